// Copyright (C) 2004-2025 Robert Griebl
// SPDX-License-Identifier: GPL-3.0-only

#include <memory>

#include <QtCore/QStringDecoder>
#include <QtCore/QLoggingCategory>

#include <gumbo.h>

#include "utility/exception.h"
#include "treebuilder.h"
#include "tokenizer.h"

Q_LOGGING_CATEGORY(LogHtml, "bh.html", QtWarningMsg)


namespace Html {

static QString tagName(const GumboElement &element)
{
    if (element.tag != GUMBO_TAG_UNKNOWN)
        return QString::fromLatin1(gumbo_normalized_tagname(element.tag));

    GumboStringPiece piece = element.original_tag;
    gumbo_tag_from_original_text(&piece);
    return QString::fromUtf8(piece.data, qsizetype(piece.length)).toLower();
}

static void replay(const GumboNode *node, ParseEventHandler &handler)
{
    switch (node->type) {
    case GUMBO_NODE_DOCUMENT: {
        const GumboVector &children = node->v.document.children;
        for (uint i = 0; i < children.length; ++i)
            replay(static_cast<const GumboNode *>(children.data[i]), handler);
        break;
    }
    case GUMBO_NODE_ELEMENT:
    case GUMBO_NODE_TEMPLATE: {
        const GumboElement &element = node->v.element;
        const QString tag = tagName(element);

        QHash<QString, QString> attributes;
        for (uint i = 0; i < element.attributes.length; ++i) {
            const auto *attr = static_cast<const GumboAttribute *>(element.attributes.data[i]);
            attributes.insert(QString::fromUtf8(attr->name).toLower(), QString::fromUtf8(attr->value));
        }

        handler.startElement(tag, attributes);
        for (uint i = 0; i < element.children.length; ++i)
            replay(static_cast<const GumboNode *>(element.children.data[i]), handler);
        handler.endElement(tag);
        break;
    }
    case GUMBO_NODE_TEXT:
    case GUMBO_NODE_CDATA:
    case GUMBO_NODE_WHITESPACE:
        handler.characters(QString::fromUtf8(node->v.text.text));
        break;
    case GUMBO_NODE_COMMENT:
        break;
    }
}

void Tokenizer::parse(const QByteArray &html, ParseEventHandler &handler)
{
    // gumbo only understands UTF-8
    auto decoder = QStringDecoder::decoderForHtml(html);
    if (!decoder.isValid())
        decoder = QStringDecoder(QStringDecoder::Utf8);

    QByteArray utf8;
    if (qstrcmp(decoder.name(), "UTF-8") == 0) {
        utf8 = html;
    } else {
        QString decoded = decoder.decode(html);
        if (decoder.hasError())
            throw ParseException(u"the document is not valid %1"_qs.arg(QString::fromLatin1(decoder.name())));
        utf8 = decoded.toUtf8();
    }

    std::unique_ptr<GumboOutput, void (*)(GumboOutput *)> output {
        gumbo_parse_with_options(&kGumboDefaultOptions, utf8.constData(), size_t(utf8.size())),
        [](GumboOutput *o) { gumbo_destroy_output(&kGumboDefaultOptions, o); }
    };
    if (!output || !output->document)
        throw ParseException("the HTML parser did not produce a document");

    if (output->errors.length)
        qCDebug(LogHtml) << "HTML parser recovered from" << output->errors.length << "errors";

    replay(output->document, handler);
}

} // namespace Html

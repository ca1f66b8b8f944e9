// Copyright (C) 2004-2025 Robert Griebl
// SPDX-License-Identifier: GPL-3.0-only

#include <algorithm>

#include <QtCore/QSet>

#include "utility/exception.h"
#include "tokenizer.h"
#include "treebuilder.h"


namespace Html {

TreeBuilder::TreeBuilder(const QUrl &baseUrl)
    : m_baseUrl(baseUrl)
{ }

Node TreeBuilder::build(const QByteArray &html, const QUrl &baseUrl)
{
    TreeBuilder builder(baseUrl);
    Tokenizer::parse(html, builder);
    return builder.takeRoot();
}

void TreeBuilder::startElement(const QString &tag, const QHash<QString, QString> &attributes)
{
    Element element(tag, attributes);

    if (tag == u"a") {
        auto it = element.attributes.find(u"href"_qs);
        if (it != element.attributes.end()) {
            if (auto href = rewrittenHref(it.value()))
                it.value() = *href;
            else
                element.attributes.erase(it);
        }
    }

    if (m_stack.empty()) {
        m_root.emplace(std::move(element));
        m_stack.push_back(m_root->element());
    } else {
        auto &children = m_stack.back()->children;
        children.emplace_back(std::move(element));
        m_stack.push_back(children.back().element());
    }
}

void TreeBuilder::characters(const QString &text)
{
    if (m_stack.empty() || text.isEmpty())
        return;

    Element *current = m_stack.back();

    if (isInsidePreformatted()) {
        current->children.emplace_back(Text { text, true });
        return;
    }

    static const QSet<QString> structuralTags = {
        u"ul"_qs, u"ol"_qs, u"body"_qs, u"div"_qs, u"blockquote"_qs, u"tr"_qs, u"table"_qs,
    };
    if (structuralTags.contains(current->tag) && text.trimmed().isEmpty())
        return;

    current->children.emplace_back(Text { text, false });
}

void TreeBuilder::endElement(const QString &tag)
{
    Q_UNUSED(tag)

    if (!m_stack.empty())
        m_stack.pop_back();
}

Node TreeBuilder::takeRoot()
{
    if (!m_root)
        throw ParseException("the document has no root element");

    m_stack.clear();
    Node root = std::move(*m_root);
    m_root.reset();
    return root;
}

bool TreeBuilder::isInsidePreformatted() const
{
    return std::any_of(m_stack.cbegin(), m_stack.cend(), [](const Element *e) {
        return (e->tag == u"pre") || (e->tag == u"code");
    });
}

std::optional<QString> TreeBuilder::rewrittenHref(const QString &href) const
{
    if (href.trimmed().startsWith(u"javascript:", Qt::CaseInsensitive))
        return std::nullopt;
    if (!m_baseUrl.isValid() || m_baseUrl.isEmpty())
        return href;

    QUrl url(href);
    if (!url.isValid())
        return href;
    return m_baseUrl.resolved(url).toString();
}

} // namespace Html

// Copyright (C) 2004-2025 Robert Griebl
// SPDX-License-Identifier: GPL-3.0-only

#include <QtCore/QSet>
#include <QtCore/QStringList>
#include <QtCore/QRegularExpression>

#include "treebuilder.h"
#include "markdown.h"


namespace Html {

namespace {

struct Renderer
{
    bool inPre = false;

    QString node(const Node &n) const;
    QString element(const Element &e) const;
    QString children(const Element &e) const;
    QString inlineMarkup(const Element &e, const QString &markup) const;
    QString table(const Element &e) const;
};

QString renderText(const Text &t)
{
    if (t.preserveWhitespace)
        return t.content;

    QString result = t.content.simplified();
    if (t.content.startsWith(u' '))
        result.prepend(u' ');
    if (t.content.endsWith(u' '))
        result.append(u' ');
    return result;
}

QString normalizedCell(const QString &content)
{
    static const QRegularExpression multipleNewlines(u"\n{2,}"_qs);

    QString normalized = content;
    normalized.replace(u"\r\n"_qs, u"\n"_qs);
    normalized.replace(multipleNewlines, u"\n"_qs);

    QStringList lines = normalized.split(u'\n');
    for (auto &line : lines)
        line = line.trimmed();
    while (!lines.isEmpty() && lines.constFirst().isEmpty())
        lines.removeFirst();
    while (!lines.isEmpty() && lines.constLast().isEmpty())
        lines.removeLast();
    return lines.join(u'\n');
}

bool isFragmentLink(const QString &href)
{
    return href.contains(u'#') && QUrl(href).hasFragment();
}

QString Renderer::node(const Node &n) const
{
    return n.visit([this](const auto &v) -> QString {
        if constexpr (std::is_same_v<std::decay_t<decltype(v)>, Text>)
            return renderText(v);
        else
            return element(v);
    });
}

QString Renderer::children(const Element &e) const
{
    QString result;
    for (const auto &child : e.children)
        result.append(node(child));
    return result;
}

QString Renderer::inlineMarkup(const Element &e, const QString &markup) const
{
    const QString content = children(e);
    const QString trimmed = content.trimmed();
    const QString leading = (!content.isEmpty() && content.front().isSpace()) ? u" "_qs : QString { };
    const QString trailing = (!content.isEmpty() && content.back().isSpace()) ? u" "_qs : QString { };

    if (trimmed.isEmpty())
        return leading.isEmpty() ? trailing : leading;
    return leading + markup + trimmed + markup + trailing;
}

QString Renderer::element(const Element &e) const
{
    static const QSet<QString> suppressed = {
        u"script"_qs, u"style"_qs, u"iframe"_qs, u"nav"_qs, u"meta"_qs, u"link"_qs, u"title"_qs,
        u"select"_qs, u"input"_qs, u"button"_qs, u"noscript"_qs, u"footer"_qs,
    };

    const QString &tag = e.tag;
    if (suppressed.contains(tag))
        return { };

    QString result;

    if ((tag == u"p") || (tag == u"div")) {
        for (const auto &child : e.children) {
            if (child.isElement() && isBlockLevel(child.element()->tag))
                Markdown::ensureParagraphBreak(result);
            result.append(node(child));
        }
        result = result.trimmed();
        if (result.isEmpty())
            return { };

    } else if ((tag == u"b") || (tag == u"strong")) {
        result = inlineMarkup(e, u"**"_qs);

    } else if ((tag == u"i") || (tag == u"em")) {
        result = inlineMarkup(e, u"*"_qs);

    } else if (tag == u"code" && !inPre) {
        result = inlineMarkup(e, u"`"_qs);

    } else if (tag == u"a") {
        const QString href = e.attribute(u"href"_qs);
        const QString content = children(e).trimmed();

        if (isFragmentLink(href))
            result = content;
        else if (!href.isEmpty() && !content.isEmpty())
            result = u'[' + content + u"](" + href + u')';

    } else if (tag == u"img") {
        const QString src = e.attribute(u"src"_qs);
        const QString alt = e.hasAttribute(u"alt"_qs) ? e.attribute(u"alt"_qs) : u"Image"_qs;

        if (!src.isEmpty() && !src.startsWith(u"data:"))
            result = u"![" + alt + u"](" + src + u')';

    } else if (tag == u"figcaption") {
        result = u'\n' + children(e).trimmed();

    } else if (tag == u"br") {
        result = u"\n"_qs;

    } else if ((tag == u"ul") || (tag == u"ol")) {
        const bool ordered = (tag == u"ol");
        int index = 1;
        for (const auto &child : e.children) {
            const QString text = node(child);
            if (text.isEmpty())
                continue;
            if (ordered)
                result += QString::number(index++) + u". " + text + u'\n';
            else
                result += u"- " + text + u'\n';
        }

    } else if (tag == u"li") {
        result = children(e).trimmed();

    } else if ((tag.size() == 2) && (tag.at(0) == u'h') && (tag.at(1) >= u'1') && (tag.at(1) <= u'6')) {
        const int level = tag.at(1).digitValue();
        result = QString(level, u'#') + u' ' + children(e);

    } else if (tag == u"table") {
        result = table(e);

    } else if (tag == u"tr") {
        QStringList cells;
        for (const auto &child : e.children)
            cells << node(child).trimmed();
        result = cells.join(u" | ") + u'\n';

    } else if ((tag == u"th") || (tag == u"td")) {
        result = normalizedCell(children(e).trimmed());
        if (tag == u"th")
            result = u"**" + result + u"**";

    } else if (tag == u"blockquote") {
        QStringList parts;
        for (const auto &child : e.children)
            parts << node(child).trimmed();
        result = u"> " + parts.join(u'\n').replace(u'\n', u"\n> "_qs);

    } else if (tag == u"pre") {
        Renderer preRenderer { true };
        QString content;

        if ((e.children.size() == 1) && e.children.front().isElement()
                && (e.children.front().element()->tag == u"code")) {
            content = preRenderer.children(*e.children.front().element());
        } else {
            content = preRenderer.children(e);
        }
        while (content.startsWith(u'\n') || content.startsWith(u'\r'))
            content.remove(0, 1);
        while (content.endsWith(u'\n') || content.endsWith(u'\r'))
            content.chop(1);

        result = u"```\n" + content + u"\n```\n";

    } else {
        result = children(e);
    }

    if (isBlockLevel(tag))
        Markdown::ensureParagraphBreak(result);

    return result;
}

QString Renderer::table(const Element &e) const
{
    std::vector<QStringList> rows;
    qsizetype columnCount = 0;

    auto addRow = [&](const Element &tr) {
        QStringList row;
        for (const auto &cell : tr.children)
            row << node(cell).trimmed();
        columnCount = std::max(columnCount, row.size());
        rows.push_back(row);
    };

    // the parser inserts implicit row groups, so rows may be one level further down
    for (const auto &child : e.children) {
        const Element *ce = child.element();
        if (!ce)
            continue;
        if (ce->tag == u"tr") {
            addRow(*ce);
        } else if ((ce->tag == u"thead") || (ce->tag == u"tbody") || (ce->tag == u"tfoot")) {
            for (const auto &groupChild : ce->children) {
                if (const Element *tr = groupChild.element(); tr && (tr->tag == u"tr"))
                    addRow(*tr);
            }
        }
    }
    if (rows.empty())
        return { };

    for (auto &row : rows) {
        while (row.size() < columnCount)
            row.append(QString { });
    }

    QVector<qsizetype> widths(columnCount, 0);
    for (const auto &row : rows) {
        for (qsizetype i = 0; i < columnCount; ++i) {
            const auto lines = row.at(i).split(u'\n');
            for (const auto &line : lines)
                widths[i] = std::max(widths[i], line.size());
        }
    }

    QString result;
    for (size_t r = 0; r < rows.size(); ++r) {
        QVector<QStringList> cellLines;
        qsizetype lineCount = 1;
        for (const auto &cell : rows[r]) {
            cellLines.append(cell.split(u'\n'));
            lineCount = std::max(lineCount, cellLines.constLast().size());
        }

        for (qsizetype l = 0; l < lineCount; ++l) {
            result += u'|';
            for (qsizetype i = 0; i < columnCount; ++i) {
                const QStringList &lines = cellLines.at(i);
                const QString line = (l < lines.size()) ? lines.at(l) : QString { };
                result += u' ' + line.leftJustified(widths.at(i), u' ') + u" |";
            }
            result += u'\n';
        }

        if (r == 0) {
            QStringList dashes;
            for (qsizetype w : std::as_const(widths))
                dashes << QString(std::max(w, qsizetype(3)), u'-');
            result += u"| " + dashes.join(u" | ") + u" |\n";
        }
    }
    return result;
}

} // namespace


QString Markdown::render(const Node &node)
{
    return Renderer { }.node(node);
}

QString Markdown::fromHtml(const QByteArray &html, const QUrl &baseUrl)
{
    return render(TreeBuilder::build(html, baseUrl)).trimmed();
}

void Markdown::ensureParagraphBreak(QString &str)
{
    if (str.isEmpty())
        return;

    if (!str.endsWith(u'\n'))
        str.append(u"\n\n");
    else if (!str.endsWith(u"\n\n"))
        str.append(u'\n');
}

} // namespace Html

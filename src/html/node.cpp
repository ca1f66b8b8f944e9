// Copyright (C) 2004-2025 Robert Griebl
// SPDX-License-Identifier: GPL-3.0-only

#include <QtCore/QSet>

#include "node.h"


namespace Html {

Element::Element(const QString &tag, const QHash<QString, QString> &attributes)
    : tag(tag)
    , attributes(attributes)
{ }

bool Element::operator==(const Element &other) const
{
    return (tag == other.tag) && (attributes == other.attributes) && (children == other.children);
}

bool isBlockLevel(const QString &tag)
{
    static const QSet<QString> blockTags = {
        u"p"_qs, u"div"_qs, u"ul"_qs, u"ol"_qs,
        u"h1"_qs, u"h2"_qs, u"h3"_qs, u"h4"_qs, u"h5"_qs, u"h6"_qs,
        u"blockquote"_qs, u"pre"_qs, u"figure"_qs, u"table"_qs, u"noscript"_qs,
    };
    return blockTags.contains(tag);
}

QString textContent(const Node &node)
{
    if (const auto *t = node.text())
        return t->content;
    return textContent(*node.element());
}

QString textContent(const Element &element)
{
    QString result;
    for (const auto &child : element.children)
        result.append(textContent(child));
    return result;
}

static void collectDescendants(const Element &element, const QString &tag,
                               std::vector<const Element *> &result)
{
    for (const auto &child : element.children) {
        if (const auto *e = child.element()) {
            if (e->tag == tag)
                result.push_back(e);
            collectDescendants(*e, tag, result);
        }
    }
}

std::vector<const Element *> descendants(const Element &element, const QString &tag)
{
    std::vector<const Element *> result;
    collectDescendants(element, tag, result);
    return result;
}

const Element *firstDescendant(const Element &element,
                               const std::function<bool(const Element &)> &predicate)
{
    for (const auto &child : element.children) {
        if (const auto *e = child.element()) {
            if (predicate(*e))
                return e;
            if (const auto *found = firstDescendant(*e, predicate))
                return found;
        }
    }
    return nullptr;
}

} // namespace Html

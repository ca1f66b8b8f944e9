// Copyright (C) 2004-2025 Robert Griebl
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include <functional>
#include <variant>
#include <vector>

#include <QtCore/QString>
#include <QtCore/QHash>


namespace Html {

class Node;

class Element
{
public:
    Element() = default;
    explicit Element(const QString &tag, const QHash<QString, QString> &attributes = { });

    QString tag;
    QHash<QString, QString> attributes;
    std::vector<Node> children;

    QString attribute(const QString &name) const  { return attributes.value(name); }
    bool hasAttribute(const QString &name) const  { return attributes.contains(name); }

    bool operator==(const Element &other) const;
};

class Text
{
public:
    QString content;
    bool preserveWhitespace = false;

    bool operator==(const Text &other) const = default;
};

// a node is either an element or a text run: the set of node kinds is closed
class Node
{
public:
    Node(Element &&element)  : m_data(std::move(element)) { }
    Node(Text &&text)        : m_data(std::move(text)) { }

    bool isElement() const       { return std::holds_alternative<Element>(m_data); }
    bool isText() const          { return std::holds_alternative<Text>(m_data); }

    const Element *element() const  { return std::get_if<Element>(&m_data); }
    Element *element()              { return std::get_if<Element>(&m_data); }
    const Text *text() const        { return std::get_if<Text>(&m_data); }

    template <typename F> decltype(auto) visit(F &&f) const
    {
        return std::visit(std::forward<F>(f), m_data);
    }

    bool operator==(const Node &other) const  { return m_data == other.m_data; }

private:
    std::variant<Element, Text> m_data;
};


bool isBlockLevel(const QString &tag);

QString textContent(const Node &node);
QString textContent(const Element &element);
std::vector<const Element *> descendants(const Element &element, const QString &tag);
const Element *firstDescendant(const Element &element,
                               const std::function<bool(const Element &)> &predicate);

} // namespace Html

// Copyright (C) 2004-2025 Robert Griebl
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include <optional>
#include <vector>

#include <QtCore/QUrl>
#include <QtCore/QHash>

#include "node.h"


namespace Html {

class ParseEventHandler
{
public:
    virtual ~ParseEventHandler() = default;

    virtual void startElement(const QString &tag, const QHash<QString, QString> &attributes) = 0;
    virtual void characters(const QString &text) = 0;
    virtual void endElement(const QString &tag) = 0;
};

class TreeBuilder : public ParseEventHandler
{
public:
    explicit TreeBuilder(const QUrl &baseUrl = { });

    static Node build(const QByteArray &html, const QUrl &baseUrl = { });

    void startElement(const QString &tag, const QHash<QString, QString> &attributes) override;
    void characters(const QString &text) override;
    void endElement(const QString &tag) override;

    bool hasRoot() const  { return m_root.has_value(); }
    Node takeRoot();

private:
    bool isInsidePreformatted() const;
    std::optional<QString> rewrittenHref(const QString &href) const;

    QUrl m_baseUrl;
    std::optional<Node> m_root;
    // elements are only ever appended to the innermost open element, so these stay valid
    std::vector<Element *> m_stack;
};

} // namespace Html

// Copyright (C) 2004-2025 Robert Griebl
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include <QtCore/QString>
#include <QtCore/QUrl>

#include "node.h"


namespace Html {

class Markdown
{
public:
    // renders the tag subset used on catalog pages; unknown tags only contribute their text
    static QString render(const Node &node);

    // builds the tree for the document and renders it, trimmed
    static QString fromHtml(const QByteArray &html, const QUrl &baseUrl = { });

    static void ensureParagraphBreak(QString &str);
};

} // namespace Html

// Copyright (C) 2004-2025 Robert Griebl
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include <QtCore/QByteArray>


namespace Html {

class ParseEventHandler;

class Tokenizer
{
public:
    // Runs an error tolerant HTML5 parser over the document and replays the result as
    // start/characters/end events. Comments and the doctype are not reported.
    static void parse(const QByteArray &html, ParseEventHandler &handler);
};

} // namespace Html

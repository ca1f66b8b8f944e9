// Copyright (C) 2004-2025 Robert Griebl
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include <QtCore/QString>
#include <QtCore/QUrl>

#include "inventory.h"


namespace BrickHarvest {

// Scans the Markdown rendition of a BrickLink inventory page for the item table.
class InventoryExtractor
{
public:
    enum class Mode {
        FullInventory,
        PartsOnly,     // minifigure and multipack inventories: no set metadata, no minifigures
    };

    static Inventory extract(const QString &markdown, const QString &setNumber, const QUrl &baseUrl,
                             Mode mode = Mode::FullInventory);

    // relative paths resolve against baseUrl, or BrickLink's site if that is empty
    static QUrl absoluteImageUrl(const QString &src, const QUrl &baseUrl = { });
    static QUrl highResolutionImageUrl(const QUrl &url);
};

} // namespace BrickHarvest

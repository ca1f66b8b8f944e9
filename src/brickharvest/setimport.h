// Copyright (C) 2004-2025 Robert Griebl
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include <vector>

#include <QtCore/QString>
#include <QtCore/QUrl>
#include <QtCore/QVector>

#include "inventory.h"


namespace BrickHarvest {

QUrl defaultBaseUrl();

QString normalizedSetNumber(const QString &raw);

QUrl setInventoryUrl(const QString &setNumber, const QUrl &baseUrl = defaultBaseUrl());
QUrl minifigureInventoryUrl(const QString &minifigureId, const QUrl &baseUrl = defaultBaseUrl());

// merges parts with the same id, color and section and sorts them for presentation
std::vector<Part> aggregateParts(const std::vector<Part> &parts);

QVector<Category> normalizedCategoryPath(const QVector<Category> &categories,
                                         const QString &fallback = u"Uncategorized"_qs);

} // namespace BrickHarvest

// Copyright (C) 2004-2025 Robert Griebl
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include <optional>
#include <vector>

#include <QtCore/QString>
#include <QtCore/QUrl>
#include <QtCore/QVector>
#include <QtCore/QJsonObject>


namespace BrickHarvest {

enum class PartSection {
    Regular,
    Counterpart,
    Extra,
    Alternate,
};

QString sectionName(PartSection section);
int sortOrder(PartSection section);

class Category
{
public:
    std::optional<QString> id;
    QString name;

    bool operator==(const Category &other) const = default;
};

// An empty QUrl means "not available" for all the URL members below.

class Part
{
public:
    QString id;
    QUrl url;
    QString name;
    QString colorName;
    QString colorId;
    QUrl imageUrl;
    int quantity = 0;
    PartSection section = PartSection::Regular;
    QUrl inventoryUrl;
    std::vector<Part> subparts;

    bool operator==(const Part &other) const = default;
};

class Minifigure
{
public:
    QString id;
    QString name;
    int quantity = 0;
    QUrl imageUrl;
    QUrl catalogUrl;
    QUrl inventoryUrl;
    QVector<Category> categories;
    std::vector<Part> parts;

    bool operator==(const Minifigure &other) const = default;
};

class Inventory
{
public:
    QString setNumber;
    QString name;
    QUrl thumbnailUrl;
    std::vector<Part> parts;
    QVector<Category> categories;
    QVector<Minifigure> minifigures;

    bool operator==(const Inventory &other) const = default;
};

QJsonObject toJson(const Category &category);
QJsonObject toJson(const Part &part);
QJsonObject toJson(const Minifigure &minifigure);
QJsonObject toJson(const Inventory &inventory);

} // namespace BrickHarvest

// Copyright (C) 2004-2025 Robert Griebl
// SPDX-License-Identifier: GPL-3.0-only

#include <QtCore/QJsonArray>

#include "inventory.h"


namespace BrickHarvest {

QString sectionName(PartSection section)
{
    switch (section) {
    case PartSection::Regular:     return u"regular"_qs;
    case PartSection::Counterpart: return u"counterpart"_qs;
    case PartSection::Extra:       return u"extra"_qs;
    case PartSection::Alternate:   return u"alternate"_qs;
    }
    return { };
}

int sortOrder(PartSection section)
{
    return int(section);
}

static void insertUrl(QJsonObject &json, const QString &key, const QUrl &url)
{
    if (!url.isEmpty())
        json.insert(key, url.toString());
}

template <typename Container> static QJsonArray toJsonArray(const Container &c)
{
    QJsonArray array;
    for (const auto &v : c)
        array.append(toJson(v));
    return array;
}

QJsonObject toJson(const Category &category)
{
    QJsonObject json { { u"name"_qs, category.name } };
    if (category.id)
        json.insert(u"id"_qs, *category.id);
    return json;
}

QJsonObject toJson(const Part &part)
{
    QJsonObject json {
        { u"id"_qs,        part.id },
        { u"name"_qs,      part.name },
        { u"colorId"_qs,   part.colorId },
        { u"colorName"_qs, part.colorName },
        { u"quantity"_qs,  part.quantity },
        { u"section"_qs,   sectionName(part.section) },
    };
    insertUrl(json, u"url"_qs, part.url);
    insertUrl(json, u"imageUrl"_qs, part.imageUrl);
    insertUrl(json, u"inventoryUrl"_qs, part.inventoryUrl);
    if (!part.subparts.empty())
        json.insert(u"subparts"_qs, toJsonArray(part.subparts));
    return json;
}

QJsonObject toJson(const Minifigure &minifigure)
{
    QJsonObject json {
        { u"id"_qs,         minifigure.id },
        { u"name"_qs,       minifigure.name },
        { u"quantity"_qs,   minifigure.quantity },
        { u"categories"_qs, toJsonArray(minifigure.categories) },
        { u"parts"_qs,      toJsonArray(minifigure.parts) },
    };
    insertUrl(json, u"imageUrl"_qs, minifigure.imageUrl);
    insertUrl(json, u"catalogUrl"_qs, minifigure.catalogUrl);
    insertUrl(json, u"inventoryUrl"_qs, minifigure.inventoryUrl);
    return json;
}

QJsonObject toJson(const Inventory &inventory)
{
    QJsonObject json {
        { u"setNumber"_qs,   inventory.setNumber },
        { u"name"_qs,        inventory.name },
        { u"parts"_qs,       toJsonArray(inventory.parts) },
        { u"categories"_qs,  toJsonArray(inventory.categories) },
        { u"minifigures"_qs, toJsonArray(inventory.minifigures) },
    };
    insertUrl(json, u"thumbnailUrl"_qs, inventory.thumbnailUrl);
    return json;
}

} // namespace BrickHarvest

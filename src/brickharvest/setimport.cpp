// Copyright (C) 2004-2025 Robert Griebl
// SPDX-License-Identifier: GPL-3.0-only

#include <algorithm>

#include <QtCore/QHash>
#include <QtCore/QUrlQuery>

#include "setimport.h"


namespace BrickHarvest {

QUrl defaultBaseUrl()
{
    return QUrl(u"https://www.bricklink.com"_qs);
}

QString normalizedSetNumber(const QString &raw)
{
    const QString trimmed = raw.trimmed();
    if (trimmed.isEmpty() || trimmed.contains(u'-'))
        return trimmed;
    return trimmed + u"-1";
}

static QUrl inventoryUrl(const QUrl &baseUrl, const QString &type, const QString &id, bool regularView)
{
    QUrl url = baseUrl.resolved(QUrl(u"/catalogItemInv.asp"_qs));
    QUrlQuery query;
    query.addQueryItem(type, id);
    if (regularView)
        query.addQueryItem(u"viewType"_qs, u"R"_qs);
    url.setQuery(query);
    return url;
}

QUrl setInventoryUrl(const QString &setNumber, const QUrl &baseUrl)
{
    return inventoryUrl(baseUrl, u"S"_qs, setNumber, true);
}

QUrl minifigureInventoryUrl(const QString &minifigureId, const QUrl &baseUrl)
{
    return inventoryUrl(baseUrl, u"M"_qs, minifigureId, false);
}

std::vector<Part> aggregateParts(const std::vector<Part> &parts)
{
    std::vector<Part> result;
    QHash<QString, size_t> indexForKey;

    for (const auto &part : parts) {
        const QString key = part.id + u'\x1f' + part.colorId + u'\x1f' + sectionName(part.section);
        auto it = indexForKey.constFind(key);
        if (it == indexForKey.cend()) {
            indexForKey.insert(key, result.size());
            result.push_back(part);
        } else {
            result[*it].quantity += part.quantity;
        }
    }

    std::stable_sort(result.begin(), result.end(), [](const Part &lhs, const Part &rhs) {
        if (lhs.section != rhs.section)
            return sortOrder(lhs.section) < sortOrder(rhs.section);
        if (lhs.colorName != rhs.colorName)
            return lhs.colorName < rhs.colorName;
        if (lhs.name != rhs.name)
            return lhs.name < rhs.name;
        return lhs.id < rhs.id;
    });
    return result;
}

QVector<Category> normalizedCategoryPath(const QVector<Category> &categories, const QString &fallback)
{
    QVector<Category> result = categories;

    if (!result.isEmpty() && (result.constFirst().name.compare(u"Catalog", Qt::CaseInsensitive) == 0))
        result.removeFirst();
    while (!result.isEmpty() && (result.constFirst().name.compare(u"Sets", Qt::CaseInsensitive) == 0))
        result.removeFirst();

    if (result.isEmpty())
        result.append(Category { std::nullopt, fallback });
    return result;
}

} // namespace BrickHarvest

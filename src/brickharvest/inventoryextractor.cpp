// Copyright (C) 2004-2025 Robert Griebl
// SPDX-License-Identifier: GPL-3.0-only

#include <algorithm>
#include <optional>

#include <QtCore/QRegularExpression>
#include <QtCore/QStringList>
#include <QtCore/QUrlQuery>
#include <QtCore/QLoggingCategory>

#include "utility/exception.h"
#include "inventoryextractor.h"
#include "setimport.h"

Q_DECLARE_LOGGING_CATEGORY(LogInventory)


namespace BrickHarvest {

namespace {

const QRegularExpression linkRegex(uR"(\[([^\]]+)\]\(([^)]+)\))"_qs);
const QRegularExpression imageRegex(uR"(!\[[^\]]*\]\(([^)]+)\))"_qs);
const QRegularExpression setNameRegex(uR"(Name:\s*([^)\]]+))"_qs);
const QRegularExpression boldRegex(uR"(\*\*([^*]+)\*\*)"_qs);
const QRegularExpression sectionRegex(uR"(^(regular|extras?|counterparts?|alternates?)\b)"_qs);
const QRegularExpression punctuationRegex(uR"([\p{P}\p{S}])"_qs);

constexpr QStringView partLinkMarker = u"catalog/catalogitem.page?P=";
constexpr QStringView minifigureLinkMarker = u"catalogitem.page?M=";

struct Link
{
    QString text;
    QString target;
};

enum class ItemType {
    Parts,
    Minifigures,
};

struct PendingRow
{
    QString line;
    QStringList cells;
    PartSection section;
    ItemType type;
};

QString normalizeWhitespace(const QString &str)
{
    return str.simplified();
}

QVector<Link> links(const QString &str)
{
    QVector<Link> result;
    auto it = linkRegex.globalMatch(str);
    while (it.hasNext()) {
        auto m = it.next();
        result.append({ m.captured(1), m.captured(2) });
    }
    return result;
}

std::optional<QString> firstCellContaining(const QStringList &cells, QStringView marker)
{
    for (const auto &cell : cells) {
        if (cell.contains(marker))
            return cell;
    }
    return std::nullopt;
}

// the outer pipes are dropped, inner empty cells are kept so that continuation lines line up
QStringList splitCells(const QString &line)
{
    QStringList cells = line.split(u'|');
    if (!cells.isEmpty())
        cells.removeFirst();
    if (!cells.isEmpty())
        cells.removeLast();
    for (auto &cell : cells)
        cell = cell.trimmed();
    return cells;
}

// only the first non-empty cell can hold a section title
std::optional<PartSection> sectionMarker(const QStringList &cells)
{
    auto it = std::find_if(cells.cbegin(), cells.cend(), [](const QString &cell) {
        return !cell.isEmpty();
    });
    if (it == cells.cend())
        return std::nullopt;

    QString normalized = it->toLower();
    normalized.remove(punctuationRegex);
    normalized = normalized.trimmed();

    auto m = sectionRegex.match(normalized);
    if (!m.hasMatch())
        return std::nullopt;

    const QString word = m.captured(1);
    if (word.startsWith(u"regular"))
        return PartSection::Regular;
    else if (word.startsWith(u"extra"))
        return PartSection::Extra;
    else if (word.startsWith(u"counterpart"))
        return PartSection::Counterpart;
    else
        return PartSection::Alternate;
}

std::optional<ItemType> itemTypeMarker(const QString &line)
{
    const QString lower = line.toLower();
    if (lower.contains(u"[catalog]"))
        return std::nullopt;
    if (lower.contains(u"minifigures:"))
        return ItemType::Minifigures;
    if (lower.contains(u"parts:"))
        return ItemType::Parts;
    return std::nullopt;
}

QUrl imageUrl(const QString &str, const QUrl &baseUrl)
{
    auto m = imageRegex.match(str);
    if (!m.hasMatch())
        return { };
    return InventoryExtractor::absoluteImageUrl(m.captured(1), baseUrl);
}

QString itemName(const QString &imageCell)
{
    qsizetype start = imageCell.indexOf(u"Name:");
    if (start < 0)
        return { };
    start += 5;
    qsizetype end = imageCell.indexOf(u"](", start);
    if (end < 0)
        return { };
    return normalizeWhitespace(imageCell.mid(start, end - start));
}

int quantity(const QStringList &cells)
{
    for (const auto &cell : cells) {
        bool ok = false;
        int q = cell.toInt(&ok);
        if (ok && (q >= 0))
            return q;
    }
    return 0;
}

QString queryValue(const QUrl &url, QStringView key)
{
    const auto items = QUrlQuery(url).queryItems(QUrl::FullyDecoded);
    for (const auto &item : items) {
        if (item.first.compare(key, Qt::CaseInsensitive) == 0)
            return item.second;
    }
    return { };
}

QString description(const QStringList &cells)
{
    for (const auto &cell : cells) {
        if (!cell.contains(u"**") || cell.contains(u"Part No:"))
            continue;
        auto m = boldRegex.match(cell);
        if (m.hasMatch())
            return normalizeWhitespace(m.captured(1));
        return normalizeWhitespace(QString(cell).remove(u"**"_qs));
    }
    return { };
}

QVector<Category> categories(const QString &str)
{
    QVector<Category> result;

    const auto allLinks = links(str);
    for (const auto &link : allLinks) {
        if (link.target.contains(u"catalogitem.page", Qt::CaseInsensitive)
                || link.target.contains(u"catalogItemInv.asp", Qt::CaseInsensitive)) {
            break;
        }
        const QString name = normalizeWhitespace(link.text);
        if (name.isEmpty() || (name == u"Catalog"))
            continue;

        Category cat;
        cat.name = name;
        const QString catString = queryValue(QUrl(link.target), u"catString");
        if (!catString.isEmpty())
            cat.id = catString.section(u'.', -1);
        result.append(cat);
    }
    return result;
}

QUrl resolvedUrl(const QString &target, const QUrl &baseUrl)
{
    QUrl url(target);
    return baseUrl.isEmpty() ? url : baseUrl.resolved(url);
}

struct ItemLink
{
    QString id;
    QUrl url;
    QUrl secondaryUrl;
};

ItemLink itemLink(const PendingRow &row, QStringView marker, const QUrl &baseUrl)
{
    auto cell = firstCellContaining(row.cells, marker);
    const auto cellLinks = cell ? links(*cell) : QVector<Link> { };
    if (cellLinks.isEmpty())
        throw MalformedRowException(row.line, "no item link");

    ItemLink result;
    result.id = normalizeWhitespace(cellLinks.at(0).text);
    if (result.id.isEmpty())
        throw MalformedRowException(row.line, "empty item id");
    result.url = resolvedUrl(cellLinks.at(0).target, baseUrl);
    if (cellLinks.size() > 1)
        result.secondaryUrl = resolvedUrl(cellLinks.at(1).target, baseUrl);
    return result;
}

QString imageCell(const QStringList &cells)
{
    for (const auto &cell : cells) {
        if (cell.contains(u"!["))
            return cell;
    }
    return { };
}

Part parsePart(const PendingRow &row, const QUrl &baseUrl)
{
    const ItemLink link = itemLink(row, partLinkMarker, baseUrl);
    const QString images = imageCell(row.cells);
    const QString name = itemName(images);
    const QString desc = description(row.cells);

    Part part;
    part.id = link.id;
    part.url = link.url;
    part.imageUrl = imageUrl(images, baseUrl);
    part.quantity = quantity(row.cells);
    part.name = name.isEmpty() ? desc : name;
    part.section = row.section;
    part.colorId = queryValue(link.url, u"idColor");

    if (!name.isEmpty()) {
        qsizetype pos = desc.indexOf(name);
        if (pos >= 0)
            part.colorName = desc.left(pos).trimmed();
    }
    if (part.colorName.isEmpty())
        part.colorName = desc;

    if (link.secondaryUrl.toString().contains(u"catalogItemInv.asp", Qt::CaseInsensitive))
        part.inventoryUrl = link.secondaryUrl;
    return part;
}

Minifigure parseMinifigure(const PendingRow &row, const QUrl &baseUrl)
{
    const ItemLink link = itemLink(row, minifigureLinkMarker, baseUrl);
    const QString images = imageCell(row.cells);
    const QString name = itemName(images);

    Minifigure minifig;
    minifig.id = link.id;
    minifig.catalogUrl = link.url;
    minifig.inventoryUrl = link.secondaryUrl;
    minifig.imageUrl = imageUrl(images, baseUrl);
    minifig.quantity = quantity(row.cells);
    minifig.name = name.isEmpty() ? description(row.cells) : name;

    for (const auto &cell : row.cells) {
        if (cell.contains(u"Catalog:") || cell.contains(u"[Catalog]")) {
            minifig.categories = categories(cell);
            break;
        }
    }
    return minifig;
}

std::optional<QString> setName(const QString &line)
{
    if (!line.contains(u"catalogItemPic.asp?S="))
        return std::nullopt;

    if (auto m = setNameRegex.match(line); m.hasMatch())
        return normalizeWhitespace(m.captured(1));

    if (auto m = boldRegex.match(line); m.hasMatch()) {
        const QString candidate = normalizeWhitespace(m.captured(1));
        static const QStringList disallowed = {
            u"image"_qs, u"qty"_qs, u"parts"_qs, u"regular items"_qs, u"mid"_qs
        };
        const QString lower = candidate.toLower();
        if (std::none_of(disallowed.cbegin(), disallowed.cend(),
                         [&lower](const QString &word) { return lower.contains(word); })) {
            return candidate;
        }
    }
    return std::nullopt;
}

void parseMetadata(const QStringList &lines, const QUrl &baseUrl, Inventory &inv)
{
    std::optional<QString> name;
    QUrl preferredThumbnail;
    QUrl fallbackThumbnail;
    bool hasCategories = false;

    for (const auto &line : lines) {
        if (!name)
            name = setName(line);

        if (preferredThumbnail.isEmpty() || fallbackThumbnail.isEmpty()) {
            const QUrl image = imageUrl(line, baseUrl);
            if (!image.isEmpty()) {
                if (fallbackThumbnail.isEmpty())
                    fallbackThumbnail = image;
                if (preferredThumbnail.isEmpty() && line.contains(u"catalogItemPic.asp?S=")
                        && image.path().contains(u"/S/")) {
                    preferredThumbnail = image;
                }
            }
        }

        if (!hasCategories && line.contains(u"[Catalog]")) {
            inv.categories = categories(line);
            hasCategories = true;
        }

        if (name && !preferredThumbnail.isEmpty() && hasCategories)
            break;
    }

    if (name)
        inv.name = *name;
    const QUrl thumbnail = preferredThumbnail.isEmpty() ? fallbackThumbnail : preferredThumbnail;
    if (!thumbnail.isEmpty())
        inv.thumbnailUrl = InventoryExtractor::highResolutionImageUrl(thumbnail);
}

} // namespace


QUrl InventoryExtractor::absoluteImageUrl(const QString &src, const QUrl &baseUrl)
{
    QUrl url(src.trimmed());
    if (!url.scheme().isEmpty())
        return url;
    return (baseUrl.isEmpty() ? defaultBaseUrl() : baseUrl).resolved(url);
}

QUrl InventoryExtractor::highResolutionImageUrl(const QUrl &url)
{
    if (!url.host().contains(u"bricklink.com"))
        return url;

    QString path = url.path();
    if (!path.contains(u"/S/"))
        return url;

    QUrl upgraded = url;
    upgraded.setPath(path.replace(u"/S/"_qs, u"/SL/"_qs));
    return upgraded;
}

Inventory InventoryExtractor::extract(const QString &markdown, const QString &setNumber,
                                      const QUrl &baseUrl, Mode mode)
{
    static const QRegularExpression newlines(u"\r\n|\r|\n"_qs);
    const QStringList lines = markdown.split(newlines);

    qsizetype headerIndex = -1;
    for (qsizetype i = 0; i < lines.size(); ++i) {
        if (lines.at(i).contains(u"| **Image**")) {
            headerIndex = i;
            break;
        }
    }
    if (headerIndex < 0)
        throw TableNotFoundException();

    const bool partsOnly = (mode == Mode::PartsOnly);

    Inventory inv;
    inv.setNumber = setNumber;
    if (!partsOnly)
        parseMetadata(lines, baseUrl, inv);

    PartSection currentSection = PartSection::Regular;
    ItemType currentType = ItemType::Parts;
    std::optional<PendingRow> pending;
    bool skippingRow = false;

    auto flush = [&]() {
        if (!pending)
            return;
        if (pending->type == ItemType::Parts)
            inv.parts.push_back(parsePart(*pending, baseUrl));
        else
            inv.minifigures.append(parseMinifigure(*pending, baseUrl));
        pending.reset();
    };

    for (qsizetype i = headerIndex + 2; i < lines.size(); ++i) {
        const QString line = lines.at(i).trimmed();
        if (!line.startsWith(u'|')) {
            flush();
            skippingRow = false;
            continue;
        }

        const QStringList cells = splitCells(line);
        const QStringView itemMarker = (currentType == ItemType::Parts) ? partLinkMarker
                                                                        : minifigureLinkMarker;
        const bool hasItemLink = line.contains(itemMarker);

        if (hasItemLink) {
            flush();
            skippingRow = partsOnly && (currentType == ItemType::Minifigures);
            if (!skippingRow)
                pending = PendingRow { line, cells, currentSection, currentType };
            continue;
        }

        // a row spanning several lines: the follow-up lines have an empty first cell
        const bool continuation = !cells.isEmpty() && cells.constFirst().isEmpty();
        if (continuation && skippingRow)
            continue;
        if (continuation && pending) {
            pending->line += u'\n' + line;
            for (qsizetype c = 0; c < cells.size(); ++c) {
                const QString &add = cells.at(c);
                if (add.isEmpty())
                    continue;
                if (c >= pending->cells.size())
                    pending->cells.resize(c + 1);
                QString &cell = pending->cells[c];
                cell = cell.isEmpty() ? add : (cell + u'\n' + add);
            }
            continue;
        }

        flush();
        skippingRow = false;

        // an item of the other item type is neither a row of its own nor a marker
        if (line.contains(u"catalogitem.page", Qt::CaseInsensitive)) {
            skippingRow = true;
            continue;
        }

        if (auto section = sectionMarker(cells)) {
            currentSection = *section;
        } else if (auto type = itemTypeMarker(line)) {
            currentType = *type;
        }
    }
    flush();

    if (!partsOnly && inv.name.isEmpty())
        throw MissingSetNameException(setNumber);

    qCDebug(LogInventory) << "Extracted" << inv.parts.size() << "parts and"
                          << inv.minifigures.size() << "minifigures for" << setNumber;
    return inv;
}

} // namespace BrickHarvest

// Copyright (C) 2004-2025 Robert Griebl
// SPDX-License-Identifier: GPL-3.0-only

#include <QtCore/QStringList>
#include <QtCore/QLoggingCategory>

#include "html/treebuilder.h"
#include "utility/exception.h"
#include "utility/transfer.h"
#include "colorguide.h"

Q_DECLARE_LOGGING_CATEGORY(LogInventory)


namespace BrickHarvest {

static const auto swatchProperty = u"--bl-castor-table-swatch-with-image-background-color"_qs;
static const auto legoColorLabel = u"LEGO Color:"_qs;

QJsonObject toJson(const ColorGuideEntry &entry)
{
    QJsonObject json {
        { u"brickLinkColorId"_qs, entry.brickLinkColorId },
        { u"brickLinkName"_qs,    entry.brickLinkName },
    };
    if (entry.legoColorName)
        json.insert(u"legoColorName"_qs, *entry.legoColorName);
    if (entry.legoColorId)
        json.insert(u"legoColorId"_qs, *entry.legoColorId);
    if (entry.hexColor)
        json.insert(u"hexColor"_qs, *entry.hexColor);
    return json;
}

QUrl ColorGuide::url(const QString &locale)
{
    return QUrl(u"https://v2.bricklink.com/%1/catalog/color-guide"_qs.arg(locale.toLower()));
}

QVector<ColorGuideEntry> ColorGuide::parse(const QByteArray &html, const QUrl &baseUrl)
{
    const Html::Node root = Html::TreeBuilder::build(html, baseUrl);

    QVector<ColorGuideEntry> entries;
    const auto rows = Html::descendants(*root.element(), u"tr"_qs);
    for (const auto *row : rows) {
        if (auto entry = parseRow(*row))
            entries.append(*entry);
    }
    if (entries.isEmpty())
        throw TableNotFoundException();

    qCDebug(LogInventory) << "Parsed" << entries.size() << "colors from" << baseUrl;
    return entries;
}

QCoro::Task<QVector<ColorGuideEntry>> ColorGuide::fetch(Transfer *transfer, QString locale)
{
    const QUrl guideUrl = url(locale);
    const QByteArray html = co_await transfer->download(guideUrl);
    co_return parse(html, guideUrl);
}

static std::pair<std::optional<QString>, std::optional<int>> legoColorDetails(QString text)
{
    text.replace(QChar::Nbsp, u' ');
    if (!text.contains(legoColorLabel))
        return { };

    QString content = text.remove(legoColorLabel).trimmed();
    if (content.startsWith(u"<!-- -->"))
        content = content.mid(8).trimmed();

    qsizetype dash = content.lastIndexOf(u'-');
    if (dash < 0)
        return { content.isEmpty() ? std::nullopt : std::optional<QString>(content), std::nullopt };

    const QString name = content.left(dash).trimmed();
    bool ok = false;
    int id = content.mid(dash + 1).trimmed().toInt(&ok);
    return { name, ok ? std::optional<int>(id) : std::nullopt };
}

static std::optional<QString> swatchColor(const Html::Element &cell)
{
    const QStringList declarations = cell.attribute(u"style"_qs).split(u';');
    for (const auto &declaration : declarations) {
        const QString d = declaration.trimmed();
        if (!d.startsWith(QString(swatchProperty + u':')))
            continue;
        const QString value = d.section(u':', -1).trimmed();
        if (value.startsWith(u'#'))
            return value;
    }
    return std::nullopt;
}

std::optional<ColorGuideEntry> ColorGuide::parseRow(const Html::Element &row)
{
    std::vector<const Html::Element *> cells;
    for (const auto &child : row.children) {
        if (const auto *e = child.element(); e && (e->tag == u"td"))
            cells.push_back(e);
    }
    if (cells.size() < 8)
        return std::nullopt;

    const Html::Element &nameCell = *cells[1];
    const auto *legoInfo = Html::firstDescendant(nameCell, [](const Html::Element &e) {
        return (e.tag == u"span") && Html::textContent(e).contains(legoColorLabel);
    });
    const auto *nameElement = Html::firstDescendant(nameCell, [](const Html::Element &e) {
        return (e.tag == u"p");
    });
    if (!legoInfo || !nameElement)
        return std::nullopt;

    bool ok = false;
    const int id = Html::textContent(*cells.back()).trimmed().remove(u',').toInt(&ok);
    if (!ok)
        return std::nullopt;

    const auto [legoName, legoId] = legoColorDetails(Html::textContent(*legoInfo).trimmed());

    ColorGuideEntry entry;
    entry.brickLinkColorId = id;
    entry.brickLinkName = Html::textContent(*nameElement).trimmed();
    entry.legoColorName = legoName;
    entry.legoColorId = legoId;
    entry.hexColor = swatchColor(*cells[0]);
    return entry;
}

} // namespace BrickHarvest

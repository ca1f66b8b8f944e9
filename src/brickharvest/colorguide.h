// Copyright (C) 2004-2025 Robert Griebl
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include <optional>

#include <QtCore/QString>
#include <QtCore/QUrl>
#include <QtCore/QVector>
#include <QtCore/QJsonObject>
#include <QCoro/QCoroTask>

class Transfer;

namespace Html {
class Element;
}


namespace BrickHarvest {

class ColorGuideEntry
{
public:
    int brickLinkColorId = 0;
    QString brickLinkName;
    std::optional<QString> legoColorName;
    std::optional<int> legoColorId;
    std::optional<QString> hexColor;

    bool operator==(const ColorGuideEntry &other) const = default;
};

QJsonObject toJson(const ColorGuideEntry &entry);

class ColorGuide
{
public:
    static QUrl url(const QString &locale = u"en-us"_qs);

    static QVector<ColorGuideEntry> parse(const QByteArray &html, const QUrl &baseUrl);
    static QCoro::Task<QVector<ColorGuideEntry>> fetch(Transfer *transfer, QString locale = u"en-us"_qs);

private:
    static std::optional<ColorGuideEntry> parseRow(const Html::Element &row);
};

} // namespace BrickHarvest

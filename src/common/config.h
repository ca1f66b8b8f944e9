// Copyright (C) 2004-2025 Robert Griebl
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include <QSettings>
#include <QUrl>


class Config : public QSettings
{
    Q_OBJECT

public:
    // an empty file name selects brickharvest.ini in the user's config location
    explicit Config(const QString &fileName = { });
    ~Config() override;

    QString cacheDir() const;
    int memoryCacheEntries() const;
    int maxConcurrentDownloads() const;
    int maxConnections() const;
    int transferTimeout() const;
    QString userAgent() const;
    QUrl brickLinkBaseUrl() const;

private:
    int m_memoryCacheEntries;
    int m_maxConcurrentDownloads;
    int m_maxConnections;
    int m_transferTimeout;
};

// Copyright (C) 2004-2025 Robert Griebl
// SPDX-License-Identifier: GPL-3.0-only

#include <algorithm>

#include <QCoreApplication>
#include <QStandardPaths>
#include <QDir>

#include "config.h"

static QString defaultFileName()
{
    return QStandardPaths::writableLocation(QStandardPaths::AppConfigLocation) + u"/brickharvest.ini";
}


Config::Config(const QString &fileName)
    : QSettings(fileName.isEmpty() ? defaultFileName() : fileName, QSettings::IniFormat)
{
    m_memoryCacheEntries = std::clamp(value(u"Cache/MemoryEntries"_qs, 100).toInt(), 1, 10000);
    m_maxConcurrentDownloads = std::clamp(value(u"Network/MaxConcurrentDownloads"_qs, 4).toInt(), 1, 32);
    m_maxConnections = std::clamp(value(u"Network/MaxConnections"_qs, 6).toInt(), 1, 32);
    m_transferTimeout = std::clamp(value(u"Network/TimeoutSeconds"_qs, 60).toInt(), 1, 600);
}

Config::~Config()
{ }

QString Config::cacheDir() const
{
    static QString cacheDir = QStandardPaths::writableLocation(QStandardPaths::CacheLocation)
            + u"/thumbnails";
    return QDir::cleanPath(value(u"Cache/Directory"_qs, cacheDir).toString());
}

int Config::memoryCacheEntries() const
{
    return m_memoryCacheEntries;
}

int Config::maxConcurrentDownloads() const
{
    return m_maxConcurrentDownloads;
}

int Config::maxConnections() const
{
    return m_maxConnections;
}

int Config::transferTimeout() const
{
    return m_transferTimeout * 1000;
}

QString Config::userAgent() const
{
    return value(u"Network/UserAgent"_qs, QString(QCoreApplication::applicationName() + u'/'
                                                  + QCoreApplication::applicationVersion())).toString();
}

QUrl Config::brickLinkBaseUrl() const
{
    return QUrl(value(u"BrickLink/BaseUrl"_qs, u"https://www.bricklink.com"_qs).toString());
}

#include "moc_config.cpp"

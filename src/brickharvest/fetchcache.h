// Copyright (C) 2004-2025 Robert Griebl
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include <memory>

#include <QtCore/QObject>
#include <QtCore/QUrl>
#include <QtCore/QByteArray>
#include <QtCore/QPromise>
#include <QCoro/QCoroTask>

class Transfer;


namespace BrickHarvest {

class FetchCachePrivate;

// Two-tier (memory + disk) cache for immutable payloads, e.g. thumbnails.
//
// All bookkeeping is owned by the thread the cache lives in; get() and invalidate() have to be
// called from there. Network concurrency is bounded by the transfer's connection limit, which
// queues the excess requests in FIFO order.
class FetchCache : public QObject
{
    Q_OBJECT

public:
    FetchCache(Transfer *transfer, const QString &cacheDir, int memoryEntries = 100,
               QObject *parent = nullptr);
    ~FetchCache() override;

    QCoro::Task<QByteArray> get(QUrl url);
    void invalidate(const QUrl &url);

    QString cacheDir() const;
    QString cacheFilePath(const QUrl &url) const;
    bool isInMemory(const QUrl &url) const;
    int memoryEntries() const;
    int inFlightCount() const;

private:
    static QCoro::Task<> fetch(std::shared_ptr<FetchCachePrivate> d, QUrl url, QString key,
                               std::shared_ptr<QPromise<QByteArray>> promise);

    std::shared_ptr<FetchCachePrivate> d;
};

} // namespace BrickHarvest

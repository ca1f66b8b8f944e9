// Copyright (C) 2004-2025 Robert Griebl
// SPDX-License-Identifier: GPL-3.0-only

#include <utility>

#include <QtCore/QCache>
#include <QtCore/QHash>
#include <QtCore/QDir>
#include <QtCore/QFile>
#include <QtCore/QSaveFile>
#include <QtCore/QFuture>
#include <QtCore/QPromise>
#include <QtCore/QThread>
#include <QtCore/QCryptographicHash>
#include <QtCore/QLoggingCategory>
#include <QCoro/QCoroFuture>

#include "utility/exception.h"
#include "utility/transfer.h"
#include "fetchcache.h"

Q_LOGGING_CATEGORY(LogCache, "bh.cache", QtWarningMsg)


namespace BrickHarvest {

class FetchCachePrivate
{
public:
    Transfer *m_transfer;
    QThread *m_thread;
    QString m_cacheDir;
    QCache<QString, QByteArray> m_memory;
    QHash<QString, std::shared_ptr<QPromise<QByteArray>>> m_inFlight;

    static QString keyFor(const QUrl &url);
    QString filePath(const QString &key) const;
    QByteArray readFromDisk(const QString &key);
    void storeOnDisk(const QString &key, const QByteArray &data);
    void storeInMemory(const QString &key, const QByteArray &data);
};

QString FetchCachePrivate::keyFor(const QUrl &url)
{
    return url.toString(QUrl::FullyEncoded);
}

QString FetchCachePrivate::filePath(const QString &key) const
{
    const QByteArray hash = QCryptographicHash::hash(key.toUtf8(), QCryptographicHash::Sha256);
    return m_cacheDir + u'/' + QString::fromLatin1(hash.toHex());
}

QByteArray FetchCachePrivate::readFromDisk(const QString &key)
{
    QFile f(filePath(key));
    if (!f.exists())
        return { };

    QByteArray data;
    if (f.open(QIODevice::ReadOnly))
        data = f.readAll();

    if (data.isEmpty()) {
        qCWarning(LogCache).noquote() << "Removing unreadable cache entry" << f.fileName()
                                      << "for" << key;
        f.remove();
    }
    return data;
}

void FetchCachePrivate::storeOnDisk(const QString &key, const QByteArray &data)
{
    QSaveFile f(filePath(key));
    if (f.open(QIODevice::WriteOnly) && (f.write(data) == data.size()) && f.commit())
        return;

    qCWarning(LogCache).noquote() << "Could not write cache entry" << f.fileName() << "for"
                                  << key << ":" << f.errorString();
    QFile::remove(f.fileName());
}

void FetchCachePrivate::storeInMemory(const QString &key, const QByteArray &data)
{
    if (!m_memory.insert(key, new QByteArray(data), 1))
        qCWarning(LogCache) << "Can not add" << key << "to the memory cache";
}


FetchCache::FetchCache(Transfer *transfer, const QString &cacheDir, int memoryEntries, QObject *parent)
    : QObject(parent)
    , d(std::make_shared<FetchCachePrivate>())
{
    d->m_transfer = transfer;
    d->m_thread = thread();
    d->m_cacheDir = QDir::cleanPath(cacheDir);
    d->m_memory.setMaxCost(std::max(1, memoryEntries));

    if (!QDir().mkpath(d->m_cacheDir))
        qCWarning(LogCache) << "Could not create the cache directory" << d->m_cacheDir;
}

FetchCache::~FetchCache()
{
    // the downloads keep running, but their waiters are released right away
    const auto inFlight = std::exchange(d->m_inFlight, { });
    if (!inFlight.isEmpty()) {
        qCDebug(LogCache) << "Fetch cache destroyed with" << inFlight.size()
                          << "downloads still in flight";
    }
    for (auto it = inFlight.cbegin(); it != inFlight.cend(); ++it) {
        it.value()->setException(TransferException(it.key(), u"Cancelled"_qs));
        it.value()->finish();
    }
}

QCoro::Task<QByteArray> FetchCache::get(QUrl url)
{
    Q_ASSERT(QThread::currentThread() == d->m_thread);

    const QString key = FetchCachePrivate::keyFor(url);

    if (const QByteArray *cached = d->m_memory.object(key)) {
        qCDebug(LogCache) << "memory hit" << key;
        co_return *cached;
    }

    QByteArray data = d->readFromDisk(key);
    if (!data.isEmpty()) {
        qCDebug(LogCache) << "disk hit" << key;
        d->storeInMemory(key, data);
        co_return data;
    }

    QFuture<QByteArray> result;
    auto it = d->m_inFlight.constFind(key);
    if (it != d->m_inFlight.cend()) {
        qCDebug(LogCache) << "joining in-flight download" << key;
        result = (*it)->future();
    } else {
        qCDebug(LogCache) << "miss" << key;

        auto promise = std::make_shared<QPromise<QByteArray>>();
        result = promise->future();
        promise->start();
        d->m_inFlight.insert(key, promise);

        // the download is not owned by this caller: the task keeps running on its own
        fetch(d, url, key, promise);
    }

    co_return co_await result;
}

QCoro::Task<> FetchCache::fetch(std::shared_ptr<FetchCachePrivate> d, QUrl url, QString key,
                                std::shared_ptr<QPromise<QByteArray>> promise)
{
    QByteArray data;
    std::exception_ptr error;
    try {
        data = co_await d->m_transfer->download(url);
    } catch (const std::exception &e) {
        qCDebug(LogCache) << "download of" << key << "failed:" << e.what();
        error = std::current_exception();
    }

    // already cancelled by ~FetchCache
    if (promise->future().isFinished())
        co_return;

    // failures are not remembered: the next get() starts a new download
    d->m_inFlight.remove(key);
    if (error) {
        promise->setException(error);
    } else {
        d->storeOnDisk(key, data);
        d->storeInMemory(key, data);
        promise->addResult(data);
    }
    promise->finish();
}

void FetchCache::invalidate(const QUrl &url)
{
    Q_ASSERT(QThread::currentThread() == d->m_thread);

    const QString key = FetchCachePrivate::keyFor(url);
    d->m_memory.remove(key);
    QFile::remove(d->filePath(key));
}

QString FetchCache::cacheDir() const
{
    return d->m_cacheDir;
}

QString FetchCache::cacheFilePath(const QUrl &url) const
{
    return d->filePath(FetchCachePrivate::keyFor(url));
}

bool FetchCache::isInMemory(const QUrl &url) const
{
    return d->m_memory.contains(FetchCachePrivate::keyFor(url));
}

int FetchCache::memoryEntries() const
{
    return int(d->m_memory.size());
}

int FetchCache::inFlightCount() const
{
    return int(d->m_inFlight.size());
}

} // namespace BrickHarvest

#include "moc_fetchcache.cpp"

// Copyright (C) 2004-2025 Robert Griebl
// SPDX-License-Identifier: GPL-3.0-only

#include "backendapplication.h"
#include <QtCore/QCoreApplication>
#include <QtCore/QJsonArray>
#include <QtCore/QJsonDocument>
#include <QtCore/QLoggingCategory>
#include <QtCore/QSaveFile>
#include "brickharvest/colorguide.h"
#include "brickharvest/fetchcache.h"
#include "brickharvest/inventoryservice.h"
#include "brickharvest/setimport.h"
#include "common/config.h"
#include "utility/exception.h"
#include "utility/transfer.h"
#include "version.h"
#include <cstdio>

BackendApplication::BackendApplication(int &argc, char **argv)
{
    // disable buffering on stdout
    setvbuf(stdout, nullptr, _IONBF, 0);

    QCoreApplication::setApplicationName(QString::fromLatin1(BRICKHARVEST_NAME));
    QCoreApplication::setApplicationVersion(QString::fromLatin1(BRICKHARVEST_VERSION));

    (void) new QCoreApplication(argc, argv);

    m_clp.setApplicationDescription(u"Fetches BrickLink set inventories and catalog images."_qs);
    m_clp.addHelpOption();
    m_clp.addOption({ { u"v"_qs, u"version"_qs }, u"Display version information."_qs });
    m_clp.addOption({ u"set"_qs, u"Print the inventory of the set <number> as JSON."_qs, u"number"_qs });
    m_clp.addOption({ u"aggregate"_qs, u"Merge identical parts in the printed inventory."_qs });
    m_clp.addOption({ u"thumbnail"_qs, u"Fetch the image at <url> through the cache."_qs, u"url"_qs });
    m_clp.addOption({ u"output"_qs, u"Write the fetched image to <file>."_qs, u"file"_qs });
    m_clp.addOption({ u"invalidate"_qs, u"Remove the image at <url> from the cache."_qs, u"url"_qs });
    m_clp.addOption({ u"color-guide"_qs, u"Print BrickLink's color guide for <locale> as JSON."_qs,
                      u"locale"_qs });
    m_clp.addOption({ u"config"_qs, u"Read the settings from the INI file <file>."_qs, u"file"_qs });
    m_clp.addOption({ u"verbose"_qs, u"Enable debug logging."_qs });
    m_clp.process(QCoreApplication::arguments());

    if (m_clp.isSet(u"version"_qs)) {
        puts(BRICKHARVEST_NAME " " BRICKHARVEST_VERSION);
        exit(0);
    }

    const int commands = int(m_clp.isSet(u"set"_qs)) + int(m_clp.isSet(u"thumbnail"_qs))
            + int(m_clp.isSet(u"invalidate"_qs)) + int(m_clp.isSet(u"color-guide"_qs));
    if (commands != 1)
        m_clp.showHelp(1);
    if (m_clp.isSet(u"thumbnail"_qs) && !m_clp.isSet(u"output"_qs)) {
        fprintf(stderr, "--thumbnail needs an --output file.\n");
        exit(1);
    }
}

BackendApplication::~BackendApplication()
{
    m_inventoryService.reset();
    m_fetchCache.reset();
    m_imageTransfer.reset();
    m_pageTransfer.reset();
}

void BackendApplication::init()
{
    if (m_clp.isSet(u"verbose"_qs))
        QLoggingCategory::setFilterRules(u"bh.*.debug=true\nbh.*.info=true"_qs);

    m_config = std::make_unique<Config>(m_clp.value(u"config"_qs));

    m_pageTransfer = std::make_unique<Transfer>(m_config->maxConnections());
    m_imageTransfer = std::make_unique<Transfer>(m_config->maxConcurrentDownloads());
    for (auto *transfer : { m_pageTransfer.get(), m_imageTransfer.get() }) {
        transfer->setUserAgent(m_config->userAgent());
        transfer->setTransferTimeout(m_config->transferTimeout());
    }

    m_fetchCache = std::make_unique<BrickHarvest::FetchCache>(m_imageTransfer.get(), m_config->cacheDir(),
                                                              m_config->memoryCacheEntries());
    m_inventoryService = std::make_unique<BrickHarvest::InventoryService>(m_pageTransfer.get(),
                                                                          m_config->brickLinkBaseUrl());

    QMetaObject::invokeMethod(this, [this]() -> QCoro::Task<> {
            QCoreApplication::exit(co_await run());
        }, Qt::QueuedConnection);
}

QCoro::Task<int> BackendApplication::run()
{
    try {
        if (m_clp.isSet(u"set"_qs)) {
            co_await printInventory(m_clp.value(u"set"_qs));
        } else if (m_clp.isSet(u"thumbnail"_qs)) {
            co_await saveThumbnail(QUrl::fromUserInput(m_clp.value(u"thumbnail"_qs)),
                                   m_clp.value(u"output"_qs));
        } else if (m_clp.isSet(u"invalidate"_qs)) {
            m_fetchCache->invalidate(QUrl::fromUserInput(m_clp.value(u"invalidate"_qs)));
        } else if (m_clp.isSet(u"color-guide"_qs)) {
            co_await printColorGuide(m_clp.value(u"color-guide"_qs));
        }
    } catch (const Exception &e) {
        QString error = e.errorString();
        if (error.isEmpty())
            fprintf(stderr, "FAILED.\n");
        else
            fprintf(stderr, "FAILED: %s\n", qPrintable(error));

        co_return 2;
    }
    co_return 0;
}

QCoro::Task<> BackendApplication::printInventory(const QString &setNumber)
{
    BrickHarvest::Inventory inv = co_await m_inventoryService->fetchInventory(setNumber);

    if (m_clp.isSet(u"aggregate"_qs)) {
        inv.parts = BrickHarvest::aggregateParts(inv.parts);
        for (auto &minifig : inv.minifigures)
            minifig.parts = BrickHarvest::aggregateParts(minifig.parts);
    }
    inv.categories = BrickHarvest::normalizedCategoryPath(inv.categories);

    const QByteArray json = QJsonDocument(BrickHarvest::toJson(inv)).toJson(QJsonDocument::Indented);
    fwrite(json.constData(), 1, size_t(json.size()), stdout);
}

QCoro::Task<> BackendApplication::saveThumbnail(const QUrl &url, const QString &fileName)
{
    const QUrl urlCopy = url;
    const QString fileNameCopy = fileName;

    const QByteArray data = co_await m_fetchCache->get(urlCopy);

    QSaveFile f(fileNameCopy);
    if (!f.open(QIODevice::WriteOnly) || (f.write(data) != data.size()) || !f.commit())
        throw Exception(&f, "Could not write the image");

    printf("%s: %lld bytes\n", qPrintable(fileNameCopy), qlonglong(data.size()));
}

QCoro::Task<> BackendApplication::printColorGuide(const QString &locale)
{
    const auto entries = co_await BrickHarvest::ColorGuide::fetch(m_pageTransfer.get(),
                                                                  locale.isEmpty() ? u"en-us"_qs : locale);
    QJsonArray array;
    for (const auto &entry : entries)
        array.append(BrickHarvest::toJson(entry));

    const QByteArray json = QJsonDocument(array).toJson(QJsonDocument::Indented);
    fwrite(json.constData(), 1, size_t(json.size()), stdout);
}

int BackendApplication::exec()
{
    return QCoreApplication::exec();
}

#include "moc_backendapplication.cpp"

// Copyright (C) 2004-2025 Robert Griebl
// SPDX-License-Identifier: GPL-3.0-only

#include <QtCore/QLoggingCategory>
#include <QtConcurrent/QtConcurrentRun>
#include <QCoro/QCoroFuture>

#include "html/markdown.h"
#include "utility/exception.h"
#include "utility/transfer.h"
#include "inventoryservice.h"

Q_LOGGING_CATEGORY(LogInventory, "bh.inventory", QtWarningMsg)


namespace BrickHarvest {

static Inventory parsePage(const QByteArray &html, const QString &id, const QUrl &url,
                           InventoryExtractor::Mode mode)
{
    const QString markdown = Html::Markdown::fromHtml(html, url);
    return InventoryExtractor::extract(markdown, id, url, mode);
}

static void recordError(std::exception_ptr *firstError)
{
    if (!*firstError)
        *firstError = std::current_exception();
}


InventoryService::InventoryService(Transfer *transfer, const QUrl &baseUrl)
    : m_transfer(transfer)
    , m_baseUrl(baseUrl)
{ }

QCoro::Task<Inventory> InventoryService::fetchInventory(QString setNumber)
{
    const QString number = normalizedSetNumber(setNumber);
    if (number.isEmpty())
        throw Exception("No set number given");

    qCInfo(LogInventory) << "Fetching the inventory of set" << number;

    Inventory inv = co_await fetchPage(setInventoryUrl(number, m_baseUrl), number,
                                       InventoryExtractor::Mode::FullInventory);

    // minifigures and multipacks are resolved in one batch
    QVector<Slot> slots(inv.minifigures.size());
    std::exception_ptr firstError;
    std::vector<QCoro::Task<>> tasks;

    launchMinifigures(inv.minifigures, slots, firstError, tasks);
    launchSubparts(inv.parts, firstError, tasks);
    co_await joinAll(tasks);

    if (firstError)
        std::rethrow_exception(firstError);

    for (qsizetype i = 0; i < slots.size(); ++i)
        inv.minifigures[i] = std::move(*slots[i]);

    qCInfo(LogInventory) << "Set" << number << "has" << inv.parts.size() << "parts and"
                         << inv.minifigures.size() << "minifigures";
    co_return inv;
}

QCoro::Task<QVector<Minifigure>> InventoryService::enrichMinifigures(QVector<Minifigure> stubs)
{
    QVector<Slot> slots(stubs.size());
    std::exception_ptr firstError;
    std::vector<QCoro::Task<>> tasks;

    launchMinifigures(stubs, slots, firstError, tasks);
    co_await joinAll(tasks);

    if (firstError)
        std::rethrow_exception(firstError);

    QVector<Minifigure> result;
    result.reserve(slots.size());
    for (auto &slot : slots)
        result.append(std::move(*slot));
    co_return result;
}

QCoro::Task<std::vector<Part>> InventoryService::enrichParts(std::vector<Part> parts)
{
    std::exception_ptr firstError;
    std::vector<QCoro::Task<>> tasks;

    launchSubparts(parts, firstError, tasks);
    co_await joinAll(tasks);

    if (firstError)
        std::rethrow_exception(firstError);
    co_return parts;
}

QCoro::Task<Inventory> InventoryService::fetchPage(QUrl url, QString id, InventoryExtractor::Mode mode)
{
    const QByteArray html = co_await m_transfer->download(url);

    // the conversion is CPU bound, so keep it off the event loop
    co_return co_await QtConcurrent::run(parsePage, html, id, url, mode);
}

void InventoryService::launchMinifigures(const QVector<Minifigure> &stubs, QVector<Slot> &slots,
                                         std::exception_ptr &firstError,
                                         std::vector<QCoro::Task<>> &tasks)
{
    Q_ASSERT(slots.size() == stubs.size());

    for (qsizetype i = 0; i < stubs.size(); ++i)
        tasks.push_back(resolveMinifigure(stubs.at(i), &slots[i], &firstError));
}

void InventoryService::launchSubparts(std::vector<Part> &parts, std::exception_ptr &firstError,
                                      std::vector<QCoro::Task<>> &tasks)
{
    for (auto &part : parts) {
        if (!part.inventoryUrl.isEmpty())
            tasks.push_back(resolveSubparts(part.inventoryUrl, part.id, &part, &firstError));
    }
}

QCoro::Task<> InventoryService::resolveMinifigure(Minifigure stub, Slot *slot,
                                                  std::exception_ptr *firstError)
{
    try {
        const QUrl url = stub.inventoryUrl.isEmpty() ? minifigureInventoryUrl(stub.id, m_baseUrl)
                                                     : stub.inventoryUrl;
        Inventory inv = co_await fetchPage(url, stub.id);

        std::exception_ptr nestedError;
        std::vector<QCoro::Task<>> nested;
        launchSubparts(inv.parts, nestedError, nested);
        co_await joinAll(nested);
        if (nestedError)
            std::rethrow_exception(nestedError);

        stub.parts = std::move(inv.parts);
        *slot = std::move(stub);
    } catch (const std::exception &e) {
        qCWarning(LogInventory) << "Could not resolve minifigure" << stub.id << ":" << e.what();
        recordError(firstError);
    }
}

QCoro::Task<> InventoryService::resolveSubparts(QUrl url, QString id, Part *part,
                                                std::exception_ptr *firstError)
{
    try {
        Inventory inv = co_await fetchPage(url, id);

        // subparts are leaves: their own inventory links are not followed
        part->subparts = std::move(inv.parts);
    } catch (const std::exception &e) {
        qCWarning(LogInventory) << "Could not resolve the inventory of part" << id << ":" << e.what();
        recordError(firstError);
    }
}

QCoro::Task<> InventoryService::joinAll(std::vector<QCoro::Task<>> &tasks)
{
    for (auto &task : tasks)
        co_await task;
}

} // namespace BrickHarvest

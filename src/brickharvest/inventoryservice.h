// Copyright (C) 2004-2025 Robert Griebl
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include <exception>
#include <optional>
#include <vector>

#include <QtCore/QString>
#include <QtCore/QUrl>
#include <QtCore/QVector>
#include <QCoro/QCoroTask>

#include "inventory.h"
#include "inventoryextractor.h"
#include "setimport.h"

class Transfer;


namespace BrickHarvest {

// Downloads inventory pages and resolves the nested minifigure and multipack inventories.
//
// Nested pages are fetched concurrently, but the results always keep the order of the
// input. If any nested fetch fails, the whole call fails with the first error after all
// of the other fetches have finished.
class InventoryService
{
public:
    explicit InventoryService(Transfer *transfer, const QUrl &baseUrl = defaultBaseUrl());

    QCoro::Task<Inventory> fetchInventory(QString setNumber);

    QCoro::Task<QVector<Minifigure>> enrichMinifigures(QVector<Minifigure> stubs);
    QCoro::Task<std::vector<Part>> enrichParts(std::vector<Part> parts);

    QCoro::Task<Inventory> fetchPage(QUrl url, QString id,
                                     InventoryExtractor::Mode mode = InventoryExtractor::Mode::PartsOnly);

    QUrl baseUrl() const  { return m_baseUrl; }

private:
    using Slot = std::optional<Minifigure>;

    void launchMinifigures(const QVector<Minifigure> &stubs, QVector<Slot> &slots,
                           std::exception_ptr &firstError, std::vector<QCoro::Task<>> &tasks);
    void launchSubparts(std::vector<Part> &parts, std::exception_ptr &firstError,
                        std::vector<QCoro::Task<>> &tasks);

    QCoro::Task<> resolveMinifigure(Minifigure stub, Slot *slot, std::exception_ptr *firstError);
    QCoro::Task<> resolveSubparts(QUrl url, QString id, Part *part, std::exception_ptr *firstError);

    static QCoro::Task<> joinAll(std::vector<QCoro::Task<>> &tasks);

    Transfer *m_transfer;
    QUrl m_baseUrl;
};

} // namespace BrickHarvest

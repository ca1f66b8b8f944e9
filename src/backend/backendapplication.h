// Copyright (C) 2004-2025 Robert Griebl
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include <memory>

#include <QCommandLineParser>
#include <QCoro/QCoroTask>

class Config;
class Transfer;

namespace BrickHarvest {
class FetchCache;
class InventoryService;
}


class BackendApplication : public QObject
{
    Q_OBJECT

public:
    BackendApplication(int &argc, char **argv);
    ~BackendApplication() override;

    void init();
    int exec();

private:
    QCoro::Task<int> run();
    QCoro::Task<> printInventory(const QString &setNumber);
    QCoro::Task<> saveThumbnail(const QUrl &url, const QString &fileName);
    QCoro::Task<> printColorGuide(const QString &locale);

    QCommandLineParser m_clp;
    std::unique_ptr<Config> m_config;
    std::unique_ptr<Transfer> m_pageTransfer;
    std::unique_ptr<Transfer> m_imageTransfer;
    std::unique_ptr<BrickHarvest::FetchCache> m_fetchCache;
    std::unique_ptr<BrickHarvest::InventoryService> m_inventoryService;
};

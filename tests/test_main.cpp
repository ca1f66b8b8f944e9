// Copyright (C) 2004-2025 Robert Griebl
// SPDX-License-Identifier: GPL-3.0-only

#include <gtest/gtest.h>

#include <QCoreApplication>
#include <QThreadPool>


int main(int argc, char **argv)
{
    QCoreApplication::setApplicationName(u"BrickHarvestTests"_qs);
    QCoreApplication::setApplicationVersion(u"1.0"_qs);

    // the coroutines under test need an event loop in the main thread
    QCoreApplication app(argc, argv);

    ::testing::InitGoogleTest(&argc, argv);
    int result = RUN_ALL_TESTS();

    QThreadPool::globalInstance()->waitForDone();
    return result;
}

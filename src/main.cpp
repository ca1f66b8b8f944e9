// Copyright (C) 2004-2025 Robert Griebl
// SPDX-License-Identifier: GPL-3.0-only

#include <QtCore/QThreadPool>
#include <QtCore/QCoreApplication>

#include "backend/backendapplication.h"


int main(int argc, char **argv)
{
    BackendApplication a(argc, argv);
    a.init();

    int exitCode = a.exec();

    // the HTML conversion runs in the global thread-pool: join it before the statics go away
    QThreadPool::globalInstance()->clear();
    QThreadPool::globalInstance()->waitForDone();

    return exitCode;
}

// Copyright (C) 2004-2025 Robert Griebl
// SPDX-License-Identifier: GPL-3.0-only

#include <memory>
#include <QByteArray>
#include <QFile>

#include "exception.h"

Exception::Exception(const QString &message)
    : QException()
    , m_errorString(message)
{ }

Exception::Exception(const char *message)
    : Exception(QString::fromLatin1(message))
{ }

Exception::Exception(QFileDevice *f, const QString &message)
    : Exception(message + fileMessage(f))
{ }

Exception::Exception(QFileDevice *f, const char *message)
    : Exception(QString::fromLatin1(message) + fileMessage(f))
{ }

Exception::Exception(const Exception &copy)
    : QException(copy)
    , m_errorString(copy.m_errorString)
{ }

Exception::Exception(Exception &&move) noexcept
    : m_errorString(std::move(move.m_errorString))
{
    std::swap(m_whatBuffer, move.m_whatBuffer);
}

const char *Exception::what() const noexcept
{
    if (!m_whatBuffer)
        m_whatBuffer = std::make_unique<QByteArray>();
    *m_whatBuffer = m_errorString.toLocal8Bit();
    return m_whatBuffer->constData();
}

QString Exception::fileMessage(QFileDevice *f)
{
    return f ? QString(u" (" + f->fileName() + u"): " + f->errorString()) : QString();
}



ParseException::ParseException(const char *message)
    : ParseException(QString::fromLatin1(message))
{ }

ParseException::ParseException(const QString &message)
    : Exception(u"Parse error: "_qs + message)
{ }


TableNotFoundException::TableNotFoundException()
    : ParseException("the inventory table could not be found")
{ }


MalformedRowException::MalformedRowException(const QString &line, const char *reason)
    : ParseException(u"malformed inventory row (%1): %2"_qs.arg(QString::fromLatin1(reason), line))
    , m_line(line)
{ }


MissingSetNameException::MissingSetNameException(const QString &setNumber)
    : ParseException(u"no name found for set %1"_qs.arg(setNumber))
{ }


TransferException::TransferException(const QString &url, const QString &error)
    : Exception(u"Download failed for %1: %2"_qs.arg(url, error))
{ }


InvalidResponseException::InvalidResponseException(const QString &url, int statusCode)
    : Exception(u"Download failed for %1: HTTP status %2"_qs.arg(url, QString::number(statusCode)))
    , m_statusCode(statusCode)
{ }


EmptyResponseException::EmptyResponseException(const QString &url)
    : Exception(u"Download has no data for %1"_qs.arg(url))
{ }

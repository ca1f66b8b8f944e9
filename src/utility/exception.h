// Copyright (C) 2004-2025 Robert Griebl
// SPDX-License-Identifier: GPL-3.0-only


#pragma once

#include <memory>

#include <QException>
#include <QString>

QT_FORWARD_DECLARE_CLASS(QFileDevice)


class Exception : public QException
{
public:
    explicit Exception(const QString &message = { });
    explicit Exception(const char *message);
    explicit Exception(QFileDevice *f, const QString &message);
    explicit Exception(QFileDevice *f, const char *message);

    Exception(const Exception &copy);
    Exception(Exception &&move) noexcept;

    ~Exception() override = default;

    template <typename... Ts> inline Exception &arg(const Ts & ...ts)
    {
        m_errorString = m_errorString.arg(ts...);
        return *this;
    }

    inline QString errorString() const  { return m_errorString; }
    const char *what() const noexcept override;

    // QFuture transports exceptions by clone(), so every subclass has to re-implement both
    void raise() const override         { throw *this; }
    Exception *clone() const override   { return new Exception(*this); }

protected:
    static QString fileMessage(QFileDevice *f);

    QString m_errorString;

private:
    mutable std::unique_ptr<QByteArray> m_whatBuffer;
};

class ParseException : public Exception
{
public:
    explicit ParseException(const char *message);
    explicit ParseException(const QString &message);

    void raise() const override               { throw *this; }
    ParseException *clone() const override    { return new ParseException(*this); }
};

class TableNotFoundException : public ParseException
{
public:
    TableNotFoundException();

    void raise() const override                     { throw *this; }
    TableNotFoundException *clone() const override  { return new TableNotFoundException(*this); }
};

class MalformedRowException : public ParseException
{
public:
    explicit MalformedRowException(const QString &line, const char *reason);

    QString line() const  { return m_line; }

    void raise() const override                    { throw *this; }
    MalformedRowException *clone() const override  { return new MalformedRowException(*this); }

private:
    QString m_line;
};

class MissingSetNameException : public ParseException
{
public:
    explicit MissingSetNameException(const QString &setNumber);

    void raise() const override                      { throw *this; }
    MissingSetNameException *clone() const override  { return new MissingSetNameException(*this); }
};

class TransferException : public Exception
{
public:
    explicit TransferException(const QString &url, const QString &error);

    void raise() const override                { throw *this; }
    TransferException *clone() const override  { return new TransferException(*this); }
};

class InvalidResponseException : public Exception
{
public:
    explicit InvalidResponseException(const QString &url, int statusCode);

    int statusCode() const  { return m_statusCode; }

    void raise() const override                       { throw *this; }
    InvalidResponseException *clone() const override  { return new InvalidResponseException(*this); }

private:
    int m_statusCode;
};

class EmptyResponseException : public Exception
{
public:
    explicit EmptyResponseException(const QString &url);

    void raise() const override                     { throw *this; }
    EmptyResponseException *clone() const override  { return new EmptyResponseException(*this); }
};

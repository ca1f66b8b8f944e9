// Copyright (C) 2004-2025 Robert Griebl
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include <functional>

#include <QUrl>
#include <QThread>
#include <QVector>
#include <QSet>
#include <QLoggingCategory>
#include <QCoro/QCoroTask>

Q_DECLARE_LOGGING_CATEGORY(LogTransfer)

QT_FORWARD_DECLARE_CLASS(QNetworkAccessManager)
QT_FORWARD_DECLARE_CLASS(QNetworkReply)
class Transfer;
class TransferRetriever;

class TransferJob
{
public:
    ~TransferJob();

    static TransferJob *get(const QUrl &url);

    QUrl url() const                 { return m_url; }
    QUrl effectiveUrl() const        { return m_effective_url; }
    QString errorString() const;
    int responseCode() const         { return m_respcode; }
    QByteArray data() const          { return m_data; }

    bool isCompleted() const         { return m_status == Completed; }
    bool isFailed() const            { return m_status == Failed; }
    bool isAborted() const           { return m_status == Aborted; }
    bool isDone() const              { return m_status > Active; }

    void setAutoDelete(bool autoDelete) { m_auto_delete = autoDelete; }
    bool autoDelete() const             { return m_auto_delete; }

private:
    enum Status : uint {
        Queued = 0,
        Active,
        Completed,
        Failed,
        Aborted
    };

    void setStatus(Status st)  { m_status = st; }

    TransferJob() = default;
    Q_DISABLE_COPY(TransferJob)

    QUrl         m_url;
    QUrl         m_effective_url;
    QByteArray   m_data;
    QString      m_error_string;
    QNetworkReply *m_reply = nullptr;

    uint         m_respcode         : 16 = 0;
    Status       m_status           : 4 = Queued;
    bool         m_auto_delete      : 1 = true;

    friend class Transfer;
    friend class TransferRetriever;
};

Q_DECLARE_METATYPE(TransferJob *)

using NetworkAccessManagerFactory = std::function<QNetworkAccessManager *(QObject *parent)>;

// lives in the retriever thread: owns the network access manager and all replies
class TransferRetriever : public QObject
{
    Q_OBJECT
public:
    TransferRetriever(Transfer *transfer, int maxConnections, const NetworkAccessManagerFactory &namFactory);
    ~TransferRetriever() override;

    void addJob(TransferJob *job);
    void abortAllJobs();

signals:
    void finished(TransferJob *job);

private:
    void schedule();
    void downloadFinished(TransferJob *job);

    Transfer *m_transfer;
    NetworkAccessManagerFactory m_namFactory;
    QNetworkAccessManager *m_nam = nullptr;
    QVector<TransferJob *> m_queue;
    QVector<TransferJob *> m_running;
    int                    m_maxConnections;
};


class Transfer : public QObject
{
    Q_OBJECT
public:
    // at most maxConnections jobs are active at the same time, the rest is queued in FIFO order
    explicit Transfer(int maxConnections = 6, const NetworkAccessManagerFactory &namFactory = { },
                      QObject *parent = nullptr);
    // jobs still outstanding are aborted and reported via finished() before this returns
    ~Transfer() override;

    QString userAgent() const;
    int transferTimeout() const;

    QCoro::Task<QByteArray> download(QUrl url);

signals:
    void finished(TransferJob *);

public slots:
    void setUserAgent(const QString &ua);
    void setTransferTimeout(int msec);

private:
    void retrieve(TransferJob *job);
    void jobFinished(TransferJob *job);

    QThread *m_retrieverThread;
    TransferRetriever *m_retriever;
    QSet<TransferJob *> m_outstanding;
    QString m_user_agent;
    int m_timeout = 60000;
};


class AwaitableTransferJob : public QObject
{
    Q_OBJECT
public:
    AwaitableTransferJob(Transfer *transfer, TransferJob *job);
    ~AwaitableTransferJob() override;
    operator TransferJob *() const;

signals:
    void finished();

private:
    TransferJob *m_job;
};

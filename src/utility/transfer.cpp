// Copyright (C) 2004-2025 Robert Griebl
// SPDX-License-Identifier: GPL-3.0-only

#include <utility>

#include <QThread>
#include <QEventLoop>
#include <QNetworkAccessManager>
#include <QNetworkRequest>
#include <QNetworkReply>
#include <QCoreApplication>
#include <QCoro/QCoroSignal>

#include "exception.h"
#include "transfer.h"

Q_LOGGING_CATEGORY(LogTransfer, "bh.transfer", QtWarningMsg)


TransferJob::~TransferJob()
{
    Q_ASSERT(!m_reply);
}

TransferJob *TransferJob::get(const QUrl &url)
{
    if (url.isEmpty())
        return nullptr;

    auto *j = new TransferJob();

    j->m_url = url;
    if (j->m_url.scheme().isEmpty())
        j->m_url.setScheme(u"https"_qs);
    return j;
}

QString TransferJob::errorString() const
{
    return isFailed() ? m_error_string
                      : (isAborted() ? QCoreApplication::translate("Transfer", "Aborted")
                                     : QString { });
}

// ===========================================================================
// ===========================================================================
// ===========================================================================


Transfer::Transfer(int maxConnections, const NetworkAccessManagerFactory &namFactory, QObject *parent)
    : QObject(parent)
{
    m_user_agent = qApp->applicationName() + u'/' + qApp->applicationVersion();

    m_retriever = new TransferRetriever(this, std::max(1, maxConnections), namFactory);
    m_retrieverThread = QThread::create([this]() {
        QEventLoop eventLoop;
        int returnCode = eventLoop.exec();
        delete m_retriever;
        return returnCode;
    });
    m_retriever->moveToThread(m_retrieverThread);
    m_retrieverThread->setObjectName(u"TransferRetriever"_qs);
    m_retrieverThread->setParent(this);
    m_retrieverThread->start(QThread::LowPriority);

    connect(m_retriever, &TransferRetriever::finished,
            this, &Transfer::jobFinished, Qt::QueuedConnection);
}

Transfer::~Transfer()
{
    QMetaObject::invokeMethod(m_retriever, &TransferRetriever::abortAllJobs, Qt::BlockingQueuedConnection);
    m_retrieverThread->quit();
    m_retrieverThread->wait();

    // the queued finished() notifications of the retriever are dropped together with this object
    const auto outstanding = m_outstanding;
    if (!outstanding.isEmpty())
        qCInfo(LogTransfer) << "Shutting down with" << outstanding.size() << "unfinished jobs";
    for (auto *job : outstanding) {
        if (!job->isDone())
            job->setStatus(TransferJob::Aborted);
        jobFinished(job);
    }
}

void Transfer::jobFinished(TransferJob *job)
{
    m_outstanding.remove(job);
    emit finished(job);
    if (job->autoDelete())
        delete job;
}

void Transfer::setUserAgent(const QString &ua)
{
    m_user_agent = ua;
}

void Transfer::setTransferTimeout(int msec)
{
    m_timeout = std::max(0, msec);
}

void Transfer::retrieve(TransferJob *job)
{
    Q_ASSERT(!m_outstanding.contains(job));
    m_outstanding.insert(job);

    QMetaObject::invokeMethod(m_retriever, [this, job]() {
        m_retriever->addJob(job);
    }, Qt::QueuedConnection);
}

QString Transfer::userAgent() const
{
    return m_user_agent;
}

int Transfer::transferTimeout() const
{
    return m_timeout;
}

QCoro::Task<QByteArray> Transfer::download(QUrl url)
{
    auto *job = TransferJob::get(url);
    if (!job)
        throw TransferException(url.toString(), u"empty URL"_qs);

    AwaitableTransferJob atj(this, job);
    retrieve(job);

    co_await qCoro(&atj, &AwaitableTransferJob::finished);

    const QString effectiveUrl = job->effectiveUrl().isEmpty() ? url.toString()
                                                               : job->effectiveUrl().toString();
    if (job->isCompleted()) {
        if (job->data().isEmpty())
            throw EmptyResponseException(effectiveUrl);
        co_return job->data();
    } else if (job->responseCode() && ((job->responseCode() < 200) || (job->responseCode() > 299))) {
        throw InvalidResponseException(effectiveUrl, job->responseCode());
    } else {
        throw TransferException(effectiveUrl, job->errorString());
    }
}


TransferRetriever::TransferRetriever(Transfer *transfer, int maxConnections,
                                     const NetworkAccessManagerFactory &namFactory)
    : QObject()
    , m_transfer(transfer)
    , m_namFactory(namFactory)
    , m_maxConnections(maxConnections)
{ }

TransferRetriever::~TransferRetriever()
{
    abortAllJobs();
    delete m_nam;
}

void TransferRetriever::addJob(TransferJob *job)
{
    m_queue.append(job);
    schedule();
}

void TransferRetriever::abortAllJobs()
{
    const auto queued = std::exchange(m_queue, { });
    for (auto *j : queued) {
        j->setStatus(TransferJob::Aborted);
        emit finished(j);
    }

    // aborting a reply finishes it synchronously, which removes it from m_running
    const auto running = m_running;
    for (auto *j : running) {
        if (j->m_reply)
            j->m_reply->abort();
    }
}

void TransferRetriever::schedule()
{
    if (!m_nam) {
        m_nam = m_namFactory ? m_namFactory(this) : new QNetworkAccessManager(this);
        m_nam->setRedirectPolicy(QNetworkRequest::NoLessSafeRedirectPolicy);
    }

    while ((m_running.size() < m_maxConnections) && !m_queue.isEmpty()) {
        auto j = m_queue.takeFirst();

        QUrl url = j->url();
        j->m_effective_url = url;

        QNetworkRequest req(url);
        req.setAttribute(QNetworkRequest::Http2AllowedAttribute, false); // QTBUG-105043
        req.setAttribute(QNetworkRequest::CacheLoadControlAttribute, QNetworkRequest::AlwaysNetwork);
        req.setAttribute(QNetworkRequest::CacheSaveControlAttribute, false);
        req.setHeader(QNetworkRequest::UserAgentHeader, m_transfer->userAgent());
        req.setTransferTimeout(m_transfer->transferTimeout());

        j->setStatus(TransferJob::Active);
        j->m_reply = m_nam->get(req);

        qCInfo(LogTransfer) << ">> GET" << req.url();

        connect(j->m_reply, &QNetworkReply::metaDataChanged, this, [j]() {
            qCInfo(LogTransfer) << "<< REPLY" << j->m_reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toUInt()
                                << j->m_effective_url;
        });
        connect(j->m_reply, &QNetworkReply::finished, this, [this, j]() {
            downloadFinished(j);
        });

        m_running.append(j);
    }
}

void TransferRetriever::downloadFinished(TransferJob *j)
{
    auto error = j->m_reply->error();

    j->m_respcode = j->m_reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toUInt();
    j->m_effective_url = j->m_reply->url();

    if (error == QNetworkReply::OperationCanceledError) {
        j->setStatus(TransferJob::Aborted);
    } else if (error != QNetworkReply::NoError) {
        j->m_error_string = j->m_reply->errorString();
        j->setStatus(TransferJob::Failed);
        qCWarning(LogTransfer) << "Download of" << j->m_url << "failed:" << j->m_error_string;
    } else if ((j->m_respcode >= 200) && (j->m_respcode <= 299)) {
        j->m_data = j->m_reply->readAll();
        j->setStatus(TransferJob::Completed);
    } else {
        j->m_error_string = u"Cannot handle HTTP response code %1"_qs.arg(j->m_respcode);
        j->setStatus(TransferJob::Failed);
    }
    j->m_reply->disconnect(this);
    j->m_reply->deleteLater();
    j->m_reply = nullptr;

    m_running.removeAll(j);

    emit finished(j); // Transfer::jobFinished() deletes the job in the main thread

    QMetaObject::invokeMethod(this, &TransferRetriever::schedule, Qt::QueuedConnection);
}


AwaitableTransferJob::AwaitableTransferJob(Transfer *transfer, TransferJob *job)
    : m_job(job)
{
    connect(transfer, &Transfer::finished,
            this, [this](TransferJob *finishedJob) {
        if (m_job == finishedJob) {
            m_job->setAutoDelete(false);
            // the awaiting coroutine deletes the job: only resume it after Transfer is done with it
            QMetaObject::invokeMethod(this, &AwaitableTransferJob::finished, Qt::QueuedConnection);
        }
    });
}

AwaitableTransferJob::~AwaitableTransferJob()
{
    if (!m_job->autoDelete())
        delete m_job;
}

AwaitableTransferJob::operator TransferJob *() const
{
    return m_job;
}

#include "moc_transfer.cpp"

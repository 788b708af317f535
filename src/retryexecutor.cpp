#include "retryexecutor.h"
#include <QDebug>
#include <QDeadlineTimer>
#include <cmath>
#include <thread>

QString ClassifiedError::kindName(ErrorKind kind)
{
    switch (kind) {
        case ErrorKind::ConnectivityLost:
            return "ConnectivityLost";
        case ErrorKind::Timeout:
            return "Timeout";
        case ErrorKind::ServerFault:
            return "ServerFault";
        case ErrorKind::NotFound:
            return "NotFound";
        case ErrorKind::Other:
            return "Other";
        default:
            return "Other";
    }
}

QString ClassifiedError::userMessage() const
{
    QString text;
    switch (kind) {
        case ErrorKind::ConnectivityLost:
            text = "You appear to be offline. Check your network connection and try again.";
            break;
        case ErrorKind::Timeout:
            text = "The operation timed out. Please try again.";
            break;
        case ErrorKind::ServerFault:
            text = "The server had a problem. Please try again later.";
            break;
        case ErrorKind::NotFound:
            text = "The requested resource was not found.";
            break;
        case ErrorKind::Other:
            text = message.isEmpty() ? QString("The operation failed.") : message;
            break;
    }

    if (exhausted) {
        text += QString(" (gave up after %1 attempts)").arg(attempts);
    }
    return text;
}

OperationError::OperationError(ErrorKind kind, const QString& message, int statusCode)
    : std::runtime_error(message.toStdString()),
      m_kind(kind),
      m_statusCode(statusCode)
{
}

OperationError OperationError::fromStatus(int statusCode, const QString& message)
{
    ErrorKind kind = ErrorKind::Other;
    if (statusCode >= 500) {
        kind = ErrorKind::ServerFault;
    } else if (statusCode == 404) {
        kind = ErrorKind::NotFound;
    } else if (statusCode == 408) {
        kind = ErrorKind::Timeout;
    }
    return OperationError(kind, message, statusCode);
}

RetryPolicy RetryPolicy::forUpload()
{
    RetryPolicy policy;
    policy.timeoutMs = 60000;
    return policy;
}

RetryPolicy RetryPolicy::forProcessing()
{
    RetryPolicy policy;
    policy.timeoutMs = 120000;
    policy.maxRetries = 2;
    policy.retryableKinds = {ErrorKind::Timeout, ErrorKind::ServerFault};
    return policy;
}

int RetryPolicy::delayForAttempt(int attempt) const
{
    double delay = baseDelayMs * std::pow(backoffFactor, attempt);
    if (delay > maxDelayMs) {
        return maxDelayMs;
    }
    return static_cast<int>(delay);
}

CancellationToken::CancellationToken()
    : m_cancelled(false),
      m_finished(false),
      m_reason(ErrorKind::Other)
{
}

bool CancellationToken::isCancelled() const
{
    QMutexLocker locker(&m_mutex);
    return m_cancelled;
}

ErrorKind CancellationToken::reason() const
{
    QMutexLocker locker(&m_mutex);
    return m_reason;
}

bool CancellationToken::waitForCancellation(int timeoutMs) const
{
    QMutexLocker locker(&m_mutex);
    QDeadlineTimer deadline(timeoutMs, Qt::PreciseTimer);
    while (!m_cancelled) {
        if (!m_condition.wait(&m_mutex, deadline)) {
            break;
        }
    }
    return m_cancelled;
}

void CancellationToken::cancel(ErrorKind reason)
{
    QMutexLocker locker(&m_mutex);
    if (m_cancelled) {
        return;
    }
    m_cancelled = true;
    m_reason = reason;
    m_condition.wakeAll();
}

void CancellationToken::markFinished()
{
    QMutexLocker locker(&m_mutex);
    m_finished = true;
    m_condition.wakeAll();
}

CancellationToken::WaitResult CancellationToken::waitForFinish(int timeoutMs) const
{
    QMutexLocker locker(&m_mutex);
    QDeadlineTimer deadline = timeoutMs > 0 ? QDeadlineTimer(timeoutMs, Qt::PreciseTimer)
                                            : QDeadlineTimer(QDeadlineTimer::Forever);
    while (!m_finished && !m_cancelled) {
        if (!m_condition.wait(&m_mutex, deadline)) {
            break;
        }
    }

    if (m_finished) {
        return WaitResult::Finished;
    }
    return m_cancelled ? WaitResult::Cancelled : WaitResult::TimedOut;
}

RetryExecutor::RetryExecutor(QObject *parent)
    : QObject(parent),
      m_online(true),
      m_nextTokenId(1)
{
}

RetryExecutor::~RetryExecutor()
{
    QMutexLocker locker(&m_mutex);
    for (const auto& token : m_inFlight) {
        token->cancel(ErrorKind::Other);
    }
}

void RetryExecutor::notifyConnectivityLost()
{
    {
        QMutexLocker locker(&m_mutex);
        if (!m_online) {
            return;
        }
        m_online = false;
        for (const auto& token : m_inFlight) {
            token->cancel(ErrorKind::ConnectivityLost);
        }
        qWarning() << "RetryExecutor: connectivity lost, cancelled" << m_inFlight.size() << "operations";
    }
    emit connectivityChanged(false);
}

void RetryExecutor::notifyConnectivityRestored()
{
    {
        QMutexLocker locker(&m_mutex);
        if (m_online) {
            return;
        }
        m_online = true;
        qInfo() << "RetryExecutor: connectivity restored";
    }
    emit connectivityChanged(true);
}

bool RetryExecutor::isOnline() const
{
    QMutexLocker locker(&m_mutex);
    return m_online;
}

QHash<QString, int> RetryExecutor::retryStats() const
{
    QMutexLocker locker(&m_mutex);
    return m_retryCounts;
}

ClassifiedError RetryExecutor::classify(std::exception_ptr error)
{
    ClassifiedError classified;
    try {
        std::rethrow_exception(error);
    } catch (const OperationError& e) {
        classified.kind = e.kind();
        classified.statusCode = e.statusCode();
        classified.message = QString::fromStdString(e.what());
    } catch (const std::exception& e) {
        classified.kind = ErrorKind::Other;
        classified.message = QString::fromStdString(e.what());
    } catch (...) {
        classified.kind = ErrorKind::Other;
        classified.message = "Unknown error";
    }
    return classified;
}

quint64 RetryExecutor::registerToken(const std::shared_ptr<CancellationToken>& token)
{
    QMutexLocker locker(&m_mutex);
    if (!m_online) {
        return 0;
    }
    quint64 tokenId = m_nextTokenId++;
    m_inFlight.insert(tokenId, token);
    return tokenId;
}

void RetryExecutor::unregisterToken(quint64 tokenId)
{
    QMutexLocker locker(&m_mutex);
    m_inFlight.remove(tokenId);
}

void RetryExecutor::setRetryCount(const QString& operationId, int count)
{
    QMutexLocker locker(&m_mutex);
    m_retryCounts[operationId] = count;
}

void RetryExecutor::clearRetryCount(const QString& operationId)
{
    QMutexLocker locker(&m_mutex);
    m_retryCounts.remove(operationId);
}

bool RetryExecutor::runAttempt(const AttemptWork& operation,
                               int timeoutMs,
                               ClassifiedError& error)
{
    auto token = std::make_shared<CancellationToken>();
    quint64 tokenId = registerToken(token);
    if (tokenId == 0) {
        error.kind = ErrorKind::ConnectivityLost;
        error.message = "Network is offline";
        return false;
    }

    auto failure = std::make_shared<std::exception_ptr>();
    AttemptWork work = operation;

    std::thread worker([work, token, failure]() {
        try {
            work(*token);
        } catch (...) {
            *failure = std::current_exception();
        }
        token->markFinished();
    });

    CancellationToken::WaitResult outcome = token->waitForFinish(timeoutMs);
    unregisterToken(tokenId);

    if (outcome == CancellationToken::WaitResult::Finished) {
        worker.join();
        if (!*failure) {
            return true;
        }
        error = classify(*failure);
        // An operation that gave up because its token fired reports why it was cancelled
        if (token->isCancelled()) {
            error.kind = token->reason();
        }
        return false;
    }

    if (outcome == CancellationToken::WaitResult::TimedOut) {
        token->cancel(ErrorKind::Timeout);
    }

    // The attempt owns copies of everything it touches and ends on its own
    worker.detach();

    error.kind = token->reason();
    if (error.kind == ErrorKind::Timeout) {
        error.message = QString("Operation timed out after %1 ms").arg(timeoutMs);
    } else if (error.kind == ErrorKind::ConnectivityLost) {
        error.message = "Connection lost";
    } else {
        error.message = "Operation cancelled";
    }
    return false;
}

bool RetryExecutor::backoff(int delayMs)
{
    auto token = std::make_shared<CancellationToken>();
    quint64 tokenId = registerToken(token);
    if (tokenId == 0) {
        return false;
    }

    bool cancelled = token->waitForCancellation(delayMs);
    unregisterToken(tokenId);
    return !cancelled;
}

bool RetryExecutor::runWithRetry(const QString& operationId,
                                 const std::function<AttemptWork()>& makeAttempt,
                                 const RetryPolicy& policy,
                                 ClassifiedError& error)
{
    for (int attempt = 0; attempt <= policy.maxRetries; ++attempt) {
        ClassifiedError attemptError;
        if (runAttempt(makeAttempt(), policy.timeoutMs, attemptError)) {
            if (attempt > 0) {
                qInfo() << "RetryExecutor:" << operationId << "succeeded on attempt" << attempt + 1;
            }
            clearRetryCount(operationId);
            return true;
        }

        attemptError.operationId = operationId;
        attemptError.attempts = attempt + 1;

        bool retryable = policy.isRetryable(attemptError.kind);
        // Connectivity loss supersedes the retry schedule
        bool aborted = attemptError.kind == ErrorKind::ConnectivityLost && !isOnline();

        if (retryable && !aborted && attempt < policy.maxRetries) {
            RetryAttempt info;
            info.operationId = operationId;
            info.attempt = attempt + 1;
            info.classification = RetryAttempt::Classification::Retryable;
            info.nextDelayMs = policy.delayForAttempt(attempt);

            setRetryCount(operationId, attempt + 1);
            qInfo() << "RetryExecutor:" << operationId << "attempt" << attempt + 1 << "failed with"
                    << ClassifiedError::kindName(attemptError.kind) << "-" << attemptError.message
                    << "- retrying in" << info.nextDelayMs << "ms";

            if (policy.onRetry) {
                policy.onRetry(info, attemptError);
            }

            if (!backoff(info.nextDelayMs)) {
                attemptError.kind = ErrorKind::ConnectivityLost;
                attemptError.message = "Connection lost while waiting to retry";
                clearRetryCount(operationId);
                error = attemptError;
                qWarning() << "RetryExecutor:" << operationId << "aborted during backoff";
                return false;
            }
            continue;
        }

        attemptError.exhausted = retryable && !aborted;
        clearRetryCount(operationId);
        error = attemptError;
        qWarning() << "RetryExecutor:" << operationId << "failed after" << attempt + 1 << "attempts:"
                   << ClassifiedError::kindName(error.kind) << "-" << error.message;
        return false;
    }

    return false;
}

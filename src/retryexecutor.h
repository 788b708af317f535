#ifndef RETRYEXECUTOR_H
#define RETRYEXECUTOR_H

#include <QObject>
#include <QHash>
#include <QList>
#include <QMutex>
#include <QString>
#include <QWaitCondition>
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>

enum class ErrorKind {
    ConnectivityLost,
    Timeout,
    ServerFault,
    NotFound,
    Other
};

/**
 * Failure of a retry-wrapped operation after classification
 */
struct ClassifiedError {
    ErrorKind kind;
    QString message;
    QString operationId;
    int statusCode;
    int attempts;
    bool exhausted;     // retryable, but every allowed attempt failed

    ClassifiedError() :
        kind(ErrorKind::Other),
        statusCode(0),
        attempts(0),
        exhausted(false)
    {}

    /**
     * Human-readable text distinguishing offline, timed out and server problems
     */
    QString userMessage() const;

    static QString kindName(ErrorKind kind);
};

/**
 * Record passed to RetryPolicy::onRetry before each backoff wait
 */
struct RetryAttempt {
    enum class Classification {
        Retryable,
        Fatal
    };

    QString operationId;
    int attempt;            // 1-based number of the attempt that just failed
    Classification classification;
    int nextDelayMs;
};

/**
 * Exception operations throw to report a classified failure
 */
class OperationError : public std::runtime_error
{
public:
    OperationError(ErrorKind kind, const QString& message, int statusCode = 0);

    /**
     * Classify an HTTP-style status code: 5xx server fault, 404 not found, 408 timeout, else other
     */
    static OperationError fromStatus(int statusCode, const QString& message);

    ErrorKind kind() const { return m_kind; }
    int statusCode() const { return m_statusCode; }

private:
    ErrorKind m_kind;
    int m_statusCode;
};

struct RetryPolicy {
    int timeoutMs;          // per attempt, <= 0 disables the deadline
    int maxRetries;
    int baseDelayMs;
    int maxDelayMs;
    double backoffFactor;
    QList<ErrorKind> retryableKinds;
    std::function<void(const RetryAttempt&, const ClassifiedError&)> onRetry;

    RetryPolicy() :
        timeoutMs(30000),
        maxRetries(3),
        baseDelayMs(1000),
        maxDelayMs(10000),
        backoffFactor(2.0),
        retryableKinds({ErrorKind::ConnectivityLost, ErrorKind::Timeout, ErrorKind::ServerFault})
    {}

    static RetryPolicy defaults() { return RetryPolicy(); }

    /**
     * Loading user-supplied images: longer deadline
     */
    static RetryPolicy forUpload();

    /**
     * Long-running processing: longer deadline, fewer retries, connectivity loss not retried
     */
    static RetryPolicy forProcessing();

    /**
     * Backoff before the retry following the given 0-based attempt
     * @return min(maxDelayMs, baseDelayMs * backoffFactor^attempt)
     */
    int delayForAttempt(int attempt) const;

    bool isRetryable(ErrorKind kind) const { return retryableKinds.contains(kind); }
};

template <typename T>
class RetryResult
{
public:
    static RetryResult success(T value)
    {
        RetryResult result;
        result.m_value = std::move(value);
        return result;
    }

    static RetryResult failure(const ClassifiedError& error)
    {
        RetryResult result;
        result.m_error = error;
        return result;
    }

    bool ok() const { return m_value.has_value(); }
    const T& value() const { return *m_value; }
    T takeValue() { return std::move(*m_value); }
    const ClassifiedError& error() const { return m_error; }

private:
    std::optional<T> m_value;
    ClassifiedError m_error;
};

/**
 * Cancellation flag handed to every attempt
 *
 * Operations should poll isCancelled() or sleep through waitForCancellation()
 * so that a deadline or a connectivity loss stops them promptly.
 */
class CancellationToken
{
public:
    enum class WaitResult {
        Finished,
        Cancelled,
        TimedOut
    };

    CancellationToken();

    bool isCancelled() const;
    ErrorKind reason() const;

    /**
     * Sleep until cancelled or the timeout expires
     * @param timeoutMs Maximum time to wait
     * @return true if cancelled
     */
    bool waitForCancellation(int timeoutMs) const;

    /**
     * Cancel; only the first reason is kept
     */
    void cancel(ErrorKind reason);

    /**
     * Mark the guarded attempt as finished
     */
    void markFinished();

    /**
     * Wait for markFinished() or cancel(), whichever comes first
     * @param timeoutMs Deadline, <= 0 waits without deadline
     */
    WaitResult waitForFinish(int timeoutMs) const;

private:
    mutable QMutex m_mutex;
    mutable QWaitCondition m_condition;
    bool m_cancelled;
    bool m_finished;
    ErrorKind m_reason;
};

/**
 * Runs operations with per-attempt deadlines and exponential backoff
 *
 * The single place in the application that implements retry loops. Each attempt
 * runs on its own thread so the deadline can be enforced; an attempt that misses
 * its deadline is cancelled and abandoned, so operations must capture what they
 * use by value. notifyConnectivityLost() cancels every attempt and backoff wait
 * in flight immediately.
 */
class RetryExecutor : public QObject
{
    Q_OBJECT

public:
    typedef std::function<void(const CancellationToken&)> AttemptWork;

    explicit RetryExecutor(QObject *parent = nullptr);
    ~RetryExecutor();

    /**
     * Execute an operation with retries
     * @param operationId Key for logging and retry statistics
     * @param operation Work to run; throws OperationError or std::exception on failure
     * @param policy Deadline, backoff and retryable error kinds
     * @return Value of the first successful attempt, or the classified error
     */
    template <typename T>
    RetryResult<T> execute(const QString& operationId,
                           std::function<T(const CancellationToken&)> operation,
                           const RetryPolicy& policy = RetryPolicy::defaults())
    {
        // Every attempt writes its own slot; an abandoned attempt never touches the one returned
        std::shared_ptr<std::optional<T>> slot;
        auto makeAttempt = [operation, &slot]() -> AttemptWork {
            auto attemptSlot = std::make_shared<std::optional<T>>();
            slot = attemptSlot;
            return [operation, attemptSlot](const CancellationToken& token) {
                *attemptSlot = operation(token);
            };
        };

        ClassifiedError error;
        if (!runWithRetry(operationId, makeAttempt, policy, error)) {
            return RetryResult<T>::failure(error);
        }
        return RetryResult<T>::success(std::move(**slot));
    }

    /**
     * Global connectivity-lost signal: aborts everything in flight, new attempts fail fast
     */
    void notifyConnectivityLost();

    void notifyConnectivityRestored();

    bool isOnline() const;

    /**
     * Retries performed so far for operations still in flight
     * @return Operation id -> retry count
     */
    QHash<QString, int> retryStats() const;

    /**
     * Classify an exception thrown by an operation
     */
    static ClassifiedError classify(std::exception_ptr error);

signals:
    void connectivityChanged(bool online);

private:
    /**
     * @param makeAttempt Called once per attempt on the calling thread; returns that attempt's work
     * @return true if the attempt created last succeeded and its thread was joined
     */
    bool runWithRetry(const QString& operationId,
                      const std::function<AttemptWork()>& makeAttempt,
                      const RetryPolicy& policy,
                      ClassifiedError& error);

    bool runAttempt(const AttemptWork& operation,
                    int timeoutMs,
                    ClassifiedError& error);

    /**
     * Wait out a backoff delay
     * @return false if connectivity was lost before the delay elapsed
     */
    bool backoff(int delayMs);

    quint64 registerToken(const std::shared_ptr<CancellationToken>& token);
    void unregisterToken(quint64 tokenId);
    void setRetryCount(const QString& operationId, int count);
    void clearRetryCount(const QString& operationId);

    mutable QMutex m_mutex;
    bool m_online;
    quint64 m_nextTokenId;
    QHash<quint64, std::shared_ptr<CancellationToken>> m_inFlight;
    QHash<QString, int> m_retryCounts;
};

#endif // RETRYEXECUTOR_H

#ifndef SESSIONCONTROLLER_H
#define SESSIONCONTROLLER_H

#include <QObject>
#include <QPointer>
#include <QString>
#include <functional>
#include <memory>
#include <optional>
#include "artifactstore.h"
#include "exportassembler.h"
#include "retryexecutor.h"
#include "selectionmodel.h"
#include "sliceencoder.h"
#include "slicingtask.h"
#include "sourceimage.h"
#include "taskmessage.h"

enum class SessionState {
    Idle,
    Uploading,
    Processing,
    Ready,
    Exporting
};

/**
 * Observable change of the session, emitted after the controller applied it
 */
struct SessionEvent {
    SessionState state;
    std::optional<int> percent;
    std::optional<int> newArtifactIndex;
    QString error;

    SessionEvent() : state(SessionState::Idle) {}
    explicit SessionEvent(SessionState s) : state(s) {}

    bool hasError() const { return !error.isEmpty(); }
};

struct SessionSnapshot {
    quint64 sessionToken;
    SessionState state;
    int sliceHeight;
    int artifactCount;
    int selectedCount;
    int liveHandles;
    bool taskAlive;
    QString sourceName;
};

/**
 * State machine driving one load -> slice -> review -> export cycle
 *
 * Idle -> Uploading -> Processing -> Ready -> Exporting -> Ready, and any state
 * back to Idle through reset() or a task error. Starting a session always tears
 * the previous one down first: the selection is cleared, every display handle is
 * released and the previous task is stopped. Messages still in flight from a
 * stopped task carry an outdated session token and are dropped.
 *
 * The controller lives on one thread and never blocks on the slicing task; all
 * task output arrives through handleTaskMessage() as queued signals.
 */
class SessionController : public QObject
{
    Q_OBJECT

public:
    typedef std::function<std::unique_ptr<SliceEncoder>()> EncoderFactory;

    /**
     * @param handles Display handle provider (must outlive the controller)
     * @param retry Executor used for source loading (must outlive the controller)
     * @param parent Parent object
     */
    SessionController(DisplayHandleProvider& handles,
                      RetryExecutor& retry,
                      QObject *parent = nullptr);
    ~SessionController();

    /**
     * Start slicing an image, discarding the current session
     * @param source Image to slice
     * @param sliceHeight Maximum slice height, 100..5000
     * @throws ValidationError if the height is out of range or the source is empty;
     *         the current session is left untouched in that case
     */
    void startSession(const SourceImage& source, int sliceHeight);

    /**
     * Load an image file through the retry executor, then start slicing it
     * The controller is in Uploading while the file is read.
     * @param filePath Image file
     * @param sliceHeight Maximum slice height, 100..5000
     * @return false if the file could not be loaded (an error event was emitted)
     * @throws ValidationError if the height is out of range
     */
    bool startSessionFromFile(const QString& filePath, int sliceHeight);

    /**
     * Flip the selection of one slice; unknown indices are ignored
     * @return true if the slice is selected afterwards
     */
    bool toggleSelection(int index);

    void selectAll();
    void deselectAll();

    /**
     * Export the selected slices
     * @param format Archive or document
     * @param outputName Base name; empty uses suggestedOutputName()
     * @return Export binary with its file name and skipped item report
     * @throws ValidationError if the session is not Ready or nothing is selected
     * @throws ExportError if none of the selected slices could be exported
     */
    ExportResult exportSelection(ExportFormat format, const QString& outputName = QString());

    /**
     * Tear the session down and return to Idle; safe to call repeatedly
     */
    void reset();

    SessionState state() const { return m_state; }
    quint64 sessionToken() const { return m_sessionToken; }
    int sliceHeight() const { return m_sliceHeight; }
    QString lastError() const { return m_lastError; }

    const ArtifactStore& artifacts() const { return *m_store; }
    const SelectionModel& selection() const { return *m_selection; }

    /**
     * Output name derived from the source file name, or the default name
     */
    QString suggestedOutputName() const;

    SessionSnapshot snapshot() const;

    void setEncoderFactory(const EncoderFactory& factory);

    /**
     * Use OpenCvSliceEncoder with the given format and quality for new sessions
     */
    void setEncoderSettings(const QString& format, int quality);

    void setExportOptions(const ExportOptions& options) { m_exportOptions = options; }
    void setUploadPolicy(const RetryPolicy& policy) { m_uploadPolicy = policy; }
    void setDefaultOutputName(const QString& name) { m_defaultOutputName = name; }

    static QString stateName(SessionState state);

public slots:
    /**
     * Apply one message of the slicing task
     * Messages whose session token is not the current one are ignored.
     */
    void handleTaskMessage(const TaskMessage& message);

signals:
    void sessionEvent(const SessionEvent& event);
    void selectionChanged(int selectedCount);

    /**
     * Every message of the current task, before it is applied
     */
    void taskMessageReceived(const TaskMessage& message);

private:
    void validateSliceHeight(int sliceHeight) const;
    void beginSession(const SourceImage& source, int sliceHeight);
    void spawnTask(const SourceImage& source);

    void handleChunk(const TaskMessage& message);
    void handleDone();
    void failSession(const QString& error);

    /**
     * Clear the selection, release every artifact and retire the running task
     */
    void cleanupSession();
    void retireTask();

    void setState(SessionState state);
    void emitEvent(const SessionEvent& event);

    DisplayHandleProvider& m_handles;
    RetryExecutor& m_retry;
    std::unique_ptr<ArtifactStore> m_store;
    std::unique_ptr<SelectionModel> m_selection;

    SessionState m_state;
    quint64 m_sessionToken;
    int m_sliceHeight;
    QString m_sourceName;
    QString m_lastError;
    QPointer<SlicingTask> m_task;

    EncoderFactory m_encoderFactory;
    ExportOptions m_exportOptions;
    RetryPolicy m_uploadPolicy;
    QString m_defaultOutputName;
};

#endif // SESSIONCONTROLLER_H

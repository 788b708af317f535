#include "sessioncontroller.h"
#include "imageiohelper.h"
#include "sliceerrors.h"
#include <QDebug>
#include <QFileInfo>

static OperationError uploadError(QFileDevice::FileError error, const QString& filePath)
{
    switch (error) {
        case QFileDevice::ReadError:
        case QFileDevice::ResourceError:
            return OperationError(ErrorKind::ConnectivityLost,
                                  QString("Reading %1 was interrupted").arg(filePath));
        case QFileDevice::TimeOutError:
            return OperationError(ErrorKind::Timeout,
                                  QString("Reading %1 timed out").arg(filePath));
        case QFileDevice::PermissionsError:
            return OperationError(ErrorKind::Other,
                                  QString("Permission denied: %1").arg(filePath));
        default:
            return OperationError(ErrorKind::Other,
                                  QString("Cannot read %1").arg(filePath));
    }
}

SessionController::SessionController(DisplayHandleProvider& handles,
                                     RetryExecutor& retry,
                                     QObject *parent)
    : QObject(parent),
      m_handles(handles),
      m_retry(retry),
      m_store(std::make_unique<ArtifactStore>(m_handles)),
      m_selection(std::make_unique<SelectionModel>(*m_store)),
      m_state(SessionState::Idle),
      m_sessionToken(0),
      m_sliceHeight(0),
      m_uploadPolicy(RetryPolicy::forUpload()),
      m_defaultOutputName(ExportAssembler::DEFAULT_OUTPUT_NAME)
{
    qRegisterMetaType<TaskMessage>("TaskMessage");
}

SessionController::~SessionController()
{
    const QList<SlicingTask*> tasks = findChildren<SlicingTask*>(QString(), Qt::FindDirectChildrenOnly);
    for (SlicingTask* task : tasks) {
        task->requestStop();
    }
    for (SlicingTask* task : tasks) {
        task->wait();
    }

    m_selection->deselectAll();
    m_store->releaseAll();
}

QString SessionController::stateName(SessionState state)
{
    switch (state) {
        case SessionState::Idle:
            return "Idle";
        case SessionState::Uploading:
            return "Uploading";
        case SessionState::Processing:
            return "Processing";
        case SessionState::Ready:
            return "Ready";
        case SessionState::Exporting:
            return "Exporting";
        default:
            return "Unknown";
    }
}

void SessionController::validateSliceHeight(int sliceHeight) const
{
    if (!SlicingTask::isValidSliceHeight(sliceHeight)) {
        throw ValidationError(QString("Slice height must be between %1 and %2 pixels, got %3")
                                  .arg(SlicingTask::MIN_SLICE_HEIGHT)
                                  .arg(SlicingTask::MAX_SLICE_HEIGHT)
                                  .arg(sliceHeight));
    }
}

void SessionController::startSession(const SourceImage& source, int sliceHeight)
{
    validateSliceHeight(sliceHeight);
    if (source.isNull()) {
        throw ValidationError("No source image provided");
    }

    beginSession(source, sliceHeight);
}

bool SessionController::startSessionFromFile(const QString& filePath, int sliceHeight)
{
    validateSliceHeight(sliceHeight);

    cleanupSession();
    ++m_sessionToken;
    m_sliceHeight = sliceHeight;
    m_sourceName = QFileInfo(filePath).fileName();
    m_lastError.clear();
    setState(SessionState::Uploading);
    emitEvent(SessionEvent(SessionState::Uploading));

    qInfo() << "SessionController: loading" << filePath;

    RetryResult<QByteArray> loaded = m_retry.execute<QByteArray>(
        "load-source:" + filePath,
        [filePath](const CancellationToken& token) -> QByteArray {
            if (!QFileInfo::exists(filePath)) {
                throw OperationError(ErrorKind::NotFound,
                                     QString("File not found: %1").arg(filePath), 404);
            }

            QByteArray data;
            QFileDevice::FileError fileError = QFileDevice::NoError;
            if (!ImageIOHelper::readFile(filePath, data, fileError)) {
                throw uploadError(fileError, filePath);
            }
            if (token.isCancelled()) {
                throw OperationError(token.reason(), "Upload cancelled");
            }
            if (data.isEmpty()) {
                throw OperationError(ErrorKind::Other, QString("File is empty: %1").arg(filePath));
            }
            return data;
        },
        m_uploadPolicy);

    if (!loaded.ok()) {
        const ClassifiedError& error = loaded.error();
        QString message = error.kind == ErrorKind::Timeout ? QString("Image upload timed out")
                                                           : error.userMessage();
        if (error.kind == ErrorKind::Other || error.kind == ErrorKind::NotFound) {
            message += ": " + error.message;
        }
        failSession(message);
        return false;
    }

    SourceImage source = SourceImage::fromEncoded(loaded.takeValue(), m_sourceName);
    qInfo() << "SessionController: loaded" << source.encodedSize() << "bytes from" << m_sourceName;
    spawnTask(source);
    return true;
}

void SessionController::beginSession(const SourceImage& source, int sliceHeight)
{
    cleanupSession();
    ++m_sessionToken;
    m_sliceHeight = sliceHeight;
    m_sourceName = source.name();
    m_lastError.clear();

    spawnTask(source);
}

void SessionController::spawnTask(const SourceImage& source)
{
    std::unique_ptr<SliceEncoder> encoder;
    if (m_encoderFactory) {
        encoder = m_encoderFactory();
    }

    SlicingTask* task = new SlicingTask(m_sessionToken, source, m_sliceHeight, std::move(encoder), this);
    connect(task, &SlicingTask::messagePosted,
            this, &SessionController::handleTaskMessage, Qt::QueuedConnection);
    m_task = task;

    qInfo() << "SessionController: session" << m_sessionToken << "slicing"
            << (m_sourceName.isEmpty() ? QString("<unnamed>") : m_sourceName)
            << "at" << m_sliceHeight << "px";

    setState(SessionState::Processing);
    task->start();

    SessionEvent event(SessionState::Processing);
    event.percent = 0;
    emitEvent(event);
}

void SessionController::handleTaskMessage(const TaskMessage& message)
{
    if (message.sessionToken != m_sessionToken || m_state != SessionState::Processing) {
        qDebug() << "SessionController: dropping stale" << TaskMessage::typeName(message.type)
                 << "message of session" << message.sessionToken;
        return;
    }

    emit taskMessageReceived(message);

    switch (message.type) {
        case TaskMessage::Type::Progress: {
            SessionEvent event(SessionState::Processing);
            event.percent = message.percent;
            emitEvent(event);
            break;
        }
        case TaskMessage::Type::Chunk:
            handleChunk(message);
            break;
        case TaskMessage::Type::Done:
            handleDone();
            break;
        case TaskMessage::Type::Error:
            failSession(message.errorMessage);
            break;
    }
}

void SessionController::handleChunk(const TaskMessage& message)
{
    if (message.index != m_store->size()) {
        failSession(QString("Slice %1 arrived out of order, expected slice %2")
                        .arg(message.index)
                        .arg(m_store->size()));
        return;
    }

    m_store->put(message.index, message.payload, message.width, message.height);
    m_selection->select(message.index);

    SessionEvent event(SessionState::Processing);
    event.newArtifactIndex = message.index;
    emitEvent(event);
    emit selectionChanged(m_selection->count());
}

void SessionController::handleDone()
{
    if (!m_store->isContiguous()) {
        failSession("Slicing finished with missing slices");
        return;
    }

    qInfo() << "SessionController: session" << m_sessionToken << "ready with"
            << m_store->size() << "slices";

    setState(SessionState::Ready);
    SessionEvent event(SessionState::Ready);
    event.percent = 100;
    emitEvent(event);
}

void SessionController::failSession(const QString& error)
{
    qWarning() << "SessionController: session" << m_sessionToken << "failed:" << error;

    cleanupSession();
    m_lastError = error;
    setState(SessionState::Idle);

    SessionEvent event(SessionState::Idle);
    event.error = error;
    emitEvent(event);
}

bool SessionController::toggleSelection(int index)
{
    bool selected = m_selection->toggle(index);
    emit selectionChanged(m_selection->count());
    return selected;
}

void SessionController::selectAll()
{
    m_selection->selectAll();
    emit selectionChanged(m_selection->count());
}

void SessionController::deselectAll()
{
    m_selection->deselectAll();
    emit selectionChanged(0);
}

ExportResult SessionController::exportSelection(ExportFormat format, const QString& outputName)
{
    if (m_state != SessionState::Ready) {
        throw ValidationError(QString("Cannot export while the session is %1").arg(stateName(m_state)));
    }
    if (m_selection->isEmpty()) {
        throw ValidationError("No slices selected");
    }

    ExportJob job = ExportJob::create(format,
                                      m_selection->selectedIndices(),
                                      outputName.trimmed().isEmpty() ? suggestedOutputName() : outputName);

    setState(SessionState::Exporting);
    emitEvent(SessionEvent(SessionState::Exporting));

    ExportAssembler assembler(m_exportOptions);
    try {
        ExportResult result = assembler.assemble(job, *m_store);

        setState(SessionState::Ready);
        emitEvent(SessionEvent(SessionState::Ready));
        return result;
    } catch (const std::exception& e) {
        m_lastError = QString::fromUtf8(e.what());
        setState(SessionState::Ready);

        SessionEvent event(SessionState::Ready);
        event.error = m_lastError;
        emitEvent(event);
        throw;
    }
}

void SessionController::reset()
{
    cleanupSession();
    ++m_sessionToken;
    m_sourceName.clear();
    m_lastError.clear();

    if (m_state != SessionState::Idle) {
        setState(SessionState::Idle);
        emitEvent(SessionEvent(SessionState::Idle));
    }
}

void SessionController::cleanupSession()
{
    retireTask();

    int deselected = m_selection->count();
    m_selection->deselectAll();
    int released = m_store->releaseAll();

    if (released > 0 || deselected > 0) {
        qDebug() << "SessionController: session" << m_sessionToken << "cleaned up,"
                 << released << "handles released," << deselected << "deselected";
        emit selectionChanged(0);
    }
}

void SessionController::retireTask()
{
    if (!m_task) {
        return;
    }

    SlicingTask* task = m_task;
    m_task.clear();

    disconnect(task, &SlicingTask::messagePosted, this, &SessionController::handleTaskMessage);
    task->requestStop();

    // Deleted once the thread has left run(); deleteLater may be requested twice safely
    connect(task, &QThread::finished, task, &QObject::deleteLater);
    if (task->isFinished()) {
        task->deleteLater();
    }
}

QString SessionController::suggestedOutputName() const
{
    QString base = QFileInfo(m_sourceName).completeBaseName();
    if (!base.trimmed().isEmpty()) {
        return base;
    }
    return m_defaultOutputName.trimmed().isEmpty() ? ExportAssembler::DEFAULT_OUTPUT_NAME
                                                   : m_defaultOutputName;
}

SessionSnapshot SessionController::snapshot() const
{
    SessionSnapshot snapshot;
    snapshot.sessionToken = m_sessionToken;
    snapshot.state = m_state;
    snapshot.sliceHeight = m_sliceHeight;
    snapshot.artifactCount = m_store->size();
    snapshot.selectedCount = m_selection->count();
    snapshot.liveHandles = m_handles.liveCount();
    snapshot.taskAlive = m_task && m_task->isRunning();
    snapshot.sourceName = m_sourceName;
    return snapshot;
}

void SessionController::setEncoderFactory(const EncoderFactory& factory)
{
    m_encoderFactory = factory;
}

void SessionController::setEncoderSettings(const QString& format, int quality)
{
    if (!OpenCvSliceEncoder::isSupportedFormat(format)) {
        throw ValidationError(QString("Unsupported slice format: %1").arg(format));
    }

    m_encoderFactory = [format, quality]() -> std::unique_ptr<SliceEncoder> {
        return std::make_unique<OpenCvSliceEncoder>(format, quality);
    };
}

void SessionController::setState(SessionState state)
{
    if (m_state == state) {
        return;
    }
    qDebug() << "SessionController:" << stateName(m_state) << "->" << stateName(state);
    m_state = state;
}

void SessionController::emitEvent(const SessionEvent& event)
{
    emit sessionEvent(event);
}

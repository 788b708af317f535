#include "slicingtask.h"
#include "sliceerrors.h"
#include <QDebug>
#include <QElapsedTimer>
#include <cmath>

SlicingTask::SlicingTask(quint64 sessionToken,
                         const SourceImage& source,
                         int sliceHeight,
                         std::unique_ptr<SliceEncoder> encoder,
                         QObject *parent)
    : QThread(parent),
      m_sessionToken(sessionToken),
      m_source(source),
      m_sliceHeight(sliceHeight),
      m_encoder(std::move(encoder)),
      m_shouldStop(false)
{
    if (!m_encoder) {
        m_encoder = std::make_unique<OpenCvSliceEncoder>();
    }
}

SlicingTask::~SlicingTask()
{
    requestStop();
    wait();
}

void SlicingTask::requestStop()
{
    QMutexLocker locker(&m_mutex);
    m_shouldStop = true;
}

bool SlicingTask::isStopRequested() const
{
    QMutexLocker locker(&m_mutex);
    return m_shouldStop;
}

std::vector<cv::Rect> SlicingTask::sliceBands(int imageWidth, int imageHeight, int sliceHeight)
{
    std::vector<cv::Rect> bands;
    if (imageWidth <= 0 || imageHeight <= 0 || sliceHeight <= 0) {
        return bands;
    }

    int count = (imageHeight + sliceHeight - 1) / sliceHeight;
    bands.reserve(count);

    for (int i = 0; i < count; ++i) {
        int startY = i * sliceHeight;
        int bandHeight = std::min(sliceHeight, imageHeight - startY);
        bands.emplace_back(0, startY, imageWidth, bandHeight);
    }

    return bands;
}

int SlicingTask::progressAfterSlice(int sliceIndex, int sliceCount)
{
    if (sliceCount <= 0) {
        return PROGRESS_DECODED;
    }
    double fraction = static_cast<double>(sliceIndex + 1) / sliceCount;
    return static_cast<int>(std::lround(PROGRESS_DECODED + fraction * PROGRESS_SLICING_SPAN));
}

bool SlicingTask::isValidSliceHeight(int sliceHeight)
{
    return sliceHeight >= MIN_SLICE_HEIGHT && sliceHeight <= MAX_SLICE_HEIGHT;
}

void SlicingTask::post(const TaskMessage& message)
{
    emit messagePosted(message);
}

void SlicingTask::run()
{
    QElapsedTimer timer;
    timer.start();

    try {
        if (!sliceImage()) {
            qDebug() << "SlicingTask: session" << m_sessionToken << "stopped after" << timer.elapsed() << "ms";
            return;
        }
        post(TaskMessage::progress(m_sessionToken, 100));
        post(TaskMessage::done(m_sessionToken));
        qDebug() << "SlicingTask: session" << m_sessionToken << "finished in" << timer.elapsed() << "ms";
    } catch (const SliceError& e) {
        qWarning() << "SlicingTask:" << e.message();
        post(TaskMessage::error(m_sessionToken, e.message()));
    } catch (const cv::Exception& e) {
        QString errorMsg = QString("Image processing error: %1").arg(QString::fromStdString(e.msg));
        qWarning() << "SlicingTask:" << errorMsg;
        post(TaskMessage::error(m_sessionToken, errorMsg));
    } catch (const std::exception& e) {
        QString errorMsg = QString("Slicing task error: %1").arg(e.what());
        qWarning() << "SlicingTask:" << errorMsg;
        post(TaskMessage::error(m_sessionToken, errorMsg));
    }
}

bool SlicingTask::sliceImage()
{
    post(TaskMessage::progress(m_sessionToken, 0));

    if (!isValidSliceHeight(m_sliceHeight)) {
        throw ValidationError(QString("Invalid slice height %1, must be between %2 and %3")
                              .arg(m_sliceHeight).arg(MIN_SLICE_HEIGHT).arg(MAX_SLICE_HEIGHT));
    }

    cv::Mat image = m_source.decode();
    if (isStopRequested()) {
        return false;
    }

    qDebug() << "SlicingTask: decoded" << image.cols << "x" << image.rows
             << "slice height" << m_sliceHeight;
    post(TaskMessage::progress(m_sessionToken, PROGRESS_DECODED));

    std::vector<cv::Rect> bands = sliceBands(image.cols, image.rows, m_sliceHeight);
    int total = static_cast<int>(bands.size());

    for (int i = 0; i < total; ++i) {
        if (isStopRequested()) {
            return false;
        }

        const cv::Rect& band = bands[i];
        // ROI view, no pixel copy
        cv::Mat slice = image(band);

        QByteArray payload;
        if (!m_encoder->encode(slice, payload)) {
            throw EncodeError(QString("Failed to encode slice %1 of %2 as %3")
                              .arg(i + 1).arg(total).arg(m_encoder->format()));
        }

        post(TaskMessage::chunk(m_sessionToken, i, payload, band.width, band.height));
        post(TaskMessage::progress(m_sessionToken, progressAfterSlice(i, total)));
    }

    return !isStopRequested();
}

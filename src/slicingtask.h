#ifndef SLICINGTASK_H
#define SLICINGTASK_H

#include <QThread>
#include <QMutex>
#include <memory>
#include <vector>
#include <opencv2/opencv.hpp>
#include "sourceimage.h"
#include "sliceencoder.h"
#include "taskmessage.h"

/**
 * Background unit that decodes a source image and cuts it into horizontal bands
 *
 * Everything the task produces leaves through messagePosted(), emitted from the
 * worker thread and delivered on the receiver's thread through a queued
 * connection. Messages are posted in this order:
 *   progress(0), progress(25) after decode,
 *   chunk(i) + progress(...) for every slice i in ascending order,
 *   progress(100), done
 * or error(message) as soon as anything fails. Nothing follows done or error.
 *
 * A stop request makes the task end silently at the next slice boundary.
 */
class SlicingTask : public QThread
{
    Q_OBJECT

public:
    /**
     * @param sessionToken Token of the session that owns this task, stamped on every message
     * @param source Image to slice
     * @param sliceHeight Maximum height of each slice in pixels
     * @param encoder Encoder used for every slice (ownership transferred)
     * @param parent Parent object
     */
    SlicingTask(quint64 sessionToken,
                const SourceImage& source,
                int sliceHeight,
                std::unique_ptr<SliceEncoder> encoder,
                QObject *parent = nullptr);
    ~SlicingTask();

    /**
     * Ask the task to terminate; it stops at the next slice boundary without posting done
     */
    void requestStop();

    /**
     * Check if a stop was requested
     * @return true if requestStop() was called
     */
    bool isStopRequested() const;

    quint64 sessionToken() const { return m_sessionToken; }
    int sliceHeight() const { return m_sliceHeight; }

    /**
     * Compute the bands a raster of the given size is cut into
     * @param imageWidth Width of the raster
     * @param imageHeight Height of the raster
     * @param sliceHeight Maximum band height (must be positive)
     * @return ceil(imageHeight / sliceHeight) rectangles covering the raster top to bottom
     */
    static std::vector<cv::Rect> sliceBands(int imageWidth, int imageHeight, int sliceHeight);

    /**
     * Progress reported after the slice at sliceIndex was posted
     * @param sliceIndex 0-based slice index
     * @param sliceCount Total number of slices
     * @return Percentage between 25 and 95
     */
    static int progressAfterSlice(int sliceIndex, int sliceCount);

    /**
     * @return true if sliceHeight is within [MIN_SLICE_HEIGHT, MAX_SLICE_HEIGHT]
     */
    static bool isValidSliceHeight(int sliceHeight);

    static constexpr int MIN_SLICE_HEIGHT = 100;
    static constexpr int MAX_SLICE_HEIGHT = 5000;

    static constexpr int PROGRESS_DECODED = 25;
    static constexpr int PROGRESS_SLICING_SPAN = 70;

signals:
    /**
     * Emitted from the worker thread for every protocol message
     * @param message Progress, chunk, done or error message
     */
    void messagePosted(const TaskMessage& message);

protected:
    void run() override;

private:
    /**
     * Decode and slice the image, posting chunks and progress
     * @return false if stopped before completion
     */
    bool sliceImage();

    void post(const TaskMessage& message);

    const quint64 m_sessionToken;
    const SourceImage m_source;
    const int m_sliceHeight;
    std::unique_ptr<SliceEncoder> m_encoder;

    mutable QMutex m_mutex;
    bool m_shouldStop;
};

#endif // SLICINGTASK_H

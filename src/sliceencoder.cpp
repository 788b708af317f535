#include "sliceencoder.h"
#include "imageiohelper.h"
#include <QStringList>

OpenCvSliceEncoder::OpenCvSliceEncoder(const QString& format, int quality)
    : m_format(format.toLower() == "jpeg" ? "jpg" : format.toLower()),
      m_quality(qBound(1, quality, 100))
{
}

bool OpenCvSliceEncoder::encode(const cv::Mat& slice, QByteArray& payload)
{
    if (slice.empty()) {
        return false;
    }

    // JPEG has no alpha channel
    if (m_format == "jpg" && slice.channels() == 4) {
        cv::Mat bgr;
        cv::cvtColor(slice, bgr, cv::COLOR_BGRA2BGR);
        return ImageIOHelper::encode(bgr, m_format, m_quality, payload);
    }

    return ImageIOHelper::encode(slice, m_format, m_quality, payload);
}

bool OpenCvSliceEncoder::isSupportedFormat(const QString& format)
{
    static const QStringList formats = {"jpg", "jpeg", "png", "webp"};
    return formats.contains(format.toLower());
}

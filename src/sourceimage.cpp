#include "sourceimage.h"
#include "imageiohelper.h"
#include "sliceerrors.h"
#include <QFileInfo>

SourceImage SourceImage::fromEncoded(const QByteArray& data, const QString& name)
{
    SourceImage image;
    image.m_encoded = data;
    image.m_name = name;
    return image;
}

SourceImage SourceImage::fromMat(const cv::Mat& mat, const QString& name)
{
    SourceImage image;
    image.m_decoded = mat.clone();
    image.m_name = name;
    return image;
}

bool SourceImage::isNull() const
{
    return m_encoded.isEmpty() && m_decoded.empty();
}

cv::Mat SourceImage::decode() const
{
    if (!m_decoded.empty()) {
        return m_decoded;
    }

    if (m_encoded.isEmpty()) {
        throw DecodeError("No image data provided");
    }

    cv::Mat image = ImageIOHelper::decode(m_encoded, cv::IMREAD_UNCHANGED);
    if (image.empty()) {
        throw DecodeError(QString("Failed to decode image%1")
                          .arg(m_name.isEmpty() ? QString() : ": " + m_name));
    }

    if (image.depth() != CV_8U) {
        // 16-bit PNG/TIFF: scale down, encoders downstream expect 8-bit
        cv::Mat converted;
        image.convertTo(converted, CV_8U, image.depth() == CV_16U ? 1.0 / 257.0 : 1.0);
        image = converted;
    }

    return image;
}

QString SourceImage::baseName() const
{
    if (m_name.isEmpty()) {
        return QString();
    }
    return QFileInfo(m_name).completeBaseName();
}

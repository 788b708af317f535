#ifndef SOURCEIMAGE_H
#define SOURCEIMAGE_H

#include <QByteArray>
#include <QString>
#include <opencv2/opencv.hpp>

/**
 * The raster a session slices
 *
 * Holds either the encoded bytes of an uploaded file (decoded lazily inside the
 * slicing task) or an already decoded OpenCV Mat. Copies share the underlying
 * buffers; nothing mutates them after construction.
 */
class SourceImage
{
public:
    SourceImage() = default;

    /**
     * Create from encoded image bytes (PNG, JPEG, WebP, BMP, ...)
     * @param data Encoded bytes
     * @param name Original file name, used to suggest export names
     */
    static SourceImage fromEncoded(const QByteArray& data, const QString& name = QString());

    /**
     * Create from a decoded raster; the pixels are copied
     * @param image 8-bit BGR, BGRA or grayscale Mat
     * @param name Display name
     */
    static SourceImage fromMat(const cv::Mat& image, const QString& name = QString());

    /**
     * @return true if there is nothing to decode
     */
    bool isNull() const;

    /**
     * Decode the raster
     * @return Decoded image, never empty
     * @throws DecodeError if the bytes are not a readable image
     */
    cv::Mat decode() const;

    QString name() const { return m_name; }

    /**
     * File name with its last extension removed, empty if there is no name
     */
    QString baseName() const;

    qint64 encodedSize() const { return m_encoded.size(); }

private:
    QByteArray m_encoded;
    cv::Mat m_decoded;
    QString m_name;
};

#endif // SOURCEIMAGE_H

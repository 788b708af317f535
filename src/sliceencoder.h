#ifndef SLICEENCODER_H
#define SLICEENCODER_H

#include <QByteArray>
#include <QString>
#include <opencv2/opencv.hpp>

/**
 * Turns one cropped band of the source raster into a compressed payload
 */
class SliceEncoder
{
public:
    virtual ~SliceEncoder() = default;

    /**
     * Encode a slice
     * @param slice Cropped image (may be a non-continuous ROI view)
     * @param payload Receives the encoded bytes
     * @return true if successful
     */
    virtual bool encode(const cv::Mat& slice, QByteArray& payload) = 0;

    /**
     * @return Output format as a file extension without dot
     */
    virtual QString format() const = 0;
};

/**
 * SliceEncoder backed by cv::imencode
 */
class OpenCvSliceEncoder : public SliceEncoder
{
public:
    /**
     * @param format "jpg", "png" or "webp"
     * @param quality 1-100, JPEG default 90
     */
    explicit OpenCvSliceEncoder(const QString& format = "jpg", int quality = 90);

    bool encode(const cv::Mat& slice, QByteArray& payload) override;
    QString format() const override { return m_format; }

    static bool isSupportedFormat(const QString& format);

private:
    QString m_format;
    int m_quality;
};

#endif // SLICEENCODER_H

#ifndef IMAGEIOHELPER_H
#define IMAGEIOHELPER_H

#include <QString>
#include <QByteArray>
#include <QFile>
#include <opencv2/opencv.hpp>
#include <vector>
#include <algorithm>

/**
 * Helper functions for in-memory image encoding and decoding
 *
 * Slices never touch the disk: payloads travel as QByteArray between the slicing
 * task, the artifact store and the export assembler. These helpers wrap
 * cv::imencode()/cv::imdecode() so callers do not deal with std::vector<uchar>.
 */
class ImageIOHelper
{
public:
    /**
     * Encode an image into a memory buffer
     * @param image OpenCV Mat to encode
     * @param format Target format without dot ("jpg", "png", "webp")
     * @param quality Quality 1-100 (JPEG/WebP quality, mapped to PNG compression)
     * @param output Receives the encoded bytes
     * @return true if successful, false otherwise
     */
    static bool encode(const cv::Mat& image, const QString& format, int quality, QByteArray& output)
    {
        if (image.empty()) {
            return false;
        }

        QString ext = "." + format.toLower();
        std::vector<int> params;
        if (ext == ".jpg" || ext == ".jpeg") {
            params.push_back(cv::IMWRITE_JPEG_QUALITY);
            params.push_back(quality);
        } else if (ext == ".webp") {
            params.push_back(cv::IMWRITE_WEBP_QUALITY);
            params.push_back(quality);
        } else if (ext == ".png") {
            // 100 -> fastest (0), 1 -> smallest (9)
            params.push_back(cv::IMWRITE_PNG_COMPRESSION);
            params.push_back(std::max(0, std::min(9, (100 - quality) / 11)));
        }

        std::vector<uchar> buffer;
        try {
            if (!cv::imencode(ext.toStdString(), image, buffer, params)) {
                return false;
            }
        } catch (const cv::Exception&) {
            return false;
        }

        output = QByteArray(reinterpret_cast<const char*>(buffer.data()),
                            static_cast<int>(buffer.size()));
        return !output.isEmpty();
    }

    /**
     * Decode an image from a memory buffer
     * @param data Encoded image bytes
     * @param flags OpenCV imread flags (e.g., cv::IMREAD_COLOR)
     * @return OpenCV Mat (empty if failed)
     */
    static cv::Mat decode(const QByteArray& data, int flags = cv::IMREAD_COLOR)
    {
        if (data.isEmpty()) {
            return cv::Mat();
        }

        std::vector<uchar> buffer(data.begin(), data.end());
        try {
            return cv::imdecode(buffer, flags);
        } catch (const cv::Exception&) {
            return cv::Mat();
        }
    }

    /**
     * Identify the image format of an encoded buffer from its signature
     * @param data Encoded image bytes
     * @return File extension without dot ("jpg", "png", "webp", "bmp"), empty if unknown
     */
    static QString sniffFormat(const QByteArray& data)
    {
        if (data.size() >= 3 && static_cast<uchar>(data[0]) == 0xFF &&
            static_cast<uchar>(data[1]) == 0xD8 && static_cast<uchar>(data[2]) == 0xFF) {
            return "jpg";
        }
        if (data.startsWith("\x89PNG\r\n\x1a\n")) {
            return "png";
        }
        if (data.size() >= 12 && data.startsWith("RIFF") && data.mid(8, 4) == "WEBP") {
            return "webp";
        }
        if (data.startsWith("BM")) {
            return "bmp";
        }
        return QString();
    }

    /**
     * Read a whole file with Qt's Unicode-aware file APIs
     * @param filePath Path to read
     * @param data Receives the file content
     * @param error Receives the QFile error code on failure
     * @return true if the whole file was read
     */
    static bool readFile(const QString& filePath, QByteArray& data, QFileDevice::FileError& error)
    {
        QFile file(filePath);
        if (!file.open(QIODevice::ReadOnly)) {
            error = file.error();
            return false;
        }

        data = file.readAll();
        error = file.error();
        file.close();

        return error == QFileDevice::NoError;
    }

    /**
     * Write a buffer to disk with Qt's Unicode-aware file APIs
     * @param filePath Destination path
     * @param data Bytes to write
     * @param error Receives the QFile error code on failure
     * @return true if all bytes were written
     */
    static bool writeFile(const QString& filePath, const QByteArray& data, QFileDevice::FileError& error)
    {
        QFile file(filePath);
        if (!file.open(QIODevice::WriteOnly)) {
            error = file.error();
            return false;
        }

        qint64 written = file.write(data);
        error = file.error();
        file.close();

        return written == static_cast<qint64>(data.size()) && error == QFileDevice::NoError;
    }
};

#endif // IMAGEIOHELPER_H

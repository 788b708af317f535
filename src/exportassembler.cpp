#include "exportassembler.h"
#include "artifactstore.h"
#include "imageiohelper.h"
#include "sliceerrors.h"
#include <QBuffer>
#include <QDebug>
#include <QImage>
#include <QPageSize>
#include <QPainter>
#include <QPdfWriter>
#include <algorithm>
#include <cstdio>
#include <memory>
#include <vector>
#include <zip.h>

namespace {

const double MM_PER_INCH = 25.4;

struct ZipSourceDeleter {
    void operator()(zip_source_t* source) const { zip_source_free(source); }
};

struct ZipArchiveDiscarder {
    void operator()(zip_t* archive) const { zip_discard(archive); }
};

using ZipSourcePtr = std::unique_ptr<zip_source_t, ZipSourceDeleter>;
using ZipArchivePtr = std::unique_ptr<zip_t, ZipArchiveDiscarder>;

QString zipErrorString(zip_error_t* error)
{
    QString message = QString::fromUtf8(zip_error_strerror(error));
    zip_error_fini(error);
    return message;
}

} // namespace

const QString ExportAssembler::DEFAULT_OUTPUT_NAME = "screenshot_slices";

ExportJob ExportJob::create(ExportFormat format, const QList<int>& selection, const QString& outputName)
{
    ExportJob job;
    job.format = format;
    job.outputName = outputName;

    std::vector<int> indices(selection.begin(), selection.end());
    std::sort(indices.begin(), indices.end());
    indices.erase(std::unique(indices.begin(), indices.end()), indices.end());
    for (int index : indices) {
        job.orderedIndices.append(index);
    }

    return job;
}

ExportAssembler::ExportAssembler(const ExportOptions& options)
    : m_options(options)
{
}

ExportResult ExportAssembler::assemble(const ExportJob& job, const ArtifactStore& store) const
{
    if (job.orderedIndices.isEmpty()) {
        throw ExportError("No slices selected for export");
    }

    ExportResult result = job.format == ExportFormat::Archive
        ? assembleArchive(job, store)
        : assembleDocument(job, store);

    result.format = job.format;
    result.fileName = outputFileName(job.outputName, job.format);

    if (result.exportedCount == 0) {
        throw ExportError(QString("None of the %1 selected slices could be exported: %2")
                          .arg(job.orderedIndices.size())
                          .arg(result.failures.join("; ")));
    }

    if (result.isPartial()) {
        qWarning() << "ExportAssembler:" << result.fileName << "written with"
                   << result.skippedCount << "skipped slices";
    } else {
        qInfo() << "ExportAssembler:" << result.fileName << "written with"
                << result.exportedCount << "slices," << result.data.size() << "bytes";
    }

    return result;
}

void ExportAssembler::recordFailure(ExportResult& result, int index, const QString& reason)
{
    QString failure = QString("slice %1: %2").arg(index + 1).arg(reason);
    qWarning() << "ExportAssembler: skipping" << failure;
    result.failures.append(failure);
    result.skippedCount++;
}

ExportResult ExportAssembler::assembleArchive(const ExportJob& job, const ArtifactStore& store) const
{
    ExportResult result;

    zip_error_t error;
    zip_error_init(&error);

    ZipSourcePtr buffer(zip_source_buffer_create(nullptr, 0, 0, &error));
    if (!buffer) {
        throw ExportError("Failed to create archive buffer: " + zipErrorString(&error));
    }

    ZipArchivePtr archive(zip_open_from_source(buffer.get(), ZIP_TRUNCATE, &error));
    if (!archive) {
        throw ExportError("Failed to open archive: " + zipErrorString(&error));
    }
    zip_error_fini(&error);

    // The archive holds one reference, this keeps ours for reading the bytes back
    zip_source_keep(buffer.get());

    // Entry data must stay alive until zip_close()
    std::vector<QByteArray> entryData;
    entryData.reserve(job.orderedIndices.size());

    for (int position = 0; position < job.orderedIndices.size(); ++position) {
        int index = job.orderedIndices[position];

        std::optional<SliceArtifact> artifact = store.get(index);
        if (!artifact) {
            recordFailure(result, index, "not available");
            continue;
        }
        if (artifact->payload.isEmpty()) {
            recordFailure(result, index, "empty payload");
            continue;
        }

        QString extension = ImageIOHelper::sniffFormat(artifact->payload);
        if (extension.isEmpty()) {
            recordFailure(result, index, "unrecognized image data");
            continue;
        }

        entryData.push_back(artifact->payload);
        const QByteArray& data = entryData.back();

        zip_source_t* entrySource = zip_source_buffer(archive.get(), data.constData(),
                                                      static_cast<zip_uint64_t>(data.size()), 0);
        if (!entrySource) {
            recordFailure(result, index, QString::fromUtf8(zip_strerror(archive.get())));
            continue;
        }

        QString entryName = archiveEntryName(position + 1, extension);
        zip_int64_t entryIndex = zip_file_add(archive.get(), entryName.toUtf8().constData(),
                                              entrySource, ZIP_FL_ENC_UTF_8 | ZIP_FL_OVERWRITE);
        if (entryIndex < 0) {
            zip_source_free(entrySource);
            recordFailure(result, index, QString::fromUtf8(zip_strerror(archive.get())));
            continue;
        }

        // Slices are already compressed images
        zip_set_file_compression(archive.get(), static_cast<zip_uint64_t>(entryIndex), ZIP_CM_STORE, 0);

        result.entryNames.append(entryName);
        result.exportedCount++;
    }

    if (result.exportedCount == 0) {
        return result;
    }

    if (zip_close(archive.get()) < 0) {
        throw ExportError("Failed to finalize archive: " + QString::fromUtf8(zip_strerror(archive.get())));
    }
    archive.release();

    if (zip_source_open(buffer.get()) < 0) {
        throw ExportError("Failed to read archive: " +
                          QString::fromUtf8(zip_error_strerror(zip_source_error(buffer.get()))));
    }
    zip_source_seek(buffer.get(), 0, SEEK_END);
    zip_int64_t size = zip_source_tell(buffer.get());
    zip_source_seek(buffer.get(), 0, SEEK_SET);

    if (size > 0) {
        result.data.resize(static_cast<int>(size));
        zip_int64_t bytesRead = zip_source_read(buffer.get(), result.data.data(),
                                                static_cast<zip_uint64_t>(size));
        if (bytesRead != size) {
            zip_source_close(buffer.get());
            throw ExportError("Failed to read archive: short read");
        }
    }
    zip_source_close(buffer.get());

    return result;
}

PagePlacement ExportAssembler::placePage(int widthPx, int heightPx) const
{
    PagePlacement placement;
    placement.orientation = widthPx > heightPx ? QPageLayout::Landscape : QPageLayout::Portrait;

    double pageWidth = widthPx * MM_PER_INCH / m_options.pixelsPerInch;
    double pageHeight = heightPx * MM_PER_INCH / m_options.pixelsPerInch;
    placement.pageSize = QSizeF(pageWidth, pageHeight);

    // Narrow slices would otherwise lose the whole page to margins
    double margin = std::min(m_options.marginMm, std::min(pageWidth, pageHeight) / 4.0);
    double contentWidth = pageWidth - 2.0 * margin;
    double contentHeight = pageHeight - 2.0 * margin;

    double scale = std::min(contentWidth / pageWidth, contentHeight / pageHeight);
    double drawWidth = pageWidth * scale;
    double drawHeight = pageHeight * scale;

    placement.imageRect = QRectF((pageWidth - drawWidth) / 2.0,
                                 (pageHeight - drawHeight) / 2.0,
                                 drawWidth,
                                 drawHeight);
    return placement;
}

ExportResult ExportAssembler::assembleDocument(const ExportJob& job, const ArtifactStore& store) const
{
    ExportResult result;

    QBuffer buffer(&result.data);
    if (!buffer.open(QIODevice::WriteOnly)) {
        throw ExportError("Failed to open document buffer");
    }

    QPdfWriter writer(&buffer);
    writer.setResolution(static_cast<int>(m_options.pixelsPerInch));
    writer.setCreator(m_options.creator);
    writer.setTitle(job.outputName);

    QPainter painter;
    double pxPerMm = writer.resolution() / MM_PER_INCH;

    for (int index : job.orderedIndices) {
        std::optional<SliceArtifact> artifact = store.get(index);
        if (!artifact) {
            recordFailure(result, index, "not available");
            continue;
        }

        QImage image;
        if (!image.loadFromData(artifact->payload)) {
            recordFailure(result, index, "failed to load image data");
            continue;
        }

        int widthPx = artifact->width > 0 ? artifact->width : image.width();
        int heightPx = artifact->height > 0 ? artifact->height : image.height();
        PagePlacement placement = placePage(widthPx, heightPx);

        // QPageSize is portrait-ordered; the layout orientation turns it
        QSizeF portraitSize(std::min(placement.pageSize.width(), placement.pageSize.height()),
                            std::max(placement.pageSize.width(), placement.pageSize.height()));
        QPageLayout layout(QPageSize(portraitSize, QPageSize::Millimeter, QString(), QPageSize::ExactMatch),
                           placement.orientation,
                           QMarginsF(0, 0, 0, 0),
                           QPageLayout::Millimeter);

        if (!painter.isActive()) {
            writer.setPageLayout(layout);
            if (!painter.begin(&writer)) {
                throw ExportError("Failed to start document");
            }
            painter.setRenderHint(QPainter::SmoothPixmapTransform);
        } else {
            writer.setPageLayout(layout);
            if (!writer.newPage()) {
                recordFailure(result, index, "failed to add page");
                continue;
            }
        }

        QRectF target(placement.imageRect.x() * pxPerMm,
                      placement.imageRect.y() * pxPerMm,
                      placement.imageRect.width() * pxPerMm,
                      placement.imageRect.height() * pxPerMm);
        painter.drawImage(target, image);

        result.exportedCount++;
    }

    if (painter.isActive()) {
        painter.end();
    }
    buffer.close();

    if (result.exportedCount == 0) {
        result.data.clear();
    }

    return result;
}

QString ExportAssembler::outputFileName(const QString& baseName, ExportFormat format)
{
    QString name = baseName.trimmed();
    if (name.isEmpty()) {
        name = DEFAULT_OUTPUT_NAME;
    }

    QString suffix = "." + extensionFor(format);
    if (!name.endsWith(suffix, Qt::CaseInsensitive)) {
        name += suffix;
    }
    return name;
}

QString ExportAssembler::archiveEntryName(int position, const QString& extension)
{
    return QString("slice_%1.%2").arg(position).arg(extension);
}

QString ExportAssembler::extensionFor(ExportFormat format)
{
    return format == ExportFormat::Archive ? "zip" : "pdf";
}

QString ExportAssembler::formatName(ExportFormat format)
{
    switch (format) {
        case ExportFormat::Archive:
            return "Archive";
        case ExportFormat::Document:
            return "Document";
        default:
            return "Archive";
    }
}

ExportFormat ExportAssembler::formatFromName(const QString& name, bool* ok)
{
    QString lower = name.trimmed().toLower();
    bool valid = true;
    ExportFormat format = ExportFormat::Archive;

    if (lower == "zip" || lower == "archive") {
        format = ExportFormat::Archive;
    } else if (lower == "pdf" || lower == "document") {
        format = ExportFormat::Document;
    } else {
        valid = false;
    }

    if (ok) {
        *ok = valid;
    }
    return format;
}

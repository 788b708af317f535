#ifndef EXPORTASSEMBLER_H
#define EXPORTASSEMBLER_H

#include <QByteArray>
#include <QList>
#include <QPageLayout>
#include <QRectF>
#include <QSizeF>
#include <QString>
#include <QStringList>

class ArtifactStore;

enum class ExportFormat {
    Archive,
    Document
};

/**
 * One export request; built fresh for every export call
 */
struct ExportJob {
    ExportFormat format;
    QList<int> orderedIndices;
    QString outputName;

    ExportJob() : format(ExportFormat::Archive) {}

    /**
     * Build a job from an unordered selection
     * @param format Output shape
     * @param selection Selected indices in any order (duplicates ignored)
     * @param outputName Caller-supplied base name
     * @return Job with ascending, unique indices
     */
    static ExportJob create(ExportFormat format, const QList<int>& selection, const QString& outputName);
};

struct ExportOptions {
    double marginMm;
    double pixelsPerInch;
    QString creator;

    ExportOptions() :
        marginMm(10.0),
        pixelsPerInch(96.0),
        creator("ScreenshotSplitter")
    {}
};

struct ExportResult {
    QByteArray data;
    QString fileName;
    ExportFormat format;
    int exportedCount;
    int skippedCount;
    QStringList failures;
    QStringList entryNames;

    ExportResult() :
        format(ExportFormat::Archive),
        exportedCount(0),
        skippedCount(0)
    {}

    bool isPartial() const { return skippedCount > 0; }
};

/**
 * Geometry of one document page, all values in millimetres
 */
struct PagePlacement {
    QPageLayout::Orientation orientation;
    QSizeF pageSize;
    QRectF imageRect;
};

/**
 * Builds the final export binary from the selected artifacts
 *
 * Archive: one ZIP entry per selected artifact, named slice_<n>.<ext> where n is
 * the 1-based position in the ordered selection, stored without recompression.
 * Document: one PDF page per selected artifact, sized to the artifact's pixels
 * at 96 px/inch, image centred and scaled to fit inside the margins.
 *
 * A single artifact that cannot be processed is logged and skipped. The export
 * only fails if nothing could be processed.
 */
class ExportAssembler
{
public:
    explicit ExportAssembler(const ExportOptions& options = ExportOptions());

    /**
     * Assemble the export
     * @param job Export request
     * @param store Store holding the artifacts
     * @return Export binary with file name and per-item failure report
     * @throws ExportError if no artifact could be processed
     */
    ExportResult assemble(const ExportJob& job, const ArtifactStore& store) const;

    /**
     * Compute page geometry for an artifact
     * @param widthPx Artifact width in pixels
     * @param heightPx Artifact height in pixels
     * @return Page size, orientation and image rectangle
     */
    PagePlacement placePage(int widthPx, int heightPx) const;

    /**
     * Append the format extension to a base name unless it is already there
     * @param baseName Caller-supplied name (empty -> DEFAULT_OUTPUT_NAME)
     * @param format Output shape
     * @return File name with extension
     */
    static QString outputFileName(const QString& baseName, ExportFormat format);

    static QString archiveEntryName(int position, const QString& extension);
    static QString extensionFor(ExportFormat format);
    static QString formatName(ExportFormat format);
    static ExportFormat formatFromName(const QString& name, bool* ok = nullptr);

    const ExportOptions& options() const { return m_options; }

    static const QString DEFAULT_OUTPUT_NAME;

private:
    ExportResult assembleArchive(const ExportJob& job, const ArtifactStore& store) const;
    ExportResult assembleDocument(const ExportJob& job, const ArtifactStore& store) const;

    static void recordFailure(ExportResult& result, int index, const QString& reason);

    ExportOptions m_options;
};

#endif // EXPORTASSEMBLER_H

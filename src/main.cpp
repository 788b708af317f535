#include <QGuiApplication>
#include <QCommandLineParser>
#include <QDir>
#include <QFileInfo>
#include <QJsonDocument>
#include <QLoggingCategory>
#include <QTextStream>
#include <QTimer>
#include <memory>
#include "configmanager.h"
#include "displayhandle.h"
#include "exportassembler.h"
#include "imageiohelper.h"
#include "retryexecutor.h"
#include "sessioncontroller.h"
#include "sliceerrors.h"

static QTextStream& out()
{
    static QTextStream stream(stdout);
    return stream;
}

static QTextStream& err()
{
    static QTextStream stream(stderr);
    return stream;
}

/**
 * Parse a list of 1-based slice numbers such as "2,5,7"
 */
static bool parseSliceNumbers(const QString& text, QList<int>& numbers)
{
    const QStringList parts = text.split(',', Qt::SkipEmptyParts);
    for (const QString& part : parts) {
        bool ok = false;
        int number = part.trimmed().toInt(&ok);
        if (!ok || number < 1) {
            return false;
        }
        numbers.append(number);
    }
    return true;
}

static RetryResult<bool> saveOutput(RetryExecutor& retry, const QString& filePath, const QByteArray& data)
{
    return retry.execute<bool>(
        "save-output:" + filePath,
        [filePath, data](const CancellationToken& token) -> bool {
            if (token.isCancelled()) {
                throw OperationError(token.reason(), "Save cancelled");
            }
            QFileDevice::FileError fileError = QFileDevice::NoError;
            if (!ImageIOHelper::writeFile(filePath, data, fileError)) {
                if (fileError == QFileDevice::ResourceError || fileError == QFileDevice::WriteError) {
                    throw OperationError(ErrorKind::ConnectivityLost,
                                         QString("Writing %1 was interrupted").arg(filePath));
                }
                throw OperationError(ErrorKind::Other, QString("Cannot write %1").arg(filePath));
            }
            return true;
        });
}

int main(int argc, char *argv[])
{
    if (qEnvironmentVariableIsEmpty("QT_QPA_PLATFORM")) {
        qputenv("QT_QPA_PLATFORM", "offscreen");
    }

    QGuiApplication app(argc, argv);

    // Set application properties
    app.setApplicationName("ScreenshotSplitter");
    app.setApplicationVersion("1.0.0");
    app.setOrganizationName("ScreenshotSplitter");

    QCommandLineParser parser;
    parser.setApplicationDescription("Split a long screenshot into slices and export them as a ZIP archive or a PDF.");
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument("image", "Image file to split.");

    QCommandLineOption heightOption(QStringList() << "H" << "slice-height",
                                    "Maximum slice height in pixels (100-5000).", "px");
    QCommandLineOption formatOption(QStringList() << "f" << "format",
                                    "Export format: zip or pdf.", "format", "zip");
    QCommandLineOption outputOption(QStringList() << "o" << "output",
                                    "Output file name without directory.", "name");
    QCommandLineOption outputDirOption(QStringList() << "d" << "output-dir",
                                       "Directory the export is written to.", "dir");
    QCommandLineOption excludeOption(QStringList() << "x" << "exclude",
                                     "Comma-separated 1-based slice numbers to leave out.", "list");
    QCommandLineOption qualityOption(QStringList() << "q" << "quality",
                                     "Slice encoding quality (1-100).", "quality");
    QCommandLineOption settingsOption("settings", "Read settings from this INI file.", "ini");
    QCommandLineOption saveSettingsOption("save-settings", "Store the effective options as new defaults.");
    QCommandLineOption verboseOption(QStringList() << "v" << "verbose", "Print every task message.");

    parser.addOption(heightOption);
    parser.addOption(formatOption);
    parser.addOption(outputOption);
    parser.addOption(outputDirOption);
    parser.addOption(excludeOption);
    parser.addOption(qualityOption);
    parser.addOption(settingsOption);
    parser.addOption(saveSettingsOption);
    parser.addOption(verboseOption);
    parser.process(app);

    const bool verbose = parser.isSet(verboseOption);
    if (!verbose) {
        QLoggingCategory::setFilterRules("*.debug=false");
    }

    const QStringList positional = parser.positionalArguments();
    if (positional.size() != 1) {
        err() << "Expected exactly one image file" << Qt::endl;
        parser.showHelp(1);
    }
    const QString imagePath = positional.first();

    std::unique_ptr<ConfigManager> configManager;
    if (parser.isSet(settingsOption)) {
        configManager = std::make_unique<ConfigManager>(parser.value(settingsOption));
    } else {
        configManager = std::make_unique<ConfigManager>();
    }
    AppConfig config = configManager->loadConfig();

    if (parser.isSet(heightOption)) {
        bool ok = false;
        config.sliceHeight = parser.value(heightOption).toInt(&ok);
        if (!ok) {
            err() << "Invalid slice height: " << parser.value(heightOption) << Qt::endl;
            return 1;
        }
    }
    if (parser.isSet(qualityOption)) {
        bool ok = false;
        config.jpegQuality = parser.value(qualityOption).toInt(&ok);
        if (!ok || config.jpegQuality < 1 || config.jpegQuality > 100) {
            err() << "Invalid quality: " << parser.value(qualityOption) << Qt::endl;
            return 1;
        }
    }
    if (parser.isSet(outputDirOption)) {
        config.outputDirectory = parser.value(outputDirOption);
    }

    bool formatOk = false;
    const ExportFormat format = ExportAssembler::formatFromName(parser.value(formatOption), &formatOk);
    if (!formatOk) {
        err() << "Unknown format: " << parser.value(formatOption) << Qt::endl;
        return 1;
    }

    QList<int> excluded;
    if (parser.isSet(excludeOption) && !parseSliceNumbers(parser.value(excludeOption), excluded)) {
        err() << "Invalid slice list: " << parser.value(excludeOption) << Qt::endl;
        return 1;
    }

    PreviewHandleProvider handles;
    RetryExecutor retry;
    SessionController controller(handles, retry);

    ExportOptions exportOptions;
    exportOptions.marginMm = config.documentMarginMm;
    controller.setExportOptions(exportOptions);
    controller.setDefaultOutputName(config.fileName);
    controller.setEncoderSettings(config.sliceFormat, config.jpegQuality);

    RetryPolicy uploadPolicy = ConfigManager::retryPolicy(config);
    uploadPolicy.timeoutMs = qMax(uploadPolicy.timeoutMs, RetryPolicy::forUpload().timeoutMs);
    controller.setUploadPolicy(uploadPolicy);

    if (verbose) {
        QObject::connect(&controller, &SessionController::taskMessageReceived,
                         [](const TaskMessage& message) {
            out() << QJsonDocument(message.toJson(false)).toJson(QJsonDocument::Compact) << Qt::endl;
        });
    }

    int exitCode = 0;
    bool exportStarted = false;

    QObject::connect(&controller, &SessionController::sessionEvent,
                     [&](const SessionEvent& event) {
        if (event.state == SessionState::Idle && event.hasError()) {
            err() << "Error: " << event.error << Qt::endl;
            exitCode = 1;
            app.exit(exitCode);
            return;
        }
        if (event.state == SessionState::Processing && event.percent && !verbose) {
            out() << "\rSlicing... " << *event.percent << "%" << Qt::flush;
            return;
        }
        if (event.state != SessionState::Ready || exportStarted) {
            return;
        }
        exportStarted = true;

        out() << "\rSlicing... 100%" << Qt::endl;
        out() << controller.artifacts().size() << " slices" << Qt::endl;

        // Apply exclusions before the first export only
        for (int number : excluded) {
            if (controller.selection().contains(number - 1)) {
                controller.toggleSelection(number - 1);
            } else {
                err() << "Warning: no slice " << number << Qt::endl;
            }
        }
        excluded.clear();

        QString outputName = parser.isSet(outputOption) ? parser.value(outputOption)
                                                        : controller.suggestedOutputName();
        try {
            ExportResult result = controller.exportSelection(format, outputName);

            QDir outputDir(config.outputDirectory);
            if (!outputDir.mkpath(".")) {
                err() << "Cannot create output directory " << config.outputDirectory << Qt::endl;
                exitCode = 1;
            } else {
                QString filePath = outputDir.absoluteFilePath(result.fileName);
                RetryResult<bool> saved = saveOutput(retry, filePath, result.data);
                if (!saved.ok()) {
                    err() << "Error: " << saved.error().userMessage() << Qt::endl;
                    exitCode = 1;
                } else {
                    out() << "Exported " << result.exportedCount << " slices to " << filePath << Qt::endl;
                    if (result.isPartial()) {
                        out() << result.skippedCount << " slices skipped:" << Qt::endl;
                        for (const QString& failure : result.failures) {
                            out() << "  " << failure << Qt::endl;
                        }
                    }
                }
            }
        } catch (const SliceError& e) {
            err() << "Error: " << e.message() << Qt::endl;
            exitCode = 1;
        }

        app.exit(exitCode);
    });

    QTimer::singleShot(0, &controller, [&]() {
        try {
            controller.startSessionFromFile(imagePath, config.sliceHeight);
        } catch (const ValidationError& e) {
            err() << "Error: " << e.message() << Qt::endl;
            exitCode = 1;
            app.exit(exitCode);
        }
    });

    int result = app.exec();

    if (result == 0 && parser.isSet(saveSettingsOption)) {
        configManager->saveConfig(config);
        out() << "Settings saved to " << configManager->settingsPath() << Qt::endl;
    }

    return result;
}

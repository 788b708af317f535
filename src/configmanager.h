#ifndef CONFIGMANAGER_H
#define CONFIGMANAGER_H

#include <QObject>
#include <QSettings>
#include <QString>
#include <QDir>
#include "retryexecutor.h"

struct AppConfig {
    // Persisted user preferences
    int sliceHeight;
    QString fileName;
    QString language;
    QString outputDirectory;

    // Slice encoding
    QString sliceFormat;
    int jpegQuality;

    // Document export
    double documentMarginMm;

    // Retry policy for file and network access
    int retryTimeoutMs;
    int retryMaxRetries;
    int retryBaseDelayMs;
    int retryMaxDelayMs;
    double retryBackoffFactor;

    // Default values
    AppConfig() :
        sliceHeight(1200),
        fileName("screenshot_slices"),
        language("en"),
        outputDirectory(QDir::homePath() + "/Downloads/ScreenshotSplitter"),
        sliceFormat("jpg"),
        jpegQuality(90),
        documentMarginMm(10.0),
        retryTimeoutMs(30000),
        retryMaxRetries(3),
        retryBaseDelayMs(1000),
        retryMaxDelayMs(10000),
        retryBackoffFactor(2.0)
    {}
};

class ConfigManager : public QObject
{
    Q_OBJECT

public:
    /**
     * Use the platform's native settings store
     */
    explicit ConfigManager(QObject *parent = nullptr);

    /**
     * Use an INI file at an explicit path
     * @param settingsPath Path of the INI file
     */
    explicit ConfigManager(const QString& settingsPath, QObject *parent = nullptr);

    /**
     * Load configuration from persistent storage
     * Values outside their valid range fall back to the defaults.
     * @return AppConfig structure with loaded settings
     */
    AppConfig loadConfig();

    /**
     * Save configuration to persistent storage
     * @param config Configuration to save
     */
    void saveConfig(const AppConfig& config);

    /**
     * Build the default retry policy from the configuration
     * @param config Loaded configuration
     * @return Retry policy with the configured deadline and backoff
     */
    static RetryPolicy retryPolicy(const AppConfig& config);

    /**
     * Location of the underlying settings store
     */
    QString settingsPath() const;

private:
    QSettings* m_settings;

    // Configuration keys
    static const QString KEY_SLICE_HEIGHT;
    static const QString KEY_FILE_NAME;
    static const QString KEY_LANGUAGE;
    static const QString KEY_OUTPUT_DIR;
    static const QString KEY_SLICE_FORMAT;
    static const QString KEY_JPEG_QUALITY;
    static const QString KEY_DOCUMENT_MARGIN;
    static const QString KEY_RETRY_TIMEOUT;
    static const QString KEY_RETRY_MAX_RETRIES;
    static const QString KEY_RETRY_BASE_DELAY;
    static const QString KEY_RETRY_MAX_DELAY;
    static const QString KEY_RETRY_BACKOFF_FACTOR;
};

#endif // CONFIGMANAGER_H

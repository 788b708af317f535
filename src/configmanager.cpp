#include "configmanager.h"
#include "sliceencoder.h"
#include "slicingtask.h"
#include <QDebug>

// Configuration keys
const QString ConfigManager::KEY_SLICE_HEIGHT = "sliceHeight";
const QString ConfigManager::KEY_FILE_NAME = "fileName";
const QString ConfigManager::KEY_LANGUAGE = "language";
const QString ConfigManager::KEY_OUTPUT_DIR = "outputDirectory";
const QString ConfigManager::KEY_SLICE_FORMAT = "sliceFormat";
const QString ConfigManager::KEY_JPEG_QUALITY = "jpegQuality";
const QString ConfigManager::KEY_DOCUMENT_MARGIN = "documentMarginMm";
const QString ConfigManager::KEY_RETRY_TIMEOUT = "retry/timeoutMs";
const QString ConfigManager::KEY_RETRY_MAX_RETRIES = "retry/maxRetries";
const QString ConfigManager::KEY_RETRY_BASE_DELAY = "retry/baseDelayMs";
const QString ConfigManager::KEY_RETRY_MAX_DELAY = "retry/maxDelayMs";
const QString ConfigManager::KEY_RETRY_BACKOFF_FACTOR = "retry/backoffFactor";

ConfigManager::ConfigManager(QObject *parent)
    : QObject(parent)
{
    m_settings = new QSettings("ScreenshotSplitter", "ScreenshotSplitter", this);
}

ConfigManager::ConfigManager(const QString& settingsPath, QObject *parent)
    : QObject(parent)
{
    m_settings = new QSettings(settingsPath, QSettings::IniFormat, this);
}

QString ConfigManager::settingsPath() const
{
    return m_settings->fileName();
}

AppConfig ConfigManager::loadConfig()
{
    AppConfig config;
    const AppConfig defaults;

    config.sliceHeight = m_settings->value(KEY_SLICE_HEIGHT, config.sliceHeight).toInt();
    if (!SlicingTask::isValidSliceHeight(config.sliceHeight)) {
        qWarning() << "ConfigManager: ignoring stored slice height" << config.sliceHeight;
        config.sliceHeight = defaults.sliceHeight;
    }

    config.fileName = m_settings->value(KEY_FILE_NAME, config.fileName).toString();
    if (config.fileName.trimmed().isEmpty()) {
        config.fileName = defaults.fileName;
    }
    config.language = m_settings->value(KEY_LANGUAGE, config.language).toString();
    config.outputDirectory = m_settings->value(KEY_OUTPUT_DIR, config.outputDirectory).toString();

    config.sliceFormat = m_settings->value(KEY_SLICE_FORMAT, config.sliceFormat).toString().toLower();
    if (!OpenCvSliceEncoder::isSupportedFormat(config.sliceFormat)) {
        qWarning() << "ConfigManager: ignoring unsupported slice format" << config.sliceFormat;
        config.sliceFormat = defaults.sliceFormat;
    }

    config.jpegQuality = m_settings->value(KEY_JPEG_QUALITY, config.jpegQuality).toInt();
    if (config.jpegQuality < 1 || config.jpegQuality > 100) {
        config.jpegQuality = defaults.jpegQuality;
    }

    config.documentMarginMm = m_settings->value(KEY_DOCUMENT_MARGIN, config.documentMarginMm).toDouble();
    if (config.documentMarginMm < 0.0) {
        config.documentMarginMm = defaults.documentMarginMm;
    }

    // Load retry settings
    config.retryTimeoutMs = m_settings->value(KEY_RETRY_TIMEOUT, config.retryTimeoutMs).toInt();
    config.retryMaxRetries = qMax(0, m_settings->value(KEY_RETRY_MAX_RETRIES, config.retryMaxRetries).toInt());
    config.retryBaseDelayMs = qMax(0, m_settings->value(KEY_RETRY_BASE_DELAY, config.retryBaseDelayMs).toInt());
    config.retryMaxDelayMs = qMax(config.retryBaseDelayMs,
                                  m_settings->value(KEY_RETRY_MAX_DELAY, config.retryMaxDelayMs).toInt());
    config.retryBackoffFactor = m_settings->value(KEY_RETRY_BACKOFF_FACTOR, config.retryBackoffFactor).toDouble();
    if (config.retryBackoffFactor < 1.0) {
        config.retryBackoffFactor = defaults.retryBackoffFactor;
    }

    return config;
}

void ConfigManager::saveConfig(const AppConfig& config)
{
    m_settings->setValue(KEY_SLICE_HEIGHT, config.sliceHeight);
    m_settings->setValue(KEY_FILE_NAME, config.fileName);
    m_settings->setValue(KEY_LANGUAGE, config.language);
    m_settings->setValue(KEY_OUTPUT_DIR, config.outputDirectory);
    m_settings->setValue(KEY_SLICE_FORMAT, config.sliceFormat);
    m_settings->setValue(KEY_JPEG_QUALITY, config.jpegQuality);
    m_settings->setValue(KEY_DOCUMENT_MARGIN, config.documentMarginMm);

    // Save retry settings
    m_settings->setValue(KEY_RETRY_TIMEOUT, config.retryTimeoutMs);
    m_settings->setValue(KEY_RETRY_MAX_RETRIES, config.retryMaxRetries);
    m_settings->setValue(KEY_RETRY_BASE_DELAY, config.retryBaseDelayMs);
    m_settings->setValue(KEY_RETRY_MAX_DELAY, config.retryMaxDelayMs);
    m_settings->setValue(KEY_RETRY_BACKOFF_FACTOR, config.retryBackoffFactor);

    m_settings->sync();
}

RetryPolicy ConfigManager::retryPolicy(const AppConfig& config)
{
    RetryPolicy policy;
    policy.timeoutMs = config.retryTimeoutMs;
    policy.maxRetries = config.retryMaxRetries;
    policy.baseDelayMs = config.retryBaseDelayMs;
    policy.maxDelayMs = config.retryMaxDelayMs;
    policy.backoffFactor = config.retryBackoffFactor;
    return policy;
}

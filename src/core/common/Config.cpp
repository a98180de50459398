#include "Config.hpp"
#include "Logger.hpp"
#include <QtCore/QCoreApplication>
#include <QtCore/QDir>
#include <QtCore/QStringList>

#ifndef WHISHER_PROJECT_ROOT
#define WHISHER_PROJECT_ROOT ""
#endif

namespace Whisher {

namespace {

BuildMode defaultBuildMode() {
#ifdef WHISHER_DEVELOPMENT_BUILD
    return BuildMode::Development;
#else
    return BuildMode::Packaged;
#endif
}

QString modeToString(BuildMode mode) {
    return mode == BuildMode::Development ? QStringLiteral("development") : QStringLiteral("packaged");
}

BuildMode modeFromString(const QString& value, BuildMode fallback) {
    const QString normalized = value.trimmed().toLower();
    if (normalized == "development" || normalized == "dev") {
        return BuildMode::Development;
    }
    if (normalized == "packaged" || normalized == "release") {
        return BuildMode::Packaged;
    }
    return fallback;
}

} // namespace

Config& Config::instance() {
    static Config instance;
    return instance;
}

void Config::initialize(const QString& organizationName, const QString& applicationName) {
    settings_ = std::make_unique<QSettings>(organizationName, applicationName);
    ensureDirectoriesExist();
    WHISHER_INFO("Config initialized for {}/{}",
                 organizationName.toStdString(), applicationName.toStdString());
}

QVariant Config::getValue(const QString& key, const QVariant& defaultValue) const {
    if (!settings_) return defaultValue;
    return settings_->value(key, defaultValue);
}

void Config::setValue(const QString& key, const QVariant& value) {
    if (settings_) {
        settings_->setValue(key, value);
    }
}

void Config::remove(const QString& key) {
    if (settings_) {
        settings_->remove(key);
    }
}

QString Config::getString(const QString& key, const QString& defaultValue) const {
    return getValue(key, defaultValue).toString();
}

int Config::getInt(const QString& key, int defaultValue) const {
    bool ok = false;
    const int value = getValue(key, defaultValue).toInt(&ok);
    return ok ? value : defaultValue;
}

bool Config::getBool(const QString& key, bool defaultValue) const {
    return getValue(key, defaultValue).toBool();
}

void Config::setString(const QString& key, const QString& value) {
    setValue(key, value);
}

void Config::setInt(const QString& key, int value) {
    setValue(key, value);
}

void Config::setBool(const QString& key, bool value) {
    setValue(key, value);
}

QString Config::getUiLanguage() const {
    return getString("ui/language");
}

void Config::setUiLanguage(const QString& language) {
    setValue("ui/language", language);
}

TranscriptionOptions Config::getTranscriptionOptions() const {
    const TranscriptionOptions defaults;
    TranscriptionOptions options;
    options.language = getString("transcription/language", defaults.language);
    options.threads = getInt("transcription/threads", defaults.threads);
    if (options.threads <= 0) {
        WHISHER_WARN("Ignoring invalid thread count {}, using {}", options.threads, defaults.threads);
        options.threads = defaults.threads;
    }
    options.modelFileName = getString("transcription/modelFileName", defaults.modelFileName);
    options.modelUrl = getString("transcription/modelUrl", defaults.modelUrl);
    options.cliPathOverride = getString("transcription/cliPath");
    options.downloadTimeoutSeconds = getInt("transcription/downloadTimeoutSeconds",
                                            defaults.downloadTimeoutSeconds);
    if (options.downloadTimeoutSeconds <= 0 ||
        options.downloadTimeoutSeconds > TranscriptionOptions::kMaxDownloadTimeoutSeconds) {
        WHISHER_WARN("Ignoring invalid download timeout {}s, using {}s",
                     options.downloadTimeoutSeconds, defaults.downloadTimeoutSeconds);
        options.downloadTimeoutSeconds = defaults.downloadTimeoutSeconds;
    }
    return options;
}

void Config::setTranscriptionOptions(const TranscriptionOptions& options) {
    setValue("transcription/language", options.language);
    setValue("transcription/threads", options.threads);
    setValue("transcription/modelFileName", options.modelFileName);
    setValue("transcription/modelUrl", options.modelUrl);
    setValue("transcription/cliPath", options.cliPathOverride);
    setValue("transcription/downloadTimeoutSeconds", options.downloadTimeoutSeconds);
}

Config::RuntimeSettings Config::getRuntimeSettings() const {
    RuntimeSettings settings;
    settings.mode = modeFromString(getString("runtime/mode"), defaultBuildMode());
    settings.projectRoot = getString("runtime/projectRoot", QString::fromUtf8(WHISHER_PROJECT_ROOT));
    settings.resourceDir = getString("runtime/resourceDir", QCoreApplication::applicationDirPath());
    return settings;
}

void Config::setRuntimeSettings(const RuntimeSettings& settings) {
    setValue("runtime/mode", modeToString(settings.mode));
    setValue("runtime/projectRoot", settings.projectRoot);
    setValue("runtime/resourceDir", settings.resourceDir);
}

RuntimeContext Config::runtimeContext() const {
    const RuntimeSettings runtime = getRuntimeSettings();

    RuntimeContext context;
    context.appDataDir = getDataPath();
    context.projectRoot = runtime.projectRoot;
    context.resourceDir = runtime.resourceDir;
    context.tempDir = QDir::tempPath();
    context.mode = runtime.mode;
    context.platform = hostPlatform();
    return context;
}

QString Config::getDataPath() const {
    return QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
}

QString Config::getLogFilePath() const {
    const QString dataPath = getDataPath();
    if (dataPath.isEmpty()) {
        return QStringLiteral("whisher.log");
    }
    return dataPath + "/logs/whisher.log";
}

void Config::sync() {
    if (settings_) {
        settings_->sync();
    }
}

void Config::ensureDirectoriesExist() {
    const QString dataPath = getDataPath();
    if (dataPath.isEmpty()) {
        WHISHER_WARN("No application data location available on this platform");
        return;
    }

    // models/ is created on demand by the model provisioner
    QStringList paths = {
        dataPath,
        dataPath + "/logs",
    };

    for (const QString& path : paths) {
        QDir dir;
        if (!dir.mkpath(path)) {
            WHISHER_WARN("Failed to create directory: {}", path.toStdString());
        }
    }
}

} // namespace Whisher

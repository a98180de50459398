#pragma once

#include <QtCore/QSettings>
#include <QtCore/QStandardPaths>
#include <QtCore/QString>
#include <QtCore/QVariant>
#include <memory>

#include "../transcription/TranscriptionTypes.hpp"

namespace Whisher {

class Config {
public:
    static Config& instance();

    void initialize(const QString& organizationName = "Whisher",
                   const QString& applicationName = "WhisherDesktop");
    bool isInitialized() const { return settings_ != nullptr; }

    // General settings
    QVariant getValue(const QString& key, const QVariant& defaultValue = QVariant()) const;
    void setValue(const QString& key, const QVariant& value);
    void remove(const QString& key);

    // Typed convenience methods
    QString getString(const QString& key, const QString& defaultValue = QString()) const;
    int getInt(const QString& key, int defaultValue = 0) const;
    bool getBool(const QString& key, bool defaultValue = false) const;

    void setString(const QString& key, const QString& value);
    void setInt(const QString& key, int value);
    void setBool(const QString& key, bool value);

    // Application-specific settings
    // Message language such as "ru"; empty follows the system locale
    QString getUiLanguage() const;
    void setUiLanguage(const QString& language);

    TranscriptionOptions getTranscriptionOptions() const;
    void setTranscriptionOptions(const TranscriptionOptions& options);

    struct RuntimeSettings {
        BuildMode mode = BuildMode::Packaged;
        QString projectRoot;
        QString resourceDir;
    };

    RuntimeSettings getRuntimeSettings() const;
    void setRuntimeSettings(const RuntimeSettings& settings);

    // Snapshot handed to the transcription components
    RuntimeContext runtimeContext() const;

    // Paths
    QString getDataPath() const;
    QString getLogFilePath() const;

    void sync();

private:
    Config() = default;
    std::unique_ptr<QSettings> settings_;

    void ensureDirectoriesExist();
};

} // namespace Whisher

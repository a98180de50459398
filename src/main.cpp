#include <QtCore/QCoreApplication>
#include <QtCore/QDir>
#include <QtCore/QJsonDocument>
#include <QtCore/QJsonObject>
#include <QtCore/QTextStream>
#include <QtCore/QTimer>

#include "cli/CommandLine.hpp"
#include "core/common/Config.hpp"
#include "core/common/Logger.hpp"
#include "core/common/Translations.hpp"
#include "ui/controllers/TranscriptionController.hpp"

namespace {

enum ExitCode {
    ExitSuccess = 0,
    ExitFailure = 1,
    ExitUsage = 2
};

void printJson(const QJsonObject& object) {
    QTextStream(stdout) << QJsonDocument(object).toJson(QJsonDocument::Indented);
}

QJsonObject toJson(const Whisher::TranscriptionResult& result) {
    QJsonObject object;
    object["text"] = result.text;
    object["success"] = result.success;
    object["error"] = result.error ? QJsonValue(*result.error) : QJsonValue(QJsonValue::Null);
    return object;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    app.setApplicationName("WhisherDesktop");
    app.setApplicationVersion("1.0.0");
    app.setOrganizationName("Whisher");
    app.setOrganizationDomain("whisher.app");

    // spdlog creates the log directory if needed; --verbose raises the level below
    Whisher::Logger::instance().initialize(Whisher::Config::instance().getLogFilePath().toStdString(),
                                           Whisher::Logger::Level::Warn);

    // Messages follow the configured language, read before any text is built
    Whisher::Config::instance().initialize();
    const std::unique_ptr<QTranslator> translator = Whisher::Translations::load(
        Whisher::Translations::localeFor(Whisher::Config::instance().getUiLanguage()));
    if (translator) {
        app.installTranslator(translator.get());
    }

    Whisher::CommandLine commandLine;
    auto parsed = commandLine.parse(app.arguments());
    if (parsed.hasError()) {
        QTextStream(stderr) << parsed.error() << "\n\n" << commandLine.helpText();
        return ExitUsage;
    }
    const Whisher::CommandLineRequest request = parsed.value();

    if (request.command == Whisher::CliCommand::Help) {
        QTextStream(stdout) << commandLine.helpText();
        return ExitSuccess;
    }
    if (request.command == Whisher::CliCommand::Version) {
        QTextStream(stdout) << app.applicationName() << " " << app.applicationVersion() << "\n";
        return ExitSuccess;
    }

    if (request.verbose) {
        Whisher::Logger::instance().setLevel(Whisher::Logger::Level::Debug);
    }

    try {

        Whisher::Logger::instance().info("Starting Whisher v{}", app.applicationVersion().toStdString());

        Whisher::RuntimeContext context = Whisher::Config::instance().runtimeContext();
        if (request.development) {
            context.mode = Whisher::BuildMode::Development;
        }
        if (!request.projectRoot.isEmpty()) {
            context.projectRoot = QDir(request.projectRoot).absolutePath();
        }
        if (!request.resourceDir.isEmpty()) {
            context.resourceDir = QDir(request.resourceDir).absolutePath();
        }

        Whisher::TranscriptionController controller(
            context, Whisher::Config::instance().getTranscriptionOptions());
        const bool json = request.json;

        if (request.command == Whisher::CliCommand::Status) {
            auto status = controller.modelStatus();
            if (status.hasError()) {
                QTextStream(stderr) << Whisher::ModelProvisioner::describe(status.error()) << "\n";
                return ExitFailure;
            }
            if (json) {
                QJsonObject object;
                object["installed"] = status.value().installed;
                object["path"] = status.value().path ? QJsonValue(*status.value().path)
                                                     : QJsonValue(QJsonValue::Null);
                printJson(object);
            } else if (status.value().installed) {
                QTextStream(stdout) << "Model installed: " << *status.value().path << "\n";
            } else {
                QTextStream(stdout) << "Model not installed\n";
            }
            return ExitSuccess;
        }

        QObject::connect(&controller, &Whisher::TranscriptionController::modelDownloadCompleted,
                         &app, [json](const QString& path) {
            if (json) {
                printJson(QJsonObject{{"path", path}});
            } else {
                QTextStream(stdout) << "Model downloaded to " << path << "\n";
            }
            QCoreApplication::exit(ExitSuccess);
        });
        QObject::connect(&controller, &Whisher::TranscriptionController::modelDownloadFailed,
                         &app, [json](const QString& error) {
            if (json) {
                printJson(QJsonObject{{"error", error}});
            } else {
                QTextStream(stderr) << error << "\n";
            }
            QCoreApplication::exit(ExitFailure);
        });
        QObject::connect(&controller, &Whisher::TranscriptionController::transcriptionFinished,
                         &app, [json](const Whisher::TranscriptionResult& result) {
            if (json) {
                printJson(toJson(result));
            } else if (result.success) {
                QTextStream(stdout) << result.text << "\n";
            } else {
                QTextStream(stderr) << result.errorString() << "\n";
            }
            QCoreApplication::exit(result.success ? ExitSuccess : ExitFailure);
        });

        // Start once the event loop runs so the exit() calls above take effect
        QTimer::singleShot(0, &controller, [&controller, &request]() {
            if (request.command == Whisher::CliCommand::Download) {
                controller.requestModelDownload();
            } else {
                controller.requestTranscription(request.audioFile);
            }
        });

        const int result = app.exec();

        Whisher::Config::instance().sync();
        Whisher::Logger::instance().info("Whisher finished with code {}", result);
        return result;

    } catch (const std::exception& e) {
        Whisher::Logger::instance().critical("Fatal error: {}", e.what());
        return ExitFailure;
    }
}

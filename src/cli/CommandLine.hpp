#pragma once

#include <QtCore/QCommandLineOption>
#include <QtCore/QCommandLineParser>
#include <QtCore/QCoreApplication>
#include <QtCore/QString>
#include <QtCore/QStringList>

#include "../core/common/Expected.hpp"

namespace Whisher {

enum class CliCommand {
    Status,
    Download,
    Transcribe,
    Help,
    Version
};

struct CommandLineRequest {
    CliCommand command = CliCommand::Help;
    QString audioFile;
    bool development = false;
    QString projectRoot;
    QString resourceDir;
    bool json = false;
    bool verbose = false;
};

/**
 * @brief Parses the whisher command line without exiting the process.
 *
 * Every usage problem comes back as an error message so the caller can
 * choose the exit code.
 */
class CommandLine {
    Q_DECLARE_TR_FUNCTIONS(CommandLine)

public:
    CommandLine();

    // arguments includes the program name, as QCoreApplication::arguments()
    Expected<CommandLineRequest, QString> parse(const QStringList& arguments);

    QString helpText() const { return parser_.helpText(); }

private:
    QCommandLineParser parser_;
    QCommandLineOption helpOption_;
    QCommandLineOption versionOption_;
    QCommandLineOption devOption_;
    QCommandLineOption projectRootOption_;
    QCommandLineOption resourceDirOption_;
    QCommandLineOption jsonOption_;
    QCommandLineOption verboseOption_;
};

} // namespace Whisher

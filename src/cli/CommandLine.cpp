#include "CommandLine.hpp"

namespace Whisher {

CommandLine::CommandLine()
    : helpOption_({"h", "help"}, tr("Show this help."))
    , versionOption_("version", tr("Show the version."))
    , devOption_("dev", tr("Look for whisper-cli in the project tree."))
    , projectRootOption_("project-root", tr("Project tree used with --dev."), "dir")
    , resourceDirOption_("resource-dir", tr("Bundled resource directory."), "dir")
    , jsonOption_("json", tr("Print results as JSON."))
    , verboseOption_({"v", "verbose"}, tr("Log debug output.")) {
    parser_.setApplicationDescription(
        tr("Transcribes audio files with a local whisper-cli and a downloaded model."));
    parser_.addPositionalArgument("command", "status | download | transcribe");
    parser_.addPositionalArgument("file", tr("Audio file to transcribe (transcribe only)."), "[file]");
    parser_.addOptions({helpOption_, versionOption_, devOption_, projectRootOption_,
                        resourceDirOption_, jsonOption_, verboseOption_});
}

Expected<CommandLineRequest, QString> CommandLine::parse(const QStringList& arguments) {
    if (!parser_.parse(arguments)) {
        return makeUnexpected(parser_.errorText());
    }

    CommandLineRequest request;
    request.development = parser_.isSet(devOption_);
    request.projectRoot = parser_.value(projectRootOption_);
    request.resourceDir = parser_.value(resourceDirOption_);
    request.json = parser_.isSet(jsonOption_);
    request.verbose = parser_.isSet(verboseOption_);

    if (parser_.isSet(helpOption_)) {
        request.command = CliCommand::Help;
        return request;
    }
    if (parser_.isSet(versionOption_)) {
        request.command = CliCommand::Version;
        return request;
    }

    const QStringList positional = parser_.positionalArguments();
    if (positional.isEmpty()) {
        return makeUnexpected(tr("Missing command"));
    }

    const QString command = positional.first();
    int expectedArguments = 1;
    if (command == "status") {
        request.command = CliCommand::Status;
    } else if (command == "download") {
        request.command = CliCommand::Download;
    } else if (command == "transcribe") {
        if (positional.size() < 2) {
            return makeUnexpected(tr("transcribe needs an audio file"));
        }
        request.command = CliCommand::Transcribe;
        request.audioFile = positional.at(1);
        expectedArguments = 2;
    } else {
        return makeUnexpected(tr("Unknown command: %1").arg(command));
    }

    if (positional.size() > expectedArguments) {
        return makeUnexpected(tr("Unexpected argument: %1").arg(positional.at(expectedArguments)));
    }
    return request;
}

} // namespace Whisher

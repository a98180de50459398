#include "OutputFilter.hpp"

#include <QtCore/QRegularExpression>

namespace Whisher {

const DiagnosticLineTable& whisperCliDiagnostics() {
    static const DiagnosticLineTable table{
        // prefixes
        {"whisper_", "system_info", "main:"},
        // substrings
        {"processing", "load time", "mel time", "sample time", "encode time",
         "decode time", "batchd time", "prompt time", "total time", "fallbacks"},
        // exact
        {"[BLANK_AUDIO]"}
    };
    return table;
}

OutputFilter::OutputFilter(const DiagnosticLineTable& table)
    : table_(table) {
}

bool OutputFilter::isDiagnostic(const QString& line) const {
    const QString trimmed = line.trimmed();
    if (trimmed.isEmpty()) {
        return true;
    }

    for (const QString& exact : table_.exact) {
        if (trimmed == exact) {
            return true;
        }
    }
    for (const QString& prefix : table_.prefixes) {
        if (trimmed.startsWith(prefix)) {
            return true;
        }
    }
    for (const QString& fragment : table_.substrings) {
        if (trimmed.contains(fragment)) {
            return true;
        }
    }
    return false;
}

QString OutputFilter::extractTranscript(const QString& capturedStdout) const {
    static const QRegularExpression lineBreak(QStringLiteral("\r?\n"));

    QStringList kept;
    const QStringList lines = capturedStdout.split(lineBreak);
    for (const QString& line : lines) {
        if (!isDiagnostic(line)) {
            kept << line.trimmed();
        }
    }
    return kept.join('\n');
}

} // namespace Whisher

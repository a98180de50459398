#include "Translations.hpp"
#include "Logger.hpp"

namespace Whisher {

std::unique_ptr<QTranslator> Translations::load(const QLocale& locale) {
    auto translator = std::make_unique<QTranslator>();
    if (!translator->load(locale, "whisher", "_", kResourceDir)) {
        Logger::instance().debug("No message catalogue for locale {}", locale.name().toStdString());
        return nullptr;
    }
    Logger::instance().info("Loaded message catalogue for locale {}", locale.name().toStdString());
    return translator;
}

QLocale Translations::localeFor(const QString& languageName) {
    const QString name = languageName.trimmed();
    return name.isEmpty() ? QLocale::system() : QLocale(name);
}

} // namespace Whisher

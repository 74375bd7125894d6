#include <QCommandLineParser>
#include <QCoreApplication>
#include <QFile>
#include <QTextStream>
#include <boost/log/trivial.hpp>
#include <chrono>
#include <memory>
#include <lxp/Backend/BackendSelector.hpp>
#include <lxp/Version.hpp>
#include "core/Logging.hpp"
#include "core/YamlConfig.hpp"
#include "core/services/BackgroundChangeService.hpp"
#include "core/services/ConfigService.hpp"

namespace {

constexpr int EXIT_OK = 0;
constexpr int EXIT_OPERATION_FAILED = 1;
constexpr int EXIT_USAGE = 2;
constexpr int EXIT_UNSUPPORTED = 3;

const char* const GPL_NOTICE =
    "loxerpaper  Copyright (C) 2025  Clifton Toaster Reid\n"
    "This program comes with ABSOLUTELY NO WARRANTY.\n"
    "This is free software, and you are welcome to redistribute it\n"
    "under certain conditions; see the GNU GPL v3 for details.\n";

int usageError(const QString& message)
{
    QTextStream(stderr) << "loxerpaper: " << message << "\n"
                        << "Try 'loxerpaper --help' for more information.\n";
    return EXIT_USAGE;
}

int report(const QString& operation, const lxp::DesktopResult& result)
{
    if (result) {
        BOOST_LOG_TRIVIAL(info) << "[main] " << operation.toStdString() << " succeeded";
        return EXIT_OK;
    }
    QTextStream(stderr) << "loxerpaper: " << operation << " failed: " << result.error().toString() << "\n";
    return EXIT_OPERATION_FAILED;
}

int sendNotification(const lxp::IDesktopApi& desktop, const QCommandLineParser& parser,
                     const QString& title)
{
    lxp::NotificationBuilder builder = lxp::Notification::builder(title);

    if (parser.isSet("body"))
        builder.body(parser.value("body"));

    if (parser.isSet("urgency")) {
        bool ok = false;
        builder.urgency(lxp::urgencyFromString(parser.value("urgency"), &ok));
        if (!ok)
            return usageError(QStringLiteral("unknown urgency '%1'").arg(parser.value("urgency")));
    }

    if (parser.isSet("timeout")) {
        bool ok = false;
        const qint64 ms = parser.value("timeout").toLongLong(&ok);
        if (!ok || ms < 0)
            return usageError(QStringLiteral("invalid timeout '%1'").arg(parser.value("timeout")));
        builder.timeout(std::chrono::milliseconds(ms));
    }

    for (const QString& spec : parser.values("action")) {
        const int eq = spec.indexOf(QLatin1Char('='));
        if (eq <= 0 || eq == spec.size() - 1)
            return usageError(QStringLiteral("action must look like id=Title, got '%1'").arg(spec));
        builder.action(spec.left(eq), spec.mid(eq + 1));
    }

    if (parser.isSet("icon"))
        builder.icon(lxp::NotificationIcon::fromPath(parser.value("icon")));

    return report(QStringLiteral("notify"), desktop.sendNotification(builder.build()));
}

} // namespace

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName("loxerpaper");
    app.setApplicationVersion(QStringLiteral("%1.%2.%3")
                                  .arg(lxp::VERSION_MAJOR)
                                  .arg(lxp::VERSION_MINOR)
                                  .arg(lxp::VERSION_PATCH));

    QCommandLineParser parser;
    parser.setApplicationDescription("Change the desktop background, show notifications and open files.");
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument("command", "wallpaper <image> | notify <title> | open <file> | capabilities");
    parser.addPositionalArgument("argument", "Image, title or file, depending on the command.", "[argument]");
    parser.addOptions({
        {"config", "Configuration file.", "path"},
        {"log-level", "trace, debug, info, warning, error or fatal.", "level"},
        {"by", "Who provided the wallpaper image.", "name"},
        {"body", "Notification body text.", "text"},
        {"urgency", "low, normal or critical.", "urgency"},
        {"timeout", "Notification timeout in milliseconds.", "ms"},
        {"action", "Notification action as id=Title; repeatable.", "action"},
        {"icon", "Notification icon image file.", "path"},
    });
    parser.process(app);

    QTextStream(stderr) << GPL_NOTICE << "\n";

    const QStringList args = parser.positionalArguments();
    if (args.isEmpty())
        return usageError(QStringLiteral("no command given"));

    const QString command = args.first();
    const bool needsArgument = command != QLatin1String("capabilities");
    if (command != QLatin1String("wallpaper") && command != QLatin1String("notify")
        && command != QLatin1String("open") && needsArgument)
        return usageError(QStringLiteral("unknown command '%1'").arg(command));
    if (needsArgument && args.size() != 2)
        return usageError(QStringLiteral("'%1' takes exactly one argument").arg(command));
    if (!needsArgument && args.size() != 1)
        return usageError(QStringLiteral("'capabilities' takes no argument"));

    // Config
    lxp::YamlConfig config;
    const QString configPath = parser.isSet("config") ? parser.value("config") : lxp::YamlConfig::defaultPath();
    if (QFile::exists(configPath)) {
        try {
            config.load(configPath);
        } catch (const YAML::Exception& e) {
            QTextStream(stderr) << "loxerpaper: cannot read " << configPath << ": " << e.what() << "\n";
            return EXIT_OPERATION_FAILED;
        }
    } else if (parser.isSet("config")) {
        return usageError(QStringLiteral("config file %1 does not exist").arg(configPath));
    }

    // Logging
    const QString levelName = parser.isSet("log-level") ? parser.value("log-level") : config.logLevel();
    boost::log::trivial::severity_level level;
    const bool levelKnown = lxp::parseLogLevel(levelName, &level);
    lxp::initLogging(level);
    if (!levelKnown)
        BOOST_LOG_TRIVIAL(warning) << "[main] unknown log level '" << levelName.toStdString() << "', using info";
    BOOST_LOG_TRIVIAL(debug) << "[main] config " << configPath.toStdString();

    // Backend
    std::shared_ptr<const lxp::IDesktopApi> desktop;
    try {
        desktop = lxp::DesktopApiHandle::initialize(config.backendOptions());
    } catch (const lxp::UnsupportedPlatformError& e) {
        BOOST_LOG_TRIVIAL(fatal) << "[main] " << e.what();
        QTextStream(stderr) << "loxerpaper: " << e.what() << "\n";
        return EXIT_UNSUPPORTED;
    }
    BOOST_LOG_TRIVIAL(info) << "[main] using " << desktop->name().toStdString() << " backend";

    if (command == QLatin1String("capabilities")) {
        QTextStream out(stdout);
        out << desktop->name() << "\n";
        for (const QString& name : lxp::capabilityNames(desktop->capabilities()))
            out << "  " << name << "\n";
        return EXIT_OK;
    }

    const QString argument = args.at(1);

    if (command == QLatin1String("wallpaper")) {
        lxp::ConfigService configService(&config, configPath);
        lxp::BackgroundChangeService service(desktop, &configService);
        return report(QStringLiteral("wallpaper"), service.apply(argument, parser.value("by")));
    }

    if (command == QLatin1String("notify"))
        return sendNotification(*desktop, parser, argument);

    return report(QStringLiteral("open"), desktop->openFile(argument));
}

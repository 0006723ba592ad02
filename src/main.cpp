#include <signal.h>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QFile>
#include <QTextStream>
#include <boost/log/trivial.hpp>
#include "core/Constants.hpp"
#include "core/DesktopEntry.hpp"
#include "core/Logging.hpp"
#include "core/YamlConfig.hpp"
#include "core/session/CastDeviceLocator.hpp"
#include "core/session/CastNetwork.hpp"
#include "core/session/DaemonArgs.hpp"
#include "core/session/RetryLoop.hpp"
#include "core/session/SessionDaemon.hpp"

namespace {

struct Options {
    QCommandLineOption name{{"n", "name"}, "Name of the device to control.", "name"};
    QCommandLineOption host{{"h", "host"}, "Hostname or IP address of the device.", "host"};
    QCommandLineOption uuid{{"u", "uuid"}, "UUID of the device.", "uuid"};
    QCommandLineOption retryWait{{"r", "retry-wait"}, "Seconds to look for the device on each attempt.", "seconds"};
    QCommandLineOption wait{{"w", "wait"}, "Seconds to wait between attempts to find the device.", "seconds"};
    QCommandLineOption noWait{"no-wait", "Give up after the first attempt to find the device."};
    QCommandLineOption icon{{"i", "icon"}, "Use the light icon."};
    QCommandLineOption logLevel{{"l", "log-level"}, "DEBUG, INFO, WARN, ERROR or CRITICAL.", "level"};
    QCommandLineOption help{{"?", "help"}, "Show this help."};
};

cctl::DaemonArgs argsFrom(const QCommandLineParser& parser, const Options& opts,
                          const cctl::YamlConfig& config)
{
    cctl::DaemonArgs args;
    args.name = parser.value(opts.name);
    args.host = parser.value(opts.host);
    args.uuid = parser.value(opts.uuid);
    args.retryWait = config.retryWait();
    args.wait = config.wait();
    args.lightIcon = config.lightIcon() || parser.isSet(opts.icon);
    args.logLevel = config.logLevel();

    bool ok = false;
    if (parser.isSet(opts.retryWait)) {
        double v = parser.value(opts.retryWait).toDouble(&ok);
        if (ok) args.retryWait = v;
        else BOOST_LOG_TRIVIAL(warning) << "[Main] ignoring --retry-wait "
                                        << parser.value(opts.retryWait).toStdString();
    }
    if (parser.isSet(opts.wait)) {
        double v = parser.value(opts.wait).toDouble(&ok);
        if (ok) args.wait = v < 0 ? cctl::NO_WAIT : v;
        else BOOST_LOG_TRIVIAL(warning) << "[Main] ignoring --wait "
                                        << parser.value(opts.wait).toStdString();
    }
    if (parser.isSet(opts.noWait))
        args.wait = cctl::NO_WAIT;
    if (parser.isSet(opts.logLevel))
        args.logLevel = parser.value(opts.logLevel);

    return args;
}

int runServer(QCoreApplication& app, const cctl::DaemonArgs& args, const cctl::YamlConfig& config)
{
    cctl::RetryLoop::Options options;
    options.query = args.query();
    options.wait = args.wait;
    options.adapter.lightIcon = args.lightIcon;
    options.adapter.durationResolution = config.durationResolution();
    options.adapter.desktopEntryFactory = [](bool lightIcon) {
        return cctl::DesktopEntry::create(lightIcon);
    };

    auto* locator = new cctl::CastDeviceLocator(new cctl::CastNetwork, &app);
    auto* loop = new cctl::RetryLoop(locator, options, &app);

    QObject::connect(loop, &cctl::RetryLoop::serverReady, &app, [](cctl::MprisServer* server) {
        BOOST_LOG_TRIVIAL(info) << "[Main] serving " << server->serviceName().toStdString();
    });
    QObject::connect(loop, &cctl::RetryLoop::deviceNotFound, &app, [&app](const QString& identifier) {
        BOOST_LOG_TRIVIAL(warning) << "[Main] Device " << identifier.toStdString() << " not found";
        app.exit(cctl::RC_NO_CHROMECAST);
    });

    // SIGTERM → leave the event loop so the server is withdrawn from the bus
    signal(SIGTERM, [](int) {
        QMetaObject::invokeMethod(qApp, &QCoreApplication::quit, Qt::QueuedConnection);
    });
    signal(SIGINT, [](int) {
        QMetaObject::invokeMethod(qApp, &QCoreApplication::quit, Qt::QueuedConnection);
    });

    loop->start();
    int ret = app.exec();

    // Server and adapter unpublish and disconnect before the app goes away
    delete loop;
    return ret;
}

int runService(const QString& action, const cctl::DaemonArgs& args, const cctl::YamlConfig& config)
{
    cctl::SessionStore store(config.dataDir());
    cctl::PosixProcessControl process;
    cctl::SessionDaemon daemon(store, &process, QCoreApplication::applicationFilePath());
    const QString identifier = args.identifier();

    if (action == "connect")
        return daemon.start(args);
    if (action == "disconnect")
        return daemon.stop(identifier);
    if (action == "reconnect")
        return daemon.reconnect(identifier);

    cctl::SessionRecord record = daemon.status(identifier);
    QTextStream out(stdout);
    out << record.identifier << ": " << cctl::sessionStateName(record.state) << "\n";
    if (record.args.isValid())
        out << "  arguments: " << record.args.toArguments().join(' ') << "\n";
    return record.state == cctl::SessionState::Running ? cctl::RC_OK : cctl::RC_NOT_RUNNING;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName(cctl::APP_NAME);
    app.setApplicationVersion("1.0.0");

    QCommandLineParser parser;
    parser.setApplicationDescription("Control casting devices through MPRIS media controls.");
    parser.addVersionOption();

    Options opts;
    parser.addOptions({opts.name, opts.host, opts.uuid, opts.retryWait, opts.wait,
                       opts.noWait, opts.icon, opts.logLevel, opts.help});
    parser.addPositionalArgument("command", "connect | service {connect|disconnect|reconnect|status}");
    parser.process(app);

    if (parser.isSet(opts.help))
        parser.showHelp(cctl::RC_OK);

    cctl::YamlConfig config;
    const QString configPath = cctl::YamlConfig::defaultPath();
    if (QFile::exists(configPath))
        config.load(configPath);

    cctl::DaemonArgs args = argsFrom(parser, opts, config);
    cctl::initLogging(args.logLevel);

    const QStringList positional = parser.positionalArguments();
    const QString command = positional.value(0);

    if (command == "connect")
        return runServer(app, args, config);

    if (command == "service") {
        const QString action = positional.value(1);
        static const QStringList actions{"connect", "disconnect", "reconnect", "status"};
        if (actions.contains(action))
            return runService(action, args, config);
    }

    parser.showHelp(EXIT_FAILURE);
}

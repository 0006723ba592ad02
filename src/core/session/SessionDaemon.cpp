#include "core/session/SessionDaemon.hpp"

#include <QFile>
#include <boost/log/trivial.hpp>

namespace cctl {

QString sessionStateName(SessionState state)
{
    switch (state) {
    case SessionState::NotStarted: return QStringLiteral("not started");
    case SessionState::Running:    return QStringLiteral("running");
    case SessionState::Stopped:    return QStringLiteral("stopped");
    }
    return QString();
}

SessionDaemon::SessionDaemon(const SessionStore& store, IProcessControl* process,
                             const QString& program)
    : store_(store)
    , process_(process)
    , program_(program)
{
}

SessionRecord SessionDaemon::status(const QString& identifier) const
{
    SessionRecord record;
    record.identifier = identifier;
    record.args = store_.load(identifier);

    if (!record.args.isValid())
        record.state = SessionState::NotStarted;
    else if (process_->isAlive(readPid(identifier)))
        record.state = SessionState::Running;
    else
        record.state = SessionState::Stopped;

    return record;
}

int SessionDaemon::start(const DaemonArgs& args)
{
    const QString identifier = args.identifier();

    if (status(identifier).state == SessionState::Running) {
        BOOST_LOG_TRIVIAL(warning) << "[Daemon] " << identifier.toStdString() << " is already running";
        return RC_OK;
    }

    if (!store_.save(args))
        return RC_NO_CHROMECAST;

    qint64 pid = process_->startDetached(program_, args.toArguments());
    if (pid <= 0) {
        store_.remove(identifier);
        return RC_NO_CHROMECAST;
    }

    if (!writePid(identifier, pid))
        BOOST_LOG_TRIVIAL(warning) << "[Daemon] Cannot record pid " << pid;

    BOOST_LOG_TRIVIAL(info) << "[Daemon] started " << identifier.toStdString() << " as pid " << pid;
    return RC_OK;
}

int SessionDaemon::stop(const QString& identifier)
{
    SessionRecord record = status(identifier);
    if (record.state != SessionState::Running) {
        BOOST_LOG_TRIVIAL(info) << "[Daemon] " << identifier.toStdString() << " is not running";
        // A daemon that died on its own still leaves its files behind
        if (record.state == SessionState::Stopped) {
            store_.remove(identifier);
            QFile::remove(store_.pidPath(identifier));
        }
        return RC_NOT_RUNNING;
    }

    qint64 pid = readPid(identifier);
    if (!process_->terminate(pid))
        BOOST_LOG_TRIVIAL(warning) << "[Daemon] could not signal pid " << pid;

    store_.remove(identifier);
    QFile::remove(store_.pidPath(identifier));
    BOOST_LOG_TRIVIAL(info) << "[Daemon] stopped " << identifier.toStdString();
    return RC_OK;
}

int SessionDaemon::reconnect(const QString& identifier)
{
    DaemonArgs args = store_.load(identifier);
    if (!args.isValid()) {
        BOOST_LOG_TRIVIAL(info) << "[Daemon] no saved session for " << identifier.toStdString();
        return RC_NOT_RUNNING;
    }

    stop(identifier);
    return start(args);
}

qint64 SessionDaemon::readPid(const QString& identifier) const
{
    QFile file(store_.pidPath(identifier));
    if (!file.open(QIODevice::ReadOnly))
        return 0;

    bool ok = false;
    qint64 pid = QString::fromLatin1(file.readAll()).trimmed().toLongLong(&ok);
    return ok ? pid : 0;
}

bool SessionDaemon::writePid(const QString& identifier, qint64 pid) const
{
    QFile file(store_.pidPath(identifier));
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate))
        return false;
    return file.write(QByteArray::number(pid) + '\n') > 0;
}

} // namespace cctl

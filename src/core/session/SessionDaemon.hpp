#pragma once

#include "core/session/DaemonArgs.hpp"
#include "core/session/ProcessControl.hpp"
#include "core/session/SessionStore.hpp"

namespace cctl {

enum class SessionState { NotStarted, Running, Stopped };

struct SessionRecord {
    QString identifier;
    SessionState state = SessionState::NotStarted;
    DaemonArgs args;
};

QString sessionStateName(SessionState state);

/// Background `connect` sessions, one per device identifier.
class SessionDaemon {
public:
    SessionDaemon(const SessionStore& store, IProcessControl* process,
                  const QString& program);

    SessionRecord status(const QString& identifier) const;

    /// Returns RC_OK once the session runs, RC_NO_CHROMECAST when it could not launch.
    int start(const DaemonArgs& args);
    /// RC_NOT_RUNNING when there is nothing to stop.
    int stop(const QString& identifier);
    int reconnect(const QString& identifier);

private:
    qint64 readPid(const QString& identifier) const;
    bool writePid(const QString& identifier, qint64 pid) const;

    SessionStore store_;
    IProcessControl* process_;
    QString program_;
};

} // namespace cctl

#include "core/session/ProcessControl.hpp"

#include <QProcess>
#include <boost/log/trivial.hpp>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <sys/types.h>

namespace cctl {

qint64 PosixProcessControl::startDetached(const QString& program, const QStringList& arguments)
{
    qint64 pid = 0;
    if (!QProcess::startDetached(program, arguments, QString(), &pid)) {
        BOOST_LOG_TRIVIAL(error) << "[Process] Failed to launch " << program.toStdString();
        return 0;
    }
    return pid;
}

bool PosixProcessControl::isAlive(qint64 pid) const
{
    if (pid <= 0)
        return false;
    return ::kill(static_cast<pid_t>(pid), 0) == 0 || errno == EPERM;
}

bool PosixProcessControl::terminate(qint64 pid)
{
    if (pid <= 0)
        return false;
    if (::kill(static_cast<pid_t>(pid), SIGTERM) != 0) {
        BOOST_LOG_TRIVIAL(warning) << "[Process] kill(" << pid << ") failed: " << std::strerror(errno);
        return false;
    }
    return true;
}

} // namespace cctl

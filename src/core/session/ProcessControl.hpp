#pragma once

#include <QString>
#include <QStringList>

namespace cctl {

class IProcessControl {
public:
    virtual ~IProcessControl() = default;

    /// Detached launch; returns the pid, or 0 on failure.
    virtual qint64 startDetached(const QString& program, const QStringList& arguments) = 0;
    virtual bool isAlive(qint64 pid) const = 0;
    virtual bool terminate(qint64 pid) = 0;
};

class PosixProcessControl : public IProcessControl {
public:
    qint64 startDetached(const QString& program, const QStringList& arguments) override;
    bool isAlive(qint64 pid) const override;
    bool terminate(qint64 pid) override;
};

} // namespace cctl

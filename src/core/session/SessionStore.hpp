#pragma once

#include "core/session/DaemonArgs.hpp"

#include <QString>

namespace cctl {

/// Per-device argument records, one YAML file each, under `dataDir`.
class SessionStore {
public:
    explicit SessionStore(const QString& dataDir);

    QString dataDir() const { return dataDir_; }
    QString argsPath(const QString& identifier) const;
    QString pidPath(const QString& identifier) const;

    /// Invalid args when the record is missing or unreadable.
    DaemonArgs load(const QString& identifier) const;
    bool save(const DaemonArgs& args) const;
    /// No-op when there is nothing to remove.
    bool remove(const QString& identifier) const;

private:
    QString dataDir_;
};

} // namespace cctl

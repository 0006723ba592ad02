#pragma once

#include <QString>

namespace cctl {

namespace DesktopEntry {

constexpr char FILE_NAME[] = "cast_control.desktop";

/// Write the hidden launcher entry MPRIS clients use to find our icon.
/// `directory` defaults to the user's applications location. Returns the
/// file path, or an empty string when it could not be written.
QString create(bool lightIcon, const QString& directory = QString(),
               const QString& assetDir = QString());

} // namespace DesktopEntry

} // namespace cctl

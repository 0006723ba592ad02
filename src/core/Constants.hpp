#pragma once

#include <QtGlobal>

namespace cctl {

// Process exit codes
constexpr int RC_OK = 0;
constexpr int RC_NO_CHROMECAST = 1;
constexpr int RC_NOT_RUNNING = 2;

// Discovery (seconds)
constexpr double DEFAULT_RETRY_WAIT = 5.0;
constexpr double DEFAULT_WAIT = 30.0;
constexpr double NO_WAIT = -1.0;

// Time is reported in microseconds over MPRIS
constexpr qint64 US_IN_SEC = 1000000;
constexpr qint64 NO_DURATION = -1;
constexpr qint64 BEGINNING = 0;

constexpr int DEFAULT_DISC_NO = 1;
constexpr int MAX_TITLES = 3;
constexpr int DEFAULT_DURATION_RESOLUTION = 1;
constexpr double DEFAULT_RATE = 1.0;

constexpr char APP_NAME[] = "cast_control";
constexpr char DEFAULT_NAME[] = "Cast Control";
constexpr char NO_DEVICE[] = "Device";
constexpr char NO_DESKTOP_FILE[] = "";
constexpr char NO_TRACK[] = "/org/mpris/MediaPlayer2/TrackList/NoTrack";
constexpr char DEFAULT_LOG_LEVEL[] = "WARN";

constexpr char ICON_FILE[] = "cast_control.svg";
constexpr char LIGHT_ICON_FILE[] = "cast_control_light.svg";

} // namespace cctl

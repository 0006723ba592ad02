#include "core/adapter/DurationTracker.hpp"
#include "core/Constants.hpp"
#include <QDateTime>
#include <QMutexLocker>
#include <cmath>

namespace cctl {

DurationTracker::DurationTracker(int resolution)
    : resolution_(resolution < 0 ? 0 : resolution)
    , longest_(NO_DURATION)
{
}

qint64 DurationTracker::duration(const ocast::MediaStatus& status)
{
    return duration(status, QDateTime::currentMSecsSinceEpoch());
}

qint64 DurationTracker::duration(const ocast::MediaStatus& status, qint64 nowMs)
{
    if (status.isValid() && status.duration > 0)
        return static_cast<qint64>(status.duration * US_IN_SEC);

    const qint64 current = position(status, nowMs);

    QMutexLocker lock(&mutex_);
    if (longest_ != NO_DURATION && longest_ > current)
        return longest_;

    if (current != BEGINNING) {
        longest_ = current;
        return current;
    }

    return NO_DURATION;
}

qint64 DurationTracker::position(const ocast::MediaStatus& status)
{
    return position(status, QDateTime::currentMSecsSinceEpoch());
}

qint64 DurationTracker::position(const ocast::MediaStatus& status, qint64 nowMs)
{
    if (!status.isValid())
        return BEGINNING;

    double seconds = status.adjustedCurrentTime(nowMs);
    if (seconds <= 0.0)
        return BEGINNING;

    return static_cast<qint64>(seconds * US_IN_SEC);
}

void DurationTracker::onNewStatus(const ocast::MediaStatus& status)
{
    if (hasCurrentTime(status))
        return;

    QMutexLocker lock(&mutex_);
    longest_ = NO_DURATION;
}

bool DurationTracker::hasCurrentTime(const ocast::MediaStatus& status) const
{
    if (!status.isValid() || !status.hasCurrentTime || status.currentTime == 0.0)
        return false;

    const double scale = std::pow(10.0, resolution_);
    const double rounded = std::round(status.currentTime * scale) / scale;
    return rounded > BEGINNING;
}

qint64 DurationTracker::longestObserved() const
{
    QMutexLocker lock(&mutex_);
    return longest_;
}

} // namespace cctl

#pragma once

#include <ocast/Status/MediaStatus.hpp>
#include <QMutex>

namespace cctl {

/// Estimates track length when the receiver reports none, from the
/// furthest position seen so far. All values are microseconds.
class DurationTracker {
public:
    explicit DurationTracker(int resolution);

    qint64 duration(const ocast::MediaStatus& status);
    qint64 duration(const ocast::MediaStatus& status, qint64 nowMs);

    static qint64 position(const ocast::MediaStatus& status);
    static qint64 position(const ocast::MediaStatus& status, qint64 nowMs);

    /// Forget the watermark when playback has no meaningful current time.
    void onNewStatus(const ocast::MediaStatus& status);

    bool hasCurrentTime(const ocast::MediaStatus& status) const;
    qint64 longestObserved() const;
    int resolution() const { return resolution_; }

private:
    mutable QMutex mutex_;
    int resolution_;
    qint64 longest_;
};

} // namespace cctl

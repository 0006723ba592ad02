#pragma once

#include "core/session/ICastNetwork.hpp"
#include "core/session/IDeviceLocator.hpp"

#include <QTimer>

namespace cctl {

/// Finds a receiver by host, then uuid, then friendly name. With no
/// identifiers at all the first receiver that answers wins. Every step
/// gets `retryWait` seconds and a failed step falls through to the next.
class CastDeviceLocator : public IDeviceLocator {
    Q_OBJECT
public:
    /// Takes ownership of `network` when it has no parent.
    explicit CastDeviceLocator(ICastNetwork* network, QObject* parent = nullptr);
    ~CastDeviceLocator() override;

    void locate(const DeviceQuery& query) override;

    static int stepTimeoutMs(double retryWait);

private:
    enum class Step { Host, Uuid, Name, Any, Done };

    void runStep(Step step);
    void nextStep();
    bool stepApplies(Step step) const;
    bool matches(const ocast::CastInfo& info) const;

    void onHostInfo(const ocast::CastInfo& info);
    void onDeviceFound(const ocast::CastInfo& info);
    void onConnected(ocast::ICastDevice* device);
    void onConnectFailed(const ocast::CastInfo& info, const QString& reason);
    void onStepTimeout();
    void connectTo(const ocast::CastInfo& info);
    void finish(ocast::ICastDevice* device);

    ICastNetwork* network_;
    DeviceQuery query_;
    Step step_ = Step::Done;
    QTimer stepTimer_;
};

} // namespace cctl

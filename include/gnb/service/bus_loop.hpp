#pragma once

/// @file bus_loop.hpp
/// @brief Single-threaded poll loop over the peer channel and a D-Bus connection.

#include <chrono>
#include <functional>

#include <systemd/sd-bus.h>

#include "gnb/foundation/bridge_result.hpp"
#include "gnb/service/service_runner.hpp"

namespace gnb::service {

using foundation::BridgeResult;

/// Why BusLoop::run() returned without an error.
enum class LoopExit {
    ShutdownRequested,
    InputClosed
};

/// Multiplexes the bridge input descriptor and the sd-bus connection.
///
/// Every iteration first drains pending bus work with sd_bus_process(),
/// then polls both descriptors. The poll timeout is the earlier of the
/// bus timeout and a fixed tick so that shutdown requests are noticed
/// promptly.
class BusLoop {
public:
    /// Called when the input descriptor is readable.
    /// @return false once the input reached end of stream.
    using InputHandler = std::function<BridgeResult<bool>()>;

    /// Called after every iteration; an error stops the loop.
    using HealthCheck = std::function<BridgeResult<void>()>;

    static constexpr std::chrono::milliseconds kTick{500};

    /// @param bus     Connection to service; not owned.
    /// @param inputFd Descriptor carrying frames from the peer; not owned.
    /// @param signals Shutdown flag source.
    BusLoop(sd_bus* bus, int inputFd, const SignalHandler& signals) noexcept
        : bus_(bus), inputFd_(inputFd), signals_(signals) {}

    BridgeResult<LoopExit> run(const InputHandler& onInput, const HealthCheck& check);

private:
    BridgeResult<void> processBus();
    void flush();
    [[nodiscard]] int pollTimeoutMs() const;

    sd_bus* bus_;
    int inputFd_;
    const SignalHandler& signals_;
};

} // namespace gnb::service

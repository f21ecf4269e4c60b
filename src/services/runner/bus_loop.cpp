/// @file bus_loop.cpp
/// @brief BusLoop implementation on poll(2).

#include "gnb/service/bus_loop.hpp"

#include <poll.h>
#include <time.h>

#include <array>
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <limits>
#include <string>

#include "gnb/foundation/bridge_logger.hpp"
#include "gnb/service/sdbus_support.hpp"

namespace gnb::service {

using foundation::BridgeError;
using foundation::ErrorCode;
using foundation::LogCategory;

namespace {

uint64_t monotonicNowUsec() {
    struct timespec ts {};
    clock_gettime(CLOCK_MONOTONIC, &ts);
    return static_cast<uint64_t>(ts.tv_sec) * 1000000U +
           static_cast<uint64_t>(ts.tv_nsec) / 1000U;
}

} // namespace

BridgeResult<void> BusLoop::processBus() {
    for (;;) {
        int r = sd_bus_process(bus_, nullptr);
        if (r < 0) {
            return BridgeResult<void>::err(
                busError(ErrorCode::BusConnectionFailed, "sd_bus_process failed", r));
        }
        if (r == 0) {
            return BridgeResult<void>::ok();
        }
    }
}

void BusLoop::flush() {
    int r = sd_bus_flush(bus_);
    if (r < 0) {
        GNB_LOG_WARN(LogCategory::DBus,
                     std::string("cannot flush bus: ") + std::strerror(-r));
    }
}

int BusLoop::pollTimeoutMs() const {
    const auto tick = static_cast<int>(kTick.count());
    uint64_t deadline = 0;
    if (sd_bus_get_timeout(bus_, &deadline) < 0 ||
        deadline == std::numeric_limits<uint64_t>::max()) {
        return tick;
    }
    // sd-bus reports an absolute CLOCK_MONOTONIC deadline.
    auto now = monotonicNowUsec();
    if (deadline <= now) {
        return 0;
    }
    auto relativeMs = (deadline - now + 999U) / 1000U;
    return relativeMs < static_cast<uint64_t>(tick) ? static_cast<int>(relativeMs) : tick;
}

BridgeResult<LoopExit> BusLoop::run(const InputHandler& onInput, const HealthCheck& check) {
    while (!signals_.shutdownRequested()) {
        if (auto processed = processBus(); processed.hasError()) {
            return BridgeResult<LoopExit>::err(processed.error());
        }
        if (auto healthy = check(); healthy.hasError()) {
            return BridgeResult<LoopExit>::err(healthy.error());
        }

        int busFd = sd_bus_get_fd(bus_);
        int busEvents = sd_bus_get_events(bus_);
        if (busFd < 0 || busEvents < 0) {
            return BridgeResult<LoopExit>::err(busError(
                ErrorCode::BusConnectionFailed, "bus connection lost",
                busFd < 0 ? busFd : busEvents));
        }

        std::array<pollfd, 2> fds{};
        fds[0].fd = inputFd_;
        fds[0].events = POLLIN;
        fds[1].fd = busFd;
        fds[1].events = static_cast<short>(busEvents);

        int ready = ::poll(fds.data(), fds.size(), pollTimeoutMs());
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            return BridgeResult<LoopExit>::err(BridgeError(
                ErrorCode::ChannelIoError, std::string("poll failed: ") + std::strerror(errno)));
        }

        if ((fds[0].revents & (POLLIN | POLLHUP | POLLERR)) != 0) {
            auto more = onInput();
            if (more.hasError()) {
                return BridgeResult<LoopExit>::err(more.error());
            }
            if (!more.value()) {
                // Push out replies queued while handling the last frames.
                if (auto processed = processBus(); processed.hasError()) {
                    return BridgeResult<LoopExit>::err(processed.error());
                }
                flush();
                GNB_LOG_INFO(LogCategory::Core, "input channel closed");
                return BridgeResult<LoopExit>::ok(LoopExit::InputClosed);
            }
        }
    }

    flush();
    GNB_LOG_INFO(LogCategory::Core, "shutdown requested");
    return BridgeResult<LoopExit>::ok(LoopExit::ShutdownRequested);
}

} // namespace gnb::service

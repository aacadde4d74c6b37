#pragma once

#include <atomic>
#include <functional>
#include <future>
#include <string>
#include <stdint.h>

#include "common/types.hpp"
#include "acquisition/acquisition_config.hpp"
#include "devices/bledom_device.hpp"
#include "transport/ble.hpp"

namespace bledom {

// Acquisition pipeline: adapter -> scan -> connect -> resolve characteristic.
//
//   IDLE -> SCANNING -> LOCATED -> CONNECTING -> CONNECTED -> SERVICE_RESOLVED -> READY
//
// Any step may end in FAILED. The configuration is copied when build()
// starts and is not read again during that run.
class DeviceBuilder
{
public:
    using StateCallback = std::function<void(AcquisitionState)>;

    explicit DeviceBuilder(ble::Manager& manager) : manager_(manager) {}

    DeviceBuilder(const DeviceBuilder&) = delete;
    DeviceBuilder& operator=(const DeviceBuilder&) = delete;

    DeviceBuilder& scan_retries(uint8_t retries);
    DeviceBuilder& scan_interval_ms(uint64_t interval);
    DeviceBuilder& connection_retries(uint8_t retries);
    DeviceBuilder& connection_interval_ms(uint64_t interval);
    DeviceBuilder& config(const AcquisitionConfig& config);

    const AcquisitionConfig& config() const { return config_; }

    void set_log_callback(LogCallback cb) { log_callback_ = std::move(cb); }
    void set_state_callback(StateCallback cb) { state_callback_ = std::move(cb); }
    void set_sleep_function(SleepFunction fn) { sleep_ = std::move(fn); }

    Result<BledomDevice> build();

    // Runs build() on a worker thread. The builder must outlive the future.
    std::future<Result<BledomDevice>> build_async();

    AcquisitionState state() const { return state_.load(); }
    uint8_t scan_attempts() const { return scan_attempts_.load(); }
    uint8_t connection_attempts() const { return connection_attempts_.load(); }

private:
    ble::Manager& manager_;
    AcquisitionConfig config_;
    LogCallback log_callback_;
    StateCallback state_callback_;
    SleepFunction sleep_;

    std::atomic<AcquisitionState> state_{AcquisitionState::IDLE};
    std::atomic<uint8_t> scan_attempts_{0};
    std::atomic<uint8_t> connection_attempts_{0};

    void enter(AcquisitionState state);
    void log(const std::string& msg);

    template<typename U>
    Result<BledomDevice> fail(const Result<U>& cause)
    {
        log("[BUILD] " + cause.describe());
        enter(AcquisitionState::FAILED);
        return Result<BledomDevice>::failure(cause);
    }
};

} // namespace bledom

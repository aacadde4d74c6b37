#include "devices/device_builder.hpp"
#include "acquisition/device_locator.hpp"
#include "acquisition/connection_establisher.hpp"
#include "acquisition/service_resolver.hpp"
#include "common/helpers.hpp"

namespace bledom {

DeviceBuilder BledomDevice::builder(ble::Manager& manager)
{
    return DeviceBuilder(manager);
}

DeviceBuilder& DeviceBuilder::scan_retries(uint8_t retries)
{
    config_.scan_retries = retries;
    return *this;
}

DeviceBuilder& DeviceBuilder::scan_interval_ms(uint64_t interval)
{
    config_.scan_interval_ms = interval;
    return *this;
}

DeviceBuilder& DeviceBuilder::connection_retries(uint8_t retries)
{
    config_.connection_retries = retries;
    return *this;
}

DeviceBuilder& DeviceBuilder::connection_interval_ms(uint64_t interval)
{
    config_.connection_interval_ms = interval;
    return *this;
}

DeviceBuilder& DeviceBuilder::config(const AcquisitionConfig& config)
{
    config_ = config;
    return *this;
}

void DeviceBuilder::log(const std::string& msg)
{
    if (log_callback_) {
        log_callback_(msg);
    }
}

void DeviceBuilder::enter(AcquisitionState state)
{
    state_.store(state);
    log(std::string("[STATE] ") + to_string(state));
    if (state_callback_) {
        state_callback_(state);
    }
}

Result<BledomDevice> DeviceBuilder::build()
{
    const AcquisitionConfig config = config_;
    const SleepFunction sleep = sleep_ ? sleep_ : SleepFunction(sleep_for_ms);

    scan_attempts_.store(0);
    connection_attempts_.store(0);
    enter(AcquisitionState::IDLE);

    auto valid = config.validate();
    if (!valid.ok()) {
        return fail(valid);
    }

    log("[BUILD] getting adapters...");
    auto adapters = manager_.adapters();
    if (!adapters.ok()) {
        return fail(adapters);
    }
    if (adapters.value().empty()) {
        return fail(Result<bool>::failure(Error::NO_ADAPTERS_FOUND, "no Bluetooth adapters found"));
    }

    auto adapter = adapters.value().front();
    log("[BUILD] adapter in use: " + adapter->name());

    enter(AcquisitionState::SCANNING);
    DeviceLocator locator(*adapter, config.scan_retries, config.scan_interval());
    locator.set_sleep_function(sleep);
    locator.set_log_callback(log_callback_);

    auto located = locator.locate();
    scan_attempts_.store(locator.attempts());
    if (!located.ok()) {
        return fail(located);
    }
    enter(AcquisitionState::LOCATED);

    auto peripheral = located.value();

    enter(AcquisitionState::CONNECTING);
    ConnectionEstablisher establisher(*peripheral, config.connection_retries, config.connection_interval());
    establisher.set_sleep_function(sleep);
    establisher.set_log_callback(log_callback_);

    auto connected = establisher.establish();
    connection_attempts_.store(establisher.attempts());
    if (!connected.ok()) {
        return fail(connected);
    }
    enter(AcquisitionState::CONNECTED);

    ServiceResolver resolver(*peripheral);
    resolver.set_log_callback(log_callback_);

    auto characteristic = resolver.resolve();
    if (!characteristic.ok()) {
        return fail(characteristic);
    }
    enter(AcquisitionState::SERVICE_RESOLVED);

    BledomDevice device(peripheral, characteristic.value());
    device.set_sleep_function(sleep);
    device.set_log_callback(log_callback_);

    enter(AcquisitionState::READY);
    return Result<BledomDevice>::success(std::move(device));
}

std::future<Result<BledomDevice>> DeviceBuilder::build_async()
{
    return std::async(std::launch::async, [this]() { return build(); });
}

} // namespace bledom

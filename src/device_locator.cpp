#include "acquisition/device_locator.hpp"
#include "common/helpers.hpp"

namespace bledom {

DeviceLocator::DeviceLocator(ble::Adapter& adapter, uint8_t retries, std::chrono::milliseconds interval)
    : adapter_(adapter), retries_(retries), interval_(interval), sleep_(sleep_for_ms) {}

void DeviceLocator::log(const std::string& msg)
{
    if (log_callback_) {
        log_callback_(msg);
    }
}

void DeviceLocator::stop_scan_quietly()
{
    auto result = adapter_.stop_scan();
    if (!result.ok()) {
        log("[SCAN] failed to stop scan: " + result.describe());
    }
}

Result<std::shared_ptr<ble::Peripheral>> DeviceLocator::find_once()
{
    using PeripheralResult = Result<std::shared_ptr<ble::Peripheral>>;

    auto peripherals = adapter_.peripherals();
    if (!peripherals.ok()) {
        return PeripheralResult::failure(peripherals);
    }

    for (const auto& peripheral : peripherals.value()) {
        auto props = peripheral->properties();
        if (!props.ok()) {
            return PeripheralResult::failure(props);
        }
        if (!props.value()) {
            return PeripheralResult::failure(Error::PROPERTIES_UNAVAILABLE,
                "peripheral properties not available for " + peripheral->id());
        }

        const auto& name = props.value()->local_name;
        if (name && name->find(name_match_) != std::string::npos) {
            return PeripheralResult::success(peripheral);
        }
    }

    return PeripheralResult::failure(Error::DEVICE_NOT_FOUND);
}

Result<std::shared_ptr<ble::Peripheral>> DeviceLocator::locate()
{
    using PeripheralResult = Result<std::shared_ptr<ble::Peripheral>>;

    attempts_ = 0;

    auto start = adapter_.start_scan(ble::ScanFilter{});
    if (!start.ok()) {
        return PeripheralResult::failure(Error::SCAN_ERROR, start.describe());
    }

    while (attempts_ < retries_) {
        log("[SCAN] trying to find light (" + std::to_string(attempts_ + 1) + "/" + std::to_string(retries_) + ")");

        auto found = find_once();
        ++attempts_;

        if (found.ok()) {
            log("[SCAN] found " + found.value()->id());
            stop_scan_quietly();
            return found;
        }

        if (found.error() != Error::DEVICE_NOT_FOUND) {
            log("[SCAN] aborting: " + found.describe());
            stop_scan_quietly();
            return found;
        }

        if (attempts_ < retries_ && sleep_) {
            sleep_(interval_);
        }
    }

    stop_scan_quietly();
    return PeripheralResult::failure(Error::DEVICE_NOT_FOUND,
        "could not find device after " + std::to_string(attempts_) + " tries");
}

} // namespace bledom

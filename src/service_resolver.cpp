#include "acquisition/service_resolver.hpp"

namespace bledom {

void ServiceResolver::log(const std::string& msg)
{
    if (log_callback_) {
        log_callback_(msg);
    }
}

Result<ble::Characteristic> ServiceResolver::resolve()
{
    log("[GATT] discovering services on " + peripheral_.id());

    auto discovered = peripheral_.discover_services();
    if (!discovered.ok()) {
        return Result<ble::Characteristic>::failure(Error::SERVICE_DISCOVERY_ERROR, discovered.describe());
    }

    auto characteristics = peripheral_.characteristics();
    log("[GATT] " + std::to_string(characteristics.size()) + " characteristic(s)");

    for (const auto& characteristic : characteristics) {
        if (characteristic.uuid == target_) {
            log("[GATT] light characteristic at handle " + std::to_string(characteristic.value_handle));
            return Result<ble::Characteristic>::success(characteristic);
        }
    }

    return Result<ble::Characteristic>::failure(Error::CHARACTERISTIC_NOT_FOUND,
        "light characteristic (UUID: " + target_.to_string() + ") not found on device");
}

} // namespace bledom

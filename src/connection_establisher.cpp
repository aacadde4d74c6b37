#include "acquisition/connection_establisher.hpp"
#include "common/helpers.hpp"

namespace bledom {

ConnectionEstablisher::ConnectionEstablisher(ble::Peripheral& peripheral, uint8_t retries, std::chrono::milliseconds interval)
    : peripheral_(peripheral), retries_(retries), interval_(interval), sleep_(sleep_for_ms) {}

void ConnectionEstablisher::log(const std::string& msg)
{
    if (log_callback_) {
        log_callback_(msg);
    }
}

Result<bool> ConnectionEstablisher::establish()
{
    attempts_ = 0;

    while (true) {
        log("[CONNECT] trying to connect to " + peripheral_.id());

        auto result = peripheral_.connect();
        ++attempts_;

        if (result.ok()) {
            log("[CONNECT] connected after " + std::to_string(attempts_) + " attempt(s)");
            return Result<bool>::success(true);
        }

        log("[CONNECT] failed to connect light: " + result.describe());

        if (attempts_ >= retries_) {
            return Result<bool>::failure(Error::CONNECTION_FAILED,
                "failed to connect after " + std::to_string(attempts_) + " tries: " + result.describe());
        }

        if (sleep_) {
            sleep_(interval_);
        }
    }
}

} // namespace bledom

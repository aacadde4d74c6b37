#include "transport/command_channel.hpp"
#include "common/helpers.hpp"
#include "common/protocol.hpp"

namespace bledom {

CommandChannel::CommandChannel(std::shared_ptr<ble::Peripheral> peripheral, ble::Characteristic characteristic)
    : peripheral_(std::move(peripheral)), characteristic_(std::move(characteristic)), sleep_(sleep_for_ms) {}

void CommandChannel::log(const std::string& msg)
{
    if (log_callback_) {
        log_callback_(msg);
    }
}

Result<bool> CommandChannel::send(const CommandFrame& frame)
{
    if (!CommandCodec::is_well_formed(frame)) {
        return Result<bool>::failure(Error::INVALID_PARAMETER,
            "malformed command byte array (expected 9 bytes, starting with 0x7e and ending with 0xef)");
    }

    log("[TX] " + bytesToHex(frame.data(), frame.size()));

    auto result = peripheral_->write(characteristic_, frame.data(), frame.size(),
                                     ble::WriteType::WITHOUT_RESPONSE);
    if (!result.ok()) {
        log("[TX] write failed: " + result.describe());
        return result;
    }

    if (sleep_) {
        sleep_(std::chrono::milliseconds(Protocol::COMMAND_SETTLE_DELAY_MS));
    }
    return Result<bool>::success(true);
}

} // namespace bledom

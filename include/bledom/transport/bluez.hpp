#pragma once

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include <stdint.h>

#include <bluetooth/bluetooth.h>
#include <bluetooth/hci.h>

#include "common/types.hpp"
#include "transport/ble.hpp"

namespace bledom {
namespace bluez {

// Linux transport over raw HCI (scanning) and L2CAP ATT (GATT) sockets.

class L2capPeripheral : public ble::Peripheral
{
public:
    static constexpr int CONNECT_TIMEOUT_MS = 5000;
    static constexpr int ATT_TIMEOUT_MS = 2000;

    L2capPeripheral(const bdaddr_t& local, const bdaddr_t& remote, uint8_t remote_type);
    ~L2capPeripheral() override;

    L2capPeripheral(const L2capPeripheral&) = delete;
    L2capPeripheral& operator=(const L2capPeripheral&) = delete;

    std::string id() const override;
    Result<std::optional<ble::PeripheralProperties>> properties() override;

    Result<bool> connect() override;
    Result<bool> disconnect() override;
    bool is_connected() const override { return socket_fd_ >= 0; }

    Result<bool> discover_services() override;
    std::vector<ble::Characteristic> characteristics() const override;

    Result<bool> write(const ble::Characteristic& characteristic,
                       const uint8_t* data, size_t len, ble::WriteType type) override;

    // Called from the scan thread for every advertising report.
    void update_advertisement(const std::optional<std::string>& name, int8_t rssi);

private:
    struct Service {
        uint16_t start_handle;
        uint16_t end_handle;
        Uuid uuid;
    };

    bdaddr_t local_;
    bdaddr_t remote_;
    uint8_t remote_type_;
    std::string address_;
    int socket_fd_{-1};

    mutable std::mutex mutex_;
    std::optional<std::string> name_;
    std::optional<int8_t> rssi_;
    std::vector<ble::Characteristic> characteristics_;

    Result<bool> send_pdu(const std::vector<uint8_t>& pdu);
    Result<std::vector<uint8_t>> receive_pdu(uint8_t expected_opcode, uint8_t request_opcode);

    Result<std::vector<Service>> discover_primary_services();
    Result<std::vector<ble::Characteristic>> discover_characteristics(const Service& service);
};

class HciAdapter : public ble::Adapter
{
public:
    HciAdapter(int dev_id, std::string name, const bdaddr_t& address);
    ~HciAdapter() override;

    HciAdapter(const HciAdapter&) = delete;
    HciAdapter& operator=(const HciAdapter&) = delete;

    std::string name() const override { return name_; }
    Result<bool> start_scan(const ble::ScanFilter& filter) override;
    Result<bool> stop_scan() override;
    Result<std::vector<std::shared_ptr<ble::Peripheral>>> peripherals() override;

    bool is_scanning() const { return running_.load(); }

private:
    int dev_id_;
    std::string name_;
    bdaddr_t address_;
    int dd_{-1};
    struct hci_filter original_filter_;

    std::atomic<bool> running_{false};
    std::thread reader_;

    std::mutex mutex_;
    std::map<std::string, std::shared_ptr<L2capPeripheral>> peripherals_;
    ble::ScanFilter filter_;

    int disable_scan();
    void read_loop();
    void handle_event(const uint8_t* buf, size_t len);
    void handle_report(const le_advertising_info* info);
};

class HciManager : public ble::Manager
{
public:
    Result<std::vector<std::shared_ptr<ble::Adapter>>> adapters() override;

private:
    // Adapters are handed out once and reused, so a second call sees the same scan state.
    std::map<int, std::shared_ptr<HciAdapter>> cache_;
};

} // namespace bluez
} // namespace bledom

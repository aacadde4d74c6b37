#include "transport/bluez.hpp"

#include <bluetooth/hci_lib.h>
#include <bluetooth/l2cap.h>

#include <sys/socket.h>
#include <sys/ioctl.h>
#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <errno.h>
#include <cstring>
#include <chrono>
#include <iostream>
#include <iomanip>
#include <sstream>

namespace bledom {
namespace bluez {

namespace {
    constexpr uint16_t ATT_CID = 0x0004;
    constexpr size_t ATT_DEFAULT_MTU = 23;

    constexpr uint8_t ATT_OP_ERROR = 0x01;
    constexpr uint8_t ATT_OP_READ_BY_TYPE_REQ = 0x08;
    constexpr uint8_t ATT_OP_READ_BY_TYPE_RSP = 0x09;
    constexpr uint8_t ATT_OP_READ_BY_GROUP_REQ = 0x10;
    constexpr uint8_t ATT_OP_READ_BY_GROUP_RSP = 0x11;
    constexpr uint8_t ATT_OP_WRITE_REQ = 0x12;
    constexpr uint8_t ATT_OP_WRITE_RSP = 0x13;
    constexpr uint8_t ATT_OP_HANDLE_IND = 0x1D;
    constexpr uint8_t ATT_OP_HANDLE_CONF = 0x1E;
    constexpr uint8_t ATT_OP_WRITE_CMD = 0x52;

    constexpr uint8_t ATT_ECODE_ATTR_NOT_FOUND = 0x0A;

    constexpr uint16_t GATT_PRIMARY_SERVICE = 0x2800;
    constexpr uint16_t GATT_CHARACTERISTIC = 0x2803;

    // Advertising data types
    constexpr uint8_t AD_UUID16_SOME = 0x02;
    constexpr uint8_t AD_UUID16_ALL = 0x03;
    constexpr uint8_t AD_UUID128_SOME = 0x06;
    constexpr uint8_t AD_UUID128_ALL = 0x07;
    constexpr uint8_t AD_NAME_SHORT = 0x08;
    constexpr uint8_t AD_NAME_COMPLETE = 0x09;

    // Active scan, 10 ms interval and window
    constexpr uint8_t SCAN_TYPE_ACTIVE = 0x01;
    constexpr uint16_t SCAN_INTERVAL = 0x0010;
    constexpr uint16_t SCAN_WINDOW = 0x0010;
    constexpr uint8_t OWN_ADDRESS_PUBLIC = 0x00;
    constexpr uint8_t FILTER_POLICY_ALL = 0x00;
    constexpr int HCI_TIMEOUT_MS = 1000;

    constexpr uint8_t LE_RANDOM_ADDRESS = 0x01;

    void put_le16(std::vector<uint8_t>& buf, uint16_t val)
    {
        buf.push_back(static_cast<uint8_t>(val & 0xFF));
        buf.push_back(static_cast<uint8_t>(val >> 8));
    }

    uint16_t get_le16(const uint8_t* buf)
    {
        return static_cast<uint16_t>(buf[0] | (buf[1] << 8));
    }

    bool set_nonblocking(int fd, bool nonblocking)
    {
        int flags = fcntl(fd, F_GETFL, 0);
        if (flags < 0) return false;
        if (nonblocking) {
            flags |= O_NONBLOCK;
        } else {
            flags &= ~O_NONBLOCK;
        }
        return fcntl(fd, F_SETFL, flags) >= 0;
    }

    std::string att_error_text(const std::vector<uint8_t>& pdu)
    {
        std::ostringstream oss;
        oss << "ATT error 0x" << std::hex << std::setw(2) << std::setfill('0');
        if (pdu.size() >= 5) {
            oss << static_cast<int>(pdu[4]) << " on handle 0x" << std::setw(4) << get_le16(&pdu[2]);
        } else {
            oss << 0;
        }
        return oss.str();
    }
}

// ---------------------------------------------------------------------------
// L2capPeripheral

L2capPeripheral::L2capPeripheral(const bdaddr_t& local, const bdaddr_t& remote, uint8_t remote_type)
    : remote_type_(remote_type)
{
    bacpy(&local_, &local);
    bacpy(&remote_, &remote);

    char addr[18] = {0};
    ba2str(&remote_, addr);
    address_ = addr;
}

L2capPeripheral::~L2capPeripheral()
{
    disconnect();
}

std::string L2capPeripheral::id() const
{
    return address_;
}

void L2capPeripheral::update_advertisement(const std::optional<std::string>& name, int8_t rssi)
{
    std::lock_guard<std::mutex> lock(mutex_);
    // Scan responses and plain advertisements alternate; keep the last name seen.
    if (name) {
        name_ = name;
    }
    rssi_ = rssi;
}

Result<std::optional<ble::PeripheralProperties>> L2capPeripheral::properties()
{
    std::lock_guard<std::mutex> lock(mutex_);

    ble::PeripheralProperties props;
    props.address = address_;
    props.local_name = name_;
    props.rssi = rssi_;
    return Result<std::optional<ble::PeripheralProperties>>::success(props);
}

Result<bool> L2capPeripheral::connect()
{
    if (socket_fd_ >= 0) {
        return Result<bool>::success(true);
    }

    int fd = ::socket(AF_BLUETOOTH, SOCK_SEQPACKET | SOCK_CLOEXEC, BTPROTO_L2CAP);
    if (fd < 0) {
        std::cerr << "Error creating L2CAP socket: " << strerror(errno) << "\n";
        return Result<bool>::failure(Error::PORT_ERROR, strerror(errno));
    }

    auto fail = [fd](Error error, const std::string& what, int err) {
        std::cerr << what << ": " << strerror(err) << "\n";
        ::close(fd);
        return Result<bool>::failure(error, what + ": " + strerror(err));
    };

    struct sockaddr_l2 src;
    memset(&src, 0, sizeof(src));
    src.l2_family = AF_BLUETOOTH;
    src.l2_cid = htobs(ATT_CID);
    src.l2_bdaddr_type = BDADDR_LE_PUBLIC;
    bacpy(&src.l2_bdaddr, &local_);

    if (::bind(fd, reinterpret_cast<struct sockaddr*>(&src), sizeof(src)) < 0) {
        return fail(Error::PORT_ERROR, "Error binding L2CAP socket", errno);
    }

    struct bt_security sec;
    memset(&sec, 0, sizeof(sec));
    sec.level = BT_SECURITY_LOW;
    if (setsockopt(fd, SOL_BLUETOOTH, BT_SECURITY, &sec, sizeof(sec)) < 0) {
        return fail(Error::PORT_ERROR, "Error setting L2CAP security", errno);
    }

    struct sockaddr_l2 dst;
    memset(&dst, 0, sizeof(dst));
    dst.l2_family = AF_BLUETOOTH;
    dst.l2_cid = htobs(ATT_CID);
    dst.l2_bdaddr_type = remote_type_ == LE_RANDOM_ADDRESS ? BDADDR_LE_RANDOM : BDADDR_LE_PUBLIC;
    bacpy(&dst.l2_bdaddr, &remote_);

    if (!set_nonblocking(fd, true)) {
        return fail(Error::PORT_ERROR, "Error setting non-blocking mode", errno);
    }

    if (::connect(fd, reinterpret_cast<struct sockaddr*>(&dst), sizeof(dst)) < 0) {
        if (errno != EINPROGRESS) {
            return fail(Error::PORT_ERROR, "Connection failed to " + address_, errno);
        }

        struct pollfd pfd = {fd, POLLOUT, 0};
        int ret = poll(&pfd, 1, CONNECT_TIMEOUT_MS);
        if (ret == 0) {
            ::close(fd);
            return Result<bool>::failure(Error::TIMEOUT, "connection to " + address_ + " timed out");
        }
        if (ret < 0) {
            return fail(Error::PORT_ERROR, "Error waiting for connection", errno);
        }

        int so_error = 0;
        socklen_t so_len = sizeof(so_error);
        if (getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &so_len) < 0) {
            return fail(Error::PORT_ERROR, "Error reading connection status", errno);
        }
        if (so_error != 0) {
            return fail(Error::PORT_ERROR, "Connection failed to " + address_, so_error);
        }
    }

    if (!set_nonblocking(fd, false)) {
        return fail(Error::PORT_ERROR, "Error restoring blocking mode", errno);
    }

    socket_fd_ = fd;
    return Result<bool>::success(true);
}

Result<bool> L2capPeripheral::disconnect()
{
    if (socket_fd_ >= 0) {
        ::close(socket_fd_);
        socket_fd_ = -1;
        return Result<bool>::success(true);
    }
    return Result<bool>::success(false);
}

Result<bool> L2capPeripheral::send_pdu(const std::vector<uint8_t>& pdu)
{
    if (socket_fd_ < 0) {
        return Result<bool>::failure(Error::PORT_ERROR, "not connected");
    }

    ssize_t sent = ::send(socket_fd_, pdu.data(), pdu.size(), 0);
    if (sent < 0) {
        std::cerr << "Error writing ATT PDU: " << strerror(errno) << "\n";
        return Result<bool>::failure(Error::WRITE_ERROR, strerror(errno));
    }
    if (static_cast<size_t>(sent) != pdu.size()) {
        return Result<bool>::failure(Error::WRITE_ERROR, "short ATT write");
    }
    return Result<bool>::success(true);
}

// Waits for `expected_opcode` or an error response to `request_opcode`;
// anything else arriving meanwhile (notifications, indications) is skipped.
Result<std::vector<uint8_t>> L2capPeripheral::receive_pdu(uint8_t expected_opcode, uint8_t request_opcode)
{
    using Clock = std::chrono::steady_clock;
    const auto deadline = Clock::now() + std::chrono::milliseconds(ATT_TIMEOUT_MS);
    uint8_t buf[512];

    while (true) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()).count();
        if (remaining <= 0) {
            return Result<std::vector<uint8_t>>::failure(Error::TIMEOUT, "no ATT response");
        }

        struct pollfd pfd = {socket_fd_, POLLIN, 0};
        int ret = poll(&pfd, 1, static_cast<int>(remaining));
        if (ret < 0) {
            if (errno == EINTR) continue;
            return Result<std::vector<uint8_t>>::failure(Error::READ_ERROR, strerror(errno));
        }
        if (ret == 0) {
            continue;
        }

        ssize_t n = ::recv(socket_fd_, buf, sizeof(buf), 0);
        if (n <= 0) {
            return Result<std::vector<uint8_t>>::failure(Error::READ_ERROR,
                n == 0 ? std::string("link closed by peer") : std::string(strerror(errno)));
        }

        std::vector<uint8_t> pdu(buf, buf + n);
        if (pdu[0] == expected_opcode) {
            return Result<std::vector<uint8_t>>::success(std::move(pdu));
        }
        if (pdu[0] == ATT_OP_ERROR && pdu.size() >= 5 && pdu[1] == request_opcode) {
            return Result<std::vector<uint8_t>>::success(std::move(pdu));
        }
        if (pdu[0] == ATT_OP_HANDLE_IND) {
            auto conf = send_pdu({ATT_OP_HANDLE_CONF});
            if (!conf.ok()) {
                return Result<std::vector<uint8_t>>::failure(conf);
            }
        }
    }
}

Result<std::vector<L2capPeripheral::Service>> L2capPeripheral::discover_primary_services()
{
    using ServiceResult = Result<std::vector<Service>>;
    std::vector<Service> services;
    uint16_t start = 0x0001;

    while (true) {
        std::vector<uint8_t> req{ATT_OP_READ_BY_GROUP_REQ};
        put_le16(req, start);
        put_le16(req, 0xFFFF);
        put_le16(req, GATT_PRIMARY_SERVICE);

        auto sent = send_pdu(req);
        if (!sent.ok()) return ServiceResult::failure(sent);

        auto rsp = receive_pdu(ATT_OP_READ_BY_GROUP_RSP, ATT_OP_READ_BY_GROUP_REQ);
        if (!rsp.ok()) return ServiceResult::failure(rsp);

        const auto& pdu = rsp.value();
        if (pdu[0] == ATT_OP_ERROR) {
            if (pdu[4] == ATT_ECODE_ATTR_NOT_FOUND) break;
            return ServiceResult::failure(Error::INVALID_RESPONSE, att_error_text(pdu));
        }

        if (pdu.size() < 2 || (pdu[1] != 6 && pdu[1] != 20)) {
            return ServiceResult::failure(Error::INVALID_RESPONSE, "bad service group length");
        }

        size_t entry_len = pdu[1];
        uint16_t last_end = start;
        for (size_t off = 2; off + entry_len <= pdu.size(); off += entry_len) {
            Service service;
            service.start_handle = get_le16(&pdu[off]);
            service.end_handle = get_le16(&pdu[off + 2]);
            service.uuid = Uuid::from_le_bytes(&pdu[off + 4], entry_len - 4);
            services.push_back(service);
            last_end = service.end_handle;
        }

        if (last_end == 0xFFFF || last_end < start) break;
        start = static_cast<uint16_t>(last_end + 1);
    }

    return ServiceResult::success(std::move(services));
}

Result<std::vector<ble::Characteristic>> L2capPeripheral::discover_characteristics(const Service& service)
{
    using CharResult = Result<std::vector<ble::Characteristic>>;
    std::vector<ble::Characteristic> chars;
    uint16_t start = service.start_handle;

    while (start <= service.end_handle) {
        std::vector<uint8_t> req{ATT_OP_READ_BY_TYPE_REQ};
        put_le16(req, start);
        put_le16(req, service.end_handle);
        put_le16(req, GATT_CHARACTERISTIC);

        auto sent = send_pdu(req);
        if (!sent.ok()) return CharResult::failure(sent);

        auto rsp = receive_pdu(ATT_OP_READ_BY_TYPE_RSP, ATT_OP_READ_BY_TYPE_REQ);
        if (!rsp.ok()) return CharResult::failure(rsp);

        const auto& pdu = rsp.value();
        if (pdu[0] == ATT_OP_ERROR) {
            if (pdu[4] == ATT_ECODE_ATTR_NOT_FOUND) break;
            return CharResult::failure(Error::INVALID_RESPONSE, att_error_text(pdu));
        }

        // handle(2) properties(1) value handle(2) uuid(2|16)
        if (pdu.size() < 2 || (pdu[1] != 7 && pdu[1] != 21)) {
            return CharResult::failure(Error::INVALID_RESPONSE, "bad characteristic entry length");
        }

        size_t entry_len = pdu[1];
        uint16_t last = start;
        for (size_t off = 2; off + entry_len <= pdu.size(); off += entry_len) {
            ble::Characteristic c;
            c.handle = get_le16(&pdu[off]);
            c.properties = pdu[off + 2];
            c.value_handle = get_le16(&pdu[off + 3]);
            c.uuid = Uuid::from_le_bytes(&pdu[off + 5], entry_len - 5);
            c.service_uuid = service.uuid;
            chars.push_back(c);
            last = c.handle;
        }

        if (last >= service.end_handle || last < start) break;
        start = static_cast<uint16_t>(last + 1);
    }

    return CharResult::success(std::move(chars));
}

Result<bool> L2capPeripheral::discover_services()
{
    if (socket_fd_ < 0) {
        return Result<bool>::failure(Error::PORT_ERROR, "not connected");
    }

    auto services = discover_primary_services();
    if (!services.ok()) {
        return Result<bool>::failure(services);
    }

    std::vector<ble::Characteristic> found;
    for (const auto& service : services.value()) {
        auto chars = discover_characteristics(service);
        if (!chars.ok()) {
            return Result<bool>::failure(chars);
        }
        found.insert(found.end(), chars.value().begin(), chars.value().end());
    }

    std::lock_guard<std::mutex> lock(mutex_);
    characteristics_ = std::move(found);
    return Result<bool>::success(true);
}

std::vector<ble::Characteristic> L2capPeripheral::characteristics() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return characteristics_;
}

Result<bool> L2capPeripheral::write(const ble::Characteristic& characteristic,
                                    const uint8_t* data, size_t len, ble::WriteType type)
{
    if (len > ATT_DEFAULT_MTU - 3) {
        return Result<bool>::failure(Error::INVALID_PARAMETER, "payload exceeds ATT MTU");
    }

    bool with_response = type == ble::WriteType::WITH_RESPONSE;

    std::vector<uint8_t> pdu{with_response ? ATT_OP_WRITE_REQ : ATT_OP_WRITE_CMD};
    put_le16(pdu, characteristic.value_handle);
    pdu.insert(pdu.end(), data, data + len);

    auto sent = send_pdu(pdu);
    if (!sent.ok() || !with_response) {
        return sent;
    }

    auto rsp = receive_pdu(ATT_OP_WRITE_RSP, ATT_OP_WRITE_REQ);
    if (!rsp.ok()) {
        return Result<bool>::failure(rsp);
    }
    if (rsp.value()[0] == ATT_OP_ERROR) {
        return Result<bool>::failure(Error::DEVICE_ERROR, att_error_text(rsp.value()));
    }
    return Result<bool>::success(true);
}

// ---------------------------------------------------------------------------
// HciAdapter

HciAdapter::HciAdapter(int dev_id, std::string name, const bdaddr_t& address)
    : dev_id_(dev_id), name_(std::move(name))
{
    bacpy(&address_, &address);
    memset(&original_filter_, 0, sizeof(original_filter_));
}

HciAdapter::~HciAdapter()
{
    stop_scan();
}

Result<bool> HciAdapter::start_scan(const ble::ScanFilter& filter)
{
    if (running_.load()) {
        return Result<bool>::success(true);
    }

    dd_ = hci_open_dev(dev_id_);
    if (dd_ < 0) {
        std::cerr << "Error opening hci" << dev_id_ << ": " << strerror(errno) << "\n";
        return Result<bool>::failure(Error::PORT_ERROR, strerror(errno));
    }

    auto fail = [this](const std::string& what) {
        int err = errno;
        std::cerr << what << ": " << strerror(err) << "\n";
        hci_close_dev(dd_);
        dd_ = -1;
        return Result<bool>::failure(Error::PORT_ERROR, what + ": " + strerror(err));
    };

    if (hci_le_set_scan_parameters(dd_, SCAN_TYPE_ACTIVE, htobs(SCAN_INTERVAL), htobs(SCAN_WINDOW),
                                   OWN_ADDRESS_PUBLIC, FILTER_POLICY_ALL, HCI_TIMEOUT_MS) < 0) {
        return fail("Error setting LE scan parameters");
    }

    if (hci_le_set_scan_enable(dd_, 0x01, 0x00, HCI_TIMEOUT_MS) < 0) {
        return fail("Error enabling LE scan");
    }

    socklen_t olen = sizeof(original_filter_);
    if (getsockopt(dd_, SOL_HCI, HCI_FILTER, &original_filter_, &olen) < 0) {
        int err = errno;
        disable_scan();
        errno = err;
        return fail("Error reading HCI filter");
    }

    struct hci_filter nf;
    hci_filter_clear(&nf);
    hci_filter_set_ptype(HCI_EVENT_PKT, &nf);
    hci_filter_set_event(EVT_LE_META_EVENT, &nf);
    if (setsockopt(dd_, SOL_HCI, HCI_FILTER, &nf, sizeof(nf)) < 0) {
        int err = errno;
        disable_scan();
        errno = err;
        return fail("Error setting HCI filter");
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        filter_ = filter;
    }

    running_.store(true);
    reader_ = std::thread(&HciAdapter::read_loop, this);
    return Result<bool>::success(true);
}

Result<bool> HciAdapter::stop_scan()
{
    if (!running_.exchange(false)) {
        return Result<bool>::success(false);
    }

    if (reader_.joinable()) {
        reader_.join();
    }

    auto result = Result<bool>::success(true);

    if (setsockopt(dd_, SOL_HCI, HCI_FILTER, &original_filter_, sizeof(original_filter_)) < 0) {
        std::cerr << "Error restoring HCI filter: " << strerror(errno) << "\n";
    }

    int err = disable_scan();
    if (err != 0) {
        result = Result<bool>::failure(Error::PORT_ERROR, strerror(err));
    }

    hci_close_dev(dd_);
    dd_ = -1;
    return result;
}

// Returns 0 or the errno of the failed HCI command.
int HciAdapter::disable_scan()
{
    if (hci_le_set_scan_enable(dd_, 0x00, 0x00, HCI_TIMEOUT_MS) < 0) {
        int err = errno;
        std::cerr << "Error disabling LE scan: " << strerror(err) << "\n";
        return err;
    }
    return 0;
}

void HciAdapter::read_loop()
{
    uint8_t buf[HCI_MAX_EVENT_SIZE];

    while (running_.load())
    {
        struct pollfd pfd = {dd_, POLLIN, 0};
        int ret = poll(&pfd, 1, 100);

        if (ret < 0) {
            if (errno == EINTR) continue;
            std::cerr << "Error polling hci" << dev_id_ << ": " << strerror(errno) << "\n";
            break;
        }
        if (ret == 0) {
            continue;
        }

        ssize_t n = ::read(dd_, buf, sizeof(buf));
        if (n < 0) {
            if (errno == EAGAIN || errno == EINTR) continue;
            std::cerr << "Error reading hci" << dev_id_ << ": " << strerror(errno) << "\n";
            break;
        }

        handle_event(buf, static_cast<size_t>(n));
    }
}

void HciAdapter::handle_event(const uint8_t* buf, size_t len)
{
    // packet type, event header, meta event
    const size_t header = 1 + HCI_EVENT_HDR_SIZE;
    if (len < header + 2) {
        return;
    }

    auto meta = reinterpret_cast<const evt_le_meta_event*>(buf + header);
    if (meta->subevent != EVT_LE_ADVERTISING_REPORT) {
        return;
    }

    const uint8_t* end = buf + len;
    uint8_t reports = meta->data[0];
    const uint8_t* cursor = meta->data + 1;

    for (uint8_t i = 0; i < reports; ++i) {
        if (cursor + LE_ADVERTISING_INFO_SIZE > end) break;
        auto info = reinterpret_cast<const le_advertising_info*>(cursor);

        // AD payload followed by one RSSI byte
        if (cursor + LE_ADVERTISING_INFO_SIZE + info->length + 1 > end) break;

        handle_report(info);
        cursor += LE_ADVERTISING_INFO_SIZE + info->length + 1;
    }
}

void HciAdapter::handle_report(const le_advertising_info* info)
{
    std::optional<std::string> name;
    std::vector<Uuid> advertised;

    const uint8_t* ad = info->data;
    size_t pos = 0;
    while (pos < info->length) {
        uint8_t field_len = ad[pos];
        if (field_len == 0 || pos + 1 + field_len > info->length) break;

        uint8_t type = ad[pos + 1];
        const uint8_t* value = ad + pos + 2;
        size_t value_len = field_len - 1;

        switch (type) {
            case AD_NAME_SHORT:
                if (!name) name = std::string(reinterpret_cast<const char*>(value), value_len);
                break;
            case AD_NAME_COMPLETE:
                name = std::string(reinterpret_cast<const char*>(value), value_len);
                break;
            case AD_UUID16_SOME:
            case AD_UUID16_ALL:
                for (size_t k = 0; k + 2 <= value_len; k += 2)
                    advertised.push_back(Uuid::from_le_bytes(value + k, 2));
                break;
            case AD_UUID128_SOME:
            case AD_UUID128_ALL:
                for (size_t k = 0; k + 16 <= value_len; k += 16)
                    advertised.push_back(Uuid::from_le_bytes(value + k, 16));
                break;
            default:
                break;
        }
        pos += field_len + 1;
    }

    int8_t rssi = static_cast<int8_t>(info->data[info->length]);

    char addr[18] = {0};
    ba2str(&info->bdaddr, addr);

    std::lock_guard<std::mutex> lock(mutex_);

    auto it = peripherals_.find(addr);
    if (it == peripherals_.end()) {
        if (!filter_.services.empty()) {
            bool wanted = false;
            for (const auto& uuid : advertised) {
                for (const auto& service : filter_.services) {
                    if (uuid == service) wanted = true;
                }
            }
            if (!wanted) return;
        }
        auto peripheral = std::make_shared<L2capPeripheral>(address_, info->bdaddr, info->bdaddr_type);
        it = peripherals_.emplace(addr, std::move(peripheral)).first;
    }

    it->second->update_advertisement(name, rssi);
}

Result<std::vector<std::shared_ptr<ble::Peripheral>>> HciAdapter::peripherals()
{
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<std::shared_ptr<ble::Peripheral>> list;
    list.reserve(peripherals_.size());
    for (const auto& entry : peripherals_) {
        list.push_back(entry.second);
    }
    return Result<std::vector<std::shared_ptr<ble::Peripheral>>>::success(std::move(list));
}

// ---------------------------------------------------------------------------
// HciManager

Result<std::vector<std::shared_ptr<ble::Adapter>>> HciManager::adapters()
{
    using AdapterResult = Result<std::vector<std::shared_ptr<ble::Adapter>>>;

    int ctl = ::socket(AF_BLUETOOTH, SOCK_RAW | SOCK_CLOEXEC, BTPROTO_HCI);
    if (ctl < 0) {
        std::cerr << "Error opening HCI control socket: " << strerror(errno) << "\n";
        return AdapterResult::failure(Error::PORT_ERROR, strerror(errno));
    }

    std::vector<uint8_t> buf(sizeof(struct hci_dev_list_req) + HCI_MAX_DEV * sizeof(struct hci_dev_req));
    auto* list = reinterpret_cast<struct hci_dev_list_req*>(buf.data());
    list->dev_num = HCI_MAX_DEV;

    if (ioctl(ctl, HCIGETDEVLIST, list) < 0) {
        int err = errno;
        std::cerr << "Error listing HCI devices: " << strerror(err) << "\n";
        ::close(ctl);
        return AdapterResult::failure(Error::PORT_ERROR, strerror(err));
    }
    ::close(ctl);

    std::vector<std::shared_ptr<ble::Adapter>> adapters;
    for (int i = 0; i < list->dev_num; ++i) {
        struct hci_dev_req* req = list->dev_req + i;
        if (!hci_test_bit(HCI_UP, &req->dev_opt)) {
            continue;
        }

        auto cached = cache_.find(req->dev_id);
        if (cached != cache_.end()) {
            adapters.push_back(cached->second);
            continue;
        }

        struct hci_dev_info info;
        if (hci_devinfo(req->dev_id, &info) < 0) {
            std::cerr << "Error reading hci" << req->dev_id << " info: " << strerror(errno) << "\n";
            continue;
        }

        auto adapter = std::make_shared<HciAdapter>(req->dev_id, info.name, info.bdaddr);
        cache_.emplace(req->dev_id, adapter);
        adapters.push_back(adapter);
    }

    return AdapterResult::success(std::move(adapters));
}

} // namespace bluez
} // namespace bledom

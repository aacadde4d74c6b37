#include <iostream>
#include <sstream>
#include <string>
#include <vector>
#include <getopt.h>
#include <stdlib.h>

#include "devices/device_builder.hpp"
#include "transport/bluez.hpp"
#include "common/effects.hpp"

using namespace bledom;

namespace {

void usage(const char* prog)
{
    std::cout << "Usage: " << prog << " [options] <command> [args]\n"
              << "\nOptions:\n"
              << "  --scan-retries N       scan polls before giving up (default "
              << static_cast<int>(AcquisitionConfig::DEFAULT_SCAN_RETRIES) << ")\n"
              << "  --scan-interval MS     delay between scan polls (default "
              << AcquisitionConfig::DEFAULT_SCAN_INTERVAL_MS << ")\n"
              << "  --connect-retries N    connect attempts (default "
              << static_cast<int>(AcquisitionConfig::DEFAULT_CONNECTION_RETRIES) << ")\n"
              << "  --connect-interval MS  delay between connect attempts (default "
              << AcquisitionConfig::DEFAULT_CONNECTION_INTERVAL_MS << ")\n"
              << "  -v, --verbose          print acquisition and TX log\n"
              << "\nCommands:\n"
              << "  on | off\n"
              << "  brightness <0-100>\n"
              << "  color <r> <g> <b>\n"
              << "  effect <name|code>\n"
              << "  speed <0-100>\n"
              << "  sync-time\n"
              << "  time <hour> <minute> <second> <day 1-7>\n"
              << "  schedule-on <days> <hour> <minute> [enable|disable]\n"
              << "  schedule-off <days> <hour> <minute> [enable|disable]\n"
              << "  raw <id> <sub> <a1> <a2> <a3>\n"
              << "  effects                list effect names\n"
              << "\n<days> is a comma list (monday,friday,weekend,...) or a mask like 0x1f\n";
}

bool parse_u8(const std::string& text, uint8_t& out)
{
    char* end = nullptr;
    long v = strtol(text.c_str(), &end, 0);
    if (text.empty() || *end != '\0' || v < 0 || v > 255) {
        std::cerr << "Invalid number: " << text << std::endl;
        return false;
    }
    out = static_cast<uint8_t>(v);
    return true;
}

bool parse_u64(const char* text, uint64_t& out)
{
    char* end = nullptr;
    unsigned long long v = strtoull(text, &end, 0);
    if (*text == '\0' || *end != '\0') {
        std::cerr << "Invalid number: " << text << std::endl;
        return false;
    }
    out = v;
    return true;
}

bool parse_days(const std::string& text, uint8_t& out)
{
    if (text.rfind("0x", 0) == 0 || text.rfind("0X", 0) == 0) {
        return parse_u8(text, out);
    }

    uint8_t mask = 0;
    std::stringstream ss(text);
    std::string item;
    while (std::getline(ss, item, ',')) {
        auto day = day_from_name(item);
        if (!day) {
            std::cerr << "Unknown day: " << item << std::endl;
            return false;
        }
        mask |= *day;
    }
    out = mask;
    return true;
}

bool parse_effect(const std::string& text, uint8_t& out)
{
    if (auto effect = effect_from_name(text)) {
        out = static_cast<uint8_t>(*effect);
        return true;
    }
    return parse_u8(text, out);
}

bool need_args(const std::vector<std::string>& args, size_t count)
{
    if (args.size() < count) {
        std::cerr << "Missing arguments for '" << args[0] << "'" << std::endl;
        return false;
    }
    return true;
}

struct Command
{
    std::string name;
    uint8_t a[5] = {0, 0, 0, 0, 0};
    bool enabled = true;
};

// Parsed before connecting so a typo does not cost a scan.
bool parse_command(const std::vector<std::string>& args, Command& cmd)
{
    cmd.name = args[0];
    const std::string& n = cmd.name;

    if (n == "on" || n == "off" || n == "sync-time") {
        return true;
    }
    if (n == "brightness" || n == "speed") {
        return need_args(args, 2) && parse_u8(args[1], cmd.a[0]);
    }
    if (n == "effect") {
        return need_args(args, 2) && parse_effect(args[1], cmd.a[0]);
    }
    if (n == "color") {
        return need_args(args, 4) && parse_u8(args[1], cmd.a[0])
            && parse_u8(args[2], cmd.a[1]) && parse_u8(args[3], cmd.a[2]);
    }
    if (n == "time") {
        return need_args(args, 5) && parse_u8(args[1], cmd.a[0]) && parse_u8(args[2], cmd.a[1])
            && parse_u8(args[3], cmd.a[2]) && parse_u8(args[4], cmd.a[3]);
    }
    if (n == "schedule-on" || n == "schedule-off") {
        if (!need_args(args, 4) || !parse_days(args[1], cmd.a[0])
            || !parse_u8(args[2], cmd.a[1]) || !parse_u8(args[3], cmd.a[2])) {
            return false;
        }
        if (args.size() > 4) {
            if (args[4] == "disable") {
                cmd.enabled = false;
            } else if (args[4] != "enable") {
                std::cerr << "Expected enable|disable, got " << args[4] << std::endl;
                return false;
            }
        }
        return true;
    }
    if (n == "raw") {
        if (!need_args(args, 6)) return false;
        for (int i = 0; i < 5; i++) {
            if (!parse_u8(args[i + 1], cmd.a[i])) return false;
        }
        return true;
    }

    std::cerr << "Unknown command: " << n << std::endl;
    return false;
}

Result<bool> run(BledomDevice& device, const Command& cmd)
{
    const std::string& n = cmd.name;
    const uint8_t* a = cmd.a;

    if (n == "on") return device.power_on();
    if (n == "off") return device.power_off();
    if (n == "brightness") return device.set_brightness(a[0]);
    if (n == "speed") return device.set_effect_speed(a[0]);
    if (n == "effect") return device.set_effect(a[0]);
    if (n == "color") return device.set_color(a[0], a[1], a[2]);
    if (n == "sync-time") return device.sync_time();
    if (n == "time") return device.set_custom_time(a[0], a[1], a[2], a[3]);
    if (n == "schedule-on") return device.set_schedule_on(a[0], a[1], a[2], cmd.enabled);
    if (n == "schedule-off") return device.set_schedule_off(a[0], a[1], a[2], cmd.enabled);
    return device.generic_command(a[0], a[1], a[2], a[3], a[4]);
}

} // namespace

int main(int argc, char* argv[])
{
    enum { OPT_SCAN_RETRIES = 1000, OPT_SCAN_INTERVAL, OPT_CONNECT_RETRIES, OPT_CONNECT_INTERVAL };

    static const struct option long_opts[] = {
        {"scan-retries", required_argument, nullptr, OPT_SCAN_RETRIES},
        {"scan-interval", required_argument, nullptr, OPT_SCAN_INTERVAL},
        {"connect-retries", required_argument, nullptr, OPT_CONNECT_RETRIES},
        {"connect-interval", required_argument, nullptr, OPT_CONNECT_INTERVAL},
        {"verbose", no_argument, nullptr, 'v'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0}
    };

    AcquisitionConfig config;
    bool verbose = false;

    int opt;
    while ((opt = getopt_long(argc, argv, "vh", long_opts, nullptr)) != -1) {
        bool ok = true;
        switch (opt) {
            case OPT_SCAN_RETRIES:     ok = parse_u8(optarg, config.scan_retries); break;
            case OPT_SCAN_INTERVAL:    ok = parse_u64(optarg, config.scan_interval_ms); break;
            case OPT_CONNECT_RETRIES:  ok = parse_u8(optarg, config.connection_retries); break;
            case OPT_CONNECT_INTERVAL: ok = parse_u64(optarg, config.connection_interval_ms); break;
            case 'v': verbose = true; break;
            case 'h': usage(argv[0]); return 0;
            default:  usage(argv[0]); return 2;
        }
        if (!ok) return 2;
    }

    if (optind >= argc) {
        usage(argv[0]);
        return 2;
    }

    std::vector<std::string> args(argv + optind, argv + argc);

    if (args[0] == "effects") {
        for (const auto& entry : EFFECT_TABLE) {
            std::cout << "  0x" << std::hex << static_cast<int>(entry.effect) << std::dec
                      << "  " << entry.name << "\n";
        }
        return 0;
    }

    Command cmd;
    if (!parse_command(args, cmd)) {
        return 2;
    }

    bluez::HciManager manager;
    auto builder = BledomDevice::builder(manager);
    builder.config(config);
    if (verbose) {
        builder.set_log_callback([](const std::string& msg) { std::cerr << msg << std::endl; });
    }

    auto built = builder.build();
    if (!built.ok()) {
        std::cerr << "[FAIL] " << built.describe() << std::endl;
        return 1;
    }

    BledomDevice& device = built.value();
    auto result = run(device, cmd);

    auto closed = device.peripheral().disconnect();
    if (!closed.ok()) {
        std::cerr << "[WARN] disconnect: " << closed.describe() << std::endl;
    }

    if (!result.ok()) {
        std::cerr << "[FAIL] " << cmd.name << ": " << result.describe() << std::endl;
        return 1;
    }

    std::cout << "[OK] " << cmd.name << std::endl;
    return 0;
}

#include <iostream>
#include <signal.h>
#include "devices/cavro_pump.hpp"
#include "common/helpers.hpp"

using namespace cavro;

static CavroPump* g_pump = nullptr;
void sig_handler(int) { if (g_pump) g_pump->cancel(); }

static void report(const char* what, const Result<bool>& r)
{
    if (r.ok()) {
        std::cout << "[OK] " << what << "\n";
    } else if (r.error() == Error::DEVICE_ERROR) {
        std::cout << "[FAIL] " << what << ": " << to_string(r.device_status()) << "\n";
    } else {
        std::cout << "[FAIL] " << what << ": " << to_string(r.error()) << "\n";
    }
}

int main(int argc, char* argv[])
{
    CavroPump pump(Address::ADDR_0, SyringeSize::S250);
    g_pump = &pump;
    signal(SIGINT, sig_handler);

    std::string port;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-v") {
            pump.set_log_callback([](const std::string& msg) { std::cerr << msg << "\n"; });
        } else if (arg != "scan") {
            port = arg;
        }
    }

    std::cout << "=== Cavro Pump Test ===" << std::endl;

    auto conn = port.empty() ? pump.connect() : pump.connect_to(port);
    if (!conn.ok()) {
        std::cerr << "Cavro not found (" << to_string(conn.error()) << ")" << std::endl;
        return 1;
    }
    std::cout << "Connected on " << pump.port() << std::endl;

    auto init = pump.initialize();
    if (!init.ok()) {
        std::cout << "[FAIL] Initialize: " << to_string(init.error()) << "\n";
        pump.disconnect();
        return 1;
    }
    std::cout << "[OK] Initialize (" << to_string(init.value()) << ")\n";

    report("Speed 20", pump.set_speed(20));

    for (auto pos : {ValvePosition::POS_1, ValvePosition::POS_2, ValvePosition::POS_3}) {
        auto r = pump.set_valve_position(pos);
        std::string what = "Valve " + std::to_string(static_cast<int>(pos));
        report(what.c_str(), r);
        if (!r.ok() && r.error() == Error::CANCELLED) break;
    }

    auto valve = pump.get_valve_position();
    if (valve.ok()) {
        std::cout << "Valve now at " << static_cast<int>(valve.value()) << "\n";
    }

    report("Plunger to 1500", pump.set_absolute_position(1500));
    report("Plunger to 0", pump.set_absolute_position(0));

    pump.disconnect();
    std::cout << "\n=== Done ===" << std::endl;
    return 0;
}

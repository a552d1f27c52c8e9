/*
 * ============================================================================
 * GCU - ANALOG ACQUISITION TESTS
 * ============================================================================
 *
 * Averaging, scaling, sub-period timing and read errors
 *
 * ============================================================================
 */

#include "gcu_analog_client.hpp"
#include "gcu_errors.hpp"
#include "gcu_shared_store.hpp"
#include "gcu_test_support.hpp"

#include <cassert>
#include <chrono>
#include <cmath>
#include <iostream>
#include <sstream>
#include <thread>

namespace {

gcu::AnalogConfig two_channels(unsigned averages) {
    gcu::AnalogConfig config;
    config.period_s = 1.0;
    config.averages = averages;
    config.channels.push_back({"Generator current", "A", "P9_40", 20.0, 0.5});
    config.channels.push_back({"Bus voltage", "V", "P9_39", 200.0, 0.0});
    return config;
}

} // namespace

bool test_average_published_after_n_samples() {
    std::cout << "Testing averaging over N samples..." << std::flush;

    gcu_test::ManualClock clock;
    gcu_test::CapturingLogger logger;
    gcu::SharedStore store(clock);
    gcu_test::ScriptedAnalogInput adc;
    adc.readings["P9_40"] = {1.0, 2.0, 3.0, 4.0, 0.0, 0.0, 0.0, 0.0};
    adc.fallback["P9_39"] = 1.5;

    gcu::AnalogAcquisition analog(adc, two_channels(4), store, logger, clock);
    assert(store.contains("P9_40"));
    assert(store.contains("P9_39"));

    for (int i = 0; i < 4; ++i) analog.acquire();
    // The mean appears on the sub-tick after the last sample
    assert(!store.get("P9_40").has_value());

    analog.acquire();
    assert(std::fabs(store.get("P9_40").value() - (2.5 * 20.0 + 0.5)) < 1e-9);
    assert(std::fabs(store.get("P9_39").value() - 300.0) < 1e-9);

    // Next window starts fresh with the fifth sample
    for (int i = 0; i < 4; ++i) analog.acquire();
    assert(std::fabs(store.get("P9_40").value() - 0.5) < 1e-9);

    std::cout << " PASS\n";
    return true;
}

bool test_read_error_is_logged() {
    std::cout << "Testing ADC read errors..." << std::flush;

    gcu_test::ManualClock clock;
    gcu_test::CapturingLogger logger;
    gcu::SharedStore store(clock);
    gcu_test::ScriptedAnalogInput adc;
    adc.fallback["P9_39"] = 1.0;   // P9_40 unreadable

    gcu::AnalogAcquisition analog(adc, two_channels(2), store, logger, clock);
    for (int i = 0; i < 3; ++i) analog.acquire();

    assert(logger.contains("ADC reading error on P9_40"));
    assert(!store.get("P9_40").has_value());
    // The other channel is unaffected
    assert(store.get("P9_39").value() == 200.0);

    std::cout << " PASS\n";
    return true;
}

bool test_zero_averages_rejected() {
    std::cout << "Testing zero averages is rejected..." << std::flush;

    gcu_test::ManualClock clock;
    gcu_test::CapturingLogger logger;
    gcu::SharedStore store(clock);
    gcu_test::ScriptedAnalogInput adc;

    bool rejected = false;
    try {
        gcu::AnalogAcquisition analog(adc, two_channels(0), store, logger, clock);
    } catch (const gcu::ConfigError& e) {
        rejected = std::string(e.what()) == "Cannot average 0 values";
    }
    assert(rejected);

    std::cout << " PASS\n";
    return true;
}

bool test_sub_period_timing() {
    std::cout << "Testing sub-period pacing..." << std::flush;

    gcu_test::ManualClock clock;
    gcu_test::CapturingLogger logger;
    gcu::SharedStore store(clock);
    gcu_test::ScriptedAnalogInput adc;
    adc.fallback["P9_40"] = 1.0;
    adc.fallback["P9_39"] = 1.0;

    gcu::AnalogAcquisition analog(adc, two_channels(10), store, logger, clock);
    analog.start();

    // Clock frozen: no sample is due yet
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    assert(adc.reads.load() == 0);

    // One sub-period (0.1 s) later: exactly one pass over both channels
    clock.advance(0.1);
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (adc.reads.load() < 2 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    assert(adc.reads.load() == 2);

    analog.stop();

    std::cout << " PASS\n";
    return true;
}

bool test_csv_and_status() {
    std::cout << "Testing CSV columns and status..." << std::flush;

    gcu_test::ManualClock clock;
    gcu_test::CapturingLogger logger;
    gcu::SharedStore store(clock);
    gcu_test::ScriptedAnalogInput adc;
    adc.fallback["P9_40"] = 1.0;
    adc.fallback["P9_39"] = 1.0;

    gcu::AnalogAcquisition analog(adc, two_channels(1), store, logger, clock);
    assert(analog.csv_header() == "Generator current,Bus voltage");
    assert(analog.csv_line(store.snapshot()) == ",");

    analog.acquire();
    analog.acquire();
    assert(analog.csv_line(store.snapshot()) == "20.5,200");

    std::ostringstream out;
    analog.print_data(out, store.snapshot());
    assert(out.str().find("Generator current") != std::string::npos);
    assert(out.str().find("20.50") != std::string::npos);

    std::cout << " PASS\n";
    return true;
}

int main() {
    std::cout << "============================================================================\n";
    std::cout << "GCU ANALOG ACQUISITION TESTS\n";
    std::cout << "============================================================================\n\n";

    try {
        bool all_passed = true;

        all_passed &= test_average_published_after_n_samples();
        all_passed &= test_read_error_is_logged();
        all_passed &= test_zero_averages_rejected();
        all_passed &= test_sub_period_timing();
        all_passed &= test_csv_and_status();

        std::cout << "\n============================================================================\n";
        if (all_passed) {
            std::cout << "✓ All analog tests PASSED\n";
        } else {
            std::cout << "✗ Some tests FAILED\n";
            return 1;
        }
        std::cout << "============================================================================\n";

    } catch (const std::exception& e) {
        std::cerr << "\n❌ Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}

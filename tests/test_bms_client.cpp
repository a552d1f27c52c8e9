/*
 * ============================================================================
 * GCU - BMS TESTS
 * ============================================================================
 *
 * Fletcher checksum, report parsing and the serial BMS client
 *
 * ============================================================================
 */

#include "gcu_bms_client.hpp"
#include "gcu_bms_protocol.hpp"
#include "gcu_errors.hpp"
#include "gcu_line_queue.hpp"
#include "gcu_shared_store.hpp"
#include "gcu_test_support.hpp"

#include <cassert>
#include <chrono>
#include <cmath>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>

namespace {

bool near(double a, double b) {
    return std::fabs(a - b) < 1e-9;
}

} // namespace

bool test_fletcher16_vectors() {
    std::cout << "Testing Fletcher-16 vectors..." << std::flush;

    assert(gcu::bms::fletcher16("abcde") == 0xF0C8);
    assert(gcu::bms::fletcher16("abcdef") == 0x5720);
    assert(gcu::bms::fletcher16("abcdefgh") == 0x2706);
    assert(gcu::bms::fletcher16("") == 0x0000);

    std::cout << " PASS\n";
    return true;
}

bool test_checksum_validation() {
    std::cout << "Testing frame checksum..." << std::flush;

    const std::string line = gcu::bms::strip_line_ending(gcu_test::bms_status_line(85, 24, 302450, -125));
    assert(line.size() == gcu::bms::FRAME_SIZE);
    assert(gcu::bms::checksum_ok(line));

    std::string corrupted = line;
    corrupted[30] = corrupted[30] == '1' ? '2' : '1';
    assert(!gcu::bms::checksum_ok(corrupted));

    assert(!gcu::bms::checksum_ok(line.substr(0, 100)));

    std::string bad_hex = line;
    bad_hex[gcu::bms::PAYLOAD_SIZE] = 'G';
    assert(!gcu::bms::checksum_ok(bad_hex));

    std::cout << " PASS\n";
    return true;
}

bool test_string_status_report() {
    std::cout << "Testing string status report..." << std::flush;

    gcu::bms::BmsStatus status;
    assert(!status.soc.has_value());

    const std::string line = gcu::bms::strip_line_ending(
        gcu_test::bms_status_line(85, 24, 302450, -125, "80008001"));
    assert(status.update(line) == 'S');

    assert(status.state.value() == 'N');
    assert(status.soc.value() == 85);
    assert(status.temperature.value() == 24);
    assert(near(status.voltage.value(), 302.45));
    assert(near(status.current.value(), -12.5));
    assert(status.watt_hours_to_full_discharge.value() == 12000);
    assert(status.watt_hours_to_full_charge.value() == 3000);
    assert(near(status.min_cell_voltage.value(), 3.301));
    assert(near(status.max_cell_voltage.value(), 3.342));
    assert(status.front_power_connector_temperature.value() == 31);

    assert(status.temperature_warning());
    assert(!status.temperature_fault());
    assert(status.bms_selfcheck_warning());
    assert(status.string_contactor_or_fet_on());

    std::cout << " PASS\n";
    return true;
}

bool test_module_insert_then_update() {
    std::cout << "Testing module insert then update..." << std::flush;

    gcu::bms::BmsStatus status;
    const auto first = gcu::bms::strip_line_ending(gcu_test::bms_module_line(3, 90, 49875));
    assert(status.update(first) == 'M');
    assert(status.modules.size() == 1);
    assert(status.modules.at(3).soc == 90);
    assert(near(status.modules.at(3).module_voltage, 49.875));
    assert(near(status.modules.at(3).current, -1.5));
    assert(status.modules.at(3).max_front_power_connector_temp == 28);

    const auto second = gcu::bms::strip_line_ending(gcu_test::bms_module_line(3, 91, 49900, "01000004"));
    status.update(second);
    assert(status.modules.size() == 1);
    const auto& module = status.modules.at(3);
    assert(module.id == 3);
    assert(module.soc == 91);
    assert(module.cell_balancing(0));
    assert(!module.cell_balancing(1));
    assert(module.high_current_warning());

    status.update(gcu::bms::strip_line_ending(gcu_test::bms_module_line(4, 70, 48000)));
    assert(status.modules.size() == 2);
    // String status is untouched by module reports
    assert(!status.soc.has_value());

    std::cout << " PASS\n";
    return true;
}

bool test_bad_field_leaves_record_untouched() {
    std::cout << "Testing malformed reports are rejected..." << std::flush;

    gcu::bms::BmsStatus status;
    status.update(gcu::bms::strip_line_ending(gcu_test::bms_status_line(85, 24, 302450, -125)));

    std::string payload = gcu_test::bms_payload('S');
    payload[17] = 'N';
    gcu_test::put_field(payload, 22, "xx");
    const std::string bad = gcu::bms::strip_line_ending(gcu_test::bms_frame(payload));
    assert(gcu::bms::checksum_ok(bad));

    bool rejected = false;
    try {
        status.update(bad);
    } catch (const gcu::ProtocolError&) {
        rejected = true;
    }
    assert(rejected);
    assert(status.soc.value() == 85);

    bool unknown = false;
    try {
        status.update(gcu::bms::strip_line_ending(gcu_test::bms_frame(gcu_test::bms_payload('Q'))));
    } catch (const gcu::ProtocolError& e) {
        unknown = std::string(e.what()).find("'Q'") != std::string::npos;
    }
    assert(unknown);

    std::cout << " PASS\n";
    return true;
}

bool test_client_publishes_status() {
    std::cout << "Testing client publishes status keys..." << std::flush;

    gcu_test::ManualClock clock;
    gcu_test::CapturingLogger logger;
    gcu::SharedStore store(clock);
    gcu::LineQueue archive(10);
    gcu_test::ScriptedLineSource source;
    gcu::BmsClient client(source, &archive, store, logger, clock);

    assert(store.contains(gcu::bms_keys::SOC));
    assert(client.csv_header() == "SoC (%),BMS Voltage,Current (A)");
    assert(client.csv_line(store.snapshot()) == ",,");

    assert(client.handle_line(gcu_test::bms_module_line(1, 90, 49875)));
    assert(!store.get(gcu::bms_keys::SOC).has_value());

    assert(client.handle_line(gcu_test::bms_status_line(85, 24, 302450, -125)));
    assert(store.get(gcu::bms_keys::SOC).value() == 85.0);
    assert(near(store.get(gcu::bms_keys::VOLTAGE).value(), 302.45));
    assert(near(store.get(gcu::bms_keys::CURRENT).value(), -12.5));
    assert(store.get(gcu::bms_keys::TEMPERATURE).value() == 24.0);

    assert(client.csv_line(store.snapshot()) == "85,302.450000,-12.5");
    assert(client.status().modules.size() == 1);

    std::ostringstream out;
    client.print_data(out, store.snapshot());
    assert(out.str().find("State of Charge") != std::string::npos);
    assert(out.str().find("302.45") != std::string::npos);

    std::cout << " PASS\n";
    return true;
}

bool test_client_archives_raw_lines() {
    std::cout << "Testing raw line archive..." << std::flush;

    gcu_test::ManualClock clock;
    gcu_test::CapturingLogger logger;
    gcu::SharedStore store(clock);
    gcu::LineQueue archive(1);
    gcu_test::ScriptedLineSource source;
    gcu::BmsClient client(source, &archive, store, logger, clock);

    const std::string raw = gcu_test::bms_status_line(85, 24, 302450, -125);
    assert(client.handle_line(raw));
    const std::string archived = archive.try_pop().value();
    // "YYYY-MM-DD HH:MM:SS,<frame>"
    assert(archived.size() == 20 + gcu::bms::FRAME_SIZE);
    assert(archived[4] == '-' && archived[13] == ':' && archived[19] == ',');
    assert(archived.substr(20) == gcu::bms::strip_line_ending(raw));

    // A full archive drops the raw line but the report is still applied
    assert(archive.push("placeholder"));
    assert(client.handle_line(gcu_test::bms_status_line(80, 24, 302000, 10)));
    assert(store.get(gcu::bms_keys::SOC).value() == 80.0);
    assert(logger.contains("Archive queue full"));

    std::cout << " PASS\n";
    return true;
}

bool test_client_drops_bad_checksum() {
    std::cout << "Testing bad checksum is dropped..." << std::flush;

    gcu_test::ManualClock clock;
    gcu_test::CapturingLogger logger;
    gcu::SharedStore store(clock);
    gcu::LineQueue archive(10);
    gcu_test::ScriptedLineSource source;
    gcu::BmsClient client(source, &archive, store, logger, clock);

    std::string line = gcu_test::bms_status_line(85, 24, 302450, -125);
    line[20] = '9';
    assert(!client.handle_line(line));
    assert(archive.empty());
    assert(!store.get(gcu::bms_keys::SOC).has_value());
    assert(!client.handle_line("garbage\n"));

    std::cout << " PASS\n";
    return true;
}

bool test_client_thread_survives_disconnect() {
    std::cout << "Testing client survives an unplugged device..." << std::flush;

    gcu_test::ManualClock clock;
    gcu_test::CapturingLogger logger;
    gcu::SharedStore store(clock);
    gcu_test::ScriptedLineSource source;
    source.lines.push_back(gcu_test::bms_status_line(85, 24, 302450, -125));
    gcu::BmsClient client(source, nullptr, store, logger, clock);

    client.start();
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (!store.get(gcu::bms_keys::SOC).has_value() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    assert(store.get(gcu::bms_keys::SOC).value() == 85.0);

    source.disconnected = true;
    while (!logger.contains("BMS not connected") && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    assert(logger.contains("BMS not connected"));
    assert(client.alive());
    client.stop();
    assert(!client.alive());

    std::cout << " PASS\n";
    return true;
}

int main() {
    std::cout << "============================================================================\n";
    std::cout << "GCU BMS TESTS\n";
    std::cout << "============================================================================\n\n";

    try {
        bool all_passed = true;

        all_passed &= test_fletcher16_vectors();
        all_passed &= test_checksum_validation();
        all_passed &= test_string_status_report();
        all_passed &= test_module_insert_then_update();
        all_passed &= test_bad_field_leaves_record_untouched();
        all_passed &= test_client_publishes_status();
        all_passed &= test_client_archives_raw_lines();
        all_passed &= test_client_drops_bad_checksum();
        all_passed &= test_client_thread_survives_disconnect();

        std::cout << "\n============================================================================\n";
        if (all_passed) {
            std::cout << "✓ All BMS tests PASSED\n";
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

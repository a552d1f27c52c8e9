/*
 * ============================================================================
 * GCU - SCHEDULER TESTS
 * ============================================================================
 *
 * Tier timing, interlocks, telemetry rows, USB handling, liveness and
 * shutdown, driven tick by tick with a manual clock
 *
 * ============================================================================
 */

#include "gcu_data_source.hpp"
#include "gcu_errors.hpp"
#include "gcu_line_queue.hpp"
#include "gcu_pid_controller.hpp"
#include "gcu_scheduler.hpp"
#include "gcu_shared_store.hpp"
#include "gcu_worker.hpp"
#include "gcu_test_support.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <cmath>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace {

class FakeSource final : public gcu::IDataSource {
public:
    FakeSource(std::string header, std::string line)
        : header_(std::move(header)), line_(std::move(line)) {}

    std::string csv_header() const override { return header_; }

    std::string csv_line(const gcu::SharedStore::Snapshot&) override {
        ++lines;
        return line_;
    }

    void print_data(std::ostream& out, const gcu::SharedStore::Snapshot&) const override {
        ++prints;
        out << "fake status\n";
    }

    int lines = 0;
    mutable int prints = 0;

private:
    std::string header_;
    std::string line_;
};

// Records the order in which workers observe cancellation
class OrderWorker final : public gcu::Worker {
public:
    OrderWorker(std::string name, gcu::ILogger& logger, std::vector<std::string>& order,
                std::mutex& order_mutex, std::atomic<int>& waiting)
        : Worker(std::move(name), logger, 0.0),
          order_(order), order_mutex_(order_mutex), waiting_(waiting) {}

    ~OrderWorker() override {
        stop();
    }

protected:
    void poll_once() override {
        ++waiting_;
        if (!wait_for(30.0)) {
            std::lock_guard<std::mutex> lock(order_mutex_);
            order_.push_back(name());
        }
    }

private:
    std::vector<std::string>& order_;
    std::mutex& order_mutex_;
    std::atomic<int>& waiting_;
};

// Everything a scheduler needs, with the generator current present
struct Rig {
    gcu_test::ManualClock clock;
    gcu_test::CapturingLogger logger;
    gcu::SharedStore store{clock};
    gcu_test::RecordingActuator actuator;
    gcu::PidController pid{actuator, gcu::PidConfig{}, logger, clock};

    Rig() {
        store.set("P9_40", 10.0);
    }
};

} // namespace

bool test_kill_switch_debounce() {
    std::cout << "Testing kill switch debounce..." << std::flush;

    gcu::KillSwitch kill(true, 2);
    assert(!kill.sample(true));
    assert(!kill.sample(false));   // resets the count
    assert(!kill.sample(true));
    assert(!kill.sample(std::nullopt));  // unreadable counts as inactive
    assert(!kill.sample(true));
    assert(kill.sample(true));
    assert(kill.consecutive() == 2);

    gcu::KillSwitch active_low(false, 1);
    assert(!active_low.sample(true));
    assert(active_low.sample(false));

    std::cout << " PASS\n";
    return true;
}

bool test_kill_switch_stops_and_powers_off() {
    std::cout << "Testing kill switch shutdown..." << std::flush;

    Rig rig;
    gcu_test::ScriptedDigitalInput kill;
    gcu_test::CountingPowerControl power;
    kill.level = true;

    gcu::SchedulerConfig config;
    config.power_off_enabled = true;
    gcu::SchedulerPeripherals io;
    io.kill_switch = &kill;
    io.power = &power;
    gcu::Scheduler scheduler(config, rig.store, rig.pid, io, rig.logger, rig.clock);

    assert(scheduler.tick());
    assert(!scheduler.stop_requested());

    rig.clock.advance(1.0);
    assert(!scheduler.tick());
    assert(scheduler.kill_triggered());
    assert(scheduler.exit_code() == gcu::EXIT_CODE_OK);

    scheduler.shutdown();
    scheduler.shutdown();  // idempotent
    assert(power.power_offs == 1);

    std::cout << " PASS\n";
    return true;
}

bool test_unreadable_kill_switch_never_triggers() {
    std::cout << "Testing unreadable kill switch..." << std::flush;

    Rig rig;
    gcu_test::ScriptedDigitalInput kill;
    kill.level = true;
    kill.unreadable = true;

    gcu::SchedulerPeripherals io;
    io.kill_switch = &kill;
    gcu::Scheduler scheduler(gcu::SchedulerConfig{}, rig.store, rig.pid, io, rig.logger, rig.clock);

    for (int i = 0; i < 5; ++i) {
        assert(scheduler.tick());
        rig.clock.advance(1.0);
    }
    assert(kill.reads == 5);
    assert(rig.logger.contains("Kill switch unreadable"));

    std::cout << " PASS\n";
    return true;
}

bool test_signal_stop_skips_power_off() {
    std::cout << "Testing interrupted exit..." << std::flush;

    Rig rig;
    gcu_test::CountingPowerControl power;
    gcu::SchedulerConfig config;
    config.power_off_enabled = true;
    gcu::SchedulerPeripherals io;
    io.power = &power;
    gcu::Scheduler scheduler(config, rig.store, rig.pid, io, rig.logger, rig.clock);

    scheduler.request_stop(gcu::EXIT_CODE_INTERRUPTED);
    scheduler.request_stop(gcu::EXIT_CODE_FAILURE);  // first request wins
    assert(scheduler.run() == gcu::EXIT_CODE_INTERRUPTED);
    assert(power.power_offs == 0);

    std::cout << " PASS\n";
    return true;
}

bool test_enable_interlock() {
    std::cout << "Testing PID enable interlock..." << std::flush;

    Rig rig;
    gcu::Scheduler scheduler(gcu::SchedulerConfig{}, rig.store, rig.pid, gcu::SchedulerPeripherals{},
                             rig.logger, rig.clock);

    // Absent enable keeps the controller in manual
    scheduler.tick();
    assert(!rig.pid.in_auto());

    rig.store.set(gcu::register_key(gcu::registers::ENABLE_RPM_CONTROL), 1.0);
    rig.clock.advance(0.6);
    scheduler.tick();
    assert(rig.pid.in_auto());

    rig.pid.set_output(40.0);
    rig.store.set(gcu::register_key(gcu::registers::ENABLE_RPM_CONTROL), 0.0);
    rig.clock.advance(0.6);
    scheduler.tick();
    assert(!rig.pid.in_auto());
    assert(rig.pid.output() == 0.0);

    std::cout << " PASS\n";
    return true;
}

bool test_generator_current_feeds_pid() {
    std::cout << "Testing generator current feeds the PID..." << std::flush;

    Rig rig;
    gcu::Scheduler scheduler(gcu::SchedulerConfig{}, rig.store, rig.pid, gcu::SchedulerPeripherals{},
                             rig.logger, rig.clock);

    rig.store.set("P9_40", 18.5);
    scheduler.tick();
    assert(rig.pid.process_variable() == 18.5);

    // An absent reading keeps the last process variable
    rig.store.set("P9_40", std::nullopt);
    rig.clock.advance(0.15);
    scheduler.tick();
    assert(rig.pid.process_variable() == 18.5);
    assert(!rig.pid.cancelled());

    std::cout << " PASS\n";
    return true;
}

bool test_unmeasured_current_cancels_pid() {
    std::cout << "Testing unmeasured current stops the PID..." << std::flush;

    gcu_test::ManualClock clock;
    gcu_test::CapturingLogger logger;
    gcu::SharedStore store(clock);
    gcu_test::RecordingActuator actuator;
    gcu::PidController pid(actuator, gcu::PidConfig{}, logger, clock);

    gcu::Scheduler scheduler(gcu::SchedulerConfig{}, store, pid, gcu::SchedulerPeripherals{}, logger, clock);
    scheduler.tick();
    assert(pid.cancelled());
    assert(logger.contains("Generator current is not being measured."));
    assert(logger.count(gcu::LogLevel::CRITICAL) == 1);

    // Reported once
    clock.advance(0.15);
    scheduler.tick();
    assert(logger.count(gcu::LogLevel::CRITICAL) == 1);

    std::cout << " PASS\n";
    return true;
}

bool test_telemetry_rows() {
    std::cout << "Testing telemetry CSV rows..." << std::flush;

    Rig rig;
    gcu::LineQueue telemetry(100);
    FakeSource first("a,b", "1,2");
    FakeSource second("c", "3");

    gcu::SchedulerPeripherals io;
    io.telemetry = &telemetry;
    gcu::Scheduler scheduler(gcu::SchedulerConfig{}, rig.store, rig.pid, io, rig.logger, rig.clock);
    scheduler.add_source(first);
    scheduler.add_source(second);

    assert(scheduler.csv_header() == "linuxtime,a,b,c");

    scheduler.tick();
    assert(telemetry.try_pop().value() == "1500000000,1,2,3");

    rig.clock.advance(0.25);
    scheduler.tick();
    assert(telemetry.try_pop().value() == "1500000000.25,1,2,3");
    assert(telemetry.empty());

    // Detached telemetry: no more rows
    scheduler.set_telemetry(nullptr);
    rig.clock.advance(0.15);
    scheduler.tick();
    assert(telemetry.empty());

    std::cout << " PASS\n";
    return true;
}

bool test_full_telemetry_queue_is_fatal() {
    std::cout << "Testing full telemetry queue exits..." << std::flush;

    Rig rig;
    gcu::LineQueue telemetry(1);
    gcu::SchedulerPeripherals io;
    io.telemetry = &telemetry;
    gcu::Scheduler scheduler(gcu::SchedulerConfig{}, rig.store, rig.pid, io, rig.logger, rig.clock);

    assert(scheduler.tick());
    rig.clock.advance(0.15);
    assert(!scheduler.tick());
    assert(scheduler.exit_code() == gcu::EXIT_CODE_FAILURE);
    assert(rig.logger.contains("File writer queue full. Exiting."));
    assert(!scheduler.kill_triggered());

    std::cout << " PASS\n";
    return true;
}

bool test_tier_timing() {
    std::cout << "Testing tier periods..." << std::flush;

    Rig rig;
    gcu::LineQueue telemetry(1000);
    FakeSource source("x", "1");
    std::ostringstream console;
    gcu_test::CountingWatchdog watchdog;

    gcu::SchedulerConfig config;
    config.watchdog = true;
    gcu::SchedulerPeripherals io;
    io.telemetry = &telemetry;
    io.console = &console;
    io.watchdog = &watchdog;
    gcu::Scheduler scheduler(config, rig.store, rig.pid, io, rig.logger, rig.clock);
    scheduler.add_source(source);

    // Every tier runs on the first tick
    scheduler.tick();
    assert(source.lines == 1);
    assert(source.prints == 1);
    assert(watchdog.kicks == 1);
    assert(console.str().find(std::string(80, '-')) != std::string::npos);

    rig.clock.advance(0.05);
    scheduler.tick();
    assert(source.lines == 1);

    rig.clock.advance(0.06);
    scheduler.tick();
    assert(source.lines == 2);
    assert(source.prints == 1);

    // A late tick runs a tier once instead of catching up
    rig.clock.advance(0.45);
    scheduler.tick();
    assert(source.lines == 3);

    rig.clock.advance(0.5);
    scheduler.tick();
    assert(source.prints == 2);
    assert(watchdog.kicks == 1);

    rig.clock.advance(4.0);
    scheduler.tick();
    assert(watchdog.kicks == 2);

    std::cout << " PASS\n";
    return true;
}

bool test_daemon_mode_is_quiet() {
    std::cout << "Testing daemon mode prints nothing..." << std::flush;

    Rig rig;
    FakeSource source("x", "1");
    std::ostringstream console;
    gcu::SchedulerConfig config;
    config.daemon = true;
    gcu::SchedulerPeripherals io;
    io.console = &console;
    gcu::Scheduler scheduler(config, rig.store, rig.pid, io, rig.logger, rig.clock);
    scheduler.add_source(source);

    scheduler.tick();
    assert(source.prints == 0);
    assert(console.str().empty());

    std::cout << " PASS\n";
    return true;
}

bool test_gauges() {
    std::cout << "Testing fuel and battery gauges..." << std::flush;

    Rig rig;
    gcu_test::RecordingGauge fuel;
    gcu_test::RecordingGauge battery;
    gcu::SchedulerPeripherals io;
    io.fuel_gauge = &fuel;
    io.battery_gauge = &battery;
    gcu::Scheduler scheduler(gcu::SchedulerConfig{}, rig.store, rig.pid, io, rig.logger, rig.clock);

    // No readings yet: one bar
    scheduler.tick();
    assert(fuel.levels.back() == 1.0);
    assert(battery.levels.back() == 1.0);

    rig.store.set(gcu::register_key(gcu::registers::FUEL_LEVEL), 80.0);
    rig.store.set(gcu::register_key(gcu::registers::BATTERY_LEVEL), 284.0);
    rig.clock.advance(30.0);
    scheduler.tick();
    assert(fuel.levels.size() == 1);

    rig.clock.advance(31.0);
    scheduler.tick();
    assert(fuel.levels.back() == 8.0);
    assert(battery.levels.back() == 5.0);

    std::cout << " PASS\n";
    return true;
}

bool test_tuning_reload() {
    std::cout << "Testing tuning file reload..." << std::flush;

    const std::string path = "gcu_scheduler_tuning.conf";
    {
        std::ofstream out(path);
        out << "Kp = 0.7\nsetpoint = 31\n";
    }

    Rig rig;
    gcu::SchedulerConfig config;
    config.tuning_file = path;
    gcu::Scheduler scheduler(config, rig.store, rig.pid, gcu::SchedulerPeripherals{}, rig.logger, rig.clock);

    scheduler.tick();
    assert(std::fabs(rig.pid.kp() - 0.7) < 1e-12);
    assert(std::fabs(rig.pid.ki() - 0.4) < 1e-12);  // absent key keeps the running gain
    assert(rig.pid.setpoint() == 31.0);

    {
        std::ofstream out(path);
        out << "Kp = fast\n";
    }
    rig.clock.advance(1.1);
    scheduler.tick();
    assert(rig.logger.contains("Ignoring tuning file"));
    assert(std::fabs(rig.pid.kp() - 0.7) < 1e-12);

    // A deleted file is not an error
    std::remove(path.c_str());
    rig.clock.advance(1.1);
    assert(scheduler.tick());

    std::cout << " PASS\n";
    return true;
}

bool test_usb_mount_and_eject() {
    std::cout << "Testing USB drive reconciliation..." << std::flush;

    Rig rig;
    gcu_test::FakeUsbDrive usb;
    gcu_test::RecordingFileWriterControl writer;
    gcu_test::ScriptedDigitalInput eject;
    eject.level = true;  // released

    gcu::SchedulerPeripherals io;
    io.usb = &usb;
    io.eject_button = &eject;
    gcu::Scheduler scheduler(gcu::SchedulerConfig{}, rig.store, rig.pid, io, rig.logger, rig.clock);
    scheduler.set_file_writer(&writer);

    // Nothing plugged
    scheduler.tick();
    assert(writer.mount_requests.empty());

    // Plugged, not mounted: mount it
    usb.plugged_device = "/dev/sda1";
    rig.clock.advance(5.1);
    scheduler.tick();
    assert(writer.mount_requests.size() == 1);
    assert(writer.mount_requests[0] == "/dev/sda1");

    // Operator presses eject: one request while ejecting
    usb.mounted_device = "/dev/sda1";
    eject.level = false;
    rig.clock.advance(0.6);
    scheduler.tick();
    assert(writer.eject_requests == 1);
    assert(scheduler.ejecting());
    rig.clock.advance(0.6);
    scheduler.tick();
    assert(writer.eject_requests == 1);

    // Unmounted but still plugged while ejecting: no remount
    usb.mounted_device.reset();
    eject.level = true;
    rig.clock.advance(5.1);
    scheduler.tick();
    assert(writer.mount_requests.size() == 1);

    // Removed: clear the safe-to-remove light
    usb.plugged_device.reset();
    rig.clock.advance(5.1);
    scheduler.tick();
    assert(!scheduler.ejecting());
    assert(!writer.safe_flags.empty() && writer.safe_flags.back() == false);

    std::cout << " PASS\n";
    return true;
}

bool test_usb_device_moved() {
    std::cout << "Testing re-enumerated USB drive..." << std::flush;

    Rig rig;
    gcu_test::FakeUsbDrive usb;
    gcu_test::RecordingFileWriterControl writer;
    usb.plugged_device = "/dev/sdb1";
    usb.mounted_device = "/dev/sda1";

    gcu::SchedulerPeripherals io;
    io.usb = &usb;
    io.file_writer = &writer;
    gcu::Scheduler scheduler(gcu::SchedulerConfig{}, rig.store, rig.pid, io, rig.logger, rig.clock);

    scheduler.tick();
    assert(writer.eject_requests == 1);
    assert(writer.mount_requests.empty());
    assert(scheduler.ejecting());

    std::cout << " PASS\n";
    return true;
}

bool test_worker_liveness() {
    std::cout << "Testing worker liveness..." << std::flush;

    std::vector<std::string> order;
    std::mutex order_mutex;
    std::atomic<int> waiting{0};

    {
        Rig rig;
        OrderWorker optional_worker("bms", rig.logger, order, order_mutex, waiting);
        gcu::Scheduler scheduler(gcu::SchedulerConfig{}, rig.store, rig.pid, gcu::SchedulerPeripherals{},
                                 rig.logger, rig.clock);
        scheduler.add_worker(optional_worker, false);  // never started: dead

        assert(scheduler.tick());
        rig.clock.advance(10.1);
        assert(scheduler.tick());
        assert(rig.logger.count_containing("Thread bms is not running") == 1);
    }

    {
        Rig rig;
        OrderWorker mandatory_worker("analog", rig.logger, order, order_mutex, waiting);
        gcu::Scheduler scheduler(gcu::SchedulerConfig{}, rig.store, rig.pid, gcu::SchedulerPeripherals{},
                                 rig.logger, rig.clock);
        scheduler.add_worker(mandatory_worker, true);

        assert(!scheduler.tick());
        assert(scheduler.exit_code() == gcu::EXIT_CODE_FAILURE);
        assert(rig.logger.contains("Missing analog, shutting down"));
    }

    std::cout << " PASS\n";
    return true;
}

bool test_shutdown_order() {
    std::cout << "Testing shutdown in reverse start order..." << std::flush;

    std::vector<std::string> order;
    std::mutex order_mutex;
    std::atomic<int> waiting{0};

    Rig rig;
    OrderWorker a("deepsea", rig.logger, order, order_mutex, waiting);
    OrderWorker b("analog", rig.logger, order, order_mutex, waiting);
    OrderWorker c("filewriter", rig.logger, order, order_mutex, waiting);

    gcu::Scheduler scheduler(gcu::SchedulerConfig{}, rig.store, rig.pid, gcu::SchedulerPeripherals{},
                             rig.logger, rig.clock);
    scheduler.add_worker(a, false);
    scheduler.add_worker(b, true);
    scheduler.add_worker(c, false);
    scheduler.start_workers();

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (waiting.load() < 3 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    assert(waiting.load() == 3);

    // All alive: the liveness tier keeps running
    assert(scheduler.tick());

    scheduler.request_stop(gcu::EXIT_CODE_OK);
    scheduler.shutdown();
    assert(!a.alive() && !b.alive() && !c.alive());

    std::lock_guard<std::mutex> lock(order_mutex);
    assert(order.size() == 3);
    assert(order[0] == "filewriter");
    assert(order[1] == "analog");
    assert(order[2] == "deepsea");

    std::cout << " PASS\n";
    return true;
}

int main() {
    std::cout << "============================================================================\n";
    std::cout << "GCU SCHEDULER TESTS\n";
    std::cout << "============================================================================\n\n";

    try {
        bool all_passed = true;

        all_passed &= test_kill_switch_debounce();
        all_passed &= test_kill_switch_stops_and_powers_off();
        all_passed &= test_unreadable_kill_switch_never_triggers();
        all_passed &= test_signal_stop_skips_power_off();
        all_passed &= test_enable_interlock();
        all_passed &= test_generator_current_feeds_pid();
        all_passed &= test_unmeasured_current_cancels_pid();
        all_passed &= test_telemetry_rows();
        all_passed &= test_full_telemetry_queue_is_fatal();
        all_passed &= test_tier_timing();
        all_passed &= test_daemon_mode_is_quiet();
        all_passed &= test_gauges();
        all_passed &= test_tuning_reload();
        all_passed &= test_usb_mount_and_eject();
        all_passed &= test_usb_device_moved();
        all_passed &= test_worker_liveness();
        all_passed &= test_shutdown_order();

        std::cout << "\n============================================================================\n";
        if (all_passed) {
            std::cout << "✓ All scheduler tests PASSED\n";
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

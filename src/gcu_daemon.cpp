/*
 * ============================================================================
 * GCU DAEMON
 * ============================================================================
 *
 * Wires the configured components to the BeagleBone adapters and runs the
 * scheduler on the main thread:
 *
 *   deepsea   Modbus RTU/TCP register client (optional)
 *   bms       serial BMS client (optional)
 *   analog    ADC acquisition (mandatory)
 *   woodward  PID speed controller driving the PWM output (mandatory)
 *   filewriter CSV / raw BMS logging (optional)
 *
 * SIGINT and SIGTERM stop the loop with exit code 130.
 *
 * LICENSE: MIT
 * ============================================================================
 */

#include "gcu_analog_client.hpp"
#include "gcu_bms_client.hpp"
#include "gcu_daemon_config.hpp"
#include "gcu_file_writer.hpp"
#include "gcu_interfaces.hpp"
#include "gcu_line_queue.hpp"
#include "gcu_logging.hpp"
#include "gcu_measurement.hpp"
#include "gcu_pid_controller.hpp"
#include "gcu_register_client.hpp"
#include "gcu_scheduler.hpp"
#include "gcu_shared_store.hpp"
#include "gcu_linux_adapters.hpp"

#include <atomic>
#include <csignal>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

namespace {

std::atomic<gcu::Scheduler*> g_scheduler{nullptr};

extern "C" void handle_stop_signal(int) {
    gcu::Scheduler* scheduler = g_scheduler.load();
    if (scheduler != nullptr) {
        scheduler->request_stop(gcu::EXIT_CODE_INTERRUPTED);
    }
}

void install_signal_handlers() {
    struct sigaction action{};
    action.sa_handler = handle_stop_signal;
    sigemptyset(&action.sa_mask);
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);
}

// Everything the daemon builds; members are destroyed in reverse order so
// workers stop before the adapters they use
struct Components {
    std::unique_ptr<gcu::IRegisterTransport> deepsea_transport;
    std::unique_ptr<gcu::RegisterClient> deepsea;

    std::unique_ptr<gcu_plugin::SerialPort> bms_port;
    std::unique_ptr<gcu_plugin::SerialLineSource> bms_lines;
    std::unique_ptr<gcu::BmsClient> bms;

    std::unique_ptr<gcu_plugin::SysfsAdc> adc;
    std::unique_ptr<gcu::AnalogAcquisition> analog;

    std::unique_ptr<gcu_plugin::SysfsPwm> pwm;
    std::unique_ptr<gcu::PidController> pid;

    std::unique_ptr<gcu_plugin::SysfsGpioOutput> safe_led;
    std::unique_ptr<gcu::CsvFileWriter> filewriter;
};

void report_component_error(gcu::ILogger& logger, const std::string& component,
                            const std::string& message) {
    if (gcu::is_mandatory_component(component)) {
        logger.critical("main", "Cannot start " + component + ": " + message);
    } else {
        logger.error("main", "Running without " + component + ": " + message);
    }
}

} // namespace

int main(int argc, char** argv) {
    gcu::StreamLogger console_log(std::cerr, gcu::LogLevel::INFO);
    gcu::TeeLogger logger;
    logger.add(console_log);

    gcu::CommandLine cli;
    try {
        cli = gcu::CommandLine::parse(argc, argv);
    } catch (const gcu::ConfigError& e) {
        std::cerr << e.what() << "\n";
        gcu::CommandLine::print_usage(std::cerr, argv[0]);
        return gcu::EXIT_CODE_FAILURE;
    }
    if (cli.help) {
        gcu::CommandLine::print_usage(std::cout, argv[0]);
        return gcu::EXIT_CODE_OK;
    }

    /* ===================== CONFIGURATION ===================== */

    gcu::KeyValueConfig kv;
    std::optional<gcu::PidTuning> tuning;
    gcu::GcuConfig config;
    try {
        kv = gcu::KeyValueConfig::load_file(cli.config_file);
        tuning = gcu::load_tuning_file(cli.tuning_file);
        config = gcu::GcuConfig::from_key_values(kv, tuning);
    } catch (const gcu::ConfigError& e) {
        logger.critical("main", e.what());
        return gcu::EXIT_CODE_FAILURE;
    }

    // Warnings and worse also go to a file that survives the console
    std::ofstream error_file(kv.get_string("main.error_log", "/var/log/gcu/error.log"),
                             std::ios::out | std::ios::app);
    gcu::StreamLogger error_log(error_file, gcu::LogLevel::WARNING);
    if (error_file) {
        logger.add(error_log);
    } else {
        logger.warning("main", "Cannot open error log, logging to console only");
    }

    config.scheduler.daemon = cli.daemon;
    config.scheduler.watchdog = cli.watchdog;
    config.scheduler.power_off_enabled = cli.power_off;
    config.scheduler.tuning_file = cli.tuning_file;

    for (const auto& e : config.errors) {
        report_component_error(logger, e.first, e.second);
        if (gcu::is_mandatory_component(e.first)) return gcu::EXIT_CODE_FAILURE;
    }
    for (const char* required : {"analog", "woodward"}) {
        if (!config.is_enabled(required)) {
            logger.critical("main", std::string("Component ") + required + " must be enabled");
            return gcu::EXIT_CODE_FAILURE;
        }
    }

    /* ===================== COMPONENTS ===================== */

    gcu::SteadyTimeSource clock;
    gcu::SharedStore store(clock);
    gcu::LineQueue telemetry(config.telemetry_queue_size);
    gcu::LineQueue bms_archive(config.bms_queue_size);
    const bool logging_enabled = config.filewriter.has_value();

    Components c;

    if (config.deepsea) {
        const auto& dc = *config.deepsea;
        try {
            gcu::MeasurementList list = gcu::read_measurement_description(dc.mlistfile);
            if (dc.mode == "rtu") {
                c.deepsea_transport = std::make_unique<gcu_plugin::ModbusRtuTransport>(dc.dev, dc.baudrate);
            } else {
                c.deepsea_transport = std::make_unique<gcu_plugin::ModbusTcpTransport>(
                    dc.host, dc.port, dc.tcp_timeout_s);
            }
            c.deepsea = std::make_unique<gcu::RegisterClient>(
                *c.deepsea_transport, static_cast<uint8_t>(dc.unit_id), std::move(list),
                store, logger, clock);
            c.deepsea->watch_measurement_file(dc.mlistfile);
        } catch (const gcu::Error& e) {
            report_component_error(logger, "deepsea", e.what());
        }
    }

    if (config.bms) {
        const auto& bc = *config.bms;
        try {
            c.bms_port = std::make_unique<gcu_plugin::SerialPort>(bc.dev, bc.baudrate);
            c.bms_lines = std::make_unique<gcu_plugin::SerialLineSource>(*c.bms_port, bc.line_timeout_s);
            c.bms = std::make_unique<gcu::BmsClient>(
                *c.bms_lines, logging_enabled ? &bms_archive : nullptr, store, logger, clock);
        } catch (const gcu::Error& e) {
            report_component_error(logger, "bms", e.what());
        }
    }

    try {
        c.adc = std::make_unique<gcu_plugin::SysfsAdc>(config.iio_device);
        c.analog = std::make_unique<gcu::AnalogAcquisition>(*c.adc, *config.analog, store, logger, clock);
    } catch (const gcu::Error& e) {
        report_component_error(logger, "analog", e.what());
        return gcu::EXIT_CODE_FAILURE;
    }

    try {
        const auto& pc = *config.woodward;
        c.pwm = std::make_unique<gcu_plugin::SysfsPwm>(pc.pwm_chip, pc.pwm_channel, pc.pwm_frequency_hz);
        c.pid = std::make_unique<gcu::PidController>(*c.pwm, pc, logger, clock);
    } catch (const gcu::Error& e) {
        report_component_error(logger, "woodward", e.what());
        return gcu::EXIT_CODE_FAILURE;
    }

    if (!c.deepsea && !c.bms && !c.analog) {
        logger.critical("main", "No measurement clients running");
        return gcu::EXIT_CODE_FAILURE;
    }

    /* ===================== PERIPHERALS ===================== */

    std::unique_ptr<gcu_plugin::SysfsGpioInput> kill_switch;
    std::unique_ptr<gcu_plugin::SysfsGpioInput> eject_button;
    try {
        kill_switch = std::make_unique<gcu_plugin::SysfsGpioInput>(config.kill_switch_pin);
    } catch (const gcu::Error& e) {
        logger.error("main", std::string("Kill switch unavailable: ") + e.what());
    }
    if (logging_enabled) {
        try {
            eject_button = std::make_unique<gcu_plugin::SysfsGpioInput>(config.eject_button_pin);
            c.safe_led = std::make_unique<gcu_plugin::SysfsGpioOutput>(config.safe_to_remove_led_pin);
        } catch (const gcu::Error& e) {
            logger.error("main", std::string("USB eject controls unavailable: ") + e.what());
        }
    }

    gcu_plugin::LoggingGauge fuel_gauge("fuel", logger);
    gcu_plugin::LoggingGauge battery_gauge("battery", logger);
    gcu_plugin::DevWatchdog watchdog(config.watchdog_device);
    gcu_plugin::SystemPowerControl power(logger);
    gcu_plugin::LinuxUsbDrive usb(logger);

    gcu::SchedulerPeripherals io;
    io.kill_switch = kill_switch.get();
    io.eject_button = eject_button.get();
    io.fuel_gauge = &fuel_gauge;
    io.battery_gauge = &battery_gauge;
    io.watchdog = &watchdog;
    io.power = &power;
    io.usb = logging_enabled ? &usb : nullptr;
    io.telemetry = logging_enabled ? &telemetry : nullptr;
    io.console = &std::cout;

    /* ===================== SCHEDULER ===================== */

    std::unique_ptr<gcu::Scheduler> scheduler;
    try {
        scheduler = std::make_unique<gcu::Scheduler>(config.scheduler, store, *c.pid, io, logger, clock);
    } catch (const gcu::ConfigError& e) {
        logger.critical("main", e.what());
        return gcu::EXIT_CODE_FAILURE;
    }

    if (c.deepsea) {
        scheduler->add_source(*c.deepsea);
        scheduler->add_worker(*c.deepsea, false);
    }
    if (c.bms) {
        scheduler->add_source(*c.bms);
        scheduler->add_worker(*c.bms, false);
    }
    scheduler->add_source(*c.analog);
    scheduler->add_worker(*c.analog, true);
    scheduler->add_source(*c.pid);
    scheduler->add_worker(*c.pid, true);

    if (logging_enabled) {
        try {
            c.filewriter = std::make_unique<gcu::CsvFileWriter>(
                *config.filewriter, telemetry, &bms_archive, scheduler->csv_header(),
                &usb, c.safe_led.get(), logger);
            scheduler->set_file_writer(c.filewriter.get());
            scheduler->add_worker(*c.filewriter, false);
        } catch (const gcu::Error& e) {
            // Nothing would drain the telemetry queue
            report_component_error(logger, "filewriter", e.what());
            scheduler->set_telemetry(nullptr);
        }
    }

    g_scheduler.store(scheduler.get());
    install_signal_handlers();

    scheduler->start_workers();
    const int code = scheduler->run();

    g_scheduler.store(nullptr);
    logger.info("main", "Exiting with code " + std::to_string(code));
    return code;
}

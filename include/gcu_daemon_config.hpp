#ifndef GCU_DAEMON_CONFIG_HPP
#define GCU_DAEMON_CONFIG_HPP

#include "gcu_analog_client.hpp"
#include "gcu_bms_client.hpp"
#include "gcu_config.hpp"
#include "gcu_errors.hpp"
#include "gcu_file_writer.hpp"
#include "gcu_pid_controller.hpp"
#include "gcu_register_client.hpp"
#include "gcu_scheduler.hpp"

#include <algorithm>
#include <optional>
#include <ostream>
#include <set>
#include <string>
#include <vector>

namespace gcu {

/*
 * ============================================================================
 * DAEMON CONFIGURATION
 * ============================================================================
 * Example:
 *
 *   enabled = deepsea,bms,analog,woodward,filewriter
 *
 *   [deepsea]
 *   mode = rtu
 *   dev = /dev/ttyO2
 *   baudrate = 115200
 *   id = 10
 *   mlistfile = /etc/gcu/mlist.csv
 *
 *   [analog]
 *   period = 1.0
 *   averages = 10
 *   measurement = Generator current,A,P9_40,20.0,0.0
 *
 * Each component section is parsed only when the component is enabled, and
 * a component whose section is invalid is kept as a ConfigError so the
 * daemon can decide whether it may run without it.
 * ============================================================================
 */

inline const std::vector<std::string>& known_components() {
    static const std::vector<std::string> components = {
        "deepsea", "bms", "analog", "woodward", "filewriter",
    };
    return components;
}

// Components the daemon cannot run without
inline bool is_mandatory_component(const std::string& component) {
    return component == "analog" || component == "woodward";
}

struct GcuConfig {
    std::set<std::string> enabled;

    std::optional<RegisterClientConfig> deepsea;
    std::optional<BmsClientConfig> bms;
    std::optional<AnalogConfig> analog;
    std::optional<PidConfig> woodward;
    std::optional<FileWriterConfig> filewriter;

    SchedulerConfig scheduler;

    // Hardware wiring
    std::string kill_switch_pin = "P8_17";
    std::string eject_button_pin = "P8_11";
    std::string safe_to_remove_led_pin = "P8_12";
    std::string iio_device = "/sys/bus/iio/devices/iio:device0";
    std::string watchdog_device = "/dev/watchdog";
    std::size_t telemetry_queue_size = 1000;
    std::size_t bms_queue_size = 1000;

    // Component -> configuration error message
    std::vector<std::pair<std::string, std::string>> errors;

    bool is_enabled(const std::string& component) const {
        return enabled.count(component) != 0;
    }

    std::optional<std::string> error_for(const std::string& component) const {
        for (const auto& e : errors) {
            if (e.first == component) return e.second;
        }
        return std::nullopt;
    }

    static GcuConfig from_key_values(const KeyValueConfig& kv,
                                     const std::optional<PidTuning>& tuning = std::nullopt) {
        GcuConfig c;
        for (const auto& list : kv.get_all("enabled")) {
            for (const auto& name : split(list, ',')) {
                if (name.empty()) continue;
                const auto& known = known_components();
                if (std::find(known.begin(), known.end(), name) == known.end()) {
                    throw ConfigError("Unknown component in enabled list: " + name);
                }
                c.enabled.insert(name);
            }
        }
        if (c.enabled.empty()) {
            throw ConfigError("No components enabled in " + kv.origin());
        }

        c.parse_component("deepsea", [&] { c.deepsea = RegisterClientConfig::from_key_values(kv); });
        c.parse_component("bms", [&] { c.bms = BmsClientConfig::from_key_values(kv); });
        c.parse_component("analog", [&] { c.analog = AnalogConfig::from_key_values(kv); });
        c.parse_component("woodward", [&] { c.woodward = PidConfig::from_key_values(kv, tuning); });
        c.parse_component("filewriter", [&] { c.filewriter = FileWriterConfig::from_key_values(kv); });

        c.scheduler.generator_current_key = kv.get_string("main.current_key", c.scheduler.generator_current_key);
        c.scheduler.kill_active_high = kv.get_bool("main.kill_active_high", c.scheduler.kill_active_high);
        const long debounce = kv.get_int("main.kill_debounce", static_cast<long>(c.scheduler.kill_debounce));
        if (debounce < 1) throw ConfigError("main.kill_debounce must be at least 1");
        c.scheduler.kill_debounce = static_cast<unsigned>(debounce);
        c.scheduler.validate();

        c.kill_switch_pin = kv.get_string("pins.kill_switch", c.kill_switch_pin);
        c.eject_button_pin = kv.get_string("pins.eject_button", c.eject_button_pin);
        c.safe_to_remove_led_pin = kv.get_string("pins.safe_to_remove_led", c.safe_to_remove_led_pin);
        c.iio_device = kv.get_string("analog.iio_device", c.iio_device);
        c.watchdog_device = kv.get_string("main.watchdog_device", c.watchdog_device);

        const long tq = kv.get_int("main.telemetry_queue", static_cast<long>(c.telemetry_queue_size));
        const long bq = kv.get_int("main.bms_queue", static_cast<long>(c.bms_queue_size));
        if (tq <= 0 || bq <= 0) throw ConfigError("Queue sizes must be positive");
        c.telemetry_queue_size = static_cast<std::size_t>(tq);
        c.bms_queue_size = static_cast<std::size_t>(bq);
        return c;
    }

private:
    template <typename Parse>
    void parse_component(const std::string& component, Parse parse) {
        if (!is_enabled(component)) return;
        try {
            parse();
        } catch (const ConfigError& e) {
            errors.emplace_back(component, e.what());
        }
    }
};

/* ================= COMMAND LINE ================= */

struct CommandLine {
    std::string config_file = "/etc/gcu/gcu.conf";
    std::string tuning_file = "/etc/gcu/tuning.conf";
    bool daemon = false;
    bool watchdog = false;
    bool power_off = false;
    bool help = false;

    static CommandLine parse(int argc, const char* const* argv) {
        CommandLine cl;
        for (int i = 1; i < argc; ++i) {
            const std::string arg = argv[i];
            auto value = [&](const std::string& flag) {
                if (i + 1 >= argc) throw ConfigError(flag + " requires a value");
                return std::string(argv[++i]);
            };
            if (arg == "--config" || arg == "-c") {
                cl.config_file = value(arg);
            } else if (arg == "--tuning" || arg == "-t") {
                cl.tuning_file = value(arg);
            } else if (arg == "--daemon" || arg == "-d") {
                cl.daemon = true;
            } else if (arg == "--watchdog" || arg == "-w") {
                cl.watchdog = true;
            } else if (arg == "--power-off" || arg == "-p") {
                cl.power_off = true;
            } else if (arg == "--help" || arg == "-h") {
                cl.help = true;
            } else {
                throw ConfigError("Unknown option: " + arg);
            }
        }
        return cl;
    }

    static void print_usage(std::ostream& out, const std::string& program) {
        out << "Usage: " << program << " [options]\n"
            << "  -c, --config FILE    daemon configuration (default /etc/gcu/gcu.conf)\n"
            << "  -t, --tuning FILE    PID tuning file, re-read every second\n"
            << "  -d, --daemon         no console status output\n"
            << "  -w, --watchdog       kick /dev/watchdog every 5 seconds\n"
            << "  -p, --power-off      power off when the kill switch is set\n"
            << "  -h, --help           show this help\n";
    }
};

} // namespace gcu

#endif // GCU_DAEMON_CONFIG_HPP

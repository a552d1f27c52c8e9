/*
 * ============================================================================
 * GCU SCHEDULER
 * ============================================================================
 *
 * Main-thread control loop. Ticks every 10 ms and runs the tiers that are
 * due:
 *
 *   0.1 s : telemetry CSV row, generator current -> PID process variable
 *   0.5 s : PID enable interlock, USB eject button
 *   1   s : console status, tuning file reload, kill switch debounce
 *   5   s : watchdog kick, USB drive reconciliation
 *   10  s : worker liveness
 *   60  s : fuel and battery gauges
 *
 * A tier that falls behind is rescheduled from now instead of bursting to
 * catch up. An exception in one tier is logged and the loop continues.
 *
 * SHUTDOWN:
 *   workers are cancelled and joined in reverse start order; power-off is
 *   requested only when the kill switch caused the shutdown and power-off
 *   is enabled.
 *
 * EXIT CODES:
 *   0   kill switch / normal stop
 *   1   mandatory worker died, telemetry queue full, startup failure
 *   130 SIGINT / SIGTERM
 *
 * LICENSE: MIT
 * ============================================================================
 */

#ifndef GCU_SCHEDULER_HPP
#define GCU_SCHEDULER_HPP

#include "gcu_data_source.hpp"
#include "gcu_errors.hpp"
#include "gcu_interfaces.hpp"
#include "gcu_line_queue.hpp"
#include "gcu_logging.hpp"
#include "gcu_measurement.hpp"
#include "gcu_pid_controller.hpp"
#include "gcu_shared_store.hpp"
#include "gcu_worker.hpp"

#include <atomic>
#include <chrono>
#include <cmath>
#include <functional>
#include <optional>
#include <ostream>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace gcu {

constexpr int EXIT_CODE_OK = 0;
constexpr int EXIT_CODE_FAILURE = 1;
constexpr int EXIT_CODE_INTERRUPTED = 130;

/* ================= CONFIGURATION ================= */

struct SchedulerConfig {
    MeasurementKey generator_current_key = "P9_40";
    MeasurementKey enable_key = register_key(registers::ENABLE_RPM_CONTROL);
    MeasurementKey fuel_key = register_key(registers::FUEL_LEVEL);
    MeasurementKey battery_key = register_key(registers::BATTERY_LEVEL);

    bool daemon = false;              // no console status block
    bool watchdog = false;
    bool power_off_enabled = false;
    std::string tuning_file;          // empty = no reload

    bool kill_active_high = true;
    unsigned kill_debounce = 2;       // consecutive 1 s samples

    double tick_s = 0.01;

    void validate() const {
        if (kill_debounce == 0) throw ConfigError("Kill switch debounce must be at least 1");
        if (tick_s <= 0.0) throw ConfigError("Scheduler tick must be positive");
        if (generator_current_key.empty()) throw ConfigError("Missing generator current key");
    }
};

// Optional collaborators; a null pointer disables the matching duty
struct SchedulerPeripherals {
    IDigitalInput* kill_switch = nullptr;
    IDigitalInput* eject_button = nullptr;   // active low
    IGauge* fuel_gauge = nullptr;
    IGauge* battery_gauge = nullptr;
    IWatchdog* watchdog = nullptr;
    IPowerControl* power = nullptr;
    IUsbDrive* usb = nullptr;
    IFileWriterControl* file_writer = nullptr;
    LineQueue* telemetry = nullptr;
    std::ostream* console = nullptr;
};

/* ================= KILL SWITCH ================= */

// Triggers after `debounce` consecutive active samples. An absent sample
// (unreadable input) counts as inactive.
class KillSwitch {
public:
    KillSwitch(bool active_high, unsigned debounce)
        : active_high_(active_high), debounce_(debounce) {}

    bool sample(const std::optional<bool>& level) {
        const bool active = level.has_value() && (*level == active_high_);
        consecutive_ = active ? consecutive_ + 1 : 0;
        return consecutive_ >= debounce_;
    }

    unsigned consecutive() const { return consecutive_; }

private:
    bool active_high_;
    unsigned debounce_;
    unsigned consecutive_ = 0;
};

/* ================= SCHEDULER ================= */

class Scheduler {
public:
    Scheduler(const SchedulerConfig& config,
              SharedStore& store,
              PidController& pid,
              const SchedulerPeripherals& peripherals,
              ILogger& logger,
              const ITimeSource& clock)
        : config_(config),
          store_(store),
          pid_(pid),
          io_(peripherals),
          logger_(logger),
          clock_(clock),
          kill_switch_(config.kill_active_high, config.kill_debounce),
          tiers_{{0.1, 0.0}, {0.5, 0.0}, {1.0, 0.0}, {5.0, 0.0}, {10.0, 0.0}, {60.0, 0.0}},
          stop_requested_(false),
          exit_code_(EXIT_CODE_OK)
    {
        config_.validate();
    }

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    // CSV column order follows registration order
    void add_source(IDataSource& source) {
        sources_.push_back(&source);
    }

    // Workers start in registration order and stop in reverse
    void add_worker(Worker& worker, bool mandatory) {
        workers_.push_back({&worker, mandatory});
    }

    // The file writer needs the CSV header, so it is created after the
    // sources are registered and attached here
    void set_file_writer(IFileWriterControl* file_writer) {
        io_.file_writer = file_writer;
    }

    // Null stops the telemetry rows, e.g. when no writer drains the queue
    void set_telemetry(LineQueue* telemetry) {
        io_.telemetry = telemetry;
    }

    std::string csv_header() const {
        std::vector<std::string> parts{"linuxtime"};
        for (const IDataSource* s : sources_) parts.push_back(s->csv_header());
        return join_csv(parts);
    }

    void start_workers() {
        for (const auto& w : workers_) {
            if (w.worker->start()) {
                logger_.debug("main", "Started thread " + w.worker->name());
            }
        }
    }

    // Run every tier that is due. Returns false once a stop was requested.
    bool tick() {
        const double now = clock_.now_seconds();

        run_tier(tiers_[0], now, [this] { every_tenth_second(); });
        run_tier(tiers_[1], now, [this] { every_half_second(); });
        run_tier(tiers_[2], now, [this] { every_second(); });
        run_tier(tiers_[3], now, [this] { every_five_seconds(); });
        run_tier(tiers_[4], now, [this] { every_ten_seconds(); });
        run_tier(tiers_[5], now, [this] { every_minute(); });

        return !stop_requested_.load();
    }

    int run() {
        logger_.info("main", "Entering main loop");
        while (tick()) {
            std::this_thread::sleep_for(std::chrono::duration<double>(config_.tick_s));
        }
        shutdown();
        return exit_code();
    }

    // Only touches lock-free atomics, so it may be called from a signal handler.
    // The first request decides the exit code.
    void request_stop(int exit_code) {
        bool expected = false;
        if (stop_requested_.compare_exchange_strong(expected, true)) {
            exit_code_.store(exit_code);
        }
    }

    void shutdown() {
        if (shut_down_) return;
        shut_down_ = true;

        logger_.info("main", "Stopping threads");
        for (auto it = workers_.rbegin(); it != workers_.rend(); ++it) {
            it->worker->cancel();
            it->worker->join();
        }

        if (kill_triggered_ && config_.power_off_enabled && io_.power != nullptr) {
            logger_.info("main", "Powering off");
            io_.power->power_off();
        }
    }

    int exit_code() const { return exit_code_.load(); }
    bool stop_requested() const { return stop_requested_.load(); }
    bool kill_triggered() const { return kill_triggered_; }
    bool ejecting() const { return ejecting_; }

private:
    struct Tier {
        double period_s;
        double next_due_s;
    };

    struct WorkerEntry {
        Worker* worker;
        bool mandatory;
    };

    void run_tier(Tier& tier, double now, const std::function<void()>& body) {
        if (now < tier.next_due_s) return;

        tier.next_due_s += tier.period_s;
        if (tier.next_due_s <= now) {
            tier.next_due_s = now + tier.period_s;
        }

        try {
            body();
        } catch (const FatalError& e) {
            logger_.critical("main", e.what());
            request_stop(EXIT_CODE_FAILURE);
        } catch (const std::exception& e) {
            log_exception(logger_, "main loop", e);
        }
    }

    /* ===================== 0.1 s ===================== */

    void every_tenth_second() {
        if (io_.telemetry != nullptr) {
            const SharedStore::Snapshot snapshot = store_.snapshot();
            std::vector<std::string> parts{format_number(clock_.unix_seconds(), 16)};
            for (IDataSource* s : sources_) parts.push_back(s->csv_line(snapshot));
            if (!io_.telemetry->push(join_csv(parts))) {
                throw FatalError("File writer queue full. Exiting.");
            }
        }

        if (!pid_.cancelled()) {
            if (!store_.contains(config_.generator_current_key)) {
                logger_.critical("main", "Generator current is not being measured.");
                pid_.cancel();
                return;
            }
            const auto current = store_.get(config_.generator_current_key);
            if (current) {
                pid_.set_process_variable(*current);
            }
        }
    }

    /* ===================== 0.5 s ===================== */

    void every_half_second() {
        const auto enable = store_.get(config_.enable_key);
        const bool enabled = enable.has_value() && *enable != 0.0;
        if (enabled && !pid_.in_auto()) {
            pid_.reset_integral();
            pid_.set_auto(true);
        } else if (!enabled) {
            pid_.force_manual();
        }

        if (io_.eject_button != nullptr && io_.file_writer != nullptr && !ejecting_) {
            if (!io_.eject_button->read()) {
                logger_.info("main", "Eject button pressed");
                io_.file_writer->request_eject();
                ejecting_ = true;
            }
        }
    }

    /* ===================== 1 s ===================== */

    void every_second() {
        if (!config_.daemon && io_.console != nullptr) {
            const SharedStore::Snapshot snapshot = store_.snapshot();
            for (const IDataSource* s : sources_) s->print_data(*io_.console, snapshot);
            *io_.console << std::string(80, '-') << "\n";
            io_.console->flush();
        }

        if (!config_.tuning_file.empty()) {
            reload_tuning();
        }

        if (io_.kill_switch != nullptr) {
            std::optional<bool> level;
            try {
                level = io_.kill_switch->read();
            } catch (const TransientError& e) {
                logger_.warning("main", std::string("Kill switch unreadable: ") + e.what());
            }
            if (kill_switch_.sample(level)) {
                logger_.info("main", "Kill switch activated, shutting down");
                kill_triggered_ = true;
                request_stop(EXIT_CODE_OK);
            }
        }
    }

    void reload_tuning() {
        std::optional<PidTuning> tuning;
        try {
            tuning = load_tuning_file(config_.tuning_file);
        } catch (const ConfigError& e) {
            logger_.error("main", std::string("Ignoring tuning file: ") + e.what());
            return;
        }
        if (!tuning) return;

        if (tuning->kp || tuning->ki || tuning->kd) {
            pid_.set_tunings(tuning->kp.value_or(pid_.kp()),
                             tuning->ki.value_or(pid_.ki()),
                             tuning->kd.value_or(pid_.kd()));
        }
        if (tuning->setpoint) {
            pid_.set_setpoint(*tuning->setpoint);
        }
    }

    /* ===================== 5 s ===================== */

    void every_five_seconds() {
        if (config_.watchdog && io_.watchdog != nullptr) {
            io_.watchdog->kick();
        }

        if (io_.usb == nullptr || io_.file_writer == nullptr) return;

        const auto plugged = io_.usb->plugged();
        if (plugged) {
            const auto mounted = io_.usb->mounted();
            if (!mounted && !ejecting_) {
                logger_.info("main", "Mounting drive " + *plugged);
                io_.file_writer->request_mount(*plugged);
            } else if (mounted && *mounted != *plugged) {
                // Drive re-enumerated under another name: eject the stale
                // mount, the new location is mounted once it is gone
                logger_.info("main", "Drive moved from " + *mounted + " to " + *plugged);
                io_.file_writer->request_eject();
                ejecting_ = true;
            }
        }

        if (ejecting_ && !plugged) {
            io_.file_writer->set_safe_to_remove(false);
            ejecting_ = false;
        }
    }

    /* ===================== 10 s ===================== */

    void every_ten_seconds() {
        for (const auto& w : workers_) {
            if (w.worker->alive()) continue;
            if (w.mandatory) {
                logger_.error("main", "Missing " + w.worker->name() + ", shutting down");
                request_stop(EXIT_CODE_FAILURE);
            } else if (reported_dead_.insert(w.worker->name()).second) {
                logger_.error("main", "Thread " + w.worker->name() + " is not running");
            }
        }
    }

    /* ===================== 60 s ===================== */

    void every_minute() {
        if (io_.fuel_gauge != nullptr) {
            const auto fuel = store_.get(config_.fuel_key);
            io_.fuel_gauge->set_level(fuel ? *fuel / 10.0 : 1.0);
        }
        if (io_.battery_gauge != nullptr) {
            // 259..309 V onto 0..10 bars
            const auto battery = store_.get(config_.battery_key);
            io_.battery_gauge->set_level(battery ? std::round((*battery - 259.0) * 0.2) : 1.0);
        }
    }

    SchedulerConfig config_;
    SharedStore& store_;
    PidController& pid_;
    SchedulerPeripherals io_;
    ILogger& logger_;
    const ITimeSource& clock_;

    KillSwitch kill_switch_;
    std::vector<IDataSource*> sources_;
    std::vector<WorkerEntry> workers_;
    std::vector<Tier> tiers_;
    std::set<std::string> reported_dead_;

    std::atomic<bool> stop_requested_;
    std::atomic<int> exit_code_;
    bool kill_triggered_ = false;
    bool ejecting_ = false;
    bool shut_down_ = false;
};

} // namespace gcu

#endif // GCU_SCHEDULER_HPP

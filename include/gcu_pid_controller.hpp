/*
 * ============================================================================
 * GCU PID CONTROLLER
 * ============================================================================
 *
 * Closed-loop controller for the engine speed reference. The process
 * variable (generator current) is set by the scheduler; the output is a duty
 * cycle in percent written to the actuator on every worker tick.
 *
 * ALGORITHM:
 *   - gains stored pre-scaled: ki * Ts, kd / Ts, negated when REVERSE
 *   - compute only when now - last_time >= Ts, with the output bounds
 *     tightened to output +/- slew * elapsed before anything else
 *   - integral clamped to the bounds (anti-windup)
 *   - derivative on measurement, not on error
 *   - between computes the output walks toward the ideal output at no more
 *     than slew %/s
 *
 * MODES:
 *   manual -> auto is bumpless: integral and ideal output start at the
 *   current output, derivative history at the current measurement.
 *
 * THREAD SAFETY:
 *   One mutex guards the whole state. Setters may be called from the
 *   scheduler while the worker computes.
 *
 * LICENSE: MIT
 * ============================================================================
 */

#ifndef GCU_PID_CONTROLLER_HPP
#define GCU_PID_CONTROLLER_HPP

#include "gcu_config.hpp"
#include "gcu_data_source.hpp"
#include "gcu_errors.hpp"
#include "gcu_interfaces.hpp"
#include "gcu_logging.hpp"
#include "gcu_worker.hpp"

#include <cstdio>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace gcu {

enum class PidDirection { DIRECT, REVERSE };

/* ================= TUNING FILE ================= */

// Values found in the tuning file; absent keys keep the running value
struct PidTuning {
    std::optional<double> kp;
    std::optional<double> ki;
    std::optional<double> kd;
    std::optional<double> setpoint;

    static PidTuning from_key_values(const KeyValueConfig& kv) {
        PidTuning t;
        if (kv.has("Kp")) t.kp = kv.require_double("Kp");
        if (kv.has("Ki")) t.ki = kv.require_double("Ki");
        if (kv.has("Kd")) t.kd = kv.require_double("Kd");
        if (kv.has("setpoint")) t.setpoint = kv.require_double("setpoint");
        return t;
    }
};

// Missing or unreadable file -> std::nullopt. A malformed value throws ConfigError.
inline std::optional<PidTuning> load_tuning_file(const std::string& path) {
    auto kv = KeyValueConfig::try_load_file(path);
    if (!kv) return std::nullopt;
    return PidTuning::from_key_values(*kv);
}

/* ================= CONFIGURATION ================= */

struct PidConfig {
    std::string pwm_chip = "/sys/class/pwm/pwmchip0";
    unsigned pwm_channel = 0;
    double pwm_frequency_hz = 100000.0;
    double kp = 0.2;
    double ki = 0.4;
    double kd = 0.0;
    double setpoint = 25.0;      // amps
    double period_s = 1.0;       // sample time Ts
    double slew = 100.0;         // % per second, 100 = effectively unlimited

    void validate() const {
        if (kp < 0.0 || ki < 0.0 || kd < 0.0) throw ConfigError("PID gains must not be negative");
        if (period_s <= 0.0) throw ConfigError("PID period must be positive");
        if (pwm_frequency_hz <= 0.0) throw ConfigError("PWM frequency must be positive");
        if (slew <= 0.0) throw ConfigError("PID slew must be positive");
    }

    void apply(const PidTuning& t) {
        if (t.kp) kp = *t.kp;
        if (t.ki) ki = *t.ki;
        if (t.kd) kd = *t.kd;
        if (t.setpoint) setpoint = *t.setpoint;
    }

    // Gains and setpoint may come from the tuning file instead, so they are
    // required only after apply() had its chance.
    static PidConfig from_key_values(const KeyValueConfig& kv,
                                     const std::optional<PidTuning>& tuning,
                                     const std::string& section = "woodward") {
        const std::string p = section + ".";
        PidConfig c;
        c.pwm_chip = kv.get_string(p + "pwm_chip", c.pwm_chip);
        const long channel = kv.get_int(p + "pwm_channel", static_cast<long>(c.pwm_channel));
        if (channel < 0) throw ConfigError("Invalid pwm_channel for woodward config");
        c.pwm_channel = static_cast<unsigned>(channel);
        c.pwm_frequency_hz = kv.get_double(p + "pwm_frequency", c.pwm_frequency_hz);
        c.period_s = kv.get_double(p + "period", c.period_s);
        c.slew = kv.get_double(p + "slew", c.slew);

        bool have_kp = kv.has(p + "Kp");
        bool have_ki = kv.has(p + "Ki");
        bool have_kd = kv.has(p + "Kd");
        bool have_sp = kv.has(p + "setpoint");
        if (have_kp) c.kp = kv.require_double(p + "Kp");
        if (have_ki) c.ki = kv.require_double(p + "Ki");
        if (have_kd) c.kd = kv.require_double(p + "Kd");
        if (have_sp) c.setpoint = kv.require_double(p + "setpoint");
        if (tuning) {
            c.apply(*tuning);
            have_kp = have_kp || tuning->kp.has_value();
            have_ki = have_ki || tuning->ki.has_value();
            have_kd = have_kd || tuning->kd.has_value();
            have_sp = have_sp || tuning->setpoint.has_value();
        }
        if (!have_kp) throw ConfigError("Missing Kp, required for woodward config");
        if (!have_ki) throw ConfigError("Missing Ki, required for woodward config");
        if (!have_kd) throw ConfigError("Missing Kd, required for woodward config");
        if (!have_sp) throw ConfigError("Missing setpoint, required for woodward config");
        c.validate();
        return c;
    }
};

/* ================= CONTROLLER ================= */

class PidController final : public Worker, public IDataSource {
public:
    static constexpr double LOOP_INTERVAL_S = 0.1;
    static constexpr double OUTPUT_MIN = 0.0;
    static constexpr double OUTPUT_MAX = 100.0;

    PidController(IActuatorOutput& actuator,
                  const PidConfig& config,
                  ILogger& logger,
                  const ITimeSource& clock)
        : Worker("woodward", logger, LOOP_INTERVAL_S),
          actuator_(actuator),
          clock_(clock),
          sample_time_(config.period_s),
          slew_(config.slew),
          setpoint_(config.setpoint),
          process_variable_(config.setpoint),
          last_input_(config.setpoint)
    {
        config.validate();
        set_tunings_locked(config.kp, config.ki, config.kd);
        logger_.info(name(), "Setting PID tunings: Kp=" + format_number(config.kp) +
                             " Ki=" + format_number(config.ki) +
                             " Kd=" + format_number(config.kd) +
                             " setpoint=" + format_number(config.setpoint) +
                             " period=" + format_number(config.period_s) +
                             " slew=" + format_number(config.slew));
        logger_.info(name(), "Started Woodward controller");
    }

    ~PidController() override {
        stop();
    }

    /* ===================== CONTROL ===================== */

    // Run the controller once and return the new output (unchanged in manual)
    double update() {
        std::lock_guard<std::mutex> lock(mutex_);
        const double next = compute_locked(clock_.now_seconds());
        if (next >= OUTPUT_MIN && next <= OUTPUT_MAX) {
            output_ = next;
        }
        return output_;
    }

    void set_auto(bool new_auto) {
        std::lock_guard<std::mutex> lock(mutex_);
        set_auto_locked(new_auto);
    }

    // Drop to manual with output and integral at zero
    void force_manual() {
        std::lock_guard<std::mutex> lock(mutex_);
        set_auto_locked(false);
        output_ = 0.0;
        integral_ = 0.0;
    }

    void set_tunings(double kp, double ki, double kd) {
        std::lock_guard<std::mutex> lock(mutex_);
        set_tunings_locked(kp, ki, kd);
    }

    void set_controller_direction(PidDirection direction) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (direction == direction_) return;
        direction_ = direction;
        kp_ = -kp_;
        ki_ = -ki_;
        kd_ = -kd_;
    }

    void set_sample_time(double new_sample_time) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (sample_time_ == 0.0) {
            sample_time_ = new_sample_time;
        } else if (new_sample_time > 0.0) {
            const double ratio = new_sample_time / sample_time_;
            ki_ *= ratio;
            kd_ /= ratio;
            sample_time_ = new_sample_time;
        }
    }

    void set_output_limits(double out_min, double out_max) {
        std::lock_guard<std::mutex> lock(mutex_);
        set_output_limits_locked(out_min, out_max);
    }

    // Ignored outside 0..100
    void set_output(double value) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (value >= OUTPUT_MIN && value <= OUTPUT_MAX) {
            output_ = value;
        }
    }

    void set_setpoint(double setpoint) {
        std::lock_guard<std::mutex> lock(mutex_);
        setpoint_ = setpoint;
    }

    void set_process_variable(double pv) {
        std::lock_guard<std::mutex> lock(mutex_);
        process_variable_ = pv;
    }

    void reset_integral() {
        std::lock_guard<std::mutex> lock(mutex_);
        integral_ = 0.0;
    }

    /* ===================== STATE ===================== */

    double output() const { std::lock_guard<std::mutex> lock(mutex_); return output_; }
    double ideal_output() const { std::lock_guard<std::mutex> lock(mutex_); return ideal_output_; }
    double integral() const { std::lock_guard<std::mutex> lock(mutex_); return integral_; }
    double setpoint() const { std::lock_guard<std::mutex> lock(mutex_); return setpoint_; }
    double process_variable() const { std::lock_guard<std::mutex> lock(mutex_); return process_variable_; }
    double output_min() const { std::lock_guard<std::mutex> lock(mutex_); return out_min_; }
    double output_max() const { std::lock_guard<std::mutex> lock(mutex_); return out_max_; }
    double sample_time() const { std::lock_guard<std::mutex> lock(mutex_); return sample_time_; }
    bool in_auto() const { std::lock_guard<std::mutex> lock(mutex_); return in_auto_; }
    PidDirection direction() const { std::lock_guard<std::mutex> lock(mutex_); return direction_; }

    // Gains as configured: unscaled by Ts and direction-normalised
    double kp() const { std::lock_guard<std::mutex> lock(mutex_); return kp_ * sign(); }
    double ki() const { std::lock_guard<std::mutex> lock(mutex_); return ki_ * sign() / sample_time_; }
    double kd() const { std::lock_guard<std::mutex> lock(mutex_); return kd_ * sign() * sample_time_; }

    /* ===================== DATA SOURCE ===================== */

    std::string csv_header() const override {
        return "pid_out_percent,setpoint_amps,kp,ki,kd";
    }

    std::string csv_line(const SharedStore::Snapshot&) override {
        return join_csv({format_number(output()), format_number(setpoint()),
                         format_number(kp()), format_number(ki()), format_number(kd())});
    }

    void print_data(std::ostream& out, const SharedStore::Snapshot&) const override {
        char row[128];
        std::snprintf(row, sizeof(row), "%20s %10s %10s", "PID enabled",
                      in_auto() ? "True" : "False", "T/F");
        out << row << "\n";
        out << format_status_row("PID output", output(), "%") << "\n";
        out << format_status_row("Setpoint A", setpoint(), "A") << "\n";
        std::snprintf(row, sizeof(row), "%20s %10.2f", "Kp", kp());
        out << row << "\n";
        std::snprintf(row, sizeof(row), "%20s %10.2f", "Ki", ki());
        out << row << "\n";
        std::snprintf(row, sizeof(row), "%20s %10.2f", "Kd", kd());
        out << row << "\n";
    }

protected:
    void poll_once() override {
        actuator_.write_percent(update());
    }

private:
    double sign() const { return direction_ == PidDirection::REVERSE ? -1.0 : 1.0; }

    static double clamp(double v, double lo, double hi) {
        if (v > hi) return hi;
        if (v < lo) return lo;
        return v;
    }

    void set_tunings_locked(double kp, double ki, double kd) {
        // Negative gains are expressed through the direction instead
        if (kp < 0.0 || ki < 0.0 || kd < 0.0) return;
        kp_ = kp;
        ki_ = ki * sample_time_;
        kd_ = kd / sample_time_;
        if (direction_ == PidDirection::REVERSE) {
            kp_ = -kp_;
            ki_ = -ki_;
            kd_ = -kd_;
        }
    }

    void set_output_limits_locked(double out_min, double out_max) {
        if (out_min < OUTPUT_MIN) out_min = OUTPUT_MIN;
        if (out_max > OUTPUT_MAX) out_max = OUTPUT_MAX;
        if (out_max < out_min) return;
        out_min_ = out_min;
        out_max_ = out_max;
        output_ = clamp(output_, out_min_, out_max_);
        integral_ = clamp(integral_, out_min_, out_max_);
    }

    void set_auto_locked(bool new_auto) {
        if (new_auto && !in_auto_) {
            initialize_locked();
        }
        if (new_auto != in_auto_) {
            in_auto_ = new_auto;
            logger_.info(name(), new_auto ? "Entering auto mode" : "Exiting auto mode");
        }
    }

    void initialize_locked() {
        last_input_ = process_variable_;
        ideal_output_ = output_;
        integral_ = clamp(output_, out_min_, out_max_);
        const double now = clock_.now_seconds();
        last_time_ = now;
        last_compute_time_ = now;
    }

    double compute_locked(double now) {
        if (!in_auto_) return output_;

        const double time_change = now - last_time_;
        const double dt = now - last_compute_time_;
        last_compute_time_ = now;
        const double output = output_;

        double ideal = ideal_output_;
        if (time_change >= sample_time_) {
            set_output_limits_locked(output - time_change * slew_, output + time_change * slew_);

            const double error = setpoint_ - process_variable_;
            integral_ = clamp(integral_ + error * ki_, out_min_, out_max_);

            const double d_input = process_variable_ - last_input_;
            ideal = clamp(kp_ * error + integral_ - kd_ * d_input, out_min_, out_max_);

            last_time_ = now;
            last_input_ = process_variable_;
        }

        ideal_output_ = ideal;
        const double max_step = slew_ * dt;
        if (ideal > output + max_step) return output + max_step;
        if (ideal < output - max_step) return output - max_step;
        return ideal;
    }

    IActuatorOutput& actuator_;
    const ITimeSource& clock_;

    mutable std::mutex mutex_;
    double sample_time_;
    double slew_;
    PidDirection direction_ = PidDirection::DIRECT;

    double kp_ = 0.0;
    double ki_ = 0.0;
    double kd_ = 0.0;

    double setpoint_;
    double process_variable_;
    double last_input_;
    double integral_ = 0.0;
    double output_ = 0.0;
    double ideal_output_ = 0.0;
    double out_min_ = OUTPUT_MIN;
    double out_max_ = OUTPUT_MAX;

    bool in_auto_ = false;
    double last_time_ = 0.0;
    double last_compute_time_ = 0.0;
};

} // namespace gcu

#endif // GCU_PID_CONTROLLER_HPP

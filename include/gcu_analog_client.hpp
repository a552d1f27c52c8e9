/*
 * ============================================================================
 * GCU ANALOG ACQUISITION
 * ============================================================================
 *
 * Samples ADC channels at period/averages and publishes the mean of every
 * `averages` samples, scaled by gain and offset, under the channel id.
 *
 * Sub-tick order per channel:
 *   1. if the accumulator holds `averages` samples: publish and reset
 *   2. read once and accumulate
 * so a value appears on the tick after its last sample was taken.
 *
 * LICENSE: MIT
 * ============================================================================
 */

#ifndef GCU_ANALOG_CLIENT_HPP
#define GCU_ANALOG_CLIENT_HPP

#include "gcu_config.hpp"
#include "gcu_data_source.hpp"
#include "gcu_errors.hpp"
#include "gcu_interfaces.hpp"
#include "gcu_logging.hpp"
#include "gcu_shared_store.hpp"
#include "gcu_worker.hpp"

#include <map>
#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace gcu {

struct AnalogChannel {
    std::string name;
    std::string unit;
    std::string channel;   // ADC pin id, also the store key ("P9_40")
    double gain = 1.0;
    double offset = 0.0;
};

struct AnalogConfig {
    std::vector<AnalogChannel> channels;
    double period_s = 1.0;      // one published value per channel per period
    unsigned averages = 10;     // samples per published value

    void validate() const {
        if (averages == 0) throw ConfigError("Cannot average 0 values");
        if (period_s <= 0.0) throw ConfigError("Analog period must be positive");
        for (const auto& c : channels) {
            if (c.channel.empty()) throw ConfigError("Analog measurement '" + c.name + "' has no channel");
        }
    }

    // "<section>.measurement = name,unit,channel,gain,offset", repeated
    static AnalogConfig from_key_values(const KeyValueConfig& kv, const std::string& section = "analog") {
        const std::string p = section + ".";
        for (const char* key : {"period", "averages"}) {
            if (!kv.has(p + key)) throw ConfigError(std::string("Missing ") + key + ", required for analog");
        }
        AnalogConfig c;
        c.period_s = kv.require_double(p + "period");
        const long averages = kv.require_int(p + "averages");
        if (averages < 0) throw ConfigError("Invalid averages for analog");
        c.averages = static_cast<unsigned>(averages);

        for (const auto& row : kv.get_all(p + "measurement")) {
            const auto fields = split(row, ',');
            if (fields.size() != 5) {
                throw ConfigError("Analog measurement formatted incorrectly: \"" + row + "\"");
            }
            auto gain = parse_double(fields[3]);
            auto offset = parse_double(fields[4]);
            if (!gain || !offset) {
                throw ConfigError("Analog measurement formatted incorrectly: \"" + row + "\"");
            }
            c.channels.push_back({fields[0], fields[1], fields[2], *gain, *offset});
        }
        c.validate();
        return c;
    }
};

class AnalogAcquisition final : public Worker, public IDataSource {
public:
    AnalogAcquisition(IAnalogInput& adc,
                      AnalogConfig config,
                      SharedStore& store,
                      ILogger& logger,
                      const ITimeSource& clock)
        : Worker("analog", logger, 0.01),
          adc_(adc),
          config_(std::move(config)),
          store_(store),
          clock_(clock)
    {
        config_.validate();
        sub_period_s_ = config_.period_s / config_.averages;
        for (const auto& c : config_.channels) {
            store_.register_key(c.channel);
            partial_[c.channel] = Accumulator{};
        }
        last_acquired_s_ = clock_.now_seconds();
        logger_.info(name(), "Started analogclient");
    }

    ~AnalogAcquisition() override {
        stop();
    }

    // One sub-tick over every channel
    void acquire() {
        for (const auto& c : config_.channels) {
            Accumulator& acc = partial_[c.channel];

            if (acc.count >= config_.averages) {
                const double mean = acc.sum / acc.count;
                store_.set(c.channel, mean * c.gain + c.offset);
                acc = Accumulator{};
            }

            try {
                acc.sum += adc_.read_volts(c.channel);
                acc.count += 1;
            } catch (const std::runtime_error& e) {
                logger_.error(name(), "ADC reading error on " + c.channel + ": " + e.what());
            }
        }
    }

    const AnalogConfig& config() const { return config_; }

    /* ===================== DATA SOURCE ===================== */

    std::string csv_header() const override {
        std::vector<std::string> names;
        for (const auto& c : config_.channels) names.push_back(c.name);
        return join_csv(names);
    }

    std::string csv_line(const SharedStore::Snapshot& snapshot) override {
        std::vector<std::string> values;
        for (const auto& c : config_.channels) {
            values.push_back(format_csv_value(lookup(snapshot, c.channel)));
        }
        return join_csv(values);
    }

    void print_data(std::ostream& out, const SharedStore::Snapshot& snapshot) const override {
        for (const auto& c : config_.channels) {
            out << format_status_row(c.name, lookup(snapshot, c.channel), c.unit) << "\n";
        }
    }

protected:
    void poll_once() override {
        const double now = clock_.now_seconds();
        if (now >= last_acquired_s_ + sub_period_s_) {
            acquire();
            last_acquired_s_ = now;
        }
    }

private:
    struct Accumulator {
        double sum = 0.0;
        unsigned count = 0;
    };

    IAnalogInput& adc_;
    AnalogConfig config_;
    SharedStore& store_;
    const ITimeSource& clock_;

    double sub_period_s_ = 0.0;
    double last_acquired_s_ = 0.0;
    std::map<std::string, Accumulator> partial_;  // worker thread only
};

} // namespace gcu

#endif // GCU_ANALOG_CLIENT_HPP

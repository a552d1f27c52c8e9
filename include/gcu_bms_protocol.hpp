/*
 * ============================================================================
 * GCU BMS SERIAL PROTOCOL
 * ============================================================================
 *
 * Parser for the battery management system's periodic ASCII reports.
 *
 * FRAME:
 *   [0, 122)   payload
 *   [122, 126) Fletcher-16 of the payload, 4 hex digits
 *   line[4]    report type: 'S' string status, 'M' module status
 *
 * Fields are fixed columns of decimal text; alarms are 8 hex digits.
 * A malformed field throws ProtocolError and leaves the record untouched.
 *
 * LICENSE: MIT
 * ============================================================================
 */

#ifndef GCU_BMS_PROTOCOL_HPP
#define GCU_BMS_PROTOCOL_HPP

#include "gcu_config.hpp"
#include "gcu_errors.hpp"

#include <cctype>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace gcu {
namespace bms {

constexpr std::size_t PAYLOAD_SIZE = 122;
constexpr std::size_t CHECKSUM_SIZE = 4;
constexpr std::size_t FRAME_SIZE = PAYLOAD_SIZE + CHECKSUM_SIZE;
constexpr std::size_t TYPE_OFFSET = 4;

// Fletcher-16, mod 255, with sum1 in the high byte
inline uint16_t fletcher16(const uint8_t* data, std::size_t length) {
    uint16_t sum1 = 0;
    uint16_t sum2 = 0;
    for (std::size_t i = 0; i < length; ++i) {
        sum1 = static_cast<uint16_t>((sum1 + data[i]) % 255);
        sum2 = static_cast<uint16_t>((sum2 + sum1) % 255);
    }
    return static_cast<uint16_t>((sum1 << 8) | sum2);
}

inline uint16_t fletcher16(const std::string& data) {
    return fletcher16(reinterpret_cast<const uint8_t*>(data.data()), data.size());
}

// Strip the line terminator left by the serial reader
inline std::string strip_line_ending(std::string line) {
    while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) {
        line.pop_back();
    }
    return line;
}

// True when the line is long enough and its checksum matches the payload
inline bool checksum_ok(const std::string& line) {
    if (line.size() < FRAME_SIZE) return false;
    for (std::size_t i = PAYLOAD_SIZE; i < FRAME_SIZE; ++i) {
        if (!std::isxdigit(static_cast<unsigned char>(line[i]))) return false;
    }
    const unsigned long checksum = std::stoul(line.substr(PAYLOAD_SIZE, CHECKSUM_SIZE), nullptr, 16);
    return fletcher16(line.substr(0, PAYLOAD_SIZE)) == checksum;
}

namespace detail {

inline long field(const std::string& line, std::size_t begin, std::size_t end, int base = 10) {
    if (end > line.size()) {
        throw ProtocolError("BMS line too short for field at column " + std::to_string(begin));
    }
    auto v = parse_long(line.substr(begin, end - begin), base);
    if (!v) {
        throw ProtocolError("Bad BMS field at columns " + std::to_string(begin) + "-" +
                            std::to_string(end) + ": \"" + line.substr(begin, end - begin) + "\"");
    }
    return *v;
}

inline uint32_t alarm_field(const std::string& line, std::size_t begin, std::size_t end) {
    return static_cast<uint32_t>(field(line, begin, end, 16));
}

inline bool bit(uint32_t word, int n) {
    return (word >> n) & 1u;
}

} // namespace detail

/* ================= MODULE STATUS ================= */

struct BmsModule {
    int id = 0;
    char state = '\0';
    int soc = 0;
    int min_cell_temp = 0;
    int avg_cell_temp = 0;
    int max_cell_temp = 0;
    double module_voltage = 0.0;
    double min_cell_voltage = 0.0;
    double avg_cell_voltage = 0.0;
    double max_cell_voltage = 0.0;
    double current = 0.0;
    uint32_t alarm_and_status = 0;
    int max_front_power_connector_temp = 0;

    static int parse_id(const std::string& line) {
        return static_cast<int>(detail::field(line, 17, 19));
    }

    // Apply a module report; the id must match this record
    void update(const std::string& line) {
        if (line.size() <= TYPE_OFFSET || line[TYPE_OFFSET] != 'M') {
            throw ProtocolError("Line is not a module status report");
        }
        if (parse_id(line) != id) {
            throw ProtocolError("Module report id does not match module " + std::to_string(id));
        }

        // Parse everything before assigning so a bad field changes nothing
        BmsModule next = *this;
        next.state = line.at(20);
        next.soc = static_cast<int>(detail::field(line, 22, 25));
        next.min_cell_temp = static_cast<int>(detail::field(line, 26, 29));
        next.avg_cell_temp = static_cast<int>(detail::field(line, 30, 33));
        next.max_cell_temp = static_cast<int>(detail::field(line, 34, 37));
        next.module_voltage = detail::field(line, 38, 44) / 1000.0;
        next.min_cell_voltage = detail::field(line, 45, 51) / 1000.0;
        next.avg_cell_voltage = detail::field(line, 52, 58) / 1000.0;
        next.max_cell_voltage = detail::field(line, 59, 65) / 1000.0;
        next.current = detail::field(line, 66, 71) / 10.0;
        next.alarm_and_status = detail::alarm_field(line, 72, 80);
        next.max_front_power_connector_temp = static_cast<int>(detail::field(line, 109, 112));
        *this = next;
    }

    bool temperature_warning() const { return detail::bit(alarm_and_status, 0); }
    bool temperature_fault() const { return detail::bit(alarm_and_status, 1); }
    bool high_current_warning() const { return detail::bit(alarm_and_status, 2); }
    bool high_current_fault() const { return detail::bit(alarm_and_status, 3); }
    bool high_voltage_warning() const { return detail::bit(alarm_and_status, 4); }
    bool high_voltage_fault() const { return detail::bit(alarm_and_status, 5); }
    bool low_voltage_warning() const { return detail::bit(alarm_and_status, 6); }
    bool low_voltage_fault() const { return detail::bit(alarm_and_status, 7); }
    bool cell_low_voltage_fault() const { return detail::bit(alarm_and_status, 8); }
    bool charge_low_warning() const { return detail::bit(alarm_and_status, 12); }
    bool communication_error() const { return detail::bit(alarm_and_status, 13); }
    bool communication_fault() const { return detail::bit(alarm_and_status, 14); }
    bool under_volt_disable() const { return detail::bit(alarm_and_status, 16); }
    bool over_volt_disable() const { return detail::bit(alarm_and_status, 17); }

    // cell 0..6
    bool cell_balancing(int cell) const {
        if (cell < 0 || cell > 6) return false;
        return detail::bit(alarm_and_status, 24 + cell);
    }
};

/* ================= STRING STATUS ================= */

class BmsStatus {
public:
    // Last values from a string status report; empty until the first one
    std::optional<char> state;
    std::optional<int> soc;
    std::optional<int> temperature;
    std::optional<double> voltage;
    std::optional<double> current;
    uint32_t alarm_and_status = 0;
    std::optional<long> watt_hours_to_full_discharge;
    std::optional<long> watt_hours_to_full_charge;
    std::optional<double> min_cell_voltage;
    std::optional<double> max_cell_voltage;
    std::optional<int> front_power_connector_temperature;

    std::map<int, BmsModule> modules;

    // Dispatch on the report type. Returns the type character applied.
    char update(const std::string& line) {
        if (line.size() < PAYLOAD_SIZE) {
            throw ProtocolError("BMS line too short: " + std::to_string(line.size()) + " chars");
        }
        const char type = line[TYPE_OFFSET];
        if (type == 'S') {
            update_status(line);
        } else if (type == 'M') {
            update_module(line);
        } else {
            throw ProtocolError(std::string("Unknown BMS report type '") + type + "'");
        }
        return type;
    }

    bool temperature_warning() const { return detail::bit(alarm_and_status, 0); }
    bool temperature_fault() const { return detail::bit(alarm_and_status, 1); }
    bool high_current_warning() const { return detail::bit(alarm_and_status, 2); }
    bool high_current_fault() const { return detail::bit(alarm_and_status, 3); }
    bool high_voltage_warning() const { return detail::bit(alarm_and_status, 4); }
    bool high_voltage_fault() const { return detail::bit(alarm_and_status, 5); }
    bool low_voltage_warning() const { return detail::bit(alarm_and_status, 6); }
    bool low_voltage_fault() const { return detail::bit(alarm_and_status, 7); }
    bool cell_low_voltage_nonrecoverable_fault() const { return detail::bit(alarm_and_status, 8); }
    bool charge_low_warning() const { return detail::bit(alarm_and_status, 12); }
    bool module_communication_error() const { return detail::bit(alarm_and_status, 13); }
    bool module_communication_fault() const { return detail::bit(alarm_and_status, 14); }
    bool bms_selfcheck_warning() const { return detail::bit(alarm_and_status, 15); }
    bool under_volt_disable() const { return detail::bit(alarm_and_status, 16); }
    bool over_volt_disable() const { return detail::bit(alarm_and_status, 17); }
    bool string_contactor_or_fet_on() const { return detail::bit(alarm_and_status, 31); }

private:
    void update_status(const std::string& line) {
        const char new_state = line.at(17);
        const int new_soc = static_cast<int>(detail::field(line, 19, 22));
        const int new_temperature = static_cast<int>(detail::field(line, 23, 26));
        const double new_voltage = detail::field(line, 27, 33) / 1000.0;
        const double new_current = detail::field(line, 34, 39) / 10.0;
        const uint32_t new_alarm = detail::alarm_field(line, 40, 48);
        const long new_wh_discharge = detail::field(line, 77, 83);
        const long new_wh_charge = detail::field(line, 84, 90);
        const double new_min_cell = detail::field(line, 91, 97) / 1000.0;
        const double new_max_cell = detail::field(line, 98, 104) / 1000.0;
        const int new_connector_temp = static_cast<int>(detail::field(line, 105, 107));

        state = new_state;
        soc = new_soc;
        temperature = new_temperature;
        voltage = new_voltage;
        current = new_current;
        alarm_and_status = new_alarm;
        watt_hours_to_full_discharge = new_wh_discharge;
        watt_hours_to_full_charge = new_wh_charge;
        min_cell_voltage = new_min_cell;
        max_cell_voltage = new_max_cell;
        front_power_connector_temperature = new_connector_temp;
    }

    void update_module(const std::string& line) {
        const int id = BmsModule::parse_id(line);
        auto it = modules.find(id);
        if (it != modules.end()) {
            it->second.update(line);
            return;
        }
        BmsModule module;
        module.id = id;
        module.update(line);
        modules.emplace(id, module);
    }
};

} // namespace bms
} // namespace gcu

#endif // GCU_BMS_PROTOCOL_HPP

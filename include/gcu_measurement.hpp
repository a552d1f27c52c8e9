/*
 * ============================================================================
 * GCU REGISTER MEASUREMENT DESCRIPTORS
 * ============================================================================
 *
 * Describes one value polled from the genset controller:
 *
 *   name, unit, address, length (words), gain, offset [, period]
 *
 * A raw register value v is published as v * gain + offset.
 *
 * DESCRIPTOR FILE:
 *   line 1-2 : header (ignored)
 *   line 3.. : "Engine speed,RPM,1030,1,1.0,0.0,0.1"
 *
 * Addresses are page * 256 + offset as in the controller's register map.
 *
 * LICENSE: MIT
 * ============================================================================
 */

#ifndef GCU_MEASUREMENT_HPP
#define GCU_MEASUREMENT_HPP

#include "gcu_config.hpp"
#include "gcu_errors.hpp"

#include <cstdint>
#include <fstream>
#include <istream>
#include <set>
#include <string>
#include <vector>

namespace gcu {

struct MeasurementDescriptor {
    std::string name;
    std::string unit;
    uint16_t address = 0;
    uint16_t length = 1;     // 1 = 16 bit, 2 = 32 bit (high word first)
    double gain = 1.0;
    double offset = 0.0;
    double period_s = 1.0;

    double scale(double raw) const { return raw * gain + offset; }
};

using MeasurementList = std::vector<MeasurementDescriptor>;

/* ================= MANDATORY REGISTERS ================= */

namespace registers {

constexpr uint16_t FUEL_LEVEL = 1027;            // page 4, offset 3
constexpr uint16_t BATTERY_LEVEL = 1223;         // page 4, offset 199
constexpr uint16_t ENGINE_SPEED = 1030;          // page 4, offset 6
constexpr uint16_t ENABLE_RPM_CONTROL = 191 * 256;  // virtual LED 1

} // namespace registers

inline const MeasurementList& mandatory_templates() {
    static const MeasurementList templates = {
        {"Fuel level",         "%",       registers::FUEL_LEVEL,         1, 1.0, 0.0, 60.0},
        {"battery level",      "V",       registers::BATTERY_LEVEL,      1, 1.0, 0.0, 1.0},
        {"Engine speed",       "RPM",     registers::ENGINE_SPEED,       1, 1.0, 0.0, 0.1},
        {"Enable RPM Control", "boolean", registers::ENABLE_RPM_CONTROL, 1, 1.0, 0.0, 1.0},
    };
    return templates;
}

// Append every mandatory template whose address is missing from the list
inline MeasurementList add_mandatory_measurements(MeasurementList list) {
    std::set<uint16_t> present;
    for (const auto& m : list) present.insert(m.address);

    for (const auto& t : mandatory_templates()) {
        if (present.insert(t.address).second) {
            list.push_back(t);
        }
    }
    return list;
}

/* ================= SIGNED REGISTERS ================= */

// Registers holding two's complement values; everything else is unsigned.
inline const std::set<uint16_t>& signed_addresses() {
    static const std::set<uint16_t> addresses = {
        // Page 4: temperatures, phase angles, watts, DC currents
        256 * 4 + 1,   256 * 4 + 2,   256 * 4 + 28,  256 * 4 + 30,  256 * 4 + 32,
        256 * 4 + 34,  256 * 4 + 48,  256 * 4 + 51,  256 * 4 + 60,  256 * 4 + 62,
        256 * 4 + 64,  256 * 4 + 66,  256 * 4 + 88,  256 * 4 + 90,  256 * 4 + 92,
        256 * 4 + 116, 256 * 4 + 118, 256 * 4 + 120, 256 * 4 + 123, 256 * 4 + 145,
        256 * 4 + 147, 256 * 4 + 149, 256 * 4 + 151, 256 * 4 + 173, 256 * 4 + 175,
        256 * 4 + 177, 256 * 4 + 179, 256 * 4 + 186, 256 * 4 + 188, 256 * 4 + 190,
        256 * 4 + 192, 256 * 4 + 195, 256 * 4 + 196, 256 * 4 + 200, 256 * 4 + 202,
        256 * 4 + 204, 256 * 4 + 206, 256 * 4 + 208, 256 * 4 + 212, 256 * 4 + 214,
        256 * 4 + 216, 256 * 4 + 218, 256 * 4 + 221, 256 * 4 + 223, 256 * 4 + 224,
        256 * 4 + 225, 256 * 4 + 232, 256 * 4 + 234, 256 * 4 + 236, 256 * 4 + 252,
        256 * 4 + 254,
        // Page 5: engine temperatures, senders, torque, pressures
        256 * 5 + 6,   256 * 5 + 7,   256 * 5 + 8,   256 * 5 + 9,   256 * 5 + 15,
        256 * 5 + 49,  256 * 5 + 51,  256 * 5 + 53,  256 * 5 + 55,  256 * 5 + 66,
        256 * 5 + 67,  256 * 5 + 70,  256 * 5 + 72,  256 * 5 + 76,  256 * 5 + 78,
        256 * 5 + 86,  256 * 5 + 87,  256 * 5 + 88,  256 * 5 + 89,  256 * 5 + 90,
        256 * 5 + 91,  256 * 5 + 92,  256 * 5 + 93,  256 * 5 + 94,  256 * 5 + 95,
        256 * 5 + 96,  256 * 5 + 97,  256 * 5 + 98,  256 * 5 + 99,  256 * 5 + 100,
        256 * 5 + 101, 256 * 5 + 102, 256 * 5 + 103, 256 * 5 + 104, 256 * 5 + 113,
        256 * 5 + 114, 256 * 5 + 115, 256 * 5 + 116, 256 * 5 + 154, 256 * 5 + 190,
        256 * 5 + 192, 256 * 5 + 201, 256 * 5 + 202, 256 * 5 + 203, 256 * 5 + 210,
        256 * 5 + 217, 256 * 5 + 218, 256 * 5 + 219, 256 * 5 + 220,
        // Page 6: power, VA, Var, power factor
        256 * 6 + 0,   256 * 6 + 8,   256 * 6 + 10,  256 * 6 + 12,  256 * 6 + 14,
        256 * 6 + 16,  256 * 6 + 18,  256 * 6 + 19,  256 * 6 + 20,  256 * 6 + 21,
        256 * 6 + 22,  256 * 6 + 23,  256 * 6 + 24,  256 * 6 + 34,  256 * 6 + 36,
        256 * 6 + 38,  256 * 6 + 40,  256 * 6 + 42,  256 * 6 + 43,  256 * 6 + 44,
        256 * 6 + 45,  256 * 6 + 46,  256 * 6 + 47,  256 * 6 + 48,  256 * 6 + 58,
        // Page 7: maintenance timers (sec)
        256 * 7 + 2,   256 * 7 + 44,  256 * 7 + 48,  256 * 7 + 52,  256 * 7 + 56,
        256 * 7 + 64,  256 * 7 + 72,  256 * 7 + 80,
    };
    return addresses;
}

inline bool is_signed_address(uint16_t address) {
    return signed_addresses().count(address) != 0;
}

// Big-endian word decode. Throws ProtocolError on a word count mismatch.
inline double decode_registers(const MeasurementDescriptor& m, const std::vector<uint16_t>& words) {
    if (words.size() != m.length) {
        throw ProtocolError("Register " + std::to_string(m.address) + ": expected " +
                            std::to_string(m.length) + " words, got " +
                            std::to_string(words.size()));
    }
    const bool is_signed = is_signed_address(m.address);
    if (m.length == 2) {
        uint32_t raw = (static_cast<uint32_t>(words[0]) << 16) | words[1];
        return is_signed ? static_cast<double>(static_cast<int32_t>(raw))
                         : static_cast<double>(raw);
    }
    return is_signed ? static_cast<double>(static_cast<int16_t>(words[0]))
                     : static_cast<double>(words[0]);
}

/* ================= DESCRIPTOR FILE ================= */

inline MeasurementList read_measurement_description(std::istream& in,
                                                    const std::string& origin = "<stream>") {
    MeasurementList list;
    std::string line;
    int line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        if (line_no <= 2) continue;  // header lines
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (trim(line).empty()) continue;

        auto fail = [&](const std::string& why) {
            return ConfigError(origin + ":" + std::to_string(line_no) + ": " + why +
                               " in \"" + line + "\"");
        };

        std::vector<std::string> fields = split(line, ',');
        if (fields.size() < 6) throw fail("expected at least 6 fields");

        MeasurementDescriptor m;
        m.name = fields[0];
        m.unit = fields[1];

        auto address = parse_long(fields[2]);
        if (!address || *address < 0 || *address > 0xFFFF) throw fail("bad address");
        m.address = static_cast<uint16_t>(*address);

        auto length = parse_long(fields[3]);
        if (!length || (*length != 1 && *length != 2)) throw fail("length must be 1 or 2");
        m.length = static_cast<uint16_t>(*length);

        auto gain = parse_double(fields[4]);
        auto offset = parse_double(fields[5]);
        if (!gain) throw fail("bad gain");
        if (!offset) throw fail("bad offset");
        m.gain = *gain;
        m.offset = *offset;

        if (fields.size() > 6 && !fields[6].empty()) {
            auto period = parse_double(fields[6]);
            if (!period || *period < 0.0) throw fail("bad period");
            m.period_s = *period;
        }
        list.push_back(m);
    }
    return list;
}

inline MeasurementList read_measurement_description(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigError("Cannot open measurement list: " + path);
    }
    return read_measurement_description(in, path);
}

} // namespace gcu

#endif // GCU_MEASUREMENT_HPP

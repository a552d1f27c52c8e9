#ifndef GCU_DATA_SOURCE_HPP
#define GCU_DATA_SOURCE_HPP

#include "gcu_shared_store.hpp"

#include <cstdio>
#include <iomanip>
#include <optional>
#include <ostream>
#include <sstream>
#include <string>
#include <vector>

namespace gcu {

// ============================================================================
// DATA SOURCE CONTRACT
// ============================================================================
//
// Anything that contributes columns to the telemetry CSV and lines to the
// console status block. The header and line never include a newline or a
// trailing comma; missing values are empty strings so columns stay aligned.
//
class IDataSource {
public:
    virtual ~IDataSource() = default;

    virtual std::string csv_header() const = 0;
    virtual std::string csv_line(const SharedStore::Snapshot& snapshot) = 0;
    virtual void print_data(std::ostream& out, const SharedStore::Snapshot& snapshot) const = 0;
};

// ============================================================================
// FORMATTING HELPERS
// ============================================================================

inline std::string format_number(double value, int precision = 10) {
    std::ostringstream oss;
    oss << std::setprecision(precision) << value;
    return oss.str();
}

inline std::string format_csv_value(const std::optional<double>& value) {
    return value ? format_number(*value) : std::string();
}

inline std::string join_csv(const std::vector<std::string>& fields) {
    std::string out;
    for (std::size_t i = 0; i < fields.size(); ++i) {
        if (i > 0) out += ',';
        out += fields[i];
    }
    return out;
}

inline std::optional<double> lookup(const SharedStore::Snapshot& snapshot, const MeasurementKey& key) {
    auto it = snapshot.find(key);
    if (it == snapshot.end()) return std::nullopt;
    return it->second.value;
}

// One status line: "%20s %10.2f %10s", or ERR when the value is missing
inline std::string format_status_row(const std::string& name,
                                     const std::optional<double>& value,
                                     const std::string& units) {
    char buf[128];
    if (value) {
        std::snprintf(buf, sizeof(buf), "%20s %10.2f %10s", name.c_str(), *value, units.c_str());
    } else {
        std::snprintf(buf, sizeof(buf), "%20s %10s %10s", name.c_str(), "ERR", units.c_str());
    }
    return buf;
}

} // namespace gcu

#endif // GCU_DATA_SOURCE_HPP

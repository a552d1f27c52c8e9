/*
 * ============================================================================
 * GCU KEY/VALUE CONFIGURATION
 * ============================================================================
 *
 * Parser for the small text files the daemon reads:
 *   - the daemon configuration (sections, repeated keys)
 *   - the PID tuning file re-read every second
 *
 * FORMAT:
 *   # comment
 *   [deepsea]                 -> following keys become "deepsea.<key>"
 *   mode = rtu
 *   measurement = a,b,c       -> keys may repeat; get_all() returns every value
 *
 * Lookups of required keys throw ConfigError naming the key and the origin.
 *
 * LICENSE: MIT
 * ============================================================================
 */

#ifndef GCU_CONFIG_HPP
#define GCU_CONFIG_HPP

#include "gcu_errors.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <istream>
#include <optional>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace gcu {

/* ================= STRING HELPERS ================= */

inline std::string trim(const std::string& s) {
    std::size_t begin = 0;
    while (begin < s.size() && std::isspace(static_cast<unsigned char>(s[begin]))) ++begin;
    std::size_t end = s.size();
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(begin, end - begin);
}

inline std::vector<std::string> split(const std::string& s, char delimiter) {
    std::vector<std::string> out;
    std::string field;
    std::istringstream iss(s);
    while (std::getline(iss, field, delimiter)) {
        out.push_back(trim(field));
    }
    if (!s.empty() && s.back() == delimiter) out.emplace_back();
    return out;
}

// Whole-string numeric conversions; std::nullopt on trailing garbage
inline std::optional<double> parse_double(const std::string& text) {
    const std::string t = trim(text);
    if (t.empty()) return std::nullopt;
    try {
        std::size_t used = 0;
        double v = std::stod(t, &used);
        if (used != t.size()) return std::nullopt;
        return v;
    } catch (const std::logic_error&) {
        return std::nullopt;
    }
}

inline std::optional<long> parse_long(const std::string& text, int base = 10) {
    const std::string t = trim(text);
    if (t.empty()) return std::nullopt;
    try {
        std::size_t used = 0;
        long v = std::stol(t, &used, base);
        if (used != t.size()) return std::nullopt;
        return v;
    } catch (const std::logic_error&) {
        return std::nullopt;
    }
}

/* ================= KEY/VALUE CONFIG ================= */

class KeyValueConfig {
public:
    KeyValueConfig() = default;

    static KeyValueConfig parse(std::istream& in, const std::string& origin = "<stream>") {
        KeyValueConfig cfg;
        cfg.origin_ = origin;

        std::string section;
        std::string raw;
        int line_no = 0;
        while (std::getline(in, raw)) {
            ++line_no;
            std::string line = raw;
            std::size_t hash = line.find('#');
            if (hash != std::string::npos) line.erase(hash);
            line = trim(line);
            if (line.empty()) continue;

            if (line.front() == '[') {
                if (line.back() != ']') {
                    throw ConfigError(origin + ":" + std::to_string(line_no) +
                                      ": unterminated section header");
                }
                section = trim(line.substr(1, line.size() - 2));
                continue;
            }

            std::size_t eq = line.find('=');
            if (eq == std::string::npos) {
                throw ConfigError(origin + ":" + std::to_string(line_no) +
                                  ": expected 'key = value'");
            }
            std::string key = trim(line.substr(0, eq));
            std::string value = trim(line.substr(eq + 1));
            if (key.empty()) {
                throw ConfigError(origin + ":" + std::to_string(line_no) + ": empty key");
            }
            if (!section.empty()) key = section + "." + key;
            cfg.entries_.emplace_back(std::move(key), std::move(value));
        }
        return cfg;
    }

    static KeyValueConfig load_file(const std::string& path) {
        std::ifstream in(path);
        if (!in) {
            throw ConfigError("Cannot open configuration file: " + path);
        }
        return parse(in, path);
    }

    // Missing or unreadable file is not an error here
    static std::optional<KeyValueConfig> try_load_file(const std::string& path) {
        std::ifstream in(path);
        if (!in) return std::nullopt;
        return parse(in, path);
    }

    void set(const std::string& key, const std::string& value) {
        entries_.emplace_back(key, value);
    }

    bool has(const std::string& key) const {
        return get(key).has_value();
    }

    // Last occurrence wins
    std::optional<std::string> get(const std::string& key) const {
        for (auto it = entries_.rbegin(); it != entries_.rend(); ++it) {
            if (it->first == key) return it->second;
        }
        return std::nullopt;
    }

    std::vector<std::string> get_all(const std::string& key) const {
        std::vector<std::string> out;
        for (const auto& kv : entries_) {
            if (kv.first == key) out.push_back(kv.second);
        }
        return out;
    }

    std::string require_string(const std::string& key) const {
        auto v = get(key);
        if (!v) throw ConfigError("Missing " + key + " in " + origin_);
        return *v;
    }

    double require_double(const std::string& key) const {
        auto v = parse_double(require_string(key));
        if (!v) throw ConfigError("Invalid number for " + key + " in " + origin_);
        return *v;
    }

    long require_int(const std::string& key) const {
        auto v = parse_long(require_string(key));
        if (!v) throw ConfigError("Invalid integer for " + key + " in " + origin_);
        return *v;
    }

    std::string get_string(const std::string& key, const std::string& fallback) const {
        auto v = get(key);
        return v ? *v : fallback;
    }

    double get_double(const std::string& key, double fallback) const {
        return has(key) ? require_double(key) : fallback;
    }

    long get_int(const std::string& key, long fallback) const {
        return has(key) ? require_int(key) : fallback;
    }

    bool get_bool(const std::string& key, bool fallback) const {
        auto v = get(key);
        if (!v) return fallback;
        std::string s = *v;
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (s == "1" || s == "true" || s == "yes" || s == "on") return true;
        if (s == "0" || s == "false" || s == "no" || s == "off") return false;
        throw ConfigError("Invalid boolean for " + key + " in " + origin_);
    }

    const std::string& origin() const { return origin_; }
    std::size_t size() const { return entries_.size(); }

private:
    std::string origin_ = "<memory>";
    std::vector<std::pair<std::string, std::string>> entries_;
};

} // namespace gcu

#endif // GCU_CONFIG_HPP

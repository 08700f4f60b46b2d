/*───────────────────────────────────────────────────────────
 *  common.hpp   –  shared types, errors, logging, json helpers
 *───────────────────────────────────────────────────────────*/
#pragma once

/* ---------- STL ---------- */
#include <cmath>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

/* ---------- deps ---------- */
#include <nlohmann/json.hpp>

namespace credit_monitor {

using json  = nlohmann::json;
using ojson = nlohmann::ordered_json;      // key order matters for the dashboard

/* a numeric cell that may be undefined (serialized as explicit null) */
using Nullable = std::optional<double>;

constexpr double NaN = std::numeric_limits<double>::quiet_NaN();

inline Nullable nullable(double v)
{
    return std::isfinite(v) ? Nullable(v) : std::nullopt;
}

inline ojson to_ojson(const Nullable& v)
{
    return v ? ojson(*v) : ojson(nullptr);
}

/* ────────────────── errors ────────────────── */
struct InitializationError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

/* batch lacks a column that feature_order (or a drift test) requires */
struct MissingFeatureError : std::runtime_error {
    MissingFeatureError(const std::string& feature, const std::string& record_id)
        : std::runtime_error("missing feature '" + feature +
                             "' in record '" + record_id + "'"),
          feature_(feature), record_id_(record_id) {}

    const std::string& feature()   const { return feature_; }
    const std::string& record_id() const { return record_id_; }

private:
    std::string feature_;
    std::string record_id_;
};

struct ConfigError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct InputError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

/* throw-on-failure check for C API return codes */
inline void chk(bool ok, const std::string& msg)
{
    if (!ok) throw std::runtime_error(msg);
}

/* ────────────────── log ────────────────── */
enum LogLevel : int { LOG_INFO = 0, LOG_WARN = 1, LOG_ERROR = 2 };

void     set_log_level(LogLevel lvl);
LogLevel log_level();
LogLevel parse_log_level(const std::string& s);

void logI(const std::string& msg);
void logW(const std::string& msg);
void logE(const std::string& msg);

/* ────────────────── file helpers ────────────────── */
bool        file_exists(const std::string& path);
bool        has_ext    (const std::string& filename, const std::string& ext);
std::string read_file  (const std::string& path);

/* ────────────────── json / numeric helpers ────────────────── */
/* number, or string holding a number; nullopt otherwise */
std::optional<double> parse_number(const json& v);
std::optional<double> parse_number(const std::string& s);

double safe_f (const json& v);
double safe_f (const json& obj, const char* key);
bool   getBool(const json& obj, const char* key);

std::string trim(const std::string& s);

} // namespace credit_monitor

#include "monitor_config.hpp"

#include <initializer_list>

namespace credit_monitor {

static void warn_unknown(const json& obj, const std::string& where,
                         std::initializer_list<const char*> known)
{
    for (auto it = obj.begin(); it != obj.end(); ++it) {
        bool ok = false;
        for (const char* k : known) ok = ok || it.key() == k;
        if (!ok) logW("config: ignoring unknown key '" + where + it.key() + "'");
    }
}

static std::string get_string(const json& obj, const char* key, const std::string& where)
{
    const json& v = obj.at(key);
    if (!v.is_string()) throw ConfigError(where + key + " must be a string");
    return v.get<std::string>();
}

static const json& get_object(const json& obj, const char* key)
{
    const json& v = obj.at(key);
    if (!v.is_object()) throw ConfigError(std::string(key) + " must be an object");
    return v;
}

/* ---------- sections ---------- */
static void read_fairness(const json& f, FairnessConfig& out)
{
    warn_unknown(f, "fairness.", {"ref_groups", "alpha", "mask_significance"});

    if (f.contains("ref_groups")) {
        const json& rg = f["ref_groups"];
        if (!rg.is_object() || rg.empty())
            throw ConfigError("fairness.ref_groups must be a non-empty object");
        out.ref_groups.clear();
        for (auto it = rg.begin(); it != rg.end(); ++it) {
            if (!it.value().is_string())
                throw ConfigError("fairness.ref_groups." + it.key() + " must be a string");
            out.ref_groups.emplace_back(it.key(), it.value().get<std::string>());
        }
    }
    if (f.contains("alpha")) {
        const json& a = f["alpha"];
        if (!a.is_number() || !(a.get<double>() > 0.0 && a.get<double>() < 1.0))
            throw ConfigError("fairness.alpha must be a number in (0, 1)");
        out.alpha = a.get<double>();
    }
    if (f.contains("mask_significance")) {
        if (!f["mask_significance"].is_boolean())
            throw ConfigError("fairness.mask_significance must be a boolean");
        out.mask_significance = f["mask_significance"].get<bool>();
    }
}

static void read_drift(const json& d, DriftConfig& out)
{
    warn_unknown(d, "drift.", {"housing_column", "rent_value", "int_rate_column"});

    if (d.contains("housing_column"))  out.housing_column  = get_string(d, "housing_column",  "drift.");
    if (d.contains("rent_value"))      out.rent_value      = get_string(d, "rent_value",      "drift.");
    if (d.contains("int_rate_column")) out.int_rate_column = get_string(d, "int_rate_column", "drift.");

    if (out.housing_column.empty() || out.int_rate_column.empty())
        throw ConfigError("drift column names must not be empty");
}

MonitorConfig config_from_json(const json& j)
{
    if (!j.is_object()) throw ConfigError("config root must be an object");
    warn_unknown(j, "", {"fairness", "drift", "labels", "report_layout", "log_level"});

    MonitorConfig c;
    if (j.contains("fairness")) read_fairness(get_object(j, "fairness"), c.fairness);
    if (j.contains("drift"))    read_drift   (get_object(j, "drift"),    c.drift);

    if (j.contains("labels")) {
        const json& l = j["labels"];
        if (!l.is_array() || l.size() != 2 || !l[0].is_string() || !l[1].is_string())
            throw ConfigError("labels must be an array of two strings");
        c.labels = {l[0].get<std::string>(), l[1].get<std::string>()};
        if (c.labels[0] == c.labels[1])
            throw ConfigError("labels must be distinct");
    }
    if (j.contains("report_layout")) {
        std::string s = get_string(j, "report_layout", "");
        if      (s == "nested") c.report_layout = ReportLayout::NESTED;
        else if (s == "flat")   c.report_layout = ReportLayout::FLAT;
        else throw ConfigError("report_layout must be \"nested\" or \"flat\", got " + s);
    }
    if (j.contains("log_level"))
        c.log_level = parse_log_level(get_string(j, "log_level", ""));

    return c;
}

MonitorConfig load_config(const std::string& path)
{
    if (!file_exists(path)) throw ConfigError("config file not found: " + path);
    json j;
    try {
        j = json::parse(read_file(path));
    } catch (const json::parse_error& e) {
        throw ConfigError("cannot parse " + path + ": " + e.what());
    }
    return config_from_json(j);
}

} // namespace credit_monitor

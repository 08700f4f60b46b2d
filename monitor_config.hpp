/* ──────────────────────────────────────────────────────────────
   monitor_config.hpp  –  run-time knobs for the metrics pass
   ────────────────────────────────────────────────────────────── */
#pragma once
#include <string>
#include <vector>

#include "drift.hpp"
#include "fairness.hpp"

namespace credit_monitor {

enum class ReportLayout { NESTED, FLAT };

struct MonitorConfig {
    FairnessConfig           fairness;
    DriftConfig              drift;
    std::vector<std::string> labels{"Charged Off", "Fully Paid"};
    ReportLayout             report_layout = ReportLayout::NESTED;
    LogLevel                 log_level     = LOG_INFO;
};

/* every key optional; unknown keys → warning, bad values → ConfigError */
MonitorConfig config_from_json(const json& j);
MonitorConfig load_config(const std::string& path);

} // namespace credit_monitor

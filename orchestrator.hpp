/* ──────────────────────────────────────────────────────────────
   orchestrator.hpp  –  the two public entry points
   ────────────────────────────────────────────────────────────── */
#pragma once
#include <optional>
#include <utility>
#include <vector>

#include "attribution.hpp"
#include "drift.hpp"
#include "fairness.hpp"
#include "monitor_config.hpp"
#include "performance.hpp"
#include "scorer.hpp"

namespace credit_monitor {

/* performance / bias absent ⇔ batch was not validated */
struct MetricsReport {
    std::optional<PerformanceReport> performance;
    std::optional<BiasReport>        bias;
    DriftReport                      drift;
    AttributionSummary               attribution;
};

/*  Holds the provider by reference; the provider must outlive it.
    No state is kept between calls, both methods may run concurrently. */
class MetricsOrchestrator {
public:
    explicit MetricsOrchestrator(const ModelProvider& provider,
                                 MonitorConfig        cfg = MonitorConfig())
        : provider_(provider), cfg_(std::move(cfg)) {}

    std::vector<ScoredRecord> score  (const Batch& batch) const;
    MetricsReport             metrics(const Batch& batch) const;

    const MonitorConfig& config() const { return cfg_; }

private:
    Batch prepare(const Batch& batch) const;     // derive + score

    const ModelProvider& provider_;
    MonitorConfig        cfg_;
};

ojson to_json(const MetricsReport& r, ReportLayout layout = ReportLayout::NESTED);

} // namespace credit_monitor

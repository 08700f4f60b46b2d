#include "orchestrator.hpp"

namespace credit_monitor {

Batch MetricsOrchestrator::prepare(const Batch& batch) const
{
    Batch derived = derive_features(batch, cfg_.drift.housing_column, cfg_.drift.rent_value);
    return score_batch(derived, provider_);
}

std::vector<ScoredRecord> MetricsOrchestrator::score(const Batch& batch) const
{
    return project_scores(prepare(batch));
}

MetricsReport MetricsOrchestrator::metrics(const Batch& batch) const
{
    const Batch scored = prepare(batch);

    MetricsReport r;
    if (scored.is_validated()) {
        r.performance = performance_metrics(scored, cfg_.labels);
        r.bias        = fairness_metrics(scored, cfg_.fairness);
    } else {
        logI("metrics: batch has no ground truth, skipping performance and bias");
    }
    r.drift       = drift_metrics(scored, provider_.reference(), cfg_.drift);
    r.attribution = attribution_summary(scored, provider_);
    return r;
}

/* ---------- serialization ---------- */
ojson to_json(const MetricsReport& r, ReportLayout layout)
{
    ojson j = ojson::object();

    if (layout == ReportLayout::NESTED) {
        if (r.performance) j["performance"] = to_json(*r.performance);
        if (r.bias)        j["bias"]        = to_json(*r.bias);
        j["drift"]       = to_json(r.drift);
        j["attribution"] = to_json(r.attribution);
        return j;
    }

    /* flat: legacy dashboard keys */
    if (r.performance) {
        ojson p = to_json(*r.performance);
        j["f1_score"]         = p["f1"];
        j["confusion_matrix"] = p["confusion_matrix"];
        j["auc"]              = p["auc"];
        j["ROC"]              = p["roc"];
    }
    if (r.bias) j["bias"] = to_json(*r.bias);
    j["drift_metrics"] = to_json(r.drift);
    j["shap"]          = to_json(r.attribution);
    return j;
}

} // namespace credit_monitor

#pragma once
#include <string>

#include "batch.hpp"
#include "model_iface.hpp"

namespace credit_monitor {

struct DriftConfig {
    std::string housing_column  = "home_ownership";
    std::string rent_value      = "RENT";
    std::string int_rate_column = "int_rate";
};

/* three independent tests, no multiple-comparison correction */
struct DriftReport {
    Nullable renters_binom_pvalue;
    Nullable output_logprob_pvalue;
    Nullable int_rate_ttest_pvalue;
};

/*  `scored` must carry rent_indicator and probability (Feature Deriver +
    Scorer). Throws MissingFeatureError if a record lacks the rate column. */
DriftReport drift_metrics(const Batch&          scored,
                          const DriftReference& ref,
                          const DriftConfig&    cfg = DriftConfig());

ojson to_json(const DriftReport& d);

} // namespace credit_monitor

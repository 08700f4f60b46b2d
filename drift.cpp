#include "drift.hpp"

#include <cmath>

#include "stats_util.hpp"

namespace credit_monitor {

DriftReport drift_metrics(const Batch&          scored,
                          const DriftReference& ref,
                          const DriftConfig&    cfg)
{
    const size_t N = scored.size();
    if (N == 0) logW("drift: empty batch, p-values are undefined");

    long renters = 0;
    std::vector<double> int_rate;     int_rate.reserve(N);
    std::vector<double> neg_log_prob; neg_log_prob.reserve(N);

    for (const auto& r : scored.records) {
        renters += r.rent_indicator;

        auto rate = r.numeric(cfg.int_rate_column);
        if (!rate) throw MissingFeatureError(cfg.int_rate_column, r.id);
        int_rate.push_back(*rate);

        neg_log_prob.push_back(-std::log(r.probability));
    }

    DriftReport d;

    /* 1. renter proportion vs training ratio */
    d.renters_binom_pvalue = nullable(stats::binom_test(renters, long(N), ref.rent_ratio));

    /* 2. output score distribution: -log p vs fitted gamma */
    d.output_logprob_pvalue = nullable(stats::kstest_gamma(neg_log_prob, ref.gamma_args).pvalue);

    /* 3. interest rate mean */
    const stats::TestResult tt = stats::ttest_1samp(int_rate, ref.int_rate_mean);
    if (N >= 2 && std::isnan(tt.pvalue))
        logW("drift: " + cfg.int_rate_column + " has zero variance");
    d.int_rate_ttest_pvalue = nullable(tt.pvalue);

    return d;
}

ojson to_json(const DriftReport& d)
{
    ojson j = ojson::object();
    j["renters_binom_pvalue"]  = to_ojson(d.renters_binom_pvalue);
    j["output_logprob_pvalue"] = to_ojson(d.output_logprob_pvalue);
    j["int_rate_ttest_pvalue"] = to_ojson(d.int_rate_ttest_pvalue);
    return j;
}

} // namespace credit_monitor

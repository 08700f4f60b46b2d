#include "scorer.hpp"

namespace credit_monitor {

FeatureMatrix build_feature_matrix(const Batch&                    batch,
                                   const std::vector<std::string>& feature_order)
{
    const Eigen::Index N = Eigen::Index(batch.size());
    const Eigen::Index F = Eigen::Index(feature_order.size());

    FeatureMatrix X(N, F);
    for (Eigen::Index i = 0; i < N; ++i) {
        const Record& r = batch.records[size_t(i)];
        for (Eigen::Index j = 0; j < F; ++j) {
            const std::string& name = feature_order[size_t(j)];
            auto v = r.numeric(name);
            if (!v) throw MissingFeatureError(name, r.id);
            X(i, j) = *v;
        }
    }
    return X;
}

Batch score_batch(const Batch& batch, const ModelProvider& provider)
{
    Batch out = batch;
    if (out.empty()) return out;

    const FeatureMatrix X = build_feature_matrix(out, provider.feature_order());
    const std::vector<double> prob = provider.model().predict_proba(X);
    chk(prob.size() == out.size(),
        "predict_proba returned " + std::to_string(prob.size()) +
        " values for " + std::to_string(out.size()) + " records");

    const double thr = provider.threshold();
    for (size_t i = 0; i < out.size(); ++i) {
        out.records[i].probability = prob[i];
        out.records[i].prediction  = threshold_label(prob[i], thr);
    }
    return out;
}

std::vector<ScoredRecord> project_scores(const Batch& scored)
{
    std::vector<ScoredRecord> v;
    v.reserve(scored.size());
    for (const auto& r : scored.records)
        v.push_back({r.id, r.probability, r.prediction, r.id_value});
    return v;
}

ojson to_json(const std::vector<ScoredRecord>& scores)
{
    ojson arr = ojson::array();
    for (const auto& s : scores)
        arr.push_back(ojson{{"id", s.id_value.is_null() ? ojson(s.id) : s.id_value},
                            {"probability", to_ojson(nullable(s.probability))},
                            {"prediction", s.prediction}});
    return arr;
}

} // namespace credit_monitor

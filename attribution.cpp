#include "attribution.hpp"

#include "scorer.hpp"
#include "shap_util.hpp"

namespace credit_monitor {

AttributionSummary attribution_summary(const Batch& batch, const ModelProvider& provider)
{
    const auto& features = provider.feature_order();
    const FeatureMatrix X = build_feature_matrix(batch, features);

    Eigen::MatrixXd shap(0, Eigen::Index(features.size()));
    if (batch.empty())
        logW("attribution: empty batch, values are undefined");
    else
        shap = provider.explainer().shap_values(X);

    chk(shap.rows() == X.rows() && shap.cols() == X.cols(),
        "explainer returned " + std::to_string(shap.rows()) + "x" +
        std::to_string(shap.cols()) + " attributions for a " +
        std::to_string(X.rows()) + "x" + std::to_string(X.cols()) + " batch");

    AttributionSummary a;
    for (auto& kv : rank_ascending(features, shap_mean_abs(shap)))
        a.values.emplace_back(kv.first, nullable(kv.second));
    return a;
}

ojson to_json(const AttributionSummary& a)
{
    ojson j = ojson::object();
    for (const auto& kv : a.values) j[kv.first] = to_ojson(kv.second);
    return j;
}

} // namespace credit_monitor

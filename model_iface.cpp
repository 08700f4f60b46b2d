#include "model_iface.hpp"

#include <cmath>
#include <unordered_set>

namespace credit_monitor {

ModelProvider::ModelProvider(std::shared_ptr<const IProbaModel> model,
                             std::shared_ptr<const IExplainer>  explainer,
                             double                             threshold,
                             std::vector<std::string>           feature_order,
                             DriftReference                     reference)
    : model_(std::move(model)),
      explainer_(std::move(explainer)),
      threshold_(threshold),
      feature_order_(std::move(feature_order)),
      reference_(std::move(reference))
{
    if (!model_)     throw InitializationError("model provider: no model");
    if (!explainer_) throw InitializationError("model provider: no explainer");

    if (!std::isfinite(threshold_) || threshold_ < 0.0 || threshold_ > 1.0)
        throw InitializationError("model provider: threshold must lie in [0,1]");

    if (feature_order_.empty())
        throw InitializationError("model provider: empty feature list");
    std::unordered_set<std::string> seen;
    for (const auto& f : feature_order_) {
        if (f.empty())
            throw InitializationError("model provider: empty feature name");
        if (!seen.insert(f).second)
            throw InitializationError("model provider: duplicated feature '" + f + "'");
    }

    const auto& ref = reference_;
    if (!std::isfinite(ref.rent_ratio) || ref.rent_ratio < 0.0 || ref.rent_ratio > 1.0)
        throw InitializationError("model provider: rent_ratio must lie in [0,1]");
    if (!std::isfinite(ref.int_rate_mean))
        throw InitializationError("model provider: int_rate_mean is not finite");

    const auto& g = ref.gamma_args;
    if (g.empty() || g.size() > 3)
        throw InitializationError("model provider: gamma_args needs 1-3 values");
    for (double v : g)
        if (!std::isfinite(v))
            throw InitializationError("model provider: gamma_args must be finite");
    if (g[0] <= 0.0)
        throw InitializationError("model provider: gamma shape must be > 0");
    if (g.size() == 3 && g[2] <= 0.0)
        throw InitializationError("model provider: gamma scale must be > 0");
}

/* ---------- manifest ---------- */
static const json& require(const json& m, const char* key)
{
    if (!m.contains(key) || m[key].is_null())
        throw InitializationError(std::string("model artifacts: missing '") + key + "'");
    return m[key];
}

static double require_number(const json& m, const char* key)
{
    auto v = parse_number(require(m, key));
    if (!v) throw InitializationError(std::string("model artifacts: '") + key +
                                      "' is not a number");
    return *v;
}

ModelProvider make_provider(const json&                        manifest,
                            std::shared_ptr<const IProbaModel> model,
                            std::shared_ptr<const IExplainer>  explainer)
{
    if (!manifest.is_object())
        throw InitializationError("model artifacts: manifest is not an object");

    const double threshold = require_number(manifest, "threshold");

    const json& jf = require(manifest, "features");
    if (!jf.is_array())
        throw InitializationError("model artifacts: 'features' must be an array");
    std::vector<std::string> features;
    for (const auto& f : jf) {
        if (!f.is_string())
            throw InitializationError("model artifacts: feature names must be strings");
        features.push_back(f.get<std::string>());
    }

    DriftReference ref;
    ref.rent_ratio    = require_number(manifest, "rent_ratio");
    ref.int_rate_mean = require_number(manifest, "int_rate_mean");

    const json& jg = require(manifest, "gamma_args");
    if (jg.is_array()) {
        for (const auto& v : jg) {
            auto n = parse_number(v);
            if (!n) throw InitializationError("model artifacts: gamma_args must be numbers");
            ref.gamma_args.push_back(*n);
        }
    } else {
        ref.gamma_args.push_back(require_number(manifest, "gamma_args"));
    }

    return ModelProvider(std::move(model), std::move(explainer), threshold,
                         std::move(features), std::move(ref));
}

} // namespace credit_monitor

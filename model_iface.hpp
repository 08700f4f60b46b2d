/* ──────────────────────────────────────────────────────────────
   model_iface.hpp     –  the abstraction layer
   ────────────────────────────────────────────────────────────── */
#pragma once
#include <memory>
#include <string>
#include <vector>

#include <Eigen/Dense>

#include "common.hpp"

namespace credit_monitor {

/* N × F, row-major so it can be handed to the booster as-is */
using FeatureMatrix =
    Eigen::Matrix<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

struct IProbaModel {
    virtual ~IProbaModel() = default;

    /*  P(class = 1) per row; result has X.rows() entries            */
    virtual std::vector<double> predict_proba(const FeatureMatrix& X) const = 0;
};

struct IExplainer {
    virtual ~IExplainer() = default;

    /*  per-record, per-feature attribution, N × F (no bias column)  */
    virtual Eigen::MatrixXd shap_values(const FeatureMatrix& X) const = 0;
};

/* reference parameters captured at training time */
struct DriftReference {
    double              rent_ratio    = 0.0;   // expected renter proportion
    std::vector<double> gamma_args;            // shape [, loc [, scale]]
    double              int_rate_mean = 0.0;
};

/*  Immutable provider: constructed once, shared read-only by every
    engine. Throws InitializationError when a field is unusable.      */
class ModelProvider {
public:
    ModelProvider(std::shared_ptr<const IProbaModel> model,
                  std::shared_ptr<const IExplainer>  explainer,
                  double                             threshold,
                  std::vector<std::string>           feature_order,
                  DriftReference                     reference);

    const IProbaModel&              model()         const { return *model_; }
    const IExplainer&               explainer()     const { return *explainer_; }
    double                          threshold()     const { return threshold_; }
    const std::vector<std::string>& feature_order() const { return feature_order_; }
    const DriftReference&           reference()     const { return reference_; }

private:
    std::shared_ptr<const IProbaModel> model_;
    std::shared_ptr<const IExplainer>  explainer_;
    double                             threshold_;
    std::vector<std::string>           feature_order_;
    DriftReference                     reference_;
};

/* Build a provider from a JSON manifest (keys: threshold, features,
   rent_ratio, gamma_args, int_rate_mean) plus an already-loaded model. */
ModelProvider make_provider(const json&                        manifest,
                            std::shared_ptr<const IProbaModel> model,
                            std::shared_ptr<const IExplainer>  explainer);

} // namespace credit_monitor

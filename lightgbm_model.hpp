/* ──────────────────────────────────────────────────────────────
   lightgbm_model.hpp  –  LightGBM-backed model provider
   ────────────────────────────────────────────────────────────── */
#pragma once
#include <memory>
#include <string>
#include <utility>

#include <LightGBM/c_api.h>

#include "model_iface.hpp"

namespace credit_monitor {

/* owns one BoosterHandle; shared by the model and its explainer */
class LGBBooster {
public:
    explicit LGBBooster(const std::string& model_file, int num_threads = 0);
    ~LGBBooster();

    LGBBooster(const LGBBooster&)            = delete;
    LGBBooster& operator=(const LGBBooster&) = delete;

    BoosterHandle      handle()       const { return handle_; }
    int                num_features() const { return num_features_; }
    const std::string& params()       const { return params_; }

private:
    BoosterHandle handle_ = nullptr;
    int           num_features_ = 0;
    std::string   params_;           // prediction parameter string
};

class LGBProbaModel : public IProbaModel {
public:
    explicit LGBProbaModel(std::shared_ptr<const LGBBooster> b) : booster_(std::move(b)) {}
    std::vector<double> predict_proba(const FeatureMatrix& X) const override;

private:
    std::shared_ptr<const LGBBooster> booster_;
};

/* TreeSHAP through C_API_PREDICT_CONTRIB */
class LGBContribExplainer : public IExplainer {
public:
    explicit LGBContribExplainer(std::shared_ptr<const LGBBooster> b) : booster_(std::move(b)) {}
    Eigen::MatrixXd shap_values(const FeatureMatrix& X) const override;

private:
    std::shared_ptr<const LGBBooster> booster_;
};

/*  Load model_artifacts manifest (JSON) and the booster it names.
    Relative model_file paths resolve against the manifest's directory. */
ModelProvider load_lightgbm_provider(const std::string& manifest_path);

} // namespace credit_monitor

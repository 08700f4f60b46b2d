/*  lightgbm_model.cpp  --------------------------------------- */
#include "lightgbm_model.hpp"

#include <algorithm>
#include <thread>

namespace credit_monitor {

static std::string lgb_error()
{
    const char* e = LGBM_GetLastError();
    return e ? std::string(e) : std::string("unknown LightGBM error");
}

LGBBooster::LGBBooster(const std::string& model_file, int num_threads)
{
    if (!file_exists(model_file))
        throw InitializationError("model file not found: " + model_file);

    int iters = 0;
    int err = LGBM_BoosterCreateFromModelfile(model_file.c_str(), &iters, &handle_);
    if (err != 0 || handle_ == nullptr)
        throw InitializationError("LightGBM load failed: " + lgb_error());

    int n_class = 0;
    if (LGBM_BoosterGetNumClasses(handle_, &n_class) != 0 || n_class != 1) {
        LGBM_BoosterFree(handle_);
        handle_ = nullptr;
        throw InitializationError("LightGBM model is not a binary classifier");
    }
    if (LGBM_BoosterGetNumFeature(handle_, &num_features_) != 0) {
        LGBM_BoosterFree(handle_);
        handle_ = nullptr;
        throw InitializationError("LightGBM GetNumFeature failed: " + lgb_error());
    }

    if (num_threads <= 0)
        num_threads = std::max(1u, std::thread::hardware_concurrency());
    params_ = "num_threads=" + std::to_string(num_threads);

    logI("LightGBM model " + model_file + ": " + std::to_string(iters) +
         " iterations, " + std::to_string(num_features_) + " features");
}

LGBBooster::~LGBBooster()
{
    if (handle_) LGBM_BoosterFree(handle_);
}

/* ---------- probability ---------- */
std::vector<double> LGBProbaModel::predict_proba(const FeatureMatrix& X) const
{
    const int N = static_cast<int>(X.rows());
    const int F = static_cast<int>(X.cols());
    if (N == 0) return {};
    chk(F == booster_->num_features(),
        "feature-count mismatch: model=" + std::to_string(booster_->num_features()) +
        "  input=" + std::to_string(F));

    std::vector<double> prob(N);
    int64_t out_len = 0;
    chk(!LGBM_BoosterPredictForMat(
            booster_->handle(), X.data(), C_API_DTYPE_FLOAT64,
            N, F, /*is_row_major=*/1, C_API_PREDICT_NORMAL,
            0, -1, booster_->params().c_str(), &out_len, prob.data()),
        "PredictForMat failed: " + lgb_error());
    chk(out_len == N, "PredictForMat returned " + std::to_string(out_len) + " values");
    return prob;
}

/* ---------- |SHAP| source ---------- */
Eigen::MatrixXd LGBContribExplainer::shap_values(const FeatureMatrix& X) const
{
    const int N = static_cast<int>(X.rows());
    const int F = static_cast<int>(X.cols());
    if (N == 0) return Eigen::MatrixXd(0, F);
    chk(F == booster_->num_features(),
        "feature-count mismatch: model=" + std::to_string(booster_->num_features()) +
        "  input=" + std::to_string(F));

    const int OUT_F = F + 1;                      // +bias
    std::vector<double> contrib(size_t(N) * OUT_F);
    int64_t out_len = 0;
    chk(!LGBM_BoosterPredictForMat(
            booster_->handle(), X.data(), C_API_DTYPE_FLOAT64,
            N, F, 1, C_API_PREDICT_CONTRIB,
            0, -1, booster_->params().c_str(), &out_len, contrib.data()),
        "SHAP predict failed: " + lgb_error());
    chk(out_len == int64_t(N) * OUT_F, "SHAP predict returned unexpected length");

    Eigen::MatrixXd shap(N, F);
    for (int i = 0; i < N; ++i) {
        const double* row = contrib.data() + size_t(i) * OUT_F;
        for (int j = 0; j < F; ++j) shap(i, j) = row[j];
    }
    return shap;
}

/* ---------- manifest ---------- */
static std::string dir_of(const std::string& path)
{
    auto pos = path.find_last_of('/');
    return pos == std::string::npos ? std::string() : path.substr(0, pos + 1);
}

ModelProvider load_lightgbm_provider(const std::string& manifest_path)
{
    json m;
    try {
        m = json::parse(read_file(manifest_path));
    } catch (const json::parse_error& e) {
        throw InitializationError(manifest_path + ": " + e.what());
    } catch (const InputError& e) {
        throw InitializationError(e.what());
    }
    if (!m.is_object() || !m.contains("model_file") || !m["model_file"].is_string())
        throw InitializationError("model artifacts: missing 'model_file'");

    std::string model_file = m["model_file"].get<std::string>();
    if (!model_file.empty() && model_file[0] != '/')
        model_file = dir_of(manifest_path) + model_file;

    const int threads = m.contains("num_threads") ? int(safe_f(m, "num_threads")) : 0;
    auto booster = std::make_shared<const LGBBooster>(model_file, threads);

    ModelProvider p = make_provider(m,
                                    std::make_shared<LGBProbaModel>(booster),
                                    std::make_shared<LGBContribExplainer>(booster));
    if (int(p.feature_order().size()) != booster->num_features())
        throw InitializationError(
            "model artifacts list " + std::to_string(p.feature_order().size()) +
            " features, booster expects " + std::to_string(booster->num_features()));
    return p;
}

} // namespace credit_monitor

/* -----------------------------------------------------------
 *  test_util.hpp – check macros and in-memory model fakes
 * ----------------------------------------------------------- */
#pragma once
#include <cmath>
#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "batch.hpp"
#include "model_iface.hpp"

static int g_checks = 0;
static int g_failed = 0;

#define CHECK(cond) do {                                                     \
    ++g_checks;                                                              \
    if (!(cond)) { ++g_failed;                                               \
        std::cerr << __FILE__ << ":" << __LINE__ << ": CHECK(" #cond ")\n"; }  \
} while (0)

#define CHECK_NEAR(a, b, eps) do {                                           \
    ++g_checks;                                                              \
    const double va_ = (a), vb_ = (b);                                       \
    if (!(std::fabs(va_ - vb_) <= (eps))) { ++g_failed;                      \
        std::cerr << __FILE__ << ":" << __LINE__ << ": " #a " = " << va_      \
                  << ", expected " << vb_ << "\n"; }                         \
} while (0)

#define CHECK_THROWS(expr, Ex) do {                                          \
    ++g_checks;                                                              \
    bool thrown_ = false;                                                    \
    try { (void)(expr); } catch (const Ex&) { thrown_ = true; }              \
    if (!thrown_) { ++g_failed;                                              \
        std::cerr << __FILE__ << ":" << __LINE__ << ": " #expr                \
                  " did not throw " #Ex "\n"; }                              \
} while (0)

inline int test_summary(const char* name)
{
    std::cout << name << ": " << (g_checks - g_failed) << "/" << g_checks
              << " checks passed" << std::endl;
    return g_failed == 0 ? 0 : 1;
}

namespace credit_monitor {
namespace testing {

/* probability = first feature column */
struct ColumnModel : IProbaModel {
    std::vector<double> predict_proba(const FeatureMatrix& X) const override {
        std::vector<double> p(size_t(X.rows()));
        for (Eigen::Index i = 0; i < X.rows(); ++i) p[size_t(i)] = X(i, 0);
        return p;
    }
};

/* attribution = the feature value itself */
struct IdentityExplainer : IExplainer {
    Eigen::MatrixXd shap_values(const FeatureMatrix& X) const override {
        return Eigen::MatrixXd(X);
    }
};

inline DriftReference default_reference()
{
    DriftReference r;
    r.rent_ratio    = 0.25;
    r.gamma_args    = {1.0};
    r.int_rate_mean = 12.0;
    return r;
}

inline ModelProvider make_test_provider(std::vector<std::string> features,
                                        double                   threshold = 0.5,
                                        DriftReference           ref = default_reference())
{
    return ModelProvider(std::make_shared<ColumnModel>(),
                         std::make_shared<IdentityExplainer>(),
                         threshold, std::move(features), std::move(ref));
}

inline Record make_record(const std::string&                        id,
                          const std::map<std::string, double>&      num,
                          const std::map<std::string, std::string>& cat = {},
                          std::optional<int>                        loan_status = std::nullopt)
{
    Record r;
    r.id = id;
    for (const auto& kv : num) r.num[kv.first] = kv.second;
    for (const auto& kv : cat) r.cat[kv.first] = kv.second;
    r.loan_status = loan_status;
    return r;
}

} // namespace testing
} // namespace credit_monitor

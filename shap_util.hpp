#pragma once
#include <algorithm>
#include <cmath>
#include <numeric>
#include <string>
#include <utility>
#include <vector>

#include <Eigen/Dense>

#include "common.hpp"

namespace credit_monitor {

/* ---------- 1. mean |SHAP| per column ---------- */
inline std::vector<double> shap_mean_abs(const Eigen::MatrixXd& shap)
{
    const Eigen::Index F = shap.cols();
    std::vector<double> mu(size_t(F), NaN);
    if (shap.rows() == 0) return mu;                // undefined, not zero

    Eigen::RowVectorXd m = shap.cwiseAbs().colwise().mean();
    for (Eigen::Index j = 0; j < F; ++j) mu[size_t(j)] = m(j);
    return mu;
}

/* ---------- 2. feature → value, ascending, NaN last ---------- */
inline std::vector<std::pair<std::string, double>>
rank_ascending(const std::vector<std::string>& names, const std::vector<double>& values)
{
    std::vector<std::pair<std::string, double>> kv;
    kv.reserve(names.size());
    for (size_t j = 0; j < names.size(); ++j) kv.emplace_back(names[j], values[j]);

    std::stable_sort(kv.begin(), kv.end(), [](const auto& a, const auto& b) {
        if (std::isnan(a.second)) return false;
        if (std::isnan(b.second)) return true;
        return a.second < b.second;
    });
    return kv;
}

} // namespace credit_monitor

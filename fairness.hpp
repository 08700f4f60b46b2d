/* ──────────────────────────────────────────────────────────────
   fairness.hpp  –  group cross-tabs and reference-group disparity
   ────────────────────────────────────────────────────────────── */
#pragma once
#include <array>
#include <string>
#include <utility>
#include <vector>

#include "batch.hpp"

namespace credit_monitor {

/* one scored record as the fairness engine sees it */
struct FairnessInput {
    int         score       = 0;      // predicted label
    int         label_value = 0;      // ground truth
    std::string group_attribute;      // preprocessed group label
};

/* absolute group metrics, output order */
enum AbsMetric : int {
    ABS_TPR = 0, ABS_TNR, ABS_FOR, ABS_FDR, ABS_FPR, ABS_FNR,
    ABS_NPV, ABS_PRECISION, ABS_PPR, ABS_PPREV, ABS_PREV, ABS_N
};
constexpr std::array<const char*, ABS_N> ABS_METRIC_NAMES = {
    "tpr", "tnr", "for", "fdr", "fpr", "fnr", "npv", "precision", "ppr", "pprev", "prev"
};

/* disparity metrics, output order (index into AbsMetric) */
constexpr int DISP_N = 10;
constexpr std::array<AbsMetric, DISP_N> DISP_METRICS = {
    ABS_PPR, ABS_PPREV, ABS_PRECISION, ABS_FDR, ABS_FOR,
    ABS_FPR, ABS_FNR, ABS_TPR, ABS_TNR, ABS_NPV
};

struct CrossTabRow {
    std::string attribute_name;
    std::string attribute_value;

    long tp = 0, fp = 0, tn = 0, fn = 0;
    long group_size     = 0;
    long k              = 0;           // predicted positives in the whole batch
    long total_entities = 0;

    std::array<Nullable, ABS_N> absolute{};

    /* filled by compute_disparity */
    bool                         is_reference = false;
    std::array<Nullable, DISP_N> disparity{};
    std::array<bool, DISP_N>     significant{};

    long pp() const { return tp + fp; }
    long pn() const { return tn + fn; }
};

struct FairnessConfig {
    /* attribute → reference group value */
    std::vector<std::pair<std::string, std::string>> ref_groups{
        {"forty_plus_indicator", "Under Forty"}};
    double alpha             = 0.05;
    bool   mask_significance = true;
};

struct BiasReport {
    std::vector<CrossTabRow> rows;
    bool mask_significance = true;
};

/* group labels for `attribute`: categorical as-is, numeric binned into
   quartile intervals, missing → "nan". Second member is the group order. */
std::pair<std::vector<std::string>, std::vector<std::string>>
preprocess_attribute(const Batch& batch, const std::string& attribute);

std::vector<CrossTabRow> crosstab(const std::vector<FairnessInput>&  in,
                                  const std::string&                attribute_name,
                                  const std::vector<std::string>&   group_order);

void compute_disparity(std::vector<CrossTabRow>&         rows,
                       const std::vector<FairnessInput>& in,
                       const std::string&                ref_value,
                       double                            alpha);

/* Requires a validated, scored batch */
BiasReport fairness_metrics(const Batch& scored, const FairnessConfig& cfg);

/* {"absolute_metrics": [...], "disparity_metrics": [...]} */
ojson to_json(const BiasReport& b);

} // namespace credit_monitor

#pragma once
#include <string>
#include <utility>
#include <vector>

#include "batch.hpp"

namespace credit_monitor {

struct RocPoint {
    Nullable fpr;
    Nullable tpr;
};

/* one row per true class; cells in label order */
using ConfusionRow = std::vector<std::pair<std::string, long>>;

struct PerformanceReport {
    double                    f1 = 0.0;
    std::vector<ConfusionRow> confusion_matrix;
    Nullable                  auc;
    std::vector<RocPoint>     roc;
};

/*  Requires a validated, scored batch (probability / prediction set).
    `labels` names class 0 then class 1.                              */
PerformanceReport performance_metrics(const Batch&                    scored,
                                      const std::vector<std::string>& labels);

ojson to_json(const PerformanceReport& p);

} // namespace credit_monitor

#include "performance.hpp"

#include <algorithm>

#include "stats_util.hpp"

namespace credit_monitor {

PerformanceReport performance_metrics(const Batch&                    scored,
                                      const std::vector<std::string>& labels)
{
    if (!scored.is_validated())
        throw std::invalid_argument("performance metrics need ground truth on every record");
    if (labels.size() != 2)
        throw std::invalid_argument("performance metrics need exactly two labels");

    const size_t N = scored.size();
    std::vector<int>    y(N), pred(N);
    std::vector<double> prob(N);
    for (size_t i = 0; i < N; ++i) {
        const Record& r = scored.records[i];
        y[i]    = *r.loan_status;
        pred[i] = r.prediction;
        prob[i] = r.probability;
    }

    const long pos = std::count(y.begin(), y.end(), 1);
    if (pos == 0 || pos == long(N))
        logW("performance: ground truth holds a single class; auc is undefined");

    PerformanceReport p;
    p.f1 = stats::f1_score(y, pred);

    /* rows = true class, columns = predicted class, negative first */
    const stats::Confusion c = stats::confusion_counts(y, pred);
    p.confusion_matrix = {
        { {labels[0], c.tn}, {labels[1], c.fp} },
        { {labels[0], c.fn}, {labels[1], c.tp} },
    };

    const stats::RocCurve rc = stats::roc_curve(y, prob);
    p.roc.reserve(rc.fpr.size());
    for (size_t i = 0; i < rc.fpr.size(); ++i)
        p.roc.push_back({nullable(rc.fpr[i]), nullable(rc.tpr[i])});

    p.auc = nullable(stats::roc_auc(y, prob));
    return p;
}

ojson to_json(const PerformanceReport& p)
{
    ojson cm = ojson::array();
    for (const auto& row : p.confusion_matrix) {
        ojson jr = ojson::object();
        for (const auto& cell : row) jr[cell.first] = cell.second;
        cm.push_back(std::move(jr));
    }
    ojson roc = ojson::array();
    for (const auto& pt : p.roc)
        roc.push_back(ojson{{"fpr", to_ojson(pt.fpr)}, {"tpr", to_ojson(pt.tpr)}});

    ojson j = ojson::object();
    j["f1"]               = p.f1;
    j["confusion_matrix"] = std::move(cm);
    j["auc"]              = to_ojson(p.auc);
    j["roc"]              = std::move(roc);
    return j;
}

} // namespace credit_monitor

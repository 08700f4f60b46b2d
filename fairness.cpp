#include "fairness.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <limits>
#include <map>
#include <sstream>

#include "stats_util.hpp"

namespace credit_monitor {

static const char* MISSING_GROUP = "nan";

static std::string fmt_num(double v, int precision = 6)
{
    std::ostringstream ss;
    ss << std::setprecision(precision) << v;
    return ss.str();
}

/* shortest precision at which every (distinct) edge prints differently */
static std::vector<std::string> fmt_edges(const std::vector<double>& edges)
{
    std::vector<std::string> out;
    for (int prec = 6; prec <= std::numeric_limits<double>::max_digits10; ++prec) {
        out.clear();
        for (double e : edges) out.push_back(fmt_num(e, prec));
        std::vector<std::string> sorted = out;
        std::sort(sorted.begin(), sorted.end());
        if (std::adjacent_find(sorted.begin(), sorted.end()) == sorted.end()) break;
    }
    return out;
}

static Nullable ratio(long num, long den)
{
    if (den == 0) return std::nullopt;
    return double(num) / double(den);
}

/* ---------- preprocessing ------------------------------------------ */
std::pair<std::vector<std::string>, std::vector<std::string>>
preprocess_attribute(const Batch& batch, const std::string& attribute)
{
    const size_t N = batch.size();
    std::vector<std::string> labels(N, MISSING_GROUP);

    bool any_cat = false;
    std::vector<double> present;
    for (const auto& r : batch.records) {
        if (r.categorical(attribute)) any_cat = true;
        else if (auto v = r.numeric(attribute)) present.push_back(*v);
    }

    std::vector<std::string> order;
    if (any_cat || present.empty()) {
        /* categorical (numbers stringified when mixed in) */
        for (size_t i = 0; i < N; ++i) {
            const Record& r = batch.records[i];
            if (auto c = r.categorical(attribute))  labels[i] = *c;
            else if (auto v = r.numeric(attribute)) labels[i] = fmt_num(*v);
        }
        order = labels;
        std::sort(order.begin(), order.end());
        order.erase(std::unique(order.begin(), order.end()), order.end());
        return {labels, order};
    }

    /* numeric: quartile edges, duplicates dropped */
    std::vector<double> sorted = present;
    std::sort(sorted.begin(), sorted.end());
    auto quantile = [&](double q) {
        const double pos = q * double(sorted.size() - 1);
        const size_t lo  = size_t(std::floor(pos));
        const size_t hi  = std::min(lo + 1, sorted.size() - 1);
        return sorted[lo] + (pos - double(lo)) * (sorted[hi] - sorted[lo]);
    };
    std::vector<double> edges;
    for (double q : {0.0, 0.25, 0.5, 0.75, 1.0}) edges.push_back(quantile(q));
    edges.erase(std::unique(edges.begin(), edges.end()), edges.end());

    const std::vector<std::string> txt = fmt_edges(edges);
    std::vector<std::string> bins;
    if (edges.size() == 1) {
        bins.push_back(txt[0]);
    } else {
        for (size_t b = 0; b + 1 < edges.size(); ++b)
            bins.push_back((b == 0 ? "[" : "(") + txt[b] + ", " + txt[b + 1] + "]");
    }

    bool any_missing = false;
    for (size_t i = 0; i < N; ++i) {
        auto v = batch.records[i].numeric(attribute);
        if (!v) { any_missing = true; continue; }
        size_t b = 0;
        while (b + 1 < bins.size() && *v > edges[b + 1]) ++b;
        labels[i] = bins[b];
    }
    order = bins;
    if (any_missing) order.push_back(MISSING_GROUP);
    return {labels, order};
}

/* ---------- cross-tabulation ---------------------------------------- */
std::vector<CrossTabRow> crosstab(const std::vector<FairnessInput>& in,
                                  const std::string&               attribute_name,
                                  const std::vector<std::string>&  group_order)
{
    long k = 0;
    for (const auto& x : in) k += (x.score == 1);

    std::map<std::string, size_t> idx;
    std::vector<CrossTabRow> rows;
    for (const auto& g : group_order) {
        chk(idx.emplace(g, rows.size()).second,
            "crosstab: group '" + g + "' listed twice for " + attribute_name);
        CrossTabRow r;
        r.attribute_name  = attribute_name;
        r.attribute_value = g;
        r.k               = k;
        r.total_entities  = long(in.size());
        rows.push_back(std::move(r));
    }

    for (const auto& x : in) {
        auto it = idx.find(x.group_attribute);
        chk(it != idx.end(), "crosstab: group '" + x.group_attribute + "' not in group order");
        CrossTabRow& r = rows[it->second];
        ++r.group_size;
        if (x.score == 1) (x.label_value == 1 ? ++r.tp : ++r.fp);
        else              (x.label_value == 1 ? ++r.fn : ++r.tn);
    }

    for (auto& r : rows) {
        auto& a = r.absolute;
        const long label_pos = r.tp + r.fn, label_neg = r.fp + r.tn;
        a[ABS_TPR]       = ratio(r.tp, label_pos);
        a[ABS_TNR]       = ratio(r.tn, label_neg);
        a[ABS_FOR]       = ratio(r.fn, r.pn());
        a[ABS_FDR]       = ratio(r.fp, r.pp());
        a[ABS_FPR]       = ratio(r.fp, label_neg);
        a[ABS_FNR]       = ratio(r.fn, label_pos);
        a[ABS_NPV]       = ratio(r.tn, r.pn());
        a[ABS_PRECISION] = ratio(r.tp, r.pp());
        a[ABS_PPR]       = ratio(r.pp(), r.k);
        a[ABS_PPREV]     = ratio(r.pp(), r.group_size);
        a[ABS_PREV]      = ratio(label_pos, r.group_size);
    }
    return rows;
}

/* ---------- significance -------------------------------------------
 *  Each disparity metric is a proportion over a subset of the group:
 *  the 0/1 sample behind it is what gets compared to the reference.
 * ------------------------------------------------------------------- */
static std::vector<double> metric_sample(const std::vector<FairnessInput>& in,
                                         const std::string& group, AbsMetric m)
{
    std::vector<double> s;
    for (const auto& x : in) {
        if (x.group_attribute != group) continue;
        switch (m) {
            case ABS_TPR: case ABS_FNR:
                if (x.label_value == 1) s.push_back(x.score); break;
            case ABS_TNR: case ABS_FPR:
                if (x.label_value == 0) s.push_back(x.score); break;
            case ABS_PRECISION: case ABS_FDR:
                if (x.score == 1) s.push_back(x.label_value); break;
            case ABS_NPV: case ABS_FOR:
                if (x.score == 0) s.push_back(x.label_value); break;
            case ABS_PREV:
                s.push_back(x.label_value); break;
            default:                                   // ppr, pprev
                s.push_back(x.score); break;
        }
    }
    return s;
}

static bool is_significant(const std::vector<double>& ref,
                           const std::vector<double>& grp, double alpha)
{
    const stats::TestResult lev = stats::levene(ref, grp);
    const bool equal_var = !(lev.pvalue < alpha);
    const stats::TestResult t = stats::ttest_ind(ref, grp, equal_var);
    return t.pvalue < alpha;
}

void compute_disparity(std::vector<CrossTabRow>&         rows,
                       const std::vector<FairnessInput>& in,
                       const std::string&                ref_value,
                       double                            alpha)
{
    auto ref_it = std::find_if(rows.begin(), rows.end(),
                               [&](const CrossTabRow& r){ return r.attribute_value == ref_value; });
    if (ref_it == rows.end()) {
        logW("fairness: reference group '" + ref_value + "' absent from batch; "
             "disparities are undefined");
        for (auto& r : rows) {
            r.disparity.fill(std::nullopt);
            r.significant.fill(false);
        }
        return;
    }
    const CrossTabRow ref = *ref_it;

    std::array<std::vector<double>, DISP_N> ref_samples;
    for (int d = 0; d < DISP_N; ++d)
        ref_samples[d] = metric_sample(in, ref_value, DISP_METRICS[d]);

    for (auto& r : rows) {
        r.is_reference = (r.attribute_value == ref_value);
        if (r.group_size == 0)
            logW("fairness: group '" + r.attribute_value + "' is empty");
        for (int d = 0; d < DISP_N; ++d) {
            const AbsMetric m = DISP_METRICS[d];
            const Nullable& g = r.absolute[m];
            const Nullable& b = ref.absolute[m];
            r.disparity[d] = (g && b) ? nullable(*g / *b) : std::nullopt;
            r.significant[d] = r.is_reference
                ? false
                : is_significant(ref_samples[d], metric_sample(in, r.attribute_value, m), alpha);
        }
    }
}

/* ---------- engine -------------------------------------------------- */
BiasReport fairness_metrics(const Batch& scored, const FairnessConfig& cfg)
{
    if (!scored.is_validated())
        throw std::invalid_argument("fairness metrics need ground truth on every record");

    BiasReport rep;
    rep.mask_significance = cfg.mask_significance;

    for (const auto& ag : cfg.ref_groups) {
        const std::string& attribute = ag.first;
        auto pre = preprocess_attribute(scored, attribute);
        const std::vector<std::string>& labels = pre.first;

        std::vector<FairnessInput> in(scored.size());
        for (size_t i = 0; i < scored.size(); ++i) {
            const Record& r = scored.records[i];
            in[i] = {r.prediction, *r.loan_status, labels[i]};
        }

        std::vector<CrossTabRow> rows = crosstab(in, attribute, pre.second);
        compute_disparity(rows, in, ag.second, cfg.alpha);
        logI("fairness: " + attribute + " → " + std::to_string(rows.size()) + " groups");

        for (auto& r : rows) rep.rows.push_back(std::move(r));
    }
    return rep;
}

/* ---------- serialization ------------------------------------------ */
static Nullable round2(const Nullable& v)
{
    if (!v) return v;
    return std::nearbyint(*v * 100.0) / 100.0;      // half-to-even, like numpy
}

ojson to_json(const BiasReport& b)
{
    ojson abs_rows  = ojson::array();
    ojson disp_rows = ojson::array();

    for (const auto& r : b.rows) {
        ojson a = ojson::object();
        a["attribute_name"]  = r.attribute_name;
        a["attribute_value"] = r.attribute_value;
        for (int m = 0; m < ABS_N; ++m)
            a[ABS_METRIC_NAMES[m]] = to_ojson(round2(r.absolute[m]));
        abs_rows.push_back(std::move(a));

        ojson d = ojson::object();
        d["attribute_name"]  = r.attribute_name;
        d["attribute_value"] = r.attribute_value;
        for (int i = 0; i < DISP_N; ++i) {
            const bool masked = b.mask_significance && !r.is_reference && !r.significant[i];
            d[std::string(ABS_METRIC_NAMES[DISP_METRICS[i]]) + "_disparity"] =
                masked ? ojson(nullptr) : to_ojson(r.disparity[i]);
        }
        if (b.mask_significance)
            for (int i = 0; i < DISP_N; ++i)
                d[std::string(ABS_METRIC_NAMES[DISP_METRICS[i]]) + "_significance"] =
                    bool(r.significant[i]);
        disp_rows.push_back(std::move(d));
    }

    ojson j = ojson::object();
    j["absolute_metrics"]  = std::move(abs_rows);
    j["disparity_metrics"] = std::move(disp_rows);
    return j;
}

} // namespace credit_monitor

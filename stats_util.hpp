#pragma once
#include <vector>

#include <Eigen/Dense>

#include "common.hpp"

namespace credit_monitor {
namespace stats {

/* ---------- 1. classification ---------- */
struct Confusion {
    long tn = 0, fp = 0, fn = 0, tp = 0;
    long total() const { return tn + fp + fn + tp; }
};

Confusion confusion_counts(const std::vector<int>& y_true,
                           const std::vector<int>& y_pred);

/* positive class = 1; 0 when 2tp+fp+fn == 0 */
double f1_score(const std::vector<int>& y_true, const std::vector<int>& y_pred);

struct RocCurve {
    std::vector<double> fpr, tpr, thresholds;
};

/* distinct thresholds, descending; collinear points dropped;
   leading (0,0) at +inf. fpr (tpr) is NaN without negatives (positives) */
RocCurve roc_curve(const std::vector<int>& y_true, const std::vector<double>& score);

/* NaN when only one class is present */
double roc_auc(const std::vector<int>& y_true, const std::vector<double>& score);

/* ---------- 2. hypothesis tests ---------- */
struct TestResult {
    double statistic = NaN;
    double pvalue    = NaN;
};

/* exact two-sided binomial test; NaN when n == 0 */
double binom_test(long k, long n, double p);

TestResult ttest_1samp(const std::vector<double>& a, double popmean);

TestResult ttest_ind(const std::vector<double>& a, const std::vector<double>& b,
                     bool equal_var);

/* Brown–Forsythe (median-centred) Levene test for two samples */
TestResult levene(const std::vector<double>& a, const std::vector<double>& b);

/* one-sample KS against gamma(shape [, loc [, scale]]) */
TestResult kstest_gamma(const std::vector<double>& x, const std::vector<double>& gamma_args);

/* ---------- 3. distributions ---------- */
double gamma_cdf(double x, double shape, double loc = 0.0, double scale = 1.0);
double binom_pmf(long k, long n, double p);
double binom_cdf(long k, long n, double p);      // P(X <= k)
double binom_sf (long k, long n, double p);      // P(X >  k)
double student_t_sf2(double t, double df);       // P(|T| >= |t|)
double f_sf(double f, double d1, double d2);     // P(F >= f)

/* P(D_n >= d), two-sided one-sample Kolmogorov statistic */
double kolmogorov_sf(long n, double d);

/* ---------- 4. small reductions ---------- */
double mean(const std::vector<double>& v);
double sample_var(const std::vector<double>& v);  // ddof = 1
double median(std::vector<double> v);

} // namespace stats
} // namespace credit_monitor

#include "stats_util.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>

#include <unsupported/Eigen/SpecialFunctions>

namespace credit_monitor {
namespace stats {

using Eigen::numext::betainc;
using Eigen::numext::igamma;

static constexpr double Inf = std::numeric_limits<double>::infinity();
static constexpr double kPi = 3.14159265358979323846;

static Eigen::Map<const Eigen::VectorXd> as_vec(const std::vector<double>& v)
{
    return Eigen::Map<const Eigen::VectorXd>(v.data(), Eigen::Index(v.size()));
}

/* ─────────────── small reductions ─────────────── */
double mean(const std::vector<double>& v)
{
    if (v.empty()) return NaN;
    return as_vec(v).mean();
}

double sample_var(const std::vector<double>& v)
{
    if (v.size() < 2) return NaN;
    auto x = as_vec(v);
    const double m = x.mean();
    return (x.array() - m).square().sum() / double(v.size() - 1);
}

double median(std::vector<double> v)
{
    if (v.empty()) return NaN;
    const size_t mid = v.size() / 2;
    std::nth_element(v.begin(), v.begin() + mid, v.end());
    double hi = v[mid];
    if (v.size() % 2) return hi;
    double lo = *std::max_element(v.begin(), v.begin() + mid);
    return 0.5 * (lo + hi);
}

/* ─────────────── classification ─────────────── */
Confusion confusion_counts(const std::vector<int>& y_true, const std::vector<int>& y_pred)
{
    chk(y_true.size() == y_pred.size(), "confusion_counts: length mismatch");
    Confusion c;
    for (size_t i = 0; i < y_true.size(); ++i) {
        bool gt = y_true[i] == 1, pr = y_pred[i] == 1;
        (pr ? (gt ? ++c.tp : ++c.fp) : (gt ? ++c.fn : ++c.tn));
    }
    return c;
}

double f1_score(const std::vector<int>& y_true, const std::vector<int>& y_pred)
{
    Confusion c = confusion_counts(y_true, y_pred);
    const long den = 2 * c.tp + c.fp + c.fn;
    return den ? 2.0 * c.tp / den : 0.0;
}

RocCurve roc_curve(const std::vector<int>& y_true, const std::vector<double>& score)
{
    chk(y_true.size() == score.size(), "roc_curve: length mismatch");
    const size_t N = score.size();

    std::vector<size_t> order(N);
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(),
                     [&](size_t a, size_t b){ return score[a] > score[b]; });

    /* cumulative tp / fp at the last index of every distinct score */
    std::vector<double> tps, fps, thr;
    double tp = 0;
    for (size_t i = 0; i < N; ++i) {
        tp += (y_true[order[i]] == 1);
        bool last = (i + 1 == N) || score[order[i + 1]] != score[order[i]];
        if (!last) continue;
        tps.push_back(tp);
        fps.push_back(double(i + 1) - tp);
        thr.push_back(score[order[i]]);
    }

    /* drop points that lie on a straight segment */
    std::vector<size_t> keep;
    const size_t M = tps.size();
    for (size_t i = 0; i < M; ++i) {
        if (M <= 2 || i == 0 || i + 1 == M) { keep.push_back(i); continue; }
        double d2f = fps[i + 1] - 2 * fps[i] + fps[i - 1];
        double d2t = tps[i + 1] - 2 * tps[i] + tps[i - 1];
        if (d2f != 0.0 || d2t != 0.0) keep.push_back(i);
    }

    RocCurve rc;
    rc.fpr.push_back(0.0);
    rc.tpr.push_back(0.0);
    rc.thresholds.push_back(std::numeric_limits<double>::infinity());
    for (size_t i : keep) {
        rc.fpr.push_back(fps[i]);
        rc.tpr.push_back(tps[i]);
        rc.thresholds.push_back(thr[i]);
    }

    const double fp_tot = rc.fpr.back(), tp_tot = rc.tpr.back();
    for (double& v : rc.fpr) v = fp_tot > 0 ? v / fp_tot : NaN;
    for (double& v : rc.tpr) v = tp_tot > 0 ? v / tp_tot : NaN;
    return rc;
}

double roc_auc(const std::vector<int>& y_true, const std::vector<double>& score)
{
    const long pos = std::count(y_true.begin(), y_true.end(), 1);
    if (pos == 0 || pos == long(y_true.size())) return NaN;

    RocCurve rc = roc_curve(y_true, score);
    double area = 0.0;
    for (size_t i = 1; i < rc.fpr.size(); ++i)
        area += (rc.fpr[i] - rc.fpr[i - 1]) * (rc.tpr[i] + rc.tpr[i - 1]) * 0.5;
    return area;
}

/* ─────────────── distributions ─────────────── */
double gamma_cdf(double x, double shape, double loc, double scale)
{
    if (std::isnan(x)) return NaN;
    const double z = (x - loc) / scale;
    if (z <= 0.0)      return 0.0;
    if (std::isinf(z)) return 1.0;
    return igamma(shape, z);
}

double binom_pmf(long k, long n, double p)
{
    if (k < 0 || k > n) return 0.0;
    if (p <= 0.0) return k == 0 ? 1.0 : 0.0;
    if (p >= 1.0) return k == n ? 1.0 : 0.0;
    const double lc = std::lgamma(n + 1.0) - std::lgamma(k + 1.0) - std::lgamma(n - k + 1.0);
    return std::exp(lc + k * std::log(p) + (n - k) * std::log1p(-p));
}

double binom_cdf(long k, long n, double p)
{
    if (k < 0)  return 0.0;
    if (k >= n) return 1.0;
    if (p <= 0.0) return 1.0;
    if (p >= 1.0) return 0.0;
    return betainc(double(n - k), double(k + 1), 1.0 - p);
}

double binom_sf(long k, long n, double p)
{
    if (k < 0)  return 1.0;
    if (k >= n) return 0.0;
    if (p <= 0.0) return 0.0;
    if (p >= 1.0) return 1.0;
    return betainc(double(k + 1), double(n - k), p);
}

double student_t_sf2(double t, double df)
{
    if (std::isnan(t) || !(df > 0)) return NaN;
    if (std::isinf(t)) return 0.0;
    const double x = df / (df + t * t);
    return betainc(0.5 * df, 0.5, x);
}

double f_sf(double f, double d1, double d2)
{
    if (std::isnan(f) || !(d1 > 0) || !(d2 > 0)) return NaN;
    if (f <= 0.0)      return 1.0;
    if (std::isinf(f)) return 0.0;
    const double x = d2 / (d2 + d1 * f);
    return betainc(0.5 * d2, 0.5 * d1, x);
}

/* ---------- Kolmogorov distribution ------------------------------
 *  Exact P(D_n < d) after Marsaglia, Tsang & Wang (2003): the k-th
 *  central element of H^n, with a decimal exponent carried alongside
 *  the matrix to keep the power in range.
 * ----------------------------------------------------------------- */
static void mat_power(const Eigen::MatrixXd& A, int eA, long n,
                      Eigen::MatrixXd& V, int& eV)
{
    if (n == 1) { V = A; eV = eA; return; }
    mat_power(A, eA, n / 2, V, eV);
    Eigen::MatrixXd B = V * V;
    int eB = 2 * eV;
    if (n % 2 == 0) { V = B;     eV = eB; }
    else            { V = A * B; eV = eA + eB; }
    const Eigen::Index c = V.rows() / 2;
    if (V(c, c) > 1e140) { V *= 1e-140; eV += 140; }
}

static double mtw_cdf(long n, double d)
{
    const long   k = long(n * d) + 1;
    const long   m = 2 * k - 1;
    const double h = double(k) - n * d;

    Eigen::MatrixXd H(m, m);
    for (long i = 0; i < m; ++i)
        for (long j = 0; j < m; ++j)
            H(i, j) = (i - j + 1 < 0) ? 0.0 : 1.0;
    for (long i = 0; i < m; ++i) {
        H(i, 0)     -= std::pow(h, double(i + 1));
        H(m - 1, i) -= std::pow(h, double(m - i));
    }
    H(m - 1, 0) += (2 * h - 1 > 0 ? std::pow(2 * h - 1, double(m)) : 0.0);
    for (long i = 0; i < m; ++i)
        for (long j = 0; j < m; ++j)
            if (i - j + 1 > 0)
                for (long g = 1; g <= i - j + 1; ++g) H(i, j) /= double(g);

    Eigen::MatrixXd Q;
    int eQ = 0;
    mat_power(H, 0, n, Q, eQ);

    double s = Q(k - 1, k - 1);
    for (long i = 1; i <= n; ++i) {
        s = s * double(i) / double(n);
        if (s < 1e-140) { s *= 1e140; eQ -= 140; }
    }
    return s * std::pow(10.0, double(eQ));
}

/* limiting distribution, P(sqrt(n) D_n >= lambda) */
static double kolmogorov_asymp_sf(double lambda)
{
    if (lambda <= 0.0) return 1.0;
    if (lambda < 1.18) {
        const double w = kPi * kPi / (8.0 * lambda * lambda);
        double cdf = 0.0;
        for (int k = 1; k <= 20; k += 2) cdf += std::exp(-double(k * k) * w);
        cdf *= std::sqrt(2.0 * kPi) / lambda;
        return std::min(1.0, std::max(0.0, 1.0 - cdf));
    }
    double sf = 0.0;
    for (int k = 1; k <= 100; ++k) {
        double term = std::exp(-2.0 * k * k * lambda * lambda);
        sf += (k % 2 ? term : -term);
        if (term < 1e-18) break;
    }
    return std::min(1.0, std::max(0.0, 2.0 * sf));
}

double kolmogorov_sf(long n, double d)
{
    if (n <= 0 || std::isnan(d)) return NaN;
    if (d <= 0.0) return 1.0;
    if (d >= 1.0) return 0.0;
    if (n > 10000) return kolmogorov_asymp_sf(std::sqrt(double(n)) * d);

    const double s = d * d * n;
    if (s > 7.24 || (s > 3.76 && n > 99))
        return std::min(1.0, 2.0 * std::exp(-(2.000071 + .331 / std::sqrt(double(n)) +
                                                1.409 / n) * s));
    return std::min(1.0, std::max(0.0, 1.0 - mtw_cdf(n, d)));
}

/* ─────────────── hypothesis tests ─────────────── */
double binom_test(long k, long n, double p)
{
    if (n <= 0 || k < 0 || k > n || !(p >= 0.0 && p <= 1.0)) return NaN;

    const double d    = binom_pmf(k, n, p);
    const double rerr = 1 + 1e-7;
    const double np   = n * p;

    double pval;
    if (double(k) == np) return 1.0;
    if (double(k) < np) {
        long y = 0;
        for (long i = long(std::ceil(np)); i <= n; ++i)
            if (binom_pmf(i, n, p) <= d * rerr) ++y;
        pval = binom_cdf(k, n, p) + binom_sf(n - y, n, p);
    } else {
        long y = 0;
        for (long i = 0; i <= long(std::floor(np)); ++i)
            if (binom_pmf(i, n, p) <= d * rerr) ++y;
        pval = binom_cdf(y - 1, n, p) + binom_sf(k - 1, n, p);
    }
    return std::min(1.0, pval);
}

TestResult ttest_1samp(const std::vector<double>& a, double popmean)
{
    TestResult r;
    const size_t n = a.size();
    if (n < 2) return r;

    const double d = mean(a) - popmean;
    const double v = sample_var(a);
    if (std::isnan(d) || std::isnan(v)) return r;
    if (v == 0.0) {
        if (d == 0.0) return r;
        r.statistic = d > 0 ? Inf : -Inf;
        r.pvalue    = 0.0;
        return r;
    }
    r.statistic = d / std::sqrt(v / double(n));
    r.pvalue    = student_t_sf2(r.statistic, double(n - 1));
    return r;
}

TestResult ttest_ind(const std::vector<double>& a, const std::vector<double>& b,
                     bool equal_var)
{
    TestResult r;
    const double n1 = double(a.size()), n2 = double(b.size());
    if (a.empty() || b.empty()) return r;

    const double v1 = sample_var(a), v2 = sample_var(b);
    const double d  = mean(a) - mean(b);

    double df, denom;
    if (equal_var) {
        df = n1 + n2 - 2.0;
        if (df <= 0) return r;
        const double svar = ((n1 - 1) * v1 + (n2 - 1) * v2) / df;
        denom = std::sqrt(svar * (1.0 / n1 + 1.0 / n2));
    } else {
        if (n1 < 2 || n2 < 2) return r;
        const double vn1 = v1 / n1, vn2 = v2 / n2;
        df = (vn1 + vn2) * (vn1 + vn2) /
             (vn1 * vn1 / (n1 - 1) + vn2 * vn2 / (n2 - 1));
        if (std::isnan(df)) df = 1.0;          // both variances zero
        denom = std::sqrt(vn1 + vn2);
    }
    if (std::isnan(denom)) return r;
    if (denom == 0.0) {
        if (d == 0.0) return r;
        r.statistic = d > 0 ? Inf : -Inf;
        r.pvalue    = 0.0;
        return r;
    }
    r.statistic = d / denom;
    r.pvalue    = student_t_sf2(r.statistic, df);
    return r;
}

TestResult levene(const std::vector<double>& a, const std::vector<double>& b)
{
    TestResult r;
    if (a.empty() || b.empty()) return r;

    auto deviations = [](const std::vector<double>& v) {
        const double med = median(v);
        std::vector<double> z(v.size());
        for (size_t i = 0; i < v.size(); ++i) z[i] = std::fabs(v[i] - med);
        return z;
    };
    const std::vector<double> za = deviations(a), zb = deviations(b);

    const double na = double(za.size()), nb = double(zb.size()), N = na + nb;
    const double ma = mean(za), mb = mean(zb);
    const double mz = (na * ma + nb * mb) / N;

    const double numer = (N - 2.0) * (na * (ma - mz) * (ma - mz) + nb * (mb - mz) * (mb - mz));
    double denom = 0.0;
    for (double z : za) denom += (z - ma) * (z - ma);
    for (double z : zb) denom += (z - mb) * (z - mb);

    if (N - 2.0 <= 0) return r;
    if (denom == 0.0) {
        if (numer == 0.0) return r;
        r.statistic = Inf;
        r.pvalue    = 0.0;
        return r;
    }
    r.statistic = numer / denom;
    r.pvalue    = f_sf(r.statistic, 1.0, N - 2.0);
    return r;
}

TestResult kstest_gamma(const std::vector<double>& x, const std::vector<double>& gamma_args)
{
    TestResult r;
    if (x.empty() || gamma_args.empty()) return r;

    const double shape = gamma_args[0];
    const double loc   = gamma_args.size() > 1 ? gamma_args[1] : 0.0;
    const double scale = gamma_args.size() > 2 ? gamma_args[2] : 1.0;

    if (std::any_of(x.begin(), x.end(), [](double v){ return std::isnan(v); }))
        return r;

    std::vector<double> s = x;
    std::sort(s.begin(), s.end());
    const double n = double(s.size());

    double d_plus = 0.0, d_minus = 0.0;
    for (size_t i = 0; i < s.size(); ++i) {
        const double F = gamma_cdf(s[i], shape, loc, scale);
        d_plus  = std::max(d_plus,  double(i + 1) / n - F);
        d_minus = std::max(d_minus, F - double(i) / n);
    }
    r.statistic = std::max(d_plus, d_minus);
    r.pvalue    = kolmogorov_sf(long(s.size()), r.statistic);
    return r;
}

} // namespace stats
} // namespace credit_monitor

/* -----------------------------------------------------------
 *  test_stats.cpp – numeric primitives against known values
 * ----------------------------------------------------------- */
#include "stats_util.hpp"
#include "test_util.hpp"

using namespace credit_monitor;

static void test_binomial()
{
    CHECK_NEAR(stats::binom_test(20, 100, 0.25), 0.2983720970, 1e-8);
    CHECK_NEAR(stats::binom_test(3, 10, 0.5),    0.34375,      1e-10);
    CHECK_NEAR(stats::binom_test(9, 10, 0.5),    0.021484375,  1e-10);
    CHECK_NEAR(stats::binom_test(0, 4, 0.5),     0.125,        1e-10);
    CHECK_NEAR(stats::binom_test(5, 10, 0.5),    1.0,          1e-12);
    CHECK(std::isnan(stats::binom_test(0, 0, 0.5)));

    CHECK_NEAR(stats::binom_cdf(2, 4, 0.5), 11.0 / 16.0, 1e-12);
    CHECK_NEAR(stats::binom_sf (2, 4, 0.5),  5.0 / 16.0, 1e-12);
}

static void test_ttests()
{
    /* t = 2*sqrt(3), df = 2: p = 1 - t / sqrt(t^2 + 2) */
    stats::TestResult r = stats::ttest_1samp({1.0, 2.0, 3.0}, 0.0);
    CHECK_NEAR(r.statistic, 2.0 * std::sqrt(3.0), 1e-12);
    CHECK_NEAR(r.pvalue, 1.0 - 2.0 * std::sqrt(3.0) / std::sqrt(14.0), 1e-9);

    /* no spread, no difference */
    r = stats::ttest_1samp({2.0, 2.0, 2.0}, 2.0);
    CHECK(std::isnan(r.pvalue));
    r = stats::ttest_1samp({2.0}, 0.0);
    CHECK(std::isnan(r.pvalue));

    r = stats::ttest_ind({1, 2, 3}, {4, 5, 6}, true);
    CHECK_NEAR(r.statistic, -3.0 / std::sqrt(2.0 / 3.0), 1e-12);
    CHECK_NEAR(r.pvalue, 0.0213116411, 1e-7);

    /* equal variances: Welch agrees with the pooled statistic */
    stats::TestResult w = stats::ttest_ind({1, 2, 3}, {4, 5, 6}, false);
    CHECK_NEAR(w.statistic, r.statistic, 1e-12);
    CHECK_NEAR(w.pvalue, r.pvalue, 1e-9);

    r = stats::ttest_ind({1, 1, 1}, {0, 0, 0}, false);
    CHECK(std::isinf(r.statistic));
    CHECK_NEAR(r.pvalue, 0.0, 0.0);
}

static void test_levene()
{
    stats::TestResult r = stats::levene({1, 2, 3}, {1, 2, 3});
    CHECK_NEAR(r.statistic, 0.0, 1e-12);
    CHECK_NEAR(r.pvalue, 1.0, 1e-9);

    /* W = 0.75 on (1, 2) degrees of freedom */
    r = stats::levene({1, 2, 4}, {7});
    CHECK_NEAR(r.statistic, 0.75, 1e-12);
    CHECK_NEAR(r.pvalue, 1.0 - std::sqrt(0.75) / std::sqrt(2.75), 1e-9);

    CHECK(std::isnan(stats::levene({}, {1.0}).pvalue));
}

static void test_kolmogorov()
{
    /* one point against Exp(1): D = 1 - e^-1, P(D_1 >= d) = 2(1 - d) */
    const double d = 1.0 - std::exp(-1.0);
    stats::TestResult r = stats::kstest_gamma({1.0}, {1.0});
    CHECK_NEAR(r.statistic, d, 1e-12);
    CHECK_NEAR(r.pvalue, 2.0 * (1.0 - d), 1e-9);

    /* loc / scale shift the reference */
    r = stats::kstest_gamma({3.0}, {1.0, 1.0, 2.0});
    CHECK_NEAR(r.statistic, d, 1e-12);

    CHECK_NEAR(stats::kolmogorov_sf(10, 0.0), 1.0, 0.0);
    CHECK_NEAR(stats::kolmogorov_sf(10, 1.0), 0.0, 0.0);
    const double a = stats::kolmogorov_sf(50, 0.1);
    const double b = stats::kolmogorov_sf(50, 0.2);
    CHECK(a > b && a <= 1.0 && b >= 0.0);

    /* large n: limiting distribution, 2 * sum (-1)^(k-1) exp(-2 k^2 lambda^2) */
    CHECK_NEAR(stats::kolmogorov_sf(20000, 0.01),
               2.0 * (std::exp(-4.0) - std::exp(-16.0)), 1e-8);

    CHECK(std::isnan(stats::kstest_gamma({}, {1.0}).pvalue));
    CHECK_NEAR(stats::gamma_cdf(1.0, 1.0), 1.0 - std::exp(-1.0), 1e-12);
    CHECK_NEAR(stats::gamma_cdf(-1.0, 2.0), 0.0, 0.0);
}

static void test_classification()
{
    const std::vector<int>    y     = {0, 0, 1, 1};
    const std::vector<double> score = {0.1, 0.4, 0.35, 0.8};

    stats::RocCurve rc = stats::roc_curve(y, score);
    const std::vector<double> fpr = {0.0, 0.0, 0.5, 0.5, 1.0};
    const std::vector<double> tpr = {0.0, 0.5, 0.5, 1.0, 1.0};
    CHECK(rc.fpr.size() == fpr.size());
    for (size_t i = 0; i < fpr.size() && i < rc.fpr.size(); ++i) {
        CHECK_NEAR(rc.fpr[i], fpr[i], 1e-12);
        CHECK_NEAR(rc.tpr[i], tpr[i], 1e-12);
    }
    CHECK(std::isinf(rc.thresholds.front()));
    CHECK_NEAR(stats::roc_auc(y, score), 0.75, 1e-12);

    /* collinear points collapse */
    rc = stats::roc_curve({1, 1, 1, 0}, {0.9, 0.8, 0.7, 0.1});
    CHECK(rc.fpr.size() == 4);

    CHECK(std::isnan(stats::roc_auc({1, 1, 1}, {0.2, 0.5, 0.9})));

    CHECK_NEAR(stats::f1_score(y, {0, 1, 1, 1}), 0.8, 1e-12);
    CHECK_NEAR(stats::f1_score({0, 0}, {0, 0}), 0.0, 0.0);

    stats::Confusion c = stats::confusion_counts(y, {0, 1, 1, 1});
    CHECK(c.tn == 1 && c.fp == 1 && c.fn == 0 && c.tp == 2);
    CHECK(c.total() == 4);
}

int main()
{
    test_binomial();
    test_ttests();
    test_levene();
    test_kolmogorov();
    test_classification();
    return test_summary("test_stats");
}

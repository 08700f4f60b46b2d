/* -----------------------------------------------------------
 *  test_attribution.cpp – mean |SHAP| ranking
 * ----------------------------------------------------------- */
#include "attribution.hpp"
#include "shap_util.hpp"
#include "test_util.hpp"

using namespace credit_monitor;
using namespace credit_monitor::testing;

/* wrong shape on purpose */
struct NarrowExplainer : IExplainer {
    Eigen::MatrixXd shap_values(const FeatureMatrix& X) const override {
        return Eigen::MatrixXd::Zero(X.rows(), X.cols() - 1);
    }
};

static void test_ranking()
{
    const ModelProvider prov = make_test_provider({"a", "b", "c"});

    Batch b;
    b.records.push_back(make_record("1", {{"a", 1.0},  {"b", 0.5}, {"c", -4.0}, {"x", 99.0}}));
    b.records.push_back(make_record("2", {{"a", -3.0}, {"b", 0.5}, {"c", 4.0}}));

    const AttributionSummary s = attribution_summary(b, prov);
    CHECK(s.values.size() == 3);
    CHECK(s.values[0].first == "b" && s.values[1].first == "a" && s.values[2].first == "c");
    CHECK_NEAR(*s.values[0].second, 0.5, 1e-12);
    CHECK_NEAR(*s.values[1].second, 2.0, 1e-12);
    CHECK_NEAR(*s.values[2].second, 4.0, 1e-12);

    const ojson j = to_json(s);
    CHECK(j.size() == 3);
    CHECK(!j.contains("x"));
    std::vector<std::string> keys;
    for (auto it = j.begin(); it != j.end(); ++it) keys.push_back(it.key());
    CHECK((keys == std::vector<std::string>{"b", "a", "c"}));
}

static void test_empty_and_errors()
{
    const ModelProvider prov = make_test_provider({"a", "b"});

    const AttributionSummary e = attribution_summary(Batch(), prov);
    CHECK(e.values.size() == 2);
    CHECK(e.values[0].first == "a" && !e.values[0].second);
    CHECK(to_json(e)["b"].is_null());

    Batch b;
    b.records.push_back(make_record("1", {{"a", 1.0}}));
    CHECK_THROWS(attribution_summary(b, prov), MissingFeatureError);

    b.records[0].num["b"] = 2.0;
    const ModelProvider narrow(std::make_shared<ColumnModel>(),
                               std::make_shared<NarrowExplainer>(),
                               0.5, {"a", "b"}, default_reference());
    CHECK_THROWS(attribution_summary(b, narrow), std::runtime_error);
}

static void test_helpers()
{
    Eigen::MatrixXd m(2, 2);
    m << -1, 2,
          3, -2;
    const std::vector<double> mu = shap_mean_abs(m);
    CHECK_NEAR(mu[0], 2.0, 0.0);
    CHECK_NEAR(mu[1], 2.0, 0.0);

    /* ties keep feature order, NaN sinks */
    const auto r = rank_ascending({"p", "q", "r"}, {NaN, 2.0, 2.0});
    CHECK(r[0].first == "q" && r[1].first == "r" && r[2].first == "p");
}

int main()
{
    set_log_level(LOG_ERROR);
    test_ranking();
    test_empty_and_errors();
    test_helpers();
    return test_summary("test_attribution");
}

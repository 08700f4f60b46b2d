/* -----------------------------------------------------------
 *  test_config.cpp – MonitorConfig parsing
 * ----------------------------------------------------------- */
#include <cstdio>
#include <fstream>

#include "monitor_config.hpp"
#include "test_util.hpp"

using namespace credit_monitor;

static void test_defaults()
{
    const MonitorConfig c = config_from_json(json::object());
    CHECK(c.fairness.ref_groups.size() == 1);
    CHECK(c.fairness.ref_groups[0].first  == "forty_plus_indicator");
    CHECK(c.fairness.ref_groups[0].second == "Under Forty");
    CHECK_NEAR(c.fairness.alpha, 0.05, 0.0);
    CHECK(c.fairness.mask_significance);
    CHECK(c.drift.housing_column == "home_ownership");
    CHECK(c.drift.rent_value == "RENT");
    CHECK(c.drift.int_rate_column == "int_rate");
    CHECK(c.labels.size() == 2 && c.labels[0] == "Charged Off" && c.labels[1] == "Fully Paid");
    CHECK(c.report_layout == ReportLayout::NESTED);
    CHECK(c.log_level == LOG_INFO);
}

static void test_overrides()
{
    const json j = json::parse(R"({
        "fairness": {"ref_groups": {"grade": "A", "term": "36 months"},
                     "alpha": 0.01, "mask_significance": false},
        "drift": {"rent_value": "MORTGAGE"},
        "labels": ["Default", "Repaid"],
        "report_layout": "flat",
        "log_level": "warn",
        "colour": "blue"
    })");
    const MonitorConfig c = config_from_json(j);
    CHECK(c.fairness.ref_groups.size() == 2);
    CHECK_NEAR(c.fairness.alpha, 0.01, 0.0);
    CHECK(!c.fairness.mask_significance);
    CHECK(c.drift.rent_value == "MORTGAGE");
    CHECK(c.drift.housing_column == "home_ownership");
    CHECK(c.labels[0] == "Default");
    CHECK(c.report_layout == ReportLayout::FLAT);
    CHECK(c.log_level == LOG_WARN);
}

static void test_bad_values()
{
    CHECK_THROWS(config_from_json(json::array()), ConfigError);
    CHECK_THROWS(config_from_json(json::parse(R"({"fairness": {"alpha": 1.5}})")), ConfigError);
    CHECK_THROWS(config_from_json(json::parse(R"({"fairness": {"alpha": "low"}})")), ConfigError);
    CHECK_THROWS(config_from_json(json::parse(R"({"fairness": {"ref_groups": {}}})")), ConfigError);
    CHECK_THROWS(config_from_json(json::parse(R"({"fairness": {"ref_groups": {"a": 1}}})")), ConfigError);
    CHECK_THROWS(config_from_json(json::parse(R"({"fairness": []})")), ConfigError);
    CHECK_THROWS(config_from_json(json::parse(R"({"labels": ["only"]})")), ConfigError);
    CHECK_THROWS(config_from_json(json::parse(R"({"labels": ["x", "x"]})")), ConfigError);
    CHECK_THROWS(config_from_json(json::parse(R"({"report_layout": "wide"})")), ConfigError);
    CHECK_THROWS(config_from_json(json::parse(R"({"log_level": "debug"})")), ConfigError);
    CHECK_THROWS(config_from_json(json::parse(R"({"drift": {"int_rate_column": ""}})")), ConfigError);
}

static void test_file()
{
    CHECK_THROWS(load_config("does_not_exist_monitor.json"), ConfigError);

    const std::string path = "test_config_tmp.json";
    {
        std::ofstream f(path);
        f << "{ not json";
    }
    CHECK_THROWS(load_config(path), ConfigError);
    {
        std::ofstream f(path);
        f << R"({"report_layout": "flat"})";
    }
    CHECK(load_config(path).report_layout == ReportLayout::FLAT);
    std::remove(path.c_str());
}

int main()
{
    set_log_level(LOG_ERROR);
    test_defaults();
    test_overrides();
    test_bad_values();
    test_file();
    return test_summary("test_config");
}

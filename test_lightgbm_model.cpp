/* -----------------------------------------------------------
 *  test_lightgbm_model.cpp – manifest / booster load failures
 * ----------------------------------------------------------- */
#include <cstdio>
#include <fstream>

#include "lightgbm_model.hpp"
#include "test_util.hpp"

using namespace credit_monitor;

static void write(const std::string& path, const std::string& text)
{
    std::ofstream f(path);
    f << text;
}

int main()
{
    set_log_level(LOG_ERROR);

    CHECK_THROWS(load_lightgbm_provider("no_such_manifest.json"), InitializationError);

    const std::string path = "test_lgbm_manifest.json";

    write(path, "{ broken");
    CHECK_THROWS(load_lightgbm_provider(path), InitializationError);

    write(path, R"({"threshold": 0.5, "features": ["a"], "rent_ratio": 0.2,
                    "gamma_args": [1.0], "int_rate_mean": 12.0})");
    CHECK_THROWS(load_lightgbm_provider(path), InitializationError);

    write(path, R"({"model_file": "no_such_model.txt", "threshold": 0.5,
                    "features": ["a"], "rent_ratio": 0.2,
                    "gamma_args": [1.0], "int_rate_mean": 12.0})");
    CHECK_THROWS(load_lightgbm_provider(path), InitializationError);

    CHECK_THROWS(LGBBooster("no_such_model.txt"), InitializationError);

    std::remove(path.c_str());
    return test_summary("test_lightgbm_model");
}

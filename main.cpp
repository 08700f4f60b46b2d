/* -----------------------------------------------------------
 *  main.cpp – batch driver: score and / or monitor one batch
 * ----------------------------------------------------------- */
#include "common.hpp"
#include <fstream>
#include <iostream>

#include "lightgbm_model.hpp"
#include "orchestrator.hpp"

static void usage()
{
    std::cerr <<
        "usage: credit_monitor_run --artifacts=<manifest.json> --input=<batch.csv|batch.json>\n"
        "                          [--config=<monitor.json>] [--mode=score|metrics|both]\n"
        "                          [--output=<file>] [--pretty]\n";
}

using namespace credit_monitor;

/* ----------------------------------------------------------- */
int main(int argc, char* argv[])
{
    /* ========== 1. CLI ======================================= */
    std::string artifacts, input, config_path, output;
    std::string mode   = "both";
    bool        pretty = false;

    for (int i = 1; i < argc; ++i) {
        std::string a(argv[i]);
        if      (a.rfind("--artifacts=",0)==0) artifacts   = a.substr(12);
        else if (a.rfind("--input=",0)==0)     input       = a.substr(8);
        else if (a.rfind("--config=",0)==0)    config_path = a.substr(9);
        else if (a.rfind("--mode=",0)==0)      mode        = a.substr(7);
        else if (a.rfind("--output=",0)==0)    output      = a.substr(9);
        else if (a == "--pretty")              pretty      = true;
        else if (a == "--help" || a == "-h") { usage(); return 0; }
        else                                   logW("ignored arg: "+a);
    }
    if (artifacts.empty() || input.empty()) { usage(); return 1; }
    if (mode!="score" && mode!="metrics" && mode!="both") {
        logE("unknown --mode="+mode); return 1;
    }

    try {
        /* ========== 2. config + provider ===================== */
        MonitorConfig cfg;
        if (!config_path.empty()) cfg = load_config(config_path);
        set_log_level(cfg.log_level);

        const ModelProvider provider = load_lightgbm_provider(artifacts);
        logI("loaded model with " + std::to_string(provider.feature_order().size()) +
             " features, threshold " + std::to_string(provider.threshold()));

        /* ========== 3. batch ================================= */
        const Batch batch = load_batch(input);
        logI("batch " + input + ": " + std::to_string(batch.size()) + " records" +
             (batch.is_validated() ? " (validated)" : ""));

        /* ========== 4. run =================================== */
        const MetricsOrchestrator orch(provider, cfg);
        ojson out;
        if (mode == "score") {
            out = to_json(orch.score(batch));
        } else if (mode == "metrics") {
            out = to_json(orch.metrics(batch), cfg.report_layout);
        } else {
            out = ojson::object();
            out["scores"]  = to_json(orch.score(batch));
            out["metrics"] = to_json(orch.metrics(batch), cfg.report_layout);
        }

        /* ========== 5. write ================================= */
        const std::string text = out.dump(pretty ? 2 : -1);
        if (output.empty()) {
            std::cout << text << '\n';
        } else {
            std::ofstream f(output);
            if (!f) throw InputError("cannot write " + output);
            f << text << '\n';
            logI("wrote " + output);
        }
    } catch (const std::exception& e) {
        logE(e.what()); return 1;
    }
    return 0;
}

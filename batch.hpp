/* ──────────────────────────────────────────────────────────────
   batch.hpp   –  scored records, batches, feature derivation
   ────────────────────────────────────────────────────────────── */
#pragma once
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "common.hpp"

namespace credit_monitor {

/* ground-truth encoding: 1 = "Fully Paid", 0 = "Charged Off" */
constexpr int LABEL_CHARGED_OFF = 0;
constexpr int LABEL_FULLY_PAID  = 1;

struct Record {
    std::string id;
    ojson       id_value;                               // id as given in JSON input
    std::unordered_map<std::string, double>      num;   // numeric inputs
    std::unordered_map<std::string, std::string> cat;   // categorical inputs
    std::optional<int> loan_status;                     // ground truth

    /* derived */
    int    rent_indicator = 0;
    double probability    = NaN;
    int    prediction     = 0;

    std::optional<double>      numeric    (const std::string& name) const;
    std::optional<std::string> categorical(const std::string& name) const;
};

struct Batch {
    std::vector<Record> records;

    size_t size()  const { return records.size(); }
    bool   empty() const { return records.empty(); }

    /* every record carries ground truth (an empty batch never does) */
    bool is_validated() const;
};

/* "Fully Paid"/"Charged Off" or 0/1; nullopt when empty or unknown */
std::optional<int> parse_loan_status(const json& v);

/* ---- loaders ---- */
Batch batch_from_json(const json& records);          // records orientation
Batch load_batch_csv (const std::string& path);
Batch load_batch     (const std::string& path);      // by extension

/* ---- Feature Deriver ----------------------------------------
 * Returns a copy of `in` with rent_indicator set (1 iff the housing
 * column equals rent_value). The indicator is also exposed as the
 * numeric field "rent_indicator" so it can feed the model.          */
Batch derive_features(const Batch&       in,
                      const std::string& housing_column = "home_ownership",
                      const std::string& rent_value     = "RENT");

} // namespace credit_monitor

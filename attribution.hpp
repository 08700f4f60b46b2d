#pragma once
#include <string>
#include <utility>
#include <vector>

#include "batch.hpp"
#include "model_iface.hpp"

namespace credit_monitor {

/* feature → mean |attribution|, lowest impact first */
struct AttributionSummary {
    std::vector<std::pair<std::string, Nullable>> values;
};

AttributionSummary attribution_summary(const Batch& batch, const ModelProvider& provider);

ojson to_json(const AttributionSummary& a);

} // namespace credit_monitor

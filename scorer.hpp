#pragma once
#include <string>
#include <vector>

#include "batch.hpp"
#include "model_iface.hpp"

namespace credit_monitor {

struct ScoredRecord {
    std::string id;
    double      probability = NaN;
    int         prediction  = 0;
    ojson       id_value;               // original JSON id; null falls back to id
};

/* columns exactly in feature_order; extra fields ignored.
   Throws MissingFeatureError on the first absent feature.          */
FeatureMatrix build_feature_matrix(const Batch&                    batch,
                                   const std::vector<std::string>& feature_order);

/* prediction = 1 iff probability > threshold */
inline int threshold_label(double probability, double threshold)
{
    return probability > threshold ? 1 : 0;
}

/* copy of `batch` with probability / prediction filled in */
Batch score_batch(const Batch& batch, const ModelProvider& provider);

/* projection {id, probability, prediction}, input order */
std::vector<ScoredRecord> project_scores(const Batch& scored);

ojson to_json(const std::vector<ScoredRecord>& scores);

} // namespace credit_monitor

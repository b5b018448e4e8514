/*───────────────────────────────────────────────────────────
 *  feature_scaler.hpp   –  per-slot standardisation
 *
 *  feature_scaler.json:
 *     { "mean": [14 doubles], "scale": [14 doubles],
 *       "feature_names": [...] }
 *───────────────────────────────────────────────────────────*/
#pragma once

#include <vector>

#include "cropadvisor/features.hpp"

namespace cropadvisor {

class FeatureScaler {
public:
    FeatureScaler();                                  // identity

    /* column mean / population std over the rows; std 0 → scale 1 */
    static FeatureScaler fit(const std::vector<FeatureVector>& rows);

    FeatureVector transform(const FeatureVector& f) const;

    json to_json() const;
    /* throws PersistenceFailure on a malformed document */
    static FeatureScaler from_json(const json& j);

    const FeatureVector& mean()  const { return mean_; }
    const FeatureVector& scale() const { return scale_; }

private:
    FeatureVector mean_;
    FeatureVector scale_;
};

} // namespace cropadvisor

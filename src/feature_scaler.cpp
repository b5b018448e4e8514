/*───────────────────────────────────────────────────────────
 *  feature_scaler.cpp
 *───────────────────────────────────────────────────────────*/
#include "cropadvisor/feature_scaler.hpp"

#include <Eigen/Dense>
#include <cmath>

#include "cropadvisor/errors.hpp"

namespace cropadvisor {

FeatureScaler::FeatureScaler()
{
    mean_.fill(0.0);
    scale_.fill(1.0);
}

FeatureScaler FeatureScaler::fit(const std::vector<FeatureVector>& rows)
{
    FeatureScaler s;
    const int N = static_cast<int>(rows.size());
    if (N == 0) return s;

    Eigen::MatrixXd A(N, NUM_FEATS);
    for (int i = 0; i < N; ++i)
        for (int k = 0; k < NUM_FEATS; ++k)
            A(i, k) = rows[i][k];

    for (int k = 0; k < NUM_FEATS; ++k) {
        const double mean = A.col(k).mean();
        const double sd   = std::sqrt((A.col(k).array() - mean).square().sum() / N);
        s.mean_[k]  = mean;
        s.scale_[k] = (sd > 1e-12 && std::isfinite(sd)) ? sd : 1.0;
    }
    return s;
}

FeatureVector FeatureScaler::transform(const FeatureVector& f) const
{
    FeatureVector out;
    for (int k = 0; k < NUM_FEATS; ++k)
        out[k] = (f[k] - mean_[k]) / scale_[k];
    return out;
}

json FeatureScaler::to_json() const
{
    json j;
    j["mean"]  = std::vector<double>(mean_.begin(), mean_.end());
    j["scale"] = std::vector<double>(scale_.begin(), scale_.end());
    json names = json::array();
    for (const char* n : feature_names()) names.push_back(n);
    j["feature_names"] = names;
    return j;
}

FeatureScaler FeatureScaler::from_json(const json& j)
{
    if (!j.is_object() || !j.contains("mean") || !j.contains("scale") ||
        !j["mean"].is_array() || !j["scale"].is_array() ||
        j["mean"].size() != size_t(NUM_FEATS) || j["scale"].size() != size_t(NUM_FEATS))
        throw PersistenceFailure("feature_scaler.json: expected " +
                                 std::to_string(NUM_FEATS) + " means and scales");

    FeatureScaler s;
    for (int k = 0; k < NUM_FEATS; ++k) {
        s.mean_[k] = parse_number(j["mean"][k], 0.0);
        const double sc = parse_number(j["scale"][k], 1.0);
        s.scale_[k] = (sc > 0.0 && std::isfinite(sc)) ? sc : 1.0;
    }
    return s;
}

} // namespace cropadvisor

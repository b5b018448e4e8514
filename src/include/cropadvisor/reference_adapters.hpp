/*───────────────────────────────────────────────────────────
 *  reference_adapters.hpp   –  file-backed collaborators
 *
 *  CatalogBaseProvider   JSON crop catalog:
 *     [ { "crop":"wheat", "season":"rabi", "soil_types":["loamy"],
 *         "suitability_score":80, "yield_per_hectare":45, ... } ]
 *  SnapshotGateway       <dir>/<location lower-case>/{weather,
 *                        market,soil}.json
 *───────────────────────────────────────────────────────────*/
#pragma once

#include <string>
#include <vector>

#include "cropadvisor/gateway.hpp"

namespace cropadvisor {

constexpr double SOIL_MATCH_BONUS = 10.0;

class CatalogBaseProvider : public BaseRecommendationProvider {
public:
    /* throws DataUnavailable when the catalog cannot be read */
    explicit CatalogBaseProvider(const std::string& catalog_path);
    explicit CatalogBaseProvider(const json& catalog);

    std::vector<CropCandidate>
    get_crop_recommendations(const std::string&    location,
                             const std::string&    soil_type,
                             const std::string&    season,
                             std::optional<double> lat,
                             std::optional<double> lon) override;

    size_t size() const { return entries_.size(); }

private:
    struct Entry {
        CropCandidate            candidate;
        std::vector<std::string> soil_types;
    };
    void parse(const json& catalog);

    std::vector<Entry> entries_;
};

class SnapshotGateway : public GovernmentDataGateway {
public:
    explicit SnapshotGateway(std::string dir) : dir_(std::move(dir)) {}

    GatewayReply get_weather_data    (const std::string& location,
                                      std::optional<double> lat,
                                      std::optional<double> lon) override;
    GatewayReply get_market_prices   (const std::string& location,
                                      std::optional<double> lat,
                                      std::optional<double> lon) override;
    GatewayReply get_soil_health_data(const std::string& location,
                                      std::optional<double> lat,
                                      std::optional<double> lon) override;

private:
    GatewayReply read(const std::string& location, const char* file) const;

    std::string dir_;
};

} // namespace cropadvisor

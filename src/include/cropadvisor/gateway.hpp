/*───────────────────────────────────────────────────────────
 *  gateway.hpp   –  the two upstream collaborators
 *
 *  GovernmentDataGateway       weather / market / soil fetches,
 *                              {status, data}; anything but
 *                              "success" counts as unavailable
 *  BaseRecommendationProvider  baseline candidate list; throws
 *                              DataUnavailable on failure
 *───────────────────────────────────────────────────────────*/
#pragma once

#include <optional>
#include <string>
#include <vector>

#include "cropadvisor/records.hpp"

namespace cropadvisor {

struct GatewayReply {
    std::string status = "error";
    json        data   = json::object();
    std::string message;

    bool ok() const { return status == "success"; }

    static GatewayReply success(json d) { GatewayReply r; r.status = "success"; r.data = std::move(d); return r; }
    static GatewayReply error(std::string why) { GatewayReply r; r.message = std::move(why); return r; }
};

struct GovernmentDataGateway {
    virtual ~GovernmentDataGateway() = default;

    virtual GatewayReply get_weather_data    (const std::string& location,
                                              std::optional<double> lat,
                                              std::optional<double> lon) = 0;
    virtual GatewayReply get_market_prices   (const std::string& location,
                                              std::optional<double> lat,
                                              std::optional<double> lon) = 0;
    virtual GatewayReply get_soil_health_data(const std::string& location,
                                              std::optional<double> lat,
                                              std::optional<double> lon) = 0;
};

struct BaseRecommendationProvider {
    virtual ~BaseRecommendationProvider() = default;

    virtual std::vector<CropCandidate>
        get_crop_recommendations(const std::string&    location,
                                 const std::string&    soil_type,
                                 const std::string&    season,
                                 std::optional<double> lat,
                                 std::optional<double> lon) = 0;
};

} // namespace cropadvisor

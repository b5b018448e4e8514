/*───────────────────────────────────────────────────────────
 *  records.hpp   –  typed event records, aggregates, requests
 *───────────────────────────────────────────────────────────*/
#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "cropadvisor/common.hpp"

namespace cropadvisor {

/* ────────────────── weather ────────────────── */
struct ForecastDay {
    std::string           date;
    std::optional<double> temperature;     // °C
    std::string           condition;       // free text, e.g. "Light rain"
    std::optional<double> rainfall_mm;
};

struct WeatherSnapshot {
    std::optional<double>    temperature;  // current, °C
    std::optional<double>    humidity;     // %
    std::string              condition;
    std::optional<double>    rainfall_mm;  // current
    std::vector<ForecastDay> forecast;     // nominally 7 days

    bool empty() const
    {
        return !temperature && !humidity && condition.empty() &&
               !rainfall_mm && forecast.empty();
    }
};

/* lenient: temperatures may be 25, "25", "25°C"; humidity "65%" */
WeatherSnapshot weather_from_json(const json& j);
json            to_json(const WeatherSnapshot& w);

/* ────────────────── events ────────────────── */
struct RecommendationRecord {
    std::string              id;           // REC_<stamp>_<hex>, assigned by the store
    std::string              location;
    std::optional<double>    latitude;
    std::optional<double>    longitude;
    std::string              season;
    std::string              soil_type;
    WeatherSnapshot          weather;
    std::vector<std::string> crops_offered;
    std::string              timestamp;
};

struct FeedbackRecord {
    std::string              id;           // FB_<stamp>_<hex>, assigned by the store
    std::string              recommendation_id;   // weak reference
    std::string              farmer_id;
    std::string              location;     // aggregate key; resolved from the
    std::string              season;       //  recommendation when empty
    std::string              crop_chosen;
    double                   yield_achieved      = 0;   // quintal/ha
    double                   profit_realized     = 0;   // ₹/ha
    int                      satisfaction_rating = 0;   // 1-5, 0 = not given
    bool                     success             = false;
    std::vector<std::string> challenges;
    std::string              comments;
    std::string              timestamp;
};

json                 to_json(const RecommendationRecord& r);
RecommendationRecord recommendation_from_json(const json& j);
json                 to_json(const FeedbackRecord& f);
FeedbackRecord       feedback_from_json(const json& j);

/* ────────────────── aggregates ────────────────── */
struct AggregateKey {
    std::string location;
    std::string crop;
    std::string season;

    std::string str() const { return location + '_' + crop + '_' + season; }
    bool operator==(const AggregateKey& o) const
    {
        return location == o.location && crop == o.crop && season == o.season;
    }
};

struct AggregateKeyHash {
    size_t operator()(const AggregateKey& k) const
    {
        return std::hash<std::string>()(k.str());
    }
};

struct PerformanceAggregate {
    AggregateKey key;
    long   attempts     = 0;
    long   successes    = 0;
    double yield_sum    = 0;
    double profit_sum   = 0;
    double success_rate = 0;     // successes / attempts, in [0,1]
    double avg_yield    = 0;
    double avg_profit   = 0;
    std::string last_updated;

    /* O(1) running-sum update; derived fields recomputed from sums */
    void apply(bool success, double yield, double profit);
    void recompute_derived();
};

json                 to_json(const PerformanceAggregate& a);
PerformanceAggregate aggregate_from_json(const json& j);

/* ────────────────── request entity ────────────────── */
struct RecommendationQuery {
    std::string                location;
    std::optional<std::string> soil_type;
    std::optional<std::string> season;
    std::optional<double>      latitude;
    std::optional<double>      longitude;
    std::optional<std::string> crop;
};

/* ────────────────── base-provider candidate ────────────────── */
struct CropCandidate {
    std::string crop;
    double suitability_score  = 70;
    double yield_per_hectare  = 40;
    double profit_per_hectare = 50000;
    double msp_per_quintal    = 2000;
    int    duration_days      = 120;
    std::string season;              // empty = unknown
    std::string water_requirement;   // low / moderate / high, empty = unknown
    json   extra = json::object();   // provider fields passed through untouched
};

CropCandidate candidate_from_json(const json& j);
json          to_json(const CropCandidate& c);

} // namespace cropadvisor

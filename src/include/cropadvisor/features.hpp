/*───────────────────────────────────────────────────────────
 *  features.hpp   –  fixed-order model input vector
 *
 *   #  slot                   default
 *   0  temp_current           25
 *   1  temp_avg_7d            current temp
 *   2  temp_min_7d            current temp
 *   3  temp_max_7d            current temp
 *   4  humidity               65
 *   5  rain_current_mm        0   (5 when condition reports rain)
 *   6  rain_forecast_7d_mm    0   (5 per rainy day unless mm given)
 *   7  soil_code              6   black=1 red=2 alluvial=3 sandy=4 clayey=5 loamy=6
 *   8  season_code            1   kharif=1 rabi=2 zaid=3 year_round=4
 *   9  latitude               28.0
 *  10  longitude              77.0
 *  11  duration_days          120
 *  12  water_code             2   low=1 moderate=2 high=3
 *  13  profit_norm            0.5 (profit_per_hectare / 100000)
 *
 *  Every slot is defaulted on its own; the vector is always full.
 *───────────────────────────────────────────────────────────*/
#pragma once

#include <array>
#include <optional>
#include <string>

#include "cropadvisor/crop_knowledge.hpp"
#include "cropadvisor/records.hpp"

namespace cropadvisor {

constexpr int NUM_FEATS = 14;

using FeatureVector = std::array<double, NUM_FEATS>;

enum FeatureSlot : int {
    F_TEMP_CURRENT = 0, F_TEMP_AVG, F_TEMP_MIN, F_TEMP_MAX,
    F_HUMIDITY,
    F_RAIN_CURRENT, F_RAIN_FORECAST,
    F_SOIL, F_SEASON,
    F_LAT, F_LON,
    F_DURATION, F_WATER, F_PROFIT_NORM
};

/* ---------- documented defaults ---------- */
constexpr double DEFAULT_TEMP        = 25.0;
constexpr double DEFAULT_HUMIDITY    = 65.0;
constexpr double DEFAULT_LATITUDE    = 28.0;
constexpr double DEFAULT_LONGITUDE   = 77.0;
constexpr int    DEFAULT_DURATION    = 120;
constexpr double DEFAULT_PROFIT      = 50000.0;
constexpr double PROFIT_NORMALIZER   = 100000.0;
constexpr double RAIN_EVENT_MM       = 5.0;      // estimate per rainy report

const std::array<const char*, NUM_FEATS>& feature_names();

struct CropAttributes {
    std::string              name;
    std::string              season;                // kharif / rabi / zaid / year_round
    std::optional<int>       duration_days;
    std::optional<WaterNeed> water;
    std::optional<double>    profit_per_hectare;
};

struct LocationInfo {
    std::string           name;
    std::optional<double> latitude;
    std::optional<double> longitude;
};

struct SoilInfo {
    std::string type;                               // empty → loamy
};

int soil_code  (const std::string& soil);          // unknown → 6 (loamy)
int season_code(const std::string& season);        // unknown → 1 (kharif)

/* condition text mentions rain / shower / drizzle */
bool reports_rain(const std::string& condition);

FeatureVector extract_features(const CropAttributes&  crop,
                               const WeatherSnapshot& weather,
                               const LocationInfo&    location,
                               const SoilInfo&        soil);

/* one joined (recommendation, feedback) row */
struct Outcome {
    int    success = 0;          // 1 / 0
    double yield   = 0;          // quintal/ha
    double profit  = 0;          // ₹/ha
};

struct TrainingSample {
    FeatureVector feat{};
    Outcome       outcome;
    std::string   crop;
    std::string   recommendation_id;
};

/* candidate + knowledge base → crop attributes (candidate wins when set) */
CropAttributes crop_attributes(const CropCandidate& c,
                               const CropKnowledge& kb,
                               const std::string&   request_season);

} // namespace cropadvisor

/*───────────────────────────────────────────────────────────
 *  forecast_analyzer.hpp   –  multi-day weather → [0,20] signal
 *
 *  score = mean(temperature sub-score, rainfall sub-score)
 *  Empty series → neutral 10, status "no_forecast", conf 0.5.
 *───────────────────────────────────────────────────────────*/
#pragma once

#include <string>
#include <vector>

#include "cropadvisor/crop_knowledge.hpp"
#include "cropadvisor/records.hpp"

namespace cropadvisor {

constexpr double NEUTRAL_WEATHER_SCORE = 10.0;
constexpr double MAX_WEATHER_SCORE     = 20.0;
constexpr double HEAVY_RAIN_MM         = 64.5;   // IMD "heavy" threshold, 24 h

struct ForecastSummary {
    double      avg_temp      = 0;
    double      min_temp      = 0;
    double      max_temp      = 0;
    int         rainy_days    = 0;
    int         forecast_days = 0;
    std::string status        = "no_forecast";   // "available" | "no_forecast"
};

struct TemperatureAnalysis {
    double      score    = NEUTRAL_WEATHER_SCORE;
    double      avg_temp = 0, min_temp = 0, max_temp = 0;
    double      optimal  = 0;
    std::string status   = "unknown";   // optimal | suitable | too_cold | too_hot
};

struct RainfallAnalysis {
    double      score      = NEUTRAL_WEATHER_SCORE;
    int         rainy_days = 0;
    WaterNeed   water      = WaterNeed::Moderate;
    std::string status     = "unknown";
};

struct ForecastAnalysis {
    double                   suitability_score = NEUTRAL_WEATHER_SCORE;
    std::string              status            = "no_forecast";
    TemperatureAnalysis      temperature;
    RainfallAnalysis         rainfall;
    std::vector<std::string> warnings;
    std::vector<std::string> advisories;
    double                   confidence        = 0.5;
};

json to_json(const ForecastSummary& s);
json to_json(const ForecastAnalysis& a);

/* a forecast day counts as rainy */
bool is_rainy_day(const ForecastDay& d);

class ForecastAnalyzer {
public:
    explicit ForecastAnalyzer(const CropKnowledge& kb) : kb_(kb) {}

    ForecastSummary  summarize(const std::vector<ForecastDay>& series) const;
    ForecastAnalysis analyze_forecast(const std::vector<ForecastDay>& series,
                                      const std::string& crop) const;

private:
    TemperatureAnalysis temperature(const std::vector<ForecastDay>& series,
                                    const TempBand& band) const;
    RainfallAnalysis    rainfall(const std::vector<ForecastDay>& series,
                                 WaterNeed water) const;

    const CropKnowledge& kb_;
};

} // namespace cropadvisor

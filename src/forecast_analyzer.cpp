/*───────────────────────────────────────────────────────────
 *  forecast_analyzer.cpp
 *───────────────────────────────────────────────────────────*/
#include "cropadvisor/forecast_analyzer.hpp"

#include <algorithm>
#include <cmath>

#include "cropadvisor/features.hpp"

namespace cropadvisor {

namespace {

double day_temp(const ForecastDay& d)
{
    return d.temperature.value_or(DEFAULT_TEMP);
}

void add_unique(std::vector<std::string>& v, const std::string& s)
{
    if (std::find(v.begin(), v.end(), s) == v.end()) v.push_back(s);
}

} // namespace

bool is_rainy_day(const ForecastDay& d)
{
    if (d.rainfall_mm && *d.rainfall_mm > 0.0) return true;
    return reports_rain(d.condition);
}


/* ────────────────── summary ────────────────── */
ForecastSummary ForecastAnalyzer::summarize(const std::vector<ForecastDay>& series) const
{
    ForecastSummary s;
    if (series.empty()) return s;

    double sum = 0;
    s.min_temp = day_temp(series.front());
    s.max_temp = s.min_temp;
    for (const auto& d : series) {
        const double t = day_temp(d);
        sum       += t;
        s.min_temp = std::min(s.min_temp, t);
        s.max_temp = std::max(s.max_temp, t);
        if (is_rainy_day(d)) ++s.rainy_days;
    }
    s.forecast_days = static_cast<int>(series.size());
    s.avg_temp      = round_to(sum / double(series.size()), 1);
    s.status        = "available";
    return s;
}


/* ────────────────── sub-scores ────────────────── */
TemperatureAnalysis
ForecastAnalyzer::temperature(const std::vector<ForecastDay>& series,
                              const TempBand& band) const
{
    TemperatureAnalysis t;
    const ForecastSummary s = summarize(series);
    if (s.forecast_days == 0) return t;

    double sum = 0;
    for (const auto& d : series) sum += day_temp(d);
    const double avg = sum / double(series.size());

    double score;
    if (avg >= band.min && avg <= band.max) {
        score    = clamp_val(20.0 - 2.0 * std::fabs(avg - band.optimal), 10.0, 20.0);
        t.status = score >= 18.0 ? "optimal" : "suitable";
    } else if (avg < band.min) {
        score    = std::max(0.0, 10.0 - 3.0 * (band.min - avg));
        t.status = "too_cold";
    } else {
        score    = std::max(0.0, 10.0 - 3.0 * (avg - band.max));
        t.status = "too_hot";
    }
    t.score    = round_to(score, 1);
    t.avg_temp = round_to(avg, 1);
    t.min_temp = round_to(s.min_temp, 1);
    t.max_temp = round_to(s.max_temp, 1);
    t.optimal  = band.optimal;
    return t;
}

RainfallAnalysis
ForecastAnalyzer::rainfall(const std::vector<ForecastDay>& series, WaterNeed water) const
{
    RainfallAnalysis r;
    r.water = water;
    for (const auto& d : series)
        if (is_rainy_day(d)) ++r.rainy_days;

    const int n = r.rainy_days;
    switch (water) {
    case WaterNeed::High:
        if      (n >= 4) { r.score = 20; r.status = "excellent"; }
        else if (n >= 2) { r.score = 15; r.status = "good"; }
        else             { r.score = 8;  r.status = "needs_irrigation"; }
        break;
    case WaterNeed::Moderate:
        if      (n >= 2 && n <= 4) { r.score = 20; r.status = "optimal"; }
        else if (n >= 5)           { r.score = 12; r.status = "excess_rain_risk"; }
        else                       { r.score = 14; r.status = "acceptable"; }
        break;
    case WaterNeed::Low:
        if      (n <= 2) { r.score = 20; r.status = "excellent"; }
        else if (n <= 4) { r.score = 15; r.status = "acceptable"; }
        else             { r.score = 10; r.status = "excess_moisture"; }
        break;
    }
    return r;
}


/* ────────────────── full analysis ────────────────── */
ForecastAnalysis
ForecastAnalyzer::analyze_forecast(const std::vector<ForecastDay>& series,
                                   const std::string& crop) const
{
    ForecastAnalysis a;
    if (series.empty()) {
        a.advisories.push_back("Weather forecast unavailable");
        return a;
    }

    const CropProfile prof = kb_.profile(crop);
    a.temperature = temperature(series, prof.temp);
    a.rainfall    = rainfall(series, prof.water);
    a.status      = "available";

    /* ---- warnings, deduplicated ---- */
    for (const auto& d : series) {
        if (contains_ci(d.condition, "storm") || d.condition.find("तूफान") != std::string::npos)
            add_unique(a.warnings, "Storm predicted - may damage crops");

        const double t = day_temp(d);
        if (t > 40.0)
            add_unique(a.warnings, "Extreme heat predicted - ensure adequate irrigation");
        else if (t < 5.0)
            add_unique(a.warnings, "Frost risk - protect sensitive crops");

        if (contains_ci(d.condition, "heavy") ||
            d.condition.find("भारी") != std::string::npos ||
            (d.rainfall_mm && *d.rainfall_mm >= HEAVY_RAIN_MM))
            add_unique(a.warnings, "Heavy rainfall predicted - ensure drainage");
    }

    /* ---- advisories ---- */
    const std::string& ts = a.temperature.status;
    if (ts == "too_cold")     a.advisories.push_back("Temperature below optimal - consider delaying sowing");
    else if (ts == "too_hot") a.advisories.push_back("High temperatures expected - ensure irrigation");
    else if (ts == "optimal") a.advisories.push_back("Temperature conditions optimal for " + crop);

    const std::string& rs = a.rainfall.status;
    if (rs == "needs_irrigation")      a.advisories.push_back("Low rainfall predicted - arrange irrigation");
    else if (rs == "excess_rain_risk") a.advisories.push_back("Heavy rainfall expected - ensure proper drainage");
    else if (rs == "excellent" || rs == "optimal")
        a.advisories.push_back("Rainfall conditions favorable for " + crop);

    if (a.temperature.score >= 15 && a.rainfall.score >= 15)
        a.advisories.push_back("Excellent time to sow " + crop);
    else if (a.temperature.score < 10 || a.rainfall.score < 10)
        a.advisories.push_back("Consider waiting for better conditions");

    const double mean = (a.temperature.score + a.rainfall.score) / 2.0;
    a.suitability_score = round_to(clamp_val(mean, 0.0, MAX_WEATHER_SCORE), 1);
    a.confidence        = series.size() >= 5 ? 0.85 : 0.65;
    return a;
}


/* ────────────────── JSON ────────────────── */
json to_json(const ForecastSummary& s)
{
    json j;
    j["status"]        = s.status;
    j["forecast_days"] = s.forecast_days;
    j["rainy_days"]    = s.rainy_days;
    if (s.forecast_days > 0) {
        j["avg_temp"] = s.avg_temp;
        j["min_temp"] = s.min_temp;
        j["max_temp"] = s.max_temp;
    }
    return j;
}

json to_json(const ForecastAnalysis& a)
{
    json j;
    j["suitability_score"] = a.suitability_score;
    j["status"]            = a.status;
    j["confidence"]        = a.confidence;
    j["warnings"]          = a.warnings;
    j["advisories"]        = a.advisories;
    if (a.status == "available") {
        j["temperature_analysis"] = {
            {"score",        a.temperature.score},
            {"avg_temp",     a.temperature.avg_temp},
            {"min_temp",     a.temperature.min_temp},
            {"max_temp",     a.temperature.max_temp},
            {"optimal_temp", a.temperature.optimal},
            {"status",       a.temperature.status}
        };
        j["rainfall_analysis"] = {
            {"score",             a.rainfall.score},
            {"rainy_days",        a.rainfall.rainy_days},
            {"water_requirement", to_string(a.rainfall.water)},
            {"status",            a.rainfall.status}
        };
    }
    return j;
}

} // namespace cropadvisor

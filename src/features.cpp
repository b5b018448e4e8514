/*───────────────────────────────────────────────────────────
 *  features.cpp   –  weather / soil / season / crop → vector
 *───────────────────────────────────────────────────────────*/
#include "cropadvisor/features.hpp"

#include <algorithm>
#include <numeric>
#include <vector>

namespace cropadvisor {

const std::array<const char*, NUM_FEATS>& feature_names()
{
    static const std::array<const char*, NUM_FEATS> names = {
        "temp_current", "temp_avg_7d", "temp_min_7d", "temp_max_7d",
        "humidity",
        "rain_current_mm", "rain_forecast_7d_mm",
        "soil_code", "season_code",
        "latitude", "longitude",
        "duration_days", "water_code", "profit_norm"
    };
    return names;
}

int soil_code(const std::string& soil)
{
    const std::string s = to_lower(soil);
    if (s == "black")    return 1;
    if (s == "red")      return 2;
    if (s == "alluvial") return 3;
    if (s == "sandy")    return 4;
    if (s == "clayey" || s == "clay") return 5;
    return 6;                                   // loamy / unknown
}

int season_code(const std::string& season)
{
    const std::string s = to_lower(season);
    if (s == "rabi")       return 2;
    if (s == "zaid")       return 3;
    if (s == "year_round") return 4;
    return 1;                                   // kharif / unknown
}

bool reports_rain(const std::string& condition)
{
    return contains_ci(condition, "rain")   ||
           contains_ci(condition, "shower") ||
           contains_ci(condition, "drizzle")||
           condition.find("बारिश") != std::string::npos;
}

FeatureVector extract_features(const CropAttributes&  crop,
                               const WeatherSnapshot& weather,
                               const LocationInfo&    location,
                               const SoilInfo&        soil)
{
    FeatureVector f{};

    /* ---- temperature: current + forecast days ---- */
    const double current = weather.temperature.value_or(DEFAULT_TEMP);
    std::vector<double> temps{current};
    for (const auto& d : weather.forecast)
        if (d.temperature) temps.push_back(*d.temperature);

    f[F_TEMP_CURRENT] = current;
    f[F_TEMP_AVG]     = std::accumulate(temps.begin(), temps.end(), 0.0) / double(temps.size());
    f[F_TEMP_MIN]     = *std::min_element(temps.begin(), temps.end());
    f[F_TEMP_MAX]     = *std::max_element(temps.begin(), temps.end());

    f[F_HUMIDITY]     = clamp_val(weather.humidity.value_or(DEFAULT_HUMIDITY), 0.0, 100.0);

    /* ---- rainfall ---- */
    if (weather.rainfall_mm)
        f[F_RAIN_CURRENT] = std::max(0.0, *weather.rainfall_mm);
    else
        f[F_RAIN_CURRENT] = reports_rain(weather.condition) ? RAIN_EVENT_MM : 0.0;

    double rain_7d = 0.0;
    for (const auto& d : weather.forecast) {
        if (d.rainfall_mm)                rain_7d += std::max(0.0, *d.rainfall_mm);
        else if (reports_rain(d.condition)) rain_7d += RAIN_EVENT_MM;
    }
    f[F_RAIN_FORECAST] = rain_7d;

    /* ---- categorical ---- */
    f[F_SOIL]   = soil_code(soil.type);
    f[F_SEASON] = season_code(crop.season);

    /* ---- location ---- */
    f[F_LAT] = location.latitude.value_or(DEFAULT_LATITUDE);
    f[F_LON] = location.longitude.value_or(DEFAULT_LONGITUDE);

    /* ---- crop characteristics ---- */
    f[F_DURATION]    = crop.duration_days && *crop.duration_days > 0 ? *crop.duration_days
                                                                     : DEFAULT_DURATION;
    f[F_WATER]       = static_cast<double>(static_cast<int>(crop.water.value_or(WaterNeed::Moderate)));
    f[F_PROFIT_NORM] = crop.profit_per_hectare.value_or(DEFAULT_PROFIT) / PROFIT_NORMALIZER;

    return f;
}

CropAttributes crop_attributes(const CropCandidate& c,
                               const CropKnowledge& kb,
                               const std::string&   request_season)
{
    const CropProfile p = kb.profile(c.crop);

    CropAttributes a;
    a.name               = c.crop;
    a.season             = !c.season.empty() ? c.season : request_season;
    a.duration_days      = c.duration_days > 0 ? c.duration_days : p.duration_days;
    a.water              = !c.water_requirement.empty()
                               ? water_need_from_string(c.water_requirement) : p.water;
    a.profit_per_hectare = c.profit_per_hectare;
    return a;
}

} // namespace cropadvisor

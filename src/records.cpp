/*───────────────────────────────────────────────────────────
 *  records.cpp   –  JSON mapping of the typed records
 *───────────────────────────────────────────────────────────*/
#include "cropadvisor/records.hpp"

#include <cmath>

namespace cropadvisor {

namespace {

std::optional<double> opt_number(const json& o, const char* k)
{
    if (!has_number(o, k)) return std::nullopt;
    return parse_number(o, k, 0.0);
}

void put_opt(json& o, const char* k, const std::optional<double>& v)
{
    if (v) o[k] = *v;
    else   o[k] = nullptr;
}

std::vector<std::string> string_list(const json& o, const char* k)
{
    std::vector<std::string> out;
    if (!o.is_object() || !o.contains(k) || !o[k].is_array()) return out;
    for (const auto& e : o[k]) {
        if (e.is_string())      out.push_back(e.get<std::string>());
        else if (e.is_object()) {
            /* provider lists are sometimes [{crop: ...}] */
            std::string name = get_string(e, "crop", get_string(e, "name"));
            if (!name.empty()) out.push_back(name);
        }
    }
    return out;
}

} // namespace


/* ────────────────── weather ────────────────── */
WeatherSnapshot weather_from_json(const json& j)
{
    WeatherSnapshot w;
    if (!j.is_object()) return w;

    w.temperature = opt_number(j, "temperature");
    w.humidity    = opt_number(j, "humidity");
    w.condition   = get_string(j, "condition");
    w.rainfall_mm = opt_number(j, "rainfall_mm");
    if (!w.rainfall_mm) w.rainfall_mm = opt_number(j, "rainfall");

    const char* series_key = j.contains("forecast_7day") ? "forecast_7day" : "forecast";
    if (j.contains(series_key) && j[series_key].is_array()) {
        for (const auto& d : j[series_key]) {
            if (!d.is_object()) continue;
            ForecastDay fd;
            fd.date        = get_string(d, "date", get_string(d, "day"));
            fd.temperature = opt_number(d, "temperature");
            fd.condition   = get_string(d, "condition");
            fd.rainfall_mm = opt_number(d, "rainfall_mm");
            if (!fd.rainfall_mm) fd.rainfall_mm = opt_number(d, "rainfall");
            w.forecast.push_back(std::move(fd));
        }
    }
    return w;
}

json to_json(const WeatherSnapshot& w)
{
    json j;
    put_opt(j, "temperature", w.temperature);
    put_opt(j, "humidity",    w.humidity);
    j["condition"] = w.condition;
    put_opt(j, "rainfall_mm", w.rainfall_mm);
    json days = json::array();
    for (const auto& d : w.forecast) {
        json dj;
        dj["date"] = d.date;
        put_opt(dj, "temperature", d.temperature);
        dj["condition"] = d.condition;
        put_opt(dj, "rainfall_mm", d.rainfall_mm);
        days.push_back(std::move(dj));
    }
    j["forecast_7day"] = std::move(days);
    return j;
}


/* ────────────────── recommendation / feedback ────────────────── */
json to_json(const RecommendationRecord& r)
{
    json j;
    j["recommendation_id"] = r.id;
    j["location"]          = r.location;
    put_opt(j, "latitude",  r.latitude);
    put_opt(j, "longitude", r.longitude);
    j["season"]            = r.season;
    j["soil_type"]         = r.soil_type;
    j["weather_data"]      = to_json(r.weather);
    j["recommendations"]   = r.crops_offered;
    j["timestamp"]         = r.timestamp;
    return j;
}

RecommendationRecord recommendation_from_json(const json& j)
{
    RecommendationRecord r;
    r.id            = get_string(j, "recommendation_id");
    r.location      = get_string(j, "location");
    r.latitude      = opt_number(j, "latitude");
    r.longitude     = opt_number(j, "longitude");
    r.season        = get_string(j, "season");
    r.soil_type     = get_string(j, "soil_type");
    if (j.is_object() && j.contains("weather_data"))
        r.weather   = weather_from_json(j["weather_data"]);
    r.crops_offered = string_list(j, "recommendations");
    r.timestamp     = get_string(j, "timestamp");
    return r;
}

json to_json(const FeedbackRecord& f)
{
    json j;
    j["feedback_id"]         = f.id;
    j["recommendation_id"]   = f.recommendation_id;
    j["farmer_id"]           = f.farmer_id;
    j["location"]            = f.location;
    j["season"]              = f.season;
    j["crop_chosen"]         = f.crop_chosen;
    j["yield_achieved"]      = f.yield_achieved;
    j["profit_realized"]     = f.profit_realized;
    j["satisfaction_rating"] = f.satisfaction_rating;
    j["success"]             = f.success;
    j["challenges_faced"]    = f.challenges;
    j["comments"]            = f.comments;
    j["timestamp"]           = f.timestamp;
    return j;
}

FeedbackRecord feedback_from_json(const json& j)
{
    FeedbackRecord f;
    f.id                  = get_string(j, "feedback_id");
    f.recommendation_id   = get_string(j, "recommendation_id");
    f.farmer_id           = get_string(j, "farmer_id");
    f.location            = get_string(j, "location");
    f.season              = get_string(j, "season");
    f.crop_chosen         = to_lower(get_string(j, "crop_chosen"));
    f.yield_achieved      = std::max(0.0, parse_number(j, "yield_achieved", 0.0));
    f.profit_realized     = parse_number(j, "profit_realized", 0.0);
    f.satisfaction_rating = clamp_val(static_cast<int>(parse_number(j, "satisfaction_rating", 0.0)), 0, 5);
    f.success             = get_bool(j, "success", false);
    f.challenges          = string_list(j, "challenges_faced");
    f.comments            = get_string(j, "comments");
    f.timestamp           = get_string(j, "timestamp");
    return f;
}


/* ────────────────── aggregates ────────────────── */
void PerformanceAggregate::apply(bool success, double yield, double profit)
{
    attempts   += 1;
    successes  += success ? 1 : 0;
    yield_sum  += yield;
    profit_sum += profit;
    recompute_derived();
}

void PerformanceAggregate::recompute_derived()
{
    if (attempts <= 0) {
        success_rate = avg_yield = avg_profit = 0;
        return;
    }
    success_rate = clamp_val(double(successes) / double(attempts), 0.0, 1.0);
    avg_yield    = yield_sum  / double(attempts);
    avg_profit   = profit_sum / double(attempts);
}

json to_json(const PerformanceAggregate& a)
{
    return json{
        {"key",                 a.key.str()},
        {"location",            a.key.location},
        {"crop",                a.key.crop},
        {"season",              a.key.season},
        {"total_attempts",      a.attempts},
        {"successful_attempts", a.successes},
        {"total_yield",         a.yield_sum},
        {"total_profit",        a.profit_sum},
        {"success_rate",        a.success_rate},
        {"avg_yield",           a.avg_yield},
        {"avg_profit",          a.avg_profit},
        {"last_updated",        a.last_updated}
    };
}

PerformanceAggregate aggregate_from_json(const json& j)
{
    PerformanceAggregate a;
    a.key.location = get_string(j, "location", "unknown");
    a.key.crop     = get_string(j, "crop", "unknown");
    a.key.season   = get_string(j, "season", "unknown");
    a.attempts     = static_cast<long>(parse_number(j, "total_attempts", 0.0));
    a.successes    = static_cast<long>(parse_number(j, "successful_attempts", 0.0));
    a.yield_sum    = parse_number(j, "total_yield", 0.0);
    a.profit_sum   = parse_number(j, "total_profit", 0.0);
    a.last_updated = get_string(j, "last_updated");
    a.successes    = clamp_val(a.successes, 0L, std::max(0L, a.attempts));
    a.recompute_derived();
    return a;
}


/* ────────────────── candidates ────────────────── */
CropCandidate candidate_from_json(const json& j)
{
    CropCandidate c;
    c.crop               = to_lower(get_string(j, "crop", get_string(j, "name", get_string(j, "crop_name"))));
    c.suitability_score  = parse_number(j, "suitability_score", c.suitability_score);
    c.yield_per_hectare  = parse_number(j, "yield_per_hectare", c.yield_per_hectare);
    c.profit_per_hectare = parse_number(j, "profit_per_hectare", c.profit_per_hectare);
    c.msp_per_quintal    = parse_number(j, "msp_per_quintal", c.msp_per_quintal);
    c.duration_days      = static_cast<int>(parse_number(j, "duration_days", c.duration_days));
    c.season             = to_lower(get_string(j, "season"));
    c.water_requirement  = to_lower(get_string(j, "water_requirement"));
    if (j.is_object()) c.extra = j;
    return c;
}

json to_json(const CropCandidate& c)
{
    json j = c.extra.is_object() ? c.extra : json::object();
    j["crop"]               = c.crop;
    j["suitability_score"]  = c.suitability_score;
    j["yield_per_hectare"]  = c.yield_per_hectare;
    j["profit_per_hectare"] = c.profit_per_hectare;
    j["msp_per_quintal"]    = c.msp_per_quintal;
    j["duration_days"]      = c.duration_days;
    if (!c.season.empty())            j["season"] = c.season;
    if (!c.water_requirement.empty()) j["water_requirement"] = c.water_requirement;
    return j;
}

} // namespace cropadvisor

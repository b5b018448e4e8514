/*───────────────────────────────────────────────────────────
 *  crop_knowledge.cpp
 *───────────────────────────────────────────────────────────*/
#include "cropadvisor/crop_knowledge.hpp"

#include <fstream>

namespace cropadvisor {

WaterNeed water_need_from_string(const std::string& s)
{
    const std::string v = to_lower(s);
    if (v == "low")  return WaterNeed::Low;
    if (v == "high") return WaterNeed::High;
    return WaterNeed::Moderate;
}

const char* to_string(WaterNeed w)
{
    switch (w) {
        case WaterNeed::Low:      return "low";
        case WaterNeed::High:     return "high";
        case WaterNeed::Moderate: return "moderate";
    }
    return "moderate";
}

CropKnowledge CropKnowledge::builtin()
{
    CropKnowledge kb;

    struct Row { const char* crop; double lo, hi, opt; WaterNeed w; int days;
                 const char* trend; const char* vol; };
    /* temperature bands °C; durations in days */
    static const Row rows[] = {
        {"wheat",     10, 25, 20, WaterNeed::Moderate, 120, "increasing", "low"},
        {"rice",      20, 35, 28, WaterNeed::High,     150, "stable",     "medium"},
        {"maize",     18, 32, 25, WaterNeed::Moderate, 100, "increasing", "medium"},
        {"cotton",    21, 35, 28, WaterNeed::Moderate, 180, "increasing", "medium"},
        {"sugarcane", 20, 35, 28, WaterNeed::High,     365, "stable",     "low"},
        {"potato",    15, 25, 20, WaterNeed::Moderate,  90, "volatile",   "high"},
        {"onion",     13, 27, 20, WaterNeed::Moderate, 120, "volatile",   "very_high"},
        {"tomato",    18, 27, 23, WaterNeed::Moderate, 120, "volatile",   "high"},
        {"mustard",   15, 30, 23, WaterNeed::Low,      120, "increasing", "medium"},
        {"turmeric",  15, 30, 23, WaterNeed::Moderate, 240, "increasing", "medium"},
        {"soybean",   15, 30, 23, WaterNeed::Moderate, 100, "stable",     "medium"},
        {"jute",      15, 30, 23, WaterNeed::High,     120, "stable",     "medium"},
        {"banana",    15, 30, 23, WaterNeed::High,     300, "stable",     "medium"},
        {"bajra",     15, 30, 23, WaterNeed::Low,       90, "stable",     "medium"},
        {"jowar",     15, 30, 23, WaterNeed::Low,      110, "stable",     "medium"},
        {"groundnut", 15, 30, 23, WaterNeed::Low,      120, "stable",     "medium"},
    };
    for (const Row& r : rows) {
        CropProfile p;
        p.temp          = TempBand{r.lo, r.hi, r.opt};
        p.water         = r.w;
        p.duration_days = r.days;
        p.price_trend   = r.trend;
        p.volatility    = r.vol;
        kb.table_[r.crop] = p;
    }
    return kb;
}

bool CropKnowledge::load(const std::string& path)
{
    std::ifstream in(path);
    if (!in) { logW("crop knowledge file not found: " + path); return false; }

    json j = json::parse(in, nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded() || !j.is_object()) {
        logW("crop knowledge file is not a JSON object: " + path);
        return false;
    }
    merge(j);
    logI("Loaded crop knowledge from " + path + " (" + std::to_string(table_.size()) + " crops)");
    return true;
}

void CropKnowledge::merge(const json& table)
{
    for (auto it = table.begin(); it != table.end(); ++it) {
        if (!it.value().is_object()) continue;
        const json& e = it.value();
        const std::string name = to_lower(it.key());

        CropProfile p = profile(name);         // start from existing / default
        p.temp.min      = parse_number(e, "temp_min", p.temp.min);
        p.temp.max      = parse_number(e, "temp_max", p.temp.max);
        p.temp.optimal  = parse_number(e, "temp_optimal", p.temp.optimal);
        if (e.contains("water_requirement"))
            p.water     = water_need_from_string(get_string(e, "water_requirement"));
        p.duration_days = static_cast<int>(parse_number(e, "duration_days", p.duration_days));
        p.price_trend   = get_string(e, "price_trend", p.price_trend);
        p.volatility    = get_string(e, "volatility", p.volatility);

        if (p.temp.min > p.temp.max) {
            logW("crop knowledge: inverted temperature band for " + name + ", skipped");
            continue;
        }
        table_[name] = p;
    }
}

CropProfile CropKnowledge::profile(const std::string& crop) const
{
    auto it = table_.find(to_lower(crop));
    return it == table_.end() ? CropProfile{} : it->second;
}

bool CropKnowledge::knows(const std::string& crop) const
{
    return table_.count(to_lower(crop)) != 0;
}

void CropKnowledge::set(const std::string& crop, const CropProfile& p)
{
    table_[to_lower(crop)] = p;
}

} // namespace cropadvisor

/*───────────────────────────────────────────────────────────
 *  crop_knowledge.hpp   –  per-crop agronomic reference data
 *
 *  Ideal temperature band, water requirement, duration and
 *  price behaviour.  builtin() carries the reference table;
 *  load() overlays entries from a JSON file:
 *     { "wheat": { "temp_min":10, "temp_max":25, "temp_optimal":20,
 *                  "water_requirement":"moderate", "duration_days":120,
 *                  "price_trend":"increasing", "volatility":"low" }, ... }
 *───────────────────────────────────────────────────────────*/
#pragma once

#include <string>
#include <unordered_map>

#include "cropadvisor/common.hpp"

namespace cropadvisor {

enum class WaterNeed { Low = 1, Moderate = 2, High = 3 };

WaterNeed   water_need_from_string(const std::string& s);   // unknown → Moderate
const char* to_string(WaterNeed w);

struct TempBand {
    double min     = 15;
    double max     = 30;
    double optimal = 23;
};

struct CropProfile {
    TempBand    temp;
    WaterNeed   water          = WaterNeed::Moderate;
    int         duration_days  = 120;
    std::string price_trend    = "stable";
    std::string volatility     = "medium";
};

class CropKnowledge {
public:
    static CropKnowledge builtin();

    /* overlay from file; false (logged) when unreadable, table untouched */
    bool load(const std::string& path);
    void merge(const json& table);

    /* case-insensitive; unknown crops get the default profile */
    CropProfile profile(const std::string& crop) const;
    bool        knows(const std::string& crop) const;
    size_t      size() const { return table_.size(); }

    void set(const std::string& crop, const CropProfile& p);

private:
    std::unordered_map<std::string, CropProfile> table_;
};

} // namespace cropadvisor

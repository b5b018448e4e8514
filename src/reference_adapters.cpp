/*───────────────────────────────────────────────────────────
 *  reference_adapters.cpp
 *───────────────────────────────────────────────────────────*/
#include "cropadvisor/reference_adapters.hpp"

#include <algorithm>
#include <fstream>

#include "cropadvisor/errors.hpp"

namespace cropadvisor {

/* ────────────────── CatalogBaseProvider ────────────────── */
CatalogBaseProvider::CatalogBaseProvider(const std::string& catalog_path)
{
    std::ifstream in(catalog_path);
    if (!in) throw DataUnavailable("cannot open crop catalog " + catalog_path);
    json j = json::parse(in, nullptr, false);
    if (j.is_discarded()) throw DataUnavailable("malformed crop catalog " + catalog_path);
    parse(j);
    logI("crop catalog " + catalog_path + ": " + std::to_string(entries_.size()) + " crops");
}

CatalogBaseProvider::CatalogBaseProvider(const json& catalog)
{
    parse(catalog);
}

void CatalogBaseProvider::parse(const json& catalog)
{
    const json& arr = (catalog.is_object() && catalog.contains("crops")) ? catalog["crops"] : catalog;
    if (!arr.is_array()) throw DataUnavailable("crop catalog must be an array");

    for (const auto& e : arr) {
        if (!e.is_object()) continue;
        Entry en;
        en.candidate = candidate_from_json(e);
        if (en.candidate.crop.empty()) {
            logW("crop catalog: entry without a crop name skipped");
            continue;
        }
        if (e.contains("soil_types") && e["soil_types"].is_array())
            for (const auto& s : e["soil_types"])
                if (s.is_string()) en.soil_types.push_back(to_lower(s.get<std::string>()));
        entries_.push_back(std::move(en));
    }
}

std::vector<CropCandidate>
CatalogBaseProvider::get_crop_recommendations(const std::string&    /*location*/,
                                              const std::string&    soil_type,
                                              const std::string&    season,
                                              std::optional<double> /*lat*/,
                                              std::optional<double> /*lon*/)
{
    const std::string want_season = to_lower(season);
    const std::string want_soil   = to_lower(soil_type);

    std::vector<CropCandidate> out;
    for (const auto& e : entries_) {
        const std::string& s = e.candidate.season;
        const bool season_ok = want_season.empty() || s.empty() ||
                               s == "year_round" || s == want_season;
        if (!season_ok) continue;

        CropCandidate c = e.candidate;
        if (!want_soil.empty() &&
            std::find(e.soil_types.begin(), e.soil_types.end(), want_soil) != e.soil_types.end())
            c.suitability_score = std::min(100.0, c.suitability_score + SOIL_MATCH_BONUS);
        out.push_back(std::move(c));
    }

    std::stable_sort(out.begin(), out.end(), [](const CropCandidate& a, const CropCandidate& b) {
        return a.suitability_score > b.suitability_score;
    });
    return out;
}


/* ────────────────── SnapshotGateway ────────────────── */
GatewayReply SnapshotGateway::read(const std::string& location, const char* file) const
{
    const std::string path = dir_ + '/' + to_lower(location) + '/' + file;
    std::ifstream in(path);
    if (!in) return GatewayReply::error("no snapshot " + path);

    json j = json::parse(in, nullptr, false);
    if (j.is_discarded()) return GatewayReply::error("malformed snapshot " + path);

    /* a snapshot may be the bare payload or a recorded {status, data} reply */
    if (j.is_object() && j.contains("status") && j.contains("data")) {
        GatewayReply r;
        r.status = get_string(j, "status", "error");
        r.data   = j["data"];
        return r;
    }
    return GatewayReply::success(std::move(j));
}

GatewayReply SnapshotGateway::get_weather_data(const std::string& location,
                                               std::optional<double>, std::optional<double>)
{
    return read(location, "weather.json");
}

GatewayReply SnapshotGateway::get_market_prices(const std::string& location,
                                                std::optional<double>, std::optional<double>)
{
    return read(location, "market.json");
}

GatewayReply SnapshotGateway::get_soil_health_data(const std::string& location,
                                                   std::optional<double>, std::optional<double>)
{
    return read(location, "soil.json");
}

} // namespace cropadvisor

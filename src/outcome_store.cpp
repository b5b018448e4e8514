/*──────────────────────────────────────────────────────────────
   outcome_store.cpp
  ──────────────────────────────────────────────────────────────*/
#include "cropadvisor/outcome_store.hpp"

#include <cstdio>
#include <unordered_map>

namespace cropadvisor {

OutcomeStore::OutcomeStore(std::unique_ptr<OutcomeBackend> backend,
                           const CropKnowledge&            kb)
    : backend_(std::move(backend)), kb_(kb), rng_(std::random_device{}())
{
    if (!backend_) throw PersistenceFailure("OutcomeStore: null backend");
}

std::string OutcomeStore::next_id(const char* prefix)
{
    unsigned r;
    {
        std::lock_guard<std::mutex> lk(rng_mtx_);
        r = static_cast<unsigned>(rng_() & 0xFFFFFF);
    }
    /* low bits of the sequence keep ids unique within one second */
    r ^= (seq_.fetch_add(1) & 0xFFF) << 12;
    char hex[8];
    std::snprintf(hex, sizeof(hex), "%06x", r & 0xFFFFFF);
    return std::string(prefix) + '_' + now_compact() + '_' + hex;
}

std::mutex& OutcomeStore::stripe_for(const AggregateKey& key) const
{
    return stripes_[AggregateKeyHash()(key) % N_STRIPES];
}


/* ---------- writes ---------- */
std::string OutcomeStore::track_recommendation(RecommendationRecord record)
{
    record.id = next_id("REC");
    if (record.timestamp.empty()) record.timestamp = now_iso();
    for (auto& c : record.crops_offered) c = to_lower(c);

    try {
        backend_->append_recommendation(record);
    } catch (const PersistenceFailure& e) {
        logE("Error tracking recommendation: " + std::string(e.what()));
        return "";
    }
    logI("Tracked recommendation: " + record.id);
    return record.id;
}

bool OutcomeStore::collect_feedback(FeedbackRecord record)
{
    if (record.crop_chosen.empty()) {
        logW("feedback rejected: crop_chosen is empty");
        return false;
    }
    record.id = next_id("FB");
    record.crop_chosen = to_lower(record.crop_chosen);
    if (record.timestamp.empty()) record.timestamp = now_iso();

    try {
        /* location / season come from the referenced recommendation when
           the feedback does not carry them itself                         */
        if ((record.location.empty() || record.season.empty()) &&
            !record.recommendation_id.empty())
        {
            if (auto rec = backend_->find_recommendation(record.recommendation_id)) {
                if (record.location.empty()) record.location = rec->location;
                if (record.season.empty())   record.season   = rec->season;
            } else {
                logW("feedback " + record.id + " references unknown recommendation " +
                     record.recommendation_id);
            }
        }
        if (record.location.empty()) record.location = "unknown";
        if (record.season.empty())   record.season   = "unknown";
        record.season = to_lower(record.season);

        const AggregateKey key{record.location, record.crop_chosen, record.season};
        std::lock_guard<std::mutex> lk(stripe_for(key));
        PerformanceAggregate row = backend_->record_feedback(record, key);
        logI("Collected feedback " + record.id + " → " + key.str() + " attempts=" +
             std::to_string(row.attempts));
    } catch (const PersistenceFailure& e) {
        logE("Error collecting feedback: " + std::string(e.what()));
        return false;
    }
    return true;
}


/* ---------- reads ---------- */
ReadResult<PerformanceAggregate>
OutcomeStore::get_crop_performance(const std::string& location,
                                   const std::string& crop,
                                   const std::string& season) const
{
    using R = ReadResult<PerformanceAggregate>;
    try {
        auto row = backend_->load_aggregate(AggregateKey{location, to_lower(crop), to_lower(season)});
        return row ? R::found(*row) : R::no_data();
    } catch (const PersistenceFailure& e) {
        logE("Error getting crop performance: " + std::string(e.what()));
        return R::failed(e.what());
    }
}

ReadResult<std::map<std::string, double>>
OutcomeStore::get_success_rate_by_location(const std::string& location) const
{
    using R = ReadResult<std::map<std::string, double>>;
    try {
        /* several seasons per crop: report the attempt-weighted rate */
        std::map<std::string, std::pair<long, long>> counts;   // successes, attempts
        for (const auto& a : backend_->aggregates_for_location(location)) {
            counts[a.key.crop].first  += a.successes;
            counts[a.key.crop].second += a.attempts;
        }
        if (counts.empty()) return R::no_data();

        std::map<std::string, double> rates;
        for (const auto& kv : counts) {
            const auto& c = kv.second;
            rates[kv.first] = c.second > 0
                ? clamp_val(double(c.first) / double(c.second), 0.0, 1.0) : 0.0;
        }
        return R::found(std::move(rates));
    } catch (const PersistenceFailure& e) {
        logE("Error getting success rates: " + std::string(e.what()));
        return R::failed(e.what());
    }
}

std::vector<TrainingSample> OutcomeStore::get_training_data(size_t min_samples) const
{
    std::vector<RecommendationRecord> recs;
    std::vector<FeedbackRecord>       fbs;
    try {
        recs = backend_->load_recommendations();
        fbs  = backend_->load_feedback();
    } catch (const PersistenceFailure& e) {
        logE("Error getting training data: " + std::string(e.what()));
        return {};
    }

    /* build side: recommendations by id */
    std::unordered_map<std::string, const RecommendationRecord*> by_id;
    by_id.reserve(recs.size());
    for (const auto& r : recs) by_id[r.id] = &r;

    std::vector<TrainingSample> out;
    out.reserve(fbs.size());
    size_t orphans = 0;

    for (const auto& fb : fbs) {
        auto it = by_id.find(fb.recommendation_id);
        if (it == by_id.end()) { ++orphans; continue; }
        const RecommendationRecord& rec = *it->second;

        const CropProfile prof = kb_.profile(fb.crop_chosen);
        CropAttributes crop;
        crop.name          = fb.crop_chosen;
        crop.season        = rec.season;
        crop.duration_days = prof.duration_days;
        crop.water         = prof.water;
        /* profit feature stays at its default: the realised profit is the target */

        TrainingSample s;
        s.feat = extract_features(crop, rec.weather,
                                  LocationInfo{rec.location, rec.latitude, rec.longitude},
                                  SoilInfo{rec.soil_type});
        s.outcome.success   = fb.success ? 1 : 0;
        s.outcome.yield     = fb.yield_achieved;
        s.outcome.profit    = fb.profit_realized;
        s.crop              = fb.crop_chosen;
        s.recommendation_id = rec.id;
        out.push_back(std::move(s));
    }

    if (orphans)
        logW("training join skipped " + std::to_string(orphans) +
             " feedback record(s) with unknown recommendation ids");
    if (out.size() < min_samples) {
        logW("only " + std::to_string(out.size()) + " joined samples (need " +
             std::to_string(min_samples) + ")");
        return {};
    }
    logI("Retrieved " + std::to_string(out.size()) + " training samples");
    return out;
}

} // namespace cropadvisor

/*──────────────────────────────────────────────────────────────
   outcome_store.hpp  –  recommendation / feedback events and
                         per-(location, crop, season) aggregates

   Availability over consistency: nothing here throws to the
   caller.  Writes degrade to ""/false, reads to NoData/Failed.
  ──────────────────────────────────────────────────────────────*/
#pragma once

#include <array>
#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <random>
#include <string>
#include <vector>

#include "cropadvisor/crop_knowledge.hpp"
#include "cropadvisor/errors.hpp"
#include "cropadvisor/features.hpp"
#include "cropadvisor/outcome_backend.hpp"

namespace cropadvisor {

class OutcomeStore {
public:
    OutcomeStore(std::unique_ptr<OutcomeBackend> backend,
                 const CropKnowledge&            kb);

    /* fresh REC_ id, or "" when the write failed (untracked) */
    std::string track_recommendation(RecommendationRecord record);

    /* append + incremental aggregate update; false on rejection / I/O failure */
    bool collect_feedback(FeedbackRecord record);

    ReadResult<PerformanceAggregate>
        get_crop_performance(const std::string& location,
                             const std::string& crop,
                             const std::string& season) const;

    ReadResult<std::map<std::string, double>>
        get_success_rate_by_location(const std::string& location) const;

    /*  feedback ⋈ recommendation on id (hash join); unresolvable
        references are skipped.  Empty when fewer than min_samples.   */
    std::vector<TrainingSample> get_training_data(size_t min_samples) const;

    std::string describe() const { return backend_->describe(); }

private:
    std::string next_id(const char* prefix);

    /* striped per-key write locks */
    static constexpr size_t N_STRIPES = 64;
    std::mutex& stripe_for(const AggregateKey& key) const;

    std::unique_ptr<OutcomeBackend>            backend_;
    const CropKnowledge&                       kb_;
    mutable std::array<std::mutex, N_STRIPES>  stripes_;
    std::atomic<unsigned>                      seq_{0};
    std::mutex                                 rng_mtx_;
    std::mt19937                               rng_;
};

} // namespace cropadvisor

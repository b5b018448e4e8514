/*───────────────────────────────────────────────────────────
 *  predictive_ensemble.hpp   –  versioned ModelSet + fallbacks
 *
 *  Readers take a snapshot of the live ModelSet with
 *  std::atomic_load; train() builds a complete new set and
 *  publishes it with std::atomic_store.  No reader ever sees a
 *  half-built set.
 *
 *  untrained:  success 0.75,  yield base·U(0.90,1.10),
 *              profit base·U(0.85,1.15)
 *───────────────────────────────────────────────────────────*/
#pragma once

#include <memory>
#include <mutex>
#include <random>
#include <string>
#include <vector>

#include "cropadvisor/model_iface.hpp"

namespace cropadvisor {

constexpr double UNTRAINED_SUCCESS_PROBABILITY = 0.75;
constexpr size_t DEFAULT_MIN_TRAINING_SAMPLES  = 50;

class PredictiveEnsemble {
public:
    /*  model_dir empty → nothing is persisted or loaded.
        jitter_seed 0 → nondeterministic untrained jitter.          */
    PredictiveEnsemble(std::string                    model_dir,
                       std::unique_ptr<IModelTrainer> trainer,
                       TrainOpt                       opt         = {},
                       size_t                         min_samples = DEFAULT_MIN_TRAINING_SAMPLES,
                       unsigned                       jitter_seed = 0);

    double predict_success(const FeatureVector& f) const;
    double predict_yield  (const FeatureVector& f, double base) const;
    double predict_profit (const FeatureVector& f, double base) const;

    /*  false when below the sample threshold, when another training
        is running, or when fitting failed; the live set is untouched
        in all three cases.                                           */
    bool train(const std::vector<TrainingSample>& samples);

    /* <model_dir>/CURRENT → v<N>/ ; false leaves the ensemble as it was */
    bool load();
    /* writes the live set as v<N>/ and repoints CURRENT */
    bool save() const;

    bool   is_trained()  const { return static_cast<bool>(snapshot()); }
    int    version()     const;
    size_t trained_on()  const;
    size_t min_samples() const { return min_samples_; }
    bool   training_in_progress() const;

private:
    std::shared_ptr<const IModelSet> snapshot() const { return std::atomic_load(&live_); }

    void   persist(const IModelSet& set) const;      // throws PersistenceFailure
    int    latest_version_on_disk() const;
    double jitter(double lo, double hi) const;

    std::string                      model_dir_;
    std::unique_ptr<IModelTrainer>   trainer_;
    TrainOpt                         opt_;
    size_t                           min_samples_;

    std::shared_ptr<const IModelSet> live_;          // atomic_load / atomic_store only
    mutable std::mutex               train_mtx_;     // one training at a time

    mutable std::mutex               rng_mtx_;
    mutable std::mt19937             rng_;
};

} // namespace cropadvisor

/* ──────────────────────────────────────────────────────────────
   model_iface.hpp     –  the abstraction layer under the ensemble
   ────────────────────────────────────────────────────────────── */
#pragma once

#include <memory>
#include <string>
#include <vector>

#include "cropadvisor/features.hpp"

namespace cropadvisor {

struct TrainOpt {
    /* shared by the classifier and both regressors */
    int     trees            = 200;
    int     num_leaves       = 15;
    double  lr               = 0.05;
    double  subsample        = 0.8;    // bagging_fraction
    double  colsample        = 0.9;    // feature_fraction
    int     min_data_in_leaf = 5;
    int     threads          = 0;      // 0 → library default
};

/*  One trained bundle: classifier + two regressors + scaler.
    Immutable once built; shared between readers.                  */
struct IModelSet {
    virtual ~IModelSet() = default;

    /* raw model outputs; throw CropAdvisorError when the library fails */
    virtual double success_probability(const FeatureVector& f) const = 0;
    virtual double yield (const FeatureVector& f) const = 0;
    virtual double profit(const FeatureVector& f) const = 0;

    /* write every artefact into an existing directory;
       throws PersistenceFailure                                   */
    virtual void save(const std::string& dir) const = 0;

    virtual int    version()    const = 0;
    virtual size_t trained_on() const = 0;
};

struct IModelTrainer {
    virtual ~IModelTrainer() = default;

    /* fits all three models on the same matrix; throws CropAdvisorError */
    virtual std::shared_ptr<const IModelSet>
        fit(const std::vector<TrainingSample>& samples,
            const TrainOpt&                    opt,
            int                                version) const = 0;

    /* reads a bundle written by save(); throws PersistenceFailure */
    virtual std::shared_ptr<const IModelSet>
        load(const std::string& dir) const = 0;
};

/* factory (gradient-boosted trees) */
std::unique_ptr<IModelTrainer> make_lightgbm_trainer();

} // namespace cropadvisor

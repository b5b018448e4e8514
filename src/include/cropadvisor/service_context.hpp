/*───────────────────────────────────────────────────────────
 *  service_context.hpp   –  the one object that owns every
 *                           service of a running process
 *
 *  Construction order: knowledge base → store → ensemble (load)
 *  → analyzer → adapters → engine.  Destruction joins the
 *  background retraining worker before anything it uses goes.
 *───────────────────────────────────────────────────────────*/
#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "cropadvisor/config.hpp"
#include "cropadvisor/crop_knowledge.hpp"
#include "cropadvisor/forecast_analyzer.hpp"
#include "cropadvisor/fusion_engine.hpp"
#include "cropadvisor/gateway.hpp"
#include "cropadvisor/outcome_store.hpp"
#include "cropadvisor/predictive_ensemble.hpp"

namespace cropadvisor {

class ServiceContext {
public:
    /* throws PersistenceFailure / DataUnavailable when a required
       collaborator cannot be opened                                  */
    explicit ServiceContext(const ServiceConfig& cfg);

    /* injected collaborators (tests, embedding) */
    ServiceContext(const ServiceConfig&                        cfg,
                   std::unique_ptr<OutcomeBackend>             backend,
                   std::shared_ptr<GovernmentDataGateway>      gateway,
                   std::shared_ptr<BaseRecommendationProvider> provider,
                   std::unique_ptr<IModelTrainer>              trainer);

    ~ServiceContext();

    ServiceContext(const ServiceContext&)            = delete;
    ServiceContext& operator=(const ServiceContext&) = delete;

    EnhancedRecommendations recommend(const RecommendationQuery& q) const;
    std::string             track_recommendation(const RecommendationRecord& r);

    /* every retrain_every accepted records kicks a background retrain */
    bool collect_feedback(const FeedbackRecord& f);

    /* synchronous: fetch joined history, train, swap */
    bool retrain();

    /* waits for a background retrain, if any */
    void wait_for_background();

    const ServiceConfig&      config()    const { return cfg_; }
    const CropKnowledge&      knowledge() const { return kb_; }
    OutcomeStore&             store()           { return *store_; }
    const PredictiveEnsemble& ensemble()  const { return *ensemble_; }
    const ForecastAnalyzer&   analyzer()  const { return *analyzer_; }

private:
    void wire(std::unique_ptr<OutcomeBackend>             backend,
              std::shared_ptr<GovernmentDataGateway>      gateway,
              std::shared_ptr<BaseRecommendationProvider> provider,
              std::unique_ptr<IModelTrainer>              trainer);
    void maybe_start_background_retrain();

    ServiceConfig                       cfg_;
    CropKnowledge                       kb_;
    std::unique_ptr<OutcomeStore>       store_;
    std::unique_ptr<PredictiveEnsemble> ensemble_;
    std::unique_ptr<ForecastAnalyzer>   analyzer_;
    std::unique_ptr<FusionEngine>       engine_;

    std::atomic<size_t>                 accepted_feedback_{0};
    std::mutex                          worker_mtx_;
    std::thread                         worker_;
    std::atomic<bool>                   worker_busy_{false};
};

} // namespace cropadvisor

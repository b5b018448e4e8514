/*───────────────────────────────────────────────────────────
 *  fusion_engine.hpp   –  one ranked, confidence-labelled list
 *                         per request
 *
 *  gateway (weather / market / soil, concurrent, time-boxed)
 *    → history per candidate      (OutcomeStore)
 *    → forecast suitability       (ForecastAnalyzer)
 *    → baseline candidates        (BaseRecommendationProvider)
 *    → success / yield / profit   (PredictiveEnsemble)
 *    → composite + confidence, sorted, top-N
 *
 *  Only a baseline failure escapes, as DataUnavailable.
 *───────────────────────────────────────────────────────────*/
#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "cropadvisor/crop_knowledge.hpp"
#include "cropadvisor/forecast_analyzer.hpp"
#include "cropadvisor/gateway.hpp"
#include "cropadvisor/outcome_store.hpp"
#include "cropadvisor/predictive_ensemble.hpp"
#include "cropadvisor/scoring.hpp"

namespace cropadvisor {

struct FusionOptions {
    std::chrono::milliseconds gateway_timeout{5000};
    size_t                    max_pending_calls   = 16;      // per upstream, incl. abandoned
    size_t                    max_recommendations = MAX_RECOMMENDATIONS;
    std::string               default_season      = "kharif";   // history lookup
    std::string               default_soil        = "loamy";
};

struct Band {
    double expected    = 0;
    double optimistic  = 0;
    double pessimistic = 0;
};

struct MarketOutlook {
    long        current_price  = 0;     // ₹/quintal
    long        next_3_months  = 0;
    long        next_6_months  = 0;
    long        next_year      = 0;
    std::string trend          = "stable";
    std::string volatility     = "medium";
    std::string confidence     = "High";
    std::string data_source    = "estimated";
};

struct CropPredictions {
    double        success_probability = UNTRAINED_SUCCESS_PROBABILITY;
    Band          yield;                 // quintal/ha, ×1.2 / ×0.8
    Band          profit;                // ₹/ha,       ×1.3 / ×0.7
    MarketOutlook market;
    std::string   source = "baseline";   // ml | statistical | baseline
};

struct EnhancedRecommendation {
    CropCandidate                       candidate;
    double                              enhanced_score = 0;
    ScoreBreakdown                      breakdown;
    std::optional<PerformanceAggregate> history;
    ForecastAnalysis                    weather;
    CropPredictions                     predictions;
    double                              confidence_score = 0;
    std::string                         confidence_level = "Low";
    bool                                degraded = false;
    std::string                         degraded_reason;
};

struct DataSources {
    std::string current     = "fallback";   // real-time when weather arrived
    std::string weather     = "fallback";
    std::string market      = "fallback";
    std::string soil        = "fallback";
    std::string historical;
    std::string predictions;
};

struct EnhancedRecommendations {
    std::string                         location;
    std::string                         season;
    std::string                         soil_type;
    std::vector<EnhancedRecommendation> recommendations;
    json                                current_conditions = json::object();
    WeatherSnapshot                     weather;       // as used for scoring
    ForecastSummary                     forecast_summary;
    DataSources                         data_sources;
    std::string                         timestamp;
};

json to_json(const EnhancedRecommendation& r);
json to_json(const EnhancedRecommendations& r);

/* price projection by season multipliers and knowledge-base trend */
MarketOutlook market_outlook(const CropCandidate& c, const CropProfile& p,
                             const std::string& season, bool live_market);

/*  Upstream calls still running on detached workers, including those
    whose request already gave up on them.  Past the cap new calls are
    refused and the request takes its fallback.                        */
class PendingCalls {
public:
    explicit PendingCalls(size_t cap) : cap_(cap) {}

    bool   try_acquire();
    void   release();
    size_t running() const;
    /* false when calls are still running at the deadline */
    bool   drain(std::chrono::steady_clock::time_point deadline) const;

private:
    mutable std::mutex              mtx_;
    mutable std::condition_variable cv_;
    size_t                          cap_;
    size_t                          running_ = 0;
};

class FusionEngine {
public:
    /* gateway may be null: every source then takes its fallback */
    FusionEngine(std::shared_ptr<GovernmentDataGateway>      gateway,
                 std::shared_ptr<BaseRecommendationProvider> provider,
                 const OutcomeStore&                         store,
                 const PredictiveEnsemble&                   ensemble,
                 const ForecastAnalyzer&                     analyzer,
                 const CropKnowledge&                        kb,
                 FusionOptions                               opt = {});
    ~FusionEngine();

    FusionEngine(FusionEngine&&)            = default;
    FusionEngine& operator=(FusionEngine&&) = delete;

    /* throws DataUnavailable when no baseline candidates can be had */
    EnhancedRecommendations get_enhanced_recommendations(const RecommendationQuery& q) const;

private:
    struct CurrentData {
        WeatherSnapshot weather;
        json            weather_raw = json::object();
        json            market      = json::object();
        json            soil        = json::object();
        bool            weather_ok  = false;
        bool            market_ok   = false;
        bool            soil_ok     = false;
    };

    CurrentData fetch_current(const RecommendationQuery& q) const;
    std::vector<CropCandidate> fetch_candidates(const RecommendationQuery& q,
                                                const std::string& soil,
                                                const std::string& season) const;

    EnhancedRecommendation enhance(const CropCandidate&       c,
                                   const RecommendationQuery& q,
                                   const CurrentData&         cur,
                                   const std::string&         soil,
                                   const std::string&         season) const;

    std::shared_ptr<GovernmentDataGateway>      gateway_;
    std::shared_ptr<BaseRecommendationProvider> provider_;
    const OutcomeStore&                         store_;
    const PredictiveEnsemble&                   ensemble_;
    const ForecastAnalyzer&                     analyzer_;
    const CropKnowledge&                        kb_;
    FusionOptions                               opt_;
    std::shared_ptr<PendingCalls>               gateway_calls_;
    std::shared_ptr<PendingCalls>               provider_calls_;
};

} // namespace cropadvisor

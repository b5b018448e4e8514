/* -----------------------------------------------------------
 *  test_fusion_engine  –  composite ranking end to end, with
 *                         fake gateway / provider / models
 * ----------------------------------------------------------- */
#include <atomic>
#include <chrono>
#include <new>
#include <stdexcept>
#include <thread>
#include <vector>

#include "cropadvisor/errors.hpp"
#include "cropadvisor/fusion_engine.hpp"
#include "test_util.hpp"

using namespace cropadvisor;

namespace {

/* ---------- fakes ---------- */
struct FakeGateway : GovernmentDataGateway {
    json weather = json::object();
    bool up       = true;
    int  delay_ms = 0;
    mutable std::atomic<int> calls{0};

    GatewayReply reply(const json& d) const
    {
        ++calls;
        if (delay_ms) std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
        return up ? GatewayReply::success(d) : GatewayReply::error("service unreachable");
    }
    GatewayReply get_weather_data(const std::string&, std::optional<double>, std::optional<double>) override
    {
        return reply(weather);
    }
    GatewayReply get_market_prices(const std::string&, std::optional<double>, std::optional<double>) override
    {
        return reply({ {"wheat", 2275} });
    }
    GatewayReply get_soil_health_data(const std::string&, std::optional<double>, std::optional<double>) override
    {
        return reply({ {"type", "alluvial"}, {"ph", 7.2} });
    }
};

struct FakeProvider : BaseRecommendationProvider {
    std::vector<CropCandidate> list;
    bool fail = false;
    std::string last_soil, last_season;

    std::vector<CropCandidate> get_crop_recommendations(const std::string&, const std::string& soil,
                                                        const std::string& season,
                                                        std::optional<double>, std::optional<double>) override
    {
        last_soil   = soil;
        last_season = season;
        if (fail) throw DataUnavailable("catalog service down");
        return list;
    }
};

struct BrokenBackend : OutcomeBackend {
    [[noreturn]] static void boom() { throw PersistenceFailure("backend offline"); }

    void append_recommendation(const RecommendationRecord&) override { boom(); }
    std::optional<RecommendationRecord> find_recommendation(const std::string&) const override { boom(); }
    std::vector<RecommendationRecord> load_recommendations() const override { boom(); }
    std::vector<FeedbackRecord> load_feedback() const override { boom(); }
    PerformanceAggregate record_feedback(const FeedbackRecord&, const AggregateKey&) override { boom(); }
    std::optional<PerformanceAggregate> load_aggregate(const AggregateKey&) const override { boom(); }
    std::vector<PerformanceAggregate> aggregates_for_location(const std::string&) const override { boom(); }
    std::string describe() const override { return "broken"; }
};

/* file store whose reads for one crop fail outside the persistence contract */
struct FlakyBackend : OutcomeBackend {
    std::unique_ptr<OutcomeBackend> inner;
    std::string                     bad_crop;
    FlakyBackend(std::unique_ptr<OutcomeBackend> in, std::string crop)
        : inner(std::move(in)), bad_crop(std::move(crop)) {}

    void append_recommendation(const RecommendationRecord& r) override { inner->append_recommendation(r); }
    std::optional<RecommendationRecord> find_recommendation(const std::string& id) const override
    {
        return inner->find_recommendation(id);
    }
    std::vector<RecommendationRecord> load_recommendations() const override { return inner->load_recommendations(); }
    std::vector<FeedbackRecord> load_feedback() const override { return inner->load_feedback(); }
    PerformanceAggregate record_feedback(const FeedbackRecord& f, const AggregateKey& k) override
    {
        return inner->record_feedback(f, k);
    }
    std::optional<PerformanceAggregate> load_aggregate(const AggregateKey& k) const override
    {
        if (k.crop == bad_crop) throw std::logic_error("index out of sync for " + k.crop);
        return inner->load_aggregate(k);
    }
    std::vector<PerformanceAggregate> aggregates_for_location(const std::string& l) const override
    {
        return inner->aggregates_for_location(l);
    }
    std::string describe() const override { return "flaky"; }
};

struct FixedSet : IModelSet {
    double p;
    bool   explode;
    FixedSet(double p_, bool explode_) : p(p_), explode(explode_) {}

    double success_probability(const FeatureVector&) const override
    {
        if (explode) throw std::runtime_error("model handle corrupted");
        return p;
    }
    double yield(const FeatureVector&) const override
    {
        if (explode) throw std::bad_alloc();
        return 44;
    }
    double profit(const FeatureVector&) const override
    {
        if (explode) throw std::out_of_range("tree index");
        return 65000;
    }
    void   save(const std::string&) const override {}
    int    version()    const override { return 1; }
    size_t trained_on() const override { return 1; }
};

struct FixedTrainer : IModelTrainer {
    double p;
    bool   explode;
    explicit FixedTrainer(double p_, bool explode_ = false) : p(p_), explode(explode_) {}

    std::shared_ptr<const IModelSet>
    fit(const std::vector<TrainingSample>&, const TrainOpt&, int) const override
    {
        return std::make_shared<FixedSet>(p, explode);
    }
    std::shared_ptr<const IModelSet> load(const std::string& dir) const override
    {
        throw PersistenceFailure("nothing saved in " + dir);
    }
};

CropCandidate cand(const std::string& crop, double suit, const std::string& season = "rabi")
{
    CropCandidate c;
    c.crop               = crop;
    c.suitability_score  = suit;
    c.yield_per_hectare  = 40;
    c.profit_per_hectare = 50000;
    c.msp_per_quintal    = 2275;
    c.season             = season;
    return c;
}

json dry_week(double temp, int days)
{
    json f = json::array();
    for (int i = 0; i < days; ++i)
        f.push_back({ {"day", "d" + std::to_string(i)}, {"temperature", temp}, {"condition", "Clear"} });
    return { {"temperature", temp}, {"humidity", 50}, {"condition", "Clear"}, {"forecast_7day", f} };
}

/* one store + ensemble + analyzer per test */
struct Rig {
    CropKnowledge                 kb = CropKnowledge::builtin();
    OutcomeStore                  store;
    PredictiveEnsemble            ensemble;
    ForecastAnalyzer              analyzer{kb};
    std::shared_ptr<FakeGateway>  gateway  = std::make_shared<FakeGateway>();
    std::shared_ptr<FakeProvider> provider = std::make_shared<FakeProvider>();

    Rig(std::unique_ptr<OutcomeBackend> backend, std::unique_ptr<IModelTrainer> trainer)
        : store(std::move(backend), kb),
          ensemble("", std::move(trainer), TrainOpt{}, 1, 11) {}

    explicit Rig(const char* tag)
        : Rig(make_file_backend(cropadvisor_test::temp_dir(tag)), make_lightgbm_trainer()) {}

    FusionEngine engine(FusionOptions opt = {})
    {
        return FusionEngine(gateway, provider, store, ensemble, analyzer, kb, opt);
    }

    void history(const std::string& loc, const std::string& crop, const std::string& season,
                 int attempts, int successes)
    {
        RecommendationRecord r;
        r.location = loc;
        r.season   = season;
        const std::string id = store.track_recommendation(r);
        CHECK(!id.empty());
        for (int i = 0; i < attempts; ++i) {
            FeedbackRecord f;
            f.recommendation_id = id;
            f.crop_chosen       = crop;
            f.success           = i < successes;
            f.yield_achieved    = 42;
            f.profit_realized   = 60000;
            CHECK(store.collect_feedback(f));
        }
    }
};

RecommendationQuery query(const std::string& loc, const std::string& soil, const std::string& season)
{
    RecommendationQuery q;
    q.location  = loc;
    q.soil_type = soil;
    q.season    = season;
    return q;
}

/* ---------- tests ---------- */
void test_worked_example()
{
    cropadvisor_test::section("all signals present → 83.5, Very High");
    Rig rig(make_file_backend(cropadvisor_test::temp_dir("fuse835")),
            std::unique_ptr<IModelTrainer>(new FixedTrainer(0.9)));
    CHECK(rig.ensemble.train(std::vector<TrainingSample>(1)));
    rig.history("Delhi", "wheat", "rabi", 10, 8);
    rig.gateway->weather = dry_week(21, 5);
    rig.provider->list   = { cand("wheat", 70) };

    const EnhancedRecommendations res = rig.engine().get_enhanced_recommendations(query("Delhi", "loamy", "rabi"));
    CHECK(res.recommendations.size() == 1);
    const EnhancedRecommendation& w = res.recommendations.front();
    CHECK_NEAR(w.breakdown.baseline,   42,   1e-9);
    CHECK_NEAR(w.breakdown.historical, 12,   1e-9);
    CHECK_NEAR(w.breakdown.weather,    16,   1e-9);
    CHECK_NEAR(w.breakdown.ml,         13.5, 1e-9);
    CHECK_NEAR(w.enhanced_score, 83.5, 1e-9);
    CHECK(w.confidence_level == "Very High");
    CHECK_NEAR(w.confidence_score, 1.0, 1e-12);
    CHECK(w.predictions.source == "ml");
    CHECK_NEAR(w.predictions.yield.expected, 44, 1e-9);
    CHECK_NEAR(w.predictions.yield.optimistic, 52.8, 1e-9);
    CHECK_NEAR(w.predictions.profit.pessimistic, 45500, 1e-9);
    CHECK(w.predictions.market.data_source == "real-time");
    CHECK(w.predictions.market.next_year == static_cast<long>(2275 * 1.28));

    CHECK(res.data_sources.weather == "real-time");
    CHECK(res.data_sources.historical == "1 crops tracked");
    CHECK(res.data_sources.predictions == "ML models v1");
    CHECK(res.forecast_summary.forecast_days == 5);
    CHECK(rig.provider->last_soil == "loamy");
    CHECK(rig.provider->last_season == "rabi");

    const json j = to_json(res);
    CHECK(j["recommendations"][0]["enhanced_score"] == 83.5);
    CHECK(j["recommendations"][0]["historical_performance"]["total_attempts"] == 10);
    CHECK(j["data_sources"]["market"] == "real-time");
}

void test_degraded_delhi()
{
    cropadvisor_test::section("gateway down, no history, untrained → baseline order");
    Rig rig("fusedeg");
    rig.gateway->up    = false;
    rig.provider->list = { cand("mustard", 78), cand("wheat", 85), cand("chickpea", 72),
                           cand("barley", 66) };

    const EnhancedRecommendations res = rig.engine().get_enhanced_recommendations(query("Delhi", "loamy", "rabi"));
    CHECK(res.recommendations.size() == 4);
    const char* order[] = {"wheat", "mustard", "chickpea", "barley"};
    for (size_t i = 0; i < res.recommendations.size(); ++i) {
        const EnhancedRecommendation& r = res.recommendations[i];
        CHECK(r.candidate.crop == order[i]);
        /* 0.6·base + neutral history + neutral weather + untrained model */
        CHECK_NEAR(r.enhanced_score, 0.6 * r.candidate.suitability_score + 7.5 + 10 + 11.25, 0.051);
        CHECK(r.confidence_level == "Medium");
        CHECK(r.weather.status == "no_forecast");
        CHECK(r.predictions.source == "baseline");
        CHECK_NEAR(r.predictions.success_probability, 0.75, 0);
        CHECK(r.predictions.yield.expected >= 35.9 && r.predictions.yield.expected <= 44.1);
        CHECK(!r.history);
    }
    CHECK(res.data_sources.weather == "fallback");
    CHECK(res.data_sources.market  == "fallback");
    CHECK(res.data_sources.soil    == "fallback");
    CHECK(res.data_sources.historical == "0 crops tracked");
    CHECK(res.data_sources.predictions == "statistical + baseline");
    CHECK(res.forecast_summary.status == "no_forecast");
}

void test_gateway_timeout()
{
    cropadvisor_test::section("slow gateway is abandoned at the deadline");
    Rig rig("fusetmo");
    rig.gateway->weather  = dry_week(21, 5);
    rig.gateway->delay_ms = 300;
    rig.provider->list    = { cand("wheat", 70) };

    FusionOptions opt;
    opt.gateway_timeout = std::chrono::milliseconds(50);

    const auto t0 = std::chrono::steady_clock::now();
    const EnhancedRecommendations res = rig.engine(opt).get_enhanced_recommendations(query("Delhi", "", "rabi"));
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                        std::chrono::steady_clock::now() - t0).count();

    CHECK(ms < 250);                                  // three calls waited on together
    CHECK(res.data_sources.weather == "fallback");
    CHECK(res.soil_type == "loamy");                  // soil fell back as well
    CHECK(res.recommendations.size() == 1);

    /* let the abandoned calls finish before the rig goes away */
    std::this_thread::sleep_for(std::chrono::milliseconds(400));
}

void test_pending_call_cap()
{
    cropadvisor_test::section("stalled gateway calls are capped");
    Rig rig("fusecap");
    rig.gateway->weather  = dry_week(21, 5);
    rig.gateway->delay_ms = 300;
    rig.provider->list    = { cand("wheat", 70) };

    FusionOptions opt;
    opt.gateway_timeout   = std::chrono::milliseconds(30);
    opt.max_pending_calls = 3;
    {
        FusionEngine engine = rig.engine(opt);

        /* three calls time out and keep running */
        const auto first = engine.get_enhanced_recommendations(query("Delhi", "loamy", "rabi"));
        CHECK(first.data_sources.weather == "fallback");

        /* cap reached: no new gateway call, straight to fallback */
        const auto second = engine.get_enhanced_recommendations(query("Delhi", "loamy", "rabi"));
        CHECK(second.data_sources.weather == "fallback");
        CHECK(second.data_sources.market == "fallback");
        CHECK(second.recommendations.size() == 1);       // provider has its own allowance

        std::this_thread::sleep_for(std::chrono::milliseconds(400));
        rig.gateway->delay_ms = 0;
        const auto third = engine.get_enhanced_recommendations(query("Delhi", "loamy", "rabi"));
        CHECK(third.data_sources.weather == "real-time");
    }
    CHECK(rig.gateway->calls == 6);                       // 3 + 0 + 3
}

void test_soil_from_gateway()
{
    cropadvisor_test::section("soil type from soil-health data");
    Rig rig("fusesoil");
    rig.provider->list = { cand("rice", 80, "kharif") };

    RecommendationQuery q;
    q.location = "Patna";
    const EnhancedRecommendations res = rig.engine().get_enhanced_recommendations(q);
    CHECK(res.soil_type == "alluvial");
    CHECK(rig.provider->last_soil == "alluvial");
    CHECK(res.season == "kharif");                    // taken from the top candidate
    CHECK(res.data_sources.soil == "real-time");
}

void test_baseline_failures()
{
    cropadvisor_test::section("no baseline → DataUnavailable");
    Rig rig("fusefail");
    rig.provider->fail = true;
    bool thrown = false;
    try {
        rig.engine().get_enhanced_recommendations(query("Delhi", "loamy", "rabi"));
    } catch (const DataUnavailable&) {
        thrown = true;
    }
    CHECK(thrown);

    rig.provider->fail = false;
    rig.provider->list.clear();
    thrown = false;
    try {
        rig.engine().get_enhanced_recommendations(query("Delhi", "loamy", "rabi"));
    } catch (const DataUnavailable&) {
        thrown = true;
    }
    CHECK(thrown);
}

void test_broken_store()
{
    cropadvisor_test::section("store failure degrades to neutral history");
    Rig rig(std::unique_ptr<OutcomeBackend>(new BrokenBackend), make_lightgbm_trainer());
    rig.provider->list = { cand("wheat", 70), cand("mustard", 60) };

    const EnhancedRecommendations res = rig.engine().get_enhanced_recommendations(query("Delhi", "loamy", "rabi"));
    CHECK(res.recommendations.size() == 2);
    CHECK(res.data_sources.historical == "unavailable");
    for (const auto& r : res.recommendations) {
        CHECK(!r.history);
        CHECK_NEAR(r.breakdown.historical, 7.5, 0);
    }
}

void test_top_n()
{
    cropadvisor_test::section("top eight, highest first");
    Rig rig("fusetop");
    for (int i = 0; i < 12; ++i)
        rig.provider->list.push_back(cand("crop" + std::to_string(i), 40 + 4 * i));

    const EnhancedRecommendations res = rig.engine().get_enhanced_recommendations(query("Delhi", "loamy", "rabi"));
    CHECK(res.recommendations.size() == 8);
    CHECK(res.recommendations.front().candidate.crop == "crop11");
    for (size_t i = 1; i < res.recommendations.size(); ++i)
        CHECK(res.recommendations[i - 1].enhanced_score >= res.recommendations[i].enhanced_score);
}

void test_statistical_fallback()
{
    cropadvisor_test::section("untrained + 5 attempts → history statistics");
    Rig rig("fusestat");
    rig.history("Nashik", "onion", "rabi", 5, 4);
    rig.provider->list = { cand("onion", 75) };

    const EnhancedRecommendations res = rig.engine().get_enhanced_recommendations(query("Nashik", "loamy", "rabi"));
    const EnhancedRecommendation& r = res.recommendations.front();
    CHECK(r.predictions.source == "statistical");
    CHECK_NEAR(r.predictions.success_probability, 0.8, 1e-12);
    CHECK_NEAR(r.predictions.yield.expected, 42, 1e-9);
    CHECK_NEAR(r.predictions.profit.expected, 60000, 1e-9);
    CHECK_NEAR(r.breakdown.historical, 12, 1e-9);
    CHECK(r.confidence_level == "High");              // 20 + 15 + 30 + 10

    /* four attempts: not enough, back to the untrained default */
    Rig few("fusestat4");
    few.history("Nashik", "onion", "rabi", 4, 4);
    few.provider->list = { cand("onion", 75) };
    const auto r4 = few.engine().get_enhanced_recommendations(query("Nashik", "loamy", "rabi"));
    CHECK(r4.recommendations.front().predictions.source == "baseline");
}

void test_model_failure_keeps_signals()
{
    cropadvisor_test::section("failing model set falls back per prediction");
    Rig rig(make_file_backend(cropadvisor_test::temp_dir("fusemodel")),
            std::unique_ptr<IModelTrainer>(new FixedTrainer(0.9, true)));
    CHECK(rig.ensemble.train(std::vector<TrainingSample>(1)));
    rig.history("Delhi", "wheat", "rabi", 3, 3);
    rig.provider->list = { cand("wheat", 70), cand("mustard", 81) };

    const EnhancedRecommendations res = rig.engine().get_enhanced_recommendations(query("Delhi", "loamy", "rabi"));
    CHECK(res.recommendations.size() == 2);
    for (const auto& r : res.recommendations) {
        CHECK(!r.degraded);
        CHECK(r.predictions.source == "ml");
        CHECK_NEAR(r.predictions.success_probability, 0.75, 1e-12);
        CHECK_NEAR(r.predictions.yield.expected, 40, 1e-9);          // base
        CHECK_NEAR(r.predictions.profit.expected, 50000, 1e-9);
        CHECK_NEAR(r.breakdown.ml, 11.25, 1e-9);
    }
    /* wheat keeps its history: 42 + 15 + 10 + 11.25 */
    const auto& wheat = res.recommendations[0].candidate.crop == "wheat"
                            ? res.recommendations[0] : res.recommendations[1];
    CHECK(wheat.history && wheat.history->attempts == 3);
    CHECK_NEAR(wheat.breakdown.historical, 15, 1e-9);
    CHECK_NEAR(wheat.breakdown.composite, 78.25, 1e-9);
}

void test_candidate_degrades_alone()
{
    cropadvisor_test::section("per-candidate failure keeps the baseline entry");
    const std::string dir = cropadvisor_test::temp_dir("fusebad");
    Rig rig(std::unique_ptr<OutcomeBackend>(new FlakyBackend(make_file_backend(dir), "mustard")),
            std::unique_ptr<IModelTrainer>(new FixedTrainer(0.9)));
    CHECK(rig.ensemble.train(std::vector<TrainingSample>(1)));
    rig.provider->list = { cand("wheat", 70), cand("mustard", 81) };

    const EnhancedRecommendations res = rig.engine().get_enhanced_recommendations(query("Delhi", "loamy", "rabi"));
    CHECK(res.recommendations.size() == 2);

    const EnhancedRecommendation& m = res.recommendations[0];
    CHECK(m.candidate.crop == "mustard");
    CHECK(m.degraded);
    CHECK_NEAR(m.enhanced_score, 81, 0);
    CHECK(m.confidence_level == "Low");
    CHECK(to_json(res)["recommendations"][0]["degraded"] == true);

    const EnhancedRecommendation& w = res.recommendations[1];
    CHECK(w.candidate.crop == "wheat");
    CHECK(!w.degraded);
    CHECK_NEAR(w.breakdown.composite, 42 + 7.5 + 10 + 13.5, 1e-9);
}

} // namespace

int main()
{
    test_worked_example();
    test_degraded_delhi();
    test_gateway_timeout();
    test_pending_call_cap();
    test_soil_from_gateway();
    test_baseline_failures();
    test_broken_store();
    test_top_n();
    test_statistical_fallback();
    test_model_failure_keeps_signals();
    test_candidate_degrades_alone();
    return cropadvisor_test::finish("test_fusion_engine");
}

/*───────────────────────────────────────────────────────────
 *  fusion_engine.cpp
 *───────────────────────────────────────────────────────────*/
#include "cropadvisor/fusion_engine.hpp"

#include <algorithm>
#include <future>
#include <system_error>
#include <thread>

#include "cropadvisor/errors.hpp"
#include "cropadvisor/features.hpp"

namespace cropadvisor {

namespace {

using Clock = std::chrono::steady_clock;

/*  Run fn on a detached worker counted in `pending`.  fn must own
    everything it touches (shared_ptr captures), so a call that outlives
    its deadline can finish on its own after the request has moved on.
    With the cap reached the future is failed without starting a thread. */
template <typename T, typename F>
std::future<T> run_detached(const std::shared_ptr<PendingCalls>& pending, F fn)
{
    auto prom = std::make_shared<std::promise<T>>();
    std::future<T> fut = prom->get_future();
    if (!pending->try_acquire()) {
        prom->set_exception(std::make_exception_ptr(DataUnavailable(
            "upstream saturated, " + std::to_string(pending->running()) + " calls still pending")));
        return fut;
    }
    try {
        std::thread([prom, fn, pending]() mutable {
            try {
                prom->set_value(fn());
            } catch (const std::exception&) {
                prom->set_exception(std::current_exception());
            }
            pending->release();
        }).detach();
    } catch (const std::system_error&) {
        pending->release();
        prom->set_exception(std::current_exception());
    }
    return fut;
}

/* ready by the deadline and not thrown → value; else the reason */
template <typename T>
bool await(std::future<T>& fut, Clock::time_point deadline, T& out, std::string& why)
{
    if (fut.wait_until(deadline) != std::future_status::ready) {
        why = "timed out";
        return false;
    }
    try {
        out = fut.get();
        return true;
    } catch (const std::exception& e) {
        why = e.what();
        return false;
    }
}

struct SeasonMultipliers { double m3, m6, m12; };

SeasonMultipliers season_multipliers(const std::string& season)
{
    if (season == "kharif") return {1.15, 1.25, 1.35};
    if (season == "rabi")   return {1.08, 1.18, 1.28};
    return {1.12, 1.22, 1.32};                                  // year_round / zaid / unknown
}

Band make_band(double expected, double up, double down, int digits)
{
    Band b;
    b.expected    = round_to(expected, digits);
    b.optimistic  = round_to(expected * up, digits);
    b.pessimistic = round_to(expected * down, digits);
    return b;
}

json band_json(const Band& b, const char* unit)
{
    return { {"expected", b.expected}, {"optimistic", b.optimistic},
             {"pessimistic", b.pessimistic}, {"unit", unit} };
}

const char* src(bool ok) { return ok ? "real-time" : "fallback"; }

} // namespace


bool PendingCalls::try_acquire()
{
    std::lock_guard<std::mutex> lk(mtx_);
    if (running_ >= cap_) return false;
    ++running_;
    return true;
}

void PendingCalls::release()
{
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (running_ > 0) --running_;
    }
    cv_.notify_all();
}

size_t PendingCalls::running() const
{
    std::lock_guard<std::mutex> lk(mtx_);
    return running_;
}

bool PendingCalls::drain(std::chrono::steady_clock::time_point deadline) const
{
    std::unique_lock<std::mutex> lk(mtx_);
    return cv_.wait_until(lk, deadline, [this] { return running_ == 0; });
}


MarketOutlook market_outlook(const CropCandidate& c, const CropProfile& p,
                             const std::string& season, bool live_market)
{
    const SeasonMultipliers m = season_multipliers(to_lower(season));
    const double base = std::max(0.0, c.msp_per_quintal);

    MarketOutlook o;
    o.current_price = static_cast<long>(base);
    o.next_3_months = static_cast<long>(base * m.m3);
    o.next_6_months = static_cast<long>(base * m.m6);
    o.next_year     = static_cast<long>(base * m.m12);
    o.trend         = p.price_trend;
    o.volatility    = p.volatility;
    o.confidence    = (p.volatility == "low" || p.volatility == "medium") ? "High" : "Medium";
    o.data_source   = live_market ? "real-time" : "estimated";
    return o;
}


FusionEngine::FusionEngine(std::shared_ptr<GovernmentDataGateway>      gateway,
                           std::shared_ptr<BaseRecommendationProvider> provider,
                           const OutcomeStore&                         store,
                           const PredictiveEnsemble&                   ensemble,
                           const ForecastAnalyzer&                     analyzer,
                           const CropKnowledge&                        kb,
                           FusionOptions                               opt)
    : gateway_(std::move(gateway)), provider_(std::move(provider)),
      store_(store), ensemble_(ensemble), analyzer_(analyzer), kb_(kb),
      opt_(std::move(opt)),
      gateway_calls_(std::make_shared<PendingCalls>(std::max<size_t>(3, opt_.max_pending_calls))),
      provider_calls_(std::make_shared<PendingCalls>(std::max<size_t>(1, opt_.max_pending_calls)))
{
    if (!provider_) throw DataUnavailable("FusionEngine: no base recommendation provider");
}

/* give abandoned calls one more timeout to finish before the engine goes */
FusionEngine::~FusionEngine()
{
    const auto deadline = Clock::now() + opt_.gateway_timeout;
    for (const auto& p : {gateway_calls_, provider_calls_}) {
        if (!p || p->drain(deadline)) continue;            // moved-from or drained
        logW(std::to_string(p->running()) + " upstream call(s) still running at shutdown");
    }
}


/* ────────────────── step 1: live data ────────────────── */
FusionEngine::CurrentData FusionEngine::fetch_current(const RecommendationQuery& q) const
{
    CurrentData cur;
    if (!gateway_) {
        logW("no data gateway configured; using fallback conditions");
        return cur;
    }

    auto gw  = gateway_;
    auto loc = q.location;
    auto lat = q.latitude, lon = q.longitude;

    /* all three in flight before waiting on any */
    auto f_weather = run_detached<GatewayReply>(gateway_calls_, [gw, loc, lat, lon] { return gw->get_weather_data(loc, lat, lon); });
    auto f_market  = run_detached<GatewayReply>(gateway_calls_, [gw, loc, lat, lon] { return gw->get_market_prices(loc, lat, lon); });
    auto f_soil    = run_detached<GatewayReply>(gateway_calls_, [gw, loc, lat, lon] { return gw->get_soil_health_data(loc, lat, lon); });

    const auto deadline = Clock::now() + opt_.gateway_timeout;

    auto take = [&](std::future<GatewayReply>& f, const char* what, json& slot) {
        GatewayReply r;
        std::string  why;
        if (!await(f, deadline, r, why)) {
            logW(std::string(what) + " unavailable for " + loc + ": " + why);
            return false;
        }
        if (!r.ok()) {
            logW(std::string(what) + " unavailable for " + loc + ": status=" + r.status +
                 (r.message.empty() ? "" : " (" + r.message + ")"));
            return false;
        }
        slot = r.data.is_object() ? r.data : json::object();
        return true;
    };

    cur.weather_ok = take(f_weather, "weather",     cur.weather_raw);
    cur.market_ok  = take(f_market,  "market data", cur.market);
    cur.soil_ok    = take(f_soil,    "soil health", cur.soil);
    if (cur.weather_ok) cur.weather = weather_from_json(cur.weather_raw);
    return cur;
}


/* ────────────────── step 4: baseline ────────────────── */
std::vector<CropCandidate>
FusionEngine::fetch_candidates(const RecommendationQuery& q,
                               const std::string& soil,
                               const std::string& season) const
{
    auto prov = provider_;
    auto loc  = q.location;
    auto lat  = q.latitude, lon = q.longitude;
    auto fut  = run_detached<std::vector<CropCandidate>>(provider_calls_, [prov, loc, soil, season, lat, lon] {
        return prov->get_crop_recommendations(loc, soil, season, lat, lon);
    });

    std::vector<CropCandidate> out;
    std::string why;
    if (!await(fut, Clock::now() + opt_.gateway_timeout, out, why))
        throw DataUnavailable("base recommendations unavailable for " + loc + ": " + why);
    if (out.empty())
        throw DataUnavailable("base recommendations empty for " + loc);
    return out;
}


/* ────────────────── steps 2, 3, 5-7 per candidate ────────────────── */
EnhancedRecommendation
FusionEngine::enhance(const CropCandidate&       c,
                      const RecommendationQuery& q,
                      const CurrentData&         cur,
                      const std::string&         soil,
                      const std::string&         season) const
{
    EnhancedRecommendation r;
    r.candidate = c;

    const std::string hist_season = season.empty() ? opt_.default_season : season;
    auto perf = store_.get_crop_performance(q.location, c.crop, hist_season);
    if (perf.ok()) r.history = perf.value;
    const long   attempts = r.history ? r.history->attempts : 0;
    const double rate     = r.history ? r.history->success_rate : 0.0;

    r.weather = analyzer_.analyze_forecast(cur.weather.forecast, c.crop);

    const CropProfile   prof  = kb_.profile(c.crop);
    const CropAttributes attrs = crop_attributes(c, kb_, season.empty() ? opt_.default_season : season);
    const FeatureVector f = extract_features(attrs, cur.weather,
                                             LocationInfo{q.location, q.latitude, q.longitude},
                                             SoilInfo{soil});

    double p, yield, profit;
    if (ensemble_.is_trained()) {
        p      = ensemble_.predict_success(f);
        yield  = ensemble_.predict_yield(f, c.yield_per_hectare);
        profit = ensemble_.predict_profit(f, c.profit_per_hectare);
        r.predictions.source = "ml";
    } else if (attempts >= STATISTICAL_FALLBACK_ATTEMPTS) {
        p      = rate;
        yield  = r.history->avg_yield;
        profit = r.history->avg_profit;
        r.predictions.source = "statistical";
    } else {
        p      = ensemble_.predict_success(f);
        yield  = ensemble_.predict_yield(f, c.yield_per_hectare);
        profit = ensemble_.predict_profit(f, c.profit_per_hectare);
        r.predictions.source = "baseline";
    }
    r.predictions.success_probability = clamp_val(p, 0.0, 1.0);
    r.predictions.yield  = make_band(yield, 1.2, 0.8, 1);
    r.predictions.profit = make_band(profit, 1.3, 0.7, 0);
    r.predictions.market = market_outlook(c, prof, c.season.empty() ? season : c.season,
                                          cur.market_ok);

    r.breakdown = composite_score(c.suitability_score, attempts, rate,
                                  r.weather.suitability_score,
                                  r.predictions.success_probability);
    r.enhanced_score = round_to(r.breakdown.composite, 1);

    const int pts = confidence_points(attempts, r.predictions.success_probability,
                                      r.weather.confidence);
    r.confidence_score = pts / 100.0;
    r.confidence_level = confidence_label_points(pts);
    return r;
}


/* ────────────────── pipeline ────────────────── */
EnhancedRecommendations
FusionEngine::get_enhanced_recommendations(const RecommendationQuery& q) const
{
    logI("enhanced recommendations for " + q.location);

    EnhancedRecommendations out;
    out.location  = q.location;
    out.timestamp = now_iso();

    const CurrentData cur = fetch_current(q);

    std::string soil = q.soil_type ? *q.soil_type : "";
    if (soil.empty()) soil = get_string(cur.soil, "type");
    if (soil.empty()) soil = opt_.default_soil;
    soil = to_lower(soil);
    const std::string season = q.season ? to_lower(*q.season) : "";

    out.soil_type = soil;
    out.season    = season;

    std::vector<CropCandidate> candidates = fetch_candidates(q, soil, season);

    const auto tracked = store_.get_success_rate_by_location(q.location);
    switch (tracked.status) {
        case ReadStatus::Found:  out.data_sources.historical = std::to_string(tracked.value.size()) + " crops tracked"; break;
        case ReadStatus::NoData: out.data_sources.historical = "0 crops tracked"; break;
        case ReadStatus::Failed: out.data_sources.historical = "unavailable"; break;
    }

    out.recommendations.reserve(candidates.size());
    for (const auto& c : candidates) {
        try {
            out.recommendations.push_back(enhance(c, q, cur, soil, season));
        } catch (const std::exception& e) {
            logW("enhancement failed for " + c.crop + ", using baseline: " + e.what());
            EnhancedRecommendation r;
            r.candidate        = c;
            r.enhanced_score   = c.suitability_score;
            r.confidence_level = "Low";
            r.degraded         = true;
            r.degraded_reason  = e.what();
            out.recommendations.push_back(std::move(r));
        }
    }

    std::stable_sort(out.recommendations.begin(), out.recommendations.end(),
                     [](const EnhancedRecommendation& a, const EnhancedRecommendation& b) {
                         return a.enhanced_score > b.enhanced_score;
                     });
    if (out.recommendations.size() > opt_.max_recommendations)
        out.recommendations.resize(opt_.max_recommendations);

    if (out.season.empty() && !out.recommendations.empty())
        out.season = out.recommendations.front().candidate.season;

    out.weather          = cur.weather;
    out.forecast_summary = analyzer_.summarize(cur.weather.forecast);

    out.data_sources.current     = src(cur.weather_ok);
    out.data_sources.weather     = src(cur.weather_ok);
    out.data_sources.market      = src(cur.market_ok);
    out.data_sources.soil        = src(cur.soil_ok);
    out.data_sources.predictions = ensemble_.is_trained()
        ? "ML models v" + std::to_string(ensemble_.version())
        : std::string("statistical + baseline");

    out.current_conditions = {
        {"weather",       cur.weather_ok ? to_json(cur.weather) : json::object()},
        {"market_prices", cur.market},
        {"soil_health",   cur.soil},
        {"soil_type",     soil},
        {"data_source",   src(cur.weather_ok)}
    };
    return out;
}


/* ────────────────── JSON ────────────────── */
json to_json(const EnhancedRecommendation& r)
{
    json j = to_json(r.candidate);
    j["enhanced_score"]   = r.enhanced_score;
    j["confidence_level"] = r.confidence_level;
    j["confidence_score"] = r.confidence_score;
    if (r.degraded) {
        j["degraded"]        = true;
        j["degraded_reason"] = r.degraded_reason;
        return j;
    }

    j["score_breakdown"] = {
        {"baseline",   round_to(r.breakdown.baseline, 2)},
        {"historical", round_to(r.breakdown.historical, 2)},
        {"weather",    round_to(r.breakdown.weather, 2)},
        {"ml",         round_to(r.breakdown.ml, 2)}
    };
    if (r.history) {
        const auto& h = *r.history;
        j["historical_performance"] = {
            {"success_rate",   round_to(h.success_rate, 3)},
            {"avg_yield",      round_to(h.avg_yield, 1)},
            {"avg_profit",     round_to(h.avg_profit, 0)},
            {"total_attempts", h.attempts},
            {"data_quality",   h.attempts >= STRONG_HISTORY_ATTEMPTS ? "high" : "low"}
        };
    } else {
        j["historical_performance"] = json::object();
    }
    j["weather_forecast_analysis"] = to_json(r.weather);

    const auto& p = r.predictions;
    j["predictions"] = {
        {"success_probability", round_to(p.success_probability, 3)},
        {"yield",  band_json(p.yield,  "quintals/hectare")},
        {"profit", band_json(p.profit, "₹/hectare")},
        {"market_price", {
            {"current_price", p.market.current_price},
            {"next_3_months", p.market.next_3_months},
            {"next_6_months", p.market.next_6_months},
            {"next_year",     p.market.next_year},
            {"unit",          "₹/quintal"},
            {"trend",         p.market.trend},
            {"volatility",    p.market.volatility},
            {"confidence",    p.market.confidence},
            {"data_source",   p.market.data_source}
        }},
        {"source", p.source}
    };
    return j;
}

json to_json(const EnhancedRecommendations& r)
{
    json recs = json::array();
    for (const auto& e : r.recommendations) recs.push_back(to_json(e));

    return {
        {"location",           r.location},
        {"season",             r.season},
        {"soil_type",          r.soil_type},
        {"recommendations",    recs},
        {"current_conditions", r.current_conditions},
        {"forecast_summary",   to_json(r.forecast_summary)},
        {"data_sources", {
            {"current",     r.data_sources.current},
            {"weather",     r.data_sources.weather},
            {"market",      r.data_sources.market},
            {"soil",        r.data_sources.soil},
            {"historical",  r.data_sources.historical},
            {"predictions", r.data_sources.predictions}
        }},
        {"timestamp", r.timestamp}
    };
}

} // namespace cropadvisor

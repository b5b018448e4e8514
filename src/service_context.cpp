/*───────────────────────────────────────────────────────────
 *  service_context.cpp
 *───────────────────────────────────────────────────────────*/
#include "cropadvisor/service_context.hpp"

#include "cropadvisor/errors.hpp"
#include "cropadvisor/reference_adapters.hpp"

namespace cropadvisor {

namespace {

std::unique_ptr<OutcomeBackend> open_backend(const ServiceConfig& cfg)
{
    if (cfg.store_backend == "mysql") return make_mysql_backend(cfg.mysql);
    return make_file_backend(cfg.data_dir);
}

std::shared_ptr<GovernmentDataGateway> open_gateway(const ServiceConfig& cfg)
{
    if (cfg.snapshot_dir.empty()) return nullptr;
    return std::make_shared<SnapshotGateway>(cfg.snapshot_dir);
}

} // namespace

ServiceContext::ServiceContext(const ServiceConfig& cfg)
    : cfg_(cfg), kb_(CropKnowledge::builtin())
{
    wire(open_backend(cfg_), open_gateway(cfg_),
         std::make_shared<CatalogBaseProvider>(cfg_.catalog_path),
         make_lightgbm_trainer());
}

ServiceContext::ServiceContext(const ServiceConfig&                        cfg,
                               std::unique_ptr<OutcomeBackend>             backend,
                               std::shared_ptr<GovernmentDataGateway>      gateway,
                               std::shared_ptr<BaseRecommendationProvider> provider,
                               std::unique_ptr<IModelTrainer>              trainer)
    : cfg_(cfg), kb_(CropKnowledge::builtin())
{
    wire(std::move(backend), std::move(gateway), std::move(provider), std::move(trainer));
}

void ServiceContext::wire(std::unique_ptr<OutcomeBackend>             backend,
                          std::shared_ptr<GovernmentDataGateway>      gateway,
                          std::shared_ptr<BaseRecommendationProvider> provider,
                          std::unique_ptr<IModelTrainer>              trainer)
{
    if (!cfg_.knowledge_path.empty() && !kb_.load(cfg_.knowledge_path))
        logW("continuing with the built-in crop table");

    store_    = std::make_unique<OutcomeStore>(std::move(backend), kb_);
    ensemble_ = std::make_unique<PredictiveEnsemble>(cfg_.model_dir, std::move(trainer),
                                                     cfg_.train, cfg_.min_training_samples,
                                                     cfg_.jitter_seed);
    ensemble_->load();
    analyzer_ = std::make_unique<ForecastAnalyzer>(kb_);

    FusionOptions fo;
    fo.gateway_timeout     = std::chrono::milliseconds(cfg_.gateway_timeout_ms);
    fo.max_recommendations = cfg_.max_recommendations;
    fo.max_pending_calls   = cfg_.gateway_max_pending;
    engine_ = std::make_unique<FusionEngine>(std::move(gateway), std::move(provider),
                                             *store_, *ensemble_, *analyzer_, kb_, fo);

    logI("service ready: store=" + store_->describe() +
         " model=" + (ensemble_->is_trained() ? "v" + std::to_string(ensemble_->version())
                                              : std::string("untrained")));
}

ServiceContext::~ServiceContext()
{
    wait_for_background();
}

EnhancedRecommendations ServiceContext::recommend(const RecommendationQuery& q) const
{
    return engine_->get_enhanced_recommendations(q);
}

std::string ServiceContext::track_recommendation(const RecommendationRecord& r)
{
    return store_->track_recommendation(r);
}

bool ServiceContext::collect_feedback(const FeedbackRecord& f)
{
    if (!store_->collect_feedback(f)) return false;
    const size_t n = ++accepted_feedback_;
    if (cfg_.retrain_every > 0 && n % cfg_.retrain_every == 0)
        maybe_start_background_retrain();
    return true;
}

bool ServiceContext::retrain()
{
    /* every joined row; the ensemble applies the minimum and logs the count */
    return ensemble_->train(store_->get_training_data(0));
}

void ServiceContext::maybe_start_background_retrain()
{
    std::lock_guard<std::mutex> lk(worker_mtx_);
    if (worker_busy_.load()) {
        logI("retrain already running; trigger skipped");
        return;
    }
    if (worker_.joinable()) worker_.join();           // finished earlier

    worker_busy_ = true;
    logI("starting background retrain after " +
         std::to_string(accepted_feedback_.load()) + " feedback records");
    worker_ = std::thread([this] {
        const bool ok = retrain();
        logI(std::string("background retrain ") + (ok ? "swapped in a new model set"
                                                      : "left the model set unchanged"));
        worker_busy_ = false;
    });
}

void ServiceContext::wait_for_background()
{
    std::lock_guard<std::mutex> lk(worker_mtx_);
    if (worker_.joinable()) worker_.join();
}

} // namespace cropadvisor

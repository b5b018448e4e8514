/* -----------------------------------------------------------
 *  test_config  –  settings, command line, service wiring
 * ----------------------------------------------------------- */
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "cropadvisor/config.hpp"
#include "cropadvisor/errors.hpp"
#include "cropadvisor/reference_adapters.hpp"
#include "cropadvisor/service_context.hpp"
#include "test_util.hpp"

using namespace cropadvisor;

namespace {

CliArgs cli(std::vector<std::string> words)
{
    words.insert(words.begin(), "cropadvisor");
    std::vector<char*> argv;
    for (auto& w : words) argv.push_back(&w[0]);
    return parse_cli(static_cast<int>(argv.size()), argv.data());
}

bool throws_config_error(ServiceConfig& cfg, const std::string& k, const std::string& v)
{
    try {
        apply_setting(cfg, k, v);
    } catch (const CropAdvisorError&) {
        return true;
    }
    return false;
}

void test_settings()
{
    cropadvisor_test::section("apply_setting");
    ServiceConfig cfg;
    CHECK(cfg.min_training_samples == 50);
    CHECK(cfg.max_recommendations == 8);
    CHECK(throws_config_error(cfg, "gateway_max_pending", "2"));
    CHECK(apply_setting(cfg, "gateway_max_pending", "6"));
    CHECK(cfg.gateway_max_pending == 6);
    CHECK(cfg.gateway_timeout_ms == 5000);

    CHECK(apply_setting(cfg, "min_training_samples", "20"));
    CHECK(cfg.min_training_samples == 20);
    CHECK(apply_setting(cfg, "store_backend", "MySQL"));
    CHECK(cfg.store_backend == "mysql");
    CHECK(apply_setting(cfg, "lr", "0.1"));
    CHECK_NEAR(cfg.train.lr, 0.1, 1e-12);
    CHECK(apply_setting(cfg, "mysql_port", "3306"));
    CHECK(cfg.mysql.port == 3306);

    CHECK(!apply_setting(cfg, "location", "Delhi"));      // command option, not a setting
    CHECK(throws_config_error(cfg, "trees", "many"));
    CHECK(throws_config_error(cfg, "retrain_every", "-1"));
    CHECK(throws_config_error(cfg, "store_backend", "sqlite"));
    CHECK(throws_config_error(cfg, "gateway_timeout_ms", "50ms"));

    CHECK(throws_config_error(cfg, "max_recommendations", "0"));
    CHECK(throws_config_error(cfg, "max_recommendations", "9"));
    CHECK(apply_setting(cfg, "max_recommendations", "1"));
    CHECK(apply_setting(cfg, "max_recommendations", "8"));
    CHECK(cfg.max_recommendations == 8);

    CHECK(!to_json(cfg).contains("mysql_pass"));
}

void test_cli_and_file()
{
    cropadvisor_test::section("defaults < file < command line");
    const std::string dir  = cropadvisor_test::temp_dir("cfg");
    const std::string path = dir + "/service.json";
    {
        std::ofstream out(path);
        out << R"({ "model_dir": "/srv/models", "trees": 80, "max_recommendations": 5,
                    "mystery": 1, "nested": {"a": 1} })";
    }

    const CliArgs a = cli({"--config=" + path, "recommend", "--location=Delhi",
                           "--max_recommendations=3", "--track"});
    CHECK(a.command == "recommend");
    CHECK(a.get("location") == "Delhi");
    CHECK(a.get("track") == "true");
    CHECK(a.get("soil", "loamy") == "loamy");

    const ServiceConfig cfg = resolve_config(a);
    CHECK(cfg.model_dir == "/srv/models");
    CHECK(cfg.train.trees == 80);
    CHECK(cfg.max_recommendations == 3);                  // command line wins
    CHECK(cfg.data_dir == "data");

    bool thrown = false;
    try {
        resolve_config(cli({"--config=" + dir + "/absent.json", "train"}));
    } catch (const CropAdvisorError&) {
        thrown = true;
    }
    CHECK(thrown);
}

/* ---------- wiring with injected collaborators ---------- */
struct FixedSet : IModelSet {
    int v; size_t n;
    FixedSet(int v_, size_t n_) : v(v_), n(n_) {}
    double success_probability(const FeatureVector&) const override { return 0.82; }
    double yield (const FeatureVector&) const override { return 38; }
    double profit(const FeatureVector&) const override { return 47000; }
    void   save(const std::string&) const override {}
    int    version()    const override { return v; }
    size_t trained_on() const override { return n; }
};

struct FixedTrainer : IModelTrainer {
    std::shared_ptr<const IModelSet>
    fit(const std::vector<TrainingSample>& s, const TrainOpt&, int version) const override
    {
        return std::make_shared<FixedSet>(version, s.size());
    }
    std::shared_ptr<const IModelSet> load(const std::string& dir) const override
    {
        throw PersistenceFailure("nothing saved in " + dir);
    }
};

void test_service_background_retrain()
{
    cropadvisor_test::section("feedback count triggers a retrain");
    ServiceConfig cfg;
    cfg.model_dir            = "";
    cfg.min_training_samples = 3;
    cfg.retrain_every        = 3;
    cfg.jitter_seed          = 5;

    const json catalog = json::array({
        { {"crop", "wheat"},   {"season", "rabi"}, {"soil_types", json::array({"loamy"})}, {"suitability_score", 80} },
        { {"crop", "mustard"}, {"season", "rabi"}, {"suitability_score", 75} }
    });

    ServiceContext ctx(cfg, make_file_backend(cropadvisor_test::temp_dir("svc")),
                       nullptr, std::make_shared<CatalogBaseProvider>(catalog),
                       std::unique_ptr<IModelTrainer>(new FixedTrainer));
    CHECK(!ctx.ensemble().is_trained());

    RecommendationRecord rec;
    rec.location      = "Delhi";
    rec.season        = "rabi";
    rec.soil_type     = "loamy";
    rec.crops_offered = {"wheat", "mustard"};
    const std::string id = ctx.track_recommendation(rec);
    CHECK(!id.empty());

    for (int i = 0; i < 3; ++i) {
        FeedbackRecord f;
        f.recommendation_id = id;
        f.crop_chosen       = "wheat";
        f.success           = i != 1;
        f.yield_achieved    = 40;
        f.profit_realized   = 52000;
        CHECK(ctx.collect_feedback(f));
    }
    ctx.wait_for_background();
    CHECK(ctx.ensemble().is_trained());
    CHECK(ctx.ensemble().version() == 1);
    CHECK(ctx.ensemble().trained_on() == 3);

    RecommendationQuery q;
    q.location  = "Delhi";
    q.soil_type = "loamy";
    q.season    = "rabi";
    const EnhancedRecommendations res = ctx.recommend(q);
    CHECK(res.recommendations.size() == 2);
    CHECK(res.recommendations.front().candidate.crop == "wheat");
    CHECK(res.recommendations.front().predictions.source == "ml");
    CHECK(res.data_sources.weather == "fallback");       // no gateway configured

    CHECK(ctx.retrain());
    CHECK(ctx.ensemble().version() == 2);
}

void test_retrain_reports_joined_count()
{
    cropadvisor_test::section("short retrain logs the joined count");
    ServiceConfig cfg;
    cfg.model_dir            = "";
    cfg.min_training_samples = 3;
    cfg.retrain_every        = 0;

    const json catalog = json::array({ { {"crop", "wheat"}, {"season", "rabi"}, {"suitability_score", 80} } });
    ServiceContext ctx(cfg, make_file_backend(cropadvisor_test::temp_dir("svcshort")),
                       nullptr, std::make_shared<CatalogBaseProvider>(catalog),
                       std::unique_ptr<IModelTrainer>(new FixedTrainer));

    RecommendationRecord rec;
    rec.location = "Delhi";
    rec.season   = "rabi";
    const std::string id = ctx.track_recommendation(rec);
    for (int i = 0; i < 2; ++i) {
        FeedbackRecord f;
        f.recommendation_id = id;
        f.crop_chosen       = "wheat";
        f.success           = true;
        CHECK(ctx.collect_feedback(f));
    }

    std::ostringstream log;
    std::streambuf* old = std::cerr.rdbuf(log.rdbuf());
    const bool trained = ctx.retrain();
    std::cerr.rdbuf(old);

    CHECK(!trained);
    CHECK(!ctx.ensemble().is_trained());
    CHECK(log.str().find("2 samples (need 3+)") != std::string::npos);
}

void test_service_missing_catalog()
{
    cropadvisor_test::section("unreadable catalog fails construction");
    ServiceConfig cfg;
    cfg.data_dir     = cropadvisor_test::temp_dir("svcbad");
    cfg.model_dir    = "";
    cfg.catalog_path = cfg.data_dir + "/none.json";
    bool thrown = false;
    try {
        ServiceContext ctx(cfg);
    } catch (const DataUnavailable&) {
        thrown = true;
    }
    CHECK(thrown);
}

} // namespace

int main()
{
    test_settings();
    test_cli_and_file();
    test_service_background_retrain();
    test_retrain_reports_joined_count();
    test_service_missing_catalog();
    return cropadvisor_test::finish("test_config");
}

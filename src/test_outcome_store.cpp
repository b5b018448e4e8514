/* -----------------------------------------------------------
 *  test_outcome_store  –  events, aggregates, training join
 * ----------------------------------------------------------- */
#include <thread>
#include <vector>

#include "cropadvisor/errors.hpp"
#include "cropadvisor/outcome_store.hpp"
#include "test_util.hpp"

using namespace cropadvisor;

namespace {

/* every operation fails like an unreachable disk / server */
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

RecommendationRecord make_rec(const std::string& loc, const std::string& season)
{
    RecommendationRecord r;
    r.location  = loc;
    r.season    = season;
    r.soil_type = "loamy";
    r.latitude  = 28.6;
    r.longitude = 77.2;
    r.weather.temperature = 22;
    r.weather.humidity    = 55;
    r.weather.condition   = "Clear";
    r.crops_offered = {"wheat", "mustard"};
    return r;
}

FeedbackRecord make_fb(const std::string& rec_id, const std::string& crop,
                       bool success, double yield, double profit)
{
    FeedbackRecord f;
    f.recommendation_id   = rec_id;
    f.crop_chosen         = crop;
    f.success             = success;
    f.yield_achieved      = yield;
    f.profit_realized     = profit;
    f.satisfaction_rating = success ? 5 : 2;
    return f;
}

void test_ids_and_resolution()
{
    cropadvisor_test::section("ids and key resolution");
    const CropKnowledge kb = CropKnowledge::builtin();
    OutcomeStore store(make_file_backend(cropadvisor_test::temp_dir("ids")), kb);

    const std::string a = store.track_recommendation(make_rec("Delhi", "rabi"));
    const std::string b = store.track_recommendation(make_rec("Delhi", "rabi"));
    CHECK(a.rfind("REC_", 0) == 0);
    CHECK(a.size() == std::string("REC_20261019081502_abcdef").size());
    CHECK(a != b);

    /* location / season come from the referenced recommendation */
    CHECK(store.collect_feedback(make_fb(a, "Wheat", true, 45, 60000)));
    auto perf = store.get_crop_performance("Delhi", "wheat", "rabi");
    CHECK(perf.status == ReadStatus::Found);
    CHECK(perf.value.attempts == 1);

    /* unknown reference: still aggregated, under "unknown" */
    CHECK(store.collect_feedback(make_fb("REC_missing", "wheat", false, 10, 1000)));
    CHECK(store.get_crop_performance("unknown", "wheat", "unknown").ok());

    FeedbackRecord empty = make_fb(a, "", true, 1, 1);
    CHECK(!store.collect_feedback(empty));

    CHECK(store.get_crop_performance("Delhi", "rice", "rabi").status == ReadStatus::NoData);
}

void test_incremental_matches_batch()
{
    cropadvisor_test::section("incremental aggregate == batch recomputation");
    const CropKnowledge kb = CropKnowledge::builtin();
    OutcomeStore store(make_file_backend(cropadvisor_test::temp_dir("agg")), kb);
    const std::string id = store.track_recommendation(make_rec("Pune", "kharif"));

    const double yields [] = {30, 42.5, 18, 50, 37, 44, 29};
    const double profits[] = {40000, 61000, 12000, 70000, 52000, 58000, 31000};
    const bool   ok     [] = {true, true, false, true, true, true, false};

    long succ = 0; double ysum = 0, psum = 0;
    for (int i = 0; i < 7; ++i) {
        CHECK(store.collect_feedback(make_fb(id, "maize", ok[i], yields[i], profits[i])));
        succ += ok[i]; ysum += yields[i]; psum += profits[i];

        auto p = store.get_crop_performance("Pune", "maize", "kharif");
        CHECK(p.ok());
        CHECK(p.value.attempts == i + 1);
        CHECK(p.value.success_rate >= 0.0 && p.value.success_rate <= 1.0);
    }
    auto p = store.get_crop_performance("Pune", "maize", "kharif");
    CHECK(p.value.successes == succ);
    CHECK_NEAR(p.value.success_rate, double(succ) / 7.0, 1e-12);
    CHECK_NEAR(p.value.avg_yield,    ysum / 7.0, 1e-9);
    CHECK_NEAR(p.value.avg_profit,   psum / 7.0, 1e-6);

    auto rates = store.get_success_rate_by_location("Pune");
    CHECK(rates.ok());
    CHECK(rates.value.count("maize") == 1);
    CHECK_NEAR(rates.value["maize"], double(succ) / 7.0, 1e-12);
    CHECK(store.get_success_rate_by_location("Nowhere").status == ReadStatus::NoData);
}

void test_reopen()
{
    cropadvisor_test::section("state survives reopen");
    const CropKnowledge kb = CropKnowledge::builtin();
    const std::string dir = cropadvisor_test::temp_dir("reopen");
    std::string id;
    {
        OutcomeStore store(make_file_backend(dir), kb);
        id = store.track_recommendation(make_rec("Jaipur", "rabi"));
        for (int i = 0; i < 4; ++i)
            CHECK(store.collect_feedback(make_fb(id, "mustard", i != 2, 15 + i, 30000)));
    }
    OutcomeStore store(make_file_backend(dir), kb);
    auto p = store.get_crop_performance("Jaipur", "mustard", "rabi");
    CHECK(p.ok());
    CHECK(p.value.attempts == 4);
    CHECK(p.value.successes == 3);

    /* the reopened id index still resolves the old recommendation */
    CHECK(store.collect_feedback(make_fb(id, "mustard", true, 20, 35000)));
    CHECK(store.get_crop_performance("Jaipur", "mustard", "rabi").value.attempts == 5);
}

void test_training_join()
{
    cropadvisor_test::section("training join");
    const CropKnowledge kb = CropKnowledge::builtin();
    OutcomeStore store(make_file_backend(cropadvisor_test::temp_dir("join")), kb);

    const std::string a = store.track_recommendation(make_rec("Delhi", "rabi"));
    const std::string b = store.track_recommendation(make_rec("Lucknow", "kharif"));
    CHECK(store.collect_feedback(make_fb(a, "wheat", true, 45, 60000)));
    CHECK(store.collect_feedback(make_fb(b, "rice", false, 20, 5000)));
    CHECK(store.collect_feedback(make_fb("REC_orphan", "wheat", true, 40, 50000)));

    auto rows = store.get_training_data(1);
    CHECK(rows.size() == 2);                         // orphan excluded
    for (const auto& r : rows) {
        CHECK(r.recommendation_id == a || r.recommendation_id == b);
        if (r.crop == "wheat") {
            CHECK(r.outcome.success == 1);
            CHECK_NEAR(r.feat[F_SEASON], 2, 0);      // rabi
            CHECK_NEAR(r.feat[F_LAT], 28.6, 1e-12);
            CHECK_NEAR(r.feat[F_TEMP_CURRENT], 22, 1e-12);
        } else {
            CHECK(r.crop == "rice");
            CHECK(r.outcome.success == 0);
            CHECK_NEAR(r.feat[F_WATER], 3, 0);       // knowledge base: high
            CHECK_NEAR(r.outcome.profit, 5000, 1e-9);
        }
    }

    CHECK(store.get_training_data(3).empty());       // 2 joined < 3
    CHECK(store.get_training_data(2).size() == 2);
}

void test_concurrent_feedback()
{
    cropadvisor_test::section("concurrent writes to one key");
    const CropKnowledge kb = CropKnowledge::builtin();
    OutcomeStore store(make_file_backend(cropadvisor_test::temp_dir("conc")), kb);
    const std::string id = store.track_recommendation(make_rec("Indore", "kharif"));

    const int T = 4, N = 25;
    std::vector<std::thread> ts;
    for (int t = 0; t < T; ++t)
        ts.emplace_back([&store, &id, t] {
            for (int i = 0; i < N; ++i)
                store.collect_feedback(make_fb(id, "soybean", (i + t) % 2 == 0, 20, 25000));
        });
    for (auto& th : ts) th.join();

    auto p = store.get_crop_performance("Indore", "soybean", "kharif");
    CHECK(p.ok());
    CHECK(p.value.attempts == T * N);
    CHECK(p.value.successes == T * N / 2);
    CHECK_NEAR(p.value.avg_yield, 20, 1e-9);
}

void test_unwritable_feedback_log()
{
    cropadvisor_test::section("failed feedback append leaves no trace");
    const CropKnowledge kb = CropKnowledge::builtin();
    const std::string dir = cropadvisor_test::temp_dir("fblog");
    OutcomeStore store(make_file_backend(dir), kb);
    const std::string id = store.track_recommendation(make_rec("Agra", "rabi"));

    CHECK(ensure_directory(dir + "/feedback.jsonl"));          // append cannot open it
    CHECK(!store.collect_feedback(make_fb(id, "wheat", true, 40, 50000)));
    CHECK(store.get_crop_performance("Agra", "wheat", "rabi").status == ReadStatus::NoData);

    CHECK(::rmdir((dir + "/feedback.jsonl").c_str()) == 0);
    CHECK(store.collect_feedback(make_fb(id, "wheat", true, 40, 50000)));
    CHECK(store.get_crop_performance("Agra", "wheat", "rabi").value.attempts == 1);
}

void test_table_flush_failure()
{
    cropadvisor_test::section("aggregate table flush failure");
    const CropKnowledge kb = CropKnowledge::builtin();
    const std::string dir = cropadvisor_test::temp_dir("flush");
    const std::string tmp = dir + "/performance.json.tmp";
    std::string id;
    {
        OutcomeStore store(make_file_backend(dir), kb);
        id = store.track_recommendation(make_rec("Nashik", "kharif"));

        CHECK(ensure_directory(tmp));                           // table rewrite fails
        CHECK(store.collect_feedback(make_fb(id, "onion", true, 180, 90000)));
        CHECK(store.get_crop_performance("Nashik", "onion", "kharif").value.attempts == 1);
        CHECK(::rmdir(tmp.c_str()) == 0);
    }
    {
        /* the table on disk lags the log by one event; reopening catches up */
        OutcomeStore store(make_file_backend(dir), kb);
        auto p = store.get_crop_performance("Nashik", "onion", "kharif");
        CHECK(p.ok());
        CHECK(p.value.attempts == 1);
        CHECK_NEAR(p.value.avg_yield, 180, 1e-9);

        CHECK(store.collect_feedback(make_fb(id, "onion", false, 90, 10000)));
        CHECK(store.get_crop_performance("Nashik", "onion", "kharif").value.attempts == 2);
    }
    OutcomeStore store(make_file_backend(dir), kb);
    auto p = store.get_crop_performance("Nashik", "onion", "kharif");
    CHECK(p.value.attempts == 2);
    CHECK(p.value.successes == 1);
    CHECK(store.get_training_data(1).size() == 2);
}

FeedbackRecord keyed_fb(const std::string& id, const std::string& loc, bool success)
{
    FeedbackRecord f = make_fb("REC_none", "wheat", success, 40, 50000);
    f.id        = id;
    f.location  = loc;
    f.season    = "rabi";
    f.timestamp = now_iso();
    return f;
}

/* location keys compare byte-wise in both stores */
void check_case_sensitive_keys(OutcomeBackend& b, const std::string& tag)
{
    b.record_feedback(keyed_fb("FB_" + tag + "_1", "Delhi", true),  {"Delhi", "wheat", "rabi"});
    b.record_feedback(keyed_fb("FB_" + tag + "_2", "delhi", false), {"delhi", "wheat", "rabi"});
    auto upper = b.load_aggregate({"Delhi", "wheat", "rabi"});
    auto lower = b.load_aggregate({"delhi", "wheat", "rabi"});
    CHECK(upper && upper->attempts == 1 && upper->successes == 1);
    CHECK(lower && lower->attempts == 1 && lower->successes == 0);
}

void test_file_keys_case_sensitive()
{
    cropadvisor_test::section("file store: location keys are case-sensitive");
    auto b = make_file_backend(cropadvisor_test::temp_dir("case"));
    check_case_sensitive_keys(*b, "file");
}

/* needs a server on 127.0.0.1:44444; skipped otherwise */
void test_mysql_backend()
{
    cropadvisor_test::section("mysql store");
    MysqlOptions opt;
    opt.db = "cropadvisor_test_" + now_compact();
    std::unique_ptr<OutcomeBackend> b;
    try {
        b = make_mysql_backend(opt);
    } catch (const PersistenceFailure& e) {
        std::cout << "   skipped: " << e.what() << std::endl;
        return;
    }
    check_case_sensitive_keys(*b, "my");

    /* a key too long for its column fails the upsert after the feedback
       insert went through; the transaction takes both back            */
    const size_t before = b->load_feedback().size();
    const std::string huge(300, 'x');
    bool failed = false;
    try {
        b->record_feedback(keyed_fb("FB_my_3", huge, true), {huge, "wheat", "rabi"});
    } catch (const PersistenceFailure&) {
        failed = true;
    }
    CHECK(failed);
    CHECK(b->load_feedback().size() == before);
    CHECK(b->aggregates_for_location(huge).empty());
}

void test_broken_backend()
{
    cropadvisor_test::section("failing backend degrades, never throws");
    const CropKnowledge kb = CropKnowledge::builtin();
    OutcomeStore store(std::unique_ptr<OutcomeBackend>(new BrokenBackend), kb);

    CHECK(store.track_recommendation(make_rec("Delhi", "rabi")).empty());
    CHECK(!store.collect_feedback(make_fb("REC_x", "wheat", true, 1, 1)));

    auto p = store.get_crop_performance("Delhi", "wheat", "rabi");
    CHECK(p.status == ReadStatus::Failed);
    CHECK(!p.error.empty());
    CHECK(store.get_success_rate_by_location("Delhi").status == ReadStatus::Failed);
    CHECK(store.get_training_data(0).empty());
}

} // namespace

int main()
{
    test_ids_and_resolution();
    test_incremental_matches_batch();
    test_reopen();
    test_unwritable_feedback_log();
    test_table_flush_failure();
    test_file_keys_case_sensitive();
    test_mysql_backend();
    test_training_join();
    test_concurrent_feedback();
    test_broken_backend();
    return cropadvisor_test::finish("test_outcome_store");
}

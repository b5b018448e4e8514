/*──────────────────────────────────────────────────────────────
   file_backend.cpp  –  embedded store

   <data_dir>/recommendations.jsonl   append-only, one record per line
   <data_dir>/feedback.jsonl          append-only, one record per line;
                                      a feedback event is committed once
                                      its line is written
   <data_dir>/performance.json        aggregate table plus the number of
                                      feedback lines it reflects, replaced
                                      by temp-file + rename after each
                                      update; rebuilt from feedback.jsonl
                                      at open when it lags the log
  ──────────────────────────────────────────────────────────────*/
#include <fstream>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>

#include "cropadvisor/errors.hpp"
#include "cropadvisor/outcome_backend.hpp"

namespace cropadvisor {

namespace {

constexpr char REC_FILE [] = "recommendations.jsonl";
constexpr char FB_FILE  [] = "feedback.jsonl";
constexpr char PERF_FILE[] = "performance.json";

/* read a JSON-lines file; malformed lines are skipped with a warning */
template <typename F>
void for_each_line(const std::string& path, F&& fn)
{
    std::ifstream in(path);
    if (!in) return;                               // absent == empty log
    std::string line;
    size_t lineno = 0, bad = 0;
    while (std::getline(in, line)) {
        ++lineno;
        if (line.empty()) continue;
        json j = json::parse(line, nullptr, /*allow_exceptions=*/false);
        if (j.is_discarded() || !j.is_object()) { ++bad; continue; }
        fn(j);
    }
    if (in.bad())
        throw PersistenceFailure("read error in " + path);
    if (bad)
        logW(path + ": skipped " + std::to_string(bad) + " malformed line(s) of " +
             std::to_string(lineno));
}

void append_line(const std::string& path, const json& j)
{
    std::ofstream out(path, std::ios::app);
    if (!out) throw PersistenceFailure("cannot open " + path + " for append");
    out << j.dump() << '\n';
    out.flush();
    if (!out) throw PersistenceFailure("write failed: " + path);
}

} // namespace


class FileOutcomeBackend : public OutcomeBackend {
    std::string dir_;

    mutable std::shared_mutex mtx_;           // guards the in-memory maps
    mutable std::mutex        log_mtx_;       // serializes log appends and replays
    std::mutex                perf_mtx_;      // update + snapshot, in order

    std::unordered_map<std::string, RecommendationRecord>               recs_;
    std::unordered_map<AggregateKey, PerformanceAggregate, AggregateKeyHash> perf_;
    long applied_ = 0;                        // feedback lines folded into perf_

    std::string path(const char* f) const { return dir_ + '/' + f; }

    /* aggregate table as last flushed; returns the feedback count it
       reflects, or -1 when absent or unreadable                        */
    long load_table()
    {
        const std::string pf = path(PERF_FILE);
        if (!file_exists(pf)) return -1;
        std::ifstream in(pf);
        json doc = json::parse(in, nullptr, false);
        if (doc.is_discarded() || !doc.is_object() ||
            !doc.contains("aggregates") || !doc["aggregates"].is_array())
        {
            logW("aggregate table " + pf + " unreadable, rebuilding from feedback log");
            return -1;
        }
        for (const auto& e : doc["aggregates"]) {
            PerformanceAggregate a = aggregate_from_json(e);
            perf_[a.key] = a;
        }
        return doc.value("feedback_applied", -1L);
    }

    /* fold every feedback line into fresh running sums */
    void rebuild_from_log()
    {
        perf_.clear();
        applied_ = 0;
        for_each_line(path(FB_FILE), [&](const json& j) {
            const FeedbackRecord f = feedback_from_json(j);
            const AggregateKey key{f.location, to_lower(f.crop_chosen), to_lower(f.season)};
            auto& a = perf_[key];
            a.key = key;
            a.apply(f.success, f.yield_achieved, f.profit_realized);
            a.last_updated = f.timestamp;
            ++applied_;
        });
    }

    long count_feedback_lines() const
    {
        long n = 0;
        for_each_line(path(FB_FILE), [&](const json&) { ++n; });
        return n;
    }

    /* caller holds perf_mtx_ */
    bool flush_table()
    {
        json doc;
        {
            std::shared_lock<std::shared_mutex> lk(mtx_);
            json arr = json::array();
            for (const auto& kv : perf_) arr.push_back(to_json(kv.second));
            doc["feedback_applied"] = applied_;
            doc["aggregates"]       = std::move(arr);
        }
        return write_file_atomic(path(PERF_FILE), doc.dump(2));
    }

public:
    explicit FileOutcomeBackend(std::string dir) : dir_(std::move(dir))
    {
        if (!ensure_directory(dir_))
            throw PersistenceFailure("cannot create data directory " + dir_);

        /* ---- replay recommendation log → id index ---- */
        for_each_line(path(REC_FILE), [&](const json& j) {
            RecommendationRecord r = recommendation_from_json(j);
            if (!r.id.empty()) recs_[r.id] = std::move(r);
        });

        /* ---- aggregate table, caught up with the feedback log ---- */
        const long logged = count_feedback_lines();
        const long table  = load_table();
        applied_ = table;
        if (table != logged) {
            if (table >= 0)
                logW("aggregate table reflects " + std::to_string(table) + " of " +
                     std::to_string(logged) + " feedback events, rebuilding");
            rebuild_from_log();
            if (!flush_table())
                logW("cannot write " + path(PERF_FILE) + ", will retry on next feedback");
        }
        logI("file store " + dir_ + ": " + std::to_string(recs_.size()) +
             " recommendations, " + std::to_string(perf_.size()) + " aggregates");
    }

    void append_recommendation(const RecommendationRecord& r) override
    {
        {
            std::lock_guard<std::mutex> lk(log_mtx_);
            append_line(path(REC_FILE), to_json(r));
        }
        std::unique_lock<std::shared_mutex> lk(mtx_);
        recs_[r.id] = r;
    }

    std::optional<RecommendationRecord>
    find_recommendation(const std::string& id) const override
    {
        std::shared_lock<std::shared_mutex> lk(mtx_);
        auto it = recs_.find(id);
        if (it == recs_.end()) return std::nullopt;
        return it->second;
    }

    std::vector<RecommendationRecord> load_recommendations() const override
    {
        std::vector<RecommendationRecord> out;
        std::lock_guard<std::mutex> lk(log_mtx_);
        for_each_line(path(REC_FILE), [&](const json& j) {
            out.push_back(recommendation_from_json(j));
        });
        return out;
    }

    std::vector<FeedbackRecord> load_feedback() const override
    {
        std::vector<FeedbackRecord> out;
        std::lock_guard<std::mutex> lk(log_mtx_);
        for_each_line(path(FB_FILE), [&](const json& j) {
            out.push_back(feedback_from_json(j));
        });
        return out;
    }

    PerformanceAggregate record_feedback(const FeedbackRecord& f,
                                         const AggregateKey& key) override
    {
        std::lock_guard<std::mutex> persist(perf_mtx_);
        {
            std::lock_guard<std::mutex> lk(log_mtx_);
            append_line(path(FB_FILE), to_json(f));      // commit point
        }

        PerformanceAggregate row;
        {
            std::unique_lock<std::shared_mutex> lk(mtx_);
            auto& a = perf_[key];
            a.key = key;
            a.apply(f.success, f.yield_achieved, f.profit_realized);
            a.last_updated = f.timestamp.empty() ? now_iso() : f.timestamp;
            row = a;
            ++applied_;
        }
        /* the event is already durable; a stale table is caught up at open */
        if (!flush_table())
            logW("cannot write " + path(PERF_FILE) + ", table lags the feedback log");
        return row;
    }

    std::optional<PerformanceAggregate>
    load_aggregate(const AggregateKey& key) const override
    {
        std::shared_lock<std::shared_mutex> lk(mtx_);
        auto it = perf_.find(key);
        if (it == perf_.end()) return std::nullopt;
        return it->second;
    }

    std::vector<PerformanceAggregate>
    aggregates_for_location(const std::string& location) const override
    {
        std::vector<PerformanceAggregate> out;
        std::shared_lock<std::shared_mutex> lk(mtx_);
        for (const auto& kv : perf_)
            if (kv.first.location == location) out.push_back(kv.second);
        return out;
    }

    std::string describe() const override { return "file:" + dir_; }
};

std::unique_ptr<OutcomeBackend> make_file_backend(const std::string& data_dir)
{
    return std::make_unique<FileOutcomeBackend>(data_dir);
}

} // namespace cropadvisor

/*──────────────────────────────────────────────────────────────
   mysql_backend.cpp  –  networked store

   cropadvisor_recommendation   append-only, JSON payload per row
   cropadvisor_feedback         append-only, JSON payload per row
   cropadvisor_performance      one row per (location, crop, season);
                                updated by an upsert in the same
                                transaction as the feedback insert

   Key columns use a binary collation so "Delhi" and "delhi" stay
   distinct keys, as they are in the file store.
  ──────────────────────────────────────────────────────────────*/
#include <mysql/mysql.h>

#include <cstdio>
#include <cstdlib>
#include <mutex>

#include "cropadvisor/errors.hpp"
#include "cropadvisor/outcome_backend.hpp"

namespace cropadvisor {

namespace {

const char* const DDL[] = {
    "CREATE TABLE IF NOT EXISTS cropadvisor_recommendation ("
    "  seq        BIGINT AUTO_INCREMENT PRIMARY KEY,"
    "  id         VARCHAR(64)  NOT NULL UNIQUE,"
    "  location   VARCHAR(128) COLLATE utf8mb4_bin NOT NULL,"
    "  season     VARCHAR(32)  COLLATE utf8mb4_bin NOT NULL,"
    "  payload    MEDIUMTEXT   NOT NULL,"
    "  created_at VARCHAR(32)  NOT NULL"
    ") ENGINE=InnoDB DEFAULT CHARSET=utf8mb4",

    "CREATE TABLE IF NOT EXISTS cropadvisor_feedback ("
    "  seq               BIGINT AUTO_INCREMENT PRIMARY KEY,"
    "  id                VARCHAR(64) NOT NULL UNIQUE,"
    "  recommendation_id VARCHAR(64) NOT NULL,"
    "  payload           MEDIUMTEXT  NOT NULL,"
    "  created_at        VARCHAR(32) NOT NULL,"
    "  INDEX (recommendation_id)"
    ") ENGINE=InnoDB DEFAULT CHARSET=utf8mb4",

    "CREATE TABLE IF NOT EXISTS cropadvisor_performance ("
    "  location     VARCHAR(128) COLLATE utf8mb4_bin NOT NULL,"
    "  crop         VARCHAR(64)  COLLATE utf8mb4_bin NOT NULL,"
    "  season       VARCHAR(32)  COLLATE utf8mb4_bin NOT NULL,"
    "  attempts     BIGINT NOT NULL DEFAULT 0,"
    "  successes    BIGINT NOT NULL DEFAULT 0,"
    "  yield_sum    DOUBLE NOT NULL DEFAULT 0,"
    "  profit_sum   DOUBLE NOT NULL DEFAULT 0,"
    "  last_updated VARCHAR(32) NOT NULL,"
    "  PRIMARY KEY (location, crop, season)"
    ") ENGINE=InnoDB DEFAULT CHARSET=utf8mb4"
};

std::string fmt_double(double v)
{
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.17g", v);
    return buf;
}

} // namespace


class MysqlOutcomeBackend : public OutcomeBackend {
    MysqlOptions       opt_;
    MYSQL*             conn_ = nullptr;
    mutable std::mutex conn_mtx_;           // one MYSQL* is not thread-safe

    [[noreturn]] void fail(const std::string& what) const
    {
        throw PersistenceFailure(what + ": " + std::string(mysql_error(conn_)));
    }

    std::string esc(const std::string& s) const
    {
        std::string out(s.size() * 2 + 1, '\0');
        unsigned long n = mysql_real_escape_string(conn_, &out[0], s.c_str(),
                                                   static_cast<unsigned long>(s.size()));
        out.resize(n);
        return '\'' + out + '\'';
    }

    void exec(const std::string& sql) const
    {
        if (mysql_query(conn_, sql.c_str()) != 0) fail("query failed");
    }

    /* run a SELECT and hand each row to fn */
    template <typename F>
    void select(const std::string& sql, F&& fn) const
    {
        exec(sql);
        MYSQL_RES* res = mysql_store_result(conn_);
        if (!res) fail("store_result failed");
        while (MYSQL_ROW row = mysql_fetch_row(res)) fn(row);
        mysql_free_result(res);
    }

    static PerformanceAggregate row_to_aggregate(MYSQL_ROW row)
    {
        PerformanceAggregate a;
        a.key.location = row[0] ? row[0] : "";
        a.key.crop     = row[1] ? row[1] : "";
        a.key.season   = row[2] ? row[2] : "";
        a.attempts     = row[3] ? std::strtol(row[3], nullptr, 10) : 0;
        a.successes    = row[4] ? std::strtol(row[4], nullptr, 10) : 0;
        a.yield_sum    = row[5] ? std::strtod(row[5], nullptr) : 0.0;
        a.profit_sum   = row[6] ? std::strtod(row[6], nullptr) : 0.0;
        a.last_updated = row[7] ? row[7] : "";
        a.recompute_derived();
        return a;
    }

    static constexpr const char* PERF_COLS =
        "SELECT location, crop, season, attempts, successes, yield_sum, profit_sum, last_updated "
        "FROM cropadvisor_performance ";

public:
    explicit MysqlOutcomeBackend(MysqlOptions opt) : opt_(std::move(opt))
    {
        conn_ = mysql_init(nullptr);
        if (!conn_) throw PersistenceFailure("mysql_init failed");

        if (!mysql_real_connect(conn_, opt_.host.c_str(), opt_.user.c_str(),
                                opt_.pass.c_str(), nullptr, opt_.port, nullptr, 0))
        {
            std::string why = mysql_error(conn_);
            mysql_close(conn_);
            conn_ = nullptr;
            throw PersistenceFailure("MySQL connect failed: " + why);
        }
        try {
            exec("CREATE DATABASE IF NOT EXISTS `" + opt_.db + "`");
            if (mysql_select_db(conn_, opt_.db.c_str()) != 0) fail("select_db failed");
            for (const char* ddl : DDL) exec(ddl);
        } catch (const PersistenceFailure&) {
            mysql_close(conn_);
            conn_ = nullptr;
            throw;
        }
        logI("mysql store " + describe() + " ready");
    }

    ~MysqlOutcomeBackend() override
    {
        if (conn_) mysql_close(conn_);
    }

    MysqlOutcomeBackend(const MysqlOutcomeBackend&)            = delete;
    MysqlOutcomeBackend& operator=(const MysqlOutcomeBackend&) = delete;

    void append_recommendation(const RecommendationRecord& r) override
    {
        std::lock_guard<std::mutex> lk(conn_mtx_);
        exec("INSERT INTO cropadvisor_recommendation (id, location, season, payload, created_at) "
             "VALUES (" + esc(r.id) + ',' + esc(r.location) + ',' + esc(r.season) + ',' +
             esc(to_json(r).dump()) + ',' + esc(r.timestamp) + ')');
    }

    std::optional<RecommendationRecord>
    find_recommendation(const std::string& id) const override
    {
        std::lock_guard<std::mutex> lk(conn_mtx_);
        std::optional<RecommendationRecord> out;
        select("SELECT payload FROM cropadvisor_recommendation WHERE id=" + esc(id),
               [&](MYSQL_ROW row) {
                   if (!row[0]) return;
                   json j = json::parse(row[0], nullptr, false);
                   if (!j.is_discarded()) out = recommendation_from_json(j);
               });
        return out;
    }

    std::vector<RecommendationRecord> load_recommendations() const override
    {
        std::lock_guard<std::mutex> lk(conn_mtx_);
        std::vector<RecommendationRecord> out;
        select("SELECT payload FROM cropadvisor_recommendation ORDER BY seq",
               [&](MYSQL_ROW row) {
                   if (!row[0]) return;
                   json j = json::parse(row[0], nullptr, false);
                   if (j.is_discarded()) { logW("skipping malformed recommendation row"); return; }
                   out.push_back(recommendation_from_json(j));
               });
        return out;
    }

    std::vector<FeedbackRecord> load_feedback() const override
    {
        std::lock_guard<std::mutex> lk(conn_mtx_);
        std::vector<FeedbackRecord> out;
        select("SELECT payload FROM cropadvisor_feedback ORDER BY seq",
               [&](MYSQL_ROW row) {
                   if (!row[0]) return;
                   json j = json::parse(row[0], nullptr, false);
                   if (j.is_discarded()) { logW("skipping malformed feedback row"); return; }
                   out.push_back(feedback_from_json(j));
               });
        return out;
    }

    PerformanceAggregate record_feedback(const FeedbackRecord& f,
                                         const AggregateKey& key) override
    {
        std::lock_guard<std::mutex> lk(conn_mtx_);
        exec("START TRANSACTION");
        try {
            exec("INSERT INTO cropadvisor_feedback (id, recommendation_id, payload, created_at) "
                 "VALUES (" + esc(f.id) + ',' + esc(f.recommendation_id) + ',' +
                 esc(to_json(f).dump()) + ',' + esc(f.timestamp) + ')');

            const std::string stamp = f.timestamp.empty() ? now_iso() : f.timestamp;
            exec("INSERT INTO cropadvisor_performance "
                 "(location, crop, season, attempts, successes, yield_sum, profit_sum, last_updated) "
                 "VALUES (" + esc(key.location) + ',' + esc(key.crop) + ',' + esc(key.season) +
                 ",1," + (f.success ? "1" : "0") + ',' + fmt_double(f.yield_achieved) + ',' +
                 fmt_double(f.profit_realized) + ',' + esc(stamp) + ") "
                 "ON DUPLICATE KEY UPDATE "
                 "attempts=attempts+1, successes=successes+VALUES(successes), "
                 "yield_sum=yield_sum+VALUES(yield_sum), profit_sum=profit_sum+VALUES(profit_sum), "
                 "last_updated=VALUES(last_updated)");

            std::optional<PerformanceAggregate> row;
            select(std::string(PERF_COLS) + "WHERE location=" + esc(key.location) +
                   " AND crop=" + esc(key.crop) + " AND season=" + esc(key.season),
                   [&](MYSQL_ROW r) { row = row_to_aggregate(r); });
            if (!row) throw PersistenceFailure("aggregate row vanished for " + key.str());

            exec("COMMIT");
            return *row;
        } catch (const PersistenceFailure&) {
            if (mysql_query(conn_, "ROLLBACK") != 0)
                logE("rollback failed: " + std::string(mysql_error(conn_)));
            throw;
        }
    }

    std::optional<PerformanceAggregate>
    load_aggregate(const AggregateKey& key) const override
    {
        std::lock_guard<std::mutex> lk(conn_mtx_);
        std::optional<PerformanceAggregate> row;
        select(std::string(PERF_COLS) + "WHERE location=" + esc(key.location) +
               " AND crop=" + esc(key.crop) + " AND season=" + esc(key.season),
               [&](MYSQL_ROW r) { row = row_to_aggregate(r); });
        return row;
    }

    std::vector<PerformanceAggregate>
    aggregates_for_location(const std::string& location) const override
    {
        std::lock_guard<std::mutex> lk(conn_mtx_);
        std::vector<PerformanceAggregate> out;
        select(std::string(PERF_COLS) + "WHERE location=" + esc(location),
               [&](MYSQL_ROW r) { out.push_back(row_to_aggregate(r)); });
        return out;
    }

    std::string describe() const override
    {
        return "mysql://" + opt_.user + '@' + opt_.host + ':' +
               std::to_string(opt_.port) + '/' + opt_.db;
    }
};

std::unique_ptr<OutcomeBackend> make_mysql_backend(const MysqlOptions& opt)
{
    return std::make_unique<MysqlOutcomeBackend>(opt);
}

} // namespace cropadvisor

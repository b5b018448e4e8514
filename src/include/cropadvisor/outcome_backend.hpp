/*──────────────────────────────────────────────────────────────
   outcome_backend.hpp  –  storage abstraction under the store

   Every method throws PersistenceFailure on I/O trouble; the
   OutcomeStore above catches, logs and degrades.  Aggregate
   updates for one key are already serialized by the caller.
  ──────────────────────────────────────────────────────────────*/
#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "cropadvisor/records.hpp"

namespace cropadvisor {

struct MysqlOptions {
    std::string host = "127.0.0.1";
    int         port = 44444;
    std::string user = "root";
    std::string pass;
    std::string db   = "cropadvisor";
};

struct OutcomeBackend {
    virtual ~OutcomeBackend() = default;

    /* append-only event log */
    virtual void append_recommendation(const RecommendationRecord& r) = 0;

    virtual std::optional<RecommendationRecord>
        find_recommendation(const std::string& id) const = 0;

    virtual std::vector<RecommendationRecord> load_recommendations() const = 0;
    virtual std::vector<FeedbackRecord>       load_feedback()        const = 0;

    /*  append the feedback event and apply its outcome to the
        running sums of `key`; returns the row after the update  */
    virtual PerformanceAggregate
        record_feedback(const FeedbackRecord& f, const AggregateKey& key) = 0;

    virtual std::optional<PerformanceAggregate>
        load_aggregate(const AggregateKey& key) const = 0;

    virtual std::vector<PerformanceAggregate>
        aggregates_for_location(const std::string& location) const = 0;

    virtual std::string describe() const = 0;
};

/* factories – throw PersistenceFailure when the store cannot be opened */
std::unique_ptr<OutcomeBackend> make_file_backend (const std::string& data_dir);
std::unique_ptr<OutcomeBackend> make_mysql_backend(const MysqlOptions& opt);

} // namespace cropadvisor

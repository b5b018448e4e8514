/*───────────────────────────────────────────────────────────
 *  config.hpp   –  ServiceConfig: JSON file + --key=value
 *
 *  precedence: defaults < --config=<file> < command line
 *───────────────────────────────────────────────────────────*/
#pragma once

#include <map>
#include <string>

#include "cropadvisor/model_iface.hpp"
#include "cropadvisor/outcome_backend.hpp"
#include "cropadvisor/scoring.hpp"

namespace cropadvisor {

struct ServiceConfig {
    std::string  data_dir             = "data";
    std::string  model_dir            = "models";
    std::string  store_backend        = "file";     // file | mysql
    MysqlOptions mysql;

    std::string  catalog_path         = "data/crop_catalog.json";
    std::string  snapshot_dir;                      // empty → no gateway
    std::string  knowledge_path;                    // empty → built-in table

    int          gateway_timeout_ms   = 5000;
    size_t       gateway_max_pending  = 16;        // per upstream, incl. timed-out calls
    size_t       min_training_samples = 50;
    size_t       retrain_every        = 25;        // 0 → never in background
    size_t       max_recommendations  = MAX_RECOMMENDATIONS;    // 1..8
    unsigned     jitter_seed          = 0;         // 0 → nondeterministic

    TrainOpt     train;
};

/*  one setting by name; false when the key is unknown.
    Throws CropAdvisorError when the value does not parse.          */
bool apply_setting(ServiceConfig& cfg, const std::string& key, const std::string& value);

/* every member of a JSON object; unknown keys are logged and skipped */
void apply_json(ServiceConfig& cfg, const json& j);

/* throws CropAdvisorError when the file is missing or malformed */
void load_config_file(ServiceConfig& cfg, const std::string& path);

json to_json(const ServiceConfig& cfg);          // password omitted

struct CliArgs {
    std::string                        command;
    std::map<std::string, std::string> options;   // --key=value, --flag → "true"

    bool        has(const std::string& k) const { return options.count(k) != 0; }
    std::string get(const std::string& k, const std::string& fallback = "") const;
};

CliArgs parse_cli(int argc, char* argv[]);

/* defaults, then --config, then every recognised --key=value */
ServiceConfig resolve_config(const CliArgs& args);

} // namespace cropadvisor

/*───────────────────────────────────────────────────────────
 *  config.cpp
 *───────────────────────────────────────────────────────────*/
#include "cropadvisor/config.hpp"

#include <fstream>
#include <stdexcept>

#include "cropadvisor/errors.hpp"

namespace cropadvisor {

namespace {

int to_int(const std::string& k, const std::string& v)
{
    try {
        size_t used = 0;
        int r = std::stoi(v, &used);
        if (used != v.size()) throw std::invalid_argument(v);
        return r;
    } catch (const std::logic_error&) {
        throw CropAdvisorError("bad integer for " + k + ": '" + v + "'");
    }
}

size_t to_count(const std::string& k, const std::string& v)
{
    const int r = to_int(k, v);
    if (r < 0) throw CropAdvisorError(k + " must not be negative");
    return static_cast<size_t>(r);
}

size_t to_count_in(const std::string& k, const std::string& v, size_t lo, size_t hi)
{
    const size_t r = to_count(k, v);
    if (r < lo || r > hi)
        throw CropAdvisorError(k + " must be between " + std::to_string(lo) + " and " +
                               std::to_string(hi) + ", got " + v);
    return r;
}

double to_double(const std::string& k, const std::string& v)
{
    try {
        size_t used = 0;
        double r = std::stod(v, &used);
        if (used != v.size()) throw std::invalid_argument(v);
        return r;
    } catch (const std::logic_error&) {
        throw CropAdvisorError("bad number for " + k + ": '" + v + "'");
    }
}

/* JSON scalar → the string a command line would have carried */
std::string scalar_text(const json& v)
{
    if (v.is_string())         return v.get<std::string>();
    if (v.is_boolean())        return v.get<bool>() ? "true" : "false";
    if (v.is_number_integer()) return std::to_string(v.get<long long>());
    if (v.is_number())         return v.dump();
    return "";
}

} // namespace

bool apply_setting(ServiceConfig& c, const std::string& k, const std::string& v)
{
    if      (k == "data_dir")             c.data_dir       = v;
    else if (k == "model_dir")            c.model_dir      = v;
    else if (k == "store_backend") {
        const std::string b = to_lower(v);
        if (b != "file" && b != "mysql")
            throw CropAdvisorError("store_backend must be file or mysql, got '" + v + "'");
        c.store_backend = b;
    }
    else if (k == "mysql_host")           c.mysql.host     = v;
    else if (k == "mysql_port")           c.mysql.port     = to_int(k, v);
    else if (k == "mysql_user")           c.mysql.user     = v;
    else if (k == "mysql_pass")           c.mysql.pass     = v;
    else if (k == "mysql_db")             c.mysql.db       = v;
    else if (k == "catalog_path")         c.catalog_path   = v;
    else if (k == "snapshot_dir")         c.snapshot_dir   = v;
    else if (k == "knowledge_path")       c.knowledge_path = v;
    else if (k == "gateway_timeout_ms")   c.gateway_timeout_ms   = static_cast<int>(to_count(k, v));
    else if (k == "gateway_max_pending")  c.gateway_max_pending  = to_count_in(k, v, 3, 1024);
    else if (k == "min_training_samples") c.min_training_samples = to_count(k, v);
    else if (k == "retrain_every")        c.retrain_every        = to_count(k, v);
    else if (k == "max_recommendations")  c.max_recommendations  = to_count_in(k, v, 1, MAX_RECOMMENDATIONS);
    else if (k == "jitter_seed")          c.jitter_seed          = static_cast<unsigned>(to_count(k, v));
    else if (k == "trees")                c.train.trees            = to_int(k, v);
    else if (k == "num_leaves")           c.train.num_leaves       = to_int(k, v);
    else if (k == "lr")                   c.train.lr               = to_double(k, v);
    else if (k == "subsample")            c.train.subsample        = to_double(k, v);
    else if (k == "colsample")            c.train.colsample        = to_double(k, v);
    else if (k == "min_data_in_leaf")     c.train.min_data_in_leaf = to_int(k, v);
    else if (k == "threads")              c.train.threads          = to_int(k, v);
    else return false;
    return true;
}

void apply_json(ServiceConfig& cfg, const json& j)
{
    if (!j.is_object()) throw CropAdvisorError("config root must be an object");
    for (auto it = j.begin(); it != j.end(); ++it) {
        if (it.value().is_structured() || it.value().is_null()) {
            logW("config: ignoring non-scalar key " + it.key());
            continue;
        }
        if (!apply_setting(cfg, it.key(), scalar_text(it.value())))
            logW("config: unknown key " + it.key());
    }
}

void load_config_file(ServiceConfig& cfg, const std::string& path)
{
    std::ifstream in(path);
    if (!in) throw CropAdvisorError("cannot open config " + path);
    json j = json::parse(in, nullptr, false);
    if (j.is_discarded()) throw CropAdvisorError("malformed config " + path);
    apply_json(cfg, j);
    logI("config loaded from " + path);
}

json to_json(const ServiceConfig& c)
{
    return {
        {"data_dir", c.data_dir}, {"model_dir", c.model_dir},
        {"store_backend", c.store_backend},
        {"mysql_host", c.mysql.host}, {"mysql_port", c.mysql.port},
        {"mysql_user", c.mysql.user}, {"mysql_db", c.mysql.db},
        {"catalog_path", c.catalog_path}, {"snapshot_dir", c.snapshot_dir},
        {"knowledge_path", c.knowledge_path},
        {"gateway_timeout_ms", c.gateway_timeout_ms},
        {"gateway_max_pending", c.gateway_max_pending},
        {"min_training_samples", c.min_training_samples},
        {"retrain_every", c.retrain_every},
        {"max_recommendations", c.max_recommendations},
        {"jitter_seed", c.jitter_seed},
        {"trees", c.train.trees}, {"num_leaves", c.train.num_leaves},
        {"lr", c.train.lr}, {"subsample", c.train.subsample},
        {"colsample", c.train.colsample},
        {"min_data_in_leaf", c.train.min_data_in_leaf},
        {"threads", c.train.threads}
    };
}


/* ────────────────── command line ────────────────── */
std::string CliArgs::get(const std::string& k, const std::string& fallback) const
{
    auto it = options.find(k);
    return it == options.end() ? fallback : it->second;
}

CliArgs parse_cli(int argc, char* argv[])
{
    CliArgs a;
    for (int i = 1; i < argc; ++i) {
        std::string s(argv[i]);
        if (s.rfind("--", 0) == 0) {
            const auto eq = s.find('=');
            if (eq == std::string::npos) a.options[s.substr(2)] = "true";
            else                         a.options[s.substr(2, eq - 2)] = s.substr(eq + 1);
        } else if (a.command.empty()) {
            a.command = s;
        } else {
            logW("ignored arg: " + s);
        }
    }
    return a;
}

ServiceConfig resolve_config(const CliArgs& args)
{
    ServiceConfig cfg;
    if (args.has("config")) load_config_file(cfg, args.get("config"));
    for (const auto& kv : args.options)
        apply_setting(cfg, kv.first, kv.second);       // command options fall through
    return cfg;
}

} // namespace cropadvisor

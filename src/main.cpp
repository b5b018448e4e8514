/* -----------------------------------------------------------
 *  cropadvisor  –  command-line driver
 *
 *    cropadvisor [--config=<file>] [--key=value ...] <command>
 *
 *    recommend --location=… [--soil=…] [--season=…] [--lat=…] [--lon=…] [--track]
 *    track     --input=<recommendation.json>
 *    feedback  --input=<feedback.json>
 *    train
 *    stats     --location=… [--crop=… --season=…]
 *
 *  JSON on stdout, logs on stderr.
 * ----------------------------------------------------------- */
#include <fstream>
#include <iostream>
#include <optional>
#include <stdexcept>

#include "cropadvisor/config.hpp"
#include "cropadvisor/errors.hpp"
#include "cropadvisor/service_context.hpp"

using namespace cropadvisor;

namespace {

constexpr int EXIT_USAGE       = 2;
constexpr int EXIT_UNAVAILABLE = 3;

void usage()
{
    std::cerr <<
        "usage: cropadvisor [--config=<file>] [--key=value ...] <command>\n"
        "  recommend --location=NAME [--soil=TYPE] [--season=S] [--lat=X] [--lon=Y] [--track]\n"
        "  track     --input=FILE\n"
        "  feedback  --input=FILE\n"
        "  train\n"
        "  stats     --location=NAME [--crop=C --season=S]\n";
}

std::optional<double> opt_double(const CliArgs& a, const char* k)
{
    if (!a.has(k)) return std::nullopt;
    try {
        return std::stod(a.get(k));
    } catch (const std::logic_error&) {
        throw CropAdvisorError(std::string("bad number for --") + k + ": " + a.get(k));
    }
}

json read_json_file(const std::string& path)
{
    std::ifstream in(path);
    if (!in) throw CropAdvisorError("cannot open " + path);
    json j = json::parse(in, nullptr, false);
    if (j.is_discarded()) throw CropAdvisorError("malformed JSON in " + path);
    return j;
}

void emit(const json& j) { std::cout << j.dump(2) << std::endl; }

/* ---------- commands ---------- */
int cmd_recommend(ServiceContext& ctx, const CliArgs& a)
{
    if (!a.has("location")) { logE("recommend needs --location"); return EXIT_USAGE; }

    RecommendationQuery q;
    q.location = a.get("location");
    if (a.has("soil"))   q.soil_type = a.get("soil");
    if (a.has("season")) q.season    = a.get("season");
    q.latitude  = opt_double(a, "lat");
    q.longitude = opt_double(a, "lon");

    EnhancedRecommendations res = ctx.recommend(q);
    json out = to_json(res);

    if (a.has("track")) {
        RecommendationRecord rec;
        rec.location  = res.location;
        rec.latitude  = q.latitude;
        rec.longitude = q.longitude;
        rec.season    = res.season;
        rec.soil_type = res.soil_type;
        rec.weather   = res.weather;
        for (const auto& r : res.recommendations) rec.crops_offered.push_back(r.candidate.crop);
        const std::string id = ctx.track_recommendation(rec);
        out["recommendation_id"] = id.empty() ? json(nullptr) : json(id);
    }
    emit(out);
    return 0;
}

int cmd_track(ServiceContext& ctx, const CliArgs& a)
{
    if (!a.has("input")) { logE("track needs --input"); return EXIT_USAGE; }
    const std::string id = ctx.track_recommendation(recommendation_from_json(read_json_file(a.get("input"))));
    emit({ {"tracked", !id.empty()}, {"recommendation_id", id} });
    return id.empty() ? 1 : 0;
}

int cmd_feedback(ServiceContext& ctx, const CliArgs& a)
{
    if (!a.has("input")) { logE("feedback needs --input"); return EXIT_USAGE; }
    const json in = read_json_file(a.get("input"));

    /* one record or an array of them */
    size_t accepted = 0, total = 0;
    auto one = [&](const json& j) {
        ++total;
        if (ctx.collect_feedback(feedback_from_json(j))) ++accepted;
    };
    if (in.is_array()) for (const auto& j : in) one(j);
    else               one(in);

    ctx.wait_for_background();
    emit({ {"accepted", accepted}, {"received", total},
           {"model_version", ctx.ensemble().version()} });
    return accepted == total ? 0 : 1;
}

int cmd_train(ServiceContext& ctx)
{
    const bool ok = ctx.retrain();
    emit({ {"trained", ok}, {"model_version", ctx.ensemble().version()},
           {"trained_on", ctx.ensemble().trained_on()} });
    return ok ? 0 : 1;
}

int cmd_stats(ServiceContext& ctx, const CliArgs& a)
{
    if (!a.has("location")) { logE("stats needs --location"); return EXIT_USAGE; }
    const std::string loc = a.get("location");

    json out;
    out["location"] = loc;
    out["store"]    = ctx.store().describe();
    out["model"]    = ctx.ensemble().is_trained()
                        ? json{ {"version", ctx.ensemble().version()},
                                {"trained_on", ctx.ensemble().trained_on()} }
                        : json("untrained");

    auto rates = ctx.store().get_success_rate_by_location(loc);
    out["status"] = to_string(rates.status);
    if (rates.status == ReadStatus::Failed) out["error"] = rates.error;
    out["success_rates"] = rates.value;

    if (a.has("crop")) {
        auto perf = ctx.store().get_crop_performance(loc, a.get("crop"), a.get("season", "kharif"));
        out["performance"] = perf.ok() ? to_json(perf.value) : json(to_string(perf.status));
    }
    emit(out);
    return rates.status == ReadStatus::Failed ? 1 : 0;
}

} // namespace

/* ----------------------------------------------------------- */
int main(int argc, char* argv[])
{
    const CliArgs args = parse_cli(argc, argv);
    if (args.command.empty() || args.has("help")) { usage(); return args.command.empty() ? EXIT_USAGE : 0; }

    try {
        const ServiceConfig cfg = resolve_config(args);
        ServiceContext ctx(cfg);

        if (args.command == "recommend") return cmd_recommend(ctx, args);
        if (args.command == "track")     return cmd_track(ctx, args);
        if (args.command == "feedback")  return cmd_feedback(ctx, args);
        if (args.command == "train")     return cmd_train(ctx);
        if (args.command == "stats")     return cmd_stats(ctx, args);

        logE("unknown command: " + args.command);
        usage();
        return EXIT_USAGE;
    } catch (const DataUnavailable& e) {
        logE(e.what());
        return EXIT_UNAVAILABLE;
    } catch (const CropAdvisorError& e) {
        logE(e.what());
        return 1;
    }
}

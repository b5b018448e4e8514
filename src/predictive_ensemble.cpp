/*───────────────────────────────────────────────────────────
 *  predictive_ensemble.cpp
 *───────────────────────────────────────────────────────────*/
#include "cropadvisor/predictive_ensemble.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <fstream>

#include <dirent.h>

#include "cropadvisor/errors.hpp"

namespace cropadvisor {

namespace {

constexpr char CURRENT_FILE[] = "CURRENT";

std::string version_dir_name(int v) { return "v" + std::to_string(v); }

/* "v12" → 12, anything else → -1 */
int parse_version_dir(const std::string& name)
{
    if (name.size() < 2 || name[0] != 'v') return -1;
    for (size_t i = 1; i < name.size(); ++i)
        if (name[i] < '0' || name[i] > '9') return -1;
    return std::atoi(name.c_str() + 1);
}

} // namespace

PredictiveEnsemble::PredictiveEnsemble(std::string                    model_dir,
                                       std::unique_ptr<IModelTrainer> trainer,
                                       TrainOpt                       opt,
                                       size_t                         min_samples,
                                       unsigned                       jitter_seed)
    : model_dir_(std::move(model_dir)), trainer_(std::move(trainer)),
      opt_(opt), min_samples_(min_samples),
      rng_(jitter_seed ? jitter_seed : std::random_device{}())
{
    if (!trainer_) throw CropAdvisorError("PredictiveEnsemble: null trainer");
}

int PredictiveEnsemble::version() const
{
    auto s = snapshot();
    return s ? s->version() : 0;
}

size_t PredictiveEnsemble::trained_on() const
{
    auto s = snapshot();
    return s ? s->trained_on() : 0;
}

bool PredictiveEnsemble::training_in_progress() const
{
    if (!train_mtx_.try_lock()) return true;
    train_mtx_.unlock();
    return false;
}

double PredictiveEnsemble::jitter(double lo, double hi) const
{
    std::uniform_real_distribution<double> U(lo, hi);
    std::lock_guard<std::mutex> lk(rng_mtx_);
    return U(rng_);
}


/* ────────────────── prediction ────────────────── */
double PredictiveEnsemble::predict_success(const FeatureVector& f) const
{
    auto set = snapshot();
    if (!set) return UNTRAINED_SUCCESS_PROBABILITY;
    try {
        const double p = set->success_probability(f);
        if (!std::isfinite(p)) return UNTRAINED_SUCCESS_PROBABILITY;
        return clamp_val(p, 0.0, 1.0);
    } catch (const std::exception& e) {
        logW("success prediction failed, using default: " + std::string(e.what()));
        return UNTRAINED_SUCCESS_PROBABILITY;
    }
}

double PredictiveEnsemble::predict_yield(const FeatureVector& f, double base) const
{
    base = std::max(0.0, base);
    auto set = snapshot();
    if (!set) return base * jitter(0.90, 1.10);
    try {
        const double y = set->yield(f);
        return std::isfinite(y) ? std::max(0.0, y) : base;
    } catch (const std::exception& e) {
        logW("yield prediction failed, using base: " + std::string(e.what()));
        return base;
    }
}

double PredictiveEnsemble::predict_profit(const FeatureVector& f, double base) const
{
    base = std::max(0.0, base);
    auto set = snapshot();
    if (!set) return base * jitter(0.85, 1.15);
    try {
        const double p = set->profit(f);
        return std::isfinite(p) ? std::max(0.0, p) : base;
    } catch (const std::exception& e) {
        logW("profit prediction failed, using base: " + std::string(e.what()));
        return base;
    }
}


/* ────────────────── training ────────────────── */
bool PredictiveEnsemble::train(const std::vector<TrainingSample>& samples)
{
    if (samples.size() < min_samples_) {
        logW(TrainingInsufficientData(samples.size(), min_samples_).what());
        return false;
    }

    std::unique_lock<std::mutex> lk(train_mtx_, std::try_to_lock);
    if (!lk.owns_lock()) {
        logW("training already in progress; request ignored");
        return false;
    }

    const int next = std::max(version(), latest_version_on_disk()) + 1;

    std::shared_ptr<const IModelSet> fresh;
    try {
        fresh = trainer_->fit(samples, opt_, next);
    } catch (const CropAdvisorError& e) {
        logE("training failed, keeping v" + std::to_string(version()) + ": " + e.what());
        return false;
    }

    try {
        persist(*fresh);
    } catch (const PersistenceFailure& e) {
        logE("model bundle v" + std::to_string(next) + " not persisted: " + e.what());
    }

    std::atomic_store(&live_, fresh);
    logI("model set v" + std::to_string(next) + " live (" +
         std::to_string(samples.size()) + " samples)");
    return true;
}


/* ────────────────── persistence ────────────────── */
int PredictiveEnsemble::latest_version_on_disk() const
{
    if (model_dir_.empty() || !is_directory(model_dir_)) return 0;
    int best = 0;
    DIR* d = ::opendir(model_dir_.c_str());
    if (!d) return 0;
    while (dirent* e = ::readdir(d))
        best = std::max(best, parse_version_dir(e->d_name));
    ::closedir(d);
    return best;
}

void PredictiveEnsemble::persist(const IModelSet& set) const
{
    if (model_dir_.empty()) return;

    const std::string vdir = model_dir_ + '/' + version_dir_name(set.version());
    if (!ensure_directory(vdir))
        throw PersistenceFailure("cannot create " + vdir);
    set.save(vdir);

    /* pointer flip last: a crash before this leaves the old version live */
    if (!write_file_atomic(model_dir_ + '/' + CURRENT_FILE,
                           version_dir_name(set.version()) + '\n'))
        throw PersistenceFailure("cannot update " + model_dir_ + '/' + CURRENT_FILE);
}

bool PredictiveEnsemble::save() const
{
    auto set = snapshot();
    if (!set) {
        logW("save: no trained model set");
        return false;
    }
    try {
        persist(*set);
    } catch (const PersistenceFailure& e) {
        logE("save failed: " + std::string(e.what()));
        return false;
    }
    return true;
}

bool PredictiveEnsemble::load()
{
    if (model_dir_.empty()) return false;

    const std::string ptr = model_dir_ + '/' + CURRENT_FILE;
    std::ifstream in(ptr);
    if (!in) {
        logI("no model bundle under " + model_dir_ + "; running untrained");
        return false;
    }
    std::string name;
    in >> name;
    if (parse_version_dir(name) < 0) {
        logE("corrupt model pointer " + ptr + ": '" + name + "'");
        return false;
    }

    try {
        auto set = trainer_->load(model_dir_ + '/' + name);
        std::atomic_store(&live_, set);
        logI("loaded model set " + name + " (trained on " +
             std::to_string(set->trained_on()) + " samples)");
        return true;
    } catch (const CropAdvisorError& e) {
        logE("model load failed, running untrained: " + std::string(e.what()));
        return false;
    }
}

} // namespace cropadvisor

/* ──────────────────────────────────────────────────────────────
   lightgbm_model_set.cpp   –  IModelSet / IModelTrainer on the
                               LightGBM C API

   bundle directory:
      success_model.txt     binary objective, P(success)
      yield_model.txt       regression_l2, quintal/ha
      profit_model.txt      regression_l2, ₹/ha
      feature_scaler.json
      manifest.json
   ────────────────────────────────────────────────────────────── */
#include <LightGBM/c_api.h>

#include <algorithm>
#include <fstream>

#include "cropadvisor/errors.hpp"
#include "cropadvisor/feature_scaler.hpp"
#include "cropadvisor/model_iface.hpp"

namespace cropadvisor {

namespace {

constexpr char SUCCESS_FILE[] = "success_model.txt";
constexpr char YIELD_FILE  [] = "yield_model.txt";
constexpr char PROFIT_FILE [] = "profit_model.txt";
constexpr char SCALER_FILE [] = "feature_scaler.json";
constexpr char MANIFEST    [] = "manifest.json";

inline void chk(bool ok, const std::string& msg)
{
    if (!ok) throw CropAdvisorError(msg + ": " + std::string(LGBM_GetLastError()));
}

/* owns one BoosterHandle */
class Booster {
public:
    Booster() = default;
    explicit Booster(BoosterHandle h) : h_(h) {}
    ~Booster() { if (h_) LGBM_BoosterFree(h_); }

    Booster(const Booster&)            = delete;
    Booster& operator=(const Booster&) = delete;
    Booster(Booster&& o) noexcept : h_(o.h_) { o.h_ = nullptr; }

    BoosterHandle get() const { return h_; }

    static Booster from_file(const std::string& path)
    {
        BoosterHandle h = nullptr;
        int iters = 0;
        if (LGBM_BoosterCreateFromModelfile(path.c_str(), &iters, &h) != 0 || !h)
            throw PersistenceFailure("LightGBM load failed for " + path + ": " +
                                     std::string(LGBM_GetLastError()));
        return Booster(h);
    }

    double predict_one(const FeatureVector& x) const
    {
        double  out     = 0.0;
        int64_t out_len = 0;
        chk(LGBM_BoosterPredictForMat(h_, x.data(), C_API_DTYPE_FLOAT64,
                                      1, NUM_FEATS, 1, C_API_PREDICT_NORMAL,
                                      0, -1, "", &out_len, &out) == 0,
            "PredictForMat failed");
        return out;
    }

    void save(const std::string& path) const
    {
        if (LGBM_BoosterSaveModel(h_, 0, -1, 0, path.c_str()) != 0)
            throw PersistenceFailure("SaveModel " + path + ": " +
                                     std::string(LGBM_GetLastError()));
    }

private:
    BoosterHandle h_ = nullptr;
};

/* owns one DatasetHandle for the duration of a fit */
struct DatasetGuard {
    DatasetHandle h = nullptr;
    ~DatasetGuard() { if (h) LGBM_DatasetFree(h); }
};

std::string param_string(const std::string& objective, const TrainOpt& opt)
{
    std::string p = "objective=" + objective
                  + " learning_rate="    + std::to_string(opt.lr)
                  + " num_leaves="       + std::to_string(opt.num_leaves)
                  + " min_data_in_leaf=" + std::to_string(opt.min_data_in_leaf)
                  + " feature_fraction=" + std::to_string(opt.colsample)
                  + " min_data_in_bin=1"
                  + " verbosity=-1";
    if (opt.subsample > 0.0 && opt.subsample < 1.0)
        p += " bagging_fraction=" + std::to_string(opt.subsample) + " bagging_freq=1";
    if (opt.threads > 0)
        p += " num_threads=" + std::to_string(opt.threads);
    return p;
}

Booster train_one(const std::vector<double>& X, int N,
                  const std::vector<float>&  y,
                  const std::string&         objective,
                  const TrainOpt&            opt,
                  const std::string&         tag)
{
    const std::string param = param_string(objective, opt);

    DatasetGuard ds;
    chk(LGBM_DatasetCreateFromMat(X.data(), C_API_DTYPE_FLOAT64, N, NUM_FEATS, 1,
                                  param.c_str(), nullptr, &ds.h) == 0,
        "DatasetCreate failed (" + tag + ")");
    chk(LGBM_DatasetSetField(ds.h, "label", y.data(), N, C_API_DTYPE_FLOAT32) == 0,
        "DatasetSetField(label) failed (" + tag + ")");

    BoosterHandle h = nullptr;
    chk(LGBM_BoosterCreate(ds.h, param.c_str(), &h) == 0,
        "BoosterCreate failed (" + tag + ")");
    Booster booster(h);

    const int trees = std::max(1, opt.trees);
    for (int it = 0; it < trees; ++it) {
        int finished = 0;
        chk(LGBM_BoosterUpdateOneIter(booster.get(), &finished) == 0,
            "UpdateOneIter failed (" + tag + ")");
        progress(tag, size_t(it + 1), size_t(trees));
        if (finished) {
            if (it + 1 < trees) progress(tag, size_t(trees), size_t(trees));
            break;
        }
    }
    return booster;
}


class LightGBMModelSet : public IModelSet {
public:
    LightGBMModelSet(Booster success, Booster yield, Booster profit,
                     FeatureScaler scaler, int version, size_t trained_on)
        : success_(std::move(success)), yield_(std::move(yield)),
          profit_(std::move(profit)), scaler_(std::move(scaler)),
          version_(version), trained_on_(trained_on) {}

    double success_probability(const FeatureVector& f) const override
    {
        return success_.predict_one(scaler_.transform(f));
    }
    double yield(const FeatureVector& f) const override
    {
        return yield_.predict_one(scaler_.transform(f));
    }
    double profit(const FeatureVector& f) const override
    {
        return profit_.predict_one(scaler_.transform(f));
    }

    void save(const std::string& dir) const override
    {
        success_.save(dir + '/' + SUCCESS_FILE);
        yield_  .save(dir + '/' + YIELD_FILE);
        profit_ .save(dir + '/' + PROFIT_FILE);

        if (!write_file_atomic(dir + '/' + SCALER_FILE, scaler_.to_json().dump(2)))
            throw PersistenceFailure("cannot write " + dir + '/' + SCALER_FILE);

        json m;
        m["version"]    = version_;
        m["trained_on"] = trained_on_;
        m["saved_at"]   = now_iso();
        m["num_features"] = NUM_FEATS;
        m["models"] = { {"success", SUCCESS_FILE}, {"yield", YIELD_FILE},
                        {"profit",  PROFIT_FILE} };
        if (!write_file_atomic(dir + '/' + MANIFEST, m.dump(2)))
            throw PersistenceFailure("cannot write " + dir + '/' + MANIFEST);
    }

    int    version()    const override { return version_; }
    size_t trained_on() const override { return trained_on_; }

private:
    Booster       success_, yield_, profit_;
    FeatureScaler scaler_;
    int           version_;
    size_t        trained_on_;
};


class LightGBMTrainer : public IModelTrainer {
public:
    std::shared_ptr<const IModelSet>
    fit(const std::vector<TrainingSample>& S, const TrainOpt& opt, int version) const override
    {
        const int N = static_cast<int>(S.size());
        if (N == 0) throw CropAdvisorError("fit: empty training set");

        std::vector<FeatureVector> rows;
        rows.reserve(S.size());
        for (const auto& s : S) rows.push_back(s.feat);
        FeatureScaler scaler = FeatureScaler::fit(rows);

        std::vector<double> X(size_t(N) * NUM_FEATS);
        std::vector<float>  y_succ(N), y_yield(N), y_profit(N);
        for (int i = 0; i < N; ++i) {
            const FeatureVector z = scaler.transform(S[i].feat);
            std::copy(z.begin(), z.end(), X.begin() + size_t(i) * NUM_FEATS);
            y_succ  [i] = S[i].outcome.success ? 1.0f : 0.0f;
            y_yield [i] = static_cast<float>(S[i].outcome.yield);
            y_profit[i] = static_cast<float>(S[i].outcome.profit);
        }

        logI("training v" + std::to_string(version) + " on " + std::to_string(N) + " samples");
        Booster succ   = train_one(X, N, y_succ,   "binary",        opt, "success");
        Booster yield  = train_one(X, N, y_yield,  "regression_l2", opt, "yield  ");
        Booster profit = train_one(X, N, y_profit, "regression_l2", opt, "profit ");

        return std::make_shared<LightGBMModelSet>(std::move(succ), std::move(yield),
                                                  std::move(profit), std::move(scaler),
                                                  version, S.size());
    }

    std::shared_ptr<const IModelSet> load(const std::string& dir) const override
    {
        std::ifstream mf(dir + '/' + MANIFEST);
        if (!mf) throw PersistenceFailure("missing " + dir + '/' + MANIFEST);
        json m = json::parse(mf, nullptr, false);
        if (m.is_discarded() || !m.is_object())
            throw PersistenceFailure("corrupt " + dir + '/' + MANIFEST);
        if (static_cast<int>(parse_number(m, "num_features", NUM_FEATS)) != NUM_FEATS)
            throw PersistenceFailure(dir + ": feature layout mismatch");

        std::ifstream sf(dir + '/' + SCALER_FILE);
        if (!sf) throw PersistenceFailure("missing " + dir + '/' + SCALER_FILE);
        json sj = json::parse(sf, nullptr, false);
        if (sj.is_discarded())
            throw PersistenceFailure("corrupt " + dir + '/' + SCALER_FILE);

        FeatureScaler scaler = FeatureScaler::from_json(sj);
        Booster succ   = Booster::from_file(dir + '/' + SUCCESS_FILE);
        Booster yield  = Booster::from_file(dir + '/' + YIELD_FILE);
        Booster profit = Booster::from_file(dir + '/' + PROFIT_FILE);

        return std::make_shared<LightGBMModelSet>(
            std::move(succ), std::move(yield), std::move(profit), std::move(scaler),
            static_cast<int>(parse_number(m, "version", 0)),
            static_cast<size_t>(parse_number(m, "trained_on", 0)));
    }
};

} // namespace

std::unique_ptr<IModelTrainer> make_lightgbm_trainer()
{
    return std::make_unique<LightGBMTrainer>();
}

} // namespace cropadvisor

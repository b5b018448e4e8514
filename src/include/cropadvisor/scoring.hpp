/*───────────────────────────────────────────────────────────
 *  scoring.hpp   –  composite score and confidence checklist
 *
 *  composite = 0.60·baseline + historical + weather + ml
 *     historical  success_rate·15 with ≥3 attempts, else 7.5
 *     weather     forecast score on [0,20]; halved only if > 20
 *     ml          P(success)·15
 *
 *  confidence (hundredths) = 20
 *     + 30 (≥10 attempts) | 15 (≥3 attempts)
 *     + 30 (P ≥ .8) | 20 (P ≥ .6) | 10
 *     + 20 (forecast confidence ≥ .8) | 10
 *  label: ≥80 Very High, ≥65 High, ≥50 Medium, else Low
 *───────────────────────────────────────────────────────────*/
#pragma once

#include <cstddef>
#include <string>

namespace cropadvisor {

constexpr double BASELINE_WEIGHT        = 0.60;
constexpr double HISTORY_POINTS         = 15.0;
constexpr double NEUTRAL_HISTORY_POINTS = 7.5;
constexpr double ML_POINTS              = 15.0;
constexpr long   MIN_HISTORY_ATTEMPTS   = 3;
constexpr long   STRONG_HISTORY_ATTEMPTS = 10;
constexpr long   STATISTICAL_FALLBACK_ATTEMPTS = 5;
constexpr size_t MAX_RECOMMENDATIONS    = 8;      // ranked list is never longer

struct ScoreBreakdown {
    double baseline   = 0;    // 0.60 · suitability
    double historical = 0;
    double weather    = 0;
    double ml         = 0;
    double composite  = 0;    // unrounded sum
};

double historical_component(long attempts, double success_rate);
double weather_component(double forecast_score);
double ml_component(double success_probability);

ScoreBreakdown composite_score(double baseline_suitability,
                               long   attempts,
                               double success_rate,
                               double forecast_score,
                               double success_probability);

/* integer hundredths, so 0.80 is never 0.7999… */
int confidence_points(long attempts, double success_probability,
                      double forecast_confidence);

const char* confidence_label_points(int points);
const char* confidence_label(double confidence_score);

} // namespace cropadvisor

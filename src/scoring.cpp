/*───────────────────────────────────────────────────────────
 *  scoring.cpp
 *───────────────────────────────────────────────────────────*/
#include "cropadvisor/scoring.hpp"

#include <algorithm>
#include <cmath>

namespace cropadvisor {

double historical_component(long attempts, double success_rate)
{
    if (attempts < MIN_HISTORY_ATTEMPTS) return NEUTRAL_HISTORY_POINTS;
    return std::max(0.0, std::min(1.0, success_rate)) * HISTORY_POINTS;
}

double weather_component(double forecast_score)
{
    if (forecast_score > 20.0) forecast_score /= 2.0;
    return std::max(0.0, forecast_score);
}

double ml_component(double success_probability)
{
    return std::max(0.0, std::min(1.0, success_probability)) * ML_POINTS;
}

ScoreBreakdown composite_score(double baseline_suitability,
                               long   attempts,
                               double success_rate,
                               double forecast_score,
                               double success_probability)
{
    ScoreBreakdown b;
    b.baseline   = BASELINE_WEIGHT * baseline_suitability;
    b.historical = historical_component(attempts, success_rate);
    b.weather    = weather_component(forecast_score);
    b.ml         = ml_component(success_probability);
    b.composite  = b.baseline + b.historical + b.weather + b.ml;
    return b;
}

int confidence_points(long attempts, double p, double forecast_confidence)
{
    int pts = 20;
    if (attempts >= STRONG_HISTORY_ATTEMPTS)   pts += 30;
    else if (attempts >= MIN_HISTORY_ATTEMPTS) pts += 15;

    if (p >= 0.8)      pts += 30;
    else if (p >= 0.6) pts += 20;
    else               pts += 10;

    pts += forecast_confidence >= 0.8 ? 20 : 10;
    return pts;
}

const char* confidence_label_points(int points)
{
    if (points >= 80) return "Very High";
    if (points >= 65) return "High";
    if (points >= 50) return "Medium";
    return "Low";
}

const char* confidence_label(double confidence_score)
{
    return confidence_label_points(static_cast<int>(std::lround(confidence_score * 100.0)));
}

} // namespace cropadvisor

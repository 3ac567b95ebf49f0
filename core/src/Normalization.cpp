#include "voicescope/Normalization.h"
#include "voicescope/CoreContract.h"
#include <algorithm>
#include <cmath>

namespace voicescope {

double mean(const std::vector<double>& v) {
    if (v.empty()) return 0.0;
    double acc = 0.0;
    for (double x : v) acc += x;
    return acc / static_cast<double>(v.size());
}

double population_stddev(const std::vector<double>& v, double mu) {
    if (v.empty()) return 0.0;
    double acc = 0.0;
    for (double x : v) acc += (x - mu) * (x - mu);
    return std::sqrt(acc / static_cast<double>(v.size()));
}

double clamp_score(double x) {
    if (std::isnan(x)) return contract::SCORE_MIN;
    return std::clamp(x, contract::SCORE_MIN, contract::SCORE_MAX);
}

double round_to_tenths(double x) {
    return std::round(x * 10.0) / 10.0;
}

} // namespace voicescope

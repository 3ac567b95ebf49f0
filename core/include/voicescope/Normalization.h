#pragma once
#include <vector>
#include <cstddef>

namespace voicescope {

// ---------- basic statistics ----------
double mean(const std::vector<double>& v);                       // 0 for empty input
double population_stddev(const std::vector<double>& v, double mu); // sqrt(mean((x-mu)^2))

// ---------- score shaping ----------
// clamp into the [1,5] score range; NaN maps to the lower bound
double clamp_score(double x);

// round half away from zero to one decimal place
double round_to_tenths(double x);

} // namespace voicescope

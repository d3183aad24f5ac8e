#include "stats_tracker.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>

StatsTracker::StatsTracker()
    : count_(0), mean_(0), m2_(0), min_(0), max_(0) {}

void StatsTracker::update(double new_value) {
  if (count_ == 0) {
    min_ = new_value;
    max_ = new_value;
  } else {
    min_ = std::min(min_, new_value);
    max_ = std::max(max_, new_value);
  }
  count_++;
  double delta = new_value - mean_;
  mean_ += delta / count_;
  double delta2 = new_value - mean_;
  m2_ += delta * delta2;
}

int64_t StatsTracker::get_count() const { return count_; }

double StatsTracker::get_mean() const { return count_ > 0 ? mean_ : 0.0; }

double StatsTracker::get_variance() const {
  // For variance to be meaningful, at least 2 samples are needed
  if (count_ < 2) {
    return 0.0;
  }
  return std::max(0.0, m2_ / (count_ - 1));
}

double StatsTracker::get_stddev() const { return std::sqrt(get_variance()); }

double StatsTracker::get_population_variance() const {
  if (count_ < 1)
    return 0.0;
  return std::max(0.0, m2_ / count_);
}

double StatsTracker::get_population_stddev() const {
  return std::sqrt(get_population_variance());
}

double StatsTracker::get_min() const { return min_; }

double StatsTracker::get_max() const { return max_; }

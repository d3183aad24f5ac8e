#ifndef STATS_TRACKER_HPP
#define STATS_TRACKER_HPP

#include <cstdint>

// Welford accumulator for streaming mean/variance
class StatsTracker {
public:
  StatsTracker();

  // Add a new data point to the stream
  void update(double new_value);

  // Getters for the current statistical state
  int64_t get_count() const;
  double get_mean() const;
  // Sample variance (n - 1); 0 with fewer than 2 samples
  double get_variance() const;
  double get_stddev() const;
  // Population variance (n); 0 when empty
  double get_population_variance() const;
  double get_population_stddev() const;
  double get_min() const;
  double get_max() const;

private:
  int64_t count_;
  double mean_;
  // M2 is the sum of squares of differences from the current mean
  double m2_;
  double min_;
  double max_;
};

#endif // STATS_TRACKER_HPP

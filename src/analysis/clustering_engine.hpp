#ifndef CLUSTERING_ENGINE_HPP
#define CLUSTERING_ENGINE_HPP

#include "analysis/student_profile.hpp"
#include "core/config.hpp"
#include "core/diagnostics.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace analytics {

using PointMatrix = std::vector<std::vector<double>>;

// State of one k-means iteration. Never modified after it is recorded.
struct ClusteringSnapshot {
  size_t iteration = 0;
  std::vector<size_t> assignments;
  PointMatrix centroids;
  double inertia = 0.0;
};

struct ClusterInfo {
  size_t label = 0;
  std::vector<double> centroid; // Raw feature units
  std::vector<double> standardized_centroid;
  std::vector<std::string> members; // Student ids, ascending
  std::string description;          // e.g. "high forum participation rate"

  size_t size() const { return members.size(); }
};

struct ClusterAssignment {
  // False when there were no students to cluster
  bool defined = false;
  size_t requested_k = 0;
  size_t effective_k = 0;
  uint64_t seed = 0;

  std::map<std::string, size_t> assignments;
  std::vector<ClusterInfo> clusters;

  size_t iterations = 0;
  bool converged = false;
  double inertia = 0.0;
  std::vector<ClusteringSnapshot> history; // Winning run only

  std::vector<Diagnostic> diagnostics;

  std::optional<size_t> label_of(const std::string &student_id) const;
  const ClusterInfo *cluster_of(const std::string &student_id) const;
};

struct KMeansRun {
  std::vector<size_t> assignments;
  PointMatrix centroids;
  double inertia = 0.0;
  size_t iterations = 0;
  bool converged = false;
  std::vector<ClusteringSnapshot> history;
};

struct StandardizedData {
  PointMatrix points;
  std::vector<double> means;
  std::vector<double> stddevs; // Population standard deviation
};

class ClusteringEngine {
public:
  explicit ClusteringEngine(
      Config::ClusteringConfig config = Config::ClusteringConfig{});

  ClusterAssignment
  cluster(const std::map<std::string, StudentProfile> &profiles) const {
    return cluster(profiles, config_.seed);
  }

  // All randomness is derived from `seed`; the same inputs and seed always
  // give the same assignment.
  ClusterAssignment cluster(const std::map<std::string, StudentProfile> &profiles,
                            uint64_t seed) const;

  // z-scores every column. Zero-deviation columns map to 0 and, when
  // `diagnostics` is given, are reported.
  static StandardizedData standardize(const PointMatrix &raw,
                                      std::vector<Diagnostic> *diagnostics);

  static PointMatrix kmeans_plus_plus(const PointMatrix &points, size_t k,
                                      std::mt19937_64 &rng);

  // A max_iterations of 0 runs a single assignment pass
  static KMeansRun run_kmeans(const PointMatrix &points, size_t k,
                              size_t max_iterations, std::mt19937_64 &rng);

  // Lowest-inertia run over n_init restarts seeded with seed + i
  KMeansRun best_run(const PointMatrix &points, size_t k, uint64_t seed) const;

  size_t choose_k_by_elbow(const PointMatrix &points, uint64_t seed) const;

  std::string describe(const std::vector<double> &standardized_centroid) const;

private:
  Config::ClusteringConfig config_;
};

} // namespace analytics

#endif // CLUSTERING_ENGINE_HPP

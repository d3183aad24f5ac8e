#include "analysis/clustering_engine.hpp"
#include "analysis/features.hpp"
#include "core/logger.hpp"
#include "core/metrics_registry.hpp"
#include "utils/scoped_timer.hpp"
#include "utils/stats_tracker.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>
#include <stdexcept>

namespace analytics {

namespace {

double squared_distance(const std::vector<double> &a,
                        const std::vector<double> &b) {
  if (a.size() != b.size())
    throw std::invalid_argument("squared_distance: dimension mismatch");
  double sum = 0.0;
  for (size_t i = 0; i < a.size(); ++i) {
    double d = a[i] - b[i];
    sum += d * d;
  }
  return sum;
}

// Ties go to the lowest cluster index
size_t nearest_centroid(const std::vector<double> &point,
                        const PointMatrix &centroids, double *distance) {
  size_t best = 0;
  double best_distance = std::numeric_limits<double>::max();
  for (size_t c = 0; c < centroids.size(); ++c) {
    double d = squared_distance(point, centroids[c]);
    if (d < best_distance) {
      best_distance = d;
      best = c;
    }
  }
  if (distance)
    *distance = best_distance;
  return best;
}

double compute_inertia(const PointMatrix &points,
                       const std::vector<size_t> &assignments,
                       const PointMatrix &centroids) {
  double inertia = 0.0;
  for (size_t i = 0; i < points.size(); ++i)
    inertia += squared_distance(points[i], centroids[assignments[i]]);
  return inertia;
}

} // namespace

std::optional<size_t>
ClusterAssignment::label_of(const std::string &student_id) const {
  auto it = assignments.find(student_id);
  if (it == assignments.end())
    return std::nullopt;
  return it->second;
}

const ClusterInfo *
ClusterAssignment::cluster_of(const std::string &student_id) const {
  auto label = label_of(student_id);
  if (!label || *label >= clusters.size())
    return nullptr;
  return &clusters[*label];
}

ClusteringEngine::ClusteringEngine(Config::ClusteringConfig config)
    : config_(std::move(config)) {}

StandardizedData
ClusteringEngine::standardize(const PointMatrix &raw,
                              std::vector<Diagnostic> *diagnostics) {
  StandardizedData data;
  if (raw.empty())
    return data;

  size_t dims = raw.front().size();
  data.means.assign(dims, 0.0);
  data.stddevs.assign(dims, 0.0);
  data.points.assign(raw.size(), std::vector<double>(dims, 0.0));

  for (size_t d = 0; d < dims; ++d) {
    StatsTracker column;
    for (const auto &row : raw) {
      if (row.size() != dims)
        throw std::invalid_argument("standardize: ragged feature matrix");
      column.update(row[d]);
    }
    data.means[d] = column.get_mean();
    data.stddevs[d] = column.get_population_stddev();

    if (data.stddevs[d] <= 0.0) {
      if (diagnostics && raw.size() > 1) {
        std::string name = d < FEATURE_COUNT ? get_feature_name(feature_at(d))
                                             : std::to_string(d);
        diagnostics->push_back(make_diagnostic(
            DiagnosticKind::NUMERIC_DEGENERACY, "clustering", name,
            "Feature has zero deviation across students; standardized to 0"));
      }
      continue;
    }
    for (size_t i = 0; i < raw.size(); ++i)
      data.points[i][d] = (raw[i][d] - data.means[d]) / data.stddevs[d];
  }
  return data;
}

PointMatrix ClusteringEngine::kmeans_plus_plus(const PointMatrix &points,
                                               size_t k, std::mt19937_64 &rng) {
  if (k == 0 || k > points.size())
    throw std::invalid_argument("kmeans_plus_plus: k must be in [1, n]");

  std::vector<bool> chosen(points.size(), false);
  PointMatrix centers;
  centers.reserve(k);

  std::uniform_int_distribution<size_t> first_pick(0, points.size() - 1);
  size_t first = first_pick(rng);
  chosen[first] = true;
  centers.push_back(points[first]);

  std::vector<double> min_distance(points.size());
  while (centers.size() < k) {
    double total = 0.0;
    for (size_t i = 0; i < points.size(); ++i) {
      min_distance[i] = chosen[i] ? 0.0 : std::numeric_limits<double>::max();
      for (const auto &center : centers)
        min_distance[i] =
            std::min(min_distance[i], squared_distance(points[i], center));
      total += min_distance[i];
    }

    size_t pick = points.size();
    if (total > 0.0) {
      std::uniform_real_distribution<double> draw(0.0, total);
      double target = draw(rng);
      double cumulative = 0.0;
      for (size_t i = 0; i < points.size(); ++i) {
        if (min_distance[i] <= 0.0)
          continue;
        cumulative += min_distance[i];
        pick = i;
        if (cumulative >= target)
          break;
      }
    }
    // Every remaining point coincides with a chosen center
    if (pick == points.size()) {
      for (size_t i = 0; i < points.size(); ++i) {
        if (!chosen[i]) {
          pick = i;
          break;
        }
      }
    }

    chosen[pick] = true;
    centers.push_back(points[pick]);
  }
  return centers;
}

KMeansRun ClusteringEngine::run_kmeans(const PointMatrix &points, size_t k,
                                       size_t max_iterations,
                                       std::mt19937_64 &rng) {
  KMeansRun run;
  run.centroids = kmeans_plus_plus(points, k, rng);
  size_t dims = points.front().size();

  // At least one assignment pass, so every point has a label
  size_t iteration_limit = std::max<size_t>(1, max_iterations);
  for (size_t iteration = 1; iteration <= iteration_limit; ++iteration) {
    std::vector<size_t> assignments(points.size());
    for (size_t i = 0; i < points.size(); ++i)
      assignments[i] = nearest_centroid(points[i], run.centroids, nullptr);

    bool changed = assignments != run.assignments;
    run.assignments = std::move(assignments);

    // Centroid update; an empty cluster keeps its previous centroid
    PointMatrix sums(k, std::vector<double>(dims, 0.0));
    std::vector<size_t> counts(k, 0);
    for (size_t i = 0; i < points.size(); ++i) {
      size_t c = run.assignments[i];
      counts[c]++;
      for (size_t d = 0; d < dims; ++d)
        sums[c][d] += points[i][d];
    }
    for (size_t c = 0; c < k; ++c) {
      if (counts[c] == 0)
        continue;
      for (size_t d = 0; d < dims; ++d)
        run.centroids[c][d] = sums[c][d] / counts[c];
    }

    run.inertia = compute_inertia(points, run.assignments, run.centroids);
    run.iterations = iteration;
    run.history.push_back(ClusteringSnapshot{iteration, run.assignments,
                                             run.centroids, run.inertia});

    if (!changed) {
      run.converged = true;
      break;
    }
  }
  return run;
}

KMeansRun ClusteringEngine::best_run(const PointMatrix &points, size_t k,
                                     uint64_t seed) const {
  size_t n_init = std::max<size_t>(1, config_.n_init);
  KMeansRun best;
  bool have_best = false;
  for (size_t i = 0; i < n_init; ++i) {
    std::mt19937_64 rng(seed + i);
    KMeansRun run = run_kmeans(points, k, config_.max_iterations, rng);
    LOG(LogLevel::TRACE, LogComponent::CLUSTERING,
        "k=" << k << " restart " << i << ": inertia " << run.inertia
             << " after " << run.iterations << " iterations");
    if (!have_best || run.inertia < best.inertia) {
      best = std::move(run);
      have_best = true;
    }
  }
  return best;
}

size_t ClusteringEngine::choose_k_by_elbow(const PointMatrix &points,
                                           uint64_t seed) const {
  size_t k_max = std::min(config_.k_max, points.size());
  size_t k_min = std::max<size_t>(1, std::min(config_.k_min, k_max));
  if (k_min >= k_max)
    return k_max;

  std::vector<double> inertia(k_max + 1, 0.0);
  for (size_t k = k_min; k <= k_max; ++k)
    inertia[k] = best_run(points, k, seed).inertia;

  for (size_t k = k_min; k < k_max; ++k) {
    double drop =
        inertia[k] > 0.0 ? (inertia[k] - inertia[k + 1]) / inertia[k] : 0.0;
    LOG(LogLevel::DEBUG, LogComponent::CLUSTERING,
        "Elbow: k=" << k << " inertia " << inertia[k] << ", relative drop "
                    << drop);
    if (drop < config_.elbow_threshold)
      return k;
  }
  return k_max;
}

std::string
ClusteringEngine::describe(const std::vector<double> &standardized_centroid) const {
  std::vector<size_t> order(standardized_centroid.size());
  std::iota(order.begin(), order.end(), 0);
  std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b) {
    return std::fabs(standardized_centroid[a]) >
           std::fabs(standardized_centroid[b]);
  });

  std::string description;
  size_t used = 0;
  for (size_t index : order) {
    if (used >= config_.label_feature_count)
      break;
    double z = standardized_centroid[index];
    if (std::fabs(z) < config_.label_min_deviation)
      break;
    if (!description.empty())
      description += ", ";
    description += (z > 0 ? "high " : "low ") +
                   get_feature_display_name(feature_at(index));
    used++;
  }
  return description.empty() ? "average engagement" : description;
}

ClusterAssignment ClusteringEngine::cluster(
    const std::map<std::string, StudentProfile> &profiles,
    uint64_t seed) const {
  ScopedTimer timer(PipelineMetrics::instance().stage_timer("clustering"));
  ClusterAssignment result;
  result.requested_k = config_.k;
  result.seed = seed;

  if (profiles.empty()) {
    result.diagnostics.push_back(
        make_diagnostic(DiagnosticKind::INSUFFICIENT_DATA, "clustering", "",
                        "No students to cluster"));
    LOG(LogLevel::WARN, LogComponent::CLUSTERING,
        "No students to cluster; assignment is undefined");
    return result;
  }

  std::vector<std::string> ids;
  PointMatrix raw;
  for (const auto &[id, profile] : profiles) {
    ids.push_back(id);
    raw.push_back(profile.features.values);
  }

  StandardizedData data = standardize(raw, &result.diagnostics);

  if (config_.max_iterations == 0) {
    result.diagnostics.push_back(make_diagnostic(
        DiagnosticKind::PARAMETER_ADJUSTMENT, "clustering", "max_iterations",
        "max_iterations raised from 0 to 1"));
    LOG(LogLevel::WARN, LogComponent::CLUSTERING,
        "max_iterations=0 is not usable; running one iteration");
  }

  size_t k = config_.k;
  if (config_.auto_k) {
    k = choose_k_by_elbow(data.points, seed);
    LOG(LogLevel::INFO, LogComponent::CLUSTERING, "Elbow method chose k=" << k);
  }
  if (k == 0)
    k = 1;
  if (k > ids.size()) {
    result.diagnostics.push_back(make_diagnostic(
        DiagnosticKind::PARAMETER_ADJUSTMENT, "clustering", "k",
        "k reduced from " + std::to_string(k) + " to the student count " +
            std::to_string(ids.size())));
    LOG(LogLevel::WARN, LogComponent::CLUSTERING,
        "Only " << ids.size() << " students; k reduced from " << k);
    k = ids.size();
  }

  KMeansRun run = best_run(data.points, k, seed);

  result.defined = true;
  result.effective_k = k;
  result.iterations = run.iterations;
  result.converged = run.converged;
  result.inertia = run.inertia;

  result.clusters.resize(k);
  for (size_t c = 0; c < k; ++c) {
    ClusterInfo &info = result.clusters[c];
    info.label = c;
    info.standardized_centroid = run.centroids[c];
    info.centroid.resize(data.means.size());
    for (size_t d = 0; d < data.means.size(); ++d)
      info.centroid[d] =
          run.centroids[c][d] * data.stddevs[d] + data.means[d];
    info.description = describe(info.standardized_centroid);
  }
  for (size_t i = 0; i < ids.size(); ++i) {
    result.assignments[ids[i]] = run.assignments[i];
    result.clusters[run.assignments[i]].members.push_back(ids[i]);
  }
  result.history = std::move(run.history);

  if (!result.converged) {
    LOG(LogLevel::WARN, LogComponent::CLUSTERING,
        "k-means stopped at max_iterations=" << config_.max_iterations
                                             << " without converging");
  }
  LOG(LogLevel::INFO, LogComponent::CLUSTERING,
      "Clustered " << ids.size() << " students into " << k
                   << " clusters (inertia " << result.inertia << ", "
                   << result.iterations << " iterations)");
  return result;
}

} // namespace analytics

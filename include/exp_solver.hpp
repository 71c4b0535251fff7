#pragma once

#include <memory>
#include <vector>
#include "discrete_path.hpp"
#include "minimizer.hpp"
#include "surface_types.hpp"

class ElasticMetric;

// Geodesic initial value problem by discrete geodesic calculus.
// Frame 0 is the base point, frame 1 an Euler step along the tangent vector,
// every further frame minimizes the squared residual of the discrete geodesic
// equation given the two frames before it.
class DiscreteSurfacesExpSolver {
public:
  // default optimizer: L-BFGS, autodiff gradient, ftol 1e-5
  explicit DiscreteSurfacesExpSolver(int n_steps = 10, std::shared_ptr<const Minimizer> optimizer = nullptr);

  int n_steps() const { return steps; }
  const Minimizer& optimizer() const { return *minimizer; }

  // prints the time spent on every frame
  void set_verbose(bool verbose) { log_frames = verbose; }

  // Objective over the flattened candidate frame x. The residual is
  //   r = 2 e1 - 2 e2 + e3
  // e1 = grad_v <next - current, v>_current at v = 0
  // e2 = grad_v <x - next, v>_next at v = 0
  // e3 = grad_p <x - next, x - next>_p at p = next
  // and the value is |r|^2. The metric must outlive the objective.
  Objective objective(const ElasticMetric& metric, const Surface& current_point, const Surface& next_point) const;

  Surface step_forward(const ElasticMetric& metric, const Surface& current_point, const Surface& next_point) const;

  std::vector<Surface> discrete_geodesic_ivp(const ElasticMetric& metric, const Surface& tangent_vec, const Surface& base_point) const;

  // independent geodesics, a batch of size 1 is broadcast against the other
  std::vector<std::vector<Surface>> discrete_geodesic_ivp(const ElasticMetric& metric, const SurfaceBatch& tangent_vecs, const SurfaceBatch& base_points) const;

  Surface exp(const ElasticMetric& metric, const Surface& tangent_vec, const Surface& base_point) const;
  SurfaceBatch exp(const ElasticMetric& metric, const SurfaceBatch& tangent_vecs, const SurfaceBatch& base_points) const;

  UniformlySampledDiscretePath geodesic_ivp(const ElasticMetric& metric, const Surface& tangent_vec, const Surface& base_point) const;

private:
  int steps;
  std::shared_ptr<const Minimizer> minimizer;
  bool log_frames = false;
};

#pragma once

#include <memory>
#include <vector>
#include "discrete_path.hpp"
#include "minimizer.hpp"
#include "surface_types.hpp"

class ElasticMetric;

// Geodesic boundary value problem: the n_nodes - 2 interior frames of a path
// between base_point and point minimize the discrete path energy.
class PathStraightening {
public:
  // default optimizer: L-BFGS, autodiff gradient, ftol 1e-3
  explicit PathStraightening(int n_nodes = 10, std::shared_ptr<const Minimizer> optimizer = nullptr);

  int n_nodes() const { return nodes; }
  const Minimizer& optimizer() const { return *minimizer; }

  // path energy over the flattened interior frames (frame after frame)
  Objective objective(const ElasticMetric& metric, const Surface& point, const Surface& base_point) const;

  // linear interpolation from base_point to point
  std::vector<Surface> initial_path(const Surface& point, const Surface& base_point) const;

  std::vector<Surface> discrete_geodesic_bvp(const ElasticMetric& metric, const Surface& point, const Surface& base_point) const;
  UniformlySampledDiscretePath geodesic_bvp(const ElasticMetric& metric, const Surface& point, const Surface& base_point) const;

  // initial velocity of the straightened path
  Surface log(const ElasticMetric& metric, const Surface& point, const Surface& base_point) const;

private:
  int nodes;
  std::shared_ptr<const Minimizer> minimizer;
};

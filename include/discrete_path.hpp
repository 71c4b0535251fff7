#pragma once

#include <Eigen/Core>
#include <vector>
#include "surface_types.hpp"

// Path through frames sampled at t_k = k/(n-1), linear in between.
class UniformlySampledDiscretePath {
public:
  explicit UniformlySampledDiscretePath(const std::vector<Surface>& frames);

  Surface operator()(double t) const;
  SurfaceBatch operator()(const Eigen::VectorXd& times) const;

  const std::vector<Surface>& frames() const { return path; }
  int n_frames() const { return path.size(); }

private:
  std::vector<Surface> path;
};

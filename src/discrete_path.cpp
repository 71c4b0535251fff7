#include "discrete_path.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>


UniformlySampledDiscretePath::UniformlySampledDiscretePath(const std::vector<Surface>& frames) : path(frames)
{
  if (path.empty())
    throw std::invalid_argument("Path needs at least one frame");
  for (size_t k = 1; k < path.size(); k++)
    if (!same_shape(path[k], path[0]))
      throw std::invalid_argument("Path frames must have the same shape");
}

Surface UniformlySampledDiscretePath::operator()(double t) const
{
  if (!(t >= 0.0 && t <= 1.0))
    throw std::invalid_argument("Path time must lie in [0, 1]");

  const int n = path.size();
  if (n == 1)
    return path[0];

  const double s = t*(n - 1);
  const int k = std::min(int(std::floor(s)), n - 2);
  const double alpha = s - k;
  return (1.0 - alpha)*path[k] + alpha*path[k+1];
}

SurfaceBatch UniformlySampledDiscretePath::operator()(const Eigen::VectorXd& times) const
{
  SurfaceBatch res(times.size());
  for (int i = 0; i < times.size(); i++)
    res[i] = (*this)(times(i));
  return res;
}

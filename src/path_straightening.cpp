#include "path_straightening.hpp"

#include <stdexcept>
#include "autodiff.hpp"
#include "elastic_metric.hpp"


PathStraightening::PathStraightening(int n_nodes, std::shared_ptr<const Minimizer> optimizer)
  : nodes(n_nodes), minimizer(optimizer)
{
  if (nodes < 3)
    throw std::invalid_argument("Path straightening needs at least three nodes");
  if (!minimizer) {
    MinimizerOptions options;
    options.gradient = GradientSource::AUTODIFF;
    options.ftol = 1e-3;
    minimizer = Minimizer::make(MinimizerMethod::LBFGS, options);
  }
}

// endpoints fixed, interior frames read from x
template <typename Scalar>
static std::vector<SurfaceT<Scalar>> assemble_path(const Surface& point, const Surface& base_point, const VectorT<Scalar>& x, int n_nodes)
{
  const int size = 3*base_point.rows();
  std::vector<SurfaceT<Scalar>> path(n_nodes);
  path[0] = surface_cast<Scalar>(base_point);
  for (int k = 1; k + 1 < n_nodes; k++)
    path[k] = unflatten(VectorT<Scalar>(x.segment((k-1)*size, size)));
  path[n_nodes-1] = surface_cast<Scalar>(point);
  return path;
}

// Path energy and its gradient with respect to every frame, differentiated
// one patch of one segment at a time.
static double path_energy_and_gradient(const ElasticMetric& metric, const std::vector<Surface>& path, std::vector<Surface>& grads)
{
  const int n = path.size();
  const double scale = n - 1;
  grads.assign(n, Surface::Zero(path[0].rows(), 3));

  double energy = 0.0;
  for (int k = 0; k + 1 < n; k++)
    for (const InnerProductPatch& patch : metric.patches()) {
      const std::vector<int>& idx = patch.vertices;
      const int size = 3*idx.size();
      Eigen::VectorXd x(2*size);
      x << flatten(local_rows(path[k], idx)), flatten(local_rows(path[k+1], idx));

      Eigen::VectorXd g;
      energy += value_and_grad([&](const VectorT<ADScalar>& ax) -> ADScalar {
          const SurfaceT<ADScalar> start = unflatten(VectorT<ADScalar>(ax.head(size)));
          const SurfaceT<ADScalar> end = unflatten(VectorT<ADScalar>(ax.tail(size)));
          const SurfaceT<ADScalar> velocity = (end - start)*ADScalar(scale);
          return metric.patch_inner_product(patch, velocity, velocity, start);
        }, x, g);
      scatter_rows(unflatten(Eigen::VectorXd(g.head(size))), idx, grads[k]);
      scatter_rows(unflatten(Eigen::VectorXd(g.tail(size))), idx, grads[k+1]);
    }

  const double factor = 0.5/scale;
  for (int k = 0; k < n; k++)
    grads[k] *= factor;
  return factor*energy;
}

Objective PathStraightening::objective(const ElasticMetric& metric, const Surface& point, const Surface& base_point) const
{
  const ElasticMetric* m = &metric;
  const int n_nodes = nodes;

  Objective obj;
  obj.value = [m, point, base_point, n_nodes](const Eigen::VectorXd& x) {
    return m->path_energy(assemble_path(point, base_point, x, n_nodes));
  };
  obj.value_and_gradient = [m, point, base_point, n_nodes](const Eigen::VectorXd& x, Eigen::VectorXd& grad) {
    const std::vector<Surface> path = assemble_path(point, base_point, x, n_nodes);
    std::vector<Surface> grads;
    const double value = path_energy_and_gradient(*m, path, grads);
    const int size = 3*base_point.rows();
    grad.resize(x.size());
    for (int k = 1; k + 1 < n_nodes; k++)
      grad.segment((k-1)*size, size) = flatten(grads[k]);
    return value;
  };
  return obj;
}

std::vector<Surface> PathStraightening::initial_path(const Surface& point, const Surface& base_point) const
{
  std::vector<Surface> path(nodes);
  for (int k = 0; k < nodes; k++)
    path[k] = base_point + (double(k)/(nodes - 1))*(point - base_point);
  return path;
}

std::vector<Surface> PathStraightening::discrete_geodesic_bvp(const ElasticMetric& metric, const Surface& point, const Surface& base_point) const
{
  if (!metric.space().belongs(base_point) || !same_shape(point, base_point))
    throw std::invalid_argument("Point and base point must have shape [n_vertices, 3]");

  const int size = 3*base_point.rows();
  const std::vector<Surface> init = initial_path(point, base_point);
  Eigen::VectorXd x0((nodes - 2)*size);
  for (int k = 1; k + 1 < nodes; k++)
    x0.segment((k-1)*size, size) = flatten(init[k]);

  const MinimizeResult sol = minimizer->minimize(objective(metric, point, base_point), x0);
  return assemble_path(point, base_point, sol.x, nodes);
}

UniformlySampledDiscretePath PathStraightening::geodesic_bvp(const ElasticMetric& metric, const Surface& point, const Surface& base_point) const
{
  return UniformlySampledDiscretePath(discrete_geodesic_bvp(metric, point, base_point));
}

Surface PathStraightening::log(const ElasticMetric& metric, const Surface& point, const Surface& base_point) const
{
  const std::vector<Surface> path = discrete_geodesic_bvp(metric, point, base_point);
  return double(nodes - 1)*(path[1] - path[0]);
}

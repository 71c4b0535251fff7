#include "exp_solver.hpp"

#include <algorithm>
#include <exception>
#include <iostream>
#include <stdexcept>
#include "autodiff.hpp"
#include "elastic_metric.hpp"
#include "time.hpp"


DiscreteSurfacesExpSolver::DiscreteSurfacesExpSolver(int n_steps, std::shared_ptr<const Minimizer> optimizer)
  : steps(n_steps), minimizer(optimizer)
{
  if (steps < 2)
    throw std::invalid_argument("Exp solver needs at least two steps");
  if (!minimizer) {
    MinimizerOptions options;
    options.gradient = GradientSource::AUTODIFF;
    options.ftol = 1e-5;
    minimizer = Minimizer::make(MinimizerMethod::LBFGS, options);
  }
}

// grad_v <a, v>_p at v = 0
static Surface tangent_gradient(const ElasticMetric& metric, const Surface& tangent_vec, const Surface& base_point)
{
  Surface grad;
  value_and_grad_local(metric.patches(), [&](const InnerProductPatch& patch, const SurfaceT<ADScalar>& v) -> ADScalar {
      const SurfaceT<ADScalar> a = surface_cast<ADScalar>(local_rows(tangent_vec, patch.vertices));
      const SurfaceT<ADScalar> p = surface_cast<ADScalar>(local_rows(base_point, patch.vertices));
      return metric.patch_inner_product(patch, a, v, p);
    }, Surface(Surface::Zero(base_point.rows(), 3)), grad);
  return grad;
}

// grad_p <a, a>_p
static Surface base_point_gradient(const ElasticMetric& metric, const Surface& tangent_vec, const Surface& base_point)
{
  Surface grad;
  value_and_grad_local(metric.patches(), [&](const InnerProductPatch& patch, const SurfaceT<ADScalar>& p) -> ADScalar {
      const SurfaceT<ADScalar> a = surface_cast<ADScalar>(local_rows(tangent_vec, patch.vertices));
      return metric.patch_inner_product(patch, a, a, p);
    }, base_point, grad);
  return grad;
}

// 2 e1 - 2 e2 + e3 at the candidate x, flattened
static Eigen::VectorXd geodesic_residual(const ElasticMetric& metric, const Surface& next_point, const Surface& energy_1, const Eigen::VectorXd& x)
{
  if (x.size() != next_point.size())
    throw std::invalid_argument("Candidate has the wrong number of coordinates");
  const Surface next_to_next_next = unflatten(x) - next_point;
  const Surface energy_2 = tangent_gradient(metric, next_to_next_next, next_point);
  const Surface energy_3 = base_point_gradient(metric, next_to_next_next, next_point);

  const Surface energy_tot = 2.0*energy_1 - 2.0*energy_2 + energy_3;
  return flatten(energy_tot);
}

// Gradient of r_bar . r(x) with r_bar frozen, i.e. J^T r_bar.
// r_bar . e2 = d/dt <x - next, t r_bar>_next and
// r_bar . e3 = d/dt <x - next, x - next>_{next + t r_bar}, both at t = 0.
// Assembled patch by patch like the residual itself.
static Eigen::VectorXd residual_jacobian_transpose(const ElasticMetric& metric, const Surface& next_point, const Eigen::VectorXd& x, const Eigen::VectorXd& r_bar)
{
  const ADScalar2 t = ad2_parameter();
  const Surface candidate = unflatten(x);
  const Surface direction = unflatten(r_bar);

  Surface grad = Surface::Zero(next_point.rows(), 3);
  for (const InnerProductPatch& patch : metric.patches()) {
    const std::vector<int>& idx = patch.vertices;
    const int m = idx.size();
    const SurfaceT<ADScalar2> candidate_ad = unflatten(ad2_variables(flatten(local_rows(candidate, idx))));
    const SurfaceT<ADScalar2> next_ad = surface_cast<ADScalar2>(local_rows(next_point, idx));
    const Surface local_direction = local_rows(direction, idx);
    const SurfaceT<ADScalar2> next_to_next_next = candidate_ad - next_ad;

    SurfaceT<ADScalar2> t_direction(m, 3), moved(m, 3);
    for (int i = 0; i < m; i++)
      for (int j = 0; j < 3; j++) {
        t_direction(i,j) = t*ADScalar2(local_direction(i,j));
        moved(i,j) = next_ad(i,j) + t_direction(i,j);
      }

    const ADScalar2 along_e2 = metric.patch_inner_product(patch, next_to_next_next, t_direction, next_ad);
    const ADScalar2 along_e3 = metric.patch_inner_product(patch, next_to_next_next, next_to_next_next, moved);
    const ADScalar2 total = ADScalar2(-2.0)*along_e2 + along_e3;
    scatter_rows(unflatten(ad2_mixed_gradient(total, 3*m)), idx, grad);
  }
  return flatten(grad);
}

Objective DiscreteSurfacesExpSolver::objective(const ElasticMetric& metric, const Surface& current_point, const Surface& next_point) const
{
  if (!metric.space().belongs(current_point) || !same_shape(next_point, current_point))
    throw std::invalid_argument("Current and next point must have shape [n_vertices, 3]");

  // does not depend on the candidate
  const Surface energy_1 = tangent_gradient(metric, Surface(next_point - current_point), current_point);

  const ElasticMetric* m = &metric;
  const Surface next = next_point;

  Objective obj;
  obj.residuals = [m, next, energy_1](const Eigen::VectorXd& x) {
    return geodesic_residual(*m, next, energy_1, x);
  };
  obj.value = [m, next, energy_1](const Eigen::VectorXd& x) {
    return geodesic_residual(*m, next, energy_1, x).squaredNorm();
  };
  obj.value_and_gradient = [m, next, energy_1](const Eigen::VectorXd& x, Eigen::VectorXd& grad) {
    const Eigen::VectorXd r = geodesic_residual(*m, next, energy_1, x);
    grad = 2.0*residual_jacobian_transpose(*m, next, x, r);
    return r.squaredNorm();
  };
  return obj;
}

Surface DiscreteSurfacesExpSolver::step_forward(const ElasticMetric& metric, const Surface& current_point, const Surface& next_point) const
{
  const Surface initial = 2.0*(next_point - current_point) + current_point;
  const MinimizeResult sol = minimizer->minimize(objective(metric, current_point, next_point), flatten(initial));
  return unflatten(sol.x);
}

std::vector<Surface> DiscreteSurfacesExpSolver::discrete_geodesic_ivp(const ElasticMetric& metric, const Surface& tangent_vec, const Surface& base_point) const
{
  if (!metric.space().belongs(base_point) || !same_shape(tangent_vec, base_point))
    throw std::invalid_argument("Tangent vector and base point must have shape [n_vertices, 3]");

  std::vector<Surface> frames(steps);
  frames[0] = base_point;
  frames[1] = base_point + tangent_vec/double(steps - 1);
  for (int k = 2; k < steps; k++) {
    if (log_frames) {
      TIME_BLOCK("geodesic frame " << k << "/" << steps - 1,
        frames[k] = step_forward(metric, frames[k-2], frames[k-1]););
    }
    else
      frames[k] = step_forward(metric, frames[k-2], frames[k-1]);
  }
  return frames;
}

std::vector<std::vector<Surface>> DiscreteSurfacesExpSolver::discrete_geodesic_ivp(const ElasticMetric& metric, const SurfaceBatch& tangent_vecs, const SurfaceBatch& base_points) const
{
  const size_t n = std::max(tangent_vecs.size(), base_points.size());
  if ((tangent_vecs.size() != n && tangent_vecs.size() != 1) || (base_points.size() != n && base_points.size() != 1))
    throw std::invalid_argument("Batch sizes of tangent vectors and base points do not match");

  std::vector<std::vector<Surface>> paths(n);
  std::exception_ptr error = nullptr;
#pragma omp parallel for schedule(dynamic)
  for (int i = 0; i < int(n); i++) {
    try {
      paths[i] = discrete_geodesic_ivp(metric,
                                       tangent_vecs[tangent_vecs.size() == 1 ? 0 : i],
                                       base_points[base_points.size() == 1 ? 0 : i]);
    }
    catch (...) {
#pragma omp critical
      {
        if (!error)
          error = std::current_exception();
      }
    }
  }
  if (error)
    std::rethrow_exception(error);
  return paths;
}

Surface DiscreteSurfacesExpSolver::exp(const ElasticMetric& metric, const Surface& tangent_vec, const Surface& base_point) const
{
  return discrete_geodesic_ivp(metric, tangent_vec, base_point).back();
}

SurfaceBatch DiscreteSurfacesExpSolver::exp(const ElasticMetric& metric, const SurfaceBatch& tangent_vecs, const SurfaceBatch& base_points) const
{
  const std::vector<std::vector<Surface>> paths = discrete_geodesic_ivp(metric, tangent_vecs, base_points);
  SurfaceBatch res(paths.size());
  for (size_t i = 0; i < paths.size(); i++)
    res[i] = paths[i].back();
  return res;
}

UniformlySampledDiscretePath DiscreteSurfacesExpSolver::geodesic_ivp(const ElasticMetric& metric, const Surface& tangent_vec, const Surface& base_point) const
{
  return UniformlySampledDiscretePath(discrete_geodesic_ivp(metric, tangent_vec, base_point));
}

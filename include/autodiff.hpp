#pragma once

#include <Eigen/Core>
#include <vector>
#include "surface_types.hpp"

// Forward mode differentiation on top of Eigen::AutoDiffScalar.
// Functions are generic callables invoked with VectorT<ADScalar> (or
// SurfaceT<ADScalar>) arguments and returning an ADScalar.

// independent variables: the derivative of x(i) is the i-th unit vector
inline VectorT<ADScalar> ad_variables(const Eigen::VectorXd& x){
  const int n = x.size();
  VectorT<ADScalar> ax(n);
  for (int i = 0; i < n; i++)
    ax(i) = ADScalar(x(i), n, i);
  return ax;
}

// constants carry an empty derivative vector
inline Eigen::VectorXd ad_gradient(const ADScalar& y, int n){
  if (y.derivatives().size() == 0)
    return Eigen::VectorXd::Zero(n);
  return y.derivatives();
}

template <typename Function>
double value_and_grad(const Function& f, const Eigen::VectorXd& x, Eigen::VectorXd& grad){
  const ADScalar y = f(ad_variables(x));
  grad = ad_gradient(y, x.size());
  return y.value();
}

// differentiates with respect to the whole [n_vertices, 3] surface
template <typename Function>
double value_and_grad_surface(const Function& f, const Surface& point, Surface& grad){
  Eigen::VectorXd g;
  const double value = value_and_grad(
      [&f](const VectorT<ADScalar>& x) -> ADScalar { return f(unflatten(x)); },
      flatten(point), g);
  grad = unflatten(g);
  return value;
}

// leading batch dimension: every surface is differentiated independently
template <typename Function>
Eigen::VectorXd value_and_grad_surface(const Function& f, const SurfaceBatch& points, SurfaceBatch& grads){
  Eigen::VectorXd values(points.size());
  grads.resize(points.size());
  for (size_t i = 0; i < points.size(); i++)
    values(i) = value_and_grad_surface(f, points[i], grads[i]);
  return values;
}

// Sum over patches of f(patch, local rows of point), differentiated patch by
// patch. Every patch has its own short derivative vector and the local
// gradients are scatter-added, so the cost grows with the number of patches
// rather than with their product with the number of vertices.
template <typename Patches, typename Function>
double value_and_grad_local(const Patches& patches, const Function& f, const Surface& point, Surface& grad){
  grad = Surface::Zero(point.rows(), 3);
  double value = 0.0;
  for (size_t i = 0; i < patches.size(); i++) {
    const std::vector<int>& idx = patches[i].vertices;
    Eigen::VectorXd g;
    value += value_and_grad(
        [&](const VectorT<ADScalar>& x) -> ADScalar { return f(patches[i], unflatten(x)); },
        flatten(local_rows(point, idx)), g);
    scatter_rows(unflatten(g), idx, grad);
  }
  return value;
}


// Mixed derivatives d/dx (d/dt f(x, t)) at t = 0. The x variables are
// ADScalar seeds with a zero t-derivative, t is a constant in x.
inline VectorT<ADScalar2> ad2_variables(const Eigen::VectorXd& x){
  const int n = x.size();
  Eigen::Matrix<ADScalar, 1, 1> zero;
  zero(0) = ADScalar(0.0);
  VectorT<ADScalar2> ax(n);
  for (int i = 0; i < n; i++)
    ax(i) = ADScalar2(ADScalar(x(i), n, i), zero);
  return ax;
}

inline ADScalar2 ad2_parameter(){
  Eigen::Matrix<ADScalar, 1, 1> one;
  one(0) = ADScalar(1.0);
  return ADScalar2(ADScalar(0.0), one);
}

inline Eigen::VectorXd ad2_mixed_gradient(const ADScalar2& y, int n){
  return ad_gradient(y.derivatives()(0), n);
}

#pragma once

#include <Eigen/Core>
#include <unsupported/Eigen/AutoDiff>
#include <vector>

// triangulation shared by every surface: one row of vertex indices per face
typedef Eigen::Matrix<int, Eigen::Dynamic, 3> Faces;

// vertex positions (or per-vertex displacements), one row per vertex
template <typename Scalar>
using SurfaceT = Eigen::Matrix<Scalar, Eigen::Dynamic, 3>;

// per-face edge vectors [v1-v0; v2-v0]
template <typename Scalar>
using OneFormT = Eigen::Matrix<Scalar, 2, 3>;

// per-face Gram matrix of the one-form
template <typename Scalar>
using MetricT = Eigen::Matrix<Scalar, 2, 2>;

template <typename Scalar>
using VectorT = Eigen::Matrix<Scalar, Eigen::Dynamic, 1>;

typedef SurfaceT<double> Surface;
typedef std::vector<Surface> SurfaceBatch;

// gradient with respect to a flat vector of variables
typedef Eigen::AutoDiffScalar<Eigen::VectorXd> ADScalar;
// one directional derivative of an ADScalar valued function
typedef Eigen::AutoDiffScalar<Eigen::Matrix<ADScalar, 1, 1>> ADScalar2;


inline double scalar_value(double x){
  return x;
}

template <typename DerType>
double scalar_value(const Eigen::AutoDiffScalar<DerType>& x){
  return scalar_value(x.value());
}

// max(x, lower); a clipped value is a constant (zero derivative)
template <typename Scalar>
Scalar clip_min(const Scalar& x, double lower){
  if (scalar_value(x) < lower)
    return Scalar(lower);
  return x;
}

// vertex-major flattening (x0, y0, z0, x1, ...)
template <typename Scalar>
VectorT<Scalar> flatten(const SurfaceT<Scalar>& point){
  VectorT<Scalar> x(point.rows()*3);
  for (int i = 0; i < point.rows(); i++)
    for (int j = 0; j < 3; j++)
      x(3*i+j) = point(i,j);
  return x;
}

template <typename Scalar>
SurfaceT<Scalar> unflatten(const VectorT<Scalar>& x){
  SurfaceT<Scalar> point(x.size()/3, 3);
  for (int i = 0; i < point.rows(); i++)
    for (int j = 0; j < 3; j++)
      point(i,j) = x(3*i+j);
  return point;
}

// converts a double valued surface to another scalar type (constants)
template <typename Scalar>
SurfaceT<Scalar> surface_cast(const Surface& point){
  SurfaceT<Scalar> out(point.rows(), 3);
  for (int i = 0; i < point.rows(); i++)
    for (int j = 0; j < 3; j++)
      out(i,j) = Scalar(point(i,j));
  return out;
}

// rows idx[0], idx[1], ... of a surface
template <typename Scalar>
SurfaceT<Scalar> local_rows(const SurfaceT<Scalar>& point, const std::vector<int>& idx){
  SurfaceT<Scalar> out(idx.size(), 3);
  for (size_t i = 0; i < idx.size(); i++)
    out.row(i) = point.row(idx[i]);
  return out;
}

// adds row i of local to row idx[i] of out
inline void scatter_rows(const Surface& local, const std::vector<int>& idx, Surface& out){
  for (size_t i = 0; i < idx.size(); i++)
    out.row(idx[i]) += local.row(i);
}

template <typename DerivedA, typename DerivedB>
typename DerivedA::Scalar dot3(const Eigen::MatrixBase<DerivedA>& a, const Eigen::MatrixBase<DerivedB>& b){
  typedef typename DerivedA::Scalar Scalar;
  const Scalar s = a(0)*b(0) + a(1)*b(1) + a(2)*b(2);
  return s;
}

template <typename DerivedA, typename DerivedB>
bool same_shape(const Eigen::MatrixBase<DerivedA>& a, const Eigen::MatrixBase<DerivedB>& b){
  return a.rows() == b.rows() && a.cols() == b.cols();
}

#pragma once

#include <Eigen/Core>
#include <Eigen/Sparse>
#include <vector>
#include "surface_types.hpp"

// Discrete Laplacian at a fixed base point.
// Half-edge k of face f goes from F(f,(k+1)%3) to F(f,(k+2)%3) and carries the
// cotangent weight of the corner F(f,k). Applying the operator accumulates
// weight*(t[source]-t[destination]) on the destination vertex.
template <typename Scalar>
class LaplacianOperator {
public:
  LaplacianOperator(const Faces& F, int n_vertices, const SurfaceT<Scalar>& base_point);

  SurfaceT<Scalar> apply(const SurfaceT<Scalar>& tangent_vec) const;
  SurfaceT<Scalar> operator()(const SurfaceT<Scalar>& tangent_vec) const { return apply(tangent_vec); }

  // (source, destination) of every half-edge, 3*n_faces rows
  const Eigen::Matrix<int, Eigen::Dynamic, 2>& edges() const { return E; }
  const VectorT<Scalar>& weights() const { return cot; }
  int n_vertices() const { return nv; }

private:
  int nv;
  Eigen::Matrix<int, Eigen::Dynamic, 2> E;
  VectorT<Scalar> cot;
};

// sparse matrix L with L*t == apply(t), rows indexed by destination vertex
Eigen::SparseMatrix<double> laplacian_matrix(const LaplacianOperator<double>& L);


// Space of surfaces sharing one triangulation.
class DiscreteSurfaces {
public:
  explicit DiscreteSurfaces(const Faces& F);

  const Faces& faces() const { return F; }
  int n_faces() const { return F.rows(); }
  int n_vertices() const { return nv; }
  int dim() const { return 3*nv; }

  // shape checks only, the tangent space is the whole ambient space
  bool belongs(const Eigen::MatrixXd& point) const;
  Eigen::Array<bool, Eigen::Dynamic, 1> belongs(const std::vector<Eigen::MatrixXd>& points) const;
  bool is_tangent(const Eigen::MatrixXd& vector, const Eigen::MatrixXd& base_point) const;
  Eigen::Array<bool, Eigen::Dynamic, 1> is_tangent(const Eigen::MatrixXd& vector, const std::vector<Eigen::MatrixXd>& base_points) const;

  Surface to_tangent(const Surface& vector, const Surface& base_point) const;
  Surface projection(const Surface& point) const;

  // coordinates uniform in [-1, 1]; not a realistic surface
  Surface random_point() const;
  SurfaceBatch random_point(int n_samples) const;

  // Heron's formula, radicand floored at 1e-6
  template <typename Scalar>
  VectorT<Scalar> triangle_areas(const SurfaceT<Scalar>& point) const;

  // 2/3 of the summed areas of the incident faces
  template <typename Scalar>
  VectorT<Scalar> vertex_areas(const SurfaceT<Scalar>& point) const;

  // 0.5*(v1-v0)x(v2-v0), norm is the face area
  template <typename Scalar>
  SurfaceT<Scalar> normals(const SurfaceT<Scalar>& point) const;

  template <typename Scalar>
  std::vector<OneFormT<Scalar>> surface_one_forms(const SurfaceT<Scalar>& point) const;

  template <typename Scalar>
  std::vector<MetricT<Scalar>> surface_metric_matrices(const SurfaceT<Scalar>& point) const;

  template <typename Scalar>
  static std::vector<MetricT<Scalar>> surface_metric_matrices_from_one_forms(const std::vector<OneFormT<Scalar>>& one_forms);

  // sqrt(det(g)) per face
  template <typename Scalar>
  VectorT<Scalar> face_areas(const SurfaceT<Scalar>& point) const;

  template <typename Scalar>
  LaplacianOperator<Scalar> laplacian(const SurfaceT<Scalar>& base_point) const {
    return LaplacianOperator<Scalar>(F, nv, base_point);
  }

private:
  Faces F;
  int nv;
};


template <typename Scalar>
Scalar det2(const MetricT<Scalar>& g){
  return g(0,0)*g(1,1) - g(0,1)*g(1,0);
}

template <typename Scalar>
MetricT<Scalar> inverse2(const MetricT<Scalar>& g){
  const Scalar det = det2(g);
  MetricT<Scalar> ginv;
  ginv(0,0) = g(1,1)/det;
  ginv(0,1) = -g(0,1)/det;
  ginv(1,0) = -g(1,0)/det;
  ginv(1,1) = g(0,0)/det;
  return ginv;
}

#pragma once

#include <Eigen/Core>
#include <memory>
#include <vector>
#include "discrete_path.hpp"
#include "discrete_surfaces.hpp"
#include "exp_solver.hpp"
#include "path_straightening.hpp"
#include "surface_types.hpp"

// weights of the six terms, a zero weight skips its term
struct ElasticMetricWeights{
  double a0 = 1.0;
  double a1 = 1.0;
  double b1 = 1.0;
  double c1 = 1.0;
  double d1 = 1.0;
  double a2 = 1.0;
};

// intermediates inner_product materializes, fixed by the weights
struct ActiveTerms{
  bool vertex_areas;
  bool one_forms;
  bool normals;
  bool inverse_metric;
  bool metric_perturbation;
};

// Local piece of the inner product: face patches carry every term but a2 on a
// single triangle, star patches the a2 term of their first vertex. vertices
// maps local rows to rows of the full surface.
struct InnerProductPatch{
  std::vector<int> vertices;
  std::shared_ptr<const DiscreteSurfaces> space;
  bool star;
};

// Elastic (second order Sobolev) metric on discrete surfaces.
//   <h,k>_q = a0 sum_v A_v <h_v, k_v> + a2 sum_v <(L h)_v, (L k)_v> / A_v
//           + sum_f area_f (a1 G_a1 + b1 G_b1 + c1 G_c1 + d1 G_d1)
// with the first order terms evaluated on the one-forms of q+h and q+k.
class ElasticMetric {
public:
  ElasticMetric(std::shared_ptr<const DiscreteSurfaces> space, const ElasticMetricWeights& weights = ElasticMetricWeights());
  ElasticMetric(std::shared_ptr<const DiscreteSurfaces> space, double a0, double a1, double b1, double c1, double d1, double a2);

  const DiscreteSurfaces& space() const { return *surfaces; }
  const ElasticMetricWeights& weights() const { return w; }
  const ActiveTerms& active_terms() const { return active; }

  template <typename Scalar>
  Scalar inner_product(const SurfaceT<Scalar>& tangent_vec_a, const SurfaceT<Scalar>& tangent_vec_b, const SurfaceT<Scalar>& base_point) const;

  // the inner product is the sum of patch_inner_product over patches(),
  // arguments of a patch hold the rows listed in its vertices
  const std::vector<InnerProductPatch>& patches() const { return local_patches; }

  template <typename Scalar>
  Scalar patch_inner_product(const InnerProductPatch& patch, const SurfaceT<Scalar>& tangent_vec_a, const SurfaceT<Scalar>& tangent_vec_b, const SurfaceT<Scalar>& base_point) const;

  // batches of size 1 are broadcast
  Eigen::VectorXd inner_product(const SurfaceBatch& tangent_vecs_a, const SurfaceBatch& tangent_vecs_b, const Surface& base_point) const;

  double squared_norm(const Surface& tangent_vec, const Surface& base_point) const;
  double norm(const Surface& tangent_vec, const Surface& base_point) const;

  // 0.5/(n-1) sum_k |(n-1)(p_k+1 - p_k)|^2_{p_k} over a path of n frames
  template <typename Scalar>
  Scalar path_energy(const std::vector<SurfaceT<Scalar>>& path) const;

  Surface exp(const Surface& tangent_vec, const Surface& base_point) const;
  SurfaceBatch exp(const SurfaceBatch& tangent_vecs, const SurfaceBatch& base_points) const;
  UniformlySampledDiscretePath geodesic_ivp(const Surface& tangent_vec, const Surface& base_point) const;

  Surface log(const Surface& point, const Surface& base_point) const;
  UniformlySampledDiscretePath geodesic_bvp(const Surface& point, const Surface& base_point) const;

  // squared norm of log(point_a, point_b) at point_b
  double squared_dist(const Surface& point_a, const Surface& point_b) const;
  double dist(const Surface& point_a, const Surface& point_b) const;

  const DiscreteSurfacesExpSolver& exp_solver() const { return exp_sol; }
  const PathStraightening& log_solver() const { return log_sol; }
  void set_exp_solver(const DiscreteSurfacesExpSolver& solver) { exp_sol = solver; }
  void set_log_solver(const PathStraightening& solver) { log_sol = solver; }

private:
  std::shared_ptr<const DiscreteSurfaces> surfaces;
  ElasticMetricWeights w;
  ActiveTerms active;
  ElasticMetricWeights face_w;
  ActiveTerms face_active;
  std::vector<InnerProductPatch> local_patches;
  DiscreteSurfacesExpSolver exp_sol;
  PathStraightening log_sol;
};

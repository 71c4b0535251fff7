#include "elastic_metric.hpp"

#include <algorithm>
#include <cmath>
#include <map>
#include <stdexcept>


static ActiveTerms active_terms_for(const ElasticMetricWeights& w)
{
  ActiveTerms active;
  active.vertex_areas = w.a0 > 0 || w.a2 > 0;
  active.one_forms = w.a1 > 0 || w.b1 > 0 || w.c1 > 0 || w.d1 > 0;
  active.normals = w.c1 > 0;
  active.inverse_metric = w.a1 > 0 || w.b1 > 0 || w.d1 > 0;
  active.metric_perturbation = w.a1 > 0 || w.b1 > 0;
  return active;
}

// One patch per face for the terms living on faces, one patch per vertex star
// for the a2 term. The center of a star is its local vertex 0, vertices
// without faces get no star.
static std::vector<InnerProductPatch> build_patches(const DiscreteSurfaces& space, bool faces, bool stars)
{
  const Faces& F = space.faces();
  std::vector<InnerProductPatch> patches;

  if (faces) {
    Faces triangle(1, 3);
    triangle << 0, 1, 2;
    const std::shared_ptr<const DiscreteSurfaces> face_space = std::make_shared<const DiscreteSurfaces>(triangle);
    for (int f = 0; f < F.rows(); f++) {
      InnerProductPatch patch;
      patch.vertices = {F(f,0), F(f,1), F(f,2)};
      patch.space = face_space;
      patch.star = false;
      patches.push_back(patch);
    }
  }

  if (stars) {
    std::vector<std::vector<int>> incident(space.n_vertices());
    for (int f = 0; f < F.rows(); f++)
      for (int k = 0; k < 3; k++)
        if (incident[F(f,k)].empty() || incident[F(f,k)].back() != f)
          incident[F(f,k)].push_back(f);

    for (int v = 0; v < space.n_vertices(); v++) {
      if (incident[v].empty())
        continue;
      InnerProductPatch patch;
      std::map<int, int> local;
      local[v] = 0;
      patch.vertices.push_back(v);
      Faces star(int(incident[v].size()), 3);
      for (size_t i = 0; i < incident[v].size(); i++)
        for (int k = 0; k < 3; k++) {
          const int vertex = F(incident[v][i], k);
          if (local.find(vertex) == local.end()) {
            local[vertex] = int(patch.vertices.size());
            patch.vertices.push_back(vertex);
          }
          star(i, k) = local[vertex];
        }
      patch.space = std::make_shared<const DiscreteSurfaces>(star);
      patch.star = true;
      patches.push_back(patch);
    }
  }
  return patches;
}

ElasticMetric::ElasticMetric(std::shared_ptr<const DiscreteSurfaces> space, const ElasticMetricWeights& weights)
  : surfaces(space), w(weights)
{
  if (!surfaces)
    throw std::invalid_argument("ElasticMetric needs a space of discrete surfaces");
  const double all[6] = {w.a0, w.a1, w.b1, w.c1, w.d1, w.a2};
  for (double weight : all)
    if (!(weight >= 0))
      throw std::invalid_argument("Elastic metric weights must be non-negative");
  active = active_terms_for(w);

  face_w = w;
  face_w.a2 = 0.0;
  face_active = active_terms_for(face_w);
  local_patches = build_patches(*surfaces, face_w.a0 > 0 || face_active.one_forms, w.a2 > 0);
}

ElasticMetric::ElasticMetric(std::shared_ptr<const DiscreteSurfaces> space, double a0, double a1, double b1, double c1, double d1, double a2)
  : ElasticMetric(space, ElasticMetricWeights{a0, a1, b1, c1, d1, a2})
{
}


template <typename Scalar>
static Scalar inner_product_a0(const SurfaceT<Scalar>& a, const SurfaceT<Scalar>& b, const VectorT<Scalar>& vertex_areas)
{
  Scalar sum = Scalar(0.0);
  for (int v = 0; v < a.rows(); v++)
    sum += vertex_areas(v)*dot3(a.row(v), b.row(v));
  return sum;
}

// Laplacians weighted by the inverse vertex areas
template <typename Scalar>
static Scalar inner_product_a2(const LaplacianOperator<Scalar>& L, const SurfaceT<Scalar>& a, const SurfaceT<Scalar>& b, const VectorT<Scalar>& vertex_areas)
{
  const SurfaceT<Scalar> La = L(a);
  const SurfaceT<Scalar> Lb = L(b);
  Scalar sum = Scalar(0.0);
  for (int v = 0; v < La.rows(); v++)
    sum += dot3(La.row(v), Lb.row(v))/vertex_areas(v);
  return sum;
}

// tr(g^-1 dg_a g^-1 dg_b)
template <typename Scalar>
static Scalar inner_product_a1(const std::vector<MetricT<Scalar>>& ginvdga, const std::vector<MetricT<Scalar>>& ginvdgb, const VectorT<Scalar>& areas)
{
  Scalar sum = Scalar(0.0);
  for (size_t f = 0; f < ginvdga.size(); f++) {
    const MetricT<Scalar> prod = ginvdga[f]*ginvdgb[f];
    sum += areas(f)*prod.trace();
  }
  return sum;
}

// tr(g^-1 dg_a) tr(g^-1 dg_b)
template <typename Scalar>
static Scalar inner_product_b1(const std::vector<MetricT<Scalar>>& ginvdga, const std::vector<MetricT<Scalar>>& ginvdgb, const VectorT<Scalar>& areas)
{
  Scalar sum = Scalar(0.0);
  for (size_t f = 0; f < ginvdga.size(); f++)
    sum += areas(f)*ginvdga[f].trace()*ginvdgb[f].trace();
  return sum;
}

// change of the face normals
template <typename Scalar>
static Scalar inner_product_c1(const SurfaceT<Scalar>& dna, const SurfaceT<Scalar>& dnb, const VectorT<Scalar>& areas)
{
  Scalar sum = Scalar(0.0);
  for (int f = 0; f < dna.rows(); f++)
    sum += areas(f)*dot3(dna.row(f), dnb.row(f));
  return sum;
}

// A^T g^-1 (x^T A^T - A x) with x = A_moved^T - A^T
template <typename Scalar>
static Eigen::Matrix<Scalar, 3, 2> one_form_zero_component(const OneFormT<Scalar>& A, const OneFormT<Scalar>& A_moved, const MetricT<Scalar>& ginv)
{
  const Eigen::Matrix<Scalar, 3, 2> x = A_moved.transpose() - A.transpose();
  const Eigen::Matrix<Scalar, 3, 2> At_ginv = A.transpose()*ginv;
  const MetricT<Scalar> skew = x.transpose()*A.transpose() - A*x;
  const Eigen::Matrix<Scalar, 3, 2> x0 = At_ginv*skew;
  return x0;
}

template <typename Scalar>
static Scalar inner_product_d1(const std::vector<OneFormT<Scalar>>& one_forms_a,
                               const std::vector<OneFormT<Scalar>>& one_forms_b,
                               const std::vector<OneFormT<Scalar>>& one_forms_bp,
                               const std::vector<MetricT<Scalar>>& ginv,
                               const VectorT<Scalar>& areas)
{
  Scalar sum = Scalar(0.0);
  for (size_t f = 0; f < one_forms_bp.size(); f++) {
    const Eigen::Matrix<Scalar, 3, 2> xa0 = one_form_zero_component(one_forms_bp[f], one_forms_a[f], ginv[f]);
    const Eigen::Matrix<Scalar, 3, 2> xb0 = one_form_zero_component(one_forms_bp[f], one_forms_b[f], ginv[f]);
    const Eigen::Matrix<Scalar, 3, 3> prod = xa0*ginv[f]*xb0.transpose();
    sum += areas(f)*prod.trace();
  }
  return sum;
}


template <typename Scalar>
static Scalar elastic_inner_product(const DiscreteSurfaces& space, const ElasticMetricWeights& w, const ActiveTerms& active,
                                    const SurfaceT<Scalar>& tangent_vec_a, const SurfaceT<Scalar>& tangent_vec_b, const SurfaceT<Scalar>& base_point)
{
  Scalar inner_prod_a0 = Scalar(0.0);
  Scalar inner_prod_a1 = Scalar(0.0);
  Scalar inner_prod_a2 = Scalar(0.0);
  Scalar inner_prod_b1 = Scalar(0.0);
  Scalar inner_prod_c1 = Scalar(0.0);
  Scalar inner_prod_d1 = Scalar(0.0);

  if (active.vertex_areas) {
    const VectorT<Scalar> vertex_areas_bp = space.vertex_areas(base_point);
    if (w.a0 > 0)
      inner_prod_a0 = Scalar(w.a0)*inner_product_a0(tangent_vec_a, tangent_vec_b, vertex_areas_bp);
    if (w.a2 > 0)
      inner_prod_a2 = Scalar(w.a2)*inner_product_a2(space.laplacian(base_point), tangent_vec_a, tangent_vec_b, vertex_areas_bp);
  }

  if (active.one_forms) {
    using std::sqrt;
    const std::vector<OneFormT<Scalar>> one_forms_bp = space.surface_one_forms(base_point);
    const std::vector<MetricT<Scalar>> g_bp = DiscreteSurfaces::surface_metric_matrices_from_one_forms(one_forms_bp);
    VectorT<Scalar> areas_bp(g_bp.size());
    for (size_t f = 0; f < g_bp.size(); f++)
      areas_bp(f) = sqrt(clip_min(det2(g_bp[f]), 0.0));

    const SurfaceT<Scalar> point_a = base_point + tangent_vec_a;
    const SurfaceT<Scalar> point_b = base_point + tangent_vec_b;

    if (active.normals) {
      const SurfaceT<Scalar> normals_bp = space.normals(base_point);
      const SurfaceT<Scalar> dna = space.normals(point_a) - normals_bp;
      const SurfaceT<Scalar> dnb = space.normals(point_b) - normals_bp;
      inner_prod_c1 = Scalar(w.c1)*inner_product_c1(dna, dnb, areas_bp);
    }

    if (active.inverse_metric) {
      std::vector<MetricT<Scalar>> ginv_bp(g_bp.size());
      for (size_t f = 0; f < g_bp.size(); f++)
        ginv_bp[f] = inverse2(g_bp[f]);
      const std::vector<OneFormT<Scalar>> one_forms_a = space.surface_one_forms(point_a);
      const std::vector<OneFormT<Scalar>> one_forms_b = space.surface_one_forms(point_b);

      if (w.d1 > 0)
        inner_prod_d1 = Scalar(w.d1)*inner_product_d1(one_forms_a, one_forms_b, one_forms_bp, ginv_bp, areas_bp);

      if (active.metric_perturbation) {
        const std::vector<MetricT<Scalar>> g_a = DiscreteSurfaces::surface_metric_matrices_from_one_forms(one_forms_a);
        const std::vector<MetricT<Scalar>> g_b = DiscreteSurfaces::surface_metric_matrices_from_one_forms(one_forms_b);
        std::vector<MetricT<Scalar>> ginvdga(g_bp.size()), ginvdgb(g_bp.size());
        for (size_t f = 0; f < g_bp.size(); f++) {
          const MetricT<Scalar> dga = g_a[f] - g_bp[f];
          const MetricT<Scalar> dgb = g_b[f] - g_bp[f];
          ginvdga[f] = ginv_bp[f]*dga;
          ginvdgb[f] = ginv_bp[f]*dgb;
        }
        if (w.a1 > 0)
          inner_prod_a1 = Scalar(w.a1)*inner_product_a1(ginvdga, ginvdgb, areas_bp);
        if (w.b1 > 0)
          inner_prod_b1 = Scalar(w.b1)*inner_product_b1(ginvdga, ginvdgb, areas_bp);
      }
    }
  }

  const Scalar total = inner_prod_a0 + inner_prod_a1 + inner_prod_a2 + inner_prod_b1 + inner_prod_c1 + inner_prod_d1;
  return total;
}

template <typename Scalar>
Scalar ElasticMetric::inner_product(const SurfaceT<Scalar>& tangent_vec_a, const SurfaceT<Scalar>& tangent_vec_b, const SurfaceT<Scalar>& base_point) const
{
  if (base_point.rows() != surfaces->n_vertices() || !same_shape(tangent_vec_a, base_point) || !same_shape(tangent_vec_b, base_point))
    throw std::invalid_argument("Tangent vectors and base point must have shape [n_vertices, 3]");
  return elastic_inner_product(*surfaces, w, active, tangent_vec_a, tangent_vec_b, base_point);
}

// a2 term of the center vertex (local index 0) of a vertex star
template <typename Scalar>
static Scalar star_inner_product_a2(const DiscreteSurfaces& star, const SurfaceT<Scalar>& a, const SurfaceT<Scalar>& b, const SurfaceT<Scalar>& base_point)
{
  const VectorT<Scalar> areas = star.vertex_areas(base_point);
  const LaplacianOperator<Scalar> L = star.laplacian(base_point);
  const SurfaceT<Scalar> La = L(a);
  const SurfaceT<Scalar> Lb = L(b);
  const Scalar res = dot3(La.row(0), Lb.row(0))/areas(0);
  return res;
}

template <typename Scalar>
Scalar ElasticMetric::patch_inner_product(const InnerProductPatch& patch, const SurfaceT<Scalar>& tangent_vec_a, const SurfaceT<Scalar>& tangent_vec_b, const SurfaceT<Scalar>& base_point) const
{
  if (patch.star)
    return Scalar(w.a2)*star_inner_product_a2(*patch.space, tangent_vec_a, tangent_vec_b, base_point);
  return elastic_inner_product(*patch.space, face_w, face_active, tangent_vec_a, tangent_vec_b, base_point);
}

Eigen::VectorXd ElasticMetric::inner_product(const SurfaceBatch& tangent_vecs_a, const SurfaceBatch& tangent_vecs_b, const Surface& base_point) const
{
  const size_t n = std::max(tangent_vecs_a.size(), tangent_vecs_b.size());
  if ((tangent_vecs_a.size() != n && tangent_vecs_a.size() != 1) || (tangent_vecs_b.size() != n && tangent_vecs_b.size() != 1))
    throw std::invalid_argument("Batch sizes of the tangent vectors do not match");

  Eigen::VectorXd res(n);
  for (size_t i = 0; i < n; i++)
    res(i) = inner_product(tangent_vecs_a[tangent_vecs_a.size() == 1 ? 0 : i],
                           tangent_vecs_b[tangent_vecs_b.size() == 1 ? 0 : i],
                           base_point);
  return res;
}

double ElasticMetric::squared_norm(const Surface& tangent_vec, const Surface& base_point) const
{
  return inner_product(tangent_vec, tangent_vec, base_point);
}

double ElasticMetric::norm(const Surface& tangent_vec, const Surface& base_point) const
{
  return std::sqrt(squared_norm(tangent_vec, base_point));
}

template <typename Scalar>
Scalar ElasticMetric::path_energy(const std::vector<SurfaceT<Scalar>>& path) const
{
  const int n = path.size();
  if (n < 2)
    throw std::invalid_argument("Path energy needs at least two frames");

  const Scalar scale = Scalar(double(n - 1));
  Scalar energy = Scalar(0.0);
  for (int k = 0; k + 1 < n; k++) {
    const SurfaceT<Scalar> velocity = (path[k+1] - path[k])*scale;
    energy += inner_product(velocity, velocity, path[k]);
  }
  const Scalar res = Scalar(0.5)*energy/scale;
  return res;
}

Surface ElasticMetric::exp(const Surface& tangent_vec, const Surface& base_point) const
{
  return exp_sol.exp(*this, tangent_vec, base_point);
}

SurfaceBatch ElasticMetric::exp(const SurfaceBatch& tangent_vecs, const SurfaceBatch& base_points) const
{
  return exp_sol.exp(*this, tangent_vecs, base_points);
}

UniformlySampledDiscretePath ElasticMetric::geodesic_ivp(const Surface& tangent_vec, const Surface& base_point) const
{
  return exp_sol.geodesic_ivp(*this, tangent_vec, base_point);
}

Surface ElasticMetric::log(const Surface& point, const Surface& base_point) const
{
  return log_sol.log(*this, point, base_point);
}

UniformlySampledDiscretePath ElasticMetric::geodesic_bvp(const Surface& point, const Surface& base_point) const
{
  return log_sol.geodesic_bvp(*this, point, base_point);
}

double ElasticMetric::squared_dist(const Surface& point_a, const Surface& point_b) const
{
  return squared_norm(log(point_a, point_b), point_b);
}

double ElasticMetric::dist(const Surface& point_a, const Surface& point_b) const
{
  return std::sqrt(squared_dist(point_a, point_b));
}


template double ElasticMetric::inner_product<double>(const SurfaceT<double>& tangent_vec_a, const SurfaceT<double>& tangent_vec_b, const SurfaceT<double>& base_point) const;
template ADScalar ElasticMetric::inner_product<ADScalar>(const SurfaceT<ADScalar>& tangent_vec_a, const SurfaceT<ADScalar>& tangent_vec_b, const SurfaceT<ADScalar>& base_point) const;
template ADScalar2 ElasticMetric::inner_product<ADScalar2>(const SurfaceT<ADScalar2>& tangent_vec_a, const SurfaceT<ADScalar2>& tangent_vec_b, const SurfaceT<ADScalar2>& base_point) const;

template double ElasticMetric::patch_inner_product<double>(const InnerProductPatch& patch, const SurfaceT<double>& tangent_vec_a, const SurfaceT<double>& tangent_vec_b, const SurfaceT<double>& base_point) const;
template ADScalar ElasticMetric::patch_inner_product<ADScalar>(const InnerProductPatch& patch, const SurfaceT<ADScalar>& tangent_vec_a, const SurfaceT<ADScalar>& tangent_vec_b, const SurfaceT<ADScalar>& base_point) const;
template ADScalar2 ElasticMetric::patch_inner_product<ADScalar2>(const InnerProductPatch& patch, const SurfaceT<ADScalar2>& tangent_vec_a, const SurfaceT<ADScalar2>& tangent_vec_b, const SurfaceT<ADScalar2>& base_point) const;

template double ElasticMetric::path_energy<double>(const std::vector<SurfaceT<double>>& path) const;

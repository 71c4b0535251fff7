#include "discrete_surfaces.hpp"

#include <cmath>
#include <stdexcept>


template <typename Scalar>
inline Scalar edge_length(const SurfaceT<Scalar>& P, int a, int b){
  using std::sqrt;
  const Eigen::Matrix<Scalar, 1, 3> e = P.row(a) - P.row(b);
  const Scalar sq = dot3(e, e);
  return sqrt(sq);
}

// Input : lengths of the edges opposite to corners 0, 1 and 2
// Output : area, with the radicand floored at 1e-6
template <typename Scalar>
inline Scalar heron_area(const Scalar& l12, const Scalar& l02, const Scalar& l01){
  using std::sqrt;
  const Scalar s = Scalar(0.5)*(l12 + l02 + l01);
  const Scalar radicand = s*(s - l12)*(s - l02)*(s - l01);
  return sqrt(clip_min(radicand, 1e-6));
}


template <typename Scalar>
LaplacianOperator<Scalar>::LaplacianOperator(const Faces& F, int n_vertices, const SurfaceT<Scalar>& base_point)
  : nv(n_vertices), E(3*F.rows(), 2), cot(3*F.rows())
{
  for (int f = 0; f < F.rows(); f++) {
    const Scalar l12 = edge_length(base_point, F(f,1), F(f,2));
    const Scalar l02 = edge_length(base_point, F(f,0), F(f,2));
    const Scalar l01 = edge_length(base_point, F(f,0), F(f,1));
    const Scalar area = heron_area(l12, l02, l01);

    const Scalar sq12 = l12*l12;
    const Scalar sq02 = l02*l02;
    const Scalar sq01 = l01*l01;
    cot(3*f+0) = (sq02 + sq01 - sq12)/area/Scalar(2.0);
    cot(3*f+1) = (sq12 + sq01 - sq02)/area/Scalar(2.0);
    cot(3*f+2) = (sq12 + sq02 - sq01)/area/Scalar(2.0);

    for (int k = 0; k < 3; k++) {
      E(3*f+k, 0) = F(f, (k+1)%3);
      E(3*f+k, 1) = F(f, (k+2)%3);
    }
  }
}

template <typename Scalar>
SurfaceT<Scalar> LaplacianOperator<Scalar>::apply(const SurfaceT<Scalar>& tangent_vec) const
{
  SurfaceT<Scalar> out(nv, 3);
  for (int i = 0; i < nv; i++)
    for (int d = 0; d < 3; d++)
      out(i,d) = Scalar(0.0);

  for (int e = 0; e < E.rows(); e++) {
    const int src = E(e,0);
    const int dst = E(e,1);
    for (int d = 0; d < 3; d++)
      out(dst,d) += cot(e)*(tangent_vec(src,d) - tangent_vec(dst,d));
  }
  return out;
}

Eigen::SparseMatrix<double> laplacian_matrix(const LaplacianOperator<double>& L)
{
  const Eigen::Matrix<int, Eigen::Dynamic, 2>& E = L.edges();
  const Eigen::VectorXd& cot = L.weights();

  std::vector<Eigen::Triplet<double>> triplets;
  triplets.reserve(2*E.rows());
  for (int e = 0; e < E.rows(); e++) {
    triplets.emplace_back(E(e,1), E(e,0), cot(e));
    triplets.emplace_back(E(e,1), E(e,1), -cot(e));
  }
  Eigen::SparseMatrix<double> M(L.n_vertices(), L.n_vertices());
  M.setFromTriplets(triplets.begin(), triplets.end());
  return M;
}


DiscreteSurfaces::DiscreteSurfaces(const Faces& F) : F(F)
{
  if (F.rows() == 0)
    throw std::invalid_argument("Triangulation has no faces");
  nv = F.maxCoeff() + 1;
}

bool DiscreteSurfaces::belongs(const Eigen::MatrixXd& point) const
{
  return point.rows() == nv && point.cols() == 3;
}

Eigen::Array<bool, Eigen::Dynamic, 1> DiscreteSurfaces::belongs(const std::vector<Eigen::MatrixXd>& points) const
{
  Eigen::Array<bool, Eigen::Dynamic, 1> res(points.size());
  for (size_t i = 0; i < points.size(); i++)
    res(i) = belongs(points[i]);
  return res;
}

bool DiscreteSurfaces::is_tangent(const Eigen::MatrixXd& vector, const Eigen::MatrixXd& base_point) const
{
  return belongs(vector);
}

Eigen::Array<bool, Eigen::Dynamic, 1> DiscreteSurfaces::is_tangent(const Eigen::MatrixXd& vector, const std::vector<Eigen::MatrixXd>& base_points) const
{
  return Eigen::Array<bool, Eigen::Dynamic, 1>::Constant(base_points.size(), belongs(vector));
}

Surface DiscreteSurfaces::to_tangent(const Surface& vector, const Surface& base_point) const
{
  return vector;
}

Surface DiscreteSurfaces::projection(const Surface& point) const
{
  return point;
}

Surface DiscreteSurfaces::random_point() const
{
  return Surface::Random(nv, 3);
}

SurfaceBatch DiscreteSurfaces::random_point(int n_samples) const
{
  SurfaceBatch points(n_samples);
  for (int i = 0; i < n_samples; i++)
    points[i] = random_point();
  return points;
}

template <typename Scalar>
VectorT<Scalar> DiscreteSurfaces::triangle_areas(const SurfaceT<Scalar>& point) const
{
  VectorT<Scalar> A(F.rows());
  for (int f = 0; f < F.rows(); f++) {
    const Scalar l12 = edge_length(point, F(f,1), F(f,2));
    const Scalar l02 = edge_length(point, F(f,0), F(f,2));
    const Scalar l01 = edge_length(point, F(f,0), F(f,1));
    A(f) = heron_area(l12, l02, l01);
  }
  return A;
}

template <typename Scalar>
VectorT<Scalar> DiscreteSurfaces::vertex_areas(const SurfaceT<Scalar>& point) const
{
  const VectorT<Scalar> A = triangle_areas(point);
  VectorT<Scalar> incident(nv);
  for (int i = 0; i < nv; i++)
    incident(i) = Scalar(0.0);

  for (int f = 0; f < F.rows(); f++)
    for (int k = 0; k < 3; k++)
      incident(F(f,k)) += A(f);

  for (int i = 0; i < nv; i++)
    incident(i) = Scalar(2.0)*incident(i)/Scalar(3.0);
  return incident;
}

template <typename Scalar>
SurfaceT<Scalar> DiscreteSurfaces::normals(const SurfaceT<Scalar>& point) const
{
  SurfaceT<Scalar> N(F.rows(), 3);
  for (int f = 0; f < F.rows(); f++) {
    const Eigen::Matrix<Scalar, 1, 3> e1 = point.row(F(f,1)) - point.row(F(f,0));
    const Eigen::Matrix<Scalar, 1, 3> e2 = point.row(F(f,2)) - point.row(F(f,0));
    N(f,0) = Scalar(0.5)*(e1(1)*e2(2) - e1(2)*e2(1));
    N(f,1) = Scalar(0.5)*(e1(2)*e2(0) - e1(0)*e2(2));
    N(f,2) = Scalar(0.5)*(e1(0)*e2(1) - e1(1)*e2(0));
  }
  return N;
}

template <typename Scalar>
std::vector<OneFormT<Scalar>> DiscreteSurfaces::surface_one_forms(const SurfaceT<Scalar>& point) const
{
  std::vector<OneFormT<Scalar>> one_forms(F.rows());
  for (int f = 0; f < F.rows(); f++) {
    one_forms[f].row(0) = point.row(F(f,1)) - point.row(F(f,0));
    one_forms[f].row(1) = point.row(F(f,2)) - point.row(F(f,0));
  }
  return one_forms;
}

template <typename Scalar>
std::vector<MetricT<Scalar>> DiscreteSurfaces::surface_metric_matrices_from_one_forms(const std::vector<OneFormT<Scalar>>& one_forms)
{
  std::vector<MetricT<Scalar>> g(one_forms.size());
  for (size_t f = 0; f < one_forms.size(); f++)
    for (int i = 0; i < 2; i++)
      for (int j = 0; j < 2; j++)
        g[f](i,j) = dot3(one_forms[f].row(i), one_forms[f].row(j));
  return g;
}

template <typename Scalar>
std::vector<MetricT<Scalar>> DiscreteSurfaces::surface_metric_matrices(const SurfaceT<Scalar>& point) const
{
  return surface_metric_matrices_from_one_forms(surface_one_forms(point));
}

template <typename Scalar>
VectorT<Scalar> DiscreteSurfaces::face_areas(const SurfaceT<Scalar>& point) const
{
  using std::sqrt;
  const std::vector<MetricT<Scalar>> g = surface_metric_matrices(point);
  VectorT<Scalar> A(F.rows());
  for (int f = 0; f < F.rows(); f++)
    A(f) = sqrt(clip_min(det2(g[f]), 0.0));
  return A;
}


template class LaplacianOperator<double>;
template class LaplacianOperator<ADScalar>;
template class LaplacianOperator<ADScalar2>;

template VectorT<double> DiscreteSurfaces::triangle_areas<double>(const SurfaceT<double>& point) const;
template VectorT<ADScalar> DiscreteSurfaces::triangle_areas<ADScalar>(const SurfaceT<ADScalar>& point) const;
template VectorT<ADScalar2> DiscreteSurfaces::triangle_areas<ADScalar2>(const SurfaceT<ADScalar2>& point) const;

template VectorT<double> DiscreteSurfaces::vertex_areas<double>(const SurfaceT<double>& point) const;
template VectorT<ADScalar> DiscreteSurfaces::vertex_areas<ADScalar>(const SurfaceT<ADScalar>& point) const;
template VectorT<ADScalar2> DiscreteSurfaces::vertex_areas<ADScalar2>(const SurfaceT<ADScalar2>& point) const;

template SurfaceT<double> DiscreteSurfaces::normals<double>(const SurfaceT<double>& point) const;
template SurfaceT<ADScalar> DiscreteSurfaces::normals<ADScalar>(const SurfaceT<ADScalar>& point) const;
template SurfaceT<ADScalar2> DiscreteSurfaces::normals<ADScalar2>(const SurfaceT<ADScalar2>& point) const;

template std::vector<OneFormT<double>> DiscreteSurfaces::surface_one_forms<double>(const SurfaceT<double>& point) const;
template std::vector<OneFormT<ADScalar>> DiscreteSurfaces::surface_one_forms<ADScalar>(const SurfaceT<ADScalar>& point) const;
template std::vector<OneFormT<ADScalar2>> DiscreteSurfaces::surface_one_forms<ADScalar2>(const SurfaceT<ADScalar2>& point) const;

template std::vector<MetricT<double>> DiscreteSurfaces::surface_metric_matrices_from_one_forms<double>(const std::vector<OneFormT<double>>& one_forms);
template std::vector<MetricT<ADScalar>> DiscreteSurfaces::surface_metric_matrices_from_one_forms<ADScalar>(const std::vector<OneFormT<ADScalar>>& one_forms);
template std::vector<MetricT<ADScalar2>> DiscreteSurfaces::surface_metric_matrices_from_one_forms<ADScalar2>(const std::vector<OneFormT<ADScalar2>>& one_forms);

template std::vector<MetricT<double>> DiscreteSurfaces::surface_metric_matrices<double>(const SurfaceT<double>& point) const;
template std::vector<MetricT<ADScalar>> DiscreteSurfaces::surface_metric_matrices<ADScalar>(const SurfaceT<ADScalar>& point) const;
template std::vector<MetricT<ADScalar2>> DiscreteSurfaces::surface_metric_matrices<ADScalar2>(const SurfaceT<ADScalar2>& point) const;

template VectorT<double> DiscreteSurfaces::face_areas<double>(const SurfaceT<double>& point) const;
template VectorT<ADScalar> DiscreteSurfaces::face_areas<ADScalar>(const SurfaceT<ADScalar>& point) const;
template VectorT<ADScalar2> DiscreteSurfaces::face_areas<ADScalar2>(const SurfaceT<ADScalar2>& point) const;

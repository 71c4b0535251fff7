#include <gtest/gtest.h>
#include <algorithm>
#include <cmath>
#include <memory>
#include <stdexcept>
#include <vector>

#include <Eigen/Geometry>
#include "elastic_metric.hpp"
#include "test_meshes.hpp"

static std::shared_ptr<const DiscreteSurfaces> MakeSpace(const TestMesh& mesh)
{
  return std::make_shared<const DiscreteSurfaces>(mesh.F);
}

static ElasticMetricWeights Weights(double a0, double a1, double b1, double c1, double d1, double a2)
{
  ElasticMetricWeights w;
  w.a0 = a0;
  w.a1 = a1;
  w.b1 = b1;
  w.c1 = c1;
  w.d1 = d1;
  w.a2 = a2;
  return w;
}

// =============================================================================
// Construction
// =============================================================================

TEST(ElasticMetric_Construction, NegativeWeightThrows)
{
  const TestMesh mesh = MakeTetrahedron();
  EXPECT_THROW(ElasticMetric(MakeSpace(mesh), 1.0, 1.0, -0.5, 1.0, 1.0, 1.0), std::invalid_argument);
  EXPECT_THROW(ElasticMetric(MakeSpace(mesh), Weights(1.0, 1.0, 1.0, 1.0, 1.0, NAN)), std::invalid_argument);
}

TEST(ElasticMetric_Construction, MissingSpaceThrows)
{
  EXPECT_THROW(ElasticMetric(nullptr), std::invalid_argument);
}

TEST(ElasticMetric_Construction, ActiveTermsFollowWeights)
{
  const TestMesh mesh = MakeTetrahedron();

  const ElasticMetric zeroth(MakeSpace(mesh), 1.0, 0.0, 0.0, 0.0, 0.0, 0.0);
  EXPECT_TRUE(zeroth.active_terms().vertex_areas);
  EXPECT_FALSE(zeroth.active_terms().one_forms);
  EXPECT_FALSE(zeroth.active_terms().normals);
  EXPECT_FALSE(zeroth.active_terms().inverse_metric);
  EXPECT_FALSE(zeroth.active_terms().metric_perturbation);

  const ElasticMetric bending(MakeSpace(mesh), 0.0, 0.0, 0.0, 1.0, 0.0, 0.0);
  EXPECT_FALSE(bending.active_terms().vertex_areas);
  EXPECT_TRUE(bending.active_terms().one_forms);
  EXPECT_TRUE(bending.active_terms().normals);
  EXPECT_FALSE(bending.active_terms().inverse_metric);

  const ElasticMetric normal_part(MakeSpace(mesh), 0.0, 0.0, 0.0, 0.0, 2.0, 0.0);
  EXPECT_TRUE(normal_part.active_terms().one_forms);
  EXPECT_TRUE(normal_part.active_terms().inverse_metric);
  EXPECT_FALSE(normal_part.active_terms().metric_perturbation);

  const ElasticMetric full(MakeSpace(mesh));
  EXPECT_TRUE(full.active_terms().vertex_areas);
  EXPECT_TRUE(full.active_terms().metric_perturbation);
  EXPECT_DOUBLE_EQ(full.weights().a2, 1.0);
}

// =============================================================================
// Inner product
// =============================================================================

TEST(ElasticMetric_InnerProduct, ZerothOrderTermOnTetrahedron)
{
  const TestMesh mesh = MakeTetrahedron();
  const ElasticMetric metric(MakeSpace(mesh), 1.0, 0.0, 0.0, 0.0, 0.0, 0.0);
  const Surface U = MakeField(4, 1, 0.7);

  // vertex areas from cross products
  Eigen::VectorXd A = Eigen::VectorXd::Zero(4);
  for (int f = 0; f < 4; f++) {
    const Eigen::Vector3d e1 = (mesh.V.row(mesh.F(f,1)) - mesh.V.row(mesh.F(f,0))).transpose();
    const Eigen::Vector3d e2 = (mesh.V.row(mesh.F(f,2)) - mesh.V.row(mesh.F(f,0))).transpose();
    const double area = 0.5*e1.cross(e2).norm();
    for (int k = 0; k < 3; k++)
      A(mesh.F(f,k)) += 2.0*area/3.0;
  }
  double expected = 0;
  for (int v = 0; v < 4; v++)
    expected += A(v)*U.row(v).squaredNorm();

  EXPECT_NEAR(metric.inner_product(U, U, mesh.V), expected, 1e-10);
  EXPECT_NEAR(metric.squared_norm(U, mesh.V), expected, 1e-10);
  EXPECT_NEAR(metric.norm(U, mesh.V), std::sqrt(expected), 1e-10);
}

TEST(ElasticMetric_InnerProduct, Symmetric)
{
  const TestMesh mesh = MakeOctahedron();
  const ElasticMetric metric(MakeSpace(mesh), 1.0, 0.8, 0.5, 0.3, 0.7, 0.2);
  const Surface P = mesh.V + MakeField(6, 1, 0.1);
  const Surface U = MakeField(6, 2, 0.3);
  const Surface W = MakeField(6, 3, 0.3);

  const double uw = metric.inner_product(U, W, P);
  const double wu = metric.inner_product(W, U, P);
  EXPECT_NEAR(uw, wu, 1e-12*std::max(1.0, std::abs(uw)));
}

TEST(ElasticMetric_InnerProduct, BilinearTerms)
{
  const TestMesh mesh = MakeOctahedron();
  const ElasticMetric metric(MakeSpace(mesh), 0.6, 0.0, 0.0, 0.0, 1.3, 0.4);
  const Surface P = mesh.V + MakeField(6, 4, 0.1);
  const Surface U1 = MakeField(6, 5, 0.3);
  const Surface U2 = MakeField(6, 6, 0.3);
  const Surface W = MakeField(6, 7, 0.3);
  const double c = -1.7;

  const double base = metric.inner_product(U1, W, P);
  EXPECT_NEAR(metric.inner_product(Surface(c*U1), W, P), c*base, 1e-10);
  EXPECT_NEAR(metric.inner_product(W, Surface(c*U1), P), c*base, 1e-10);
  EXPECT_NEAR(metric.inner_product(Surface(U1 + U2), W, P),
              base + metric.inner_product(U2, W, P), 1e-10);
}

TEST(ElasticMetric_InnerProduct, NonNegative)
{
  const TestMesh mesh = MakeOctahedron();
  const Surface P = mesh.V + MakeField(6, 8, 0.1);
  const ElasticMetric zeroth(MakeSpace(mesh), 1.0, 0.0, 0.0, 0.0, 0.0, 0.0);
  const ElasticMetric full(MakeSpace(mesh));

  for (int seed = 0; seed < 10; seed++) {
    const Surface U = MakeField(6, 10 + seed, 0.5);
    EXPECT_GE(zeroth.squared_norm(U, P), 0.0);
    EXPECT_GE(full.squared_norm(U, P), 0.0);
  }
  EXPECT_NEAR(zeroth.squared_norm(Surface::Zero(6, 3), P), 0.0, 1e-15);
}

TEST(ElasticMetric_InnerProduct, ZeroFieldIsOrthogonalToEverything)
{
  const TestMesh mesh = MakeTetrahedron();
  const ElasticMetric metric(MakeSpace(mesh));
  const Surface P = mesh.V + MakeField(4, 1, 0.1);

  EXPECT_NEAR(metric.inner_product(Surface(Surface::Zero(4, 3)), MakeField(4, 2, 0.5), P), 0.0, 1e-12);
}

TEST(ElasticMetric_InnerProduct, TermsAddUp)
{
  const TestMesh mesh = MakeOctahedron();
  const std::shared_ptr<const DiscreteSurfaces> space = MakeSpace(mesh);
  const Surface P = mesh.V + MakeField(6, 2, 0.1);
  const Surface U = MakeField(6, 3, 0.2);
  const Surface W = MakeField(6, 4, 0.2);
  const double w[6] = {0.5, 1.5, 0.25, 2.0, 0.75, 1.25};

  const ElasticMetric full(space, w[0], w[1], w[2], w[3], w[4], w[5]);
  double sum = 0;
  for (int i = 0; i < 6; i++) {
    double single[6] = {0, 0, 0, 0, 0, 0};
    single[i] = w[i];
    const ElasticMetric term(space, single[0], single[1], single[2], single[3], single[4], single[5]);
    sum += term.inner_product(U, W, P);
  }
  EXPECT_NEAR(full.inner_product(U, W, P), sum, 1e-10);
}

TEST(ElasticMetric_InnerProduct, WithoutZerothOrderTermTranslationsAreInvisible)
{
  const TestMesh mesh = MakeOctahedron();
  const ElasticMetric metric(MakeSpace(mesh), 0.0, 1.0, 1.0, 1.0, 1.0, 1.0);
  const Surface P = mesh.V + MakeField(6, 5, 0.1);
  const Surface U = MakeField(6, 6, 0.2);
  const Surface W = MakeField(6, 7, 0.2);

  Surface shifted = U;
  shifted.rowwise() += Eigen::RowVector3d(0.4, -0.3, 0.9);

  EXPECT_NEAR(metric.inner_product(shifted, W, P), metric.inner_product(U, W, P), 1e-10);
  EXPECT_NEAR(metric.squared_norm(Surface(shifted - U), P), 0.0, 1e-10);
}

TEST(ElasticMetric_InnerProduct, SecondOrderTermIgnoredWhenWeightIsZero)
{
  const TestMesh mesh = MakeOctahedron();
  const std::shared_ptr<const DiscreteSurfaces> space = MakeSpace(mesh);
  const ElasticMetric without(space, 1.0, 1.0, 1.0, 1.0, 1.0, 0.0);
  const ElasticMetric with(space, 1.0, 1.0, 1.0, 1.0, 1.0, 1.0);
  const ElasticMetric only(space, 0.0, 0.0, 0.0, 0.0, 0.0, 1.0);
  const Surface P = mesh.V + MakeField(6, 8, 0.1);
  const Surface U = MakeField(6, 9, 0.2);
  const Surface W = MakeField(6, 10, 0.2);

  EXPECT_NEAR(with.inner_product(U, W, P) - without.inner_product(U, W, P), only.inner_product(U, W, P), 1e-10);
}

TEST(ElasticMetric_InnerProduct, WrongShapeThrows)
{
  const TestMesh mesh = MakeTetrahedron();
  const ElasticMetric metric(MakeSpace(mesh));

  EXPECT_THROW(metric.inner_product(MakeField(3, 1, 1.0), MakeField(4, 1, 1.0), mesh.V), std::invalid_argument);
  EXPECT_THROW(metric.inner_product(MakeField(5, 1, 1.0), MakeField(5, 1, 1.0), MakeField(5, 2, 1.0)), std::invalid_argument);
}

TEST(ElasticMetric_InnerProduct, BatchBroadcastsSingleVector)
{
  const TestMesh mesh = MakeTetrahedron();
  const ElasticMetric metric(MakeSpace(mesh));
  const SurfaceBatch a = {MakeField(4, 1, 0.3), MakeField(4, 2, 0.3), MakeField(4, 3, 0.3)};
  const SurfaceBatch b = {MakeField(4, 4, 0.3)};

  const Eigen::VectorXd res = metric.inner_product(a, b, mesh.V);
  ASSERT_EQ(res.size(), 3);
  for (int i = 0; i < 3; i++)
    EXPECT_DOUBLE_EQ(res(i), metric.inner_product(a[i], b[0], mesh.V));

  const SurfaceBatch two = {MakeField(4, 5, 0.3), MakeField(4, 6, 0.3)};
  EXPECT_THROW(metric.inner_product(a, two, mesh.V), std::invalid_argument);
}

// =============================================================================
// Patches
// =============================================================================

static double SumOverPatches(const ElasticMetric& metric, const Surface& a, const Surface& b, const Surface& p)
{
  double sum = 0.0;
  for (const InnerProductPatch& patch : metric.patches())
    sum += metric.patch_inner_product(patch, Surface(local_rows(a, patch.vertices)),
                                      Surface(local_rows(b, patch.vertices)),
                                      Surface(local_rows(p, patch.vertices)));
  return sum;
}

TEST(ElasticMetric_Patches, OneFacePatchPerFaceAndOneStarPerVertex)
{
  const TestMesh mesh = MakeOctahedron();

  const ElasticMetric full(MakeSpace(mesh));
  EXPECT_EQ(full.patches().size(), 14u);
  EXPECT_FALSE(full.patches().front().star);
  EXPECT_EQ(full.patches().front().vertices.size(), 3u);

  // star of vertex 0: the vertex itself and its four neighbours
  const InnerProductPatch& star = full.patches()[8];
  EXPECT_TRUE(star.star);
  ASSERT_EQ(star.vertices.size(), 5u);
  EXPECT_EQ(star.vertices[0], 0);
  EXPECT_EQ(star.space->n_faces(), 4);

  const ElasticMetric laplacian_only(MakeSpace(mesh), 0.0, 0.0, 0.0, 0.0, 0.0, 1.0);
  EXPECT_EQ(laplacian_only.patches().size(), 6u);

  const ElasticMetric first_order(MakeSpace(mesh), 0.0, 1.0, 0.0, 0.0, 0.0, 0.0);
  EXPECT_EQ(first_order.patches().size(), 8u);

  const ElasticMetric none(MakeSpace(mesh), 0.0, 0.0, 0.0, 0.0, 0.0, 0.0);
  EXPECT_TRUE(none.patches().empty());
}

TEST(ElasticMetric_Patches, PatchesSumToTheInnerProduct)
{
  const TestMesh closed = MakeOctahedron();
  const TestMesh open = MakeGrid(4);
  const TestMesh meshes[2] = {closed, open};

  for (const TestMesh& mesh : meshes) {
    const int nv = mesh.V.rows();
    const Surface p = mesh.V + MakeField(nv, 1, 0.05);
    const Surface a = MakeField(nv, 2, 0.3);
    const Surface b = MakeField(nv, 3, 0.3);

    const ElasticMetric full(MakeSpace(mesh), 1.0, 0.5, 0.25, 1.0, 0.75, 2.0);
    const double expected = full.inner_product(a, b, p);
    EXPECT_NEAR(SumOverPatches(full, a, b, p), expected, 1e-12*std::max(1.0, std::abs(expected)));

    const ElasticMetric laplacian_only(MakeSpace(mesh), 0.0, 0.0, 0.0, 0.0, 0.0, 1.0);
    const double expected_a2 = laplacian_only.inner_product(a, b, p);
    EXPECT_NEAR(SumOverPatches(laplacian_only, a, b, p), expected_a2, 1e-12*std::max(1.0, std::abs(expected_a2)));
  }
}

// =============================================================================
// Path energy
// =============================================================================

TEST(ElasticMetric_PathEnergy, ConstantPathHasNoEnergy)
{
  const TestMesh mesh = MakeTetrahedron();
  const ElasticMetric metric(MakeSpace(mesh));
  const std::vector<Surface> path(5, mesh.V);

  EXPECT_NEAR(metric.path_energy(path), 0.0, 1e-14);
}

TEST(ElasticMetric_PathEnergy, TranslationUnderZerothOrderMetric)
{
  const TestMesh mesh = MakeTetrahedron();
  const std::shared_ptr<const DiscreteSurfaces> space = MakeSpace(mesh);
  const ElasticMetric metric(space, 1.0, 0.0, 0.0, 0.0, 0.0, 0.0);
  const Eigen::RowVector3d shift(0.2, -0.1, 0.3);

  const int n = 6;
  std::vector<Surface> path(n);
  for (int k = 0; k < n; k++) {
    path[k] = mesh.V;
    path[k].rowwise() += (double(k)/(n - 1))*shift;
  }

  // constant speed |shift|, vertex areas unchanged along the path
  const double expected = 0.5*space->vertex_areas(mesh.V).sum()*shift.squaredNorm();
  EXPECT_NEAR(metric.path_energy(path), expected, 1e-10);
}

TEST(ElasticMetric_PathEnergy, SingleFrameThrows)
{
  const TestMesh mesh = MakeTetrahedron();
  const ElasticMetric metric(MakeSpace(mesh));
  EXPECT_THROW(metric.path_energy(std::vector<Surface>(1, mesh.V)), std::invalid_argument);
}

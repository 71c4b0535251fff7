#include <nanobind/nanobind.h>
#include <nanobind/eigen/dense.h>
#include <nanobind/eigen/sparse.h>
#include <nanobind/stl/shared_ptr.h>
#include <nanobind/stl/vector.h>
#include <discrete_surfaces.hpp>

namespace nb = nanobind;

Eigen::SparseMatrix<double> wrap_laplacian(const DiscreteSurfaces& space, const Surface& base_point){
   return laplacian_matrix(space.laplacian(base_point));
}

Eigen::MatrixXd wrap_metric_matrices(const DiscreteSurfaces& space, const Surface& point){
   // one row (g00, g01, g10, g11) per face
   const std::vector<MetricT<double>> g = space.surface_metric_matrices(point);
   Eigen::MatrixXd res(g.size(), 4);
   for (size_t f = 0; f < g.size(); f++)
     res.row(f) << g[f](0,0), g[f](0,1), g[f](1,0), g[f](1,1);
   return res;
}

void init_surfaces(nb::module_ &m) {
  nb::class_<DiscreteSurfaces>(m, "DiscreteSurfaces")
    .def(nb::init<const Faces&>(), nb::arg("faces"))
    .def_prop_ro("faces", [](const DiscreteSurfaces& s) { return Faces(s.faces()); })
    .def_prop_ro("n_vertices", &DiscreteSurfaces::n_vertices)
    .def_prop_ro("n_faces", &DiscreteSurfaces::n_faces)
    .def_prop_ro("dim", &DiscreteSurfaces::dim)
    .def("belongs", [](const DiscreteSurfaces& s, const Eigen::MatrixXd& point) { return s.belongs(point); })
    .def("is_tangent", [](const DiscreteSurfaces& s, const Eigen::MatrixXd& vector, const Eigen::MatrixXd& base_point) {
        return s.is_tangent(vector, base_point); })
    .def("random_point", [](const DiscreteSurfaces& s) { return s.random_point(); })
    .def("random_points", [](const DiscreteSurfaces& s, int n_samples) { return s.random_point(n_samples); })
    .def("vertex_areas", [](const DiscreteSurfaces& s, const Surface& point) { return Eigen::VectorXd(s.vertex_areas(point)); })
    .def("face_areas", [](const DiscreteSurfaces& s, const Surface& point) { return Eigen::VectorXd(s.face_areas(point)); })
    .def("normals", [](const DiscreteSurfaces& s, const Surface& point) { return Surface(s.normals(point)); })
    .def("surface_metric_matrices", &wrap_metric_matrices)
    .def("laplacian", &wrap_laplacian);
}

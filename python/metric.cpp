#include <nanobind/nanobind.h>
#include <nanobind/eigen/dense.h>
#include <nanobind/stl/shared_ptr.h>
#include <nanobind/stl/vector.h>
#include <elastic_metric.hpp>

namespace nb = nanobind;

void init_metric(nb::module_ &m) {
  nb::class_<ElasticMetric>(m, "ElasticMetric")
    .def("__init__", [](ElasticMetric* self, std::shared_ptr<DiscreteSurfaces> space,
                        double a0, double a1, double b1, double c1, double d1, double a2) {
        new (self) ElasticMetric(space, a0, a1, b1, c1, d1, a2);
      },
      nb::arg("space"), nb::arg("a0") = 1.0, nb::arg("a1") = 1.0, nb::arg("b1") = 1.0,
      nb::arg("c1") = 1.0, nb::arg("d1") = 1.0, nb::arg("a2") = 1.0)
    .def("inner_product", [](const ElasticMetric& metric, const Surface& a, const Surface& b, const Surface& base_point) {
        return metric.inner_product(a, b, base_point); })
    .def("squared_norm", &ElasticMetric::squared_norm)
    .def("norm", &ElasticMetric::norm)
    .def("exp", [](const ElasticMetric& metric, const Surface& tangent_vec, const Surface& base_point) {
        return metric.exp(tangent_vec, base_point); })
    .def("geodesic_ivp", [](const ElasticMetric& metric, const Surface& tangent_vec, const Surface& base_point) {
        return metric.geodesic_ivp(tangent_vec, base_point).frames(); })
    .def("log", &ElasticMetric::log)
    .def("geodesic_bvp", [](const ElasticMetric& metric, const Surface& point, const Surface& base_point) {
        return metric.geodesic_bvp(point, base_point).frames(); })
    .def("squared_dist", &ElasticMetric::squared_dist)
    .def("dist", &ElasticMetric::dist);
}

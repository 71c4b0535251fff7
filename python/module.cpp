#include <nanobind/nanobind.h>
#include <nanobind/eigen/dense.h>
#include <nanobind/eigen/sparse.h>

namespace nb = nanobind;

void init_surfaces(nb::module_ &m);
void init_metric(nb::module_ &m);

NB_MODULE(pyelasticsurf, m) {
    init_surfaces(m);
    init_metric(m);
}

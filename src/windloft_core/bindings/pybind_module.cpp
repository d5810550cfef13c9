#include "windloft_core/case_runner.hpp"
#include "windloft_core/numerics/spline.hpp"
#include "windloft_core/version.hpp"

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <string>
#include <vector>

namespace py = pybind11;

PYBIND11_MODULE(windloft_core, m) {
  m.doc() = "pybind11 bindings for the windloft mesh generator";

  m.def("version", []() { return windloft::core::version(); }, "Return native core version string.");
  m.def(
    "openmp_enabled", []() { return windloft::core::openmp_enabled(); },
    "Return True when the core was compiled with OpenMP.");

  m.def(
    "sample_spline",
    [](const std::vector<double>& x, const std::vector<double>& y, const std::vector<double>& at,
       const int degree, const double smoothing) {
      windloft::core::SplineOptions options;
      options.degree = degree;
      options.smoothing = smoothing;
      return windloft::core::sample(windloft::core::fit_spline(x, y, options), at);
    },
    py::arg("x"), py::arg("y"), py::arg("at"), py::arg("degree") = 5,
    py::arg("smoothing") = 0.001, "Fit a distribution spline and sample it for verification.");

  m.def(
    "run_case",
    [](const std::string& case_path, const std::string& out_dir) {
      const windloft::core::RunSummary summary = windloft::core::run_case(case_path, out_dir);
      py::dict result;
      result["status"] = summary.status;
      result["case_type"] = summary.case_type;
      result["run_log"] = summary.run_log;
      result["part_count"] = summary.part_count;
      result["node_count"] = summary.node_count;
      result["triangle_count"] = summary.triangle_count;
      result["files"] = summary.files;
      return result;
    },
    py::arg("case_path"), py::arg("out_dir"), "Run a case file and write VTU outputs.");
}

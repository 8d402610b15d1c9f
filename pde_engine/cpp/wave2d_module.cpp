// wave2d_module.cpp
#include <algorithm>
#include <vector>

#include <pybind11/numpy.h>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "wave2d_solver.hpp"

namespace py = pybind11;

namespace {

// row-major (j*(N+1)+i) の場を shape (N+1, N+1) の numpy 配列にコピー
// a[j, i] なので imshow(origin="lower") でそのまま x-y 平面になる
py::array_t<double> to_array(const std::vector<double>& u, int points) {
    const std::vector<py::ssize_t> shape{points, points};
    py::array_t<double> a(shape);
    std::copy(u.begin(), u.end(), a.mutable_data());
    return a;
}

// {step: ndarray} の dict
py::dict to_dict(const SnapshotCollection& snapshots) {
    py::dict out;
    for (const auto& kv : snapshots) {
        out[py::int_(kv.first)] = to_array(kv.second, snapshots.points());
    }
    return out;
}

// ラッパ関数: 検証して Nt ステップ解き、{step: U} を返す
py::dict solve_wave_2d_neumann(int    N,
                               int    Nt,
                               double cfl,
                               double c,
                               int    mx,
                               int    my,
                               int    store_every)
{
    return to_dict(run_wave_2d_neumann(N, Nt, cfl, c, mx, my, store_every));
}

} // namespace

PYBIND11_MODULE(wave2d_cpp, m) {
    m.doc() = "2D wave equation solver with Neumann boundary (C++ + pybind11)";

    py::register_exception<Wave2DParameterError>(m, "Wave2DParameterError", PyExc_ValueError);

    py::class_<Wave2DParams>(m, "Wave2DParams")
        .def(py::init<>())
        .def_readwrite("N",           &Wave2DParams::N)
        .def_readwrite("Nt",          &Wave2DParams::Nt)
        .def_readwrite("cfl",         &Wave2DParams::cfl)
        .def_readwrite("c",           &Wave2DParams::c)
        .def_readwrite("mx",          &Wave2DParams::mx)
        .def_readwrite("my",          &Wave2DParams::my)
        .def_readwrite("store_every", &Wave2DParams::store_every);

    py::class_<Wave2DNeumannSolver>(m, "Wave2DNeumannSolver")
        .def(py::init<const Wave2DParams&, bool>(),
             py::arg("params"), py::arg("verbose") = false)
        .def("reset_initial", &Wave2DNeumannSolver::reset_initial)
        .def("step", &Wave2DNeumannSolver::step)
        .def("run", &Wave2DNeumannSolver::run, py::arg("steps"))
        .def("solve", [](Wave2DNeumannSolver& self) { return to_dict(self.solve()); })
        .def("current_error", &Wave2DNeumannSolver::current_error)
        .def("get_x", &Wave2DNeumannSolver::get_x,
             py::return_value_policy::reference_internal)
        .def("get_y", &Wave2DNeumannSolver::get_y,
             py::return_value_policy::reference_internal)
        .def("get_u", [](const Wave2DNeumannSolver& self) {
                 return to_array(self.get_u(), self.get_N() + 1);
             })
        .def_property_readonly("params", &Wave2DNeumannSolver::get_params)
        .def_property_readonly("dt", &Wave2DNeumannSolver::get_dt)
        .def_property_readonly("h", &Wave2DNeumannSolver::get_h)
        .def_property_readonly("time", &Wave2DNeumannSolver::time)
        .def_property_readonly("steps_taken", &Wave2DNeumannSolver::steps_taken);

    m.def("solve_wave_2d_neumann",
          &solve_wave_2d_neumann,
          py::arg("N")           = 60,
          py::arg("Nt")          = 120,
          py::arg("cfl")         = 0.5,
          py::arg("c")           = 1.0,
          py::arg("mx")          = 2,
          py::arg("my")          = 3,
          py::arg("store_every") = 2,
          "Solve the 2D Neumann wave equation and return {step: U} with U[j, i].");

    m.def("convergence_rates",
          [](int m_levels, double cfl, int Nt, int mx, int my, double c) {
              const ConvergenceResult r = convergence_rates(m_levels, cfl, Nt, mx, my, c);
              return py::make_tuple(r.rates, r.errors, r.h);
          },
          py::arg("m")   = 4,
          py::arg("cfl") = 0.1,
          py::arg("Nt")  = 10,
          py::arg("mx")  = 3,
          py::arg("my")  = 3,
          py::arg("c")   = 1.0,
          "Return (rates, l2 errors, h) over m resolutions starting at N = 8.");
}

#include <pybind11/pybind11.h>
#include <pybind11/numpy.h>
#include <pybind11/stl.h>
#include "../annuity/engine.h"
#include "../io/report.hpp"

namespace py = pybind11;
using namespace Annuity;

PYBIND11_MODULE(annuity_core, m) {
    m.doc() = "Annuity draw-down simulator and parameter solver";

    py::enum_<SolveFor>(m, "SolveFor")
        .value("Withdrawal", SolveFor::Withdrawal)
        .value("Term", SolveFor::Term)
        .value("Principal", SolveFor::Principal)
        .value("Rate", SolveFor::Rate);

    py::enum_<SolveStatus>(m, "SolveStatus")
        .value("Ok", SolveStatus::Ok)
        .value("MissingInput", SolveStatus::MissingInput)
        .value("InvalidInput", SolveStatus::InvalidInput)
        .value("SearchFailed", SolveStatus::SearchFailed)
        .value("CalculationTooLong", SolveStatus::CalculationTooLong);

    py::class_<SimulationInput>(m, "SimulationInput")
        .def(py::init<>())
        .def_readwrite("principal", &SimulationInput::principal)
        .def_readwrite("term_years", &SimulationInput::term_years)
        .def_readwrite("annual_rate_pct", &SimulationInput::annual_rate_pct)
        .def_readwrite("compounding_per_year", &SimulationInput::compounding_per_year)
        .def_readwrite("monthly_withdrawal", &SimulationInput::monthly_withdrawal)
        .def_readwrite("annual_increase_pct", &SimulationInput::annual_increase_pct);

    py::class_<Summary>(m, "Summary")
        .def_readonly("total_interest", &Summary::total_interest)
        .def_readonly("total_withdrawn", &Summary::total_withdrawn)
        .def_readonly("initial_annual_income", &Summary::initial_annual_income)
        .def_readonly("draw_down_pct", &Summary::draw_down_pct)
        .def_readonly("solved_value", &Summary::solved_value);

    py::class_<SolveResult>(m, "SolveResult")
        .def_readonly("status", &SolveResult::status)
        .def_readonly("kind", &SolveResult::kind)
        .def_readonly("summary", &SolveResult::summary)
        .def("ok", &SolveResult::ok)
        .def_property_readonly("message", [](const SolveResult& r) { return Report::error_message(r); })
        .def_property_readonly("term_years", [](const SolveResult& r) { return r.trace.actual_term_years; })
        // (periods, 4): start_balance, end_balance, interest, withdrawal
        .def_property_readonly("monthly", [](const SolveResult& r) {
            const auto& p = r.trace.periods;
            py::array_t<double> out({static_cast<py::ssize_t>(p.size()), static_cast<py::ssize_t>(4)});
            auto buf = out.mutable_unchecked<2>();
            for (size_t i = 0; i < p.size(); ++i) {
                buf(i, 0) = p[i].start_balance;
                buf(i, 1) = p[i].end_balance;
                buf(i, 2) = p[i].interest_payment;
                buf(i, 3) = p[i].withdrawal;
            }
            return out;
        })
        .def_property_readonly("annual", [](const SolveResult& r) {
            py::list rows;
            for (const AnnualRecord& a : r.annual) {
                py::dict row;
                row["start_balance"] = a.start_balance;
                row["end_balance"] = a.end_balance;
                row["interest"] = a.interest_payment;
                row["withdrawal"] = a.withdrawal;
                row["total_interest"] = a.total_interest;
                row["total_withdrawn"] = a.total_withdrawn;
                rows.append(row);
            }
            return rows;
        });

    py::class_<AnnuityEngine>(m, "AnnuityEngine")
        .def(py::init([](bool verbose) {
            AnnuityEngine::Options opts;
            opts.verbose = verbose;
            return AnnuityEngine(opts);
        }), py::arg("verbose") = false)
        .def("solve", &AnnuityEngine::solve, py::arg("input"), py::arg("kind"))
        .def("solve_raw", &AnnuityEngine::solve_raw, py::arg("raw"), py::arg("kind"));
}

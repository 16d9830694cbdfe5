// python/e0lib_module.cpp - Pybind11 module entrypoint exposing e0lib.

#include <cstddef>
#include <cstdint>
#include <string>

#include <pybind11/pybind11.h>

#include <pybind11/stl.h>

#include <e0/e0lib.hpp>

namespace py = pybind11;
using e0::core::operation_budget;
using e0::core::ordinal;

namespace {

template <typename Operation>
ordinal run_budgeted(std::uint64_t limit, Operation&& operation) {
    operation_budget budget(limit);
    return operation(budget);
}

ordinal parse_literal(const std::string& text) {
    return e0::io::calculate(text);
}

ordinal from_python_int(const py::int_& value) {
    const std::string digits = py::str(value);
    if (!digits.empty() && digits.front() == '-') {
        throw py::value_error("Ordinals cannot be negative");
    }
    return e0::core::cnf_ordinal(e0::core::natural::from_string(digits));
}

} // namespace

PYBIND11_MODULE(e0lib, module) {
    module.doc() = "Ordinal arithmetic below epsilon_0 with a real-valued embedding";

    py::register_exception<e0::core::budget_exceeded>(module, "BudgetExceeded", PyExc_RuntimeError);
    py::register_exception<e0::core::unsupported_operation>(module, "UnsupportedOperation",
                                                            PyExc_ValueError);
    py::register_exception<e0::core::regression_limit>(module, "RegressionLimit", PyExc_RuntimeError);
    py::register_exception<e0::io::parse_error>(module, "ParseError", PyExc_ValueError);

    module.attr("DEFAULT_BUDGET") = operation_budget::DEFAULT_LIMIT;
    module.attr("DEFAULT_COMPLEXITY") = e0::approx::DEFAULT_COMPLEXITY_LIMIT;

    py::class_<ordinal> py_ordinal(module, "Ordinal");
    py_ordinal.def(py::init<>())
        .def(py::init(&from_python_int), py::arg("value"))
        .def_static("parse", &parse_literal, py::arg("text"), "Evaluate a calculator expression")
        .def_static("omega", [] { return ordinal(e0::core::cnf_ordinal::omega()); })
        .def_static("epsilon", &ordinal::epsilon)
        .def_static("tower", &ordinal::tower, py::arg("height"))
        .def("__str__", [](const ordinal& value) { return e0::io::to_string(value); })
        .def("__repr__", [](const ordinal& value) {
            return "<e0lib.Ordinal " + e0::io::to_string(value) + ">";
        })
        .def("__bool__", [](const ordinal& value) { return !value.is_zero(); })
        .def("is_finite", &ordinal::is_finite)
        .def("is_epsilon", &ordinal::is_epsilon_naught)
        .def("is_tower", &ordinal::is_tower)
        .def(
            "add",
            [](const ordinal& lhs, const ordinal& rhs, std::uint64_t budget) {
                return run_budgeted(budget,
                                    [&](operation_budget& b) { return e0::core::add(lhs, rhs, b); });
            },
            py::arg("rhs"), py::arg("budget") = operation_budget::DEFAULT_LIMIT)
        .def(
            "multiply",
            [](const ordinal& lhs, const ordinal& rhs, std::uint64_t budget) {
                return run_budgeted(budget,
                                    [&](operation_budget& b) { return e0::core::multiply(lhs, rhs, b); });
            },
            py::arg("rhs"), py::arg("budget") = operation_budget::DEFAULT_LIMIT)
        .def(
            "power",
            [](const ordinal& lhs, const ordinal& rhs, std::uint64_t budget) {
                return run_budgeted(budget,
                                    [&](operation_budget& b) { return e0::core::power(lhs, rhs, b); });
            },
            py::arg("rhs"), py::arg("budget") = operation_budget::DEFAULT_LIMIT)
        .def(
            "tetrate",
            [](const ordinal& lhs, const ordinal& rhs, std::uint64_t budget) {
                return run_budgeted(budget,
                                    [&](operation_budget& b) { return e0::core::tetrate(lhs, rhs, b); });
            },
            py::arg("rhs"), py::arg("budget") = operation_budget::DEFAULT_LIMIT)
        .def("__add__", [](const ordinal& lhs, const ordinal& rhs) {
            operation_budget budget;
            return e0::core::add(lhs, rhs, budget);
        })
        .def("__mul__", [](const ordinal& lhs, const ordinal& rhs) {
            operation_budget budget;
            return e0::core::multiply(lhs, rhs, budget);
        })
        .def("__pow__", [](const ordinal& lhs, const ordinal& rhs) {
            operation_budget budget;
            return e0::core::power(lhs, rhs, budget);
        })
        .def("__eq__", [](const ordinal& lhs, const ordinal& rhs) { return lhs == rhs; })
        .def("__lt__", [](const ordinal& lhs, const ordinal& rhs) { return lhs < rhs; })
        .def("__le__", [](const ordinal& lhs, const ordinal& rhs) { return lhs <= rhs; })
        .def("complexity", [](const ordinal& value) {
            operation_budget budget;
            return e0::approx::complexity(value, budget);
        })
        .def(
            "simplify",
            [](const ordinal& value, std::size_t max_complexity) {
                operation_budget budget;
                return e0::approx::simplify(value, max_complexity, budget).value;
            },
            py::arg("max_complexity") = e0::approx::DEFAULT_COMPLEXITY_LIMIT,
            "Largest value <= self whose notation fits in max_complexity");

    py::implicitly_convertible<py::int_, ordinal>();

    py::class_<e0::mapping::mapping_params>(module, "MappingParams")
        .def(py::init<>())
        .def(py::init<double, double, double, double>(), py::arg("scale_add"), py::arg("scale_mult"),
             py::arg("scale_exp"), py::arg("scale_tet"))
        .def_static("legacy", &e0::mapping::mapping_params::legacy)
        .def_property_readonly("upper", &e0::mapping::mapping_params::upper)
        .def_property_readonly("omega_omega_value", &e0::mapping::mapping_params::omega_omega_value);

    py::class_<e0::mapping::embedding>(module, "Embedding")
        .def(py::init<>())
        .def(py::init<e0::mapping::mapping_params, std::size_t>(), py::arg("params"),
             py::arg("cache_limit") = e0::mapping::embedding::DEFAULT_CACHE_LIMIT)
        .def(
            "f",
            [](e0::mapping::embedding& map, const ordinal& value, std::uint64_t budget) {
                operation_budget counter(budget);
                return map.f(value, counter);
            },
            py::arg("value"), py::arg("budget") = operation_budget::DEFAULT_LIMIT)
        .def(
            "f_inverse",
            [](e0::mapping::embedding& map, double x, double threshold, std::size_t max_depth,
               std::uint64_t budget) {
                operation_budget counter(budget);
                const e0::mapping::inverse_limits limits{threshold, max_depth};
                return map.inverse_ordinal(x, counter, limits);
            },
            py::arg("x"), py::arg("threshold") = e0::mapping::inverse_limits{}.threshold,
            py::arg("max_depth") = e0::mapping::inverse_limits{}.max_depth,
            py::arg("budget") = operation_budget::DEFAULT_LIMIT)
        .def_property_readonly("cache_size", &e0::mapping::embedding::cache_size)
        .def_property_readonly("cache_limit", &e0::mapping::embedding::cache_limit)
        .def("clear_cache", &e0::mapping::embedding::clear_cache);

    module.def("calculate", &parse_literal, py::arg("expression"),
               "Evaluate an ordinal expression under the default budget");
    module.def(
        "evaluate",
        [](const std::string& expression, std::uint64_t budget) {
            const auto result = e0::evaluate(expression, budget);
            return py::make_tuple(result.value, result.operations);
        },
        py::arg("expression"), py::arg("budget") = operation_budget::DEFAULT_LIMIT,
        "Evaluate an expression and report the operations it consumed");
}

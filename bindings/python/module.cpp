/*
  Pybind11 module exposing transferroute C++ APIs to Python.

  Notes:
    - Batches are passed as Python lists of Route and copied into a
      std::vector for the duration of the call; selectors return copies.
    - Timestamps convert from/to datetime.datetime (pybind11/chrono.h).
    - generate_reasoning accepts a RouteCategory, its string name or its
      integer value; an unrecognized name, an out-of-range integer or any
      other object produces the generic fallback text.
    - set_log_level raises ValueError for an unknown level name.
*/
#include <pybind11/pybind11.h>
#include <pybind11/chrono.h>
#include <pybind11/stl.h>

#include <limits>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "transferroute/core/categorize.hpp"
#include "transferroute/core/error.hpp"
#include "transferroute/core/fees.hpp"
#include "transferroute/core/logging.hpp"
#include "transferroute/core/normalize.hpp"
#include "transferroute/core/reasoning.hpp"
#include "transferroute/core/risk.hpp"
#include "transferroute/core/scoring.hpp"
#include "transferroute/core/selection.hpp"
#include "transferroute/core/types.hpp"
#include "transferroute/core/validation.hpp"

namespace py = pybind11;
using namespace transferroute::core;

namespace {
// Out-of-range value routes to the generic reasoning text.
constexpr auto kUnknownCategory = static_cast<RouteCategory>(0);

RouteCategory category_from(py::handle obj) {
  if (py::isinstance<RouteCategory>(obj)) return py::cast<RouteCategory>(obj);
  if (py::isinstance<py::str>(obj)) {
    auto parsed = parse_route_category(py::cast<std::string>(obj));
    return parsed ? *parsed : kUnknownCategory;
  }
  if (py::isinstance<py::int_>(obj)) {
    int overflow = 0;
    const long long value = PyLong_AsLongLongAndOverflow(obj.ptr(), &overflow);
    if (overflow != 0 || value < std::numeric_limits<int>::min() ||
        value > std::numeric_limits<int>::max())
      return kUnknownCategory;
    return static_cast<RouteCategory>(static_cast<int>(value));
  }
  return kUnknownCategory;
}
} // namespace

PYBIND11_MODULE(_transferroute_core, m) {
  m.doc() = "transferroute C++ bindings";

  py::register_exception<EmptyBatchError>(m, "EmptyBatchError");
  py::register_exception<ValueError>(m, "RouteValueError", PyExc_ValueError);

  py::enum_<TransferSpeed>(m, "TransferSpeed")
      .value("INSTANT", TransferSpeed::Instant)
      .value("SAME_DAY", TransferSpeed::SameDay)
      .value("ONE_DAY", TransferSpeed::OneDay)
      .value("THREE_DAY", TransferSpeed::ThreeDay);

  py::enum_<RiskLevel>(m, "RiskLevel")
      .value("LOW", RiskLevel::Low)
      .value("MEDIUM", RiskLevel::Medium)
      .value("HIGH", RiskLevel::High);

  py::enum_<RouteCategory>(m, "RouteCategory")
      .value("CHEAPEST", RouteCategory::Cheapest)
      .value("FASTEST", RouteCategory::Fastest)
      .value("RECOMMENDED", RouteCategory::Recommended);

  py::class_<TransferStep>(m, "TransferStep")
      .def(py::init<>())
      .def(py::init([](std::string from, std::string to, Money amount, TransferSpeed method,
                       Timestamp arrival, std::optional<Money> fee) {
        TransferStep s;
        s.from_account_id = std::move(from);
        s.to_account_id = std::move(to);
        s.amount = amount;
        s.method = method;
        s.fee = fee;
        s.estimated_arrival = arrival;
        return s;
      }),
        py::kw_only(),
        py::arg("from_account_id"), py::arg("to_account_id"), py::arg("amount"),
        py::arg("method"), py::arg("estimated_arrival"), py::arg("fee") = py::none())
      .def_readwrite("from_account_id", &TransferStep::from_account_id)
      .def_readwrite("to_account_id", &TransferStep::to_account_id)
      .def_readwrite("amount", &TransferStep::amount)
      .def_readwrite("method", &TransferStep::method)
      .def_readwrite("fee", &TransferStep::fee)
      .def_readwrite("estimated_arrival", &TransferStep::estimated_arrival);

  py::class_<Route>(m, "Route")
      .def(py::init<>())
      .def(py::init([](std::vector<TransferStep> steps, Timestamp arrival, double risk_score,
                       std::optional<Money> total) {
        Route r;
        r.total_fees = total ? *total : total_fees(steps);
        r.steps = std::move(steps);
        r.estimated_arrival = arrival;
        r.risk_score = risk_score;
        r.risk_level = classify_risk_level(risk_score);
        return r;
      }),
        py::kw_only(),
        py::arg("steps"), py::arg("estimated_arrival"), py::arg("risk_score") = 0.0,
        py::arg("total_fees") = py::none())
      .def_readwrite("category", &Route::category)
      .def_readwrite("steps", &Route::steps)
      .def_readwrite("total_fees", &Route::total_fees)
      .def_readwrite("estimated_arrival", &Route::estimated_arrival)
      .def_readwrite("risk_level", &Route::risk_level)
      .def_readwrite("risk_score", &Route::risk_score)
      .def_readwrite("reasoning", &Route::reasoning);

  py::class_<RiskAssessment>(m, "RiskAssessment")
      .def_readonly("score", &RiskAssessment::score)
      .def_readonly("timing", &RiskAssessment::timing)
      .def_readonly("reliability", &RiskAssessment::reliability)
      .def_readonly("complexity", &RiskAssessment::complexity);

  py::class_<RoutingResult>(m, "RoutingResult")
      .def_readonly("routes", &RoutingResult::routes)
      .def_readonly("all_routes_risky", &RoutingResult::all_routes_risky);

  m.def("total_fees", [](const std::vector<TransferStep>& steps) { return total_fees(steps); },
        py::arg("steps"));

  m.def("validate_route", &validate_route, py::arg("route"));

  m.def("normalize_costs", [](const std::vector<Route>& batch) { return normalize_costs(batch); },
        py::arg("routes"));
  m.def("normalize_times",
        [](const std::vector<Route>& batch, Timestamp now) { return normalize_times(batch, now); },
        py::arg("routes"), py::arg("now"));
  m.def("recommended_score", &recommended_score,
        py::arg("route"), py::arg("normalized_cost"), py::arg("normalized_time"));

  m.def("select_cheapest",
        [](const std::vector<Route>& batch) { return select_cheapest(batch); },
        py::arg("routes"));
  m.def("select_fastest",
        [](const std::vector<Route>& batch) { return select_fastest(batch); },
        py::arg("routes"));
  m.def("select_recommended",
        [](const std::vector<Route>& batch, Timestamp now) { return select_recommended(batch, now); },
        py::arg("routes"), py::arg("now"));

  m.def("generate_reasoning",
        [](const Route& route, py::object category, const std::vector<Route>& batch, Timestamp now) {
          return generate_reasoning(route, category_from(category), batch, now);
        },
        py::arg("route"), py::arg("category"), py::arg("routes"), py::arg("now"));

  m.def("assess_risk", &assess_risk, py::arg("route"), py::arg("deadline"));
  m.def("classify_risk_level",
        [](double score) { return classify_risk_level(score); }, py::arg("risk_score"));
  m.def("all_routes_risky",
        [](const std::vector<Route>& batch, double threshold) {
          RiskOptions opts;
          opts.warning_threshold = threshold;
          return all_routes_risky(batch, opts);
        },
        py::arg("routes"), py::kw_only(), py::arg("threshold") = 70.0);

  m.def("categorize_routes",
        [](const std::vector<Route>& batch, Timestamp now, bool validate) {
          CategorizeOptions opts;
          opts.validate = validate;
          return categorize_routes(batch, now, opts);
        },
        py::arg("routes"), py::arg("now"), py::kw_only(), py::arg("validate") = true);

  m.def("set_log_level",
        [](const std::string& level) {
          auto parsed = parse_log_level(level);
          if (!parsed) throw py::value_error("unknown log level: " + level);
          set_log_level(*parsed);
        },
        py::arg("level"));
}

/*
  Pybind11 module exposing the transitgraph core to Python.

  Notes:
    - Failed Status values raise: InvalidInput/Duplicate -> ValueError,
      NotFound -> KeyError, Unavailable -> RuntimeError.
    - Coordinates are (lon, lat) tuples; chains are lists of (a, b) tuples.
    - Transport classes are passed as their tags ("ICE", "IC", "RE", "RB", "S").
*/
#include <memory>
#include <optional>
#include <string>
#include <variant>

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "transitgraph/core/branch_manager.hpp"
#include "transitgraph/core/chain_decomposer.hpp"
#include "transitgraph/core/default_network.hpp"
#include "transitgraph/core/options.hpp"
#include "transitgraph/core/travel_time.hpp"
#include "transitgraph/core/types.hpp"
#include "transitgraph/core/workspace.hpp"

namespace py = pybind11;
using namespace transitgraph::core;

namespace {
void raise_if_error(const Status& st) {
  switch (st.kind()) {
    case ErrorKind::Ok: return;
    case ErrorKind::InvalidInput:
    case ErrorKind::Duplicate: throw py::value_error(st.to_string());
    case ErrorKind::NotFound: throw py::key_error(st.to_string());
    case ErrorKind::Unavailable: break;
  }
  throw std::runtime_error(st.to_string());
}

std::optional<TransportClass> class_arg(const py::object& tag) {
  if (tag.is_none()) return std::nullopt;
  auto text = py::cast<std::string>(tag);
  auto cls = parse_transport_class(text);
  if (!cls) throw py::value_error("unknown transport class '" + text + "'");
  return cls;
}

py::list chain_to_py(const Chain& chain) {
  py::list out;
  for (const auto& c : chain) out.append(py::make_tuple(c.a, c.b));
  return out;
}
} // namespace

PYBIND11_MODULE(_transitgraph_core, m) {
  m.doc() = "transitgraph C++ bindings";

  m.def("haversine_km", [](std::pair<double, double> a, std::pair<double, double> b) {
    return haversine_km(GeoPoint{a.first, a.second}, GeoPoint{b.first, b.second});
  }, py::arg("a"), py::arg("b"));
  m.def("format_minutes", &format_minutes, py::arg("minutes"));
  m.def("format_total", &format_total, py::arg("minutes"));

  py::class_<Branch>(m, "Branch")
      .def_readonly("id", &Branch::id)
      .def_readonly("name", &Branch::name)
      .def_readonly("children", &Branch::children)
      .def_property_readonly("parents", &Branch::parents)
      .def_property_readonly("kind", [](const Branch& b) {
        if (std::holds_alternative<SplitLineage>(b.lineage)) return "split";
        if (std::holds_alternative<MergeLineage>(b.lineage)) return "merge";
        return "root";
      })
      .def_property_readonly("edges", [](const Branch& b) { return chain_to_py(b.edges); })
      .def_property_readonly("color", [](const Branch& b) { return std::string(b.color()); })
      .def_property_readonly("line_style", [](const Branch& b) { return static_cast<int>(b.line_style); });

  py::class_<RouteWorkspace>(m, "RouteWorkspace")
      .def(py::init([](bool with_defaults, std::size_t history_capacity, const std::string& log_level) {
        CoreOptions opts;
        opts.history.capacity = history_capacity;
        opts.log_level = log_level;
        return std::make_unique<RouteWorkspace>(opts, with_defaults ? default_network() : NetworkState{});
      }), py::kw_only(), py::arg("with_defaults") = false,
          py::arg("history_capacity") = kMaxHistorySize, py::arg("log_level") = "warn")
      .def("add_city", [](RouteWorkspace& w, const std::string& name, double lon, double lat) {
        raise_if_error(w.add_city(name, GeoPoint{lon, lat}));
      }, py::arg("name"), py::arg("lon"), py::arg("lat"))
      .def("update_city", [](RouteWorkspace& w, const std::string& name, double lon, double lat) {
        raise_if_error(w.update_city_coordinates(name, GeoPoint{lon, lat}));
      }, py::arg("name"), py::arg("lon"), py::arg("lat"))
      .def("remove_city", [](RouteWorkspace& w, const std::string& name) {
        raise_if_error(w.remove_city(name));
      }, py::arg("name"))
      .def("remove_default_cities", [](RouteWorkspace& w) { raise_if_error(w.remove_default_cities()); })
      .def("add_connection", [](RouteWorkspace& w, const std::string& a, const std::string& b, py::object cls) {
        raise_if_error(w.add_connection(a, b, class_arg(cls)));
      }, py::arg("a"), py::arg("b"), py::arg("train_type") = py::none())
      .def("remove_connection", [](RouteWorkspace& w, const std::string& a, const std::string& b) {
        raise_if_error(w.remove_connection(a, b));
      }, py::arg("a"), py::arg("b"))
      .def("mark_break", [](RouteWorkspace& w, const std::string& a, const std::string& b) {
        raise_if_error(w.mark_break(a, b));
      }, py::arg("a"), py::arg("b"))
      .def("unmark_break", [](RouteWorkspace& w, const std::string& a, const std::string& b) {
        raise_if_error(w.unmark_break(a, b));
      }, py::arg("a"), py::arg("b"))
      .def("set_travel_time", [](RouteWorkspace& w, const std::string& a, const std::string& b, Minutes minutes) {
        raise_if_error(w.set_duration_override(a, b, minutes));
      }, py::arg("a"), py::arg("b"), py::arg("minutes"))
      .def("clear_travel_time", [](RouteWorkspace& w, const std::string& a, const std::string& b) {
        raise_if_error(w.clear_duration_override(a, b));
      }, py::arg("a"), py::arg("b"))
      .def("load", [](RouteWorkspace& w, const std::string& path) { raise_if_error(w.load_file(path)); },
           py::arg("path"))
      .def("save", [](const RouteWorkspace& w, const std::string& path) { raise_if_error(w.save_file(path)); },
           py::arg("path"))
      .def("undo", [](RouteWorkspace& w) { raise_if_error(w.undo()); })
      .def("redo", [](RouteWorkspace& w) { raise_if_error(w.redo()); })
      .def("can_undo", &RouteWorkspace::can_undo)
      .def("can_redo", &RouteWorkspace::can_redo)
      .def("cities", [](const RouteWorkspace& w) {
        py::dict out;
        for (const auto& [name, at] : w.store().state().cities) out[py::str(name)] = py::make_tuple(at.lon, at.lat);
        return out;
      })
      .def("connections", [](const RouteWorkspace& w) { return chain_to_py(w.store().state().connections); })
      .def("chains", [](const RouteWorkspace& w) {
        py::list out;
        for (const auto& chain : w.chains()) out.append(chain_to_py(chain));
        return out;
      })
      .def("travel_time", [](RouteWorkspace& w, const std::string& a, const std::string& b) {
        return w.travel_time_label(a, b);
      }, py::arg("a"), py::arg("b"))
      .def("travel_minutes", [](RouteWorkspace& w, const std::string& a, const std::string& b) {
        return w.travel_minutes(a, b);
      }, py::arg("a"), py::arg("b"))
      .def("branch_ids", [](const RouteWorkspace& w) { return w.branches().branch_ids(); })
      .def("branch", [](const RouteWorkspace& w, const BranchId& id) {
        const Branch* b = w.branches().find(id);
        if (b == nullptr) throw py::key_error("unknown branch id '" + id + "'");
        return *b;
      }, py::arg("branch_id"))
      .def("active_branch", [](const RouteWorkspace& w) { return w.branches().active(); })
      .def("branch_tree", [](const RouteWorkspace& w) {
        auto t = w.branches().tree();
        return py::make_tuple(t.roots, t.children);
      })
      .def("split", [](RouteWorkspace& w, const BranchId& id, const std::string& city) {
        auto r = w.branches().split(id, city);
        raise_if_error(r.status());
        return py::make_tuple(r.value().first, r.value().second);
      }, py::arg("branch_id"), py::arg("city"))
      .def("merge", [](RouteWorkspace& w, const BranchId& id1, const BranchId& id2,
                       const std::string& city1, const std::string& city2) {
        auto r = w.branches().merge(id1, id2, city1, city2);
        raise_if_error(r.status());
        return r.value();
      }, py::arg("branch_id1"), py::arg("branch_id2"), py::arg("city1"), py::arg("city2"))
      .def("apply_branch", [](RouteWorkspace& w, const BranchId& id) {
        raise_if_error(w.branches().apply_to_network(id));
      }, py::arg("branch_id"));
}

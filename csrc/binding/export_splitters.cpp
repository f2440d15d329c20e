#include "mdchunk.hpp"

#include "hierarchical_splitter.hpp"
#include "multi_scale_splitter.hpp"
#include "semantic_splitter.hpp"

#include <optional>
#include <string>
#include <vector>

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

namespace {

// set_default / get_default / reset_default on a splitter's registry.
template <class Splitter, class PyClass>
void def_default_params(PyClass& cls) {
    cls.def_static("set_default",
            [](py::kwargs kwargs) {
                mdchunk::MapParams::MapType updates;
                for (auto item : kwargs) {
                    updates[py::cast<std::string>(item.first)] = py::cast<size_t>(item.second);
                }
                Splitter::_default_params.set_default(updates);
            }
        )
        .def_static("get_default",
            [](py::object param_name) -> py::object {
                if (param_name.is_none()) {
                    py::dict out;
                    for (const auto& [key, value] : Splitter::_default_params.get_default()) {
                        out[py::str(key)] = py::int_(value);
                    }
                    return py::object(std::move(out));
                }
                auto value = Splitter::_default_params.get_default(param_name.cast<std::string>());
                if (!value) return py::none();
                return py::int_(*value);
            },
            py::arg("param_name") = py::none()
        )
        .def_static("reset_default", []() { Splitter::_default_params.reset_default(); });
}

} // namespace

void exportSplitters(py::module& m) {
    py::class_<mdchunk::HierarchicalConfig>(m, "HierarchicalConfig")
        .def(py::init<>())
        .def_readwrite("parent_target_size", &mdchunk::HierarchicalConfig::parent_target_size)
        .def_readwrite("min_parent_size", &mdchunk::HierarchicalConfig::min_parent_size)
        .def_readwrite("child_target_size", &mdchunk::HierarchicalConfig::child_target_size)
        .def_readwrite("code_flush_min_size", &mdchunk::HierarchicalConfig::code_flush_min_size)
        .def_readwrite("break_lookback_lines", &mdchunk::HierarchicalConfig::break_lookback_lines);

    py::class_<mdchunk::HierarchicalSplitter> hierarchical(m, "HierarchicalSplitter");
    hierarchical
        .def(py::init<std::optional<size_t>, std::optional<size_t>, std::optional<size_t>>(),
            py::arg("parent_target_size") = py::none(),
            py::arg("min_parent_size") = py::none(),
            py::arg("child_target_size") = py::none()
        )
        .def(py::init<const mdchunk::HierarchicalConfig&>(), py::arg("config"))
        .def("split", [](const mdchunk::HierarchicalSplitter& self, const std::string& document) {
                py::gil_scoped_release release;
                return self.split(document);
            },
            py::arg("document")
        )
        .def_property_readonly("config", &mdchunk::HierarchicalSplitter::config);
    def_default_params<mdchunk::HierarchicalSplitter>(hierarchical);

    py::class_<mdchunk::TierConfig>(m, "TierConfig")
        .def(py::init([](mdchunk::ChunkSize chunk_size, size_t target_size, size_t overlap) {
                return mdchunk::TierConfig{chunk_size, target_size, overlap};
            }),
            py::arg("chunk_size"), py::arg("target_size"), py::arg("overlap")
        )
        .def_readwrite("chunk_size", &mdchunk::TierConfig::chunk_size)
        .def_readwrite("target_size", &mdchunk::TierConfig::target_size)
        .def_readwrite("overlap", &mdchunk::TierConfig::overlap);

    py::class_<mdchunk::MultiScaleSplitter> multi_scale(m, "MultiScaleSplitter");
    multi_scale
        .def(py::init([](py::object tiers) {
                if (tiers.is_none()) return mdchunk::MultiScaleSplitter();
                return mdchunk::MultiScaleSplitter(tiers.cast<std::vector<mdchunk::TierConfig>>());
            }),
            py::arg("tiers") = py::none()
        )
        .def("split", [](const mdchunk::MultiScaleSplitter& self, const std::string& document) {
                py::gil_scoped_release release;
                return self.split(document);
            },
            py::arg("document")
        )
        .def("split_tier", [](const mdchunk::MultiScaleSplitter& self, const std::string& document,
                              const mdchunk::TierConfig& tier) {
                py::gil_scoped_release release;
                return self.split_tier(document, tier);
            },
            py::arg("document"), py::arg("tier")
        )
        .def_property_readonly("tiers", &mdchunk::MultiScaleSplitter::tiers)
        .def_static("default_tiers", &mdchunk::MultiScaleSplitter::default_tiers);
    def_default_params<mdchunk::MultiScaleSplitter>(multi_scale);

    py::class_<mdchunk::SemanticSplitter> semantic(m, "SemanticSplitter");
    semantic
        .def(py::init<std::optional<size_t>>(), py::arg("target_size") = py::none())
        .def("split", [](const mdchunk::SemanticSplitter& self, const std::string& document) {
                py::gil_scoped_release release;
                return self.split(document);
            },
            py::arg("document")
        );
    def_default_params<mdchunk::SemanticSplitter>(semantic);
}

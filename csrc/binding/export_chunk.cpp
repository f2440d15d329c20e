#include "mdchunk.hpp"

#include "chunk.hpp"

#include <string>

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

void exportChunk(py::module& m) {
    py::enum_<mdchunk::ChunkType>(m, "ChunkType")
        .value("Code", mdchunk::ChunkType::Code)
        .value("Text", mdchunk::ChunkType::Text)
        .value("Header", mdchunk::ChunkType::Header)
        .value("List", mdchunk::ChunkType::List)
        .value("Mixed", mdchunk::ChunkType::Mixed)
        .def("__str__", [](mdchunk::ChunkType type) { return mdchunk::to_string(type); });

    py::enum_<mdchunk::ChunkSize>(m, "ChunkSize")
        .value("Small", mdchunk::ChunkSize::Small)
        .value("Medium", mdchunk::ChunkSize::Medium)
        .value("Large", mdchunk::ChunkSize::Large)
        .def("__str__", [](mdchunk::ChunkSize size) { return mdchunk::to_string(size); });

    py::class_<mdchunk::ParentChunk>(m, "ParentChunk")
        .def(py::init<>())
        .def_readwrite("id", &mdchunk::ParentChunk::id)
        .def_readwrite("content", &mdchunk::ParentChunk::content)
        .def_readwrite("start_line", &mdchunk::ParentChunk::start_line)
        .def_readwrite("end_line", &mdchunk::ParentChunk::end_line)
        .def_readwrite("headers", &mdchunk::ParentChunk::headers)
        .def_readwrite("child_ids", &mdchunk::ParentChunk::child_ids)
        .def_readwrite("summary", &mdchunk::ParentChunk::summary)
        .def_property_readonly("content_hash", &mdchunk::ParentChunk::content_hash)
        .def("__repr__", [](const mdchunk::ParentChunk& p) {
            return "<ParentChunk id=" + p.id + " lines=" + std::to_string(p.start_line) +
                   ".." + std::to_string(p.end_line) + ">";
        });

    py::class_<mdchunk::ChildChunk>(m, "ChildChunk")
        .def(py::init<>())
        .def_readwrite("id", &mdchunk::ChildChunk::id)
        .def_readwrite("parent_id", &mdchunk::ChildChunk::parent_id)
        .def_readwrite("content", &mdchunk::ChildChunk::content)
        .def_readwrite("start_line", &mdchunk::ChildChunk::start_line)
        .def_readwrite("end_line", &mdchunk::ChildChunk::end_line)
        .def_readwrite("chunk_type", &mdchunk::ChildChunk::chunk_type)
        .def_readwrite("index_in_parent", &mdchunk::ChildChunk::index_in_parent)
        .def_property_readonly("content_hash", &mdchunk::ChildChunk::content_hash)
        .def("__repr__", [](const mdchunk::ChildChunk& c) {
            return "<ChildChunk id=" + c.id + " type=" + mdchunk::to_string(c.chunk_type) + ">";
        });

    py::class_<mdchunk::Chunk>(m, "Chunk")
        .def(py::init<>())
        .def_readwrite("content", &mdchunk::Chunk::content)
        .def_readwrite("start_line", &mdchunk::Chunk::start_line)
        .def_readwrite("end_line", &mdchunk::Chunk::end_line)
        .def_readwrite("chunk_size", &mdchunk::Chunk::chunk_size)
        .def_readwrite("has_code", &mdchunk::Chunk::has_code)
        .def_readwrite("headers", &mdchunk::Chunk::headers)
        .def_property_readonly("content_hash", &mdchunk::Chunk::content_hash);

    py::class_<mdchunk::HierarchicalChunks>(m, "HierarchicalChunks")
        .def(py::init<>())
        .def_readwrite("parents", &mdchunk::HierarchicalChunks::parents)
        .def_readwrite("children", &mdchunk::HierarchicalChunks::children)
        .def("verify", [](const mdchunk::HierarchicalChunks& self) {
            mdchunk::ChunkIndex(self).verify();
        });
}

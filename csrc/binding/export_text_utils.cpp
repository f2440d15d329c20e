#include "mdchunk.hpp"

#include "embedding_sanitizer.hpp"
#include "summary.hpp"
#include "unicode_processor.hpp"

#include <string>
#include <vector>

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

namespace {

// str for well-formed UTF-8, bytes otherwise; invalid input bytes pass
// through truncation and sanitizing unchanged.
py::object to_py_text(const std::string& text) {
    if (mdchunk::UnicodeProcessor(text).is_valid_utf8()) return py::str(text);
    return py::bytes(text);
}

} // namespace

void exportTextUtils(py::module& m) {
    m.def("safe_truncate",
        [](const std::string& text, size_t max_chars) {
            return to_py_text(mdchunk::safe_truncate(text, max_chars));
        },
        py::arg("text"), py::arg("max_chars"));
    m.def("sanitize_for_embedding",
        [](const std::string& text) { return to_py_text(mdchunk::sanitize_for_embedding(text)); },
        py::arg("text"));
    m.def("make_summary",
        [](const std::string& content, const std::vector<std::string>& headers) {
            return mdchunk::make_summary(content, headers);
        },
        py::arg("content"), py::arg("headers"));
    m.def("char_count",
        [](const std::string& text) { return mdchunk::UnicodeProcessor(text).char_count(); },
        py::arg("text"));
}

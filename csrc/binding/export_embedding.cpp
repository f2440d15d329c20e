#include "mdchunk.hpp"

#include "embedding.hpp"
#include "logging.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

namespace {

// Wraps any Python object with an `embed(text) -> list[float]` method.
class PyEmbedder final : public mdchunk::Embedder {
public:
    explicit PyEmbedder(py::object obj) : _obj(std::move(obj)) {}

    std::vector<float> embed(const std::string& text) override {
        py::gil_scoped_acquire gil;
        py::object func = py::getattr(_obj, "embed", py::none());
        if (func.is_none())
            throw mdchunk::EmbeddingError(mdchunk::EmbeddingError::Kind::Terminal, "Embedder missing method: embed");
        try {
            return func(text).cast<std::vector<float>>();
        } catch (const py::error_already_set& e) {
            throw mdchunk::EmbeddingError(mdchunk::EmbeddingError::Kind::Transient, e.what());
        } catch (const py::cast_error& e) {
            throw mdchunk::EmbeddingError(mdchunk::EmbeddingError::Kind::Terminal, e.what());
        }
    }

private:
    py::object _obj;
};

} // namespace

void exportEmbedding(py::module& m) {
    m.def("prepare_embedding_input", &mdchunk::prepare_embedding_input,
        py::arg("text"), py::arg("max_chars") = 2000);

    m.def("set_log_level",
        [](const std::string& level) { mdchunk::set_log_level(mdchunk::log_level_from_name(level)); },
        py::arg("level"));

    py::register_exception<mdchunk::EmbeddingError>(m, "EmbeddingError", PyExc_RuntimeError);

    py::class_<mdchunk::EmbeddingClient, std::shared_ptr<mdchunk::EmbeddingClient>>(m, "EmbeddingClient")
        .def(py::init([](py::object embedder, size_t max_chars, size_t max_attempts,
                         long long base_delay_ms, long long max_delay_ms, bool wake_up_probe) {
                mdchunk::EmbeddingOptions options;
                options.max_chars = max_chars;
                options.max_attempts = max_attempts;
                options.base_delay = std::chrono::milliseconds(base_delay_ms);
                options.max_delay = std::chrono::milliseconds(max_delay_ms);
                options.wake_up_probe = wake_up_probe;
                return std::make_shared<mdchunk::EmbeddingClient>(
                    std::make_shared<PyEmbedder>(std::move(embedder)), options);
            }),
            py::arg("embedder"),
            py::arg("max_chars") = 2000,
            py::arg("max_attempts") = 5,
            py::arg("base_delay_ms") = 500,
            py::arg("max_delay_ms") = 60000,
            py::arg("wake_up_probe") = true
        )
        .def("embed", [](const mdchunk::EmbeddingClient& self, const std::string& text) {
                py::gil_scoped_release release;
                return self.embed(text);
            },
            py::arg("text")
        );
}

#include "mdchunk.hpp"

PYBIND11_MODULE(mdchunk_cpp, m) {
    m.doc() = "mdchunk CPP Module.";

    // prevent document generation
    pybind11::options options;
    options.disable_function_signatures();

    exportChunk(m);
    exportSplitters(m);
    exportTextUtils(m);
    exportEmbedding(m);
}

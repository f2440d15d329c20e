#pragma once

#include <memory>
#include <stdexcept>

#include <pybind11/stl.h>
#include <pybind11/pybind11.h>
#include <pybind11/pytypes.h>

namespace py = pybind11;

void exportChunk(pybind11::module& m);
void exportSplitters(pybind11::module& m);
void exportTextUtils(pybind11::module& m);
void exportEmbedding(pybind11::module& m);

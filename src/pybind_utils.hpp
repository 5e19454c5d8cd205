#pragma once

#include <cstddef>
#include <span>
#include <stdexcept>
#include <type_traits>
#include <vector>

#include <pybind11/numpy.h>
#include <pybind11/pybind11.h>

namespace cobra::python {

namespace py = pybind11;

template <typename T>
using PyArrayT = py::array_t<T, py::array::c_style | py::array::forcecast>;

// Copies a state or parameter vector into a new 1-D array.
template <typename T>
inline py::array_t<T> to_numpy(const std::vector<T>& values) {
    return py::array_t<T>(static_cast<py::ssize_t>(values.size()),
                          values.data());
}

// Borrowed view over a contiguous 1-D array. Must not outlive `arr`.
template <typename T>
inline std::span<const T> as_span(const PyArrayT<T>& arr) {
    static_assert(std::is_arithmetic_v<T>, "T must be arithmetic");
    const py::buffer_info buffer = arr.request();
    if (buffer.ndim != 1) {
        throw std::invalid_argument("Expected a 1-D array");
    }
    return {static_cast<const T*>(buffer.ptr),
            static_cast<std::size_t>(buffer.size)};
}

// (n_points, dim) array of branch states. Points of different dimension
// cannot share one array.
template <typename T>
inline py::array_t<T> rows_to_numpy(const std::vector<std::vector<T>>& rows) {
    const auto n_rows = static_cast<py::ssize_t>(rows.size());
    const auto n_cols =
        rows.empty() ? py::ssize_t{0} : static_cast<py::ssize_t>(rows[0].size());
    py::array_t<T> result({n_rows, n_cols});
    auto view = result.template mutable_unchecked<2>();
    for (py::ssize_t i = 0; i < n_rows; ++i) {
        const auto& row = rows[static_cast<std::size_t>(i)];
        if (static_cast<py::ssize_t>(row.size()) != n_cols) {
            throw std::invalid_argument(
                "Branch states have different dimensions");
        }
        for (py::ssize_t j = 0; j < n_cols; ++j) {
            view(i, j) = row[static_cast<std::size_t>(j)];
        }
    }
    return result;
}

} // namespace cobra::python

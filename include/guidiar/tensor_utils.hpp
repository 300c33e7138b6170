#pragma once

#include <string>
#include <vector>

#include <axiom/axiom.hpp>

namespace guidiar {

using namespace axiom;

namespace detail {

// Number of elements, 0 for an empty (storage-less) tensor.
size_t numel(const Tensor &t);

// Throws std::invalid_argument naming `what` unless `t` has exactly `dims`.
void require_shape(const Tensor &t, const std::vector<size_t> &dims,
                   const std::string &what);

// Throws std::invalid_argument naming `what` unless `t` holds float32 data.
void require_float(const Tensor &t, const std::string &what);

// Throws std::invalid_argument naming `what` unless `t` is a float32 tensor
// with `rank` dims.
void require_rank(const Tensor &t, size_t rank, const std::string &what);

// Contiguous CPU float32 copy of the tensor data. Throws
// std::invalid_argument on any other dtype.
std::vector<float> to_vector(const Tensor &t);

Tensor from_vector(std::vector<float> data, const Shape &shape);

// Rows `indices` of the leading axis, in the given order.
Tensor select_rows(const Tensor &t, const std::vector<int> &indices);

std::string shape_str(const Tensor &t);

} // namespace detail

} // namespace guidiar

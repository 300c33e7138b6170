#include "guidiar/tensor_utils.hpp"

#include <cstddef>
#include <stdexcept>
#include <utility>

namespace guidiar {
namespace detail {

size_t numel(const Tensor &t) {
    if (!t.storage())
        return 0;
    size_t n = 1;
    for (auto d : t.shape())
        n *= d;
    return n;
}

std::string shape_str(const Tensor &t) {
    if (!t.storage())
        return "(empty)";
    std::string s = "(";
    auto shape = t.shape();
    for (size_t i = 0; i < shape.size(); ++i) {
        if (i > 0)
            s += ", ";
        s += std::to_string(shape[i]);
    }
    return s + ")";
}

void require_rank(const Tensor &t, size_t rank, const std::string &what) {
    if (!t.storage() || t.shape().size() != rank) {
        throw std::invalid_argument(what + ": expected " +
                                    std::to_string(rank) +
                                    "-d tensor, got " + shape_str(t));
    }
    require_float(t, what);
}

void require_shape(const Tensor &t, const std::vector<size_t> &dims,
                   const std::string &what) {
    require_rank(t, dims.size(), what);
    auto shape = t.shape();
    for (size_t i = 0; i < dims.size(); ++i) {
        if (shape[i] != dims[i]) {
            std::string expected = "(";
            for (size_t j = 0; j < dims.size(); ++j) {
                if (j > 0)
                    expected += ", ";
                expected += std::to_string(dims[j]);
            }
            throw std::invalid_argument(what + ": expected shape " + expected +
                                        "), got " + shape_str(t));
        }
    }
}

void require_float(const Tensor &t, const std::string &what) {
    if (t.storage() && t.dtype() != DType::Float32) {
        throw std::invalid_argument(what + ": expected float32 tensor");
    }
}

std::vector<float> to_vector(const Tensor &t) {
    size_t n = numel(t);
    if (n == 0)
        return {};
    require_float(t, "to_vector");
    auto c = t.cpu().ascontiguousarray();
    const float *data = c.typed_data<float>();
    return std::vector<float>(data, data + n);
}

Tensor from_vector(std::vector<float> data, const Shape &shape) {
    return Tensor::from_data(data.data(), shape, true);
}

Tensor select_rows(const Tensor &t, const std::vector<int> &indices) {
    auto shape = t.shape();
    size_t rows = shape[0];
    size_t row_size = rows > 0 ? numel(t) / rows : 0;
    auto src = to_vector(t);

    std::vector<float> out;
    out.reserve(indices.size() * row_size);
    for (int i : indices) {
        if (i < 0 || static_cast<size_t>(i) >= rows) {
            throw std::out_of_range("select_rows: row " + std::to_string(i) +
                                    " out of range for " + shape_str(t));
        }
        auto offset = static_cast<size_t>(i) * row_size;
        auto begin = src.begin() + static_cast<std::ptrdiff_t>(offset);
        out.insert(out.end(), begin,
                   begin + static_cast<std::ptrdiff_t>(row_size));
    }

    Shape out_shape = shape;
    out_shape[0] = indices.size();
    return from_vector(std::move(out), out_shape);
}

} // namespace detail
} // namespace guidiar

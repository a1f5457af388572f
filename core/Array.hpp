// Minimal N-dimensional double array with NumPy-style broadcasting
#pragma once

#include <cstddef>
#include <initializer_list>
#include <string>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>
#include "core/Errors.hpp"

namespace rocket {

using Shape = std::vector<std::size_t>;

std::size_t shape_size(const Shape& s);
// Python-style tuple text: "()", "(2,)", "(2, 3)"
std::string shape_to_string(const Shape& s);

// Row-major array of doubles. A 0-d array holds a single scalar.
class Array {
public:
  Array(double v) : values_{v} {}
  Array(std::initializer_list<double> v) : shape_{v.size()}, values_(v) {}
  Array(std::vector<double> v);
  Array(Shape shape, std::vector<double> v);

  // Converting factories for other arithmetic element types (integers etc.)
  template <typename T>
  static Array from(Shape shape, const std::vector<T>& v) {
    static_assert(std::is_arithmetic<T>::value && !std::is_same<T, bool>::value,
                  "Array elements must be numeric");
    return Array(std::move(shape), std::vector<double>(v.begin(), v.end()));
  }
  template <typename T>
  static Array from(const std::vector<T>& v) { return from(Shape{v.size()}, v); }

  const Shape& shape() const { return shape_; }
  std::size_t ndim() const { return shape_.size(); }
  std::size_t size() const { return values_.size(); }
  bool is_scalar() const { return shape_.empty(); }
  const std::vector<double>& values() const { return values_; }

  double operator[](std::size_t i) const { return values_[i]; }
  // Value of a single-element array; throws a shape error otherwise
  double item() const;

private:
  Shape shape_;
  std::vector<double> values_;
};

// Broadcast shape of all inputs (trailing dims aligned, 1 stretches)
Shape broadcast_shapes(const std::vector<Shape>& shapes);

// Maps a flat index of the broadcast shape to a flat index of one input
class BroadcastIndex {
public:
  BroadcastIndex(const Shape& out, const Shape& in);
  std::size_t operator()(std::size_t flat) const;

private:
  Shape out_;
  std::vector<std::size_t> strides_; // 0 on stretched or missing dims
};

namespace detail {

template <typename Fn, typename Tuple, std::size_t... I>
Array broadcast_map_impl(Fn& fn, const Tuple& args, std::index_sequence<I...>) {
  Shape out = broadcast_shapes({std::get<I>(args).shape()...});
  const BroadcastIndex idx[] = {BroadcastIndex(out, std::get<I>(args).shape())...};
  std::vector<double> values(shape_size(out));
  for (std::size_t k = 0; k < values.size(); ++k) {
    values[k] = fn(std::get<I>(args)[idx[I](k)]...);
  }
  return Array(std::move(out), std::move(values));
}

} // namespace detail

// Evaluate fn element-wise over the broadcast shape of the inputs
template <typename Fn, typename... Arrays>
Array broadcast_map(Fn fn, const Arrays&... in) {
  static_assert(sizeof...(Arrays) > 0, "broadcast_map needs at least one input");
  static_assert((std::is_same<Arrays, Array>::value && ...), "broadcast_map takes Array inputs");
  return detail::broadcast_map_impl(fn, std::forward_as_tuple(in...),
                                    std::index_sequence_for<Arrays...>{});
}

} // namespace rocket

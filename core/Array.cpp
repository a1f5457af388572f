#include "core/Array.hpp"
#include <algorithm>
#include <sstream>

namespace rocket {

std::size_t shape_size(const Shape& s) {
  std::size_t n = 1;
  for (std::size_t d : s) n *= d;
  return n;
}

std::string shape_to_string(const Shape& s) {
  std::ostringstream ss;
  ss << '(';
  for (std::size_t i = 0; i < s.size(); ++i) {
    if (i) ss << ", ";
    ss << s[i];
  }
  if (s.size() == 1) ss << ',';
  ss << ')';
  return ss.str();
}

Array::Array(std::vector<double> v) : shape_{v.size()}, values_(std::move(v)) {}

Array::Array(Shape shape, std::vector<double> v) : shape_(std::move(shape)), values_(std::move(v)) {
  if (shape_size(shape_) != values_.size()) {
    std::ostringstream ss;
    ss << "cannot hold " << values_.size() << " values in an array of shape "
       << shape_to_string(shape_);
    shape_error("", ss.str());
  }
}

double Array::item() const {
  if (values_.size() != 1) {
    shape_error("", "only single-element arrays can be converted to a scalar, got shape "
                    + shape_to_string(shape_));
  }
  return values_.front();
}

Shape broadcast_shapes(const std::vector<Shape>& shapes) {
  std::size_t nd = 0;
  for (const auto& s : shapes) nd = std::max(nd, s.size());
  Shape out(nd, 1);
  // Walk trailing dimensions; i counts from the right
  for (std::size_t i = 0; i < nd; ++i) {
    std::size_t& dim = out[nd - 1 - i];
    for (std::size_t j = 0; j < shapes.size(); ++j) {
      const Shape& s = shapes[j];
      if (i >= s.size()) continue;
      const std::size_t d = s[s.size() - 1 - i];
      if (d == 1 || d == dim) continue;
      if (dim == 1) { dim = d; continue; }
      // Report the first input that fixed this dimension alongside the offender
      std::size_t k = 0;
      while (k < j && !(i < shapes[k].size() && shapes[k][shapes[k].size() - 1 - i] == dim)) ++k;
      shape_error("", "shapes " + shape_to_string(shapes[k]) + " and " + shape_to_string(s)
                      + " cannot be broadcast together");
    }
  }
  return out;
}

BroadcastIndex::BroadcastIndex(const Shape& out, const Shape& in)
    : out_(out), strides_(out.size(), 0) {
  const std::size_t offset = out.size() - in.size();
  std::size_t stride = 1;
  for (std::size_t i = in.size(); i-- > 0;) {
    if (in[i] != 1) strides_[offset + i] = stride;
    stride *= in[i];
  }
}

std::size_t BroadcastIndex::operator()(std::size_t flat) const {
  std::size_t off = 0;
  for (std::size_t d = out_.size(); d-- > 0;) {
    off += (flat % out_[d]) * strides_[d];
    flat /= out_[d];
  }
  return off;
}

} // namespace rocket

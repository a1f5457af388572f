#include "io/ArrayText.hpp"
#include <cctype>
#include <charconv>
#include <system_error>
#include <iomanip>
#include <limits>
#include <sstream>

namespace rocket::io {

namespace {

constexpr std::size_t kUnset = std::numeric_limits<std::size_t>::max();
constexpr std::size_t kMaxDepth = 32;

static std::size_t skip_digits(const std::string& t, std::size_t i) {
  while (i < t.size() && std::isdigit(static_cast<unsigned char>(t[i]))) ++i;
  return i;
}

// Plain decimal literal: [+-] (digits [. digits] | . digits) [(e|E) [+-] digits]
static bool is_decimal_literal(const std::string& t) {
  std::size_t i = 0;
  if (i < t.size() && (t[i] == '+' || t[i] == '-')) ++i;
  const std::size_t int_end = skip_digits(t, i);
  bool digits = int_end > i;
  i = int_end;
  if (i < t.size() && t[i] == '.') {
    const std::size_t frac_end = skip_digits(t, i + 1);
    digits = digits || frac_end > i + 1;
    i = frac_end;
  }
  if (!digits) return false;
  if (i < t.size() && (t[i] == 'e' || t[i] == 'E')) {
    ++i;
    if (i < t.size() && (t[i] == '+' || t[i] == '-')) ++i;
    const std::size_t exp_end = skip_digits(t, i);
    if (exp_end == i) return false;
    i = exp_end;
  }
  return i == t.size();
}

class Parser {
public:
  Parser(const std::string& argument, const std::string& text)
      : arg_(argument), s_(text) {}

  Array parse() {
    skip_ws();
    if (pos_ == s_.size()) type_error(arg_);
    if (peek() != '[' && s_.find(',') != std::string::npos) {
      list(0, '\0');  // bare comma list
    } else {
      value(0);
    }
    skip_ws();
    if (pos_ != s_.size()) type_error(arg_);
    if (leaf_depth_ != kUnset && leaf_depth_ != dims_.size()) ragged();
    return Array(Shape(dims_.begin(), dims_.end()), std::move(values_));
  }

private:
  const std::string& arg_;
  const std::string& s_;
  std::size_t pos_{0};
  std::vector<std::size_t> dims_;   // length per nesting level, kUnset until seen
  std::size_t leaf_depth_{kUnset};  // nesting level of numbers
  std::vector<double> values_;

  char peek() const { return pos_ < s_.size() ? s_[pos_] : '\0'; }

  void skip_ws() {
    while (pos_ < s_.size() && std::isspace(static_cast<unsigned char>(s_[pos_]))) ++pos_;
  }

  [[noreturn]] void ragged() const {
    shape_error(arg_, arg_ + " has inconsistent nesting (ragged array)");
  }

  void value(std::size_t depth) {
    if (depth > kMaxDepth) {
      shape_error(arg_, arg_ + " is nested deeper than " + std::to_string(kMaxDepth) + " levels");
    }
    skip_ws();
    if (peek() == '[') {
      ++pos_;
      list(depth, ']');
    } else {
      leaf(depth);
    }
  }

  // Elements up to `close`; '\0' means end of text
  void list(std::size_t depth, char close) {
    std::size_t n = 0;
    skip_ws();
    if (close != '\0' && peek() == close) {
      ++pos_;
    } else {
      for (;;) {
        value(depth + 1);
        ++n;
        skip_ws();
        if (peek() == ',') { ++pos_; continue; }
        if (peek() == close) {
          if (close != '\0') ++pos_;
          break;
        }
        type_error(arg_);
      }
    }
    if (dims_.size() <= depth) dims_.resize(depth + 1, kUnset);
    if (dims_[depth] == kUnset) dims_[depth] = n;
    else if (dims_[depth] != n) ragged();
  }

  void leaf(std::size_t depth) {
    const std::size_t start = pos_;
    while (pos_ < s_.size()) {
      const char c = s_[pos_];
      if (c == ',' || c == '[' || c == ']' || std::isspace(static_cast<unsigned char>(c))) break;
      ++pos_;
    }
    const std::string tok = s_.substr(start, pos_ - start);
    if (!is_decimal_literal(tok)) type_error(arg_);
    // from_chars takes no leading '+' and ignores the locale
    const char* first = tok.c_str() + (tok[0] == '+' ? 1 : 0);
    const char* last = tok.c_str() + tok.size();
    double v = 0.0;
    const auto res = std::from_chars(first, last, v);
    if (res.ec != std::errc() || res.ptr != last) type_error(arg_);
    if (leaf_depth_ == kUnset) leaf_depth_ = depth;
    else if (leaf_depth_ != depth) ragged();
    values_.push_back(v);
  }
};

void format_rec(std::ostringstream& ss, const Array& a, std::size_t dim, std::size_t& flat) {
  if (dim == a.ndim()) {
    ss << a[flat++];
    return;
  }
  ss << '[';
  for (std::size_t i = 0; i < a.shape()[dim]; ++i) {
    if (i) ss << ", ";
    format_rec(ss, a, dim + 1, flat);
  }
  ss << ']';
}

} // namespace

Array parse_array(const std::string& argument, const std::string& text) {
  return Parser(argument, text).parse();
}

std::string format_array(const Array& a) {
  std::ostringstream ss;
  ss << std::setprecision(std::numeric_limits<double>::max_digits10);
  std::size_t flat = 0;
  format_rec(ss, a, 0, flat);
  return ss.str();
}

} // namespace rocket::io

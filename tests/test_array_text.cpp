#include <cmath>
#include <iostream>
#include <string>
#include "io/ArrayText.hpp"

using rocket::Array;
using rocket::Shape;
using rocket::io::parse_array;
using rocket::io::format_array;

static bool fails_with(const std::string& text, rocket::ErrorKind kind) {
  try {
    parse_array("gamma", text);
  } catch (const rocket::Error& e) {
    return e.kind() == kind && e.argument() == "gamma";
  }
  return false;
}

int main() {
  // Scalars, lists, nesting
  {
    Array s = parse_array("T0", " 3500 ");
    if (!s.is_scalar() || s.item() != 3500.0) { std::cerr << "scalar parse\n"; return 1; }

    Array l = parse_array("gamma", "1.2,1.3");
    if (l.shape() != Shape{2} || l[0] != 1.2 || l[1] != 1.3) { std::cerr << "comma list parse\n"; return 1; }

    Array b = parse_array("gamma", "[1.2, 1.3]");
    if (b.values() != l.values() || b.shape() != l.shape()) { std::cerr << "bracket list parse\n"; return 1; }

    Array m = parse_array("Rs", "[[1, 2, 3], [4, 5, 6e2]]");
    if (m.shape() != Shape{2, 3} || m[5] != 600.0) { std::cerr << "nested list parse\n"; return 1; }

    Array e = parse_array("Rs", "[]");
    if (e.shape() != Shape{0}) { std::cerr << "empty list parse\n"; return 1; }

    Array one = parse_array("Rs", "[[7]]");
    if (one.shape() != Shape{1, 1} || one.item() != 7.0) { std::cerr << "[[7]] parse\n"; return 1; }
  }

  // Non-numeric input is a type error naming the argument
  {
    const char* bad[] = {"", "abc", "\"1.2\"", "true", "null", "1.2,abc", "[1.2, x]",
                         "1.2,", "[1.2,,1.3]", "[1.2", "1.2]", "1.2 1.3", "1.2.3",
                         "nan", "NAN(abc)", "inf", "-infinity", "0x1p0", "0x1.3p0",
                         "1e", "1e+", ".", "-", "+-1", "1e999"};
    for (const char* t : bad) {
      if (!fails_with(t, rocket::ErrorKind::Type)) {
        std::cerr << "expected type error for '" << t << "'\n";
        return 1;
      }
    }
    try {
      parse_array("Rs", "fuel");
    } catch (const rocket::Error& e) {
      if (std::string(e.what()) != "Rs must be numeric") {
        std::cerr << "type error message: " << e.what() << "\n";
        return 1;
      }
    }
  }

  // Decimal literal forms that are accepted
  {
    struct Case { const char* text; double value; } ok[] = {
      {"+1.5", 1.5}, {".5", 0.5}, {"5.", 5.0}, {"-2e-3", -0.002}, {"1E2", 100.0}, {"0", 0.0},
    };
    for (const auto& c : ok) {
      if (parse_array("gamma", c.text).item() != c.value) {
        std::cerr << "literal '" << c.text << "' parsed wrong\n";
        return 1;
      }
    }
  }

  // Ragged nesting is a shape error
  {
    const char* ragged[] = {"[[1, 2], [3]]", "[1, [2]]", "[[1], 2]", "[[], 1]", "[[], [1]]"};
    for (const char* t : ragged) {
      if (!fails_with(t, rocket::ErrorKind::Shape)) {
        std::cerr << "expected shape error for '" << t << "'\n";
        return 1;
      }
    }
  }

  // Nesting depth is capped
  {
    const std::string deep = std::string(40, '[') + "1" + std::string(40, ']');
    if (!fails_with(deep, rocket::ErrorKind::Shape)) {
      std::cerr << "40 levels of nesting accepted\n";
      return 1;
    }
    const std::string ok = std::string(8, '[') + "1" + std::string(8, ']');
    if (parse_array("gamma", ok).ndim() != 8) {
      std::cerr << "8 levels of nesting rejected\n";
      return 1;
    }
  }

  // Formatting keeps the nesting and enough digits to read back exactly
  {
    if (format_array(Array(1.5)) != "1.5") { std::cerr << "format scalar: " << format_array(Array(1.5)) << "\n"; return 1; }
    Array m(Shape{2, 2}, {1, 2, 3, 4});
    if (format_array(m) != "[[1, 2], [3, 4]]") { std::cerr << "format matrix: " << format_array(m) << "\n"; return 1; }
    if (format_array(Array(Shape{0}, {})) != "[]") { std::cerr << "format empty\n"; return 1; }
    const double x = 0.1 + 0.2;
    if (parse_array("x", format_array(Array(x))).item() != x) { std::cerr << "format precision lost\n"; return 1; }
  }

  return 0;
}

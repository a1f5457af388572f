#include <iostream>
#include <string>
#include <vector>
#include "core/Array.hpp"

using rocket::Array;
using rocket::Shape;
using rocket::broadcast_shapes;

static bool shape_error_for(const std::vector<Shape>& shapes) {
  try {
    broadcast_shapes(shapes);
  } catch (const rocket::Error& e) {
    return e.kind() == rocket::ErrorKind::Shape;
  }
  return false;
}

int main() {
  // Scalars are 0-d
  {
    Array s(2.5);
    if (!s.is_scalar() || s.size() != 1 || s.item() != 2.5) {
      std::cerr << "scalar array malformed\n";
      return 1;
    }
    if (rocket::shape_to_string(s.shape()) != "()") {
      std::cerr << "scalar shape text: " << rocket::shape_to_string(s.shape()) << "\n";
      return 1;
    }
  }

  // Shape / value count must agree
  {
    try {
      Array bad(Shape{2, 2}, {1.0, 2.0, 3.0});
      std::cerr << "3 values accepted for shape (2, 2)\n";
      return 1;
    } catch (const rocket::Error& e) {
      if (e.kind() != rocket::ErrorKind::Shape) { std::cerr << "wrong kind for bad shape\n"; return 1; }
    }
  }

  // item() only for single elements
  {
    try {
      (void)Array{1.0, 2.0}.item();
      std::cerr << "item() accepted two elements\n";
      return 1;
    } catch (const rocket::Error& e) {
      if (e.kind() != rocket::ErrorKind::Shape) { std::cerr << "wrong kind for item()\n"; return 1; }
    }
  }

  // Broadcast rules
  {
    struct Case { std::vector<Shape> in; Shape out; } cases[] = {
      {{Shape{}, Shape{}}, Shape{}},
      {{Shape{2}, Shape{}}, Shape{2}},
      {{Shape{2}, Shape{2}, Shape{}}, Shape{2}},
      {{Shape{2, 1}, Shape{3}}, Shape{2, 3}},
      {{Shape{4, 1, 3}, Shape{5, 1}}, Shape{4, 5, 3}},
      {{Shape{1}, Shape{0}}, Shape{0}},
      {{Shape{2, 0}, Shape{1}}, Shape{2, 0}},
    };
    for (const auto& c : cases) {
      Shape got = broadcast_shapes(c.in);
      if (got != c.out) {
        std::cerr << "broadcast gave " << rocket::shape_to_string(got)
                  << " expected " << rocket::shape_to_string(c.out) << "\n";
        return 1;
      }
    }
    if (!shape_error_for({Shape{2}, Shape{3}}) ||
        !shape_error_for({Shape{2, 3}, Shape{3, 2}}) ||
        !shape_error_for({Shape{0}, Shape{3}})) {
      std::cerr << "incompatible shapes were broadcast\n";
      return 1;
    }
  }

  // Message names both shapes
  {
    try {
      broadcast_shapes({Shape{2}, Shape{1}, Shape{3}});
    } catch (const rocket::Error& e) {
      if (std::string(e.what()) != "shapes (2,) and (3,) cannot be broadcast together") {
        std::cerr << "shape message: " << e.what() << "\n";
        return 1;
      }
    }
  }

  // broadcast_map visits the stretched operands correctly
  {
    Array col(Shape{2, 1}, {10.0, 20.0});
    Array row{1.0, 2.0, 3.0};
    Array sum = rocket::broadcast_map([](double a, double b) { return a + b; }, col, row);
    const std::vector<double> expected{11, 12, 13, 21, 22, 23};
    if (sum.shape() != Shape{2, 3} || sum.values() != expected) {
      std::cerr << "broadcast_map (2,1)+(3,) wrong\n";
      return 1;
    }
    Array empty = rocket::broadcast_map([](double a) { return a; }, Array(Shape{0}, {}));
    if (empty.size() != 0 || empty.shape() != Shape{0}) {
      std::cerr << "empty input should give empty output\n";
      return 1;
    }
  }

  // Integer conversion
  {
    Array a = Array::from(Shape{2, 2}, std::vector<long>{1, 2, 3, 4});
    if (a.shape() != Shape{2, 2} || a[3] != 4.0) {
      std::cerr << "integer conversion wrong\n";
      return 1;
    }
  }

  return 0;
}

#include "core/Errors.hpp"

namespace rocket {

const char* to_string(ErrorKind k) noexcept {
  switch (k) {
    case ErrorKind::Type:   return "TypeError";
    case ErrorKind::Domain: return "DomainError";
    case ErrorKind::Shape:  return "ShapeError";
  }
  return "Error";
}

void type_error(const std::string& argument) {
  throw Error(ErrorKind::Type, argument, argument + " must be numeric");
}

void domain_error(const std::string& argument, const std::string& msg) {
  throw Error(ErrorKind::Domain, argument, msg);
}

void shape_error(const std::string& argument, const std::string& msg) {
  throw Error(ErrorKind::Shape, argument, msg);
}

} // namespace rocket

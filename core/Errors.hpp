// Error taxonomy shared by the array layer and the nozzle relations
#pragma once

#include <exception>
#include <string>
#include <utility>

namespace rocket {

enum class ErrorKind { Type, Domain, Shape };

const char* to_string(ErrorKind k) noexcept;

class Error final : public std::exception {
public:
  Error(ErrorKind kind, std::string argument, std::string msg)
      : kind_(kind), argument_(std::move(argument)), msg_(std::move(msg)) {}

  const char* what() const noexcept override { return msg_.c_str(); }
  ErrorKind kind() const noexcept { return kind_; }
  // Name of the offending argument; empty when no single argument is at fault
  const std::string& argument() const noexcept { return argument_; }

private:
  ErrorKind kind_;
  std::string argument_;
  std::string msg_;
};

[[noreturn]] void type_error(const std::string& argument);
[[noreturn]] void domain_error(const std::string& argument, const std::string& msg);
[[noreturn]] void shape_error(const std::string& argument, const std::string& msg);

} // namespace rocket

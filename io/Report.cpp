#include "io/Report.hpp"
#include "io/ArrayText.hpp"

namespace rocket::io {

void write_result_json(std::ostream& os, const std::optional<Array>& cstar,
                       const std::optional<Array>& cf) {
  os << "{\n";
  if (cstar) os << "  \"c_star\": " << format_array(*cstar) << (cf ? ",\n" : "\n");
  if (cf) os << "  \"C_f\": " << format_array(*cf) << "\n";
  os << "}\n";
}

} // namespace rocket::io

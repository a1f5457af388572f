#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include "core/Errors.hpp"
#include "ideal/Ideal.hpp"
#include "io/ArrayText.hpp"
#include "io/Config.hpp"
#include "io/Report.hpp"

namespace {

static std::optional<std::string> slurp(const std::string& path) {
  std::ifstream in(path);
  if (!in) return std::nullopt;
  std::ostringstream ss; ss << in.rdbuf();
  return ss.str();
}

static void usage() {
  std::cout << "Usage: rocket_cli [--config file.json] [--gamma v] [--Rs v] [--T0 v]"
               " [--ratio_pe_p0 v] [--ratio_pa_p0 v] [--ratio_Ae_Astar v] [--out result.json]\n"
               "  values: number, comma list (1.2,1.3) or nested list ([[1.2],[1.3]])\n";
}

} // namespace

int main(int argc, char** argv) {
  using rocket::io::format_array;

  std::string config_path;
  std::string out_path;
  // Flag values are applied after the config file so they take precedence
  rocket::io::Overrides overrides;
  for (int i=1;i<argc;++i) {
    std::string a = argv[i];
    if (a == "--help") { usage(); return 0; }
    if (a.rfind("--", 0) != 0 || i+1 >= argc) {
      std::cerr << "[rocket_cli] unexpected argument: " << a << "\n"; usage(); return 1;
    }
    std::string v = argv[++i];
    if (a == "--config") config_path = v;
    else if (a == "--out") out_path = v;
    else overrides.emplace_back(a.substr(2), v);
  }

  rocket::io::RunConfig cfg;
  std::optional<rocket::Array> cstar, cf;
  try {
    if (!config_path.empty()) {
      auto text = slurp(config_path);
      if (!text) { std::cerr << "[config] cannot read " << config_path << "\n"; return 1; }
      cfg = rocket::io::parse_config(*text);
    }
    if (auto unknown = rocket::io::apply_overrides(cfg, overrides)) {
      std::cerr << "[rocket_cli] unknown option: --" << *unknown << "\n"; usage(); return 1;
    }
    if (!cfg.has_cstar_inputs() && !cfg.has_cf_inputs()) {
      std::cerr << "[rocket_cli] nothing to evaluate; c* needs gamma, Rs, T0;"
                   " C_f needs gamma, ratio_pe_p0, ratio_pa_p0, ratio_Ae_Astar."
                   " Missing: " << rocket::io::missing_inputs(cfg) << "\n";
      return 1;
    }

    if (cfg.has_cstar_inputs())
      cstar = rocket::ideal::solve_cstar(*cfg.gamma, *cfg.Rs, *cfg.T0);
    if (cfg.has_cf_inputs())
      cf = rocket::ideal::solve_cf(*cfg.gamma, *cfg.ratio_pe_p0, *cfg.ratio_pa_p0,
                                   *cfg.ratio_Ae_Astar);
  } catch (const rocket::Error& e) {
    std::cerr << "[rocket_cli] " << rocket::to_string(e.kind());
    if (!e.argument().empty()) std::cerr << " (" << e.argument() << ")";
    std::cerr << ": " << e.what() << "\n";
    return 2;
  }

  if (cstar) std::cout << "c_star = " << format_array(*cstar) << " m/s\n";
  if (cf) std::cout << "C_f = " << format_array(*cf) << "\n";

  if (!out_path.empty()) {
    std::ofstream of(out_path);
    if (!of) { std::cerr << "[rocket_cli] cannot write " << out_path << "\n"; return 1; }
    rocket::io::write_result_json(of, cstar, cf);
  }
  return 0;
}

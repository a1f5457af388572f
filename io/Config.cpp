#include "io/Config.hpp"
#include "io/ArrayText.hpp"
#include <cctype>

namespace rocket::io {

static std::string trim(const std::string& s) {
  std::size_t b = 0, e = s.size();
  while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
  while (e > b && std::isspace(static_cast<unsigned char>(s[e-1]))) --e;
  return s.substr(b, e - b);
}

static const char* const kKeys[] = {
  "gamma", "Rs", "T0", "ratio_pe_p0", "ratio_pa_p0", "ratio_Ae_Astar"
};

std::optional<std::string> find_value(const std::string& json, const std::string& key) {
  auto pos = json.find("\"" + key + "\""); if (pos == std::string::npos) return std::nullopt;
  pos = json.find(':', pos); if (pos == std::string::npos) return std::nullopt;
  ++pos;
  while (pos < json.size() && std::isspace(static_cast<unsigned char>(json[pos]))) ++pos;
  if (pos == json.size()) return std::nullopt;

  if (json[pos] == '[') {
    int depth = 0;
    for (std::size_t i = pos; i < json.size(); ++i) {
      if (json[i] == '[') ++depth;
      else if (json[i] == ']' && --depth == 0) return json.substr(pos, i - pos + 1);
    }
    return std::nullopt; // unbalanced
  }
  if (json[pos] == '"') {
    auto end = json.find('"', pos + 1); if (end == std::string::npos) return std::nullopt;
    return json.substr(pos, end - pos + 1);
  }
  auto end = json.find_first_of(",}\n\r", pos);
  return trim(json.substr(pos, end == std::string::npos ? std::string::npos : end - pos));
}

static std::optional<Array>* slot_for(RunConfig& cfg, const std::string& key) {
  if (key == "gamma") return &cfg.gamma;
  if (key == "Rs") return &cfg.Rs;
  if (key == "T0") return &cfg.T0;
  if (key == "ratio_pe_p0") return &cfg.ratio_pe_p0;
  if (key == "ratio_pa_p0") return &cfg.ratio_pa_p0;
  if (key == "ratio_Ae_Astar") return &cfg.ratio_Ae_Astar;
  return nullptr;
}

bool set_input(RunConfig& cfg, const std::string& key, const std::string& text) {
  auto* slot = slot_for(cfg, key);
  if (!slot) return false;
  *slot = parse_array(key, text);
  return true;
}

RunConfig parse_config(const std::string& json) {
  RunConfig c;
  for (const char* key : kKeys) {
    if (auto v = find_value(json, key)) *slot_for(c, key) = parse_array(key, *v);
  }
  return c;
}

std::optional<std::string> apply_overrides(RunConfig& cfg, const Overrides& flags) {
  for (const auto& [key, text] : flags) {
    if (!set_input(cfg, key, text)) return key;
  }
  return std::nullopt;
}

std::string missing_inputs(const RunConfig& cfg) {
  std::string out;
  auto add = [&out](bool present, const char* key) {
    if (present) return;
    if (!out.empty()) out += ' ';
    out += key;
  };
  add(cfg.gamma.has_value(), "gamma");
  add(cfg.Rs.has_value(), "Rs");
  add(cfg.T0.has_value(), "T0");
  add(cfg.ratio_pe_p0.has_value(), "ratio_pe_p0");
  add(cfg.ratio_pa_p0.has_value(), "ratio_pa_p0");
  add(cfg.ratio_Ae_Astar.has_value(), "ratio_Ae_Astar");
  return out;
}

} // namespace rocket::io

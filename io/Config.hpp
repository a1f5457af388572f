// Run configuration: nozzle inputs from a flat JSON object or command-line flags
#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "core/Array.hpp"

namespace rocket::io {

struct RunConfig {
  std::optional<Array> gamma;
  std::optional<Array> Rs;              // [J/(kg*K)]
  std::optional<Array> T0;              // [K]
  std::optional<Array> ratio_pe_p0;
  std::optional<Array> ratio_pa_p0;
  std::optional<Array> ratio_Ae_Astar;

  bool has_cstar_inputs() const { return gamma && Rs && T0; }
  bool has_cf_inputs() const { return gamma && ratio_pe_p0 && ratio_pa_p0 && ratio_Ae_Astar; }
};

// Raw text of the value stored under "key": a number, a quoted string
// (quotes kept) or a balanced bracket list. Empty if the key is absent.
std::optional<std::string> find_value(const std::string& json, const std::string& key);

// Parses `text` into the input named `key`. Returns false for unknown keys.
bool set_input(RunConfig& cfg, const std::string& key, const std::string& text);

RunConfig parse_config(const std::string& json);

// Flag values in command-line order, keyed without the leading "--"
using Overrides = std::vector<std::pair<std::string, std::string>>;

// Applies flags on top of cfg, later flags winning. Returns the first unknown
// key; cfg is left untouched from that flag on.
std::optional<std::string> apply_overrides(RunConfig& cfg, const Overrides& flags);

// Space-separated names of the inputs that are not set
std::string missing_inputs(const RunConfig& cfg);

} // namespace rocket::io

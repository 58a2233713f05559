#pragma once

#include <irasm/preprocessor.hpp>
#include <irasm/program.hpp>
#include <irasm/config.hpp>

#include <nlohmann/json.hpp>

#include <string_view>
#include <vector>

namespace irasm
{
namespace frontend
{
  struct assembled
  {
    parameter_map parameters;
    program prog;
  };

  /// {"code": ..., "labels": ..., "parameters": ...}
  void to_json(nlohmann::json& j, const assembled& a);

  /// Renders and assembles `tmpl` once per parameter combination of `cfg`.
  /// Throws assembly_error on the first failing combination.
  std::vector<assembled> assemble_all(std::string_view tmpl, const config_t& cfg,
                                      std::string_view module = "<template>");

  /// Reads cfg.input_file, assembles it and writes cfg.output_file.
  /// Failures are reported to `diagnostic`.
  void run(const config_t& cfg);
}
}

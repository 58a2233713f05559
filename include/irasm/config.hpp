#pragma once

#include <irasm/parameters.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <cstdio>
#include <string>
#include <vector>

namespace irasm
{

enum class emit_classes
{
  undef,
  help,
  bin,
  json,
};

NLOHMANN_JSON_SERIALIZE_ENUM( emit_classes, {
  { emit_classes::undef, "undef" },
  { emit_classes::help, "help" },
  { emit_classes::bin, "bin" },
  { emit_classes::json, "json" },
})

const static auto emit_classes_list = {
  emit_classes::help,
  emit_classes::bin,
  emit_classes::json,
};

void print_emit_classes(std::FILE* f);

struct config_t
{
  bool print_help { false };
  bool verbose { false };

  emit_classes emit_class { emit_classes::bin };

  std::string input_file;
  std::string output_file { "a.bin" };

  std::uint32_t base_address { 0 };

  std::vector<int_sweep> int_params;
  parameter_map str_params;
};

inline config_t config;

}

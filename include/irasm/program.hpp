#pragma once

#include <irasm/context.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace irasm
{
  /// Result of assembling one source: a flat binary loaded at `base`.
  struct program
  {
    std::uint32_t base { 0 };
    std::vector<unsigned char> bytes;
    label_table labels;

    std::size_t instruction_count() const
    { return bytes.size() / 4; }

    std::string to_hex() const;
  };

  /// {"code": "<hex>", "labels": {name: address}}, labels sorted by name.
  void to_json(nlohmann::json& j, const program& p);
}

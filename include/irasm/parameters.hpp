#pragma once

#include <irasm/preprocessor.hpp>

#include <string_view>
#include <optional>
#include <utility>
#include <string>
#include <vector>

namespace irasm
{
  /// All values an integer parameter takes, one assembly per value.
  struct int_sweep
  {
    std::string key;
    std::vector<parameter_value> values;
  };

  namespace parameters
  {
    /// Decimal or 0x hex with an optional minus, in [-2^63, 2^64).
    std::optional<parameter_value> parse_number(std::string_view text);

    /// key=v[,v...] where each v is a number, an inclusive range lo-hi,
    /// or one of rand8, rand16, rand32, rand64. Throws assembly_error.
    int_sweep parse_int_parameter(std::string_view arg);

    /// key=text. Throws assembly_error.
    std::pair<std::string, std::string> parse_string_parameter(std::string_view arg);

    /// Every combination of the sweeps, each merged over `fixed`.
    std::vector<parameter_map> cartesian_product(const std::vector<int_sweep>& sweeps,
                                                 const parameter_map& fixed = {});
  }
}

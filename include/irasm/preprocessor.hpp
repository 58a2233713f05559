#pragma once

#include <nlohmann/json.hpp>

#include <string_view>
#include <cstdint>
#include <variant>
#include <string>
#include <map>

namespace irasm
{
  /// Integers are kept as int64 only when negative.
  using parameter_value = std::variant<std::uint64_t, std::int64_t, std::string>;
  using parameter_map = std::map<std::string, parameter_value>;

  parameter_value make_integer(std::int64_t value);

  std::string to_string(const parameter_value& value);

  nlohmann::json parameters_to_json(const parameter_map& params);

  /// Renders an assembly template with inja. Parameters are the template's data,
  /// so `{{ name }}`, expressions, `{% for %}` and `{% if %}` are all available.
  /// Line statements use the "%%" prefix.
  struct preprocessor
  {
    /// Throws assembly_error for unknown names and template syntax errors.
    static std::string render(std::string_view tmpl, const parameter_map& params,
                              std::string_view module = "<template>");
  };
}

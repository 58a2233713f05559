#pragma once

#include <nlohmann/json.hpp>

#include <string_view>
#include <cstdint>
#include <string>

namespace irasm
{
  /// 1-based, end column exclusive. Row 0 means the problem has no line, e.g. a command line argument.
  struct source_range
  {
    std::string_view module;

    std::size_t column_beg;
    std::size_t row_beg;

    std::size_t column_end;
    std::size_t row_end;

    source_range() = default;

    source_range(std::string_view module, std::size_t column_beg, std::size_t row_beg,
                                          std::size_t column_end, std::size_t row_end);

    /// `len` characters of `row` starting at `column`.
    static source_range on_row(std::string_view module, std::size_t row, std::size_t column, std::size_t len);

    static source_range command_line()
    { return source_range { "args", 0, 0, 0, 0 }; }

    /// module:row:column, or just the module for ranges without a line
    std::string to_string() const;
  };

  void to_json(nlohmann::json& j, const source_range& s);
}

#include <irasm/source_range.hpp>

#include <fmt/format.h>

namespace irasm
{

source_range::source_range(std::string_view module, std::size_t column_beg, std::size_t row_beg,
                                                    std::size_t column_end, std::size_t row_end)
  : module(module), column_beg(column_beg), row_beg(row_beg), column_end(column_end), row_end(row_end)
{  }

source_range source_range::on_row(std::string_view module, std::size_t row, std::size_t column, std::size_t len)
{
  return source_range { module, column, row, column + len, row };
}

std::string source_range::to_string() const
{
  if(row_beg == 0)
    return std::string(module);
  return fmt::format("{}:{}:{}", module, row_beg, column_beg);
}

void to_json(nlohmann::json& j, const source_range& s)
{
  j = nlohmann::json{
    { "module", std::string(s.module) },
    { "col_beg", s.column_beg },
    { "row_beg", s.row_beg },
    { "col_end", s.column_end },
    { "row_end", s.row_end },
  };
}

}

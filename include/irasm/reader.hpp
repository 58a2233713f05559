#pragma once

#include <irasm/source_range.hpp>
#include <irasm/operand.hpp>

#include <string_view>
#include <cstdint>
#include <string>
#include <vector>

namespace irasm
{
  /// One non-blank, non-comment source line.
  struct statement
  {
    std::string mnemonic;
    std::vector<operand> operands;

    std::string text; // trimmed line, used in diagnostics
    source_range loc;
  };

  class asm_reader
  {
  public:
    /// Splits `text` into statements. `module` names the source in locations
    /// and must outlive the returned statements.
    static std::vector<statement> read_text(std::string_view text, std::string_view module);

  private:
    asm_reader(std::string_view text, std::string_view module)
      : text(text), module(module)
    {  }

    bool next_line();

    statement parse_statement() const;

    source_range range_of(std::size_t beg, std::size_t len) const;
  private:
    std::string_view text;
    std::string_view module;

    std::size_t pos { 0 };
    bool exhausted { false };

    std::string_view linebuf;
    std::size_t col { 0 }; // offset of linebuf inside the untrimmed line
    std::size_t row { 0 };
  };
}

#pragma once

#include <irasm/source_range.hpp>

#include <string_view>
#include <optional>
#include <variant>
#include <cstdint>
#include <string>

namespace irasm
{
  /// r<N> or the alias `zero`. N is not range checked here.
  struct reg
  {
    std::uint64_t number;
  };

  struct immediate
  {
    std::int64_t value;
  };

  /// Anything that is neither a register nor a number.
  struct label_ref
  {  };

  using operand_value = std::variant<reg, immediate, label_ref>;

  struct operand
  {
    std::string text;
    operand_value value;
    source_range loc;

    static operand parse(std::string_view text, const source_range& loc);

    bool is_register() const
    { return std::holds_alternative<reg>(value); }

    bool is_immediate() const
    { return std::holds_alternative<immediate>(value); }
  };

  /// Decimal, 0x-prefixed hex or bare hex (`00b`), with an optional leading minus.
  /// Values that do not fit 64 bits saturate.
  std::optional<std::int64_t> parse_immediate(std::string_view text);
}

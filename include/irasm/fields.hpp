#pragma once

#include <irasm/operand.hpp>

#include <tsl/robin_map.h>

#include <string_view>
#include <optional>
#include <cstdint>

namespace irasm
{
  class context;

  /// One named operand slot of an instruction word.
  /// `encode` returns the operand already shifted into place, masked to `width` bits.
  struct field
  {
    using encoder = std::uint32_t (*)(const field&, const context&, const operand&);

    std::string_view name;
    unsigned width;
    unsigned shift;
    encoder encode_fn;

    std::uint32_t encode(const context& ctx, const operand& op) const
    { return encode_fn(*this, ctx, op); }
  };

  namespace fields
  {
    using registry_t = tsl::robin_map<std::string_view, field>;

    /// The iRISC fields, built on first use and never modified.
    const registry_t& registry();

    /// nullptr if no field has that name.
    const field* lookup(std::string_view name);

    /// [0, 2^bits)
    std::optional<std::uint32_t> fit_unsigned(std::int64_t value, unsigned bits);

    /// [-2^(bits-1), 2^(bits-1)), returned as its bits-wide two's complement pattern.
    std::optional<std::uint32_t> fit_signed(std::int64_t value, unsigned bits);
  }
}

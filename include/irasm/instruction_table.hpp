#pragma once

#include <irasm/fields.hpp>
#include <irasm/operand.hpp>
#include <irasm/reader.hpp>

#include <tsl/robin_map.h>

#include <optional>
#include <cstdint>
#include <utility>
#include <string>
#include <vector>

namespace irasm
{
  class context;

  struct slot
  {
    const field* target;
    std::optional<operand> literal; // fixed operand, consumes no input
  };

  struct mnemonic
  {
    using handler = void (*)(const mnemonic&, context&, const statement&);

    std::string name;
    std::vector<slot> layout;
    std::size_t operand_count; // slots without a literal
    handler run;
  };

  /// Mnemonic -> instruction word layout.
  ///
  /// Layouts are space separated `field:literal` tokens, e.g. "opcode:0x00 rd: rs: simm16:".
  /// Tokens with an empty literal take the statement's operands from left to right and
  /// the word is the OR of all field contributions. `lbl` is always present and declares
  /// a label at the current address instead of emitting a word.
  class instruction_table
  {
  public:
    using layout_list = std::vector<std::pair<std::string, std::string>>;

    /// Throws assembly_error if a layout names an unknown field or has a bad literal.
    explicit instruction_table(const layout_list& layouts);

    /// The iRISC instruction set, built once.
    static const instruction_table& irisc();

    const mnemonic* lookup(const std::string& name) const;

    /// Encodes `stmt` into `ctx`. Errors carry the statement's line.
    void assemble(context& ctx, const statement& stmt) const;

    std::size_t size() const
    { return entries.size(); }
  private:
    tsl::robin_map<std::string, mnemonic> entries;
  };
}

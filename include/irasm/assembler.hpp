#pragma once

#include <irasm/instruction_table.hpp>
#include <irasm/program.hpp>
#include <irasm/reader.hpp>

#include <string_view>
#include <cstdint>
#include <vector>

namespace irasm
{
  /// Two-pass driver. Pass one only collects label addresses (every instruction
  /// is one word, so they are final), pass two emits the words with all
  /// relative offsets resolved against them.
  struct assembler
  {
    /// Throws assembly_error on the first failure.
    static program assemble(std::string_view source, std::uint32_t base,
                            std::string_view module = "<source>",
                            const instruction_table& table = instruction_table::irisc());

    static program assemble(const std::vector<statement>& statements, std::uint32_t base,
                            const instruction_table& table = instruction_table::irisc());

  private:
    assembler(const std::vector<statement>& statements, std::uint32_t base, const instruction_table& table);

    void phase_one();
    void phase_two();
  private:
    const std::vector<statement>& statements;
    const instruction_table& table;

    program prog;
  };
}

#pragma once

#include <irasm/operand.hpp>

#include <tsl/robin_map.h>

#include <optional>
#include <cstdint>
#include <string>
#include <vector>

namespace irasm
{
  using label_table = tsl::robin_map<std::string, std::uint64_t>;

  enum class pass_kind
  {
    collect_labels,
    emit,
  };

  /// State of one assembly pass. Owns its label table and output buffer.
  class context
  {
  public:
    context(std::uint32_t base, pass_kind pass, label_table labels = {});

    std::uint32_t base() const
    { return base_addr; }

    pass_kind pass() const
    { return current_pass; }

    /// Address of the next instruction to be emitted.
    std::uint64_t address() const
    { return static_cast<std::uint64_t>(base_addr) + code.size(); }

    const label_table& labels() const
    { return label_addrs; }

    const std::vector<unsigned char>& bytes() const
    { return code; }

    std::optional<std::uint64_t> lookup_label(const std::string& name) const;

    /// Binds `name` to the current address, or checks it is already bound there.
    void declare_label(const operand& name);

    /// Appends one instruction word, most significant byte first.
    void emit(std::uint32_t word);

    label_table release_labels();
    std::vector<unsigned char> release_bytes();
  private:
    std::uint32_t base_addr;
    pass_kind current_pass;

    label_table label_addrs;
    std::vector<unsigned char> code;
  };
}

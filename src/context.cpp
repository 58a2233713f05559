#include <irasm/context.hpp>
#include <irasm/diagnostic_db.hpp>
#include <irasm/error.hpp>

#include <utility>

namespace irasm
{

context::context(std::uint32_t base, pass_kind pass, label_table labels)
  : base_addr(base), current_pass(pass), label_addrs(std::move(labels)), code()
{  }

std::optional<std::uint64_t> context::lookup_label(const std::string& name) const
{
  auto it = label_addrs.find(name);
  if(it == label_addrs.end())
    return std::nullopt;
  return it->second;
}

void context::declare_label(const operand& name)
{
  const auto addr = address();

  auto it = label_addrs.find(name.text);
  if(it == label_addrs.end())
  {
    label_addrs.emplace(name.text, addr);
    return;
  }

  if(it->second != addr)
    throw assembly_error(diagnostic_db::assembler::label_redefinition(name.loc, name.text, it->second, addr));
}

void context::emit(std::uint32_t word)
{
  code.push_back(static_cast<unsigned char>((word >> 24) & 0xff));
  code.push_back(static_cast<unsigned char>((word >> 16) & 0xff));
  code.push_back(static_cast<unsigned char>((word >>  8) & 0xff));
  code.push_back(static_cast<unsigned char>( word        & 0xff));
}

label_table context::release_labels()
{ return std::move(label_addrs); }

std::vector<unsigned char> context::release_bytes()
{ return std::move(code); }

}

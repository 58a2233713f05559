#include <irasm/fields.hpp>
#include <irasm/context.hpp>
#include <irasm/diagnostic_db.hpp>
#include <irasm/error.hpp>

#include <initializer_list>

using namespace std::literals::string_view_literals;

namespace irasm
{

namespace fields
{

std::optional<std::uint32_t> fit_unsigned(std::int64_t value, unsigned bits)
{
  if(value < 0 || value >= (std::int64_t { 1 } << bits))
    return std::nullopt;
  return static_cast<std::uint32_t>(value);
}

std::optional<std::uint32_t> fit_signed(std::int64_t value, unsigned bits)
{
  const std::int64_t bound = std::int64_t { 1 } << (bits - 1);
  if(value < -bound || value >= bound)
    return std::nullopt;
  return static_cast<std::uint32_t>(value & ((std::int64_t { 1 } << bits) - 1));
}

}

namespace
{

std::uint32_t encode_register(const field& f, const context&, const operand& op)
{
  const auto* r = std::get_if<reg>(&op.value);
  if(r == nullptr)
    throw assembly_error(diagnostic_db::assembler::register_format(op.loc, f.name, op.text));
  if(r->number >= (std::uint64_t { 1 } << f.width))
    throw assembly_error(diagnostic_db::assembler::register_range(op.loc, op.text, f.name));

  return static_cast<std::uint32_t>(r->number) << f.shift;
}

std::int64_t immediate_of(const field& f, const operand& op)
{
  const auto* imm = std::get_if<immediate>(&op.value);
  if(imm == nullptr)
    throw assembly_error(diagnostic_db::assembler::number_format(op.loc, f.name, op.text));
  return imm->value;
}

std::uint32_t encode_unsigned(const field& f, const context&, const operand& op)
{
  const auto value = immediate_of(f, op);
  const auto bits = fields::fit_unsigned(value, f.width);
  if(!bits)
    throw assembly_error(diagnostic_db::assembler::field_range(op.loc, value, f.width, f.name));

  return *bits << f.shift;
}

std::uint32_t encode_signed(const field& f, const context&, const operand& op)
{
  const auto value = immediate_of(f, op);
  const auto bits = fields::fit_signed(value, f.width);
  if(!bits)
    throw assembly_error(diagnostic_db::assembler::field_range(op.loc, value, f.width, f.name));

  return *bits << f.shift;
}

// Distance in instructions from the current instruction to the label named by the operand text.
std::uint32_t encode_relative(const field& f, const context& ctx, const operand& op)
{
  // label addresses are still being collected, the word is thrown away
  if(ctx.pass() == pass_kind::collect_labels)
    return 0;

  const auto target = ctx.lookup_label(op.text);
  if(!target)
    throw assembly_error(diagnostic_db::assembler::undefined_label(op.loc, op.text));

  const auto distance = static_cast<std::int64_t>(*target) - static_cast<std::int64_t>(ctx.address());
  if(distance % 4 != 0)
    throw assembly_error(diagnostic_db::assembler::alignment(op.loc, distance, op.text));

  const auto words = distance / 4;
  const auto bits = fields::fit_signed(words, f.width);
  if(!bits)
    throw assembly_error(diagnostic_db::assembler::relative_range(op.loc, words, op.text, f.name));

  return *bits << f.shift;
}

fields::registry_t make_registry(std::initializer_list<field> list)
{
  fields::registry_t map;
  map.reserve(list.size());
  for(const auto& f : list)
    map.emplace(f.name, f);
  return map;
}

}

namespace fields
{

const registry_t& registry()
{
  static const registry_t table = make_registry({
    { "rs"sv,      5,  21, &encode_register },
    { "rd"sv,      5,  16, &encode_register },
    { "rt"sv,      5,  11, &encode_register },
    { "cmpop"sv,   5,  16, &encode_unsigned },
    { "simm16"sv,  16, 0,  &encode_signed },
    { "uimm16"sv,  16, 0,  &encode_unsigned },
    { "opcode"sv,  6,  26, &encode_unsigned },
    { "jmpop"sv,   2,  0,  &encode_unsigned },
    { "rel24"sv,   24, 0,  &encode_relative },
    { "rel16"sv,   16, 0,  &encode_relative },
    { "off11"sv,   11, 0,  &encode_unsigned },
    { "bitsel"sv,  5,  16, &encode_unsigned },
    { "twobits"sv, 2,  0,  &encode_unsigned },
    { "funct"sv,   11, 0,  &encode_unsigned },
  });
  return table;
}

const field* lookup(std::string_view name)
{
  const auto& map = registry();
  auto it = map.find(name);
  if(it == map.end())
    return nullptr;
  return &it->second;
}

}

}

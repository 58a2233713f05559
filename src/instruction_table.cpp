#include <irasm/instruction_table.hpp>
#include <irasm/diagnostic_db.hpp>
#include <irasm/context.hpp>
#include <irasm/error.hpp>

#include <string_view>

namespace irasm
{

namespace
{

void emit_layout(const mnemonic& m, context& ctx, const statement& stmt)
{
  if(stmt.operands.size() < m.operand_count)
    throw assembly_error(diagnostic_db::assembler::operand_count(stmt.loc, m.name, m.operand_count, stmt.operands.size()));

  std::uint32_t word = 0;
  auto next = stmt.operands.begin();
  for(const auto& s : m.layout)
  {
    if(s.literal)
      word |= s.target->encode(ctx, *s.literal);
    else
      word |= s.target->encode(ctx, *next++);
  }
  ctx.emit(word);
}

void declare_label(const mnemonic& m, context& ctx, const statement& stmt)
{
  if(stmt.operands.empty())
    throw assembly_error(diagnostic_db::assembler::operand_count(stmt.loc, m.name, 1, 0));

  ctx.declare_label(stmt.operands.front());
}

mnemonic parse_layout(const std::string& name, std::string_view layout)
{
  mnemonic m { name, {}, 0, &emit_layout };

  // checks fixed operands before any source is assembled
  const context scratch(0, pass_kind::collect_labels);

  std::size_t beg = 0;
  while(beg < layout.size())
  {
    if(layout[beg] == ' ')
    {
      ++beg;
      continue;
    }
    auto end = layout.find(' ', beg);
    if(end == std::string_view::npos)
      end = layout.size();

    const auto token = layout.substr(beg, end - beg);
    const auto loc = source_range::on_row("<layout>", 1, beg + 1, end - beg);

    const auto colon = token.find(':');
    if(colon == std::string_view::npos)
      throw assembly_error(diagnostic_db::assembler::malformed_slot(loc, name, token));

    const auto field_name = token.substr(0, colon);
    const auto literal = token.substr(colon + 1);

    const auto* f = fields::lookup(field_name);
    if(f == nullptr)
      throw assembly_error(diagnostic_db::assembler::unknown_field(loc, name, field_name));

    slot s { f, std::nullopt };
    if(!literal.empty())
    {
      s.literal = operand::parse(literal, loc);
      f->encode(scratch, *s.literal);
    }
    else
      ++m.operand_count;

    m.layout.push_back(std::move(s));
    beg = end;
  }
  return m;
}

}

instruction_table::instruction_table(const layout_list& layouts)
{
  entries.reserve(layouts.size() + 1);
  for(const auto& [name, layout] : layouts)
    entries.insert_or_assign(name, parse_layout(name, layout));

  entries.insert_or_assign("lbl", mnemonic { "lbl", {}, 1, &declare_label });
}

const instruction_table& instruction_table::irisc()
{
  static const instruction_table table({
    { "unk.r",    "opcode: rd: rs: rt: funct:" },
    { "unk.i",    "opcode: rd: rs: uimm16:" },
    { "addi",     "opcode:0x00 rd: rs: simm16:" },
    { "set0",     "opcode:0x06 rd: rs: uimm16:" },
    { "set1",     "opcode:0x07 rd: rs: uimm16:" },
    { "set3",     "opcode:0x08 rd: rs: uimm16:" },
    { "set2",     "opcode:0x09 rd: rs: uimm16:" },
    { "call",     "opcode:0x25 jmpop:0x0 rel24:" },
    { "jump",     "opcode:0x25 jmpop:0x1 rel24:" },
    { "alu.r",    "opcode:0x3f funct: rd: rs: rt:" },
    { "add",      "opcode:0x3f rd: rs: rt: funct:0x000" },
    { "sub",      "opcode:0x3f rd: rs: rt: funct:0x004" },
    { "subs",     "opcode:0x3f rd: rs: rt: funct:0x005" },
    { "alur.0xb", "opcode:0x3f rd: rs: rt: funct:00b" },
    { "b.t",      "opcode:0x28 cmpop: rs: rel16:" },
    { "b.f",      "opcode:0x29 cmpop: rs: rel16:" },
    { "b.set",    "opcode:0x2a rs: bitsel: rel16:" },
    { "b.clr",    "opcode:0x2b rs: bitsel: rel16:" },
    { "ld.b",     "opcode:0x18 rd: rs: simm16:" },
    { "ld.d",     "opcode:0x19 rd: rs: rt: off11: twobits:0x2" },
    { "st.d",     "opcode:0x1b rd: rs: rt: off11: twobits:0x2" },
    { "st.q",     "opcode:0x1e rd: rs: rt: off11: twobits:" },
    { "ret.d",    "opcode:0x3f rd: rs: rt: funct:0x02d" },
  });
  return table;
}

const mnemonic* instruction_table::lookup(const std::string& name) const
{
  auto it = entries.find(name);
  if(it == entries.end())
    return nullptr;
  return &it->second;
}

void instruction_table::assemble(context& ctx, const statement& stmt) const
{
  try
  {
    const auto* m = lookup(stmt.mnemonic);
    if(m == nullptr)
      throw assembly_error(diagnostic_db::assembler::unknown_mnemonic(stmt.loc, stmt.mnemonic));

    m->run(*m, ctx, stmt);
  }
  catch(assembly_error& err)
  {
    err.attach_line(stmt.text);
    throw;
  }
}

}

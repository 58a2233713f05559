#include <irasm/assembler.hpp>
#include <irasm/context.hpp>

#include <utility>

namespace irasm
{

assembler::assembler(const std::vector<statement>& statements, std::uint32_t base, const instruction_table& table)
  : statements(statements), table(table)
{
  prog.base = base;
}

program assembler::assemble(std::string_view source, std::uint32_t base,
                            std::string_view module, const instruction_table& table)
{
  const auto statements = asm_reader::read_text(source, module);

  return assemble(statements, base, table);
}

program assembler::assemble(const std::vector<statement>& statements, std::uint32_t base,
                            const instruction_table& table)
{
  assembler assm(statements, base, table);

  assm.phase_one();
  assm.phase_two();

  return std::move(assm.prog);
}

void assembler::phase_one()
{
  context ctx(prog.base, pass_kind::collect_labels);

  for(auto& stmt : statements)
    table.assemble(ctx, stmt);

  prog.labels = ctx.release_labels();
}

void assembler::phase_two()
{
  context ctx(prog.base, pass_kind::emit, std::move(prog.labels));

  for(auto& stmt : statements)
    table.assemble(ctx, stmt);

  prog.bytes = ctx.release_bytes();
  prog.labels = ctx.release_labels();
}

}

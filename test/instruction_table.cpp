#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

#include <irasm/instruction_table.hpp>
#include <irasm/context.hpp>
#include <irasm/reader.hpp>
#include <irasm/error.hpp>

#include <optional>
#include <cstdint>

using namespace irasm;

namespace
{

// encodes a single line against the default table, labels must already be known
std::uint32_t word_of(std::string_view line, label_table labels = {}, std::uint32_t base = 0)
{
  const auto statements = asm_reader::read_text(line, "test");
  REQUIRE(statements.size() == 1);

  context ctx(base, pass_kind::emit, std::move(labels));
  instruction_table::irisc().assemble(ctx, statements.front());

  const auto& b = ctx.bytes();
  REQUIRE(b.size() == 4);
  return (std::uint32_t { b[0] } << 24) | (std::uint32_t { b[1] } << 16)
       | (std::uint32_t { b[2] } << 8) | std::uint32_t { b[3] };
}

std::optional<assembly_error> failure_of(std::string_view line)
{
  try
  {
    context ctx(0, pass_kind::emit);
    for(auto& stmt : asm_reader::read_text(line, "test"))
      instruction_table::irisc().assemble(ctx, stmt);
  }
  catch(const assembly_error& err)
  {
    return err;
  }
  return std::nullopt;
}

std::optional<error_kind> table_failure(const instruction_table::layout_list& layouts)
{
  try
  {
    instruction_table t(layouts);
  }
  catch(const assembly_error& err)
  {
    return err.kind();
  }
  return std::nullopt;
}

}

TEST_CASE( "default table", "[instruction_table]" ) {

  const auto& table = instruction_table::irisc();

  // 23 layouts and lbl
  REQUIRE(table.size() == 24);
  REQUIRE(table.lookup("addi") != nullptr);
  REQUIRE(table.lookup("addi")->operand_count == 3);
  REQUIRE(table.lookup("lbl") != nullptr);
  REQUIRE(table.lookup("nop") == nullptr);
  REQUIRE(&table == &instruction_table::irisc());
}

TEST_CASE( "encodings", "[instruction_table]" ) {

  SECTION( "immediates" ) {
    REQUIRE(word_of("addi r1, r2, 10") == 0x0041000au);
    REQUIRE(word_of("addi r1, r1, -1") == 0x0021ffffu);
    REQUIRE(word_of("addi r1, r2, +5") == 0x00410005u);
    REQUIRE(word_of("addi zero, zero, 0") == 0x00000000u);
    REQUIRE(word_of("set0 r3, r4, 0xffff") == 0x1883ffffu);
    REQUIRE(word_of("set2 r3, r4, 1") == 0x24830001u);
    REQUIRE(word_of("ld.b r1, r2, -4") == 0x6041fffcu);
    REQUIRE(word_of("unk.i 0x3e, r1, r2, 7") == 0xf8410007u);
  }

  SECTION( "register forms" ) {
    REQUIRE(word_of("add r1, r2, r3") == 0xfc411800u);
    REQUIRE(word_of("sub r1, r2, r3") == 0xfc411804u);
    REQUIRE(word_of("subs r1, r2, r3") == 0xfc411805u);
    REQUIRE(word_of("alur.0xb r1, r2, r3") == 0xfc41180bu);
    REQUIRE(word_of("ret.d r0, r31, r0") == 0xffe0002du);
    REQUIRE(word_of("alu.r 0x7ff, r1, r2, r3") == 0xfc411fffu);
    REQUIRE(word_of("unk.r 1, r1, r2, r3, 2") == 0x04411802u);
  }

  SECTION( "memory" ) {
    REQUIRE(word_of("ld.d r1, r2, r3, 4") == 0x64411806u);
    REQUIRE(word_of("st.d r1, r2, r3, 0") == 0x6c411802u);
    REQUIRE(word_of("st.q r1, r2, r3, 0, 1") == 0x78411801u);
  }

  SECTION( "branches" ) {
    const label_table labels { { "here", 0 }, { "next", 4 } };
    REQUIRE(word_of("b.t 0, r1, here", labels) == 0xa0200000u);
    REQUIRE(word_of("b.f 3, r1, next", labels) == 0xa4230001u);
    REQUIRE(word_of("b.set r2, 31, next", labels) == 0xa85f0001u);
    REQUIRE(word_of("b.clr r2, 0, next", labels) == 0xac400001u);
    REQUIRE(word_of("call next", labels) == 0x94000001u);
    REQUIRE(word_of("jump here", labels) == 0x94000001u);
  }

  SECTION( "surplus operands are ignored" ) {
    REQUIRE(word_of("addi r1, r2, 10, r9") == word_of("addi r1, r2, 10"));
  }
}

TEST_CASE( "failures", "[instruction_table]" ) {

  SECTION( "unknown mnemonic" ) {
    auto err = failure_of("nop");
    REQUIRE(err.has_value());
    REQUIRE(err->kind() == error_kind::unknown_mnemonic);
    REQUIRE(err->diag()["line"].get<std::string>() == "nop");
  }

  SECTION( "operand count" ) {
    REQUIRE(failure_of("addi r1, r2")->kind() == error_kind::operand_count);
    REQUIRE(failure_of("lbl")->kind() == error_kind::operand_count);
    REQUIRE(failure_of("ret.d")->kind() == error_kind::operand_count);
  }

  SECTION( "operand kinds" ) {
    REQUIRE(failure_of("addi 1, r2, 3")->kind() == error_kind::register_format);
    REQUIRE(failure_of("addi r1, r2, loop")->kind() == error_kind::number_format);
    REQUIRE(failure_of("addi r1, r40, 3")->kind() == error_kind::field_range);
    REQUIRE(failure_of("jump nowhere")->kind() == error_kind::undefined_label);
  }

  SECTION( "errors carry the statement line and location" ) {
    auto err = failure_of("addi r1, r2, 3\n  set0 r1, r2, 0x10000");
    REQUIRE(err.has_value());
    REQUIRE(err->kind() == error_kind::field_range);
    REQUIRE(err->diag()["line"].get<std::string>() == "set0 r1, r2, 0x10000");
    REQUIRE(err->diag()["range"]["row_beg"].get<std::size_t>() == 2);
    REQUIRE(err->diag()["range"]["col_beg"].get<std::size_t>() == 16);
  }
}

TEST_CASE( "custom tables", "[instruction_table]" ) {

  SECTION( "layouts" ) {
    const instruction_table t({ { "mov", "opcode:0x01 rd: rs:" } });
    REQUIRE(t.size() == 2);
    REQUIRE(t.lookup("mov")->operand_count == 2);
    REQUIRE(t.lookup("addi") == nullptr);

    context ctx(0, pass_kind::emit);
    t.assemble(ctx, asm_reader::read_text("mov r1, r2", "test").front());
    REQUIRE((ctx.bytes() == std::vector<unsigned char> { 0x04, 0x41, 0x00, 0x00 }));
  }

  SECTION( "bad layouts" ) {
    REQUIRE(table_failure({ { "x", "opcode:0x01 bogus:" } }) == error_kind::unknown_field);
    REQUIRE(table_failure({ { "x", "opcode" } }) == error_kind::unknown_field);
    REQUIRE(table_failure({ { "x", "opcode:0x40" } }) == error_kind::field_range);
    REQUIRE(table_failure({ { "x", "rd:7" } }) == error_kind::register_format);
  }
}

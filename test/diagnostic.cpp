#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

#include <irasm/diagnostic_db.hpp>
#include <irasm/diagnostic.hpp>
#include <irasm/error.hpp>

using namespace irasm;

TEST_CASE( "diagnostic records", "[diagnostic]" ) {

  const source_range range { "prog.s", 5, 3, 9, 3 };

  SECTION( "database entries" ) {
    auto j = diagnostic_db::assembler::field_range(range, 70000, 16, "simm16");

    REQUIRE(j["level"].get<diag_level>() == diag_level::error);
    REQUIRE(j["hrc"] == static_cast<std::uint_fast16_t>(error_kind::field_range));
    REQUIRE(j["message"] == "Value 70000 does not fit the 16-bit field \"simm16\".");
    REQUIRE(j["range"]["module"] == "prog.s");
    REQUIRE(j["range"]["row_beg"] == 3);
    REQUIRE(j["range"]["col_beg"] == 5);
    REQUIRE_FALSE(j.contains("line"));
  }

  SECTION( "levels" ) {
    REQUIRE(mk_diag::warn(range, 1, "w")["level"] == "warn");
    REQUIRE(mk_diag::info(range, "i")["level"] == "info");
    REQUIRE_FALSE(mk_diag::info(range, "i").contains("hrc"));
  }

  SECTION( "kinds print with dashes" ) {
    REQUIRE(nlohmann::json(error_kind::label_redefinition) == "label-redefinition");
    REQUIRE(nlohmann::json(error_kind::undefined_label) == "undefined-label");
  }
}

TEST_CASE( "assembly errors", "[diagnostic]" ) {

  const source_range range { "prog.s", 1, 2, 1, 2 };

  assembly_error err(diagnostic_db::assembler::unknown_mnemonic(range, "nop"));

  REQUIRE(err.kind() == error_kind::unknown_mnemonic);
  REQUIRE(std::string(err.what()) == "Unknown mnemonic \"nop\".");

  err.attach_line("nop r1");
  err.attach_line("something else");
  REQUIRE(err.diag()["line"] == "nop r1");
}

TEST_CASE( "diagnostics manager", "[diagnostic]" ) {

  diagnostic.reset();
  REQUIRE(diagnostic.empty());
  REQUIRE(diagnostic.error_code() == 0);

  const source_range range { "prog.s", 1, 1, 1, 1 };

  diagnostic <<= mk_diag::info(range, "just saying");
  REQUIRE_FALSE(diagnostic.empty());
  REQUIRE(diagnostic.error_code() == 0);

  diagnostic <<= mk_diag::warn(range, 1, "careful");
  REQUIRE(diagnostic.error_code() == 0);

  diagnostic <<= diagnostic_db::assembler::undefined_label(range, "end");
  REQUIRE(diagnostic.error_code() == 1);

  diagnostic.reset();
  REQUIRE(diagnostic.empty());
  REQUIRE(diagnostic.error_code() == 0);
}

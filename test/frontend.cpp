#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

#include <irasm/diagnostic.hpp>
#include <irasm/parameters.hpp>
#include <irasm/frontend.hpp>
#include <irasm/error.hpp>

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>
#include <cstdio>

using namespace irasm;

namespace
{

const char* const input_path = "irasm_frontend_test.s";
const char* const output_path = "irasm_frontend_test.out";

void write_file(const char* path, const std::string& text)
{
  std::ofstream out(path, std::ios::binary);
  out << text;
}

std::string read_file(const char* path)
{
  std::ifstream in(path, std::ios::binary);
  std::stringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

}

TEST_CASE( "parameter sweeps", "[frontend]" ) {

  config_t cfg;
  cfg.base_address = 0x100;
  cfg.int_params.push_back(parameters::parse_int_parameter("imm=1-2"));
  cfg.str_params["target"] = std::string("loop");

  const auto results = frontend::assemble_all("lbl loop\naddi r1, r2, {{ imm }}\nb.t 0, r1, {{ target }}\n", cfg);

  REQUIRE(results.size() == 2);
  REQUIRE(results[0].prog.to_hex() == "00410001a020ffff");
  REQUIRE(results[1].prog.to_hex() == "00410002a020ffff");
  REQUIRE(results[1].prog.labels.at("loop") == 0x100);

  const nlohmann::json j = results[0];
  REQUIRE(j["code"] == "00410001a020ffff");
  REQUIRE(j["labels"]["loop"] == 0x100);
  REQUIRE(j["parameters"]["imm"] == 1);
  REQUIRE(j["parameters"]["target"] == "loop");

  SECTION( "unrolled loops" ) {
    cfg.int_params = { parameters::parse_int_parameter("n=2-3") };
    const auto unrolled = frontend::assemble_all("{% for i in range(n) %}addi r1, r1, {{ i + 1 }}\n{% endfor %}", cfg);

    REQUIRE(unrolled.size() == 2);
    REQUIRE(unrolled[0].prog.to_hex() == "0021000100210002");
    REQUIRE(unrolled[1].prog.to_hex() == "002100010021000200210003");
  }

  SECTION( "the first failing combination is reported" ) {
    cfg.int_params = { parameters::parse_int_parameter("imm=32767-32768") };
    try
    {
      frontend::assemble_all("addi r1, r2, {{ imm }}\n", cfg, "sweep.s");
      FAIL("out of range immediate accepted");
    }
    catch(const assembly_error& err)
    {
      REQUIRE(err.kind() == error_kind::field_range);
      REQUIRE(err.diag()["range"]["module"] == "sweep.s");
    }
  }
}

TEST_CASE( "files", "[frontend]" ) {

  diagnostic.reset();
  write_file(input_path, "lbl loop\naddi r1, r1, {{ imm }}\nb.t 0, r1, loop\n");

  config_t cfg;
  cfg.input_file = input_path;
  cfg.output_file = output_path;

  SECTION( "binary" ) {
    cfg.int_params.push_back(parameters::parse_int_parameter("imm=-1"));
    frontend::run(cfg);

    REQUIRE(diagnostic.error_code() == 0);
    const auto bytes = read_file(output_path);
    REQUIRE(bytes == std::string("\x00\x21\xff\xff\xa0\x20\xff\xff", 8));
  }

  SECTION( "json lines" ) {
    cfg.emit_class = emit_classes::json;
    cfg.int_params.push_back(parameters::parse_int_parameter("imm=1,2,3"));
    frontend::run(cfg);

    REQUIRE(diagnostic.error_code() == 0);
    std::istringstream lines(read_file(output_path));
    std::string line;
    std::size_t count = 0;
    while(std::getline(lines, line))
    {
      auto j = nlohmann::json::parse(line);
      REQUIRE(j.contains("code"));
      REQUIRE(j["parameters"]["imm"] == count + 1);
      ++count;
    }
    REQUIRE(count == 3);
  }

  SECTION( "a binary needs exactly one combination" ) {
    cfg.int_params.push_back(parameters::parse_int_parameter("imm=1,2"));
    frontend::run(cfg);
    REQUIRE(diagnostic.error_code() == 1);
  }

  SECTION( "assembly errors become diagnostics" ) {
    frontend::run(cfg);
    REQUIRE(diagnostic.error_code() == 1);
  }

  SECTION( "missing input" ) {
    cfg.input_file = "irasm_frontend_test.missing";
    frontend::run(cfg);
    REQUIRE(diagnostic.error_code() == 1);
  }

  std::remove(input_path);
  std::remove(output_path);
}

#include <irasm/frontend.hpp>
#include <irasm/diagnostic_db.hpp>
#include <irasm/diagnostic.hpp>
#include <irasm/parameters.hpp>
#include <irasm/assembler.hpp>
#include <irasm/error.hpp>

#include <fmt/format.h>

#include <fstream>
#include <sstream>
#include <memory>
#include <cstdio>
#include <map>

namespace irasm
{
namespace frontend
{

namespace
{

struct file_closer
{
  void operator()(std::FILE* f) const
  {
    if(f != stdout)
      std::fclose(f);
  }
};
using file_ptr = std::unique_ptr<std::FILE, file_closer>;

file_ptr open_output(const std::string& path)
{
  if(path == "-")
    return file_ptr(stdout);
  return file_ptr(std::fopen(path.c_str(), "wb"));
}

void print_labels(std::FILE* f, const assembled& a)
{
  if(!a.parameters.empty())
    fmt::print(f, "parameters: {}\n", parameters_to_json(a.parameters).dump());

  std::map<std::string, std::uint64_t> sorted(a.prog.labels.begin(), a.prog.labels.end());
  fmt::print(f, "labels:\n");
  for(const auto& [name, addr] : sorted)
    fmt::print(f, "  {:<24} 0x{:08x}\n", name, addr);
}

bool write_bin(std::FILE* f, const program& prog)
{
  return std::fwrite(prog.bytes.data(), 1, prog.bytes.size(), f) == prog.bytes.size();
}

bool write_json(std::FILE* f, const std::vector<assembled>& results)
{
  for(const auto& a : results)
  {
    const auto line = nlohmann::json(a).dump() + "\n";
    if(std::fwrite(line.data(), 1, line.size(), f) != line.size())
      return false;
  }
  return true;
}

}

void to_json(nlohmann::json& j, const assembled& a)
{
  j = a.prog;
  j["parameters"] = parameters_to_json(a.parameters);
}

std::vector<assembled> assemble_all(std::string_view tmpl, const config_t& cfg, std::string_view module)
{
  std::vector<assembled> results;

  for(auto& params : parameters::cartesian_product(cfg.int_params, cfg.str_params))
  {
    const auto source = preprocessor::render(tmpl, params, module);
    auto prog = assembler::assemble(source, cfg.base_address, module);

    results.push_back(assembled { std::move(params), std::move(prog) });
  }
  return results;
}

void run(const config_t& cfg)
{
  std::ifstream in(cfg.input_file, std::ios::binary);
  if(!in)
  {
    diagnostic <<= diagnostic_db::frontend::cannot_open_input(source_range::command_line(), cfg.input_file);
    return;
  }
  std::stringstream ss;
  ss << in.rdbuf();
  const auto tmpl = ss.str();

  std::size_t combinations = 1;
  for(const auto& sweep : cfg.int_params)
    combinations *= sweep.values.size();

  if(cfg.emit_class == emit_classes::bin && combinations != 1)
  {
    diagnostic <<= diagnostic_db::frontend::ambiguous_parameters(source_range::command_line(), combinations);
    return;
  }

  std::vector<assembled> results;
  try
  {
    results = assemble_all(tmpl, cfg, cfg.input_file);
  }
  catch(const assembly_error& err)
  {
    diagnostic <<= err.diag();
    return;
  }

  if(cfg.verbose)
  {
    for(const auto& a : results)
      print_labels(stderr, a);
  }

  auto out = open_output(cfg.output_file);
  if(!out)
  {
    diagnostic <<= diagnostic_db::frontend::cannot_open_output(source_range::command_line(), cfg.output_file);
    return;
  }

  const bool written = cfg.emit_class == emit_classes::json
                     ? write_json(out.get(), results)
                     : write_bin(out.get(), results.front().prog);
  if(!written)
    diagnostic <<= diagnostic_db::frontend::cannot_open_output(source_range::command_line(), cfg.output_file);
}

}
}

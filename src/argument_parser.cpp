#include <irasm/arguments_parser.hpp>
#include <irasm/diagnostic_db.hpp>
#include <irasm/diagnostic.hpp>
#include <irasm/parameters.hpp>
#include <irasm/config.hpp>
#include <irasm/error.hpp>

#include <fmt/format.h>

#include <optional>
#include <limits>
#include <iterator>

namespace irasm
{

void print_emit_classes(std::FILE* f)
{
  fmt::print(f, "emit classes: ");

  for(auto it = std::begin(emit_classes_list); it != std::end(emit_classes_list); ++it)
  {
    if(std::next(it) == std::end(emit_classes_list))
      fmt::print(f, "{}\n", nlohmann::json(*it).get<std::string>());
    else
      fmt::print(f, "{}, ", nlohmann::json(*it).get<std::string>());
  }
}

namespace arguments
{

void parse(int argc, const char** argv, std::FILE* out)
{
  using detail::CmdOption;

  std::vector<int_sweep> sweeps;
  parameter_map strings;

  detail::CmdOptions options("irasm", "Two-pass assembler for the iRISC instruction set.");
  options.add_options()
    ("h,?,-help", "Prints this text.", std::make_any<bool>(false), "false", 0,
      [](auto) { return std::make_any<bool>(true); })
    (",i,-input", "Assembly template to read.", std::make_any<std::string>(), "none", 1,
      [](auto x) { return std::make_any<std::string>(x.front()); })
    ("o,-output", "Output file to write to, \"-\" writes to stdout.", std::make_any<std::string>("a.bin"), "a.bin", 1,
      [](auto x) { return std::make_any<std::string>(x.front()); })
    ("b,-base", "Load address of the first instruction, decimal or 0x hex.", std::make_any<std::uint32_t>(0), "0", 1,
      [](auto x)
      {
        auto v = parameters::parse_number(x.front());
        const auto* u = v ? std::get_if<std::uint64_t>(&*v) : nullptr;
        if(u == nullptr || *u > std::numeric_limits<std::uint32_t>::max())
        {
          diagnostic <<= diagnostic_db::args::base_out_of_range(source_range::command_line(), x.front());
          return std::make_any<std::uint32_t>(0);
        }
        return std::make_any<std::uint32_t>(static_cast<std::uint32_t>(*u));
      })
    ("p,-param", "Integer parameter key=v[,v...], v is a number, a range lo-hi or rand8/16/32/64. Repeatable.",
      std::make_any<std::vector<int_sweep>>(), "none", 1,
      [&sweeps](auto x)
      {
        for(auto v : x)
        {
          try
          {
            sweeps.push_back(parameters::parse_int_parameter(v));
          }
          catch(const assembly_error& err)
          {
            diagnostic <<= err.diag();
          }
        }
        return std::make_any<std::vector<int_sweep>>(sweeps);
      })
    ("s,-str", "String parameter key=text. Repeatable.", std::make_any<parameter_map>(), "none", 1,
      [&strings](auto x)
      {
        for(auto v : x)
        {
          try
          {
            auto [key, value] = parameters::parse_string_parameter(v);
            strings[key] = value;
          }
          catch(const assembly_error& err)
          {
            diagnostic <<= err.diag();
          }
        }
        return std::make_any<parameter_map>(strings);
      })
    ("-emit=", "Choose what to emit. Set to \"help\" to get a list.", std::make_any<emit_classes>(emit_classes::bin), "bin", 1,
      [](auto x)
      {
        auto& v = x.front();

        if(v.empty()) return emit_classes::help;

        nlohmann::json easy_conversion = std::string(v);
        if(easy_conversion.get<emit_classes>() != emit_classes::undef)
          return easy_conversion.get<emit_classes>();

        diagnostic <<= diagnostic_db::args::emit_not_present(source_range::command_line(), v);
        return emit_classes::help;
      })
    ("v,-verbose", "Prints the label table of every assembled source.", std::make_any<bool>(false), "false", 0,
      [](auto) { return std::make_any<bool>(true); })
    ;

  auto map = options.parse(argc, argv);

  if(std::any_cast<bool>(map["h"]))
  {
    options.print_help(out);
    config.print_help = true;
  }
  config.verbose = std::any_cast<bool>(map["v"]);
  config.input_file = std::any_cast<std::string>(map["i"]);
  config.output_file = std::any_cast<std::string>(map["o"]);
  config.base_address = std::any_cast<std::uint32_t>(map["b"]);
  config.int_params = std::any_cast<std::vector<int_sweep>>(map["p"]);
  config.str_params = std::any_cast<parameter_map>(map["s"]);
  config.emit_class = std::any_cast<emit_classes>(map["-emit="]);
  if(config.emit_class == emit_classes::help)
  {
    print_emit_classes(out);
    config.print_help = true;
  }

  if(!config.print_help && config.input_file.empty())
    diagnostic <<= diagnostic_db::args::missing_input(source_range::command_line());
}

namespace detail
{

namespace
{

// "h,?,-help" -> {"h", "?", "-help"}, a trailing '=' marks options written as -opt=value
std::vector<std::string_view> split_aliases(std::string_view opt_list, bool& has_equals)
{
  std::vector<std::string_view> opts;
  while(true)
  {
    const auto comma = opt_list.find(',');

    auto opt = opt_list.substr(0, comma);
    if(!opt.empty() && opt.back() == '=')
    {
      opt.remove_suffix(1);
      has_equals = true;
    }
    opts.push_back(opt);

    if(comma == std::string_view::npos)
      break;
    opt_list.remove_prefix(comma + 1);
  }
  return opts;
}

}

CmdOptions::CmdOptionsAdder& CmdOptions::CmdOptionsAdder::operator()(std::string_view opt_list, std::string_view description,
    std::any default_value, std::string_view default_value_str, std::size_t argc, const CmdOption::parser_t& f)
{
  bool has_equals = false;
  auto opts = split_aliases(opt_list, has_equals);

  ot->data.push_back(CmdOption { std::move(opts), description, std::move(default_value), default_value_str,
                                 has_equals ? 1 : argc, f, has_equals });
  return *this;
}

CmdOptions::CmdOptionsAdder CmdOptions::add_options()
{ return { this }; }

struct CmdParse
{
  CmdParse(const std::vector<std::string_view>& args, std::map<std::string, std::any>& map, CmdOptions& cmdopts)
    : args(&args), map(&map), cmdopts(&cmdopts)
  {
    reset_cur_opt();
  }

  operator std::map<std::string, std::any>&()
  { return parse(); }
private:
  void reset_cur_opt()
  {
    cur_opt = std::nullopt;
    implicit = false;

    for(auto& v : cmdopts->data)
    {
      for(auto f : v.opt)
      {
        if(f.empty()) // if we have an implicit argument, make this the initial current option
        {
          cur_opt = v;
          implicit = true;
        }
      }
    }
  }

  std::map<std::string, std::any>& parse()
  {
    for(auto& str : *args)
    {
      if(str.size() > 1 && str[0] == '-')
        parse_option(str);
      else
        parse_arg(str);
    }
    flush();

    return *map;
  }

  void store(const std::any& a)
  {
    for(auto& o : cur_opt->opt)
      (*map)[static_cast<std::string>(o) + (cur_opt->has_equals ? "=" : "")] = a;
  }

  // runs the parser of the current option once it has its arguments
  void flush()
  {
    if(cur_opt.has_value())
    {
      if(cur_opt->argc == 0 || !opt_args.empty())
        store(cur_opt->parser(opt_args));
      else if(!implicit)
        diagnostic <<= diagnostic_db::args::missing_value(source_range::command_line(), cur_opt->opt.back());
    }

    opt_args.clear();
    reset_cur_opt();
  }

  void parse_arg(const std::string_view& str)
  {
    if(!cur_opt.has_value())
    {
      diagnostic <<= diagnostic_db::args::unknown_arg(source_range::command_line(), str);
      return;
    }
    opt_args.push_back(str);

    if(opt_args.size() >= cur_opt->argc)
      flush();
  }

  void parse_option(const std::string_view& str)
  {
    flush();

    cur_opt = std::nullopt;
    implicit = false;
    for(auto& v : cmdopts->data)
    {
      for(auto f : v.opt)
      {
        if(!f.empty() && str.find(f) == 1 && str.size() - 1 == f.size()) // first char of str is `-`, after that it should match
          cur_opt = v;
      }
    }
    if(!cur_opt.has_value())
    {
      diagnostic <<= diagnostic_db::args::unknown_arg(source_range::command_line(), str);
      return;
    }
    if(cur_opt->argc == 0)
      flush();
  }

private:
  const std::vector<std::string_view>* args;
  std::map<std::string, std::any>* map; // <- not a string_view, since we need to append '=' sometimes

  CmdOptions* cmdopts;

  std::vector<std::string_view> opt_args;
  std::optional<CmdOption> cur_opt;
  bool implicit { false };
};

std::map<std::string, std::any> CmdOptions::parse(int argc, const char** argv)
{
  std::map<std::string, std::any> map;
  for(const auto& v : data)
  {
    for(auto f : v.opt)
      map[std::string(f) + (v.has_equals ? "=" : "")] = v.default_value;
  }

  // options are split at their first '=', e.g. --emit=json becomes --emit json
  std::vector<std::string_view> args;
  for(int i = 1; i < argc; ++i)
  {
    const std::string_view arg = argv[i];
    const auto eq = arg.find('=');
    if(arg.size() > 1 && arg.front() == '-' && eq != std::string_view::npos)
    {
      args.push_back(arg.substr(0, eq));
      args.push_back(arg.substr(eq + 1));
    }
    else
      args.push_back(arg);
  }

  return CmdParse(args, map, *this);
}

void CmdOptions::print_help(std::FILE* f) const
{
  fmt::print(f, "{}  -  {}\n", name, description);

  for(auto& v : data)
  {
    std::string args;
    for(auto o : v.opt)
    {
      if(o.empty())
        continue;
      if(!args.empty())
        args += " or ";
      args += "-";
      args += o;
      if(v.has_equals)
        args += "=";
    }
    fmt::print(f, "  {:<28} {} [default={}]\n", args, v.description, v.default_value_str);
  }
}

}

}
}

#pragma once

#include <string_view>
#include <functional>
#include <cstdio>
#include <string>
#include <vector>
#include <any>
#include <map>

namespace irasm
{
namespace arguments
{

/// Fills `config` from the command line. Problems are reported to `diagnostic`.
void parse(int argc, const char** argv, std::FILE* out);

namespace detail
{

  struct CmdOption
  {
    using parser_t = std::function<std::any(const std::vector<std::string_view>&)>;

    std::vector<std::string_view> opt;
    std::string_view description;
    std::any default_value;
    std::string_view default_value_str;
    std::size_t argc; // arguments taken before falling back to the implicit option
    parser_t parser;
    bool has_equals;
  };

  struct CmdOptions
  {
  private:
    struct CmdOptionsAdder
    {
      CmdOptionsAdder& operator()(std::string_view opts, std::string_view description,
                                  std::any default_value, std::string_view default_value_str,
                                  std::size_t argc, const CmdOption::parser_t& f);

      CmdOptions* ot;
    };
    friend struct CmdParse;
  public:
    CmdOptions(std::string_view name, std::string_view description)
      : name(name), description(description)
    {  }

    CmdOptionsAdder add_options();

    std::map<std::string, std::any> parse(int argc, const char** argv);

    void print_help(std::FILE* f) const;
  private:
    std::string_view name;
    std::string_view description;

    std::vector<CmdOption> data;
  };

}

}
}

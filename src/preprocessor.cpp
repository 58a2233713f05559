#include <irasm/preprocessor.hpp>
#include <irasm/diagnostic_db.hpp>
#include <irasm/source_range.hpp>
#include <irasm/error.hpp>

#include <fmt/format.h>
#include <inja/inja.hpp>

#include <optional>

namespace irasm
{

namespace
{

// inja reports unknown names as "variable 'name' not found"
std::optional<std::string_view> missing_variable(std::string_view message)
{
  constexpr std::string_view prefix = "variable '";
  constexpr std::string_view suffix = "' not found";

  if(message.size() <= prefix.size() + suffix.size()
  || message.substr(0, prefix.size()) != prefix
  || message.substr(message.size() - suffix.size()) != suffix)
    return std::nullopt;
  return message.substr(prefix.size(), message.size() - prefix.size() - suffix.size());
}

}

parameter_value make_integer(std::int64_t value)
{
  if(value < 0)
    return value;
  return static_cast<std::uint64_t>(value);
}

std::string to_string(const parameter_value& value)
{
  return std::visit([](const auto& v) { return fmt::format("{}", v); }, value);
}

nlohmann::json parameters_to_json(const parameter_map& params)
{
  nlohmann::json j = nlohmann::json::object();
  for(const auto& [key, value] : params)
    std::visit([&j, &key = key](const auto& v) { j[key] = v; }, value);
  return j;
}

std::string preprocessor::render(std::string_view tmpl, const parameter_map& params, std::string_view module)
{
  inja::Environment env;
  // '#' starts an assembly comment, so "##" must stay plain text
  env.set_line_statement("%%");

  try
  {
    return env.render(std::string(tmpl), parameters_to_json(params));
  }
  catch(const inja::InjaError& err)
  {
    const std::string_view message = err.message;
    if(auto name = missing_variable(message); name && err.type == "render_error")
    {
      const auto loc = source_range::on_row(module, err.location.line, err.location.column, name->size());
      throw assembly_error(diagnostic_db::preprocessor::undefined_parameter(loc, *name));
    }
    const auto loc = source_range::on_row(module, err.location.line, err.location.column, 1);
    throw assembly_error(diagnostic_db::preprocessor::template_error(loc, message));
  }
}

}

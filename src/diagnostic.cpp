#include <irasm/diagnostic.hpp>

#include <fmt/format.h>
#include <fmt/color.h>

#include <cassert>

namespace irasm
{

namespace mk_diag
{

namespace
{

nlohmann::json record(const source_range& range, diag_level level, const std::string_view& message)
{
  nlohmann::json j;

  j["range"] = range;
  j["level"] = level;
  j["message"] = message;

  return j;
}

}

nlohmann::json warn(const source_range& range,
                    std::uint_fast16_t hrc, const std::string_view& message)
{
  auto j = record(range, diag_level::warn, message);
  j["hrc"] = hrc;
  return j;
}

nlohmann::json error(const source_range& range,
                     std::uint_fast16_t hrc, const std::string_view& message)
{
  auto j = record(range, diag_level::error, message);
  j["hrc"] = hrc;
  return j;
}

nlohmann::json info(const source_range& range, const std::string_view& message)
{ return record(range, diag_level::info, message); }

}

diagnostics_manager::~diagnostics_manager()
{ assert(printed && "Messages have been printed."); }

diagnostics_manager& diagnostics_manager::operator<<=(const nlohmann::json& msg)
{
  std::lock_guard<std::mutex> guard(mut);

  if(msg["level"].get<diag_level>() == diag_level::error)
    err = 1;

  const auto& range = msg["range"];
  detail::position pos { range["module"].get<std::string>(),
                         range["row_beg"].get<std::size_t>(),
                         range["col_beg"].get<std::size_t>() };

  auto it = data.find(pos);
  if(it == data.end())
  {
    order.push_back(pos);
    data[pos].push_back(msg);
  }
  else
    it.value().push_back(msg);

  return *this;
}

namespace
{

void print_location(std::FILE* file, const nlohmann::json& range)
{
  const auto module = range["module"].get<std::string>();
  const auto row = range["row_beg"].get<std::size_t>();

  if(row == 0)
    fmt::print(file, fmt::emphasis::bold | fg(fmt::color::white), "{}: ", module);
  else
    fmt::print(file, fmt::emphasis::bold | fg(fmt::color::white), "{}:{}:{}: ",
               module, row, range["col_beg"].get<std::size_t>());
}

void print_level(std::FILE* file, const nlohmann::json& v)
{
  switch(v["level"].get<diag_level>())
  {
  default:
  case diag_level::error:
    fmt::print(file, fg(fmt::color::cornsilk), "(IA-{}) ", v["hrc"].get<std::uint_fast16_t>());
    fmt::print(file, fmt::emphasis::bold | fg(fmt::color::red), "error: ");
    break;

  case diag_level::warn:
    fmt::print(file, fg(fmt::color::cornsilk), "(IA-{}) ", v["hrc"].get<std::uint_fast16_t>());
    fmt::print(file, fmt::emphasis::bold | fg(fmt::color::alice_blue), "warning: ");
    break;

  case diag_level::info:
    fmt::print(file, fmt::emphasis::bold | fg(fmt::color::gray), "info: ");
    break;
  }
}

// the offending source line, prefixed with its row
void print_line(std::FILE* file, const nlohmann::json& v)
{
  if(!v.contains("line"))
    return;

  fmt::print(file, fg(fmt::color::sandy_brown), "\n {:>7} | ", v["range"]["row_beg"].get<std::size_t>());
  fmt::print(file, "{}", v["line"].get<std::string>());
}

}

void diagnostics_manager::print(std::FILE* file)
{
  if(printed)
    return;
  std::lock_guard<std::mutex> guard(mut);

  // reported in the order the positions were first seen
  for(auto& pos : order)
  {
    for(auto& v : data[pos])
    {
      print_location(file, v["range"]);
      print_level(file, v);
      fmt::print(file, fmt::emphasis::bold | fg(fmt::color::white), "{}", v["message"].get<std::string>());
      print_line(file, v);
      fmt::print(file, "\n");
    }
  }
  printed = true;
}

int diagnostics_manager::error_code() const
{
  return err;
}

}

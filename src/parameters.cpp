#include <irasm/parameters.hpp>
#include <irasm/diagnostic_db.hpp>
#include <irasm/error.hpp>

#include <charconv>
#include <utility>
#include <limits>
#include <cstdint>
#include <random>

using namespace std::literals::string_view_literals;

namespace irasm
{

namespace
{

std::uint64_t random_bits(unsigned bits)
{
  static std::mt19937_64 rng { std::random_device{}() };

  const auto v = rng();
  if(bits >= 64)
    return v;
  return v & ((std::uint64_t { 1 } << bits) - 1);
}

std::optional<unsigned> random_width(std::string_view text)
{
  if(text == "rand8"sv)  return 8;
  if(text == "rand16"sv) return 16;
  if(text == "rand32"sv) return 32;
  if(text == "rand64"sv) return 64;
  return std::nullopt;
}

parameter_value number_or_throw(std::string_view text)
{
  auto v = parameters::parse_number(text);
  if(!v)
    throw assembly_error(diagnostic_db::parameters::not_a_value(source_range::command_line(), text));
  return *v;
}

// inclusive, negative bounds are int64 and everything else uint64
void append_range(std::vector<parameter_value>& out, parameter_value lo, const parameter_value& hi, std::string_view text)
{
  if(const auto* l = std::get_if<std::int64_t>(&lo))
  {
    const auto* h = std::get_if<std::int64_t>(&hi);
    const std::int64_t last = h ? *h : -1;
    if(*l > last)
      throw assembly_error(diagnostic_db::parameters::empty_range(source_range::command_line(), text));

    for(std::int64_t v = *l; ; ++v)
    {
      out.push_back(v);
      if(v == last)
        break;
    }
    if(h)
      return;
    lo = std::uint64_t { 0 };
  }

  const auto* h = std::get_if<std::uint64_t>(&hi);
  const auto l = std::get<std::uint64_t>(lo);
  if(h == nullptr || l > *h)
    throw assembly_error(diagnostic_db::parameters::empty_range(source_range::command_line(), text));

  for(std::uint64_t v = l; ; ++v)
  {
    out.push_back(v);
    if(v == *h)
      break;
  }
}

std::pair<std::string_view, std::string_view> split_key_value(std::string_view arg)
{
  const auto eq = arg.find('=');
  if(eq == std::string_view::npos || eq == 0)
    throw assembly_error(diagnostic_db::parameters::not_key_value(source_range::command_line(), arg));
  return { arg.substr(0, eq), arg.substr(eq + 1) };
}

}

namespace parameters
{

std::optional<parameter_value> parse_number(std::string_view text)
{
  const bool negative = !text.empty() && text.front() == '-';
  if(!text.empty() && (text.front() == '-' || text.front() == '+'))
    text.remove_prefix(1);

  int base = 10;
  if(text.size() > 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X'))
  {
    base = 16;
    text.remove_prefix(2);
  }
  if(text.empty() || text.front() == '-' || text.front() == '+')
    return std::nullopt;

  std::uint64_t magnitude = 0;
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), magnitude, base);
  if(ec != std::errc() || ptr != text.data() + text.size())
    return std::nullopt;

  if(!negative)
    return magnitude;

  constexpr auto limit = std::uint64_t { 1 } << 63;
  if(magnitude > limit)
    return std::nullopt;
  if(magnitude == limit)
    return parameter_value { std::numeric_limits<std::int64_t>::min() };
  return make_integer(-static_cast<std::int64_t>(magnitude));
}

int_sweep parse_int_parameter(std::string_view arg)
{
  const auto [key, list] = split_key_value(arg);

  int_sweep sweep { std::string(key), {} };

  std::size_t beg = 0;
  while(true)
  {
    auto comma = list.find(',', beg);
    const auto end = comma == std::string_view::npos ? list.size() : comma;
    const auto value = list.substr(beg, end - beg);

    if(auto width = random_width(value))
      sweep.values.push_back(random_bits(*width));
    else if(auto dash = value.find('-', 1); dash != std::string_view::npos)
      append_range(sweep.values, number_or_throw(value.substr(0, dash)),
                                 number_or_throw(value.substr(dash + 1)), value);
    else
      sweep.values.push_back(number_or_throw(value));

    if(comma == std::string_view::npos)
      break;
    beg = comma + 1;
  }

  return sweep;
}

std::pair<std::string, std::string> parse_string_parameter(std::string_view arg)
{
  const auto [key, value] = split_key_value(arg);
  return { std::string(key), std::string(value) };
}

std::vector<parameter_map> cartesian_product(const std::vector<int_sweep>& sweeps, const parameter_map& fixed)
{
  std::vector<parameter_map> rows { fixed };

  for(const auto& sweep : sweeps)
  {
    std::vector<parameter_map> next;
    next.reserve(rows.size() * sweep.values.size());

    for(const auto& row : rows)
    {
      for(const auto& value : sweep.values)
      {
        auto extended = row;
        extended[sweep.key] = value;
        next.push_back(std::move(extended));
      }
    }
    rows = std::move(next);
  }
  return rows;
}

}

}

#include <irasm/operand.hpp>

#include <algorithm>
#include <charconv>
#include <limits>
#include <cctype>

namespace irasm
{

namespace
{

bool all_digits(std::string_view str, int base)
{
  return !str.empty() && std::all_of(str.begin(), str.end(), [base](char c)
  {
    const auto u = static_cast<unsigned char>(c);
    return base == 16 ? std::isxdigit(u) != 0 : std::isdigit(u) != 0;
  });
}

std::optional<std::uint64_t> parse_magnitude(std::string_view digits, int base)
{
  std::uint64_t value = 0;
  auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value, base);

  if(ec == std::errc::result_out_of_range)
    return std::numeric_limits<std::uint64_t>::max();
  if(ec != std::errc() || ptr != digits.data() + digits.size())
    return std::nullopt;
  return value;
}

}

std::optional<std::int64_t> parse_immediate(std::string_view text)
{
  const bool negative = !text.empty() && text.front() == '-';
  if(!text.empty() && (text.front() == '-' || text.front() == '+'))
    text.remove_prefix(1);

  std::optional<std::uint64_t> magnitude;
  if(text.size() > 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X'))
  {
    if(all_digits(text.substr(2), 16))
      magnitude = parse_magnitude(text.substr(2), 16);
  }
  else if(all_digits(text, 10))
    magnitude = parse_magnitude(text, 10);
  else if(all_digits(text, 16))
    magnitude = parse_magnitude(text, 16);

  if(!magnitude)
    return std::nullopt;

  constexpr auto max = static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());
  if(negative)
  {
    if(*magnitude > max)
      return std::numeric_limits<std::int64_t>::min();
    return -static_cast<std::int64_t>(*magnitude);
  }
  return static_cast<std::int64_t>(std::min(*magnitude, max));
}

operand operand::parse(std::string_view text, const source_range& loc)
{
  operand op { std::string(text), label_ref{}, loc };

  if(text == "zero")
    op.value = reg { 0 };
  else if(text.size() > 1 && text.front() == 'r' && all_digits(text.substr(1), 10))
    op.value = reg { parse_magnitude(text.substr(1), 10).value_or(std::numeric_limits<std::uint64_t>::max()) };
  else if(auto imm = parse_immediate(text))
    op.value = immediate { *imm };

  return op;
}

}

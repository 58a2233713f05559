#include <irasm/program.hpp>

#include <fmt/format.h>

#include <iterator>
#include <map>

namespace irasm
{

std::string program::to_hex() const
{
  std::string hex;
  hex.reserve(bytes.size() * 2);

  for(auto b : bytes)
    fmt::format_to(std::back_inserter(hex), "{:02x}", b);

  return hex;
}

void to_json(nlohmann::json& j, const program& p)
{
  std::map<std::string, std::uint64_t> sorted(p.labels.begin(), p.labels.end());

  j = nlohmann::json{
    { "code", p.to_hex() },
    { "labels", sorted },
  };
}

}

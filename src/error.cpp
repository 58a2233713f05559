#include <irasm/error.hpp>

#include <string>

namespace irasm
{

assembly_error::assembly_error(const nlohmann::json& record)
  : std::runtime_error(record["message"].get<std::string>()), record(record)
{  }

error_kind assembly_error::kind() const
{ return static_cast<error_kind>(record["hrc"].get<std::uint_fast16_t>()); }

void assembly_error::attach_line(std::string_view line)
{
  if(!record.contains("line"))
    record["line"] = std::string(line);
}

}

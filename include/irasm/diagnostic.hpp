#pragma once

#include <irasm/source_range.hpp>

#include <tsl/robin_map.h>
#include <nlohmann/json.hpp>

#include <string_view>
#include <functional>
#include <cstdio>
#include <string>
#include <vector>
#include <mutex>

namespace irasm
{

enum class diag_level : unsigned char
{
  error = 1,
  info  = 1 << 1,
  warn  = 1 << 2,
};

NLOHMANN_JSON_SERIALIZE_ENUM( diag_level, {
  { diag_level::error, "error" },
  { diag_level::info, "info" },
  { diag_level::warn, "warn" },
})

namespace mk_diag
{
nlohmann::json error(const source_range& range,
                     std::uint_fast16_t hrc, const std::string_view& message);

nlohmann::json warn(const source_range& range,
                    std::uint_fast16_t hrc, const std::string_view& message);

nlohmann::json info(const source_range& range, const std::string_view& message);
}

namespace detail
{
  /// Diagnostics reported at the same place are printed together.
  struct position
  {
    std::string module;
    std::size_t row;
    std::size_t col;

    bool operator==(const position& other) const
    { return row == other.row && col == other.col && module == other.module; }
  };

  struct position_hash
  {
    std::size_t operator()(const position& p) const
    {
      std::size_t h = std::hash<std::string>()(p.module);
      h ^= std::hash<std::size_t>()(p.row) + 0x9e3779b9 + (h << 6) + (h >> 2);
      h ^= std::hash<std::size_t>()(p.col) + 0x9e3779b9 + (h << 6) + (h >> 2);
      return h;
    }
  };
}

struct diagnostics_manager
{
private:
  diagnostics_manager()  {  }
public:
  ~diagnostics_manager();

  static diagnostics_manager& make()
  {
    static diagnostics_manager diag;
    return diag;
  }

  diagnostics_manager& operator<<=(const nlohmann::json& msg);

  bool empty() const { return data.empty(); }

  void print(std::FILE* file);
  int error_code() const;

  inline void reset() { err = 0; data.clear(); order.clear(); }
private:
  tsl::robin_map<detail::position, std::vector<nlohmann::json>, detail::position_hash> data;
  std::vector<detail::position> order;

  int err { 0 };
  std::mutex mut;

#ifndef IRASM_TESTING
  bool printed { false };
#else
  bool printed { true  };
#endif
};

inline diagnostics_manager& diagnostic = diagnostics_manager::make();

}

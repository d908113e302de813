#pragma once

#include <veneer/dom/log.hpp>

#include <cstddef>
#include <cstdlib>
#include <string>
#include <string_view>

namespace veneer::dom {

struct Config {
  // Element ids cross the host boundary as id_prefix + dom_id.
  std::string id_prefix{"vn-"};
  bool coalesce_mutations{true};
  std::size_t html_reserve{1 << 10};
  LogLevel log_level{LogLevel::Warn};
};

inline bool parse_env_bool(std::string_view s, bool fallback) {
  if (s == "1" || s == "true" || s == "on" || s == "yes") {
    return true;
  }
  if (s == "0" || s == "false" || s == "off" || s == "no") {
    return false;
  }
  return fallback;
}

// Applies VENEER_ID_PREFIX, VENEER_COALESCE and VENEER_LOG on top of base and
// installs the resulting log level.
inline Config config_from_env(Config base = {}) {
  if (const char *e = std::getenv("VENEER_ID_PREFIX"); e && *e) {
    base.id_prefix = e;
  }
  if (const char *e = std::getenv("VENEER_COALESCE"); e && *e) {
    base.coalesce_mutations = parse_env_bool(e, base.coalesce_mutations);
  }
  if (const char *e = std::getenv("VENEER_LOG"); e && *e) {
    LogLevel level{};
    if (parse_log_level(e, level)) {
      base.log_level = level;
    } else {
      VENEER_LOG_WARN("ignoring unknown VENEER_LOG value '%s'", e);
    }
  }
  set_log_level(base.log_level);
  return base;
}

} // namespace veneer::dom

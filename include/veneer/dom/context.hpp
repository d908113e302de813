#pragma once

#include <veneer/dom/config.hpp>
#include <veneer/dom/interner.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

namespace veneer::dom {

using DomId = std::uint64_t;

// Name of the attribute that carries the element identifier in serialized
// HTML. Reserved: trees may not set it themselves.
inline constexpr std::string_view dom_id_attribute = "id";

inline std::string format_dom_id(std::string_view prefix, DomId id) {
  std::string out;
  out.reserve(prefix.size() + 20);
  out.append(prefix);
  out += std::to_string(id);
  return out;
}

// Explicitly created engine state shared by tree construction, diffing and
// patch application. One per document; single-threaded.
class Context {
public:
  explicit Context(Config config = {})
      : config_{std::move(config)},
        reserved_key_{interner_.intern(dom_id_attribute)} {}

  Context(const Context &) = delete;
  Context &operator=(const Context &) = delete;

  Interner &interner() noexcept { return interner_; }
  const Interner &interner() const noexcept { return interner_; }

  const Config &config() const noexcept { return config_; }

  Handle intern(std::string_view s) { return interner_.intern(s); }

  std::string_view str(Handle h) const { return interner_.str(h); }

  Handle reserved_key() const noexcept { return reserved_key_; }

  DomId allocate_id() noexcept { return next_id_++; }

  // Keeps id away from allocate_id, for containers the page numbered itself.
  void reserve_id(DomId id) noexcept {
    if (id >= next_id_) {
      next_id_ = id + 1;
    }
  }

  DomId peek_next_id() const noexcept { return next_id_; }

  std::string dom_id_string(DomId id) const {
    return format_dom_id(config_.id_prefix, id);
  }

private:
  Interner interner_;
  Config config_;
  Handle reserved_key_{};
  DomId next_id_{1};
};

} // namespace veneer::dom

#pragma once

#include <veneer/dom/host.hpp>
#include <veneer/dom/json.hpp>
#include <veneer/dom/log.hpp>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace veneer::dom {

using ListenerId = std::uint64_t;

struct DelegatedEvent {
  std::string type;
  std::string selector;
  AttributeSnapshot attrs;
};

using EventHandler = std::function<void(const DelegatedEvent &)>;

struct DispatchResult {
  std::size_t handlers_called{};
  std::string error;
  bool ok{};
};

// Delegated event routing. Each distinct (type, selector) pair owns exactly
// one native listener at the document root, however many handlers and
// elements it serves.
class EventRegistry {
public:
  explicit EventRegistry(EventHost &host) : host_{&host} {}

  EventRegistry(const EventRegistry &) = delete;
  EventRegistry &operator=(const EventRegistry &) = delete;

  ~EventRegistry() {
    for (const auto &kv : pairs_) {
      host_->unregister_listener(kv.first.first, kv.first.second);
    }
  }

  // Returns true when a native listener was installed, false when the pair
  // was already registered.
  bool register_pair(const std::string &type, const std::string &selector) {
    bool installed = false;
    ensure(type, selector, &installed).pinned = true;
    return installed;
  }

  // Drops the native listener and every handler of the pair. Unknown pairs
  // are ignored.
  bool unregister_pair(const std::string &type, const std::string &selector) {
    const auto it = pairs_.find(Key{type, selector});
    if (it == pairs_.end()) {
      return false;
    }
    pairs_.erase(it);
    host_->unregister_listener(type, selector);
    VENEER_LOG_DEBUG("unregistered %s '%s'", type.c_str(), selector.c_str());
    return true;
  }

  ListenerId add_listener(const std::string &type, const std::string &selector,
                          EventHandler handler) {
    auto &entry = ensure(type, selector);
    const auto id = ++next_id_;
    entry.handlers.push_back(Handler{id, std::move(handler)});
    return id;
  }

  // The native listener goes away with the last handler, unless the pair was
  // registered on its own.
  bool remove_listener(ListenerId id) {
    for (auto it = pairs_.begin(); it != pairs_.end(); ++it) {
      auto &handlers = it->second.handlers;
      const auto h = std::find_if(handlers.begin(), handlers.end(),
                                  [&](const Handler &x) { return x.id == id; });
      if (h == handlers.end()) {
        continue;
      }
      handlers.erase(h);
      if (handlers.empty() && !it->second.pinned) {
        const auto key = it->first;
        pairs_.erase(it);
        host_->unregister_listener(key.first, key.second);
      }
      return true;
    }
    return false;
  }

  // Entry point for events caught by the host. attrs_json is the attribute
  // snapshot of the matched element.
  DispatchResult delegate(std::string_view type, std::string_view selector,
                          std::string_view attrs_json) {
    DispatchResult out;
    const auto it = pairs_.find(Key{std::string{type}, std::string{selector}});
    if (it == pairs_.end()) {
      out.error = "no listener for " + std::string{type} + " '" +
                  std::string{selector} + "'";
      VENEER_LOG_WARN("%s", out.error.c_str());
      return out;
    }

    auto snapshot = parse_attribute_snapshot(attrs_json);
    if (!snapshot.ok) {
      const auto &e = snapshot.errors.empty() ? JsonError{0, 0, "invalid"}
                                              : snapshot.errors.front();
      out.error = "bad attribute snapshot at " + std::to_string(e.line) + ":" +
                  std::to_string(e.column) + ": " + e.message;
      VENEER_LOG_WARN("%s", out.error.c_str());
      return out;
    }

    DelegatedEvent ev{std::string{type}, std::string{selector},
                      std::move(snapshot.attrs)};
    // Handlers may add or remove listeners while running.
    const auto handlers = it->second.handlers;
    for (const auto &h : handlers) {
      if (h.fn) {
        h.fn(ev);
        ++out.handlers_called;
      }
    }
    out.ok = true;
    return out;
  }

  bool is_registered(const std::string &type,
                     const std::string &selector) const {
    return pairs_.find(Key{type, selector}) != pairs_.end();
  }

  std::size_t native_listener_count() const noexcept { return pairs_.size(); }

  std::size_t handler_count(const std::string &type,
                            const std::string &selector) const {
    const auto it = pairs_.find(Key{type, selector});
    return it == pairs_.end() ? 0 : it->second.handlers.size();
  }

private:
  using Key = std::pair<std::string, std::string>;

  struct Handler {
    ListenerId id{};
    EventHandler fn;
  };

  struct Entry {
    std::vector<Handler> handlers;
    bool pinned{};
  };

  Entry &ensure(const std::string &type, const std::string &selector,
               bool *installed = nullptr) {
    auto [it, inserted] = pairs_.try_emplace(Key{type, selector});
    if (inserted) {
      host_->register_listener(type, selector);
      VENEER_LOG_DEBUG("registered %s '%s'", type.c_str(), selector.c_str());
    }
    if (installed) {
      *installed = inserted;
    }
    return it->second;
  }

  EventHost *host_{};
  std::map<Key, Entry> pairs_;
  ListenerId next_id_{};
};

} // namespace veneer::dom

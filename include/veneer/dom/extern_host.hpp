#pragma once

#include <veneer/dom/host.hpp>

#include <cstdlib>
#include <optional>
#include <string>

// Implemented by the host page (web/veneer_host.js). Mutators return 0 on
// success and non-zero when no element carries the id.
extern "C" {
int veneer_set_outer_html(const char *id, const char *html);
int veneer_set_inner_html(const char *id, const char *html);
// Heap buffer owned by the caller, null when the element does not exist.
char *veneer_get_inner_html(const char *id);
int veneer_append(const char *id, const char *html);
int veneer_prepend(const char *id, const char *html);
int veneer_insert_before(const char *id, const char *html);
int veneer_insert_after(const char *id, const char *html);
int veneer_remove(const char *id);
int veneer_set_attr(const char *id, const char *key, const char *value);
int veneer_remove_attr(const char *id, const char *key);
void veneer_register_listener(const char *type, const char *selector);
void veneer_unregister_listener(const char *type, const char *selector);
}

namespace veneer::dom {

class ExternHost final : public DomHost, public EventHost {
public:
  bool set_outer_html(const std::string &id, const std::string &html) override {
    return veneer_set_outer_html(id.c_str(), html.c_str()) == 0;
  }

  bool set_inner_html(const std::string &id, const std::string &html) override {
    return veneer_set_inner_html(id.c_str(), html.c_str()) == 0;
  }

  std::optional<std::string> get_inner_html(const std::string &id) override {
    char *buf = veneer_get_inner_html(id.c_str());
    if (!buf) {
      return std::nullopt;
    }
    std::string out{buf};
    std::free(buf);
    return out;
  }

  bool append(const std::string &id, const std::string &html) override {
    return veneer_append(id.c_str(), html.c_str()) == 0;
  }

  bool prepend(const std::string &id, const std::string &html) override {
    return veneer_prepend(id.c_str(), html.c_str()) == 0;
  }

  bool insert_before(const std::string &id, const std::string &html) override {
    return veneer_insert_before(id.c_str(), html.c_str()) == 0;
  }

  bool insert_after(const std::string &id, const std::string &html) override {
    return veneer_insert_after(id.c_str(), html.c_str()) == 0;
  }

  bool remove(const std::string &id) override {
    return veneer_remove(id.c_str()) == 0;
  }

  bool set_attr(const std::string &id, const std::string &key,
                const std::string &value) override {
    return veneer_set_attr(id.c_str(), key.c_str(), value.c_str()) == 0;
  }

  bool remove_attr(const std::string &id, const std::string &key) override {
    return veneer_remove_attr(id.c_str(), key.c_str()) == 0;
  }

  void register_listener(const std::string &type,
                         const std::string &selector) override {
    veneer_register_listener(type.c_str(), selector.c_str());
  }

  void unregister_listener(const std::string &type,
                           const std::string &selector) override {
    veneer_unregister_listener(type.c_str(), selector.c_str());
  }
};

} // namespace veneer::dom

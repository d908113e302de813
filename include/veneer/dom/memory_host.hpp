#pragma once

#include <veneer/dom/host.hpp>
#include <veneer/dom/html.hpp>
#include <veneer/dom/json.hpp>
#include <veneer/dom/log.hpp>
#include <veneer/dom/node.hpp>

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace veneer::dom {

// Node of the in-memory document. Attribute values are stored decoded; an
// empty value serializes as a bare attribute name.
struct MemoryNode {
  bool is_text{};
  std::string tag;
  std::vector<std::pair<std::string, std::string>> attrs;
  std::string text;
  std::vector<std::unique_ptr<MemoryNode>> children;
  MemoryNode *parent{};

  const std::string *attr(std::string_view name) const {
    for (const auto &kv : attrs) {
      if (kv.first == name) {
        return &kv.second;
      }
    }
    return nullptr;
  }

  void set_attr(std::string name, std::string value) {
    for (auto &kv : attrs) {
      if (kv.first == name) {
        kv.second = std::move(value);
        return;
      }
    }
    attrs.emplace_back(std::move(name), std::move(value));
  }

  bool remove_attr(std::string_view name) {
    const auto it = std::find_if(attrs.begin(), attrs.end(),
                                 [&](const auto &kv) { return kv.first == name; });
    if (it == attrs.end()) {
      return false;
    }
    attrs.erase(it);
    return true;
  }
};

using MemoryNodes = std::vector<std::unique_ptr<MemoryNode>>;

namespace detail {

inline bool is_html_space(char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f';
}

inline char ascii_lower(char c) {
  return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

inline void decode_entities(std::string &out, std::string_view s) {
  std::size_t i = 0;
  while (i < s.size()) {
    const char c = s[i];
    if (c != '&') {
      out.push_back(c);
      ++i;
      continue;
    }
    const auto semi = s.find(';', i);
    if (semi == std::string_view::npos || semi - i > 10) {
      out.push_back(c);
      ++i;
      continue;
    }
    const auto name = s.substr(i + 1, semi - i - 1);
    bool known = true;
    if (name == "amp") {
      out.push_back('&');
    } else if (name == "lt") {
      out.push_back('<');
    } else if (name == "gt") {
      out.push_back('>');
    } else if (name == "quot") {
      out.push_back('"');
    } else if (name == "apos") {
      out.push_back('\'');
    } else if (name.size() > 1 && name[0] == '#') {
      std::uint32_t cp = 0;
      const bool hex = name[1] == 'x' || name[1] == 'X';
      const auto digits = name.substr(hex ? 2 : 1);
      known = !digits.empty();
      for (const char d : digits) {
        std::uint32_t v = 0;
        if (d >= '0' && d <= '9') {
          v = static_cast<std::uint32_t>(d - '0');
        } else if (hex && d >= 'a' && d <= 'f') {
          v = static_cast<std::uint32_t>(d - 'a' + 10);
        } else if (hex && d >= 'A' && d <= 'F') {
          v = static_cast<std::uint32_t>(d - 'A' + 10);
        } else {
          known = false;
          break;
        }
        cp = cp * (hex ? 16 : 10) + v;
      }
      if (known) {
        append_utf8(out, cp > 0x10FFFF ? 0xFFFD : cp);
      }
    } else {
      known = false;
    }
    if (!known) {
      out.push_back(c);
      ++i;
      continue;
    }
    i = semi + 1;
  }
}

// Fragment parser for the markup the engine emits: elements, quoted or bare
// attributes, character references, void elements and comments. Stray end
// tags are ignored and open elements are closed at the end of input.
class FragmentParser {
public:
  explicit FragmentParser(std::string_view s) : s_{s} {}

  MemoryNodes parse() {
    MemoryNode root;
    std::vector<MemoryNode *> stack{&root};
    while (i_ < s_.size()) {
      if (s_[i_] != '<') {
        parse_text(*stack.back());
        continue;
      }
      if (s_.substr(i_, 4) == "<!--") {
        const auto end = s_.find("-->", i_ + 4);
        i_ = end == std::string_view::npos ? s_.size() : end + 3;
        continue;
      }
      if (s_.substr(i_, 2) == "</") {
        close_tag(stack);
        continue;
      }
      if (i_ + 1 < s_.size() && is_name_start(s_[i_ + 1])) {
        open_tag(stack);
        continue;
      }
      // A lone '<' is text.
      append_text(*stack.back(), "<");
      ++i_;
    }
    for (auto &c : root.children) {
      c->parent = nullptr;
    }
    return std::move(root.children);
  }

private:
  static bool is_name_start(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
  }

  static void append_text(MemoryNode &parent, std::string_view decoded) {
    if (!parent.children.empty() && parent.children.back()->is_text) {
      parent.children.back()->text.append(decoded);
      return;
    }
    auto t = std::make_unique<MemoryNode>();
    t->is_text = true;
    t->text = std::string{decoded};
    t->parent = &parent;
    parent.children.push_back(std::move(t));
  }

  void parse_text(MemoryNode &parent) {
    auto end = s_.find('<', i_);
    if (end == std::string_view::npos) {
      end = s_.size();
    }
    std::string decoded;
    decode_entities(decoded, s_.substr(i_, end - i_));
    append_text(parent, decoded);
    i_ = end;
  }

  std::string read_name() {
    std::string name;
    while (i_ < s_.size()) {
      const char c = s_[i_];
      if (is_html_space(c) || c == '>' || c == '/' || c == '=') {
        break;
      }
      name.push_back(ascii_lower(c));
      ++i_;
    }
    return name;
  }

  void skip_space() {
    while (i_ < s_.size() && is_html_space(s_[i_])) {
      ++i_;
    }
  }

  void open_tag(std::vector<MemoryNode *> &stack) {
    ++i_;
    auto el = std::make_unique<MemoryNode>();
    el->tag = read_name();

    bool self_closing = false;
    for (;;) {
      skip_space();
      if (i_ >= s_.size()) {
        break;
      }
      if (s_[i_] == '>') {
        ++i_;
        break;
      }
      if (s_[i_] == '/') {
        self_closing = true;
        ++i_;
        continue;
      }
      auto name = read_name();
      if (name.empty()) {
        // Unparseable byte inside a tag.
        ++i_;
        continue;
      }
      std::string value;
      skip_space();
      if (i_ < s_.size() && s_[i_] == '=') {
        ++i_;
        skip_space();
        value = read_value();
      }
      if (!el->attr(name)) {
        el->attrs.emplace_back(std::move(name), std::move(value));
      }
    }

    auto &parent = *stack.back();
    el->parent = &parent;
    auto *raw = el.get();
    parent.children.push_back(std::move(el));
    if (!self_closing && !is_void_tag(raw->tag)) {
      stack.push_back(raw);
    }
  }

  std::string read_value() {
    std::string out;
    if (i_ >= s_.size()) {
      return out;
    }
    const char q = s_[i_];
    std::string_view raw;
    if (q == '"' || q == '\'') {
      const auto end = s_.find(q, i_ + 1);
      const auto stop = end == std::string_view::npos ? s_.size() : end;
      raw = s_.substr(i_ + 1, stop - i_ - 1);
      i_ = end == std::string_view::npos ? s_.size() : end + 1;
    } else {
      const auto start = i_;
      while (i_ < s_.size() && !is_html_space(s_[i_]) && s_[i_] != '>') {
        ++i_;
      }
      raw = s_.substr(start, i_ - start);
    }
    decode_entities(out, raw);
    return out;
  }

  void close_tag(std::vector<MemoryNode *> &stack) {
    i_ += 2;
    const auto name = read_name();
    const auto end = s_.find('>', i_);
    i_ = end == std::string_view::npos ? s_.size() : end + 1;
    for (auto k = stack.size(); k-- > 1;) {
      if (stack[k]->tag == name) {
        stack.resize(k);
        return;
      }
    }
  }

  std::string_view s_;
  std::size_t i_{};
};

inline void serialize_node(const MemoryNode &n, std::string &out,
                           bool sort_attrs) {
  if (n.is_text) {
    escape_html(out, n.text);
    return;
  }
  out.push_back('<');
  out += n.tag;
  auto attrs = n.attrs;
  if (sort_attrs) {
    std::sort(attrs.begin(), attrs.end());
  }
  for (const auto &kv : attrs) {
    out.push_back(' ');
    out += kv.first;
    if (!kv.second.empty()) {
      out += "=\"";
      escape_html(out, kv.second);
      out.push_back('"');
    }
  }
  out.push_back('>');
  if (is_void_tag(n.tag)) {
    return;
  }
  for (const auto &c : n.children) {
    serialize_node(*c, out, sort_attrs);
  }
  out += "</";
  out += n.tag;
  out.push_back('>');
}

inline std::string serialize_children(const MemoryNode &n, bool sort_attrs) {
  std::string out;
  for (const auto &c : n.children) {
    serialize_node(*c, out, sort_attrs);
  }
  return out;
}

struct SimpleSelector {
  std::string tag;
  std::string id;
  std::vector<std::string> classes;
  std::vector<std::pair<std::string, std::optional<std::string>>> attrs;
};

// Compound selectors only (no combinators): tag, #id, .class, [attr] and
// [attr=value]. Returns nullopt for anything else.
inline std::optional<SimpleSelector> parse_simple_selector(std::string_view s) {
  SimpleSelector sel;
  std::size_t i = 0;
  auto ident = [&] {
    const auto start = i;
    while (i < s.size() && (std::isalnum(static_cast<unsigned char>(s[i])) ||
                            s[i] == '-' || s[i] == '_')) {
      ++i;
    }
    return std::string{s.substr(start, i - start)};
  };
  if (s.empty()) {
    return std::nullopt;
  }
  if (s[0] == '*') {
    ++i;
  } else if (std::isalpha(static_cast<unsigned char>(s[0]))) {
    sel.tag = ident();
    std::transform(sel.tag.begin(), sel.tag.end(), sel.tag.begin(), ascii_lower);
  }
  while (i < s.size()) {
    const char c = s[i++];
    if (c == '#' || c == '.') {
      auto name = ident();
      if (name.empty()) {
        return std::nullopt;
      }
      if (c == '#') {
        sel.id = std::move(name);
      } else {
        sel.classes.push_back(std::move(name));
      }
    } else if (c == '[') {
      const auto close = s.find(']', i);
      if (close == std::string_view::npos) {
        return std::nullopt;
      }
      const auto body = s.substr(i, close - i);
      i = close + 1;
      const auto eq = body.find('=');
      if (eq == std::string_view::npos) {
        sel.attrs.emplace_back(std::string{body}, std::nullopt);
        continue;
      }
      auto value = body.substr(eq + 1);
      if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') &&
          value.back() == value.front()) {
        value = value.substr(1, value.size() - 2);
      }
      sel.attrs.emplace_back(std::string{body.substr(0, eq)}, std::string{value});
    } else {
      return std::nullopt;
    }
  }
  return sel;
}

inline bool has_class(const MemoryNode &n, std::string_view cls) {
  const auto *v = n.attr("class");
  if (!v) {
    return false;
  }
  std::string_view rest{*v};
  while (!rest.empty()) {
    const auto start = rest.find_first_not_of(" \t\n\r\f");
    if (start == std::string_view::npos) {
      break;
    }
    rest.remove_prefix(start);
    const auto end = std::min(rest.find_first_of(" \t\n\r\f"), rest.size());
    if (rest.substr(0, end) == cls) {
      return true;
    }
    rest.remove_prefix(end);
  }
  return false;
}

inline bool matches(const MemoryNode &n, const SimpleSelector &sel) {
  if (n.is_text || n.tag.empty()) {
    return false;
  }
  if (!sel.tag.empty() && sel.tag != n.tag) {
    return false;
  }
  if (!sel.id.empty()) {
    const auto *v = n.attr("id");
    if (!v || *v != sel.id) {
      return false;
    }
  }
  for (const auto &c : sel.classes) {
    if (!has_class(n, c)) {
      return false;
    }
  }
  for (const auto &kv : sel.attrs) {
    const auto *v = n.attr(kv.first);
    if (!v || (kv.second && *v != *kv.second)) {
      return false;
    }
  }
  return true;
}

} // namespace detail

inline MemoryNodes parse_html_fragment(std::string_view html) {
  return detail::FragmentParser{html}.parse();
}

// Canonical form of a fragment: attributes sorted by name, character
// references decoded and re-escaped. Two fragments the browser would build
// the same tree from normalize to the same string.
inline std::string normalize_html(std::string_view html) {
  MemoryNode holder;
  holder.children = parse_html_fragment(html);
  return detail::serialize_children(holder, true);
}

// Nearest of el and its ancestors matching the selector list, like
// Element.closest().
inline const MemoryNode *closest(const MemoryNode &el, std::string_view selector) {
  std::vector<detail::SimpleSelector> list;
  std::size_t start = 0;
  while (start <= selector.size()) {
    auto end = selector.find(',', start);
    if (end == std::string_view::npos) {
      end = selector.size();
    }
    auto part = selector.substr(start, end - start);
    while (!part.empty() && detail::is_html_space(part.front())) {
      part.remove_prefix(1);
    }
    while (!part.empty() && detail::is_html_space(part.back())) {
      part.remove_suffix(1);
    }
    auto sel = detail::parse_simple_selector(part);
    if (!sel) {
      VENEER_LOG_DEBUG("unsupported selector '%s'",
                       std::string{selector}.c_str());
      return nullptr;
    }
    list.push_back(std::move(*sel));
    start = end + 1;
  }
  for (const auto *n = &el; n; n = n->parent) {
    for (const auto &sel : list) {
      if (detail::matches(*n, sel)) {
        return n;
      }
    }
  }
  return nullptr;
}

// Reference host: a document held in memory. Containers are added up front
// the way a page ships its mount points; everything else arrives as HTML
// through the DomHost calls.
class MemoryHost final : public DomHost, public EventHost {
public:
  // type, selector, attrs_json
  using EventSink = std::function<void(const std::string &, const std::string &,
                                       const std::string &)>;

  MemoryHost() { document_.tag = "#document"; }

  MemoryHost(const MemoryHost &) = delete;
  MemoryHost &operator=(const MemoryHost &) = delete;

  MemoryNode &add_container(const std::string &id, std::string tag = "div") {
    auto el = std::make_unique<MemoryNode>();
    el->tag = std::move(tag);
    el->attrs.emplace_back("id", id);
    el->parent = &document_;
    auto *raw = el.get();
    document_.children.push_back(std::move(el));
    return *raw;
  }

  MemoryNode *find(const std::string &id) { return find_in(document_, id); }

  const MemoryNode *find(const std::string &id) const {
    return find_in(document_, id);
  }

  std::optional<std::string> outer_html(const std::string &id) const {
    const auto *n = find(id);
    if (!n) {
      return std::nullopt;
    }
    std::string out;
    detail::serialize_node(*n, out, false);
    return out;
  }

  std::string document_html() const {
    return detail::serialize_children(document_, false);
  }

  // Successful DomHost mutations.
  std::size_t mutations() const noexcept { return mutations_; }

  // "<op> <id>" for every DomHost call, failed ones included.
  const std::vector<std::string> &calls() const noexcept { return calls_; }

  void clear_calls() { calls_.clear(); }

  bool set_outer_html(const std::string &id, const std::string &html) override {
    record("set_outer_html", id);
    auto *n = find(id);
    if (!n || !n->parent) {
      return false;
    }
    auto *parent = n->parent;
    const auto at = index_of(*n);
    parent->children.erase(parent->children.begin() +
                           static_cast<std::ptrdiff_t>(at));
    insert_at(*parent, at, html);
    return touched();
  }

  bool set_inner_html(const std::string &id, const std::string &html) override {
    record("set_inner_html", id);
    auto *n = find(id);
    if (!n) {
      return false;
    }
    n->children.clear();
    insert_at(*n, 0, html);
    return touched();
  }

  std::optional<std::string> get_inner_html(const std::string &id) override {
    const auto *n = find(id);
    if (!n) {
      return std::nullopt;
    }
    return detail::serialize_children(*n, false);
  }

  bool append(const std::string &id, const std::string &html) override {
    record("append", id);
    auto *n = find(id);
    if (!n) {
      return false;
    }
    insert_at(*n, n->children.size(), html);
    return touched();
  }

  bool prepend(const std::string &id, const std::string &html) override {
    record("prepend", id);
    auto *n = find(id);
    if (!n) {
      return false;
    }
    insert_at(*n, 0, html);
    return touched();
  }

  bool insert_before(const std::string &id, const std::string &html) override {
    record("insert_before", id);
    auto *n = find(id);
    if (!n || !n->parent) {
      return false;
    }
    insert_at(*n->parent, index_of(*n), html);
    return touched();
  }

  bool insert_after(const std::string &id, const std::string &html) override {
    record("insert_after", id);
    auto *n = find(id);
    if (!n || !n->parent) {
      return false;
    }
    insert_at(*n->parent, index_of(*n) + 1, html);
    return touched();
  }

  bool remove(const std::string &id) override {
    record("remove", id);
    auto *n = find(id);
    if (!n || !n->parent) {
      return false;
    }
    auto *parent = n->parent;
    parent->children.erase(parent->children.begin() +
                           static_cast<std::ptrdiff_t>(index_of(*n)));
    return touched();
  }

  bool set_attr(const std::string &id, const std::string &key,
                const std::string &value) override {
    record("set_attr", id);
    auto *n = find(id);
    if (!n) {
      return false;
    }
    n->set_attr(key, value);
    return touched();
  }

  bool remove_attr(const std::string &id, const std::string &key) override {
    record("remove_attr", id);
    auto *n = find(id);
    if (!n) {
      return false;
    }
    n->remove_attr(key);
    return touched();
  }

  void register_listener(const std::string &type,
                         const std::string &selector) override {
    ++register_calls_;
    if (std::find(listeners_.begin(), listeners_.end(),
                  Listener{type, selector}) == listeners_.end()) {
      listeners_.emplace_back(type, selector);
    }
  }

  void unregister_listener(const std::string &type,
                           const std::string &selector) override {
    const auto it = std::find(listeners_.begin(), listeners_.end(),
                              Listener{type, selector});
    if (it != listeners_.end()) {
      listeners_.erase(it);
    }
  }

  std::size_t listener_count() const noexcept { return listeners_.size(); }

  std::size_t register_calls() const noexcept { return register_calls_; }

  bool has_listener(const std::string &type, const std::string &selector) const {
    return std::find(listeners_.begin(), listeners_.end(),
                     Listener{type, selector}) != listeners_.end();
  }

  void set_event_sink(EventSink sink) { sink_ = std::move(sink); }

  // Simulates a user event on the element target_id. Every native listener of
  // that type whose selector matches the target or an ancestor receives the
  // matched element's attributes. Returns the number of deliveries.
  std::size_t dispatch(const std::string &type, const std::string &target_id) {
    const auto *target = find(target_id);
    if (!target) {
      VENEER_LOG_WARN("dispatch %s: no element with id '%s'", type.c_str(),
                      target_id.c_str());
      return 0;
    }
    std::size_t delivered = 0;
    // Listeners may be removed by the handlers they reach.
    const auto listeners = listeners_;
    for (const auto &l : listeners) {
      if (l.first != type) {
        continue;
      }
      const auto *hit = closest(*target, l.second);
      if (!hit) {
        continue;
      }
      AttributeSnapshot snapshot;
      for (const auto &kv : hit->attrs) {
        snapshot.insert_or_assign(kv.first, kv.second);
      }
      if (sink_) {
        sink_(l.first, l.second, write_attribute_snapshot(snapshot));
      }
      ++delivered;
    }
    return delivered;
  }

private:
  using Listener = std::pair<std::string, std::string>;

  static MemoryNode *find_in(const MemoryNode &n, const std::string &id) {
    for (const auto &c : n.children) {
      if (c->is_text) {
        continue;
      }
      const auto *v = c->attr("id");
      if (v && *v == id) {
        return c.get();
      }
      if (auto *hit = find_in(*c, id)) {
        return hit;
      }
    }
    return nullptr;
  }

  static std::size_t index_of(const MemoryNode &n) {
    const auto &siblings = n.parent->children;
    for (std::size_t i = 0; i < siblings.size(); ++i) {
      if (siblings[i].get() == &n) {
        return i;
      }
    }
    return siblings.size();
  }

  static void insert_at(MemoryNode &parent, std::size_t at,
                        const std::string &html) {
    auto nodes = parse_html_fragment(html);
    for (auto &c : nodes) {
      c->parent = &parent;
    }
    parent.children.insert(parent.children.begin() +
                               static_cast<std::ptrdiff_t>(at),
                           std::make_move_iterator(nodes.begin()),
                           std::make_move_iterator(nodes.end()));
    merge_text(parent);
  }

  // Adjacent text nodes collapse, as they do when the browser re-parses.
  static void merge_text(MemoryNode &parent) {
    auto &ch = parent.children;
    for (std::size_t i = 1; i < ch.size();) {
      if (ch[i]->is_text && ch[i - 1]->is_text) {
        ch[i - 1]->text += ch[i]->text;
        ch.erase(ch.begin() + static_cast<std::ptrdiff_t>(i));
        continue;
      }
      ++i;
    }
  }

  void record(const char *op, const std::string &id) {
    calls_.push_back(std::string{op} + " " + id);
  }

  bool touched() {
    ++mutations_;
    return true;
  }

  MemoryNode document_;
  std::vector<Listener> listeners_;
  std::size_t register_calls_{};
  EventSink sink_;
  std::vector<std::string> calls_;
  std::size_t mutations_{};
};

} // namespace veneer::dom

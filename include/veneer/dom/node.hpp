#pragma once

#include <veneer/dom/context.hpp>
#include <veneer/dom/error.hpp>
#include <veneer/dom/log.hpp>

#include <algorithm>
#include <cstddef>
#include <initializer_list>
#include <map>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace veneer::dom {

enum class NodeKind { Element, Text, Fragment };

// Attribute name -> value. Sorted by key handle, which makes equality
// independent of the order attributes were added in.
using Attrs = std::map<Handle, Handle>;

struct VNode {
  NodeKind kind{NodeKind::Element};
  Handle tag{};
  Attrs attrs;
  std::vector<VNode> children;
  std::string text;
  std::optional<DomId> dom_id;

  bool is_element() const noexcept { return kind == NodeKind::Element; }
  bool is_text() const noexcept { return kind == NodeKind::Text; }
  bool is_fragment() const noexcept { return kind == NodeKind::Fragment; }
};

// Structural equality. dom_id is not part of a node's structure.
inline bool operator==(const VNode &a, const VNode &b) {
  if (a.kind != b.kind) {
    return false;
  }
  switch (a.kind) {
  case NodeKind::Text:
    return a.text == b.text;
  case NodeKind::Element:
    if (a.tag != b.tag || a.attrs != b.attrs) {
      return false;
    }
    break;
  case NodeKind::Fragment:
    break;
  }
  if (a.children.size() != b.children.size()) {
    return false;
  }
  for (std::size_t i = 0; i < a.children.size(); ++i) {
    if (!(a.children[i] == b.children[i])) {
      return false;
    }
  }
  return true;
}

inline bool operator!=(const VNode &a, const VNode &b) { return !(a == b); }

inline bool is_void_tag(std::string_view tag) {
  return tag == "area" || tag == "base" || tag == "br" || tag == "col" ||
         tag == "embed" || tag == "hr" || tag == "img" || tag == "input" ||
         tag == "link" || tag == "meta" || tag == "param" ||
         tag == "source" || tag == "track" || tag == "wbr";
}

inline bool is_void_element(const Context &ctx, const VNode &node) {
  return node.is_element() && is_void_tag(ctx.str(node.tag));
}

// Attribute names are ASCII case-insensitive in HTML documents, so they are
// lowercased before interning. Names that would break out of the open tag
// when serialized are refused.
inline std::optional<std::string> normalize_attr_name(std::string_view key) {
  if (key.empty()) {
    return std::nullopt;
  }
  std::string out;
  out.reserve(key.size());
  for (const char c : key) {
    const auto u = static_cast<unsigned char>(c);
    if (u <= 0x20 || u == 0x7F || c == '"' || c == '\'' || c == '>' ||
        c == '<' || c == '/' || c == '=') {
      return std::nullopt;
    }
    out.push_back(c >= 'A' && c <= 'Z' ? static_cast<char>(c - 'A' + 'a') : c);
  }
  return out;
}

// class="b a b" and class="a b" name the same set of classes.
inline std::string normalize_class_list(std::string_view value) {
  const auto space = [](char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f';
  };
  std::vector<std::string_view> tokens;
  std::size_t i = 0;
  while (i < value.size()) {
    while (i < value.size() && space(value[i])) {
      ++i;
    }
    const std::size_t start = i;
    while (i < value.size() && !space(value[i])) {
      ++i;
    }
    if (i > start) {
      tokens.push_back(value.substr(start, i - start));
    }
  }
  std::sort(tokens.begin(), tokens.end());
  tokens.erase(std::unique(tokens.begin(), tokens.end()), tokens.end());

  std::string out;
  for (const auto t : tokens) {
    if (!out.empty()) {
      out.push_back(' ');
    }
    out.append(t);
  }
  return out;
}

struct BuildResult {
  VNode node;
  Error error;
  bool ok{};
};

inline VNode text(std::string content) {
  VNode n;
  n.kind = NodeKind::Text;
  n.text = std::move(content);
  return n;
}

inline VNode fragment(std::vector<VNode> children) {
  VNode n;
  n.kind = NodeKind::Fragment;
  n.children = std::move(children);
  return n;
}

class ElementBuilder {
public:
  ElementBuilder(Context &ctx, std::string_view tag) : ctx_{&ctx} {
    node_.kind = NodeKind::Element;
    node_.tag = ctx.intern(tag);
    void_ = is_void_tag(tag);
  }

  ElementBuilder &attr(std::string_view key, std::string_view value) {
    const auto name = normalize_attr_name(key);
    if (!name) {
      fail(make_error(ErrorCode::InvalidAttributeName,
                      std::string{"invalid attribute name '"} +
                          std::string{key} + "'"));
      return *this;
    }
    const auto k = ctx_->intern(*name);
    if (k == ctx_->reserved_key()) {
      fail(make_error(ErrorCode::ReservedAttribute,
                      std::string{"attribute '"} + std::string{key} +
                          "' is reserved for element addressing"));
      return *this;
    }
    if (*name == "class") {
      node_.attrs.insert_or_assign(k, ctx_->intern(normalize_class_list(value)));
    } else {
      node_.attrs.insert_or_assign(k, ctx_->intern(value));
    }
    return *this;
  }

  // Attribute without a value, e.g. <input disabled>.
  ElementBuilder &attr(std::string_view key) { return attr(key, {}); }

  ElementBuilder &child(VNode node) {
    if (void_) {
      VENEER_LOG_WARN("dropping child of void element <%s>",
                      std::string{ctx_->str(node_.tag)}.c_str());
      return *this;
    }
    node_.children.push_back(std::move(node));
    return *this;
  }

  ElementBuilder &child(BuildResult result) {
    if (!result.ok) {
      fail(std::move(result.error));
      return *this;
    }
    return child(std::move(result.node));
  }

  ElementBuilder &text(std::string content) {
    return child(dom::text(std::move(content)));
  }

  ElementBuilder &children(std::initializer_list<VNode> nodes) {
    for (const auto &n : nodes) {
      child(n);
    }
    return *this;
  }

  ElementBuilder &children(std::vector<VNode> nodes) {
    for (auto &n : nodes) {
      child(std::move(n));
    }
    return *this;
  }

  template <typename F> ElementBuilder &children(F &&fn) {
    ChildCollector collector{this};
    fn(collector);
    return *this;
  }

  BuildResult build() && {
    if (error_) {
      return BuildResult{VNode{}, std::move(error_), false};
    }
    return BuildResult{std::move(node_), {}, true};
  }

  BuildResult build() const & {
    if (error_) {
      return BuildResult{VNode{}, error_, false};
    }
    return BuildResult{node_, {}, true};
  }

  struct ChildCollector {
    ElementBuilder *builder{};

    void add(VNode node) { builder->child(std::move(node)); }
    void add(BuildResult result) { builder->child(std::move(result)); }
  };

private:
  void fail(Error e) {
    // Keep the first error, it names the offending input.
    if (!error_) {
      error_ = std::move(e);
    }
  }

  Context *ctx_{};
  VNode node_;
  Error error_;
  bool void_{};
};

inline ElementBuilder element(Context &ctx, std::string_view tag) {
  return ElementBuilder{ctx, tag};
}

inline BuildResult
make_element(Context &ctx, std::string_view tag,
             std::initializer_list<std::pair<std::string_view, std::string_view>>
                 attrs,
             std::vector<VNode> children = {}) {
  auto b = element(ctx, tag);
  for (const auto &kv : attrs) {
    b.attr(kv.first, kv.second);
  }
  b.children(std::move(children));
  return std::move(b).build();
}

// Attribute value by name, or nullopt when the element does not carry it.
inline std::optional<std::string_view>
attr_value(const Context &ctx, const VNode &node, std::string_view key) {
  const auto name = normalize_attr_name(key);
  if (!name) {
    return std::nullopt;
  }
  const auto k = ctx.interner().find(*name);
  if (!k) {
    return std::nullopt;
  }
  const auto it = node.attrs.find(*k);
  if (it == node.attrs.end()) {
    return std::nullopt;
  }
  return ctx.str(it->second);
}

inline std::size_t count_elements(const VNode &node) {
  std::size_t n = node.is_element() ? 1 : 0;
  for (const auto &c : node.children) {
    n += count_elements(c);
  }
  return n;
}

inline void dump_tree(std::ostream &os, const Context &ctx, const VNode &node,
                      int indent_spaces = 0) {
  for (int i = 0; i < indent_spaces; ++i) {
    os.put(' ');
  }

  switch (node.kind) {
  case NodeKind::Text:
    os << "\"" << node.text << "\"\n";
    return;
  case NodeKind::Fragment:
    os << "<>";
    break;
  case NodeKind::Element:
    os << ctx.str(node.tag);
    if (node.dom_id) {
      os << "#" << *node.dom_id;
    }
    if (!node.attrs.empty()) {
      os << " {";
      bool first = true;
      for (const auto &kv : node.attrs) {
        if (!std::exchange(first, false)) {
          os << ", ";
        }
        os << ctx.str(kv.first) << ": " << ctx.str(kv.second);
      }
      os << "}";
    }
    break;
  }

  os << "\n";

  for (const auto &child : node.children) {
    dump_tree(os, ctx, child, indent_spaces + 2);
  }
}

} // namespace veneer::dom

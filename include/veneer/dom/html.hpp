#pragma once

#include <veneer/dom/context.hpp>
#include <veneer/dom/node.hpp>

#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace veneer::dom {

inline void escape_html(std::string &out, std::string_view s) {
  for (const char c : s) {
    switch (c) {
    case '&':
      out += "&amp;";
      break;
    case '\'':
      out += "&#39;";
      break;
    case '<':
      out += "&lt;";
      break;
    case '>':
      out += "&gt;";
      break;
    case '"':
      out += "&#34;";
      break;
    default:
      out.push_back(c);
      break;
    }
  }
}

inline std::string escape_html(std::string_view s) {
  std::string out;
  out.reserve(s.size());
  escape_html(out, s);
  return out;
}

namespace detail {

inline void write_open_tag(const Context &ctx, const VNode &node,
                           std::string &out) {
  out.push_back('<');
  out.append(ctx.str(node.tag));
  if (node.dom_id) {
    out.push_back(' ');
    out.append(dom_id_attribute);
    out += "=\"";
    out += ctx.dom_id_string(*node.dom_id);
    out.push_back('"');
  }
  for (const auto &kv : node.attrs) {
    out.push_back(' ');
    out.append(ctx.str(kv.first));
    if (kv.second != 0) {
      out += "=\"";
      escape_html(out, ctx.str(kv.second));
      out.push_back('"');
    }
  }
  out.push_back('>');
}

template <typename Ctx, typename Node>
void write_html_impl(Ctx &ctx, Node &node, std::string &out, bool assign_ids) {
  switch (node.kind) {
  case NodeKind::Text:
    escape_html(out, node.text);
    return;
  case NodeKind::Fragment:
    for (auto &c : node.children) {
      write_html_impl(ctx, c, out, assign_ids);
    }
    return;
  case NodeKind::Element:
    break;
  }

  if constexpr (!std::is_const_v<Ctx> && !std::is_const_v<Node>) {
    if (assign_ids && !node.dom_id) {
      node.dom_id = ctx.allocate_id();
    }
  }
  write_open_tag(ctx, node, out);
  const auto tag = ctx.str(node.tag);
  if (is_void_tag(tag)) {
    return;
  }
  for (auto &c : node.children) {
    write_html_impl(ctx, c, out, assign_ids);
  }
  out += "</";
  out.append(tag);
  out.push_back('>');
}

} // namespace detail

// Serializes node for a patch. Elements that have not been materialized yet
// receive their dom_id here.
inline void write_html(Context &ctx, VNode &node, std::string &out) {
  detail::write_html_impl(ctx, node, out, true);
}

inline std::string render_html(Context &ctx, VNode &node) {
  std::string out;
  out.reserve(ctx.config().html_reserve);
  write_html(ctx, node, out);
  return out;
}

inline std::string render_html(Context &ctx, std::vector<VNode *> &nodes) {
  std::string out;
  out.reserve(ctx.config().html_reserve);
  for (auto *n : nodes) {
    write_html(ctx, *n, out);
  }
  return out;
}

// Read-only serialization: ids already assigned are written, none are added.
inline std::string to_html(const Context &ctx, const VNode &node) {
  std::string out;
  detail::write_html_impl(ctx, node, out, false);
  return out;
}

inline std::string to_html(const Context &ctx, const std::vector<VNode> &nodes) {
  std::string out;
  for (const auto &n : nodes) {
    detail::write_html_impl(ctx, n, out, false);
  }
  return out;
}

} // namespace veneer::dom

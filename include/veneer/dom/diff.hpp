#pragma once

#include <veneer/dom/context.hpp>
#include <veneer/dom/html.hpp>
#include <veneer/dom/log.hpp>
#include <veneer/dom/node.hpp>
#include <veneer/dom/patch.hpp>

#include <algorithm>
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace veneer::dom {

namespace detail {

// Expands fragments in place, so a child list reads the way the host sees it.
template <typename N, typename P>
void flatten_children(N &children, std::vector<P *> &out) {
  for (auto &c : children) {
    if (c.is_fragment()) {
      flatten_children(c.children, out);
    } else {
      out.push_back(&c);
    }
  }
}

// next is structurally equal to old: it takes over every id as is.
inline void adopt_ids(const VNode &old, VNode &next) {
  next.dom_id = old.dom_id;
  const auto n = std::min(old.children.size(), next.children.size());
  for (std::size_t i = 0; i < n; ++i) {
    adopt_ids(old.children[i], next.children[i]);
  }
}

inline bool materialized(const VNode *n) {
  return n->is_element() && n->dom_id.has_value();
}

class Differ {
public:
  Differ(Context &ctx, std::vector<Patch> &out) : ctx_{ctx}, out_{out} {}

  void diff_node(const VNode &old, VNode &next) {
    if (old.tag != next.tag) {
      replace_outer(old, next);
      return;
    }

    next.dom_id = old.dom_id;
    const auto id = *old.dom_id;
    diff_attrs(id, old.attrs, next.attrs);
    if (is_void_element(ctx_, next)) {
      return;
    }
    diff_children(id, old.children, next.children);
  }

  void diff_children(DomId parent, const std::vector<VNode> &old_children,
                     std::vector<VNode> &new_children) {
    std::vector<const VNode *> a;
    std::vector<VNode *> b;
    a.reserve(old_children.size());
    b.reserve(new_children.size());
    flatten_children(old_children, a);
    flatten_children(new_children, b);
    diff_flat(parent, a, b);
  }

  void replace_outer(const VNode &old, VNode &next) {
    if (next.is_element()) {
      next.dom_id = old.dom_id;
    }
    out_.push_back(PatchReplaceOuter{*old.dom_id, render_html(ctx_, next)});
  }

private:
  void diff_attrs(DomId id, const Attrs &old_attrs, const Attrs &new_attrs) {
    if (old_attrs == new_attrs) {
      return;
    }
    for (const auto &kv : new_attrs) {
      const auto it = old_attrs.find(kv.first);
      if (it == old_attrs.end() || it->second != kv.second) {
        out_.push_back(PatchSetAttr{id, kv.first, kv.second});
      }
    }
    for (const auto &kv : old_attrs) {
      if (!new_attrs.contains(kv.first)) {
        out_.push_back(PatchRemoveAttr{id, kv.first});
      }
    }
  }

  void diff_flat(DomId parent, const std::vector<const VNode *> &a,
                 std::vector<VNode *> &b) {
    const auto m = a.size();
    const auto n = b.size();

    if (m == n) {
      if (!pairs_patchable(a, b, n)) {
        replace_inner(parent, b);
        return;
      }
      diff_pairs(a, b, n);
      return;
    }

    const auto k = std::min(m, n);
    std::size_t p = 0;
    while (p < k && *a[p] == *b[p]) {
      ++p;
    }
    std::size_t s = 0;
    while (s < k - p && *a[m - 1 - s] == *b[n - 1 - s]) {
      ++s;
    }

    if (p + s == k) {
      if (n > m) {
        insert_between(parent, a, b, p, s);
      } else {
        remove_between(parent, a, b, p, s);
      }
      return;
    }

    // Positional fallback: compare by index, then fix up the tail.
    if (!pairs_patchable(a, b, k) ||
        !std::all_of(a.begin() + static_cast<std::ptrdiff_t>(k), a.end(),
                     materialized)) {
      replace_inner(parent, b);
      return;
    }
    diff_pairs(a, b, k);
    for (std::size_t i = m; i < n; ++i) {
      emit_insert<PatchAppend>(parent, *b[i]);
    }
    for (std::size_t i = n; i < m; ++i) {
      out_.push_back(PatchRemove{*a[i]->dom_id});
    }
  }

  // A pair is patchable when its old side can be addressed: text content
  // cannot, so a text node that changes goes through its parent.
  bool pairs_patchable(const std::vector<const VNode *> &a,
                       const std::vector<VNode *> &b, std::size_t count) const {
    for (std::size_t i = 0; i < count; ++i) {
      if (a[i]->is_text()) {
        if (!b[i]->is_text() || a[i]->text != b[i]->text) {
          return false;
        }
        continue;
      }
      if (!a[i]->dom_id) {
        VENEER_LOG_ERROR("committed <%s> has no dom_id, re-rendering parent",
                         std::string{ctx_.str(a[i]->tag)}.c_str());
        return false;
      }
    }
    return true;
  }

  void diff_pairs(const std::vector<const VNode *> &a,
                  std::vector<VNode *> &b, std::size_t count) {
    for (std::size_t i = 0; i < count; ++i) {
      if (a[i]->is_text()) {
        continue;
      }
      if (b[i]->is_text()) {
        replace_outer(*a[i], *b[i]);
        continue;
      }
      diff_node(*a[i], *b[i]);
    }
  }

  // b is a: with b[p, p + n - m) inserted.
  void insert_between(DomId parent, const std::vector<const VNode *> &a,
                      std::vector<VNode *> &b, std::size_t p, std::size_t s) {
    const auto m = a.size();
    const auto n = b.size();
    adopt_matched(a, b, p, s);

    const auto first = p;
    const auto last = p + (n - m);
    if (p == m) {
      for (auto i = first; i < last; ++i) {
        emit_insert<PatchAppend>(parent, *b[i]);
      }
    } else if (p == 0) {
      for (auto i = last; i-- > first;) {
        emit_insert<PatchPrepend>(parent, *b[i]);
      }
    } else if (materialized(a[p])) {
      for (auto i = first; i < last; ++i) {
        emit_insert<PatchInsertBefore>(*a[p]->dom_id, *b[i]);
      }
    } else if (materialized(a[p - 1])) {
      for (auto i = last; i-- > first;) {
        emit_insert<PatchInsertAfter>(*a[p - 1]->dom_id, *b[i]);
      }
    } else {
      // Both neighbours are text: nothing to anchor on.
      replace_inner(parent, b);
    }
  }

  // b is a with a[p, p + m - n) removed.
  void remove_between(DomId parent, const std::vector<const VNode *> &a,
                      std::vector<VNode *> &b, std::size_t p, std::size_t s) {
    const auto m = a.size();
    const auto n = b.size();
    const auto first = a.begin() + static_cast<std::ptrdiff_t>(p);
    const auto last = first + static_cast<std::ptrdiff_t>(m - n);
    if (!std::all_of(first, last, materialized)) {
      replace_inner(parent, b);
      return;
    }
    adopt_matched(a, b, p, s);
    for (auto it = first; it != last; ++it) {
      out_.push_back(PatchRemove{*(*it)->dom_id});
    }
  }

  void adopt_matched(const std::vector<const VNode *> &a,
                     std::vector<VNode *> &b, std::size_t p, std::size_t s) {
    for (std::size_t i = 0; i < p; ++i) {
      adopt_ids(*a[i], *b[i]);
    }
    for (std::size_t j = 0; j < s; ++j) {
      adopt_ids(*a[a.size() - 1 - j], *b[b.size() - 1 - j]);
    }
  }

  void replace_inner(DomId parent, std::vector<VNode *> &b) {
    out_.push_back(PatchReplaceInner{parent, render_html(ctx_, b)});
  }

  template <typename P> void emit_insert(DomId target, VNode &node) {
    auto html = render_html(ctx_, node);
    if (html.empty()) {
      // Empty text: nothing for the host to parse.
      return;
    }
    out_.push_back(P{target, std::move(html)});
  }

  Context &ctx_;
  std::vector<Patch> &out_;
};

} // namespace detail

// Diffs the children of the element parent_id. new_children receives the ids
// of the nodes it keeps or replaces; new elements get fresh ids as they are
// serialized into patches.
inline void diff_children(Context &ctx, DomId parent,
                          const std::vector<VNode> &old_children,
                          std::vector<VNode> &new_children,
                          std::vector<Patch> &out) {
  detail::Differ d{ctx, out};
  d.diff_children(parent, old_children, new_children);
}

// Diffs a committed element root against its replacement. Roots that are text
// or fragments have no identifier of their own; mount them with a Tree.
inline std::vector<Patch> diff_tree(Context &ctx, const VNode &old_root,
                                    VNode &new_root) {
  std::vector<Patch> out;
  if (!detail::materialized(&old_root)) {
    VENEER_LOG_ERROR("diff_tree: committed root is not a materialized element");
    return out;
  }
  detail::Differ d{ctx, out};
  if (new_root.is_element()) {
    d.diff_node(old_root, new_root);
  } else {
    d.replace_outer(old_root, new_root);
  }
  VENEER_LOG_DEBUG("diff_tree: %zu patches", out.size());
  return out;
}

} // namespace veneer::dom

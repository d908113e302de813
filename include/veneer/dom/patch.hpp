#pragma once

#include <veneer/dom/context.hpp>

#include <cstddef>
#include <ostream>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace veneer::dom {

struct PatchReplaceOuter {
  DomId id{};
  std::string html;
  bool operator==(const PatchReplaceOuter &) const = default;
};

struct PatchReplaceInner {
  DomId id{};
  std::string html;
  bool operator==(const PatchReplaceInner &) const = default;
};

// Insert as last child of id.
struct PatchAppend {
  DomId id{};
  std::string html;
  bool operator==(const PatchAppend &) const = default;
};

// Insert as first child of id.
struct PatchPrepend {
  DomId id{};
  std::string html;
  bool operator==(const PatchPrepend &) const = default;
};

// Insert as the sibling right before id.
struct PatchInsertBefore {
  DomId id{};
  std::string html;
  bool operator==(const PatchInsertBefore &) const = default;
};

// Insert as the sibling right after id.
struct PatchInsertAfter {
  DomId id{};
  std::string html;
  bool operator==(const PatchInsertAfter &) const = default;
};

struct PatchRemove {
  DomId id{};
  bool operator==(const PatchRemove &) const = default;
};

struct PatchSetAttr {
  DomId id{};
  Handle key{};
  Handle value{};
  bool operator==(const PatchSetAttr &) const = default;
};

struct PatchRemoveAttr {
  DomId id{};
  Handle key{};
  bool operator==(const PatchRemoveAttr &) const = default;
};

using Patch =
    std::variant<PatchReplaceOuter, PatchReplaceInner, PatchAppend,
                 PatchPrepend, PatchInsertBefore, PatchInsertAfter,
                 PatchRemove, PatchSetAttr, PatchRemoveAttr>;

inline DomId patch_target(const Patch &p) {
  return std::visit([](const auto &op) { return op.id; }, p);
}

// Markup carried by the patch, nullptr for attribute and removal patches.
inline const std::string *patch_html(const Patch &p) {
  return std::visit(
      [](const auto &op) -> const std::string * {
        using T = std::decay_t<decltype(op)>;
        if constexpr (std::is_same_v<T, PatchRemove> ||
                      std::is_same_v<T, PatchSetAttr> ||
                      std::is_same_v<T, PatchRemoveAttr>) {
          return nullptr;
        } else {
          return &op.html;
        }
      },
      p);
}

inline const char *patch_name(const Patch &p) {
  return std::visit(
      [](const auto &op) -> const char * {
        using T = std::decay_t<decltype(op)>;
        if constexpr (std::is_same_v<T, PatchReplaceOuter>) {
          return "ReplaceOuter";
        } else if constexpr (std::is_same_v<T, PatchReplaceInner>) {
          return "ReplaceInner";
        } else if constexpr (std::is_same_v<T, PatchAppend>) {
          return "Append";
        } else if constexpr (std::is_same_v<T, PatchPrepend>) {
          return "Prepend";
        } else if constexpr (std::is_same_v<T, PatchInsertBefore>) {
          return "InsertBefore";
        } else if constexpr (std::is_same_v<T, PatchInsertAfter>) {
          return "InsertAfter";
        } else if constexpr (std::is_same_v<T, PatchRemove>) {
          return "Remove";
        } else if constexpr (std::is_same_v<T, PatchSetAttr>) {
          return "SetAttr";
        } else {
          return "RemoveAttr";
        }
      },
      p);
}

template <typename T> std::size_t count_patches(const std::vector<Patch> &ps) {
  std::size_t n = 0;
  for (const auto &p : ps) {
    if (std::holds_alternative<T>(p)) {
      ++n;
    }
  }
  return n;
}

inline void dump_patches(std::ostream &os, const Context &ctx,
                         const std::vector<Patch> &patches) {
  for (const auto &p : patches) {
    os << patch_name(p) << " #" << patch_target(p);
    std::visit(
        [&](const auto &op) {
          using T = std::decay_t<decltype(op)>;
          if constexpr (std::is_same_v<T, PatchSetAttr>) {
            os << " " << ctx.str(op.key) << "=" << ctx.str(op.value);
          } else if constexpr (std::is_same_v<T, PatchRemoveAttr>) {
            os << " " << ctx.str(op.key);
          } else if constexpr (std::is_same_v<T, PatchRemove>) {
          } else {
            os << " " << op.html;
          }
        },
        p);
    os << "\n";
  }
}

} // namespace veneer::dom

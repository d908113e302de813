#pragma once

#include <veneer/dom/context.hpp>
#include <veneer/dom/error.hpp>
#include <veneer/dom/log.hpp>
#include <veneer/dom/patch.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace veneer::dom {

// DOM primitives of the host. Elements are addressed by their formatted id.
// Mutators return false when no element carries that id.
struct DomHost {
  virtual ~DomHost() = default;
  virtual bool set_outer_html(const std::string &id, const std::string &html) = 0;
  virtual bool set_inner_html(const std::string &id, const std::string &html) = 0;
  virtual std::optional<std::string> get_inner_html(const std::string &id) = 0;
  virtual bool append(const std::string &id, const std::string &html) = 0;
  virtual bool prepend(const std::string &id, const std::string &html) = 0;
  virtual bool insert_before(const std::string &id, const std::string &html) = 0;
  virtual bool insert_after(const std::string &id, const std::string &html) = 0;
  virtual bool remove(const std::string &id) = 0;
  virtual bool set_attr(const std::string &id, const std::string &key,
                        const std::string &value) = 0;
  virtual bool remove_attr(const std::string &id, const std::string &key) = 0;
};

// Native listener management, one listener per (type, selector) at the
// document root.
struct EventHost {
  virtual ~EventHost() = default;
  virtual void register_listener(const std::string &type,
                                 const std::string &selector) = 0;
  virtual void unregister_listener(const std::string &type,
                                   const std::string &selector) = 0;
};

struct PatchFailure {
  std::size_t index{};
  DomId id{};
  Error error;
};

struct ApplyReport {
  std::size_t applied{};
  std::vector<PatchFailure> failures;

  bool ok() const noexcept { return failures.empty(); }
};

inline bool apply_patch(DomHost &host, const Context &ctx, const Patch &patch) {
  const auto id = ctx.dom_id_string(patch_target(patch));
  return std::visit(
      [&](const auto &op) -> bool {
        using T = std::decay_t<decltype(op)>;
        if constexpr (std::is_same_v<T, PatchReplaceOuter>) {
          return host.set_outer_html(id, op.html);
        } else if constexpr (std::is_same_v<T, PatchReplaceInner>) {
          return host.set_inner_html(id, op.html);
        } else if constexpr (std::is_same_v<T, PatchAppend>) {
          return host.append(id, op.html);
        } else if constexpr (std::is_same_v<T, PatchPrepend>) {
          return host.prepend(id, op.html);
        } else if constexpr (std::is_same_v<T, PatchInsertBefore>) {
          return host.insert_before(id, op.html);
        } else if constexpr (std::is_same_v<T, PatchInsertAfter>) {
          return host.insert_after(id, op.html);
        } else if constexpr (std::is_same_v<T, PatchRemove>) {
          return host.remove(id);
        } else if constexpr (std::is_same_v<T, PatchSetAttr>) {
          return host.set_attr(id, std::string{ctx.str(op.key)},
                               std::string{ctx.str(op.value)});
        } else {
          return host.remove_attr(id, std::string{ctx.str(op.key)});
        }
      },
      patch);
}

// Applies patches in order. A patch whose target is gone is recorded and
// skipped; the rest still run and the next diff cycle repairs the DOM.
inline ApplyReport apply_patches(DomHost &host, const Context &ctx,
                                 const std::vector<Patch> &patches) {
  ApplyReport report;
  for (std::size_t i = 0; i < patches.size(); ++i) {
    const auto &p = patches[i];
    if (apply_patch(host, ctx, p)) {
      ++report.applied;
      continue;
    }
    const auto id = patch_target(p);
    auto msg = std::string{patch_name(p)} + ": no element with id '" +
               ctx.dom_id_string(id) + "'";
    VENEER_LOG_WARN("%s", msg.c_str());
    report.failures.push_back(
        PatchFailure{i, id, make_error(ErrorCode::MissingTarget, std::move(msg))});
  }
  return report;
}

} // namespace veneer::dom

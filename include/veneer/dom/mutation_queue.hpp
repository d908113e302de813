#pragma once

#include <veneer/dom/context.hpp>
#include <veneer/dom/host.hpp>
#include <veneer/dom/log.hpp>
#include <veneer/dom/patch.hpp>

#include <algorithm>
#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace veneer::dom {

// Patches waiting for the next frame. Pushing a patch that makes earlier
// pending ones pointless drops them, so a burst of renders between two
// frames reaches the host as the smallest equivalent batch.
//
// A dropped insertion takes pending patches on the elements it would have
// created with it; the superseding patch serializes their current state.
// id_prefix must match the Context the patches are serialized with.
class MutationQueue {
public:
  explicit MutationQueue(bool coalesce = true,
                         std::string id_prefix = Config{}.id_prefix)
      : id_prefix_{std::move(id_prefix)}, coalesce_{coalesce} {}

  void push(Patch p) {
    if (coalesce_) {
      drop_superseded(p);
    }
    pending_.push_back(std::move(p));
  }

  void push_all(std::vector<Patch> patches) {
    for (auto &p : patches) {
      push(std::move(p));
    }
  }

  const std::vector<Patch> &pending() const noexcept { return pending_; }

  std::size_t size() const noexcept { return pending_.size(); }

  bool empty() const noexcept { return pending_.empty(); }

  // Patches dropped as superseded since construction.
  std::size_t coalesced() const noexcept { return coalesced_; }

  void clear() { pending_.clear(); }

  ApplyReport flush(DomHost &host, const Context &ctx) {
    auto batch = std::exchange(pending_, {});
    if (batch.empty()) {
      return {};
    }
    VENEER_LOG_DEBUG("flush: %zu mutations", batch.size());
    return apply_patches(host, ctx, batch);
  }

private:
  // Patches that change the element itself or its content. Insertions
  // before/after an element touch its siblings and survive.
  static bool touches_element(const Patch &p) {
    return !std::holds_alternative<PatchInsertBefore>(p) &&
           !std::holds_alternative<PatchInsertAfter>(p);
  }

  static bool touches_content(const Patch &p) {
    return std::holds_alternative<PatchReplaceInner>(p) ||
           std::holds_alternative<PatchAppend>(p) ||
           std::holds_alternative<PatchPrepend>(p);
  }

  void drop_superseded(const Patch &p) {
    const auto id = patch_target(p);
    bool (*superseded)(const Patch &) = nullptr;
    if (std::holds_alternative<PatchReplaceOuter>(p) ||
        std::holds_alternative<PatchRemove>(p)) {
      superseded = &touches_element;
    } else if (std::holds_alternative<PatchReplaceInner>(p)) {
      superseded = &touches_content;
    } else {
      return;
    }

    std::vector<DomId> gone;
    const auto is_gone = [&](DomId t) {
      return std::find(gone.begin(), gone.end(), t) != gone.end();
    };

    std::vector<Patch> kept;
    kept.reserve(pending_.size());
    for (auto &q : pending_) {
      const auto t = patch_target(q);
      const bool stale = t == id ? superseded(q) : is_gone(t);
      if (!stale) {
        kept.push_back(std::move(q));
        continue;
      }
      ++coalesced_;
      if (const auto *html = patch_html(q)) {
        collect_ids(*html, id, gone);
      }
    }
    pending_ = std::move(kept);
  }

  // Appends the ids of elements serialized in html, except skip. Values and
  // text are escaped, so ` id="` only occurs as a real attribute.
  void collect_ids(std::string_view html, DomId skip,
                   std::vector<DomId> &out) const {
    const std::string marker =
        " " + std::string{dom_id_attribute} + "=\"" + id_prefix_;
    std::size_t pos = 0;
    while ((pos = html.find(marker, pos)) != std::string_view::npos) {
      pos += marker.size();
      DomId v = 0;
      std::size_t digits = 0;
      while (pos < html.size() && html[pos] >= '0' && html[pos] <= '9') {
        v = v * 10 + static_cast<DomId>(html[pos] - '0');
        ++pos;
        ++digits;
      }
      if (digits > 0 && pos < html.size() && html[pos] == '"' && v != skip) {
        out.push_back(v);
      }
    }
  }

  std::vector<Patch> pending_;
  std::string id_prefix_;
  std::size_t coalesced_{};
  bool coalesce_{true};
};

} // namespace veneer::dom

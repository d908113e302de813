#pragma once

#include <veneer/dom/context.hpp>
#include <veneer/dom/diff.hpp>
#include <veneer/dom/html.hpp>
#include <veneer/dom/log.hpp>
#include <veneer/dom/node.hpp>
#include <veneer/dom/patch.hpp>

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace veneer::dom {

// Committed tree of one mount point. The container element is owned by the
// host page; the tree is rendered as its content, so the root may be an
// element, a text node or a fragment.
//
// container is 0, an id taken from ctx.allocate_id(), or a number the page
// gave the container element. The last is reserved in ctx so elements
// rendered afterwards never share it.
class Tree {
public:
  Tree(Context &ctx, DomId container) : ctx_{&ctx}, container_{container} {
    ctx.reserve_id(container);
  }

  DomId container() const noexcept { return container_; }

  bool mounted() const noexcept { return !roots_.empty(); }

  // nullptr before the first render.
  const VNode *root() const noexcept {
    return roots_.empty() ? nullptr : &roots_.front();
  }

  // Diffs next against the committed tree and commits it. The returned
  // patches bring the host from the previous commit to next.
  std::vector<Patch> render(VNode next) {
    std::vector<VNode> next_roots;
    next_roots.push_back(std::move(next));

    std::vector<Patch> out;
    diff_children(*ctx_, container_, roots_, next_roots, out);
    roots_ = std::move(next_roots);
    ++commits_;
    VENEER_LOG_DEBUG("commit %zu on #%llu: %zu patches", commits_,
                     static_cast<unsigned long long>(container_), out.size());
    return out;
  }

  // Empties the container and forgets the committed tree.
  std::vector<Patch> unmount() {
    std::vector<Patch> out;
    if (!roots_.empty()) {
      std::vector<VNode> none;
      diff_children(*ctx_, container_, roots_, none, out);
      roots_.clear();
    }
    return out;
  }

  // Content of the container as the host should currently hold it.
  std::string html() const { return to_html(*ctx_, roots_); }

  std::size_t commits() const noexcept { return commits_; }

private:
  Context *ctx_{};
  DomId container_{};
  std::vector<VNode> roots_;
  std::size_t commits_{};
};

} // namespace veneer::dom

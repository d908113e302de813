#pragma once

#include <veneer/dom/context.hpp>
#include <veneer/dom/host.hpp>
#include <veneer/dom/mutation_queue.hpp>
#include <veneer/dom/node.hpp>
#include <veneer/dom/tree.hpp>

#include <optional>
#include <string>
#include <utility>

namespace veneer::dom {

// One mounted tree: renders into the queue, flushes the queue to the host.
class Root {
public:
  Root(Context &ctx, DomHost &host, DomId container)
      : ctx_{&ctx}, host_{&host}, tree_{ctx, container},
        queue_{ctx.config().coalesce_mutations, ctx.config().id_prefix} {}

  void render(VNode next) { queue_.push_all(tree_.render(std::move(next))); }

  void unmount() { queue_.push_all(tree_.unmount()); }

  // Called once per frame by the host loop.
  ApplyReport flush() { return queue_.flush(*host_, *ctx_); }

  ApplyReport render_now(VNode next) {
    render(std::move(next));
    return flush();
  }

  // Reads the container back from the host. Forces the host to serialize, so
  // use sparingly.
  std::optional<std::string> host_html() const {
    return host_->get_inner_html(ctx_->dom_id_string(tree_.container()));
  }

  const Tree &tree() const noexcept { return tree_; }

  const MutationQueue &queue() const noexcept { return queue_; }

  Context &context() noexcept { return *ctx_; }

private:
  Context *ctx_{};
  DomHost *host_{};
  Tree tree_;
  MutationQueue queue_;
};

} // namespace veneer::dom

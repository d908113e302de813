#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

#include <veneer/dom/memory_host.hpp>
#include <veneer/dom/veneer.hpp>

using namespace veneer::dom;

namespace {

VNode counter_view(Context &ctx, std::int64_t count,
                   const std::vector<std::string> &items) {
  auto list = element(ctx, "ul").attr("class", "items");
  for (const auto &item : items) {
    list.child(element(ctx, "li").attr("data-item", item).text(item).build());
  }

  auto r = element(ctx, "div")
               .attr("class", "app")
               .children([&](auto &c) {
                 c.add(element(ctx, "p").text("Count: " + std::to_string(count))
                           .build());
                 c.add(element(ctx, "button")
                           .attr("class", "inc")
                           .attr("data-action", "inc")
                           .text("Inc")
                           .build());
                 c.add(std::move(list).build());
               })
               .build();
  if (!r.ok) {
    std::cerr << error_code_name(r.error.code) << ": " << r.error.message
              << "\n";
    return text("");
  }
  return std::move(r.node);
}

} // namespace

int main() {
  Context ctx{config_from_env()};
  MemoryHost host;
  host.add_container(ctx.dom_id_string(0));

  Root root{ctx, host, 0};
  EventRegistry events{host};
  host.set_event_sink([&](const std::string &type, const std::string &sel,
                          const std::string &json) {
    events.delegate(type, sel, json);
  });

  std::int64_t count = 0;
  std::vector<std::string> items{"a", "b"};

  auto frame = [&](const char *label) {
    std::cout << "\n" << label << "\n";
    root.render(counter_view(ctx, count, items));
    std::cout << "Patches:\n";
    dump_patches(std::cout, ctx, root.queue().pending());
    const auto report = root.flush();
    std::cout << "Applied " << report.applied << ", failed "
              << report.failures.size() << "\n";
    std::cout << "Tree:\n";
    dump_tree(std::cout, ctx, *root.tree().root());
    std::cout << "Host:\n" << host.document_html() << "\n";
  };

  events.add_listener("click", "[data-action]", [&](const DelegatedEvent &ev) {
    std::cout << "click " << ev.attrs.at("data-action") << "\n";
    if (ev.attrs.at("data-action") == "inc") {
      ++count;
    }
  });

  frame("Initial render:");

  const auto *container = host.find(ctx.dom_id_string(0));
  std::string button_id;
  if (container && !container->children.empty()) {
    // div.app > button
    const auto &app = *container->children.front();
    if (app.children.size() > 1) {
      if (const auto *id = app.children[1]->attr("id")) {
        button_id = *id;
      }
    }
  }

  host.dispatch("click", button_id);
  frame("After click:");

  items.push_back("c");
  items.insert(items.begin(), "z");
  frame("After list edit:");

  items.erase(items.begin() + 1);
  frame("After removal:");

  std::cout << "\nUnmount:\n";
  root.unmount();
  dump_patches(std::cout, ctx, root.queue().pending());
  root.flush();
  std::cout << "Host:\n" << host.document_html() << "\n";
  return 0;
}

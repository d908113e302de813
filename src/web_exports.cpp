#include <veneer/dom/log.hpp>
#include <veneer/dom/web_exports.hpp>

#if defined(__EMSCRIPTEN__)
#include <emscripten/emscripten.h>
#define VENEER_EXPORT EMSCRIPTEN_KEEPALIVE
#else
#define VENEER_EXPORT
#endif

namespace veneer::dom {

namespace {
EventRegistry *g_registry = nullptr;
Root *g_root = nullptr;
} // namespace

void bind_event_registry(EventRegistry *registry) { g_registry = registry; }

void bind_root(Root *root) { g_root = root; }

EventRegistry *bound_event_registry() { return g_registry; }

Root *bound_root() { return g_root; }

} // namespace veneer::dom

extern "C" {

VENEER_EXPORT void veneer_delegate_event(const char *type, const char *selector,
                                         const char *attrs_json) {
  auto *registry = veneer::dom::bound_event_registry();
  if (!registry) {
    VENEER_LOG_WARN("event %s dropped: no registry bound", type ? type : "");
    return;
  }
  const auto r = registry->delegate(type ? type : "", selector ? selector : "",
                                    attrs_json ? attrs_json : "{}");
  if (!r.ok) {
    VENEER_LOG_DEBUG("event %s not dispatched: %s", type ? type : "",
                     r.error.c_str());
  }
}

VENEER_EXPORT void veneer_flush() {
  auto *root = veneer::dom::bound_root();
  if (!root) {
    return;
  }
  const auto report = root->flush();
  if (!report.ok()) {
    VENEER_LOG_INFO("flush: %zu applied, %zu failed", report.applied,
                    report.failures.size());
  }
}

} // extern "C"

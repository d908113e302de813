#pragma once

#include <veneer/dom/events.hpp>
#include <veneer/dom/root.hpp>

// Entry points called by the host page.
extern "C" {
void veneer_delegate_event(const char *type, const char *selector,
                           const char *attrs_json);
void veneer_flush();
}

namespace veneer::dom {

// Targets of the inbound calls. Pass nullptr to detach; calls that arrive
// while nothing is bound are logged and dropped.
void bind_event_registry(EventRegistry *registry);
void bind_root(Root *root);

EventRegistry *bound_event_registry();
Root *bound_root();

} // namespace veneer::dom

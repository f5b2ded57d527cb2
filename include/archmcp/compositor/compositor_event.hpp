#pragma once

// ─────────────────────────────────────────────────────────────────────────────
// Compositor Events
// ─────────────────────────────────────────────────────────────────────────────
//
// The event socket pushes one record per line: "<kind>>><payload>". Payloads
// with several fields are comma separated, and the last field keeps any
// further commas (window titles may contain them):
//
//   workspace>>2
//   activewindow>>kitty,~/src: vim
//   openwindow>>80a6f50,2,kitty,Kitty, the terminal
//   moveworkspace>>3,DP-1
//
// Unknown kinds are preserved as UnknownEvent. A known kind whose payload
// does not fit (missing fields, non-numeric id) yields no event.
//
// ─────────────────────────────────────────────────────────────────────────────

#include "archmcp/json/json.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace archmcp {

struct WorkspaceEvent { std::string name; };
struct ActiveWindowEvent { std::string window_class; std::string title; };
struct FullscreenEvent { bool enabled{false}; };
struct MonitorAddedEvent { std::string name; };
struct MonitorRemovedEvent { std::string name; };
struct WorkspaceCreatedEvent { int id{0}; };
struct WorkspaceDestroyedEvent { int id{0}; };
struct WorkspaceMovedEvent { int id{0}; std::string monitor; };
struct WindowOpenedEvent { std::string address; std::string workspace; std::string window_class; std::string title; };
struct WindowClosedEvent { std::string address; };
struct WindowMovedEvent { std::string address; std::string workspace; };
struct UrgentEvent { std::string address; };
struct MinimizeEvent { std::string address; bool minimized{false}; };
struct UnknownEvent { std::string kind; std::string payload; };

using CompositorEvent = std::variant<
    WorkspaceEvent,
    ActiveWindowEvent,
    FullscreenEvent,
    MonitorAddedEvent,
    MonitorRemovedEvent,
    WorkspaceCreatedEvent,
    WorkspaceDestroyedEvent,
    WorkspaceMovedEvent,
    WindowOpenedEvent,
    WindowClosedEvent,
    WindowMovedEvent,
    UrgentEvent,
    MinimizeEvent,
    UnknownEvent
>;

/// Parse one event line (a trailing "\r" or "\n" is ignored). Returns nullopt
/// when the line has no ">>" separator or a known kind's payload is malformed.
[[nodiscard]] std::optional<CompositorEvent> parse_compositor_event(std::string_view line);

/// Wire name of the event kind ("workspace", "openwindow", ...); for
/// UnknownEvent the kind as received
[[nodiscard]] std::string event_kind(const CompositorEvent& event);

/// {"kind": ..., plus the event's fields}
[[nodiscard]] Json to_json(const CompositorEvent& event);

}  // namespace archmcp

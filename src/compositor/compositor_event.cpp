#include "archmcp/compositor/compositor_event.hpp"

#include <array>
#include <charconv>
#include <cstddef>
#include <type_traits>

namespace archmcp {

namespace {

constexpr std::string_view kSeparator{">>"};

template <typename>
inline constexpr bool kAlwaysFalse = false;

/// Split into exactly N fields on ','; the last field keeps the remainder
template <std::size_t N>
std::optional<std::array<std::string_view, N>> split_fields(std::string_view payload) {
    std::array<std::string_view, N> fields{};
    for (std::size_t i = 0; i + 1 < N; ++i) {
        const auto comma = payload.find(',');
        if (comma == std::string_view::npos) {
            return std::nullopt;
        }
        fields[i] = payload.substr(0, comma);
        payload.remove_prefix(comma + 1);
    }
    fields[N - 1] = payload;
    return fields;
}

std::optional<int> parse_int(std::string_view text) {
    int value = 0;
    const char* last = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(text.data(), last, value);
    if ((text.empty() == true) || (ec != std::errc{}) || (ptr != last)) {
        return std::nullopt;
    }
    return value;
}

}  // namespace

std::optional<CompositorEvent> parse_compositor_event(std::string_view line) {
    while ((line.empty() == false) && ((line.back() == '\n') || (line.back() == '\r'))) {
        line.remove_suffix(1);
    }

    const auto separator = line.find(kSeparator);
    if (separator == std::string_view::npos) {
        return std::nullopt;
    }
    const std::string_view kind = line.substr(0, separator);
    const std::string_view data = line.substr(separator + kSeparator.size());

    if (kind == "workspace") {
        return WorkspaceEvent{std::string(data)};
    }
    if (kind == "activewindow") {
        auto fields = split_fields<2>(data);
        if (!fields) return std::nullopt;
        return ActiveWindowEvent{std::string((*fields)[0]), std::string((*fields)[1])};
    }
    if (kind == "fullscreen") {
        return FullscreenEvent{data == "1"};
    }
    if (kind == "monitoradded") {
        return MonitorAddedEvent{std::string(data)};
    }
    if (kind == "monitorremoved") {
        return MonitorRemovedEvent{std::string(data)};
    }
    if (kind == "createworkspace") {
        auto id = parse_int(data);
        if (!id) return std::nullopt;
        return WorkspaceCreatedEvent{*id};
    }
    if (kind == "destroyworkspace") {
        auto id = parse_int(data);
        if (!id) return std::nullopt;
        return WorkspaceDestroyedEvent{*id};
    }
    if (kind == "moveworkspace") {
        auto fields = split_fields<2>(data);
        if (!fields) return std::nullopt;
        auto id = parse_int((*fields)[0]);
        if (!id) return std::nullopt;
        return WorkspaceMovedEvent{*id, std::string((*fields)[1])};
    }
    if (kind == "openwindow") {
        auto fields = split_fields<4>(data);
        if (!fields) return std::nullopt;
        return WindowOpenedEvent{
            std::string((*fields)[0]),
            std::string((*fields)[1]),
            std::string((*fields)[2]),
            std::string((*fields)[3])
        };
    }
    if (kind == "closewindow") {
        return WindowClosedEvent{std::string(data)};
    }
    if (kind == "movewindow") {
        auto fields = split_fields<2>(data);
        if (!fields) return std::nullopt;
        return WindowMovedEvent{std::string((*fields)[0]), std::string((*fields)[1])};
    }
    if (kind == "urgent") {
        return UrgentEvent{std::string(data)};
    }
    if (kind == "minimize") {
        auto fields = split_fields<2>(data);
        if (!fields) return std::nullopt;
        return MinimizeEvent{std::string((*fields)[0]), (*fields)[1] == "1"};
    }

    return UnknownEvent{std::string(kind), std::string(data)};
}

std::string event_kind(const CompositorEvent& event) {
    return std::visit([](const auto& e) -> std::string {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, WorkspaceEvent>) return "workspace";
        else if constexpr (std::is_same_v<T, ActiveWindowEvent>) return "activewindow";
        else if constexpr (std::is_same_v<T, FullscreenEvent>) return "fullscreen";
        else if constexpr (std::is_same_v<T, MonitorAddedEvent>) return "monitoradded";
        else if constexpr (std::is_same_v<T, MonitorRemovedEvent>) return "monitorremoved";
        else if constexpr (std::is_same_v<T, WorkspaceCreatedEvent>) return "createworkspace";
        else if constexpr (std::is_same_v<T, WorkspaceDestroyedEvent>) return "destroyworkspace";
        else if constexpr (std::is_same_v<T, WorkspaceMovedEvent>) return "moveworkspace";
        else if constexpr (std::is_same_v<T, WindowOpenedEvent>) return "openwindow";
        else if constexpr (std::is_same_v<T, WindowClosedEvent>) return "closewindow";
        else if constexpr (std::is_same_v<T, WindowMovedEvent>) return "movewindow";
        else if constexpr (std::is_same_v<T, UrgentEvent>) return "urgent";
        else if constexpr (std::is_same_v<T, MinimizeEvent>) return "minimize";
        else if constexpr (std::is_same_v<T, UnknownEvent>) return e.kind;
        else static_assert(kAlwaysFalse<T>, "unhandled compositor event");
    }, event);
}

Json to_json(const CompositorEvent& event) {
    Json j = std::visit([](const auto& e) -> Json {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, WorkspaceEvent>) {
            return {{"name", e.name}};
        } else if constexpr (std::is_same_v<T, ActiveWindowEvent>) {
            return {{"class", e.window_class}, {"title", e.title}};
        } else if constexpr (std::is_same_v<T, FullscreenEvent>) {
            return {{"enabled", e.enabled}};
        } else if constexpr (std::is_same_v<T, MonitorAddedEvent> || std::is_same_v<T, MonitorRemovedEvent>) {
            return {{"name", e.name}};
        } else if constexpr (std::is_same_v<T, WorkspaceCreatedEvent> || std::is_same_v<T, WorkspaceDestroyedEvent>) {
            return {{"id", e.id}};
        } else if constexpr (std::is_same_v<T, WorkspaceMovedEvent>) {
            return {{"id", e.id}, {"monitor", e.monitor}};
        } else if constexpr (std::is_same_v<T, WindowOpenedEvent>) {
            return {{"address", e.address}, {"workspace", e.workspace}, {"class", e.window_class}, {"title", e.title}};
        } else if constexpr (std::is_same_v<T, WindowClosedEvent> || std::is_same_v<T, UrgentEvent>) {
            return {{"address", e.address}};
        } else if constexpr (std::is_same_v<T, WindowMovedEvent>) {
            return {{"address", e.address}, {"workspace", e.workspace}};
        } else if constexpr (std::is_same_v<T, MinimizeEvent>) {
            return {{"address", e.address}, {"minimized", e.minimized}};
        } else if constexpr (std::is_same_v<T, UnknownEvent>) {
            return {{"payload", e.payload}};
        } else {
            static_assert(kAlwaysFalse<T>, "unhandled compositor event");
        }
    }, event);
    j["kind"] = event_kind(event);
    return j;
}

}  // namespace archmcp

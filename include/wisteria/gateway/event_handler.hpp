#pragma once

#include "wisteria/config.hpp"
#include "wisteria/error.hpp"
#include "wisteria/gateway/event.hpp"
#include "wisteria/gateway/frame.hpp"

#include <expected>
#include <functional>
#include <string_view>
#include <typeindex>
#include <unordered_map>
#include <utility>
#include <vector>

namespace wisteria::gateway
{

/**
 * Routes resolved gateway events to application callbacks.
 *
 * Callbacks are keyed by the event type they take: a control event
 * (Hello, Dispatch, ...) or one of the dispatch events in gateway::events.
 * A dispatch frame reaches the Dispatch callbacks first, then the callbacks
 * of the event it carries. Callbacks of one type run in registration order.
 */
class EventHandler
{
public:
    EventHandler() = default;
    explicit EventHandler(bool ignore_unknown_dispatch);
    explicit EventHandler(const Config& config);

    template<class Ev>
    void on(std::function<void(const Ev&)> fn)
    {
        hdls[std::type_index(typeid(Ev))].push_back(
            [fn = std::move(fn)](const void* ev) { fn(*static_cast<const Ev*>(ev)); });
    }

    // Resolves `frame` and routes the result. Unknown dispatch tags succeed
    // when they are configured to be ignored.
    [[nodiscard]] std::expected<void, Error> handle(const FrameEnvelope& frame);

    // Parses raw frame text, bounded by the configured frame size, then
    // handles it as above.
    [[nodiscard]] std::expected<void, Error> handle(std::string_view text);

    void route(const Event& event);

    [[nodiscard]] bool ignores_unknown_dispatch() const { return ignore_unknown; }
    [[nodiscard]] size_t max_frame_size() const { return max_frame; }

private:
    using Handler = std::function<void(const void*)>;

    template<class Ev>
    void notify(const Ev& ev);

    bool ignore_unknown = true;
    size_t max_frame = FrameEnvelope::default_max_size;
    std::unordered_map<std::type_index, std::vector<Handler>> hdls;
};

} // namespace wisteria::gateway

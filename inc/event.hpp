//SPDX-License-Identifier: LicenseRef-Apache-License-2.0
//Author: Blayne Dennis

#ifndef __SIMPLE_UIKIT_EVENT__
#define __SIMPLE_UIKIT_EVENT__

#include <cstddef>
#include <memory>

#include "data.hpp"
#include "context.hpp"

namespace su { // simple uikit
namespace detail {
namespace event {

enum kind {
    user = 0,
    refresh,
    wake_up
};

struct context {
    context(kind k, std::size_t id) : m_kind(k), m_id(id) { }

    context(kind k, std::size_t id, su::data&& d) :
        m_kind(k),
        m_id(id),
        m_data(std::move(d))
    { }

    const kind m_kind;
    const std::size_t m_id;
    su::data m_data;
};

}
}

/**
 * @brief opaque item injected into an application's event queue
 *
 * Events are produced on any thread with `su::application::inject_event()`
 * and are handed, in injection order, to `su::application::process_event()`
 * on the UI thread.
 *
 * An `su::event` is a handle: copies refer to the same id and payload. It is
 * *not* mutex locked, the payload should only be touched by the consumer.
 */
struct event : public su::shared_context<event, detail::event::context> {
    inline virtual ~event() { }

    /**
     * @brief construct an event
     *
     * @param id an unsigned integer representing which kind of event
     * @param d payload data
     * @return an allocated `su::event`
     */
    static inline event make(std::size_t id, su::data&& d) {
        event e;
        e.ctx(std::make_shared<detail::event::context>(
            detail::event::user,
            id,
            std::move(d)));
        return e;
    }

    /**
     * @brief construct an event
     *
     * @param id an unsigned integer representing which kind of event
     * @param t arbitrary typed data to be stored as the event payload
     * @return an allocated `su::event`
     */
    template <typename T>
    static event make(std::size_t id, T&& t) {
        return event::make(id, su::data::make<T>(std::forward<T>(t)));
    }

    /**
     * @brief construct an event without a payload
     *
     * @param id an unsigned integer representing which kind of event
     * @return an allocated `su::event`
     */
    static inline event make(std::size_t id=0) {
        event e;
        e.ctx(std::make_shared<detail::event::context>(detail::event::user, id));
        return e;
    }

    /**
     * @return a marker asking the UI thread to redraw the screen
     */
    static inline event refresh_marker() {
        event e;
        e.ctx(std::make_shared<detail::event::context>(detail::event::refresh, 0));
        return e;
    }

    /**
     * @return a marker whose only purpose is to wake up an idle main loop
     */
    static inline event wake_up_marker() {
        event e;
        e.ctx(std::make_shared<detail::event::context>(detail::event::wake_up, 0));
        return e;
    }

    /**
     * @return `true` if this is a redraw request marker, else `false`
     */
    inline bool is_refresh() const {
        return ctx() && ctx()->m_kind == detail::event::refresh;
    }

    /**
     * @return `true` if this is a wake up marker, else `false`
     */
    inline bool is_wake_up() const {
        return ctx() && ctx()->m_kind == detail::event::wake_up;
    }

    /**
     * @return `true` if this event was produced by user code, else `false`
     */
    inline bool is_user() const {
        return ctx() && ctx()->m_kind == detail::event::user;
    }

    /**
     * @brief an unsigned integer representing the event's meaning
     *
     * An `id` can trivially represent an enumeration of the kinds of event an
     * application understands.
     */
    inline std::size_t id() const {
        return ctx()->m_id;
    }

    /**
     * @brief optional type erased payload data
     */
    inline su::data& data() {
        return ctx()->m_data;
    }
};

}

#endif

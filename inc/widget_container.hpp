//SPDX-License-Identifier: LicenseRef-Apache-License-2.0
//Author: Blayne Dennis

#ifndef __SIMPLE_UIKIT_WIDGET_CONTAINER__
#define __SIMPLE_UIKIT_WIDGET_CONTAINER__

#include <algorithm>
#include <cstddef>
#include <memory>
#include <type_traits>
#include <vector>

namespace su { // simple uikit

/**
 * @brief capability of a widget which can redraw itself from its model
 */
struct refreshable {
    virtual ~refreshable() { }
    virtual void refresh() = 0;
};

namespace detail {
namespace widget_container {

// handle case where W may implement su::refreshable
template <typename W>
void refresh(std::true_type, const std::shared_ptr<W>& w) {
    auto r = dynamic_cast<su::refreshable*>(w.get());
    if(r) {
        r->refresh();
    }
}

// handle case where W cannot
template <typename W>
void refresh(std::false_type, const std::shared_ptr<W>&) { }

}
}

/**
 * @brief refresh a widget if it implements `su::refreshable`
 */
template <typename W>
void refresh_widget(const std::shared_ptr<W>& w) {
    if(w) {
        detail::widget_container::refresh(std::is_polymorphic<W>(), w);
    }
}

/**
 * @brief interface of a widget holding an ordered sequence of child widgets, one of which may have focus
 *
 * Widgets are held by `std::shared_ptr` and compared by identity.
 *
 * W: the child widget type
 */
template <typename W>
struct widget_container {
    typedef std::shared_ptr<W> widget_ptr;

    virtual ~widget_container() { }

    /**
     * @return count of child widgets
     */
    virtual std::size_t size() const = 0;

    /**
     * @return the child widgets in display order
     */
    virtual std::vector<widget_ptr> widgets() const = 0;

    /**
     * @return the child widget at index, null if out of range
     */
    virtual widget_ptr widget_at(std::size_t index) const = 0;

    /**
     * @brief insert a child widget
     * @param w widget to insert
     * @param index position of the new widget, values past the end append
     */
    virtual void add_widget(widget_ptr w, std::size_t index) = 0;

    /**
     * @brief append a child widget
     */
    inline void add_widget(widget_ptr w) {
        add_widget(std::move(w), size());
    }

    /**
     * @return `true` if the widget was a child and was removed, else `false`
     */
    virtual bool remove_widget(const widget_ptr& w) = 0;

    /**
     * @brief remove every child widget
     */
    virtual void clear() = 0;

    /**
     * @return the focused child widget, null if none
     */
    virtual widget_ptr focused_widget() const = 0;

    /**
     * @return the index of the focused child widget, `-1` if none
     */
    virtual int focus_position() const = 0;

    /**
     * @brief move the focus
     * @return `true` on success, `false` if index is out of range
     */
    virtual bool focus_position(int index) = 0;

    /**
     * @brief refresh every child widget implementing `su::refreshable`
     */
    virtual void refresh() {
        for(auto& w : widgets()) {
            su::refresh_widget(w);
        }
    }
};

/**
 * @brief vertical list of child widgets
 *
 * Focus rules:
 * - the first widget added to an empty list gets the focus
 * - the focus follows its widget when widgets are inserted before it
 * - removing the focused widget moves the focus to the widget which took its place, or the new last widget
 *
 * Not threadsafe, owned by the UI thread.
 */
template <typename W>
struct widget_list : public widget_container<W> {
    typedef typename widget_container<W>::widget_ptr widget_ptr;
    using widget_container<W>::add_widget;

    widget_list() : m_focus(-1) { }
    virtual ~widget_list() { }

    inline std::size_t size() const {
        return m_widgets.size();
    }

    inline std::vector<widget_ptr> widgets() const {
        return m_widgets;
    }

    inline widget_ptr widget_at(std::size_t index) const {
        return index < m_widgets.size() ? m_widgets[index] : widget_ptr();
    }

    inline void add_widget(widget_ptr w, std::size_t index) {
        if(index > m_widgets.size()) {
            index = m_widgets.size();
        }

        m_widgets.insert(m_widgets.begin() + index, std::move(w));

        if(m_focus < 0) {
            m_focus = static_cast<int>(index);
        } else if(static_cast<int>(index) <= m_focus) {
            ++m_focus;
        }
    }

    inline bool remove_widget(const widget_ptr& w) {
        auto it = std::find(m_widgets.begin(), m_widgets.end(), w);

        if(it == m_widgets.end()) {
            return false;
        }

        int index = static_cast<int>(it - m_widgets.begin());
        m_widgets.erase(it);

        if(m_widgets.empty()) {
            m_focus = -1;
        } else if(index < m_focus) {
            --m_focus;
        } else if(index == m_focus && m_focus >= static_cast<int>(m_widgets.size())) {
            m_focus = static_cast<int>(m_widgets.size()) - 1;
        }

        return true;
    }

    inline void clear() {
        m_widgets.clear();
        m_focus = -1;
    }

    inline widget_ptr focused_widget() const {
        return m_focus < 0 ? widget_ptr() : m_widgets[m_focus];
    }

    inline int focus_position() const {
        return m_focus;
    }

    inline bool focus_position(int index) {
        if(index < 0 || index >= static_cast<int>(m_widgets.size())) {
            return false;
        }

        m_focus = index;
        return true;
    }

private:
    std::vector<widget_ptr> m_widgets;
    int m_focus;
};

}

#endif

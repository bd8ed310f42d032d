//SPDX-License-Identifier: LicenseRef-Apache-License-2.0
//Author: Blayne Dennis

#ifndef __SIMPLE_UIKIT_OBJECT_CONTAINER__
#define __SIMPLE_UIKIT_OBJECT_CONTAINER__

#include <algorithm>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <vector>

#include "widget_container.hpp"

namespace su { // simple uikit

/**
 * @brief keeps the widgets of a `su::widget_container` in a 1:1 mapping with business objects
 *
 * Each item added gets a widget built by a factory. Widgets are kept ordered
 * by the key their item yields through the key function. Items with equal
 * keys keep the order in which they were added. An empty key function orders
 * every item by insertion.
 *
 * A widget owning a list of items *contains* an `object_container` next to
 * its `su::widget_container` and delegates to it.
 *
 * Items and widgets are compared by identity. Not threadsafe, owned by the UI
 * thread.
 *
 * ITEM: the business object type
 * WIDGET: the widget type held by the container
 * KEY: a type ordered by `operator<`
 */
template <typename ITEM, typename WIDGET, typename KEY>
struct object_container {
    typedef std::shared_ptr<ITEM> item_ptr;
    typedef std::shared_ptr<WIDGET> widget_ptr;
    typedef std::function<KEY(const ITEM&)> key_function_type;
    typedef std::function<widget_ptr(const item_ptr&)> widget_factory;
    typedef std::function<void(const item_ptr&)> selection_handler;

    /**
     * @param container the widget container to manage, must outlive this object
     * @param factory builds the widget representing an item
     * @param key derives the ordering key of an item
     */
    object_container(su::widget_container<WIDGET>& container,
                     widget_factory factory,
                     key_function_type key=key_function_type()) :
        m_container(container),
        m_factory(std::move(factory)),
        m_key(std::move(key)),
        m_next_seq(0)
    { }

    virtual ~object_container() { }

    /**
     * @brief add an item, building and inserting its widget in key order
     * @return the widget of the item, the existing one if it was already added, null if the factory failed
     */
    inline widget_ptr add_item(const item_ptr& item) {
        return get_widget_for_item(item, true);
    }

    /**
     * @brief remove an item and its widget
     * @return the removed widget, null if the item was not in the container
     */
    inline widget_ptr remove_item(const item_ptr& item) {
        auto it = m_entries.find(item.get());

        if(it == m_entries.end()) {
            return widget_ptr();
        }

        widget_ptr w = it->second.m_widget;
        m_container.remove_widget(w);
        m_items_by_widget.erase(w.get());
        m_entries.erase(it);
        return w;
    }

    /**
     * @return `true` if the item has a widget in the container, else `false`
     */
    inline bool contains_item(const item_ptr& item) const {
        return m_entries.find(item.get()) != m_entries.end();
    }

    /**
     * @param item the item to look up
     * @param create_if_missing build and insert a widget if the item has none
     * @return the widget of the item, null if none
     */
    inline widget_ptr get_widget_for_item(const item_ptr& item, bool create_if_missing=false) {
        if(!item) {
            return widget_ptr();
        }

        auto it = m_entries.find(item.get());

        if(it != m_entries.end()) {
            return it->second.m_widget;
        } else if(create_if_missing) {
            return create_and_insert(item);
        } else {
            return widget_ptr();
        }
    }

    /**
     * @return the item represented by a widget, null if the widget is not managed by this container
     */
    inline item_ptr item_for_widget(const widget_ptr& w) const {
        auto it = m_items_by_widget.find(w.get());
        return it != m_items_by_widget.end() ? it->second : item_ptr();
    }

    /**
     * @brief refresh the widget of an item if it implements `su::refreshable`
     * @return the widget of the item, null if none
     */
    inline widget_ptr refresh_item(const item_ptr& item, bool create_if_missing=false) {
        widget_ptr w = get_widget_for_item(item, create_if_missing);
        su::refresh_widget(w);
        return w;
    }

    /**
     * @brief remove every item and every widget
     */
    inline void clear() {
        m_entries.clear();
        m_items_by_widget.clear();
        m_container.clear();
    }

    /**
     * @return the current key function, empty when ordering by insertion
     */
    inline const key_function_type& key_function() const {
        return m_key;
    }

    /**
     * @brief replace the key function and reorder the widgets
     */
    inline void key_function(key_function_type key) {
        m_key = std::move(key);
        update_order();
    }

    /**
     * @brief sort the widgets by key, keep the focus on the same item, and refresh every widget
     */
    void update_order() {
        widget_ptr focused = m_container.focused_widget();
        std::vector<widget_ptr> widgets = m_container.widgets();

        std::stable_sort(widgets.begin(), widgets.end(),
            [&](const widget_ptr& lhs, const widget_ptr& rhs) {
                return before(entry_for_widget(lhs), entry_for_widget(rhs));
            });

        m_container.clear();

        for(auto& w : widgets) {
            m_container.add_widget(w);
        }

        if(focused) {
            auto it = std::find(widgets.begin(), widgets.end(), focused);

            if(it != widgets.end()) {
                m_container.focus_position(static_cast<int>(it - widgets.begin()));
            }
        }

        m_container.refresh();
    }

    /**
     * @return the item of the focused widget, null if nothing is focused
     */
    inline item_ptr selected_item() const {
        return item_for_widget(m_container.focused_widget());
    }

    /**
     * @brief install the handler called by `emit_item_selected()`
     */
    inline void on_item_selected(selection_handler f) {
        m_on_selected = std::move(f);
    }

    /**
     * @brief call the selection handler with the selected item, if there is one
     * @return `true` if the handler was called, else `false`
     */
    inline bool emit_item_selected() {
        item_ptr item = selected_item();

        if(item && m_on_selected) {
            m_on_selected(item);
            return true;
        } else {
            return false;
        }
    }

    /**
     * @return count of items
     */
    inline std::size_t size() const {
        return m_entries.size();
    }

    /**
     * @return the items in display order
     */
    inline std::vector<item_ptr> items() const {
        std::vector<item_ptr> result;

        for(auto& w : m_container.widgets()) {
            item_ptr item = item_for_widget(w);
            if(item) {
                result.push_back(item);
            }
        }

        return result;
    }

private:
    struct entry {
        item_ptr m_item;
        widget_ptr m_widget;
        std::size_t m_seq; // insertion order, tiebreak between equal keys
    };

    inline const entry* entry_for_widget(const widget_ptr& w) const {
        auto it = m_items_by_widget.find(w.get());

        if(it == m_items_by_widget.end()) {
            return nullptr;
        }

        return &(m_entries.find(it->second.get())->second);
    }

    // strict (key, insertion) ordering, foreign widgets sort last
    inline bool before(const entry* lhs, const entry* rhs) const {
        if(!lhs || !rhs) {
            return lhs && !rhs;
        }

        if(m_key) {
            KEY lk = m_key(*(lhs->m_item));
            KEY rk = m_key(*(rhs->m_item));

            if(lk < rk) {
                return true;
            } else if(rk < lk) {
                return false;
            }
        }

        return lhs->m_seq < rhs->m_seq;
    }

    inline widget_ptr create_and_insert(const item_ptr& item) {
        widget_ptr w = m_factory ? m_factory(item) : widget_ptr();

        if(!w) {
            return w;
        }

        entry e;
        e.m_item = item;
        e.m_widget = w;
        e.m_seq = m_next_seq;

        // find the position first, the key function may throw and nothing is mapped yet
        std::vector<widget_ptr> widgets = m_container.widgets();
        std::size_t index = 0;

        while(index < widgets.size() && !before(&e, entry_for_widget(widgets[index]))) {
            ++index;
        }

        m_container.add_widget(w, index);
        ++m_next_seq;
        m_items_by_widget[w.get()] = item;
        m_entries[item.get()] = std::move(e);
        return w;
    }

    su::widget_container<WIDGET>& m_container;
    widget_factory m_factory;
    key_function_type m_key;
    selection_handler m_on_selected;
    std::size_t m_next_seq;
    std::map<const ITEM*, entry> m_entries;
    std::map<const WIDGET*, item_ptr> m_items_by_widget;
};

}

#endif

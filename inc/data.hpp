//SPDX-License-Identifier: LicenseRef-Apache-License-2.0
//Author: Blayne Dennis

#ifndef __SIMPLE_UIKIT_DATA__
#define __SIMPLE_UIKIT_DATA__

#include <memory>
#include <typeinfo>
#include <utility>

#include "utility.hpp"

namespace su { // simple uikit

/**
 * @brief type erased payload container
 *
 * Used as the payload of `su::event`s injected into an application's event
 * queue, where the UI thread receives values of arbitrary type produced by
 * worker threads.
 *
 * `su::data` is move only. It can hold any type that can be constructed from
 * the arguments given to `su::data::make<T>(...)`.
 */
struct data {
    // type_info helper struct when unallocated
    struct unset { };

    /// default constructor
    data() :
        m_type_info(&typeid(unset)),
        m_data_ptr(data_pointer_t(nullptr, data::no_delete))
    { }

    /// rvalue constructor
    data(data&& rhs) :
        m_type_info(rhs.m_type_info),
        m_data_ptr(std::move(rhs.m_data_ptr))
    {
        rhs.m_type_info = &typeid(unset);
    }

    virtual ~data() { }

    /**
     * @brief construct a data payload using explicit template typing instead of by deduction
     *
     * @param as optional constructor parameters
     * @return an allocated data object
     */
    template <typename T, typename... As>
    static data make(As&&... as) {
        return data(detail::hint<T>(), std::forward<As>(as)...);
    }

    /// rvalue assignment
    inline data& operator=(data&& rhs) {
        m_type_info = rhs.m_type_info;
        m_data_ptr = std::move(rhs.m_data_ptr);
        rhs.m_type_info = &typeid(unset);
        return *this;
    }

    /// no lvalue constructor or copy
    data(const data& rhs) = delete;
    data& operator=(const data& rhs) = delete;

    /**
     * @return `true` if the object holds a payload, else `false`
     */
    inline explicit operator bool() const {
        return m_data_ptr ? true : false;
    }

    /**
     * If `su::data` holds no payload the returned type_info will be equal to
     * `typeid(su::data::unset)`.
     *
     * @return payload type info
     */
    inline const std::type_info& type_info() const {
        return *m_type_info;
    }

    /**
     * @return true if the unqualified type of T matches the payload type, else false
     */
    template <typename T>
    bool is() const {
        return m_data_ptr && *m_type_info == typeid(detail::base<T>);
    }

    /**
     * @brief cast the payload to templated type reference
     *
     * NOTE: this function is *NOT* type checked. A successful call to
     * `is<T>()` is required before casting. `copy_to<T>()` and `move_to<T>()`
     * include an internal type check.
     *
     * @return a reference of type T to the payload
     */
    template <typename T>
    T& cast_to() {
        return *((detail::base<T>*)(m_data_ptr.get()));
    }

    /**
     * @brief copy the payload to argument t
     * @return true on success, false on type mismatch
     */
    template <typename T>
    bool copy_to(T& t) {
        if(is<T>()) {
            t = cast_to<T>();
            return true;
        } else {
            return false;
        }
    }

    /**
     * @brief swap the payload with argument t
     * @return true on success, false on type mismatch
     */
    template <typename T>
    bool move_to(T& t) {
        if(is<T>()) {
            std::swap(t, cast_to<T>());
            return true;
        } else {
            return false;
        }
    }

private:
    typedef void(*deleter_t)(void*);
    typedef std::unique_ptr<void,deleter_t> data_pointer_t;

    template <typename T, typename... As>
    data(detail::hint<T>, As&&... as) :
        m_type_info(&typeid(detail::base<T>)),
        m_data_ptr(allocate<T>(std::forward<As>(as)...), data::deleter<T>)
    { }

    template <typename T, typename... As>
    static void* allocate(As&&... as) {
        return (void*)(new detail::base<T>(std::forward<As>(as)...));
    }

    template <typename T>
    static void deleter(void* p) {
        delete (detail::base<T>*)p;
    }

    static inline void no_delete(void*) { }

    const std::type_info* m_type_info;
    data_pointer_t m_data_ptr;
};

}

#endif

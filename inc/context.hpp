//SPDX-License-Identifier: LicenseRef-Apache-License-2.0
//Author: Blayne Dennis

#ifndef __SIMPLE_UIKIT_CONTEXT__
#define __SIMPLE_UIKIT_CONTEXT__

#include <memory>

#include "utility.hpp"

namespace su { // simple uikit

/**
 * @brief CRTP-templated interface to provide shared context api
 *
 * Most public objects in this library are handles: cheap to copy, comparable,
 * and all copies refer to the same underlying state. By inheriting this
 * template a handle type gets a standardized implementation of:
 * ==
 * !=
 * <
 * >
 * <=
 * >=
 * bool conversion
 *
 * As well as standardized access to the underlying pointer (of type CRTPCTX)
 * which holds the real implementation:
 * ctx() -> shared_ptr<CRTPCTX>& // getter
 * ctx(shared_ptr<CRTPCTX>) -> void // setter
 *
 * CRTP: curiously recurring template pattern, this should be equal to the
 * child type which is implementing this object. IE:
 * struct object : shared_context<object, detail::object::context>
 *
 * CRTPCTX: the CRTP's context type. This is the underlying private type
 * containing the actual data and implementation of an object.
 */
template <typename CRTP, typename CRTPCTX>
struct shared_context {
protected:
    /**
     * WARNING: Blind manipulation of this value is dangerous.
     *
     * @return context shared pointer reference
     */
    inline std::shared_ptr<CRTPCTX>& ctx() const {
        return this->m_context;
    }

    /**
     * @param new_ctx assign the context shared pointer
     */
    inline void ctx(std::shared_ptr<CRTPCTX> new_ctx) {
        this->m_context = std::move(new_ctx);
    }

public:
    virtual ~shared_context() { }

    /**
     * @return `true` if object is allocated, else `false`
     */
    inline explicit operator bool() const {
        return this->ctx().operator bool();
    }

    /**
     * @brief release this handle's reference to the shared context
     */
    inline void reset() {
        this->ctx().reset();
    }

    inline bool operator==(const CRTP& rhs) const noexcept {
        return this->ctx() == rhs.ctx();
    }

    inline bool operator!=(const CRTP& rhs) const noexcept {
        return this->ctx() != rhs.ctx();
    }

    inline bool operator<(const CRTP& rhs) const noexcept {
        return this->ctx() < rhs.ctx();
    }

    inline bool operator>(const CRTP& rhs) const noexcept {
        return rhs.ctx() < this->ctx();
    }

    inline bool operator<=(const CRTP& rhs) const noexcept {
        return !(rhs.ctx() < this->ctx());
    }

    inline bool operator>=(const CRTP& rhs) const noexcept {
        return !(this->ctx() < rhs.ctx());
    }

private:
    mutable std::shared_ptr<CRTPCTX> m_context;
};

}

#endif

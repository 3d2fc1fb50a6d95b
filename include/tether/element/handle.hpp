#pragma once

/// @file handle.hpp
/// @brief Generic element handle and the checked downcast
///
/// Handle is the element wrapper that stands for "any element". Its class
/// tag is a sentinel no native class uses, and every typed wrapper converts
/// to it implicitly. Going back to a typed wrapper compares the live class
/// name of the native object with the target's tag, byte for byte.

#include "element.hpp"

#include <concepts>
#include <string_view>
#include <vector>

namespace tether_element {

namespace detail {

/// Report the outcome of a downcast on the element logger
void log_downcast(std::string_view target_type, std::string_view target_class, RawHandle handle, bool matched);

} // namespace detail

// =============================================================================
// Handle
// =============================================================================

class Handle final : public Element<Handle> {
    TETHER_ELEMENT_BODY(Handle, "__tether_handle")

    /// Null handle
    Handle() noexcept = default;

    /// Erase the type of any wrapper
    template<typename E>
        requires (!std::same_as<E, Handle>) && ElementType<E>
    Handle(const E& elem) noexcept : Element<Handle>(elem.raw()) {}

    /// Erase the type of any wrapper
    template<ElementType E>
    [[nodiscard]] static Handle from_element(const E& elem) noexcept {
        return Handle::from_raw_unchecked(elem.raw());
    }

    [[nodiscard]] bool is_null() const noexcept { return raw() == nullptr; }

    /// Check if the live class of the element matches E.
    /// Always true for the Handle target itself.
    template<ElementType E>
    [[nodiscard]] bool can_downcast() const {
        if (E::target_class_name() == target_class_name()) {
            return true;
        }
        if (is_null()) {
            return false;
        }
        return detail::live_class_name(raw()) == E::target_class_name();
    }

    /// Convert to E if the live class matches; otherwise give this handle back.
    /// A successful downcast does not install the destruction hook again.
    template<ElementType E>
    [[nodiscard]] tether_core::Result<E, Handle> try_downcast() const {
        const bool matched = can_downcast<E>();
        detail::log_downcast(E::type_name(), E::target_class_name(), raw(), matched);
        if (!matched) {
            return tether_core::Result<E, Handle>(tether_core::err_tag, *this);
        }
        return E::from_raw_unchecked(raw());
    }
};

static_assert(ElementType<Handle>);

template<typename Derived>
tether_core::Result<Derived, Handle> Element<Derived>::from_handle(Handle handle) {
    return handle.try_downcast<Derived>();
}

template<typename Derived>
tether_core::Result<void> Element<Derived>::append(const Handle& child) {
    if (!tether_native::native_system().append(m_handle, child.raw())) {
        return tether_core::Err(detail::append_error(m_handle, Derived::type_name(), child.raw()));
    }
    return tether_core::Ok();
}

/// Erase a list of wrappers of mixed types, e.g. for container children
template<typename... Es>
[[nodiscard]] std::vector<Handle> make_elements(const Es&... elems) {
    return std::vector<Handle>{Handle(elems)...};
}

} // namespace tether_element

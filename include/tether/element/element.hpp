#pragma once

/// @file element.hpp
/// @brief Element capability shared by every typed wrapper
///
/// A typed wrapper is a copyable value holding one raw native handle and
/// statically tied to one native class name. Copies alias the same native
/// object; none of them owns it. Wrappers are siblings: a Button is never
/// a kind of Dialog, and the only checked conversion between them goes
/// through Handle::try_downcast.
///
/// Element<Derived> supplies the default operations. Concrete wrappers are
/// declared with TETHER_ELEMENT (see controls.hpp).

#include "fwd.hpp"
#include "callback.hpp"
#include <tether/core/error.hpp>
#include <tether/native/system.hpp>

#include <concepts>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace tether_element {

// =============================================================================
// ElementType Concept
// =============================================================================

/// Requirements of a typed wrapper
template<typename T>
concept ElementType = std::copyable<T> && requires(const T& elem, RawHandle handle) {
    { elem.raw() } -> std::same_as<RawHandle>;
    { T::from_raw_unchecked(handle) } -> std::same_as<T>;
    { T::target_class_name() } -> std::same_as<std::string_view>;
    { T::type_name() } -> std::same_as<std::string_view>;
};

// =============================================================================
// Out-of-line Helpers (element.cpp)
// =============================================================================

namespace detail {

/// Log and throw std::invalid_argument for a null handle at from_raw
[[noreturn]] void null_handle_error(std::string_view type_name);

/// Log a failed map/show and build the error for it
[[nodiscard]] tether_core::Error native_status_error(
    tether_core::NativeError::Kind kind, RawHandle handle, std::string_view type_name, int status);

/// Log a refused append and build the error for it
[[nodiscard]] tether_core::Error append_error(RawHandle parent, std::string_view type_name, RawHandle child);

/// "TypeName(0x...)"
[[nodiscard]] std::string format_element(std::string_view type_name, RawHandle handle);

/// Live class name, empty when the native system reports none
[[nodiscard]] std::string live_class_name(RawHandle handle);

} // namespace detail

// =============================================================================
// Element<Derived>
// =============================================================================

template<typename Derived>
class Element {
public:
    // =========================================================================
    // Construction
    // =========================================================================

    /// Wrap a raw handle freshly returned by a native constructor.
    ///
    /// This is the only entry point that installs the destruction hook, so
    /// every handle must cross it once before being aliased elsewhere.
    /// The live class of the handle must match Derived.
    ///
    /// @throws std::invalid_argument if handle is null
    [[nodiscard]] static Derived from_raw(RawHandle handle) {
        if (!handle) {
            detail::null_handle_error(Derived::type_name());
        }
        CallbackRegistry::instance().install_destroy_hook(tether_native::native_system(), handle);
        return Derived::from_raw_unchecked(handle);
    }

    /// Wrap a raw handle without any check or hook installation.
    ///
    /// The handle must already have passed through from_raw, and its live
    /// class must match Derived. Anything else is undefined behaviour.
    [[nodiscard]] static Derived from_raw_unchecked(RawHandle handle) noexcept {
        return Derived(handle);
    }

    /// Create a new native object of Derived's class.
    /// @throws std::invalid_argument if the native system refuses the class
    [[nodiscard]] static Derived create() {
        return from_raw(tether_native::native_system().create(Derived::target_class_name().data()));
    }

    /// Convert a generic handle if the live class matches (handle.hpp)
    [[nodiscard]] static tether_core::Result<Derived, Handle> from_handle(Handle handle);

    // =========================================================================
    // Identity
    // =========================================================================

    /// Raw handle, ownership stays with the native system
    [[nodiscard]] RawHandle raw() const noexcept { return m_handle; }

    /// Another alias of the same native object
    [[nodiscard]] Derived dup() const noexcept { return Derived::from_raw_unchecked(m_handle); }

    /// Live class name as reported by the native system
    [[nodiscard]] std::string class_name() const { return detail::live_class_name(m_handle); }

    /// Same native object
    [[nodiscard]] bool operator==(const Element& other) const noexcept = default;

    // =========================================================================
    // Hierarchy
    // =========================================================================

    /// Attach a detached child at the end of this element's children (handle.hpp)
    [[nodiscard]] tether_core::Result<void> append(const Handle& child);

    // =========================================================================
    // Attributes
    // =========================================================================

    /// Set an attribute. The value is copied by the native system.
    Derived& set_attribute(const std::string& name, const std::string& value) {
        tether_native::native_system().set_attribute(m_handle, name.c_str(), value.c_str());
        return derived();
    }

    /// Get an attribute; nullopt when the native system has no value.
    /// An empty string is a value.
    [[nodiscard]] std::optional<std::string> attribute(const std::string& name) const {
        const char* value = tether_native::native_system().attribute(m_handle, name.c_str());
        if (!value) {
            return std::nullopt;
        }
        return std::string(value);
    }

    /// Clear the value so the default applies
    void clear_attribute(const std::string& name) {
        tether_native::native_system().set_attribute(m_handle, name.c_str(), nullptr);
    }

    /// Remove an attribute from the element and, if inheritable, its children
    void reset_attribute(const std::string& name) {
        tether_native::native_system().reset_attribute(m_handle, name.c_str());
    }

    // =========================================================================
    // Lifecycle
    // =========================================================================

    /// Create the native counterpart of the element and its children.
    /// The element must be attached to a mapped container, unless it is a dialog.
    [[nodiscard]] tether_core::Result<void> map() {
        const int status = tether_native::native_system().map(m_handle);
        if (!tether_native::status::succeeded(status)) {
            return tether_core::Err(detail::native_status_error(
                tether_core::NativeError::Kind::MapFailed, m_handle, Derived::type_name(), status));
        }
        return tether_core::Ok();
    }

    /// Remove the native counterpart. The element is neither detached nor destroyed.
    void unmap() {
        tether_native::native_system().unmap(m_handle);
    }

    /// Show the element, mapping it first if needed
    [[nodiscard]] tether_core::Result<void> show() {
        const int status = tether_native::native_system().show(m_handle);
        if (!tether_native::status::succeeded(status)) {
            return tether_core::Err(detail::native_status_error(
                tether_core::NativeError::Kind::ShowFailed, m_handle, Derived::type_name(), status));
        }
        return tether_core::Ok();
    }

    /// Hide the element
    void hide() {
        tether_native::native_system().hide(m_handle);
    }

    /// Destroy the native object and all its children.
    ///
    /// This alias is reset to null. Other aliases of the same object dangle
    /// afterwards, exactly as raw native handles would.
    void destroy() {
        if (!m_handle) {
            return;
        }
        tether_native::native_system().destroy(std::exchange(m_handle, nullptr));
    }

    // =========================================================================
    // Common Callbacks
    // =========================================================================

    /// Called right before the element is destroyed
    template<typename F>
    Derived& set_destroy_cb(F&& callback) { return set_callback(CallbackKind::Destroy, std::forward<F>(callback)); }
    Derived& remove_destroy_cb() { return remove_callback(CallbackKind::Destroy); }

    /// Called right after the element is mapped
    template<typename F>
    Derived& set_map_cb(F&& callback) { return set_callback(CallbackKind::Map, std::forward<F>(callback)); }
    Derived& remove_map_cb() { return remove_callback(CallbackKind::Map); }

    /// Called right before the element is unmapped
    template<typename F>
    Derived& set_unmap_cb(F&& callback) { return set_callback(CallbackKind::Unmap, std::forward<F>(callback)); }
    Derived& remove_unmap_cb() { return remove_callback(CallbackKind::Unmap); }

    template<typename F>
    Derived& set_getfocus_cb(F&& callback) { return set_callback(CallbackKind::GetFocus, std::forward<F>(callback)); }
    Derived& remove_getfocus_cb() { return remove_callback(CallbackKind::GetFocus); }

    template<typename F>
    Derived& set_killfocus_cb(F&& callback) { return set_callback(CallbackKind::KillFocus, std::forward<F>(callback)); }
    Derived& remove_killfocus_cb() { return remove_callback(CallbackKind::KillFocus); }

    template<typename F>
    Derived& set_enterwindow_cb(F&& callback) { return set_callback(CallbackKind::EnterWindow, std::forward<F>(callback)); }
    Derived& remove_enterwindow_cb() { return remove_callback(CallbackKind::EnterWindow); }

    template<typename F>
    Derived& set_leavewindow_cb(F&& callback) { return set_callback(CallbackKind::LeaveWindow, std::forward<F>(callback)); }
    Derived& remove_leavewindow_cb() { return remove_callback(CallbackKind::LeaveWindow); }

    /// Called when the user presses F1 over the element
    template<typename F>
    Derived& set_help_cb(F&& callback) { return set_callback(CallbackKind::Help, std::forward<F>(callback)); }
    Derived& remove_help_cb() { return remove_callback(CallbackKind::Help); }

protected:
    Element() noexcept = default;
    explicit Element(RawHandle handle) noexcept : m_handle(handle) {}

    /// Register a closure taking Derived and returning CallbackReturn or void
    /// (void means CallbackReturn::Default), and route the native callback to it.
    template<typename F>
    Derived& set_callback(CallbackKind kind, F&& callback) {
        using Fn = std::decay_t<F>;
        static_assert(std::is_invocable_v<Fn&, Derived>, "callback must accept the element type");

        Closure closure = [fn = Fn(std::forward<F>(callback))](RawHandle handle) mutable -> CallbackReturn {
            if constexpr (std::is_void_v<std::invoke_result_t<Fn&, Derived>>) {
                fn(Derived::from_raw_unchecked(handle));
                return CallbackReturn::Default;
            } else {
                return fn(Derived::from_raw_unchecked(handle));
            }
        };

        CallbackRegistry::instance().set(m_handle, kind, std::move(closure));
        tether_native::native_system().set_callback(m_handle, callback_native_name(kind), trampoline_for(kind));
        return derived();
    }

    /// Remove a closure and the native callback routing to it
    Derived& remove_callback(CallbackKind kind) {
        CallbackRegistry::instance().remove(m_handle, kind);
        tether_native::native_system().set_callback(m_handle, callback_native_name(kind), nullptr);
        return derived();
    }

private:
    Derived& derived() noexcept { return static_cast<Derived&>(*this); }

    RawHandle m_handle = nullptr;
};

// =============================================================================
// Formatting
// =============================================================================

/// "TypeName(0x...)"
template<ElementType E>
[[nodiscard]] std::string to_string(const E& elem) {
    return detail::format_element(E::type_name(), elem.raw());
}

template<ElementType E>
std::ostream& operator<<(std::ostream& os, const E& elem) {
    return os << to_string(elem);
}

} // namespace tether_element

// =============================================================================
// Declaration Macros
// =============================================================================

/// Members every typed wrapper needs. Place at the top of the class body.
#define TETHER_ELEMENT_BODY(Type, ClassName)                                           \
public:                                                                                \
    [[nodiscard]] static constexpr std::string_view target_class_name() noexcept {     \
        return ClassName;                                                              \
    }                                                                                  \
    [[nodiscard]] static constexpr std::string_view type_name() noexcept {             \
        return #Type;                                                                  \
    }                                                                                  \
                                                                                       \
private:                                                                               \
    friend class ::tether_element::Element<Type>;                                      \
    explicit Type(::tether_native::RawHandle handle) noexcept                          \
        : ::tether_element::Element<Type>(handle) {}                                   \
                                                                                       \
public:

/// Declare a typed wrapper with only the common operations.
/// See the native class names with Element::class_name().
#define TETHER_ELEMENT(Type, ClassName)                                                \
    class Type final : public ::tether_element::Element<Type> {                        \
        TETHER_ELEMENT_BODY(Type, ClassName)                                           \
    };                                                                                 \
    static_assert(::tether_element::ElementType<Type>)

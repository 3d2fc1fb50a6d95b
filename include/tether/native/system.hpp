#pragma once

/// @file system.hpp
/// @brief Boundary with the native object system
///
/// Every call the binding makes into the toolkit goes through NativeSystem.
/// One system is active per process; it is installed by the application
/// (or a test) before any element is created.

#include "fwd.hpp"
#include "types.hpp"

namespace tether_native {

// =============================================================================
// NativeSystem
// =============================================================================

/// Handle-based native object system.
/// All string parameters are NUL-terminated byte strings.
class NativeSystem {
public:
    virtual ~NativeSystem() = default;

    /// Create an object of the given class. Null on failure.
    virtual RawHandle create(const char* class_name) = 0;

    /// Destroy an object and its children
    virtual void destroy(RawHandle handle) = 0;

    /// Create the native counterpart of an element and its children.
    /// Returns status::Error on failure.
    virtual int map(RawHandle handle) = 0;

    /// Remove the native counterpart of an element and its children
    virtual void unmap(RawHandle handle) = 0;

    /// Show an element (maps it first if needed).
    /// Returns status::Error on failure.
    virtual int show(RawHandle handle) = 0;

    /// Hide an element
    virtual void hide(RawHandle handle) = 0;

    /// Set an attribute. A null value clears it.
    virtual void set_attribute(RawHandle handle, const char* name, const char* value) = 0;

    /// Get an attribute. Null when unset.
    virtual const char* attribute(RawHandle handle, const char* name) = 0;

    /// Remove an attribute from the element and, if inheritable, its children
    virtual void reset_attribute(RawHandle handle, const char* name) = 0;

    /// Live class name of the object. Never null for a live handle.
    virtual const char* class_name(RawHandle handle) = 0;

    /// Set a named callback. A null function removes it.
    virtual void set_callback(RawHandle handle, const char* name, NativeCallback callback) = 0;

    /// Get a named callback. Null when unset.
    virtual NativeCallback callback(RawHandle handle, const char* name) = 0;

    /// Attach child to parent. Returns parent, or null on failure.
    virtual RawHandle append(RawHandle parent, RawHandle child) = 0;
};

// =============================================================================
// Active System
// =============================================================================

/// Make a system active. The binding does not take ownership.
void install_native_system(NativeSystem& system) noexcept;

/// Clear the active system
void uninstall_native_system() noexcept;

/// Check if a system is active
[[nodiscard]] bool has_native_system() noexcept;

/// Get the active system. Throws std::logic_error if none is installed.
[[nodiscard]] NativeSystem& native_system();

/// RAII installation of a native system for a scope.
/// Restores the previously active system on exit.
class ScopedNativeSystem {
public:
    explicit ScopedNativeSystem(NativeSystem& system) noexcept;
    ~ScopedNativeSystem();

    ScopedNativeSystem(const ScopedNativeSystem&) = delete;
    ScopedNativeSystem& operator=(const ScopedNativeSystem&) = delete;
    ScopedNativeSystem(ScopedNativeSystem&&) = delete;
    ScopedNativeSystem& operator=(ScopedNativeSystem&&) = delete;

private:
    NativeSystem* m_previous;
};

} // namespace tether_native

#pragma once

/// @file callback.hpp
/// @brief Callback registry and destruction hook for tether_element
///
/// Closures registered on an element live in a process-wide registry keyed
/// by raw handle. The native system only sees plain function pointers: one
/// trampoline per CallbackKind that looks the closure up again.
///
/// Every handle that crosses Element::from_raw gets the DESTROY_CB
/// notification installed once. When the native object dies the hook drops
/// all closures of that handle.
///
/// The registry is not synchronized. It must only be used from the thread
/// that drives the native toolkit; with Config::enforce_thread_affinity set
/// a foreign thread is rejected with std::logic_error.

#include "fwd.hpp"
#include <tether/native/system.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <thread>
#include <unordered_map>
#include <unordered_set>

namespace tether_element {

using tether_native::CallbackReturn;
using tether_native::RawHandle;

// =============================================================================
// CallbackKind
// =============================================================================

/// Callbacks the binding knows how to route
enum class CallbackKind : std::uint8_t {
    Destroy,      // LDESTROY_CB
    Map,          // MAP_CB
    Unmap,        // UNMAP_CB
    GetFocus,     // GETFOCUS_CB
    KillFocus,    // KILLFOCUS_CB
    EnterWindow,  // ENTERWINDOW_CB
    LeaveWindow,  // LEAVEWINDOW_CB
    Help,         // HELP_CB
    Action,       // ACTION
    ActionCb,     // ACTION_CB
};

/// Native callback name for a kind
[[nodiscard]] constexpr const char* callback_native_name(CallbackKind kind) noexcept {
    switch (kind) {
        // DESTROY_CB is reserved for the binding's own hook, which must run
        // after user code; LDESTROY_CB fires first.
        case CallbackKind::Destroy: return "LDESTROY_CB";
        case CallbackKind::Map: return "MAP_CB";
        case CallbackKind::Unmap: return "UNMAP_CB";
        case CallbackKind::GetFocus: return "GETFOCUS_CB";
        case CallbackKind::KillFocus: return "KILLFOCUS_CB";
        case CallbackKind::EnterWindow: return "ENTERWINDOW_CB";
        case CallbackKind::LeaveWindow: return "LEAVEWINDOW_CB";
        case CallbackKind::Help: return "HELP_CB";
        case CallbackKind::Action: return "ACTION";
        case CallbackKind::ActionCb: return "ACTION_CB";
        default: return "";
    }
}

/// Readable kind name
[[nodiscard]] constexpr const char* callback_kind_name(CallbackKind kind) noexcept {
    switch (kind) {
        case CallbackKind::Destroy: return "Destroy";
        case CallbackKind::Map: return "Map";
        case CallbackKind::Unmap: return "Unmap";
        case CallbackKind::GetFocus: return "GetFocus";
        case CallbackKind::KillFocus: return "KillFocus";
        case CallbackKind::EnterWindow: return "EnterWindow";
        case CallbackKind::LeaveWindow: return "LeaveWindow";
        case CallbackKind::Help: return "Help";
        case CallbackKind::Action: return "Action";
        case CallbackKind::ActionCb: return "ActionCb";
        default: return "Unknown";
    }
}

/// Type-erased callback closure
using Closure = std::function<CallbackReturn(RawHandle)>;

// =============================================================================
// CallbackRegistry
// =============================================================================

class CallbackRegistry {
public:
    /// Process-wide instance
    [[nodiscard]] static CallbackRegistry& instance();

    CallbackRegistry(const CallbackRegistry&) = delete;
    CallbackRegistry& operator=(const CallbackRegistry&) = delete;

    // =========================================================================
    // Closures
    // =========================================================================

    /// Insert or replace the closure for (handle, kind)
    void set(RawHandle handle, CallbackKind kind, Closure closure);

    /// Remove the closure for (handle, kind). Returns false if none was set.
    bool remove(RawHandle handle, CallbackKind kind);

    /// Invoke the closure for (handle, kind). Default when none is set.
    CallbackReturn invoke(RawHandle handle, CallbackKind kind);

    /// Release every closure of a handle and forget the handle.
    /// Returns the number of closures released; 0 if the handle is unknown.
    std::size_t drop_callbacks(RawHandle handle);

    // =========================================================================
    // Destruction Hook
    // =========================================================================

    /// Install the DESTROY_CB notification the first time a handle is seen.
    /// Returns false (and does not touch the native system) afterwards.
    bool install_destroy_hook(tether_native::NativeSystem& system, RawHandle handle);

    /// Check if the destruction notification is installed for a handle
    [[nodiscard]] bool is_hooked(RawHandle handle) const;

    // =========================================================================
    // Queries
    // =========================================================================

    [[nodiscard]] bool contains(RawHandle handle) const;
    [[nodiscard]] bool contains(RawHandle handle, CallbackKind kind) const;
    [[nodiscard]] std::size_t callback_count(RawHandle handle) const;
    [[nodiscard]] std::size_t entry_count() const;
    [[nodiscard]] std::size_t hooked_count() const;

    // =========================================================================
    // Maintenance
    // =========================================================================

    /// Drop every entry and hooked mark
    void clear();

    /// Make the calling thread the owner
    void rebind_thread();

private:
    CallbackRegistry() = default;

    /// Throws std::logic_error when called off the owner thread
    void check_thread() const;

    std::unordered_map<RawHandle, std::map<CallbackKind, Closure>> m_entries;
    std::unordered_set<RawHandle> m_hooked;
    mutable std::optional<std::thread::id> m_owner;
};

// =============================================================================
// Native Entry Points
// =============================================================================

/// Destruction notification installed on every handle.
/// Releases the per-element bookkeeping of the binding.
int on_element_destroy(RawHandle handle) noexcept;

/// Function pointer handed to the native system for a kind
[[nodiscard]] tether_native::NativeCallback trampoline_for(CallbackKind kind) noexcept;

} // namespace tether_element

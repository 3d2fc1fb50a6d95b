#pragma once

/// @file types.hpp
/// @brief Types shared across the native object system boundary

#include "fwd.hpp"
#include <cstdint>

namespace tether_native {

// =============================================================================
// Raw Handle
// =============================================================================

/// Opaque native object. Only the native system knows its layout.
struct NativeObject;

/// Identity of a native object. Never owned by the binding.
using RawHandle = NativeObject*;

/// Native callback entry point
using NativeCallback = int (*)(RawHandle);

// =============================================================================
// Status Codes
// =============================================================================

/// Status convention of map()/show(): zero is failure, anything else success
namespace status {
    constexpr int Error = 0;
    constexpr int Ok = 1;

    [[nodiscard]] constexpr bool succeeded(int code) noexcept {
        return code != Error;
    }
}

// =============================================================================
// CallbackReturn
// =============================================================================

/// Value a callback hands back to the native event loop
enum class CallbackReturn : int {
    Ignore = -1,
    Default = -2,
    Close = -3,
    Continue = -4,
};

[[nodiscard]] constexpr int to_native(CallbackReturn value) noexcept {
    return static_cast<int>(value);
}

/// Unknown codes are treated as Default
[[nodiscard]] constexpr CallbackReturn from_native(int code) noexcept {
    switch (code) {
        case -1: return CallbackReturn::Ignore;
        case -3: return CallbackReturn::Close;
        case -4: return CallbackReturn::Continue;
        default: return CallbackReturn::Default;
    }
}

[[nodiscard]] constexpr const char* callback_return_name(CallbackReturn value) noexcept {
    switch (value) {
        case CallbackReturn::Ignore: return "Ignore";
        case CallbackReturn::Default: return "Default";
        case CallbackReturn::Close: return "Close";
        case CallbackReturn::Continue: return "Continue";
        default: return "Default";
    }
}

// =============================================================================
// Well-known Callback Names
// =============================================================================

namespace callback_names {
    /// Destruction notification used by the binding. Fired last.
    constexpr const char* Destroy = "DESTROY_CB";
    /// Destruction callback fired first, before children are destroyed
    constexpr const char* LDestroy = "LDESTROY_CB";
    constexpr const char* Map = "MAP_CB";
    constexpr const char* Unmap = "UNMAP_CB";
}

} // namespace tether_native

#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for tether_native module

namespace tether_native {

struct NativeObject;
enum class CallbackReturn : int;
class NativeSystem;
class ScopedNativeSystem;
class MemorySystem;

} // namespace tether_native

#pragma once

/// @file native.hpp
/// @brief Main include file for tether_native module

#include "fwd.hpp"
#include "types.hpp"
#include "system.hpp"
#include "memory_system.hpp"

/// @namespace tether_native
/// @brief Boundary with the native object system
///
/// The binding never talks to a toolkit directly. It calls the installed
/// NativeSystem, which a real toolkit adapter or MemorySystem implements.
///
/// @code
/// tether_native::MemorySystem system;
/// tether_native::ScopedNativeSystem active(system);
/// auto dlg = system.create("dialog");
/// @endcode

#pragma once

/// @file tether.hpp
/// @brief Everything needed by an application using the binding

#include "core/core.hpp"
#include "native/native.hpp"
#include "element/element_module.hpp"

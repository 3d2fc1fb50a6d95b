#pragma once

/// @file element_module.hpp
/// @brief Main include file for tether_element module

#include "fwd.hpp"
#include "callback.hpp"
#include "element.hpp"
#include "handle.hpp"
#include "controls.hpp"

/// @namespace tether_element
/// @brief Typed element wrappers over raw native handles
///
/// - **Element**: shared operations and common callbacks of every wrapper
/// - **Handle**: type-erased element with the checked downcast
/// - **Controls**: Dialog, Button, VBox and the other standard classes
///
/// Example usage:
/// @code
/// auto dlg = tether_element::Dialog::create();
/// auto btn = tether_element::Button::create();
/// btn.set_attribute("TITLE", "OK")
///    .set_action_cb([](tether_element::Button) { return tether_element::CallbackReturn::Close; });
///
/// tether_element::Handle any = btn;
/// if (auto as_dialog = any.try_downcast<tether_element::Dialog>(); !as_dialog) {
///     // still a button, any is handed back in the error slot
/// }
/// @endcode

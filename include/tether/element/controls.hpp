#pragma once

/// @file controls.hpp
/// @brief Typed wrappers for the standard native classes

#include "element.hpp"
#include "handle.hpp"

#include <utility>

namespace tether_element {

// =============================================================================
// Dialogs and Containers
// =============================================================================

TETHER_ELEMENT(Dialog, "dialog");
TETHER_ELEMENT(VBox, "vbox");
TETHER_ELEMENT(HBox, "hbox");
TETHER_ELEMENT(ZBox, "zbox");
TETHER_ELEMENT(Fill, "fill");
TETHER_ELEMENT(Frame, "frame");
TETHER_ELEMENT(Tabs, "tabs");

// =============================================================================
// Controls
// =============================================================================

/// Push button. ACTION fires when it is activated.
class Button final : public Element<Button> {
    TETHER_ELEMENT_BODY(Button, "button")

    template<typename F>
    Button& set_action_cb(F&& callback) { return set_callback(CallbackKind::Action, std::forward<F>(callback)); }
    Button& remove_action_cb() { return remove_callback(CallbackKind::Action); }
};
static_assert(ElementType<Button>);

/// Two-state button. ACTION fires when the state changes.
class Toggle final : public Element<Toggle> {
    TETHER_ELEMENT_BODY(Toggle, "toggle")

    template<typename F>
    Toggle& set_action_cb(F&& callback) { return set_callback(CallbackKind::Action, std::forward<F>(callback)); }
    Toggle& remove_action_cb() { return remove_callback(CallbackKind::Action); }
};
static_assert(ElementType<Toggle>);

TETHER_ELEMENT(Label, "label");
TETHER_ELEMENT(Text, "text");
TETHER_ELEMENT(List, "list");
TETHER_ELEMENT(Image, "image");
TETHER_ELEMENT(ProgressBar, "progressbar");
TETHER_ELEMENT(Val, "val");
TETHER_ELEMENT(Canvas, "canvas");

// =============================================================================
// Menus
// =============================================================================

TETHER_ELEMENT(Menu, "menu");
TETHER_ELEMENT(Submenu, "submenu");
TETHER_ELEMENT(Separator, "separator");

/// Menu entry. ACTION fires when it is selected.
class Item final : public Element<Item> {
    TETHER_ELEMENT_BODY(Item, "item")

    template<typename F>
    Item& set_action_cb(F&& callback) { return set_callback(CallbackKind::Action, std::forward<F>(callback)); }
    Item& remove_action_cb() { return remove_callback(CallbackKind::Action); }
};
static_assert(ElementType<Item>);

// =============================================================================
// Timer
// =============================================================================

/// Timer. ACTION_CB fires on every period while RUN is YES.
class Timer final : public Element<Timer> {
    TETHER_ELEMENT_BODY(Timer, "timer")

    template<typename F>
    Timer& set_action_cb(F&& callback) { return set_callback(CallbackKind::ActionCb, std::forward<F>(callback)); }
    Timer& remove_action_cb() { return remove_callback(CallbackKind::ActionCb); }
};
static_assert(ElementType<Timer>);

} // namespace tether_element

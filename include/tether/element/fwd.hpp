#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for tether_element module

#include <cstdint>

namespace tether_element {

// =============================================================================
// Callbacks
// =============================================================================

enum class CallbackKind : std::uint8_t;
class CallbackRegistry;

// =============================================================================
// Elements
// =============================================================================

template<typename Derived>
class Element;

class Handle;

class Dialog;
class Button;
class Label;
class Text;
class Toggle;
class List;
class Image;
class VBox;
class HBox;
class ZBox;
class Fill;
class Frame;
class Tabs;
class Menu;
class Submenu;
class Item;
class Separator;
class Timer;
class ProgressBar;
class Val;
class Canvas;

} // namespace tether_element

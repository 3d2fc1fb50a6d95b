// tether_element Element operation tests

#include <catch2/catch_test_macros.hpp>
#include <tether/element/element_module.hpp>
#include <tether/native/memory_system.hpp>

#include "stub_native_system.hpp"

#include <sstream>
#include <stdexcept>
#include <string>
#include <type_traits>

using namespace tether_element;
using tether_test::fake_handle;
using tether_test::RegistryReset;
using tether_test::StubNativeSystem;

// =============================================================================
// Wrapper Shape
// =============================================================================

static_assert(std::is_trivially_copyable_v<Dialog>);
static_assert(std::is_trivially_copyable_v<Handle>);
static_assert(sizeof(Button) == sizeof(RawHandle));
static_assert(!std::is_convertible_v<Button, Dialog>);
static_assert(!std::is_base_of_v<Dialog, Button>);
static_assert(std::is_convertible_v<Button, Handle>);
static_assert(!std::is_constructible_v<Dialog, RawHandle>);

TEST_CASE("Typed wrappers carry their class tag", "[element][wrapper]") {
    REQUIRE(Dialog::target_class_name() == "dialog");
    REQUIRE(Button::target_class_name() == "button");
    REQUIRE(ProgressBar::target_class_name() == "progressbar");
    REQUIRE(Timer::target_class_name() == "timer");
    REQUIRE(Handle::target_class_name() == "__tether_handle");
    REQUIRE(VBox::type_name() == "VBox");
}

// =============================================================================
// from_raw
// =============================================================================

TEST_CASE("from_raw installs the destruction hook once", "[element][from_raw]") {
    RegistryReset reset;
    StubNativeSystem stub;
    tether_native::ScopedNativeSystem active(stub);
    const RawHandle h = fake_handle(0x10);
    stub.add_object(h, "button");

    Button first = Button::from_raw(h);
    REQUIRE(first.raw() == h);
    REQUIRE(stub.destroy_hook_registrations == 1);
    REQUIRE(CallbackRegistry::instance().is_hooked(h));

    SECTION("a second from_raw does not register again") {
        Button second = Button::from_raw(h);
        REQUIRE(second == first);
        REQUIRE(stub.destroy_hook_registrations == 1);
    }

    SECTION("from_raw_unchecked and dup never register") {
        Button alias = Button::from_raw_unchecked(h);
        Button copy = alias.dup();
        REQUIRE(copy.raw() == h);
        REQUIRE(stub.destroy_hook_registrations == 1);
    }

    SECTION("hook is installed again once the handle was destroyed") {
        stub.fire(h, "DESTROY_CB");
        REQUIRE_FALSE(CallbackRegistry::instance().is_hooked(h));

        // The native system may reuse the address for a new object
        (void)Button::from_raw(h);
        REQUIRE(stub.destroy_hook_registrations == 2);
    }
}

TEST_CASE("from_raw with a null handle is fatal", "[element][from_raw]") {
    RegistryReset reset;
    StubNativeSystem stub;
    tether_native::ScopedNativeSystem active(stub);

    REQUIRE_THROWS_AS(Dialog::from_raw(nullptr), std::invalid_argument);
    REQUIRE(stub.destroy_hook_registrations == 0);
    REQUIRE(CallbackRegistry::instance().hooked_count() == 0);
}

TEST_CASE("create asks the native system for the wrapper's class", "[element][from_raw]") {
    RegistryReset reset;
    StubNativeSystem stub;
    tether_native::ScopedNativeSystem active(stub);

    SECTION("success") {
        stub.create_result = fake_handle(0x20);
        Label label = Label::create();
        REQUIRE(label.raw() == fake_handle(0x20));
        REQUIRE(label.class_name() == "label");
        REQUIRE(stub.destroy_hook_registrations == 1);
    }

    SECTION("refused class surfaces as a null handle") {
        stub.create_result = nullptr;
        REQUIRE_THROWS_AS(Label::create(), std::invalid_argument);
        REQUIRE(stub.create_calls == 1);
    }
}

// =============================================================================
// Attributes
// =============================================================================

TEST_CASE("Element attributes", "[element][attribute]") {
    RegistryReset reset;
    StubNativeSystem stub;
    tether_native::ScopedNativeSystem active(stub);
    const RawHandle h = fake_handle(0x30);
    stub.add_object(h, "text");
    Text text = Text::from_raw(h);

    SECTION("set is chainable and get reads back") {
        text.set_attribute("VALUE", "hello").set_attribute("READONLY", "YES");
        REQUIRE(text.attribute("VALUE") == std::optional<std::string>("hello"));
        REQUIRE(text.attribute("READONLY") == std::optional<std::string>("YES"));
    }

    SECTION("absence is distinct from the empty string") {
        REQUIRE_FALSE(text.attribute("VALUE").has_value());

        text.set_attribute("VALUE", "");
        auto value = text.attribute("VALUE");
        REQUIRE(value.has_value());
        REQUIRE(value->empty());
    }

    SECTION("clear removes the value") {
        text.set_attribute("VALUE", "x");
        text.clear_attribute("VALUE");
        REQUIRE_FALSE(text.attribute("VALUE").has_value());
    }

    SECTION("reset forwards to the native system") {
        text.reset_attribute("FONT");
        REQUIRE(stub.reset_calls == 1);
    }

    SECTION("aliases see the same attributes") {
        Text alias = text.dup();
        alias.set_attribute("VALUE", "shared");
        REQUIRE(text.attribute("VALUE") == std::optional<std::string>("shared"));
    }
}

TEST_CASE("Attribute inheritance through MemorySystem", "[element][attribute]") {
    RegistryReset reset;
    tether_native::MemorySystem system;
    tether_native::ScopedNativeSystem active(system);

    auto box = VBox::create();
    auto label = Label::create();
    REQUIRE(box.append(label).is_ok());

    box.set_attribute("BGCOLOR", "0 128 0");
    REQUIRE(label.attribute("BGCOLOR") == std::optional<std::string>("0 128 0"));

    box.reset_attribute("BGCOLOR");
    REQUIRE_FALSE(label.attribute("BGCOLOR").has_value());
}

// =============================================================================
// Lifecycle
// =============================================================================

TEST_CASE("map and show report native failures", "[element][lifecycle]") {
    RegistryReset reset;
    StubNativeSystem stub;
    tether_native::ScopedNativeSystem active(stub);
    const RawHandle h = fake_handle(0x40);
    stub.add_object(h, "dialog");
    Dialog dlg = Dialog::from_raw(h);

    SECTION("success") {
        REQUIRE(dlg.map().is_ok());
        REQUIRE(dlg.show().is_ok());
        dlg.hide();
        dlg.unmap();
        REQUIRE(stub.map_calls == 1);
        REQUIRE(stub.show_calls == 1);
        REQUIRE(stub.hide_calls == 1);
        REQUIRE(stub.unmap_calls == 1);
    }

    SECTION("map failure") {
        stub.map_status = tether_native::status::Error;
        auto result = dlg.map();
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == tether_core::ErrorCode::OperationFailed);

        const auto* native = result.error().as<tether_core::NativeError>();
        REQUIRE(native != nullptr);
        REQUIRE(native->kind == tether_core::NativeError::Kind::MapFailed);
        REQUIRE(native->class_name == "dialog");
        REQUIRE(native->status == 0);
        REQUIRE(result.error().get_context("element") != nullptr);
    }

    SECTION("show failure") {
        stub.show_status = tether_native::status::Error;
        auto result = dlg.show();
        REQUIRE(result.is_err());
        REQUIRE(result.error().as<tether_core::NativeError>()->kind ==
                tether_core::NativeError::Kind::ShowFailed);
    }

    SECTION("any non-zero status is success") {
        stub.map_status = 7;
        REQUIRE(dlg.map().is_ok());
    }
}

TEST_CASE("Mapping rules through MemorySystem", "[element][lifecycle]") {
    RegistryReset reset;
    tether_native::MemorySystem system;
    tether_native::ScopedNativeSystem active(system);

    auto dlg = Dialog::create();
    auto btn = Button::create();
    REQUIRE(dlg.append(btn).is_ok());

    REQUIRE(btn.map().is_err());
    REQUIRE(dlg.show().is_ok());
    REQUIRE(system.is_mapped(btn.raw()));
    REQUIRE(btn.attribute("VISIBLE") == std::optional<std::string>("YES"));
}

TEST_CASE("append failures", "[element][lifecycle]") {
    RegistryReset reset;
    StubNativeSystem stub;
    tether_native::ScopedNativeSystem active(stub);
    stub.add_object(fake_handle(0x50), "vbox");
    stub.add_object(fake_handle(0x51), "button");
    VBox box = VBox::from_raw(fake_handle(0x50));
    Button btn = Button::from_raw(fake_handle(0x51));

    stub.append_succeeds = false;
    auto result = box.append(btn);
    REQUIRE(result.is_err());
    const auto* native = result.error().as<tether_core::NativeError>();
    REQUIRE(native->kind == tether_core::NativeError::Kind::AppendFailed);
    REQUIRE(result.error().message().find("button") != std::string::npos);
}

TEST_CASE("destroy nulls the alias and purges the registry", "[element][lifecycle]") {
    RegistryReset reset;
    tether_native::MemorySystem system;
    tether_native::ScopedNativeSystem active(system);

    auto dlg = Dialog::create();
    const RawHandle h = dlg.raw();
    Dialog alias = dlg;
    dlg.set_map_cb([](Dialog) {});
    REQUIRE(CallbackRegistry::instance().contains(h));

    dlg.destroy();
    REQUIRE(dlg.raw() == nullptr);
    REQUIRE(alias.raw() == h);
    REQUIRE_FALSE(system.is_alive(h));
    REQUIRE_FALSE(CallbackRegistry::instance().contains(h));
    REQUIRE_FALSE(CallbackRegistry::instance().is_hooked(h));

    // Destroying a null alias is a no-op
    REQUIRE_NOTHROW(dlg.destroy());
}

// =============================================================================
// Formatting and Identity
// =============================================================================

TEST_CASE("Debug formatting", "[element][format]") {
    RegistryReset reset;
    StubNativeSystem stub;
    tether_native::ScopedNativeSystem active(stub);
    stub.add_object(fake_handle(0x1), "dialog");

    Dialog dlg = Dialog::from_raw(fake_handle(0x1));
    REQUIRE(to_string(dlg) == "Dialog(0x1)");

    std::ostringstream oss;
    oss << Handle(dlg);
    REQUIRE(oss.str() == "Handle(0x1)");
}

TEST_CASE("Equality follows the raw handle", "[element][format]") {
    RegistryReset reset;
    StubNativeSystem stub;
    tether_native::ScopedNativeSystem active(stub);
    stub.add_object(fake_handle(0x1), "button");
    stub.add_object(fake_handle(0x2), "button");

    Button a = Button::from_raw(fake_handle(0x1));
    Button b = Button::from_raw(fake_handle(0x2));
    REQUIRE(a == a.dup());
    REQUIRE(a != b);
    REQUIRE(Handle(a) == Handle::from_element(a));
}

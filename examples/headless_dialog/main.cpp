/// @file main.cpp
/// @brief Headless dialog demo
///
/// Builds a small confirmation dialog on the in-memory native system,
/// simulates a click on each button and tears everything down:
/// - Optional config file given as the first argument
/// - Typed wrappers, generic handles and checked downcasts
/// - Callbacks and their removal on destruction

#include <tether/tether.hpp>

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <exception>
#include <utility>

namespace {

tether_core::Config load_demo_config(int argc, char* argv[]) {
    if (argc < 2) {
        return tether_core::Config{};
    }

    auto config = tether_core::load_config(argv[1]);
    if (!config) {
        spdlog::warn("Using defaults: {}", tether_core::build_error_chain(config.error()));
        return tether_core::Config{};
    }
    return std::move(config).value();
}

/// Everything native lives here so it is gone before logging shuts down
int run_demo() {
    using namespace tether_element;

    tether_native::MemorySystem system;
    tether_native::ScopedNativeSystem active(system);

    auto dlg = Dialog::create();
    auto box = VBox::create();
    auto message = Label::create();
    auto ok = Button::create();
    auto cancel = Button::create();

    dlg.set_attribute("TITLE", "Confirm");
    message.set_attribute("TITLE", "Apply the changes?");
    ok.set_attribute("TITLE", "OK");
    cancel.set_attribute("TITLE", "Cancel");

    for (const auto& child : make_elements(message, ok, cancel)) {
        if (auto appended = box.append(child); !appended) {
            spdlog::error("{}", tether_core::build_error_chain(appended.error()));
            return EXIT_FAILURE;
        }
    }
    if (auto appended = dlg.append(box); !appended) {
        spdlog::error("{}", tether_core::build_error_chain(appended.error()));
        return EXIT_FAILURE;
    }

    dlg.set_map_cb([](Dialog d) { spdlog::info("{} mapped", to_string(d)); })
       .set_destroy_cb([](Dialog d) { spdlog::info("{} about to be destroyed", to_string(d)); });
    ok.set_action_cb([](Button b) {
        spdlog::info("'{}' pressed", b.attribute("TITLE").value_or("?"));
        return CallbackReturn::Close;
    });
    cancel.set_action_cb([](Button) { return CallbackReturn::Ignore; });

    if (auto shown = dlg.show(); !shown) {
        spdlog::error("{}", tether_core::build_error_chain(shown.error()));
        return EXIT_FAILURE;
    }

    for (auto raw : system.children(box.raw())) {
        Handle child = Handle::from_raw_unchecked(raw);
        auto button = child.try_downcast<Button>();
        if (!button) {
            spdlog::info("{} is a '{}', not a button", to_string(child), child.class_name());
            continue;
        }
        const int ret = system.fire(raw, "ACTION");
        spdlog::info("{} returned {}", to_string(button.value()),
                     tether_native::callback_return_name(tether_native::from_native(ret)));
    }

    spdlog::info("Registry: {} handle(s) hooked, {} with callbacks",
                 CallbackRegistry::instance().hooked_count(), CallbackRegistry::instance().entry_count());

    dlg.destroy();

    spdlog::info("After destroy: {} native object(s), {} hooked",
                 system.object_count(), CallbackRegistry::instance().hooked_count());
    return EXIT_SUCCESS;
}

} // namespace

int main(int argc, char* argv[]) {
    tether_core::init(load_demo_config(argc, argv));
    spdlog::info("=== Headless Dialog Demo ({} {}) ===", tether_core::module_name(), tether_core::version());

    int result = EXIT_FAILURE;
    try {
        result = run_demo();
    } catch (const std::exception& ex) {
        spdlog::critical("Demo aborted: {}", ex.what());
    }

    tether_core::shutdown();
    return result;
}

// tether_native MemorySystem tests

#include <catch2/catch_test_macros.hpp>
#include <tether/native/native.hpp>

#include <string>
#include <utility>
#include <vector>

using namespace tether_native;

namespace {

// Native callbacks are plain function pointers, so events go to a global log
std::vector<std::pair<std::string, RawHandle>>& events() {
    static std::vector<std::pair<std::string, RawHandle>> log;
    return log;
}

int on_map(RawHandle h) { events().emplace_back("map", h); return to_native(CallbackReturn::Default); }
int on_unmap(RawHandle h) { events().emplace_back("unmap", h); return to_native(CallbackReturn::Default); }
int on_ldestroy(RawHandle h) { events().emplace_back("ldestroy", h); return to_native(CallbackReturn::Default); }
int on_destroy(RawHandle h) { events().emplace_back("destroy", h); return to_native(CallbackReturn::Default); }
int on_close(RawHandle) { return to_native(CallbackReturn::Close); }

// Callbacks that change the tree reach the system through these
MemorySystem* g_system = nullptr;
RawHandle g_target = nullptr;

int destroy_target(RawHandle h) {
    events().emplace_back("ldestroy", h);
    g_system->destroy(g_target);
    return to_native(CallbackReturn::Default);
}

int destroy_self(RawHandle h) {
    events().emplace_back("map", h);
    g_system->destroy(h);
    return to_native(CallbackReturn::Default);
}

int destroy_parent(RawHandle h) {
    events().emplace_back("unmap", h);
    g_system->destroy(g_system->parent(h));
    return to_native(CallbackReturn::Default);
}

struct ActiveSystem {
    explicit ActiveSystem(MemorySystem& system) { g_system = &system; }
    ~ActiveSystem() { g_system = nullptr; g_target = nullptr; }
};

void watch(MemorySystem& system, RawHandle h) {
    system.set_callback(h, callback_names::Map, &on_map);
    system.set_callback(h, callback_names::Unmap, &on_unmap);
    system.set_callback(h, callback_names::LDestroy, &on_ldestroy);
    system.set_callback(h, callback_names::Destroy, &on_destroy);
}

} // anonymous namespace

// =============================================================================
// Creation
// =============================================================================

TEST_CASE("MemorySystem object creation", "[native][memory]") {
    MemorySystem system;

    SECTION("standard classes are registered") {
        REQUIRE(system.is_class_registered("dialog"));
        REQUIRE(system.is_class_registered("button"));
        REQUIRE(system.is_class_registered("multiline"));
        REQUIRE_FALSE(system.is_class_registered("__tether_handle"));
    }

    SECTION("create returns a live handle with its class") {
        RawHandle h = system.create("button");
        REQUIRE(h != nullptr);
        REQUIRE(system.is_alive(h));
        REQUIRE(std::string(system.class_name(h)) == "button");
        REQUIRE(system.object_count() == 1);
    }

    SECTION("unknown or empty class gives null") {
        REQUIRE(system.create("spinner") == nullptr);
        REQUIRE(system.create("") == nullptr);
        REQUIRE(system.create(nullptr) == nullptr);
        REQUIRE(system.object_count() == 0);
    }

    SECTION("registered class can be created") {
        system.register_class("spinner");
        REQUIRE(system.create("spinner") != nullptr);
    }

    SECTION("class name of an unknown handle is null") {
        REQUIRE(system.class_name(nullptr) == nullptr);
    }
}

// =============================================================================
// Attributes
// =============================================================================

TEST_CASE("MemorySystem attributes", "[native][memory]") {
    MemorySystem system;
    RawHandle box = system.create("vbox");
    RawHandle label = system.create("label");
    REQUIRE(system.append(box, label) == box);

    SECTION("set, get and clear") {
        system.set_attribute(label, "TITLE", "Hello");
        REQUIRE(std::string(system.attribute(label, "TITLE")) == "Hello");

        system.set_attribute(label, "TITLE", nullptr);
        REQUIRE(system.attribute(label, "TITLE") == nullptr);
    }

    SECTION("empty string is a value") {
        system.set_attribute(label, "TITLE", "");
        const char* value = system.attribute(label, "TITLE");
        REQUIRE(value != nullptr);
        REQUIRE(std::string(value).empty());
    }

    SECTION("inheritable attributes come from the parent") {
        system.set_attribute(box, "FGCOLOR", "255 0 0");
        REQUIRE(std::string(system.attribute(label, "FGCOLOR")) == "255 0 0");

        system.set_attribute(label, "FGCOLOR", "0 0 255");
        REQUIRE(std::string(system.attribute(label, "FGCOLOR")) == "0 0 255");
    }

    SECTION("non-inheritable attributes stay local") {
        system.set_attribute(box, "TITLE", "Box");
        REQUIRE(system.attribute(label, "TITLE") == nullptr);
    }

    SECTION("reset of an inheritable attribute clears descendants") {
        system.set_attribute(box, "FONT", "Mono, 10");
        system.set_attribute(label, "FONT", "Sans, 12");
        system.reset_attribute(box, "FONT");
        REQUIRE(system.attribute(box, "FONT") == nullptr);
        REQUIRE(system.attribute(label, "FONT") == nullptr);
    }

    SECTION("reset of a local attribute keeps descendants") {
        system.set_attribute(box, "TITLE", "Box");
        system.set_attribute(label, "TITLE", "Label");
        system.reset_attribute(box, "TITLE");
        REQUIRE(system.attribute(box, "TITLE") == nullptr);
        REQUIRE(std::string(system.attribute(label, "TITLE")) == "Label");
    }

    SECTION("extra inheritable attributes") {
        system.register_inheritable_attribute("MARGIN");
        REQUIRE(system.is_inheritable("MARGIN"));
        system.set_attribute(box, "MARGIN", "5x5");
        REQUIRE(std::string(system.attribute(label, "MARGIN")) == "5x5");
    }
}

// =============================================================================
// Hierarchy
// =============================================================================

TEST_CASE("MemorySystem append rules", "[native][memory]") {
    MemorySystem system;
    RawHandle dlg = system.create("dialog");
    RawHandle box = system.create("vbox");
    RawHandle btn = system.create("button");

    REQUIRE(system.append(dlg, box) == dlg);
    REQUIRE(system.append(box, btn) == box);
    REQUIRE(system.parent(btn) == box);
    REQUIRE(system.children(box) == std::vector<RawHandle>{btn});

    SECTION("already attached child is refused") {
        RawHandle other = system.create("hbox");
        REQUIRE(system.append(other, btn) == nullptr);
    }

    SECTION("cycles are refused") {
        RawHandle frame = system.create("frame");
        REQUIRE(system.append(btn, frame) == btn);
        REQUIRE(system.append(frame, dlg) == nullptr);
    }

    SECTION("unknown handles are refused") {
        REQUIRE(system.append(dlg, nullptr) == nullptr);
    }
}

// =============================================================================
// Mapping
// =============================================================================

TEST_CASE("MemorySystem mapping", "[native][memory]") {
    events().clear();
    MemorySystem system;
    RawHandle dlg = system.create("dialog");
    RawHandle btn = system.create("button");
    REQUIRE(system.append(dlg, btn) == dlg);
    watch(system, dlg);
    watch(system, btn);

    SECTION("child of an unmapped parent cannot be mapped") {
        REQUIRE(system.map(btn) == status::Error);
        REQUIRE_FALSE(system.is_mapped(btn));
    }

    SECTION("mapping is recursive and fires MAP_CB") {
        REQUIRE(system.map(dlg) == status::Ok);
        REQUIRE(system.is_mapped(dlg));
        REQUIRE(system.is_mapped(btn));
        REQUIRE(events().size() == 2);
        REQUIRE(events()[0] == std::make_pair(std::string("map"), dlg));

        // Already mapped is success without a second event
        REQUIRE(system.map(dlg) == status::Ok);
        REQUIRE(events().size() == 2);
    }

    SECTION("unmap goes children first") {
        REQUIRE(system.map(dlg) == status::Ok);
        events().clear();
        system.unmap(dlg);
        REQUIRE_FALSE(system.is_mapped(btn));
        REQUIRE(events().size() == 2);
        REQUIRE(events()[0] == std::make_pair(std::string("unmap"), btn));
        REQUIRE(events()[1] == std::make_pair(std::string("unmap"), dlg));
    }

    SECTION("show maps and sets VISIBLE") {
        REQUIRE(system.show(dlg) == status::Ok);
        REQUIRE(system.is_mapped(dlg));
        REQUIRE(std::string(system.attribute(btn, "VISIBLE")) == "YES");

        system.hide(dlg);
        REQUIRE(std::string(system.attribute(dlg, "VISIBLE")) == "NO");
    }

    SECTION("unknown handle fails") {
        REQUIRE(system.map(nullptr) == status::Error);
        REQUIRE(system.show(nullptr) == status::Error);
    }
}

// =============================================================================
// Destruction
// =============================================================================

TEST_CASE("MemorySystem cascading destroy", "[native][memory]") {
    events().clear();
    MemorySystem system;
    RawHandle dlg = system.create("dialog");
    RawHandle btn = system.create("button");
    REQUIRE(system.append(dlg, btn) == dlg);
    REQUIRE(system.map(dlg) == status::Ok);
    watch(system, dlg);
    watch(system, btn);

    system.destroy(dlg);

    REQUIRE_FALSE(system.is_alive(dlg));
    REQUIRE_FALSE(system.is_alive(btn));
    REQUIRE(system.object_count() == 0);

    std::vector<std::pair<std::string, RawHandle>> expected = {
        {"ldestroy", dlg},
        {"unmap", btn},
        {"unmap", dlg},
        {"ldestroy", btn},
        {"destroy", btn},
        {"destroy", dlg},
    };
    REQUIRE(events() == expected);

    // Unknown handles are ignored
    REQUIRE_NOTHROW(system.destroy(dlg));
}

TEST_CASE("MemorySystem destroy callback that destroys a sibling", "[native][memory][reentrancy]") {
    events().clear();
    MemorySystem system;
    ActiveSystem active(system);
    RawHandle dlg = system.create("dialog");
    RawHandle a = system.create("button");
    RawHandle b = system.create("button");
    REQUIRE(system.append(dlg, a) == dlg);
    REQUIRE(system.append(dlg, b) == dlg);
    watch(system, dlg);
    watch(system, b);
    system.set_callback(a, callback_names::LDestroy, &destroy_target);
    system.set_callback(a, callback_names::Destroy, &on_destroy);
    g_target = b;

    system.destroy(dlg);

    REQUIRE(system.object_count() == 0);

    std::vector<std::pair<std::string, RawHandle>> expected = {
        {"ldestroy", dlg},
        {"ldestroy", a},
        {"ldestroy", b},
        {"destroy", b},
        {"destroy", a},
        {"destroy", dlg},
    };
    REQUIRE(events() == expected);
}

TEST_CASE("MemorySystem map callback that destroys its element", "[native][memory][reentrancy]") {
    events().clear();
    MemorySystem system;
    ActiveSystem active(system);
    RawHandle dlg = system.create("dialog");
    RawHandle btn = system.create("button");
    REQUIRE(system.append(dlg, btn) == dlg);
    watch(system, btn);
    system.set_callback(dlg, callback_names::Map, &destroy_self);

    REQUIRE(system.map(dlg) == status::Ok);

    REQUIRE_FALSE(system.is_alive(dlg));
    REQUIRE_FALSE(system.is_alive(btn));
    REQUIRE(system.object_count() == 0);

    // The child went away before the walk reached it, so it never mapped
    std::vector<std::pair<std::string, RawHandle>> expected = {
        {"map", dlg},
        {"ldestroy", btn},
        {"destroy", btn},
    };
    REQUIRE(events() == expected);
}

TEST_CASE("MemorySystem unmap callback that destroys the parent", "[native][memory][reentrancy]") {
    events().clear();
    MemorySystem system;
    ActiveSystem active(system);
    RawHandle dlg = system.create("dialog");
    RawHandle a = system.create("button");
    RawHandle b = system.create("button");
    REQUIRE(system.append(dlg, a) == dlg);
    REQUIRE(system.append(dlg, b) == dlg);
    REQUIRE(system.map(dlg) == status::Ok);
    system.set_callback(a, callback_names::Unmap, &destroy_parent);
    system.set_callback(b, callback_names::Unmap, &on_unmap);
    system.set_callback(dlg, callback_names::Destroy, &on_destroy);

    system.unmap(dlg);

    REQUIRE(system.object_count() == 0);

    // Each element is unmapped once, then the parent's cascade finishes
    std::vector<std::pair<std::string, RawHandle>> expected = {
        {"unmap", a},
        {"unmap", b},
        {"destroy", dlg},
    };
    REQUIRE(events() == expected);
}

TEST_CASE("MemorySystem destroys leftovers on destruction", "[native][memory]") {
    events().clear();
    RawHandle dlg = nullptr;
    {
        MemorySystem system;
        dlg = system.create("dialog");
        system.set_callback(dlg, callback_names::Destroy, &on_destroy);
    }
    REQUIRE(events().size() == 1);
    REQUIRE(events()[0] == std::make_pair(std::string("destroy"), dlg));
}

TEST_CASE("MemorySystem event simulation", "[native][memory]") {
    MemorySystem system;
    RawHandle btn = system.create("button");

    REQUIRE(system.fire(btn, "ACTION") == to_native(CallbackReturn::Default));

    system.set_callback(btn, "ACTION", &on_close);
    REQUIRE(system.callback(btn, "ACTION") == &on_close);
    REQUIRE(system.fire(btn, "ACTION") == to_native(CallbackReturn::Close));

    system.set_callback(btn, "ACTION", nullptr);
    REQUIRE(system.callback(btn, "ACTION") == nullptr);
}

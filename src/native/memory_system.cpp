/// @file memory_system.cpp
/// @brief In-process native object system implementation

#include <tether/native/memory_system.hpp>
#include <tether/core/log.hpp>

#include <algorithm>
#include <map>
#include <set>
#include <unordered_map>

namespace tether_native {

// =============================================================================
// NativeObject
// =============================================================================

struct NativeObject {
    std::string class_name;
    std::map<std::string, std::string> attributes;
    std::map<std::string, NativeCallback> callbacks;
    NativeObject* parent = nullptr;
    std::vector<NativeObject*> children;
    bool mapped = false;
    bool destroying = false;
};

namespace {

constexpr const char* k_default_classes[] = {
    "dialog", "button", "label", "text", "multiline", "toggle", "list",
    "image", "vbox", "hbox", "zbox", "fill", "frame", "tabs", "menu",
    "submenu", "item", "separator", "timer", "progressbar", "val", "canvas",
};

constexpr const char* k_default_inheritable[] = {
    "ACTIVE", "BGCOLOR", "FGCOLOR", "FONT", "VISIBLE",
};

} // anonymous namespace

// =============================================================================
// MemorySystem::Impl
// =============================================================================

struct MemorySystem::Impl {
    std::unordered_map<RawHandle, std::unique_ptr<NativeObject>> objects;
    std::set<std::string> classes;
    std::set<std::string> inheritable;

    NativeObject* find(RawHandle handle) const {
        if (!handle) {
            return nullptr;
        }
        auto it = objects.find(handle);
        return it != objects.end() ? it->second.get() : nullptr;
    }

    /// Callbacks run user code that may change the tree, so walks hold
    /// handles and look each object up again after every fire.
    int fire(RawHandle handle, const char* name) {
        auto* obj = find(handle);
        if (!obj) {
            return to_native(CallbackReturn::Default);
        }
        auto it = obj->callbacks.find(name);
        if (it == obj->callbacks.end() || !it->second) {
            return to_native(CallbackReturn::Default);
        }
        const NativeCallback callback = it->second;
        return callback(handle);
    }

    std::vector<RawHandle> children_of(RawHandle handle) const {
        auto* obj = find(handle);
        if (!obj) {
            return {};
        }
        return std::vector<RawHandle>(obj->children.begin(), obj->children.end());
    }

    /// False once a callback destroyed the child or moved it elsewhere
    bool is_child_of(RawHandle child, RawHandle parent) const {
        auto* obj = find(child);
        return obj && obj->parent == parent;
    }

    void map_object(RawHandle handle) {
        auto* obj = find(handle);
        if (!obj) {
            return;
        }
        if (!obj->mapped) {
            obj->mapped = true;
            fire(handle, callback_names::Map);
        }
        for (RawHandle child : children_of(handle)) {
            if (is_child_of(child, handle)) {
                map_object(child);
            }
        }
    }

    void unmap_object(RawHandle handle) {
        auto* obj = find(handle);
        if (!obj || !obj->mapped) {
            return;
        }
        for (RawHandle child : children_of(handle)) {
            if (is_child_of(child, handle)) {
                unmap_object(child);
            }
        }

        obj = find(handle);
        if (!obj || !obj->mapped) {
            return;
        }
        obj->mapped = false;
        fire(handle, callback_names::Unmap);
    }

    void detach(NativeObject* obj) {
        if (obj->parent) {
            auto& siblings = obj->parent->children;
            siblings.erase(std::remove(siblings.begin(), siblings.end(), obj), siblings.end());
            obj->parent = nullptr;
        }
    }

    void destroy_object(RawHandle handle) {
        auto* obj = find(handle);
        if (!obj || obj->destroying) {
            return;
        }
        // Only this frame erases obj; nested destroys stop at the flag
        obj->destroying = true;

        fire(handle, callback_names::LDestroy);
        unmap_object(handle);
        detach(obj);

        for (RawHandle child : children_of(handle)) {
            if (is_child_of(child, handle)) {
                destroy_object(child);
            }
        }

        fire(handle, callback_names::Destroy);

        // Callbacks may have re-attached obj, and children still being
        // destroyed further up the stack must not point at it
        detach(obj);
        for (auto* child : obj->children) {
            child->parent = nullptr;
        }

        tether_core::native_logger()->trace("Destroyed '{}' ({})", obj->class_name, static_cast<const void*>(obj));
        objects.erase(handle);
    }

    void reset_tree(NativeObject* obj, const std::string& name) {
        obj->attributes.erase(name);
        for (auto* child : obj->children) {
            reset_tree(child, name);
        }
    }

    static bool is_ancestor(const NativeObject* candidate, const NativeObject* obj) {
        for (const auto* p = obj; p; p = p->parent) {
            if (p == candidate) {
                return true;
            }
        }
        return false;
    }
};

// =============================================================================
// Construction
// =============================================================================

MemorySystem::MemorySystem() : m_impl(std::make_unique<Impl>()) {
    for (const char* cls : k_default_classes) {
        m_impl->classes.insert(cls);
    }
    for (const char* name : k_default_inheritable) {
        m_impl->inheritable.insert(name);
    }
}

/// Remaining objects are destroyed root by root so their destruction
/// callbacks still fire.
MemorySystem::~MemorySystem() {
    while (!m_impl->objects.empty()) {
        NativeObject* root = m_impl->objects.begin()->second.get();
        while (root->parent) {
            root = root->parent;
        }
        m_impl->destroy_object(root);
    }
}

// =============================================================================
// Object Lifetime
// =============================================================================

RawHandle MemorySystem::create(const char* class_name) {
    if (!class_name || !*class_name || !is_class_registered(class_name)) {
        tether_core::native_logger()->debug("create: unknown class '{}'", class_name ? class_name : "");
        return nullptr;
    }

    auto obj = std::make_unique<NativeObject>();
    obj->class_name = class_name;
    RawHandle handle = obj.get();
    m_impl->objects.emplace(handle, std::move(obj));

    tether_core::native_logger()->trace("Created '{}' ({})", class_name, static_cast<const void*>(handle));
    return handle;
}

void MemorySystem::destroy(RawHandle handle) {
    m_impl->destroy_object(handle);
}

// =============================================================================
// Mapping and Visibility
// =============================================================================

int MemorySystem::map(RawHandle handle) {
    auto* obj = m_impl->find(handle);
    if (!obj) {
        return status::Error;
    }
    if (obj->mapped) {
        return status::Ok;
    }
    // A child can only be mapped if its parent is already mapped
    if (obj->parent && !obj->parent->mapped) {
        return status::Error;
    }
    m_impl->map_object(handle);
    return status::Ok;
}

void MemorySystem::unmap(RawHandle handle) {
    m_impl->unmap_object(handle);
}

int MemorySystem::show(RawHandle handle) {
    if (!status::succeeded(map(handle))) {
        return status::Error;
    }
    set_attribute(handle, "VISIBLE", "YES");
    return status::Ok;
}

void MemorySystem::hide(RawHandle handle) {
    set_attribute(handle, "VISIBLE", "NO");
}

// =============================================================================
// Attributes
// =============================================================================

void MemorySystem::set_attribute(RawHandle handle, const char* name, const char* value) {
    auto* obj = m_impl->find(handle);
    if (!obj || !name) {
        return;
    }
    if (value) {
        obj->attributes[name] = value;
    } else {
        obj->attributes.erase(name);
    }
}

const char* MemorySystem::attribute(RawHandle handle, const char* name) {
    auto* obj = m_impl->find(handle);
    if (!obj || !name) {
        return nullptr;
    }

    auto it = obj->attributes.find(name);
    if (it != obj->attributes.end()) {
        return it->second.c_str();
    }

    if (!is_inheritable(name)) {
        return nullptr;
    }
    for (auto* p = obj->parent; p; p = p->parent) {
        auto pit = p->attributes.find(name);
        if (pit != p->attributes.end()) {
            return pit->second.c_str();
        }
    }
    return nullptr;
}

void MemorySystem::reset_attribute(RawHandle handle, const char* name) {
    auto* obj = m_impl->find(handle);
    if (!obj || !name) {
        return;
    }
    if (is_inheritable(name)) {
        m_impl->reset_tree(obj, name);
    } else {
        obj->attributes.erase(name);
    }
}

const char* MemorySystem::class_name(RawHandle handle) {
    auto* obj = m_impl->find(handle);
    return obj ? obj->class_name.c_str() : nullptr;
}

// =============================================================================
// Callbacks
// =============================================================================

void MemorySystem::set_callback(RawHandle handle, const char* name, NativeCallback callback) {
    auto* obj = m_impl->find(handle);
    if (!obj || !name) {
        return;
    }
    if (callback) {
        obj->callbacks[name] = callback;
    } else {
        obj->callbacks.erase(name);
    }
}

NativeCallback MemorySystem::callback(RawHandle handle, const char* name) {
    auto* obj = m_impl->find(handle);
    if (!obj || !name) {
        return nullptr;
    }
    auto it = obj->callbacks.find(name);
    return it != obj->callbacks.end() ? it->second : nullptr;
}

int MemorySystem::fire(RawHandle handle, const char* name) {
    if (!name) {
        return to_native(CallbackReturn::Default);
    }
    return m_impl->fire(handle, name);
}

// =============================================================================
// Hierarchy
// =============================================================================

RawHandle MemorySystem::append(RawHandle parent, RawHandle child) {
    auto* p = m_impl->find(parent);
    auto* c = m_impl->find(child);
    if (!p || !c || c->parent || Impl::is_ancestor(c, p)) {
        return nullptr;
    }
    c->parent = p;
    p->children.push_back(c);
    return parent;
}

// =============================================================================
// Class and Attribute Setup
// =============================================================================

void MemorySystem::register_class(const std::string& class_name) {
    if (!class_name.empty()) {
        m_impl->classes.insert(class_name);
    }
}

bool MemorySystem::is_class_registered(const std::string& class_name) const {
    return m_impl->classes.count(class_name) > 0;
}

void MemorySystem::register_inheritable_attribute(const std::string& name) {
    m_impl->inheritable.insert(name);
}

bool MemorySystem::is_inheritable(const std::string& name) const {
    return m_impl->inheritable.count(name) > 0;
}

// =============================================================================
// Introspection
// =============================================================================

bool MemorySystem::is_alive(RawHandle handle) const {
    return m_impl->find(handle) != nullptr;
}

bool MemorySystem::is_mapped(RawHandle handle) const {
    auto* obj = m_impl->find(handle);
    return obj && obj->mapped;
}

std::size_t MemorySystem::object_count() const {
    return m_impl->objects.size();
}

RawHandle MemorySystem::parent(RawHandle handle) const {
    auto* obj = m_impl->find(handle);
    return obj ? obj->parent : nullptr;
}

std::vector<RawHandle> MemorySystem::children(RawHandle handle) const {
    return m_impl->children_of(handle);
}

} // namespace tether_native

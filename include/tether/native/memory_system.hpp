#pragma once

/// @file memory_system.hpp
/// @brief In-process native object system
///
/// MemorySystem models the object semantics of the toolkit without any
/// windowing backend: class names, string attributes with inheritance,
/// parent/child trees, mapping rules, named callbacks and cascading
/// destruction. It backs the test-suite and headless tools.

#include "fwd.hpp"
#include "system.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace tether_native {

// =============================================================================
// MemorySystem
// =============================================================================

class MemorySystem : public NativeSystem {
public:
    /// Registers the standard class names and inheritable attributes
    MemorySystem();

    /// Destroys the remaining objects, firing their destruction callbacks
    ~MemorySystem() override;

    MemorySystem(const MemorySystem&) = delete;
    MemorySystem& operator=(const MemorySystem&) = delete;

    // =========================================================================
    // NativeSystem
    // =========================================================================

    RawHandle create(const char* class_name) override;
    void destroy(RawHandle handle) override;
    int map(RawHandle handle) override;
    void unmap(RawHandle handle) override;
    int show(RawHandle handle) override;
    void hide(RawHandle handle) override;

    /// The returned pointer of attribute() stays valid until the attribute
    /// is changed or the object is destroyed.
    void set_attribute(RawHandle handle, const char* name, const char* value) override;
    const char* attribute(RawHandle handle, const char* name) override;
    void reset_attribute(RawHandle handle, const char* name) override;

    const char* class_name(RawHandle handle) override;
    void set_callback(RawHandle handle, const char* name, NativeCallback callback) override;
    NativeCallback callback(RawHandle handle, const char* name) override;
    RawHandle append(RawHandle parent, RawHandle child) override;

    // =========================================================================
    // Class and Attribute Setup
    // =========================================================================

    /// Allow create() for a class name
    void register_class(const std::string& class_name);

    /// Check if create() accepts a class name
    [[nodiscard]] bool is_class_registered(const std::string& class_name) const;

    /// Mark an attribute as inherited from parents when unset
    void register_inheritable_attribute(const std::string& name);

    /// Check if an attribute is inheritable
    [[nodiscard]] bool is_inheritable(const std::string& name) const;

    // =========================================================================
    // Event Simulation
    // =========================================================================

    /// Invoke a named callback the way the event loop would.
    /// Returns CallbackReturn::Default when no callback is set.
    int fire(RawHandle handle, const char* name);

    // =========================================================================
    // Introspection
    // =========================================================================

    [[nodiscard]] bool is_alive(RawHandle handle) const;
    [[nodiscard]] bool is_mapped(RawHandle handle) const;
    [[nodiscard]] std::size_t object_count() const;
    [[nodiscard]] RawHandle parent(RawHandle handle) const;
    [[nodiscard]] std::vector<RawHandle> children(RawHandle handle) const;

private:
    struct Impl;
    std::unique_ptr<Impl> m_impl;
};

} // namespace tether_native

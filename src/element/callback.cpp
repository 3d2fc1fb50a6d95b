/// @file callback.cpp
/// @brief Callback registry and destruction hook implementation

#include <tether/element/callback.hpp>
#include <tether/core/core.hpp>

#include <exception>
#include <stdexcept>
#include <utility>

namespace tether_element {

namespace {

bool trace_lifecycle() {
    return tether_core::current_config().trace_lifecycle;
}

/// Closures run inside native event dispatch; an exception must not
/// unwind through the toolkit, so it is reported and the event gets the
/// default handling.
template<CallbackKind K>
int trampoline(RawHandle handle) noexcept {
    try {
        return tether_native::to_native(CallbackRegistry::instance().invoke(handle, K));
    } catch (const std::exception& ex) {
        tether_core::callback_logger()->error("{} callback on {} threw: {}",
            callback_kind_name(K), static_cast<const void*>(handle), ex.what());
    } catch (...) {
        tether_core::callback_logger()->critical("{} callback on {} threw a non-standard exception",
            callback_kind_name(K), static_cast<const void*>(handle));
    }
    return tether_native::to_native(CallbackReturn::Default);
}

} // anonymous namespace

// =============================================================================
// CallbackRegistry
// =============================================================================

CallbackRegistry& CallbackRegistry::instance() {
    static CallbackRegistry registry;
    return registry;
}

void CallbackRegistry::check_thread() const {
    if (!tether_core::current_config().enforce_thread_affinity) {
        return;
    }
    const auto current = std::this_thread::get_id();
    if (!m_owner) {
        m_owner = current;
        return;
    }
    if (*m_owner != current) {
        tether_core::callback_logger()->critical(
            "Callback registry accessed from a thread other than the toolkit thread");
        throw std::logic_error("Callback registry accessed from a foreign thread");
    }
}

void CallbackRegistry::set(RawHandle handle, CallbackKind kind, Closure closure) {
    check_thread();

    auto& slot = m_entries[handle][kind];
    Closure replaced = std::exchange(slot, std::move(closure));

    if (trace_lifecycle()) {
        tether_core::callback_logger()->trace("{} {} callback on {}",
            replaced ? "Replaced" : "Registered", callback_kind_name(kind),
            static_cast<const void*>(handle));
    }
}

bool CallbackRegistry::remove(RawHandle handle, CallbackKind kind) {
    check_thread();

    auto it = m_entries.find(handle);
    if (it == m_entries.end()) {
        return false;
    }

    auto cit = it->second.find(kind);
    if (cit == it->second.end()) {
        return false;
    }

    Closure removed = std::move(cit->second);
    it->second.erase(cit);
    if (it->second.empty()) {
        m_entries.erase(it);
    }

    if (trace_lifecycle()) {
        tether_core::callback_logger()->trace("Removed {} callback on {}",
            callback_kind_name(kind), static_cast<const void*>(handle));
    }
    return true;
}

CallbackReturn CallbackRegistry::invoke(RawHandle handle, CallbackKind kind) {
    check_thread();

    auto it = m_entries.find(handle);
    if (it == m_entries.end()) {
        return CallbackReturn::Default;
    }
    auto cit = it->second.find(kind);
    if (cit == it->second.end() || !cit->second) {
        return CallbackReturn::Default;
    }

    // The closure may replace or remove itself while running
    Closure closure = cit->second;
    return closure(handle);
}

std::size_t CallbackRegistry::drop_callbacks(RawHandle handle) {
    check_thread();

    std::map<CallbackKind, Closure> dropped;
    auto it = m_entries.find(handle);
    if (it != m_entries.end()) {
        dropped = std::move(it->second);
        m_entries.erase(it);
    }
    const bool was_hooked = m_hooked.erase(handle) > 0;

    if (trace_lifecycle()) {
        tether_core::callback_logger()->trace("Dropped {} callback(s) of {}{}",
            dropped.size(), static_cast<const void*>(handle), was_hooked ? "" : " (not hooked)");
    }

    // Closures are released here, after the registry no longer refers to them
    return dropped.size();
}

bool CallbackRegistry::install_destroy_hook(tether_native::NativeSystem& system, RawHandle handle) {
    check_thread();

    if (!m_hooked.insert(handle).second) {
        return false;
    }
    system.set_callback(handle, tether_native::callback_names::Destroy, &on_element_destroy);

    if (trace_lifecycle()) {
        tether_core::callback_logger()->trace("Installed destroy hook on {}", static_cast<const void*>(handle));
    }
    return true;
}

bool CallbackRegistry::is_hooked(RawHandle handle) const {
    check_thread();
    return m_hooked.count(handle) > 0;
}

bool CallbackRegistry::contains(RawHandle handle) const {
    check_thread();
    return m_entries.find(handle) != m_entries.end();
}

bool CallbackRegistry::contains(RawHandle handle, CallbackKind kind) const {
    check_thread();
    auto it = m_entries.find(handle);
    return it != m_entries.end() && it->second.count(kind) > 0;
}

std::size_t CallbackRegistry::callback_count(RawHandle handle) const {
    check_thread();
    auto it = m_entries.find(handle);
    return it != m_entries.end() ? it->second.size() : 0;
}

std::size_t CallbackRegistry::entry_count() const {
    check_thread();
    return m_entries.size();
}

std::size_t CallbackRegistry::hooked_count() const {
    check_thread();
    return m_hooked.size();
}

void CallbackRegistry::clear() {
    check_thread();

    auto entries = std::move(m_entries);
    m_entries.clear();
    m_hooked.clear();
}

void CallbackRegistry::rebind_thread() {
    m_owner = std::this_thread::get_id();
}

// =============================================================================
// Native Entry Points
// =============================================================================

int on_element_destroy(RawHandle handle) noexcept {
    try {
        CallbackRegistry::instance().drop_callbacks(handle);
    } catch (const std::exception& ex) {
        tether_core::callback_logger()->critical("Destroy hook on {} failed: {}",
            static_cast<const void*>(handle), ex.what());
    } catch (...) {
        tether_core::callback_logger()->critical("Destroy hook on {} failed with a non-standard exception",
            static_cast<const void*>(handle));
    }
    return tether_native::to_native(CallbackReturn::Default);
}

tether_native::NativeCallback trampoline_for(CallbackKind kind) noexcept {
    switch (kind) {
        case CallbackKind::Destroy: return &trampoline<CallbackKind::Destroy>;
        case CallbackKind::Map: return &trampoline<CallbackKind::Map>;
        case CallbackKind::Unmap: return &trampoline<CallbackKind::Unmap>;
        case CallbackKind::GetFocus: return &trampoline<CallbackKind::GetFocus>;
        case CallbackKind::KillFocus: return &trampoline<CallbackKind::KillFocus>;
        case CallbackKind::EnterWindow: return &trampoline<CallbackKind::EnterWindow>;
        case CallbackKind::LeaveWindow: return &trampoline<CallbackKind::LeaveWindow>;
        case CallbackKind::Help: return &trampoline<CallbackKind::Help>;
        case CallbackKind::Action: return &trampoline<CallbackKind::Action>;
        case CallbackKind::ActionCb: return &trampoline<CallbackKind::ActionCb>;
        default: return nullptr;
    }
}

} // namespace tether_element

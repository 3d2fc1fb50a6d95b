/// @file system.cpp
/// @brief Active native system registration

#include <tether/native/system.hpp>
#include <tether/core/error.hpp>
#include <tether/core/log.hpp>

#include <stdexcept>

namespace tether_native {

namespace {

NativeSystem*& active_system() {
    static NativeSystem* system = nullptr;
    return system;
}

} // anonymous namespace

void install_native_system(NativeSystem& system) noexcept {
    active_system() = &system;
}

void uninstall_native_system() noexcept {
    active_system() = nullptr;
}

bool has_native_system() noexcept {
    return active_system() != nullptr;
}

NativeSystem& native_system() {
    NativeSystem* system = active_system();
    if (!system) {
        const auto error = tether_core::NativeError::no_system();
        tether_core::native_logger()->critical("{} (used before one was installed)", error.message);
        throw std::logic_error(error.message);
    }
    return *system;
}

ScopedNativeSystem::ScopedNativeSystem(NativeSystem& system) noexcept
    : m_previous(active_system())
{
    active_system() = &system;
}

ScopedNativeSystem::~ScopedNativeSystem() {
    active_system() = m_previous;
}

} // namespace tether_native

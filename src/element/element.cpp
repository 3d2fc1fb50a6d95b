/// @file element.cpp
/// @brief Out-of-line helpers of the element wrappers

#include <tether/element/handle.hpp>
#include <tether/core/core.hpp>

#include <spdlog/fmt/fmt.h>

#include <stdexcept>
#include <utility>

namespace tether_element {
namespace detail {

namespace {

const void* ptr(RawHandle handle) {
    return static_cast<const void*>(handle);
}

} // anonymous namespace

void null_handle_error(std::string_view type_name) {
    auto error = tether_core::Error(tether_core::HandleError::null())
        .with_context("type", std::string(type_name));
    tether_core::element_logger()->critical("from_raw: {}", tether_core::build_error_chain(error));
    throw std::invalid_argument(fmt::format("{}::from_raw called with a null handle", type_name));
}

tether_core::Error native_status_error(
    tether_core::NativeError::Kind kind, RawHandle handle, std::string_view type_name, int status)
{
    const std::string cls = live_class_name(handle);
    auto native = kind == tether_core::NativeError::Kind::ShowFailed
        ? tether_core::NativeError::show_failed(cls, status)
        : tether_core::NativeError::map_failed(cls, status);

    tether_core::Error error(std::move(native));
    error.with_context("element", format_element(type_name, handle));

    tether_core::element_logger()->warn("{}", tether_core::build_error_chain(error));
    return error;
}

tether_core::Error append_error(RawHandle parent, std::string_view type_name, RawHandle child) {
    tether_core::Error error(tether_core::NativeError::append_failed(
        live_class_name(parent), live_class_name(child)));
    error.with_context("element", format_element(type_name, parent))
         .with_context("child", fmt::format("{}", ptr(child)));

    tether_core::element_logger()->warn("{}", tether_core::build_error_chain(error));
    return error;
}

std::string format_element(std::string_view type_name, RawHandle handle) {
    return fmt::format("{}({})", type_name, ptr(handle));
}

std::string live_class_name(RawHandle handle) {
    if (!handle) {
        return {};
    }
    const char* name = tether_native::native_system().class_name(handle);
    return name ? std::string(name) : std::string();
}

void log_downcast(std::string_view target_type, std::string_view target_class, RawHandle handle, bool matched) {
    if (matched) {
        if (tether_core::current_config().trace_downcasts) {
            tether_core::element_logger()->trace("Downcast of {} to {} succeeded", ptr(handle), target_type);
        }
        return;
    }

    auto error = tether_core::Error(tether_core::HandleError::class_mismatch(
        std::string(target_class), live_class_name(handle)));
    error.with_context("target", std::string(target_type));
    tether_core::element_logger()->debug("Downcast of {} refused: {}",
        ptr(handle), tether_core::build_error_chain(error));
}

} // namespace detail
} // namespace tether_element

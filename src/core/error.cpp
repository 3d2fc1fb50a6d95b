/// @file error.cpp
/// @brief Error handling implementation for tether_core
///
/// The error system is primarily template-based and header-only.
/// This file provides:
/// - Explicit template instantiations for common Result types
/// - Error formatting utilities

#include <tether/core/error.hpp>
#include <sstream>

namespace tether_core {

// =============================================================================
// Error Message Formatting
// =============================================================================

namespace detail {

const char* native_kind_name(NativeError::Kind kind) {
    switch (kind) {
        case NativeError::Kind::MapFailed: return "MapFailed";
        case NativeError::Kind::ShowFailed: return "ShowFailed";
        case NativeError::Kind::AppendFailed: return "AppendFailed";
        case NativeError::Kind::NoSystem: return "NoSystem";
        default: return "Unknown";
    }
}

/// Format native error with full context
std::string format_native_error(const NativeError& err) {
    std::ostringstream oss;
    oss << "[NativeError:" << native_kind_name(err.kind) << "] " << err.message;

    if (err.kind == NativeError::Kind::MapFailed || err.kind == NativeError::Kind::ShowFailed) {
        oss << " (status: " << err.status << ")";
    }

    return oss.str();
}

/// Format handle error with full context
std::string format_handle_error(const HandleError& err) {
    std::ostringstream oss;
    oss << "[HandleError] " << err.message;
    return oss.str();
}

/// Format config error with full context
std::string format_config_error(const ConfigError& err) {
    std::ostringstream oss;
    oss << "[ConfigError] " << err.message;

    if (!err.key.empty()) {
        oss << " (key: " << err.key << ")";
    }

    return oss.str();
}

} // namespace detail

// =============================================================================
// Error Chain Support
// =============================================================================

/// Build a full error message with context chain
std::string build_error_chain(const Error& error) {
    std::ostringstream oss;

    // Error code
    oss << "[" << error_code_name(error.code()) << "] ";

    // Main message based on variant type
    std::visit([&oss](const auto& err) {
        using T = std::decay_t<decltype(err)>;
        if constexpr (std::is_same_v<T, std::string>) {
            oss << err;
        } else if constexpr (std::is_same_v<T, NativeError>) {
            oss << detail::format_native_error(err);
        } else if constexpr (std::is_same_v<T, HandleError>) {
            oss << detail::format_handle_error(err);
        } else if constexpr (std::is_same_v<T, ConfigError>) {
            oss << detail::format_config_error(err);
        }
    }, error.variant());

    // Context entries, sorted by key
    for (const auto& [key, value] : error.context()) {
        oss << " {" << key << "=" << value << "}";
    }

    return oss.str();
}

// =============================================================================
// Explicit Template Instantiations
// =============================================================================

template class Result<void, Error>;
template class Result<bool, Error>;
template class Result<int, Error>;

} // namespace tether_core

// =============================================================================
// FILE: smat/binding/c_api/core.cpp
// BRIEF: Thread-local error state and exception translation
// =============================================================================

#include "smat/binding/c_api/core.h"
#include "smat/binding/c_api/internal.hpp"
#include "smat/threading/scheduler.hpp"
#include "smat/core/error.hpp"
#include "smat/version.hpp"

#include <algorithm>
#include <array>
#include <cstring>
#include <exception>
#include <new>
#include <stdexcept>
#include <string>
#include <string_view>

namespace smat::binding {

// =============================================================================
// Thread-Local Error State
// =============================================================================

namespace {

constexpr std::size_t ERROR_MESSAGE_BUFFER_SIZE = 512;

// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
thread_local smat_error_t g_last_error_code = SMAT_OK;
// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
thread_local std::array<char, ERROR_MESSAGE_BUFFER_SIZE> g_last_error_message = {};

} // anonymous namespace

void set_last_error(smat_error_t code, const char* message) noexcept {
    set_last_error(code, message != nullptr ? std::string_view(message) : std::string_view{});
}

void set_last_error(smat_error_t code, std::string_view message) noexcept {
    g_last_error_code = code;

    // Truncates long messages
    const auto copy_len = std::min(message.size(), ERROR_MESSAGE_BUFFER_SIZE - 1);
    std::memcpy(g_last_error_message.data(), message.data(), copy_len);
    g_last_error_message[copy_len] = '\0';
}

void clear_last_error() noexcept {
    g_last_error_code = SMAT_OK;
    g_last_error_message[0] = '\0';
}

auto get_last_error_message() noexcept -> const char* {
    if (SMAT_LIKELY(g_last_error_message[0] != '\0')) {
        return g_last_error_message.data();
    }
    return "No error";
}

auto get_last_error_code() noexcept -> smat_error_t {
    return g_last_error_code;
}

// =============================================================================
// Exception to Error Code Conversion
// =============================================================================

[[nodiscard]] auto handle_exception() noexcept -> smat_error_t {
    try {
        throw;
    }
    // Every smat exception carries its stable code
    catch (const Exception& e) {
        const auto code = static_cast<smat_error_t>(e.code());
        set_last_error(code, e.what());
        return code;
    }
    catch (const std::bad_alloc&) {
        set_last_error(SMAT_ERROR_OUT_OF_MEMORY,
                       "Memory allocation failed (std::bad_alloc)");
        return SMAT_ERROR_OUT_OF_MEMORY;
    }
    catch (const std::out_of_range& e) {
        set_last_error(SMAT_ERROR_RANGE_ERROR, e.what());
        return SMAT_ERROR_RANGE_ERROR;
    }
    catch (const std::logic_error& e) {
        set_last_error(SMAT_ERROR_INVALID_ARGUMENT, e.what());
        return SMAT_ERROR_INVALID_ARGUMENT;
    }
    catch (const std::exception& e) {
        set_last_error(SMAT_ERROR_UNKNOWN, e.what());
        return SMAT_ERROR_UNKNOWN;
    }
    catch (...) {
        set_last_error(SMAT_ERROR_UNKNOWN,
                       "Unknown exception (not derived from std::exception)");
        return SMAT_ERROR_UNKNOWN;
    }
}

} // namespace smat::binding

// =============================================================================
// C API Implementation
// =============================================================================

extern "C" {

SMAT_EXPORT const char* smat_get_version(void) {
    return SMAT_VERSION_STRING;
}

SMAT_EXPORT const char* smat_get_build_config(void) {
    static const std::string config_str =
        std::string(smat::VALUE_DTYPE_NAME) + "+" +
        smat::threading::Scheduler::backend_name();
    return config_str.c_str();
}

SMAT_EXPORT const char* smat_get_last_error(void) {
    return smat::binding::get_last_error_message();
}

SMAT_EXPORT smat_error_t smat_get_last_error_code(void) {
    return smat::binding::get_last_error_code();
}

SMAT_EXPORT void smat_clear_error(void) {
    smat::binding::clear_last_error();
}

} // extern "C"

// =============================================================================
// FILE: safe/binding/c_api/core/core.cpp
// BRIEF: Core C API implementation with thread-safe error handling
// =============================================================================

#include "safe/binding/c_api/core/core.h"
#include "safe/binding/c_api/core/internal.hpp"
#include "safe/core/error.hpp"
#include "safe/threading/scheduler.hpp"

#include <algorithm>
#include <array>
#include <cstring>
#include <exception>
#include <new>
#include <stdexcept>
#include <string_view>

namespace safe::binding {

// =============================================================================
// Thread-Local Error State
// =============================================================================

namespace {

constexpr std::size_t ERROR_MESSAGE_BUFFER_SIZE = 512;

// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
thread_local safe_error_t g_last_error_code = SAFE_OK;
// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
thread_local std::array<char, ERROR_MESSAGE_BUFFER_SIZE> g_last_error_message = {};

auto report(safe_error_t code, const char* message) noexcept -> safe_error_t {
    set_last_error(code, message);
    return code;
}

} // anonymous namespace

void set_last_error(safe_error_t code, const char* message) noexcept {
    g_last_error_code = code;

    if (SAFE_LIKELY(message != nullptr)) {
        std::strncpy(g_last_error_message.data(), message, ERROR_MESSAGE_BUFFER_SIZE - 1);
        g_last_error_message[ERROR_MESSAGE_BUFFER_SIZE - 1] = '\0';
    } else {
        g_last_error_message[0] = '\0';
    }
}

void set_last_error(safe_error_t code, std::string_view message) noexcept {
    g_last_error_code = code;

    const auto copy_len = std::min(message.size(), ERROR_MESSAGE_BUFFER_SIZE - 1);
    std::memcpy(g_last_error_message.data(), message.data(), copy_len);
    g_last_error_message[copy_len] = '\0';
}

void clear_last_error() noexcept {
    g_last_error_code = SAFE_OK;
    g_last_error_message[0] = '\0';
}

auto get_last_error_message() noexcept -> const char* {
    if (SAFE_LIKELY(g_last_error_message[0] != '\0')) {
        return g_last_error_message.data();
    }
    return "No error";
}

auto get_last_error_code() noexcept -> safe_error_t {
    return g_last_error_code;
}

// =============================================================================
// Exception to Error Code Conversion
// =============================================================================

// Every safe::Exception carries its stable code; standard exceptions are
// mapped by category.
auto handle_exception() noexcept -> safe_error_t {
    try {
        throw;
    }
    catch (const Exception& e) {
        return report(static_cast<safe_error_t>(e.code()), e.what());
    }
    catch (const std::bad_alloc&) {
        return report(SAFE_ERROR_OUT_OF_MEMORY, "Memory allocation failed (std::bad_alloc)");
    }
    catch (const std::out_of_range& e) {
        return report(SAFE_ERROR_RANGE_ERROR, e.what());
    }
    catch (const std::domain_error& e) {
        return report(SAFE_ERROR_DOMAIN_ERROR, e.what());
    }
    catch (const std::logic_error& e) {
        return report(SAFE_ERROR_INVALID_ARGUMENT, e.what());
    }
    catch (const std::exception& e) {
        return report(SAFE_ERROR_UNKNOWN, e.what());
    }
    catch (...) {
        return report(SAFE_ERROR_UNKNOWN, "Unknown exception (not derived from std::exception)");
    }
}

} // namespace safe::binding

// =============================================================================
// C API Implementation
// =============================================================================

extern "C" {

SAFE_C_EXPORT const char* safe_get_version(void) {
    return "1.0.0";
}

SAFE_C_EXPORT const char* safe_get_build_config(void) {
    static const char* config_str =
        SAFE_REAL_TYPE_NAME "+" SAFE_INDEX_TYPE_NAME
#if defined(SAFE_USE_OPENMP)
        "+openmp"
#elif defined(SAFE_USE_TBB)
        "+tbb"
#else
        "+serial"
#endif
#if defined(SAFE_HAS_HDF5)
        "+hdf5"
#endif
        ;
    return config_str;
}

SAFE_C_EXPORT const char* safe_get_last_error(void) {
    return safe::binding::get_last_error_message();
}

SAFE_C_EXPORT safe_error_t safe_get_last_error_code(void) {
    return safe::binding::get_last_error_code();
}

SAFE_C_EXPORT void safe_clear_error(void) {
    safe::binding::clear_last_error();
}

SAFE_C_EXPORT safe_bool_t safe_is_ok(safe_error_t code) {
    return (code == SAFE_OK) ? SAFE_TRUE : SAFE_FALSE;
}

SAFE_C_EXPORT safe_bool_t safe_is_error(safe_error_t code) {
    return (code != SAFE_OK) ? SAFE_TRUE : SAFE_FALSE;
}

SAFE_C_EXPORT safe_error_t safe_set_num_threads(safe_size_t n) {
    SAFE_C_API_TRY
        safe::threading::Scheduler::set_num_threads(n);
        SAFE_C_API_RETURN_OK;
    SAFE_C_API_CATCH
}

SAFE_C_EXPORT safe_size_t safe_get_num_threads(void) {
    return safe::threading::Scheduler::get_num_threads();
}

} // extern "C"

#pragma once

/**
 * @file platform.hpp
 * @brief Platform detection and small OS abstractions
 *
 * This header provides:
 * - Compile-time compiler and OS detection
 * - Language feature detection
 * - Attribute and branch-hint macros
 * - Runtime environment queries used by logging and configuration
 */

#include <cstdint>
#include <string>
#include <string_view>

// ============================================================================
// COMPILER DETECTION
// ============================================================================

#if defined(__clang__)
    #define WSCONN_COMPILER_CLANG 1
    #define WSCONN_COMPILER_NAME "Clang"
#elif defined(__GNUC__) || defined(__GNUG__)
    #define WSCONN_COMPILER_GCC 1
    #define WSCONN_COMPILER_NAME "GCC"
#elif defined(_MSC_VER)
    #define WSCONN_COMPILER_MSVC 1
    #define WSCONN_COMPILER_NAME "MSVC"
#else
    #define WSCONN_COMPILER_UNKNOWN 1
    #define WSCONN_COMPILER_NAME "Unknown"
#endif

// ============================================================================
// OPERATING SYSTEM DETECTION
// ============================================================================

#if defined(_WIN32) || defined(_WIN64)
    #define WSCONN_OS_WINDOWS 1
    #define WSCONN_OS_NAME "Windows"
#elif defined(__APPLE__) && defined(__MACH__)
    #define WSCONN_OS_MACOS 1
    #define WSCONN_OS_NAME "macOS"
#elif defined(__linux__)
    #define WSCONN_OS_LINUX 1
    #define WSCONN_OS_NAME "Linux"
#elif defined(__FreeBSD__)
    #define WSCONN_OS_FREEBSD 1
    #define WSCONN_OS_NAME "FreeBSD"
#elif defined(__unix__)
    #define WSCONN_OS_UNIX 1
    #define WSCONN_OS_NAME "Unix"
#else
    #define WSCONN_OS_UNKNOWN 1
    #define WSCONN_OS_NAME "Unknown"
#endif

#if defined(WSCONN_OS_LINUX) || defined(WSCONN_OS_MACOS) || defined(WSCONN_OS_FREEBSD) || \
    defined(WSCONN_OS_UNIX)
    #define WSCONN_OS_POSIX 1
#endif

// ============================================================================
// BUILD TYPE DETECTION
// ============================================================================

#if defined(NDEBUG) || defined(WSCONN_RELEASE)
    #define WSCONN_BUILD_RELEASE 1
    #define WSCONN_BUILD_TYPE "Release"
#else
    #define WSCONN_BUILD_DEBUG 1
    #define WSCONN_BUILD_TYPE "Debug"
#endif

// ============================================================================
// FEATURE DETECTION
// ============================================================================

#if __cplusplus >= 202002L
    #define WSCONN_CPP_VERSION 20
#elif __cplusplus >= 201703L
    #define WSCONN_CPP_VERSION 17
#else
    #define WSCONN_CPP_VERSION 0
#endif

// Source location (C++20)
#if defined(__cpp_lib_source_location) || (WSCONN_CPP_VERSION >= 20 && !defined(WSCONN_COMPILER_MSVC))
    #define WSCONN_HAS_SOURCE_LOCATION 1
#endif

// ============================================================================
// COMPILER ATTRIBUTES
// ============================================================================

// Branch prediction hints
#if defined(WSCONN_COMPILER_GCC) || defined(WSCONN_COMPILER_CLANG)
    #define WSCONN_LIKELY(x)   __builtin_expect(!!(x), 1)
    #define WSCONN_UNLIKELY(x) __builtin_expect(!!(x), 0)
#else
    #define WSCONN_LIKELY(x)   (x)
    #define WSCONN_UNLIKELY(x) (x)
#endif

// Export/Import for shared libraries
#if defined(WSCONN_OS_WINDOWS)
    #if defined(WSCONN_BUILDING_SHARED)
        #define WSCONN_API __declspec(dllexport)
    #elif defined(WSCONN_USING_SHARED)
        #define WSCONN_API __declspec(dllimport)
    #else
        #define WSCONN_API
    #endif
#elif defined(WSCONN_COMPILER_GCC) || defined(WSCONN_COMPILER_CLANG)
    #if defined(WSCONN_BUILDING_SHARED)
        #define WSCONN_API __attribute__((visibility("default")))
    #else
        #define WSCONN_API
    #endif
#else
    #define WSCONN_API
#endif

#define WSCONN_THREAD_LOCAL thread_local

namespace wsconn::common::platform {

// ============================================================================
// Runtime Environment Queries
// ============================================================================

/**
 * @brief Get current process ID
 */
WSCONN_API uint64_t get_process_id() noexcept;

/**
 * @brief Get current thread ID
 */
WSCONN_API uint64_t get_thread_id() noexcept;

/**
 * @brief Get environment variable value
 * @return Empty string if not found
 */
WSCONN_API std::string get_env(std::string_view name);

/**
 * @brief Set environment variable
 * @return true on success
 */
WSCONN_API bool set_env(std::string_view name, std::string_view value);

/**
 * @brief Remove environment variable
 * @return true on success
 */
WSCONN_API bool unset_env(std::string_view name);

}  // namespace wsconn::common::platform

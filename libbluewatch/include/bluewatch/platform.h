/**
 * @file platform.h
 * @brief Platform detection and abstraction macros for bluewatch
 *
 * This header provides compile-time platform detection and defines
 * the appropriate macros for cross-platform development.
 *
 * bluewatch only supports Linux (BlueZ over D-Bus).
 */

#ifndef BLUEWATCH_PLATFORM_H
#define BLUEWATCH_PLATFORM_H

// ============================================================================
// Platform Detection
// ============================================================================

#if defined(__linux__)
#define BLUEWATCH_PLATFORM_LINUX 1
#define BLUEWATCH_PLATFORM_NAME "Linux"
#else
#error "Unsupported platform. bluewatch only supports Linux."
#endif

// ============================================================================
// Compiler Detection (GCC and Clang only)
// ============================================================================

#if defined(__clang__)
#define BLUEWATCH_COMPILER_CLANG 1
#define BLUEWATCH_COMPILER_NAME "Clang"
#elif defined(__GNUC__)
#define BLUEWATCH_COMPILER_GCC 1
#define BLUEWATCH_COMPILER_NAME "GCC"
#else
#define BLUEWATCH_COMPILER_UNKNOWN 1
#define BLUEWATCH_COMPILER_NAME "Unknown"
#endif

// ============================================================================
// Export/Import Macros
// ============================================================================

#ifdef BLUEWATCH_BUILDING_SHARED
#define BLUEWATCH_API __attribute__((visibility("default")))
#else
#define BLUEWATCH_API
#endif

#define BLUEWATCH_LOCAL __attribute__((visibility("hidden")))

// ============================================================================
// Utility Macros
// ============================================================================

#define BLUEWATCH_UNUSED(x) (void)(x)

#define BLUEWATCH_LIKELY(x) __builtin_expect(!!(x), 1)
#define BLUEWATCH_UNLIKELY(x) __builtin_expect(!!(x), 0)

// ============================================================================
// Feature Detection
// ============================================================================

// BlueZ radio backend (set by the build when libdbus-1 is found)
#ifdef HAS_BLUEZ
#define BLUEWATCH_HAS_BLUETOOTH 1
#define BLUEWATCH_BLUETOOTH_BLUEZ 1
#endif

#endif // BLUEWATCH_PLATFORM_H

/**
 * @file platform.h
 * @brief Platform detection and abstraction macros for klip
 *
 * Compile-time platform detection plus the export and utility macros
 * shared by the library and the server executable.
 *
 * klip only supports Linux desktops (X11 or Wayland).
 */

#ifndef KLIP_PLATFORM_H
#define KLIP_PLATFORM_H

// ============================================================================
// Platform Detection (Linux only)
// ============================================================================

#if !defined(__linux__) || defined(__ANDROID__)
#error "Unsupported platform. klip only supports desktop Linux."
#endif

// ============================================================================
// Export/Import Macros
// ============================================================================

#ifdef KLIP_BUILDING_SHARED
#define KLIP_API __attribute__((visibility("default")))
#else
#define KLIP_API
#endif

// ============================================================================
// Utility Macros
// ============================================================================

#define KLIP_UNUSED(x) (void)(x)

// Branch prediction hint
#define KLIP_LIKELY(x) __builtin_expect(!!(x), 1)

#endif // KLIP_PLATFORM_H

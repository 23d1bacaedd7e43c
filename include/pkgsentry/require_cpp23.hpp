#pragma once

/**
 * @file require_cpp23.hpp
 * @brief C++23 feature-test checks for pkgsentry
 *
 * Include this header early in a translation unit (main.cpp) to get a clear error
 * message when the toolchain lacks a standard library feature pkgsentry relies on.
 *
 * Required compiler versions:
 *   - GCC 14.0+
 *   - Clang 19.0+
 */

#include <expected>
#include <version>

#if !defined(__cplusplus) || __cplusplus < 202'302L
    #error "pkgsentry requires C++23 or later (__cplusplus >= 202302L)."
#endif

// =============================================================================
// std::print / std::println (__cpp_lib_print)
// =============================================================================
// Required for: all console output

#if !defined(__cpp_lib_print) || __cpp_lib_print < 202'207L
    #error "pkgsentry requires std::print/std::println (__cpp_lib_print >= 202207L). " \
       "Please use GCC 14+ or Clang 19+ with a compatible standard library."
#endif

// =============================================================================
// std::expected (__cpp_lib_expected)
// =============================================================================
// Required for: Result<T> / VoidResult

#if !defined(__cpp_lib_expected) || __cpp_lib_expected < 202'202L
    #error "pkgsentry requires std::expected (__cpp_lib_expected >= 202202L). " \
       "Please use GCC 14+ or Clang 19+ with a compatible standard library."
#endif

// =============================================================================
// std::views::enumerate (__cpp_lib_ranges_enumerate)
// =============================================================================
// Required for: CLI argument parsing

#if !defined(__cpp_lib_ranges_enumerate) || __cpp_lib_ranges_enumerate < 202'302L
    #error "pkgsentry requires std::views::enumerate (__cpp_lib_ranges_enumerate >= 202302L). " \
       "Please use GCC 14+ or Clang 19+ with a compatible standard library."
#endif

// =============================================================================
// std::format (__cpp_lib_format)
// =============================================================================

#if !defined(__cpp_lib_format) || __cpp_lib_format < 202'110L
    #error "pkgsentry requires std::format (__cpp_lib_format >= 202110L). " \
       "Please use GCC 14+ or Clang 19+ with a compatible standard library."
#endif

// =============================================================================
// std::ranges (__cpp_lib_ranges)
// =============================================================================

#if !defined(__cpp_lib_ranges) || __cpp_lib_ranges < 202'110L
    #error "pkgsentry requires std::ranges (__cpp_lib_ranges >= 202110L). " \
       "Please use GCC 14+ or Clang 19+ with a compatible standard library."
#endif

#define PKGSENTRY_CPP23_FEATURES_VERIFIED 1

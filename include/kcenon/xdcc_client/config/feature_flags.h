// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file feature_flags.h
 * @brief Unified feature flags header for xdcc_client
 *
 * Central entry point for the system integration flags used by the
 * download client. Include this header to get access to the KCENON_WITH_*
 * macros and the XDCC_CLIENT_USE_LOGGER_SYSTEM switch.
 *
 * Usage:
 * @code
 * #include <kcenon/xdcc_client/config/feature_flags.h>
 *
 * #if XDCC_CLIENT_USE_LOGGER_SYSTEM
 *     logger_->log(level, message);
 * #endif
 * @endcode
 *
 * @see common_system/config/feature_flags.h for upstream feature detection
 */

#pragma once

//==============================================================================
// Include common_system feature flags if available
//==============================================================================

#if __has_include(<kcenon/common/config/feature_flags.h>)
#include <kcenon/common/config/feature_flags.h>
#define XDCC_CLIENT_HAS_COMMON_FEATURE_FLAGS 1
#else
#define XDCC_CLIENT_HAS_COMMON_FEATURE_FLAGS 0
#endif

//==============================================================================
// System Integration Flags
//==============================================================================

/**
 * @brief Ensure KCENON_WITH_* flags are always available
 *
 * These flags are normally set via CMake compile definitions and may be
 * inherited from common_system's feature_flags.h. Defaults are provided here
 * for standalone builds.
 */

#ifndef KCENON_WITH_COMMON_SYSTEM
    #if defined(BUILD_WITH_COMMON_SYSTEM)
        #define KCENON_WITH_COMMON_SYSTEM 1
    #else
        #define KCENON_WITH_COMMON_SYSTEM 0
    #endif
#endif

// logger_system integration (structured logging)
#ifndef KCENON_WITH_LOGGER_SYSTEM
    #if defined(BUILD_WITH_LOGGER_SYSTEM)
        #define KCENON_WITH_LOGGER_SYSTEM 1
    #else
        #define KCENON_WITH_LOGGER_SYSTEM 0
    #endif
#endif

// network_system integration (TCP transport layer)
#ifndef KCENON_WITH_NETWORK_SYSTEM
    #if defined(BUILD_WITH_NETWORK_SYSTEM)
        #define KCENON_WITH_NETWORK_SYSTEM 1
    #else
        #define KCENON_WITH_NETWORK_SYSTEM 0
    #endif
#endif

//==============================================================================
// Logger System Integration Helper
//==============================================================================

/**
 * @brief Unified flag for logger_system usage in xdcc_client
 *
 * logger_system integration requires common_system.
 */
#ifndef XDCC_CLIENT_USE_LOGGER_SYSTEM
    #if KCENON_WITH_LOGGER_SYSTEM && KCENON_WITH_COMMON_SYSTEM
        #define XDCC_CLIENT_USE_LOGGER_SYSTEM 1
    #else
        #define XDCC_CLIENT_USE_LOGGER_SYSTEM 0
    #endif
#endif

//==============================================================================
// Feature Summary (for debugging)
//==============================================================================

#ifdef XDCC_CLIENT_PRINT_FEATURE_SUMMARY

#pragma message("=== XDCC Client Feature Summary ===")

#if KCENON_WITH_LOGGER_SYSTEM
    #pragma message("  logger_system: Enabled")
#else
    #pragma message("  logger_system: Disabled")
#endif

#if KCENON_WITH_NETWORK_SYSTEM
    #pragma message("  network_system: Enabled")
#else
    #pragma message("  network_system: Disabled")
#endif

#endif // XDCC_CLIENT_PRINT_FEATURE_SUMMARY

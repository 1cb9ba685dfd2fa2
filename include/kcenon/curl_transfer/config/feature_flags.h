// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file feature_flags.h
 * @brief Compile-time capabilities of the linked libcurl and optional kcenon systems
 *
 * Flag families:
 * - CURL_TRANS_HAS_*  : libcurl features, derived from <curl/curlver.h>
 * - KCENON_WITH_*     : kcenon system integrations enabled by the build
 * - CURL_TRANS_USE_*  : what curl_transfer actually routes through
 *
 * @code
 * #include <kcenon/curl_transfer/config/feature_flags.h>
 *
 * #if CURL_TRANS_HAS_SSH_HOSTKEY_FUNCTION
 *     // verify SSH host keys without a known_hosts file
 * #endif
 * @endcode
 */

#pragma once

#include <curl/curlver.h>

//==============================================================================
// libcurl Capabilities
//==============================================================================

// curl_multi_poll() and curl_multi_wakeup() drive the scheduler thread
#if LIBCURL_VERSION_NUM < 0x074400
    #error "curl_transfer requires libcurl 7.68.0 or newer"
#endif

/**
 * @brief CURLOPT_SSH_HOSTKEYFUNCTION (libcurl 7.84.0)
 *
 * Without it, transfer_handle::create() refuses SFTP/SCP requests that have
 * no known_hosts file, since nothing would check the server's key.
 */
#ifndef CURL_TRANS_HAS_SSH_HOSTKEY_FUNCTION
    #if LIBCURL_VERSION_NUM >= 0x075400
        #define CURL_TRANS_HAS_SSH_HOSTKEY_FUNCTION 1
    #else
        #define CURL_TRANS_HAS_SSH_HOSTKEY_FUNCTION 0
    #endif
#endif

//==============================================================================
// kcenon System Integrations
//==============================================================================

#ifndef KCENON_WITH_COMMON_SYSTEM
    #if defined(BUILD_WITH_COMMON_SYSTEM)
        #define KCENON_WITH_COMMON_SYSTEM 1
    #else
        #define KCENON_WITH_COMMON_SYSTEM 0
    #endif
#endif

#ifndef KCENON_WITH_LOGGER_SYSTEM
    #if defined(BUILD_WITH_LOGGER_SYSTEM)
        #define KCENON_WITH_LOGGER_SYSTEM 1
    #else
        #define KCENON_WITH_LOGGER_SYSTEM 0
    #endif
#endif

/**
 * @brief Route CT_LOG_* output through kcenon logger_system
 *
 * logger_system is built on common_system, so both must be enabled.
 * Otherwise records go to the registered callback or stderr.
 */
#ifndef CURL_TRANS_USE_LOGGER_SYSTEM
    #if KCENON_WITH_LOGGER_SYSTEM && KCENON_WITH_COMMON_SYSTEM
        #define CURL_TRANS_USE_LOGGER_SYSTEM 1
    #else
        #define CURL_TRANS_USE_LOGGER_SYSTEM 0
    #endif
#endif

#ifdef CURL_TRANS_PRINT_FEATURE_SUMMARY
    #pragma message("curl_transfer built against libcurl " LIBCURL_VERSION)
    #if CURL_TRANS_HAS_SSH_HOSTKEY_FUNCTION
        #pragma message("  ssh host key callback: yes")
    #else
        #pragma message("  ssh host key callback: no")
    #endif
    #if CURL_TRANS_USE_LOGGER_SYSTEM
        #pragma message("  logger_system: yes")
    #else
        #pragma message("  logger_system: no")
    #endif
#endif

// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file feature_flags.h
 * @brief Which kcenon systems this build of stage_transfer runs on
 *
 * CMake defines BUILD_WITH_<SYSTEM> for every system it found. This header
 * turns those into KCENON_WITH_<SYSTEM> values of 0 or 1 so sources can
 * test them with #if. A flag already defined by common_system's own
 * feature_flags.h wins.
 *
 * | Flag                             | Selects                               |
 * |----------------------------------|---------------------------------------|
 * | KCENON_WITH_THREAD_SYSTEM        | thread_system_transfer_adapter        |
 * | KCENON_WITH_NETWORK_SYSTEM       | cloud_http_client requests            |
 * | STAGE_TRANSFER_USE_LOGGER_SYSTEM | logger_system backend of the logger   |
 *
 * Payload features are plain CMake definitions tested with #ifdef:
 * STAGE_TRANS_ENABLE_ENCRYPTION (OpenSSL) and STAGE_TRANS_ENABLE_LZ4.
 */

#pragma once

#if __has_include(<kcenon/common/config/feature_flags.h>)
#include <kcenon/common/config/feature_flags.h>
#endif

#ifndef KCENON_WITH_COMMON_SYSTEM
#  ifdef BUILD_WITH_COMMON_SYSTEM
#    define KCENON_WITH_COMMON_SYSTEM 1
#  else
#    define KCENON_WITH_COMMON_SYSTEM 0
#  endif
#endif

#ifndef KCENON_WITH_THREAD_SYSTEM
#  ifdef BUILD_WITH_THREAD_SYSTEM
#    define KCENON_WITH_THREAD_SYSTEM 1
#  else
#    define KCENON_WITH_THREAD_SYSTEM 0
#  endif
#endif

#ifndef KCENON_WITH_LOGGER_SYSTEM
#  ifdef BUILD_WITH_LOGGER_SYSTEM
#    define KCENON_WITH_LOGGER_SYSTEM 1
#  else
#    define KCENON_WITH_LOGGER_SYSTEM 0
#  endif
#endif

#ifndef KCENON_WITH_NETWORK_SYSTEM
#  ifdef BUILD_WITH_NETWORK_SYSTEM
#    define KCENON_WITH_NETWORK_SYSTEM 1
#  else
#    define KCENON_WITH_NETWORK_SYSTEM 0
#  endif
#endif

// logger_system entries carry common_system types
#ifndef STAGE_TRANSFER_USE_LOGGER_SYSTEM
#  if KCENON_WITH_LOGGER_SYSTEM && KCENON_WITH_COMMON_SYSTEM
#    define STAGE_TRANSFER_USE_LOGGER_SYSTEM 1
#  else
#    define STAGE_TRANSFER_USE_LOGGER_SYSTEM 0
#  endif
#endif

// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file feature_flags.h
 * @brief Which kcenon systems this build of cloud_backup links against
 *
 * CMake passes BUILD_WITH_<SYSTEM> for every package it found. Each one maps
 * to KCENON_WITH_<SYSTEM> as 0 or 1, unless common_system already set it.
 *
 * | Flag                        | Off means                              |
 * |-----------------------------|----------------------------------------|
 * | KCENON_WITH_THREAD_SYSTEM   | worker loops run on std::async threads |
 * | KCENON_WITH_LOGGER_SYSTEM   | log records go to stderr               |
 * | KCENON_WITH_NETWORK_SYSTEM  | object store requests fail to connect  |
 */

#pragma once

#if __has_include(<kcenon/common/config/feature_flags.h>)
#include <kcenon/common/config/feature_flags.h>
#endif

#if !defined(KCENON_WITH_COMMON_SYSTEM) && defined(BUILD_WITH_COMMON_SYSTEM)
#define KCENON_WITH_COMMON_SYSTEM 1
#endif
#if !defined(KCENON_WITH_THREAD_SYSTEM) && defined(BUILD_WITH_THREAD_SYSTEM)
#define KCENON_WITH_THREAD_SYSTEM 1
#endif
#if !defined(KCENON_WITH_LOGGER_SYSTEM) && defined(BUILD_WITH_LOGGER_SYSTEM)
#define KCENON_WITH_LOGGER_SYSTEM 1
#endif
#if !defined(KCENON_WITH_NETWORK_SYSTEM) && defined(BUILD_WITH_NETWORK_SYSTEM)
#define KCENON_WITH_NETWORK_SYSTEM 1
#endif

// Anything still undefined was not built in
#ifndef KCENON_WITH_COMMON_SYSTEM
#define KCENON_WITH_COMMON_SYSTEM 0
#endif
#ifndef KCENON_WITH_THREAD_SYSTEM
#define KCENON_WITH_THREAD_SYSTEM 0
#endif
#ifndef KCENON_WITH_LOGGER_SYSTEM
#define KCENON_WITH_LOGGER_SYSTEM 0
#endif
#ifndef KCENON_WITH_NETWORK_SYSTEM
#define KCENON_WITH_NETWORK_SYSTEM 0
#endif

// logger_system reports through common_system result types
#ifndef CLOUD_BACKUP_USE_LOGGER_SYSTEM
#if KCENON_WITH_LOGGER_SYSTEM && KCENON_WITH_COMMON_SYSTEM
#define CLOUD_BACKUP_USE_LOGGER_SYSTEM 1
#else
#define CLOUD_BACKUP_USE_LOGGER_SYSTEM 0
#endif
#endif

// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file yamldiff_config.h
/// @brief Centralized compile-time configuration for yamldiff and its dependencies
///
/// This file pins the settings of the third-party libraries yamldiff builds on:
///   - immer: persistent containers backing the Node tree
///   - yaml-cpp: YAML parsing and emitting (no configuration needed)
///
/// It MUST be included before any immer header so that every translation unit
/// sees the same container layout. All yamldiff public headers include it first.
///
/// immer keeps its thread-safe defaults: independent `compare` calls may run
/// on separate threads, and any Node copied out of a result may be released
/// from a thread other than the one that built it.

#pragma once

// ============================================================
// Configuration Guard
// ============================================================

#if defined(IMMER_CONFIG_HPP_INCLUDED_) && !defined(YAMLDIFF_CONFIGURED)
#error "immer headers were included before yamldiff/yamldiff_config.h. " \
       "Please include yamldiff headers before any direct immer includes."
#endif

#define YAMLDIFF_CONFIGURED 1

// ============================================================
// Immer Settings
// ============================================================

/// @brief Atomic reference counting and locked free lists.
#ifndef IMMER_NO_THREAD_SAFETY
#define IMMER_NO_THREAD_SAFETY 0
#endif

#if IMMER_NO_THREAD_SAFETY
#error "yamldiff requires immer's thread-safe memory policy; " \
       "do not define IMMER_NO_THREAD_SAFETY=1."
#endif

/// @brief Disable tagged node assertions (smaller nodes, no runtime checks)
#ifndef IMMER_TAGGED_NODE
#define IMMER_TAGGED_NODE 0
#endif

#ifndef IMMER_DEBUG_TRACES
#define IMMER_DEBUG_TRACES 0
#endif

#ifndef IMMER_DEBUG_PRINT
#define IMMER_DEBUG_PRINT 0
#endif

#ifndef IMMER_DEBUG_STATS
#define IMMER_DEBUG_STATS 0
#endif

#ifndef IMMER_DEBUG_DEEP_CHECK
#define IMMER_DEBUG_DEEP_CHECK 0
#endif

#ifndef IMMER_ENABLE_DEBUG_SIZE_HEAP
#define IMMER_ENABLE_DEBUG_SIZE_HEAP 0
#endif

#ifndef IMMER_THROW_ON_INVALID_STATE
#define IMMER_THROW_ON_INVALID_STATE 0
#endif

// ============================================================
// Verbose Logging
//
// When YAMLDIFF_VERBOSE_LOG is 1:
//   - missed Node lookups, broken alias cycles and scalar fallbacks
//     are reported on stderr
//
// Defaults to enabled in debug builds and disabled with NDEBUG.
// ============================================================

#ifndef YAMLDIFF_VERBOSE_LOG
#  if defined(NDEBUG)
#    define YAMLDIFF_VERBOSE_LOG 0
#  else
#    define YAMLDIFF_VERBOSE_LOG 1
#  endif
#endif

#ifdef YAMLDIFF_CONFIG_VERBOSE
#pragma message("yamldiff: immer thread safety ENABLED")
#if YAMLDIFF_VERBOSE_LOG
#pragma message("yamldiff: verbose logging ENABLED")
#endif
#endif // YAMLDIFF_CONFIG_VERBOSE

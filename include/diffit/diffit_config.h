// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file diffit_config.h
/// @brief Centralized compile-time configuration for diffit and immer.
///
/// This file defines the compile-time configuration for diffit and the
/// immer containers backing its Value type. It MUST be included before any
/// immer header so every translation unit sees the same settings. All diffit
/// public headers include it first, so users who only include diffit headers
/// don't need to do anything special.
///
/// Settings:
///   - DIFFIT_THREAD_SAFE_VALUES: atomic refcounts for Value containers
///   - DIFFIT_VERBOSE_LOG: diagnostic logging to stderr
///
/// @warning Do NOT include immer headers directly before this file.

#pragma once

// ============================================================
// Configuration Guard
// ============================================================

#if defined(IMMER_CONFIG_HPP_INCLUDED_) && !defined(DIFFIT_CONFIGURED)
#error "immer headers were included before diffit/diffit_config.h. " \
       "Please include diffit headers before any direct immer includes."
#endif

#define DIFFIT_CONFIGURED 1

// ============================================================
// Value Memory Policy
// ============================================================

/// @brief Use immer's thread-safe memory policy for Value containers
///
/// diff() is reentrant and callers commonly diff snapshots that share
/// structure (the new value is usually derived from the old one) from
/// different threads. Atomic reference counts keep that sharing sound.
///
/// Set to 0 for single-threaded programs: non-atomic refcounts and a
/// lock-free heap, roughly 10-30% faster container operations.
#ifndef DIFFIT_THREAD_SAFE_VALUES
#define DIFFIT_THREAD_SAFE_VALUES 1
#endif

// ============================================================
// Immer Settings
// ============================================================

#ifndef IMMER_NO_THREAD_SAFETY
#  if DIFFIT_THREAD_SAFE_VALUES
#    define IMMER_NO_THREAD_SAFETY 0
#  else
#    define IMMER_NO_THREAD_SAFETY 1
#  endif
#endif

/// @brief Disable tagged node assertions (smaller nodes, no assertion overhead)
#ifndef IMMER_TAGGED_NODE
#define IMMER_TAGGED_NODE 0
#endif

#ifndef IMMER_DEBUG_TRACES
#define IMMER_DEBUG_TRACES 0
#endif

#ifndef IMMER_DEBUG_PRINT
#define IMMER_DEBUG_PRINT 0
#endif

#ifndef IMMER_DEBUG_DEEP_CHECK
#define IMMER_DEBUG_DEEP_CHECK 0
#endif

// ============================================================
// Verbose Logging
//
// When DIFFIT_VERBOSE_LOG is 1:
//   - array strategy fallbacks are logged with path and reason
//   - pointer-sharing diagnostics are echoed
//   - errors are logged at the point they are raised
//
// Disabled by default in release builds, enabled in debug builds.
// ============================================================

#ifndef DIFFIT_VERBOSE_LOG
#  if defined(NDEBUG)
#    define DIFFIT_VERBOSE_LOG 0
#  else
#    define DIFFIT_VERBOSE_LOG 1
#  endif
#endif

// ============================================================
// Configuration Summary (compile-time message)
// ============================================================

#ifdef DIFFIT_CONFIG_VERBOSE
#if DIFFIT_THREAD_SAFE_VALUES
#pragma message("diffit: Value containers use atomic refcounts")
#else
#pragma message("diffit: Value containers are single-threaded")
#endif

#if DIFFIT_VERBOSE_LOG
#pragma message("diffit: verbose logging ENABLED")
#endif
#endif

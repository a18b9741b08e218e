// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file config.h
/// @brief Centralized compile-time configuration for treepath
///
/// Every public treepath header includes this file first. Each setting can be
/// overridden by defining the macro before the first treepath include (or on
/// the compiler command line).

#pragma once

// ============================================================
// Diagnostics
// ============================================================

/// @brief Verbose diagnostic logging to stderr
///
/// When 1, the library reports aborted patches, swallowed resolution
/// failures in exists(), rejected patch document records and move
/// restoration through detail::log_* (see error.h).
///
/// Defaults to enabled in debug builds and disabled when NDEBUG is set.
#ifndef TREEPATH_VERBOSE_LOG
#  if defined(NDEBUG)
#    define TREEPATH_VERBOSE_LOG 0
#  else
#    define TREEPATH_VERBOSE_LOG 1
#  endif
#endif

// ============================================================
// Auto-vivification
// ============================================================

/// @brief Pad sequences with nulls when vivifying past their end
///
/// With the default (1), set({"list", 3}) on an empty "list" produces
/// [null, null, null, <value>]. With 0, an index greater than the current
/// size is reported as IndexOutOfBounds; index == size still appends.
#ifndef TREEPATH_PAD_ON_VIVIFY
#define TREEPATH_PAD_ON_VIVIFY 1
#endif

/// @brief Most nulls a single vivifying step may pad a sequence with
///
/// An index further past the end is reported as IndexOutOfBounds.
#ifndef TREEPATH_MAX_VIVIFY_PAD
#define TREEPATH_MAX_VIVIFY_PAD 65536
#endif

// ============================================================
// Configuration Summary (compile-time message)
// ============================================================

#ifdef TREEPATH_CONFIG_VERBOSE
#if TREEPATH_VERBOSE_LOG
#pragma message("treepath: verbose logging ENABLED")
#else
#pragma message("treepath: verbose logging DISABLED")
#endif

#if TREEPATH_PAD_ON_VIVIFY
#pragma message("treepath: sequence padding on vivify ENABLED")
#else
#pragma message("treepath: sequence padding on vivify DISABLED")
#endif
#endif // TREEPATH_CONFIG_VERBOSE

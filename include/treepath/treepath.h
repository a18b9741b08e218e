// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file treepath.h
/// @brief Umbrella header: path navigation and structural editing of Value trees.
///
/// | Header       | Provides                                          |
/// |--------------|---------------------------------------------------|
/// | value.h      | Value, ValueMap, ValueVector                      |
/// | builders.h   | MapBuilder, VectorBuilder                         |
/// | path.h       | PathElement, FromEnd, Path, pointer text          |
/// | error.h      | ErrorCode, PathError                              |
/// | resolver.h   | at(), in(), try_at()                              |
/// | access.h     | exists(), get(), get_key(), get_pair(), set()     |
/// | editor.h     | add(), remove(), replace(), move(), copy(), transform() |
/// | patch.h      | Operation, patch(), PatchError, document codec    |
/// | diff.h       | diff(), DiffCollector                             |
/// | traverse.h   | list(), flatten()                                 |

#pragma once

#include <treepath/config.h>
#include <treepath/api.h>
#include <treepath/value.h>
#include <treepath/builders.h>
#include <treepath/path.h>
#include <treepath/error.h>
#include <treepath/resolver.h>
#include <treepath/access.h>
#include <treepath/editor.h>
#include <treepath/patch.h>
#include <treepath/diff.h>
#include <treepath/traverse.h>

// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file record_delta.h
/// @brief Convenience header: record description, Delta, diff, merge, copy,
///        Schema Model and change listing.
///
/// lager integration is not included; use record_delta/lager_adapters.h.

#pragma once

#include <record_delta/record_delta_config.h>
#include <record_delta/api.h>
#include <record_delta/change_list.h>
#include <record_delta/concepts.h>
#include <record_delta/copy.h>
#include <record_delta/delta.h>
#include <record_delta/diff.h>
#include <record_delta/merge.h>
#include <record_delta/record.h>
#include <record_delta/schema.h>

/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <string>

namespace filesinks {

// One serialized record. Its layout is described by the schema stored in the
// container header and is opaque to the sink.
using record = std::string;

} // namespace filesinks

#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/core/engine.hpp"
#include "internal/db/api/repository.hpp"

namespace trailwatch::factory {

/*
  Composition root. The ONLY place that knows concrete DB types.
*/

// Opens the SQLite store named in config, creating its directory and
// bootstrapping the schema. read_only opens a query-only connection and
// skips bootstrap. Throws util::StoreUnavailable on failure.
std::shared_ptr<db::Repository> BuildRepository(const trailwatch::runtime::config::RuntimeConfig& config, bool read_only = false);

core::Engine::Options EngineOptions(const trailwatch::runtime::config::RuntimeConfig& config);

// Full daemon graph on the system clock.
std::unique_ptr<core::Engine> Build(const trailwatch::runtime::config::RuntimeConfig& config);

} // namespace trailwatch::factory

#pragma once

#include "sqlite_db.hpp"

namespace trailwatch::db::sqlite {

/*
  Creates tables, indexes and triggers if missing, then checks every
  table with a trivial select so a schema from an incompatible build
  fails at startup instead of on the first write.

  Event type seeding is NOT done here; it goes through the repository so
  the conflict rule lives in one place.
*/
void BootstrapSchema(SqliteDB& db);

} // namespace trailwatch::db::sqlite

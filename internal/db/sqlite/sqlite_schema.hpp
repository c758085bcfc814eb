#pragma once

#include "sqlite_db.hpp"

namespace buildq::db::sqlite {

// Creates the services/builds/deployments tables if missing. Idempotent.
void BootstrapSchema(SqliteDB& db);

} // namespace buildq::db::sqlite

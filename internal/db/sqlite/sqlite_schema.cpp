#include "sqlite_schema.hpp"

#include <string>
#include <vector>

namespace buildq::db::sqlite {

void BootstrapSchema(SqliteDB& db) {
  static const std::vector<std::string> kBootstrapSql = {
      "CREATE TABLE IF NOT EXISTS services (id INTEGER PRIMARY KEY AUTOINCREMENT, project_id INTEGER NOT NULL, name TEXT NOT NULL, image TEXT NOT NULL DEFAULT '', created_at_ms INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS builds (id INTEGER PRIMARY KEY AUTOINCREMENT, project_id INTEGER NOT NULL, service_id INTEGER NOT NULL REFERENCES services(id) ON DELETE CASCADE, git_url TEXT NOT NULL, git_ref TEXT NOT NULL, commit_sha TEXT NOT NULL DEFAULT '', context_path TEXT NOT NULL, dockerfile TEXT NOT NULL, image_tag TEXT NOT NULL, status TEXT NOT NULL, log_path TEXT NOT NULL DEFAULT '', triggered_by TEXT NOT NULL DEFAULT '', started_at_ms INTEGER NOT NULL DEFAULT 0, finished_at_ms INTEGER NOT NULL DEFAULT 0, created_at_ms INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS idx_builds_service ON builds(service_id, id);",
      "CREATE TABLE IF NOT EXISTS deployments (id INTEGER PRIMARY KEY AUTOINCREMENT, project_id INTEGER NOT NULL, service_id INTEGER NOT NULL REFERENCES services(id) ON DELETE CASCADE, image_tag TEXT NOT NULL, status TEXT NOT NULL, reason TEXT NOT NULL DEFAULT '', created_at_ms INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS idx_deployments_service ON deployments(service_id, id);"};

  for (const auto& sql : kBootstrapSql) {
    db.Exec(sql);
  }

  // Fail fast on a database created by an incompatible layout.
  db.Exec("SELECT id,project_id,name,image,created_at_ms FROM services LIMIT 1;");
  db.Exec("SELECT id,service_id,status,log_path,started_at_ms,finished_at_ms FROM builds LIMIT 1;");
  db.Exec("SELECT id,service_id,image_tag,status,reason FROM deployments LIMIT 1;");
}

} // namespace buildq::db::sqlite

#pragma once

#include <memory>
#include <mutex>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"

namespace buildq::db::sqlite {

/*
  SQLite-backed repository.

  Every operation runs under op_mutex_ so last_insert_rowid() and the
  statement it follows stay paired when several workers write at once.
*/
class SqliteRepository final : public db::Repository {
 public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  Result                            CreateBuild(model::BuildRecord& record) override;
  std::optional<model::BuildRecord> GetBuild(uint64_t id) override;
  std::vector<model::BuildRecord>   ListBuilds(uint64_t service_id) override;
  Result UpdateBuildStatus(uint64_t id, model::BuildStatus status, const std::optional<std::string>& log_path,
                           std::optional<uint64_t> started_at_ms, std::optional<uint64_t> finished_at_ms) override;

  Result                              CreateService(model::ServiceRecord& record) override;
  std::optional<model::ServiceRecord> GetService(uint64_t id) override;
  Result                              UpdateService(uint64_t id, const ServiceUpdate& update) override;

  Result                                 CreateDeployment(model::DeploymentRecord& record) override;
  std::optional<model::DeploymentRecord> GetDeployment(uint64_t id) override;
  std::vector<model::DeploymentRecord>   ListDeployments(uint64_t service_id) override;
  Result UpdateDeploymentStatus(uint64_t id, model::DeploymentStatus status, const std::optional<std::string>& reason) override;

 private:
  std::shared_ptr<SqliteDB> db_;
  std::mutex                op_mutex_;

  static Result Translate(sqlite3* db, int rc);
};

} // namespace buildq::db::sqlite

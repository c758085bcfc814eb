#pragma once

#include <map>
#include <mutex>

#include "internal/db/api/repository.hpp"

namespace buildq::db::memory {

/*
  Process-local repository used by tests and `database: { memory: {} }`.
  Ids are assigned from per-table counters starting at 1.
*/
class MemoryRepository final : public db::Repository {
 public:
  MemoryRepository();

  Result                             CreateBuild(model::BuildRecord& record) override;
  std::optional<model::BuildRecord>  GetBuild(uint64_t id) override;
  std::vector<model::BuildRecord>    ListBuilds(uint64_t service_id) override;
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
  struct State {
    std::map<uint64_t, model::ServiceRecord>    services;
    std::map<uint64_t, model::BuildRecord>      builds;
    std::map<uint64_t, model::DeploymentRecord> deployments;

    uint64_t next_service_id    = 1;
    uint64_t next_build_id      = 1;
    uint64_t next_deployment_id = 1;
  };

  std::mutex mutex_;
  State      state_;
};

} // namespace buildq::db::memory

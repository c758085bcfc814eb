#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/model/build_record.hpp"
#include "internal/db/model/deployment_record.hpp"
#include "internal/db/model/service_record.hpp"

namespace buildq::db {

// Partial service update; unset fields are left untouched.
struct ServiceUpdate {
  std::optional<std::string> name;
  std::optional<std::string> image;
};

/*
  Build persistence.

  Create* assigns id and created_at_ms on the passed record when they are 0.
  Reads return nullopt (or an empty list) when nothing matches and throw
  util::IoError when the backing store itself fails; the same holds for
  DeployStore.
*/
class BuildStore {
 public:
  virtual ~BuildStore() = default;

  virtual Result CreateBuild(model::BuildRecord& record) = 0;

  virtual std::optional<model::BuildRecord> GetBuild(uint64_t id) = 0;

  // Newest first.
  virtual std::vector<model::BuildRecord> ListBuilds(uint64_t service_id) = 0;

  // Unset optionals keep the stored value.
  virtual Result UpdateBuildStatus(uint64_t id, model::BuildStatus status, const std::optional<std::string>& log_path,
                                   std::optional<uint64_t> started_at_ms, std::optional<uint64_t> finished_at_ms) = 0;
};

/*
  Service and deployment persistence.
*/
class DeployStore {
 public:
  virtual ~DeployStore() = default;

  // ---------------------------------------------------------------------
  // Services
  // ---------------------------------------------------------------------

  virtual Result CreateService(model::ServiceRecord& record) = 0;

  virtual std::optional<model::ServiceRecord> GetService(uint64_t id) = 0;

  virtual Result UpdateService(uint64_t id, const ServiceUpdate& update) = 0;

  // ---------------------------------------------------------------------
  // Deployments
  // ---------------------------------------------------------------------

  virtual Result CreateDeployment(model::DeploymentRecord& record) = 0;

  virtual std::optional<model::DeploymentRecord> GetDeployment(uint64_t id) = 0;

  // Newest first.
  virtual std::vector<model::DeploymentRecord> ListDeployments(uint64_t service_id) = 0;

  virtual Result UpdateDeploymentStatus(uint64_t id, model::DeploymentStatus status, const std::optional<std::string>& reason) = 0;
};

/*
  Repository abstraction.

  The store is the source of truth for builds, services and deployments.
  Job state is not persisted here; it lives in the queue.

  Implementations must be safe to call from several worker threads.
*/
class Repository : public BuildStore, public DeployStore {
 public:
  ~Repository() override = default;
};

} // namespace buildq::db

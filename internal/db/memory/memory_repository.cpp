#include "memory_repository.hpp"

#include <algorithm>

#include "internal/util/time.hpp"

namespace buildq::db::memory {

namespace {

uint64_t NowMs() {
  return static_cast<uint64_t>(util::ToUnixMillis(util::Now()));
}

// Claims an id for a new row. A caller-chosen id bumps the counter past it.
template <typename Map>
Result AssignId(Map& table, uint64_t& next_id, uint64_t& id) {
  if (id == 0) {
    id = next_id++;
  } else if (table.contains(id)) {
    return Result::Err(ErrorCode::AlreadyExists, "id " + std::to_string(id));
  } else {
    next_id = std::max(next_id, id + 1);
  }
  return Result::Ok();
}

// std::map iterates ascending; ids grow with creation time.
template <typename Record, typename Map>
std::vector<Record> NewestFirst(const Map& table, uint64_t service_id) {
  std::vector<Record> out;
  for (auto it = table.rbegin(); it != table.rend(); ++it) {
    if (it->second.service_id == service_id) out.push_back(it->second);
  }
  return out;
}

} // namespace

MemoryRepository::MemoryRepository() = default;

// ------------------------------------------------------------------
// Builds
// ------------------------------------------------------------------

Result MemoryRepository::CreateBuild(model::BuildRecord& record) {
  std::lock_guard lock(mutex_);
  if (auto r = AssignId(state_.builds, state_.next_build_id, record.id); !r) return r;
  if (record.created_at_ms == 0) record.created_at_ms = NowMs();
  state_.builds[record.id] = record;
  return Result::Ok();
}

std::optional<model::BuildRecord> MemoryRepository::GetBuild(uint64_t id) {
  std::lock_guard lock(mutex_);
  auto            it = state_.builds.find(id);
  if (it == state_.builds.end()) return std::nullopt;
  return it->second;
}

std::vector<model::BuildRecord> MemoryRepository::ListBuilds(uint64_t service_id) {
  std::lock_guard lock(mutex_);
  return NewestFirst<model::BuildRecord>(state_.builds, service_id);
}

Result MemoryRepository::UpdateBuildStatus(uint64_t id, model::BuildStatus status, const std::optional<std::string>& log_path,
                                           std::optional<uint64_t> started_at_ms, std::optional<uint64_t> finished_at_ms) {
  std::lock_guard lock(mutex_);
  auto            it = state_.builds.find(id);
  if (it == state_.builds.end()) return Result::Err(ErrorCode::NotFound, "build " + std::to_string(id));

  auto& b  = it->second;
  b.status = status;
  if (log_path) b.log_path = *log_path;
  if (started_at_ms) b.started_at_ms = *started_at_ms;
  if (finished_at_ms) b.finished_at_ms = *finished_at_ms;
  return Result::Ok();
}

// ------------------------------------------------------------------
// Services
// ------------------------------------------------------------------

Result MemoryRepository::CreateService(model::ServiceRecord& record) {
  std::lock_guard lock(mutex_);
  if (auto r = AssignId(state_.services, state_.next_service_id, record.id); !r) return r;
  if (record.created_at_ms == 0) record.created_at_ms = NowMs();
  state_.services[record.id] = record;
  return Result::Ok();
}

std::optional<model::ServiceRecord> MemoryRepository::GetService(uint64_t id) {
  std::lock_guard lock(mutex_);
  auto            it = state_.services.find(id);
  if (it == state_.services.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::UpdateService(uint64_t id, const ServiceUpdate& update) {
  std::lock_guard lock(mutex_);
  auto            it = state_.services.find(id);
  if (it == state_.services.end()) return Result::Err(ErrorCode::NotFound, "service " + std::to_string(id));

  if (update.name) it->second.name = *update.name;
  if (update.image) it->second.image = *update.image;
  return Result::Ok();
}

// ------------------------------------------------------------------
// Deployments
// ------------------------------------------------------------------

Result MemoryRepository::CreateDeployment(model::DeploymentRecord& record) {
  std::lock_guard lock(mutex_);
  if (auto r = AssignId(state_.deployments, state_.next_deployment_id, record.id); !r) return r;
  if (record.created_at_ms == 0) record.created_at_ms = NowMs();
  state_.deployments[record.id] = record;
  return Result::Ok();
}

std::optional<model::DeploymentRecord> MemoryRepository::GetDeployment(uint64_t id) {
  std::lock_guard lock(mutex_);
  auto            it = state_.deployments.find(id);
  if (it == state_.deployments.end()) return std::nullopt;
  return it->second;
}

std::vector<model::DeploymentRecord> MemoryRepository::ListDeployments(uint64_t service_id) {
  std::lock_guard lock(mutex_);
  return NewestFirst<model::DeploymentRecord>(state_.deployments, service_id);
}

Result MemoryRepository::UpdateDeploymentStatus(uint64_t id, model::DeploymentStatus status, const std::optional<std::string>& reason) {
  std::lock_guard lock(mutex_);
  auto            it = state_.deployments.find(id);
  if (it == state_.deployments.end()) return Result::Err(ErrorCode::NotFound, "deployment " + std::to_string(id));

  it->second.status = status;
  if (reason) it->second.reason = *reason;
  return Result::Ok();
}

} // namespace buildq::db::memory

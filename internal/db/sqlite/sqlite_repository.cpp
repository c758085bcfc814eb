#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace buildq::db::sqlite {

using buildq::db::ErrorCode;
using buildq::db::Result;

namespace {

// Owns one prepared statement for the duration of a call.
class Statement {
 public:
  Statement(sqlite3* db, const char* sql) {
    if (sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr) != SQLITE_OK) {
      stmt_ = nullptr;
    }
  }
  ~Statement() {
    if (stmt_) sqlite3_finalize(stmt_);
  }

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  sqlite3_stmt* get() const {
    return stmt_;
  }
  explicit operator bool() const {
    return stmt_ != nullptr;
  }

 private:
  sqlite3_stmt* stmt_ = nullptr;
};

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindOptText(sqlite3_stmt* st, int idx, const std::optional<std::string>& s) {
  if (s) {
    BindText(st, idx, *s);
  } else {
    sqlite3_bind_null(st, idx);
  }
}

void BindOptU64(sqlite3_stmt* st, int idx, std::optional<uint64_t> v) {
  if (v) {
    BindU64(st, idx, *v);
  } else {
    sqlite3_bind_null(st, idx);
  }
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

[[noreturn]] void ThrowReadError(sqlite3* db, const char* table) {
  throw util::IoError(std::string("sqlite read from ") + table + " failed: " + sqlite3_errmsg(db));
}

// SQLITE_ROW -> true, SQLITE_DONE -> false, anything else throws.
bool StepRow(sqlite3* db, sqlite3_stmt* st, const char* table) {
  const int rc = sqlite3_step(st);
  if (rc == SQLITE_ROW) return true;
  if (rc == SQLITE_DONE) return false;
  ThrowReadError(db, table);
}

uint64_t NowMs() {
  return static_cast<uint64_t>(util::ToUnixMillis(util::Now()));
}

constexpr const char* kBuildColumns =
    "id,project_id,service_id,git_url,git_ref,commit_sha,context_path,dockerfile,image_tag,status,log_path,triggered_by,started_at_ms,finished_at_ms,created_at_ms";

model::BuildRecord ReadBuild(sqlite3_stmt* st) {
  model::BuildRecord r;
  r.id             = ColU64(st, 0);
  r.project_id     = ColU64(st, 1);
  r.service_id     = ColU64(st, 2);
  r.git_url        = ColText(st, 3);
  r.git_ref        = ColText(st, 4);
  r.commit_sha     = ColText(st, 5);
  r.context_path   = ColText(st, 6);
  r.dockerfile     = ColText(st, 7);
  r.image_tag      = ColText(st, 8);
  r.status         = model::ParseBuildStatus(ColText(st, 9)).value_or(model::BuildStatus::kFailed);
  r.log_path       = ColText(st, 10);
  r.triggered_by   = ColText(st, 11);
  r.started_at_ms  = ColU64(st, 12);
  r.finished_at_ms = ColU64(st, 13);
  r.created_at_ms  = ColU64(st, 14);
  return r;
}

model::DeploymentRecord ReadDeployment(sqlite3_stmt* st) {
  model::DeploymentRecord r;
  r.id            = ColU64(st, 0);
  r.project_id    = ColU64(st, 1);
  r.service_id    = ColU64(st, 2);
  r.image_tag     = ColText(st, 3);
  r.status        = model::ParseDeploymentStatus(ColText(st, 4)).value_or(model::DeploymentStatus::kFailed);
  r.reason        = ColText(st, 5);
  r.created_at_ms = ColU64(st, 6);
  return r;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Builds
// ------------------------------------------------------------------

Result SqliteRepository::CreateBuild(model::BuildRecord& r) {
  std::lock_guard lock(op_mutex_);
  auto*           db = db_->Handle();

  const char* sql =
      "INSERT INTO builds(project_id,service_id,git_url,git_ref,commit_sha,context_path,dockerfile,image_tag,status,log_path,triggered_by,"
      "started_at_ms,finished_at_ms,created_at_ms) VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?);";

  Statement st(db, sql);
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  const uint64_t created = r.created_at_ms != 0 ? r.created_at_ms : NowMs();

  BindU64(st.get(), 1, r.project_id);
  BindU64(st.get(), 2, r.service_id);
  BindText(st.get(), 3, r.git_url);
  BindText(st.get(), 4, r.git_ref);
  BindText(st.get(), 5, r.commit_sha);
  BindText(st.get(), 6, r.context_path);
  BindText(st.get(), 7, r.dockerfile);
  BindText(st.get(), 8, r.image_tag);
  BindText(st.get(), 9, std::string(model::ToString(r.status)));
  BindText(st.get(), 10, r.log_path);
  BindText(st.get(), 11, r.triggered_by);
  BindU64(st.get(), 12, r.started_at_ms);
  BindU64(st.get(), 13, r.finished_at_ms);
  BindU64(st.get(), 14, created);

  auto result = Translate(db, sqlite3_step(st.get()));
  if (!result) return result;

  r.id            = static_cast<uint64_t>(sqlite3_last_insert_rowid(db));
  r.created_at_ms = created;
  return Result::Ok();
}

std::optional<model::BuildRecord> SqliteRepository::GetBuild(uint64_t id) {
  std::lock_guard lock(op_mutex_);
  auto*           db = db_->Handle();

  const std::string sql = std::string("SELECT ") + kBuildColumns + " FROM builds WHERE id=?;";
  Statement         st(db, sql.c_str());
  if (!st) ThrowReadError(db, "builds");

  BindU64(st.get(), 1, id);
  if (!StepRow(db, st.get(), "builds")) return std::nullopt;
  return ReadBuild(st.get());
}

std::vector<model::BuildRecord> SqliteRepository::ListBuilds(uint64_t service_id) {
  std::lock_guard lock(op_mutex_);
  auto*           db = db_->Handle();

  std::vector<model::BuildRecord> out;
  const std::string sql = std::string("SELECT ") + kBuildColumns + " FROM builds WHERE service_id=? ORDER BY id DESC;";
  Statement         st(db, sql.c_str());
  if (!st) ThrowReadError(db, "builds");

  BindU64(st.get(), 1, service_id);
  while (StepRow(db, st.get(), "builds")) {
    out.push_back(ReadBuild(st.get()));
  }
  return out;
}

Result SqliteRepository::UpdateBuildStatus(uint64_t id, model::BuildStatus status, const std::optional<std::string>& log_path,
                                           std::optional<uint64_t> started_at_ms, std::optional<uint64_t> finished_at_ms) {
  std::lock_guard lock(op_mutex_);
  auto*           db = db_->Handle();

  const char* sql =
      "UPDATE builds SET status=?, log_path=COALESCE(?,log_path), started_at_ms=COALESCE(?,started_at_ms), "
      "finished_at_ms=COALESCE(?,finished_at_ms) WHERE id=?;";

  Statement st(db, sql);
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, std::string(model::ToString(status)));
  BindOptText(st.get(), 2, log_path);
  BindOptU64(st.get(), 3, started_at_ms);
  BindOptU64(st.get(), 4, finished_at_ms);
  BindU64(st.get(), 5, id);

  auto result = Translate(db, sqlite3_step(st.get()));
  if (!result) return result;
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "build " + std::to_string(id));
  return Result::Ok();
}

// ------------------------------------------------------------------
// Services
// ------------------------------------------------------------------

Result SqliteRepository::CreateService(model::ServiceRecord& r) {
  std::lock_guard lock(op_mutex_);
  auto*           db = db_->Handle();

  Statement st(db, "INSERT INTO services(project_id,name,image,created_at_ms) VALUES(?,?,?,?);");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  const uint64_t created = r.created_at_ms != 0 ? r.created_at_ms : NowMs();
  BindU64(st.get(), 1, r.project_id);
  BindText(st.get(), 2, r.name);
  BindText(st.get(), 3, r.image);
  BindU64(st.get(), 4, created);

  auto result = Translate(db, sqlite3_step(st.get()));
  if (!result) return result;

  r.id            = static_cast<uint64_t>(sqlite3_last_insert_rowid(db));
  r.created_at_ms = created;
  return Result::Ok();
}

std::optional<model::ServiceRecord> SqliteRepository::GetService(uint64_t id) {
  std::lock_guard lock(op_mutex_);
  auto*           db = db_->Handle();

  Statement st(db, "SELECT id,project_id,name,image,created_at_ms FROM services WHERE id=?;");
  if (!st) ThrowReadError(db, "services");

  BindU64(st.get(), 1, id);
  if (!StepRow(db, st.get(), "services")) return std::nullopt;

  model::ServiceRecord r;
  r.id            = ColU64(st.get(), 0);
  r.project_id    = ColU64(st.get(), 1);
  r.name          = ColText(st.get(), 2);
  r.image         = ColText(st.get(), 3);
  r.created_at_ms = ColU64(st.get(), 4);
  return r;
}

Result SqliteRepository::UpdateService(uint64_t id, const ServiceUpdate& update) {
  std::lock_guard lock(op_mutex_);
  auto*           db = db_->Handle();

  Statement st(db, "UPDATE services SET name=COALESCE(?,name), image=COALESCE(?,image) WHERE id=?;");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindOptText(st.get(), 1, update.name);
  BindOptText(st.get(), 2, update.image);
  BindU64(st.get(), 3, id);

  auto result = Translate(db, sqlite3_step(st.get()));
  if (!result) return result;
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "service " + std::to_string(id));
  return Result::Ok();
}

// ------------------------------------------------------------------
// Deployments
// ------------------------------------------------------------------

Result SqliteRepository::CreateDeployment(model::DeploymentRecord& r) {
  std::lock_guard lock(op_mutex_);
  auto*           db = db_->Handle();

  Statement st(db, "INSERT INTO deployments(project_id,service_id,image_tag,status,reason,created_at_ms) VALUES(?,?,?,?,?,?);");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  const uint64_t created = r.created_at_ms != 0 ? r.created_at_ms : NowMs();
  BindU64(st.get(), 1, r.project_id);
  BindU64(st.get(), 2, r.service_id);
  BindText(st.get(), 3, r.image_tag);
  BindText(st.get(), 4, std::string(model::ToString(r.status)));
  BindText(st.get(), 5, r.reason);
  BindU64(st.get(), 6, created);

  auto result = Translate(db, sqlite3_step(st.get()));
  if (!result) return result;

  r.id            = static_cast<uint64_t>(sqlite3_last_insert_rowid(db));
  r.created_at_ms = created;
  return Result::Ok();
}

std::optional<model::DeploymentRecord> SqliteRepository::GetDeployment(uint64_t id) {
  std::lock_guard lock(op_mutex_);
  auto*           db = db_->Handle();

  Statement st(db, "SELECT id,project_id,service_id,image_tag,status,reason,created_at_ms FROM deployments WHERE id=?;");
  if (!st) ThrowReadError(db, "deployments");

  BindU64(st.get(), 1, id);
  if (!StepRow(db, st.get(), "deployments")) return std::nullopt;
  return ReadDeployment(st.get());
}

std::vector<model::DeploymentRecord> SqliteRepository::ListDeployments(uint64_t service_id) {
  std::lock_guard lock(op_mutex_);
  auto*           db = db_->Handle();

  std::vector<model::DeploymentRecord> out;
  Statement st(db, "SELECT id,project_id,service_id,image_tag,status,reason,created_at_ms FROM deployments WHERE service_id=? ORDER BY id DESC;");
  if (!st) ThrowReadError(db, "deployments");

  BindU64(st.get(), 1, service_id);
  while (StepRow(db, st.get(), "deployments")) {
    out.push_back(ReadDeployment(st.get()));
  }
  return out;
}

Result SqliteRepository::UpdateDeploymentStatus(uint64_t id, model::DeploymentStatus status, const std::optional<std::string>& reason) {
  std::lock_guard lock(op_mutex_);
  auto*           db = db_->Handle();

  Statement st(db, "UPDATE deployments SET status=?, reason=COALESCE(?,reason) WHERE id=?;");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, std::string(model::ToString(status)));
  BindOptText(st.get(), 2, reason);
  BindU64(st.get(), 3, id);

  auto result = Translate(db, sqlite3_step(st.get()));
  if (!result) return result;
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "deployment " + std::to_string(id));
  return Result::Ok();
}

} // namespace buildq::db::sqlite

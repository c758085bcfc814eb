#pragma once

#include <sqlite3.h>

#include <string>

namespace buildq::db::sqlite {

/*
  Thin RAII wrapper around sqlite3*.

  Opened in serialized (FULLMUTEX) mode; a single handle is shared by the
  repository across worker threads.
*/
class SqliteDB {
 public:
  // ":memory:" gives a private in-memory database.
  explicit SqliteDB(std::string path);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  // Execute a SQL string (used for pragmas and schema bootstrap)
  void Exec(const std::string& sql);

 private:
  void Configure();

  sqlite3*    db_ = nullptr;
  std::string path_;
};

} // namespace buildq::db::sqlite

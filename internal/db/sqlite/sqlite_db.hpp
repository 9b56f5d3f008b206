#pragma once

#include <sqlite3.h>

#include <memory>
#include <mutex>
#include <string>

namespace beacon::db::sqlite {

/*
  Thin RAII wrapper around one sqlite3* connection.

  The connection is shared by every transaction; TxMutex() serializes
  transactions so BEGIN/COMMIT pairs from different threads never interleave.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, int busy_timeout_ms = 5000);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  std::mutex& TxMutex() {
    return tx_mutex_;
  }

  // Execute a SQL string (used for pragmas/schema)
  void Exec(const std::string& sql);

  // Configure recommended PRAGMAs (WAL, foreign keys, etc.)
  void Configure(int busy_timeout_ms);

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
  std::mutex  tx_mutex_;
};

} // namespace beacon::db::sqlite

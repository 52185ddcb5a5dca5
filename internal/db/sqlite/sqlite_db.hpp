#pragma once

#include <sqlite3.h>

#include <mutex>
#include <string>

namespace sealer::db::sqlite {

/*
  Thin RAII wrapper around a single sqlite3* connection.

  The connection is shared by every transaction, so transactions take
  TxMutex() for their whole lifetime; SQLite cannot nest BEGIN on one
  connection.
*/
class SqliteDB {
 public:
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

  std::mutex& TxMutex() {
    return tx_mutex_;
  }

  // Execute a SQL string (used for pragmas/migrations)
  void Exec(const std::string& sql);

  // Configure recommended PRAGMAs (WAL, busy timeout)
  void Configure();

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
  std::mutex  tx_mutex_;
};

// Creates the ledger table, its uniqueness indexes and append-only triggers.
void BootstrapSchema(SqliteDB& db);

} // namespace sealer::db::sqlite

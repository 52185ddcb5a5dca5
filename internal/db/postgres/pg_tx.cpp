#include "pg_tx.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace sealer::db::postgres {

PgTransaction::PgTransaction(std::shared_ptr<PgPool> pool)
{
  conn_ = pool->Acquire();
  tx_ = std::make_unique<pqxx::work>(*conn_);
}

PgTransaction::~PgTransaction() {
  if (!finished_) {
    try {
      tx_->abort();
    } catch (const std::exception& e) {
      SEALER_LOG_WARN("postgres rollback failed", {observability::StringField("error", e.what())});
    }
  }
  // Drop the transaction before the connection goes back to the pool.
  tx_.reset();
}

void PgTransaction::Commit() {
  try {
    tx_->commit();
  } catch (const pqxx::serialization_failure& e) {
    finished_ = true;
    throw util::Conflict(e.what());
  }
  finished_ = true;
}

void PgTransaction::Rollback() {
  tx_->abort();
  finished_ = true;
}

}

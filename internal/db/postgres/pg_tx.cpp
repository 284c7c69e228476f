#include "pg_tx.hpp"

#include "internal/observability/logging.hpp"

namespace mediacache::db::postgres {

PgTransaction::PgTransaction(std::shared_ptr<PgPool> pool) {
  conn_ = pool->Acquire();
  tx_   = std::make_unique<pqxx::work>(*conn_);
}

PgTransaction::~PgTransaction() {
  if (!finished_) {
    try {
      tx_->abort();
    } catch (const std::exception& e) {
      MEDIACACHE_LOG_WARN("Postgres rollback failed", {observability::StringField("error", e.what())});
    }
  }
  tx_.reset();
}

void PgTransaction::Commit() {
  tx_->commit();
  finished_ = true;
}

void PgTransaction::Rollback() {
  tx_->abort();
  finished_ = true;
}

}

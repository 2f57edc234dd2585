#include "engine/account_service.hpp"
#include "domain/errors.hpp"
#include "observability/logger.hpp"
#include "observability/metrics.hpp"

#include <optional>
#include <unordered_set>

namespace ledger {
namespace engine {

AccountService::AccountService(std::shared_ptr<storage::AccountStore> account_store,
                               std::shared_ptr<storage::Coordinator> coordinator)
    : account_store_(std::move(account_store)), coordinator_(std::move(coordinator)) {}

Account AccountService::CreateAccount(bool can_overdraft) {
  Account account(Uuid::generateV7(), can_overdraft);

  coordinator_->runAtomic([&](storage::Session& session) {
    account_store_->save(session, account);
  });

  observability::getGlobalMetrics().incrementCounter(observability::metric::kAccountsCreated);
  LOG_BUILDER(observability::LogLevel::INFO, "Account created")
      .field("account_id", account.id().toString())
      .field("can_overdraft", account.canOverdraft());
  return account;
}

Account AccountService::GetAccount(const Uuid& id) {
  std::optional<Account> account;
  coordinator_->runAtomic([&](storage::Session& session) {
    account = account_store_->findById(session, id);
  });

  if (!account) {
    throw LedgerError(ErrorCode::AccountNotFound, "account " + id.toString() + " not found");
  }
  return *account;
}

std::vector<Account> AccountService::GetAccounts(const std::vector<Uuid>& ids) {
  std::vector<Uuid> unique_ids;
  std::unordered_set<Uuid> seen;
  for (const auto& id : ids) {
    if (seen.insert(id).second) {
      unique_ids.push_back(id);
    }
  }

  std::vector<Account> accounts;
  if (unique_ids.empty()) {
    return accounts;
  }

  coordinator_->runAtomic([&](storage::Session& session) {
    accounts = account_store_->findByIds(session, unique_ids);
  });
  return accounts;
}

}  // namespace engine
}  // namespace ledger

#ifndef ACCOUNT_STORE_HPP_
#define ACCOUNT_STORE_HPP_

#include "domain/account.hpp"
#include "storage/session.hpp"

#include <optional>
#include <vector>

namespace ledger {
namespace storage {

/**
 * Persistence for accounts.
 */
class AccountStore {
 public:
  virtual ~AccountStore() = default;

  /**
   * Inserts the account or overwrites its balance.
   */
  virtual void save(Session& session, const Account& account) = 0;

  virtual std::optional<Account> findById(Session& session, const Uuid& id) = 0;

  /**
   * Like findById, but takes an exclusive row lock held until the session ends.
   * Throws LockTimeout if the row stays locked past the coordinator's lock timeout.
   */
  virtual std::optional<Account> findByIdForUpdate(Session& session, const Uuid& id) = 0;

  /**
   * Batch lookup. Missing ids are skipped; the result follows the order of `ids`.
   */
  virtual std::vector<Account> findByIds(Session& session, const std::vector<Uuid>& ids) = 0;
};

}  // namespace storage
}  // namespace ledger

#endif  // ACCOUNT_STORE_HPP_

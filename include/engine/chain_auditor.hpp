#ifndef CHAIN_AUDITOR_HPP_
#define CHAIN_AUDITOR_HPP_

#include "storage/coordinator.hpp"
#include "storage/journal_store.hpp"

#include <cstdint>
#include <memory>
#include <string>

namespace ledger {
namespace engine {

struct ChainAuditReport {
  std::uint64_t entries_checked = 0;
  bool valid = true;
  std::uint64_t first_broken_sequence = 0;  // 0 when valid
  std::string reason;
};

/**
 * Verifies the journal's hash chain from the first entry to the tail.
 */
class ChainAuditor {
 public:
  static constexpr int kDefaultPageSize = 500;

  ChainAuditor(std::shared_ptr<storage::JournalStore> journal_store,
               std::shared_ptr<storage::Coordinator> coordinator);

  /**
   * Reads the journal in sequence order, `page_size` entries per transaction, and checks that
   * sequences are contiguous from 1, that each previous_hash equals the hash before it (empty
   * for the first entry) and that every entry's hash matches its fields. Stops at the first
   * defect.
   */
  ChainAuditReport Verify(int page_size = kDefaultPageSize);

 private:
  std::shared_ptr<storage::JournalStore> journal_store_;
  std::shared_ptr<storage::Coordinator> coordinator_;
};

}  // namespace engine
}  // namespace ledger

#endif  // CHAIN_AUDITOR_HPP_

#include "engine/chain_auditor.hpp"
#include "observability/logger.hpp"

#include <vector>

namespace ledger {
namespace engine {

namespace {

ChainAuditReport broken(ChainAuditReport report, std::uint64_t sequence,
                        const std::string& reason) {
  report.valid = false;
  report.first_broken_sequence = sequence;
  report.reason = reason;
  return report;
}

}  // namespace

ChainAuditor::ChainAuditor(std::shared_ptr<storage::JournalStore> journal_store,
                           std::shared_ptr<storage::Coordinator> coordinator)
    : journal_store_(std::move(journal_store)), coordinator_(std::move(coordinator)) {}

ChainAuditReport ChainAuditor::Verify(int page_size) {
  if (page_size <= 0) {
    page_size = kDefaultPageSize;
  }

  ChainAuditReport report;
  std::uint64_t expected_sequence = 1;
  std::string expected_previous_hash;

  while (true) {
    std::vector<JournalEntry> page;
    coordinator_->runAtomic([&](storage::Session& session) {
      page = journal_store_->findBySequenceRange(session, expected_sequence, page_size);
    });

    for (const auto& entry : page) {
      if (entry.sequence != expected_sequence) {
        report = broken(report, expected_sequence,
                        "sequence gap: expected " + std::to_string(expected_sequence) +
                            ", found " + std::to_string(entry.sequence));
        break;
      }
      if (entry.previous_hash != expected_previous_hash) {
        report = broken(report, entry.sequence, "previous_hash does not match the prior entry");
        break;
      }
      if (!entry.Validate()) {
        report = broken(report, entry.sequence, "hash does not match entry contents");
        break;
      }

      ++report.entries_checked;
      ++expected_sequence;
      expected_previous_hash = entry.hash;
    }

    if (!report.valid || page.size() < static_cast<size_t>(page_size)) {
      break;
    }
  }

  if (report.valid) {
    LOG_BUILDER(observability::LogLevel::INFO, "Journal chain verified")
        .field("entries_checked", report.entries_checked);
  } else {
    LOG_BUILDER(observability::LogLevel::ERROR, "Journal chain broken")
        .field("entries_checked", report.entries_checked)
        .field("sequence", report.first_broken_sequence)
        .field("reason", report.reason);
  }
  return report;
}

}  // namespace engine
}  // namespace ledger

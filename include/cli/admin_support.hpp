#ifndef ADMIN_SUPPORT_HPP_
#define ADMIN_SUPPORT_HPP_

#include "domain/account.hpp"
#include "domain/journal_entry.hpp"
#include "domain/uuid.hpp"

#include <nlohmann/json.hpp>

#include <functional>
#include <ostream>
#include <stdexcept>
#include <string>

namespace ledger {
namespace cli {

constexpr int kExitOk = 0;
constexpr int kExitUsage = 1;
constexpr int kExitLedgerError = 2;

/**
 * Bad command line. Reported with the usage text and exit code kExitUsage.
 */
class UsageError : public std::runtime_error {
 public:
  explicit UsageError(const std::string& message) : std::runtime_error(message) {}
};

void printUsage(std::ostream& out);

// Whole-string decimal parse; throws UsageError naming `what` on junk or overflow.
long long parseNumber(const std::string& text, const std::string& what);

// As parseNumber, restricted to the range of int.
int parseInt(const std::string& text, const std::string& what);

Uuid parseId(const std::string& text);

nlohmann::json accountToJson(const Account& account);
nlohmann::json entryToJson(const JournalEntry& entry);

/**
 * Runs `command` and turns whatever escapes it into a message on `err` and an exit code:
 * UsageError gives kExitUsage, LedgerError and any other std::exception give kExitLedgerError.
 */
int runReportingErrors(const std::function<int()>& command, std::ostream& err);

}  // namespace cli
}  // namespace ledger

#endif  // ADMIN_SUPPORT_HPP_

#include "cli/admin_support.hpp"
#include "domain/errors.hpp"

#include <limits>

namespace ledger {
namespace cli {

void printUsage(std::ostream& out) {
  out << "Usage: ledger_admin [--config path] <command> [args]\n"
      << "\n"
      << "Commands:\n"
      << "  init-schema                                   create tables from the schema file\n"
      << "  create-account [--overdraft]                  create an account with zero balance\n"
      << "  account <id>                                  show an account\n"
      << "  transfer <from> <to> <amount> <key> [desc]    move points between accounts\n"
      << "  history <account-id> [limit] [offset]         list journal entries, newest first\n"
      << "  audit [page-size]                             verify the journal hash chain\n"
      << "  metrics                                       print metrics in Prometheus format\n"
      << "\n"
      << "Database settings come from the config file and LEDGER_DB_* environment variables.\n";
}

long long parseNumber(const std::string& text, const std::string& what) {
  try {
    size_t consumed = 0;
    long long value = std::stoll(text, &consumed);
    if (consumed != text.size()) {
      throw UsageError(what + " is not a number: " + text);
    }
    return value;
  } catch (const std::logic_error&) {
    throw UsageError(what + " is not a number: " + text);
  }
}

int parseInt(const std::string& text, const std::string& what) {
  long long value = parseNumber(text, what);
  if (value < std::numeric_limits<int>::min() || value > std::numeric_limits<int>::max()) {
    throw UsageError(what + " is out of range: " + text);
  }
  return static_cast<int>(value);
}

Uuid parseId(const std::string& text) {
  try {
    return Uuid::parse(text);
  } catch (const LedgerError&) {
    throw UsageError("not a valid account id: " + text);
  }
}

nlohmann::json accountToJson(const Account& account) {
  nlohmann::json j;
  j["id"] = account.id().toString();
  j["balance"] = account.balance();
  j["can_overdraft"] = account.canOverdraft();
  return j;
}

nlohmann::json entryToJson(const JournalEntry& entry) {
  nlohmann::json j;
  j["id"] = entry.id.toString();
  j["sequence"] = entry.sequence;
  j["from_account_id"] = entry.from_account_id.toString();
  j["to_account_id"] = entry.to_account_id.toString();
  j["amount"] = entry.amount;
  j["description"] = entry.description;
  j["idempotency_key"] = entry.idempotency_key;
  j["previous_hash"] = entry.previous_hash;
  j["hash"] = entry.hash;
  j["timestamp_ns"] = entry.unixNanos();
  return j;
}

int runReportingErrors(const std::function<int()>& command, std::ostream& err) {
  try {
    return command();
  } catch (const UsageError& e) {
    err << "Usage error: " << e.what() << "\n\n";
    printUsage(err);
    return kExitUsage;
  } catch (const LedgerError& e) {
    err << errorClassName(e.errorClass()) << " (" << errorCodeName(e.code()) << "): "
        << e.what() << std::endl;
    return kExitLedgerError;
  } catch (const std::exception& e) {
    err << "Internal error: " << e.what() << std::endl;
    return kExitLedgerError;
  }
}

}  // namespace cli
}  // namespace ledger

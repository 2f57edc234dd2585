#include "cli/admin_support.hpp"
#include "ledger_system.hpp"
#include "observability/metrics.hpp"

#include <nlohmann/json.hpp>

#include <iostream>
#include <string>
#include <vector>

using namespace ledger::cli;

namespace {

void print(const nlohmann::json& j) {
  std::cout << j.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
}

int runCommand(ledger::LedgerSystem& system, const ledger::config::LedgerConfig& config,
               const std::vector<std::string>& args) {
  const std::string& command = args[0];
  auto arg_count = args.size() - 1;

  if (command == "init-schema") {
    system.initializeSchema(config.schema_path);
    std::cout << "Schema initialized from " << config.schema_path << std::endl;
    return kExitOk;
  }

  if (command == "create-account") {
    bool overdraft = false;
    if (arg_count == 1 && args[1] == "--overdraft") {
      overdraft = true;
    } else if (arg_count != 0) {
      throw UsageError("create-account takes only --overdraft");
    }
    print(accountToJson(system.accounts().CreateAccount(overdraft)));
    return kExitOk;
  }

  if (command == "account") {
    if (arg_count != 1) throw UsageError("account needs an account id");
    print(accountToJson(system.accounts().GetAccount(parseId(args[1]))));
    return kExitOk;
  }

  if (command == "transfer") {
    if (arg_count < 4 || arg_count > 5) {
      throw UsageError("transfer needs <from> <to> <amount> <idempotency-key> [description]");
    }
    ledger::engine::TransferRequest request;
    request.from_account_id = parseId(args[1]);
    request.to_account_id = parseId(args[2]);
    request.amount = parseNumber(args[3], "amount");
    request.idempotency_key = args[4];
    if (arg_count == 5) request.description = args[5];

    print(entryToJson(system.transfers().Transfer(request)));
    return kExitOk;
  }

  if (command == "history") {
    if (arg_count < 1 || arg_count > 3) {
      throw UsageError("history needs <account-id> [limit] [offset]");
    }
    int limit = arg_count >= 2 ? parseInt(args[2], "limit") : 0;
    int offset = arg_count >= 3 ? parseInt(args[3], "offset") : 0;

    nlohmann::json entries = nlohmann::json::array();
    for (const auto& entry : system.transfers().GetJournalEntries(parseId(args[1]), limit,
                                                                  offset)) {
      entries.push_back(entryToJson(entry));
    }
    print(entries);
    return kExitOk;
  }

  if (command == "audit") {
    if (arg_count > 1) throw UsageError("audit takes an optional page size");
    int page_size = arg_count == 1 ? parseInt(args[1], "page size")
                                  : ledger::engine::ChainAuditor::kDefaultPageSize;
    auto report = system.auditor().Verify(page_size);

    nlohmann::json j;
    j["valid"] = report.valid;
    j["entries_checked"] = report.entries_checked;
    if (!report.valid) {
      j["first_broken_sequence"] = report.first_broken_sequence;
      j["reason"] = report.reason;
    }
    print(j);
    return report.valid ? kExitOk : kExitLedgerError;
  }

  if (command == "metrics") {
    std::cout << ledger::observability::getGlobalMetrics().exportMetrics();
    return kExitOk;
  }

  throw UsageError("unknown command: " + command);
}

}  // namespace

int main(int argc, char* argv[]) {
  std::string config_path;
  std::vector<std::string> args;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--config" && args.empty()) {
      if (i + 1 >= argc) {
        std::cerr << "--config needs a path" << std::endl;
        return kExitUsage;
      }
      config_path = argv[++i];
    } else if ((arg == "--help" || arg == "-h") && args.empty()) {
      printUsage(std::cout);
      return kExitOk;
    } else {
      args.push_back(arg);
    }
  }

  if (args.empty()) {
    printUsage(std::cerr);
    return kExitUsage;
  }

  return runReportingErrors(
      [&]() -> int {
        ledger::config::LedgerConfig config;
        std::unique_ptr<ledger::LedgerSystem> system;
        try {
          if (!config_path.empty()) {
            config = ledger::config::LedgerConfig::fromJsonFile(config_path);
          }
          config.applyEnvironment();
          // Log lines go to stderr so command output stays machine readable
          ledger::observability::Logger::getInstance().setOutputStream(std::cerr);
          system = ledger::LedgerSystem::createPostgres(config);
        } catch (const ledger::LedgerError& e) {
          std::cerr << "Configuration error: " << e.what() << std::endl;
          return kExitUsage;
        }
        return runCommand(*system, config, args);
      },
      std::cerr);
}

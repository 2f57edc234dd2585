#include "database/ledger_persistence.hpp"
#include "database/postgres_coordinator.hpp"
#include "observability/logger.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <unordered_map>

namespace ledger {
namespace database {

namespace {

const char kAccountColumns[] = "encode(id, 'hex'), balance, can_overdraft";

const char kEntryColumns[] =
    "encode(e.id, 'hex'), e.sequence, encode(e.from_account_id, 'hex'), "
    "encode(e.to_account_id, 'hex'), e.amount, e.description, e.idempotency_key, "
    "e.prev_hash, e.hash, e.created_at_ns";

// Seeds the chain head from the journal tail, or as an empty head when there are no entries
const char kSeedChainHead[] = R"(
    INSERT INTO chain_head (id, last_entry_id, last_sequence, last_hash)
    SELECT 1, tail.id, COALESCE(tail.sequence, 0), COALESCE(tail.hash, '')
    FROM (SELECT 1) AS head
    LEFT JOIN LATERAL (
      SELECT id, sequence, hash FROM journal_entries ORDER BY sequence DESC LIMIT 1
    ) tail ON TRUE
    ON CONFLICT (id) DO NOTHING
  )";

std::string value(const PGresult* result, int row, int column) {
  return PQgetvalue(result, row, column);
}

Account accountFromRow(const PGresult* result, int row) {
  return Account(Uuid::fromHex(value(result, row, 0)), std::stoll(value(result, row, 1)),
                 value(result, row, 2) == "t");
}

JournalEntry entryFromRow(const PGresult* result, int row) {
  JournalEntry entry;
  entry.id = Uuid::fromHex(value(result, row, 0));
  entry.sequence = std::stoull(value(result, row, 1));
  entry.from_account_id = Uuid::fromHex(value(result, row, 2));
  entry.to_account_id = Uuid::fromHex(value(result, row, 3));
  entry.amount = std::stoll(value(result, row, 4));
  entry.description = value(result, row, 5);
  entry.idempotency_key = value(result, row, 6);
  entry.previous_hash = value(result, row, 7);
  entry.hash = value(result, row, 8);
  entry.timestamp = timestampFromUnixNanos(std::stoll(value(result, row, 9)));
  return entry;
}

std::vector<JournalEntry> entriesFromResult(const PGresult* result) {
  std::vector<JournalEntry> entries;
  int rows = PQntuples(result);
  entries.reserve(rows);
  for (int row = 0; row < rows; ++row) {
    entries.push_back(entryFromRow(result, row));
  }
  return entries;
}

std::optional<JournalEntry> firstEntry(const PGresult* result) {
  if (PQntuples(result) == 0) {
    return std::nullopt;
  }
  return entryFromRow(result, 0);
}

std::optional<Account> findAccount(storage::Session& session, const Uuid& id,
                                   const char* suffix) {
  auto result = sessionConnection(session).query(
      std::string("SELECT ") + kAccountColumns +
          " FROM accounts WHERE id = decode($1, 'hex')" + suffix,
      {id.toHex()});

  if (PQntuples(result.get()) == 0) {
    return std::nullopt;
  }
  return accountFromRow(result.get(), 0);
}

std::string trim(const std::string& text) {
  auto first = std::find_if_not(text.begin(), text.end(),
                                [](unsigned char c) { return std::isspace(c); });
  auto last = std::find_if_not(text.rbegin(), text.rend(),
                               [](unsigned char c) { return std::isspace(c); }).base();
  return first < last ? std::string(first, last) : std::string();
}

}  // namespace

// PostgresAccountStore implementation
void PostgresAccountStore::save(storage::Session& session, const Account& account) {
  sessionConnection(session).query(R"(
      INSERT INTO accounts (id, balance, can_overdraft)
      VALUES (decode($1, 'hex'), $2, $3)
      ON CONFLICT (id) DO UPDATE
      SET balance = EXCLUDED.balance, updated_at = CURRENT_TIMESTAMP
    )",
      {account.id().toHex(), std::to_string(account.balance()),
       std::string(account.canOverdraft() ? "true" : "false")});
}

std::optional<Account> PostgresAccountStore::findById(storage::Session& session, const Uuid& id) {
  return findAccount(session, id, "");
}

std::optional<Account> PostgresAccountStore::findByIdForUpdate(storage::Session& session,
                                                               const Uuid& id) {
  return findAccount(session, id, " FOR UPDATE");
}

std::vector<Account> PostgresAccountStore::findByIds(storage::Session& session,
                                                     const std::vector<Uuid>& ids) {
  if (ids.empty()) {
    return {};
  }

  // Hex digits need no quoting inside an array literal
  std::string array_literal = "{";
  for (size_t i = 0; i < ids.size(); ++i) {
    if (i > 0) array_literal += ",";
    array_literal += ids[i].toHex();
  }
  array_literal += "}";

  auto result = sessionConnection(session).query(
      std::string("SELECT ") + kAccountColumns +
          " FROM accounts WHERE id IN (SELECT decode(h, 'hex') FROM unnest($1::text[]) AS h)",
      {array_literal});

  std::unordered_map<Uuid, Account> found;
  for (int row = 0; row < PQntuples(result.get()); ++row) {
    Account account = accountFromRow(result.get(), row);
    found.emplace(account.id(), account);
  }

  std::vector<Account> accounts;
  accounts.reserve(found.size());
  for (const auto& id : ids) {
    auto it = found.find(id);
    if (it != found.end()) {
      accounts.push_back(it->second);
    }
  }
  return accounts;
}

// PostgresJournalStore implementation
void PostgresJournalStore::save(storage::Session& session, const JournalEntry& entry) {
  auto& conn = sessionConnection(session);

  conn.query(R"(
      INSERT INTO journal_entries (
        id, sequence, from_account_id, to_account_id, amount,
        description, idempotency_key, prev_hash, hash, created_at_ns
      ) VALUES (
        decode($1, 'hex'), $2, decode($3, 'hex'), decode($4, 'hex'), $5,
        $6, $7, $8, $9, $10
      )
    )",
      {entry.id.toHex(), std::to_string(entry.sequence), entry.from_account_id.toHex(),
       entry.to_account_id.toHex(), std::to_string(entry.amount), entry.description,
       entry.idempotency_key, entry.previous_hash, entry.hash,
       std::to_string(entry.unixNanos())});

  conn.query(R"(
      UPDATE chain_head
      SET last_entry_id = decode($1, 'hex'), last_sequence = $2, last_hash = $3
      WHERE id = 1
    )",
      {entry.id.toHex(), std::to_string(entry.sequence), entry.hash});
}

std::optional<JournalEntry> PostgresJournalStore::findById(storage::Session& session,
                                                           const Uuid& id) {
  auto result = sessionConnection(session).query(
      std::string("SELECT ") + kEntryColumns +
          " FROM journal_entries e WHERE e.id = decode($1, 'hex')",
      {id.toHex()});
  return firstEntry(result.get());
}

std::optional<JournalEntry> PostgresJournalStore::findByIdempotencyKey(storage::Session& session,
                                                                       const std::string& key) {
  auto result = sessionConnection(session).query(
      std::string("SELECT ") + kEntryColumns +
          " FROM journal_entries e WHERE e.idempotency_key = $1",
      {key});
  return firstEntry(result.get());
}

std::optional<JournalEntry> PostgresJournalStore::getLatestEntry(storage::Session& session) {
  auto& conn = sessionConnection(session);

  // Recreate a missing head row at the real tail, so there is always a row to lock
  conn.execute(kSeedChainHead);

  auto result = conn.query(std::string("SELECT ") + kEntryColumns + R"(
      FROM chain_head h
      LEFT JOIN journal_entries e ON e.id = h.last_entry_id
      WHERE h.id = 1
      FOR UPDATE OF h
    )");

  if (PQntuples(result.get()) == 0 || PQgetisnull(result.get(), 0, 0)) {
    return std::nullopt;
  }
  return entryFromRow(result.get(), 0);
}

std::vector<JournalEntry> PostgresJournalStore::findByAccountId(storage::Session& session,
                                                                const Uuid& account_id,
                                                                int limit, int offset) {
  auto result = sessionConnection(session).query(
      std::string("SELECT ") + kEntryColumns + R"(
      FROM journal_entries e
      WHERE e.from_account_id = decode($1, 'hex') OR e.to_account_id = decode($1, 'hex')
      ORDER BY e.id DESC
      LIMIT $2 OFFSET $3
    )",
      {account_id.toHex(), std::to_string(std::max(limit, 0)),
       std::to_string(std::max(offset, 0))});
  return entriesFromResult(result.get());
}

std::vector<JournalEntry> PostgresJournalStore::findBySequenceRange(storage::Session& session,
                                                                    std::uint64_t first_sequence,
                                                                    int limit) {
  auto result = sessionConnection(session).query(
      std::string("SELECT ") + kEntryColumns + R"(
      FROM journal_entries e
      WHERE e.sequence >= $1
      ORDER BY e.sequence
      LIMIT $2
    )",
      {std::to_string(first_sequence), std::to_string(std::max(limit, 0))});
  return entriesFromResult(result.get());
}

// LedgerSchema implementation
void LedgerSchema::initialize(PostgresConnection& conn, const std::string& schema_path) {
  std::ifstream schema_file(schema_path);
  if (!schema_file.is_open()) {
    throw LedgerError(ErrorCode::Configuration, "could not open schema file: " + schema_path);
  }

  std::stringstream buffer;
  buffer << schema_file.rdbuf();
  auto statements = splitStatements(buffer.str());

  TransactionGuard transaction(conn);
  for (const auto& statement : statements) {
    conn.execute(statement);
  }
  transaction.commit();

  LOG_BUILDER(observability::LogLevel::INFO, "Database schema initialized")
      .field("schema_path", schema_path)
      .field("statements", static_cast<std::uint64_t>(statements.size()));
}

std::vector<std::string> LedgerSchema::splitStatements(const std::string& script) {
  // Strip comment lines first so a ';' inside a comment does not split a statement
  std::stringstream lines(script);
  std::string line;
  std::string sql;
  while (std::getline(lines, line)) {
    auto comment = line.find("--");
    if (comment != std::string::npos) {
      line.erase(comment);
    }
    sql += line;
    sql += '\n';
  }

  std::vector<std::string> statements;
  size_t start = 0;
  size_t pos = 0;
  while ((pos = sql.find(';', start)) != std::string::npos) {
    std::string statement = trim(sql.substr(start, pos - start));
    if (!statement.empty()) {
      statements.push_back(statement);
    }
    start = pos + 1;
  }

  std::string tail = trim(sql.substr(start));
  if (!tail.empty()) {
    statements.push_back(tail);
  }
  return statements;
}

}  // namespace database
}  // namespace ledger

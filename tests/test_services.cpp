#include "ledger_system.hpp"
#include "observability/metrics.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <type_traits>

using namespace ledger;
using namespace std::chrono_literals;

TEST(LedgerSystemTest, BuiltOnlyThroughFactories) {
  static_assert(!std::is_constructible<LedgerSystem, std::shared_ptr<storage::AccountStore>,
                                       std::shared_ptr<storage::JournalStore>,
                                       std::shared_ptr<storage::Coordinator>>::value,
                "stores and coordinator are wired by the factories");
  static_assert(!std::is_copy_constructible<LedgerSystem>::value, "LedgerSystem is not copyable");

  auto system = LedgerSystem::createInMemory(200ms);
  ASSERT_NE(system, nullptr);
  EXPECT_NE(system->memory(), nullptr);
  EXPECT_EQ(system->pool(), nullptr);
  EXPECT_EQ(system->accounts().CreateAccount(false).balance(), 0);
}

class AccountServiceTest : public ::testing::Test {
 protected:
  void SetUp() override {
    system_ = LedgerSystem::createInMemory(200ms);
  }

  std::unique_ptr<LedgerSystem> system_;
};

TEST_F(AccountServiceTest, CreateAccountStartsAtZero) {
  auto& metrics = observability::getGlobalMetrics();
  double created = metrics.counterValue(observability::metric::kAccountsCreated);

  auto plain = system_->accounts().CreateAccount(false);
  auto overdraft = system_->accounts().CreateAccount(true);

  EXPECT_EQ(plain.balance(), 0);
  EXPECT_FALSE(plain.canOverdraft());
  EXPECT_TRUE(overdraft.canOverdraft());
  EXPECT_EQ(plain.id().version(), 7);
  EXPECT_LT(plain.id(), overdraft.id());
  EXPECT_EQ(system_->memory()->accountCount(), 2u);
  EXPECT_EQ(metrics.counterValue(observability::metric::kAccountsCreated), created + 2);
}

TEST_F(AccountServiceTest, GetAccountReflectsTransfers) {
  auto a = testutil::seedAccount(system_->memory(), 300);
  auto b = system_->accounts().CreateAccount(false);

  system_->transfers().Transfer(a.id(), b.id(), 120, "", "get-1");

  EXPECT_EQ(system_->accounts().GetAccount(a.id()).balance(), 180);
  EXPECT_EQ(system_->accounts().GetAccount(b.id()).balance(), 120);
}

TEST_F(AccountServiceTest, GetAccountUnknownId) {
  EXPECT_LEDGER_ERROR(ErrorCode::AccountNotFound,
                      system_->accounts().GetAccount(Uuid::generateV7()));
}

TEST_F(AccountServiceTest, GetAccountsKeepsOrderSkipsMissingAndDuplicates) {
  auto a = system_->accounts().CreateAccount(false);
  auto b = system_->accounts().CreateAccount(false);
  auto c = system_->accounts().CreateAccount(true);
  auto missing = Uuid::generateV7();

  auto accounts = system_->accounts().GetAccounts({c.id(), missing, a.id(), c.id(), b.id()});
  ASSERT_EQ(accounts.size(), 3u);
  EXPECT_EQ(accounts[0].id(), c.id());
  EXPECT_EQ(accounts[1].id(), a.id());
  EXPECT_EQ(accounts[2].id(), b.id());
  EXPECT_TRUE(accounts[0].canOverdraft());

  EXPECT_TRUE(system_->accounts().GetAccounts({}).empty());
  EXPECT_TRUE(system_->accounts().GetAccounts({missing}).empty());
}

class ChainAuditorTest : public ::testing::Test {
 protected:
  void SetUp() override {
    system_ = LedgerSystem::createInMemory(200ms);
    memory_ = system_->memory();
    auto a = testutil::seedAccount(memory_, 1000);
    auto b = testutil::seedAccount(memory_, 1000);
    for (int i = 1; i <= 7; ++i) {
      system_->transfers().Transfer(i % 2 ? a.id() : b.id(), i % 2 ? b.id() : a.id(), i, "",
                                    "audit-" + std::to_string(i));
    }
  }

  JournalEntry entryAt(std::uint64_t sequence) {
    for (const auto& entry : memory_->committedEntries()) {
      if (entry.sequence == sequence) return entry;
    }
    ADD_FAILURE() << "no entry with sequence " << sequence;
    return JournalEntry();
  }

  std::unique_ptr<LedgerSystem> system_;
  std::shared_ptr<storage::MemoryLedger> memory_;
};

TEST_F(ChainAuditorTest, EmptyJournalIsValid) {
  auto empty = LedgerSystem::createInMemory(200ms);
  auto report = empty->auditor().Verify();
  EXPECT_TRUE(report.valid);
  EXPECT_EQ(report.entries_checked, 0u);
}

TEST_F(ChainAuditorTest, IntactChainAcrossPageSizes) {
  for (int page_size : {1, 2, 3, 7, 8, 500, 0}) {
    auto report = system_->auditor().Verify(page_size);
    EXPECT_TRUE(report.valid) << "page size " << page_size << ": " << report.reason;
    EXPECT_EQ(report.entries_checked, 7u) << "page size " << page_size;
    EXPECT_EQ(report.first_broken_sequence, 0u);
  }
}

TEST_F(ChainAuditorTest, DetectsTamperedAmount) {
  auto entry = entryAt(4);
  entry.amount += 1;
  memory_->replaceEntry(entry);

  auto report = system_->auditor().Verify(2);
  EXPECT_FALSE(report.valid);
  EXPECT_EQ(report.first_broken_sequence, 4u);
  EXPECT_EQ(report.entries_checked, 3u);
  EXPECT_FALSE(report.reason.empty());
}

TEST_F(ChainAuditorTest, DetectsRehashedEntryThroughSuccessor) {
  // Recomputing the hash after tampering breaks the link from the next entry
  auto entry = entryAt(3);
  entry.amount = 999;
  entry.hash = entry.ComputeHash();
  memory_->replaceEntry(entry);

  auto report = system_->auditor().Verify(3);
  EXPECT_FALSE(report.valid);
  EXPECT_EQ(report.first_broken_sequence, 4u);
}

TEST_F(ChainAuditorTest, DetectsBrokenFirstLink) {
  auto entry = entryAt(1);
  entry.previous_hash = std::string(64, 'a');
  entry.hash = entry.ComputeHash();
  memory_->replaceEntry(entry);

  auto report = system_->auditor().Verify();
  EXPECT_FALSE(report.valid);
  EXPECT_EQ(report.first_broken_sequence, 1u);
  EXPECT_EQ(report.entries_checked, 0u);
}

TEST_F(ChainAuditorTest, DescriptionChangeIsNotADefect) {
  auto entry = entryAt(5);
  entry.description = "rewritten";
  memory_->replaceEntry(entry);

  EXPECT_TRUE(system_->auditor().Verify().valid);
}

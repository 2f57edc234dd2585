#include "engine/chain_auditor.hpp"
#include "engine/transfer_engine.hpp"
#include "storage/memory_ledger_store.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <mutex>
#include <random>
#include <string>
#include <thread>
#include <vector>

using namespace ledger;
using namespace std::chrono_literals;

namespace {

// Records the order of row locks and stalls briefly after each one, so two
// transactions taking the same rows in opposite order would run into each other.
class RecordingAccountStore : public storage::AccountStore {
 public:
  explicit RecordingAccountStore(std::shared_ptr<storage::MemoryLedger> memory)
      : inner_(std::move(memory)) {}

  void save(storage::Session& session, const Account& account) override {
    inner_.save(session, account);
  }

  std::optional<Account> findById(storage::Session& session, const Uuid& id) override {
    return inner_.findById(session, id);
  }

  std::optional<Account> findByIdForUpdate(storage::Session& session, const Uuid& id) override {
    auto account = inner_.findByIdForUpdate(session, id);
    {
      std::lock_guard<std::mutex> lock(mutex_);
      locked_.push_back(id);
    }
    thread_local std::mt19937 rng(std::random_device{}());
    std::this_thread::sleep_for(std::chrono::milliseconds(rng() % 3));
    return account;
  }

  std::vector<Account> findByIds(storage::Session& session,
                                 const std::vector<Uuid>& ids) override {
    return inner_.findByIds(session, ids);
  }

  std::vector<Uuid> lockedIds() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return locked_;
  }

 private:
  storage::MemoryAccountStore inner_;
  mutable std::mutex mutex_;
  std::vector<Uuid> locked_;
};

// Transactions as usual, but named regions do not exclude anyone, leaving row locks
// as the only thing ordering concurrent transfers.
class UnserializedCoordinator : public storage::Coordinator {
 public:
  explicit UnserializedCoordinator(std::shared_ptr<storage::MemoryLedger> memory)
      : inner_(std::move(memory)) {}

  void runAtomic(const AtomicFn& fn, const concurrent::CancellationToken& cancel) override {
    inner_.runAtomic(fn, cancel);
  }

  void runSerialized(const std::string&, const SerializedFn& fn,
                     const concurrent::CancellationToken&) override {
    fn();
  }

 private:
  storage::MemoryCoordinator inner_;
};

}  // namespace

class LockOrderTest : public ::testing::Test {
 protected:
  void SetUp() override {
    memory_ = std::make_shared<storage::MemoryLedger>(2s);
    accounts_ = std::make_shared<RecordingAccountStore>(memory_);
    journal_ = std::make_shared<storage::MemoryJournalStore>(memory_);
    coordinator_ = std::make_shared<UnserializedCoordinator>(memory_);
    engine_ = std::make_unique<engine::TransferEngine>(accounts_, journal_, coordinator_);
  }

  std::shared_ptr<storage::MemoryLedger> memory_;
  std::shared_ptr<RecordingAccountStore> accounts_;
  std::shared_ptr<storage::MemoryJournalStore> journal_;
  std::shared_ptr<UnserializedCoordinator> coordinator_;
  std::unique_ptr<engine::TransferEngine> engine_;
};

TEST_F(LockOrderTest, SmallerIdIsLockedFirstInBothDirections) {
  auto a = testutil::seedAccount(memory_, 1000);
  auto b = testutil::seedAccount(memory_, 1000);
  const Uuid& low = a.id().toString() < b.id().toString() ? a.id() : b.id();
  const Uuid& high = low == a.id() ? b.id() : a.id();

  engine_->Transfer(a.id(), b.id(), 10, "", "order-ab");
  engine_->Transfer(b.id(), a.id(), 20, "", "order-ba");
  engine_->Transfer(high, low, 30, "", "order-high-low");

  auto locked = accounts_->lockedIds();
  ASSERT_EQ(locked.size(), 6u);
  for (size_t i = 0; i < locked.size(); i += 2) {
    EXPECT_EQ(locked[i], low) << "transfer " << i / 2;
    EXPECT_EQ(locked[i + 1], high) << "transfer " << i / 2;
  }
}

TEST_F(LockOrderTest, OpposingTransfersWithoutRegionDoNotDeadlock) {
  auto a = testutil::seedAccount(memory_, 10000);
  auto b = testutil::seedAccount(memory_, 10000);

  constexpr int kThreads = 4;
  constexpr int kPerThread = 20;
  std::atomic<int> failures{0};
  std::vector<std::thread> threads;

  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&, t]() {
      for (int i = 0; i < kPerThread; ++i) {
        bool forward = (t + i) % 2 == 0;
        std::string key = "opposing-" + std::to_string(t) + "-" + std::to_string(i);
        try {
          engine_->Transfer(forward ? a.id() : b.id(), forward ? b.id() : a.id(), 1 + i % 5, "",
                            key);
        } catch (const LedgerError& e) {
          ADD_FAILURE() << key << ": " << errorCodeName(e.code()) << ": " << e.what();
          ++failures;
        }
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  EXPECT_EQ(failures.load(), 0);
  EXPECT_EQ(testutil::committedBalance(memory_, a.id()) +
                testutil::committedBalance(memory_, b.id()),
            20000);
  EXPECT_EQ(memory_->committedEntries().size(), static_cast<size_t>(kThreads * kPerThread));

  engine::ChainAuditor auditor(journal_, coordinator_);
  auto report = auditor.Verify();
  EXPECT_TRUE(report.valid) << report.reason;
}

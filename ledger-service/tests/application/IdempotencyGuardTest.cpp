/**
 * @file IdempotencyGuardTest.cpp
 * @brief Unit tests for IdempotencyGuard
 */

#include <gtest/gtest.h>
#include "application/IdempotencyGuard.hpp"
#include "adapters/secondary/InMemoryLedgerStore.hpp"

using namespace ledger;
using namespace ledger::application;
using ledger::adapters::secondary::InMemoryLedgerStore;

class IdempotencyGuardTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_shared<InMemoryLedgerStore>();
        guard_ = std::make_shared<IdempotencyGuard>(store_);

        account_ = *store_->insertAccount(
            domain::Account(domain::AccountOwner{"C-1", "Alice"}, domain::AccountType::CHECKING), 5).account;

        existing_ = commit("m-1", "tx-1", std::string("key-1"), "10");
    }

    domain::Movement commit(const std::string& id, const std::string& txId,
                            std::optional<std::string> key, const std::string& amount) {
        auto current = *store_->findAccount(account_.accountNumber);

        ports::output::MovementCommit c;
        c.accountNumber = current.accountNumber;
        c.expectedVersion = current.version;
        c.newBalance = current.balance + domain::Money::fromString(amount);
        c.movement.movementId = id;
        c.movement.accountNumber = current.accountNumber;
        c.movement.type = domain::MovementType::CREDIT;
        c.movement.amount = domain::Money::fromString(amount);
        c.movement.balanceBefore = current.balance;
        c.movement.balanceAfter = c.newBalance;
        c.movement.transactionId = txId;
        c.movement.idempotencyKey = key;

        auto result = store_->commitMovement(c);
        EXPECT_EQ(result.status, ports::output::CommitStatus::COMMITTED);
        return c.movement;
    }

    IdempotencyGuard::Request request(const std::string& txId,
                                      std::optional<std::string> key = std::nullopt,
                                      const std::string& amount = "10") {
        IdempotencyGuard::Request r;
        r.accountNumber = account_.accountNumber;
        r.type = domain::MovementType::CREDIT;
        r.amount = domain::Money::fromString(amount);
        r.transactionId = txId;
        r.idempotencyKey = key;
        return r;
    }

    std::shared_ptr<InMemoryLedgerStore> store_;
    std::shared_ptr<IdempotencyGuard> guard_;
    domain::Account account_;
    domain::Movement existing_;
};

TEST_F(IdempotencyGuardTest, NewRequest_NothingFound) {
    EXPECT_FALSE(guard_->findExisting(request("tx-2")).has_value());
    EXPECT_FALSE(guard_->findExisting(request("tx-2", std::string("key-2"))).has_value());
}

TEST_F(IdempotencyGuardTest, SameTransaction_ReturnsExisting) {
    auto found = guard_->findExisting(request("tx-1"));
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->movementId, "m-1");
}

TEST_F(IdempotencyGuardTest, SameKeyOnly_ReturnsExisting) {
    auto found = guard_->findExisting(request("tx-other", std::string("key-1")));
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->movementId, "m-1");
}

TEST_F(IdempotencyGuardTest, DifferentAmount_Conflict) {
    EXPECT_THROW(guard_->findExisting(request("tx-1", std::nullopt, "10.01")),
                 domain::IdempotencyConflictError);
}

TEST_F(IdempotencyGuardTest, DifferentKind_Conflict) {
    auto r = request("tx-1");
    r.type = domain::MovementType::DEBIT;
    EXPECT_THROW(guard_->findExisting(r), domain::IdempotencyConflictError);
}

TEST_F(IdempotencyGuardTest, DifferentAccount_Conflict) {
    auto r = request("tx-1");
    r.accountNumber += 1;
    EXPECT_THROW(guard_->findExisting(r), domain::IdempotencyConflictError);
}

TEST_F(IdempotencyGuardTest, KeyAndTransactionSplit_Conflict) {
    commit("m-2", "tx-2", std::string("key-2"), "10");
    EXPECT_THROW(guard_->findExisting(request("tx-1", std::string("key-2"))),
                 domain::IdempotencyConflictError);
}

TEST_F(IdempotencyGuardTest, ResolveDuplicate_ByTransaction) {
    auto winner = guard_->resolveDuplicate(request("tx-1"), ports::output::CommitStatus::DUPLICATE_TRANSACTION);
    EXPECT_EQ(winner.movementId, "m-1");
}

TEST_F(IdempotencyGuardTest, ResolveDuplicate_ByKey) {
    auto winner = guard_->resolveDuplicate(request("tx-new", std::string("key-1")),
                                           ports::output::CommitStatus::DUPLICATE_IDEMPOTENCY_KEY);
    EXPECT_EQ(winner.movementId, "m-1");
}

TEST_F(IdempotencyGuardTest, ResolveDuplicate_Mismatch_Conflict) {
    EXPECT_THROW(guard_->resolveDuplicate(request("tx-1", std::nullopt, "99"),
                                          ports::output::CommitStatus::DUPLICATE_TRANSACTION),
                 domain::IdempotencyConflictError);
}

TEST_F(IdempotencyGuardTest, ResolveDuplicate_Vanished_ConcurrentModification) {
    ASSERT_EQ(store_->deleteAccountCascade(account_.accountNumber, std::nullopt),
              ports::output::DeleteStatus::DELETED);
    EXPECT_THROW(guard_->resolveDuplicate(request("tx-1"), ports::output::CommitStatus::DUPLICATE_TRANSACTION),
                 domain::ConcurrentModificationError);
}

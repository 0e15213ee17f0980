/**
 * @file CustomerEventHandlerTest.cpp
 * @brief Unit tests for CustomerEventHandler
 */

#include <gtest/gtest.h>
#include "application/CustomerEventHandler.hpp"
#include "application/AccountService.hpp"
#include "application/MetricsService.hpp"
#include "adapters/secondary/InMemoryLedgerStore.hpp"
#include "settings/MetricsSettings.hpp"
#include "../mocks/MockCustomerClient.hpp"
#include "../mocks/MockEventConsumer.hpp"
#include "../mocks/MockEventPublisher.hpp"
#include <nlohmann/json.hpp>

using namespace ledger;
using namespace ledger::application;
using namespace ledger::tests;
using ledger::adapters::secondary::InMemoryLedgerStore;

class CustomerEventHandlerTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_shared<InMemoryLedgerStore>();
        client_ = std::make_shared<MockCustomerClient>();
        consumer_ = std::make_shared<MockEventConsumer>();
        transport_ = std::make_shared<MockEventPublisher>();
        metrics_ = std::make_shared<MetricsService>(std::make_shared<settings::MetricsSettings>());
        settings_ = std::make_shared<settings::LedgerSettings>();
        settings_->setAutoOpenSavings(true);

        cache_ = std::make_shared<CustomerConsistencyCache>(client_, metrics_);
        publisher_ = std::make_shared<LedgerEventPublisher>(transport_, metrics_, settings_);
        accounts_ = std::make_shared<AccountService>(store_, cache_, publisher_, metrics_, settings_);
        handler_ = std::make_shared<CustomerEventHandler>(consumer_, cache_, accounts_, metrics_, settings_);
    }

    void TearDown() override {
        publisher_->stop();
    }

    static std::string event(const std::string& type, const std::string& eventId,
                             const std::string& customerId, int64_t timestamp,
                             const std::string& name = "Alice Smith", bool active = true) {
        nlohmann::json j;
        j["eventId"] = eventId;
        j["eventType"] = type;
        j["customerId"] = customerId;
        j["timestamp"] = timestamp;
        j["name"] = name;
        j["active"] = active;
        return j.dump();
    }

    std::shared_ptr<InMemoryLedgerStore> store_;
    std::shared_ptr<MockCustomerClient> client_;
    std::shared_ptr<MockEventConsumer> consumer_;
    std::shared_ptr<MockEventPublisher> transport_;
    std::shared_ptr<MetricsService> metrics_;
    std::shared_ptr<settings::LedgerSettings> settings_;
    std::shared_ptr<CustomerConsistencyCache> cache_;
    std::shared_ptr<LedgerEventPublisher> publisher_;
    std::shared_ptr<AccountService> accounts_;
    std::shared_ptr<CustomerEventHandler> handler_;
};

TEST_F(CustomerEventHandlerTest, SubscribesToCustomerEvents) {
    EXPECT_TRUE(consumer_->isSubscribed("customer.created"));
    EXPECT_TRUE(consumer_->isSubscribed("customer.updated"));
    EXPECT_TRUE(consumer_->isSubscribed("customer.deleted"));
    EXPECT_FALSE(consumer_->isSubscribed("movement.created"));
}

TEST_F(CustomerEventHandlerTest, Created_OpensDefaultSavings) {
    consumer_->emit("customer.created", event("customer.created", "e-1", "C-1", 1000));

    auto opened = store_->findAccountsByCustomer("C-1");
    ASSERT_EQ(opened.size(), 1u);
    EXPECT_EQ(opened[0].type, domain::AccountType::SAVINGS);
    EXPECT_EQ(opened[0].owner.name, "Alice Smith");

    EXPECT_EQ(cache_->isCustomerActive("C-1"), domain::CustomerStatus::ACTIVE);
    EXPECT_EQ(client_->lookupCallCount(), 0);
    EXPECT_EQ(metrics_->value("ledger_customer_events_total", {{"event", "customer.created"}}), 1);

    publisher_->stop();
    EXPECT_EQ(transport_->getMessagesByTopic("account.created").size(), 1u);
}

TEST_F(CustomerEventHandlerTest, Created_AutoOpenDisabled_NoAccount) {
    settings_->setAutoOpenSavings(false);

    consumer_->emit("customer.created", event("customer.created", "e-1", "C-1", 1000));

    EXPECT_TRUE(store_->findAccountsByCustomer("C-1").empty());
    EXPECT_EQ(cache_->isCustomerActive("C-1"), domain::CustomerStatus::ACTIVE);
}

TEST_F(CustomerEventHandlerTest, Created_InactiveCustomer_NoAccount) {
    consumer_->emit("customer.created", event("customer.created", "e-1", "C-1", 1000, "Alice", false));

    EXPECT_TRUE(store_->findAccountsByCustomer("C-1").empty());
}

TEST_F(CustomerEventHandlerTest, Redelivery_IsDiscarded) {
    auto message = event("customer.created", "e-1", "C-1", 1000);
    consumer_->emit("customer.created", message);
    consumer_->emit("customer.created", message);

    EXPECT_EQ(store_->findAccountsByCustomer("C-1").size(), 1u);
    EXPECT_EQ(metrics_->value("ledger_customer_events_total", {{"event", "customer.created"}}), 1);
    EXPECT_EQ(metrics_->value("ledger_customer_events_discarded_total"), 1);
}

TEST_F(CustomerEventHandlerTest, Malformed_IsDiscarded) {
    EXPECT_NO_THROW(consumer_->emit("customer.created", "{not json"));
    EXPECT_NO_THROW(consumer_->emit("customer.created", R"({"eventId":"e-1","timestamp":1})"));

    EXPECT_EQ(metrics_->value("ledger_customer_events_discarded_total"), 2);
    EXPECT_EQ(store_->accountCount(), 0u);
}

TEST_F(CustomerEventHandlerTest, Updated_OnlyRefreshesCache) {
    consumer_->emit("customer.created", event("customer.created", "e-1", "C-1", 1000));
    consumer_->emit("customer.updated", event("customer.updated", "e-2", "C-1", 2000, "Alice Jones", false));

    EXPECT_EQ(cache_->isCustomerActive("C-1"), domain::CustomerStatus::INACTIVE);
    auto opened = store_->findAccountsByCustomer("C-1");
    ASSERT_EQ(opened.size(), 1u);
    EXPECT_TRUE(opened[0].active);
    EXPECT_EQ(opened[0].owner.name, "Alice Smith");
}

TEST_F(CustomerEventHandlerTest, Deleted_RemovesAllAccounts) {
    consumer_->emit("customer.created", event("customer.created", "e-1", "C-1", 1000));
    store_->insertAccount(domain::Account(domain::AccountOwner{"C-1", "Alice Smith"},
                                          domain::AccountType::CHECKING), 5);
    ASSERT_EQ(store_->findAccountsByCustomer("C-1").size(), 2u);

    consumer_->emit("customer.deleted", event("customer.deleted", "e-2", "C-1", 2000));

    EXPECT_TRUE(store_->findAccountsByCustomer("C-1").empty());
    EXPECT_EQ(cache_->isCustomerActive("C-1"), domain::CustomerStatus::INACTIVE);

    publisher_->stop();
    EXPECT_EQ(transport_->getMessagesByTopic("account.deleted").size(), 2u);
}

TEST_F(CustomerEventHandlerTest, StaleCreatedAfterDeleted_DoesNotReopen) {
    consumer_->emit("customer.deleted", event("customer.deleted", "e-2", "C-1", 2000));
    consumer_->emit("customer.created", event("customer.created", "e-1", "C-1", 1000));

    EXPECT_TRUE(store_->findAccountsByCustomer("C-1").empty());
    EXPECT_EQ(metrics_->value("ledger_customer_events_discarded_total"), 1);
}

TEST_F(CustomerEventHandlerTest, RoutingKeyUsedWhenEventTypeMissing) {
    consumer_->emit("customer.created", R"({"eventId":"e-1","customerId":"C-7","timestamp":5,"name":"Seven"})");

    auto opened = store_->findAccountsByCustomer("C-7");
    ASSERT_EQ(opened.size(), 1u);
    EXPECT_EQ(opened[0].owner.name, "Seven");
}

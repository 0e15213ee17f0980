/**
 * @file CustomerEventTest.cpp
 * @brief Unit tests for CustomerEvent parsing
 */

#include <gtest/gtest.h>
#include "domain/CustomerEvent.hpp"

using namespace ledger::domain;

TEST(CustomerEventTest, ParsesFullPayload) {
    auto event = CustomerEvent::fromJson(R"({
        "eventId": "evt-1",
        "eventType": "customer.created",
        "timestamp": "2025-03-01T12:00:00.500Z",
        "customerId": "C-42",
        "name": "Ada Lovelace",
        "active": true,
        "correlationId": "corr-7"
    })");

    EXPECT_EQ(event.eventId, "evt-1");
    EXPECT_EQ(event.type, CustomerEventType::CREATED);
    EXPECT_EQ(event.timestamp.toString(), "2025-03-01T12:00:00.500Z");
    EXPECT_EQ(event.customerId, "C-42");
    EXPECT_EQ(event.name, "Ada Lovelace");
    EXPECT_TRUE(event.active);
    ASSERT_TRUE(event.correlationId.has_value());
    EXPECT_EQ(*event.correlationId, "corr-7");
}

TEST(CustomerEventTest, TypeFallsBackToRoutingKey) {
    auto event = CustomerEvent::fromJson(
        R"({"eventId":"e","customerId":"C-1","timestamp":1700000000000,"active":false})",
        "customer.updated");

    EXPECT_EQ(event.type, CustomerEventType::UPDATED);
    EXPECT_FALSE(event.active);
    EXPECT_EQ(event.timestamp.toEpochMillis(), 1700000000000);
}

TEST(CustomerEventTest, AcceptsUpperCaseTypeAndNumericIds) {
    auto event = CustomerEvent::fromJson(
        R"({"eventId":17,"eventType":"CUSTOMER_UPDATED","customerId":42,"timestamp":1,"state":false})");

    EXPECT_EQ(event.eventId, "17");
    EXPECT_EQ(event.customerId, "42");
    EXPECT_EQ(event.type, CustomerEventType::UPDATED);
    EXPECT_FALSE(event.active);
}

TEST(CustomerEventTest, StateStringMatchesCustomerLookup) {
    auto active = CustomerEvent::fromJson(
        R"({"eventId":"e1","customerId":"C-1","timestamp":1,"state":"ACTIVE"})", "customer.updated");
    EXPECT_TRUE(active.active);

    auto blocked = CustomerEvent::fromJson(
        R"({"eventId":"e2","customerId":"C-1","timestamp":1,"state":"BLOCKED"})", "customer.updated");
    EXPECT_FALSE(blocked.active);
}

TEST(CustomerEventTest, NullNameAndType_Tolerated) {
    auto event = CustomerEvent::fromJson(
        R"({"eventId":"e","eventType":null,"customerId":"C-1","timestamp":1,"name":null})",
        "customer.created");

    EXPECT_EQ(event.type, CustomerEventType::CREATED);
    EXPECT_EQ(event.name, "");
    EXPECT_TRUE(event.active);
}

TEST(CustomerEventTest, DeletedIsNeverActive) {
    auto event = CustomerEvent::fromJson(
        R"({"eventId":"e","eventType":"customer.deleted","customerId":"C-1","timestamp":1,"active":true})");

    EXPECT_EQ(event.type, CustomerEventType::DELETED);
    EXPECT_FALSE(event.active);
}

TEST(CustomerEventTest, RejectsMalformedPayloads) {
    EXPECT_THROW(CustomerEvent::fromJson("not json"), std::invalid_argument);
    EXPECT_THROW(CustomerEvent::fromJson("[1]", "customer.created"), std::invalid_argument);
    EXPECT_THROW(CustomerEvent::fromJson(R"({"customerId":"C","timestamp":1})", "customer.created"),
                 std::invalid_argument);
    EXPECT_THROW(CustomerEvent::fromJson(R"({"eventId":"e","timestamp":1})", "customer.created"),
                 std::invalid_argument);
    EXPECT_THROW(CustomerEvent::fromJson(R"({"eventId":"e","customerId":"C"})", "customer.created"),
                 std::invalid_argument);
    EXPECT_THROW(CustomerEvent::fromJson(R"({"eventId":"e","customerId":"C","timestamp":1})", "customer.merged"),
                 std::invalid_argument);
}

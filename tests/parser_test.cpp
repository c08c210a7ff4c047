/*
 * AEVUMDB COMMUNITY LICENSE
 * Version 1.0, February 2026
 *
 * Copyright (c) 2026 Ananda Firmansyah.
 * Official Organization: AevumDB (https://github.com/aevumdb)
 *
 * This source code is licensed under the AevumDB Community License.
 * You may not use this file except in compliance with the License.
 */

/**
 * @file parser_test.cpp
 * @brief Unit tests for envelope decoding and snapshot extraction.
 */

#include "framework.hpp"
#include "hooksync/model/errors.hpp"
#include "hooksync/model/snapshot.hpp"
#include "hooksync/sync/parser.hpp"
#include "test_support.hpp"

#include <cJSON.h>
#include <string>

using hooksync::model::MalformedPayload;
using hooksync::model::ValidationError;
using hooksync::sync::Parser;

void test_parser_canonical_envelope()
{
    const std::string body = hooksync::test::envelope(
        "jira:issue_created",
        hooksync::test::issue_json("10001", "PRJ-1", "Login fails", "10000",
                                   "2024-01-15T11:00:00Z"));

    auto env = Parser::parse(body, "application/json; charset=utf-8");
    ASSERT_EQ(env.event_type, std::string("jira:issue_created"));
    ASSERT_EQ(env.source_id, std::string("10001"));
    ASSERT_TRUE(env.timestamp.has_value());
    ASSERT_EQ(*env.timestamp, 1705312800000LL);
    ASSERT_TRUE(env.entity_payload != nullptr);
    ASSERT_TRUE(env.document != nullptr);

    auto snap = hooksync::model::issue_snapshot(env);
    ASSERT_EQ(snap.summary.value_or(""), std::string("Login fails"));
    ASSERT_TRUE(snap.project.has_value());
    ASSERT_EQ(snap.project->source_id, std::string("10000"));
    // lastModified wins over the envelope timestamp.
    ASSERT_EQ(snap.modified_at.value_or(0), 1705316400000LL);
}

/**
 * @brief Jira's own delivery shape: `webhookEvent`, numeric timestamp, `fields`.
 */
void test_parser_native_jira_shape()
{
    const std::string body = R"({
        "webhookEvent": "jira:issue_updated",
        "timestamp": 1525698237764,
        "user": {"name": "admin"},
        "issue": {
            "id": 10001,
            "key": "PRJ-1",
            "fields": {
                "summary": "Checkout broken",
                "status": {"name": "In Progress"},
                "priority": {"name": "High"},
                "assignee": {"displayName": "Dana"},
                "issuetype": {"name": "Bug"},
                "project": {"id": "10000", "key": "PRJ", "name": "Platform"},
                "updated": "2018-05-07T14:03:57.764+0000"
            }
        }
    })";

    auto env = Parser::parse(body);
    ASSERT_EQ(env.event_type, std::string("jira:issue_updated"));
    ASSERT_EQ(env.source_id, std::string("10001"));
    ASSERT_EQ(env.timestamp.value_or(0), 1525698237764LL);

    auto snap = hooksync::model::issue_snapshot(env);
    ASSERT_EQ(snap.key.value_or(""), std::string("PRJ-1"));
    ASSERT_EQ(snap.summary.value_or(""), std::string("Checkout broken"));
    ASSERT_EQ(snap.status.value_or(""), std::string("In Progress"));
    ASSERT_EQ(snap.priority.value_or(""), std::string("High"));
    ASSERT_EQ(snap.assignee.value_or(""), std::string("Dana"));
    ASSERT_EQ(snap.issue_type.value_or(""), std::string("Bug"));
    ASSERT_EQ(snap.project->key.value_or(""), std::string("PRJ"));
    ASSERT_EQ(snap.modified_at.value_or(0), 1525701837764LL);
}

void test_parser_native_project_event()
{
    const std::string body = R"({"webhookEvent":"project_created","timestamp":1705312800000,
        "project":{"id":10000,"key":"PRJ","name":"Platform",
                   "projectLead":{"displayName":"Ana"}}})";

    auto env = Parser::parse(body);
    ASSERT_EQ(env.source_id, std::string("10000"));

    auto snap = hooksync::model::project_snapshot(env);
    ASSERT_EQ(snap.name.value_or(""), std::string("Platform"));
    ASSERT_EQ(snap.lead.value_or(""), std::string("Ana"));
    // No lastModified / updated: the envelope timestamp is used.
    ASSERT_EQ(snap.modified_at.value_or(0), 1705312800000LL);
}

void test_parser_rejects_malformed()
{
    const std::string entity = R"({"id":"1","name":"x"})";

    ASSERT_THROWS(MalformedPayload, Parser::parse(""));
    ASSERT_THROWS(MalformedPayload, Parser::parse("   \n"));
    ASSERT_THROWS(MalformedPayload, Parser::parse("{not json"));
    ASSERT_THROWS(MalformedPayload, Parser::parse("[1, 2, 3]"));
    ASSERT_THROWS(MalformedPayload, Parser::parse(R"({"entityPayload":{"id":"1"}})"));
    ASSERT_THROWS(MalformedPayload, Parser::parse(R"({"eventType":"","entityPayload":{"id":"1"}})"));
    ASSERT_THROWS(MalformedPayload, Parser::parse(R"({"eventType":7,"entityPayload":{"id":"1"}})"));
    ASSERT_THROWS(MalformedPayload, Parser::parse(R"({"eventType":"jira:issue_created"})"));
    ASSERT_THROWS(MalformedPayload,
                  Parser::parse(R"({"eventType":"issue_created","entityPayload":"text"})"));
    ASSERT_THROWS(MalformedPayload,
                  Parser::parse(R"({"eventType":"issue_created","entityPayload":{"key":"A-1"}})"));
    ASSERT_THROWS(MalformedPayload,
                  Parser::parse(R"({"eventType":"issue_created","entityPayload":{"id":""}})"));
    ASSERT_THROWS(MalformedPayload,
                  Parser::parse(hooksync::test::envelope("project_created", entity, "yesterday")));
    ASSERT_THROWS(MalformedPayload,
                  Parser::parse(hooksync::test::envelope("project_created", entity), "text/plain"));
}

void test_parser_optional_timestamp_and_extra_fields()
{
    auto env = Parser::parse(
        R"({"eventType":"jira:issue_deleted","entityPayload":{"id":"10001","extra":[1,2]},"noise":true})");
    ASSERT_FALSE(env.timestamp.has_value());
    ASSERT_EQ(env.source_id, std::string("10001"));
}

void test_parser_media_types()
{
    ASSERT_TRUE(Parser::is_json_media_type("application/json"));
    ASSERT_TRUE(Parser::is_json_media_type("Application/JSON; charset=UTF-8"));
    ASSERT_TRUE(Parser::is_json_media_type("application/vnd.atlassian+json"));
    ASSERT_FALSE(Parser::is_json_media_type("text/plain"));
    ASSERT_FALSE(Parser::is_json_media_type("application/x-www-form-urlencoded"));
}

/**
 * @brief A present but unreadable modification time is a validation failure, not
 * a silent fallback to the envelope time.
 */
void test_snapshot_rejects_unreadable_modification_time()
{
    auto env = Parser::parse(hooksync::test::envelope(
        "project_updated", R"({"id":"10000","lastModified":"last tuesday"})"));
    ASSERT_THROWS(ValidationError, hooksync::model::project_snapshot(env));

    auto orphan = Parser::parse(hooksync::test::envelope(
        "issue_created", R"({"id":"1","summary":"x","project":{"key":"PRJ"}})"));
    ASSERT_THROWS(ValidationError, hooksync::model::issue_snapshot(orphan));
}

/**
 * @brief Numbers a double cannot carry exactly into an id or an epoch value are
 * rejected instead of being wrapped or merged.
 */
void test_parser_rejects_out_of_range_numbers()
{
    ASSERT_THROWS(MalformedPayload,
                  Parser::parse(R"({"eventType":"issue_updated","entityPayload":{"id":1e20}})"));
    ASSERT_THROWS(MalformedPayload,
                  Parser::parse(R"({"eventType":"issue_updated","entityPayload":{"id":2e20}})"));
    ASSERT_THROWS(MalformedPayload,
                  Parser::parse(R"({"eventType":"issue_updated","entityPayload":{"id":1e16}})"));

    auto largest = Parser::parse(
        R"({"eventType":"issue_updated","entityPayload":{"id":9007199254740991}})");
    ASSERT_EQ(largest.source_id, std::string("9007199254740991"));

    ASSERT_THROWS(MalformedPayload,
                  Parser::parse(R"({"eventType":"issue_updated","timestamp":1e300,)"
                                R"("entityPayload":{"id":"1"}})"));
    ASSERT_THROWS(MalformedPayload,
                  Parser::parse(R"({"eventType":"issue_updated","timestamp":-1e19,)"
                                R"("entityPayload":{"id":"1"}})"));
    auto numeric = Parser::parse(
        R"({"eventType":"issue_updated","timestamp":1705312800000,"entityPayload":{"id":"1"}})");
    ASSERT_EQ(numeric.timestamp.value_or(-1), 1705312800000LL);

    auto far_future = Parser::parse(hooksync::test::envelope(
        "project_updated", R"({"id":"10000","lastModified":1e20})"));
    ASSERT_THROWS(ValidationError, hooksync::model::project_snapshot(far_future));

    auto huge_parent = Parser::parse(hooksync::test::envelope(
        "issue_created", R"({"id":"1","summary":"x","projectId":1e20})"));
    ASSERT_THROWS(ValidationError, hooksync::model::issue_snapshot(huge_parent));
}

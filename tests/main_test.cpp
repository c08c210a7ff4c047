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
 * @file main_test.cpp
 * @brief Central orchestrator for the HookSync test suite.
 *
 * @details
 * This file serves as the main entry point for the testing environment. It
 * aggregates unit and integration tests across all subsystems:
 * Infrastructure, Storage, Sync pipeline, and Network endpoint.
 */

#include "framework.hpp"
#include "hooksync/infra/logger.hpp"

#include <iostream>

// ============================================================================
// Forward Declarations
// ============================================================================

// Infrastructure Subsystem (infra_test.cpp)
void test_uuid_length();
void test_uuid_uniqueness();
void test_string_trim();
void test_string_helpers();
void test_timestamp_parse_zones();
void test_timestamp_rejects_garbage();
void test_timestamp_format();
void test_keyed_mutex_serializes_key();
void test_keyed_mutex_independent_keys();
void test_scheduler_submit();
void test_config_from_json();
void test_config_defaults_and_errors();
void test_logger_threshold_and_sink();

// Storage Subsystem (storage_test.cpp)
void test_engine_append_and_load();
void test_engine_torn_tail();
void test_engine_failed_append_rolls_back();
void test_engine_checksum_mismatch();
void test_engine_compact();
void test_store_insert_assigns_identity();
void test_store_replay();
void test_store_revision_conflict();
void test_store_uniqueness_and_foreign_keys();
void test_store_touch_local_and_compact();
void test_store_survives_failed_append();
void test_store_replay_zeroes_unrepresentable_numbers();

// Payload Parser (parser_test.cpp)
void test_parser_canonical_envelope();
void test_parser_native_jira_shape();
void test_parser_native_project_event();
void test_parser_rejects_malformed();
void test_parser_optional_timestamp_and_extra_fields();
void test_parser_media_types();
void test_snapshot_rejects_unreadable_modification_time();
void test_parser_rejects_out_of_range_numbers();

// Event Classifier (dispatcher_test.cpp)
void test_dispatcher_default_routes();
void test_dispatcher_rejects_unknown();
void test_dispatcher_registration();

// Reconciliation (reconciler_test.cpp)
void test_reconcile_idempotent_redelivery();
void test_reconcile_out_of_order_converges();
void test_reconcile_duplicate_create_merges();
void test_reconcile_partial_merge();
void test_reconcile_delete_idempotent_soft();
void test_reconcile_delete_idempotent_hard();
void test_reconcile_orphan_issue_placeholder();
void test_reconcile_cascade_soft();
void test_reconcile_cascade_hard();
void test_reconcile_cascade_skips_issue_moved_away();
void test_reconcile_relinks_moved_issue();
void test_reconcile_requires_parent_for_unknown_issue();
void test_reconcile_respects_local_edits();
void test_reconcile_propagates_store_failures();
void test_reconcile_concurrent_same_record();

// Ingest Pipeline (ingestor_test.cpp)
void test_ingest_end_to_end_project_lifecycle();
void test_ingest_rejects_unknown_event();
void test_ingest_ignore_policy();
void test_ingest_rejects_bad_input();
void test_ingest_issue_lifecycle();
void test_ingest_health_counters();

// Endpoint (http_test.cpp)
void test_http_parse_head();
void test_http_incomplete_and_malformed();
void test_http_serialize();
void test_server_dispatch_routes();
void test_server_sheds_load_when_backlog_full();

/**
 * @brief Test Suite Execution Entry Point.
 *
 * @return
 * - 0: All tests passed.
 * - 1: One or more assertions failed.
 */
int main()
{
    std::cout << "\033[36mInitiating HookSync Test Suite...\033[0m" << std::endl;

    // Pipeline logging is exercised, not inspected, outside the logger test.
    hooksync::infra::Logger::set_level(hooksync::infra::LogLevel::FATAL);

    // --- 1. Infrastructure ---
    RUN_TEST(test_uuid_length);
    RUN_TEST(test_uuid_uniqueness);
    RUN_TEST(test_string_trim);
    RUN_TEST(test_string_helpers);
    RUN_TEST(test_timestamp_parse_zones);
    RUN_TEST(test_timestamp_rejects_garbage);
    RUN_TEST(test_timestamp_format);
    RUN_TEST(test_keyed_mutex_serializes_key);
    RUN_TEST(test_keyed_mutex_independent_keys);
    RUN_TEST(test_scheduler_submit);
    RUN_TEST(test_config_from_json);
    RUN_TEST(test_config_defaults_and_errors);
    RUN_TEST(test_logger_threshold_and_sink);

    // --- 2. Storage ---
    RUN_TEST(test_engine_append_and_load);
    RUN_TEST(test_engine_torn_tail);
    RUN_TEST(test_engine_failed_append_rolls_back);
    RUN_TEST(test_engine_checksum_mismatch);
    RUN_TEST(test_engine_compact);
    RUN_TEST(test_store_insert_assigns_identity);
    RUN_TEST(test_store_replay);
    RUN_TEST(test_store_revision_conflict);
    RUN_TEST(test_store_uniqueness_and_foreign_keys);
    RUN_TEST(test_store_touch_local_and_compact);
    RUN_TEST(test_store_survives_failed_append);
    RUN_TEST(test_store_replay_zeroes_unrepresentable_numbers);

    // --- 3. Parse & classify ---
    RUN_TEST(test_parser_canonical_envelope);
    RUN_TEST(test_parser_native_jira_shape);
    RUN_TEST(test_parser_native_project_event);
    RUN_TEST(test_parser_rejects_malformed);
    RUN_TEST(test_parser_optional_timestamp_and_extra_fields);
    RUN_TEST(test_parser_media_types);
    RUN_TEST(test_snapshot_rejects_unreadable_modification_time);
    RUN_TEST(test_parser_rejects_out_of_range_numbers);
    RUN_TEST(test_dispatcher_default_routes);
    RUN_TEST(test_dispatcher_rejects_unknown);
    RUN_TEST(test_dispatcher_registration);

    // --- 4. Reconciliation ---
    RUN_TEST(test_reconcile_idempotent_redelivery);
    RUN_TEST(test_reconcile_out_of_order_converges);
    RUN_TEST(test_reconcile_duplicate_create_merges);
    RUN_TEST(test_reconcile_partial_merge);
    RUN_TEST(test_reconcile_delete_idempotent_soft);
    RUN_TEST(test_reconcile_delete_idempotent_hard);
    RUN_TEST(test_reconcile_orphan_issue_placeholder);
    RUN_TEST(test_reconcile_cascade_soft);
    RUN_TEST(test_reconcile_cascade_hard);
    RUN_TEST(test_reconcile_cascade_skips_issue_moved_away);
    RUN_TEST(test_reconcile_relinks_moved_issue);
    RUN_TEST(test_reconcile_requires_parent_for_unknown_issue);
    RUN_TEST(test_reconcile_respects_local_edits);
    RUN_TEST(test_reconcile_propagates_store_failures);
    RUN_TEST(test_reconcile_concurrent_same_record);

    // --- 5. Ingest pipeline & endpoint ---
    RUN_TEST(test_ingest_end_to_end_project_lifecycle);
    RUN_TEST(test_ingest_rejects_unknown_event);
    RUN_TEST(test_ingest_ignore_policy);
    RUN_TEST(test_ingest_rejects_bad_input);
    RUN_TEST(test_ingest_issue_lifecycle);
    RUN_TEST(test_ingest_health_counters);
    RUN_TEST(test_http_parse_head);
    RUN_TEST(test_http_incomplete_and_malformed);
    RUN_TEST(test_http_serialize);
    RUN_TEST(test_server_dispatch_routes);
    RUN_TEST(test_server_sheds_load_when_backlog_full);

    hooksync::test::print_summary();

    return (hooksync::test::failed_count > 0) ? 1 : 0;
}

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
 * @brief Central orchestrator for the docgate Test Suite.
 *
 * @details
 * This file serves as the main entry point for the testing environment. It
 * aggregates unit and integration tests across all subsystems: Infrastructure,
 * Value Tree, Security, Executors, Store, Gateway, Network and Configuration.
 */

#include "docgate/infra/logger.hpp"
#include "framework.hpp"

#include <iostream>

// ============================================================================
// Forward Declarations
// ============================================================================
// The following test functions are implemented in their respective
// translation units (e.g., infra_test.cpp, dispatcher_test.cpp, etc.).

// Infrastructure (infra_test.cpp)
void test_id_generator_uniqueness();
void test_string_trim();
void test_string_trim_empty();
void test_string_strip_control();
void test_string_hex();
void test_base64_vectors();
void test_base64_rejects_malformed();
void test_logger_parse_level();
void test_logger_threshold();

// Value Tree & JSON Codec (bson_test.cpp)
void test_codec_preserves_key_order();
void test_codec_integral_numbers_are_int64();
void test_codec_extended_json();
void test_codec_extended_json_needs_single_key();
void test_codec_rejects_malformed_extended_json();
void test_codec_rejects_syntax_errors();
void test_object_id_parse();
void test_document_operations();
void test_value_compare();
void test_type_names();

// Sanitizer (sanitizer_test.cpp)
void test_sanitize_string_strips_and_trims();
void test_sanitize_string_idempotent();
void test_sanitize_string_length_bound();
void test_sanitize_string_rejects_non_string();
void test_check_depth_boundary();
void test_check_depth_counts_arrays();
void test_sanitize_structure_preserves_clean_input();
void test_sanitize_structure_cleans_keys_and_values();
void test_sanitize_structure_refuses_minted_operator_keys();
void test_sanitize_query_enforces_depth();
void test_sanitize_document_size_bound();

// Validators (validator_test.cpp)
void test_query_where_depends_on_mode();
void test_query_unknown_operator_always_rejected();
void test_query_safe_operators_accepted();
void test_query_rejection_location();
void test_query_must_be_object();
void test_pipeline_length_bound();
void test_pipeline_out_rejected_in_safe_mode();
void test_pipeline_stage_shape();
void test_namespace_names();

// Executors (executor_test.cpp)
void test_find_forwards_safe_query();
void test_find_rejection_never_reaches_store();
void test_find_rejects_keys_cleaned_into_operators();
void test_find_limit_clamping();
void test_find_normalizes_ids();
void test_find_one_returns_null_when_absent();
void test_count_sanitizes_filter();
void test_writes_require_dangerous_mode();
void test_insert_reports_identifier();
void test_update_passes_options();
void test_delete_reports_count();
void test_store_failure_becomes_execution_failed();
void test_aggregate_appends_limit();
void test_aggregate_keeps_explicit_limit();
void test_aggregate_limit_precedes_write_stage();
void test_aggregate_rejects_out_in_safe_mode();
void test_aggregate_rejects_stage_cleaned_into_operator();
void test_aggregate_enforces_stage_depth();
void test_create_index_options();
void test_collection_stats_mapping();
void test_database_stats_defaults_missing_fields();
void test_list_collections_shape();
void test_describe_collection_samples_ids();

// In-Memory Store (memory_store_test.cpp)
void test_store_find_filters_and_sorts();
void test_store_find_skip_limit_projection();
void test_store_find_rejects_negative_paging();
void test_store_missing_collection_reads_empty();
void test_store_find_one_and_count();
void test_store_exhausted_budget_aborts_scan();
void test_store_regex_bounds_subject_length();
void test_store_insert_generates_object_id();
void test_store_insert_rejects_duplicate_id();
void test_store_update_operators();
void test_store_update_counts_unchanged_matches();
void test_store_upsert_seeds_from_filter();
void test_store_update_rejects_malformed_specs();
void test_store_delete_many();
void test_store_unique_index_enforced();
void test_store_unique_index_rolled_back_on_conflict();
void test_store_index_listing_and_recreation();
void test_store_metadata();
void test_store_aggregate_group();
void test_store_aggregate_unwind_and_count();
void test_store_aggregate_lookup_and_facet();
void test_store_aggregate_out_replaces_target();
void test_store_aggregate_rejects_bad_stages();

// Tool Registry (gateway_test.cpp)
void test_gateway_catalog_order();
void test_gateway_schema_lists_required_arguments();
void test_gateway_unknown_tool();
void test_gateway_argument_checks();
void test_gateway_null_means_absent();
void test_gateway_structured_payload_reaches_validator();

// JSON-RPC Surface (dispatcher_test.cpp)
void test_dispatch_initialize();
void test_dispatch_tools_list();
void test_dispatch_tool_call_result();
void test_dispatch_find_returns_structured_content();
void test_dispatch_ping_and_notifications();
void test_dispatch_shutdown();
void test_dispatch_parse_error();
void test_dispatch_invalid_request();
void test_dispatch_method_and_tool_not_found();
void test_dispatch_invalid_params();
void test_dispatch_validation_error_data();
void test_dispatch_permission_denied();
void test_dispatch_execution_failed();
void test_stdio_server_answers_each_line();
void test_stdio_server_stops_on_shutdown();

// Settings (config_test.cpp)
void test_config_defaults();
void test_config_reads_environment();
void test_config_flags_override_environment();
void test_config_switch_without_value();
void test_config_default_limit_clamped();
void test_config_rejects_bad_values();
void test_config_rejects_bad_arguments();
void test_config_help();

/**
 * @brief Test Suite Execution Entry Point.
 *
 * @return
 * - 0: All tests passed (Success).
 * - 1: One or more assertions failed (Exit failure for CI pipelines).
 */
int main()
{
    std::cout << "\033[36mInitiating docgate Test Suite...\033[0m" << std::endl;

    // Keep expected rejections from flooding stderr.
    docgate::infra::Logger::set_level(docgate::infra::LogLevel::FATAL);

    // --- 1. Infrastructure ---
    // Verifies the foundational blocks (ID Generator, String, Base64, Logger).
    RUN_TEST(test_id_generator_uniqueness);
    RUN_TEST(test_string_trim);
    RUN_TEST(test_string_trim_empty);
    RUN_TEST(test_string_strip_control);
    RUN_TEST(test_string_hex);
    RUN_TEST(test_base64_vectors);
    RUN_TEST(test_base64_rejects_malformed);
    RUN_TEST(test_logger_parse_level);
    RUN_TEST(test_logger_threshold);

    // --- 2. Value Tree & JSON Codec ---
    // Verifies ordered documents, comparison and Extended JSON.
    RUN_TEST(test_codec_preserves_key_order);
    RUN_TEST(test_codec_integral_numbers_are_int64);
    RUN_TEST(test_codec_extended_json);
    RUN_TEST(test_codec_extended_json_needs_single_key);
    RUN_TEST(test_codec_rejects_malformed_extended_json);
    RUN_TEST(test_codec_rejects_syntax_errors);
    RUN_TEST(test_object_id_parse);
    RUN_TEST(test_document_operations);
    RUN_TEST(test_value_compare);
    RUN_TEST(test_type_names);

    // --- 3. Sanitizer ---
    // Verifies string cleanup, depth and size bounds.
    RUN_TEST(test_sanitize_string_strips_and_trims);
    RUN_TEST(test_sanitize_string_idempotent);
    RUN_TEST(test_sanitize_string_length_bound);
    RUN_TEST(test_sanitize_string_rejects_non_string);
    RUN_TEST(test_check_depth_boundary);
    RUN_TEST(test_check_depth_counts_arrays);
    RUN_TEST(test_sanitize_structure_preserves_clean_input);
    RUN_TEST(test_sanitize_structure_cleans_keys_and_values);
    RUN_TEST(test_sanitize_structure_refuses_minted_operator_keys);
    RUN_TEST(test_sanitize_query_enforces_depth);
    RUN_TEST(test_sanitize_document_size_bound);

    // --- 4. Validators ---
    // Verifies operator, stage and namespace policies.
    RUN_TEST(test_query_where_depends_on_mode);
    RUN_TEST(test_query_unknown_operator_always_rejected);
    RUN_TEST(test_query_safe_operators_accepted);
    RUN_TEST(test_query_rejection_location);
    RUN_TEST(test_query_must_be_object);
    RUN_TEST(test_pipeline_length_bound);
    RUN_TEST(test_pipeline_out_rejected_in_safe_mode);
    RUN_TEST(test_pipeline_stage_shape);
    RUN_TEST(test_namespace_names);

    // --- 5. Executors ---
    // Verifies the gateway contract against a recording store.
    RUN_TEST(test_find_forwards_safe_query);
    RUN_TEST(test_find_rejection_never_reaches_store);
    RUN_TEST(test_find_rejects_keys_cleaned_into_operators);
    RUN_TEST(test_find_limit_clamping);
    RUN_TEST(test_find_normalizes_ids);
    RUN_TEST(test_find_one_returns_null_when_absent);
    RUN_TEST(test_count_sanitizes_filter);
    RUN_TEST(test_writes_require_dangerous_mode);
    RUN_TEST(test_insert_reports_identifier);
    RUN_TEST(test_update_passes_options);
    RUN_TEST(test_delete_reports_count);
    RUN_TEST(test_store_failure_becomes_execution_failed);
    RUN_TEST(test_aggregate_appends_limit);
    RUN_TEST(test_aggregate_keeps_explicit_limit);
    RUN_TEST(test_aggregate_limit_precedes_write_stage);
    RUN_TEST(test_aggregate_rejects_out_in_safe_mode);
    RUN_TEST(test_aggregate_rejects_stage_cleaned_into_operator);
    RUN_TEST(test_aggregate_enforces_stage_depth);
    RUN_TEST(test_create_index_options);
    RUN_TEST(test_collection_stats_mapping);
    RUN_TEST(test_database_stats_defaults_missing_fields);
    RUN_TEST(test_list_collections_shape);
    RUN_TEST(test_describe_collection_samples_ids);

    // --- 6. In-Memory Store ---
    // Verifies CRUD, indexes and the aggregation engine.
    RUN_TEST(test_store_find_filters_and_sorts);
    RUN_TEST(test_store_find_skip_limit_projection);
    RUN_TEST(test_store_find_rejects_negative_paging);
    RUN_TEST(test_store_missing_collection_reads_empty);
    RUN_TEST(test_store_find_one_and_count);
    RUN_TEST(test_store_exhausted_budget_aborts_scan);
    RUN_TEST(test_store_regex_bounds_subject_length);
    RUN_TEST(test_store_insert_generates_object_id);
    RUN_TEST(test_store_insert_rejects_duplicate_id);
    RUN_TEST(test_store_update_operators);
    RUN_TEST(test_store_update_counts_unchanged_matches);
    RUN_TEST(test_store_upsert_seeds_from_filter);
    RUN_TEST(test_store_update_rejects_malformed_specs);
    RUN_TEST(test_store_delete_many);
    RUN_TEST(test_store_unique_index_enforced);
    RUN_TEST(test_store_unique_index_rolled_back_on_conflict);
    RUN_TEST(test_store_index_listing_and_recreation);
    RUN_TEST(test_store_metadata);
    RUN_TEST(test_store_aggregate_group);
    RUN_TEST(test_store_aggregate_unwind_and_count);
    RUN_TEST(test_store_aggregate_lookup_and_facet);
    RUN_TEST(test_store_aggregate_out_replaces_target);
    RUN_TEST(test_store_aggregate_rejects_bad_stages);

    // --- 7. Tool Registry ---
    // Verifies the catalog and argument checks.
    RUN_TEST(test_gateway_catalog_order);
    RUN_TEST(test_gateway_schema_lists_required_arguments);
    RUN_TEST(test_gateway_unknown_tool);
    RUN_TEST(test_gateway_argument_checks);
    RUN_TEST(test_gateway_null_means_absent);
    RUN_TEST(test_gateway_structured_payload_reaches_validator);

    // --- 8. JSON-RPC Surface ---
    // Verifies envelopes, error codes and the stdio loop (JSON-In -> Execute -> JSON-Out).
    RUN_TEST(test_dispatch_initialize);
    RUN_TEST(test_dispatch_tools_list);
    RUN_TEST(test_dispatch_tool_call_result);
    RUN_TEST(test_dispatch_find_returns_structured_content);
    RUN_TEST(test_dispatch_ping_and_notifications);
    RUN_TEST(test_dispatch_shutdown);
    RUN_TEST(test_dispatch_parse_error);
    RUN_TEST(test_dispatch_invalid_request);
    RUN_TEST(test_dispatch_method_and_tool_not_found);
    RUN_TEST(test_dispatch_invalid_params);
    RUN_TEST(test_dispatch_validation_error_data);
    RUN_TEST(test_dispatch_permission_denied);
    RUN_TEST(test_dispatch_execution_failed);
    RUN_TEST(test_stdio_server_answers_each_line);
    RUN_TEST(test_stdio_server_stops_on_shutdown);

    // --- 9. Settings ---
    // Verifies environment and flag parsing.
    RUN_TEST(test_config_defaults);
    RUN_TEST(test_config_reads_environment);
    RUN_TEST(test_config_flags_override_environment);
    RUN_TEST(test_config_switch_without_value);
    RUN_TEST(test_config_default_limit_clamped);
    RUN_TEST(test_config_rejects_bad_values);
    RUN_TEST(test_config_rejects_bad_arguments);
    RUN_TEST(test_config_help);

    // Render the final results summary to stdout.
    docgate::test::print_summary();

    // Signal exit status: Non-zero if failures occurred.
    return (docgate::test::failed_count == 0) ? 0 : 1;
}

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
 * @file processors.hpp
 * @brief The six entity processors: {project, issue} x {created, updated, deleted}.
 *
 * @details
 * A processor validates the snapshot fields its operation requires, then performs
 * exactly one reconciliation. Missing fields raise `model::ValidationError`, which
 * the ingest pipeline reports as a non-retriable rejection.
 */

#pragma once

#include "hooksync/model/envelope.hpp"
#include "hooksync/sync/reconciler.hpp"

#include <functional>

namespace hooksync::sync {

/// @brief Collaborators handed to every processor invocation.
struct ProcessorContext {
    Reconciler& reconciler;
};

struct ProcessResult {
    model::ExternalEntityRef ref;
    Resolution resolution;
};

using ProcessFn =
    std::function<ProcessResult(const ProcessorContext&, const model::WebhookEnvelope&)>;

/// @brief Requires `id`, `name` and a modification time.
ProcessResult process_project_created(const ProcessorContext& ctx,
                                      const model::WebhookEnvelope& envelope);
/// @brief Requires `id` and a modification time.
ProcessResult process_project_updated(const ProcessorContext& ctx,
                                      const model::WebhookEnvelope& envelope);
/// @brief Requires `id`.
ProcessResult process_project_deleted(const ProcessorContext& ctx,
                                      const model::WebhookEnvelope& envelope);

/// @brief Requires `id`, `summary`, a project reference and a modification time.
ProcessResult process_issue_created(const ProcessorContext& ctx,
                                    const model::WebhookEnvelope& envelope);
/**
 * @brief Requires `id` and a modification time. A project reference is also
 * required when the issue is not yet known locally (checked by the reconciler).
 */
ProcessResult process_issue_updated(const ProcessorContext& ctx,
                                    const model::WebhookEnvelope& envelope);
ProcessResult process_issue_deleted(const ProcessorContext& ctx,
                                    const model::WebhookEnvelope& envelope);

} // namespace hooksync::sync

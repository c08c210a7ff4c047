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
 * @file issue_processors.cpp
 * @brief Issue created / updated / deleted handlers.
 */

#include "hooksync/model/errors.hpp"
#include "hooksync/model/snapshot.hpp"
#include "hooksync/sync/processors.hpp"

namespace hooksync::sync {

namespace {

void require_modified(const model::IssueSnapshot& snap)
{
    if (!snap.modified_at)
        throw model::ValidationError("Issue " + snap.source_id +
                                     " carries no modification time (lastModified/updated/timestamp)");
}

} // namespace

ProcessResult process_issue_created(const ProcessorContext& ctx,
                                    const model::WebhookEnvelope& envelope)
{
    const model::IssueSnapshot snap = model::issue_snapshot(envelope);
    if (!snap.summary || snap.summary->empty())
        throw model::ValidationError("Issue " + snap.source_id + " is missing 'summary'");
    if (!snap.project)
        throw model::ValidationError("Issue " + snap.source_id + " is missing a project reference");
    require_modified(snap);

    return {snap.ref(), ctx.reconciler.resolve(snap, model::Operation::CREATED)};
}

ProcessResult process_issue_updated(const ProcessorContext& ctx,
                                    const model::WebhookEnvelope& envelope)
{
    const model::IssueSnapshot snap = model::issue_snapshot(envelope);
    require_modified(snap);

    return {snap.ref(), ctx.reconciler.resolve(snap, model::Operation::UPDATED)};
}

ProcessResult process_issue_deleted(const ProcessorContext& ctx,
                                    const model::WebhookEnvelope& envelope)
{
    const model::IssueSnapshot snap = model::issue_snapshot(envelope);
    return {snap.ref(), ctx.reconciler.resolve(snap, model::Operation::DELETED)};
}

} // namespace hooksync::sync

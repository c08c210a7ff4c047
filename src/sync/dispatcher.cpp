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
 * @file dispatcher.cpp
 * @brief Implementation of the event routing table.
 */

#include "hooksync/sync/dispatcher.hpp"

#include "hooksync/model/errors.hpp"

#include <stdexcept>

namespace hooksync::sync {

void Dispatcher::register_processor(const std::string& event_name, Processor processor)
{
    const std::string name = model::event_name(event_name);
    if (name.empty())
        throw std::invalid_argument("Dispatcher: empty event name");
    if (!processor.fn)
        throw std::invalid_argument("Dispatcher: processor for '" + name + "' has no function");

    auto [it, inserted] = table_.emplace(name, std::move(processor));
    if (!inserted)
        throw std::invalid_argument("Dispatcher: '" + name + "' is already registered");
}

const Processor& Dispatcher::classify(const std::string& event_type) const
{
    auto it = table_.find(model::event_name(event_type));
    if (it == table_.end())
        throw model::UnsupportedEventType(event_type);
    return it->second;
}

bool Dispatcher::supports(const std::string& event_type) const
{
    return table_.count(model::event_name(event_type)) > 0;
}

std::vector<std::string> Dispatcher::event_names() const
{
    std::vector<std::string> names;
    names.reserve(table_.size());
    for (const auto& entry : table_)
        names.push_back(entry.first);
    return names;
}

Dispatcher Dispatcher::default_registry()
{
    using model::EntityKind;
    using model::Operation;

    Dispatcher d;
    d.register_processor("project_created",
                         {EntityKind::PROJECT, Operation::CREATED, process_project_created});
    d.register_processor("project_updated",
                         {EntityKind::PROJECT, Operation::UPDATED, process_project_updated});
    d.register_processor("project_deleted",
                         {EntityKind::PROJECT, Operation::DELETED, process_project_deleted});
    d.register_processor("issue_created",
                         {EntityKind::ISSUE, Operation::CREATED, process_issue_created});
    d.register_processor("issue_updated",
                         {EntityKind::ISSUE, Operation::UPDATED, process_issue_updated});
    d.register_processor("issue_deleted",
                         {EntityKind::ISSUE, Operation::DELETED, process_issue_deleted});
    return d;
}

} // namespace hooksync::sync

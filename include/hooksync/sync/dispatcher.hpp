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
 * @file dispatcher.hpp
 * @brief Event classifier: maps an event tag to its entity processor.
 *
 * @details
 * The routing table is data, not a conditional chain. It is built once at startup
 * and only read afterwards, so concurrent `classify` calls need no locking.
 */

#pragma once

#include "hooksync/sync/processors.hpp"

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace hooksync::sync {

/**
 * @struct Processor
 * @brief One routing table entry.
 */
struct Processor {
    model::EntityKind kind = model::EntityKind::PROJECT;
    model::Operation operation = model::Operation::CREATED;
    ProcessFn fn;
};

class Dispatcher {
  public:
    /**
     * @brief Adds a route for @p event_name (domain prefix, if any, is stripped).
     *
     * @throws std::invalid_argument If the name is empty, already registered, or
     * @p processor has no function.
     */
    void register_processor(const std::string& event_name, Processor processor);

    /**
     * @brief Exact-match lookup after the `"<domain>:"` prefix is stripped.
     *
     * @throws model::UnsupportedEventType If no processor is registered.
     */
    const Processor& classify(const std::string& event_type) const;

    bool supports(const std::string& event_type) const;

    /// @brief Registered event names in lexical order.
    std::vector<std::string> event_names() const;

    size_t size() const { return table_.size(); }

    /**
     * @brief The six built-in routes:
     * `project_created`, `project_updated`, `project_deleted`,
     * `issue_created`, `issue_updated`, `issue_deleted`.
     */
    static Dispatcher default_registry();

  private:
    std::map<std::string, Processor> table_;
};

} // namespace hooksync::sync

/**
 * @file AuditSink.hpp
 * @brief Append-only destination for completed exchanges.
 */

#pragma once
#include "domain/ChatExchange.hpp"

namespace promptwarden::domain {

class AuditSink {
public:
    virtual ~AuditSink() = default;

    /** @brief Records the exchange. Must not block the caller on I/O. */
    virtual void record(const ChatExchange& exchange) = 0;
};

} // namespace promptwarden::domain

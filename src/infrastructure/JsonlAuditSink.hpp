/**
 * @file JsonlAuditSink.hpp
 * @brief Append-only JSON-lines audit log written from a background thread.
 */

#pragma once
#include <atomic>
#include <condition_variable>
#include <filesystem>
#include <mutex>
#include <queue>
#include <string>
#include <thread>

#include "domain/AuditSink.hpp"

namespace promptwarden::infrastructure {

/**
 * @class JsonlAuditSink
 * @brief Serializes each exchange on the caller's thread and appends it on a worker.
 *
 * All appends pass through a single queue, so lines from concurrent exchanges
 * never interleave.
 */
class JsonlAuditSink : public domain::AuditSink {
public:
    explicit JsonlAuditSink(std::filesystem::path path);
    ~JsonlAuditSink() override;

    JsonlAuditSink(const JsonlAuditSink&) = delete;
    JsonlAuditSink& operator=(const JsonlAuditSink&) = delete;

    void record(const domain::ChatExchange& exchange) override;

    /**
     * @brief Stops the worker thread after every queued line is written.
     */
    void stop();

    const std::filesystem::path& path() const { return m_path; }

private:
    void workerLoop();

    /** @brief Appends one line. Failures are logged and the line is dropped. */
    void append(const std::string& line);

    std::filesystem::path m_path;

    std::queue<std::string> m_queue;
    std::mutex m_mutex;
    std::condition_variable m_cv;

    std::thread m_worker;
    std::atomic<bool> m_running;
};

} // namespace promptwarden::infrastructure

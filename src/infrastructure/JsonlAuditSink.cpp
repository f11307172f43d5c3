/**
 * @file JsonlAuditSink.cpp
 * @brief Implementation of JsonlAuditSink.
 */

#include "infrastructure/JsonlAuditSink.hpp"
#include "infrastructure/ExchangeJson.hpp"
#include <fstream>
#include <iostream>

namespace promptwarden::infrastructure {

namespace fs = std::filesystem;

JsonlAuditSink::JsonlAuditSink(fs::path path)
    : m_path(std::move(path)), m_running(true) {
    if (m_path.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(m_path.parent_path(), ec);
        if (ec) {
            std::cerr << "[JsonlAuditSink] Error creating directories: " << ec.message() << std::endl;
        }
    }
    m_worker = std::thread(&JsonlAuditSink::workerLoop, this);
    std::cout << "[JsonlAuditSink] Writing audit trail to " << m_path.string() << std::endl;
}

JsonlAuditSink::~JsonlAuditSink() {
    stop();
}

void JsonlAuditSink::stop() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_running) return;
        m_running = false;
    }
    m_cv.notify_all();

    if (m_worker.joinable()) {
        m_worker.join();
    }
}

void JsonlAuditSink::record(const domain::ChatExchange& exchange) {
    std::string line = ExchangeJson::AuditRecord(exchange).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_running) {
            std::cerr << "[JsonlAuditSink] Dropping record after stop()." << std::endl;
            return;
        }
        m_queue.push(std::move(line));
    }
    m_cv.notify_one();
}

void JsonlAuditSink::workerLoop() {
    while (true) {
        std::string line;

        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_cv.wait(lock, [this] {
                return !m_queue.empty() || !m_running;
            });

            if (!m_running && m_queue.empty()) {
                return;
            }

            if (m_queue.empty()) {
                continue;
            }

            line = std::move(m_queue.front());
            m_queue.pop();
        }

        // Write outside lock
        append(line);
    }
}

void JsonlAuditSink::append(const std::string& line) {
    std::ofstream ofs(m_path, std::ios::app);
    if (!ofs.is_open()) {
        std::cerr << "[JsonlAuditSink] Failed to open " << m_path << std::endl;
        return;
    }
    ofs << line << '\n';
    if (ofs.fail()) {
        std::cerr << "[JsonlAuditSink] Write failed: " << m_path << std::endl;
    }
}

} // namespace promptwarden::infrastructure

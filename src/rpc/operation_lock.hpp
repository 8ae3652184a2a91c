#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include "utils/common.hpp"

namespace reportd::rpc {

// Process-wide set of in-flight operation identifiers. Each registration is
// released by End or, failing that, by a timer on a private io_context thread.
class NamedOperationLock {
public:
    NamedOperationLock();
    ~NamedOperationLock();

    NamedOperationLock(const NamedOperationLock&) = delete;
    NamedOperationLock& operator=(const NamedOperationLock&) = delete;

    // False when the identifier is already registered.
    bool Begin(const std::string& identifier,
               std::chrono::milliseconds timeout = std::chrono::seconds(300));
    // False when nothing was registered under the identifier.
    bool End(const std::string& identifier);

    bool IsHeld(const std::string& identifier) const;
    std::size_t size() const;

private:
    struct Entry {
        std::uint64_t generation = 0;
        utils::TimePoint started_at;
        std::chrono::milliseconds timeout{0};
        std::shared_ptr<boost::asio::steady_timer> timer;
    };

    void Expire(const std::string& identifier, std::uint64_t generation);

    boost::asio::io_context io_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_;
    std::thread thread_;

    mutable std::mutex mutex_;
    std::map<std::string, Entry> entries_;
    std::uint64_t next_generation_ = 1;
};

}  // namespace reportd::rpc

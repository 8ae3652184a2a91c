#include "rpc/operation_lock.hpp"

#include <boost/asio/post.hpp>
#include <boost/system/error_code.hpp>

#include "utils/logging.hpp"

namespace reportd::rpc {
namespace {

constexpr const char* kTag = "rpc";

}  // namespace

NamedOperationLock::NamedOperationLock()
    : work_(boost::asio::make_work_guard(io_))
    , thread_([this]() { io_.run(); }) {}

NamedOperationLock::~NamedOperationLock() {
    work_.reset();
    io_.stop();
    if (thread_.joinable()) {
        thread_.join();
    }
}

bool NamedOperationLock::Begin(const std::string& identifier, std::chrono::milliseconds timeout) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (entries_.count(identifier) > 0) {
        utils::LogWarn(kTag, "operation already in progress", {{"operation", identifier}});
        return false;
    }

    Entry entry;
    entry.generation = next_generation_++;
    entry.started_at = utils::Now();
    entry.timeout = timeout;
    entry.timer = std::make_shared<boost::asio::steady_timer>(io_);

    const auto generation = entry.generation;
    auto timer = entry.timer;
    entries_.emplace(identifier, std::move(entry));

    boost::asio::post(io_, [this, timer, timeout, identifier, generation]() {
        timer->expires_after(timeout);
        timer->async_wait([this, timer, identifier, generation](const boost::system::error_code& ec) {
            if (ec) {
                return;
            }
            Expire(identifier, generation);
        });
    });
    utils::LogDebug(kTag, "operation started", {
        {"operation", identifier},
        {"timeout_ms", std::to_string(timeout.count())}});
    return true;
}

bool NamedOperationLock::End(const std::string& identifier) {
    std::shared_ptr<boost::asio::steady_timer> timer;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(identifier);
        if (it == entries_.end()) {
            return false;
        }
        timer = it->second.timer;
        entries_.erase(it);
    }
    boost::asio::post(io_, [timer]() { timer->cancel(); });
    utils::LogDebug(kTag, "operation ended", {{"operation", identifier}});
    return true;
}

bool NamedOperationLock::IsHeld(const std::string& identifier) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.count(identifier) > 0;
}

std::size_t NamedOperationLock::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

void NamedOperationLock::Expire(const std::string& identifier, std::uint64_t generation) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(identifier);
    // A newer registration under the same name keeps its own timer.
    if (it == entries_.end() || it->second.generation != generation) {
        return;
    }
    entries_.erase(it);
    utils::LogWarn(kTag, "operation timed out, releasing", {{"operation", identifier}});
}

}  // namespace reportd::rpc

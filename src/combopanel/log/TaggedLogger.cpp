#ifdef CP_LOG_DEBUG
#include "TaggedLogger.hpp"

#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace CP {

std::mutex                  TaggedLogger::coutMutex;
thread_local std::string    TaggedLogger::currentThreadName;

TaggedLogger& logger() {
    static TaggedLogger instance;
    return instance;
}

TaggedLogger::TaggedLogger() : running(true), loggingEnabled(false) {
    this->workerThread = std::thread(&TaggedLogger::processQueue, this);
}

TaggedLogger::~TaggedLogger() {
    {
        std::unique_lock<std::mutex> lock(this->queueMutex);
        this->running = false;
        this->cv.notify_one();
    }
    if (this->workerThread.joinable()) {
        this->workerThread.join();
    }
}

auto TaggedLogger::setThreadName(const std::string& name) -> void {
    currentThreadName = name;
}

auto TaggedLogger::setLoggingEnabled(bool enabled) -> void {
    loggingEnabled.store(enabled, std::memory_order_relaxed);
}

auto TaggedLogger::processQueue() -> void {
    std::unique_lock<std::mutex> lock(this->queueMutex);
    while (true) {
        this->cv.wait(lock, [this] { return !this->messageQueue.empty() || !this->running; });
        if (!this->running && this->messageQueue.empty()) {
            return;
        }
        while (!this->messageQueue.empty()) {
            const auto msg = std::move(this->messageQueue.front());
            this->messageQueue.pop();
            lock.unlock();
            this->writeToStderr(msg);
            lock.lock();
        }
    }
}

auto TaggedLogger::writeToStderr(const LogMessage& msg) const -> void {
    for (auto const& tag : msg.tags)
        if (this->skipTags.contains(tag))
            return;

    const auto  nowMs    = std::chrono::duration_cast<std::chrono::milliseconds>(msg.timestamp.time_since_epoch()) % 1000;
    const auto  nowTimeT = std::chrono::system_clock::to_time_t(msg.timestamp);
    const auto* nowTm    = std::localtime(&nowTimeT);

    std::ostringstream oss;
    oss << std::put_time(nowTm, "%H:%M:%S") << '.' << std::setfill('0') << std::setw(3) << nowMs.count() << ' ';
    for (auto const& tag : msg.tags)
        oss << '[' << tag << ']';
    if (!msg.threadName.empty())
        oss << " [" << msg.threadName << ']';
    oss << ' ' << msg.message << '\n';

    std::lock_guard<std::mutex> lock(coutMutex);
    std::cerr << oss.str() << std::flush;
}

void set_thread_name(const std::string& name) {
    TaggedLogger::setThreadName(name);
}

void set_logging_enabled(bool enabled) {
    logger().setLoggingEnabled(enabled);
}

} // namespace CP
#endif // CP_LOG_DEBUG

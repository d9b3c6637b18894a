#ifndef MAPCORE_PRINTER_HPP
#define MAPCORE_PRINTER_HPP

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <iostream>
#include <mutex>
#include <queue>
#include <string>
#include <thread>

#include "log.hpp"
#include "thread/affinity.hpp"

namespace mapcore
{
namespace util
{

// Serialises output from many worker threads through one background
// thread, so progress lines from a stress run never interleave.
class printer final
{
public:
    inline explicit printer(int core_id) noexcept;
    inline ~printer() noexcept;

    template <typename... Args>
    void print(const std::string& message, const Args&... args) noexcept;

    // Stops accepting new lines; everything already queued is still written.
    inline void stop() noexcept;

    std::size_t printed() const noexcept { return this->printed_.load(); }

    printer()                          = delete;
    printer(const printer&)            = delete;
    printer(printer&&)                 = delete;
    printer& operator=(const printer&) = delete;
    printer& operator=(printer&&)      = delete;

private:
    void push(std::string value) noexcept
    {
        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            if (!this->running_) return;
            queue_.push(std::move(value));
        }
        cv_.notify_one();
    }

    inline void flush() noexcept;

    std::queue<std::string>  queue_;
    std::mutex               queue_mutex_;
    std::condition_variable  cv_;
    bool                     running_;  // guarded by queue_mutex_
    std::atomic<std::size_t> printed_{0};
    std::thread              printer_thread_;
};

printer::printer(int core_id) noexcept
    : running_(true)
{
    this->printer_thread_ = std::thread([this, core_id]
    {
        [[maybe_unused]] bool pinned = use_core(core_id);
        this->flush();
    });
}

printer::~printer() noexcept
{
    this->stop();
    if (this->printer_thread_.joinable()) this->printer_thread_.join();
}

void printer::stop() noexcept
{
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        this->running_ = false;
    }
    cv_.notify_all();
}

template <typename... Args>
void printer::print(const std::string& message, const Args&... args) noexcept
{
    try
    {
        this->push(format(message, args...));
    }
    catch (const std::exception& e)
    {
        log_error("printer dropped a line: {}", e.what());
    }
}

void printer::flush() noexcept
{
    std::unique_lock<std::mutex> lock(this->queue_mutex_);
    for (;;)
    {
        cv_.wait(lock, [this] { return !queue_.empty() || !this->running_; });

        while (!this->queue_.empty())
        {
            std::string content = std::move(this->queue_.front());
            this->queue_.pop();
            lock.unlock();
            std::cout << content << std::endl;  // already formatted
            ++this->printed_;
            lock.lock();
        }

        if (!this->running_) return;
    }
}

}  // namespace util
}  // namespace mapcore

#endif  // MAPCORE_PRINTER_HPP

// ============================================================================
// PACER - Runtime Implementation
// ============================================================================

#include "pacer/runtime/runtime.hpp"

#include "pacer/utils/logger.hpp"

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>

#include <atomic>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <thread>
#include <vector>

namespace pacer::runtime {

namespace net = boost::asio;

// ============================================================================
// Runtime Implementation
// ============================================================================

struct Runtime::Impl {
    using WorkGuard = net::executor_work_guard<net::io_context::executor_type>;

    explicit Impl(const RuntimeConfig& config)
        : config_(config)
        , io_context_(static_cast<int>(config.threads))
        , work_(net::make_work_guard(io_context_)) {}

    void start() {
        running_ = true;
        threads_.reserve(config_.threads);
        for (size_t i = 0; i < config_.threads; ++i) {
            threads_.emplace_back([this, i] { run_loop(i); });
        }
        PACER_LOG_DEBUG("[runtime:{}] started with {} thread(s)", config_.name, config_.threads);
    }

    void run_loop(size_t index) {
        while (true) {
            try {
                io_context_.run();
                return;
            } catch (const std::exception& e) {
                // A handler threw; keep serving the remaining tasks
                PACER_LOG_ERROR("[runtime:{}] thread {} caught: {}", config_.name, index, e.what());
            }
        }
    }

    void stop() {
        std::lock_guard lock(stop_mutex_);
        if (!running_.exchange(false)) {
            return;
        }

        work_.reset();
        io_context_.stop();

        // Called from one of our own handlers: that thread is joined by
        // the destructor once it has left run()
        const auto self = std::this_thread::get_id();
        for (auto& thread : threads_) {
            if (thread.joinable() && thread.get_id() != self) {
                thread.join();
            }
        }
        PACER_LOG_DEBUG("[runtime:{}] stopped", config_.name);
    }

    void join_remaining() {
        std::lock_guard lock(stop_mutex_);
        for (auto& thread : threads_) {
            if (thread.joinable()) {
                thread.join();
            }
        }
        threads_.clear();
    }

    RuntimeConfig config_;
    net::io_context io_context_;
    std::optional<WorkGuard> work_;
    std::vector<std::thread> threads_;
    std::atomic<bool> running_{false};
    std::mutex stop_mutex_;
};

// ============================================================================
// Runtime
// ============================================================================

Runtime::Runtime(const RuntimeConfig& config) {
    if (config.threads == 0) {
        throw std::invalid_argument("Runtime requires at least one thread");
    }
    impl_ = std::make_unique<Impl>(config);
    impl_->start();
}

Runtime::~Runtime() {
    stop();
    impl_->join_remaining();
}

net::any_io_executor Runtime::executor() const {
    return impl_->io_context_.get_executor();
}

void Runtime::stop() {
    impl_->stop();
}

bool Runtime::running() const noexcept {
    return impl_->running_.load();
}

size_t Runtime::thread_count() const noexcept {
    return impl_->config_.threads;
}

const std::string& Runtime::name() const noexcept {
    return impl_->config_.name;
}

Runtime& Runtime::global() {
    static Runtime runtime(RuntimeConfig{1, "global"});
    return runtime;
}

}  // namespace pacer::runtime

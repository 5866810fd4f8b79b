#pragma once
// ============================================================================
// PACER - Runtime
// ============================================================================
// Owns a Boost.Asio io_context and the threads that run it.
// Rate limiter workers are coroutines scheduled here.
// ============================================================================

#include <boost/asio/any_io_executor.hpp>

#include <cstddef>
#include <memory>
#include <string>

namespace pacer::runtime {

struct RuntimeConfig {
    size_t threads = 1;
    std::string name = "pacer";
};

class Runtime {
public:
    /// Starts `config.threads` threads running the io_context.
    /// Throws std::invalid_argument when threads == 0.
    explicit Runtime(const RuntimeConfig& config = RuntimeConfig{});

    /// Stops, joins, then destroys every outstanding task.
    /// Must not run on one of the runtime's own threads.
    ~Runtime();

    // Non-copyable, non-movable (threads hold `this`)
    Runtime(const Runtime&) = delete;
    Runtime& operator=(const Runtime&) = delete;
    Runtime(Runtime&&) = delete;
    Runtime& operator=(Runtime&&) = delete;

    [[nodiscard]] boost::asio::any_io_executor executor() const;

    /// Stop the io_context and join its threads. Idempotent.
    /// From a handler, the calling thread is joined later by the destructor.
    void stop();

    [[nodiscard]] bool running() const noexcept;

    [[nodiscard]] size_t thread_count() const noexcept;

    [[nodiscard]] const std::string& name() const noexcept;

    /// Process-wide single-threaded runtime, created on first use
    static Runtime& global();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace pacer::runtime

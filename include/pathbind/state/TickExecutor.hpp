#pragma once

#include <pathbind/core/Error.hpp>

#include <cstddef>
#include <deque>
#include <functional>
#include <optional>

namespace PB {

/**
 * TickExecutor: the host's shortest deferred-callback primitive.
 *
 * Contract
 * --------
 * - post(...) queues a job to run at the next tick boundary and returns
 *   std::nullopt on success, or an Error when the executor refuses it
 *   (e.g. it has been closed).
 * - Jobs run on the thread that drives the executor, in posting order, and
 *   never synchronously inside post().
 */
struct TickExecutor {
    using Job = std::function<void()>;

    virtual ~TickExecutor() = default;

    virtual auto post(Job job) -> std::optional<Error> = 0;
};

/**
 * TickQueue: an end-of-turn job queue driven explicitly by the host loop.
 *
 * runOnce() executes one turn: exactly the jobs that were queued when the
 * turn started. Jobs posted while a turn runs belong to the next turn, so a
 * job that keeps re-posting itself cannot starve the caller.
 */
class TickQueue final : public TickExecutor {
public:
    TickQueue()  = default;
    ~TickQueue() override = default;

    TickQueue(TickQueue const&)            = delete;
    TickQueue& operator=(TickQueue const&) = delete;

    auto post(Job job) -> std::optional<Error> override;

    // Runs one turn; returns the number of jobs executed.
    auto runOnce() -> std::size_t;
    // Runs turns until the queue is idle or maxTurns is reached; returns the
    // number of jobs executed.
    auto drain(std::size_t maxTurns = 1024) -> std::size_t;

    [[nodiscard]] auto pending() const -> std::size_t { return jobs.size(); }
    [[nodiscard]] auto isClosed() const -> bool { return closed; }

    auto clear() -> void { jobs.clear(); }
    // Refuse further posts and drop queued jobs.
    auto close() -> void;

private:
    std::deque<Job> jobs;
    bool            closed = false;
};

} // namespace PB

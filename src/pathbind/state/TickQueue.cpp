#include <pathbind/state/TickExecutor.hpp>
#include <pathbind/log/TaggedLogger.hpp>

#include <exception>
#include <string>

namespace PB {

auto TickQueue::post(Job job) -> std::optional<Error> {
    if (this->closed)
        return Error{Error::Code::Destroyed, "tick queue is closed"};
    if (!job)
        return Error{Error::Code::InvalidArgument, "empty job"};
    this->jobs.push_back(std::move(job));
    return std::nullopt;
}

auto TickQueue::runOnce() -> std::size_t {
    std::deque<Job> turn;
    turn.swap(this->jobs);
    pb_log("TickQueue::runOnce jobs=" + std::to_string(turn.size()), "TickQueue");

    std::size_t executed = 0;
    for (auto& job : turn) {
        try {
            job();
        } catch (std::exception const& ex) {
            pb_error(std::string("tick job threw: ") + ex.what(), "TickQueue");
        }
        ++executed;
    }
    return executed;
}

auto TickQueue::drain(std::size_t maxTurns) -> std::size_t {
    std::size_t executed = 0;
    for (std::size_t turn = 0; turn < maxTurns && !this->jobs.empty(); ++turn)
        executed += this->runOnce();
    if (!this->jobs.empty())
        pb_warn("TickQueue::drain stopped after " + std::to_string(maxTurns) + " turns with jobs pending", "TickQueue");
    return executed;
}

auto TickQueue::close() -> void {
    this->closed = true;
    this->jobs.clear();
}

} // namespace PB

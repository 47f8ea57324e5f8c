#pragma once
#include "process.hpp"
#include <mutex>
#include <vector>

namespace paragate {

class MockProcessRunner : public ProcessRunner {
public:
    struct Call {
        std::string program;
        std::vector<std::string> args;
        std::chrono::milliseconds timeout{0};
        Environment environment;
    };

    ProcessOutcome next_outcome;
    std::vector<ProcessOutcome> outcome_queue;

    ProcessOutcome run(const std::string& program,
                       const std::vector<std::string>& args,
                       std::chrono::milliseconds timeout,
                       const Environment& overrides) override {
        std::lock_guard<std::mutex> lock(mutex_);
        calls_.push_back({program, args, timeout, overrides});
        if (!outcome_queue.empty()) {
            auto outcome = outcome_queue.front();
            outcome_queue.erase(outcome_queue.begin());
            return outcome;
        }
        return next_outcome;
    }

    size_t call_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_.size();
    }

    Call last_call() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_.empty() ? Call{} : calls_.back();
    }

    // Convenience: exit 0 with the given stdout
    static ProcessOutcome exited(const std::string& out, int code = 0,
                                 const std::string& err = "") {
        ProcessOutcome o;
        o.status = ProcessStatus::Exited;
        o.exit_code = code;
        o.stdout_text = out;
        o.stderr_text = err;
        return o;
    }

private:
    mutable std::mutex mutex_;
    std::vector<Call> calls_;
};

} // namespace paragate

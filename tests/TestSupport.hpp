#pragma once

#include "authrelay/repository/StatsStore.hpp"
#include "authrelay/session/SessionRunner.hpp"
#include "authrelay/util/Clock.hpp"

#include <chrono>
#include <deque>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace authrelay::testing {

class ManualClock : public util::Clock {
public:
    explicit ManualClock(std::int64_t startMillis = 1'700'000'000'000)
        : now_(util::fromEpochMillis(startMillis)) {}

    TimePoint now() const override {
        std::scoped_lock lock(mutex_);
        return now_;
    }

    void advance(std::chrono::milliseconds delta) {
        std::scoped_lock lock(mutex_);
        now_ += delta;
    }

private:
    mutable std::mutex mutex_;
    TimePoint now_;
};

class MemoryStatsStore : public repository::StatsStore {
public:
    repository::StatsMap load() override {
        std::scoped_lock lock(mutex_);
        if (failLoads) {
            throw repository::StatsStoreError("load disabled");
        }
        return stored;
    }

    void save(const repository::StatsMap& stats) override {
        std::scoped_lock lock(mutex_);
        if (failSaves) {
            throw repository::StatsStoreError("disk full");
        }
        stored = stats;
        ++saves;
    }

    repository::StatsMap snapshot() {
        std::scoped_lock lock(mutex_);
        return stored;
    }

    repository::StatsMap stored;
    bool failLoads{false};
    bool failSaves{false};
    int saves{0};

private:
    std::mutex mutex_;
};

struct ScriptedStep {
    model::SessionOutcome outcome{model::SessionOutcome::success};
    std::string token;
    std::chrono::milliseconds delay{0};
    bool throws{false};
};

// Plays back a fixed list of results; once exhausted it repeats the last one.
class ScriptedRunner : public session::SessionRunner {
public:
    explicit ScriptedRunner(std::vector<ScriptedStep> steps)
        : steps_(steps.begin(), steps.end()) {}

    session::SessionResult run(const session::SessionRequest& request) override {
        ScriptedStep step;
        {
            std::scoped_lock lock(mutex_);
            requests_.push_back(request);
            if (steps_.size() > 1) {
                step = steps_.front();
                steps_.pop_front();
            } else if (!steps_.empty()) {
                step = steps_.front();
            }
        }
        if (step.delay.count() > 0) {
            std::this_thread::sleep_for(step.delay);
        }
        if (step.throws) {
            throw session::SessionRunnerError("worker unreachable");
        }
        session::SessionResult result;
        result.outcome = step.outcome;
        result.token = step.token;
        return result;
    }

    std::vector<session::SessionRequest> requests() {
        std::scoped_lock lock(mutex_);
        return requests_;
    }

private:
    std::mutex mutex_;
    std::deque<ScriptedStep> steps_;
    std::vector<session::SessionRequest> requests_;
};

} // namespace authrelay::testing

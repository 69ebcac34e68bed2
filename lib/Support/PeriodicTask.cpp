//===----------------------------------------------------------------------===//
//
// Part of the lspvisor project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements cancellation tokens and the periodic worker.
///
//===----------------------------------------------------------------------===//

#include "lspvisor/Support/PeriodicTask.h"

#include "lspvisor/Support/Logging.h"

#include <condition_variable>
#include <exception>
#include <mutex>
#include <thread>
#include <utility>

namespace lspvisor
{

struct CancellationToken::State final
{
    std::mutex              mutex;
    std::condition_variable cv;
    bool                    cancelled{false};
};

CancellationToken::CancellationToken(std::shared_ptr<State> state)
    : state_(std::move(state))
{
}

bool CancellationToken::isCancellationRequested() const
{
    if (!state_)
    {
        return false;
    }
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->cancelled;
}

bool CancellationToken::waitFor(const std::chrono::milliseconds duration) const
{
    if (!state_)
    {
        std::this_thread::sleep_for(duration);
        return false;
    }
    std::unique_lock<std::mutex> lock(state_->mutex);
    return state_->cv.wait_for(lock, duration, [this]() { return state_->cancelled; });
}

CancellationSource::CancellationSource()
    : state_(std::make_shared<CancellationToken::State>())
{
}

CancellationToken CancellationSource::token() const
{
    return CancellationToken(state_);
}

void CancellationSource::cancel()
{
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->cancelled = true;
    }
    state_->cv.notify_all();
}

bool CancellationSource::isCancelled() const
{
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->cancelled;
}

class PeriodicTask::Impl final
{
public:
    Impl(std::string name, const std::chrono::milliseconds interval, PeriodicBody body)
        : shared_(std::make_shared<Shared>(Shared{std::move(name), interval, std::move(body), CancellationSource()}))
        , worker_([shared = shared_]() { run(*shared); })
    {
    }

    ~Impl()
    {
        stop();
        if (worker_.joinable())
        {
            // Destroyed from inside its own tick; the worker keeps `shared_` alive.
            worker_.detach();
        }
    }

    void stop()
    {
        shared_->source.cancel();
        if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id())
        {
            worker_.join();
        }
    }

    bool isStopping() const
    {
        return shared_->source.isCancelled();
    }

private:
    struct Shared final
    {
        std::string               name;
        std::chrono::milliseconds interval;
        PeriodicBody              body;
        CancellationSource        source;
    };

    static void run(Shared& shared)
    {
        const CancellationToken token = shared.source.token();
        while (!token.waitFor(shared.interval))
        {
            try
            {
                shared.body(token);
            } catch (const std::exception& ex)
            {
                logError("task", shared.name + ": tick failed: " + ex.what());
            } catch (...)
            {
                logError("task", shared.name + ": tick failed: unknown exception");
            }
        }
        logDebug("task", shared.name + " stopped");
    }

    std::shared_ptr<Shared> shared_;
    std::thread             worker_;
};

PeriodicTask::PeriodicTask(std::string name, const std::chrono::milliseconds interval, PeriodicBody body)
    : impl_(std::make_unique<Impl>(std::move(name), interval, std::move(body)))
{
}

PeriodicTask::~PeriodicTask() = default;

void PeriodicTask::stop()
{
    impl_->stop();
}

bool PeriodicTask::isStopping() const
{
    return impl_->isStopping();
}

}  // namespace lspvisor

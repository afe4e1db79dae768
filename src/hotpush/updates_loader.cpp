#include "hotpush/updates_loader.hpp"

#include "util/logger.hpp"

#include <utility>

namespace hotpush {

UpdatesLoader::UpdatesLoader(UpdateLoaderWorker::Collaborators collaborators)
    : collaborators_(std::move(collaborators)) {}

UpdatesLoader::~UpdatesLoader() { Wait(); }

Result UpdatesLoader::Start(const UpdateRequest& request,
                            IUpdateEventSink* sink,
                            std::string* out_worker_id) {
    std::lock_guard<std::mutex> lk(mu_);
    if (running_) {
        LogWarn("Update check rejected: download already in progress");
        return Result::Fail(kDownloadAlreadyInProgress, "download already in progress");
    }
    // A finished run may still own an unjoined thread.
    if (thread_.joinable())
        thread_.join();

    UpdateLoaderWorker worker(request, collaborators_);
    worker.SetProgressSink(progress_sink_);
    worker.SetEventSink(sink);
    if (out_worker_id)
        *out_worker_id = worker.WorkerId();

    running_ = true;
    thread_ = std::thread([this, worker = std::move(worker)]() mutable {
        (void)worker.Run();
        std::lock_guard<std::mutex> done_lk(mu_);
        running_ = false;
    });
    return Result::Ok();
}

bool UpdatesLoader::IsRunning() const {
    std::lock_guard<std::mutex> lk(mu_);
    return running_;
}

void UpdatesLoader::Wait() {
    std::thread t;
    {
        std::lock_guard<std::mutex> lk(mu_);
        t = std::move(thread_);
    }
    if (t.joinable())
        t.join();
}

} // namespace hotpush

#pragma once

#include "hotpush/update_loader_worker.hpp"
#include "util/result.hpp"

#include <mutex>
#include <string>
#include <thread>

namespace hotpush {

// Runs update checks on a background thread, at most one at a time.
class UpdatesLoader {
  public:
    static constexpr int kDownloadAlreadyInProgress = -12;

    explicit UpdatesLoader(UpdateLoaderWorker::Collaborators collaborators);
    UpdatesLoader(const UpdatesLoader&) = delete;
    UpdatesLoader& operator=(const UpdatesLoader&) = delete;
    ~UpdatesLoader();

    void SetProgressSink(IProgress* sink) { progress_sink_ = sink; }

    // Fails with kDownloadAlreadyInProgress while a previous run is active.
    // The outcome is delivered to `sink` from the background thread.
    Result Start(const UpdateRequest& request,
                 IUpdateEventSink* sink,
                 std::string* out_worker_id = nullptr);

    bool IsRunning() const;

    // Blocks until the current run, if any, has delivered its outcome.
    void Wait();

  private:
    UpdateLoaderWorker::Collaborators collaborators_;
    IProgress* progress_sink_ = nullptr;

    mutable std::mutex mu_;
    bool running_ = false;
    std::thread thread_;
};

} // namespace hotpush

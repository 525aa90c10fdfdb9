#pragma once

#include "downstream/transcript_sink.hpp"
#include "storage/transcript_store.hpp"

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <thread>

// Hands flushed blocks to the transcript store and the analysis sink on one
// worker thread. Failures are logged and the block is not retried.
class TranscriptDispatcher {
public:
    // Either collaborator may be null (disabled).
    TranscriptDispatcher(TranscriptStore* store, TranscriptSink* sink,
                         uint32_t retention_days, bool verbose = false);
    ~TranscriptDispatcher();

    TranscriptDispatcher(const TranscriptDispatcher&) = delete;
    TranscriptDispatcher& operator=(const TranscriptDispatcher&) = delete;

    void start();

    // Thread-safe; never blocks on the collaborators.
    void submit(std::string session_id, std::string text);

    // Delivers everything already submitted, then joins the worker.
    void stop();

    uint64_t delivered() const;
    uint64_t failed() const;

private:
    struct Job {
        std::string session_id;
        std::string text;
    };

    void run(std::stop_token st);
    void dispatch(const Job& job);

    TranscriptStore* store_;
    TranscriptSink* sink_;
    uint32_t retention_days_;
    bool verbose_;

    mutable std::mutex mutex_;
    std::condition_variable_any cv_;
    std::deque<Job> queue_;
    uint64_t delivered_ = 0;
    uint64_t failed_ = 0;
    std::jthread worker_;
};

#include "downstream/transcript_dispatcher.hpp"

#include <print>

TranscriptDispatcher::TranscriptDispatcher(TranscriptStore* store, TranscriptSink* sink,
                                           uint32_t retention_days, bool verbose)
    : store_(store), sink_(sink), retention_days_(retention_days), verbose_(verbose) {}

TranscriptDispatcher::~TranscriptDispatcher() {
    stop();
}

void TranscriptDispatcher::start() {
    if (worker_.joinable()) return;
    worker_ = std::jthread([this](std::stop_token st) { run(st); });
}

void TranscriptDispatcher::submit(std::string session_id, std::string text) {
    {
        std::lock_guard lock(mutex_);
        queue_.push_back(Job{std::move(session_id), std::move(text)});
    }
    cv_.notify_one();
}

void TranscriptDispatcher::stop() {
    if (!worker_.joinable()) return;
    worker_.request_stop();
    worker_.join();
}

uint64_t TranscriptDispatcher::delivered() const {
    std::lock_guard lock(mutex_);
    return delivered_;
}

uint64_t TranscriptDispatcher::failed() const {
    std::lock_guard lock(mutex_);
    return failed_;
}

void TranscriptDispatcher::run(std::stop_token st) {
    for (;;) {
        Job job;
        {
            std::unique_lock lock(mutex_);
            cv_.wait(lock, st, [this] { return !queue_.empty(); });
            // Drain what was queued before the stop request.
            if (queue_.empty()) return;
            job = std::move(queue_.front());
            queue_.pop_front();
        }
        dispatch(job);
    }
}

void TranscriptDispatcher::dispatch(const Job& job) {
    bool ok = true;

    if (store_ && !store_->insert(job.session_id, job.text, retention_days_)) {
        std::println(stderr, "dispatch {}: transcript store insert failed", job.session_id);
        ok = false;
    }

    if (sink_) {
        auto r = sink_->deliver(job.session_id, job.text);
        if (!r) {
            std::println(stderr, "dispatch {}: downstream delivery failed: {}", job.session_id,
                         r.error());
            ok = false;
        }
    }

    if (verbose_) {
        std::println(stderr, "dispatch {}: {} chars {}", job.session_id, job.text.size(),
                     ok ? "delivered" : "dropped");
    }

    std::lock_guard lock(mutex_);
    if (ok) delivered_++;
    else failed_++;
}

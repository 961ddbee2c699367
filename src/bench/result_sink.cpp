#include <latbench/bench/result_sink.h>

#include <spdlog/spdlog.h>

#include <utility>

namespace latbench::bench {

ResultSink::ResultSink(Config config, IDetailWriter* detailWriter)
    : config_(config), detailWriter_(detailWriter) {
    if (config_.batchSize == 0) {
        config_.batchSize = 1;
    }
    if (config_.detailedLogging && detailWriter_) {
        detailBuffer_.reserve(config_.batchSize);
    }
    spdlog::debug("[ResultSink] Initialized with detailedLogging={}, batchSize={}",
                  config_.detailedLogging && detailWriter_ != nullptr, config_.batchSize);
}

ResultSink::~ResultSink() {
    if (started_ && !finished_) {
        auto leftover = finish();
        (void)leftover;
    }
}

void ResultSink::start() {
    if (started_) {
        return;
    }
    started_ = true;
    writer_ = std::thread([this]() { writerLoop(); });
}

void ResultSink::submit(RequestOutcome outcome) {
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        pending_.push_back(std::move(outcome));
    }
    queueCv_.notify_one();

    std::lock_guard<std::mutex> slock(statsMutex_);
    stats_.received++;
}

std::vector<TargetAggregate> ResultSink::finish() {
    if (finished_) {
        return aggregates_;
    }

    if (started_) {
        {
            std::lock_guard<std::mutex> lock(queueMutex_);
            stop_ = true;
        }
        queueCv_.notify_all();
        if (writer_.joinable()) {
            writer_.join();
        }
    } else {
        // Never started: fold everything on the calling thread.
        std::vector<RequestOutcome> drained;
        {
            std::lock_guard<std::mutex> lock(queueMutex_);
            drained.swap(pending_);
        }
        for (auto& o : drained) {
            apply(std::move(o));
        }
        flushDetails();
    }

    finished_ = true;
    auto stats = getStats();
    spdlog::debug("[ResultSink] Finished: processed={}, batches={}, flushErrors={}",
                  stats.processed, stats.batchesFlushed, stats.flushErrors);
    return aggregates_;
}

ResultSink::Stats ResultSink::getStats() const {
    std::lock_guard<std::mutex> lock(statsMutex_);
    return stats_;
}

void ResultSink::writerLoop() {
    while (true) {
        std::vector<RequestOutcome> batch;
        {
            std::unique_lock<std::mutex> lock(queueMutex_);
            queueCv_.wait(lock, [this] { return stop_ || !pending_.empty(); });
            if (pending_.empty() && stop_) {
                break;
            }
            batch.swap(pending_);
        }

        for (auto& o : batch) {
            apply(std::move(o));
        }
    }

    // Final partial flush
    flushDetails();
}

void ResultSink::apply(RequestOutcome&& outcome) {
    auto [it, inserted] = index_.try_emplace(outcome.targetId, aggregates_.size());
    if (inserted) {
        aggregates_.emplace_back();
        aggregates_.back().targetId = outcome.targetId;
    }
    aggregates_[it->second].record(outcome);

    const bool ok = outcome.success();
    const bool cleanupFailed = outcome.cleanup == CleanupStatus::Failed;

    processed_.fetch_add(1, std::memory_order_relaxed);
    if (ok) {
        successes_.fetch_add(1, std::memory_order_relaxed);
    }
    {
        std::lock_guard<std::mutex> slock(statsMutex_);
        stats_.processed++;
        if (ok)
            stats_.successes++;
        if (cleanupFailed)
            stats_.cleanupFailures++;
    }

    if (config_.detailedLogging && detailWriter_) {
        detailBuffer_.push_back(std::move(outcome));
        if (detailBuffer_.size() >= config_.batchSize) {
            flushDetails();
        }
    }
}

void ResultSink::flushDetails() {
    if (detailBuffer_.empty() || !detailWriter_) {
        return;
    }

    std::vector<RequestOutcome> rows;
    rows.swap(detailBuffer_);
    detailBuffer_.reserve(config_.batchSize);

    Result<void> r = Error{ErrorCode::WriteError, "detail writer threw"};
    try {
        r = detailWriter_->writeBatch(rows);
    } catch (const std::exception& e) {
        r = Error{ErrorCode::WriteError, e.what()};
    }

    std::lock_guard<std::mutex> slock(statsMutex_);
    if (r) {
        stats_.batchesFlushed++;
        stats_.rowsFlushed += rows.size();
        spdlog::debug("[ResultSink] Flushed {} detail rows", rows.size());
    } else {
        stats_.flushErrors++;
        spdlog::error("[ResultSink] Failed to flush {} detail rows: {}", rows.size(),
                      r.error().message);
    }
}

} // namespace latbench::bench

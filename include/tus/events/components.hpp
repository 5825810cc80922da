/**
 * @file components.hpp
 * @brief Ready-made observers for upload events
 *
 * EXAMPLE:
 * EventBus bus;
 * LoggerComponent logger(bus);
 * MetricsComponent metrics(bus);
 * Client client(config, transport, &bus);
 * // Uploads are now logged and counted
 */

#pragma once

#include "tus/events/event_bus.hpp"
#include "tus/events/events.hpp"
#include <spdlog/spdlog.h>
#include <atomic>
#include <vector>

namespace tus::events {

/**
 * @brief Logger component - logs every upload event with spdlog
 *
 * Components unsubscribe on destruction and must not outlive the bus.
 */
class LoggerComponent {
public:
    explicit LoggerComponent(EventBus& bus) {
        subscriptions_.push_back(bus.subscribe_scoped<UploadCreatedEvent>([this](const UploadCreatedEvent& e) {
            on_upload_created(e);
        }));

        subscriptions_.push_back(bus.subscribe_scoped<ChunkAcceptedEvent>([this](const ChunkAcceptedEvent& e) {
            on_chunk_accepted(e);
        }));

        subscriptions_.push_back(bus.subscribe_scoped<OffsetReconciledEvent>([this](const OffsetReconciledEvent& e) {
            on_offset_reconciled(e);
        }));

        subscriptions_.push_back(bus.subscribe_scoped<TransferRetryEvent>([this](const TransferRetryEvent& e) {
            on_transfer_retry(e);
        }));

        subscriptions_.push_back(bus.subscribe_scoped<UploadCompletedEvent>([this](const UploadCompletedEvent& e) {
            on_upload_completed(e);
        }));

        subscriptions_.push_back(bus.subscribe_scoped<UploadFailedEvent>([this](const UploadFailedEvent& e) {
            on_upload_failed(e);
        }));
    }

    LoggerComponent(const LoggerComponent&) = delete;
    LoggerComponent& operator=(const LoggerComponent&) = delete;

private:
    void on_upload_created(const UploadCreatedEvent& e) {
        spdlog::info("[UploadCreated] location={} length={} deferred={}",
                     e.descriptor.location(),
                     e.descriptor.total_length(),
                     e.descriptor.length_deferred());
    }

    void on_chunk_accepted(const ChunkAcceptedEvent& e) {
        spdlog::debug("[ChunkAccepted] location={} range=[{}, {}) offset={}/{}",
                      e.descriptor.location(),
                      e.chunk_offset, e.chunk_offset + e.bytes,
                      e.descriptor.confirmed_offset(), e.descriptor.total_length());
    }

    void on_offset_reconciled(const OffsetReconciledEvent& e) {
        spdlog::info("[OffsetReconciled] location={} {} -> {} ({})",
                     e.descriptor.location(), e.previous_offset,
                     e.descriptor.confirmed_offset(), e.reason);
    }

    void on_transfer_retry(const TransferRetryEvent& e) {
        spdlog::warn("[TransferRetry] location={} offset={} attempt={} delay={}ms error={}",
                     e.location, e.offset, e.attempt, e.delay.count(), e.error.to_string());
    }

    void on_upload_completed(const UploadCompletedEvent& e) {
        spdlog::info("[UploadCompleted] location={} bytes={} duration={}ms",
                     e.descriptor.location(), e.descriptor.total_length(), e.duration.count());
    }

    void on_upload_failed(const UploadFailedEvent& e) {
        spdlog::error("[UploadFailed] location={} offset={} resumable={} error={}",
                      e.descriptor.location().empty() ? "<none>" : e.descriptor.location(),
                      e.descriptor.confirmed_offset(),
                      is_resumable(e.error), e.error.to_string());
    }

    std::vector<Subscription> subscriptions_;
};

/**
 * @brief Metrics component - counts uploads, chunks, bytes and retries
 *
 * USAGE:
 * MetricsComponent metrics(bus);
 * // Later...
 * metrics.print_stats();
 */
class MetricsComponent {
public:
    struct Stats {
        std::atomic<uint64_t> uploads_created{0};
        std::atomic<uint64_t> uploads_completed{0};
        std::atomic<uint64_t> uploads_failed{0};
        std::atomic<uint64_t> chunks_accepted{0};
        std::atomic<uint64_t> bytes_accepted{0};
        std::atomic<uint64_t> retries{0};
        std::atomic<uint64_t> reconciliations{0};
    };

    explicit MetricsComponent(EventBus& bus) {
        subscriptions_.push_back(bus.subscribe_scoped<UploadCreatedEvent>([this](const UploadCreatedEvent&) {
            stats_.uploads_created++;
        }));

        subscriptions_.push_back(bus.subscribe_scoped<ChunkAcceptedEvent>([this](const ChunkAcceptedEvent& e) {
            stats_.chunks_accepted++;
            stats_.bytes_accepted += e.bytes;
        }));

        subscriptions_.push_back(bus.subscribe_scoped<OffsetReconciledEvent>([this](const OffsetReconciledEvent&) {
            stats_.reconciliations++;
        }));

        subscriptions_.push_back(bus.subscribe_scoped<TransferRetryEvent>([this](const TransferRetryEvent&) {
            stats_.retries++;
        }));

        subscriptions_.push_back(bus.subscribe_scoped<UploadCompletedEvent>([this](const UploadCompletedEvent&) {
            stats_.uploads_completed++;
        }));

        subscriptions_.push_back(bus.subscribe_scoped<UploadFailedEvent>([this](const UploadFailedEvent&) {
            stats_.uploads_failed++;
        }));
    }

    MetricsComponent(const MetricsComponent&) = delete;
    MetricsComponent& operator=(const MetricsComponent&) = delete;

    const Stats& get_stats() const {
        return stats_;
    }

    void print_stats() const {
        spdlog::info("═══════════════════════════════════════");
        spdlog::info("Upload Statistics:");
        spdlog::info("  Uploads created:   {}", stats_.uploads_created.load());
        spdlog::info("  Uploads completed: {}", stats_.uploads_completed.load());
        spdlog::info("  Uploads failed:    {}", stats_.uploads_failed.load());
        spdlog::info("  Chunks accepted:   {}", stats_.chunks_accepted.load());
        spdlog::info("  Bytes accepted:    {}", stats_.bytes_accepted.load());
        spdlog::info("  Retries:           {}", stats_.retries.load());
        spdlog::info("  Reconciliations:   {}", stats_.reconciliations.load());
        spdlog::info("═══════════════════════════════════════");
    }

private:
    Stats stats_;
    std::vector<Subscription> subscriptions_;
};

} // namespace tus::events

/**
 * @file tus_upload.cpp
 * @brief Resumable upload of one file to a tus server
 *
 * Usage:
 *   ./build/examples/tus_upload <endpoint> <file> [descriptor.json] [config.json]
 *
 * The descriptor file is rewritten after creation and after every
 * acknowledged chunk. Run the same command again after a crash or Ctrl+C
 * and the upload continues from the server's offset.
 *
 * Try it against tusd:
 *   tusd -upload-dir ./data &
 *   ./build/examples/tus_upload http://localhost:8080/files/ big.iso big.iso.tus.json
 */

#include "tus/client/client.hpp"
#include "tus/events/components.hpp"
#include "tus/events/event_bus.hpp"
#include "tus/events/events.hpp"
#include <spdlog/spdlog.h>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <thread>

using namespace tus;
using namespace tus::events;

// ════════════════════════════════════════════════════════════
// Global Objects
// ════════════════════════════════════════════════════════════

CancellationToken g_cancel;
volatile std::sig_atomic_t g_interrupted = 0;

// Only async-signal-safe work here; the watcher below does the cancel()
void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_interrupted = 1;
    }
}

/**
 * Polls the signal flag and forwards it to the upload's token.
 * Stops and joins when it goes out of scope.
 */
class InterruptWatcher {
public:
    explicit InterruptWatcher(CancellationToken& target)
        : thread_([this, &target] {
              while (!stop_.wait_for(std::chrono::milliseconds(50))) {
                  if (g_interrupted != 0) {
                      spdlog::warn("Interrupted, cancelling upload");
                      target.cancel();
                      return;
                  }
              }
          }) {}

    ~InterruptWatcher() {
        stop_.cancel();
        thread_.join();
    }

    InterruptWatcher(const InterruptWatcher&) = delete;
    InterruptWatcher& operator=(const InterruptWatcher&) = delete;

private:
    CancellationToken stop_;
    std::thread thread_;
};

// ════════════════════════════════════════════════════════════
// Descriptor persistence
// ════════════════════════════════════════════════════════════

bool save_descriptor(const std::filesystem::path& path, const upload::UploadDescriptor& descriptor) {
    const auto tmp = path.string() + ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out) {
            spdlog::error("Cannot write {}", tmp);
            return false;
        }
        out << descriptor.to_string(2);
        if (!out) {
            spdlog::error("Write to {} failed", tmp);
            return false;
        }
    }

    std::error_code ec;
    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        spdlog::error("Cannot replace {}: {}", path.string(), ec.message());
        return false;
    }
    return true;
}

Result<upload::UploadDescriptor> load_descriptor(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        return Fail<upload::UploadDescriptor>(ErrorKind::Configuration, "cannot open " + path.string());
    }
    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    return upload::UploadDescriptor::from_string(text);
}

int main(int argc, char* argv[]) {
    if (argc < 3) {
        spdlog::error("Usage: {} <endpoint> <file> [descriptor.json] [config.json]", argv[0]);
        return 2;
    }

    spdlog::set_level(spdlog::level::info);
    spdlog::set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");

    const std::string endpoint = argv[1];
    const std::filesystem::path file = argv[2];
    const std::filesystem::path state_file = argc > 3
        ? std::filesystem::path(argv[3])
        : std::filesystem::path(file.string() + ".tus.json");

    client::ClientConfig config;
    if (argc > 4) {
        auto loaded = client::ClientConfig::load_from_file(argv[4]);
        if (loaded.is_error()) {
            spdlog::error("Config error: {}", loaded.error().to_string());
            return 2;
        }
        config = loaded.value();
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    InterruptWatcher watcher(g_cancel);

    // ════════════════════════════════════════════════════════════
    // Components: logging, counters and persistence all hang off the bus
    // ════════════════════════════════════════════════════════════
    EventBus bus;
    MetricsComponent metrics(bus);

    auto persist = [&state_file](const upload::UploadDescriptor& descriptor) {
        save_descriptor(state_file, descriptor);
    };
    bus.subscribe<UploadCreatedEvent>([&](const UploadCreatedEvent& e) { persist(e.descriptor); });
    bus.subscribe<ChunkAcceptedEvent>([&](const ChunkAcceptedEvent& e) {
        persist(e.descriptor);
        spdlog::info("{:>6.2f}% ({}/{} bytes)",
                     e.descriptor.total_length() == 0 ? 100.0
                         : 100.0 * static_cast<double>(e.descriptor.confirmed_offset()) /
                               static_cast<double>(e.descriptor.total_length()),
                     e.descriptor.confirmed_offset(), e.descriptor.total_length());
    });
    bus.subscribe<OffsetReconciledEvent>([&](const OffsetReconciledEvent& e) { persist(e.descriptor); });
    bus.subscribe<UploadFailedEvent>([&](const UploadFailedEvent& e) {
        if (!e.descriptor.location().empty()) {
            persist(e.descriptor);
        }
    });

    client::Client client(config, &bus);

    Result<void> outcome = Ok();
    if (std::filesystem::exists(state_file)) {
        auto descriptor = load_descriptor(state_file);
        if (descriptor.is_error()) {
            spdlog::error("Cannot read {}: {}", state_file.string(), descriptor.error().to_string());
            return 1;
        }
        spdlog::info("Resuming {} from {}", descriptor.value().location(), state_file.string());
        outcome = client.resume(descriptor.value(), &g_cancel);
    } else {
        auto uploaded = client.upload(file, endpoint, {}, &g_cancel);
        if (uploaded.is_error()) {
            outcome = Err<void>(uploaded.error());
        } else {
            spdlog::info("Uploaded to {}", uploaded.value().location());
        }
    }

    metrics.print_stats();

    if (outcome.is_error()) {
        const auto& error = outcome.error();
        spdlog::error("Upload failed: {}", error.to_string());
        if (is_resumable(error)) {
            spdlog::info("Run the same command again to resume from {}", state_file.string());
        } else {
            std::error_code ec;
            std::filesystem::remove(state_file, ec);
        }
        return 1;
    }

    std::error_code ec;
    std::filesystem::remove(state_file, ec);
    return 0;
}

#include "mpu/directory_storage.hpp"
#include "mpu/errors.hpp"
#include "mpu/event_log.hpp"
#include "mpu/file_source.hpp"
#include "mpu/resumable_transport.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>

namespace {

volatile std::sig_atomic_t interrupted = 0;

void on_interrupt(int) { interrupted = 1; }

struct UploadOptions {
    std::filesystem::path store;
    std::string bucket;
    std::string key;
    std::filesystem::path file;
    std::string session_id = "mpu_upload";
    std::string upload_id;
    std::uint64_t part_size = mpu::kDefaultPartSize;
    std::int64_t idle_timeout_ms = mpu::kDefaultIdleTimeout.count();
    std::uint32_t max_parts = 10000;
};

class ConsoleListener : public mpu::TransportListener {
  public:
    void on_start(const mpu::StartEvent &event) override { print(mpu::format_event(event)); }

    void on_progress(const mpu::ProgressEvent &event) override {
        print(mpu::format_event(event));
    }

    void on_pause(const mpu::PauseEvent &event) override { print(mpu::format_event(event)); }

    void on_finish(const mpu::FinishEvent &event) override { print(mpu::format_event(event)); }

    void on_error(const mpu::ErrorEvent &event) override {
        std::lock_guard<std::mutex> lock(mutex_);
        failed_ = true;
        std::cout << mpu::format_event(event) << std::endl;
    }

    bool failed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return failed_;
    }

  private:
    void print(const std::string &line) {
        std::lock_guard<std::mutex> lock(mutex_);
        std::cout << line << std::endl;
    }

    mutable std::mutex mutex_;
    bool failed_{false};
};

void print_usage() {
    std::cerr << "Usage:\n"
                 "  mpu_upload --store <dir> --bucket <bucket> --key <key> --file <path> "
                 "[--session-id <id>] [--upload-id <id>] [--part-size <bytes>] "
                 "[--idle-timeout-ms <ms>] [--max-parts <n>]\n"
                 "Interrupt (Ctrl-C) pauses the upload; rerun with --upload-id to resume.\n";
}

UploadOptions parse_upload(int argc, char **argv) {
    UploadOptions opts;
    for (int i = 0; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--store" && i + 1 < argc) {
            opts.store = argv[++i];
        } else if (arg == "--bucket" && i + 1 < argc) {
            opts.bucket = argv[++i];
        } else if (arg == "--key" && i + 1 < argc) {
            opts.key = argv[++i];
        } else if (arg == "--file" && i + 1 < argc) {
            opts.file = argv[++i];
        } else if (arg == "--session-id" && i + 1 < argc) {
            opts.session_id = argv[++i];
        } else if (arg == "--upload-id" && i + 1 < argc) {
            opts.upload_id = argv[++i];
        } else if (arg == "--part-size" && i + 1 < argc) {
            opts.part_size = static_cast<std::uint64_t>(std::stoull(argv[++i]));
        } else if (arg == "--idle-timeout-ms" && i + 1 < argc) {
            opts.idle_timeout_ms = std::stoll(argv[++i]);
        } else if (arg == "--max-parts" && i + 1 < argc) {
            opts.max_parts = static_cast<std::uint32_t>(std::stoul(argv[++i]));
        } else {
            std::ostringstream oss;
            oss << "unknown or incomplete option: " << arg;
            throw mpu::Error(oss.str());
        }
    }
    if (opts.store.empty() || opts.bucket.empty() || opts.key.empty() || opts.file.empty()) {
        throw mpu::Error("missing required upload options");
    }
    return opts;
}

int run_upload(const UploadOptions &opts) {
    mpu::DirectoryStorageClient client(mpu::DirectoryStorageConfig{opts.store, opts.max_parts});
    mpu::LocalFileSource files;
    ConsoleListener listener;

    mpu::TransportConfig config;
    config.session_id = opts.session_id;
    config.bucket = opts.bucket;
    config.object_key = opts.key;
    config.local_path = opts.file;
    if (!opts.upload_id.empty()) {
        config.upload_id = opts.upload_id;
    }
    config.part_size_bytes = opts.part_size;
    config.idle_timeout = std::chrono::milliseconds(opts.idle_timeout_ms);
    mpu::ResumableTransport transport(config, client, files, listener);

    std::signal(SIGINT, on_interrupt);
    std::atomic<bool> done{false};
    std::thread worker([&] {
        transport.start();
        done = true;
    });
    bool pause_sent = false;
    while (!done) {
        if (interrupted && !pause_sent) {
            pause_sent = true;
            transport.pause();
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    worker.join();
    std::signal(SIGINT, SIG_DFL);

    if (transport.state() == mpu::TransportState::paused) {
        if (auto id = transport.upload_id()) {
            std::cerr << "paused; resume with --upload-id " << *id << std::endl;
        }
    }
    return listener.failed() ? EXIT_FAILURE : EXIT_SUCCESS;
}

} // namespace

int main(int argc, char **argv) {
    if (argc < 2) {
        print_usage();
        return EXIT_FAILURE;
    }
    std::string first = argv[1];
    if (first == "--help" || first == "-h") {
        print_usage();
        return EXIT_SUCCESS;
    }
    try {
        UploadOptions opts = parse_upload(argc - 1, argv + 1);
        return run_upload(opts);
    } catch (const std::exception &err) {
        std::cerr << "error: " << err.what() << std::endl;
        return EXIT_FAILURE;
    }
}

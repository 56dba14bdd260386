#include "mpu/content_hash.hpp"
#include "mpu/errors.hpp"
#include "mpu/file_source.hpp"
#include "mpu/object_metadata.hpp"
#include "mpu/resumable_transport.hpp"

#include <algorithm>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace {

namespace fs = std::filesystem;

constexpr std::uint64_t MiB = 1024ull * 1024;

class FakeStorageClient : public mpu::StorageClient {
  public:
    std::string initiate_multipart_upload(const std::string &bucket,
                                          const std::string &key) override {
        ++initiate_calls;
        assert(bucket == "bucket" && key == "object");
        upload_id = next_upload_id;
        return upload_id;
    }

    mpu::PartListing list_parts(const std::string &, const std::string &,
                                const std::string &id) override {
        ++list_calls;
        if (on_list) {
            on_list();
        }
        if (id != upload_id) {
            throw mpu::StorageError(404, "no such upload");
        }
        mpu::PartListing listing{{}, max_parts};
        for (const auto &part : parts) {
            listing.parts.push_back(mpu::UploadedPart{part.first, part.second.size()});
        }
        // The service does not promise any order.
        std::reverse(listing.parts.begin(), listing.parts.end());
        return listing;
    }

    void upload_part(const std::string &, const std::string &, mpu::PartBody &body,
                     const mpu::Headers &headers, const mpu::PartParams &params) override {
        if (params.upload_id != upload_id) {
            throw mpu::StorageError(404, "no such upload");
        }
        attempted.push_back(params.part_number);
        part_headers.push_back(headers);
        if (params.part_number == fail_part) {
            throw mpu::StorageError(503, "service unavailable");
        }
        std::vector<char> data;
        std::vector<char> buffer(read_size);
        while (auto read = body.read(buffer.data(), buffer.size())) {
            data.insert(data.end(), buffer.begin(), buffer.begin() + read);
            if (on_read) {
                on_read(params.part_number, data.size());
            }
        }
        parts[params.part_number] = std::move(data);
        if (ack_delay.count() > 0) {
            std::this_thread::sleep_for(ack_delay);
        }
    }

    void complete_multipart_upload(const std::string &, const std::string &,
                                   const std::string &id,
                                   const std::vector<mpu::UploadedPart> &ordered,
                                   const mpu::Headers &metadata) override {
        ++complete_calls;
        assert(id == upload_id);
        completed_parts = ordered;
        completion_metadata = metadata;
        object.clear();
        for (const auto &part : ordered) {
            const auto &data = parts.at(part.part_number);
            assert(data.size() == part.size);
            object.insert(object.end(), data.begin(), data.end());
        }
    }

    mpu::Headers get_object_metadata(const std::string &, const std::string &) override {
        ++metadata_calls;
        if (on_metadata) {
            on_metadata();
        }
        if (metadata_status != 0) {
            throw mpu::StorageError(metadata_status, "");
        }
        if (!remote_object) {
            throw mpu::StorageError(404, "object not found");
        }
        return *remote_object;
    }

    int remote_calls() const {
        return initiate_calls + list_calls + complete_calls + metadata_calls +
               static_cast<int>(attempted.size());
    }

    std::string next_upload_id = "upload-1";
    std::string upload_id;
    std::uint32_t max_parts = 1000;
    std::map<std::uint32_t, std::vector<char>> parts;
    std::optional<mpu::Headers> remote_object;
    int metadata_status = 0;
    std::uint32_t fail_part = 0;
    std::size_t read_size = 64;
    std::function<void(std::uint32_t, std::size_t)> on_read;
    std::function<void()> on_metadata;
    std::function<void()> on_list;
    std::chrono::milliseconds ack_delay{0};

    int initiate_calls = 0;
    int list_calls = 0;
    int complete_calls = 0;
    int metadata_calls = 0;
    std::vector<std::uint32_t> attempted;
    std::vector<mpu::Headers> part_headers;
    std::vector<mpu::UploadedPart> completed_parts;
    mpu::Headers completion_metadata;
    std::vector<char> object;
};

// Serves `size` bytes of 'x' without touching the disk and counts range opens.
class SyntheticFileSource : public mpu::FileSource {
  public:
    SyntheticFileSource(std::uint64_t size, std::int64_t modified_time_ms)
        : size_(size), modified_time_ms_(modified_time_ms) {}

    bool exists(const fs::path &) const override { return true; }

    mpu::FileStat stat(const fs::path &) const override {
        return mpu::FileStat{size_, modified_time_ms_};
    }

    std::unique_ptr<mpu::ByteRangeStream> open_range(const fs::path &, std::uint64_t offset,
                                                     std::uint64_t length) const override {
        ++opened;
        if (offset == 0 && length == size_) {
            ++full_opens;
        }
        return std::make_unique<Stream>(length);
    }

    mutable int opened = 0;
    mutable int full_opens = 0;

  private:
    class Stream : public mpu::ByteRangeStream {
      public:
        explicit Stream(std::uint64_t length) : length_(length) {}

        std::size_t read(char *buffer, std::size_t size) override {
            const auto count =
                static_cast<std::size_t>(std::min<std::uint64_t>(size, length_ - consumed_));
            std::fill(buffer, buffer + count, 'x');
            consumed_ += count;
            return count;
        }

        std::uint64_t length() const noexcept override { return length_; }

      private:
        std::uint64_t length_;
        std::uint64_t consumed_{0};
    };

    std::uint64_t size_;
    std::int64_t modified_time_ms_;
};

class RecordingListener : public mpu::TransportListener {
  public:
    void on_start(const mpu::StartEvent &event) override {
        std::lock_guard<std::mutex> lock(mutex_);
        starts.push_back(event);
    }

    void on_progress(const mpu::ProgressEvent &event) override {
        std::lock_guard<std::mutex> lock(mutex_);
        progress.push_back(event);
    }

    void on_pause(const mpu::PauseEvent &event) override {
        std::lock_guard<std::mutex> lock(mutex_);
        pauses.push_back(event);
    }

    void on_finish(const mpu::FinishEvent &event) override {
        std::lock_guard<std::mutex> lock(mutex_);
        finishes.push_back(event);
    }

    void on_error(const mpu::ErrorEvent &event) override {
        std::lock_guard<std::mutex> lock(mutex_);
        errors.push_back(event);
    }

    std::vector<mpu::StartEvent> starts;
    std::vector<mpu::ProgressEvent> progress;
    std::vector<mpu::PauseEvent> pauses;
    std::vector<mpu::FinishEvent> finishes;
    std::vector<mpu::ErrorEvent> errors;

  private:
    std::mutex mutex_;
};

std::vector<char> write_file(const fs::path &path, std::size_t size) {
    std::vector<char> data(size);
    for (std::size_t i = 0; i < size; ++i) {
        data[i] = static_cast<char>((i * 31 + 7) % 256);
    }
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    file.write(data.data(), static_cast<std::streamsize>(data.size()));
    return data;
}

mpu::TransportConfig make_config(const fs::path &path, std::uint64_t part_size = 256) {
    mpu::TransportConfig config;
    config.session_id = "session-1";
    config.bucket = "bucket";
    config.object_key = "object";
    config.local_path = path;
    config.part_size_bytes = part_size;
    return config;
}

mpu::Headers transport_object(std::uint64_t size, const std::optional<std::string> &md5,
                              const std::optional<std::int64_t> &mtime) {
    mpu::Headers headers;
    headers["Content-Length"] = std::to_string(size);
    headers[mpu::headers::kMetaFrom] = mpu::headers::kTransportOrigin;
    if (md5) {
        headers[mpu::headers::kMetaMd5] = *md5;
    }
    if (mtime) {
        headers[mpu::headers::kMetaModifiedTime] = std::to_string(*mtime);
    }
    return headers;
}

void test_missing_file(const fs::path &dir) {
    FakeStorageClient client;
    mpu::LocalFileSource files;
    RecordingListener listener;
    mpu::ResumableTransport transport(make_config(dir / "missing.bin"), client, files, listener);
    assert(transport.is_paused());
    assert(transport.state() == mpu::TransportState::idle);
    transport.start();
    assert(listener.errors.size() == 1);
    assert(listener.errors[0].session_id == "session-1");
    assert(listener.errors[0].error.find("file not found") != std::string::npos);
    assert(listener.pauses.empty() && listener.finishes.empty() && listener.starts.empty());
    assert(client.remote_calls() == 0);
    assert(transport.is_paused());
    assert(transport.state() == mpu::TransportState::errored);
}

void test_fresh_upload(const fs::path &dir) {
    auto path = dir / "fresh.bin";
    auto data = write_file(path, 1000);
    FakeStorageClient client;
    mpu::LocalFileSource files;
    RecordingListener listener;
    mpu::ResumableTransport transport(make_config(path), client, files, listener);
    transport.start();

    assert(listener.errors.empty() && listener.pauses.empty());
    assert(listener.finishes.size() == 1);
    assert(listener.finishes[0].local_path == path);
    assert(listener.starts.size() == 1);
    assert(listener.starts[0].upload_id == "upload-1");
    assert(client.metadata_calls == 1);
    assert(client.initiate_calls == 1);
    assert((client.attempted == std::vector<std::uint32_t>{1, 2, 3, 4}));
    const std::vector<std::string> lengths{"256", "256", "256", "232"};
    for (std::size_t i = 0; i < lengths.size(); ++i) {
        assert(client.part_headers[i].at("content-length") == lengths[i]);
        assert(client.part_headers[i].at("content-type") == "application/octet-stream");
    }
    assert(client.complete_calls == 1);
    assert(client.completed_parts.size() == 4);
    for (std::size_t i = 0; i < client.completed_parts.size(); ++i) {
        assert(client.completed_parts[i].part_number == i + 1);
    }
    assert(client.object == data);

    const auto md5 = mpu::ContentHash::md5_base64(data);
    assert(client.completion_metadata.at(mpu::headers::kMetaFrom) == "bce-client");
    assert(client.completion_metadata.at(mpu::headers::kMetaMd5) == md5);
    assert(client.completion_metadata.at(mpu::headers::kMetaModifiedTime) ==
           std::to_string(files.stat(path).modified_time_ms));
    assert(transport.content_md5() == md5);

    assert(!listener.progress.empty());
    std::uint64_t last = 0;
    for (const auto &event : listener.progress) {
        assert(event.session_id == "session-1");
        assert(event.bytes_written >= last);
        last = event.bytes_written;
    }
    assert(last == 1000);
    assert(transport.uploaded_bytes() == 1000);
    assert(transport.is_paused());
    assert(transport.state() == mpu::TransportState::finished);
    assert(transport.upload_id() == std::string("upload-1"));
}

void test_empty_file(const fs::path &dir) {
    auto path = dir / "empty.bin";
    write_file(path, 0);
    FakeStorageClient client;
    mpu::LocalFileSource files;
    RecordingListener listener;
    mpu::ResumableTransport transport(make_config(path), client, files, listener);
    transport.start();
    assert(listener.finishes.size() == 1);
    assert(listener.starts.empty());
    assert(client.attempted.empty());
    assert(client.complete_calls == 1);
    assert(client.completed_parts.empty());
}

void test_consistency_checks(const fs::path &dir) {
    auto path = dir / "consistency.bin";
    auto data = write_file(path, 1000);
    mpu::LocalFileSource files;
    const auto mtime = files.stat(path).modified_time_ms;
    const auto md5 = mpu::ContentHash::md5_base64(data);

    auto check = [&](std::optional<mpu::Headers> remote) {
        FakeStorageClient client;
        client.remote_object = std::move(remote);
        RecordingListener listener;
        mpu::ResumableTransport transport(make_config(path), client, files, listener);
        return transport.check_consistency();
    };

    assert(!check(std::nullopt));
    assert(!check(transport_object(999, md5, mtime)));
    assert(check(transport_object(1000, md5, mtime)));
    assert(!check(transport_object(1000, std::string("1B2M2Y8AsgTpgAmY7PhCfg=="), mtime)));
    assert(check(transport_object(1000, std::nullopt, mtime)));
    assert(!check(transport_object(1000, std::nullopt, mtime + 1)));
    assert(!check(transport_object(1000, std::nullopt, std::nullopt)));

    mpu::Headers foreign;
    foreign["Content-Length"] = "1000";
    assert(check(foreign));
    foreign[mpu::headers::kMetaFrom] = "web-console";
    assert(check(foreign));
    foreign["Content-Length"] = "1001";
    assert(!check(foreign));

    FakeStorageClient failing;
    failing.metadata_status = 500;
    RecordingListener listener;
    mpu::ResumableTransport transport(make_config(path), failing, files, listener);
    bool threw = false;
    try {
        transport.check_consistency();
    } catch (const mpu::StorageError &err) {
        threw = err.status_code() == 500;
    }
    assert(threw);
}

void test_skips_consistent_remote(const fs::path &dir) {
    auto path = dir / "uploaded.bin";
    auto data = write_file(path, 1000);
    mpu::LocalFileSource files;
    FakeStorageClient client;
    client.remote_object = transport_object(1000, mpu::ContentHash::md5_base64(data), std::nullopt);
    RecordingListener listener;
    mpu::ResumableTransport transport(make_config(path), client, files, listener);
    transport.start();
    assert(listener.finishes.size() == 1);
    assert(listener.starts.empty() && listener.errors.empty());
    assert(client.initiate_calls == 0);
    assert(client.attempted.empty());
    assert(client.complete_calls == 0);
    assert(transport.state() == mpu::TransportState::finished);
    assert(!transport.upload_id());
}

void test_metadata_error(const fs::path &dir) {
    auto path = dir / "metadata_error.bin";
    write_file(path, 1000);
    mpu::LocalFileSource files;
    FakeStorageClient client;
    client.metadata_status = 500;
    RecordingListener listener;
    mpu::ResumableTransport transport(make_config(path), client, files, listener);
    transport.start();
    assert(listener.errors.size() == 1);
    assert(listener.errors[0].error == "Server code = 500");
    assert(client.initiate_calls == 0);
    assert(transport.is_paused());
    assert(transport.state() == mpu::TransportState::errored);
}

void test_resume_accepted_parts(const fs::path &dir) {
    auto path = dir / "large.bin";
    {
        std::ofstream file(path, std::ios::binary | std::ios::trunc);
    }
    fs::resize_file(path, 45 * MiB);

    mpu::LocalFileSource files;
    FakeStorageClient client;
    client.read_size = 1 << 20;
    client.upload_id = "upload-1";
    client.parts[1] = std::vector<char>(20 * MiB, '\0');
    RecordingListener listener;
    auto config = make_config(path, mpu::kDefaultPartSize);
    config.upload_id = "upload-1";
    mpu::ResumableTransport transport(config, client, files, listener);
    transport.start();

    assert(listener.errors.empty());
    assert(listener.finishes.size() == 1);
    assert(client.metadata_calls == 0);
    assert(client.initiate_calls == 0);
    assert((client.attempted == std::vector<std::uint32_t>{2, 3}));
    assert(client.part_headers[0].at("Content-Length") == std::to_string(20 * MiB));
    assert(client.part_headers[1].at("Content-Length") == std::to_string(5 * MiB));
    assert(client.completed_parts.size() == 3);
    assert(client.completed_parts[0].size == 20 * MiB);
    assert(client.completed_parts[1].size == 20 * MiB);
    assert(client.completed_parts[2].size == 5 * MiB);
    assert(client.object.size() == 45 * MiB);
    assert(!listener.progress.empty());
    assert(listener.progress.front().bytes_written > 20 * MiB);
    assert(listener.progress.back().bytes_written == 45 * MiB);
    assert(transport.uploaded_bytes() == 45 * MiB);
    assert(client.completion_metadata.at(mpu::headers::kMetaMd5) ==
           mpu::ContentHash::md5_base64(std::vector<char>(45 * MiB, '\0')));
}

void test_pause_mid_upload(const fs::path &dir) {
    auto path = dir / "pause.bin";
    auto data = write_file(path, 1000);
    mpu::LocalFileSource files;
    FakeStorageClient client;
    RecordingListener listener;
    mpu::ResumableTransport transport(make_config(path), client, files, listener);
    client.on_read = [&](std::uint32_t part_number, std::size_t received) {
        if (part_number == 2 && received == 128) {
            transport.pause();
        }
    };
    transport.start();

    assert(listener.pauses.size() == 1);
    assert(listener.errors.empty() && listener.finishes.empty());
    assert((client.attempted == std::vector<std::uint32_t>{1, 2}));
    assert(client.parts.size() == 1);
    assert(client.complete_calls == 0);
    assert(transport.is_paused());
    assert(transport.state() == mpu::TransportState::paused);
    assert(transport.uploaded_bytes() == 256);

    client.on_read = nullptr;
    transport.start();
    assert(listener.pauses.size() == 1);
    assert(listener.errors.empty());
    assert(listener.finishes.size() == 1);
    assert(listener.starts.size() == 2);
    assert((client.attempted == std::vector<std::uint32_t>{1, 2, 2, 3, 4}));
    assert(client.initiate_calls == 1);
    assert(client.metadata_calls == 1);
    assert(client.object == data);
    assert(transport.state() == mpu::TransportState::finished);
}

void test_pause_while_checking(const fs::path &dir) {
    auto path = dir / "pause_checking.bin";
    write_file(path, 1000);
    mpu::LocalFileSource files;
    FakeStorageClient client;
    RecordingListener listener;
    mpu::ResumableTransport transport(make_config(path), client, files, listener);
    client.on_metadata = [&] { transport.pause(); };
    transport.start();
    assert(listener.pauses.size() == 1);
    assert(listener.errors.empty() && listener.finishes.empty());
    assert(client.initiate_calls == 0);
    assert(client.attempted.empty());
    assert(transport.state() == mpu::TransportState::paused);
}

void test_pause_before_start(const fs::path &dir) {
    auto path = dir / "pause_idle.bin";
    write_file(path, 1000);
    mpu::LocalFileSource files;
    FakeStorageClient client;
    RecordingListener listener;
    mpu::ResumableTransport transport(make_config(path), client, files, listener);
    transport.pause();
    assert(listener.pauses.size() == 1);
    assert(client.remote_calls() == 0);
    assert(transport.is_paused());
    assert(transport.state() == mpu::TransportState::paused);
}

void test_stall_aborts_part(const fs::path &dir) {
    auto path = dir / "stall.bin";
    write_file(path, 1000);
    mpu::LocalFileSource files;
    FakeStorageClient client;
    RecordingListener listener;
    auto config = make_config(path);
    config.idle_timeout = std::chrono::milliseconds(50);
    mpu::ResumableTransport transport(config, client, files, listener);
    client.on_read = [](std::uint32_t part_number, std::size_t received) {
        if (part_number == 1 && received == 64) {
            std::this_thread::sleep_for(std::chrono::milliseconds(400));
        }
    };
    transport.start();
    assert(listener.errors.size() == 1);
    assert(listener.errors[0].error.find("stalled") != std::string::npos);
    assert(listener.pauses.empty() && listener.finishes.empty());
    assert(client.parts.empty());
    assert(client.complete_calls == 0);
    assert(transport.is_paused());
    assert(transport.state() == mpu::TransportState::errored);
}

void test_part_failure_then_retry(const fs::path &dir) {
    auto path = dir / "retry.bin";
    auto data = write_file(path, 1000);
    mpu::LocalFileSource files;
    FakeStorageClient client;
    client.fail_part = 2;
    RecordingListener listener;
    mpu::ResumableTransport transport(make_config(path), client, files, listener);
    transport.start();
    assert(listener.errors.size() == 1);
    assert(listener.errors[0].error == "service unavailable");
    assert((client.attempted == std::vector<std::uint32_t>{1, 2}));
    assert(client.complete_calls == 0);
    assert(transport.uploaded_bytes() == 256);
    assert(transport.state() == mpu::TransportState::errored);

    client.fail_part = 0;
    transport.start();
    assert(listener.errors.size() == 1);
    assert(listener.finishes.size() == 1);
    assert((client.attempted == std::vector<std::uint32_t>{1, 2, 2, 3, 4}));
    assert(client.object == data);
}

void test_resume_drives_queue(const fs::path &dir) {
    auto path = dir / "resume.bin";
    auto data = write_file(path, 1000);
    mpu::LocalFileSource files;
    FakeStorageClient client;
    client.upload_id = "upload-1";
    RecordingListener listener;

    mpu::ResumableTransport unbound(make_config(path), client, files, listener);
    bool threw = false;
    try {
        unbound.resume({});
    } catch (const mpu::Error &) {
        threw = true;
    }
    assert(threw);

    auto config = make_config(path);
    config.upload_id = "upload-1";
    mpu::ResumableTransport transport(config, client, files, listener);
    const auto plan = mpu::PartPlanner(256).decompose({}, 1000, 0, data.size());
    transport.resume(plan);
    assert((client.attempted == std::vector<std::uint32_t>{1, 2, 3, 4}));
    assert(transport.uploaded_bytes() == 1000);
    assert(listener.finishes.empty() && listener.errors.empty());

    client.fail_part = 1;
    threw = false;
    try {
        transport.resume(plan);
    } catch (const mpu::StorageError &err) {
        threw = err.status_code() == 503;
    }
    assert(threw);
    assert(client.attempted.size() == 5);
    assert(transport.state() == mpu::TransportState::errored);
}

void test_slow_acknowledgement(const fs::path &dir) {
    auto path = dir / "slow_ack.bin";
    auto data = write_file(path, 1000);
    mpu::LocalFileSource files;
    FakeStorageClient client;
    // Every part is fully read, then acknowledged after the idle timeout.
    client.ack_delay = std::chrono::milliseconds(200);
    RecordingListener listener;
    auto config = make_config(path);
    config.idle_timeout = std::chrono::milliseconds(50);
    mpu::ResumableTransport transport(config, client, files, listener);
    transport.start();
    assert(listener.errors.empty());
    assert(listener.pauses.empty());
    assert(listener.finishes.size() == 1);
    assert((client.attempted == std::vector<std::uint32_t>{1, 2, 3, 4}));
    assert(client.object == data);
    assert(transport.uploaded_bytes() == 1000);
    assert(transport.state() == mpu::TransportState::finished);
}

void test_pause_after_listing(const fs::path &dir) {
    auto path = dir / "pause_listing.bin";
    write_file(path, 1000);
    mpu::LocalFileSource files;
    FakeStorageClient client;
    RecordingListener listener;
    mpu::ResumableTransport transport(make_config(path), client, files, listener);
    client.on_list = [&] { transport.pause(); };
    transport.start();
    assert(listener.pauses.size() == 1);
    assert(listener.starts.empty());
    assert(listener.errors.empty() && listener.finishes.empty());
    assert(client.attempted.empty());
    assert(transport.state() == mpu::TransportState::paused);
}

void test_large_file_compares_mtime() {
    const std::int64_t mtime = 1514764800123;
    SyntheticFileSource files(mpu::ContentHash::kMaxHashableSize, mtime);
    FakeStorageClient client;
    RecordingListener listener;
    mpu::ResumableTransport transport(make_config("/synthetic/large.bin"), client, files,
                                      listener);

    client.remote_object = transport_object(mpu::ContentHash::kMaxHashableSize,
                                            std::string("1B2M2Y8AsgTpgAmY7PhCfg=="), mtime);
    assert(transport.check_consistency());
    client.remote_object = transport_object(mpu::ContentHash::kMaxHashableSize,
                                            std::string("1B2M2Y8AsgTpgAmY7PhCfg=="), mtime + 1);
    assert(!transport.check_consistency());
    assert(files.opened == 0);
    assert(!transport.content_md5());
    assert(files.opened == 0);
}

void test_hash_computed_once() {
    const std::int64_t mtime = 1514764800123;
    SyntheticFileSource files(1000, mtime);
    FakeStorageClient client;
    client.remote_object = transport_object(1000, std::string("1B2M2Y8AsgTpgAmY7PhCfg=="), mtime);
    RecordingListener listener;
    mpu::ResumableTransport transport(make_config("/synthetic/small.bin"), client, files,
                                      listener);
    assert(!transport.check_consistency());
    assert(files.full_opens == 1);

    transport.start();
    assert(listener.finishes.size() == 1);
    assert(client.attempted.size() == 4);
    assert(files.full_opens == 1);
    assert(client.completion_metadata.at(mpu::headers::kMetaMd5) ==
           mpu::ContentHash::md5_base64(std::vector<char>(1000, 'x')));
}

} // namespace

int main() {
    auto temp_dir = fs::temp_directory_path() / "mpu_transport_test";
    fs::create_directories(temp_dir);

    test_missing_file(temp_dir);
    test_fresh_upload(temp_dir);
    test_empty_file(temp_dir);
    test_consistency_checks(temp_dir);
    test_skips_consistent_remote(temp_dir);
    test_metadata_error(temp_dir);
    test_resume_accepted_parts(temp_dir);
    test_pause_mid_upload(temp_dir);
    test_pause_while_checking(temp_dir);
    test_pause_before_start(temp_dir);
    test_stall_aborts_part(temp_dir);
    test_part_failure_then_retry(temp_dir);
    test_resume_drives_queue(temp_dir);
    test_slow_acknowledgement(temp_dir);
    test_pause_after_listing(temp_dir);
    test_large_file_compares_mtime();
    test_hash_computed_once();

    fs::remove_all(temp_dir);
    return 0;
}

#include <any>
#include <filesystem>
#include <fstream>
#include <string>
#include <type_traits>
#include <vector>

#include <spdlog/spdlog.h>

#include "unchunk/config/config.hpp"
#include "unchunk/io/record_reader.hpp"
#include "unchunk/reassembly/unchunker.hpp"
#include "unchunk/utils/logging.hpp"
#include "unchunk/utils/time.hpp"

using namespace unchunk;

namespace {

// Writes or reports delivered messages
class MessageSink {
public:
    explicit MessageSink(std::string output_dir) : output_dir_(std::move(output_dir)) {}

    void on_bytes(const Bytes& message) {
        ++count_;
        bytes_ += message.size();
        if (output_dir_.empty()) {
            spdlog::info("Message {}: {} bytes", count_, message.size());
            return;
        }
        std::ofstream out(path_for(count_), std::ios::binary);
        out.write(reinterpret_cast<const char*>(message.data()),
                  static_cast<std::streamsize>(message.size()));
        if (!out) {
            spdlog::error("Failed to write {}", path_for(count_).string());
            ++failures_;
        }
    }

    void on_blob(const Blob& message) {
        ++count_;
        bytes_ += message.size();
        if (output_dir_.empty()) {
            spdlog::info("Message {}: {} bytes in {} segments",
                         count_, message.size(), message.segment_count());
            return;
        }
        std::ofstream out(path_for(count_), std::ios::binary);
        if (!message.write_to(out)) {
            spdlog::error("Failed to write {}", path_for(count_).string());
            ++failures_;
        }
    }

    [[nodiscard]] size_t count() const { return count_; }
    [[nodiscard]] uint64_t bytes() const { return bytes_; }
    [[nodiscard]] size_t failures() const { return failures_; }

private:
    std::filesystem::path path_for(size_t n) const {
        return std::filesystem::path(output_dir_) / ("message-" + std::to_string(n) + ".bin");
    }

    std::string output_dir_;
    size_t count_{0};
    uint64_t bytes_{0};
    size_t failures_{0};
};

// Replay one record file into the unchunker
template <typename Payload>
bool replay_file(const std::string& path,
                 const config::ToolConfig& config,
                 reassembly::BasicUnchunker<Payload>& unchunker,
                 uint64_t& records) {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        spdlog::error("Cannot open {}", path);
        return false;
    }

    io::RecordReader reader(input);
    io::RecordError record_error = io::RecordError::SUCCESS;

    while (true) {
        ChunkError error = ChunkError::SUCCESS;
        if constexpr (std::is_same_v<Payload, Blob>) {
            // Chunks stay in the file, only their headers are read
            auto info = reader.skip(&record_error);
            if (!info) break;
            error = unchunker.add(Blob::from_file(path, info->offset, info->length), records);
        } else {
            auto record = reader.next(&record_error);
            if (!record) break;
            error = unchunker.add(ByteView(*record), records);
        }

        if (error != ChunkError::SUCCESS) {
            spdlog::warn("{}: record {}: {}", path, reader.records_read(),
                         chunk_error_to_string(error));
        }

        ++records;
        if (config.gc_interval > 0 && records % config.gc_interval == 0) {
            unchunker.gc(config.max_age_ms);
        }
    }

    if (record_error != io::RecordError::END_OF_STREAM) {
        spdlog::error("{}: {} after {} records", path,
                      io::record_error_to_string(record_error), reader.records_read());
        return false;
    }
    return true;
}

template <typename Payload>
int run(const config::ToolConfig& config, MessageSink& sink) {
    reassembly::BasicUnchunker<Payload> unchunker;
    unchunker.set_message_handler([&sink](Payload message, std::vector<std::any> context) {
        if constexpr (std::is_same_v<Payload, Blob>) {
            sink.on_blob(message);
        } else {
            sink.on_bytes(message);
        }
        // Context is the index of each record that carried a chunk
        if (!context.empty()) {
            spdlog::debug("Message {} built from records {}..{}", sink.count(),
                          std::any_cast<uint64_t>(context.front()),
                          std::any_cast<uint64_t>(context.back()));
        }
    });

    utils::Timer timer;
    uint64_t records = 0;
    bool ok = true;
    for (const auto& path : config.inputs) {
        ok = replay_file(path, config, unchunker, records) && ok;
    }

    const auto& stats = unchunker.stats();
    spdlog::info("Processed {} records in {} ms", records, timer.elapsed_ms());
    spdlog::info("Delivered {} messages ({} bytes), {} duplicates, {} merge failures",
                 sink.count(), sink.bytes(), stats.duplicates_ignored, stats.merge_failures);
    spdlog::info("Expired {} messages ({} chunks), {} still incomplete",
                 stats.messages_expired, stats.chunks_expired, unchunker.pending_messages());

    return ok && sink.failures() == 0 ? 0 : 1;
}

}  // namespace

int main(int argc, char* argv[]) {
    std::string config_path;
    auto cli = config::parse_cli(argc, argv, &config_path);
    if (!cli) {
        return 1;
    }

    config::ToolConfig config = *cli;
    if (!config_path.empty()) {
        auto file = config::load_config(config_path);
        if (!file) {
            return 1;
        }
        config = config::merge_config(*file, *cli);
    }

    utils::init_logging(utils::string_to_log_level(config.log_level));

    auto validation = config::validate_config(config);
    for (const auto& warning : validation.warnings) {
        spdlog::warn("{}", warning);
    }
    for (const auto& error : validation.errors) {
        spdlog::error("{}", error);
    }
    if (!validation.valid) {
        return 1;
    }

    if (!config.output_dir.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(config.output_dir, ec);
        if (ec) {
            spdlog::error("Cannot create {}: {}", config.output_dir, ec.message());
            return 1;
        }
    }

    spdlog::info("Replaying {} files in {} mode", config.inputs.size(),
                 config::delivery_mode_to_string(config.mode));

    MessageSink sink(config.output_dir);
    switch (config.mode) {
        case config::DeliveryMode::BLOB: return run<Blob>(config, sink);
        case config::DeliveryMode::BYTES: return run<Bytes>(config, sink);
    }
    return 1;
}

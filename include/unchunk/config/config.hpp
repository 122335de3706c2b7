#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace unchunk::config {

// Message representation delivered by the tool's unchunker
enum class DeliveryMode {
    BYTES,  // Contiguous buffer
    BLOB    // File-backed blob, chunks referenced in place
};

const char* delivery_mode_to_string(DeliveryMode mode);
std::optional<DeliveryMode> string_to_delivery_mode(const std::string& str);

// Configuration of the unchunk command-line tool
struct ToolConfig {
    std::vector<std::string> inputs;      // Record files to replay
    std::string output_dir;               // Where to write messages, empty = report only
    DeliveryMode mode{DeliveryMode::BYTES};
    uint64_t max_age_ms = 30000;          // gc() threshold for incomplete messages
    uint64_t gc_interval = 1000;          // Run gc() every N records, 0 = only at the end
    std::string log_level = "info";
};

// Parse configuration from an INI file
std::optional<ToolConfig> load_config(const std::string& path);

// Parse configuration from CLI arguments.
// config_path receives the value of --config when given.
std::optional<ToolConfig> parse_cli(int argc, char* argv[], std::string* config_path = nullptr);

// Save configuration to file
bool save_config(const ToolConfig& config, const std::string& path);

// Merge CLI arguments over config file
ToolConfig merge_config(const ToolConfig& base, const ToolConfig& overlay);

// Validate configuration
struct ValidationResult {
    bool valid{true};
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
};

ValidationResult validate_config(const ToolConfig& config);

}  // namespace unchunk::config

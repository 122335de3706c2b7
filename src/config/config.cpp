#include "unchunk/config/config.hpp"

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <fstream>
#include <sstream>

#include "unchunk/utils/logging.hpp"

namespace unchunk::config {

namespace {

// Simple INI parser
class IniParser {
public:
    struct Entry {
        std::string section;
        std::string key;
        std::string value;
    };

    static std::vector<Entry> parse(std::istream& input) {
        std::vector<Entry> entries;
        std::string current_section;
        std::string line;

        while (std::getline(input, line)) {
            // Trim whitespace
            line.erase(0, line.find_first_not_of(" \t\r\n"));
            line.erase(line.find_last_not_of(" \t\r\n") + 1);

            // Skip empty lines and comments
            if (line.empty() || line[0] == '#' || line[0] == ';') {
                continue;
            }

            // Section header
            if (line[0] == '[' && line.back() == ']') {
                current_section = line.substr(1, line.size() - 2);
                continue;
            }

            // Key=value
            auto eq_pos = line.find('=');
            if (eq_pos != std::string::npos) {
                std::string key = line.substr(0, eq_pos);
                std::string value = line.substr(eq_pos + 1);

                // Trim
                key.erase(key.find_last_not_of(" \t") + 1);
                value.erase(0, value.find_first_not_of(" \t"));

                // Remove quotes
                if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
                    value = value.substr(1, value.size() - 2);
                }

                entries.push_back({current_section, key, value});
            }
        }

        return entries;
    }
};

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return s;
}

std::optional<uint64_t> parse_u64(const std::string& value) {
    uint64_t result = 0;
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), result);
    if (ec != std::errc() || ptr != value.data() + value.size()) {
        return std::nullopt;
    }
    return result;
}

// Comma separated list, blanks dropped
std::vector<std::string> split_list(const std::string& value) {
    std::vector<std::string> items;
    std::stringstream stream(value);
    std::string item;
    while (std::getline(stream, item, ',')) {
        item.erase(0, item.find_first_not_of(" \t"));
        item.erase(item.find_last_not_of(" \t") + 1);
        if (!item.empty()) {
            items.push_back(item);
        }
    }
    return items;
}

}  // namespace

const char* delivery_mode_to_string(DeliveryMode mode) {
    switch (mode) {
        case DeliveryMode::BYTES: return "bytes";
        case DeliveryMode::BLOB: return "blob";
    }
    return "bytes";
}

std::optional<DeliveryMode> string_to_delivery_mode(const std::string& str) {
    std::string lower = to_lower(str);
    if (lower == "bytes" || lower == "buffer") return DeliveryMode::BYTES;
    if (lower == "blob" || lower == "stream") return DeliveryMode::BLOB;
    return std::nullopt;
}

std::optional<ToolConfig> load_config(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        spdlog::error("Cannot open config file {}", path);
        return std::nullopt;
    }

    auto entries = IniParser::parse(file);
    ToolConfig config;

    auto read_number = [&path](const IniParser::Entry& entry, uint64_t& out) {
        auto value = parse_u64(entry.value);
        if (!value) {
            spdlog::error("{}: invalid number for {}: '{}'", path, entry.key, entry.value);
            return false;
        }
        out = *value;
        return true;
    };

    for (const auto& entry : entries) {
        std::string section = to_lower(entry.section);
        std::string key = to_lower(entry.key);

        if (section == "input") {
            if (key == "files" || key == "file") {
                auto files = split_list(entry.value);
                config.inputs.insert(config.inputs.end(), files.begin(), files.end());
            }
        } else if (section == "output") {
            if (key == "dir" || key == "directory") {
                config.output_dir = entry.value;
            }
        } else if (section == "unchunker" || section.empty()) {
            if (key == "mode") {
                auto mode = string_to_delivery_mode(entry.value);
                if (!mode) {
                    spdlog::error("{}: unknown mode '{}'", path, entry.value);
                    return std::nullopt;
                }
                config.mode = *mode;
            } else if (key == "max_age_ms") {
                if (!read_number(entry, config.max_age_ms)) return std::nullopt;
            } else if (key == "gc_interval") {
                if (!read_number(entry, config.gc_interval)) return std::nullopt;
            }
        } else if (section == "logging") {
            if (key == "level") {
                config.log_level = entry.value;
            }
        }
    }

    return config;
}

std::optional<ToolConfig> parse_cli(int argc, char* argv[], std::string* config_path) {
    CLI::App app{"unchunk - reassemble chunked messages"};

    ToolConfig config;
    std::string mode = delivery_mode_to_string(config.mode);
    std::string path;

    app.add_option("inputs", config.inputs, "Record files with one raw chunk per record");
    app.add_option("-c,--config", path, "INI configuration file");
    app.add_option("-o,--output", config.output_dir, "Directory for reassembled messages");
    app.add_option("-m,--mode", mode, "Delivery mode: bytes or blob")
        ->check(CLI::IsMember({"bytes", "blob"}));
    app.add_option("--max-age", config.max_age_ms, "Drop incomplete messages idle this long (ms)");
    app.add_option("--gc-interval", config.gc_interval, "Run garbage collection every N records");
    app.add_option("-l,--log-level", config.log_level, "Log level: trace,debug,info,warn,error");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        // Prints help or the parse error
        app.exit(e);
        return std::nullopt;
    }

    config.mode = string_to_delivery_mode(mode).value_or(DeliveryMode::BYTES);
    if (config_path) {
        *config_path = path;
    }
    return config;
}

bool save_config(const ToolConfig& config, const std::string& path) {
    std::ofstream file(path);
    if (!file) {
        return false;
    }

    file << "[input]\n";
    file << "files = ";
    for (size_t i = 0; i < config.inputs.size(); ++i) {
        file << (i ? ", " : "") << config.inputs[i];
    }
    file << "\n\n";

    file << "[output]\n";
    file << "dir = " << config.output_dir << "\n";
    file << "\n";

    file << "[unchunker]\n";
    file << "mode = " << delivery_mode_to_string(config.mode) << "\n";
    file << "max_age_ms = " << config.max_age_ms << "\n";
    file << "gc_interval = " << config.gc_interval << "\n";
    file << "\n";

    file << "[logging]\n";
    file << "level = " << config.log_level << "\n";

    return static_cast<bool>(file);
}

ToolConfig merge_config(const ToolConfig& base, const ToolConfig& overlay) {
    const ToolConfig defaults;
    ToolConfig result = base;

    // Override with values the overlay changed from the defaults
    if (!overlay.inputs.empty()) {
        result.inputs = overlay.inputs;
    }
    if (!overlay.output_dir.empty()) {
        result.output_dir = overlay.output_dir;
    }
    if (overlay.mode != defaults.mode) {
        result.mode = overlay.mode;
    }
    if (overlay.max_age_ms != defaults.max_age_ms) {
        result.max_age_ms = overlay.max_age_ms;
    }
    if (overlay.gc_interval != defaults.gc_interval) {
        result.gc_interval = overlay.gc_interval;
    }
    if (overlay.log_level != defaults.log_level) {
        result.log_level = overlay.log_level;
    }

    return result;
}

ValidationResult validate_config(const ToolConfig& config) {
    ValidationResult result;

    if (config.inputs.empty()) {
        result.errors.push_back("No input files given");
        result.valid = false;
    }

    utils::LogLevel level;
    if (!utils::try_parse_log_level(config.log_level, level)) {
        result.errors.push_back("Unknown log level: " + config.log_level);
        result.valid = false;
    }

    if (config.max_age_ms == 0) {
        result.warnings.push_back("max_age_ms is 0 - every idle incomplete message is dropped on gc");
    }

    if (config.gc_interval == 0) {
        result.warnings.push_back("gc_interval is 0 - garbage collection only runs at the end");
    }

    if (config.output_dir.empty()) {
        result.warnings.push_back("No output directory - messages are only reported");
    }

    return result;
}

}  // namespace unchunk::config

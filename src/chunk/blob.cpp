#include "unchunk/chunk/blob.hpp"

#include <algorithm>
#include <array>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <system_error>

namespace unchunk {

MemoryBlobPart::MemoryBlobPart(std::vector<uint8_t> bytes)
    : bytes_(std::move(bytes)) {
}

bool MemoryBlobPart::read(size_t offset, std::span<uint8_t> out) const {
    if (offset > bytes_.size() || out.size() > bytes_.size() - offset) {
        return false;
    }
    if (!out.empty()) {
        std::memcpy(out.data(), bytes_.data() + offset, out.size());
    }
    return true;
}

FileBlobPart::FileBlobPart(std::string path, uint64_t offset, size_t size)
    : path_(std::move(path)), offset_(offset), size_(size) {
}

bool FileBlobPart::read(size_t offset, std::span<uint8_t> out) const {
    if (offset > size_ || out.size() > size_ - offset) {
        return false;
    }
    if (out.empty()) {
        return true;
    }

    std::ifstream file(path_, std::ios::binary);
    if (!file) {
        return false;
    }

    file.seekg(static_cast<std::streamoff>(offset_ + offset));
    if (!file) {
        return false;
    }

    file.read(reinterpret_cast<char*>(out.data()), static_cast<std::streamsize>(out.size()));
    return static_cast<size_t>(file.gcount()) == out.size();
}

Blob::Blob(std::shared_ptr<const BlobPart> part) {
    if (part && part->size() > 0) {
        size_ = part->size();
        segments_.push_back({std::move(part), 0, size_});
    }
}

Blob Blob::from_bytes(std::span<const uint8_t> bytes) {
    return Blob(std::make_shared<MemoryBlobPart>(
        std::vector<uint8_t>(bytes.begin(), bytes.end())));
}

Blob Blob::from_file(const std::string& path, uint64_t offset, size_t size) {
    return Blob(std::make_shared<FileBlobPart>(path, offset, size));
}

std::optional<Blob> Blob::from_file(const std::string& path) {
    std::error_code ec;
    auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        return std::nullopt;
    }
    return from_file(path, 0, static_cast<size_t>(size));
}

Blob Blob::concat(std::span<const Blob* const> blobs) {
    Blob result;
    for (const Blob* blob : blobs) {
        if (!blob) {
            continue;
        }
        result.segments_.insert(result.segments_.end(),
                                blob->segments_.begin(), blob->segments_.end());
        result.size_ += blob->size_;
    }
    return result;
}

Blob Blob::slice(size_t begin, size_t end) const {
    end = std::min(end, size_);
    begin = std::min(begin, end);

    Blob result;
    size_t position = 0;
    for (const auto& segment : segments_) {
        size_t seg_begin = position;
        size_t seg_end = position + segment.length;
        position = seg_end;

        if (seg_end <= begin) {
            continue;
        }
        if (seg_begin >= end) {
            break;
        }

        size_t from = std::max(begin, seg_begin) - seg_begin;
        size_t to = std::min(end, seg_end) - seg_begin;
        result.segments_.push_back({segment.part, segment.offset + from, to - from});
        result.size_ += to - from;
    }
    return result;
}

bool Blob::read(size_t offset, std::span<uint8_t> out) const {
    if (offset > size_ || out.size() > size_ - offset) {
        return false;
    }

    size_t position = 0;
    size_t written = 0;
    for (const auto& segment : segments_) {
        if (written == out.size()) {
            break;
        }

        size_t seg_end = position + segment.length;
        size_t cursor = offset + written;
        if (cursor < seg_end) {
            size_t within = cursor - position;
            size_t take = std::min(segment.length - within, out.size() - written);
            if (!segment.part->read(segment.offset + within, out.subspan(written, take))) {
                return false;
            }
            written += take;
        }
        position = seg_end;
    }

    return written == out.size();
}

std::optional<std::vector<uint8_t>> Blob::read_all() const {
    std::vector<uint8_t> out(size_);
    if (!read(0, out)) {
        return std::nullopt;
    }
    return out;
}

bool Blob::write_to(std::ostream& out) const {
    std::array<uint8_t, 4096> buffer;

    for (const auto& segment : segments_) {
        size_t done = 0;
        while (done < segment.length) {
            size_t take = std::min(buffer.size(), segment.length - done);
            std::span<uint8_t> view(buffer.data(), take);
            if (!segment.part->read(segment.offset + done, view)) {
                return false;
            }
            out.write(reinterpret_cast<const char*>(buffer.data()),
                      static_cast<std::streamsize>(take));
            if (!out) {
                return false;
            }
            done += take;
        }
    }
    return true;
}

}  // namespace unchunk

#pragma once

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace unchunk {

// Backing storage of a blob. Bytes are only reachable through read(),
// which may block (file I/O) and may fail.
class BlobPart {
public:
    virtual ~BlobPart() = default;

    [[nodiscard]] virtual size_t size() const = 0;

    // Copy out.size() bytes starting at offset into out.
    // Returns false if the bytes could not be read.
    virtual bool read(size_t offset, std::span<uint8_t> out) const = 0;
};

// Part holding an owned copy of in-memory bytes
class MemoryBlobPart : public BlobPart {
public:
    explicit MemoryBlobPart(std::vector<uint8_t> bytes);

    [[nodiscard]] size_t size() const override { return bytes_.size(); }
    bool read(size_t offset, std::span<uint8_t> out) const override;

private:
    std::vector<uint8_t> bytes_;
};

// Part referencing a byte range of a file, read on demand
class FileBlobPart : public BlobPart {
public:
    FileBlobPart(std::string path, uint64_t offset, size_t size);

    [[nodiscard]] size_t size() const override { return size_; }
    bool read(size_t offset, std::span<uint8_t> out) const override;

    [[nodiscard]] const std::string& path() const { return path_; }

private:
    std::string path_;
    uint64_t offset_;
    size_t size_;
};

// Immutable binary object assembled from ranges of shared parts.
// Copies, slices and concatenations share parts and never copy bytes.
class Blob {
public:
    Blob() = default;
    explicit Blob(std::shared_ptr<const BlobPart> part);

    // Blob over a private copy of the given bytes
    static Blob from_bytes(std::span<const uint8_t> bytes);

    // Blob over a byte range of a file (the file is not opened here)
    static Blob from_file(const std::string& path, uint64_t offset, size_t size);

    // Blob over a whole file, nullopt if its size cannot be determined
    static std::optional<Blob> from_file(const std::string& path);

    // Concatenate blobs in order
    static Blob concat(std::span<const Blob* const> blobs);

    [[nodiscard]] size_t size() const { return size_; }
    [[nodiscard]] bool empty() const { return size_ == 0; }

    // Number of part ranges the blob is made of
    [[nodiscard]] size_t segment_count() const { return segments_.size(); }

    // Sub-range [begin, end), clamped to the blob size
    [[nodiscard]] Blob slice(size_t begin, size_t end) const;

    // Copy out.size() bytes starting at offset into out.
    // Returns false if the range is out of bounds or a part failed to read.
    bool read(size_t offset, std::span<uint8_t> out) const;

    // Read the whole blob into memory
    [[nodiscard]] std::optional<std::vector<uint8_t>> read_all() const;

    // Stream the blob to out, part by part
    bool write_to(std::ostream& out) const;

private:
    struct Segment {
        std::shared_ptr<const BlobPart> part;
        size_t offset;
        size_t length;
    };

    std::vector<Segment> segments_;
    size_t size_{0};
};

}  // namespace unchunk

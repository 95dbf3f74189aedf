#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace middleman {

using Bytes = std::vector<uint8_t>;

// Accumulates a response body as it streams past. Chunks are kept as written
// and only joined by to_bytes()/to_string(). After close() the buffer is
// inert: writes and reads throw UsageError.
class WriteBuffer {
public:
    void write(Bytes chunk);
    void write(const char* data, size_t len);

    // Concatenation of everything written; empty if nothing was.
    Bytes to_bytes() const;
    std::string to_string() const;

    // Drop buffered chunks; the buffer stays writable.
    void flush();

    void close();
    bool closed() const { return closed_; }

    size_t size() const { return size_; }
    size_t chunk_count() const { return chunks_.size(); }

private:
    void ensure_open(const char* op) const;

    std::vector<Bytes> chunks_;
    size_t size_ = 0;
    bool closed_ = false;
};

} // namespace middleman

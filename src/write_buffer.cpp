#include "write_buffer.hpp"
#include "errors.hpp"

namespace middleman {

void WriteBuffer::ensure_open(const char* op) const {
    if (closed_) throw UsageError(std::string("WriteBuffer: ") + op + " after close");
}

void WriteBuffer::write(Bytes chunk) {
    ensure_open("write");
    if (chunk.empty()) return;
    size_ += chunk.size();
    chunks_.push_back(std::move(chunk));
}

void WriteBuffer::write(const char* data, size_t len) {
    ensure_open("write");
    if (len == 0) return;
    const auto* p = reinterpret_cast<const uint8_t*>(data);
    size_ += len;
    chunks_.emplace_back(p, p + len);
}

Bytes WriteBuffer::to_bytes() const {
    ensure_open("read");
    Bytes out;
    out.reserve(size_);
    for (const auto& chunk : chunks_) {
        out.insert(out.end(), chunk.begin(), chunk.end());
    }
    return out;
}

std::string WriteBuffer::to_string() const {
    Bytes bytes = to_bytes();
    return std::string(bytes.begin(), bytes.end());
}

void WriteBuffer::flush() {
    chunks_.clear();
    size_ = 0;
}

void WriteBuffer::close() {
    chunks_.clear();
    chunks_.shrink_to_fit();
    size_ = 0;
    closed_ = true;
}

} // namespace middleman

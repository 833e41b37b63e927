#include "repopath/tail_ring.hpp"

namespace repopath {

// ============================================================================
// TailRing
// ============================================================================

// The buffer grows with the data written; the limit is only an upper bound.
TailRing::TailRing(long long limit)
    : limit_(limit > 0 ? static_cast<size_t>(limit) : 0) {}

TailRing::TailRing(const TailRing& other) {
    std::lock_guard<std::mutex> lock(other.mutex_);
    buf_ = other.buf_;
    limit_ = other.limit_;
}

size_t TailRing::write(const char* data, size_t size) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (limit_ == 0) {
        return size;
    }

    // A chunk that fills the ring on its own replaces everything.
    if (size >= limit_) {
        buf_.assign(data + (size - limit_), limit_);
        return size;
    }

    size_t total = buf_.size() + size;
    if (total > limit_) {
        buf_.erase(0, total - limit_);
    }
    buf_.append(data, size);
    return size;
}

std::string TailRing::str() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return buf_;
}

std::vector<uint8_t> TailRing::bytes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<uint8_t>(buf_.begin(), buf_.end());
}

size_t TailRing::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return buf_.size();
}

void TailRing::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    buf_.clear();
}

// ============================================================================
// TeeStreamBuf
// ============================================================================

TeeStreamBuf::int_type TeeStreamBuf::overflow(int_type ch) {
    if (traits_type::eq_int_type(ch, traits_type::eof())) {
        return traits_type::not_eof(ch);
    }
    char c = traits_type::to_char_type(ch);
    ring_.write(&c, 1);
    if (dst_ && traits_type::eq_int_type(dst_->sputc(c), traits_type::eof())) {
        return traits_type::eof();
    }
    return ch;
}

std::streamsize TeeStreamBuf::xsputn(const char* s, std::streamsize n) {
    if (n <= 0) {
        return 0;
    }
    ring_.write(s, static_cast<size_t>(n));
    if (dst_) {
        return dst_->sputn(s, n);
    }
    return n;
}

int TeeStreamBuf::sync() {
    return dst_ ? dst_->pubsync() : 0;
}

} // namespace repopath

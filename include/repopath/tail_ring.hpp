#pragma once

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <streambuf>
#include <string>
#include <vector>

namespace repopath {

/**
 * @brief Bounded buffer that keeps only the last N bytes written.
 *
 * Used to capture the tail of log output. All operations are thread-safe.
 * A limit of zero or less keeps nothing.
 */
class TailRing {
public:
    explicit TailRing(long long limit);

    static TailRing from_kb(long long kb) { return TailRing(kb * 1024); }

    TailRing(const TailRing& other);
    TailRing& operator=(const TailRing&) = delete;

    // Append data, dropping the oldest bytes past the limit.
    // Always reports the full size as consumed.
    size_t write(const char* data, size_t size);
    size_t write(const std::string& data) { return write(data.data(), data.size()); }

    std::string str() const;
    std::vector<uint8_t> bytes() const;

    size_t size() const;
    size_t capacity() const { return limit_; }
    void reset();

private:
    mutable std::mutex mutex_;
    std::string buf_;
    size_t limit_;
};

/**
 * @brief Stream buffer that forwards output to another buffer and a TailRing.
 *
 * Install it behind an std::ostream to tee everything written there into the
 * ring. A null destination only records into the ring.
 */
class TeeStreamBuf : public std::streambuf {
public:
    TeeStreamBuf(std::streambuf* dst, TailRing& ring) : dst_(dst), ring_(ring) {}

protected:
    int_type overflow(int_type ch) override;
    std::streamsize xsputn(const char* s, std::streamsize n) override;
    int sync() override;

private:
    std::streambuf* dst_;
    TailRing& ring_;
};

} // namespace repopath

#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>

namespace persist {

struct IoResult {
    bool ok{false};
    int error_code{0};
};

// Append-only byte sink behind the journal. Abstract so tests can inject failures.
class IFileSink {
public:
    virtual ~IFileSink() = default;
    virtual IoResult open(const std::string& path) noexcept = 0;
    virtual void close() noexcept = 0;
    // Writes all bytes or fails; a partial write is reported as a failure.
    virtual IoResult append(std::span<const std::byte> data) noexcept = 0;
    virtual IoResult sync() noexcept = 0;
    // Drops everything past size; used to roll back a failed append.
    virtual IoResult truncate(std::uint64_t size) noexcept = 0;
    virtual std::uint64_t current_size() const noexcept = 0;
    virtual bool is_open() const noexcept = 0;
};

class PosixFileSink : public IFileSink {
public:
    PosixFileSink();
    ~PosixFileSink() override;

    PosixFileSink(const PosixFileSink&) = delete;
    PosixFileSink& operator=(const PosixFileSink&) = delete;

    IoResult open(const std::string& path) noexcept override;
    void close() noexcept override;
    IoResult append(std::span<const std::byte> data) noexcept override;
    IoResult sync() noexcept override;
    IoResult truncate(std::uint64_t size) noexcept override;
    std::uint64_t current_size() const noexcept override { return size_bytes_; }
    bool is_open() const noexcept override;

private:
    int fd_{-1};
    std::uint64_t size_bytes_{0};
};

} // namespace persist

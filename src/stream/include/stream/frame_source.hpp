#pragma once
#include "core/expected.hpp"
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace vcam::stream {

enum class ReadStatus {
    Frame,          // buffer holds exactly one frame
    EndOfStream,    // source closed, possibly mid-frame; the partial tail is dropped
    Interrupted,    // a signal arrived while the interrupt flag was raised
    Error           // read failed for a reason other than end of stream
};

const char* read_status_name(ReadStatus s) noexcept;

struct SourceStats {
    uint64_t frames_read = 0;
    uint64_t bytes_read = 0;
    uint64_t discarded_tail_bytes = 0; // bytes of an incomplete final frame
};

// Producer of fixed-size raw frames. The stream has no delimiters: frame N occupies
// bytes [N*frame_size, (N+1)*frame_size).
class IFrameSource {
public:
    virtual ~IFrameSource() = default;
    virtual ReadStatus read_frame(std::vector<uint8_t>& out) = 0;
    virtual std::size_t frame_size() const = 0;
    virtual const SourceStats& stats() const = 0;
};

// Reads frames from a file descriptor (pipe, file, stdin).
class FdFrameSource final : public IFrameSource {
public:
    FdFrameSource(int fd, std::size_t frame_size, bool owns_fd);
    ~FdFrameSource() override;
    FdFrameSource(const FdFrameSource&) = delete;
    FdFrameSource& operator=(const FdFrameSource&) = delete;

    ReadStatus read_frame(std::vector<uint8_t>& out) override;
    std::size_t frame_size() const override { return frame_size_; }
    const SourceStats& stats() const override { return stats_; }

    int last_errno() const { return errno_; }

    // When set and raised, read_frame returns Interrupted instead of retrying a read() that a
    // signal cut short; the flag is also checked before each read(). Bytes of the interrupted
    // frame are discarded.
    void set_interrupt_flag(const std::atomic<bool>* flag) { interrupt_ = flag; }

private:
    int fd_;
    std::size_t frame_size_;
    bool owns_fd_;
    const std::atomic<bool>* interrupt_ = nullptr;
    bool eof_ = false;
    int errno_ = 0;
    SourceStats stats_;
};

// "-" selects stdin (not closed on destruction); anything else is opened read-only.
// interrupt is forwarded to FdFrameSource::set_interrupt_flag.
expected<std::unique_ptr<IFrameSource>, std::string>
open_frame_source(const std::string& path, std::size_t frame_size, const std::atomic<bool>* interrupt = nullptr);

} // namespace vcam::stream

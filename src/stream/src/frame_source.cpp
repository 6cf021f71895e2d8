#include "stream/frame_source.hpp"
#include "core/log.hpp"

#include <fcntl.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

namespace vcam::stream {

namespace {

constexpr ssize_t kInterrupted = -2;

bool interrupted(const std::atomic<bool>* interrupt) {
    return interrupt && interrupt->load(std::memory_order_relaxed);
}

// Fill up to len bytes, retrying on short pipe reads and on EINTR unless the interrupt flag
// is raised. Returns the byte count actually read (< len only at end of stream), -1 on
// error or kInterrupted.
ssize_t read_full(int fd, uint8_t* buf, std::size_t len, const std::atomic<bool>* interrupt) {
    std::size_t got = 0;
    while (got < len) {
        // A signal that landed before read() blocks produces no EINTR.
        if (interrupted(interrupt)) return kInterrupted;
        ssize_t n = ::read(fd, buf + got, len - got);
        if (n < 0) {
            if (errno == EINTR) {
                if (interrupted(interrupt)) return kInterrupted;
                continue;
            }
            return -1;
        }
        if (n == 0) break;
        got += static_cast<std::size_t>(n);
    }
    return static_cast<ssize_t>(got);
}

} // namespace

const char* read_status_name(ReadStatus s) noexcept {
    switch (s) {
        case ReadStatus::Frame: return "frame";
        case ReadStatus::EndOfStream: return "end-of-stream";
        case ReadStatus::Interrupted: return "interrupted";
        case ReadStatus::Error: return "error";
    }
    return "unknown";
}

FdFrameSource::FdFrameSource(int fd, std::size_t frame_size, bool owns_fd)
    : fd_(fd), frame_size_(frame_size), owns_fd_(owns_fd) {}

FdFrameSource::~FdFrameSource() {
    if (owns_fd_ && fd_ >= 0) ::close(fd_);
}

ReadStatus FdFrameSource::read_frame(std::vector<uint8_t>& out) {
    if (eof_) return ReadStatus::EndOfStream;
    if (frame_size_ == 0) {
        errno_ = EINVAL;
        return ReadStatus::Error;
    }

    out.resize(frame_size_);
    const ssize_t n = read_full(fd_, out.data(), frame_size_, interrupt_);
    if (n == kInterrupted) {
        out.clear();
        return ReadStatus::Interrupted;
    }
    if (n < 0) {
        errno_ = errno;
        vcam::log::error(std::string("frame source: read failed: ") + std::strerror(errno_));
        return ReadStatus::Error;
    }

    const auto got = static_cast<std::size_t>(n);
    stats_.bytes_read += got;
    if (got < frame_size_) {
        eof_ = true;
        stats_.discarded_tail_bytes = got;
        if (got > 0) {
            vcam::log::debug("frame source: dropping partial frame (" + std::to_string(got) + "/" +
                             std::to_string(frame_size_) + " bytes)");
        }
        out.clear();
        return ReadStatus::EndOfStream;
    }

    ++stats_.frames_read;
    return ReadStatus::Frame;
}

expected<std::unique_ptr<IFrameSource>, std::string>
open_frame_source(const std::string& path, std::size_t frame_size, const std::atomic<bool>* interrupt) {
    if (frame_size == 0) return make_unexpected(std::string("frame size must be positive"));

    std::unique_ptr<FdFrameSource> source;
    if (path == "-") {
        source = std::make_unique<FdFrameSource>(STDIN_FILENO, frame_size, false);
    } else {
        const int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
        if (fd < 0) {
            return make_unexpected("cannot open " + path + ": " + std::strerror(errno));
        }
        source = std::make_unique<FdFrameSource>(fd, frame_size, true);
    }
    source->set_interrupt_flag(interrupt);
    return std::unique_ptr<IFrameSource>(std::move(source));
}

} // namespace vcam::stream

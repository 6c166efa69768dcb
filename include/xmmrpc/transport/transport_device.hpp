#pragma once
/**
 * @file transport_device.hpp
 * @brief Linux RPC character device transport (header-only, poll + self-pipe).
 *
 * Depends on: unistd.h, fcntl.h, poll.h. The device (e.g. /dev/xmm0/rpc) is a
 * message-oriented character device; each read usually returns one frame, which
 * the reader loop does not rely on.
 */

#if !defined(__linux__)
#  error "transport_device.hpp is Linux-only."
#endif

#include "xmmrpc/transport/transport_base.hpp"

#include <cerrno>
#include <cstring>
#include <mutex>
#include <string>

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

namespace xmmrpc::transport {

static constexpr const char* DEFAULT_DEVICE_PATH = "/dev/xmm0/rpc";

/// What one poll() wakeup over {device, wake pipe} means for a pending read.
enum class PollWake { Spurious, Readable, Cancelled, Invalid };

inline PollWake classify_poll(short device_revents, short wake_revents) {
    if ((device_revents | wake_revents) & POLLNVAL) return PollWake::Invalid;
    if (wake_revents & POLLIN) return PollWake::Cancelled;
    if (wake_revents & (POLLERR | POLLHUP)) return PollWake::Invalid;
    if (device_revents & (POLLIN | POLLHUP | POLLERR)) return PollWake::Readable;
    return PollWake::Spurious;
}

class DeviceTransport : public ITransport {
public:
    DeviceTransport() = default;
    ~DeviceTransport() override { close(); }

    DeviceTransport(const DeviceTransport&) = delete;
    DeviceTransport& operator=(const DeviceTransport&) = delete;

    /**
     * @brief Open @p path read/write with O_SYNC and arm the interrupt pipe.
     * @return false with @p err = "open_failed:<strerror>" (permissions, missing node...).
     */
    bool open(const std::string& path, std::string& err) {
        close();

        fd_ = ::open(path.c_str(), O_RDWR | O_SYNC | O_CLOEXEC);
        if (fd_ < 0) {
            err = std::string("open_failed:") + std::strerror(errno);
            return false;
        }
        if (::pipe2(wake_, O_CLOEXEC | O_NONBLOCK) != 0) {
            err = std::string("pipe_failed:") + std::strerror(errno);
            close();
            return false;
        }
        path_ = path;
        return true;
    }

    void close() {
        if (fd_ >= 0) { ::close(fd_); fd_ = -1; }
        for (int& p : wake_) {
            if (p >= 0) { ::close(p); p = -1; }
        }
    }

    bool is_open() const { return fd_ >= 0; }
    const std::string& path() const { return path_; }

    bool write(const uint8_t* data, std::size_t len, std::size_t& written, std::string& err) override {
        written = 0;
        if (fd_ < 0) { err = "not_open"; return false; }

        std::lock_guard<std::mutex> lock(write_mtx_);
        ssize_t w;
        do {
            w = ::write(fd_, data, len);
        } while (w < 0 && errno == EINTR);

        if (w < 0) {
            err = std::string("write_failed:") + std::strerror(errno);
            return false;
        }
        written = static_cast<std::size_t>(w);
        return true;
    }

    ReadResult read(uint8_t* out, std::size_t cap, std::size_t& out_len, std::string& err) override {
        out_len = 0;
        if (fd_ < 0) { err = "not_open"; return ReadResult::Error; }

        pollfd pfd[2] = {{fd_, POLLIN, 0}, {wake_[0], POLLIN, 0}};
        for (;;) {
            int pr = ::poll(pfd, 2, -1);
            if (pr < 0) {
                if (errno == EINTR) continue;
                err = std::string("poll_failed:") + std::strerror(errno);
                return ReadResult::Error;
            }
            const PollWake wake = classify_poll(pfd[0].revents, pfd[1].revents);
            if (wake == PollWake::Cancelled) return ReadResult::Cancelled;
            if (wake == PollWake::Invalid) { err = "poll_invalid_fd"; return ReadResult::Error; }
            if (wake == PollWake::Readable) break;
        }

        ssize_t r;
        do {
            r = ::read(fd_, out, cap);
        } while (r < 0 && errno == EINTR);

        if (r > 0) { out_len = static_cast<std::size_t>(r); return ReadResult::Ok; }
        if (r == 0) return ReadResult::Closed;
        err = std::string("read_failed:") + std::strerror(errno);
        return ReadResult::Error;
    }

    void interrupt_pending_read() override {
        if (wake_[1] < 0) return;
        const uint8_t b = 1;
        // The pipe is never drained, so one byte keeps every later poll awake.
        ssize_t w;
        do {
            w = ::write(wake_[1], &b, 1);
        } while (w < 0 && errno == EINTR);
    }

    const char* name() const override { return "rpc-device"; }

private:
    int fd_{-1};
    int wake_[2]{-1, -1};
    std::string path_;
    std::mutex write_mtx_;
};

} // namespace xmmrpc::transport

#include "drone_relay/fd_line_source.hpp"

#include <poll.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <cstring>
#include <stdexcept>

namespace drone_relay {

namespace {
constexpr std::size_t k_read_chunk_bytes{4096};
}  // namespace

FdLineSource::FdLineSource(int fd, std::size_t max_line_bytes)
    : fd_(fd),
      max_line_bytes_(max_line_bytes),
      logger_(get_logger()) {
    if (fd_ < 0) {
        throw std::invalid_argument("FdLineSource requires a valid file descriptor");
    }
    if (max_line_bytes_ == 0) {
        throw std::invalid_argument("FdLineSource line bound must be positive");
    }
}

std::optional<std::string> FdLineSource::next_line(Duration timeout) {
    if (list_lines_.empty() && !flag_eof_) {
        fill(timeout);
    }
    if (list_lines_.empty()) {
        return std::nullopt;
    }
    std::string line = std::move(list_lines_.front());
    list_lines_.pop_front();
    return line;
}

bool FdLineSource::exhausted() const noexcept {
    return flag_eof_ && list_lines_.empty();
}

std::size_t FdLineSource::discarded_count() const noexcept {
    return discarded_count_;
}

bool FdLineSource::fill(Duration timeout) {
    pollfd descriptor{};
    descriptor.fd = fd_;
    descriptor.events = POLLIN;
    const auto timeout_ms = std::chrono::duration_cast<std::chrono::milliseconds>(timeout).count();

    const int ready = ::poll(&descriptor, 1, static_cast<int>(timeout_ms));
    if (ready < 0) {
        if (errno == EINTR) {
            return false;
        }
        throw std::runtime_error("poll failed: " + std::string(std::strerror(errno)));
    }
    if (ready == 0) {
        return false;
    }

    char buffer[k_read_chunk_bytes];
    const ssize_t count = ::read(fd_, buffer, sizeof(buffer));
    if (count < 0) {
        if (errno == EINTR || errno == EAGAIN) {
            return false;
        }
        throw std::runtime_error("read failed: " + std::string(std::strerror(errno)));
    }
    if (count == 0) {
        flag_eof_ = true;
        if (!str_partial_.empty()) {
            list_lines_.push_back(std::move(str_partial_));
            str_partial_.clear();
        }
        return !list_lines_.empty();
    }

    str_partial_.append(buffer, static_cast<std::size_t>(count));
    split_buffer();
    return !list_lines_.empty();
}

void FdLineSource::split_buffer() {
    std::size_t start = 0;
    for (auto newline = str_partial_.find('\n'); newline != std::string::npos;
         newline = str_partial_.find('\n', start)) {
        if (flag_discarding_) {
            // Tail of a line already reported as oversized.
            flag_discarding_ = false;
            start = newline + 1;
            continue;
        }
        std::string line = str_partial_.substr(start, newline - start);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.size() > max_line_bytes_) {
            discard_line(line.size());
        } else if (!line.empty()) {
            list_lines_.push_back(std::move(line));
        }
        start = newline + 1;
    }
    str_partial_.erase(0, start);

    if (flag_discarding_) {
        str_partial_.clear();
    } else if (str_partial_.size() > max_line_bytes_) {
        discard_line(str_partial_.size());
        str_partial_.clear();
        flag_discarding_ = true;
    }
}

void FdLineSource::discard_line(std::size_t length) {
    ++discarded_count_;
    logger_->warn("Discarding input line of at least {} bytes (limit {} bytes)", length, max_line_bytes_);
}

}  // namespace drone_relay

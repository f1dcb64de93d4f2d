// === File Descriptor Line Source =============================================
//
// Reads newline-delimited messages from a file descriptor without blocking the
// control loop for longer than a caller-supplied timeout. Lines longer than
// the configured bound are discarded whole, so a producer that never sends a
// newline costs bounded memory.

#pragma once

#include <cstddef>
#include <deque>
#include <memory>
#include <optional>
#include <string>

#include "drone_relay/logging.hpp"
#include "drone_relay/types.hpp"

namespace drone_relay {

inline constexpr std::size_t k_default_max_line_bytes{1024 * 1024};

class FdLineSource final {
  public:
    /**
     * @param fd Readable descriptor; the source does not take ownership.
     * @param max_line_bytes Longest line kept; longer ones are logged and dropped.
     */
    explicit FdLineSource(int fd, std::size_t max_line_bytes = k_default_max_line_bytes);

    /**
     * @brief Wait up to @p timeout for input and return the next complete line.
     *
     * Returns nullopt when no full line arrived in time. A trailing partial
     * line is delivered once the descriptor reaches end-of-file. Throws
     * std::runtime_error when poll(2) or read(2) fails.
     */
    std::optional<std::string> next_line(Duration timeout);

    /** @brief True once end-of-file was seen and every buffered line was consumed. */
    [[nodiscard]] bool exhausted() const noexcept;

    /** @brief Lines dropped for exceeding the length bound. */
    [[nodiscard]] std::size_t discarded_count() const noexcept;

  private:
    bool fill(Duration timeout);
    void split_buffer();
    void discard_line(std::size_t length);

    int fd_;
    std::size_t max_line_bytes_;
    bool flag_eof_{false};
    bool flag_discarding_{false};  /**< Dropping the rest of an oversized line up to its newline. */
    std::size_t discarded_count_{0};
    std::shared_ptr<spdlog::logger> logger_;
    std::string str_partial_{};
    std::deque<std::string> list_lines_{};
};

}  // namespace drone_relay

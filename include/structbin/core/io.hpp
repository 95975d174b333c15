#pragma once

#include "structbin/core/common.hpp"
#include "structbin/core/error.hpp"

#include <cstddef>
#include <system_error>
#include <vector>

namespace structbin::core {

/**
 * @brief 字节输出端（编码目标）。
 *
 * write() 允许只接受部分字节（written < in.size()），
 * 是否把短写视为错误由调用方决定（编码引擎会视为致命错误）。
 */
class Sink {
 public:
  virtual ~Sink() = default;

  virtual std::error_code write(bytes_view in, std::size_t& written) noexcept = 0;
};

/**
 * @brief 字节输入端（解码来源）。
 *
 * read_some() 返回 n == 0 且无错误，表示“没有更多字节可读”。
 */
class Source {
 public:
  virtual ~Source() = default;

  virtual std::error_code read_some(mutable_bytes_view out, std::size_t& n) noexcept = 0;
};

/**
 * @brief 追加写入调用方持有的 std::vector<byte>，从不短写。
 */
class VectorSink final : public Sink {
 public:
  explicit VectorSink(std::vector<byte>& out) : out_(out) {}

  std::error_code write(bytes_view in, std::size_t& written) noexcept override;

  [[nodiscard]] std::vector<byte>& bytes() noexcept { return out_; }

 private:
  std::vector<byte>& out_;
};

/**
 * @brief 写入固定缓冲区：放得下多少写多少，满了以后产生短写。
 */
class SpanSink final : public Sink {
 public:
  explicit SpanSink(mutable_bytes_view out) : out_(out) {}

  std::error_code write(bytes_view in, std::size_t& written) noexcept override;

  [[nodiscard]] std::size_t written() const noexcept { return written_; }
  [[nodiscard]] bytes_view view() const noexcept { return bytes_view{out_.data(), written_}; }

 private:
  mutable_bytes_view out_{};
  std::size_t written_{0};
};

/**
 * @brief 从内存字节序列读取。
 *
 * chunk > 0 时每次 read_some 最多返回 chunk 字节（用于模拟慢速/分片的来源）。
 */
class BytesSource final : public Source {
 public:
  explicit BytesSource(bytes_view in, std::size_t chunk = 0) : in_(in), chunk_(chunk) {}

  std::error_code read_some(mutable_bytes_view out, std::size_t& n) noexcept override;

  [[nodiscard]] std::size_t consumed() const noexcept { return pos_; }
  [[nodiscard]] std::size_t remaining() const noexcept { return in_.size() - pos_; }

 private:
  bytes_view in_{};
  std::size_t chunk_{0};
  std::size_t pos_{0};
};

}  // namespace structbin::core

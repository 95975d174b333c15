#pragma once

#include "structbin/core/io.hpp"

#include <asio/buffer.hpp>
#include <asio/error.hpp>
#include <asio/write.hpp>

#include <cstddef>
#include <system_error>

namespace structbin::io {

/**
 * @brief 把 asio 同步写流（SyncWriteStream：tcp::socket、posix::stream_descriptor、serial_port 等）
 *        适配为 core::Sink。
 *
 * 说明：
 * - 使用 asio::write 尽量写满；流出错时返回已写入的字节数与错误
 * - 写入不满时编码引擎会报告 codec::errc::short_write
 * - 不持有流，调用方保证其生命周期
 */
template <class SyncWriteStream>
class AsioStreamSink final : public core::Sink {
 public:
  explicit AsioStreamSink(SyncWriteStream& stream) : stream_(stream) {}

  std::error_code write(core::bytes_view in, std::size_t& written) noexcept override {
    std::error_code ec;
    written = asio::write(stream_, asio::buffer(in.data(), in.size()), ec);
    return ec;
  }

 private:
  SyncWriteStream& stream_;
};

/**
 * @brief 把 asio 同步读流（SyncReadStream）适配为 core::Source。
 *
 * asio::error::eof 映射为“没有更多字节”（n == 0 且无错误），
 * 由解码引擎决定补 0 还是报告截断；其它错误原样传播。
 */
template <class SyncReadStream>
class AsioStreamSource final : public core::Source {
 public:
  explicit AsioStreamSource(SyncReadStream& stream) : stream_(stream) {}

  std::error_code read_some(core::mutable_bytes_view out, std::size_t& n) noexcept override {
    n = 0;
    if (out.empty()) {
      return {};
    }
    std::error_code ec;
    n = stream_.read_some(asio::buffer(out.data(), out.size()), ec);
    if (ec == asio::error::eof) {
      return {};
    }
    return ec;
  }

 private:
  SyncReadStream& stream_;
};

}  // namespace structbin::io

// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "discovery/cancellation.hpp"
#include "discovery/types.hpp"
#include <utility>  // boost 1.74 asio/awaitable.hpp uses std::exchange without it
#include <boost/asio.hpp>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace topowatch {
namespace discovery {

/**
 * ByteStream - blocking, deadline-bounded byte transport used by the
 * session-oriented probes (remote CLI and vendor API)
 *
 * Every call returns false and fills `error` on failure. Calls return as soon
 * as `token` is cancelled or its deadline passes (error code TIMEOUT).
 * Abstract so probes can be driven by scripted streams in tests.
 */
class ByteStream {
public:
  virtual ~ByteStream() = default;

  virtual bool Connect(const std::string &host, uint16_t port,
                       const CancellationToken &token, ProbeError &error) = 0;

  // Write all of `data`
  virtual bool Write(const std::string &data, const CancellationToken &token,
                     ProbeError &error) = 0;

  // Append at least one received byte to `out`
  virtual bool ReadSome(std::string &out, const CancellationToken &token,
                        ProbeError &error) = 0;

  virtual void Close() = 0;
};

using StreamFactory = std::function<std::unique_ptr<ByteStream>()>;

/**
 * TcpStream - ByteStream over a boost::asio TCP socket
 *
 * Each stream owns a private io_context which is driven from the calling
 * thread with run_one_for(); the token is polled between slices and a
 * cancelled token aborts the outstanding operation.
 */
class TcpStream : public ByteStream {
public:
  TcpStream();
  ~TcpStream() override;

  TcpStream(const TcpStream &) = delete;
  TcpStream &operator=(const TcpStream &) = delete;

  bool Connect(const std::string &host, uint16_t port,
               const CancellationToken &token, ProbeError &error) override;
  bool Write(const std::string &data, const CancellationToken &token,
             ProbeError &error) override;
  bool ReadSome(std::string &out, const CancellationToken &token,
                ProbeError &error) override;
  void Close() override;

  static StreamFactory Factory();

private:
  // Drive io_ until `done` or the token fires. Returns false on cancellation.
  // `abort` runs once on cancellation in addition to cancelling the socket.
  bool RunUntil(const bool &done, const CancellationToken &token,
                const std::function<void()> &abort = {});

  static ProbeError MapError(const boost::system::error_code &ec,
                             const std::string &what);

  boost::asio::io_context io_;
  boost::asio::ip::tcp::socket socket_;
  std::string peer_;
};

} // namespace discovery
} // namespace topowatch

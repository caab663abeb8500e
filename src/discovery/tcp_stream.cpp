// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "discovery/byte_stream.hpp"
#include "util/logging.hpp"
#include <algorithm>
#include <array>

namespace topowatch {
namespace discovery {

namespace {
// Upper bound on one io_context slice so the token is re-checked promptly
constexpr auto kPollSlice = std::chrono::milliseconds(50);
} // namespace

TcpStream::TcpStream() : socket_(io_) {}

TcpStream::~TcpStream() { Close(); }

StreamFactory TcpStream::Factory() {
  return []() { return std::make_unique<TcpStream>(); };
}

bool TcpStream::RunUntil(const bool &done, const CancellationToken &token,
                         const std::function<void()> &abort) {
  bool cancelled = false;
  while (!done) {
    if (!cancelled && token.IsCancelled()) {
      // Abort outstanding ops; their handlers still run with operation_aborted
      cancelled = true;
      boost::system::error_code ignored;
      socket_.cancel(ignored);
      if (abort) {
        abort();
      }
    }
    auto slice = std::min<std::chrono::milliseconds>(kPollSlice, token.Remaining());
    if (slice.count() <= 0) {
      slice = std::chrono::milliseconds(1);
    }
    io_.run_one_for(slice);
  }
  return !cancelled;
}

ProbeError TcpStream::MapError(const boost::system::error_code &ec,
                               const std::string &what) {
  namespace error = boost::asio::error;
  if (ec == error::operation_aborted || ec == error::timed_out) {
    return ProbeError{ProbeErrorCode::TIMEOUT, what + ": " + ec.message()};
  }
  // Refused, unreachable, reset and EOF are all transient from our side
  return ProbeError{ProbeErrorCode::UNREACHABLE, what + ": " + ec.message()};
}

bool TcpStream::Connect(const std::string &host, uint16_t port,
                        const CancellationToken &token, ProbeError &error) {
  peer_ = host + ":" + std::to_string(port);
  io_.restart();

  bool done = false;
  boost::system::error_code result;
  boost::asio::ip::tcp::resolver resolver(io_);

  auto on_connect = [&](const boost::system::error_code &ec,
                        const boost::asio::ip::tcp::endpoint &) {
    result = ec;
    done = true;
  };

  boost::system::error_code parse_ec;
  auto literal = boost::asio::ip::make_address(host, parse_ec);
  if (!parse_ec) {
    std::array<boost::asio::ip::tcp::endpoint, 1> endpoints{
        boost::asio::ip::tcp::endpoint(literal, port)};
    boost::asio::async_connect(socket_, endpoints, on_connect);
  } else {
    resolver.async_resolve(
      host, std::to_string(port),
      [&](const boost::system::error_code &ec,
          boost::asio::ip::tcp::resolver::results_type results) {
        if (ec) {
          result = ec;
          done = true;
          return;
        }
        boost::asio::async_connect(socket_, results, on_connect);
      });
  }

  if (!RunUntil(done, token, [&resolver]() { resolver.cancel(); })) {
    error = ProbeError{ProbeErrorCode::TIMEOUT, "connect to " + peer_ + " timed out"};
    LOG_DISC_TRACE("connect to {} cancelled", peer_);
    return false;
  }
  if (result) {
    error = MapError(result, "connect to " + peer_);
    LOG_DISC_TRACE("connect to {} failed: {}", peer_, result.message());
    return false;
  }
  return true;
}

bool TcpStream::Write(const std::string &data, const CancellationToken &token,
                      ProbeError &error) {
  io_.restart();
  bool done = false;
  boost::system::error_code result;

  boost::asio::async_write(socket_, boost::asio::buffer(data),
                           [&](const boost::system::error_code &ec, size_t) {
                             result = ec;
                             done = true;
                           });

  if (!RunUntil(done, token)) {
    error = ProbeError{ProbeErrorCode::TIMEOUT, "write to " + peer_ + " timed out"};
    return false;
  }
  if (result) {
    error = MapError(result, "write to " + peer_);
    return false;
  }
  return true;
}

bool TcpStream::ReadSome(std::string &out, const CancellationToken &token,
                         ProbeError &error) {
  io_.restart();
  bool done = false;
  boost::system::error_code result;
  std::array<char, 4096> buf;
  size_t received = 0;

  socket_.async_read_some(boost::asio::buffer(buf),
                          [&](const boost::system::error_code &ec, size_t n) {
                            result = ec;
                            received = n;
                            done = true;
                          });

  if (!RunUntil(done, token)) {
    // Bytes that arrived with the aborted read are still delivered
    out.append(buf.data(), received);
    error = ProbeError{ProbeErrorCode::TIMEOUT, "read from " + peer_ + " timed out"};
    return false;
  }
  out.append(buf.data(), received);
  if (result) {
    error = MapError(result, "read from " + peer_);
    return false;
  }
  return true;
}

void TcpStream::Close() {
  boost::system::error_code ignored;
  if (socket_.is_open()) {
    socket_.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ignored);
    socket_.close(ignored);
  }
}

} // namespace discovery
} // namespace topowatch

#include "tcp_dialer.hpp"

#include <utility>

#include <boost/asio.hpp>

#include <condition_variable>
#include <mutex>
#include <thread>
#include <utility>

#include "internal/util/errors.hpp"

namespace edgerun::overlay {

using boost::asio::ip::tcp;

struct TcpDialer::IoThread {
  IoThread() : work(boost::asio::make_work_guard(io)), worker([this] { io.run(); }) {
  }

  ~IoThread() {
    work.reset();
    io.stop();
    worker.join();
  }

  boost::asio::io_context                                                  io;
  boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work;
  std::thread                                                              worker;
};

namespace {

class TcpConnection final : public OverlayConnection {
 public:
  TcpConnection(std::shared_ptr<void> io, tcp::socket socket, const tcp::endpoint& endpoint)
      : io_(std::move(io)),
        socket_(std::move(socket)),
        remote_(endpoint.address().to_string() + ":" + std::to_string(endpoint.port())) {
  }

  ~TcpConnection() override {
    Close();
  }

  std::string RemoteAddress() const override {
    return remote_;
  }

  void Close() override {
    boost::system::error_code ignored;
    socket_.close(ignored);
  }

 private:
  // Keeps the io_context alive for as long as the socket is.
  std::shared_ptr<void> io_;
  tcp::socket           socket_;
  std::string           remote_;
};

// One dial in flight. Owned jointly by the caller and the pending handlers.
struct DialAttempt {
  explicit DialAttempt(boost::asio::io_context& io) : resolver(io), socket(io) {
  }

  void Finish(const boost::system::error_code& ec, const tcp::endpoint& endpoint = {}) {
    {
      std::lock_guard lock(mutex);
      if (done) {
        return;
      }
      done      = true;
      result    = ec;
      connected = endpoint;
    }
    cv.notify_all();
  }

  tcp::resolver resolver;
  tcp::socket   socket;

  std::mutex                mutex;
  std::condition_variable   cv;
  bool                      done{false};
  boost::system::error_code result;
  tcp::endpoint             connected;
};

} // namespace

TcpDialer::TcpDialer() : io_(std::make_shared<IoThread>()) {
}

TcpDialer::~TcpDialer() = default;

std::unique_ptr<OverlayConnection> TcpDialer::Dial(const std::string& host, uint16_t port, std::chrono::milliseconds timeout) {
  const std::string target = host + ":" + std::to_string(port);
  if (host.empty()) {
    throw util::ConnectivityFailure("dial " + target + ": empty host");
  }
  if (timeout <= std::chrono::milliseconds::zero()) {
    throw util::ConnectivityFailure("dial " + target + ": no time left");
  }

  auto attempt = std::make_shared<DialAttempt>(io_->io);
  boost::asio::post(io_->io, [attempt, host, port] {
    // Literal addresses skip the resolver, whose lookups share one thread.
    boost::system::error_code parse_ec;
    const auto                address = boost::asio::ip::make_address(host, parse_ec);
    if (!parse_ec) {
      const tcp::endpoint endpoint(address, port);
      attempt->socket.async_connect(endpoint, [attempt, endpoint](const boost::system::error_code& ec) { attempt->Finish(ec, endpoint); });
      return;
    }

    attempt->resolver.async_resolve(host, std::to_string(port), [attempt](const boost::system::error_code& ec, tcp::resolver::results_type endpoints) {
      if (ec) {
        attempt->Finish(ec);
        return;
      }
      boost::asio::async_connect(attempt->socket, endpoints, [attempt](const boost::system::error_code& connect_ec, const tcp::endpoint& endpoint) {
        attempt->Finish(connect_ec, endpoint);
      });
    });
  });

  std::unique_lock lock(attempt->mutex);
  if (!attempt->cv.wait_for(lock, timeout, [&] { return attempt->done; })) {
    attempt->done = true;
    lock.unlock();
    boost::asio::post(io_->io, [attempt] {
      boost::system::error_code ignored;
      attempt->resolver.cancel();
      attempt->socket.close(ignored);
    });
    throw util::ConnectivityFailure("dial " + target + ": timed out after " + std::to_string(timeout.count()) + "ms");
  }

  if (attempt->result) {
    throw util::ConnectivityFailure("dial " + target + ": " + attempt->result.message());
  }

  // No handler touches the socket once the connect has completed.
  return std::make_unique<TcpConnection>(io_, std::move(attempt->socket), attempt->connected);
}

} // namespace edgerun::overlay

// Copyright: 2026, Ableton AG, Berlin. All rights reserved.

#include <lanlight/asio/AsioService.hpp>
#include <lanlight/discovery/UdpInterface.hpp>
#include <lanlight/test/CatchWrapper.hpp>
#include <lanlight/test/Platform.hpp>
#include <lanlight/util/SafeAsyncHandler.hpp>
#include <chrono>
#include <condition_variable>
#include <iterator>
#include <memory>
#include <mutex>
#include <vector>

namespace lanlight
{
namespace discovery
{
namespace
{

using Transport = UdpInterface<kMaxMessageSize>;

const auto kLoopback = platform::test::makeInterface("127.0.0.1", "255.0.0.0");

// Re-arms after every datagram, the way a gateway listens
struct Listener : std::enable_shared_from_this<Listener>
{
  explicit Listener(Transport transport)
    : iface(std::move(transport))
  {
  }

  void listen()
  {
    receive(iface, util::makeAsyncSafe(shared_from_this()));
  }

  template <typename It>
  void operator()(const asio::ip::udp::endpoint&, const It begin, const It end)
  {
    {
      std::lock_guard<std::mutex> lock(mutex);
      sizes.push_back(static_cast<std::size_t>(std::distance(begin, end)));
    }
    condition.notify_all();
    listen();
  }

  std::vector<std::size_t> waitFor(const std::size_t count)
  {
    std::unique_lock<std::mutex> lock(mutex);
    condition.wait_for(
      lock, std::chrono::seconds(5), [this, count] { return sizes.size() >= count; });
    return sizes;
  }

  Transport iface;
  std::mutex mutex;
  std::condition_variable condition;
  std::vector<std::size_t> sizes;
};

} // anonymous namespace

TEST_CASE("UdpInterface | KeepsReceivingAfterEmptyDatagram", "[UdpInterface]")
{
  util::AsioService io;
  Transport sender(io, kLoopback);
  auto pListener = std::make_shared<Listener>(Transport(io, kLoopback));
  io.post([pListener] { pListener->listen(); });

  const auto to = endpoint(pListener->iface);
  const std::vector<std::uint8_t> payload{1, 2, 3, 4, 5};

  send(sender, payload.data(), payload.size(), to);
  CHECK(1 == pListener->waitFor(1).size());

  send(sender, payload.data(), 0, to);
  for (int i = 0; i < 3; ++i)
  {
    send(sender, payload.data(), payload.size(), to);
  }

  const auto sizes = pListener->waitFor(4);
  REQUIRE(4 == sizes.size());
  for (const auto size : sizes)
  {
    CHECK(5 == size);
  }

  // Close the sockets before the io thread is joined
  pListener.reset();
}

} // namespace discovery
} // namespace lanlight

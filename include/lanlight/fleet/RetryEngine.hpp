// Copyright: 2026, Ableton AG, Berlin. All rights reserved.

#pragma once

#include <lanlight/discovery/UdpInterface.hpp>
#include <lanlight/fleet/InflightTracker.hpp>
#include <lanlight/fleet/Outcome.hpp>
#include <lanlight/lan/Codec.hpp>
#include <lanlight/util/Injected.hpp>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace lanlight
{
namespace fleet
{

// Sends requests to devices and resends them until the response
// arrives or the attempts run out. Every attempt waits the same
// response timeout, so the worst case latency of a request is
// timeout * retryCount. Used on the io thread only.
template <typename IoContext, typename Log>
class RetryEngine
{
public:
  using IoType = typename util::Injected<IoContext>::type;
  using Timer = typename IoType::Timer;
  using TimerError = typename Timer::ErrorCode;
  // Hands a datagram to the transport. May throw
  // discovery::UdpSendException, which counts as a lost attempt.
  using Sender =
    std::function<void(const std::vector<std::uint8_t>&, const asio::ip::udp::endpoint&)>;
  // Sees every resolution except cancellations, before the handler of
  // the request does
  using OutcomeObserver = std::function<void(const lan::Message& request, const Outcome&)>;

  struct Target
  {
    lan::Serial serial;
    asio::ip::udp::endpoint endpoint;
    Sender send;
  };

  RetryEngine(
    util::Injected<IoContext> io,
    const std::uint32_t source,
    const std::chrono::milliseconds responseTimeout,
    const std::size_t retryCount,
    OutcomeObserver observer,
    Log log)
    : mIo(std::move(io))
    , mSource(source)
    , mTimeout(responseTimeout)
    , mRetryCount(retryCount)
    , mObserver(std::move(observer))
    , mLog(std::move(log))
  {
  }

  ~RetryEngine()
  {
    cancelAll("shutting down");
  }

  RetryEngine(const RetryEngine&) = delete;
  RetryEngine& operator=(const RetryEngine&) = delete;

  // Sends the request and eventually calls the handler exactly once.
  // The permit is held until the request is resolved.
  void execute(
    Target target, lan::Message request, InflightTracker::Permit permit, OutcomeHandler handler)
  {
    const auto sequence = allocateSequence(target.serial);
    if (!sequence)
    {
      handler(failedOutcome(Status::Backpressure, target.serial, "no free sequence number"));
      return;
    }

    lan::Header header;
    header.source = mSource;
    header.target = target.serial;
    header.sequence = *sequence;
    header.ackRequired = lan::requiresAck(request);
    header.resRequired = !header.ackRequired;
    auto datagram = lan::encode(header, request);

    auto pPending = std::make_shared<Pending>(std::move(target), std::move(request),
      std::move(datagram), *sequence, std::move(permit), std::move(handler), mIo->makeTimer());
    mPending.emplace(Key{pPending->target.serial, pPending->sequence}, pPending);

    debug(mLog) << "sending " << pPending->request << " to " << pPending->target.serial
                << " seq " << static_cast<unsigned>(pPending->sequence);
    sendAttempt(pPending);
  }

  // Resolves the pending request the packet answers. Returns false for
  // datagrams that answer nothing in flight: late or duplicate
  // responses, responses of the wrong type and traffic of other
  // clients.
  bool dispatch(const asio::ip::udp::endpoint& from, const lan::Packet& packet)
  {
    if (packet.header.source != mSource)
    {
      return false;
    }

    const auto it = findPending(from, packet.header);
    if (it == mPending.end())
    {
      debug(mLog) << "discarding unmatched " << packet.message << " from " << from
                  << " seq " << static_cast<unsigned>(packet.header.sequence);
      return false;
    }

    auto pPending = it->second;
    if (!lan::acceptsResponse(pPending->request, lan::messageType(packet.message)))
    {
      debug(mLog) << "discarding " << packet.message << " from " << from
                  << " in reply to " << pPending->request;
      return false;
    }

    resolve(pPending,
      Outcome{Status::Success, pPending->target.serial, packet.message, pPending->attempts, {}});
    return true;
  }

  // The device answered discovery from another address. Requests in
  // flight to it resend there and accept responses from there only.
  void retarget(const lan::Serial& serial, const asio::ip::udp::endpoint& endpoint, Sender send)
  {
    for (const auto& entry : mPending)
    {
      if (entry.first.first == serial)
      {
        entry.second->target.endpoint = endpoint;
        entry.second->target.send = send;
      }
    }
  }

  // Resolves every request in flight to the device as cancelled
  void cancel(const lan::Serial& serial, const std::string& reason)
  {
    std::vector<PendingPtr> cancelled;
    for (const auto& entry : mPending)
    {
      if (entry.first.first == serial)
      {
        cancelled.push_back(entry.second);
      }
    }
    for (const auto& pPending : cancelled)
    {
      resolve(pPending, failedOutcome(Status::Cancelled, serial, reason, pPending->attempts));
    }
    mNextSequence.erase(serial);
  }

  void cancelAll(const std::string& reason)
  {
    std::vector<PendingPtr> cancelled;
    for (const auto& entry : mPending)
    {
      cancelled.push_back(entry.second);
    }
    for (const auto& pPending : cancelled)
    {
      resolve(pPending,
        failedOutcome(Status::Cancelled, pPending->target.serial, reason, pPending->attempts));
    }
  }

  std::size_t pending(const lan::Serial& serial) const
  {
    std::size_t count = 0;
    for (const auto& entry : mPending)
    {
      count += entry.first.first == serial ? 1 : 0;
    }
    return count;
  }

  std::size_t pending() const
  {
    return mPending.size();
  }

private:
  struct Pending
  {
    Pending(Target target_, lan::Message request_, std::vector<std::uint8_t> datagram_,
      const std::uint8_t sequence_, InflightTracker::Permit permit_, OutcomeHandler handler_,
      Timer timer_)
      : target(std::move(target_))
      , request(std::move(request_))
      , datagram(std::move(datagram_))
      , sequence(sequence_)
      , permit(std::move(permit_))
      , handler(std::move(handler_))
      , timer(std::move(timer_))
    {
    }

    Target target;
    lan::Message request;
    std::vector<std::uint8_t> datagram;
    std::uint8_t sequence;
    std::size_t attempts = 0;
    InflightTracker::Permit permit;
    OutcomeHandler handler;
    Timer timer;
    bool resolved = false;
  };

  using PendingPtr = std::shared_ptr<Pending>;
  using Key = std::pair<lan::Serial, std::uint8_t>;
  using PendingMap = std::map<Key, PendingPtr>;

  // Sequence numbers are scoped to the device and skip those still in
  // flight to it
  std::optional<std::uint8_t> allocateSequence(const lan::Serial& serial)
  {
    auto& next = mNextSequence[serial];
    for (int i = 0; i < 256; ++i)
    {
      const auto candidate = next++;
      if (mPending.count(Key{serial, candidate}) == 0)
      {
        return candidate;
      }
    }
    return std::nullopt;
  }

  typename PendingMap::iterator findPending(
    const asio::ip::udp::endpoint& from, const lan::Header& header)
  {
    for (auto it = mPending.begin(); it != mPending.end(); ++it)
    {
      const auto& key = it->first;
      if (key.second == header.sequence
          && it->second->target.endpoint.address() == from.address()
          && (header.target.isZero() || header.target == key.first))
      {
        return it;
      }
    }
    return mPending.end();
  }

  void sendAttempt(const PendingPtr& pPending)
  {
    ++pPending->attempts;

    // Arm before sending so that a response can't overtake the timer
    std::weak_ptr<Pending> wpPending = pPending;
    pPending->timer.expires_from_now(mTimeout);
    pPending->timer.async_wait([this, wpPending](const TimerError e) {
      if (!e)
      {
        if (const auto pPending = wpPending.lock())
        {
          onTimeout(pPending);
        }
      }
    });

    try
    {
      pPending->target.send(pPending->datagram, pPending->target.endpoint);
    }
    catch (const discovery::UdpSendException& e)
    {
      info(mLog) << "sending to " << pPending->target.serial << " on " << e.interfaceAddr
                 << " failed: " << e.what() << ", attempt " << pPending->attempts
                 << " counts as lost";
    }
  }

  void onTimeout(const PendingPtr& pPending)
  {
    if (pPending->resolved)
    {
      return;
    }

    if (pPending->attempts < mRetryCount)
    {
      debug(mLog) << "attempt " << pPending->attempts << " of " << mRetryCount << " for "
                  << pPending->request << " to " << pPending->target.serial
                  << " timed out, resending";
      sendAttempt(pPending);
    }
    else
    {
      info(mLog) << pPending->request << " to " << pPending->target.serial
                 << " got no response after " << pPending->attempts << " attempts";
      resolve(pPending, failedOutcome(Status::Exhausted, pPending->target.serial,
                          "no response after " + std::to_string(pPending->attempts)
                            + " attempts",
                          pPending->attempts));
    }
  }

  void resolve(const PendingPtr& pPending, const Outcome& outcome)
  {
    if (pPending->resolved)
    {
      return;
    }
    pPending->resolved = true;
    mPending.erase(Key{pPending->target.serial, pPending->sequence});
    pPending->timer.cancel();
    pPending->permit.release();

    if (outcome.status != Status::Cancelled && mObserver)
    {
      mObserver(pPending->request, outcome);
    }
    if (pPending->handler)
    {
      pPending->handler(outcome);
    }
  }

  util::Injected<IoContext> mIo;
  const std::uint32_t mSource;
  const std::chrono::milliseconds mTimeout;
  const std::size_t mRetryCount;
  OutcomeObserver mObserver;
  Log mLog;
  PendingMap mPending;
  std::map<lan::Serial, std::uint8_t> mNextSequence;
};

} // namespace fleet
} // namespace lanlight

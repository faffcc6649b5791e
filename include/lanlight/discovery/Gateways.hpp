// Copyright: 2026, Ableton AG, Berlin. All rights reserved.

#pragma once

#include <lanlight/asio/AsioWrapper.hpp>
#include <lanlight/discovery/InterfaceScanner.hpp>
#include <lanlight/discovery/Interfaces.hpp>
#include <algorithm>
#include <chrono>
#include <map>
#include <memory>
#include <stdexcept>
#include <type_traits>
#include <vector>

namespace lanlight
{
namespace discovery
{

// Maintains one gateway per local subnet. GatewayFactory must have an
// operator()(IoType&, const IpInterface&) that constructs a gateway on
// the given interface.
template <typename GatewayFactory, typename Io, typename Platform, typename Log>
struct Gateways
{
  using IoType = typename util::Injected<Io>::type;
  using LogType = typename util::Injected<Log>::type;
  using Gateway = typename std::result_of<GatewayFactory(IoType&, IpInterface)>::type;
  using GatewayMap = std::map<IpInterface, Gateway>;

  Gateways(
    const std::chrono::seconds rescanPeriod,
    GatewayFactory factory,
    util::Injected<Io> io,
    util::Injected<Platform> platform,
    util::Injected<Log> log)
    : mIo(std::move(io))
    , mLog(std::move(log))
    , mpScannerCallback(std::make_shared<Callback>(std::move(factory), *mIo, *mLog))
    , mpScanner(std::make_shared<Scanner>(rescanPeriod, util::injectShared(mpScannerCallback),
        std::move(platform), util::injectVal(mIo->makeTimer()), mLog))
  {
  }

  ~Gateways()
  {
    // Release the callback in the io thread so that gateway cleanup
    // doesn't happen in the client thread
    mIo->post(Deleter{*this});
  }

  Gateways(const Gateways&) = delete;
  Gateways& operator=(const Gateways&) = delete;

  Gateways(Gateways&&) = delete;
  Gateways& operator=(Gateways&&) = delete;

  void enable(const bool bEnable)
  {
    auto pCallback = mpScannerCallback;
    auto pScanner = mpScanner;

    mIo->post([pCallback, pScanner, bEnable] {
      pCallback->mGateways.clear();
      pScanner->enable(bEnable);
    });
  }

  // Starts a discovery cycle on every gateway without waiting for the
  // next interval
  void discoverNow()
  {
    auto pCallback = mpScannerCallback;
    mIo->post([pCallback] {
      for (auto& entry : pCallback->mGateways)
      {
        discover(entry.second);
      }
    });
  }

  // Must be called on the io thread. Invokes fn with the gateway bound
  // to the given local address and returns false if there is none.
  template <typename Fn>
  bool withGateway(const asio::ip::address_v4& addr, Fn fn)
  {
    auto& gateways = mpScannerCallback->mGateways;
    const auto it = std::find_if(gateways.begin(), gateways.end(),
      [&addr](const typename GatewayMap::value_type& vt) { return vt.first.address == addr; });
    if (it == gateways.end())
    {
      return false;
    }
    fn(it->second);
    return true;
  }

  // If a gateway has become non-responsive or is throwing exceptions,
  // this method can be invoked to either fix it or discard it.
  void repairGateway(const asio::ip::address& gatewayAddr)
  {
    auto pCallback = mpScannerCallback;
    auto pScanner = mpScanner;
    mIo->post([pCallback, pScanner, gatewayAddr] {
      if (pCallback->eraseGateway(gatewayAddr))
      {
        // If we erased a gateway, rescan again immediately so that
        // we will re-initialize it if it's still present
        pScanner->scan();
      }
    });
  }

private:
  struct Callback
  {
    Callback(GatewayFactory factory, IoType& io, LogType& log)
      : mFactory(std::move(factory))
      , mIo(io)
      , mLog(log)
    {
    }

    void operator()(const std::vector<IpInterface>& scanned)
    {
      using namespace std;

      // Interfaces that already have a gateway keep it, even if a
      // newly reported interface shares their subnet.
      vector<IpInterface> candidates;
      for (const auto& entry : mGateways)
      {
        if (find(begin(scanned), end(scanned), entry.first) != end(scanned))
        {
          candidates.push_back(entry.first);
        }
      }
      candidates.insert(end(candidates), begin(scanned), end(scanned));
      const auto chosen = uniqueSubnets(candidates);

      for (auto it = mGateways.begin(); it != mGateways.end();)
      {
        if (find(begin(chosen), end(chosen), it->first) == end(chosen))
        {
          info(mLog) << "removing gateway on interface " << it->first;
          it = mGateways.erase(it);
        }
        else
        {
          ++it;
        }
      }

      for (const auto& iface : chosen)
      {
        if (mGateways.count(iface) > 0)
        {
          continue;
        }
        try
        {
          info(mLog) << "initializing gateway on interface " << iface;
          mGateways.emplace(iface, mFactory(mIo, iface));
        }
        catch (const runtime_error& e)
        {
          warning(mLog) << "failed to init gateway on interface " << iface
                        << " reason: " << e.what();
        }
      }
    }

    bool eraseGateway(const asio::ip::address& addr)
    {
      for (auto it = mGateways.begin(); it != mGateways.end(); ++it)
      {
        if (it->first.address == addr)
        {
          mGateways.erase(it);
          return true;
        }
      }
      return false;
    }

    GatewayFactory mFactory;
    IoType& mIo;
    LogType& mLog;
    GatewayMap mGateways;
  };

  using Scanner =
    InterfaceScanner<std::shared_ptr<Callback>, Platform, typename IoType::Timer, Log>;

  struct Deleter
  {
    Deleter(Gateways& gateways)
      : mpScannerCallback(std::move(gateways.mpScannerCallback))
      , mpScanner(std::move(gateways.mpScanner))
    {
    }

    void operator()()
    {
      mpScanner.reset();
      mpScannerCallback.reset();
    }

    std::shared_ptr<Callback> mpScannerCallback;
    std::shared_ptr<Scanner> mpScanner;
  };

  util::Injected<Io> mIo;
  util::Injected<Log> mLog;
  std::shared_ptr<Callback> mpScannerCallback;
  std::shared_ptr<Scanner> mpScanner;
};

template <typename GatewayFactory, typename Io, typename Platform, typename Log>
std::unique_ptr<Gateways<GatewayFactory, Io, Platform, Log>> makeGateways(
  const std::chrono::seconds rescanPeriod,
  GatewayFactory factory,
  util::Injected<Io> io,
  util::Injected<Platform> platform,
  util::Injected<Log> log)
{
  using std::move;
  using GatewaysT = Gateways<GatewayFactory, Io, Platform, Log>;
  return std::unique_ptr<GatewaysT>{
    new GatewaysT{rescanPeriod, move(factory), move(io), move(platform), move(log)}};
}

} // namespace discovery
} // namespace lanlight

// Copyright: 2026, Ableton AG, Berlin. All rights reserved.

#pragma once

#include <lanlight/discovery/Interfaces.hpp>
#include <lanlight/discovery/test/Interface.hpp>
#include <lanlight/lan/Codec.hpp>
#include <lanlight/lan/Products.hpp>
#include <lanlight/util/test/IoService.hpp>
#include <algorithm>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace lanlight
{
namespace lan
{
namespace test
{

// A device on the simulated network. It answers the way a light with
// the given state and product would.
struct SimulatedDevice
{
  Serial serial;
  asio::ip::address_v4 address;
  std::uint32_t product = 1;
  std::uint32_t hostFirmware = firmwareVersion(3, 70);
  std::string label;
  std::string group;
  std::uint16_t power = 0;
  Hsbk color;
  // Multizone devices only
  std::vector<Hsbk> zones;
  std::uint16_t infrared = 0;
  bool online = true;
  // Types of the packets that reached the device, in order of arrival
  std::vector<std::uint16_t> received;
};

namespace detail
{

// Builds the replies of a device to a request and applies commands
struct Responder
{
  using Replies = std::vector<Message>;

  Replies operator()(const GetService&)
  {
    StateService state;
    state.port = kDefaultPort;
    return {state};
  }

  Replies operator()(const GetHostFirmware&)
  {
    StateHostFirmware state;
    state.version = device.hostFirmware;
    return {state};
  }

  Replies operator()(const GetWifiInfo&)
  {
    StateWifiInfo state;
    state.signal = 1e-5f;
    return {state};
  }

  Replies operator()(const GetPower&)
  {
    StatePower state;
    state.level = device.power;
    return {state};
  }

  Replies operator()(const GetLightPower&)
  {
    StateLightPower state;
    state.level = device.power;
    return {state};
  }

  Replies operator()(const GetLabel&)
  {
    StateLabel state;
    state.label = toLabel(device.label);
    return {state};
  }

  Replies operator()(const GetVersion&)
  {
    StateVersion state;
    state.vendor = kLifxVendor;
    state.product = device.product;
    return {state};
  }

  Replies operator()(const GetGroup&)
  {
    StateGroup state;
    state.label = toLabel(device.group);
    return {state};
  }

  Replies operator()(const EchoRequest& request)
  {
    EchoResponse response;
    response.echoing = request.echoing;
    return {response};
  }

  Replies operator()(const GetColor&)
  {
    LightState state;
    state.color = device.color;
    state.power = device.power;
    state.label = toLabel(device.label);
    return {state};
  }

  Replies operator()(const GetInfrared&)
  {
    StateInfrared state;
    state.brightness = device.infrared;
    return {state};
  }

  Replies operator()(const GetHevCycle&)
  {
    return {StateHevCycle{}};
  }

  Replies operator()(const GetMultiZoneEffect&)
  {
    if (device.zones.empty())
    {
      return {};
    }
    return {StateMultiZoneEffect{}};
  }

  Replies operator()(const GetColorZones& request)
  {
    const auto count = device.zones.size();
    Replies replies;
    if (request.startIndex == request.endIndex && request.startIndex < count)
    {
      StateZone state;
      state.count = static_cast<std::uint8_t>(count);
      state.index = request.startIndex;
      state.color = device.zones[request.startIndex];
      replies.push_back(state);
      return replies;
    }

    for (std::size_t i = request.startIndex; i <= request.endIndex && i < count;
         i += kZonesPerStateMultiZone)
    {
      StateMultiZone state;
      state.count = static_cast<std::uint8_t>(count);
      state.index = static_cast<std::uint8_t>(i);
      for (std::size_t j = 0; j < kZonesPerStateMultiZone && i + j < count; ++j)
      {
        state.colors[j] = device.zones[i + j];
      }
      replies.push_back(state);
    }
    return replies;
  }

  Replies operator()(const GetExtendedColorZones&)
  {
    const auto count = device.zones.size();
    Replies replies;
    for (std::size_t i = 0; i < count; i += kZonesPerExtendedMessage)
    {
      StateExtendedColorZones state;
      state.count = static_cast<std::uint16_t>(count);
      state.index = static_cast<std::uint16_t>(i);
      const auto n = std::min(kZonesPerExtendedMessage, count - i);
      state.colorsCount = static_cast<std::uint8_t>(n);
      std::copy_n(device.zones.begin() + static_cast<std::ptrdiff_t>(i), n, state.colors.begin());
      replies.push_back(state);
    }
    return replies;
  }

  Replies operator()(const SetPower& command)
  {
    device.power = command.level;
    return {};
  }

  Replies operator()(const SetLightPower& command)
  {
    device.power = command.level;
    return {};
  }

  Replies operator()(const SetLabel& command)
  {
    device.label = toString(command.label);
    return {};
  }

  Replies operator()(const SetColor& command)
  {
    device.color = command.color;
    return {};
  }

  Replies operator()(const SetInfrared& command)
  {
    device.infrared = command.brightness;
    return {};
  }

  Replies operator()(const SetColorZones& command)
  {
    for (std::size_t i = command.startIndex; i <= command.endIndex && i < device.zones.size();
         ++i)
    {
      device.zones[i] = command.color;
    }
    return {};
  }

  Replies operator()(const SetExtendedColorZones& command)
  {
    for (std::size_t j = 0; j < command.colorsCount && j < command.colors.size(); ++j)
    {
      const auto i = command.index + j;
      if (i < device.zones.size())
      {
        device.zones[i] = command.colors[j];
      }
    }
    return {};
  }

  // State messages sent to a device are ignored
  template <typename Message>
  Replies operator()(const Message&)
  {
    return {};
  }

  SimulatedDevice& device;
};

} // namespace detail

// Connects test interfaces to simulated devices. Every datagram sent
// through an attached interface reaches the online devices on the
// interface's subnet; their replies are posted to the io service and
// arrive on the interface when the test runs the handlers.
class SimulatedNetwork
{
public:
  using Interface = discovery::test::Interface;
  // Decides whether the n-th packet sent to a device, counted from 1,
  // is lost
  using LossModel = std::function<bool(const Serial&, std::size_t packetOnLink)>;

  // Doubles as the interface factory of a fleet controller
  struct InterfaceFactory
  {
    std::shared_ptr<Interface> operator()(
      util::test::IoService&, const discovery::IpInterface& iface)
    {
      return mpNetwork->attach(iface);
    }

    SimulatedNetwork* mpNetwork;
  };

  explicit SimulatedNetwork(util::test::IoService& io)
    : mIo(io)
  {
  }

  ~SimulatedNetwork()
  {
    for (const auto& pIface : mInterfaces)
    {
      pIface->onSend = nullptr;
    }
  }

  SimulatedNetwork(const SimulatedNetwork&) = delete;
  SimulatedNetwork& operator=(const SimulatedNetwork&) = delete;

  SimulatedDevice& addDevice(SimulatedDevice device)
  {
    mDevices.push_back(std::move(device));
    return mDevices.back();
  }

  SimulatedDevice* device(const Serial& serial)
  {
    const auto it = std::find_if(mDevices.begin(), mDevices.end(),
      [&serial](const SimulatedDevice& device) { return device.serial == serial; });
    return it == mDevices.end() ? nullptr : &*it;
  }

  void setLossModel(LossModel lossModel)
  {
    mLossModel = std::move(lossModel);
  }

  InterfaceFactory interfaceFactory()
  {
    return {this};
  }

  std::shared_ptr<Interface> attach(const discovery::IpInterface& iface)
  {
    auto pIface = std::make_shared<Interface>(asio::ip::udp::endpoint{iface.address, 50000});
    std::weak_ptr<Interface> wpIface = pIface;
    pIface->onSend = [this, iface, wpIface](const std::vector<std::uint8_t>& bytes,
                       const asio::ip::udp::endpoint& to) { deliver(iface, wpIface, bytes, to); };
    mInterfaces.push_back(pIface);
    return pIface;
  }

  // Every interface attached so far, including those the fleet has
  // since dropped
  const std::vector<std::shared_ptr<Interface>>& interfaces() const
  {
    return mInterfaces;
  }

private:
  void deliver(const discovery::IpInterface& iface,
    const std::weak_ptr<Interface>& wpIface,
    const std::vector<std::uint8_t>& bytes,
    const asio::ip::udp::endpoint& to)
  {
    const auto result = decode(bytes);
    const auto pPacket = std::get_if<Packet>(&result);
    if (!pPacket)
    {
      return;
    }

    const auto broadcast = to.address() == asio::ip::address{broadcastAddress(iface)};
    for (auto& device : mDevices)
    {
      if (!device.online
          || !discovery::sameSubnet(iface, discovery::IpInterface{device.address, iface.netmask}))
      {
        continue;
      }
      if (!broadcast && to.address() != asio::ip::address{device.address})
      {
        continue;
      }
      if (!pPacket->header.tagged && !pPacket->header.target.isZero()
          && pPacket->header.target != device.serial)
      {
        continue;
      }

      const auto packetOnLink = ++mLinkCounts[device.serial];
      if (mLossModel && mLossModel(device.serial, packetOnLink))
      {
        continue;
      }
      device.received.push_back(pPacket->header.type);
      respond(device, *pPacket, wpIface);
    }
  }

  void respond(
    SimulatedDevice& device, const Packet& request, const std::weak_ptr<Interface>& wpIface)
  {
    auto replies = std::visit(detail::Responder{device}, request.message);
    if (request.header.ackRequired)
    {
      replies.insert(replies.begin(), Acknowledgement{});
    }

    Header header;
    header.source = request.header.source;
    header.target = device.serial;
    header.sequence = request.header.sequence;
    const asio::ip::udp::endpoint from{device.address, kDefaultPort};
    for (const auto& reply : replies)
    {
      const auto bytes = encode(header, reply);
      mIo.post([wpIface, from, bytes] {
        if (const auto pIface = wpIface.lock())
        {
          pIface->incomingMessage(from, bytes);
        }
      });
    }
  }

  util::test::IoService& mIo;
  std::deque<SimulatedDevice> mDevices;
  std::vector<std::shared_ptr<Interface>> mInterfaces;
  std::map<Serial, std::size_t> mLinkCounts;
  LossModel mLossModel;
};

} // namespace test
} // namespace lan
} // namespace lanlight

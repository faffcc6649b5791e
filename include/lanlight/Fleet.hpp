// Copyright: 2026, Ableton AG, Berlin. All rights reserved.

#pragma once

#include <lanlight/asio/AsioService.hpp>
#include <lanlight/discovery/UdpInterface.hpp>
#include <lanlight/fleet/Controller.hpp>
#include <lanlight/platform/Posix.hpp>
#include <lanlight/util/Log.hpp>
#include <memory>
#include <mutex>

namespace lanlight
{

/*! @class Fleet
 *  @brief Discovers and controls the smart lights on the local
 *  networks.
 *
 *  @discussion A Fleet owns a network thread on which discovery,
 *  retries and all device bookkeeping happen. Its methods are
 *  thread-safe and never block on the network: requests are resolved
 *  later, on the network thread, through the handler passed to send().
 *
 *  Devices appear in the fleet when they answer discovery. Each one
 *  carries an availability: Unknown until the first response,
 *  Available while it answers and Unavailable once it has not answered
 *  for longer than the grace period.
 */
class Fleet
{
public:
  using Settings = fleet::Settings;
  using Outcome = fleet::Outcome;
  using Status = fleet::Status;
  using Availability = fleet::Availability;
  using DeviceState = fleet::DeviceState;
  using DeviceSummary = fleet::DeviceSummary;

  /*! @brief Construct with the given settings.
   *  Throws std::invalid_argument for invalid settings. Discovery does
   *  not start before discover() is called.
   */
  explicit Fleet(Settings settings = {});

  Fleet(const Fleet&) = delete;
  Fleet& operator=(const Fleet&) = delete;
  Fleet(Fleet&&) = delete;
  Fleet& operator=(Fleet&&) = delete;

  /*! @brief Start periodic discovery on every eligible interface. */
  void discover();

  /*! @brief Run a discovery cycle now instead of at the next interval. */
  void rediscover();

  /*! @brief End discovery and cancel every request in flight. */
  void stop();

  /*! @brief Send a request to a device.
   *  The handler is invoked exactly once, on the network thread, with
   *  the response or the reason there is none.
   */
  template <typename Handler>
  void send(const lan::Serial& serial, lan::Message request, Handler handler);

  /*! @brief Register a callback for availability changes.
   *  The callback is invoked on the network thread once per transition.
   */
  template <typename Callback>
  void setAvailabilityCallback(Callback callback);

  std::optional<DeviceState> deviceState(const lan::Serial& serial) const;
  std::vector<DeviceSummary> devices() const;
  std::size_t numDevices() const;

  /*! @brief Forget a device and cancel its requests in flight. */
  void removeDevice(const lan::Serial& serial);

private:
  using Controller = fleet::Controller<platform::Posix,
    discovery::UdpInterfaceFactory,
    util::Timestamped<util::StdLog>,
    std::unique_ptr<util::AsioService>>;

  std::mutex mCallbackMutex;
  fleet::AvailabilityCallback mAvailabilityCallback;
  Controller mController;
};

} // namespace lanlight

#include <lanlight/Fleet.ipp>

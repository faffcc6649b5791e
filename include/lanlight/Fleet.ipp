// Copyright: 2026, Ableton AG, Berlin. All rights reserved.

#pragma once

namespace lanlight
{

inline Fleet::Fleet(Settings settings)
  : mAvailabilityCallback([](const lan::Serial&, Availability) {})
  , mController(settings,
      platform::Posix{},
      discovery::UdpInterfaceFactory{},
      util::Timestamped<util::StdLog>{util::StdLog{"lanlight", settings.verbose}},
      util::injectUnique(std::unique_ptr<util::AsioService>(new util::AsioService)),
      [this](const lan::Serial& serial, const Availability availability) {
        std::lock_guard<std::mutex> lock(mCallbackMutex);
        mAvailabilityCallback(serial, availability);
      })
{
}

inline void Fleet::discover()
{
  mController.discover();
}

inline void Fleet::rediscover()
{
  mController.rediscover();
}

inline void Fleet::stop()
{
  mController.stop();
}

template <typename Handler>
void Fleet::send(const lan::Serial& serial, lan::Message request, Handler handler)
{
  mController.send(serial, std::move(request),
    [handler](const Outcome& outcome) mutable { handler(outcome); });
}

template <typename Callback>
void Fleet::setAvailabilityCallback(Callback callback)
{
  std::lock_guard<std::mutex> lock(mCallbackMutex);
  mAvailabilityCallback = [callback](const lan::Serial& serial,
                            const Availability availability) { callback(serial, availability); };
}

inline std::optional<Fleet::DeviceState> Fleet::deviceState(const lan::Serial& serial) const
{
  return mController.deviceState(serial);
}

inline std::vector<Fleet::DeviceSummary> Fleet::devices() const
{
  return mController.devices();
}

inline std::size_t Fleet::numDevices() const
{
  return mController.numDevices();
}

inline void Fleet::removeDevice(const lan::Serial& serial)
{
  mController.removeDevice(serial);
}

} // namespace lanlight

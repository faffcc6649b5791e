// Copyright: 2026, Ableton AG, Berlin. All rights reserved.

#include <lanlight/Fleet.hpp>

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <termios.h>
#include <unistd.h>

namespace
{

struct State
{
  std::atomic<bool> running;
  std::atomic<std::uint16_t> hue;
  lanlight::Fleet fleet;

  State(lanlight::Fleet::Settings settings)
    : running(true)
    , hue(0)
    , fleet(std::move(settings))
  {
  }
};

void disableBufferedInput()
{
  termios t;
  tcgetattr(STDIN_FILENO, &t);
  t.c_lflag &= static_cast<unsigned long>(~ICANON);
  tcsetattr(STDIN_FILENO, TCSANOW, &t);
}

void enableBufferedInput()
{
  termios t;
  tcgetattr(STDIN_FILENO, &t);
  t.c_lflag |= ICANON;
  tcsetattr(STDIN_FILENO, TCSANOW, &t);
}

void printUsage()
{
  std::cout << "Usage: lanlighthut [options]" << std::endl;
  std::cout << "  --discovery-interval <s>   period of discovery broadcasts (60)" << std::endl;
  std::cout << "  --timeout <ms>             response timeout per attempt (1000)" << std::endl;
  std::cout << "  --retries <n>              attempts per request (8)" << std::endl;
  std::cout << "  --grace <s>                silence before unavailable (180)" << std::endl;
  std::cout << "  --inflight <n>             requests in flight per device (8)" << std::endl;
  std::cout << "  --no-poll                  don't poll idle devices" << std::endl;
  std::cout << "  --verbose                  log every attempt" << std::endl;
}

void printHelp()
{
  std::cout << std::endl << " < L A N  L I G H T  H U T >" << std::endl << std::endl;
  std::cout << "usage:" << std::endl;
  std::cout << "  list devices: l" << std::endl;
  std::cout << "  rediscover: d" << std::endl;
  std::cout << "  all lights on / off: 1 / 0" << std::endl;
  std::cout << "  next color: c" << std::endl;
  std::cout << "  quit: q" << std::endl << std::endl;
}

void printDevices(const lanlight::Fleet& fleet)
{
  using namespace std;
  cout << endl << "serial       | address              | state       | label" << endl;
  for (const auto& device : fleet.devices())
  {
    ostringstream address;
    address << device.endpoint;
    cout << device.serial << " | " << left << setw(20) << address.str() << " | " << setw(11)
         << toString(device.availability) << " | " << device.label << endl;
  }
  cout << fleet.numDevices() << " devices" << endl << endl;
}

void sendToAll(lanlight::Fleet& fleet, const lanlight::lan::Message& request)
{
  for (const auto& device : fleet.devices())
  {
    const auto serial = device.serial;
    fleet.send(serial, request, [serial](const lanlight::Fleet::Outcome& outcome) {
      if (!outcome)
      {
        std::cout << serial << ": " << toString(outcome.status) << ", " << outcome.reason
                  << std::endl;
      }
    });
  }
}

void input(State& state)
{
  for (;;)
  {
    const auto in = static_cast<char>(std::cin.get());

    switch (in)
    {
    case 'q':
      state.running = false;
      return;
    case 'l':
      printDevices(state.fleet);
      break;
    case 'd':
      state.fleet.rediscover();
      break;
    case '1':
    case '0':
    {
      lanlight::lan::SetLightPower power;
      power.level = in == '1' ? std::uint16_t{65535} : std::uint16_t{0};
      power.durationMs = 500;
      sendToAll(state.fleet, power);
      break;
    }
    case 'c':
    {
      lanlight::lan::SetColor color;
      color.color.hue = state.hue += 8192;
      color.color.saturation = 65535;
      color.color.brightness = 65535;
      color.color.kelvin = 3500;
      color.durationMs = 500;
      sendToAll(state.fleet, color);
      break;
    }
    default:
      break;
    }
  }
}

lanlight::Fleet::Settings parseSettings(const int nargs, char** args)
{
  lanlight::Fleet::Settings settings;
  for (int i = 1; i < nargs; ++i)
  {
    const std::string arg = args[i];
    const auto value = [&] {
      if (i + 1 >= nargs)
      {
        throw std::invalid_argument(arg + " needs a value");
      }
      return std::stoul(args[++i]);
    };

    if (arg == "--discovery-interval")
    {
      settings.discoveryInterval = std::chrono::seconds(value());
    }
    else if (arg == "--timeout")
    {
      settings.responseTimeout = std::chrono::milliseconds(value());
    }
    else if (arg == "--retries")
    {
      settings.retryCount = value();
    }
    else if (arg == "--grace")
    {
      settings.gracePeriod = std::chrono::seconds(value());
    }
    else if (arg == "--inflight")
    {
      settings.inflightCeiling = value();
    }
    else if (arg == "--no-poll")
    {
      settings.pollDevices = false;
    }
    else if (arg == "--verbose")
    {
      settings.verbose = true;
    }
    else
    {
      throw std::invalid_argument("unknown option " + arg);
    }
  }
  lanlight::fleet::validate(settings);
  return settings;
}

} // namespace

int main(int nargs, char** args)
{
  lanlight::Fleet::Settings settings;
  try
  {
    settings = parseSettings(nargs, args);
  }
  catch (const std::exception& e)
  {
    std::cerr << e.what() << std::endl;
    printUsage();
    return EXIT_FAILURE;
  }

  State state(settings);
  state.fleet.setAvailabilityCallback(
    [](const lanlight::lan::Serial& serial, const lanlight::Fleet::Availability availability) {
      std::cout << serial << " is " << toString(availability) << std::endl;
    });

  printHelp();
  disableBufferedInput();
  state.fleet.discover();

  std::thread thread(input, std::ref(state));

  while (state.running)
  {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  state.fleet.stop();
  enableBufferedInput();
  thread.join();
  return 0;
}

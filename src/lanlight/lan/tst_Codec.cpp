// Copyright: 2026, Ableton AG, Berlin. All rights reserved.

#include <lanlight/lan/Codec.hpp>
#include <lanlight/test/CatchWrapper.hpp>
#include <cstring>
#include <new>
#include <sstream>

namespace lanlight
{
namespace lan
{
namespace
{

const Serial kSerial = Serial::fromString("d073d5001122");

Packet decodePacket(const std::vector<std::uint8_t>& bytes)
{
  auto result = decode(bytes);
  REQUIRE(std::holds_alternative<Packet>(result));
  return std::get<Packet>(result);
}

} // anonymous namespace

TEST_CASE("Codec | BroadcastHeaderLayout", "[Codec]")
{
  Header header;
  header.tagged = true;
  header.source = 0x01020304;
  header.resRequired = true;
  header.sequence = 7;
  const auto bytes = encode(header, GetService{});

  REQUIRE(36 == bytes.size());
  // size
  CHECK(36 == bytes[0]);
  CHECK(0 == bytes[1]);
  // protocol 1024, addressable and tagged
  CHECK(0x00 == bytes[2]);
  CHECK(0x34 == bytes[3]);
  // source, little endian
  CHECK(0x04 == bytes[4]);
  CHECK(0x01 == bytes[7]);
  // all zero target
  for (std::size_t i = 8; i < 16; ++i)
  {
    CHECK(0 == bytes[i]);
  }
  CHECK(0x01 == bytes[22]);
  CHECK(7 == bytes[23]);
  // type
  CHECK(2 == bytes[32]);
  CHECK(0 == bytes[33]);
}

TEST_CASE("Codec | DefaultHeaderOverDirtyStorageBroadcasts", "[Codec]")
{
  alignas(Header) unsigned char storage[sizeof(Header)];
  std::memset(storage, 0xab, sizeof(storage));
  auto* pHeader = new (storage) Header;
  pHeader->tagged = true;
  const auto bytes = encode(*pHeader, GetService{});
  CHECK(pHeader->target.isZero());
  pHeader->~Header();

  REQUIRE(36 == bytes.size());
  for (std::size_t i = 8; i < 16; ++i)
  {
    CHECK(0 == bytes[i]);
  }
}

TEST_CASE("Codec | UnicastCommand", "[Codec]")
{
  Header header;
  header.source = 42;
  header.target = kSerial;
  header.ackRequired = true;
  header.sequence = 200;

  SetColor command;
  command.color = Hsbk{21845, 65535, 32768, 3500};
  command.durationMs = 1500;
  const auto bytes = encode(header, command);

  // header, reserved byte, color and duration
  REQUIRE(49 == bytes.size());
  CHECK(49 == bytes[0]);
  CHECK(102 == bytes[32]);
  // not tagged
  CHECK(0x14 == bytes[3]);
  CHECK(0x02 == bytes[22]);
  CHECK(0xd0 == bytes[8]);
  CHECK(0x22 == bytes[13]);
  CHECK(0 == bytes[14]);

  const auto packet = decodePacket(bytes);
  CHECK(42 == packet.header.source);
  CHECK(kSerial == packet.header.target);
  CHECK(!packet.header.tagged);
  CHECK(packet.header.ackRequired);
  CHECK(!packet.header.resRequired);
  CHECK(200 == packet.header.sequence);
  CHECK(49 == packet.header.size);

  const auto pDecoded = std::get_if<SetColor>(&packet.message);
  REQUIRE(pDecoded);
  CHECK(command.color == pDecoded->color);
  CHECK(1500 == pDecoded->durationMs);
}

TEST_CASE("Codec | StateMessagesDecode", "[Codec]")
{
  Header header;
  header.target = kSerial;

  LightState state;
  state.color = Hsbk{1, 2, 3, 4000};
  state.power = 65535;
  state.label = toLabel("Kitchen");
  const auto packet = decodePacket(encode(header, state));

  const auto pState = std::get_if<LightState>(&packet.message);
  REQUIRE(pState);
  CHECK(Hsbk{1, 2, 3, 4000} == pState->color);
  CHECK(65535 == pState->power);
  CHECK("Kitchen" == toString(pState->label));
}

TEST_CASE("Codec | ZoneMessagesDecode", "[Codec]")
{
  StateExtendedColorZones state;
  state.count = 90;
  state.index = 82;
  state.colorsCount = 8;
  state.colors[7] = Hsbk{7, 7, 7, 7};
  const auto packet = decodePacket(encode(Header{}, state));

  const auto pState = std::get_if<StateExtendedColorZones>(&packet.message);
  REQUIRE(pState);
  CHECK(90 == pState->count);
  CHECK(82 == pState->index);
  CHECK(8 == pState->colorsCount);
  CHECK(Hsbk{7, 7, 7, 7} == pState->colors[7]);
}

TEST_CASE("Codec | TruncatedMessage", "[Codec]")
{
  auto bytes = encode(Header{}, SetPower{});
  bytes.pop_back();
  CHECK(std::holds_alternative<DecodeError>(decode(bytes)));
}

TEST_CASE("Codec | ShorterThanHeader", "[Codec]")
{
  auto bytes = encode(Header{}, GetService{});
  bytes.resize(20);
  CHECK(std::holds_alternative<DecodeError>(decode(bytes)));
}

TEST_CASE("Codec | WrongProtocol", "[Codec]")
{
  auto bytes = encode(Header{}, GetService{});
  bytes[2] = 0x01;
  bytes[3] = 0x10;
  const auto result = decode(bytes);
  REQUIRE(std::holds_alternative<DecodeError>(result));
  CHECK(std::get<DecodeError>(result).reason.find("protocol") != std::string::npos);
}

TEST_CASE("Codec | UnknownType", "[Codec]")
{
  auto bytes = encode(Header{}, GetService{});
  bytes[32] = 0x0f;
  bytes[33] = 0x27;
  const auto result = decode(bytes);
  REQUIRE(std::holds_alternative<DecodeError>(result));
  CHECK(std::get<DecodeError>(result).reason.find("9999") != std::string::npos);
}

TEST_CASE("Codec | TrailingBytesIgnored", "[Codec]")
{
  auto bytes = encode(Header{}, StatePower{});
  bytes.push_back(0xff);
  bytes.push_back(0xff);
  const auto packet = decodePacket(bytes);
  CHECK(std::holds_alternative<StatePower>(packet.message));
}

TEST_CASE("Codec | ResponseCorrelation", "[Codec]")
{
  CHECK(LightState::kType == responseType(GetColor{}));
  CHECK(Acknowledgement::kType == responseType(SetPower{}));
  CHECK(0 == responseType(StateService{}));

  CHECK(isRequest(GetLabel{}));
  CHECK(isRequest(SetLabel{}));
  CHECK(!isRequest(StateLabel{}));
  CHECK(!isRequest(Acknowledgement{}));

  CHECK(requiresAck(SetColor{}));
  CHECK(!requiresAck(GetColor{}));

  CHECK(acceptsResponse(GetColor{}, LightState::kType));
  CHECK(!acceptsResponse(GetColor{}, StatePower::kType));
  CHECK(acceptsResponse(GetColorZones{}, StateMultiZone::kType));
  CHECK(acceptsResponse(GetColorZones{}, StateZone::kType));
  CHECK(!acceptsResponse(StatePower{}, StatePower::kType));
}

TEST_CASE("Codec | MessageNames", "[Codec]")
{
  std::ostringstream stream;
  stream << Message{GetHostFirmware{}};
  CHECK("GetHostFirmware(14)" == stream.str());
}

TEST_CASE("Label | NullPadded", "[Label]")
{
  auto label = toLabel("abc");
  CHECK("abc" == toString(label));
  label[1] = 0;
  CHECK("a" == toString(label));
  CHECK(32 == toString(toLabel(std::string(40, 'x'))).size());
}

TEST_CASE("Serial | Parsing", "[Serial]")
{
  const auto serial = Serial::fromString("d0:73:d5:00:11:22");
  CHECK(kSerial == serial);
  CHECK(!serial.isZero());
  CHECK(Serial{}.isZero());

  std::ostringstream stream;
  stream << serial;
  CHECK("d0:73:d5:00:11:22" == stream.str());

  CHECK_THROWS_AS(Serial::fromString("d073d50011"), std::invalid_argument);
  CHECK_THROWS_AS(Serial::fromString("d073d50011zz"), std::invalid_argument);
}

} // namespace lan
} // namespace lanlight

// Copyright: 2026, Ableton AG, Berlin. All rights reserved.

#include <lanlight/lan/Products.hpp>
#include <lanlight/test/CatchWrapper.hpp>
#include <string>

namespace lanlight
{
namespace lan
{

TEST_CASE("Products | KnownProduct", "[Products]")
{
  const auto pProduct = findProduct(kLifxVendor, 22);
  REQUIRE(pProduct);
  CHECK(std::string{"LIFX Color 1000"} == pProduct->name);
  CHECK(pProduct->features.color);
  CHECK(!pProduct->features.multizone);
}

TEST_CASE("Products | UnknownProduct", "[Products]")
{
  CHECK(nullptr == findProduct(kLifxVendor, 9999));
  CHECK(nullptr == findProduct(2, 1));

  const auto f = productFeatures(kLifxVendor, 9999, 0);
  CHECK(f.color);
  CHECK(!f.multizone);
  CHECK(!f.relays);
}

TEST_CASE("Products | ExtendedMultizoneNeedsFirmware", "[Products]")
{
  const auto old = productFeatures(kLifxVendor, 32, firmwareVersion(2, 76));
  CHECK(old.multizone);
  CHECK(!old.extendedMultizone);

  const auto current = productFeatures(kLifxVendor, 32, firmwareVersion(2, 77));
  CHECK(current.multizone);
  CHECK(current.extendedMultizone);

  CHECK(productFeatures(kLifxVendor, 117, 0).extendedMultizone);
  CHECK(!productFeatures(kLifxVendor, 31, firmwareVersion(3, 90)).extendedMultizone);
}

TEST_CASE("Products | Capabilities", "[Products]")
{
  CHECK(productFeatures(kLifxVendor, 29, 0).infrared);
  CHECK(productFeatures(kLifxVendor, 90, 0).hev);

  const auto lightSwitch = productFeatures(kLifxVendor, 70, 0);
  CHECK(lightSwitch.relays);
  CHECK(!lightSwitch.color);
}

TEST_CASE("Products | FirmwareVersion", "[Products]")
{
  CHECK(0x0002004d == firmwareVersion(2, 77));
}

} // namespace lan
} // namespace lanlight

// Copyright: 2026, Ableton AG, Berlin. All rights reserved.

#define CATCH_CONFIG_RUNNER

#include <lanlight/test/CatchWrapper.hpp>
#include <algorithm>
#include <string>
#include <vector>

namespace
{

const char* pathForXmlOutput(const int argc, const char* const argv[])
{
  const std::string outputArgPrefix = "--gtest_output=xml:";

  for (int i = 1; i < argc; i++)
  {
    if (std::string{argv[i]}.compare(0, outputArgPrefix.length(), outputArgPrefix) == 0)
    {
      return argv[i] + outputArgPrefix.length();
    }
  }

  return nullptr;
}

} // anonymous namespace

int main(const int argc, const char* const argv[])
{
  // CI runners request google test-style xml; hand it to the junit reporter
  const auto pPath = pathForXmlOutput(argc, argv);
  const auto args = pPath == nullptr
                      ? std::vector<const char*>{}
                      : std::vector<const char*>{"-r", "junit", "-o", pPath};

  std::vector<const char*> inArgs(argv, argv + argc);
  inArgs.erase(std::remove_if(inArgs.begin(), inArgs.end(),
                 [](const char* arg) {
                   return std::string{arg}.find("--gtest") != std::string::npos;
                 }),
    inArgs.end());

  inArgs.insert(inArgs.end(), args.begin(), args.end());

  Catch::Session session;
  const auto result = session.applyCommandLine(int(inArgs.size()), inArgs.data());
  if (result != 0)
  {
    return result;
  }
  return session.run();
}

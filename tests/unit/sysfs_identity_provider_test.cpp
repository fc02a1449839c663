#include "internal/identity/sysfs_identity_provider.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>

namespace {

using blegw::identity::SysfsIdentityProvider;
using blegw::runtime::Task;

// Runs tasks right away on the calling thread.
void Inline(Task task) {
  task();
}

std::filesystem::path MakeSysfsRoot(const std::string& test_name) {
  const auto root = std::filesystem::temp_directory_path() / "ble_gateway_sysfs_tests" / test_name;
  std::filesystem::remove_all(root);
  std::filesystem::create_directories(root);
  return root;
}

void WriteAddress(const std::filesystem::path& root, const std::string& adapter, const std::string& content) {
  std::filesystem::create_directories(root / adapter);
  std::ofstream out(root / adapter / "address");
  out << content;
}

std::optional<std::string> ResolveNow(SysfsIdentityProvider& provider) {
  bool                       called = false;
  std::optional<std::string> result;
  provider.Resolve([&](std::optional<std::string> address) {
    called = true;
    result = std::move(address);
  });
  assert(called);
  return result;
}

void TestReadsAdapterAddress() {
  const auto root = MakeSysfsRoot("reads_address");
  WriteAddress(root, "hci0", "dc:a6:32:01:02:03\n");

  SysfsIdentityProvider provider(Inline, "hci0", "", root);
  const auto            address = ResolveNow(provider);
  assert(address && *address == "dc:a6:32:01:02:03");
}

void TestPicksConfiguredAdapter() {
  const auto root = MakeSysfsRoot("picks_adapter");
  WriteAddress(root, "hci0", "00:00:00:00:00:01\n");
  WriteAddress(root, "hci1", "00:00:00:00:00:02\n");

  SysfsIdentityProvider provider(Inline, "hci1", "", root);
  const auto            address = ResolveNow(provider);
  assert(address && *address == "00:00:00:00:00:02");
}

void TestMissingAdapterResolvesToNothing() {
  const auto root = MakeSysfsRoot("missing_adapter");

  SysfsIdentityProvider provider(Inline, "hci0", "", root);
  assert(!ResolveNow(provider));
}

void TestEmptyAddressFileResolvesToNothing() {
  const auto root = MakeSysfsRoot("empty_file");
  WriteAddress(root, "hci0", "\n");

  SysfsIdentityProvider provider(Inline, "hci0", "", root);
  assert(!ResolveNow(provider));
}

void TestOverrideWins() {
  const auto root = MakeSysfsRoot("override");
  WriteAddress(root, "hci0", "dc:a6:32:01:02:03\n");

  SysfsIdentityProvider provider(Inline, "hci0", "112233445566", root);
  const auto            address = ResolveNow(provider);
  assert(address && *address == "112233445566");
}

} // namespace

int main() {
  TestReadsAdapterAddress();
  TestPicksConfiguredAdapter();
  TestMissingAdapterResolvesToNothing();
  TestEmptyAddressFileResolvesToNothing();
  TestOverrideWins();

  std::cout << "ble_gateway_unit_sysfs_identity_provider: pass\n";
  return 0;
}

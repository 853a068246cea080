#include "internal/installer/directory_installer.hpp"

#include <cassert>
#include <filesystem>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

#include "install_test_fakes.hpp"
#include "internal/installer/package_registry.hpp"

namespace {

using install::installer::DirectoryInstaller;
using install::installer::DirectoryPackageRegistry;
using install::installer::InstallEvent;
using install::installer::InstallEventKind;
using install::testing::FreshDir;
using install::testing::MakeRequest;
using install::testing::ReadFile;
using install::testing::WaitUntil;
using install::testing::WriteFile;

class EventLog {
 public:
  void Add(const InstallEvent& event) {
    std::lock_guard lock(mutex_);
    events_.push_back(event);
  }

  std::vector<InstallEvent> Events() const {
    std::lock_guard lock(mutex_);
    return events_;
  }

  std::size_t Count() const {
    std::lock_guard lock(mutex_);
    return events_.size();
  }

 private:
  mutable std::mutex        mutex_;
  std::vector<InstallEvent> events_;
};

void TestCopiesArtifactIntoPackageDir() {
  const auto dir      = FreshDir("installer_copy");
  const auto artifact = dir / "cache" / "app.apk";
  WriteFile(artifact, "apk bytes");

  DirectoryInstaller installer(dir / "installed", false);
  EventLog           log;
  const std::string  identity = "https://x/app.apk";
  auto sub = installer.Subscribe(identity, [&](const std::string&, const InstallEvent& event) { log.Add(event); });

  installer.Start();
  installer.Install(artifact, identity, MakeRequest(identity, "org.example.app", "apk bytes"));
  assert(WaitUntil([&] { return log.Count() == 2; }));

  const auto events = log.Events();
  assert(events[0].kind == InstallEventKind::kStarted);
  assert(events[1].kind == InstallEventKind::kComplete);
  assert(ReadFile(dir / "installed" / "org.example.app" / "app.apk") == "apk bytes");
  installer.Stop();
}

void TestMissingArtifactIsInterruptedWithError() {
  const auto         dir = FreshDir("installer_missing");
  DirectoryInstaller installer(dir / "installed", false);
  EventLog           log;
  const std::string  identity = "https://x/gone.apk";
  auto sub = installer.Subscribe(identity, [&](const std::string&, const InstallEvent& event) { log.Add(event); });

  installer.Start();
  installer.Install(dir / "cache" / "gone.apk", identity, MakeRequest(identity, "org.example.gone", "x"));
  assert(WaitUntil([&] { return log.Count() == 2; }));

  const auto events = log.Events();
  assert(events[1].kind == InstallEventKind::kInterrupted);
  assert(!events[1].error_message.empty());
  installer.Stop();
}

void TestConfirmationFlow() {
  const auto dir      = FreshDir("installer_confirm");
  const auto artifact = dir / "cache" / "app.apk";
  WriteFile(artifact, "confirmed");

  DirectoryInstaller installer(dir / "installed", true);
  EventLog           log;
  const std::string  identity = "https://x/app.apk";
  auto sub = installer.Subscribe(identity, [&](const std::string&, const InstallEvent& event) { log.Add(event); });

  installer.Start();
  installer.Install(artifact, identity, MakeRequest(identity, "org.example.app", "confirmed"));
  assert(WaitUntil([&] { return log.Count() == 2; }));

  auto events = log.Events();
  assert(events[1].kind == InstallEventKind::kUserInteractionRequired);
  assert(events[1].action.kind() == install::manager::v1::ACTION_KIND_CONFIRM_INSTALL);
  assert(events[1].action.identity() == identity);
  assert(!events[1].action.token().empty());
  assert(!std::filesystem::exists(dir / "installed" / "org.example.app" / "app.apk"));

  installer.Confirm(identity);
  assert(WaitUntil([&] { return log.Count() == 4; }));
  events = log.Events();
  assert(events[2].kind == InstallEventKind::kStarted);
  assert(events[3].kind == InstallEventKind::kComplete);
  assert(ReadFile(dir / "installed" / "org.example.app" / "app.apk") == "confirmed");
  installer.Stop();
}

void TestDeclineIsSilentInterrupt() {
  const auto dir      = FreshDir("installer_decline");
  const auto artifact = dir / "cache" / "app.apk";
  WriteFile(artifact, "declined");

  DirectoryInstaller installer(dir / "installed", true);
  EventLog           log;
  const std::string  identity = "https://x/app.apk";
  auto sub = installer.Subscribe(identity, [&](const std::string&, const InstallEvent& event) { log.Add(event); });

  installer.Start();
  installer.Install(artifact, identity, MakeRequest(identity, "org.example.app", "declined"));
  assert(WaitUntil([&] { return log.Count() == 2; }));

  installer.Decline(identity);
  assert(WaitUntil([&] { return log.Count() == 3; }));
  const auto events = log.Events();
  assert(events[2].kind == InstallEventKind::kInterrupted);
  assert(events[2].error_message.empty());

  // nothing left to confirm
  installer.Confirm(identity);
  installer.Stop();
  assert(log.Count() == 3);
}

void TestPackageRegistryRecordsInstaller() {
  const auto               dir = FreshDir("package_registry");
  DirectoryPackageRegistry registry(dir);

  assert(!registry.InstallerOf("org.example.app"));
  registry.SetInstaller("org.example.app", "install-manager");
  assert(registry.InstallerOf("org.example.app") == std::string("install-manager"));
  assert(ReadFile(dir / "org.example.app" / "INSTALLER") == "install-manager\n");

  bool threw = false;
  try {
    registry.SetInstaller("../escape", "install-manager");
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestCopiesArtifactIntoPackageDir();
  TestMissingArtifactIsInterruptedWithError();
  TestConfirmationFlow();
  TestDeclineIsSilentInterrupt();
  TestPackageRegistryRecordsInstaller();

  std::cout << "install_manager_unit_directory_installer: pass\n";
  return 0;
}

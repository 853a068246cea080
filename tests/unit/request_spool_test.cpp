#include "internal/runtime/request_spool.hpp"

#include <cassert>
#include <filesystem>
#include <iostream>
#include <string>

#include "install_test_fakes.hpp"

namespace {

using install::runtime::RequestSpool;
using install::testing::FreshDir;
using install::testing::MakeRequest;
using install::testing::WriteFile;

void TestAddLoadRemove() {
  RequestSpool spool(FreshDir("spool_roundtrip"));

  auto request = MakeRequest("https://x/app.apk", "org.example.app", "content");
  request.set_display_name("Example");
  request.mutable_main_expansion()->set_url("https://x/main.obb");

  spool.Add(request);
  assert(spool.Contains("https://x/app.apk"));

  auto loaded = spool.LoadAll();
  assert(loaded.size() == 1);
  assert(loaded[0].SerializeAsString() == request.SerializeAsString());

  assert(spool.Remove("https://x/app.apk"));
  assert(!spool.Remove("https://x/app.apk"));
  assert(spool.LoadAll().empty());
}

void TestAddReplacesSameIdentity() {
  RequestSpool spool(FreshDir("spool_replace"));

  auto first = MakeRequest("https://x/app.apk", "org.example.app", "v1");
  spool.Add(first);
  auto second = first;
  second.set_version_code(2);
  spool.Add(second);

  auto loaded = spool.LoadAll();
  assert(loaded.size() == 1);
  assert(loaded[0].version_code() == 2);
}

void TestUnreadableEntriesAreSkipped() {
  const auto   root = FreshDir("spool_garbage");
  RequestSpool spool(root);
  spool.Add(MakeRequest("https://x/good.apk", "org.example.good", "good"));

  WriteFile(spool.PendingDir() / "garbage.pb", std::string("\xff\xff\xff\xff", 4));
  WriteFile(spool.PendingDir() / "ignored.txt", "not a spool entry");

  auto loaded = spool.LoadAll();
  assert(loaded.size() == 1);
  assert(loaded[0].identity() == "https://x/good.apk");
}

void TestEntriesSurviveReopen() {
  const auto root = FreshDir("spool_reopen");
  {
    RequestSpool spool(root);
    spool.Add(MakeRequest("https://x/a.apk", "org.example.a", "a"));
    spool.Add(MakeRequest("https://x/b.apk", "org.example.b", "b"));
  }

  RequestSpool reopened(root);
  assert(reopened.LoadAll().size() == 2);
}

} // namespace

int main() {
  TestAddLoadRemove();
  TestAddReplacesSameIdentity();
  TestUnreadableEntriesAreSkipped();
  TestEntriesSurviveReopen();

  std::cout << "install_manager_unit_request_spool: pass\n";
  return 0;
}

#include "internal/status/status_registry.hpp"

#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "install_test_fakes.hpp"
#include "internal/model/state_machine.hpp"

namespace {

using namespace install::manager::v1;
using install::status::StatusChange;
using install::status::StatusRegistry;
using install::testing::MakeRequest;

void TestUpsertCreatesAndReplaces() {
  StatusRegistry registry;
  const auto     request = MakeRequest("https://x/a.apk", "org.example.a", "aaaa");

  auto created = registry.Upsert(request, INSTALL_STATUS_UNKNOWN);
  assert(created.identity() == "https://x/a.apk");
  assert(created.status() == INSTALL_STATUS_UNKNOWN);
  assert(created.request().package_name() == "org.example.a");
  assert(created.has_updated_at());

  registry.UpdateProgress("https://x/a.apk", 4, 2);
  registry.SetError("https://x/a.apk", "disk full");

  auto replaced = registry.Upsert(request, INSTALL_STATUS_UNKNOWN);
  assert(replaced.error_message().empty());
  assert(replaced.bytes_read() == 0);
  assert(registry.ListAll().size() == 1);
}

void TestUpdatesIgnoreMissingRecords() {
  StatusRegistry registry;
  assert(!registry.Update("https://x/none.apk", INSTALL_STATUS_DOWNLOADING));
  assert(!registry.UpdateProgress("https://x/none.apk", 10, 1));
  assert(!registry.SetError("https://x/none.apk", "boom"));
  assert(!registry.Remove("https://x/none.apk"));
  assert(!registry.Get("https://x/none.apk"));
}

void TestUpdateSetsAndClearsAction() {
  StatusRegistry registry;
  registry.Upsert(MakeRequest("https://x/a.apk", "org.example.a", "a"), INSTALL_STATUS_UNKNOWN);

  PendingAction cancel;
  cancel.set_kind(ACTION_KIND_CANCEL);
  cancel.set_identity("https://x/a.apk");
  assert(registry.Update("https://x/a.apk", INSTALL_STATUS_DOWNLOADING, cancel));
  assert(registry.Get("https://x/a.apk")->action().kind() == ACTION_KIND_CANCEL);

  registry.UpdateProgress("https://x/a.apk", 100, 40);
  auto record = *registry.Get("https://x/a.apk");
  assert(record.action().kind() == ACTION_KIND_CANCEL);
  assert(record.bytes_read() == 40);
  assert(install::status::ProgressFraction(record) == 0.4);

  assert(registry.Update("https://x/a.apk", INSTALL_STATUS_READY_TO_INSTALL));
  assert(!registry.Get("https://x/a.apk")->has_action());
}

void TestSetErrorIsTerminalWithMessage() {
  StatusRegistry registry;
  registry.Upsert(MakeRequest("https://x/a.apk", "org.example.a", "a"), INSTALL_STATUS_INSTALLING);
  assert(registry.SetError("https://x/a.apk", "signature mismatch"));

  auto record = *registry.Get("https://x/a.apk");
  assert(record.status() == INSTALL_STATUS_ERROR);
  assert(record.error_message() == "signature mismatch");
}

void TestQueriesAreSortedAndFiltered() {
  StatusRegistry registry;
  registry.Upsert(MakeRequest("https://x/c.apk", "org.example.shared", "c"), INSTALL_STATUS_INSTALLED);
  registry.Upsert(MakeRequest("https://x/a.apk", "org.example.shared", "a"), INSTALL_STATUS_READY_TO_INSTALL);
  registry.Upsert(MakeRequest("https://x/b.apk", "org.example.other", "b"), INSTALL_STATUS_READY_TO_INSTALL);

  auto all = registry.ListAll();
  assert(all.size() == 3);
  assert(all[0].identity() == "https://x/a.apk");
  assert(all[2].identity() == "https://x/c.apk");

  auto ready = registry.ListByStatus(INSTALL_STATUS_READY_TO_INSTALL);
  assert(ready.size() == 2);
  assert(ready[1].identity() == "https://x/b.apk");

  auto shared = registry.GetByPackageName("org.example.shared");
  assert(shared.size() == 2);
  assert(shared[0].identity() == "https://x/a.apk");

  auto snapshot = registry.Snapshot();
  assert(snapshot.records_size() == 3);
  assert(snapshot.has_taken_at());
}

void TestListenersSeeUpdatesAndRemovals() {
  StatusRegistry            registry;
  std::vector<StatusChange> changes;
  const auto                id = registry.AddListener([&](const StatusChange& change) { changes.push_back(change); });

  registry.Upsert(MakeRequest("https://x/a.apk", "org.example.a", "a"), INSTALL_STATUS_UNKNOWN);
  registry.Remove("https://x/a.apk");

  assert(changes.size() == 2);
  assert(changes[0].kind == StatusChange::Kind::kUpdated);
  assert(changes[1].kind == StatusChange::Kind::kRemoved);
  assert(changes[1].record.identity() == "https://x/a.apk");

  registry.RemoveListener(id);
  registry.Upsert(MakeRequest("https://x/b.apk", "org.example.b", "b"), INSTALL_STATUS_UNKNOWN);
  assert(changes.size() == 2);
}

void TestListenerMayReadRegistry() {
  StatusRegistry registry;
  bool           seen = false;
  registry.AddListener([&](const StatusChange& change) { seen = registry.Get(change.record.identity()).has_value(); });

  registry.Upsert(MakeRequest("https://x/a.apk", "org.example.a", "a"), INSTALL_STATUS_UNKNOWN);
  assert(seen);
}

void TestTransitionTable() {
  using install::model::CanTransition;

  assert(CanTransition(INSTALL_STATUS_UNKNOWN, INSTALL_STATUS_DOWNLOADING));
  assert(CanTransition(INSTALL_STATUS_DOWNLOADING, INSTALL_STATUS_READY_TO_INSTALL));
  assert(CanTransition(INSTALL_STATUS_DOWNLOADING, INSTALL_STATUS_UNKNOWN));
  assert(CanTransition(INSTALL_STATUS_READY_TO_INSTALL, INSTALL_STATUS_INSTALLING));
  assert(CanTransition(INSTALL_STATUS_UNKNOWN, INSTALL_STATUS_READY_TO_INSTALL));
  assert(CanTransition(INSTALL_STATUS_DOWNLOADING, INSTALL_STATUS_DOWNLOADING));
  assert(CanTransition(INSTALL_STATUS_INSTALLING, INSTALL_STATUS_INSTALLED));
  assert(CanTransition(INSTALL_STATUS_DOWNLOADING, INSTALL_STATUS_ERROR));
  assert(CanTransition(INSTALL_STATUS_ERROR, INSTALL_STATUS_INSTALLED));

  assert(!CanTransition(INSTALL_STATUS_READY_TO_INSTALL, INSTALL_STATUS_DOWNLOADING));
  assert(!CanTransition(INSTALL_STATUS_INSTALLED, INSTALL_STATUS_DOWNLOADING));
  assert(!CanTransition(INSTALL_STATUS_INSTALLED, INSTALL_STATUS_ERROR));
  assert(!CanTransition(INSTALL_STATUS_UNKNOWN, INSTALL_STATUS_INSTALLING));
  assert(!CanTransition(INSTALL_STATUS_INSTALLING, INSTALL_STATUS_UNKNOWN));
  assert(!CanTransition(INSTALL_STATUS_INSTALLING, INSTALL_STATUS_READY_TO_INSTALL));
  assert(!CanTransition(INSTALL_STATUS_READY_TO_INSTALL, INSTALL_STATUS_READY_TO_INSTALL));
  assert(!CanTransition(INSTALL_STATUS_INSTALLING, INSTALL_STATUS_INSTALLING));
  assert(!CanTransition(INSTALL_STATUS_ERROR, INSTALL_STATUS_ERROR));

  using install::model::CanAwaitUser;
  assert(CanAwaitUser(INSTALL_STATUS_READY_TO_INSTALL));
  assert(CanAwaitUser(INSTALL_STATUS_INSTALLING));
  assert(!CanAwaitUser(INSTALL_STATUS_DOWNLOADING));
  assert(!CanAwaitUser(INSTALL_STATUS_INSTALLED));

  assert(install::model::IsTerminal(INSTALL_STATUS_INSTALLED));
  assert(install::model::IsTerminal(INSTALL_STATUS_ERROR));
  assert(install::model::IsIntermediate(INSTALL_STATUS_INSTALLING));
  assert(!install::model::IsIntermediate(INSTALL_STATUS_UNSPECIFIED));
}

} // namespace

int main() {
  TestUpsertCreatesAndReplaces();
  TestUpdatesIgnoreMissingRecords();
  TestUpdateSetsAndClearsAction();
  TestSetErrorIsTerminalWithMessage();
  TestQueriesAreSortedAndFiltered();
  TestListenersSeeUpdatesAndRemovals();
  TestListenerMayReadRegistry();
  TestTransitionTable();

  std::cout << "install_manager_unit_status_registry: pass\n";
  return 0;
}

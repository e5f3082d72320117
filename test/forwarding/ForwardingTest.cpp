#include "Errors.hpp"
#include "FakeStores.hpp"
#include "ForwardingRuleManager.hpp"
#include "Mocks.hpp"
#include "NetshForwardingStore.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

using ::testing::_;
using ::testing::ElementsAre;
using ::testing::InSequence;
using ::testing::Return;
using ::testing::Throw;

namespace {
const char *V4_TABLE =
    "\n"
    "Listen on ipv4:             Connect to ipv4:\n"
    "\n"
    "Address         Port        Address         Port\n"
    "--------------- ----------  --------------- ----------\n"
    "0.0.0.0         3000        172.20.10.5     3000\n"
    "127.0.0.1       8080        172.20.10.5     80\n"
    "\n";
} // namespace

TEST(ForwardingRuleManagerTests, RemoveDeletesLoopbackThenAnyAddress) {
  MockForwardingStore store;
  {
    InSequence order;
    EXPECT_CALL(store, remove(ForwardingFamily::V4_TO_V4, "127.0.0.1", 3000))
        .WillOnce(Return(false));
    EXPECT_CALL(store, remove(ForwardingFamily::V4_TO_V4, "0.0.0.0", 3000))
        .WillOnce(Return(true));
  }
  EXPECT_CALL(store, remove(ForwardingFamily::V6_TO_V4, _, _)).Times(0);

  ForwardingRuleManager manager(store);
  manager.remove(3000, false);
}

TEST(ForwardingRuleManagerTests, RemoveIncludesIpv6WhenAsked) {
  MockForwardingStore store;
  EXPECT_CALL(store, remove(ForwardingFamily::V4_TO_V4, _, 3000))
      .Times(2)
      .WillRepeatedly(Return(false));
  EXPECT_CALL(store, remove(ForwardingFamily::V6_TO_V4, "::", 3000))
      .WillOnce(Return(false));

  ForwardingRuleManager manager(store);
  EXPECT_NO_THROW(manager.remove(3000, true));
}

TEST(ForwardingRuleManagerTests, AddCreatesAnyAddressEntries) {
  MockForwardingStore store;
  EXPECT_CALL(store, add(ForwardingEntry{ForwardingFamily::V4_TO_V4, "0.0.0.0",
                                         8443, "172.20.10.5", 8443}));
  EXPECT_CALL(store, add(ForwardingEntry{ForwardingFamily::V6_TO_V4, "::",
                                         8443, "172.20.10.5", 8443}));

  ForwardingRuleManager manager(store);
  manager.add(8443, "172.20.10.5", true);
}

TEST(ForwardingRuleManagerTests, StoreFailureNamesTheEntry) {
  MockForwardingStore store;
  EXPECT_CALL(store, remove(ForwardingFamily::V4_TO_V4, "127.0.0.1", 3000))
      .WillOnce(Throw(CommandError("netsh", 1, "Access is denied.")));
  // aborts on the first real failure
  EXPECT_CALL(store, remove(ForwardingFamily::V4_TO_V4, "0.0.0.0", _))
      .Times(0);

  ForwardingRuleManager manager(store);
  try {
    manager.remove(3000, false);
    FAIL() << "expected ForwardingError";
  } catch (const ForwardingError &error) {
    EXPECT_EQ(error.operation(), "delete v4tov4 127.0.0.1:3000");
  }
}

TEST(ForwardingRuleManagerTests, AddFailureNamesIpv6Entry) {
  FakeForwardingStore store;
  store.entries.push_back(ForwardingEntry{ForwardingFamily::V6_TO_V4, "::",
                                          3000, "10.0.0.9", 3000});

  ForwardingRuleManager manager(store);
  try {
    manager.add(3000, "10.0.0.1", true);
    FAIL() << "expected ForwardingError";
  } catch (const ForwardingError &error) {
    EXPECT_EQ(error.operation(),
              "add v6tov4 [::]:3000 -> 10.0.0.1:3000");
  }
  // the IPv4 entry created before the failure stays
  EXPECT_EQ(store.list(ForwardingFamily::V4_TO_V4).size(), 1u);
}

TEST(NetshForwardingStoreTests, ParsesDataRowsOnly) {
  auto entries =
      NetshForwardingStore::parseTable(ForwardingFamily::V4_TO_V4, V4_TABLE);
  EXPECT_THAT(entries,
              ElementsAre(ForwardingEntry{ForwardingFamily::V4_TO_V4,
                                          "0.0.0.0", 3000, "172.20.10.5",
                                          3000},
                          ForwardingEntry{ForwardingFamily::V4_TO_V4,
                                          "127.0.0.1", 8080, "172.20.10.5",
                                          80}));
}

TEST(NetshForwardingStoreTests, EmptyTableHasNoEntries) {
  EXPECT_TRUE(
      NetshForwardingStore::parseTable(ForwardingFamily::V6_TO_V4, "\n\n")
          .empty());
}

TEST(NetshForwardingStoreTests, AddBuildsPortproxyCommand) {
  MockCommandRunner runner;
  EXPECT_CALL(runner,
              run(ElementsAre("netsh.exe", "interface", "portproxy", "add",
                              "v6tov4", "listenaddress=::", "listenport=3000",
                              "connectaddress=172.20.10.5",
                              "connectport=3000")))
      .WillOnce(Return(CommandResult{0, ""}));

  NetshForwardingStore store(runner, "netsh.exe");
  store.add(ForwardingEntry{ForwardingFamily::V6_TO_V4, "::", 3000,
                            "172.20.10.5", 3000});
}

TEST(NetshForwardingStoreTests, FailedDeleteOfMissingEntryIsAbsence) {
  MockCommandRunner runner;
  EXPECT_CALL(runner, run(ElementsAre("netsh.exe", "interface", "portproxy",
                                      "delete", "v4tov4",
                                      "listenaddress=127.0.0.1",
                                      "listenport=3000")))
      .WillOnce(Return(
          CommandResult{1, "The system cannot find the file specified.\n"}));
  EXPECT_CALL(runner, run(ElementsAre("netsh.exe", "interface", "portproxy",
                                      "show", "v4tov4")))
      .WillOnce(Return(CommandResult{0, V4_TABLE}));

  NetshForwardingStore store(runner, "netsh.exe");
  EXPECT_FALSE(store.remove(ForwardingFamily::V4_TO_V4, "127.0.0.1", 3000));
}

TEST(NetshForwardingStoreTests, FailedDeleteOfPresentEntryThrows) {
  MockCommandRunner runner;
  EXPECT_CALL(runner, run(ElementsAre(_, _, _, "delete", _, _, _)))
      .WillOnce(Return(CommandResult{1, "The requested operation requires "
                                        "elevation.\n"}));
  EXPECT_CALL(runner, run(ElementsAre(_, _, _, "show", "v4tov4")))
      .WillOnce(Return(CommandResult{0, V4_TABLE}));

  NetshForwardingStore store(runner, "netsh.exe");
  EXPECT_THROW(store.remove(ForwardingFamily::V4_TO_V4, "0.0.0.0", 3000),
               CommandError);
}

TEST(NetshForwardingStoreTests, FailedRelistKeepsDeleteError) {
  MockCommandRunner runner;
  EXPECT_CALL(runner, run(ElementsAre(_, _, _, "delete", _, _, _)))
      .WillOnce(Return(CommandResult{1, "The requested operation requires "
                                        "elevation.\n"}));
  EXPECT_CALL(runner, run(ElementsAre(_, _, _, "show", "v4tov4")))
      .WillOnce(Return(CommandResult{1, "netsh is unavailable\n"}));

  NetshForwardingStore store(runner, "netsh.exe");
  try {
    store.remove(ForwardingFamily::V4_TO_V4, "0.0.0.0", 3000);
    FAIL() << "expected CommandError";
  } catch (const CommandError &error) {
    EXPECT_THAT(error.command(), ::testing::HasSubstr("delete"));
    EXPECT_THAT(error.output(), ::testing::HasSubstr("elevation"));
  }
}

TEST(NetshForwardingStoreTests, SuccessfulDeleteSkipsListing) {
  MockCommandRunner runner;
  EXPECT_CALL(runner, run(ElementsAre(_, _, _, "delete", _, _, _)))
      .WillOnce(Return(CommandResult{0, "\n"}));

  NetshForwardingStore store(runner, "netsh.exe");
  EXPECT_TRUE(store.remove(ForwardingFamily::V4_TO_V4, "0.0.0.0", 3000));
}

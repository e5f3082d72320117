#include "AddressResolver.hpp"
#include "Errors.hpp"
#include "Mocks.hpp"
#include "WslGuestQuery.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

using ::testing::_;
using ::testing::ElementsAre;
using ::testing::Return;
using ::testing::Throw;

TEST(AddressResolverTests, PrimaryLookupFirstIpv4Token) {
  MockGuestQuery query;
  EXPECT_CALL(query, listInterfaces("Ubuntu"))
      .WillOnce(Return("172.20.10.5 172.17.0.1 fe80::215:5dff:fe4a:1\n"));
  EXPECT_CALL(query, interfaceDetail(_, _)).Times(0);

  AddressResolver resolver(query, "eth0");
  EXPECT_EQ(resolver.resolve("Ubuntu"), "172.20.10.5");
}

TEST(AddressResolverTests, FallbackStripsPrefixLength) {
  MockGuestQuery query;
  EXPECT_CALL(query, listInterfaces("Ubuntu")).WillOnce(Return("\n"));
  EXPECT_CALL(query, interfaceDetail("Ubuntu", "eth0"))
      .WillOnce(Return(
          "6: eth0: <BROADCAST,MULTICAST,UP,LOWER_UP> mtu 1500 qdisc mq\n"
          "    inet 172.28.144.3/20 brd 172.28.159.255 scope global eth0\n"
          "       valid_lft forever preferred_lft forever\n"));

  AddressResolver resolver(query, "eth0");
  EXPECT_EQ(resolver.resolve("Ubuntu"), "172.28.144.3");
}

TEST(AddressResolverTests, FallbackUsedWhenPrimaryFailsToRun) {
  MockGuestQuery query;
  EXPECT_CALL(query, listInterfaces("Debian"))
      .WillOnce(Throw(CommandError("wsl.exe -d Debian -- hostname -I", 1,
                                   "hostname: invalid option -- 'I'")));
  EXPECT_CALL(query, interfaceDetail("Debian", "eth1"))
      .WillOnce(Return("inet 10.0.0.7/24 scope global eth1"));

  AddressResolver resolver(query, "eth1");
  EXPECT_EQ(resolver.resolve("Debian"), "10.0.0.7");
}

TEST(AddressResolverTests, BothLookupsEmptyIsResolutionError) {
  MockGuestQuery query;
  EXPECT_CALL(query, listInterfaces(_)).WillOnce(Return(""));
  EXPECT_CALL(query, interfaceDetail(_, _))
      .WillOnce(Return("Device \"eth0\" does not exist."));

  AddressResolver resolver(query, "eth0");
  EXPECT_THROW(resolver.resolve("Ubuntu"), ResolutionError);
}

TEST(AddressResolverTests, FallbackFailingToRunIsResolutionError) {
  MockGuestQuery query;
  EXPECT_CALL(query, listInterfaces(_)).WillOnce(Return("::1"));
  EXPECT_CALL(query, interfaceDetail(_, _))
      .WillOnce(Throw(CommandError("ip", 1, "no such distribution")));

  AddressResolver resolver(query, "eth0");
  try {
    resolver.resolve("Missing");
    FAIL() << "expected ResolutionError";
  } catch (const ResolutionError &error) {
    EXPECT_EQ(error.guest(), "Missing");
    EXPECT_THAT(error.what(), ::testing::HasSubstr("no address found"));
  }
}

TEST(AddressResolverTests, Ipv4TokenMustBeWholeDottedQuad) {
  EXPECT_EQ(AddressResolver::firstIpv4Token("1.2.3 1.2.3.4.5 x10.0.0.1"),
            std::nullopt);
  EXPECT_EQ(AddressResolver::firstIpv4Token("1234.1.1.1 10.1.2.3"),
            "10.1.2.3");
  // no octet range check
  EXPECT_EQ(AddressResolver::firstIpv4Token("999.1.1.1"), "999.1.1.1");
  // a prefixed address is not a bare dotted quad
  EXPECT_EQ(AddressResolver::firstIpv4Token("inet 10.1.2.3/20"),
            std::nullopt);
}

TEST(AddressResolverTests, CidrTokenNeedsPrefixLength) {
  EXPECT_EQ(AddressResolver::firstCidrToken("inet 10.1.2.3 brd"),
            std::nullopt);
  EXPECT_EQ(AddressResolver::firstCidrToken("inet 10.1.2.3/ brd"),
            std::nullopt);
  EXPECT_EQ(AddressResolver::firstCidrToken("a 192.168.1.20/24 b 10.0.0.1/8"),
            "192.168.1.20");
}

TEST(WslGuestQueryTests, RunsCommandsInsideTheDistribution) {
  MockCommandRunner runner;
  EXPECT_CALL(runner, run(ElementsAre("wsl.exe", "-d", "Ubuntu", "--",
                                      "hostname", "-I")))
      .WillOnce(Return(CommandResult{0, "172.20.10.5 \n"}));
  EXPECT_CALL(runner, run(ElementsAre("wsl.exe", "-d", "Ubuntu", "--", "ip",
                                      "-4", "addr", "show", "eth0")))
      .WillOnce(Return(CommandResult{1, "Device \"eth0\" does not exist.\n"}));

  WslGuestQuery query(runner, "wsl.exe");
  EXPECT_EQ(query.listInterfaces("Ubuntu"), "172.20.10.5 \n");
  EXPECT_THROW(query.interfaceDetail("Ubuntu", "eth0"), CommandError);
}

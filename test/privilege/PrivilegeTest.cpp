#include "Errors.hpp"
#include "Mocks.hpp"
#include "PrivilegeCheck.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

using ::testing::_;
using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::Return;

TEST(PrivilegeCheckTests, AdministratorPasses) {
  MockCommandRunner runner;
  EXPECT_CALL(runner, run(ElementsAre("powershell.exe", _, _, _,
                                      HasSubstr("IsInRole"))))
      .WillOnce(Return(CommandResult{0, "True\n"}));

  PowerShell powershell(runner, "powershell.exe");
  WindowsAdminCheck check(powershell);
  EXPECT_NO_THROW(check.require());
}

TEST(PrivilegeCheckTests, NonAdministratorIsPrivilegeError) {
  MockCommandRunner runner;
  EXPECT_CALL(runner, run(_)).WillOnce(Return(CommandResult{0, "False\n"}));

  PowerShell powershell(runner, "powershell.exe");
  WindowsAdminCheck check(powershell);
  EXPECT_THROW(check.require(), PrivilegeError);
}

TEST(PrivilegeCheckTests, UnanswerableCheckIsPrivilegeError) {
  MockCommandRunner runner;
  EXPECT_CALL(runner, run(_))
      .WillOnce(Return(CommandResult{127, "powershell.exe: not found\n"}));

  PowerShell powershell(runner, "powershell.exe");
  WindowsAdminCheck check(powershell);
  EXPECT_THROW(check.require(), PrivilegeError);
}

#include <cstdlib>
#include <gtest/gtest.h>

#include <pintrust/config.hpp>
#include <pintrust/error_code.hpp>

using namespace pintrust;

TEST(ConfigTest, DefaultTrustFile)
{
    ::unsetenv("PINTRUST_CFG_DIR");
    ASSERT_EQ(config::DefaultTrustFile(), "/etc/pintrust/depot-trust.json");

    ::setenv("PINTRUST_CFG_DIR", "", 1);
    ASSERT_EQ(config::DefaultTrustFile(), "/etc/pintrust/depot-trust.json");

    ::setenv("PINTRUST_CFG_DIR", "/opt/depot/cfg", 1);
    ASSERT_EQ(config::DefaultTrustFile(), "/opt/depot/cfg/pintrust/depot-trust.json");

    ::unsetenv("PINTRUST_CFG_DIR");
}

TEST(ConfigTest, TrustFileMode)
{
    ASSERT_EQ(config::kTrustFileMode, 0644U);
}

TEST(ErrorCodeTest, Messages)
{
    auto ec = MakeErrorCode(Error::StoreWriteError);
    ASSERT_STREQ(ec.category().name(), "pintrust");
    ASSERT_EQ(ec.message(), "unable to write trust store");
    ASSERT_TRUE(ec);
    ASSERT_FALSE(MakeErrorCode(Error::No));
}

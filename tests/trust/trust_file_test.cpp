#include <filesystem>
#include <sys/stat.h>
#include <gtest/gtest.h>

#include <pintrust/exception.hpp>
#include <pintrust/trust/trust_file.hpp>

#include "../common/test_helpers.hpp"

using namespace pintrust;
using namespace pintrust::trust;

class TrustFileTest : public testing::Test
{
protected:
    test::TempDir dir_;
    test::LogCapture log_;
};

TEST_F(TrustFileTest, LoadMissingFile)
{
    TrustFile file(dir_.file("trust.json"));

    ASSERT_FALSE(file.exists());

    TrustStore store;
    ASSERT_NO_THROW(store = file.load());
    ASSERT_TRUE(store.empty());
    ASSERT_TRUE(log_.contains("doesn't exist at " + file.path()));
    ASSERT_FALSE(file.exists());
}

TEST_F(TrustFileTest, SaveAndLoad)
{
    TrustFile file(dir_.file("trust.json"));

    TrustStore store;
    store.pin("https://a.example", "-----BEGIN CERTIFICATE-----\nMIIB\n-----END CERTIFICATE-----\n");
    store.disable("https://b.example");

    ASSERT_NO_THROW(file.save(store));
    ASSERT_TRUE(file.exists());
    ASSERT_TRUE(log_.contains("Storing trust to " + file.path()));

    ASSERT_EQ(test::ReadFile(file.path()),
              "{\n"
              "   \"https://a.example\": \"-----BEGIN CERTIFICATE-----\\nMIIB\\n-----END CERTIFICATE-----\\n\",\n"
              "   \"https://b.example\": \"AnyCertificate\"\n"
              "}");

    TrustStore loaded;
    ASSERT_NO_THROW(loaded = file.load());
    ASSERT_TRUE(loaded == store);
    ASSERT_TRUE(log_.contains("Loading trust from " + file.path()));
}

TEST_F(TrustFileTest, SaveEmptyStore)
{
    TrustFile file(dir_.file("trust.json"));

    ASSERT_NO_THROW(file.save(TrustStore()));
    ASSERT_EQ(test::ReadFile(file.path()), "{}");
    ASSERT_EQ(test::FileMode(file.path()), 0644U);
}

TEST_F(TrustFileTest, SaveResetsMode)
{
    TrustFile file(dir_.file("trust.json"));

    for (mode_t mode : {0600, 0666, 0777, 0400})
    {
        test::WriteFile(file.path(), "{}", mode);
        ASSERT_EQ(test::FileMode(file.path()), mode);

        ASSERT_NO_THROW(file.save(TrustStore()));
        ASSERT_EQ(test::FileMode(file.path()), 0644U) << std::oct << mode;
    }
}

TEST_F(TrustFileTest, SaveReplacesSymlink)
{
    const auto target = dir_.file("target.json");
    test::WriteFile(target, "{}", 0600);

    TrustFile file(dir_.file("trust.json"));
    std::filesystem::create_symlink(target, file.path());

    TrustStore store;
    store.disable("https://a.example");
    ASSERT_NO_THROW(file.save(store));

    ASSERT_FALSE(std::filesystem::is_symlink(file.path()));
    ASSERT_TRUE(std::filesystem::is_regular_file(file.path()));
    ASSERT_EQ(test::FileMode(file.path()), 0644U);
    ASSERT_EQ(test::ReadFile(target), "{}");
    ASSERT_EQ(test::FileMode(target), 0600U);
}

TEST_F(TrustFileTest, SaveIgnoresUmask)
{
    TrustFile file(dir_.file("trust.json"));

    auto previous = ::umask(0077);
    file.save(TrustStore());
    ::umask(previous);

    ASSERT_EQ(test::FileMode(file.path()), 0644U);
}

TEST_F(TrustFileTest, SaveLeavesNoTemporaryFiles)
{
    TrustFile file(dir_.file("trust.json"));
    file.save(TrustStore());
    file.save(TrustStore());

    std::size_t count{0};
    for (const auto& entry : std::filesystem::directory_iterator(dir_.path()))
    {
        ASSERT_EQ(entry.path().filename().string(), "trust.json");
        ++count;
    }
    ASSERT_EQ(count, 1U);
}

TEST_F(TrustFileTest, SaveToMissingDirectory)
{
    TrustFile file(dir_.file("missing/trust.json"));

    try
    {
        file.save(TrustStore());
        FAIL() << "saved to a missing directory";
    }
    catch (const Exception& e)
    {
        ASSERT_EQ(e.code(), MakeErrorCode(Error::StoreWriteError));
    }
}

TEST_F(TrustFileTest, SaveOverDirectory)
{
    TrustFile file(dir_.file("trust.json"));
    std::filesystem::create_directories(std::filesystem::path(file.path()) / "nested");

    ASSERT_THROW(file.save(TrustStore()), Exception);
    ASSERT_TRUE(std::filesystem::is_directory(file.path()));

    std::size_t count{0};
    for (const auto& entry : std::filesystem::directory_iterator(dir_.path()))
    {
        ASSERT_EQ(entry.path().filename().string(), "trust.json");
        ++count;
    }
    ASSERT_EQ(count, 1U);
}

TEST_F(TrustFileTest, LoadNull)
{
    TrustFile file(dir_.file("trust.json"));
    test::WriteFile(file.path(), "null");

    TrustStore store;
    ASSERT_NO_THROW(store = file.load());
    ASSERT_TRUE(store.empty());
}

TEST_F(TrustFileTest, LoadMalformed)
{
    TrustFile file(dir_.file("trust.json"));

    for (auto content : {"", "{", "not json", "[]", "{\"https://a.example\": 1}"})
    {
        test::WriteFile(file.path(), content);
        try
        {
            file.load();
            FAIL() << "loaded '" << content << "'";
        }
        catch (const Exception& e)
        {
            ASSERT_EQ(e.code(), MakeErrorCode(Error::StoreReadError)) << content;
        }
    }
}

TEST_F(TrustFileTest, LoadDirectory)
{
    TrustFile file(dir_.path().string());

    ASSERT_TRUE(file.exists());
    ASSERT_THROW(file.load(), Exception);
}

TEST_F(TrustFileTest, SaveInvalidUtf8Url)
{
    TrustFile file(dir_.file("trust.json"));
    test::WriteFile(file.path(), "{}");

    TrustStore store;
    store.disable("https://h/caf\xe9");

    try
    {
        file.save(store);
        FAIL() << "saved a key that is not UTF-8";
    }
    catch (const Exception& e)
    {
        ASSERT_EQ(e.code(), MakeErrorCode(Error::StoreWriteError));
    }

    ASSERT_EQ(test::ReadFile(file.path()), "{}");

    std::size_t count{0};
    for (const auto& entry : std::filesystem::directory_iterator(dir_.path()))
    {
        ASSERT_EQ(entry.path().filename().string(), "trust.json");
        ++count;
    }
    ASSERT_EQ(count, 1U);
}

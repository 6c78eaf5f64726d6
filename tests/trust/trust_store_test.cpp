#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <pintrust/exception.hpp>
#include <pintrust/trust/trust_store.hpp>

using namespace pintrust;
using namespace pintrust::trust;

static const std::string kPem = "-----BEGIN CERTIFICATE-----\nMIIB\n-----END CERTIFICATE-----\n";

TEST(TrustStoreTest, Empty)
{
    TrustStore store;
    ASSERT_TRUE(store.empty());
    ASSERT_EQ(store.find("https://a.example"), nullptr);
    ASSERT_FALSE(store.isPinned("https://a.example"));
    ASSERT_FALSE(store.isDisabled("https://a.example"));
    ASSERT_FALSE(store.erase("https://a.example"));
}

TEST(TrustStoreTest, PinAndDisableReplaceEachOther)
{
    TrustStore store;

    store.pin("https://a.example", kPem);
    ASSERT_TRUE(store.isPinned("https://a.example"));
    ASSERT_EQ(std::get<Pinned>(*store.find("https://a.example")).pem, kPem);

    store.disable("https://a.example");
    ASSERT_TRUE(store.isDisabled("https://a.example"));
    ASSERT_FALSE(store.isPinned("https://a.example"));

    store.pin("https://a.example", "other");
    ASSERT_EQ(store.size(), 1U);
    ASSERT_EQ(std::get<Pinned>(*store.find("https://a.example")).pem, "other");
}

TEST(TrustStoreTest, KeysAreNotNormalized)
{
    TrustStore store;
    store.pin("https://a.example", kPem);
    store.disable("https://a.example/");
    store.disable("HTTPS://a.example");

    ASSERT_EQ(store.size(), 3U);
    ASSERT_TRUE(store.isPinned("https://a.example"));
    ASSERT_TRUE(store.isDisabled("https://a.example/"));

    ASSERT_TRUE(store.erase("https://a.example/"));
    ASSERT_EQ(store.size(), 2U);
}

TEST(TrustStoreTest, ToJson)
{
    TrustStore store;
    store.pin("https://b.example", kPem);
    store.disable("https://a.example");

    auto json = store.toJson();
    ASSERT_TRUE(json.is_object());
    ASSERT_EQ(json.size(), 2U);
    ASSERT_EQ(json["https://a.example"], "AnyCertificate");
    ASSERT_EQ(json["https://b.example"], kPem);

    ASSERT_EQ(TrustStore().toJson().dump(), "{}");
}

TEST(TrustStoreTest, FromJson)
{
    auto json = nlohmann::json::parse(R"({
       "https://a.example": "AnyCertificate",
       "https://b.example": "-----BEGIN CERTIFICATE-----\nMIIB\n-----END CERTIFICATE-----\n"
    })");

    auto store = TrustStore::fromJson(json);
    ASSERT_EQ(store.size(), 2U);
    ASSERT_TRUE(store.isDisabled("https://a.example"));
    ASSERT_TRUE(store.isPinned("https://b.example"));
    ASSERT_EQ(std::get<Pinned>(*store.find("https://b.example")).pem, kPem);
    ASSERT_TRUE(TrustStore::fromJson(store.toJson()) == store);
}

TEST(TrustStoreTest, FromNull)
{
    ASSERT_TRUE(TrustStore::fromJson(nlohmann::json()).empty());
}

TEST(TrustStoreTest, FromInvalidJson)
{
    const char* invalid[] = {
        R"([])",
        R"("AnyCertificate")",
        R"(42)",
        R"({"https://a.example": 1})",
        R"({"https://a.example": null})",
        R"({"https://a.example": ["pem"]})",
    };

    for (auto text : invalid)
    {
        try
        {
            TrustStore::fromJson(nlohmann::json::parse(text));
            FAIL() << "decoded " << text;
        }
        catch (const Exception& e)
        {
            ASSERT_EQ(e.code(), MakeErrorCode(Error::StoreReadError)) << text;
        }
    }
}

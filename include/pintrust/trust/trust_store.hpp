/// @file
/// @brief In-memory set of trust entries keyed by URL.

#pragma once
#include <cstddef>
#include <map>
#include <string>
#include <string_view>

#include <nlohmann/json_fwd.hpp>

#include <pintrust/trust/trust_entry.hpp>

namespace pintrust::trust
{

/// @brief Maps URLs to their trust entries.
///
/// Keys are stored exactly as given, so `https://host` and `https://host/`
/// are different entries. Entries are replaced whole.
class TrustStore final
{
public:
    using Container = std::map<std::string, TrustEntry, std::less<>>;
    using ConstIterator = Container::const_iterator;

    TrustStore() = default;
    ~TrustStore() = default;

    /// @brief Looks up the entry for @p url.
    /// @return Entry pointer, or nullptr when @p url is unknown.
    const TrustEntry* find(std::string_view url) const;

    bool isPinned(std::string_view url) const;

    bool isDisabled(std::string_view url) const;

    /// @brief Sets a Pinned entry for @p url, replacing any previous one.
    void pin(const std::string& url, std::string pem);

    /// @brief Sets a TrustDisabled entry for @p url, replacing any previous one.
    void disable(const std::string& url);

    /// @return True if an entry was removed.
    bool erase(std::string_view url);

    void clear() noexcept;

    std::size_t size() const noexcept;

    bool empty() const noexcept;

    ConstIterator begin() const noexcept;

    ConstIterator end() const noexcept;

    bool operator==(const TrustStore& other) const
    {
        return entries_ == other.entries_;
    }

    /// @brief Encodes the store as a JSON object of URL to certificate or marker.
    nlohmann::json toJson() const;

    /// @brief Decodes a JSON document produced by toJson().
    ///
    /// `null` gives an empty store.
    ///
    /// @throw pintrust::Exception with Error::StoreReadError if @p json is not
    /// an object or holds a non-string value.
    static TrustStore fromJson(const nlohmann::json& json);

private:
    Container entries_;
};

} // namespace pintrust::trust

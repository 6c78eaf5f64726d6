#include <nlohmann/json.hpp>

#include <pintrust/config.hpp>
#include <pintrust/exception.hpp>
#include <pintrust/trust/trust_store.hpp>

namespace pintrust::trust
{

const TrustEntry* TrustStore::find(std::string_view url) const
{
    auto it = entries_.find(url);
    return it != entries_.end() ? &it->second : nullptr;
}

bool TrustStore::isPinned(std::string_view url) const
{
    auto entry = find(url);
    return entry != nullptr && std::holds_alternative<Pinned>(*entry);
}

bool TrustStore::isDisabled(std::string_view url) const
{
    auto entry = find(url);
    return entry != nullptr && std::holds_alternative<TrustDisabled>(*entry);
}

void TrustStore::pin(const std::string& url, std::string pem)
{
    entries_.insert_or_assign(url, Pinned{std::move(pem)});
}

void TrustStore::disable(const std::string& url)
{
    entries_.insert_or_assign(url, TrustDisabled{});
}

bool TrustStore::erase(std::string_view url)
{
    auto it = entries_.find(url);
    if (it == entries_.end())
    {
        return false;
    }
    entries_.erase(it);
    return true;
}

void TrustStore::clear() noexcept
{
    entries_.clear();
}

std::size_t TrustStore::size() const noexcept
{
    return entries_.size();
}

bool TrustStore::empty() const noexcept
{
    return entries_.empty();
}

TrustStore::ConstIterator TrustStore::begin() const noexcept
{
    return entries_.begin();
}

TrustStore::ConstIterator TrustStore::end() const noexcept
{
    return entries_.end();
}

nlohmann::json TrustStore::toJson() const
{
    auto json = nlohmann::json::object();
    for (const auto& [url, entry] : entries_)
    {
        if (std::holds_alternative<TrustDisabled>(entry))
        {
            json[url] = std::string(config::kDisabledMarker);
        }
        else
        {
            json[url] = std::get<Pinned>(entry).pem;
        }
    }
    return json;
}

TrustStore TrustStore::fromJson(const nlohmann::json& json)
{
    TrustStore store;
    if (json.is_null())
    {
        return store;
    }

    ThrowIfTrue(!json.is_object(), Error::StoreReadError,
                std::string("expected an object, found ") + json.type_name());

    for (auto it = json.begin(); it != json.end(); ++it)
    {
        const auto& url = it.key();
        const auto& value = it.value();
        ThrowIfTrue(!value.is_string(), Error::StoreReadError,
                    "value for '" + url + "' is not a string");

        auto text = value.get<std::string>();
        if (text == config::kDisabledMarker)
        {
            store.disable(url);
        }
        else
        {
            store.pin(url, std::move(text));
        }
    }
    return store;
}

} // namespace pintrust::trust

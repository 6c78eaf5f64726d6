/// @file
/// @brief Persistence of the trust store.

#pragma once
#include <string>
#include <pintrust/trust/trust_store.hpp>

namespace pintrust::trust
{

/// @brief JSON file backing a TrustStore.
class TrustFile final
{
public:
    explicit TrustFile(std::string path);

    ~TrustFile() = default;

    const std::string& path() const noexcept
    {
        return path_;
    }

    bool exists() const;

    /// @brief Reads the store, an absent file gives an empty store.
    ///
    /// @throw pintrust::Exception with Error::StoreReadError.
    TrustStore load() const;

    /// @brief Replaces the file content with @p store.
    ///
    /// Data goes to a temporary file next to the target which then gets the
    /// trust file mode and is renamed over the target. The target is thus a
    /// new regular file owned by the caller: a symbolic link at @p path is
    /// replaced, not followed, and previous ownership is not kept.
    ///
    /// @throw pintrust::Exception with Error::StoreWriteError.
    void save(const TrustStore& store) const;

private:
    std::string path_;
};

} // namespace pintrust::trust

#include <cerrno>
#include <filesystem>
#include <fstream>
#include <vector>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <casket/log/log_manager.hpp>
#include <casket/utils/error_code.hpp>
#include <casket/utils/noncopyable.hpp>
#include <nlohmann/json.hpp>

#include <pintrust/config.hpp>
#include <pintrust/exception.hpp>
#include <pintrust/trust/trust_file.hpp>

namespace fs = std::filesystem;

namespace pintrust::trust
{

namespace
{

// Temporary file created next to the target, removed unless committed.
class TempFile final : public casket::NonCopyable
{
public:
    explicit TempFile(const fs::path& target)
        : fd_(-1)
        , committed_(false)
    {
        auto dir = target.parent_path();
        if (dir.empty())
        {
            dir = ".";
        }

        auto pattern = (dir / ("." + target.filename().string() + ".XXXXXX")).string();
        std::vector<char> buffer(pattern.begin(), pattern.end());
        buffer.push_back('\0');

        fd_ = ::mkstemp(buffer.data());
        ThrowIfTrue(fd_ < 0, Error::StoreWriteError,
                    "unable to create temporary file in " + dir.string() + ": " +
                        casket::GetLastSystemError().message());
        path_ = buffer.data();
    }

    ~TempFile() noexcept
    {
        close();
        if (!committed_)
        {
            ::unlink(path_.c_str());
        }
    }

    void write(const std::string& data)
    {
        std::size_t written{0};
        while (written < data.size())
        {
            auto ret = ::write(fd_, data.data() + written, data.size() - written);
            if (ret < 0 && errno == EINTR)
            {
                continue;
            }
            ThrowIfTrue(ret < 0, Error::StoreWriteError,
                        "unable to write " + path_ + ": " + casket::GetLastSystemError().message());
            written += static_cast<std::size_t>(ret);
        }
    }

    void setMode(mode_t mode)
    {
        ThrowIfTrue(::fchmod(fd_, mode) < 0, Error::StoreWriteError,
                    "unable to change mode of " + path_ + ": " +
                        casket::GetLastSystemError().message());
    }

    void commit(const fs::path& target)
    {
        ThrowIfTrue(::fsync(fd_) < 0, Error::StoreWriteError,
                    "unable to flush " + path_ + ": " + casket::GetLastSystemError().message());
        close();

        ThrowIfTrue(::rename(path_.c_str(), target.c_str()) < 0, Error::StoreWriteError,
                    "unable to replace " + target.string() + ": " +
                        casket::GetLastSystemError().message());
        committed_ = true;
    }

private:
    void close() noexcept
    {
        if (fd_ >= 0)
        {
            ::close(fd_);
            fd_ = -1;
        }
    }

    int fd_;
    bool committed_;
    std::string path_;
};

} // namespace

TrustFile::TrustFile(std::string path)
    : path_(std::move(path))
{
}

bool TrustFile::exists() const
{
    std::error_code ec;
    return fs::exists(path_, ec);
}

TrustStore TrustFile::load() const
{
    if (!exists())
    {
        casket::info("Trust doesn't exist at {}, using empty trust", path_);
        return TrustStore();
    }

    casket::info("Loading trust from {}", path_);

    std::ifstream file(path_);
    ThrowIfTrue(!file.is_open(), Error::StoreReadError,
                "unable to open " + path_ + ": " + casket::GetLastSystemError().message());

    nlohmann::json json;
    try
    {
        json = nlohmann::json::parse(file);
    }
    catch (const nlohmann::json::exception& e)
    {
        throw Exception(Error::StoreReadError, "malformed trust file " + path_ + ": " + e.what());
    }

    return TrustStore::fromJson(json);
}

void TrustFile::save(const TrustStore& store) const
{
    casket::info("Storing trust to {}", path_);

    std::string content;
    try
    {
        content = store.toJson().dump(config::kTrustFileIndent);
    }
    catch (const nlohmann::json::exception& e)
    {
        throw Exception(Error::StoreWriteError, "unable to encode trust for " + path_ + ": " + e.what());
    }

    fs::path target(path_);
    TempFile temp(target);
    temp.write(content);
    temp.setMode(config::kTrustFileMode);
    temp.commit(target);

    casket::debug("Wrote {} entries to {}", store.size(), path_);
}

} // namespace pintrust::trust

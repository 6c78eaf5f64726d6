#pragma once
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <sys/stat.h>
#include <unistd.h>

#include <gtest/gtest.h>
#include <casket/log/log_manager.hpp>

namespace pintrust::test
{

/// @brief Collects what the console logger prints while it is alive.
class LogCapture final
{
public:
    explicit LogCapture(casket::Level level = casket::Level::Debug)
    {
        casket::LogManager::Instance().enable(casket::Type::Console);
        casket::LogManager::Instance().setLevel(level);
        start();
    }

    ~LogCapture()
    {
        stop();
    }

    bool contains(std::string_view text)
    {
        stop();
        start();
        return output_.find(text) != std::string::npos;
    }

    const std::string& output()
    {
        stop();
        start();
        return output_;
    }

private:
    void start()
    {
        testing::internal::CaptureStdout();
        testing::internal::CaptureStderr();
    }

    void stop()
    {
        std::cout.flush();
        std::cerr.flush();
        output_ += testing::internal::GetCapturedStdout();
        output_ += testing::internal::GetCapturedStderr();
    }

    std::string output_;
};

/// @brief Unique directory removed with its content on destruction.
class TempDir final
{
public:
    TempDir()
    {
        auto pattern = (std::filesystem::temp_directory_path() / "pintrust-test-XXXXXX").string();
        std::vector<char> buffer(pattern.begin(), pattern.end());
        buffer.push_back('\0');
        if (::mkdtemp(buffer.data()) == nullptr)
        {
            throw std::runtime_error("mkdtemp failed");
        }
        path_ = buffer.data();
    }

    ~TempDir()
    {
        std::error_code ec;
        std::filesystem::permissions(path_, std::filesystem::perms::owner_all,
                                     std::filesystem::perm_options::add, ec);
        std::filesystem::remove_all(path_, ec);
    }

    std::string file(const std::string& name) const
    {
        return (path_ / name).string();
    }

    const std::filesystem::path& path() const
    {
        return path_;
    }

private:
    std::filesystem::path path_;
};

inline std::string ReadFile(const std::string& path)
{
    std::ifstream file(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}

inline void WriteFile(const std::string& path, const std::string& content, mode_t mode = 0644)
{
    {
        std::ofstream file(path, std::ios::binary | std::ios::trunc);
        file << content;
    }
    ::chmod(path.c_str(), mode);
}

inline mode_t FileMode(const std::string& path)
{
    struct stat st{};
    if (::stat(path.c_str(), &st) != 0)
    {
        return 0;
    }
    return st.st_mode & 07777;
}

} // namespace pintrust::test

#pragma once
#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

#include <sys/stat.h>

namespace pintrust::config
{

/// Value stored in place of a certificate to skip trust establishment.
static constexpr std::string_view kDisabledMarker{"AnyCertificate"};

/// Only URLs with this scheme (compared case-insensitively) need trust.
static constexpr std::string_view kSecureScheme{"https://"};

static constexpr std::uint16_t kDefaultHttpsPort{443};

static constexpr std::chrono::seconds kFetchTimeout{10};

/// Largest accepted `--timeout` value.
static constexpr std::chrono::seconds kMaxFetchTimeout{3600};

/// Owner read-write, group and others read-only.
static constexpr mode_t kTrustFileMode{S_IRUSR | S_IWUSR | S_IRGRP | S_IROTH};

/// Indentation of the JSON trust file.
static constexpr int kTrustFileIndent{3};

/// Environment variable naming the configuration root directory.
static constexpr std::string_view kConfigDirEnv{"PINTRUST_CFG_DIR"};

static constexpr std::string_view kTrustFileName{"depot-trust.json"};

/// @brief Trust file used when none is given on the command line.
///
/// `$PINTRUST_CFG_DIR/pintrust/depot-trust.json` when the variable is set
/// and not empty, `/etc/pintrust/depot-trust.json` otherwise.
std::string DefaultTrustFile();

} // namespace pintrust::config

#pragma once
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "remote/iremote_mover.hpp"

namespace config
{

struct Settings
{
    std::string              root;
    std::uint64_t            chunk_size = 0;  // filled from constants by defaults()
    std::string              sidecar;
    std::vector<std::string> skip_extensions;
    std::string              mover;  // "rclone" or "mirror"
    std::string              rclone_program;
    std::string              remote_service;
    std::string              remote_dest;
    std::string              mirror_root;
    std::optional<int>       finish_hour;
    int                      min_free_percent = 0;
    std::string              log_level;
    std::string              log_file;
};

Settings defaults();

// Overlays CHUNKSYNC_* environment variables. Returns an error text for unparsable values.
std::optional<std::string> apply_env(Settings &s);

// Overlays one "--flag value" option. Returns false for an unknown flag or bad value
// (`err` says why); `consumed` is the number of argv slots used.
bool apply_flag(Settings &s, const std::string &flag, const char *value, int &consumed, std::string &err);

// Startup checks: chunk size > 0, root is an existing directory, mover known.
std::optional<std::string> validate(const Settings &s, bool need_root);

// Accepts plain bytes or a K/M/G suffix (decimal: 1M = 1000000).
std::optional<std::uint64_t> parse_size(const std::string &text);

std::vector<std::string> split_list(const std::string &text);

// The mover named by `s.mover`; call validate() first.
std::unique_ptr<remote::IRemoteMover> make_mover(const Settings &s);

}  // namespace config

#pragma once
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include <sodium.h>

namespace digest
{

constexpr std::size_t DIGEST_SIZE = 32;  // crypto_generichash_BYTES

// Streaming BLAKE2b-256 over an arbitrary byte stream.
// If libsodium cannot be initialised the hash is not ok(): updates are dropped and
// hex_final() returns an empty string.
class Blake2b
{
  public:
    Blake2b();

    bool        ok() const { return ready_; }
    void        update(const void *data, std::size_t size);
    std::string hex_final();

  private:
    crypto_generichash_state state_{};
    bool                     ready_{false};
    bool                     finished_{false};
};

// nullopt when the file cannot be read to the end.
std::optional<std::string> file_hex(const std::filesystem::path &path);

}  // namespace digest

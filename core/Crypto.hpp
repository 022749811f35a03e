#pragma once

#include <string>

namespace ward {

// Random version 4 UUID from OpenSSL's CSPRNG. Empty if RAND_bytes fails.
std::string GenerateUUID();

// Lowercase hex SHA-256 of data. Empty on digest failure.
std::string Sha256Hex(const std::string& data);

std::string FileSha256Hex(const std::string& file_path);

} // namespace ward

#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace blobstream::util {

/*
  UUID helpers

  Blob ids are raw 16 byte RFC4122 version 4 UUIDs, rendered in the
  canonical 8-4-4-4-12 form when used in file names and headers.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);
UUID        FromString(const std::string& str);

// Canonical form check; rejects anything that could escape a directory.
bool IsCanonicalUUID(const std::string& str);

} // namespace blobstream::util

#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace assetxfer::util {

/*
  UUID helpers

  Used for process-unique temp/backup file names.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

// 32 lowercase hex characters, no dashes. Safe inside a file name.
std::string RandomToken();

} // namespace assetxfer::util

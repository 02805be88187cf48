#pragma once

#include <filesystem>
#include <string>

namespace zs::util {

// Upper-case hex SHA-256, the form the object API reports and accepts.
std::string sha256Hex(const std::string& data);
std::string sha256File(const std::filesystem::path& path);

}

#pragma once
#include <filesystem>
#include <cstdint>
#include <system_error>

namespace csvsa {

// 0 when the file is missing or unreadable.
inline std::uintmax_t file_size_bytes(const std::filesystem::path& p) {
    std::error_code ec;
    auto sz = std::filesystem::file_size(p, ec);
    return ec ? 0u : static_cast<std::uintmax_t>(sz);
}

inline bool is_readable_file(const std::filesystem::path& p) {
    std::error_code ec;
    return std::filesystem::is_regular_file(p, ec) && !ec;
}

}

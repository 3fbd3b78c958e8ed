#pragma once
#include <filesystem>
#include <fstream>
#include <vector>
#include <string>
#include <cstdint>

#include "util/errors.hpp"

namespace csvsa {

class chunk_reader {
public:
    chunk_reader(const std::filesystem::path& p, std::size_t chunk_bytes)
        : path_(p), buf_(chunk_bytes == 0 ? 262144 : chunk_bytes)
    {
        in_.open(path_, std::ios::binary);
        if (!in_) throw input_error("cannot open " + path_.string());
    }

    // Appends the next chunk to out; returns bytes read, 0 = EOF
    std::size_t append_next(std::string& out) {
        if (!in_) return 0;
        in_.read(buf_.data(), static_cast<std::streamsize>(buf_.size()));
        auto got = static_cast<std::size_t>(in_.gcount());
        if (in_.bad()) throw input_error("read failed on " + path_.string());
        out.append(buf_.data(), got);
        return got;
    }

private:
    std::filesystem::path path_;
    std::ifstream in_;
    std::vector<char> buf_;
};

inline std::string read_all_bytes(const std::filesystem::path& p, std::size_t chunk_bytes = 262144) {
    chunk_reader reader(p, chunk_bytes);
    std::string bytes;
    while (reader.append_next(bytes) > 0) {}
    return bytes;
}

}

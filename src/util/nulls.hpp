#pragma once
#include <string_view>
#include <string>
#include <vector>

#include "util/strings.hpp"

namespace csvsa {

inline std::vector<std::string> default_null_tokens() {
    return {"", "NA", "N/A", "null", "NULL", "NaN"};
}

// Null tokens match case-insensitively after trimming, so " na " is null too.
inline bool is_null_like(std::string_view s, const std::vector<std::string>& nulls) {
    const std::string_view t = trim_view(s);
    for (const auto& n : nulls) {
        if (ieq(t, n)) return true;
    }
    return false;
}

}

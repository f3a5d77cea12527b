#pragma once

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>
#include <vector>

namespace flatrig::strings {

inline std::string to_lower_copy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

inline std::string trim_copy(std::string_view value) {
    std::size_t start = 0;
    std::size_t end = value.size();

    while (start < end && std::isspace(static_cast<unsigned char>(value[start]))) {
        ++start;
    }
    while (end > start && std::isspace(static_cast<unsigned char>(value[end - 1]))) {
        --end;
    }

    return std::string(value.substr(start, end - start));
}

inline bool ends_with_ci(std::string_view value, std::string_view suffix) {
    if (suffix.size() > value.size()) {
        return false;
    }
    const std::size_t offset = value.size() - suffix.size();
    for (std::size_t i = 0; i < suffix.size(); ++i) {
        const auto lhs = std::tolower(static_cast<unsigned char>(value[offset + i]));
        const auto rhs = std::tolower(static_cast<unsigned char>(suffix[i]));
        if (lhs != rhs) {
            return false;
        }
    }
    return true;
}

// Splits on `delimiter`, trimming each piece and dropping empty ones.
inline std::vector<std::string> split_trimmed(std::string_view value, char delimiter) {
    std::vector<std::string> out;
    std::size_t start = 0;
    while (start <= value.size()) {
        const std::size_t pos = value.find(delimiter, start);
        const std::size_t end = (pos == std::string_view::npos) ? value.size() : pos;
        std::string piece = trim_copy(value.substr(start, end - start));
        if (!piece.empty()) {
            out.push_back(std::move(piece));
        }
        if (pos == std::string_view::npos) {
            break;
        }
        start = pos + 1;
    }
    return out;
}

}

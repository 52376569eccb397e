// src/core/env_loader.cpp

#include "portfolio_recon/core/env_loader.hpp"
#include <cstdlib>
#include <fstream>

namespace portfolio_recon {

namespace {

std::string trim(const std::string& text) {
    const char* whitespace = " \t\r\n";
    size_t begin = text.find_first_not_of(whitespace);
    if (begin == std::string::npos) {
        return "";
    }
    size_t end = text.find_last_not_of(whitespace);
    return text.substr(begin, end - begin + 1);
}

std::string strip_quotes(const std::string& value) {
    if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') &&
        value.back() == value.front()) {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

}  // namespace

Result<void> EnvLoader::load(const std::string& filepath, bool overwrite) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        return make_error<void>(ErrorCode::FILE_NOT_FOUND,
                                "Failed to open .env file: " + filepath, "EnvLoader");
    }

    std::string line;
    while (std::getline(file, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') {
            continue;
        }
        if (line.rfind("export ", 0) == 0) {
            line = trim(line.substr(7));
        }

        size_t delimiter_pos = line.find('=');
        if (delimiter_pos == std::string::npos) {
            continue;
        }

        std::string key = trim(line.substr(0, delimiter_pos));
        std::string value = strip_quotes(trim(line.substr(delimiter_pos + 1)));
        if (key.empty()) {
            continue;
        }

        if (setenv(key.c_str(), value.c_str(), overwrite ? 1 : 0) != 0) {
            return make_error<void>(ErrorCode::INVALID_DATA,
                                    "Failed to set environment variable: " + key, "EnvLoader");
        }
    }

    return Result<void>();
}

std::optional<std::string> EnvLoader::get(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (value == nullptr || *value == '\0') {
        return std::nullopt;
    }
    return std::string(value);
}

}  // namespace portfolio_recon

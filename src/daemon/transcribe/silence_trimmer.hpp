#pragma once

#include <expected>
#include <filesystem>
#include <string>

class SilenceTrimmer {
public:
    virtual ~SilenceTrimmer() = default;
    // Returns the input path when there is nothing to trim, otherwise a new
    // file owned by the caller.
    virtual std::expected<std::filesystem::path, std::string>
        trim(const std::filesystem::path& input) = 0;
};

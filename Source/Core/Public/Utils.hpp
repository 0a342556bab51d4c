#pragma once

#include "Expected.hpp"

#include <filesystem>
#include <fstream>
#include <string>

/// Reads a whole text file (script source) into a string.
static inline Result<std::string> read_file(const std::filesystem::path& filePath)
{
    std::ifstream file{filePath, std::ios::ate | std::ios::binary};

    if (!file.is_open())
    {
        return make_error("Failed to open file: " + filePath.string(), ErrorCode::FileReadFailed);
    }

    size_t fileSize = (size_t)file.tellg();
    std::string buffer(fileSize, '\0');

    file.seekg(0);
    file.read(buffer.data(), static_cast<std::streamsize>(fileSize));

    file.close();

    return buffer;
}

/**
 * @file AtomicFileWriter.hpp
 * @brief Writes whole files through a temp file and a rename.
 */

#pragma once

#include <filesystem>
#include <string>

namespace pioneer::infrastructure {

class AtomicFileWriter {
public:
    /**
     * @brief Writes content to path atomically (temp -> rename), creating parent
     *        directories as needed. Readers never observe a partial file.
     * @param error Receives a description on failure.
     * @return True on success.
     */
    static bool Write(const std::filesystem::path& path, const std::string& content, std::string& error);

    /** @brief Reads a whole file. Returns false if it cannot be opened. */
    static bool Read(const std::filesystem::path& path, std::string& content);
};

} // namespace pioneer::infrastructure

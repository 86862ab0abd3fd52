/* SPDX-FileCopyrightText: 2025 ReplLink Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/export.hpp"

#include <filesystem>
#include <fstream>
#include <optional>
#include <string>

namespace rpl::core {

    /**
     * @brief Convert filesystem path to UTF-8 string for logging and for text sent
     * to the interpreter. The native encoding on the supported platforms is UTF-8.
     */
    inline std::string path_to_utf8(const std::filesystem::path& p) {
        return p.string();
    }

    inline std::filesystem::path utf8_to_path(const std::string& utf8_str) {
        return std::filesystem::path(utf8_str);
    }

    inline bool open_file_for_read(const std::filesystem::path& path, std::ifstream& file) {
        file.open(path, std::ios::in | std::ios::binary);
        return file.is_open();
    }

    inline bool open_file_for_write(const std::filesystem::path& path, std::ofstream& file) {
        file.open(path, std::ios::out | std::ios::binary | std::ios::trunc);
        return file.is_open();
    }

    /**
     * @brief Resolve an executable the way a shell would.
     *
     * Names containing a directory separator are checked directly; bare names are
     * searched on PATH. Returns std::nullopt when nothing executable is found.
     */
    RPL_CORE_API std::optional<std::filesystem::path> find_executable(const std::string& name);

    /**
     * @brief Create a uniquely named file in the temp directory and write `content` to it.
     * @return The path of the new file, or std::nullopt if it could not be created.
     */
    RPL_CORE_API std::optional<std::filesystem::path> write_temp_file(const std::string& content,
                                                                      const std::string& suffix = ".py");

} // namespace rpl::core

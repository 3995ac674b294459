/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <filesystem>
#include <fstream>
#include <ac/file.hpp>

namespace ada_composer::file {
    uint8_vector read(const std::string &path)
    {
        std::ifstream is { path, std::ios::binary };
        if (!is)
            throw error_sys(fmt::format("failed to open {} for reading", path));
        const auto sz = std::filesystem::file_size(path);
        uint8_vector buf(sz);
        if (!is.read(reinterpret_cast<char *>(buf.data()), static_cast<std::streamsize>(sz)))
            throw error_sys(fmt::format("failed to read {} bytes from {}", sz, path));
        return buf;
    }

    void write(const std::string &path, const buffer data)
    {
        const std::filesystem::path p { path };
        if (p.has_parent_path())
            std::filesystem::create_directories(p.parent_path());
        // readers must never observe a partially written file
        const auto tmp_path = fmt::format("{}.tmp", path);
        {
            std::ofstream os { tmp_path, std::ios::binary | std::ios::trunc };
            if (!os)
                throw error_sys(fmt::format("failed to open {} for writing", tmp_path));
            if (!os.write(reinterpret_cast<const char *>(data.data()), static_cast<std::streamsize>(data.size())))
                throw error_sys(fmt::format("failed to write {} bytes to {}", data.size(), tmp_path));
        }
        std::filesystem::rename(tmp_path, p);
    }
}

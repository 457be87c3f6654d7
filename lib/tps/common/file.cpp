/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <cstdio>
#include <memory>
#include "file.hpp"

namespace tps::file {
    void read(const std::string &path, uint8_vector &buf)
    {
        const std::unique_ptr<std::FILE, decltype(&std::fclose)> f { std::fopen(path.c_str(), "rb"), &std::fclose };
        if (!f) [[unlikely]]
            throw error_sys(fmt::format("failed to open file {} for reading", path));
        if (std::fseek(f.get(), 0, SEEK_END) != 0) [[unlikely]]
            throw error_sys(fmt::format("failed to seek to the end of {}", path));
        const auto sz = std::ftell(f.get());
        if (sz < 0) [[unlikely]]
            throw error_sys(fmt::format("failed to determine the size of {}", path));
        if (std::fseek(f.get(), 0, SEEK_SET) != 0) [[unlikely]]
            throw error_sys(fmt::format("failed to seek to the beginning of {}", path));
        buf.resize(static_cast<size_t>(sz));
        if (!buf.empty() && std::fread(buf.data(), 1, buf.size(), f.get()) != buf.size()) [[unlikely]]
            throw error_sys(fmt::format("failed to read {} bytes from {}", buf.size(), path));
    }
}

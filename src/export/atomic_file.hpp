#pragma once

#include <filesystem>
#include <fstream>
#include <functional>
#include <stdexcept>
#include <string>
#include <system_error>

namespace schedule_io {

// Writes through a temporary sibling file and renames it over `path` only
// after `write` returns and the stream is flushed; a failure leaves no file.
inline void write_file_atomically(const std::string& path,
                                  const std::function<void(std::ostream&)>& write) {
    auto parent = std::filesystem::path(path).parent_path();
    if (!parent.empty() && !std::filesystem::exists(parent)) {
        throw std::runtime_error("Output directory does not exist: " + parent.string());
    }

    const std::string tmp_path = path + ".tmp";
    {
        std::ofstream out(tmp_path, std::ios::out | std::ios::trunc);
        if (!out.is_open()) {
            throw std::runtime_error("Cannot open output file: " + path);
        }
        try {
            write(out);
            out.flush();
            if (!out) throw std::runtime_error("Failed writing output file: " + path);
        } catch (...) {
            out.close();
            std::error_code ec;
            std::filesystem::remove(tmp_path, ec);
            throw;
        }
    }

    std::error_code ec;
    std::filesystem::rename(tmp_path, path, ec);
    if (ec) {
        std::filesystem::remove(tmp_path, ec);
        throw std::runtime_error("Cannot replace output file: " + path);
    }
}

}  // namespace schedule_io

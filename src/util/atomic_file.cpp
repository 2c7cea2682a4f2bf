/**
 * devhttps - Local HTTPS Development Server
 * Atomic file helpers implementation
 */

#include "util/atomic_file.hpp"

#include <spdlog/spdlog.h>

#include <cstdint>
#include <fstream>
#include <random>
#include <stdexcept>
#include <system_error>

namespace devhttps::util {

namespace {

/**
 * Random 16-character hex suffix
 */
std::string random_suffix() {
    static thread_local std::mt19937_64 rng(std::random_device{}());
    static constexpr char hex_chars[] = "0123456789abcdef";

    std::uint64_t value = rng();
    std::string id;
    id.reserve(16);

    for (int i = 0; i < 16; ++i) {
        id.push_back(hex_chars[(value >> (i * 4)) & 0xF]);
    }

    return id;
}

} // anonymous namespace

std::filesystem::path make_temp_sibling(const std::filesystem::path& target) {
    auto name = "." + target.filename().string() + ".tmp-" + random_suffix();
    return target.parent_path() / name;
}

void write_file_atomically(const std::filesystem::path& target,
                           std::string_view contents,
                           std::filesystem::perms perms) {
    TempFileGuard temp(make_temp_sibling(target));

    {
        std::ofstream file(temp.path(), std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            throw std::runtime_error("Cannot create file: " + temp.path().string());
        }

        file.write(contents.data(), static_cast<std::streamsize>(contents.size()));
        file.flush();
        if (!file) {
            throw std::runtime_error("Failed to write file: " + temp.path().string());
        }
    }

    std::error_code ec;
    std::filesystem::permissions(temp.path(), perms, ec);
    if (ec) {
        spdlog::warn("Could not restrict permissions of {}: {}", temp.path().string(), ec.message());
    }

    commit_file(temp.path(), target);
    temp.release();
}

void commit_file(const std::filesystem::path& temp, const std::filesystem::path& target) {
    std::error_code ec;
    std::filesystem::rename(temp, target, ec);
    if (ec) {
        throw std::runtime_error("Failed to move " + temp.string() + " to " +
                                 target.string() + ": " + ec.message());
    }
}

TempFileGuard::TempFileGuard(std::filesystem::path path)
    : path_(std::move(path))
{
}

TempFileGuard::~TempFileGuard() {
    if (released_) {
        return;
    }

    std::error_code ec;
    std::filesystem::remove(path_, ec);
    if (ec) {
        spdlog::warn("Failed to remove temporary file {}: {}", path_.string(), ec.message());
    }
}

} // namespace devhttps::util

// Copyright (c) 2026 changcheng967. All rights reserved.

#include <support/temp_dir.hpp>
#include <atomic>
#include <filesystem>
#include <format>
#include <fstream>
#include <iterator>
#include <random>

namespace fs = std::filesystem;

namespace ferry::test {

TempDir::TempDir() {
    static std::atomic<unsigned> counter{0};
    std::random_device rd;
    auto name = std::format("ferry-test-{}-{}", rd(), counter.fetch_add(1));
    auto dir = fs::temp_directory_path() / name;
    fs::create_directories(dir);
    path_ = dir.string();
}

TempDir::~TempDir() {
    std::error_code ec;
    fs::remove_all(path_, ec);
}

std::string TempDir::file(std::string_view name) const {
    return (fs::path(path_) / name).string();
}

std::string read_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
}

void write_file(const std::string& path, std::string_view data) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(data.data(), static_cast<std::streamsize>(data.size()));
}

} // namespace ferry::test

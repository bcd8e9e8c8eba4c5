// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <string>
#include <string_view>

namespace ferry::test {

// Fresh directory under the system temp path, removed on destruction
class TempDir {
public:
    TempDir();
    ~TempDir();

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] const std::string& path() const noexcept { return path_; }
    [[nodiscard]] std::string file(std::string_view name) const;

private:
    std::string path_;
};

[[nodiscard]] std::string read_file(const std::string& path);
void write_file(const std::string& path, std::string_view data);

} // namespace ferry::test

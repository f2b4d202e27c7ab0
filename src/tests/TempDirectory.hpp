// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <filesystem>
#include <format>
#include <random>
#include <string_view>
#include <system_error>

namespace supervox::test
{

/// @brief A fresh directory under the system temp directory, removed with its contents on destruction.
class TempDirectory
{
  public:
    explicit TempDirectory(std::string_view tag = "test")
    {
        auto random = std::mt19937_64 { std::random_device {}() };
        _path = std::filesystem::temp_directory_path() / std::format("supervox_{}_{:016x}", tag, random());
        std::filesystem::create_directories(_path);
    }

    ~TempDirectory()
    {
        auto ec = std::error_code {};
        std::filesystem::remove_all(_path, ec);
    }

    TempDirectory(const TempDirectory&) = delete;
    TempDirectory& operator=(const TempDirectory&) = delete;

    [[nodiscard]] auto path() const -> const std::filesystem::path& { return _path; }

    [[nodiscard]] auto operator/(std::string_view name) const -> std::filesystem::path { return _path / name; }

  private:
    std::filesystem::path _path;
};

} // namespace supervox::test

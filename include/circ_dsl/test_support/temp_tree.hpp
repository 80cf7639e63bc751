// circ_dsl/test_support/temp_tree.hpp - temporary package trees for tests
#pragma once

#include <filesystem>
#include <fstream>
#include <random>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace circ_dsl::test_support
{

/**
 * A fresh directory under the system temp directory, removed on destruction.
 *
 * @code
 *   TempDir root("imports");
 *   root.write("src/foo.leo", "function bar() -> u8 { return 1u8; }");
 * @endcode
 */
class TempDir
{
public:
  explicit TempDir(std::string_view prefix)
  {
    std::random_device rd;
    path_ = std::filesystem::temp_directory_path() /
            ("circ_dsl_" + std::string(prefix) + "_" + std::to_string(rd()));
    std::filesystem::create_directories(path_);
  }

  ~TempDir()
  {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }

  TempDir(const TempDir &) = delete;
  TempDir & operator=(const TempDir &) = delete;

  [[nodiscard]] const std::filesystem::path & path() const noexcept { return path_; }

  /// Write `content` to `relative`, creating parent directories.
  std::filesystem::path write(const std::filesystem::path & relative, std::string_view content) const
  {
    const std::filesystem::path full = path_ / relative;
    std::filesystem::create_directories(full.parent_path());
    std::ofstream out(full, std::ios::out | std::ios::binary | std::ios::trunc);
    out << content;
    return full;
  }

  /// Create an empty directory at `relative`.
  std::filesystem::path mkdir(const std::filesystem::path & relative) const
  {
    const std::filesystem::path full = path_ / relative;
    std::filesystem::create_directories(full);
    return full;
  }

private:
  std::filesystem::path path_;
};

}  // namespace circ_dsl::test_support

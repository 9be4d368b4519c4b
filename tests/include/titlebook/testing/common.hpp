#pragma once

#include <titlebook/schema/primitives.hpp>

#include <atomic>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace titlebook::testing {

inline titlebook::schema::hash32_t filled_hash(const uint8_t fill) {
  auto out = titlebook::schema::hash32_t{};
  out.fill(fill);
  return out;
}

/// Unique directory under the system temp path, removed with its contents
/// when the object goes out of scope.
class scratch_directory final {
 public:
  explicit scratch_directory(const std::string_view prefix)
      : path_{(std::filesystem::temp_directory_path() /
               (std::string{prefix} + "_" + std::to_string(next_serial())))
                  .string()} {
    auto error = std::error_code{};
    std::filesystem::remove_all(path_, error);
  }

  scratch_directory(const scratch_directory&) = delete;
  scratch_directory& operator=(const scratch_directory&) = delete;

  ~scratch_directory() {
    auto error = std::error_code{};
    std::filesystem::remove_all(path_, error);
  }

  const std::string& path() const { return path_; }

 private:
  static uint64_t next_serial() {
    static auto serial = std::atomic<uint64_t>{0};
    return serial.fetch_add(1) +
           static_cast<uint64_t>(
               std::filesystem::file_time_type::clock::now()
                   .time_since_epoch()
                   .count());
  }

  std::string path_;
};

}  // namespace titlebook::testing

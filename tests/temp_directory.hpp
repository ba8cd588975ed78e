#pragma once

#include <filesystem>
#include <random>
#include <string>
#include <system_error>

namespace persistor::testing {

// unique directory below the system temp dir, removed with its contents
class Temp_directory {
 private:
  std::filesystem::path _path;

 public:
  Temp_directory() {
    std::random_device seed;
    std::mt19937_64 generator(seed());
    do {
      _path = std::filesystem::temp_directory_path() /
              ("persistor-test-" + std::to_string(generator()));
    } while (!std::filesystem::create_directory(_path));
  }
  Temp_directory(const Temp_directory&) = delete;
  Temp_directory& operator=(const Temp_directory&) = delete;

  ~Temp_directory() {
    std::error_code ec;
    std::filesystem::remove_all(_path, ec);
  }

  [[nodiscard]] const std::filesystem::path& path() const noexcept { return _path; }
};

}  // namespace persistor::testing

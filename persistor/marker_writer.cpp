#include <fmt/format.h>
#include <fmt/std.h>

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <persistor/marker_writer.hpp>
#include <persistor/try.hpp>
#include <string>
#include <sys/stat.h>
#include <tl/expected.hpp>
#include <unistd.h>
#include <utility>

namespace fs = std::filesystem;

namespace persistor {

namespace {

// closes the descriptor on scope exit
class File_descriptor {
 private:
  int _fd{-1};

 public:
  explicit File_descriptor(const int fd) noexcept : _fd(fd) {}
  File_descriptor(const File_descriptor&) = delete;
  File_descriptor& operator=(const File_descriptor&) = delete;
  ~File_descriptor() {
    if (_fd >= 0) {
      ::close(_fd);
    }
  }

  [[nodiscard]] int get() const noexcept { return _fd; }

  [[nodiscard]] bool valid() const noexcept { return _fd >= 0; }

  // closes now, so that a failing close is reported
  [[nodiscard]] bool close() noexcept {
    const auto fd = std::exchange(_fd, -1);
    return ::close(fd) == 0;
  }
};

[[nodiscard]] tl::unexpected<Provision_error> write_error(const fs::path& path,
                                                          const char* const action) {
  return make_error(Provision_errc::write,
                    fmt::format("Could not {} {}: {}", action, path, std::strerror(errno)));
}

// Opens the marker for writing. A symlink in its place is replaced by a
// regular file, never followed; other non-regular entries are refused.
[[nodiscard]] Provision_result<int> open_marker(const fs::path& marker_path) {
  struct stat entry {};
  if (::lstat(marker_path.c_str(), &entry) == 0) {
    if (S_ISLNK(entry.st_mode)) {
      if (::unlink(marker_path.c_str()) != 0) {
        return write_error(marker_path, "remove the symbolic link");
      }
    } else if (!S_ISREG(entry.st_mode)) {
      return make_error(Provision_errc::write,
                        fmt::format("{} exists and is not a regular file.", marker_path));
    }
  } else if (errno != ENOENT) {
    return write_error(marker_path, "inspect");
  }

  const auto fd = ::open(marker_path.c_str(),
                         O_WRONLY | O_CREAT | O_TRUNC | O_NOFOLLOW | O_NONBLOCK | O_CLOEXEC,
                         0644);
  if (fd < 0) {
    return write_error(marker_path, "open");
  }
  return fd;
}

}  // namespace

Provision_result<fs::path> write_marker(const fs::path& mountpoint, Disk_tools& tools) {
  const auto marker_path = mountpoint / marker_filename;

  File_descriptor file(TRY(open_marker(marker_path)));
  struct stat opened {};
  if (::fstat(file.get(), &opened) != 0) {
    return write_error(marker_path, "inspect");
  }
  if (!S_ISREG(opened.st_mode)) {
    return make_error(Provision_errc::write,
                      fmt::format("{} was replaced by something other than a regular file.",
                                  marker_path));
  }

  std::size_t written = 0;
  while (written < marker_content.size()) {
    const auto num_written = ::write(file.get(), marker_content.data() + written,
                                     marker_content.size() - written);
    if (num_written < 0) {
      if (errno == EINTR) {
        continue;
      }
      return write_error(marker_path, "write");
    }
    written += static_cast<std::size_t>(num_written);
  }

  if (::fsync(file.get()) != 0) {
    return write_error(marker_path, "sync");
  }
  if (!file.close()) {
    return write_error(marker_path, "close");
  }

  // the directory entry must reach the disk as well
  File_descriptor directory(::open(mountpoint.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC));
  if (!directory.valid()) {
    return write_error(mountpoint, "open");
  }
  if (::fsync(directory.get()) != 0) {
    return write_error(mountpoint, "sync");
  }

  REQ(tools.flush().map_error([&](auto&& error) {
    return Provision_error{.code = Provision_errc::write,
                           .message = fmt::format("Flushing {} failed: {}", marker_path,
                                                  error.message)};
  }))
  return marker_path;
}

}  // namespace persistor

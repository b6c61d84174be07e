#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

namespace pcloud {
namespace store {

// Exclusively created scratch file that is removed on every exit path unless
// persist() moved it to its final location.
class TempFile {
public:

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // Creates <dir>/<prefix>-<random>.tmp, retrying on name collision
  static TempFile create(const std::filesystem::path& dir, const std::string& prefix);
  ~TempFile();

  TempFile(TempFile&& other) noexcept;
  TempFile& operator=(TempFile&& other) noexcept;
  TempFile(const TempFile&) = delete;
  TempFile& operator=(const TempFile&) = delete;


  // ---- WRITING ----
  // Appends the whole buffer or throws IoError
  void append(const void* data, size_t length);
  // Flushes file data to stable storage
  void sync();


  // ---- RELEASE ----
  // Closes and atomically renames the file to target; the object no longer owns it
  void persist(const std::filesystem::path& target);
  // Closes and removes the file, throws IoError if removal fails
  void discard();


  // ---- GETTERS ----
  const std::filesystem::path& path() const { return path_; }
  std::uint64_t size() const { return size_; }
  bool is_owned() const { return owned_; }

private:
  TempFile(int fd, std::filesystem::path path);

  // ---- PARAMETERS ----
  int fd_;
  std::filesystem::path path_;
  std::uint64_t size_;
  bool owned_;

  void close_fd() noexcept;
  void release() noexcept;
};

} // namespace store
} // namespace pcloud

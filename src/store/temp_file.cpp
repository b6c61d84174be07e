#include "store/temp_file.hpp"
#include <cerrno>
#include <cstring>
#include <random>
#include <fcntl.h>
#include <unistd.h>
#include <boost/log/trivial.hpp>
#include "protocol/protocol_error.hpp"

namespace pcloud {
namespace store {

namespace {

std::string errno_message(const std::string& what, const std::filesystem::path& path) {
  return what + " " + path.string() + ": " + std::strerror(errno);
}

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

TempFile::TempFile(int fd, std::filesystem::path path)
  : fd_(fd)
  , path_(std::move(path))
  , size_(0)
  , owned_(true) {}

TempFile TempFile::create(const std::filesystem::path& dir, const std::string& prefix) {
  std::random_device rd;
  std::mt19937 gen(rd());
  std::uniform_int_distribution<uint32_t> dis;

  while (true) {
    auto path = dir / (prefix + "-" + std::to_string(dis(gen)) + ".tmp");
    int fd = ::open(path.c_str(), O_CREAT | O_EXCL | O_WRONLY | O_CLOEXEC, 0600);
    if (fd >= 0) {
      BOOST_LOG_TRIVIAL(debug) << "Temp file: Created " << path.string();
      return TempFile(fd, std::move(path));
    }
    if (errno == EEXIST) {
      BOOST_LOG_TRIVIAL(debug) << "Temp file: Name collision on " << path.string() << ", retrying";
      continue;
    }
    throw protocol::IoError(errno_message("Failed to create temporary file", path));
  }
}

TempFile::~TempFile() {
  release();
}

TempFile::TempFile(TempFile&& other) noexcept
  : fd_(other.fd_)
  , path_(std::move(other.path_))
  , size_(other.size_)
  , owned_(other.owned_) {
  other.fd_ = -1;
  other.owned_ = false;
}

TempFile& TempFile::operator=(TempFile&& other) noexcept {
  if (this != &other) {
    release();
    fd_ = other.fd_;
    path_ = std::move(other.path_);
    size_ = other.size_;
    owned_ = other.owned_;
    other.fd_ = -1;
    other.owned_ = false;
  }
  return *this;
}


//==============================================
// WRITING
//==============================================

void TempFile::append(const void* data, size_t length) {
  if (!owned_ || fd_ < 0) {
    throw protocol::IoError("Temporary file is closed");
  }

  auto bytes = static_cast<const char*>(data);
  size_t written = 0;
  while (written < length) {
    ssize_t n = ::write(fd_, bytes + written, length - written);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      throw protocol::IoError(errno_message("Failed to write", path_));
    }
    written += static_cast<size_t>(n);
  }
  size_ += length;
}

void TempFile::sync() {
  if (!owned_ || fd_ < 0) {
    throw protocol::IoError("Temporary file is closed");
  }
  if (::fsync(fd_) != 0) {
    throw protocol::IoError(errno_message("Failed to sync", path_));
  }
}


//==============================================
// RELEASE
//==============================================

void TempFile::persist(const std::filesystem::path& target) {
  if (!owned_) {
    throw protocol::IoError("Temporary file is no longer owned");
  }
  close_fd();

  std::error_code ec;
  std::filesystem::rename(path_, target, ec);
  if (ec) {
    throw protocol::IoError("Failed to move " + path_.string() + " to " + target.string() + ": " + ec.message());
  }
  owned_ = false;
  BOOST_LOG_TRIVIAL(debug) << "Temp file: Persisted " << path_.string() << " as " << target.string();
}

void TempFile::discard() {
  if (!owned_) {
    return;
  }
  close_fd();
  owned_ = false;

  std::error_code ec;
  if (!std::filesystem::remove(path_, ec) || ec) {
    throw protocol::IoError("Failed to remove temporary file " + path_.string() +
                            (ec ? ": " + ec.message() : std::string()));
  }
  BOOST_LOG_TRIVIAL(debug) << "Temp file: Removed " << path_.string();
}

void TempFile::close_fd() noexcept {
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
}

void TempFile::release() noexcept {
  close_fd();
  if (owned_) {
    owned_ = false;
    std::error_code ec;
    std::filesystem::remove(path_, ec);
    if (ec) {
      BOOST_LOG_TRIVIAL(error) << "Temp file: Failed to remove " << path_.string() << ": " << ec.message();
    } else {
      BOOST_LOG_TRIVIAL(debug) << "Temp file: Dropped " << path_.string();
    }
  }
}

} // namespace store
} // namespace pcloud

#include "io/file.hpp"

#include <algorithm>
#include <cstdarg>
#include <cstring>
#include <stdexcept>
#include <utility>

#include "util/log.hpp"


namespace lensgen {

std::string PathJoin(const std::string& p1, const std::string& p2) {
  boost::filesystem::path p(p1);
  p /= (p2);
  return p.string();
}


File::File(const char* filename)
    : file_(nullptr), buffer_{ new char[kBufferSize] }, buffer_offset_(0), failed_(false), path_(filename) {}


File::File(File&& other) noexcept
    : file_(other.file_), buffer_(std::move(other.buffer_)), buffer_offset_(other.buffer_offset_),
      failed_(other.failed_), path_(std::move(other.path_)) {
  other.file_ = nullptr;
  other.buffer_offset_ = 0;
}


File& File::operator=(File&& other) noexcept {
  if (&other != this) {
    if (!Close()) {
      LOG_ERROR("Failed to close file %s", path_.string().c_str());
    }
    file_ = other.file_;
    buffer_ = std::move(other.buffer_);
    buffer_offset_ = other.buffer_offset_;
    failed_ = other.failed_;
    path_ = std::move(other.path_);
    other.file_ = nullptr;
    other.buffer_offset_ = 0;
  }
  return *this;
}


File::~File() {
  if (!Close()) {
    LOG_ERROR("Failed to close file %s", path_.string().c_str());
  }
}


bool File::Open() {
  if (file_ && !Close()) {
    LOG_ERROR("Failed to close file %s", path_.string().c_str());
    return false;
  }

  if (path_.has_parent_path()) {
    boost::system::error_code ec;
    boost::filesystem::create_directories(path_.parent_path(), ec);
    if (ec) {
      LOG_ERROR("Cannot create directory %s: %s", path_.parent_path().string().c_str(), ec.message().c_str());
      return false;
    }
  }

  file_ = std::fopen(path_.string().c_str(), "w");
  if (!file_) {
    LOG_VERBOSE("Cannot open file %s", path_.string().c_str());
    return false;
  }
  failed_ = false;
  return true;
}


size_t File::Write(const char* data, size_t n) {
  if (!file_) {
    throw std::logic_error("File is not open for writing!");
  }

  size_t count = 0;
  while (count < n) {
    if (buffer_offset_ >= kBufferSize && !Flush()) {
      break;
    }
    size_t len = std::min(n - count, kBufferSize - buffer_offset_);
    std::memcpy(buffer_.get() + buffer_offset_, data + count, len);
    buffer_offset_ += len;
    count += len;
  }
  return count;
}


size_t File::Write(const std::string& data) {
  return Write(data.data(), data.size());
}


size_t File::Printf(const char* fmt, ...) {
  char line[kMaxLineLength];
  va_list args;
  va_start(args, fmt);
  int n = std::vsnprintf(line, kMaxLineLength, fmt, args);
  va_end(args);
  if (n < 0) {
    failed_ = true;
    return 0;
  }
  if (static_cast<size_t>(n) >= kMaxLineLength) {
    std::string long_line(static_cast<size_t>(n) + 1, '\0');
    va_start(args, fmt);
    std::vsnprintf(&long_line[0], long_line.size(), fmt, args);
    va_end(args);
    return Write(long_line.data(), static_cast<size_t>(n));
  }
  return Write(line, static_cast<size_t>(n));
}


bool File::Flush() {
  if (!file_) {
    return true;
  }
  size_t n = std::fwrite(buffer_.get(), 1, buffer_offset_, file_);
  if (n != buffer_offset_) {
    failed_ = true;
  }
  buffer_offset_ = 0;
  return !failed_;
}


bool File::Close() {
  if (!file_) {
    return true;
  }
  bool ok = Flush();
  ok = std::fclose(file_) == 0 && ok;
  file_ = nullptr;
  buffer_offset_ = 0;
  return ok;
}


const boost::filesystem::path& File::GetPath() const {
  return path_;
}

}  // namespace lensgen

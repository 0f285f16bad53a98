#ifndef IO_FILE_H_
#define IO_FILE_H_

#include <cstdio>
#include <memory>
#include <string>

#define BOOST_FILESYSTEM_NO_DEPRECATED
#include <boost/filesystem.hpp>


namespace lensgen {

/**
 * @brief A buffered text file for writing.
 *
 * Missing parent directories are created on Open(). Data is flushed on Close() and on destruction.
 * Once a flush fails the file stays failed, and Close() returns false.
 */
class File {
 public:
  explicit File(const char* filename);
  File(const File& other) = delete;
  File(File&& other) noexcept;
  ~File();

  File& operator=(const File& other) = delete;
  File& operator=(File&& other) noexcept;

  bool Open();
  bool Close();
  bool Flush();

  const boost::filesystem::path& GetPath() const;

  size_t Write(const char* data, size_t n);
  size_t Write(const std::string& data);
  size_t Printf(const char* fmt, ...);

 private:
  std::FILE* file_;
  std::unique_ptr<char[]> buffer_;
  size_t buffer_offset_;
  bool failed_;
  boost::filesystem::path path_;

  static constexpr size_t kBufferSize = 64 * 1024;
  static constexpr size_t kMaxLineLength = 1024;
};


std::string PathJoin(const std::string& p1, const std::string& p2);

}  // namespace lensgen

#endif  // IO_FILE_H_

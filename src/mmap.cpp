#include <utility>

#include <fmt/format.h>

#include <rscx/mmap.hpp>

#ifdef _WIN32
#include <windows.h>
#else
#include <cerrno>

#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>
#endif

namespace rscx {

namespace {

#ifdef _WIN32
unsigned long lastError() {
  return GetLastError();
}
#else
int lastError() {
  return errno;
}
#endif

} // namespace

MappedFile::MappedFile() = default;

MappedFile::~MappedFile() {
  close();
}

MappedFile::MappedFile(MappedFile &&other) noexcept
    :
#ifdef _WIN32
      fileHandle_(std::exchange(other.fileHandle_, nullptr)),
      mappingHandle_(std::exchange(other.mappingHandle_, nullptr)),
#else
      fd_(std::exchange(other.fd_, -1)),
#endif
      data_(std::exchange(other.data_, nullptr)), size_(std::exchange(other.size_, 0)),
      writable_(std::exchange(other.writable_, false)) {
}

MappedFile &MappedFile::operator=(MappedFile &&other) noexcept {
  if (this != &other) {
    close();
#ifdef _WIN32
    fileHandle_ = std::exchange(other.fileHandle_, nullptr);
    mappingHandle_ = std::exchange(other.mappingHandle_, nullptr);
#else
    fd_ = std::exchange(other.fd_, -1);
#endif
    data_ = std::exchange(other.data_, nullptr);
    size_ = std::exchange(other.size_, 0);
    writable_ = std::exchange(other.writable_, false);
  }
  return *this;
}

bool MappedFile::fail(std::string *outError, const std::string &message) {
  if (outError) {
    *outError = message;
  }
  close();
  return false;
}

bool MappedFile::openRead(const std::filesystem::path &path, std::string *outError) {
  close();

#ifdef _WIN32
  fileHandle_ = CreateFileW(path.c_str(), GENERIC_READ, FILE_SHARE_READ, nullptr, OPEN_EXISTING,
                            FILE_ATTRIBUTE_NORMAL, nullptr);
  if (fileHandle_ == INVALID_HANDLE_VALUE) {
    fileHandle_ = nullptr;
    return fail(outError, fmt::format("Failed to open file for reading: {} (error: {})",
                                      path.string(), lastError()));
  }

  LARGE_INTEGER fileSize;
  if (!GetFileSizeEx(static_cast<HANDLE>(fileHandle_), &fileSize)) {
    return fail(outError, fmt::format("Failed to get file size: {} (error: {})", path.string(),
                                      lastError()));
  }
  if (fileSize.QuadPart == 0) {
    return fail(outError, fmt::format("File is empty: {}", path.string()));
  }
  size_ = static_cast<size_t>(fileSize.QuadPart);

  mappingHandle_ =
      CreateFileMappingW(static_cast<HANDLE>(fileHandle_), nullptr, PAGE_READONLY, 0, 0, nullptr);
  if (!mappingHandle_) {
    return fail(outError, fmt::format("Failed to create file mapping: {} (error: {})",
                                      path.string(), lastError()));
  }

  data_ = MapViewOfFile(static_cast<HANDLE>(mappingHandle_), FILE_MAP_READ, 0, 0, 0);
  if (!data_) {
    return fail(outError, fmt::format("Failed to map file: {} (error: {})", path.string(),
                                      lastError()));
  }
#else
  fd_ = ::open(path.string().c_str(), O_RDONLY);
  if (fd_ < 0) {
    return fail(outError, fmt::format("Failed to open file for reading: {} (errno: {})",
                                      path.string(), lastError()));
  }

  struct stat st;
  if (fstat(fd_, &st) < 0) {
    return fail(outError, fmt::format("Failed to get file size: {} (errno: {})", path.string(),
                                      lastError()));
  }
  if (!S_ISREG(st.st_mode)) {
    return fail(outError, fmt::format("Not a regular file: {}", path.string()));
  }
  if (st.st_size == 0) {
    return fail(outError, fmt::format("File is empty: {}", path.string()));
  }
  size_ = static_cast<size_t>(st.st_size);

  data_ = mmap(nullptr, size_, PROT_READ, MAP_PRIVATE, fd_, 0);
  if (data_ == MAP_FAILED) {
    data_ = nullptr;
    return fail(outError, fmt::format("Failed to map file: {} (errno: {})", path.string(),
                                      lastError()));
  }
#endif

  writable_ = false;
  return true;
}

bool MappedFile::openWrite(const std::filesystem::path &path, size_t size, std::string *outError) {
  close();

  if (size == 0) {
    return fail(outError, "Cannot create file mapping with zero size");
  }

#ifdef _WIN32
  fileHandle_ = CreateFileW(path.c_str(), GENERIC_READ | GENERIC_WRITE, 0, nullptr, CREATE_ALWAYS,
                            FILE_ATTRIBUTE_NORMAL, nullptr);
  if (fileHandle_ == INVALID_HANDLE_VALUE) {
    fileHandle_ = nullptr;
    return fail(outError, fmt::format("Failed to create file for writing: {} (error: {})",
                                      path.string(), lastError()));
  }

  LARGE_INTEGER fileSize;
  fileSize.QuadPart = static_cast<LONGLONG>(size);
  if (!SetFilePointerEx(static_cast<HANDLE>(fileHandle_), fileSize, nullptr, FILE_BEGIN) ||
      !SetEndOfFile(static_cast<HANDLE>(fileHandle_))) {
    return fail(outError, fmt::format("Failed to set file size: {} (error: {})", path.string(),
                                      lastError()));
  }

  mappingHandle_ =
      CreateFileMappingW(static_cast<HANDLE>(fileHandle_), nullptr, PAGE_READWRITE, 0, 0, nullptr);
  if (!mappingHandle_) {
    return fail(outError, fmt::format("Failed to create file mapping: {} (error: {})",
                                      path.string(), lastError()));
  }

  data_ = MapViewOfFile(static_cast<HANDLE>(mappingHandle_), FILE_MAP_WRITE, 0, 0, 0);
  if (!data_) {
    return fail(outError, fmt::format("Failed to map file: {} (error: {})", path.string(),
                                      lastError()));
  }
#else
  fd_ = ::open(path.string().c_str(), O_RDWR | O_CREAT | O_TRUNC, 0644);
  if (fd_ < 0) {
    return fail(outError, fmt::format("Failed to create file for writing: {} (errno: {})",
                                      path.string(), lastError()));
  }

  if (ftruncate(fd_, static_cast<off_t>(size)) < 0) {
    return fail(outError, fmt::format("Failed to set file size: {} (errno: {})", path.string(),
                                      lastError()));
  }

  data_ = mmap(nullptr, size, PROT_READ | PROT_WRITE, MAP_SHARED, fd_, 0);
  if (data_ == MAP_FAILED) {
    data_ = nullptr;
    return fail(outError, fmt::format("Failed to map file: {} (errno: {})", path.string(),
                                      lastError()));
  }
#endif

  size_ = size;
  writable_ = true;
  return true;
}

bool MappedFile::flush(std::string *outError) {
  if (!data_ || !writable_) {
    if (outError) {
      *outError = "Cannot flush: file not open for writing";
    }
    return false;
  }

#ifdef _WIN32
  if (!FlushViewOfFile(data_, 0) || !FlushFileBuffers(static_cast<HANDLE>(fileHandle_))) {
    if (outError) {
      *outError = fmt::format("Failed to flush mapped file (error: {})", lastError());
    }
    return false;
  }
#else
  if (msync(data_, size_, MS_SYNC) < 0) {
    if (outError) {
      *outError = fmt::format("Failed to sync mapped file (errno: {})", lastError());
    }
    return false;
  }
#endif

  return true;
}

void MappedFile::close() {
  if (data_) {
#ifdef _WIN32
    UnmapViewOfFile(data_);
#else
    munmap(data_, size_);
#endif
    data_ = nullptr;
  }

#ifdef _WIN32
  if (mappingHandle_) {
    CloseHandle(static_cast<HANDLE>(mappingHandle_));
    mappingHandle_ = nullptr;
  }
  if (fileHandle_) {
    CloseHandle(static_cast<HANDLE>(fileHandle_));
    fileHandle_ = nullptr;
  }
#else
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
#endif

  size_ = 0;
  writable_ = false;
}

} // namespace rscx

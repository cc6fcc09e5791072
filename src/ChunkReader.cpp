#include "ChunkReader.hpp"
#include "TransferError.hpp"
#include <algorithm>
#include <chrono>
#include <system_error>
#include <utility>
#include <vector>

#include <picosha2.h>

namespace fs = std::filesystem;

namespace davsync {

ChunkReader::ChunkReader(std::string path) : m_path(std::move(path)) {
  std::error_code ec;
  if (!fs::is_regular_file(m_path, ec))
    throw TransferError(ErrorKind::LocalFileNotFound,
                        "not a readable file: " + m_path);
  m_size = fs::file_size(m_path, ec);
  if (ec)
    throw TransferError(ErrorKind::LocalFileNotFound,
                        "cannot stat " + m_path + ": " + ec.message());
  m_stream.open(m_path, std::ios::binary);
  if (!m_stream.is_open())
    throw TransferError(ErrorKind::LocalFileNotFound,
                        "cannot open " + m_path);
}

ChunkReader::~ChunkReader() = default;

std::uint64_t ChunkReader::windowLength(std::uint64_t offset,
                                        std::uint64_t length) const {
  if (offset >= m_size)
    return 0;
  return std::min(length, m_size - offset);
}

std::string ChunkReader::readWindow(std::uint64_t offset,
                                    std::uint64_t length) {
  std::string out;
  out.reserve(static_cast<std::size_t>(windowLength(offset, length)));
  streamWindow(offset, length, [&out](const char *data, std::size_t len) {
    out.append(data, len);
    return true;
  });
  return out;
}

std::uint64_t ChunkReader::streamWindow(std::uint64_t offset,
                                        std::uint64_t length,
                                        const PieceHandler &handler) {
  std::uint64_t remaining = windowLength(offset, length);
  std::uint64_t sent = 0;
  if (remaining == 0)
    return 0;

  m_stream.clear();
  m_stream.seekg(static_cast<std::streamoff>(offset));
  if (!m_stream)
    throw TransferError(ErrorKind::LocalFileNotFound,
                        "seek failed in " + m_path);

  std::vector<char> buffer(kPieceSize);
  while (remaining > 0) {
    auto toRead = static_cast<std::size_t>(
        std::min<std::uint64_t>(remaining, buffer.size()));
    m_stream.read(buffer.data(), static_cast<std::streamsize>(toRead));
    auto got = static_cast<std::size_t>(m_stream.gcount());
    if (got == 0)
      throw TransferError(ErrorKind::LocalFileNotFound,
                          "file shrank while reading " + m_path);
    sent += got;
    remaining -= got;
    if (!handler(buffer.data(), got))
      break;
  }
  return sent;
}

std::string ChunkReader::sha256Hex() {
  m_stream.clear();
  m_stream.seekg(0);
  std::vector<unsigned char> hash(picosha2::k_digest_size);
  picosha2::hash256(m_stream, hash.begin(), hash.end());
  m_stream.clear();
  return picosha2::bytes_to_hex_string(hash.begin(), hash.end());
}

std::int64_t ChunkReader::getUnixTimeStamp(const fs::file_time_type &ftime) {
  auto now_file = fs::file_time_type::clock::now();
  auto now_sys = std::chrono::system_clock::now();
  auto file_duration = ftime - now_file;
  auto sys_time =
      now_sys + std::chrono::duration_cast<std::chrono::system_clock::duration>(
                    file_duration);
  return std::chrono::duration_cast<std::chrono::seconds>(
             sys_time.time_since_epoch())
      .count();
}

std::int64_t ChunkReader::lastModifiedSeconds(const std::string &path) {
  std::error_code ec;
  auto ftime = fs::last_write_time(path, ec);
  if (ec)
    return 0;
  return getUnixTimeStamp(ftime);
}

} // namespace davsync

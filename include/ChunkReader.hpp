#ifndef CHUNKREADER_HPP
#define CHUNKREADER_HPP

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <string>

namespace davsync {

/**
 * ChunkReader streams a local file in bounded windows, for hashing and for
 * request bodies. It knows nothing about the network.
 */
class ChunkReader {
public:
  static constexpr std::size_t kPieceSize = 64 * 1024;

  // Receives each piece of a window; returning false stops the stream.
  using PieceHandler = std::function<bool(const char *data, std::size_t len)>;

  explicit ChunkReader(std::string path);
  ~ChunkReader();

  const std::string &path() const { return m_path; }
  std::uint64_t size() const { return m_size; }

  // Bytes actually available in [offset, offset + length).
  std::uint64_t windowLength(std::uint64_t offset, std::uint64_t length) const;

  std::string readWindow(std::uint64_t offset, std::uint64_t length);

  // Returns the number of bytes handed out. Stops early if the handler
  // returns false.
  std::uint64_t streamWindow(std::uint64_t offset, std::uint64_t length,
                             const PieceHandler &handler);

  std::string sha256Hex();

  static std::int64_t
  getUnixTimeStamp(const std::filesystem::file_time_type &ftime);
  static std::int64_t lastModifiedSeconds(const std::string &path);

private:
  std::string m_path;
  std::ifstream m_stream;
  std::uint64_t m_size = 0;
};

} // namespace davsync

#endif // CHUNKREADER_HPP

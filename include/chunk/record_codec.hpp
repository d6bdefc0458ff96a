#ifndef MVAULT_CHUNK_RECORD_CODEC_HPP
#define MVAULT_CHUNK_RECORD_CODEC_HPP

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace mvault {
namespace chunk {

class RecordFormatError : public std::runtime_error {
public:
  explicit RecordFormatError(const std::string& message) : std::runtime_error(message) {}
};

// Appends fields to a byte buffer. Integers are written in network byte
// order, strings and blobs are prefixed with their length.
class RecordWriter {
public:
  // Every record opens with a 4 byte tag and a format version
  RecordWriter(const char (&tag)[5], uint8_t version);

  // ---- SERIALIZATION ----
  void write_u8(uint8_t value);
  void write_u32(uint32_t value);
  void write_u64(uint64_t value);
  void write_i64(int64_t value);
  void write_string(const std::string& value);
  void write_blob(const std::vector<uint8_t>& value);

  const std::vector<uint8_t>& bytes() const { return buffer_; }
  std::vector<uint8_t> release() { return std::move(buffer_); }

private:
  std::vector<uint8_t> buffer_;

  void write_bytes(const void* data, std::size_t size);
};

// Reads fields written by RecordWriter. Any truncation or tag mismatch
// throws RecordFormatError.
class RecordReader {
public:
  RecordReader(const std::vector<uint8_t>& buffer, const char (&tag)[5]);

  // ---- DESERIALIZATION ----
  uint8_t read_u8();
  uint32_t read_u32();
  uint64_t read_u64();
  int64_t read_i64();
  std::string read_string();
  std::vector<uint8_t> read_blob();

  uint8_t version() const { return version_; }
  bool at_end() const { return position_ == buffer_.size(); }
  // Throws unless every byte has been consumed
  void expect_end() const;

private:
  const std::vector<uint8_t>& buffer_;
  std::size_t position_{0};
  uint8_t version_{0};

  void read_bytes(void* data, std::size_t size);
};

} // namespace chunk
} // namespace mvault

#endif // MVAULT_CHUNK_RECORD_CODEC_HPP

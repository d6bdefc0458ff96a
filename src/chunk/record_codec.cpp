#include "chunk/record_codec.hpp"
#include <cstring>
#include <boost/endian/conversion.hpp>

namespace mvault {
namespace chunk {

//==============================================
// SERIALIZATION
//==============================================

RecordWriter::RecordWriter(const char (&tag)[5], uint8_t version) {
  write_bytes(tag, 4);
  write_u8(version);
}

void RecordWriter::write_u8(uint8_t value) {
  buffer_.push_back(value);
}

void RecordWriter::write_u32(uint32_t value) {
  uint32_t network_value = boost::endian::native_to_big(value);
  write_bytes(&network_value, sizeof(network_value));
}

void RecordWriter::write_u64(uint64_t value) {
  uint64_t network_value = boost::endian::native_to_big(value);
  write_bytes(&network_value, sizeof(network_value));
}

void RecordWriter::write_i64(int64_t value) {
  write_u64(static_cast<uint64_t>(value));
}

void RecordWriter::write_string(const std::string& value) {
  write_u32(static_cast<uint32_t>(value.size()));
  write_bytes(value.data(), value.size());
}

void RecordWriter::write_blob(const std::vector<uint8_t>& value) {
  write_u64(value.size());
  write_bytes(value.data(), value.size());
}

void RecordWriter::write_bytes(const void* data, std::size_t size) {
  const uint8_t* begin = static_cast<const uint8_t*>(data);
  buffer_.insert(buffer_.end(), begin, begin + size);
}


//==============================================
// DESERIALIZATION
//==============================================

RecordReader::RecordReader(const std::vector<uint8_t>& buffer, const char (&tag)[5])
  : buffer_(buffer) {
  char stored_tag[4];
  read_bytes(stored_tag, sizeof(stored_tag));
  if (std::memcmp(stored_tag, tag, sizeof(stored_tag)) != 0) {
    throw RecordFormatError("Record codec: unexpected record tag, wanted " + std::string(tag, 4));
  }
  version_ = read_u8();
}

uint8_t RecordReader::read_u8() {
  uint8_t value = 0;
  read_bytes(&value, sizeof(value));
  return value;
}

uint32_t RecordReader::read_u32() {
  uint32_t network_value = 0;
  read_bytes(&network_value, sizeof(network_value));
  return boost::endian::big_to_native(network_value);
}

uint64_t RecordReader::read_u64() {
  uint64_t network_value = 0;
  read_bytes(&network_value, sizeof(network_value));
  return boost::endian::big_to_native(network_value);
}

int64_t RecordReader::read_i64() {
  return static_cast<int64_t>(read_u64());
}

std::string RecordReader::read_string() {
  uint32_t length = read_u32();
  if (length > buffer_.size() - position_) {
    throw RecordFormatError("Record codec: string length exceeds record size");
  }
  std::string value(length, '\0');
  read_bytes(value.data(), length);
  return value;
}

std::vector<uint8_t> RecordReader::read_blob() {
  uint64_t length = read_u64();
  if (length > buffer_.size() - position_) {
    throw RecordFormatError("Record codec: blob length exceeds record size");
  }
  std::vector<uint8_t> value(buffer_.begin() + position_, buffer_.begin() + position_ + length);
  position_ += length;
  return value;
}

void RecordReader::expect_end() const {
  if (!at_end()) {
    throw RecordFormatError("Record codec: " + std::to_string(buffer_.size() - position_) +
                            " trailing bytes");
  }
}

void RecordReader::read_bytes(void* data, std::size_t size) {
  if (size > buffer_.size() - position_) {
    throw RecordFormatError("Record codec: truncated record");
  }
  if (size > 0) {
    std::memcpy(data, buffer_.data() + position_, size);
  }
  position_ += size;
}

} // namespace chunk
} // namespace mvault

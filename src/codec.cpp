#include "cruxenclave/codec.hpp"
#include "cruxenclave/errors.hpp"
#include <arpa/inet.h> // For htons, ntohs, htonl, ntohl
#include <sodium.h>

namespace CruxEnclave {

// --- ByteWriter ---

ByteWriter& ByteWriter::add_u8(uint8_t value) {
    buffer_.push_back(value);
    return *this;
}

ByteWriter& ByteWriter::add_u16(uint16_t value) {
    uint16_t be_value = htons(value);
    buffer_.insert(buffer_.end(), reinterpret_cast<uint8_t*>(&be_value), reinterpret_cast<uint8_t*>(&be_value) + sizeof(be_value));
    return *this;
}

ByteWriter& ByteWriter::add_u32(uint32_t value) {
    uint32_t be_value = htonl(value);
    buffer_.insert(buffer_.end(), reinterpret_cast<uint8_t*>(&be_value), reinterpret_cast<uint8_t*>(&be_value) + sizeof(be_value));
    return *this;
}

ByteWriter& ByteWriter::add_u64(uint64_t value) {
    uint64_t be_value = detail::htonll_local(value);
    buffer_.insert(buffer_.end(), reinterpret_cast<uint8_t*>(&be_value), reinterpret_cast<uint8_t*>(&be_value) + sizeof(be_value));
    return *this;
}

ByteWriter& ByteWriter::add_bytes(const byte_vector& value) {
    add_u64(static_cast<uint64_t>(value.size()));
    buffer_.insert(buffer_.end(), value.begin(), value.end());
    return *this;
}

ByteWriter& ByteWriter::add_bytes(const std::string& value) {
    return add_bytes(byte_vector(value.begin(), value.end()));
}

byte_vector ByteWriter::take() {
    return std::move(buffer_);
}


// --- ByteReader ---

ByteReader::ByteReader(const byte_vector& data, size_t offset) : data_(data), offset_(offset) {}

void ByteReader::require(size_t n) const {
    if (n > data_.size() - offset_) {
        throw CodecError("Invalid encoding: unexpected end of data.");
    }
}

uint8_t ByteReader::read_u8() {
    require(sizeof(uint8_t));
    return data_[offset_++];
}

uint16_t ByteReader::read_u16() {
    require(sizeof(uint16_t));
    uint16_t be_value;
    std::copy(data_.begin() + offset_, data_.begin() + offset_ + sizeof(uint16_t), reinterpret_cast<uint8_t*>(&be_value));
    offset_ += sizeof(uint16_t);
    return ntohs(be_value);
}

uint32_t ByteReader::read_u32() {
    require(sizeof(uint32_t));
    uint32_t be_value;
    std::copy(data_.begin() + offset_, data_.begin() + offset_ + sizeof(uint32_t), reinterpret_cast<uint8_t*>(&be_value));
    offset_ += sizeof(uint32_t);
    return ntohl(be_value);
}

uint64_t ByteReader::read_u64() {
    require(sizeof(uint64_t));
    uint64_t be_value;
    std::copy(data_.begin() + offset_, data_.begin() + offset_ + sizeof(uint64_t), reinterpret_cast<uint8_t*>(&be_value));
    offset_ += sizeof(uint64_t);
    return detail::ntohll_local(be_value);
}

byte_vector ByteReader::read_bytes() {
    uint64_t len = read_u64();
    if (len > remaining()) {
        offset_ = data_.size(); // Prevent further reads
        throw CodecError("Invalid encoding: length prefix exceeds remaining data.");
    }
    byte_vector out(data_.begin() + offset_, data_.begin() + offset_ + len);
    offset_ += len;
    return out;
}

std::string ByteReader::read_string() {
    byte_vector vec = read_bytes();
    return std::string(vec.begin(), vec.end());
}

uint64_t ByteReader::read_count(size_t min_element_size) {
    uint64_t count = read_u64();
    if (min_element_size > 0 && count > remaining() / min_element_size) {
        throw CodecError("Invalid encoding: element count exceeds remaining data.");
    }
    return count;
}

bool ByteReader::has_more() const {
    return offset_ < data_.size();
}

size_t ByteReader::remaining() const {
    return data_.size() - offset_;
}


// --- Frame ---

byte_vector Frame::serialize() const {
    byte_vector buffer;
    buffer.reserve(sizeof(op_code) + body.size());

    uint16_t be_op_code = htons(op_code);
    buffer.insert(buffer.end(), reinterpret_cast<const uint8_t*>(&be_op_code), reinterpret_cast<const uint8_t*>(&be_op_code) + sizeof(be_op_code));
    buffer.insert(buffer.end(), body.begin(), body.end());

    return buffer;
}

Frame Frame::deserialize(const byte_vector& data) {
    if (data.size() < sizeof(OpCode)) {
        throw CodecError("Data too small to be a valid frame.");
    }

    Frame frame;
    uint16_t be_op_code;
    std::copy(data.begin(), data.begin() + sizeof(OpCode), reinterpret_cast<uint8_t*>(&be_op_code));
    frame.op_code = ntohs(be_op_code);

    frame.body.assign(data.begin() + sizeof(OpCode), data.end());

    return frame;
}


// --- Hex ---

std::string to_hex(const byte_vector& data) {
    std::string out(data.size() * 2 + 1, '\0');
    sodium_bin2hex(out.data(), out.size(), data.data(), data.size());
    out.pop_back();  // Drop the terminator written by sodium_bin2hex
    return out;
}

byte_vector from_hex(const std::string& hex) {
    byte_vector out(hex.size() / 2);
    size_t bin_len = 0;
    if (sodium_hex2bin(out.data(), out.size(), hex.data(), hex.size(), nullptr, &bin_len, nullptr) != 0) {
        throw CodecError("Invalid hex string.");
    }
    out.resize(bin_len);
    return out;
}

} // namespace CruxEnclave

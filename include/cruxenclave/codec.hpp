#ifndef CRUXENCLAVE_CODEC_HPP
#define CRUXENCLAVE_CODEC_HPP

#include <vector>
#include <cstdint>
#include <string>
#include <arpa/inet.h>
#include "errors.hpp"

namespace CruxEnclave {

    namespace detail {
        #if __BYTE_ORDER__ == __ORDER_LITTLE_ENDIAN__
        inline uint64_t htonll_local(uint64_t val) {
            return (((uint64_t)htonl(val)) << 32) + htonl(val >> 32);
        }
        inline uint64_t ntohll_local(uint64_t val) {
            return (((uint64_t)ntohl(val)) << 32) + ntohl(val >> 32);
        }
        #else
        inline uint64_t htonll_local(uint64_t val) { return val; }
        inline uint64_t ntohll_local(uint64_t val) { return val; }
        #endif
    }

    // Using a simple vector of bytes for data representation.
    using byte_vector = std::vector<uint8_t>;

    /**
     * @brief Appends big-endian integers and u64-length-prefixed byte strings.
     */
    class ByteWriter {
    public:
        ByteWriter& add_u8(uint8_t value);
        ByteWriter& add_u16(uint16_t value);
        ByteWriter& add_u32(uint32_t value);
        ByteWriter& add_u64(uint64_t value);

        // Writes a u64 length followed by the raw bytes.
        ByteWriter& add_bytes(const byte_vector& value);
        ByteWriter& add_bytes(const std::string& value);

        const byte_vector& data() const { return buffer_; }
        byte_vector take();

    private:
        byte_vector buffer_;
    };

    /**
     * @brief Reads back what a ByteWriter produced.
     * All read methods throw CodecError when the input is truncated.
     */
    class ByteReader {
    public:
        explicit ByteReader(const byte_vector& data, size_t offset = 0);

        uint8_t read_u8();
        uint16_t read_u16();
        uint32_t read_u32();
        uint64_t read_u64();
        byte_vector read_bytes();
        std::string read_string();

        // Reads a u64 element count, rejecting counts the remaining input cannot hold.
        uint64_t read_count(size_t min_element_size);

        bool has_more() const;
        size_t remaining() const;

    private:
        void require(size_t n) const;

        const byte_vector& data_;
        size_t offset_;
    };

    /**
     * @brief A transport frame.
     * Format: [OpCode (2)] + [Body (N)]
     */
    class Frame {
    public:
        using OpCode = uint16_t;

        OpCode op_code = 0;
        byte_vector body;

        byte_vector serialize() const;

        /**
         * @brief Deserializes a byte vector into a Frame.
         * @throws CruxEnclave::CodecError if the data is too small.
         */
        static Frame deserialize(const byte_vector& data);
    };

    namespace OpCodes {
        constexpr Frame::OpCode PUSH_PAYLOAD = 0x0101;
        constexpr Frame::OpCode PARTY_INFO = 0x0102;
        constexpr Frame::OpCode STORE = 0x0201;
        constexpr Frame::OpCode RETRIEVE = 0x0202;
        constexpr Frame::OpCode DELETE = 0x0203;
        constexpr Frame::OpCode RESPONSE = 0xFFFF;
    }

    /**
     * @brief Hex helpers shared by key identifiers and store paths.
     */
    std::string to_hex(const byte_vector& data);

    /**
     * @throws CruxEnclave::CodecError on odd length or a non-hex character.
     */
    byte_vector from_hex(const std::string& hex);

} // namespace CruxEnclave

#endif // CRUXENCLAVE_CODEC_HPP

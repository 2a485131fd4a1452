#ifndef __SSP_WIRE_CODEC__
#define __SSP_WIRE_CODEC__

#include "Headers.hpp"

namespace ssp {
/**
 * @brief Message type tag stored in byte 12 of every wire header.
 */
enum class MessageType : uint8_t {
  INPUT = 0,
  OUTPUT = 1,
  RESIZE = 2,
  SIGNAL = 3,
  EXIT = 4,
  /** @brief Any tag this binary does not understand. */
  UNKNOWN = 255
};

/** @brief Owned form of a protocol message, used on the encode side. */
struct WireMessage {
  MessageType type;
  uint64_t timestamp;
  string payload;
};

/**
 * @brief Decoded message that points into the buffer it was decoded from.
 *
 * The view is only valid while that buffer is alive and unmodified.
 */
struct WireMessageView {
  uint32_t totalLength;
  uint64_t timestamp;
  MessageType type;
  const char* payloadData;
  size_t payloadLength;

  /** @brief Copies the payload out of the backing buffer. */
  inline string payload() const { return string(payloadData, payloadLength); }
};

/**
 * @brief Encodes and decodes the fixed-header SSP wire format.
 *
 * Layout (all integers little-endian):
 *   [total_length:4][timestamp_ms:8][type:1][reserved:1][payload...]
 * A batch is [count:4] followed by `count` single messages back to back.
 */
class WireCodec {
 public:
  /** @brief Size of the fixed header that precedes every payload. */
  static constexpr size_t HEADER_SIZE = 14;
  /** @brief Size of the message count that prefixes a batch. */
  static constexpr size_t BATCH_COUNT_SIZE = 4;

  /**
   * @brief Serializes one message. The header and payload are written into a
   * single allocation.
   */
  static string encode(MessageType type, uint64_t timestamp,
                       const string& payload);
  static string encode(const WireMessage& message) {
    return encode(message.type, message.timestamp, message.payload);
  }

  /**
   * @brief Parses one message without copying the payload.
   * @return false if the header is truncated or its length field disagrees
   * with the buffer length. `out` is left untouched in that case.
   */
  static bool decode(const char* data, size_t length, WireMessageView* out);
  static bool decode(const string& data, WireMessageView* out) {
    return decode(data.data(), data.size(), out);
  }

  /** @brief Serializes a count-prefixed batch into one allocation. */
  static string encodeBatch(const vector<WireMessage>& messages);

  /**
   * @brief Parses a count-prefixed batch. Every view points into `data`.
   * @return false if any message is malformed or bytes are left over.
   */
  static bool decodeBatch(const string& data, vector<WireMessageView>* out);

  static uint8_t messageTypeToByte(MessageType type);
  static MessageType byteToMessageType(uint8_t value);
  static string messageTypeToString(MessageType type);

 protected:
  /** @brief Writes header and payload at `dest`, returns bytes written. */
  static size_t writeMessage(char* dest, MessageType type, uint64_t timestamp,
                             const string& payload);
  static size_t encodedLength(const string& payload);
};

inline void writeLittleEndian32(char* dest, uint32_t value) {
  for (int i = 0; i < 4; i++) {
    dest[i] = char((value >> (8 * i)) & 0xff);
  }
}

inline void writeLittleEndian64(char* dest, uint64_t value) {
  for (int i = 0; i < 8; i++) {
    dest[i] = char((value >> (8 * i)) & 0xff);
  }
}

inline uint32_t readLittleEndian32(const char* src) {
  uint32_t value = 0;
  for (int i = 0; i < 4; i++) {
    value |= uint32_t(uint8_t(src[i])) << (8 * i);
  }
  return value;
}

inline uint64_t readLittleEndian64(const char* src) {
  uint64_t value = 0;
  for (int i = 0; i < 8; i++) {
    value |= uint64_t(uint8_t(src[i])) << (8 * i);
  }
  return value;
}
}  // namespace ssp

#endif  // __SSP_WIRE_CODEC__

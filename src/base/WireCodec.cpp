#include "WireCodec.hpp"

namespace ssp {
size_t WireCodec::encodedLength(const string& payload) {
  size_t total = HEADER_SIZE + payload.length();
  if (total > size_t(std::numeric_limits<uint32_t>::max())) {
    STFATAL << "Invalid message length: " << total;
  }
  return total;
}

size_t WireCodec::writeMessage(char* dest, MessageType type,
                               uint64_t timestamp, const string& payload) {
  size_t total = encodedLength(payload);
  writeLittleEndian32(dest, uint32_t(total));
  writeLittleEndian64(dest + 4, timestamp);
  dest[12] = char(messageTypeToByte(type));
  dest[13] = 0;  // reserved
  if (!payload.empty()) {
    memcpy(dest + HEADER_SIZE, payload.data(), payload.length());
  }
  return total;
}

string WireCodec::encode(MessageType type, uint64_t timestamp,
                         const string& payload) {
  string s(encodedLength(payload), '\0');
  size_t written = writeMessage(&s[0], type, timestamp, payload);
  if (written != s.length()) {
    STFATAL << "Encoded length mismatch: " << written << " != " << s.length();
  }
  return s;
}

bool WireCodec::decode(const char* data, size_t length, WireMessageView* out) {
  if (length < HEADER_SIZE) {
    return false;
  }
  uint32_t totalLength = readLittleEndian32(data);
  if (totalLength < HEADER_SIZE || size_t(totalLength) != length) {
    return false;
  }
  out->totalLength = totalLength;
  out->timestamp = readLittleEndian64(data + 4);
  out->type = byteToMessageType(uint8_t(data[12]));
  out->payloadData = data + HEADER_SIZE;
  out->payloadLength = totalLength - HEADER_SIZE;
  return true;
}

string WireCodec::encodeBatch(const vector<WireMessage>& messages) {
  size_t total = BATCH_COUNT_SIZE;
  for (const auto& it : messages) {
    total += encodedLength(it.payload);
  }
  string s(total, '\0');
  writeLittleEndian32(&s[0], uint32_t(messages.size()));
  size_t offset = BATCH_COUNT_SIZE;
  for (const auto& it : messages) {
    offset += writeMessage(&s[offset], it.type, it.timestamp, it.payload);
  }
  return s;
}

bool WireCodec::decodeBatch(const string& data, vector<WireMessageView>* out) {
  if (data.length() < BATCH_COUNT_SIZE) {
    return false;
  }
  uint32_t count = readLittleEndian32(data.data());
  vector<WireMessageView> views;
  size_t offset = BATCH_COUNT_SIZE;
  for (uint32_t i = 0; i < count; i++) {
    if (data.length() - offset < HEADER_SIZE) {
      return false;
    }
    uint32_t totalLength = readLittleEndian32(data.data() + offset);
    if (totalLength > data.length() - offset) {
      return false;
    }
    WireMessageView view;
    if (!decode(data.data() + offset, totalLength, &view)) {
      return false;
    }
    views.push_back(view);
    offset += totalLength;
  }
  if (offset != data.length()) {
    return false;
  }
  out->insert(out->end(), views.begin(), views.end());
  return true;
}

uint8_t WireCodec::messageTypeToByte(MessageType type) {
  return static_cast<uint8_t>(type);
}

MessageType WireCodec::byteToMessageType(uint8_t value) {
  switch (value) {
    case 0:
      return MessageType::INPUT;
    case 1:
      return MessageType::OUTPUT;
    case 2:
      return MessageType::RESIZE;
    case 3:
      return MessageType::SIGNAL;
    case 4:
      return MessageType::EXIT;
    default:
      return MessageType::UNKNOWN;
  }
}

string WireCodec::messageTypeToString(MessageType type) {
  switch (type) {
    case MessageType::INPUT:
      return "input";
    case MessageType::OUTPUT:
      return "output";
    case MessageType::RESIZE:
      return "resize";
    case MessageType::SIGNAL:
      return "signal";
    case MessageType::EXIT:
      return "exit";
    default:
      return "unknown";
  }
}
}  // namespace ssp

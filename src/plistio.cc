#include "plistio.hpp"

#include <cctype>
#include <cstring>
#include <fstream>
#include <istream>
#include <limits>
#include <locale>
#include <ostream>
#include <sstream>

namespace libplistio {

// ============================================================================
// ERRORS
// ============================================================================

const char *errorKindName(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::Io:
    return "I/O error";
  case ErrorKind::UnexpectedEof:
    return "unexpected end of input";
  case ErrorKind::InvalidData:
    return "invalid data";
  case ErrorKind::WrongType:
    return "wrong type";
  }
  return "unknown error";
}

Error::Error(ErrorKind kind, const std::string &message)
    : std::runtime_error(message), mKind(kind) {}

Error::Error(ErrorKind kind, const std::string &message, uint64_t offset)
    : std::runtime_error(message + " (at byte offset " +
                         std::to_string(offset) + ")"),
      mKind(kind), mOffset(offset) {}

// ============================================================================
// UTILITY FUNCTIONS
// ============================================================================

std::string base64_encode(const unsigned char *data, size_t len) {
  static const char base64_chars[] =
      "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
  std::string encoded;
  encoded.reserve(((len + 2) / 3) * 4);

  for (size_t i = 0; i < len; i += 3) {
    uint32_t triple = (i + 0 < len ? (data[i] << 16) : 0) |
                      (i + 1 < len ? (data[i + 1] << 8) : 0) |
                      (i + 2 < len ? data[i + 2] : 0);

    encoded += base64_chars[(triple >> 18) & 0x3F];
    encoded += base64_chars[(triple >> 12) & 0x3F];
    encoded += (i + 1 < len) ? base64_chars[(triple >> 6) & 0x3F] : '=';
    encoded += (i + 2 < len) ? base64_chars[triple & 0x3F] : '=';
  }
  return encoded;
}

std::vector<uint8_t> base64_decode(const std::string &data) {
  const std::string chars =
      "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
  std::vector<uint8_t> result;
  result.reserve(data.size() / 4 * 3);
  uint32_t val = 0;
  int valb = -8;
  for (char c : data) {
    if (c == '=')
      break;
    if (c == ' ' || c == '\t' || c == '\n' || c == '\r')
      continue;
    auto pos = chars.find(c);
    if (pos == std::string::npos) {
      throw Error(ErrorKind::InvalidData,
                  std::string("Invalid base64 character '") + c + "'");
    }
    val = (val << 6) + static_cast<uint32_t>(pos);
    valb += 6;
    if (valb >= 0) {
      result.push_back(static_cast<uint8_t>((val >> valb) & 0xFF));
      valb -= 8;
    }
  }
  return result;
}

std::string encode_xml_entities(const std::string &text) {
  std::string result;
  result.reserve(static_cast<size_t>(text.size() * 1.2));

  for (char c : text) {
    switch (c) {
    case '&':
      result += "&amp;";
      break;
    case '<':
      result += "&lt;";
      break;
    case '>':
      result += "&gt;";
      break;
    case '"':
      result += "&quot;";
      break;
    case '\'':
      result += "&apos;";
      break;
    case '\r':
      // A raw CR would be read back as a line feed.
      result += "&#13;";
      break;
    default:
      result += c;
      break;
    }
  }

  return result;
}

std::optional<double> parse_decimal_real(const std::string &text) {
  size_t start = (!text.empty() && (text[0] == '+' || text[0] == '-')) ? 1 : 0;
  std::string word;
  for (size_t i = start; i < text.size(); ++i) {
    word += static_cast<char>(
        std::tolower(static_cast<unsigned char>(text[i])));
  }
  bool negative = start == 1 && text[0] == '-';
  if (word == "nan") {
    return std::numeric_limits<double>::quiet_NaN();
  }
  if (word == "inf" || word == "infinity") {
    double inf = std::numeric_limits<double>::infinity();
    return negative ? -inf : inf;
  }

  std::istringstream ss(text);
  ss.imbue(std::locale::classic());
  double value;
  if (text.empty() || std::isspace(static_cast<unsigned char>(text[0])) ||
      !(ss >> value) || ss.peek() != std::char_traits<char>::eof()) {
    return std::nullopt;
  }
  return value;
}

std::string utf16_to_utf8(const std::u16string &text) {
  std::string result;
  result.reserve(text.size());

  for (size_t i = 0; i < text.size(); ++i) {
    uint32_t cp = text[i];
    if (cp >= 0xD800 && cp <= 0xDBFF) {
      if (i + 1 >= text.size() || text[i + 1] < 0xDC00 ||
          text[i + 1] > 0xDFFF) {
        throw Error(ErrorKind::InvalidData, "Unpaired UTF-16 high surrogate");
      }
      cp = 0x10000 + ((cp - 0xD800) << 10) + (text[++i] - 0xDC00);
    } else if (cp >= 0xDC00 && cp <= 0xDFFF) {
      throw Error(ErrorKind::InvalidData, "Unpaired UTF-16 low surrogate");
    }

    if (cp < 0x80) {
      result += static_cast<char>(cp);
    } else if (cp < 0x800) {
      result += static_cast<char>(0xC0 | (cp >> 6));
      result += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
      result += static_cast<char>(0xE0 | (cp >> 12));
      result += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
      result += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
      result += static_cast<char>(0xF0 | (cp >> 18));
      result += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
      result += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
      result += static_cast<char>(0x80 | (cp & 0x3F));
    }
  }
  return result;
}

std::u16string utf8_to_utf16(const std::string &text) {
  std::u16string result;
  result.reserve(text.size());

  size_t i = 0;
  while (i < text.size()) {
    uint8_t lead = static_cast<uint8_t>(text[i]);
    uint32_t cp;
    size_t extra;
    if (lead < 0x80) {
      cp = lead;
      extra = 0;
    } else if ((lead & 0xE0) == 0xC0) {
      cp = lead & 0x1F;
      extra = 1;
    } else if ((lead & 0xF0) == 0xE0) {
      cp = lead & 0x0F;
      extra = 2;
    } else if ((lead & 0xF8) == 0xF0) {
      cp = lead & 0x07;
      extra = 3;
    } else {
      throw Error(ErrorKind::InvalidData, "Invalid UTF-8 lead byte");
    }

    if (i + extra >= text.size()) {
      throw Error(ErrorKind::InvalidData, "Truncated UTF-8 sequence");
    }
    for (size_t k = 1; k <= extra; ++k) {
      uint8_t next = static_cast<uint8_t>(text[i + k]);
      if ((next & 0xC0) != 0x80) {
        throw Error(ErrorKind::InvalidData, "Invalid UTF-8 continuation byte");
      }
      cp = (cp << 6) | (next & 0x3F);
    }
    i += extra + 1;

    if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
      throw Error(ErrorKind::InvalidData, "Invalid Unicode code point");
    }
    if (cp >= 0x10000) {
      cp -= 0x10000;
      result += static_cast<char16_t>(0xD800 + (cp >> 10));
      result += static_cast<char16_t>(0xDC00 + (cp & 0x3FF));
    } else {
      result += static_cast<char16_t>(cp);
    }
  }
  return result;
}

// ============================================================================
// STREAM WRAPPERS
// ============================================================================

DataInput::DataInput(std::istream &is) : input_stream(is) {}

void DataInput::readExact(uint8_t *buffer, size_t length) {
  input_stream.read(reinterpret_cast<char *>(buffer),
                    static_cast<std::streamsize>(length));
  if (static_cast<size_t>(input_stream.gcount()) != length) {
    throw Error(ErrorKind::UnexpectedEof,
                "Expected " + std::to_string(length) + " bytes, got " +
                    std::to_string(input_stream.gcount()));
  }
}

uint8_t DataInput::readByte() {
  uint8_t value;
  readExact(&value, 1);
  return value;
}

uint64_t DataInput::readUnsigned(size_t width) {
  uint8_t bytes[8];
  readExact(bytes, width);
  uint64_t value = 0;
  for (size_t i = 0; i < width; ++i) {
    value = (value << 8) | bytes[i];
  }
  return value;
}

float DataInput::readFloat() {
  uint32_t int_value = static_cast<uint32_t>(readUnsigned(4));
  float result;
  std::memcpy(&result, &int_value, sizeof(float));
  return result;
}

double DataInput::readDouble() {
  uint64_t int_value = readUnsigned(8);
  double result;
  std::memcpy(&result, &int_value, sizeof(double));
  return result;
}

std::vector<uint8_t> DataInput::readBytes(size_t length) {
  std::vector<uint8_t> data(length);
  if (length > 0) {
    readExact(data.data(), length);
  }
  return data;
}

void DataInput::seek(uint64_t offset) {
  input_stream.seekg(static_cast<std::streamoff>(offset), std::ios::beg);
  if (!input_stream) {
    throw Error(ErrorKind::Io,
                "Failed to seek to offset " + std::to_string(offset));
  }
}

uint64_t DataInput::tell() {
  std::streampos pos = input_stream.tellg();
  if (pos == std::streampos(-1)) {
    throw Error(ErrorKind::Io, "Failed to query stream position");
  }
  return static_cast<uint64_t>(pos);
}

uint64_t DataInput::size() {
  uint64_t current = tell();
  input_stream.seekg(0, std::ios::end);
  std::streampos end = input_stream.tellg();
  if (!input_stream || end == std::streampos(-1)) {
    throw Error(ErrorKind::Io, "Failed to determine stream size");
  }
  seek(current);
  return static_cast<uint64_t>(end);
}

DataOutput::DataOutput(std::ostream &os) : output_stream(os) {}

void DataOutput::writeByte(uint8_t value) {
  output_stream.write(reinterpret_cast<const char *>(&value), 1);
  mPosition += 1;
}

void DataOutput::writeUnsigned(uint64_t value, size_t width) {
  for (size_t i = width; i > 0; i--) {
    writeByte(static_cast<uint8_t>((value >> ((i - 1) * 8)) & 0xFF));
  }
}

void DataOutput::writeDouble(double value) {
  uint64_t int_value;
  std::memcpy(&int_value, &value, sizeof(double));
  writeUnsigned(int_value, 8);
}

void DataOutput::write(const uint8_t *data, size_t length) {
  output_stream.write(reinterpret_cast<const char *>(data),
                      static_cast<std::streamsize>(length));
  mPosition += length;
}

void DataOutput::flush() {
  output_stream.flush();
  if (!output_stream) {
    throw Error(ErrorKind::Io, "Failed to write to output stream");
  }
}

// ============================================================================
// HIGH-LEVEL API
// ============================================================================

uint64_t copyEvents(Reader &reader, Writer &writer) {
  uint64_t count = 0;
  while (std::optional<Event> event = reader.next()) {
    writer.write(*event);
    ++count;
  }
  return count;
}

Value readValue(std::unique_ptr<std::istream> input,
                const ReaderOptions &options) {
  Reader reader(std::move(input), options);
  return Value::fromReader(reader);
}

Value readValueFromFile(const std::string &path,
                        const ReaderOptions &options) {
  auto file = std::make_unique<std::ifstream>(path, std::ios::binary);
  if (!*file) {
    throw Error(ErrorKind::Io, "Failed to open file: " + path);
  }
  return readValue(std::move(file), options);
}

Value readValueFromString(const std::string &bytes,
                          const ReaderOptions &options) {
  return readValue(std::make_unique<std::istringstream>(
                       bytes, std::ios::in | std::ios::binary),
                   options);
}

void writeXml(Value value, std::ostream &output,
              const XmlWriterOptions &options) {
  XmlWriter writer(output, options);
  for (const Event &event : std::move(value).intoEvents()) {
    writer.write(event);
  }
}

void writeBinary(Value value, std::ostream &output) {
  BinaryWriter writer(output);
  for (const Event &event : std::move(value).intoEvents()) {
    writer.write(event);
  }
}

std::string toXmlString(Value value, const XmlWriterOptions &options) {
  std::ostringstream out;
  writeXml(std::move(value), out, options);
  return out.str();
}

std::string toBinaryString(Value value) {
  std::ostringstream out(std::ios::out | std::ios::binary);
  writeBinary(std::move(value), out);
  return out.str();
}

void convertToXml(std::unique_ptr<std::istream> input, std::ostream &output,
                  const ReaderOptions &reader_options,
                  const XmlWriterOptions &writer_options) {
  Reader reader(std::move(input), reader_options);
  XmlWriter writer(output, writer_options);
  copyEvents(reader, writer);
  if (!writer.isComplete()) {
    throw Error(ErrorKind::UnexpectedEof,
                "Input ended before a complete property list");
  }
}

void convertToBinary(std::unique_ptr<std::istream> input, std::ostream &output,
                     const ReaderOptions &reader_options) {
  Reader reader(std::move(input), reader_options);
  BinaryWriter writer(output);
  copyEvents(reader, writer);
  if (!writer.isComplete()) {
    throw Error(ErrorKind::UnexpectedEof,
                "Input ended before a complete property list");
  }
}

} // namespace libplistio

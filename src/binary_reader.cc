#include "plistio.hpp"

#include <cstring>
#include <istream>

namespace libplistio {

// ============================================================================
// BINARY READER
// ============================================================================

const uint8_t BinaryReader::MAGIC[8] = {'b', 'p', 'l', 'i',
                                        's', 't', '0', '0'};

namespace {

// Object markers (high nibble)
const uint8_t MARKER_SIMPLE = 0x00;
const uint8_t MARKER_INT = 0x10;
const uint8_t MARKER_REAL = 0x20;
const uint8_t MARKER_DATE = 0x30;
const uint8_t MARKER_DATA = 0x40;
const uint8_t MARKER_ASCII_STRING = 0x50;
const uint8_t MARKER_UTF16_STRING = 0x60;
const uint8_t MARKER_ARRAY = 0xA0;
const uint8_t MARKER_DICT = 0xD0;

const uint8_t SIMPLE_FALSE = 0x08;
const uint8_t SIMPLE_TRUE = 0x09;

const size_t HEADER_SIZE = 8;
const size_t TRAILER_SIZE = 32;

} // anonymous namespace

BinaryReader::BinaryReader(std::unique_ptr<std::istream> stream,
                           const ReaderOptions &options)
    : mStream(std::move(stream)), mOptions(options),
      mIn(std::make_unique<DataInput>(*mStream)) {}

void BinaryReader::readTrailer() {
  uint64_t file_size = mIn->size();
  if (file_size < HEADER_SIZE + TRAILER_SIZE) {
    throw Error(ErrorKind::InvalidData, "Binary plist is too short", 0);
  }

  uint8_t magic[8];
  mIn->seek(0);
  mIn->readExact(magic, sizeof(magic));
  if (std::memcmp(magic, MAGIC, sizeof(magic)) != 0) {
    throw Error(ErrorKind::InvalidData,
                "Invalid binary plist - magic header mismatch", 0);
  }

  uint64_t trailer_offset = file_size - TRAILER_SIZE;
  mIn->seek(trailer_offset + 6);
  size_t offset_size = mIn->readByte();
  mRefSize = mIn->readByte();
  uint64_t num_objects = mIn->readUnsigned(8);
  mTopObject = mIn->readUnsigned(8);
  uint64_t table_offset = mIn->readUnsigned(8);

  if (offset_size < 1 || offset_size > 8 || mRefSize < 1 || mRefSize > 8) {
    throw Error(ErrorKind::InvalidData,
                "Invalid offset or object reference size in trailer",
                trailer_offset);
  }
  if (num_objects == 0 || mTopObject >= num_objects) {
    throw Error(ErrorKind::InvalidData,
                "Top object is outside the object table", trailer_offset);
  }
  if (table_offset < HEADER_SIZE || table_offset > trailer_offset ||
      num_objects > (trailer_offset - table_offset) / offset_size) {
    throw Error(ErrorKind::InvalidData,
                "Offset table does not fit in the file", trailer_offset);
  }
  if (mRefSize < 8 && num_objects - 1 > (uint64_t(1) << (mRefSize * 8)) - 1 &&
      mOptions.warning_callback) {
    mOptions.warning_callback(
        "Binary structure",
        "Object references are " + std::to_string(mRefSize) +
            " bytes wide but the file declares " +
            std::to_string(num_objects) + " objects");
  }

  mObjectAreaEnd = table_offset;
  mOffsets.clear();
  mOffsets.reserve(static_cast<size_t>(num_objects));
  mIn->seek(table_offset);
  for (uint64_t i = 0; i < num_objects; ++i) {
    uint64_t offset = mIn->readUnsigned(offset_size);
    if (offset < HEADER_SIZE || offset >= mObjectAreaEnd) {
      throw Error(ErrorKind::InvalidData,
                  "Object " + std::to_string(i) +
                      " lies outside the object area",
                  table_offset + i * offset_size);
    }
    mOffsets.push_back(offset);
  }
}

uint64_t BinaryReader::readLength(uint8_t marker) {
  uint8_t info = marker & 0x0F;
  if (info != 0x0F) {
    return info;
  }

  uint64_t at = mIn->tell();
  uint8_t int_marker = mIn->readByte();
  if ((int_marker & 0xF0) != MARKER_INT || (int_marker & 0x0F) > 3) {
    throw Error(ErrorKind::InvalidData, "Invalid length marker", at);
  }
  return mIn->readUnsigned(size_t(1) << (int_marker & 0x0F));
}

Event BinaryReader::readObject(uint64_t ref, bool isKey) {
  if (ref >= mOffsets.size()) {
    throw Error(ErrorKind::InvalidData,
                "Object reference " + std::to_string(ref) + " out of range");
  }

  uint64_t offset = mOffsets[ref];
  mIn->seek(offset);
  uint8_t marker = mIn->readByte();
  uint8_t kind = marker & 0xF0;
  uint8_t info = marker & 0x0F;

  auto remaining = [this]() -> uint64_t {
    uint64_t at = mIn->tell();
    return at >= mObjectAreaEnd ? 0 : mObjectAreaEnd - at;
  };

  if (isKey && kind != MARKER_ASCII_STRING && kind != MARKER_UTF16_STRING) {
    throw Error(ErrorKind::InvalidData, "Dictionary key is not a string",
                offset);
  }

  switch (kind) {
  case MARKER_SIMPLE:
    if (marker == SIMPLE_FALSE) {
      return Event::boolean(false);
    }
    if (marker == SIMPLE_TRUE) {
      return Event::boolean(true);
    }
    break;

  case MARKER_INT:
    if (info <= 2) {
      return Event::integer(
          static_cast<int64_t>(mIn->readUnsigned(size_t(1) << info)));
    }
    if (info == 3) {
      return Event::integer(static_cast<int64_t>(mIn->readUnsigned(8)));
    }
    if (info == 4) {
      // 128-bit integers are accepted when they fit in 64 bits.
      uint64_t high = mIn->readUnsigned(8);
      uint64_t low = mIn->readUnsigned(8);
      bool negative = (low >> 63) != 0;
      if ((high == 0 && !negative) || (high == ~uint64_t(0) && negative)) {
        return Event::integer(static_cast<int64_t>(low));
      }
      throw Error(ErrorKind::InvalidData, "Integer does not fit in 64 bits",
                  offset);
    }
    break;

  case MARKER_REAL:
    if (info == 2) {
      return Event::real(mIn->readFloat());
    }
    if (info == 3) {
      return Event::real(mIn->readDouble());
    }
    break;

  case MARKER_DATE:
    if (info == 3) {
      return Event::date(Date::fromSecondsSincePlistEpoch(mIn->readDouble()));
    }
    break;

  case MARKER_DATA: {
    uint64_t length = readLength(marker);
    if (length > remaining()) {
      throw Error(ErrorKind::InvalidData, "Data extends past the object area",
                  offset);
    }
    return Event::data(mIn->readBytes(static_cast<size_t>(length)));
  }

  case MARKER_ASCII_STRING: {
    uint64_t length = readLength(marker);
    if (length > remaining()) {
      throw Error(ErrorKind::InvalidData,
                  "String extends past the object area", offset);
    }
    std::vector<uint8_t> bytes = mIn->readBytes(static_cast<size_t>(length));
    return Event::string(std::string(bytes.begin(), bytes.end()));
  }

  case MARKER_UTF16_STRING: {
    uint64_t length = readLength(marker);
    if (length > remaining() / 2) {
      throw Error(ErrorKind::InvalidData,
                  "String extends past the object area", offset);
    }
    std::u16string units;
    units.reserve(static_cast<size_t>(length));
    for (uint64_t i = 0; i < length; ++i) {
      units += static_cast<char16_t>(mIn->readUnsigned(2));
    }
    return Event::string(utf16_to_utf8(units));
  }

  case MARKER_ARRAY:
  case MARKER_DICT: {
    bool is_dict = kind == MARKER_DICT;
    uint64_t length = readLength(marker);
    uint64_t ref_count = is_dict ? length * 2 : length;
    if (length > mObjectAreaEnd || ref_count > remaining() / mRefSize) {
      throw Error(ErrorKind::InvalidData,
                  "Container extends past the object area", offset);
    }
    for (const Frame &frame : mStack) {
      if (frame.ref == ref) {
        throw Error(ErrorKind::InvalidData,
                    "Object " + std::to_string(ref) + " contains itself",
                    offset);
      }
    }

    std::vector<uint64_t> refs(static_cast<size_t>(ref_count));
    for (uint64_t &child : refs) {
      child = mIn->readUnsigned(mRefSize);
    }

    Frame frame{ref, is_dict, {}, 0};
    if (is_dict) {
      // Stored as all keys followed by all values; hand them out in pairs.
      frame.children.reserve(refs.size());
      for (size_t i = 0; i < length; ++i) {
        frame.children.push_back(refs[i]);
        frame.children.push_back(refs[length + i]);
      }
    } else {
      frame.children = std::move(refs);
    }
    mStack.push_back(std::move(frame));

    return is_dict ? Event::startDictionary(length) : Event::startArray(length);
  }

  default:
    break;
  }

  throw Error(ErrorKind::InvalidData,
              "Unsupported object marker " + std::to_string(marker), offset);
}

std::optional<Event> BinaryReader::next() {
  if (mFinished) {
    return std::nullopt;
  }

  if (!mStarted) {
    readTrailer();
    mStarted = true;
    return readObject(mTopObject, false);
  }

  if (mStack.empty()) {
    mFinished = true;
    return std::nullopt;
  }

  Frame &top = mStack.back();
  if (top.position == top.children.size()) {
    bool is_dict = top.isDictionary;
    mStack.pop_back();
    return is_dict ? Event::endDictionary() : Event::endArray();
  }

  uint64_t ref = top.children[top.position];
  bool is_key = top.isDictionary && top.position % 2 == 0;
  top.position++;
  return readObject(ref, is_key);
}

} // namespace libplistio

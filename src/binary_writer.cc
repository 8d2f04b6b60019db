#include "plistio.hpp"

#include <ostream>

namespace libplistio {

// ============================================================================
// BINARY WRITER
// ============================================================================

namespace {

// One entry per object in the output, numbered in pre-order. Strings are
// shared, so `string` points either at a dictionary key or at a String value.
struct ObjectEntry {
  const Value *value = nullptr;
  const std::string *string = nullptr;
  std::vector<uint64_t> refs;
};

class ObjectTable {
private:
  std::vector<ObjectEntry> mEntries;
  std::unordered_map<std::string, uint64_t> mStringIds;

public:
  uint64_t addString(const std::string &str) {
    auto it = mStringIds.find(str);
    if (it != mStringIds.end()) {
      return it->second;
    }
    uint64_t id = mEntries.size();
    ObjectEntry entry;
    entry.string = &str;
    mEntries.push_back(std::move(entry));
    mStringIds.emplace(str, id);
    return id;
  }

  uint64_t add(const Value &value) {
    if (value.isString()) {
      return addString(value.asString());
    }

    uint64_t id = mEntries.size();
    mEntries.emplace_back();
    mEntries[id].value = &value;

    std::vector<uint64_t> refs;
    if (value.isArray()) {
      refs.reserve(value.asArray().size());
      for (const Value &element : value.asArray()) {
        refs.push_back(add(element));
      }
    } else if (value.isDictionary()) {
      const Dictionary &dict = value.asDictionary();
      refs.reserve(dict.size() * 2);
      for (const Dictionary::Entry &entry : dict) {
        refs.push_back(addString(entry.first));
      }
      for (const Dictionary::Entry &entry : dict) {
        refs.push_back(add(entry.second));
      }
    }
    mEntries[id].refs = std::move(refs);
    return id;
  }

  const std::vector<ObjectEntry> &entries() const { return mEntries; }
};

// Smallest of 1, 2, 4 or 8 bytes that can hold `value`.
size_t width_for(uint64_t value) {
  if (value <= 0xFF)
    return 1;
  if (value <= 0xFFFF)
    return 2;
  if (value <= 0xFFFFFFFFULL)
    return 4;
  return 8;
}

uint8_t width_exponent(size_t width) {
  switch (width) {
  case 1:
    return 0;
  case 2:
    return 1;
  case 4:
    return 2;
  default:
    return 3;
  }
}

bool is_ascii(const std::string &str) {
  for (char c : str) {
    if (static_cast<unsigned char>(c) >= 0x80)
      return false;
  }
  return true;
}

void write_unsigned_int(DataOutput &out, uint64_t value) {
  size_t width = width_for(value);
  out.writeByte(0x10 | width_exponent(width));
  out.writeUnsigned(value, width);
}

void write_marker(DataOutput &out, uint8_t kind, uint64_t count) {
  if (count < 15) {
    out.writeByte(kind | static_cast<uint8_t>(count));
  } else {
    out.writeByte(kind | 0x0F);
    write_unsigned_int(out, count);
  }
}

void write_string(DataOutput &out, const std::string &str) {
  if (is_ascii(str)) {
    write_marker(out, 0x50, str.size());
    out.write(reinterpret_cast<const uint8_t *>(str.data()), str.size());
  } else {
    std::u16string units = utf8_to_utf16(str);
    write_marker(out, 0x60, units.size());
    for (char16_t unit : units) {
      out.writeUnsigned(unit, 2);
    }
  }
}

} // anonymous namespace

BinaryWriter::BinaryWriter(std::ostream &os) : mOut(os) {}

void BinaryWriter::write(const Event &event) {
  if (mFinished) {
    throw Error(ErrorKind::InvalidData,
                std::string("Unexpected ") + eventTypeName(event.type()) +
                    " after the root value was written");
  }
  mBuilder.write(event);
  if (mBuilder.isComplete()) {
    serialize(mBuilder.takeValue());
    mFinished = true;
  }
}

void BinaryWriter::serialize(const Value &root) {
  ObjectTable table;
  table.add(root);
  const std::vector<ObjectEntry> &entries = table.entries();
  size_t ref_size = width_for(entries.size() - 1);

  mOut.write(BinaryReader::MAGIC, sizeof(BinaryReader::MAGIC));

  std::vector<uint64_t> offsets;
  offsets.reserve(entries.size());
  for (const ObjectEntry &entry : entries) {
    offsets.push_back(mOut.position());

    if (entry.string) {
      write_string(mOut, *entry.string);
      continue;
    }

    const Value &value = *entry.value;
    switch (value.type()) {
    case ValueType::Array:
    case ValueType::Dictionary:
      write_marker(mOut, value.isArray() ? 0xA0 : 0xD0,
                   value.isArray() ? entry.refs.size()
                                   : entry.refs.size() / 2);
      for (uint64_t ref : entry.refs) {
        mOut.writeUnsigned(ref, ref_size);
      }
      break;
    case ValueType::Boolean:
      mOut.writeByte(value.asBoolean() ? 0x09 : 0x08);
      break;
    case ValueType::Data:
      write_marker(mOut, 0x40, value.asData().size());
      mOut.write(value.asData().data(), value.asData().size());
      break;
    case ValueType::Date:
      mOut.writeByte(0x33);
      mOut.writeDouble(value.asDate().secondsSincePlistEpoch());
      break;
    case ValueType::Real:
      mOut.writeByte(0x23);
      mOut.writeDouble(value.asReal());
      break;
    case ValueType::Integer:
      if (value.asInteger() >= 0) {
        write_unsigned_int(mOut, static_cast<uint64_t>(value.asInteger()));
      } else {
        mOut.writeByte(0x13);
        mOut.writeUnsigned(static_cast<uint64_t>(value.asInteger()), 8);
      }
      break;
    case ValueType::String:
      // Strings are always routed through the shared string entries.
      write_string(mOut, value.asString());
      break;
    }
  }

  uint64_t table_offset = mOut.position();
  size_t offset_size = width_for(offsets.empty() ? 0 : offsets.back());
  for (uint64_t offset : offsets) {
    mOut.writeUnsigned(offset, offset_size);
  }

  // Trailer: 6 unused bytes, sizes, object count, top object, table offset
  for (int i = 0; i < 6; ++i) {
    mOut.writeByte(0);
  }
  mOut.writeByte(static_cast<uint8_t>(offset_size));
  mOut.writeByte(static_cast<uint8_t>(ref_size));
  mOut.writeUnsigned(entries.size(), 8);
  mOut.writeUnsigned(0, 8);
  mOut.writeUnsigned(table_offset, 8);
  mOut.flush();
}

} // namespace libplistio

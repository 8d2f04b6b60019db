#include "plistio.hpp"

#include <cmath>
#include <cstdio>

namespace libplistio {

// ============================================================================
// DATE
// ============================================================================

namespace {

// Days since 1970-01-01 for a proleptic Gregorian date.
int64_t days_from_civil(int64_t y, unsigned m, unsigned d) {
  y -= m <= 2;
  const int64_t era = (y >= 0 ? y : y - 399) / 400;
  const unsigned yoe = static_cast<unsigned>(y - era * 400);
  const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
  const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

void civil_from_days(int64_t z, int64_t &y, unsigned &m, unsigned &d) {
  z += 719468;
  const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
  const unsigned doe = static_cast<unsigned>(z - era * 146097);
  const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
  const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
  const unsigned mp = (5 * doy + 2) / 153;
  d = doy - (153 * mp + 2) / 5 + 1;
  m = mp < 10 ? mp + 3 : mp - 9;
  y = static_cast<int64_t>(yoe) + era * 400 + (m <= 2);
}

bool is_leap_year(int64_t y) {
  return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

unsigned days_in_month(int64_t y, unsigned m) {
  static const unsigned days[] = {31, 28, 31, 30, 31, 30,
                                  31, 31, 30, 31, 30, 31};
  return (m == 2 && is_leap_year(y)) ? 29 : days[m - 1];
}

// Parse exactly `count` decimal digits starting at text[pos].
bool parse_digits(const std::string &text, size_t pos, size_t count,
                  unsigned &out) {
  if (pos + count > text.size())
    return false;
  out = 0;
  for (size_t i = pos; i < pos + count; ++i) {
    if (text[i] < '0' || text[i] > '9')
      return false;
    out = out * 10 + static_cast<unsigned>(text[i] - '0');
  }
  return true;
}

// 0000-01-01T00:00:00Z and 10000-01-01T00:00:00Z.
constexpr int64_t FIRST_UNIX_SECONDS = -62167219200;
constexpr int64_t END_UNIX_SECONDS = 253402300800;

} // anonymous namespace

Date Date::fromSecondsSincePlistEpoch(double seconds) {
  using std::chrono::microseconds;
  // Checked in double first so the tick conversion below cannot overflow.
  const double first = static_cast<double>(FIRST_UNIX_SECONDS -
                                           PLIST_EPOCH_UNIX_SECONDS);
  const double end = static_cast<double>(END_UNIX_SECONDS -
                                         PLIST_EPOCH_UNIX_SECONDS);
  if (!std::isfinite(seconds) || seconds < first || seconds >= end) {
    throw Error(ErrorKind::InvalidData, "Date out of range");
  }
  microseconds since_unix =
      std::chrono::round<microseconds>(std::chrono::duration<double>(seconds)) +
      std::chrono::seconds(PLIST_EPOCH_UNIX_SECONDS);
  if (since_unix >= std::chrono::seconds(END_UNIX_SECONDS)) {
    throw Error(ErrorKind::InvalidData, "Date out of range");
  }
  return Date(TimePoint(since_unix));
}

Date Date::fromXmlFormat(const std::string &text) {
  // YYYY-MM-DDTHH:MM:SSZ
  unsigned year, month, day, hour, minute, second;
  bool ok = text.size() == 20 && parse_digits(text, 0, 4, year) &&
            text[4] == '-' && parse_digits(text, 5, 2, month) &&
            text[7] == '-' && parse_digits(text, 8, 2, day) &&
            text[10] == 'T' && parse_digits(text, 11, 2, hour) &&
            text[13] == ':' && parse_digits(text, 14, 2, minute) &&
            text[16] == ':' && parse_digits(text, 17, 2, second) &&
            text[19] == 'Z';
  if (!ok || month < 1 || month > 12 || day < 1 ||
      day > days_in_month(year, month) || hour > 23 || minute > 59 ||
      second > 59) {
    throw Error(ErrorKind::InvalidData, "Invalid date: '" + text + "'");
  }

  // Four digit years keep this inside [FIRST_UNIX_SECONDS, END_UNIX_SECONDS).
  int64_t days = days_from_civil(year, month, day);
  int64_t seconds = days * 86400 + hour * 3600 + minute * 60 + second;
  return Date(TimePoint(std::chrono::seconds(seconds)));
}

double Date::secondsSincePlistEpoch() const {
  std::chrono::microseconds since_plist =
      mTime.time_since_epoch() - std::chrono::seconds(PLIST_EPOCH_UNIX_SECONDS);
  return std::chrono::duration<double>(since_plist).count();
}

std::string Date::toXmlFormat() const {
  int64_t since_unix =
      std::chrono::floor<std::chrono::seconds>(mTime.time_since_epoch())
          .count();
  int64_t days = since_unix / 86400;
  int64_t rem = since_unix % 86400;
  if (rem < 0) {
    rem += 86400;
    days -= 1;
  }

  int64_t year;
  unsigned month, day;
  civil_from_days(days, year, month, day);

  char buffer[48];
  std::snprintf(buffer, sizeof(buffer), "%04lld-%02u-%02uT%02d:%02d:%02dZ",
                static_cast<long long>(year), month, day,
                static_cast<int>(rem / 3600), static_cast<int>(rem % 3600 / 60),
                static_cast<int>(rem % 60));
  return buffer;
}

// ============================================================================
// DICTIONARY
// ============================================================================

Dictionary::Dictionary() = default;
Dictionary::Dictionary(const Dictionary &other) = default;
Dictionary::Dictionary(Dictionary &&other) noexcept = default;
Dictionary &Dictionary::operator=(const Dictionary &other) = default;
Dictionary &Dictionary::operator=(Dictionary &&other) noexcept = default;
Dictionary::~Dictionary() = default;

size_t Dictionary::size() const { return mEntries.size(); }

bool Dictionary::empty() const { return mEntries.empty(); }

void Dictionary::reserve(size_t count) { mEntries.reserve(count); }

Value &Dictionary::insert(std::string key, Value value) {
  if (Value *existing = find(key)) {
    *existing = std::move(value);
    return *existing;
  }
  mEntries.emplace_back(std::move(key), std::move(value));
  return mEntries.back().second;
}

const Value *Dictionary::find(const std::string &key) const {
  for (const Entry &entry : mEntries) {
    if (entry.first == key)
      return &entry.second;
  }
  return nullptr;
}

Value *Dictionary::find(const std::string &key) {
  for (Entry &entry : mEntries) {
    if (entry.first == key)
      return &entry.second;
  }
  return nullptr;
}

bool Dictionary::contains(const std::string &key) const {
  return find(key) != nullptr;
}

bool Dictionary::erase(const std::string &key) {
  for (auto it = mEntries.begin(); it != mEntries.end(); ++it) {
    if (it->first == key) {
      mEntries.erase(it);
      return true;
    }
  }
  return false;
}

Dictionary::iterator Dictionary::begin() { return mEntries.begin(); }
Dictionary::iterator Dictionary::end() { return mEntries.end(); }
Dictionary::const_iterator Dictionary::begin() const {
  return mEntries.begin();
}
Dictionary::const_iterator Dictionary::end() const { return mEntries.end(); }

bool Dictionary::operator==(const Dictionary &other) const {
  return mEntries == other.mEntries;
}

// ============================================================================
// VALUE
// ============================================================================

const char *valueTypeName(ValueType type) {
  switch (type) {
  case ValueType::Array:
    return "array";
  case ValueType::Dictionary:
    return "dictionary";
  case ValueType::Boolean:
    return "boolean";
  case ValueType::Data:
    return "data";
  case ValueType::Date:
    return "date";
  case ValueType::Real:
    return "real";
  case ValueType::Integer:
    return "integer";
  case ValueType::String:
    return "string";
  }
  return "unknown";
}

namespace {

template <typename T, typename Storage>
auto &get_or_throw(Storage &storage, ValueType expected, ValueType actual) {
  if (auto ptr = std::get_if<T>(&storage))
    return *ptr;
  throw Error(ErrorKind::WrongType, std::string("Expected ") +
                                        valueTypeName(expected) + ", found " +
                                        valueTypeName(actual));
}

} // anonymous namespace

Value::Value() : mStorage(std::in_place_type<Dictionary>) {}
Value::Value(Array value)
    : mStorage(std::in_place_type<Array>, std::move(value)) {}
Value::Value(Dictionary value)
    : mStorage(std::in_place_type<Dictionary>, std::move(value)) {}
Value::Value(bool value) : mStorage(std::in_place_type<bool>, value) {}
Value::Value(Data value)
    : mStorage(std::in_place_type<Data>, std::move(value)) {}
Value::Value(Date value) : mStorage(std::in_place_type<Date>, value) {}
Value::Value(double value) : mStorage(std::in_place_type<double>, value) {}
Value::Value(std::string value)
    : mStorage(std::in_place_type<std::string>, std::move(value)) {}
Value::Value(const char *value)
    : mStorage(std::in_place_type<std::string>, value) {}

const Array &Value::asArray() const {
  return get_or_throw<Array>(mStorage, ValueType::Array, type());
}

const Dictionary &Value::asDictionary() const {
  return get_or_throw<Dictionary>(mStorage, ValueType::Dictionary,
                                        type());
}

bool Value::asBoolean() const {
  return get_or_throw<bool>(mStorage, ValueType::Boolean, type());
}

const Data &Value::asData() const {
  return get_or_throw<Data>(mStorage, ValueType::Data, type());
}

const Date &Value::asDate() const {
  return get_or_throw<Date>(mStorage, ValueType::Date, type());
}

double Value::asReal() const {
  return get_or_throw<double>(mStorage, ValueType::Real, type());
}

int64_t Value::asInteger() const {
  return get_or_throw<int64_t>(mStorage, ValueType::Integer, type());
}

const std::string &Value::asString() const {
  return get_or_throw<std::string>(mStorage, ValueType::String, type());
}

Array &Value::mutArray() {
  return get_or_throw<Array>(mStorage, ValueType::Array, type());
}

Dictionary &Value::mutDictionary() {
  return get_or_throw<Dictionary>(mStorage, ValueType::Dictionary, type());
}

Data &Value::mutData() {
  return get_or_throw<Data>(mStorage, ValueType::Data, type());
}

std::string &Value::mutString() {
  return get_or_throw<std::string>(mStorage, ValueType::String, type());
}

IntoEvents Value::intoEvents() && { return IntoEvents(std::move(*this)); }

Value Value::fromReader(Reader &reader) { return buildValue(reader); }

bool Value::operator==(const Value &other) const {
  return mStorage == other.mStorage;
}

} // namespace libplistio

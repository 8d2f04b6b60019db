#include "plistio.hpp"

#include <algorithm>
#include <ostream>

namespace libplistio {

// ============================================================================
// EVENT
// ============================================================================

const char *eventTypeName(EventType type) {
  switch (type) {
  case EventType::StartArray:
    return "StartArray";
  case EventType::EndArray:
    return "EndArray";
  case EventType::StartDictionary:
    return "StartDictionary";
  case EventType::EndDictionary:
    return "EndDictionary";
  case EventType::Boolean:
    return "BooleanValue";
  case EventType::Data:
    return "DataValue";
  case EventType::Date:
    return "DateValue";
  case EventType::Integer:
    return "IntegerValue";
  case EventType::Real:
    return "RealValue";
  case EventType::String:
    return "StringValue";
  }
  return "Unknown";
}

Event::Event(EventType type, Payload payload)
    : mType(type), mPayload(std::move(payload)) {}

Event Event::startArray(std::optional<uint64_t> length) {
  return Event(EventType::StartArray,
               Payload(std::in_place_type<std::optional<uint64_t>>, length));
}

Event Event::endArray() { return Event(EventType::EndArray, Payload()); }

Event Event::startDictionary(std::optional<uint64_t> length) {
  return Event(EventType::StartDictionary,
               Payload(std::in_place_type<std::optional<uint64_t>>, length));
}

Event Event::endDictionary() {
  return Event(EventType::EndDictionary, Payload());
}

Event Event::boolean(bool value) {
  return Event(EventType::Boolean, Payload(std::in_place_type<bool>, value));
}

Event Event::data(Data value) {
  return Event(EventType::Data,
               Payload(std::in_place_type<Data>, std::move(value)));
}

Event Event::date(Date value) {
  return Event(EventType::Date, Payload(std::in_place_type<Date>, value));
}

Event Event::integer(int64_t value) {
  return Event(EventType::Integer,
               Payload(std::in_place_type<int64_t>, value));
}

Event Event::real(double value) {
  return Event(EventType::Real, Payload(std::in_place_type<double>, value));
}

Event Event::string(std::string value) {
  return Event(EventType::String,
               Payload(std::in_place_type<std::string>, std::move(value)));
}

namespace {

template <typename T, typename Payload>
const T &payload_or_throw(const Payload &payload, EventType actual,
                          const char *wanted) {
  if (auto ptr = std::get_if<T>(&payload))
    return *ptr;
  throw Error(ErrorKind::WrongType, std::string("Expected ") + wanted +
                                        " event, found " +
                                        eventTypeName(actual));
}

} // anonymous namespace

std::optional<uint64_t> Event::length() const {
  return payload_or_throw<std::optional<uint64_t>>(mPayload, mType,
                                                   "a start");
}

bool Event::asBoolean() const {
  return payload_or_throw<bool>(mPayload, mType, "a boolean");
}

const Data &Event::asData() const {
  return payload_or_throw<Data>(mPayload, mType, "a data");
}

const Date &Event::asDate() const {
  return payload_or_throw<Date>(mPayload, mType, "a date");
}

int64_t Event::asInteger() const {
  return payload_or_throw<int64_t>(mPayload, mType, "an integer");
}

double Event::asReal() const {
  return payload_or_throw<double>(mPayload, mType, "a real");
}

const std::string &Event::asString() const {
  return payload_or_throw<std::string>(mPayload, mType, "a string");
}

bool Event::operator==(const Event &other) const {
  return mType == other.mType && mPayload == other.mPayload;
}

std::ostream &operator<<(std::ostream &os, const Event &event) {
  os << eventTypeName(event.type());
  switch (event.type()) {
  case EventType::StartArray:
  case EventType::StartDictionary: {
    std::optional<uint64_t> length = event.length();
    if (length) {
      os << "(" << *length << ")";
    } else {
      os << "(None)";
    }
    break;
  }
  case EventType::EndArray:
  case EventType::EndDictionary:
    break;
  case EventType::Boolean:
    os << "(" << (event.asBoolean() ? "true" : "false") << ")";
    break;
  case EventType::Data:
    os << "(" << base64_encode(event.asData().data(), event.asData().size())
       << ")";
    break;
  case EventType::Date:
    os << "(" << event.asDate().toXmlFormat() << ")";
    break;
  case EventType::Integer:
    os << "(" << event.asInteger() << ")";
    break;
  case EventType::Real:
    os << "(" << event.asReal() << ")";
    break;
  case EventType::String:
    os << "(\"" << event.asString() << "\")";
    break;
  }
  return os;
}

// ============================================================================
// FLATTENING
// ============================================================================

IntoEvents::IntoEvents(Value value) { flatten(std::move(value), mEvents); }

void IntoEvents::flatten(Value &&value, std::vector<Event> &events) {
  switch (value.type()) {
  case ValueType::Array: {
    Array &array = value.mutArray();
    events.push_back(Event::startArray(array.size()));
    for (Value &element : array) {
      flatten(std::move(element), events);
    }
    events.push_back(Event::endArray());
    break;
  }
  case ValueType::Dictionary: {
    Dictionary &dict = value.mutDictionary();
    events.push_back(Event::startDictionary(dict.size()));
    for (Dictionary::Entry &entry : dict) {
      events.push_back(Event::string(std::move(entry.first)));
      flatten(std::move(entry.second), events);
    }
    events.push_back(Event::endDictionary());
    break;
  }
  case ValueType::Boolean:
    events.push_back(Event::boolean(value.asBoolean()));
    break;
  case ValueType::Data:
    events.push_back(Event::data(std::move(value.mutData())));
    break;
  case ValueType::Date:
    events.push_back(Event::date(value.asDate()));
    break;
  case ValueType::Real:
    events.push_back(Event::real(value.asReal()));
    break;
  case ValueType::Integer:
    events.push_back(Event::integer(value.asInteger()));
    break;
  case ValueType::String:
    events.push_back(Event::string(std::move(value.mutString())));
    break;
  }
}

std::optional<Event> IntoEvents::next() {
  if (mPosition >= mEvents.size()) {
    return std::nullopt;
  }
  return std::move(mEvents[mPosition++]);
}

// ============================================================================
// BUILDER
// ============================================================================

void Builder::beginValue(const Event &event) {
  if (mRoot) {
    throw Error(ErrorKind::InvalidData,
                std::string("Unexpected ") + eventTypeName(event.type()) +
                    " after the root value was complete");
  }
  if (!mStack.empty()) {
    const Frame &top = mStack.back();
    if (top.container.isDictionary() && !top.pendingKey &&
        event.type() != EventType::String) {
      throw Error(ErrorKind::InvalidData,
                  std::string("Dictionary key must be a string, found ") +
                      eventTypeName(event.type()));
    }
  }
}

void Builder::insertValue(Value value) {
  if (mStack.empty()) {
    mRoot = std::move(value);
    return;
  }

  Frame &top = mStack.back();
  if (top.container.isArray()) {
    top.container.mutArray().push_back(std::move(value));
  } else if (top.pendingKey) {
    top.container.mutDictionary().insert(std::move(*top.pendingKey),
                                         std::move(value));
    top.pendingKey.reset();
  } else {
    top.pendingKey = std::move(value.mutString());
  }
}

void Builder::write(const Event &event) {
  switch (event.type()) {
  case EventType::StartArray: {
    beginValue(event);
    Array array;
    if (std::optional<uint64_t> length = event.length()) {
      // Only a hint; don't let a hostile value allocate unbounded memory.
      array.reserve(static_cast<size_t>(std::min<uint64_t>(*length, 4096)));
    }
    mStack.push_back(Frame{Value(std::move(array)), std::nullopt});
    break;
  }
  case EventType::StartDictionary: {
    beginValue(event);
    Dictionary dict;
    if (std::optional<uint64_t> length = event.length()) {
      dict.reserve(static_cast<size_t>(std::min<uint64_t>(*length, 4096)));
    }
    mStack.push_back(Frame{Value(std::move(dict)), std::nullopt});
    break;
  }
  case EventType::EndArray:
  case EventType::EndDictionary: {
    bool wantDictionary = event.type() == EventType::EndDictionary;
    if (mStack.empty() ||
        mStack.back().container.isDictionary() != wantDictionary) {
      throw Error(ErrorKind::InvalidData,
                  std::string("Unexpected ") + eventTypeName(event.type()));
    }
    if (mStack.back().pendingKey) {
      throw Error(ErrorKind::InvalidData, "Dictionary key '" +
                                              *mStack.back().pendingKey +
                                              "' has no value");
    }
    Value container = std::move(mStack.back().container);
    mStack.pop_back();
    insertValue(std::move(container));
    break;
  }
  case EventType::Boolean:
    beginValue(event);
    insertValue(Value(event.asBoolean()));
    break;
  case EventType::Data:
    beginValue(event);
    insertValue(Value(event.asData()));
    break;
  case EventType::Date:
    beginValue(event);
    insertValue(Value(event.asDate()));
    break;
  case EventType::Integer:
    beginValue(event);
    insertValue(Value(event.asInteger()));
    break;
  case EventType::Real:
    beginValue(event);
    insertValue(Value(event.asReal()));
    break;
  case EventType::String:
    beginValue(event);
    insertValue(Value(event.asString()));
    break;
  }
}

Value Builder::takeValue() {
  if (!mRoot) {
    throw Error(ErrorKind::UnexpectedEof,
                "Event stream ended before a complete value");
  }
  Value value = std::move(*mRoot);
  mRoot.reset();
  return value;
}

} // namespace libplistio

#ifndef LIBPLISTIO_H
#define LIBPLISTIO_H
#include <chrono>
#include <cstdint>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <pugixml.hpp>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

/**
 * @namespace libplistio
 * @brief Property list I/O built around a flat stream of events.
 *
 * Every property list, whatever its physical encoding, is exposed as a
 * linear sequence of Event objects. Readers produce that sequence, writers
 * consume it, and a Value tree can be flattened into it or rebuilt from it.
 * Two encodings are supported: the binary "bplist00" format and the Apple
 * XML plist format.
 *
 * ### Read any plist file
 * @code
 * #include <fstream>
 * #include "plistio.hpp"
 *
 * libplistio::Value root = libplistio::readValueFromFile("Info.plist");
 * const libplistio::Value* name = root.asDictionary().find("CFBundleName");
 * @endcode
 *
 * ### Stream events without building a tree
 * @code
 * auto input = std::make_unique<std::ifstream>("in.plist", std::ios::binary);
 * libplistio::Reader reader(std::move(input));
 * while (std::optional<libplistio::Event> event = reader.next()) {
 *     std::cout << *event << "\n";
 * }
 * @endcode
 *
 * ### Convert to XML with warnings reported
 * @code
 * libplistio::ReaderOptions opts;
 * opts.warning_callback = [](const std::string& category, const std::string& msg) {
 *     std::cerr << "[" << category << "] " << msg << std::endl;
 * };
 *
 * std::ofstream xml_file("out.plist");
 * libplistio::convertToXml(std::make_unique<std::ifstream>("in.plist", std::ios::binary),
 *                          xml_file, opts);
 * @endcode
 */
namespace libplistio {

/**
 * @typedef WarningCallback
 * @brief Callback function for handling warnings while reading.
 *
 * The callback receives two parameters:
 * - @param category A string describing the category of warning (e.g. "XML structure")
 * - @param message A descriptive message about the warning
 *
 * Warnings never stop a read; anything that does is reported as an Error.
 */
using WarningCallback =
    std::function<void(const std::string& category, const std::string& message)>;

// ============================================================================
// ERRORS
// ============================================================================

/**
 * @brief Classification of everything that can go wrong in this library.
 */
enum class ErrorKind : uint8_t {
    Io = 1,             ///< The underlying stream failed to read, write or seek
    UnexpectedEof = 2,  ///< Input ended before the requested bytes or events
    InvalidData = 3,    ///< Malformed input bytes or a malformed event sequence
    WrongType = 4,      ///< A typed accessor was used on the wrong alternative
};

/**
 * @brief Get a printable name for an error kind.
 */
const char* errorKindName(ErrorKind kind);

/**
 * @class Error
 * @brief The exception type thrown by every operation of this library.
 *
 * Codec errors carry the byte offset at which they were detected; the offset
 * is also appended to what().
 */
class Error : public std::runtime_error {
   private:
    ErrorKind mKind;
    std::optional<uint64_t> mOffset;

   public:
    Error(ErrorKind kind, const std::string& message);
    Error(ErrorKind kind, const std::string& message, uint64_t offset);

    ErrorKind kind() const noexcept { return mKind; }
    std::optional<uint64_t> offset() const noexcept { return mOffset; }
};

// ============================================================================
// UTILITY FUNCTIONS
// ============================================================================

/**
 * @defgroup Utilities Utility Functions
 * @brief Low-level encoding and decoding utilities.
 * @{
 */

/**
 * @brief Encode binary data as base64.
 *
 * @param data Pointer to the binary data to encode
 * @param len Length of the binary data in bytes
 * @return Base64-encoded string representation of the data
 */
std::string base64_encode(const unsigned char* data, size_t len);

/**
 * @brief Decode a base64-encoded string into binary data.
 *
 * Whitespace anywhere in the input is skipped, so the multi-line layout used
 * by XML plists decodes directly. Padding characters ('=') end the data.
 *
 * @param data Base64-encoded string
 * @return Vector of bytes containing decoded data
 * @throws Error (InvalidData) on a character outside the base64 alphabet
 */
std::vector<uint8_t> base64_decode(const std::string& data);

/**
 * @brief Encode XML entities in a string.
 *
 * Escapes special XML characters: &, <, >, ", and '. A carriage return
 * becomes "&#13;" since XML parsers fold a raw one into a line feed.
 *
 * @param text String to encode
 * @return String with XML entities properly escaped
 */
std::string encode_xml_entities(const std::string& text);

/**
 * @brief Parse a decimal real in the "C" locale, whatever the global one is.
 *
 * Also accepts nan, inf and infinity in any case, optionally signed. The
 * whole of @p text must be consumed.
 *
 * @return The value, or std::nullopt if @p text is not a real
 */
std::optional<double> parse_decimal_real(const std::string& text);

/**
 * @brief Convert UTF-16 code units to a UTF-8 string.
 *
 * @throws Error (InvalidData) on an unpaired surrogate
 */
std::string utf16_to_utf8(const std::u16string& text);

/**
 * @brief Convert a UTF-8 string to UTF-16 code units.
 *
 * @throws Error (InvalidData) on a malformed UTF-8 sequence
 */
std::u16string utf8_to_utf16(const std::string& text);

/** @} */

// ============================================================================
// STREAM WRAPPERS - Low-level binary I/O
// ============================================================================

/**
 * @defgroup StreamIO Stream I/O Wrappers
 * @brief Big-endian, seekable binary input/output over standard streams.
 * @{
 */

/**
 * @class DataInput
 * @brief Random-access binary input with big-endian integer decoding.
 *
 * Every read either delivers the exact number of bytes requested or throws,
 * so callers never see a partially filled buffer.
 *
 * @note This class is primarily for internal use by the readers.
 */
class DataInput {
   private:
    std::istream& input_stream;

   public:
    explicit DataInput(std::istream& is);

    /**
     * @brief Read exactly @p length bytes into @p buffer.
     *
     * @throws Error (UnexpectedEof) if the stream ends first
     */
    void readExact(uint8_t* buffer, size_t length);

    uint8_t readByte();

    /**
     * @brief Read an unsigned big-endian integer of 1 to 8 bytes.
     */
    uint64_t readUnsigned(size_t width);

    float readFloat();
    double readDouble();
    std::vector<uint8_t> readBytes(size_t length);

    /**
     * @brief Seek to an absolute byte offset.
     *
     * @throws Error (Io) if the stream refuses the seek
     */
    void seek(uint64_t offset);

    uint64_t tell();

    /**
     * @brief Total length of the stream in bytes. The read position is kept.
     */
    uint64_t size();
};

/**
 * @class DataOutput
 * @brief Binary output with big-endian integer encoding and a byte counter.
 */
class DataOutput {
   private:
    std::ostream& output_stream;
    uint64_t mPosition = 0;

   public:
    explicit DataOutput(std::ostream& os);

    void writeByte(uint8_t value);

    /**
     * @brief Write the low @p width bytes of @p value in big-endian order.
     */
    void writeUnsigned(uint64_t value, size_t width);

    void writeDouble(double value);
    void write(const uint8_t* data, size_t length);

    /**
     * @brief Number of bytes written through this wrapper so far.
     */
    uint64_t position() const { return mPosition; }

    /**
     * @brief Flush the output stream and verify that every write succeeded.
     *
     * @throws Error (Io) if the stream is in a failed state
     */
    void flush();
};

/** @} */

// ============================================================================
// TREE VALUE
// ============================================================================

class Value;

using Array = std::vector<Value>;
using Data = std::vector<uint8_t>;

/**
 * @class Date
 * @brief A point in time as stored in property lists.
 *
 * Binary plists store dates as seconds relative to 2001-01-01T00:00:00Z;
 * XML plists use the form YYYY-MM-DDTHH:MM:SSZ. Both conversions live here.
 */
class Date {
   public:
    using Clock = std::chrono::system_clock;
    /// Microsecond ticks cover years 0000 to 9999 without overflow.
    using TimePoint = std::chrono::time_point<Clock, std::chrono::microseconds>;

    /// Seconds between the Unix epoch and the plist epoch (2001-01-01).
    static constexpr int64_t PLIST_EPOCH_UNIX_SECONDS = 978307200;

   private:
    TimePoint mTime;

   public:
    /// Initializes the Unix epoch.
    Date() = default;
    explicit Date(TimePoint time) : mTime(time) {}

    /**
     * @brief Build a date from seconds relative to 2001-01-01T00:00:00Z.
     *
     * Accepted dates run from 0000-01-01T00:00:00Z up to the end of year
     * 9999, the span the XML form can express.
     *
     * @throws Error (InvalidData) if the value is not finite or out of range
     */
    static Date fromSecondsSincePlistEpoch(double seconds);

    /**
     * @brief Parse the XML plist form, e.g. "2024-05-01T12:30:00Z".
     *
     * @throws Error (InvalidData) if the text is not in that exact form
     */
    static Date fromXmlFormat(const std::string& text);

    double secondsSincePlistEpoch() const;

    /**
     * @brief Format as YYYY-MM-DDTHH:MM:SSZ. Sub-second precision is dropped.
     */
    std::string toXmlFormat() const;

    TimePoint timePoint() const { return mTime; }

    bool operator==(const Date& other) const { return mTime == other.mTime; }
    bool operator!=(const Date& other) const { return mTime != other.mTime; }
    bool operator<(const Date& other) const { return mTime < other.mTime; }
};

/**
 * @class Dictionary
 * @brief String-keyed mapping that keeps insertion order.
 *
 * Iteration order is the order in which keys were first inserted; it is
 * also the order in which flattening emits them.
 */
class Dictionary {
   public:
    using Entry = std::pair<std::string, Value>;
    using iterator = std::vector<Entry>::iterator;
    using const_iterator = std::vector<Entry>::const_iterator;

   private:
    std::vector<Entry> mEntries;

   public:
    Dictionary();
    Dictionary(const Dictionary& other);
    Dictionary(Dictionary&& other) noexcept;
    Dictionary& operator=(const Dictionary& other);
    Dictionary& operator=(Dictionary&& other) noexcept;
    ~Dictionary();

    size_t size() const;
    bool empty() const;
    void reserve(size_t count);

    /**
     * @brief Insert a key. An existing key keeps its position and gets the
     *        new value.
     *
     * @return Reference to the stored value
     */
    Value& insert(std::string key, Value value);

    /**
     * @brief Look up a key.
     *
     * @return Pointer to the value, or nullptr if the key is absent
     */
    const Value* find(const std::string& key) const;
    Value* find(const std::string& key);

    bool contains(const std::string& key) const;
    bool erase(const std::string& key);

    iterator begin();
    iterator end();
    const_iterator begin() const;
    const_iterator end() const;

    bool operator==(const Dictionary& other) const;
    bool operator!=(const Dictionary& other) const { return !(*this == other); }
};

/**
 * @brief The eight kinds of property list value.
 */
enum class ValueType : uint8_t {
    Array = 0,
    Dictionary = 1,
    Boolean = 2,
    Data = 3,
    Date = 4,
    Real = 5,
    Integer = 6,
    String = 7,
};

class IntoEvents;
class Reader;

/**
 * @class Value
 * @brief An in-memory property list tree.
 *
 * A Value holds exactly one of the alternatives listed in ValueType. The
 * as...() accessors throw Error (WrongType) on a mismatch; the mut...()
 * accessors do the same but return a mutable reference.
 */
class Value {
   private:
    std::variant<Array, Dictionary, bool, Data, Date, double, int64_t, std::string> mStorage;

   public:
    /// Initializes an empty dictionary.
    Value();

    Value(Array value);
    Value(Dictionary value);
    Value(bool value);
    Value(Data value);
    Value(Date value);
    Value(double value);
    Value(std::string value);
    Value(const char* value);

    // Every integral type except bool stores an Integer.
    template <typename T,
              typename std::enable_if<std::is_integral<T>::value &&
                                          !std::is_same<T, bool>::value,
                                      int>::type = 0>
    Value(T value)
        : mStorage(std::in_place_type<int64_t>, static_cast<int64_t>(value)) {}

    ValueType type() const { return static_cast<ValueType>(mStorage.index()); }

    bool isArray() const { return type() == ValueType::Array; }
    bool isDictionary() const { return type() == ValueType::Dictionary; }
    bool isBoolean() const { return type() == ValueType::Boolean; }
    bool isData() const { return type() == ValueType::Data; }
    bool isDate() const { return type() == ValueType::Date; }
    bool isReal() const { return type() == ValueType::Real; }
    bool isInteger() const { return type() == ValueType::Integer; }
    bool isString() const { return type() == ValueType::String; }

    const Array& asArray() const;
    const Dictionary& asDictionary() const;
    bool asBoolean() const;
    const Data& asData() const;
    const Date& asDate() const;
    double asReal() const;
    int64_t asInteger() const;
    const std::string& asString() const;

    Array& mutArray();
    Dictionary& mutDictionary();
    Data& mutData();
    std::string& mutString();

    /**
     * @brief Flatten this value into its event sequence.
     *
     * The value is consumed: nested containers and scalars are moved into the
     * events, so the source must not be used afterwards.
     */
    IntoEvents intoEvents() &&;

    /**
     * @brief Build a value from the events of a reader.
     *
     * Pulls until exactly one complete value has been read; events after it
     * are left in the reader.
     *
     * @throws Error (UnexpectedEof) if the reader ends before the value is complete
     */
    static Value fromReader(Reader& reader);

    bool operator==(const Value& other) const;
    bool operator!=(const Value& other) const { return !(*this == other); }
};

const char* valueTypeName(ValueType type);

// ============================================================================
// EVENT MODEL
// ============================================================================

/**
 * @brief The kinds of event in a flattened property list.
 */
enum class EventType : uint8_t {
    StartArray = 0,
    EndArray = 1,
    StartDictionary = 2,
    EndDictionary = 3,
    Boolean = 4,
    Data = 5,
    Date = 6,
    Integer = 7,
    Real = 8,
    String = 9,
};

const char* eventTypeName(EventType type);

/**
 * @class Event
 * @brief One element of the flat representation of a property list.
 *
 * Containers become a Start event, their children, and an End event.
 * Dictionary contents are key/value pairs, the key always being a String
 * event directly before the value's events:
 *
 * @code
 * StartDictionary(2)
 * String("Height")   // key
 * Real(181.2)        // value
 * String("Age")      // key
 * Integer(28)        // value
 * EndDictionary
 * @endcode
 *
 * The length carried by Start events, when present, is the number of direct
 * children (elements, or key/value pairs). It is a preallocation hint only;
 * consumers end a container on its End event.
 */
class Event {
   private:
    using Payload = std::variant<std::monostate, std::optional<uint64_t>, bool, Data,
                                 Date, int64_t, double, std::string>;

    EventType mType;
    Payload mPayload;

    Event(EventType type, Payload payload);

   public:
    static Event startArray(std::optional<uint64_t> length = std::nullopt);
    static Event endArray();
    static Event startDictionary(std::optional<uint64_t> length = std::nullopt);
    static Event endDictionary();
    static Event boolean(bool value);
    static Event data(Data value);
    static Event date(Date value);
    static Event integer(int64_t value);
    static Event real(double value);
    static Event string(std::string value);

    EventType type() const { return mType; }

    bool isStart() const {
        return mType == EventType::StartArray || mType == EventType::StartDictionary;
    }
    bool isEnd() const {
        return mType == EventType::EndArray || mType == EventType::EndDictionary;
    }

    /**
     * @brief Length hint of a Start event.
     *
     * @throws Error (WrongType) if this is not a Start event
     */
    std::optional<uint64_t> length() const;

    bool asBoolean() const;
    const Data& asData() const;
    const Date& asDate() const;
    int64_t asInteger() const;
    double asReal() const;
    const std::string& asString() const;

    bool operator==(const Event& other) const;
    bool operator!=(const Event& other) const { return !(*this == other); }
};

std::ostream& operator<<(std::ostream& os, const Event& event);

/**
 * @class IntoEvents
 * @brief The event sequence of a flattened Value.
 *
 * Produced by Value::intoEvents(). The events are computed up front by a
 * pre-order walk of the tree; next() hands them out one at a time.
 */
class IntoEvents {
   private:
    std::vector<Event> mEvents;
    size_t mPosition = 0;

    static void flatten(Value&& value, std::vector<Event>& events);

   public:
    explicit IntoEvents(Value value);

    /**
     * @brief Next event, or std::nullopt once every event was handed out.
     */
    std::optional<Event> next();

    size_t remaining() const { return mEvents.size() - mPosition; }

    // Range over the events not yet handed out.
    std::vector<Event>::const_iterator begin() const { return mEvents.begin() + mPosition; }
    std::vector<Event>::const_iterator end() const { return mEvents.end(); }
};

// ============================================================================
// WRITERS
// ============================================================================

/**
 * @class Writer
 * @brief Consumer of an event sequence.
 *
 * Implementations receive one event per call and keep their own nesting
 * state. Whether output is buffered, and how it is finalised, is up to each
 * implementation.
 */
class Writer {
   public:
    virtual ~Writer() = default;

    /**
     * @brief Accept the next event.
     *
     * @throws Error if the event is out of place or the output fails
     */
    virtual void write(const Event& event) = 0;
};

/**
 * @class Builder
 * @brief A Writer that rebuilds the Value described by the events.
 *
 * @code
 * libplistio::Builder builder;
 * for (const libplistio::Event& event : std::move(value).intoEvents()) {
 *     builder.write(event);
 * }
 * libplistio::Value copy = builder.takeValue();
 * @endcode
 */
class Builder : public Writer {
   private:
    struct Frame {
        Value container;
        std::optional<std::string> pendingKey;
    };

    std::vector<Frame> mStack;
    std::optional<Value> mRoot;

    void beginValue(const Event& event);
    void insertValue(Value value);

   public:
    Builder() = default;

    void write(const Event& event) override;

    /**
     * @brief Whether a complete root value has been received.
     */
    bool isComplete() const { return mRoot.has_value(); }

    /**
     * @brief Take the finished value and reset the builder.
     *
     * @throws Error (UnexpectedEof) if the value is not complete yet
     */
    Value takeValue();
};

/**
 * @brief Build a Value from any source with a next() returning std::optional<Event>.
 *
 * @throws Error (UnexpectedEof) if the source ends before a complete value
 */
template <typename EventSource>
Value buildValue(EventSource& source) {
    Builder builder;
    while (!builder.isComplete()) {
        std::optional<Event> event = source.next();
        if (!event) {
            throw Error(ErrorKind::UnexpectedEof, "Event stream ended before a complete value");
        }
        builder.write(*event);
    }
    return builder.takeValue();
}

/**
 * @class BinaryWriter
 * @brief Writes events as a binary "bplist00" property list.
 *
 * The binary format needs the whole object graph to compute its offset
 * table, so events are collected until the root value is complete. The file
 * is then written in one go and the stream flushed. Equal strings (keys or
 * values) are stored once and shared by reference.
 */
class BinaryWriter : public Writer {
   private:
    DataOutput mOut;
    Builder mBuilder;
    bool mFinished = false;

    void serialize(const Value& root);

   public:
    explicit BinaryWriter(std::ostream& os);

    void write(const Event& event) override;

    bool isComplete() const { return mFinished; }
};

/**
 * @struct XmlWriterOptions
 * @brief Formatting options for XML output.
 */
struct XmlWriterOptions {
    /**
     * @brief Indentation added per nesting level.
     *
     * Default: one tab, as written by Apple tools
     */
    std::string indent = "\t";

    /**
     * @brief Maximum length of a base64 line inside <data>.
     *
     * Data that fits is written on the same line as its tags; 0 disables
     * line splitting.
     *
     * Default: 76
     */
    size_t data_line_width = 76;
};

/**
 * @class XmlWriter
 * @brief Writes events as an XML property list.
 *
 * Output is streamed as events arrive. The XML declaration, DOCTYPE and
 * <plist> element are written before the first value; </plist> is written
 * and the stream flushed once the root value is complete.
 */
class XmlWriter : public Writer {
   private:
    struct Frame {
        bool isDictionary;
        bool tagOpen;      // "<array" written, ">" still pending
        bool expectingKey;
    };

    std::ostream& mOut;
    XmlWriterOptions mOptions;
    std::vector<Frame> mStack;
    bool mStarted = false;
    bool mFinished = false;

    void writeIndent();
    void openParent();
    void writeElement(const char* name, const std::string& text);
    void writeData(const Data& data);
    void endValue();

   public:
    explicit XmlWriter(std::ostream& os, const XmlWriterOptions& options = {});

    void write(const Event& event) override;

    bool isComplete() const { return mFinished; }
};

// ============================================================================
// READERS
// ============================================================================

/**
 * @struct ReaderOptions
 * @brief Configuration shared by the readers.
 */
struct ReaderOptions {
    /**
     * @brief Optional callback function for warning messages.
     *
     * Called for non-fatal oddities such as:
     * - Text between the elements of an XML array or dictionary
     * - An XML plist version other than 1.0
     * - Object references in a binary plist too narrow to reach every object
     *
     * Default: nullptr (no warnings reported)
     */
    WarningCallback warning_callback = nullptr;
};

/**
 * @class BinaryReader
 * @brief Pull parser for binary "bplist00" property lists.
 *
 * The trailer and offset table are read on the first call to next(); each
 * following call decodes just enough of the object graph to produce one
 * event. Containers carry their exact length hint.
 */
class BinaryReader {
   private:
    struct Frame {
        uint64_t ref;
        bool isDictionary;
        std::vector<uint64_t> children;  // dictionaries: key0, value0, key1, ...
        size_t position;
    };

    std::unique_ptr<std::istream> mStream;
    ReaderOptions mOptions;
    std::unique_ptr<DataInput> mIn;

    std::vector<uint64_t> mOffsets;
    size_t mRefSize = 0;
    uint64_t mTopObject = 0;
    uint64_t mObjectAreaEnd = 0;

    std::vector<Frame> mStack;
    bool mStarted = false;
    bool mFinished = false;

    void readTrailer();
    uint64_t readLength(uint8_t marker);
    Event readObject(uint64_t ref, bool isKey);

   public:
    /// Signature at offset 0 of every binary plist.
    static const uint8_t MAGIC[8];

    explicit BinaryReader(std::unique_ptr<std::istream> stream,
                          const ReaderOptions& options = {});

    /**
     * @brief Next event, or std::nullopt after the top object is complete.
     *
     * @throws Error on I/O failure or malformed data
     */
    std::optional<Event> next();
};

/**
 * @class XmlReader
 * @brief Pull parser for XML property lists.
 *
 * The document is parsed with pugixml on the first call to next() and then
 * walked one event at a time. Containers carry no length hint.
 */
class XmlReader {
   private:
    struct Frame {
        pugi::xml_node next;
        bool isDictionary;
    };

    std::unique_ptr<std::istream> mStream;
    ReaderOptions mOptions;
    std::unique_ptr<pugi::xml_document> mDocument;
    std::vector<Frame> mStack;
    bool mFinished = false;

    void warn(const std::string& category, const std::string& message) const;
    pugi::xml_node firstElement(pugi::xml_node node) const;
    pugi::xml_node load();
    Event readElement(const pugi::xml_node& node);

   public:
    explicit XmlReader(std::unique_ptr<std::istream> stream,
                       const ReaderOptions& options = {});
    ~XmlReader();

    XmlReader(XmlReader&& other) noexcept;
    XmlReader& operator=(XmlReader&& other) noexcept;

    /**
     * @brief Next event, or std::nullopt after the root value is complete.
     *
     * @throws Error if the document is not well-formed or not a plist
     */
    std::optional<Event> next();
};

/**
 * @class Reader
 * @brief Reads a property list in whichever encoding the stream holds.
 *
 * Nothing is read at construction. The first call to next() seeks to the
 * start of the stream, compares the first 8 bytes with "bplist00", seeks
 * back to the start and binds to a BinaryReader on a match or to an
 * XmlReader otherwise. Every later call goes straight to the bound reader.
 *
 * A failbit or eofbit already set on the stream is cleared before the
 * probe, and the stream's exception mask is suspended while it runs, so
 * probe failures always surface as Error.
 *
 * If that first probe fails (fewer than 8 bytes, or a failed seek) the
 * reader stays unbound and the error is thrown. The stream's error state
 * is cleared and it is rewound to offset 0 first, so a retry probes again
 * from the start.
 *
 * @code
 * libplistio::Reader reader(std::make_unique<std::istringstream>(bytes));
 * libplistio::Value root = libplistio::Value::fromReader(reader);
 * @endcode
 */
class Reader {
   private:
    struct Uninitialized {
        std::unique_ptr<std::istream> stream;
    };

    std::variant<Uninitialized, XmlReader, BinaryReader> mState;
    ReaderOptions mOptions;

    static bool probeBinary(std::istream& stream);
    void bind();

   public:
    explicit Reader(std::unique_ptr<std::istream> stream, const ReaderOptions& options = {});

    /**
     * @brief Next event, or std::nullopt at the end of the property list.
     *
     * End of stream is sticky: once std::nullopt is returned it is returned
     * on every later call.
     *
     * @throws Error from the probe or from the bound reader, unchanged
     */
    std::optional<Event> next();

    bool isBound() const { return !std::holds_alternative<Uninitialized>(mState); }
    bool isBinary() const { return std::holds_alternative<BinaryReader>(mState); }
    bool isXml() const { return std::holds_alternative<XmlReader>(mState); }
};

// ============================================================================
// HIGH-LEVEL API
// ============================================================================

/**
 * @defgroup HighLevelAPI High-Level API
 * @brief Convenient file, stream and string conversion functions.
 * @{
 */

/**
 * @brief Pull every event from @p reader and push it into @p writer.
 *
 * @return Number of events copied
 */
uint64_t copyEvents(Reader& reader, Writer& writer);

/**
 * @brief Read one property list value from a stream of either encoding.
 *
 * @throws Error if the stream is not a valid property list
 */
Value readValue(std::unique_ptr<std::istream> input, const ReaderOptions& options = {});

/**
 * @brief Read one property list value from a file of either encoding.
 *
 * @throws Error (Io) if the file cannot be opened
 */
Value readValueFromFile(const std::string& path, const ReaderOptions& options = {});

/**
 * @brief Read one property list value from in-memory bytes.
 */
Value readValueFromString(const std::string& bytes, const ReaderOptions& options = {});

void writeXml(Value value, std::ostream& output, const XmlWriterOptions& options = {});
void writeBinary(Value value, std::ostream& output);

std::string toXmlString(Value value, const XmlWriterOptions& options = {});
std::string toBinaryString(Value value);

/**
 * @brief Re-encode a property list of either encoding as XML.
 *
 * Events are streamed from the reader into the writer without building a
 * tree.
 *
 * @throws Error (UnexpectedEof) if the input ends before a complete value
 *
 * @code
 * std::ofstream out("Info.xml.plist");
 * libplistio::convertToXml(
 *     std::make_unique<std::ifstream>("Info.plist", std::ios::binary), out);
 * @endcode
 */
void convertToXml(std::unique_ptr<std::istream> input, std::ostream& output,
                  const ReaderOptions& reader_options = {},
                  const XmlWriterOptions& writer_options = {});

/**
 * @brief Re-encode a property list of either encoding as binary.
 */
void convertToBinary(std::unique_ptr<std::istream> input, std::ostream& output,
                     const ReaderOptions& reader_options = {});

/** @} */

}  // namespace libplistio

#endif

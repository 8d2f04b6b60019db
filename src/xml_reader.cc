#include "plistio.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <istream>

namespace libplistio {

// ============================================================================
// XML READER
// ============================================================================

namespace {

bool is_whitespace_only(const char *text) {
  for (; *text; ++text) {
    if (*text != ' ' && *text != '\t' && *text != '\n' && *text != '\r')
      return false;
  }
  return true;
}

std::string trim(const std::string &str) {
  size_t first = str.find_first_not_of(" \t\r\n");
  if (first == std::string::npos)
    return std::string();
  size_t last = str.find_last_not_of(" \t\r\n");
  return str.substr(first, last - first + 1);
}

// Concatenated character data of an element (text and CDATA children).
std::string text_content(const pugi::xml_node &node) {
  std::string text;
  for (pugi::xml_node child = node.first_child(); child;
       child = child.next_sibling()) {
    if (child.type() == pugi::node_pcdata || child.type() == pugi::node_cdata) {
      text += child.value();
    }
  }
  return text;
}

int64_t parse_integer(const std::string &raw) {
  std::string text = trim(raw);
  bool negative = !text.empty() && text[0] == '-';
  size_t start = (negative || (!text.empty() && text[0] == '+')) ? 1 : 0;
  bool hex = text.compare(start, 2, "0x") == 0 ||
             text.compare(start, 2, "0X") == 0;
  if (hex) {
    start += 2;
  }
  if (start >= text.size()) {
    throw Error(ErrorKind::InvalidData, "Invalid integer: '" + raw + "'");
  }

  const char *digits = text.c_str() + start;
  char *end = nullptr;
  errno = 0;
  unsigned long long magnitude = std::strtoull(digits, &end, hex ? 16 : 10);
  if (errno == ERANGE || end == digits || *end != '\0' || digits[0] == '-' ||
      digits[0] == '+' || digits[0] == ' ') {
    throw Error(ErrorKind::InvalidData, "Invalid integer: '" + raw + "'");
  }

  if (negative) {
    if (magnitude > 9223372036854775808ULL) {
      throw Error(ErrorKind::InvalidData, "Integer out of range: '" + raw + "'");
    }
    return static_cast<int64_t>(0 - magnitude);
  }
  if (magnitude > 9223372036854775807ULL) {
    throw Error(ErrorKind::InvalidData, "Integer out of range: '" + raw + "'");
  }
  return static_cast<int64_t>(magnitude);
}

double parse_real(const std::string &raw) {
  std::string text = trim(raw);
  if (text.empty()) {
    throw Error(ErrorKind::InvalidData, "Invalid real: '" + raw + "'");
  }
  std::optional<double> value = parse_decimal_real(text);
  if (!value) {
    throw Error(ErrorKind::InvalidData, "Invalid real: '" + raw + "'");
  }
  return *value;
}

} // anonymous namespace

XmlReader::XmlReader(std::unique_ptr<std::istream> stream,
                     const ReaderOptions &options)
    : mStream(std::move(stream)), mOptions(options) {}

XmlReader::~XmlReader() = default;
XmlReader::XmlReader(XmlReader &&other) noexcept = default;
XmlReader &XmlReader::operator=(XmlReader &&other) noexcept = default;

void XmlReader::warn(const std::string &category,
                     const std::string &message) const {
  if (mOptions.warning_callback) {
    mOptions.warning_callback(category, message);
  }
}

pugi::xml_node XmlReader::firstElement(pugi::xml_node node) const {
  while (node && node.type() != pugi::node_element) {
    if ((node.type() == pugi::node_pcdata ||
         node.type() == pugi::node_cdata) &&
        !is_whitespace_only(node.value())) {
      warn("XML structure", "Ignoring text '" + trim(node.value()) +
                                "' inside <" + node.parent().name() + ">");
    }
    node = node.next_sibling();
  }
  return node;
}

pugi::xml_node XmlReader::load() {
  mDocument = std::make_unique<pugi::xml_document>();
  pugi::xml_parse_result result = mDocument->load(
      *mStream, pugi::parse_default | pugi::parse_ws_pcdata_single);

  if (!result) {
    throw Error(ErrorKind::InvalidData,
                "Failed to parse XML plist: " +
                    std::string(result.description()),
                static_cast<uint64_t>(result.offset));
  }

  pugi::xml_node root = mDocument->document_element();
  if (!root) {
    throw Error(ErrorKind::InvalidData, "XML document has no root element");
  }
  if (std::strcmp(root.name(), "plist") != 0) {
    // A bare value element is accepted as the whole property list.
    return root;
  }

  pugi::xml_attribute version = root.attribute("version");
  if (version && std::strcmp(version.value(), "1.0") != 0) {
    warn("XML structure",
         std::string("Unexpected plist version '") + version.value() + "'");
  }

  pugi::xml_node value = firstElement(root.first_child());
  if (!value) {
    throw Error(ErrorKind::UnexpectedEof, "<plist> element contains no value");
  }
  if (firstElement(value.next_sibling())) {
    warn("XML structure", "Ignoring elements after the first value in <plist>");
  }
  return value;
}

Event XmlReader::readElement(const pugi::xml_node &node) {
  const char *name = node.name();

  if (std::strcmp(name, "array") == 0) {
    mStack.push_back(Frame{firstElement(node.first_child()), false});
    return Event::startArray();
  }
  if (std::strcmp(name, "dict") == 0) {
    mStack.push_back(Frame{firstElement(node.first_child()), true});
    return Event::startDictionary();
  }
  if (std::strcmp(name, "key") == 0 || std::strcmp(name, "string") == 0) {
    return Event::string(text_content(node));
  }
  if (std::strcmp(name, "integer") == 0) {
    return Event::integer(parse_integer(text_content(node)));
  }
  if (std::strcmp(name, "real") == 0) {
    return Event::real(parse_real(text_content(node)));
  }
  if (std::strcmp(name, "true") == 0) {
    return Event::boolean(true);
  }
  if (std::strcmp(name, "false") == 0) {
    return Event::boolean(false);
  }
  if (std::strcmp(name, "data") == 0) {
    return Event::data(base64_decode(text_content(node)));
  }
  if (std::strcmp(name, "date") == 0) {
    return Event::date(Date::fromXmlFormat(trim(text_content(node))));
  }

  std::string message = std::string("Unknown plist element <") + name + ">";
  ptrdiff_t offset = node.offset_debug();
  if (offset < 0) {
    throw Error(ErrorKind::InvalidData, message);
  }
  throw Error(ErrorKind::InvalidData, message, static_cast<uint64_t>(offset));
}

std::optional<Event> XmlReader::next() {
  if (mFinished) {
    return std::nullopt;
  }

  if (!mDocument) {
    return readElement(load());
  }

  if (mStack.empty()) {
    mFinished = true;
    return std::nullopt;
  }

  Frame &top = mStack.back();
  pugi::xml_node child = top.next;
  if (!child) {
    bool is_dict = top.isDictionary;
    mStack.pop_back();
    return is_dict ? Event::endDictionary() : Event::endArray();
  }

  top.next = firstElement(child.next_sibling());
  return readElement(child);
}

} // namespace libplistio

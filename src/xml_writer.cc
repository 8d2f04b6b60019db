#include "plistio.hpp"

#include <cmath>
#include <iomanip>
#include <limits>
#include <locale>
#include <ostream>
#include <sstream>

namespace libplistio {

// ============================================================================
// XML WRITER
// ============================================================================

namespace {

const char XML_HEADER[] =
    "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
    "<!DOCTYPE plist PUBLIC \"-//Apple//DTD PLIST 1.0//EN\" "
    "\"http://www.apple.com/DTDs/PropertyList-1.0.dtd\">\n"
    "<plist version=\"1.0\">\n";

const char XML_FOOTER[] = "</plist>\n";

// Shortest decimal form that parses back to the same double.
std::string format_real(double value) {
  if (std::isnan(value)) {
    return "nan";
  }
  if (std::isinf(value)) {
    return value < 0 ? "-inf" : "inf";
  }
  if (value == std::floor(value) && std::fabs(value) < 1e15) {
    std::ostringstream ss;
    ss.imbue(std::locale::classic());
    ss << static_cast<long long>(value) << ".0";
    return ss.str();
  }

  std::string text;
  for (int precision = 15; precision <= std::numeric_limits<double>::max_digits10;
       ++precision) {
    std::ostringstream ss;
    ss.imbue(std::locale::classic());
    ss << std::setprecision(precision) << value;
    text = ss.str();
    if (parse_decimal_real(text) == value) {
      break;
    }
  }
  return text;
}

} // anonymous namespace

XmlWriter::XmlWriter(std::ostream &os, const XmlWriterOptions &options)
    : mOut(os), mOptions(options) {}

void XmlWriter::writeIndent() {
  for (size_t i = 0; i < mStack.size(); ++i) {
    mOut << mOptions.indent;
  }
}

// Completes a pending "<array" or "<dict" start tag before its first child.
void XmlWriter::openParent() {
  if (!mStack.empty() && mStack.back().tagOpen) {
    mOut << ">\n";
    mStack.back().tagOpen = false;
  }
}

void XmlWriter::writeElement(const char *name, const std::string &text) {
  openParent();
  writeIndent();
  mOut << "<" << name << ">" << encode_xml_entities(text) << "</" << name
       << ">\n";
}

void XmlWriter::writeData(const Data &data) {
  openParent();
  std::string encoded = base64_encode(data.data(), data.size());
  size_t width = mOptions.data_line_width;

  writeIndent();
  if (width == 0 || encoded.size() <= width) {
    mOut << "<data>" << encoded << "</data>\n";
    return;
  }

  mOut << "<data>\n";
  for (size_t pos = 0; pos < encoded.size(); pos += width) {
    writeIndent();
    mOut << encoded.substr(pos, width) << "\n";
  }
  writeIndent();
  mOut << "</data>\n";
}

// Called after every complete value, at whatever depth it ended.
void XmlWriter::endValue() {
  if (mStack.empty()) {
    mOut << XML_FOOTER;
    mOut.flush();
    mFinished = true;
    if (!mOut) {
      throw Error(ErrorKind::Io, "Failed to write XML output");
    }
    return;
  }
  if (mStack.back().isDictionary) {
    mStack.back().expectingKey = true;
  }
}

void XmlWriter::write(const Event &event) {
  if (mFinished) {
    throw Error(ErrorKind::InvalidData,
                std::string("Unexpected ") + eventTypeName(event.type()) +
                    " after the root value was written");
  }
  if (!mStarted) {
    mOut << XML_HEADER;
    mStarted = true;
  }

  if (!mStack.empty() && mStack.back().isDictionary &&
      mStack.back().expectingKey) {
    if (event.type() == EventType::String) {
      writeElement("key", event.asString());
      mStack.back().expectingKey = false;
      return;
    }
    if (event.type() != EventType::EndDictionary) {
      throw Error(ErrorKind::InvalidData,
                  std::string("Dictionary key must be a string, found ") +
                      eventTypeName(event.type()));
    }
  }

  switch (event.type()) {
  case EventType::StartArray:
  case EventType::StartDictionary: {
    bool is_dict = event.type() == EventType::StartDictionary;
    openParent();
    writeIndent();
    mOut << (is_dict ? "<dict" : "<array");
    mStack.push_back(Frame{is_dict, true, is_dict});
    break;
  }
  case EventType::EndArray:
  case EventType::EndDictionary: {
    bool is_dict = event.type() == EventType::EndDictionary;
    if (mStack.empty() || mStack.back().isDictionary != is_dict) {
      throw Error(ErrorKind::InvalidData,
                  std::string("Unexpected ") + eventTypeName(event.type()));
    }
    if (is_dict && !mStack.back().expectingKey) {
      throw Error(ErrorKind::InvalidData,
                  "Dictionary key has no value before EndDictionary");
    }
    bool empty = mStack.back().tagOpen;
    mStack.pop_back();
    if (empty) {
      mOut << "/>\n";
    } else {
      writeIndent();
      mOut << (is_dict ? "</dict>\n" : "</array>\n");
    }
    endValue();
    break;
  }
  case EventType::Boolean:
    openParent();
    writeIndent();
    mOut << (event.asBoolean() ? "<true/>\n" : "<false/>\n");
    endValue();
    break;
  case EventType::Data:
    writeData(event.asData());
    endValue();
    break;
  case EventType::Date:
    writeElement("date", event.asDate().toXmlFormat());
    endValue();
    break;
  case EventType::Integer:
    writeElement("integer", std::to_string(event.asInteger()));
    endValue();
    break;
  case EventType::Real:
    writeElement("real", format_real(event.asReal()));
    endValue();
    break;
  case EventType::String:
    writeElement("string", event.asString());
    endValue();
    break;
  }
}

} // namespace libplistio

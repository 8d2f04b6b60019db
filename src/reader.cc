#include "plistio.hpp"

#include <cstring>
#include <istream>

namespace libplistio {

// ============================================================================
// FORMAT DISPATCHER
// ============================================================================

Reader::Reader(std::unique_ptr<std::istream> stream,
               const ReaderOptions &options)
    : mState(std::in_place_type<Uninitialized>,
             Uninitialized{std::move(stream)}),
      mOptions(options) {
  if (!std::get<Uninitialized>(mState).stream) {
    throw Error(ErrorKind::Io, "Reader requires an input stream");
  }
}

bool Reader::probeBinary(std::istream &stream) {
  DataInput in(stream);
  uint8_t magic[8];
  in.seek(0);
  in.readExact(magic, sizeof(magic));
  in.seek(0);

  return std::memcmp(magic, BinaryReader::MAGIC, sizeof(magic)) == 0;
}

void Reader::bind() {
  std::istream &stream = *std::get<Uninitialized>(mState).stream;

  // The probe reports failures as Error, so stream exceptions stay masked
  // until it is done. A stale failbit or eofbit left by whoever filled the
  // stream is not a probe failure.
  const std::ios::iostate exceptions = stream.exceptions();
  stream.exceptions(std::ios::goodbit);
  stream.clear(stream.rdstate() & std::ios::badbit);

  bool binary;
  try {
    binary = probeBinary(stream);
  } catch (const Error &) {
    // Leave the stream rewound and unbound so a retry starts from scratch.
    stream.clear();
    stream.seekg(0, std::ios::beg);
    stream.clear();
    stream.exceptions(exceptions);
    throw;
  }
  stream.exceptions(exceptions);

  // emplace destroys the Uninitialized holder before building its successor.
  std::unique_ptr<std::istream> owned =
      std::move(std::get<Uninitialized>(mState).stream);
  if (binary) {
    mState.emplace<BinaryReader>(std::move(owned), mOptions);
  } else {
    mState.emplace<XmlReader>(std::move(owned), mOptions);
  }
}

std::optional<Event> Reader::next() {
  while (true) {
    if (auto binary = std::get_if<BinaryReader>(&mState)) {
      return binary->next();
    }
    if (auto xml = std::get_if<XmlReader>(&mState)) {
      return xml->next();
    }
    bind();
  }
}

} // namespace libplistio

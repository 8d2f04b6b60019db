#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <clocale>
#include <cmath>
#include <limits>
#include <locale>
#include <sstream>

#include "plistio.hpp"

using namespace libplistio;

static const std::string HEADER =
	"<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
	"<!DOCTYPE plist PUBLIC \"-//Apple//DTD PLIST 1.0//EN\" \"http://www.apple.com/DTDs/PropertyList-1.0.dtd\">\n"
	"<plist version=\"1.0\">\n";

static const std::string FOOTER = "</plist>\n";

static const char SAMPLE[] =
	"<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
	"<!DOCTYPE plist PUBLIC \"-//Apple//DTD PLIST 1.0//EN\" \"http://www.apple.com/DTDs/PropertyList-1.0.dtd\">\n"
	"<plist version=\"1.0\">\n"
	"<dict>\n"
	"\t<key>Name</key>\n"
	"\t<string>Fish &amp; Chips</string>\n"
	"\t<key>Numbers</key>\n"
	"\t<array>\n"
	"\t\t<integer>-5</integer>\n"
	"\t\t<integer>0x10</integer>\n"
	"\t\t<real>1.5</real>\n"
	"\t</array>\n"
	"\t<key>Flag</key>\n"
	"\t<true/>\n"
	"\t<key>Blob</key>\n"
	"\t<data>\n"
	"\taGVs\n"
	"\tbG8=\n"
	"\t</data>\n"
	"\t<key>When</key>\n"
	"\t<date>2024-05-01T12:30:00Z</date>\n"
	"\t<key>Nothing</key>\n"
	"\t<dict/>\n"
	"\t<key>Blank</key>\n"
	"\t<string></string>\n"
	"</dict>\n"
	"</plist>\n";

static std::unique_ptr<std::istream> stream_of(const std::string& content)
{
	return std::make_unique<std::istringstream>(content);
}

static std::vector<Event> events_of(const std::string& content, const ReaderOptions& options = {})
{
	XmlReader reader(stream_of(content), options);
	std::vector<Event> events;
	while(std::optional<Event> event = reader.next())
	{
		events.push_back(std::move(*event));
	}
	return events;
}

static ErrorKind error_kind_of(const std::string& content)
{
	try
	{
		readValueFromString(content);
	}
	catch(const Error& e)
	{
		return e.kind();
	}
	ADD_FAILURE() << "malformed XML plist was accepted";
	return ErrorKind::Io;
}

TEST(XmlReader, events_of_sample)
{
	std::vector<Event> expected = {
		Event::startDictionary(),
		Event::string("Name"),
		Event::string("Fish & Chips"),
		Event::string("Numbers"),
		Event::startArray(),
		Event::integer(-5),
		Event::integer(16),
		Event::real(1.5),
		Event::endArray(),
		Event::string("Flag"),
		Event::boolean(true),
		Event::string("Blob"),
		Event::data(Data{'h', 'e', 'l', 'l', 'o'}),
		Event::string("When"),
		Event::date(Date::fromXmlFormat("2024-05-01T12:30:00Z")),
		Event::string("Nothing"),
		Event::startDictionary(),
		Event::endDictionary(),
		Event::string("Blank"),
		Event::string(""),
		Event::endDictionary(),
	};
	EXPECT_EQ(events_of(SAMPLE), expected);
}

TEST(XmlReader, end_is_sticky)
{
	XmlReader reader(stream_of("<plist><false/></plist>"));
	std::optional<Event> only = reader.next();
	ASSERT_TRUE(only.has_value());
	EXPECT_EQ(*only, Event::boolean(false));
	EXPECT_FALSE(reader.next().has_value());
	EXPECT_FALSE(reader.next().has_value());
}

TEST(XmlReader, bare_value_without_plist_element)
{
	std::vector<Event> expected = {Event::string("bare")};
	EXPECT_EQ(events_of("<string>bare</string>"), expected);
}

TEST(XmlReader, cdata_and_whitespace)
{
	std::vector<Event> events = events_of("<plist><array><string><![CDATA[a<b]]></string><string> </string></array></plist>");
	ASSERT_EQ(events.size(), 4u);
	EXPECT_EQ(events[1], Event::string("a<b"));
	EXPECT_EQ(events[2], Event::string(" "));
}

TEST(XmlReader, warns_about_stray_text)
{
	testing::MockFunction<void(const std::string&, const std::string&)> warning;
	EXPECT_CALL(warning, Call("XML structure", testing::HasSubstr("oops"))).Times(1);

	ReaderOptions options;
	options.warning_callback = warning.AsStdFunction();

	std::vector<Event> expected = {Event::startArray(), Event::integer(1), Event::endArray()};
	EXPECT_EQ(events_of("<plist version=\"1.0\"><array>oops<integer>1</integer></array></plist>", options), expected);
}

TEST(XmlReader, warns_about_unknown_version)
{
	testing::MockFunction<void(const std::string&, const std::string&)> warning;
	EXPECT_CALL(warning, Call("XML structure", testing::HasSubstr("2.0"))).Times(1);

	ReaderOptions options;
	options.warning_callback = warning.AsStdFunction();

	EXPECT_EQ(events_of("<plist version=\"2.0\"><true/></plist>", options).size(), 1u);
}

TEST(XmlReader, rejects_malformed_documents)
{
	EXPECT_EQ(error_kind_of("<plist version=\"1.0\"><dict>"), ErrorKind::InvalidData);
	EXPECT_EQ(error_kind_of("<plist><unknown/></plist>"), ErrorKind::InvalidData);
	EXPECT_EQ(error_kind_of("<plist><integer>12abc</integer></plist>"), ErrorKind::InvalidData);
	EXPECT_EQ(error_kind_of("<plist><integer>99999999999999999999</integer></plist>"), ErrorKind::InvalidData);
	EXPECT_EQ(error_kind_of("<plist><real>fast</real></plist>"), ErrorKind::InvalidData);
	EXPECT_EQ(error_kind_of("<plist><data>@@@@</data></plist>"), ErrorKind::InvalidData);
	EXPECT_EQ(error_kind_of("<plist><date>yesterday</date></plist>"), ErrorKind::InvalidData);
	EXPECT_EQ(error_kind_of("<plist><dict><integer>1</integer></dict></plist>"), ErrorKind::InvalidData);
	EXPECT_EQ(error_kind_of("<plist version=\"1.0\"></plist>"), ErrorKind::UnexpectedEof);
}

TEST(XmlReader, parse_error_has_offset)
{
	try
	{
		events_of("<plist><array></dict></plist>");
		FAIL() << "mismatched tags were accepted";
	}
	catch(const Error& e)
	{
		EXPECT_EQ(e.kind(), ErrorKind::InvalidData);
		EXPECT_TRUE(e.offset().has_value());
	}
}

TEST(XmlWriter, single_entry_dictionary)
{
	Dictionary dict;
	dict.insert("Age", 28);

	EXPECT_EQ(toXmlString(dict),
		HEADER +
		"<dict>\n"
		"\t<key>Age</key>\n"
		"\t<integer>28</integer>\n"
		"</dict>\n" +
		FOOTER);
}

TEST(XmlWriter, empty_containers_are_self_closing)
{
	EXPECT_EQ(toXmlString(Array{}), HEADER + "<array/>\n" + FOOTER);

	Dictionary dict;
	dict.insert("inner", Dictionary());
	EXPECT_EQ(toXmlString(dict),
		HEADER +
		"<dict>\n"
		"\t<key>inner</key>\n"
		"\t<dict/>\n"
		"</dict>\n" +
		FOOTER);
}

TEST(XmlWriter, nested_values)
{
	Dictionary dict;
	dict.insert("list", Array{1, true, "a<b&c"});
	dict.insert("d", Data{'h', 'i'});
	dict.insert("r", Array{2.0, 0.1, -0.5});

	EXPECT_EQ(toXmlString(dict),
		HEADER +
		"<dict>\n"
		"\t<key>list</key>\n"
		"\t<array>\n"
		"\t\t<integer>1</integer>\n"
		"\t\t<true/>\n"
		"\t\t<string>a&lt;b&amp;c</string>\n"
		"\t</array>\n"
		"\t<key>d</key>\n"
		"\t<data>aGk=</data>\n"
		"\t<key>r</key>\n"
		"\t<array>\n"
		"\t\t<real>2.0</real>\n"
		"\t\t<real>0.1</real>\n"
		"\t\t<real>-0.5</real>\n"
		"\t</array>\n"
		"</dict>\n" +
		FOOTER);
}

TEST(XmlWriter, options_control_layout)
{
	XmlWriterOptions options;
	options.indent = "  ";
	options.data_line_width = 4;

	EXPECT_EQ(toXmlString(Array{Data{'h', 'e', 'l', 'l', 'o'}}, options),
		HEADER +
		"<array>\n"
		"  <data>\n"
		"  aGVs\n"
		"  bG8=\n"
		"  </data>\n"
		"</array>\n" +
		FOOTER);
}

TEST(XmlWriter, rejects_misplaced_events)
{
	{
		std::ostringstream out;
		XmlWriter writer(out);
		writer.write(Event::startDictionary());
		EXPECT_THROW(writer.write(Event::integer(1)), Error);
	}
	{
		std::ostringstream out;
		XmlWriter writer(out);
		writer.write(Event::startArray());
		EXPECT_THROW(writer.write(Event::endDictionary()), Error);
	}
	{
		std::ostringstream out;
		XmlWriter writer(out);
		writer.write(Event::string("done"));
		EXPECT_TRUE(writer.isComplete());
		EXPECT_THROW(writer.write(Event::string("again")), Error);
	}
}

TEST(XmlWriter, round_trip)
{
	Dictionary root;
	root.insert("text", "caf\xC3\xA9 & <friends>");
	root.insert("negative", -42);
	root.insert("big", INT64_MAX);
	root.insert("pi", 3.141592653589793);
	root.insert("tiny", 1e-300);
	root.insert("flags", Array{true, false});
	root.insert("when", Date::fromXmlFormat("1999-12-31T23:59:59Z"));
	root.insert("blob", Data(100, 0xAB));
	root.insert("empty", Array{});

	Value original = root;
	EXPECT_EQ(readValueFromString(toXmlString(root)), original);
}

TEST(XmlWriter, far_dates_round_trip)
{
	Array dates{
		Date::fromXmlFormat("0001-01-01T00:00:00Z"),
		Date::fromXmlFormat("4001-01-01T00:00:00Z"),
	};

	std::string xml = toXmlString(dates);
	EXPECT_THAT(xml, testing::HasSubstr("<date>0001-01-01T00:00:00Z</date>"));
	EXPECT_THAT(xml, testing::HasSubstr("<date>4001-01-01T00:00:00Z</date>"));

	Value original = dates;
	EXPECT_EQ(readValueFromString(xml), original);
}

TEST(XmlWriter, carriage_return_survives)
{
	Dictionary dict;
	dict.insert("line\rbreak", "a\rb\r\nc");

	std::string xml = toXmlString(dict);
	EXPECT_THAT(xml, testing::HasSubstr("<key>line&#13;break</key>"));
	EXPECT_THAT(xml, testing::HasSubstr("<string>a&#13;b&#13;\nc</string>"));

	Value original = dict;
	EXPECT_EQ(readValueFromString(xml), original);
}

namespace
{
	struct CommaDecimalPoint: std::numpunct<char>
	{
		char do_decimal_point() const override { return ','; }
	};

	// Restores the global C++ and C locales on scope exit.
	class LocaleGuard
	{
	public:
		LocaleGuard(): m_global(), m_numeric(std::setlocale(LC_NUMERIC, nullptr)) {}
		~LocaleGuard()
		{
			std::locale::global(m_global);
			std::setlocale(LC_NUMERIC, m_numeric.c_str());
		}

	private:
		std::locale m_global;
		std::string m_numeric;
	};
}

TEST(XmlReader, reals_ignore_global_locale)
{
	LocaleGuard guard;
	std::locale::global(std::locale(std::locale::classic(), new CommaDecimalPoint));

	std::vector<Event> expected = {Event::startArray(), Event::real(1.5), Event::real(-0.25), Event::endArray()};
	EXPECT_EQ(events_of("<plist><array><real>1.5</real><real> -2.5e-1 </real></array></plist>"), expected);
	EXPECT_EQ(toXmlString(Array{0.1}), HEADER + "<array>\n\t<real>0.1</real>\n</array>\n" + FOOTER);
}

TEST(XmlReader, reals_ignore_c_numeric_locale)
{
	LocaleGuard guard;
	const char* names[] = {"de_DE.UTF-8", "de_DE.utf8", "fr_FR.UTF-8", "fr_FR.utf8"};
	bool switched = false;
	for(const char* name : names)
	{
		if(std::setlocale(LC_NUMERIC, name) != nullptr)
		{
			switched = true;
			break;
		}
	}
	if(!switched)
	{
		GTEST_SKIP() << "no locale with a comma decimal point is installed";
	}

	Value original = Array{1.5, 0.1, 1e-300};
	EXPECT_EQ(readValueFromString(toXmlString(original)), original);
	EXPECT_EQ(readValueFromString("<plist><real>1.5</real></plist>").asReal(), 1.5);
}

TEST(XmlReader, real_spellings)
{
	std::vector<Event> events = events_of("<array><real>nan</real><real>-inf</real><real>+Infinity</real><real>1e-300</real></array>");
	ASSERT_EQ(events.size(), 6u);
	EXPECT_TRUE(std::isnan(events[1].asReal()));
	EXPECT_EQ(events[2], Event::real(-std::numeric_limits<double>::infinity()));
	EXPECT_EQ(events[3], Event::real(std::numeric_limits<double>::infinity()));
	EXPECT_EQ(events[4], Event::real(1e-300));

	EXPECT_EQ(error_kind_of("<plist><real>1.5x</real></plist>"), ErrorKind::InvalidData);
	EXPECT_EQ(error_kind_of("<plist><real>1,5</real></plist>"), ErrorKind::InvalidData);
	EXPECT_EQ(error_kind_of("<plist><real>-</real></plist>"), ErrorKind::InvalidData);
}


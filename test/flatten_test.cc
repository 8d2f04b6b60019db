#include <gtest/gtest.h>

#include "plistio.hpp"

using namespace libplistio;

static std::vector<Event> flattened(Value value)
{
	std::vector<Event> events;
	IntoEvents source = std::move(value).intoEvents();
	while(std::optional<Event> event = source.next())
	{
		events.push_back(std::move(*event));
	}
	return events;
}

static Value sample_tree()
{
	Dictionary inner;
	inner.insert("flag", true);
	inner.insert("blob", Data{1, 2, 3});

	Dictionary root;
	root.insert("Name", "Example");
	root.insert("Numbers", Array{1, -2, 3.5});
	root.insert("Inner", inner);
	root.insert("Empty", Array{});
	root.insert("When", Date::fromXmlFormat("2020-02-02T02:02:02Z"));
	return root;
}

TEST(Flatten, empty_array)
{
	std::vector<Event> events = flattened(Array{});

	ASSERT_EQ(events.size(), 2u);
	EXPECT_EQ(events[0], Event::startArray(0));
	EXPECT_EQ(events[1], Event::endArray());
}

TEST(Flatten, single_entry_dictionary)
{
	Dictionary dict;
	dict.insert("Age", 28);

	std::vector<Event> expected = {
		Event::startDictionary(1),
		Event::string("Age"),
		Event::integer(28),
		Event::endDictionary(),
	};
	EXPECT_EQ(flattened(dict), expected);
}

TEST(Flatten, scalar_root_is_one_event)
{
	std::vector<Event> events = flattened(Value("lonely"));
	ASSERT_EQ(events.size(), 1u);
	EXPECT_EQ(events[0], Event::string("lonely"));
}

TEST(Flatten, dictionary_order_is_insertion_order)
{
	Dictionary dict;
	dict.insert("Height", 181.2);
	dict.insert("Age", 28);

	std::vector<Event> expected = {
		Event::startDictionary(2),
		Event::string("Height"),
		Event::real(181.2),
		Event::string("Age"),
		Event::integer(28),
		Event::endDictionary(),
	};
	EXPECT_EQ(flattened(dict), expected);
}

TEST(Flatten, containers_are_balanced)
{
	std::vector<Event> events = flattened(sample_tree());

	std::vector<EventType> open;
	for(const Event& event : events)
	{
		if(event.type() == EventType::StartArray || event.type() == EventType::StartDictionary)
		{
			open.push_back(event.type());
		}
		else if(event.type() == EventType::EndArray)
		{
			ASSERT_FALSE(open.empty());
			EXPECT_EQ(open.back(), EventType::StartArray);
			open.pop_back();
		}
		else if(event.type() == EventType::EndDictionary)
		{
			ASSERT_FALSE(open.empty());
			EXPECT_EQ(open.back(), EventType::StartDictionary);
			open.pop_back();
		}
	}
	EXPECT_TRUE(open.empty());
}

TEST(Flatten, length_hints_count_direct_children)
{
	std::vector<Event> events = flattened(sample_tree());

	ASSERT_FALSE(events.empty());
	EXPECT_EQ(events.front(), Event::startDictionary(5));

	// "Numbers" array
	ASSERT_GE(events.size(), 5u);
	EXPECT_EQ(events[3], Event::string("Numbers"));
	EXPECT_EQ(events[4], Event::startArray(3));
}

TEST(Flatten, next_is_idempotent_at_end)
{
	IntoEvents source = Value(5).intoEvents();
	EXPECT_EQ(source.remaining(), 1u);
	ASSERT_TRUE(source.next().has_value());
	EXPECT_EQ(source.remaining(), 0u);
	EXPECT_FALSE(source.next().has_value());
	EXPECT_FALSE(source.next().has_value());
}

TEST(Builder, rebuilds_flattened_tree)
{
	Value original = sample_tree();
	Value copy = original;

	IntoEvents source = std::move(copy).intoEvents();
	Value rebuilt = buildValue(source);

	EXPECT_EQ(rebuilt, original);
	EXPECT_FALSE(source.next().has_value());
}

TEST(Builder, rebuilds_far_dates)
{
	Dictionary dict;
	dict.insert("past", Date::fromXmlFormat("0001-01-01T00:00:00Z"));
	dict.insert("future", Date::fromXmlFormat("4001-01-01T00:00:00Z"));
	Value original = dict;

	IntoEvents source = Value(original).intoEvents();
	Value rebuilt = buildValue(source);

	ASSERT_TRUE(rebuilt.isDictionary());
	EXPECT_EQ(rebuilt, original);
	EXPECT_EQ(rebuilt.asDictionary().find("future")->asDate().toXmlFormat(), "4001-01-01T00:00:00Z");
}

TEST(Builder, write_then_take)
{
	Builder builder;
	for(const Event& event : Value(Array{"a", "b"}).intoEvents())
	{
		EXPECT_FALSE(builder.isComplete());
		builder.write(event);
	}
	ASSERT_TRUE(builder.isComplete());

	Value value = builder.takeValue();
	ASSERT_TRUE(value.isArray());
	EXPECT_EQ(value.asArray().size(), 2u);
	EXPECT_FALSE(builder.isComplete());
}

TEST(Builder, missing_length_hint_is_accepted)
{
	Builder builder;
	builder.write(Event::startDictionary());
	builder.write(Event::string("k"));
	builder.write(Event::startArray());
	builder.write(Event::endArray());
	builder.write(Event::endDictionary());

	Value value = builder.takeValue();
	ASSERT_NE(value.asDictionary().find("k"), nullptr);
	EXPECT_TRUE(value.asDictionary().find("k")->asArray().empty());
}

TEST(Builder, huge_length_hint_is_only_a_hint)
{
	Builder builder;
	builder.write(Event::startArray(UINT64_MAX));
	builder.write(Event::integer(1));
	builder.write(Event::endArray());
	EXPECT_EQ(builder.takeValue().asArray().size(), 1u);
}

TEST(Builder, rejects_malformed_sequences)
{
	{
		Builder builder;
		EXPECT_THROW(builder.write(Event::endArray()), Error);
	}
	{
		Builder builder;
		builder.write(Event::startArray());
		EXPECT_THROW(builder.write(Event::endDictionary()), Error);
	}
	{
		Builder builder;
		builder.write(Event::startDictionary());
		EXPECT_THROW(builder.write(Event::integer(1)), Error);
	}
	{
		Builder builder;
		builder.write(Event::startDictionary());
		builder.write(Event::string("dangling"));
		EXPECT_THROW(builder.write(Event::endDictionary()), Error);
	}
	{
		Builder builder;
		builder.write(Event::integer(1));
		EXPECT_THROW(builder.write(Event::integer(2)), Error);
	}
}

TEST(Builder, incomplete_value)
{
	Builder builder;
	builder.write(Event::startArray(2));
	builder.write(Event::integer(1));

	try
	{
		builder.takeValue();
		FAIL() << "takeValue() on an open array did not throw";
	}
	catch(const Error& e)
	{
		EXPECT_EQ(e.kind(), ErrorKind::UnexpectedEof);
	}
}

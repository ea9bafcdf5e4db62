#include "short_id.hpp"
#include <algorithm>
#include <array>
#include <chrono>
#include <gtest/gtest.h>
#include <mutex>
#include <set>
#include <sstream>
#include <string>
#include <thread>
#include <unordered_set>
#include <vector>

namespace {
	using shortid::short_id_t;
	using shortid::bytes_t;
	using shortid::byte;
	using shortid::precision;

	//helper
	static bool has_no_escapable_chars(const std::string& s){
		return s.find_first_of("+/=") == std::string::npos;
	}

	static bytes_t make_bytes(std::initializer_list<int> values){
		bytes_t out;
		for(int v : values){
			out.push_back(static_cast<byte>(v));
		}
		return out;
	}

	TEST(ShortId, DefaultIdHasFourteenUrlSafeChars){
		const auto id = shortid::short_id();
		ASSERT_EQ(id.size(), 14u);
		EXPECT_TRUE(shortid::is_url_safe(id)) << "Unexpected character in id: " << id;
		EXPECT_TRUE(has_no_escapable_chars(id));
	}

	TEST(ShortId, EncodedLengthFollowsGroupRules){
		EXPECT_EQ(shortid::encoded_length(1), 2u);
		EXPECT_EQ(shortid::encoded_length(2), 3u);
		EXPECT_EQ(shortid::encoded_length(3), 4u);
		EXPECT_EQ(shortid::encoded_length(4), 6u);
		EXPECT_EQ(shortid::encoded_length(10), 14u);
		EXPECT_EQ(shortid::encoded_length(32), 43u);
	}

	TEST(ShortId, RandomLengthLawHoldsForEveryValidLength){
		for(std::size_t n = 1; n <= shortid::max_length; ++n){
			const auto bytes = shortid::generate_random(n);
			ASSERT_EQ(bytes.size(), n);
			const auto text = shortid::encode(bytes);
			EXPECT_EQ(text.size(), (n * 4 + 2) / 3) << "n = " << n;
			EXPECT_TRUE(shortid::is_url_safe(text)) << text;
			EXPECT_TRUE(has_no_escapable_chars(text)) << text;
		}
	}

	TEST(ShortId, CustomLengthIdMatchesEncodedLength){
		for(std::size_t n = 1; n <= shortid::max_length; ++n){
			EXPECT_EQ(shortid::short_id(n).size(), shortid::encoded_length(n));
		}
	}

	TEST(ShortId, GenerateProducesUniqueIds){
		constexpr int N = 2000;
		std::set<std::string> s;

		for(int i = 0; i < N; ++i){
			s.insert(shortid::short_id());
		}

		// ~80 bits of entropy, a collision here means the source is broken
		EXPECT_EQ(s.size(), N);
	}

	TEST(ShortId, ConsecutiveRandomBuffersDiffer){
		EXPECT_NE(shortid::generate_random(16), shortid::generate_random(16));
	}

	TEST(ShortId, ConcurrentGenerationStaysUnique){
		constexpr int threads = 8;
		constexpr int per_thread = 500;
		std::mutex m;
		std::unordered_set<std::string> all;
		std::vector<std::thread> workers;

		for(int t = 0; t < threads; ++t){
			workers.emplace_back([&]{
				std::vector<std::string> local;
				local.reserve(per_thread);
				for(int i = 0; i < per_thread; ++i){
					local.push_back(shortid::short_id());
				}
				std::lock_guard lock(m);
				all.insert(local.begin(), local.end());
			});
		}
		for(auto& w : workers){
			w.join();
		}
		EXPECT_EQ(all.size(), static_cast<std::size_t>(threads * per_thread));
	}

	TEST(ShortId, RandomRejectsZeroLength){
		EXPECT_THROW((void)shortid::generate_random(0), shortid::invalid_length);
		EXPECT_THROW((void)shortid::short_id(0), shortid::invalid_length);
	}

	TEST(ShortId, RandomRejectsOversizedLength){
		EXPECT_THROW((void)shortid::generate_random(33), shortid::invalid_length);
		EXPECT_THROW((void)shortid::short_id(33), shortid::invalid_length);
	}

	TEST(ShortId, InvalidLengthReportsBounds){
		try{
			(void)shortid::generate_random(33);
			FAIL() << "expected invalid_length";
		} catch(const shortid::invalid_length& e){
			EXPECT_EQ(e.length(), 33u);
			EXPECT_EQ(e.min(), 1u);
			EXPECT_EQ(e.max(), 32u);
			EXPECT_NE(std::string{e.what()}.find("33"), std::string::npos);
		}
	}

	TEST(ShortId, InvalidLengthIsAnInvalidArgument){
		EXPECT_THROW((void)shortid::generate_random(0), std::invalid_argument);
	}

	// Encoder

	TEST(Encode, KnownVectors){
		EXPECT_EQ(shortid::encode(make_bytes({'M', 'a', 'n'})), "TWFu");
		EXPECT_EQ(shortid::encode(make_bytes({'h', 'e', 'l', 'l', 'o'})), "aGVsbG8");
		EXPECT_EQ(shortid::encode(make_bytes({0x00})), "AA");
		EXPECT_EQ(shortid::encode(make_bytes({0xFF, 0xFF, 0xFF})), "____");
		EXPECT_EQ(shortid::encode(make_bytes({0xFB, 0xEF, 0xBE})), "----");
	}

	TEST(Encode, UsesUrlSafeSymbolsInsteadOfPlusAndSlash){
		// standard base64 would give "+/8=" here
		EXPECT_EQ(shortid::encode(make_bytes({0xFB, 0xFF})), "-_8");
	}

	TEST(Encode, TrailingSingleByteGivesTwoChars){
		EXPECT_EQ(shortid::encode(make_bytes({0x01, 0x02, 0x03, 0x04})), "AQIDBA");
	}

	TEST(Encode, TrailingPairGivesThreeChars){
		EXPECT_EQ(shortid::encode(make_bytes({0x01, 0x02, 0x03, 0x04, 0x05})), "AQIDBAU");
	}

	TEST(Encode, AllZeroDefaultBufferIsAllA){
		const bytes_t zero(shortid::default_length, 0);
		EXPECT_EQ(shortid::encode(zero), "AAAAAAAAAAAAAA");
	}

	TEST(Encode, IsDeterministic){
		const auto bytes = shortid::generate_random(10);
		EXPECT_EQ(shortid::encode(bytes), shortid::encode(bytes));
	}

	TEST(Encode, IsUrlSafeRejectsForeignCharacters){
		EXPECT_TRUE(shortid::is_url_safe("AZaz09-_"));
		EXPECT_FALSE(shortid::is_url_safe("abc+def"));
		EXPECT_FALSE(shortid::is_url_safe("abc/def"));
		EXPECT_FALSE(shortid::is_url_safe("abc="));
		EXPECT_FALSE(shortid::is_url_safe("a b"));
	}

#if SHORT_ID_ENABLE_ORDERED

	TEST(Ordered, DefaultIdHasFourteenUrlSafeChars){
		const auto id = shortid::short_id_ordered();
		ASSERT_EQ(id.size(), 14u);
		EXPECT_TRUE(shortid::is_url_safe(id)) << id;
	}

	TEST(Ordered, MicrosecondDefaultLengthIsFourteenChars){
		EXPECT_EQ(shortid::short_id_ordered(10, precision::microseconds).size(), 14u);
	}

	TEST(Ordered, IdsWithinTheSameTickAreUnique){
		const auto id1 = shortid::short_id_ordered();
		const auto id2 = shortid::short_id_ordered();
		const auto id3 = shortid::short_id_ordered();
		EXPECT_NE(id1, id2);
		EXPECT_NE(id2, id3);
		EXPECT_NE(id1, id3);
	}

	TEST(Ordered, IdsAHundredMillisecondsApartDiffer){
		const auto id1 = shortid::short_id_ordered(10, precision::microseconds);
		std::this_thread::sleep_for(std::chrono::milliseconds(100));
		const auto id2 = shortid::short_id_ordered(10, precision::microseconds);
		EXPECT_NE(id1, id2);
	}

	TEST(Ordered, TimestampPrefixAdvancesAfterOneTick){
		const auto before = shortid::generate_ordered(10, precision::microseconds);
		std::this_thread::sleep_for(std::chrono::milliseconds(2));
		const auto after = shortid::generate_ordered(10, precision::microseconds);
		EXPECT_LT(shortid::read_timestamp(before, precision::microseconds),
			shortid::read_timestamp(after, precision::microseconds));
		EXPECT_NE(shortid::encode(before), shortid::encode(after));
	}

	TEST(Ordered, WritesBigEndianSecondsPrefix){
		using namespace std::chrono;
		const auto tp = system_clock::time_point{seconds{0x01020304}};
		const auto bytes = shortid::generate_ordered(10, precision::seconds, tp);

		ASSERT_EQ(bytes.size(), 10u);
		EXPECT_EQ(bytes[0], 0x01);
		EXPECT_EQ(bytes[1], 0x02);
		EXPECT_EQ(bytes[2], 0x03);
		EXPECT_EQ(bytes[3], 0x04);
		EXPECT_EQ(shortid::read_timestamp(bytes, precision::seconds), 0x01020304u);
	}

	TEST(Ordered, WritesBigEndianMicrosecondsPrefix){
		using namespace std::chrono;
		const std::uint64_t us = 0x0001020304050607ULL;
		const auto tp = system_clock::time_point{duration_cast<system_clock::duration>(microseconds{us})};
		const auto bytes = shortid::generate_ordered(12, precision::microseconds, tp);

		ASSERT_EQ(bytes.size(), 12u);
		for(std::size_t i = 0; i < 8; ++i){
			EXPECT_EQ(bytes[i], static_cast<byte>(i)) << "at byte " << i;
		}
		EXPECT_EQ(shortid::read_timestamp(bytes, precision::microseconds), us);
	}

	TEST(Ordered, SameInstantSharesEncodedTimestampPrefix){
		using namespace std::chrono;
		const auto tp = system_clock::now();
		const auto a = shortid::encode(shortid::generate_ordered(10, precision::seconds, tp));
		const auto b = shortid::encode(shortid::generate_ordered(10, precision::seconds, tp));
		// 4 timestamp bytes = 32 bits, the first 5 chars (30 bits) are pure timestamp
		EXPECT_EQ(a.substr(0, 5), b.substr(0, 5));
		EXPECT_NE(a, b);
	}

	TEST(Ordered, SecondsAreTruncatedToThirtyTwoBits){
		using namespace std::chrono;
		const auto tp = system_clock::time_point{seconds{(std::int64_t{1} << 32) + 5}};
		const auto bytes = shortid::generate_ordered(4, precision::seconds, tp);
		EXPECT_EQ(shortid::read_timestamp(bytes, precision::seconds), 5u);
	}

	TEST(Ordered, TimestampOnlyBufferIsAccepted){
		const auto bytes = shortid::generate_ordered(8, precision::microseconds);
		EXPECT_EQ(bytes.size(), 8u);
		EXPECT_EQ(shortid::encode(bytes).size(), shortid::encoded_length(8));
	}

	TEST(Ordered, RejectsClockBeforeEpoch){
		using namespace std::chrono;
		const auto before_epoch = system_clock::time_point{} - seconds{1};
		EXPECT_THROW((void)shortid::generate_ordered(10, precision::seconds, before_epoch), shortid::clock_error);
		EXPECT_THROW((void)shortid::generate_ordered(10, precision::microseconds, before_epoch), shortid::clock_error);
	}

	TEST(Ordered, LengthIsCheckedBeforeTheClock){
		using namespace std::chrono;
		const auto before_epoch = system_clock::time_point{} - seconds{1};
		EXPECT_THROW((void)shortid::generate_ordered(2, precision::seconds, before_epoch), shortid::invalid_length);
	}

	TEST(Ordered, ReadTimestampRejectsShortBuffer){
		const auto bytes = make_bytes({1, 2, 3});
		EXPECT_THROW((void)shortid::read_timestamp(bytes, precision::seconds), shortid::invalid_length);
	}

	class OrderedPrecision : public ::testing::TestWithParam<precision>{};

	TEST_P(OrderedPrecision, LengthLawHoldsForEveryValidLength){
		const auto p = GetParam();
		for(std::size_t n = shortid::timestamp_width(p); n <= shortid::max_length; ++n){
			const auto text = shortid::short_id_ordered(n, p);
			EXPECT_EQ(text.size(), shortid::encoded_length(n)) << "n = " << n;
			EXPECT_TRUE(shortid::is_url_safe(text)) << text;
		}
	}

	TEST_P(OrderedPrecision, RejectsLengthBelowTimestampWidth){
		const auto p = GetParam();
		const auto width = shortid::timestamp_width(p);
		EXPECT_THROW((void)shortid::generate_ordered(width - 1, p), shortid::invalid_length);
		EXPECT_THROW((void)shortid::short_id_ordered(0, p), shortid::invalid_length);
	}

	TEST_P(OrderedPrecision, RejectsOversizedLength){
		EXPECT_THROW((void)shortid::generate_ordered(33, GetParam()), shortid::invalid_length);
	}

	TEST_P(OrderedPrecision, ProducesUniqueIds){
		constexpr int N = 1000;
		std::set<std::string> s;
		for(int i = 0; i < N; ++i){
			// 10 random bytes at seconds precision, 6 at microseconds
			s.insert(shortid::short_id_ordered(14, GetParam()));
		}
		EXPECT_EQ(s.size(), N);
	}

	TEST_P(OrderedPrecision, TimestampsNeverGoBackwards){
		const auto p = GetParam();
		std::uint64_t last = 0;
		for(int i = 0; i < 256; ++i){
			const auto ts = shortid::read_timestamp(shortid::generate_ordered(10, p), p);
			EXPECT_GE(ts, last);
			last = ts;
		}
	}

	INSTANTIATE_TEST_SUITE_P(Precisions, OrderedPrecision,
		::testing::Values(precision::seconds, precision::microseconds),
		[](const ::testing::TestParamInfo<precision>& info){
			return std::string{shortid::to_string(info.param)};
		});

#endif // SHORT_ID_ENABLE_ORDERED

	// Typed wrapper

	TEST(ShortIdType, RandomHasDefaultLength){
		const auto id = short_id_t::random();
		EXPECT_EQ(id.size(), 14u);
		EXPECT_TRUE(shortid::is_url_safe(id.as_str()));
	}

	TEST(ShortIdType, RandomCustomLength){
		EXPECT_EQ(short_id_t::random(32).size(), 43u);
		EXPECT_THROW((void)short_id_t::random(0), shortid::invalid_length);
	}

#if SHORT_ID_ENABLE_ORDERED
	TEST(ShortIdType, OrderedHasDefaultLength){
		const auto id = short_id_t::ordered();
		EXPECT_EQ(id.size(), 14u);
		EXPECT_TRUE(shortid::is_url_safe(id.as_str()));
	}

	TEST(ShortIdType, OrderedRejectsLengthBelowTimestampWidth){
		EXPECT_THROW((void)short_id_t::ordered(7, precision::microseconds), shortid::invalid_length);
	}
#endif

	TEST(ShortIdType, WrapUnwrapIsIdentity){
		const std::array<std::string, 4> samples{"X7K9mP2nQwE-Tg", "", "not url safe / at all =", "\xF0\x9F\x98\x80"};
		for(const auto& s : samples){
			short_id_t id{s};
			EXPECT_EQ(id.as_str(), s);
			EXPECT_EQ(id.str(), s);
			EXPECT_EQ(std::move(id).into_string(), s);
		}
	}

	TEST(ShortIdType, WrappingDoesNotValidate){
		const short_id_t id{std::string{"+/="}};
		EXPECT_EQ(id.as_str(), "+/=");
		EXPECT_FALSE(shortid::is_url_safe(id.as_str()));
	}

	TEST(ShortIdType, DefaultConstructedIsEmpty){
		const short_id_t id{};
		EXPECT_TRUE(id.empty());
		EXPECT_EQ(id.as_str(), "");
	}

	TEST(ShortIdType, FromBytesEncodesBuffer){
		const auto id = short_id_t::from_bytes(make_bytes({'M', 'a', 'n'}));
		EXPECT_EQ(id.as_str(), "TWFu");
		EXPECT_THROW((void)short_id_t::from_bytes(bytes_t{}), shortid::invalid_length);
		EXPECT_THROW((void)short_id_t::from_bytes(bytes_t(33, 0)), shortid::invalid_length);
	}

	TEST(ShortIdType, EqualityAndThreeWayComparison){
		const short_id_t a{std::string{"abc"}};
		const short_id_t b{std::string{"abc"}};
		const short_id_t c{std::string{"abd"}};

		EXPECT_EQ(a, b);
		EXPECT_FALSE(a < b);
		EXPECT_FALSE(b < a);
		EXPECT_EQ(a <=> b, std::strong_ordering::equal);
		EXPECT_LT(a, c);
		EXPECT_NE(a, c);
	}

	TEST(ShortIdType, OrderingIsByteWiseLexicographic){
		// '-' (0x2D) < '0' (0x30) < 'A' (0x41) < '_' (0x5F) < 'a' (0x61)
		std::vector<short_id_t> ids{
			short_id_t{std::string{"a"}}, short_id_t{std::string{"_"}}, short_id_t{std::string{"A"}},
			short_id_t{std::string{"0"}}, short_id_t{std::string{"-"}}, short_id_t{std::string{"AA"}}
		};
		std::sort(ids.begin(), ids.end());

		std::vector<std::string> order;
		for(const auto& id : ids){
			order.emplace_back(id.as_str());
		}
		EXPECT_EQ(order, (std::vector<std::string>{"-", "0", "A", "AA", "_", "a"}));
	}

	TEST(ShortIdType, SortingByValueMatchesSortingByString){
		constexpr int N = 128;
		std::vector<short_id_t> ids;
		std::vector<std::string> strings;
		for(int i = 0; i < N; ++i){
			ids.push_back(short_id_t::random());
			strings.emplace_back(ids.back().as_str());
		}
		std::sort(ids.begin(), ids.end());
		std::sort(strings.begin(), strings.end());

		for(int i = 0; i < N; ++i){
			EXPECT_EQ(ids[i].as_str(), strings[i]);
		}
	}

	TEST(ShortIdType, HashMatchesTextHash){
		const short_id_t a{std::string{"X7K9mP2nQwE-Tg"}};
		const short_id_t b{std::string{"X7K9mP2nQwE-Tg"}};
		EXPECT_EQ(std::hash<short_id_t>{}(a), std::hash<short_id_t>{}(b));
		EXPECT_EQ(std::hash<short_id_t>{}(a), std::hash<std::string_view>{}("X7K9mP2nQwE-Tg"));

		std::unordered_set<short_id_t> set{a, b, short_id_t::random()};
		EXPECT_EQ(set.size(), 2u);
	}

	TEST(ShortIdType, StreamsText){
		const auto id = short_id_t::random();
		std::ostringstream oss;
		oss << id;
		EXPECT_EQ(oss.str(), id.as_str());
	}

	TEST(ShortIdType, ExplicitStringViewConversion){
		const short_id_t id{std::string{"abc"}};
		const auto view = static_cast<std::string_view>(id);
		EXPECT_EQ(view, "abc");
	}

} // namespace

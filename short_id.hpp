#pragma once
#include "log.hpp"
#include "secure_random.hpp"
#include <chrono>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <ostream>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

// A short id is fundamentally:
// - N bytes (1..32, default 10)
// - encoded using unpadded base64url (A-Z a-z 0-9 - _)
//
// The N bytes come in two layouts:
//   - random:  N bytes from OpenSSL's CSPRNG
//   - ordered: a K byte big-endian timestamp followed by N-K random bytes,
//              K = 4 for seconds since the Unix epoch, K = 8 for microseconds
//
// With the default of 10 bytes the encoded id is 14 characters: shorter than
// a UUID, safe to drop into a URL path or query string without escaping.
//
// This header provides:
//
//   - shortid::short_id() / short_id(n)
//       Random id, ~80 bits of entropy at the default length.
//
//   - shortid::short_id_ordered() / short_id_ordered(n, precision)
//       Timestamp-prefixed id. Ids from different clock ticks differ in their
//       leading characters, which groups them roughly by time. NOTE: the
//       base64url alphabet is not in ASCII order, so comparing the *strings*
//       does not sort by time. Compare the byte buffers (read_timestamp) if you
//       need that.
//       Only declared when SHORT_ID_ENABLE_ORDERED is non-zero.
//
//   - shortid::short_id_t
//       Strongly typed wrapper around the encoded text. Compares, hashes and
//       streams as its text.
//
//   - generate_random() / generate_ordered() / encode()
//       The building blocks, for callers who want the raw bytes.
//
// Length violations throw invalid_length, a clock set before 1970 throws
// clock_error. Both are logged through the "short_id" spdlog logger first.

#ifndef SHORT_ID_ENABLE_ORDERED
#define SHORT_ID_ENABLE_ORDERED 1
#endif

#ifndef SHORT_ID_PRECISION_MICROS
#define SHORT_ID_PRECISION_MICROS 0
#endif

namespace shortid{

	using byte = std::uint8_t;
	using bytes_t = std::vector<byte>;

	inline constexpr std::size_t max_length = 32;
	inline constexpr std::size_t min_random_length = 1;
	inline constexpr std::size_t default_length = 10;

	enum class precision : std::uint8_t{
		seconds,      // 4 byte timestamp, wraps in 2106
		microseconds  // 8 byte timestamp
	};

	inline constexpr precision default_precision =
		SHORT_ID_PRECISION_MICROS ? precision::microseconds : precision::seconds;

	[[nodiscard]] constexpr std::size_t timestamp_width(precision p) noexcept{
		return p == precision::microseconds ? 8 : 4;
	}

	[[nodiscard]] constexpr std::string_view to_string(precision p) noexcept{
		return p == precision::microseconds ? "microseconds" : "seconds";
	}

	// a byte count outside of [min, max]. Always a bug in the caller.
	class invalid_length final : public std::invalid_argument{
	public:
		invalid_length(std::size_t length, std::size_t min, std::size_t max)
			: std::invalid_argument(describe(length, min, max)), _length(length), _min(min), _max(max){}

		[[nodiscard]] std::size_t length() const noexcept{ return _length; }
		[[nodiscard]] std::size_t min() const noexcept{ return _min; }
		[[nodiscard]] std::size_t max() const noexcept{ return _max; }

	private:
		std::size_t _length;
		std::size_t _min;
		std::size_t _max;

		static std::string describe(std::size_t length, std::size_t min, std::size_t max){
			return "short_id: invalid byte length " + std::to_string(length)
				+ " (expected " + std::to_string(min) + ".." + std::to_string(max) + ")";
		}
	};

	// the system clock reports a time before the Unix epoch.
	class clock_error final : public std::runtime_error{
	public:
		using std::runtime_error::runtime_error;
	};

	namespace detail{
		inline constexpr char ENCODING[64] = {
			'A','B','C','D','E','F','G','H','I','J','K','L','M',
			'N','O','P','Q','R','S','T','U','V','W','X','Y','Z',
			'a','b','c','d','e','f','g','h','i','j','k','l','m',
			'n','o','p','q','r','s','t','u','v','w','x','y','z',
			'0','1','2','3','4','5','6','7','8','9','-','_'
		};

		inline void require_length(std::size_t n, std::size_t min, std::size_t max){
			if(n < min || n > max){
				log::logger().error("rejected byte length {}, accepted range is [{}, {}]", n, min, max);
				throw invalid_length(n, min, max);
			}
		}

		//helper for writing bytes in big-endian order
		template<std::size_t N>
		constexpr void write_big_endian(std::uint64_t value, std::span<byte, N> out) noexcept{
			static_assert(N <= 8);
			for(std::size_t i = 0; i < N; ++i){
				out[i] = static_cast<byte>((value >> ((N - 1 - i) * 8)) & 0xFF);
			}
		}

		// ticks since the Unix epoch at precision p. throws clock_error for instants before it.
		inline std::uint64_t ticks_since_epoch(std::chrono::system_clock::time_point now, precision p){
			using namespace std::chrono;
			const auto since = now.time_since_epoch();
			if(since < system_clock::duration::zero()){
				log::logger().error("system clock reports {} before the Unix epoch",
					duration_cast<microseconds>(since).count());
				throw clock_error("short_id: system clock is set before the Unix epoch");
			}
			if(p == precision::microseconds){
				return static_cast<std::uint64_t>(duration_cast<microseconds>(since).count());
			}
			// the seconds layout only has room for 32 bits; truncate like a u32 cast would.
			return static_cast<std::uint32_t>(duration_cast<seconds>(since).count());
		}
	} //namespace detail

	// ceil(4n / 3): every 3 bytes become 4 characters, a trailing 1 or 2 bytes become 2 or 3.
	[[nodiscard]] constexpr std::size_t encoded_length(std::size_t n) noexcept{
		return (n * 4 + 2) / 3;
	}

	[[nodiscard]] constexpr bool is_url_safe_char(char c) noexcept{
		return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9')
			|| c == '-' || c == '_';
	}

	[[nodiscard]] constexpr bool is_url_safe(std::string_view s) noexcept{
		for(const char c : s){
			if(!is_url_safe_char(c)){
				return false;
			}
		}
		return true;
	}

	// unpadded base64url. Pure, never fails.
	[[nodiscard]] inline std::string encode(std::span<const byte> bytes){
		using detail::ENCODING;
		std::string out;
		out.reserve(encoded_length(bytes.size()));
		std::size_t i = 0;
		for(; i + 3 <= bytes.size(); i += 3){ // whole 24-bit groups
			const std::uint32_t group = (std::uint32_t{bytes[i]} << 16)
				| (std::uint32_t{bytes[i + 1]} << 8)
				| std::uint32_t{bytes[i + 2]};
			out.push_back(ENCODING[(group >> 18) & 0x3F]);
			out.push_back(ENCODING[(group >> 12) & 0x3F]);
			out.push_back(ENCODING[(group >> 6) & 0x3F]);
			out.push_back(ENCODING[group & 0x3F]);
		}
		const std::size_t rest = bytes.size() - i;
		if(rest == 1){ // 8 bits -> 2 chars, low 4 bits zero
			const std::uint32_t group = std::uint32_t{bytes[i]} << 16;
			out.push_back(ENCODING[(group >> 18) & 0x3F]);
			out.push_back(ENCODING[(group >> 12) & 0x3F]);
		} else if(rest == 2){ // 16 bits -> 3 chars, low 2 bits zero
			const std::uint32_t group = (std::uint32_t{bytes[i]} << 16) | (std::uint32_t{bytes[i + 1]} << 8);
			out.push_back(ENCODING[(group >> 18) & 0x3F]);
			out.push_back(ENCODING[(group >> 12) & 0x3F]);
			out.push_back(ENCODING[(group >> 6) & 0x3F]);
		}
		return out;
	}

	[[nodiscard]] inline bytes_t generate_random(std::size_t n){
		detail::require_length(n, min_random_length, max_length);
		bytes_t bytes(n);
		secure_random::fill(bytes);
		return bytes;
	}

	// the timestamp prefix of an ordered buffer, at the precision it was written with.
	[[nodiscard]] inline std::uint64_t read_timestamp(std::span<const byte> bytes, precision p){
		const auto width = timestamp_width(p);
		detail::require_length(bytes.size(), width, max_length);
		std::uint64_t ts = 0;
		for(const byte b : bytes.first(width)){
			ts = (ts << 8) | static_cast<std::uint64_t>(b);
		}
		return ts;
	}

#if SHORT_ID_ENABLE_ORDERED
	// ordered layout for a caller-supplied instant.
	[[nodiscard]] inline bytes_t generate_ordered(std::size_t n, precision p, std::chrono::system_clock::time_point now){
		const auto width = timestamp_width(p);
		detail::require_length(n, width, max_length);
		const auto ts = detail::ticks_since_epoch(now, p);
		bytes_t bytes(n);
		const auto out = std::span<byte>{bytes};
		if(p == precision::microseconds){
			detail::write_big_endian<8>(ts, out.first<8>());
		} else{
			detail::write_big_endian<4>(ts, out.first<4>());
		}
		secure_random::fill(out.subspan(width));
		return bytes;
	}

	[[nodiscard]] inline bytes_t generate_ordered(std::size_t n, precision p = default_precision){
		return generate_ordered(n, p, std::chrono::system_clock::now());
	}
#endif

	[[nodiscard]] inline std::string short_id(std::size_t n = default_length){
		return encode(generate_random(n));
	}

#if SHORT_ID_ENABLE_ORDERED
	[[nodiscard]] inline std::string short_id_ordered(std::size_t n = default_length, precision p = default_precision){
		return encode(generate_ordered(n, p));
	}
#endif

	class short_id_t final{
	public:
		short_id_t() = default;

		// wraps text as-is. No validation: the caller vouches for it.
		explicit short_id_t(std::string text) noexcept : _text(std::move(text)){}

		[[nodiscard]] static short_id_t random(std::size_t n = default_length){
			return short_id_t{short_id(n)};
		}

#if SHORT_ID_ENABLE_ORDERED
		[[nodiscard]] static short_id_t ordered(std::size_t n = default_length, precision p = default_precision){
			return short_id_t{short_id_ordered(n, p)};
		}
#endif

		[[nodiscard]] static short_id_t from_bytes(std::span<const byte> bytes){
			detail::require_length(bytes.size(), min_random_length, max_length);
			return short_id_t{encode(bytes)};
		}

		[[nodiscard]] std::string_view as_str() const noexcept{ return _text; }
		[[nodiscard]] const std::string& str() const& noexcept{ return _text; }
		[[nodiscard]] std::string into_string() && noexcept{ return std::move(_text); }

		[[nodiscard]] explicit operator std::string_view() const noexcept{ return _text; }

		[[nodiscard]] std::size_t size() const noexcept{ return _text.size(); }
		[[nodiscard]] bool empty() const noexcept{ return _text.empty(); }

		auto operator<=>(const short_id_t&) const = default;
		bool operator==(const short_id_t&) const = default;

	private:
		std::string _text;
	};

	inline std::ostream& operator<<(std::ostream& os, const short_id_t& id){
		return os << id.as_str();
	}

	inline std::ostream& operator<<(std::ostream& os, precision p){
		return os << to_string(p);
	}
} //namespace shortid

template<>
struct std::hash<shortid::short_id_t>{
	std::size_t operator()(const shortid::short_id_t& id) const noexcept{
		return std::hash<std::string_view>{}(id.as_str());
	}
};

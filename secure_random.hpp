#pragma once
#include "log.hpp"
#include <array>
#include <climits>
#include <cstddef>
#include <cstdint>
#include <span>
#include <stdexcept>
#include <string>
#include <openssl/err.h>
#include <openssl/rand.h>

// Thin facade over OpenSSL's process-wide DRBG.
// RAND_bytes is safe to call from any thread without external locking (OpenSSL >= 1.1.0),
// so there is no state here at all: every call draws straight from the shared generator.

namespace shortid{

	// OpenSSL could not produce random bytes (unseeded DRBG, broken entropy source, ...).
	class entropy_error final : public std::runtime_error{
	public:
		using std::runtime_error::runtime_error;
	};

	class secure_random final{
	public:
		using byte = std::uint8_t;

		secure_random() = delete;

		// fills `out` with cryptographically secure random bytes, or throws entropy_error.
		static void fill(std::span<byte> out){
			if(out.empty()){
				return;
			}
			if(out.size() > static_cast<std::size_t>(INT_MAX)){
				throw entropy_error("secure_random: request too large for RAND_bytes");
			}
			if(RAND_bytes(out.data(), static_cast<int>(out.size())) != 1){
				const auto reason = last_openssl_error();
				log::logger().error("RAND_bytes failed for {} bytes: {}", out.size(), reason);
				throw entropy_error("secure_random: RAND_bytes failed: " + reason);
			}
		}

	private:
		static std::string last_openssl_error(){
			const unsigned long code = ERR_get_error();
			if(code == 0){
				return "no error queued";
			}
			std::array<char, 256> buf{};
			ERR_error_string_n(code, buf.data(), buf.size());
			return std::string{buf.data()};
		}
	};

} //namespace shortid

// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "Sizes.hxx"
#include "util/SpanCast.hxx"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <span>
#include <string_view>

class SliceArea;

namespace SSH {

/**
 * Thrown by #Serializer if the buffer is full.
 */
struct SerializeOverflow {};

/**
 * Writes SSH wire primitives (RFC 4251 section 5) into a buffer
 * allocated from the #fb_pool.
 */
class Serializer {
	SliceArea *area = nullptr;

	std::span<std::byte, MAX_PACKET_SIZE> buffer;

	std::size_t position = 0;

public:
	Serializer() noexcept;
	~Serializer() noexcept;

	Serializer(const Serializer &) = delete;
	Serializer &operator=(const Serializer &) = delete;

	std::span<std::byte> BeginWriteN(std::size_t size) {
		if (size > buffer.size() - position)
			throw SerializeOverflow{};

		return buffer.subspan(position, size);
	}

	void CommitWriteN(std::size_t size) noexcept {
		position += size;
	}

	std::span<std::byte> WriteN(std::size_t size) {
		auto result = BeginWriteN(size);
		CommitWriteN(size);
		return result;
	}

	void WriteN(std::span<const std::byte> src) {
		auto dest = WriteN(src.size());
		std::copy(src.begin(), src.end(), dest.begin());
	}

	void WriteU32(uint_least32_t value) {
		auto dest = WriteN(4);
		dest[0] = static_cast<std::byte>(value >> 24);
		dest[1] = static_cast<std::byte>(value >> 16);
		dest[2] = static_cast<std::byte>(value >> 8);
		dest[3] = static_cast<std::byte>(value);
	}

	/**
	 * Write a "string" (a 32 bit big-endian length followed by
	 * the payload).
	 */
	void WriteLengthEncoded(std::span<const std::byte> src) {
		WriteU32(src.size());
		WriteN(src);
	}

	void WriteString(std::string_view s) {
		WriteLengthEncoded(AsBytes(s));
	}

	/**
	 * Like CommitWriteN(), but convert the (unsigned big-endian)
	 * data written to the buffer returned by BeginWriteN() to
	 * "mpint" payload format: leading zeroes are stripped and a
	 * null byte is inserted if the most significant bit is set.
	 */
	void CommitBignum2(std::size_t size) {
		std::byte *const dest = buffer.data() + position;
		std::byte *const end = dest + size;
		const std::byte *const begin = std::find_if(dest, end, [](std::byte b){
			return b != std::byte{};
		});

		const std::size_t length = end - begin;
		const std::size_t prefix = length > 0 &&
			(*begin & std::byte{0x80}) != std::byte{};

		if (prefix > 0 && begin == dest &&
		    size + prefix > buffer.size() - position)
			throw SerializeOverflow{};

		std::memmove(dest + prefix, begin, length);
		if (prefix > 0)
			*dest = std::byte{};

		CommitWriteN(prefix + length);
	}

	/**
	 * Reserve space for a 32 bit length, to be filled later by
	 * CommitLength().
	 */
	std::size_t PrepareLength() {
		const std::size_t result = position;
		WriteN(4);
		return result;
	}

	/**
	 * Fill the length reserved by PrepareLength() with the number
	 * of bytes written since.
	 */
	void CommitLength(std::size_t length_position) noexcept {
		const uint_least32_t length = position - length_position - 4;
		auto dest = buffer.subspan(length_position, 4);
		dest[0] = static_cast<std::byte>(length >> 24);
		dest[1] = static_cast<std::byte>(length >> 16);
		dest[2] = static_cast<std::byte>(length >> 8);
		dest[3] = static_cast<std::byte>(length);
	}

	std::span<const std::byte> Finish() const noexcept {
		return buffer.first(position);
	}
};

} // namespace SSH

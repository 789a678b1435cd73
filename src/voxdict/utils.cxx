/* Copyright 2024 The Voxdict Authors
 *
 * This file is part of Voxdict.
 *
 * Voxdict is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Lesser General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * Voxdict is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU Lesser General Public License for more details.
 *
 * You should have received a copy of the GNU Lesser General Public License
 * along with Voxdict.  If not, see <http://www.gnu.org/licenses/>.
 */

#include "utils.hxx"

#include <unicode/utf8.h>
#include <unicode/ustring.h>

#if ' ' != 32 || '.' != 46 || 'A' != 65 || 'Z' != 90 || 'a' != 97 || 'z' != 122
#error "Basic execution character set is not ASCII"
#endif

using namespace std;

namespace voxdict {
VOXDICT_BEGIN_INLINE_NAMESPACE

auto validate_utf8(string_view s) -> bool
{
	auto err = U_ZERO_ERROR;
	u_strFromUTF8(nullptr, 0, nullptr, data(s), size(s), &err);
	if (err == U_INVALID_CHAR_FOUND)
		return false;
	return err == U_BUFFER_OVERFLOW_ERROR || U_SUCCESS(err);
}

/**
 * @internal
 * @brief Decodes UTF-8 into code points.
 * @pre @p in is valid UTF-8, see validate_utf8().
 */
auto valid_utf8_to_32(std::string_view in, std::u32string& out) -> void
{
	out.clear();
	if (in.size() > out.capacity())
		out.reserve(in.size());
	for (size_t i = 0; i != in.size();) {
		UChar32 cp;
		U8_NEXT_UNSAFE(in, i, cp);
		out.push_back(cp);
	}
}

auto valid_utf8_to_32(std::string_view in) -> std::u32string
{
	auto out = u32string();
	valid_utf8_to_32(in, out);
	return out;
}

auto utf32_to_utf8(std::u32string_view in, std::string& out) -> void
{
	out.clear();
	for (auto cp : in) {
		char seq[U8_MAX_LENGTH];
		size_t len = 0;
		U8_APPEND_UNSAFE(seq, len, cp);
		out.append(seq, len);
	}
}

auto utf32_to_utf8(std::u32string_view in) -> std::string
{
	auto out = string();
	utf32_to_utf8(in, out);
	return out;
}

/**
 * @brief Converts printable ASCII to the Fullwidth Forms block.
 *
 * Characters U+0021 to U+007E are shifted by U+FEE0, e.g. "A" becomes "Ａ".
 * Space and every non-ASCII character are copied unchanged.
 *
 * @pre @p in is valid UTF-8.
 */
auto to_fullwidth(std::string_view in) -> std::string
{
	auto cps = valid_utf8_to_32(in);
	for (auto& cp : cps) {
		if (U'!' <= cp && cp <= U'~')
			cp += 0xFEE0;
	}
	return utf32_to_utf8(cps);
}

auto log_line(std::ostream& log, std::string_view level,
              std::string_view message) -> void
{
	auto line = string();
	line.reserve(level.size() + message.size() + 3);
	line += level;
	line += ": ";
	line += message;
	line += '\n';
	log << line << flush;
}

/**
 * @internal
 * @brief Deletes a temporary file if it exists.
 *
 * Used on cleanup paths, so it never throws. A failure is logged as a
 * warning because the file is only leaked, no data is lost.
 */
auto remove_temporary(const std::filesystem::path& p, std::ostream& log)
    -> void
{
	auto ec = error_code();
	filesystem::remove(p, ec);
	if (ec)
		log_line(log, "WARNING",
		         "Can not delete temporary file " + p.string() + ": " +
		             ec.message());
}

VOXDICT_END_INLINE_NAMESPACE
} // namespace voxdict

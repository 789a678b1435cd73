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

#ifndef VOXDICT_UTILS_HXX
#define VOXDICT_UTILS_HXX

#include "defines.hxx"

#include <filesystem>
#include <ostream>
#include <string>
#include <string_view>

namespace voxdict {
VOXDICT_BEGIN_INLINE_NAMESPACE

VOXDICT_EXPORT auto validate_utf8(std::string_view s) -> bool;

VOXDICT_EXPORT auto valid_utf8_to_32(std::string_view in, std::u32string& out)
    -> void;
VOXDICT_EXPORT auto valid_utf8_to_32(std::string_view in) -> std::u32string;

VOXDICT_EXPORT auto utf32_to_utf8(std::u32string_view in, std::string& out)
    -> void;
VOXDICT_EXPORT auto utf32_to_utf8(std::u32string_view in) -> std::string;

[[nodiscard]] VOXDICT_EXPORT auto to_fullwidth(std::string_view in)
    -> std::string;

auto inline begins_with(std::string_view haystack, std::string_view needle)
    -> bool
{
	return haystack.compare(0, needle.size(), needle) == 0;
}

auto inline ends_with(std::string_view haystack, std::string_view needle)
    -> bool
{
	return haystack.size() >= needle.size() &&
	       haystack.compare(haystack.size() - needle.size(), needle.size(),
	                        needle) == 0;
}

/**
 * @internal
 * @brief Writes one diagnostic line with a single insertion.
 *
 * The line is assembled before it reaches the stream, so lines written by
 * different threads to std::clog do not get mixed.
 */
VOXDICT_EXPORT auto log_line(std::ostream& log, std::string_view level,
                             std::string_view message) -> void;

VOXDICT_EXPORT auto remove_temporary(const std::filesystem::path& p,
                                     std::ostream& log) -> void;

VOXDICT_END_INLINE_NAMESPACE
} // namespace voxdict
#endif // VOXDICT_UTILS_HXX

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

#include <voxdict/utils.hxx>

#include <catch2/catch.hpp>

#include <sstream>

using namespace std;
using namespace voxdict;

TEST_CASE("validate_utf8", "[utils]")
{
	CHECK(validate_utf8(""));
	CHECK(validate_utf8("abc"));
	CHECK(validate_utf8("テスト"));
	CHECK(validate_utf8("\U0010FFFF"));
	CHECK_FALSE(validate_utf8("\xFF"));
	CHECK_FALSE(validate_utf8("ab\xE3\x83"));
	CHECK_FALSE(validate_utf8("\xC0\xAF"));
}

TEST_CASE("wide_to_utf8", "[utils]")
{
	CHECK("abгшß" == utf32_to_utf8(U"abгшß"));
	CHECK("\U0010FFFF" == utf32_to_utf8(U"\U0010FFFF"));
	CHECK(U"ボイス" == valid_utf8_to_32("ボイス"));

	auto in = u32string(U"\U00011D59キ\U00011D59");
	auto out = string();
	utf32_to_utf8(in, out);
	CHECK("\U00011D59キ\U00011D59" == out);
	auto back = u32string();
	valid_utf8_to_32(out, back);
	CHECK(in == back);
}

TEST_CASE("to_fullwidth", "[utils]")
{
	CHECK(to_fullwidth("") == "");
	CHECK(to_fullwidth("abc") == "ａｂｃ");
	CHECK(to_fullwidth("VOICE!") == "ＶＯＩＣＥ！");
	CHECK(to_fullwidth("~09") == "～０９");
	CHECK(to_fullwidth("a b") == "ａ ｂ");
	CHECK(to_fullwidth("テストa") == "テストａ");
	CHECK(to_fullwidth("ａｂｃ") == "ａｂｃ");
}

TEST_CASE("begins_with ends_with", "[utils]")
{
	CHECK(begins_with("user.dict_csv-1.tmp", "user.dict"));
	CHECK_FALSE(begins_with("u", "user"));
	CHECK(ends_with("02_extra.csv.zst", ".csv.zst"));
	CHECK_FALSE(ends_with("02_extra.csv", ".csv.zst"));
	CHECK(ends_with("abc", ""));
}

TEST_CASE("log_line", "[utils]")
{
	auto log = ostringstream();
	log_line(log, "WARNING", "disk is full");
	log_line(log, "INFO", "done");
	CHECK(log.str() == "WARNING: disk is full\nINFO: done\n");
}

TEST_CASE("remove_temporary", "[utils]")
{
	auto p = filesystem::temp_directory_path() / "voxdict-absent-file.tmp";
	auto log = ostringstream();
	remove_temporary(p, log);
	CHECK(log.str().empty());
}

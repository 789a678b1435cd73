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

#include <voxdict/paths.hxx>

#include <catch2/catch.hpp>

#include "test_support.hxx"

using namespace std;
using namespace voxdict;
namespace fs = std::filesystem;

TEST_CASE("find_base_lexicon_files", "[paths]")
{
	auto dir = Temp_Dir();
	auto& d = dir.path();
	write_file(d / "02_b.csv.zst", "");
	write_file(d / "10_c.csv.zst", "");
	write_file(d / "01_a.csv.zst", "");
	write_file(d / "01_default.csv", "");
	write_file(d / "readme.txt", "");
	fs::create_directories(d / "03_dir.csv.zst");

	auto files = find_base_lexicon_files(d, false);
	CHECK(files == vector<fs::path>{d / "01_a.csv.zst", d / "02_b.csv.zst",
	                                d / "10_c.csv.zst"});

	files = find_base_lexicon_files(d, true);
	CHECK(files == vector<fs::path>{d / "01_default.csv"});

	CHECK(find_base_lexicon_files(d / "absent", false).empty());
	CHECK(find_base_lexicon_files(d / "absent", true).empty());
	CHECK(find_base_lexicon_files({}, false).empty());
}

TEST_CASE("make_paths", "[paths]")
{
	auto p = make_paths("/data", "/base");
	CHECK(p.base_lexicon_dir == "/base");
	CHECK(p.store_file == fs::path("/data") / "user_dict.json");
	CHECK(p.compiled_dictionary == fs::path("/data") / "user.dic");
}

TEST_CASE("append_base_lexicon_dir_paths", "[paths]")
{
	// Values are system dependent, only check that the call works.
	auto paths = vector<fs::path>();
	append_base_lexicon_dir_paths(paths);
	auto d = find_base_lexicon_dir();
	CHECK((d.empty() || fs::is_directory(d)));
	CHECK_FALSE(default_save_dir().empty());
}

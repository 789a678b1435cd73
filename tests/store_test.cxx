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

#include <voxdict/store.hxx>

#include <catch2/catch.hpp>

#include "test_support.hxx"

#include <sstream>

using namespace std;
using namespace voxdict;

namespace {
auto word_json(const string& id, const string& extra = "") -> string
{
	return R"({")" + id + R"(": {
  "surface": "ｔｅｓｔ",
  "context_id": 1348,
  "cost": 8609,
  "part_of_speech": "名詞",
  "part_of_speech_detail_1": "固有名詞",
  "part_of_speech_detail_2": "一般",
  "part_of_speech_detail_3": "*",
  "inflectional_type": "*",
  "inflectional_form": "*",
  "stem": "*",
  "yomi": "テスト",
  "pronunciation": "テスト",
  "accent_type": 1,
  )" + extra + R"("accent_associative_rule": "*"
}})";
}
const auto ID = string("cce59b5f-f93f-4a1e-9cba-6d3a94b8c8f2");
} // namespace

TEST_CASE("canonical_uuid", "[store]")
{
	auto out = string();
	CHECK(canonical_uuid("CCE59B5F-F93F-4A1E-9CBA-6D3A94B8C8F2", out));
	CHECK(out == ID);
	CHECK(canonical_uuid("{cce59b5f-f93f-4a1e-9cba-6d3a94b8c8f2}", out));
	CHECK(out == ID);
	out = "unchanged";
	CHECK_FALSE(canonical_uuid("not-a-uuid", out));
	CHECK_FALSE(canonical_uuid("", out));
	CHECK(out == "unchanged");

	auto a = generate_uuid();
	auto b = generate_uuid();
	CHECK(a != b);
	CHECK(canonical_uuid(a, out));
	CHECK(out == a);
}

TEST_CASE("parse_store", "[store]")
{
	auto words = Word_Map();
	auto err = ostringstream();

	SECTION("valid")
	{
		auto in = istringstream(word_json(ID, R"("mora_count": 3,)"));
		REQUIRE(parse_store(in, words, err));
		CHECK(err.str().empty());
		REQUIRE(words.size() == 1);
		auto& w = words.at(ID);
		CHECK(w.surface == "ｔｅｓｔ");
		CHECK(w.priority == 5);
		CHECK(w.mora_count == 3);
	}
	SECTION("key is canonicalised")
	{
		auto in = istringstream(
		    word_json("CCE59B5F-F93F-4A1E-9CBA-6D3A94B8C8F2"));
		REQUIRE(parse_store(in, words, err));
		CHECK(words.count(ID) == 1);
	}
	SECTION("missing context_id is a proper noun")
	{
		auto j = word_json(ID);
		j.erase(j.find(R"("context_id": 1348,)"), 19);
		auto in = istringstream(j);
		REQUIRE(parse_store(in, words, err));
		CHECK(words.at(ID).context_id == 1348);
	}
	SECTION("unknown fields warn")
	{
		auto in = istringstream(word_json(ID, R"("color": "red",)"));
		REQUIRE(parse_store(in, words, err));
		CHECK(err.str().find("color") != string::npos);
		CHECK(words.size() == 1);
	}
	SECTION("failures keep the output")
	{
		words.emplace("x", Word_Record());
		auto bad = {string("{"), string("[]"), word_json("42"),
		            word_json(ID, R"("mora_count": 4,)"),
		            word_json(ID, R"("mora_count": 0,)"),
		            word_json(ID, R"("accent_type": 9,)"),
		            string(R"({")" + ID + R"(": {"surface": "a"}})")};
		for (auto& b : bad) {
			auto in = istringstream(b);
			auto e = ostringstream();
			CHECK_FALSE(parse_store(in, words, e));
			CHECK_FALSE(e.str().empty());
		}
		CHECK(words.size() == 1);
		CHECK(words.count("x") == 1);
	}
	SECTION("same identifier in two spellings")
	{
		auto j = word_json(ID);
		j.pop_back();
		j += "," + word_json("CCE59B5F-F93F-4A1E-9CBA-6D3A94B8C8F2")
		               .substr(1);
		auto in = istringstream(j);
		CHECK_FALSE(parse_store(in, words, err));
	}
}

TEST_CASE("serialize_store", "[store]")
{
	auto words = Word_Map();
	words[ID] = to_record(make_word_property("test", "テスト", 1));
	words[generate_uuid()] = to_record(
	    make_word_property("速い", "ハヤイ", 2, Word_Type::ADJECTIVE, 8));
	auto out = ostringstream();
	serialize_store(words, out);
	auto text = out.str();
	CHECK(text.find("\"cost\" : 8609") != string::npos);
	CHECK(text.find("ｔｅｓｔ") != string::npos);
	CHECK(text.find("\"priority\"") == string::npos);

	auto in = istringstream(text);
	auto back = Word_Map();
	auto err = ostringstream();
	REQUIRE(parse_store(in, back, err));
	CHECK(back == words);
}

TEST_CASE("Word_Store", "[store]")
{
	auto dir = Temp_Dir();
	auto log = ostringstream();
	auto file = dir.path() / "sub" / "user_dict.json";
	auto store = Word_Store(file, log);
	CHECK(store.path() == file);

	CHECK(store.read_all().empty());

	auto words = Word_Map();
	words[ID] = to_record(make_word_property("test", "テスト", 1));
	store.write_all(words);
	CHECK(filesystem::exists(file));
	CHECK(store.read_all() == words);
	CHECK(temporaries_in(file.parent_path()) == 0);

	SECTION("modify")
	{
		store.modify([](Word_Map& w) { w.clear(); });
		CHECK(store.read_all().empty());
	}
	SECTION("modify that throws writes nothing")
	{
		auto before = read_file(file);
		CHECK_THROWS_AS(store.modify([](Word_Map& w) {
			w.clear();
			throw Validation_Error("no");
		}),
		                Validation_Error);
		CHECK(read_file(file) == before);
	}
	SECTION("corrupt file")
	{
		write_file(file, "{ not json");
		CHECK_THROWS_AS(store.read_all(), Corrupt_Store_Error);
		CHECK_THROWS_AS(store.modify([](Word_Map&) {}),
		                Corrupt_Store_Error);
		CHECK(read_file(file) == "{ not json");
	}
	SECTION("unknown fields are logged")
	{
		write_file(file, word_json(ID, R"("color": "red",)"));
		CHECK(store.read_all().size() == 1);
		CHECK(log.str().find("WARNING") != string::npos);
		CHECK(log.str().find("color") != string::npos);
	}
}

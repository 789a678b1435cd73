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

#include <voxdict/dictionary.hxx>

#include <catch2/catch.hpp>

#include "test_support.hxx"

#include <thread>

using namespace std;
using namespace voxdict;
namespace fs = std::filesystem;

namespace {
struct Dict_Fixture {
	Temp_Dir dir;
	ostringstream log;
	Fake_Analyzer analyzer;
	Dictionary_Paths paths;

	Dict_Fixture()
	{
		paths = make_paths(dir.path() / "save",
		                   make_test_base_lexicon(dir.path()));
	}
	auto make() -> User_Dictionary
	{
		auto opt = Compile_Options();
		opt.under_test_harness = true;
		return User_Dictionary(paths, analyzer, opt, log);
	}
};

auto record(const string& surface, const string& pronunciation, int accent,
            Word_Type type = Word_Type::PROPER_NOUN,
            int priority = DEFAULT_PRIORITY)
{
	return to_record(make_word_property(surface, pronunciation, accent, type,
	                                    priority));
}
} // namespace

TEST_CASE("User_Dictionary construction", "[dictionary]")
{
	auto f = Dict_Fixture();
	auto d = f.make();
	CHECK(f.analyzer.compile_count() == 1);
	CHECK(d.list_words().empty());
	CHECK(d.active_dictionary() != nullptr);
	CHECK(d.compile_state() == Compile_State::IDLE);
	CHECK(d.store_path() == f.paths.store_file);
	CHECK_FALSE(fs::exists(f.paths.store_file));

	d.update_dictionary();
	CHECK(f.analyzer.compile_count() == 2);

	SECTION("corrupt store")
	{
		write_file(f.paths.store_file, "{\"a\": 1}");
		CHECK_THROWS_AS(f.make(), Corrupt_Store_Error);
	}
}

TEST_CASE("User_Dictionary::add_word", "[dictionary]")
{
	auto f = Dict_Fixture();
	auto d = f.make();

	auto id = d.add_word(make_word_property("test", "テスト", 1));
	auto canonical = string();
	CHECK(canonical_uuid(id, canonical));
	CHECK(canonical == id);

	auto words = d.list_words();
	REQUIRE(words.size() == 1);
	auto& w = words.at(id);
	CHECK(w.surface == "ｔｅｓｔ");
	CHECK(w.mora_count == 3);
	CHECK(w.priority == 5);
	CHECK(read_file(f.paths.store_file).find("\"cost\" : 8609") !=
	      string::npos);

	CHECK(f.analyzer.compile_count() == 2);
	auto compiled = read_file(f.paths.compiled_dictionary);
	CHECK(compiled.find("ｔｅｓｔ,1348,1348,8609,") != string::npos);
	CHECK(f.analyzer.user_dictionary() == *d.active_dictionary());

	auto id2 = d.add_word(make_word_property("test", "テスト", 1));
	CHECK(id2 != id);
	CHECK(d.list_words().size() == 2);

	SECTION("invalid word changes nothing")
	{
		auto before = read_file(f.paths.store_file);
		CHECK_THROWS_AS(d.add_word(make_word_property("x", "x", 0)),
		                Validation_Error);
		CHECK_THROWS_AS(
		    d.add_word(make_word_property("x", "テスト", 0,
		                                  Word_Type::VERB, 12)),
		    Validation_Error);
		CHECK(read_file(f.paths.store_file) == before);
		CHECK(f.analyzer.compile_count() == 3);
	}
}

TEST_CASE("User_Dictionary::update_word", "[dictionary]")
{
	auto f = Dict_Fixture();
	auto d = f.make();
	auto id = d.add_word(make_word_property("test", "テスト", 1));
	auto other = d.add_word(make_word_property("voice", "ボイス", 1));

	d.update_word(id, make_word_property("test", "テスト", 3,
	                                     Word_Type::COMMON_NOUN, 9));
	auto words = d.list_words();
	CHECK(words.size() == 2);
	CHECK(words.at(id) == record("test", "テスト", 3,
	                             Word_Type::COMMON_NOUN, 9));
	CHECK(words.at(other) == record("voice", "ボイス", 1));

	auto upper = id;
	for (auto& c : upper)
		if ('a' <= c && c <= 'f')
			c -= 'a' - 'A';
	d.update_word(upper, make_word_property("test", "テスト", 2));
	CHECK(d.list_words().at(id).accent_type == 2);

	auto compiles = f.analyzer.compile_count();
	CHECK_THROWS_AS(d.update_word(generate_uuid(),
	                              make_word_property("a", "ア", 0)),
	                Not_Found_Error);
	CHECK_THROWS_AS(
	    d.update_word("no-such-id", make_word_property("a", "ア", 0)),
	    Not_Found_Error);
	CHECK_THROWS_AS(d.update_word(id, make_word_property("a", "a", 0)),
	                Validation_Error);
	CHECK(f.analyzer.compile_count() == compiles);
	CHECK(d.list_words().size() == 2);
}

TEST_CASE("User_Dictionary::delete_word", "[dictionary]")
{
	auto f = Dict_Fixture();
	auto d = f.make();
	auto id = d.add_word(make_word_property("test", "テスト", 1));
	auto other = d.add_word(make_word_property("voice", "ボイス", 1));

	d.delete_word(id);
	auto words = d.list_words();
	CHECK(words.size() == 1);
	CHECK(words.count(other) == 1);
	CHECK(read_file(f.paths.compiled_dictionary).find("ｔｅｓｔ") ==
	      string::npos);

	CHECK_THROWS_AS(d.delete_word(id), Not_Found_Error);
	CHECK_THROWS_AS(d.delete_word("garbage"), Not_Found_Error);
	CHECK(d.list_words().size() == 1);
}

TEST_CASE("User_Dictionary::import_words", "[dictionary]")
{
	auto f = Dict_Fixture();
	auto d = f.make();
	auto id = d.add_word(make_word_property("test", "テスト", 1));
	auto compiles = f.analyzer.compile_count();

	auto fresh = generate_uuid();
	auto incoming = Word_Map();
	incoming[id] = record("test", "テスト", 3);
	incoming[fresh] = record("voice", "ボイス", 1, Word_Type::SUFFIX, 2);

	SECTION("existing wins")
	{
		d.import_words(incoming, false);
		auto words = d.list_words();
		CHECK(words.size() == 2);
		CHECK(words.at(id).accent_type == 1);
		CHECK(words.at(fresh) == incoming[fresh]);
		CHECK(f.analyzer.compile_count() == compiles + 1);
	}
	SECTION("incoming wins")
	{
		d.import_words(incoming, true);
		auto words = d.list_words();
		CHECK(words.size() == 2);
		CHECK(words.at(id).accent_type == 3);
		CHECK(f.analyzer.compile_count() == compiles + 1);
	}
	SECTION("identifiers are canonicalised")
	{
		auto upper = Word_Map();
		upper["{" + fresh + "}"] = incoming[fresh];
		d.import_words(upper, false);
		CHECK(d.list_words().count(fresh) == 1);
	}
	SECTION("one bad word aborts the import")
	{
		auto before = read_file(f.paths.store_file);
		auto bad = incoming;
		auto broken = record("a", "ア", 0);
		broken.context_id = 20;
		bad[generate_uuid()] = broken;
		CHECK_THROWS_AS(d.import_words(bad, true), Validation_Error);

		bad = incoming;
		bad["not-a-uuid"] = record("a", "ア", 0);
		CHECK_THROWS_AS(d.import_words(bad, true), Validation_Error);

		bad = incoming;
		auto verb = record("a", "ア", 0, Word_Type::VERB);
		verb.accent_associative_rule = "C1";
		bad[generate_uuid()] = verb;
		CHECK_THROWS_AS(d.import_words(bad, true), Validation_Error);

		CHECK(read_file(f.paths.store_file) == before);
		CHECK(f.analyzer.compile_count() == compiles);
	}
	SECTION("properties")
	{
		auto props = map<string, Word_Property>();
		props[fresh] = make_word_property("voice", "ボイス", 1);
		d.import_words(props, false);
		CHECK(d.list_words().at(fresh) == record("voice", "ボイス", 1));

		props[fresh].pronunciation = "voice";
		CHECK_THROWS_AS(d.import_words(props, true), Validation_Error);
		CHECK(d.list_words().at(fresh).pronunciation == "ボイス");
	}
}

TEST_CASE("User_Dictionary concurrent mutations", "[dictionary]")
{
	auto f = Dict_Fixture();
	auto d = f.make();

	auto threads = vector<thread>();
	auto ids = vector<vector<string>>(10);
	for (size_t t = 0; t != ids.size(); ++t) {
		threads.emplace_back([&, t] {
			for (auto i = 0; i != 5; ++i)
				ids[t].push_back(d.add_word(
				    make_word_property("word", "ワード", 1)));
		});
	}
	for (auto& t : threads)
		t.join();

	auto words = d.list_words();
	CHECK(words.size() == 50);
	for (auto& v : ids)
		for (auto& id : v)
			CHECK(words.count(id) == 1);
	CHECK(f.analyzer.compile_count() == 51);
	CHECK(d.compile_state() == Compile_State::IDLE);
	CHECK(temporaries_in(f.paths.store_file.parent_path()) == 0);

	// The last compilation saw every word.
	auto compiled = read_file(f.paths.compiled_dictionary);
	auto lines = count(begin(compiled), end(compiled), '\n');
	CHECK(lines == 51);
}

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

#include "store.hxx"
#include "utils.hxx"

#include <algorithm>
#include <fstream>
#include <memory>
#include <set>
#include <sstream>

#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/string_generator.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <json/json.h>

using namespace std;
namespace fs = std::filesystem;

namespace voxdict {
VOXDICT_BEGIN_INLINE_NAMESPACE

namespace {
const char* const known_fields[] = {"surface",
                                    "context_id",
                                    "cost",
                                    "part_of_speech",
                                    "part_of_speech_detail_1",
                                    "part_of_speech_detail_2",
                                    "part_of_speech_detail_3",
                                    "inflectional_type",
                                    "inflectional_form",
                                    "stem",
                                    "yomi",
                                    "pronunciation",
                                    "accent_type",
                                    "mora_count",
                                    "accent_associative_rule"};

auto is_known_field(const string& name) -> bool
{
	return any_of(begin(known_fields), end(known_fields),
	              [&](auto f) { return name == f; });
}

auto get_string(const Json::Value& word, const char* name, string& out,
                ostream& err_msg) -> bool
{
	auto& v = word[name];
	if (!v.isString()) {
		err_msg << "field " << name << " is missing or not a string";
		return false;
	}
	out = v.asString();
	return true;
}

auto get_int(const Json::Value& word, const char* name, int& out,
             ostream& err_msg) -> bool
{
	auto& v = word[name];
	if (!v.isInt()) {
		err_msg << "field " << name << " is missing or not an integer";
		return false;
	}
	out = v.asInt();
	return true;
}

auto parse_word(const Json::Value& v, Save_Format_Word& w, ostream& err_msg)
    -> bool
{
	if (!v.isObject()) {
		err_msg << "word is not a JSON object";
		return false;
	}
	auto& pos = w.part_of_speech;
	auto ok = get_string(v, "surface", w.surface, err_msg) &&
	          get_int(v, "cost", w.cost, err_msg) &&
	          get_string(v, "part_of_speech", pos.part_of_speech,
	                     err_msg) &&
	          get_string(v, "part_of_speech_detail_1", pos.detail_1,
	                     err_msg) &&
	          get_string(v, "part_of_speech_detail_2", pos.detail_2,
	                     err_msg) &&
	          get_string(v, "part_of_speech_detail_3", pos.detail_3,
	                     err_msg) &&
	          get_string(v, "inflectional_type", w.inflectional_type,
	                     err_msg) &&
	          get_string(v, "inflectional_form", w.inflectional_form,
	                     err_msg) &&
	          get_string(v, "stem", w.stem, err_msg) &&
	          get_string(v, "yomi", w.yomi, err_msg) &&
	          get_string(v, "pronunciation", w.pronunciation, err_msg) &&
	          get_int(v, "accent_type", w.accent_type, err_msg) &&
	          get_string(v, "accent_associative_rule",
	                     w.accent_associative_rule, err_msg);
	if (!ok)
		return false;

	// Stores written before context ids were saved only had proper nouns.
	if (v.isMember("context_id")) {
		if (!get_int(v, "context_id", w.context_id, err_msg))
			return false;
	}
	else {
		w.context_id =
		    part_of_speech_table().find(Word_Type::PROPER_NOUN).context_id;
	}
	if (v.isMember("mora_count")) {
		auto moras = 0;
		if (!get_int(v, "mora_count", moras, err_msg))
			return false;
		w.mora_count = moras;
	}
	return true;
}
} // namespace

/**
 * @brief Brings a UUID to the lower-case hyphenated form.
 * @param id UUID in any form accepted by boost::uuids::string_generator
 * @param[out] out canonical form, set only on success
 * @return false if @p id is not a UUID
 */
auto canonical_uuid(std::string_view id, std::string& out) -> bool
{
	try {
		auto u = boost::uuids::string_generator()(id.begin(), id.end());
		out = boost::uuids::to_string(u);
		return true;
	}
	catch (const std::runtime_error&) {
		return false;
	}
}

/**
 * @brief Returns a new random (version 4) UUID in canonical form.
 */
auto generate_uuid() -> std::string
{
	auto gen = boost::uuids::random_generator();
	return boost::uuids::to_string(gen());
}

/**
 * @brief Parses the store format.
 *
 * The whole input is validated before @p out is touched, so on failure
 * @p out keeps its previous content.
 *
 * @param in stream with a JSON object mapping UUIDs to words
 * @param[out] out parsed words keyed by canonical UUID
 * @param err_msg receives the reason of a failure, or on success the
 * warnings that were found
 * @return true on success
 */
auto parse_store(std::istream& in, Word_Map& out, std::ostream& err_msg)
    -> bool
{
	auto builder = Json::CharReaderBuilder();
	builder["rejectDupKeys"] = true;
	builder["failIfExtra"] = true;
	auto root = Json::Value();
	auto errs = string();
	if (!Json::parseFromStream(builder, in, &root, &errs)) {
		err_msg << errs;
		return false;
	}
	if (!root.isObject()) {
		err_msg << "top level value is not a JSON object";
		return false;
	}

	auto words = Word_Map();
	auto unknown = set<string>();
	for (auto& id : root.getMemberNames()) {
		auto key = string();
		if (!canonical_uuid(id, key)) {
			err_msg << "word identifier " << id << " is not a UUID";
			return false;
		}
		auto& v = root[id];
		auto save_word = Save_Format_Word();
		auto word_err = ostringstream();
		if (!parse_word(v, save_word, word_err)) {
			err_msg << "word " << id << ": " << word_err.str();
			return false;
		}
		auto record = Word_Record();
		try {
			record = from_save_format(save_word);
		}
		catch (const Validation_Error& e) {
			err_msg << "word " << id << ": " << e.what();
			return false;
		}
		if (!words.emplace(key, std::move(record)).second) {
			err_msg << "word identifier " << id
			        << " appears more than once";
			return false;
		}
		for (auto& name : v.getMemberNames()) {
			if (!is_known_field(name))
				unknown.insert(name);
		}
	}
	if (!unknown.empty()) {
		err_msg << "unknown word fields are not kept:";
		for (auto& name : unknown)
			err_msg << ' ' << name;
	}
	out = std::move(words);
	return true;
}

/**
 * @brief Writes words in the store format, see parse_store().
 * @throws Validation_Error if a record has an unknown context id or priority
 */
auto serialize_store(const Word_Map& words, std::ostream& out) -> void
{
	auto root = Json::Value(Json::objectValue);
	for (auto& [id, word] : words) {
		auto s = to_save_format(word);
		auto& v = root[id];
		v["surface"] = s.surface;
		v["context_id"] = s.context_id;
		v["cost"] = s.cost;
		v["part_of_speech"] = s.part_of_speech.part_of_speech;
		v["part_of_speech_detail_1"] = s.part_of_speech.detail_1;
		v["part_of_speech_detail_2"] = s.part_of_speech.detail_2;
		v["part_of_speech_detail_3"] = s.part_of_speech.detail_3;
		v["inflectional_type"] = s.inflectional_type;
		v["inflectional_form"] = s.inflectional_form;
		v["stem"] = s.stem;
		v["yomi"] = s.yomi;
		v["pronunciation"] = s.pronunciation;
		v["accent_type"] = s.accent_type;
		if (s.mora_count)
			v["mora_count"] = *s.mora_count;
		v["accent_associative_rule"] = s.accent_associative_rule;
	}
	auto builder = Json::StreamWriterBuilder();
	builder["indentation"] = "  ";
	builder["emitUTF8"] = true;
	auto writer = unique_ptr<Json::StreamWriter>(builder.newStreamWriter());
	writer->write(root, &out);
	out << '\n';
}

Word_Store::Word_Store(std::filesystem::path path, std::ostream& log)
    : store_path(std::move(path)), log(&log)
{
}

auto Word_Store::read_unlocked() const -> Word_Map
{
	if (!fs::exists(store_path))
		return {};
	auto in = ifstream(store_path, ios_base::binary);
	if (in.fail())
		throw fs::filesystem_error("Can not open store file", store_path,
		                           make_error_code(errc::io_error));
	auto words = Word_Map();
	auto err = ostringstream();
	if (!parse_store(in, words, err))
		throw Corrupt_Store_Error("Store file " + store_path.string() +
		                          " is corrupt: " + err.str());
	auto warnings = std::move(err).str();
	if (!warnings.empty())
		log_line(*log, "WARNING",
		         "Store file " + store_path.string() + ": " + warnings);
	return words;
}

/**
 * Writes into a sibling temporary file and renames it over the store, so a
 * crash never leaves a half written store behind.
 */
auto Word_Store::write_unlocked(const Word_Map& words) -> void
{
	auto dir = store_path.parent_path();
	if (!dir.empty())
		fs::create_directories(dir);
	auto tmp = store_path;
	tmp += ".tmp-" + generate_uuid();
	try {
		auto out = ofstream(tmp, ios_base::binary | ios_base::trunc);
		if (out.fail())
			throw fs::filesystem_error(
			    "Can not create temporary store file", tmp,
			    make_error_code(errc::io_error));
		serialize_store(words, out);
		out.close();
		if (out.fail())
			throw fs::filesystem_error(
			    "Can not write temporary store file", tmp,
			    make_error_code(errc::io_error));
		fs::rename(tmp, store_path);
	}
	catch (...) {
		remove_temporary(tmp, *log);
		throw;
	}
}

/**
 * @brief Reads the whole store.
 * @return empty map if the store file does not exist
 * @throws Corrupt_Store_Error if the file can not be parsed
 */
auto Word_Store::read_all() const -> Word_Map
{
	auto lock = lock_guard<mutex>(mtx);
	return read_unlocked();
}

/**
 * @brief Replaces the whole store with @p words.
 */
auto Word_Store::write_all(const Word_Map& words) -> void
{
	auto lock = lock_guard<mutex>(mtx);
	write_unlocked(words);
}

VOXDICT_END_INLINE_NAMESPACE
} // namespace voxdict

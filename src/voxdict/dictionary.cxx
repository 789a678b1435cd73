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

#include "dictionary.hxx"

using namespace std;

namespace voxdict {
VOXDICT_BEGIN_INLINE_NAMESPACE

namespace {
auto canonical_id_or_throw(string_view id) -> string
{
	auto key = string();
	if (!canonical_uuid(id, key))
		throw Not_Found_Error("Word " + string(id) + " not found");
	return key;
}

// Validates everything first so a bad entry aborts before any write.
auto validate_import(const Word_Map& incoming) -> Word_Map
{
	auto out = Word_Map();
	for (auto& [id, word] : incoming) {
		auto key = string();
		if (!canonical_uuid(id, key))
			throw Validation_Error("Word identifier " + id +
			                       " is not a UUID");
		auto record = Word_Record();
		try {
			record = validate_record(word);
		}
		catch (const Validation_Error& e) {
			throw Validation_Error("Word " + id + ": " + e.what());
		}
		if (!out.emplace(key, std::move(record)).second)
			throw Validation_Error("Word identifier " + id +
			                       " appears more than once");
	}
	return out;
}
} // namespace

/**
 * @brief Opens the store and compiles the dictionary once.
 *
 * The store file and the compiled dictionary do not need to exist.
 *
 * @throws Compilation_Error if the initial compilation fails
 * @throws Corrupt_Store_Error if the store file exists but is corrupt
 */
User_Dictionary::User_Dictionary(const Dictionary_Paths& paths,
                                 Analyzer& analyzer, Compile_Options options,
                                 std::ostream& log)
    : store(paths.store_file, log),
      compiler(store, analyzer, paths.base_lexicon_dir,
               paths.compiled_dictionary, options, log)
{
	compiler.compile();
}

auto User_Dictionary::list_words() const -> Word_Map
{
	return store.read_all();
}

/**
 * @brief Adds a word under a new identifier.
 * @return the identifier of the new word
 * @throws Validation_Error if the word is invalid, nothing is stored then
 */
auto User_Dictionary::add_word(const Word_Property& property) -> std::string
{
	auto record = to_record(property);
	auto id = string();
	store.modify([&](Word_Map& words) {
		do {
			id = generate_uuid();
		} while (words.count(id));
		words.emplace(id, std::move(record));
	});
	compiler.compile();
	return id;
}

/**
 * @brief Replaces the word with identifier @p id, keeping the identifier.
 * @throws Not_Found_Error if there is no such word
 * @throws Validation_Error if the word is invalid
 */
auto User_Dictionary::update_word(std::string_view id,
                                  const Word_Property& property) -> void
{
	auto record = to_record(property);
	auto key = canonical_id_or_throw(id);
	store.modify([&](Word_Map& words) {
		auto it = words.find(key);
		if (it == end(words))
			throw Not_Found_Error("Word " + key + " not found");
		it->second = std::move(record);
	});
	compiler.compile();
}

/**
 * @brief Removes the word with identifier @p id.
 * @throws Not_Found_Error if there is no such word
 */
auto User_Dictionary::delete_word(std::string_view id) -> void
{
	auto key = canonical_id_or_throw(id);
	store.modify([&](Word_Map& words) {
		if (words.erase(key) == 0)
			throw Not_Found_Error("Word " + key + " not found");
	});
	compiler.compile();
}

/**
 * @brief Merges words into the store.
 *
 * All incoming words are validated before the store is read. On an
 * identifier present in both, @p override_on_conflict selects the incoming
 * word, otherwise the existing one is kept. The store is written once and
 * the dictionary compiled once.
 *
 * @throws Validation_Error if any incoming word is invalid, nothing is
 * stored then
 */
auto User_Dictionary::import_words(const Word_Map& incoming,
                                   bool override_on_conflict) -> void
{
	auto valid = validate_import(incoming);
	store.modify([&](Word_Map& words) {
		for (auto& [id, word] : valid) {
			if (override_on_conflict)
				words.insert_or_assign(id, std::move(word));
			else
				words.emplace(id, std::move(word));
		}
	});
	compiler.compile();
}

auto User_Dictionary::import_words(
    const std::map<std::string, Word_Property>& incoming,
    bool override_on_conflict) -> void
{
	auto records = Word_Map();
	for (auto& [id, property] : incoming) {
		try {
			records.emplace(id, to_record(property));
		}
		catch (const Validation_Error& e) {
			throw Validation_Error("Word " + id + ": " + e.what());
		}
	}
	import_words(records, override_on_conflict);
}

/**
 * @brief Recompiles the dictionary from the store without changing it.
 */
auto User_Dictionary::update_dictionary() -> void { compiler.compile(); }

VOXDICT_END_INLINE_NAMESPACE
} // namespace voxdict

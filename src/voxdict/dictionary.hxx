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

/**
 * @file
 * @brief The user dictionary manager.
 */

#ifndef VOXDICT_DICTIONARY_HXX
#define VOXDICT_DICTIONARY_HXX

#include "compiler.hxx"
#include "paths.hxx"

namespace voxdict {
VOXDICT_BEGIN_INLINE_NAMESPACE

/**
 * @brief Thrown when an identifier is not in the store.
 */
class Not_Found_Error : public User_Dictionary_Error {
      public:
	using User_Dictionary_Error::User_Dictionary_Error;
};

/**
 * @brief The only important public class
 *
 * Every mutation is persisted and followed by a recompilation, so when a
 * mutating call returns the analyzer uses a dictionary that contains it.
 * Safe to call from many threads.
 */
class VOXDICT_EXPORT User_Dictionary {
	Word_Store store;
	Dictionary_Compiler compiler;

      public:
	User_Dictionary(const Dictionary_Paths& paths, Analyzer& analyzer,
	                Compile_Options options = {},
	                std::ostream& log = std::clog);

	auto list_words() const -> Word_Map;
	auto add_word(const Word_Property& property) -> std::string;
	auto update_word(std::string_view id, const Word_Property& property)
	    -> void;
	auto delete_word(std::string_view id) -> void;
	auto import_words(const Word_Map& incoming, bool override_on_conflict)
	    -> void;
	auto import_words(const std::map<std::string, Word_Property>& incoming,
	                  bool override_on_conflict) -> void;

	auto update_dictionary() -> void;
	auto active_dictionary() const { return compiler.active_dictionary(); }
	auto compile_state() const { return compiler.state(); }
	auto& store_path() const { return store.path(); }
};

VOXDICT_END_INLINE_NAMESPACE
} // namespace voxdict
#endif // VOXDICT_DICTIONARY_HXX

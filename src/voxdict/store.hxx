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
 * @brief Persistent storage of the user dictionary.
 */

#ifndef VOXDICT_STORE_HXX
#define VOXDICT_STORE_HXX

#include "word.hxx"

#include <filesystem>
#include <iostream>
#include <map>
#include <mutex>

namespace voxdict {
VOXDICT_BEGIN_INLINE_NAMESPACE

/**
 * @brief Thrown when the store file can not be parsed.
 */
class Corrupt_Store_Error : public User_Dictionary_Error {
      public:
	using User_Dictionary_Error::User_Dictionary_Error;
};

/**
 * @brief Identifier to word. The order has no meaning, std::map only keeps
 * the store file and the compiler source deterministic.
 */
using Word_Map = std::map<std::string, Word_Record>;

VOXDICT_EXPORT auto canonical_uuid(std::string_view id, std::string& out)
    -> bool;
VOXDICT_EXPORT auto generate_uuid() -> std::string;

VOXDICT_EXPORT auto parse_store(std::istream& in, Word_Map& out,
                                std::ostream& err_msg) -> bool;
VOXDICT_EXPORT auto serialize_store(const Word_Map& words, std::ostream& out)
    -> void;

/**
 * @brief The store file, read and written as a whole.
 *
 * There is no cache. Every read goes to the file so it always sees the last
 * committed write. All access to the file is serialized by one mutex which
 * must not be held when calling into the compiler.
 */
class VOXDICT_EXPORT Word_Store {
	std::filesystem::path store_path;
	std::ostream* log;
	mutable std::mutex mtx;

	auto read_unlocked() const -> Word_Map;
	auto write_unlocked(const Word_Map& words) -> void;

      public:
	explicit Word_Store(std::filesystem::path path,
	                    std::ostream& log = std::clog);
	auto& path() const { return store_path; }

	auto read_all() const -> Word_Map;
	auto write_all(const Word_Map& words) -> void;

	/**
	 * @brief Read, modify and write back under one lock.
	 *
	 * @p fn gets the current words and changes them in place. If it
	 * throws, nothing is written and the exception propagates.
	 */
	template <class Func>
	auto modify(Func&& fn) -> void
	{
		auto lock = std::lock_guard<std::mutex>(mtx);
		auto words = read_unlocked();
		fn(words);
		write_unlocked(words);
	}
};

VOXDICT_END_INLINE_NAMESPACE
} // namespace voxdict
#endif // VOXDICT_STORE_HXX

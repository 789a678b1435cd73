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
 * @brief User dictionary words, part-of-speech table and cost codec.
 */

#ifndef VOXDICT_WORD_HXX
#define VOXDICT_WORD_HXX

#include "defines.hxx"

#include <array>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace voxdict {
VOXDICT_BEGIN_INLINE_NAMESPACE

/**
 * @brief Base class of all exceptions thrown by this library.
 */
class User_Dictionary_Error : public std::runtime_error {
      public:
	using std::runtime_error::runtime_error;
};

/**
 * @brief Thrown for a malformed word, an unknown part of speech or a bad
 * priority.
 */
class Validation_Error : public User_Dictionary_Error {
      public:
	using User_Dictionary_Error::User_Dictionary_Error;
};

enum class Word_Type : char {
	PROPER_NOUN,
	COMMON_NOUN,
	VERB,
	ADJECTIVE,
	SUFFIX
};

constexpr int MIN_PRIORITY = 0;
constexpr int MAX_PRIORITY = 10;
constexpr int DEFAULT_PRIORITY = 5;

/**
 * @brief The four part-of-speech columns of the analyzer's lexicon.
 */
struct Part_Of_Speech {
	std::string part_of_speech;
	std::string detail_1;
	std::string detail_2;
	std::string detail_3;
};

auto inline operator==(const Part_Of_Speech& a, const Part_Of_Speech& b)
    -> bool
{
	return a.part_of_speech == b.part_of_speech &&
	       a.detail_1 == b.detail_1 && a.detail_2 == b.detail_2 &&
	       a.detail_3 == b.detail_3;
}
auto inline operator!=(const Part_Of_Speech& a, const Part_Of_Speech& b)
    -> bool
{
	return !(a == b);
}

/**
 * @brief One row of the part-of-speech table.
 *
 * cost_candidates[i] is the cost of priority MAX_PRIORITY - i, so the array
 * is ascending while the priority descends.
 */
struct Part_Of_Speech_Detail {
	Word_Type word_type;
	Part_Of_Speech pos;
	int context_id;
	std::array<int, MAX_PRIORITY - MIN_PRIORITY + 1> cost_candidates;
	std::vector<std::string> accent_associative_rules;

	auto allows_rule(std::string_view rule) const -> bool;
};

/**
 * @brief Immutable table of supported parts of speech with O(1) lookups.
 *
 * Use part_of_speech_table() to get the single instance.
 */
class VOXDICT_EXPORT Part_Of_Speech_Table {
	std::vector<Part_Of_Speech_Detail> rows;
	std::unordered_map<std::string, size_t> by_pos;
	std::unordered_map<int, size_t> by_context_id;

      public:
	explicit Part_Of_Speech_Table(std::vector<Part_Of_Speech_Detail> r);
	auto find(const Part_Of_Speech& pos) const
	    -> const Part_Of_Speech_Detail*;
	auto find(int context_id) const -> const Part_Of_Speech_Detail*;
	auto find(Word_Type type) const -> const Part_Of_Speech_Detail&;
	auto begin() const { return rows.begin(); }
	auto end() const { return rows.end(); }
	auto size() const { return rows.size(); }
};

VOXDICT_EXPORT auto part_of_speech_table() -> const Part_Of_Speech_Table&;

/**
 * @brief A word as submitted by a user.
 */
struct Word_Property {
	std::string surface;
	std::string pronunciation;
	int accent_type = 0;
	Part_Of_Speech part_of_speech;
	std::string accent_associative_rule = "*";
	int priority = DEFAULT_PRIORITY;
};

VOXDICT_EXPORT auto
make_word_property(std::string surface, std::string pronunciation,
                   int accent_type, Word_Type type = Word_Type::PROPER_NOUN,
                   int priority = DEFAULT_PRIORITY) -> Word_Property;

/**
 * @brief A stored user dictionary word.
 *
 * Invariant: the part of speech is a row of the table, context_id is the
 * context id of that row, accent_associative_rule is allowed by that row and
 * mora_count is the mora count of pronunciation.
 */
struct Word_Record {
	std::string surface;
	int priority = DEFAULT_PRIORITY;
	int context_id = 0;
	Part_Of_Speech part_of_speech;
	std::string inflectional_type = "*";
	std::string inflectional_form = "*";
	std::string stem = "*";
	std::string yomi;
	std::string pronunciation;
	int accent_type = 0;
	int mora_count = 0;
	std::string accent_associative_rule = "*";
};

VOXDICT_EXPORT auto operator==(const Word_Record& a, const Word_Record& b)
    -> bool;
auto inline operator!=(const Word_Record& a, const Word_Record& b) -> bool
{
	return !(a == b);
}

/**
 * @brief On-disk projection of Word_Record.
 *
 * The priority is persisted as the analyzer cost. mora_count is optional
 * because old stores did not have it.
 */
struct Save_Format_Word {
	std::string surface;
	int context_id = 0;
	int cost = 0;
	Part_Of_Speech part_of_speech;
	std::string inflectional_type;
	std::string inflectional_form;
	std::string stem;
	std::string yomi;
	std::string pronunciation;
	int accent_type = 0;
	std::optional<int> mora_count;
	std::string accent_associative_rule;
};

VOXDICT_EXPORT auto count_moras(std::string_view pronunciation) -> int;

VOXDICT_EXPORT auto cost_from_priority(int context_id, int priority) -> int;
VOXDICT_EXPORT auto priority_from_cost(int context_id, int cost) -> int;

VOXDICT_EXPORT auto to_record(const Word_Property& property) -> Word_Record;
VOXDICT_EXPORT auto validate_record(const Word_Record& record) -> Word_Record;

VOXDICT_EXPORT auto to_save_format(const Word_Record& record)
    -> Save_Format_Word;
VOXDICT_EXPORT auto from_save_format(const Save_Format_Word& word)
    -> Word_Record;

VOXDICT_END_INLINE_NAMESPACE
} // namespace voxdict
#endif // VOXDICT_WORD_HXX

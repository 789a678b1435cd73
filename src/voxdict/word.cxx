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

#include "word.hxx"
#include "utils.hxx"

#include <algorithm>
#include <cstdlib>
#include <limits>

using namespace std;

namespace voxdict {
VOXDICT_BEGIN_INLINE_NAMESPACE

namespace {
auto pos_key(const Part_Of_Speech& pos) -> string
{
	auto key = pos.part_of_speech;
	key += ',';
	key += pos.detail_1;
	key += ',';
	key += pos.detail_2;
	key += ',';
	key += pos.detail_3;
	return key;
}

auto make_table() -> vector<Part_Of_Speech_Detail>
{
	auto all_rules = vector<string>{"*", "C1", "C2", "C3", "C4", "C5"};
	auto no_rules = vector<string>{"*"};
	return {
	    {Word_Type::PROPER_NOUN,
	     {"名詞", "固有名詞", "一般", "*"},
	     1348,
	     {-988, 3488, 4768, 6048, 7328, 8609, 8734, 8859, 8984, 9110,
	      14176},
	     all_rules},
	    {Word_Type::COMMON_NOUN,
	     {"名詞", "一般", "*", "*"},
	     1345,
	     {-4445, 49, 1473, 2897, 4321, 5746, 6554, 7362, 8170, 8979,
	      15001},
	     all_rules},
	    {Word_Type::VERB,
	     {"動詞", "自立", "*", "*"},
	     642,
	     {3100, 6160, 6360, 6561, 6761, 6962, 7414, 7866, 8318, 8771,
	      13433},
	     no_rules},
	    {Word_Type::ADJECTIVE,
	     {"形容詞", "自立", "*", "*"},
	     20,
	     {1527, 3266, 3561, 3857, 4153, 4449, 5149, 5849, 6549, 7250,
	      10001},
	     no_rules},
	    {Word_Type::SUFFIX,
	     {"名詞", "接尾", "一般", "*"},
	     1358,
	     {4399, 5373, 6041, 6710, 7378, 8047, 9440, 10834, 12228, 13622,
	      15847},
	     all_rules}};
}

// Small kana that can not start a mora on their own. SOKUON is kept apart.
constexpr auto SMALL_KANA = u32string_view(U"ァィゥェォャュョヮ");
constexpr auto SOKUON = U'ッ';

struct Two_Char_Mora {
	u32string_view first;
	u32string_view second;
};

constexpr Two_Char_Mora two_char_moras[] = {
    {U"イ", U"ェ"},
    {U"ヴ", U"ャュョ"},
    {U"トド", U"ゥ"},
    {U"テデ", U"ィャュョ"},
    {U"デ", U"ェ"},
    {U"クグ", U"ヮ"},
    {U"キシチニヒミリギジビピ", U"ェャュョ"},
    {U"ツフヴ", U"ァ"},
    {U"ウスツフヴズ", U"ィ"},
    {U"ウツフヴ", U"ェォ"}};

auto is_two_char_mora(char32_t a, char32_t b) -> bool
{
	return any_of(begin(two_char_moras), end(two_char_moras),
	              [&](auto& r) {
		              return r.first.find(a) != r.first.npos &&
		                     r.second.find(b) != r.second.npos;
	              });
}

auto is_katakana(char32_t cp) -> bool
{
	return (U'ァ' <= cp && cp <= U'ヴ') || cp == U'ー';
}

auto count_moras_valid(u32string_view s) -> int
{
	auto n = 0;
	for (size_t i = 0; i != s.size(); ++n) {
		if (i + 1 != s.size() && is_two_char_mora(s[i], s[i + 1]))
			i += 2;
		else
			i += 1;
	}
	return n;
}

auto check_utf8(string_view field, string_view value) -> void
{
	if (!validate_utf8(value))
		throw Validation_Error(string(field) + " is not valid UTF-8");
}

// Every text field ends up as a column of the compiler source.
auto check_column(string_view field, string_view value) -> void
{
	check_utf8(field, value);
	if (value.empty())
		throw Validation_Error(string(field) + " is empty");
	if (value.find_first_of(",\"\r\n") != value.npos)
		throw Validation_Error(string(field) +
		                       " contains a comma, a quote or a line "
		                       "break");
}

// ASCII commas and quotes become full-width, so only line breaks can
// survive the conversion.
auto normalize_surface(string_view surface) -> string
{
	check_utf8("Surface", surface);
	if (surface.empty())
		throw Validation_Error("Surface is empty");
	auto s = to_fullwidth(surface);
	check_column("Surface", s);
	return s;
}

/**
 * Checks that the pronunciation is katakana where small kana are only used
 * the way they can be pronounced.
 */
auto check_pronunciation(string_view pronunciation) -> u32string
{
	check_utf8("Pronunciation", pronunciation);
	auto s = valid_utf8_to_32(pronunciation);
	if (s.empty())
		throw Validation_Error("Pronunciation is empty");
	if (!all_of(begin(s), end(s), is_katakana))
		throw Validation_Error("Pronunciation " + string(pronunciation) +
		                       " is not written in katakana");
	for (size_t i = 0; i != s.size(); ++i) {
		auto c = s[i];
		auto is_small = SMALL_KANA.find(c) != SMALL_KANA.npos;
		if ((is_small || c == SOKUON) && i + 1 != s.size()) {
			auto next = s[i + 1];
			if (SMALL_KANA.find(next) != SMALL_KANA.npos ||
			    (c == SOKUON && next == SOKUON))
				throw Validation_Error(
				    "Pronunciation " + string(pronunciation) +
				    " has consecutive small kana");
		}
		if (c == U'ヮ' && i != 0 && s[i - 1] != U'ク' &&
		    s[i - 1] != U'グ')
			throw Validation_Error("Pronunciation " +
			                       string(pronunciation) +
			                       " uses ヮ after other than ク or グ");
	}
	return s;
}

auto check_priority(int priority) -> void
{
	if (priority < MIN_PRIORITY || priority > MAX_PRIORITY)
		throw Validation_Error("Priority " + to_string(priority) +
		                       " is out of range [" +
		                       to_string(MIN_PRIORITY) + ", " +
		                       to_string(MAX_PRIORITY) + "]");
}

auto check_accent_type(int accent_type, int mora_count) -> void
{
	if (accent_type < 0 || accent_type > mora_count)
		throw Validation_Error("Accent type " + to_string(accent_type) +
		                       " is out of range [0, " +
		                       to_string(mora_count) + "]");
}

auto find_detail(const Part_Of_Speech& pos, string_view rule)
    -> const Part_Of_Speech_Detail&
{
	auto detail = part_of_speech_table().find(pos);
	if (!detail)
		throw Validation_Error("Unsupported part of speech " +
		                       pos_key(pos));
	if (!detail->allows_rule(rule))
		throw Validation_Error("Accent associative rule " +
		                       string(rule) + " is not allowed for " +
		                       pos_key(pos));
	return *detail;
}

auto find_cost_candidates(int context_id) -> const Part_Of_Speech_Detail&
{
	auto detail = part_of_speech_table().find(context_id);
	if (!detail)
		throw Validation_Error("Unknown context id " +
		                       to_string(context_id));
	return *detail;
}
} // namespace

auto Part_Of_Speech_Detail::allows_rule(std::string_view rule) const -> bool
{
	return find(begin(accent_associative_rules),
	            end(accent_associative_rules),
	            rule) != end(accent_associative_rules);
}

Part_Of_Speech_Table::Part_Of_Speech_Table(vector<Part_Of_Speech_Detail> r)
    : rows(std::move(r))
{
	for (size_t i = 0; i != rows.size(); ++i) {
		by_pos.emplace(pos_key(rows[i].pos), i);
		by_context_id.emplace(rows[i].context_id, i);
	}
}

auto Part_Of_Speech_Table::find(const Part_Of_Speech& pos) const
    -> const Part_Of_Speech_Detail*
{
	auto it = by_pos.find(pos_key(pos));
	if (it == by_pos.end())
		return nullptr;
	return &rows[it->second];
}

auto Part_Of_Speech_Table::find(int context_id) const
    -> const Part_Of_Speech_Detail*
{
	auto it = by_context_id.find(context_id);
	if (it == by_context_id.end())
		return nullptr;
	return &rows[it->second];
}

auto Part_Of_Speech_Table::find(Word_Type type) const
    -> const Part_Of_Speech_Detail&
{
	auto it = find_if(begin(), end(),
	                  [&](auto& row) { return row.word_type == type; });
	if (it == end())
		throw Validation_Error("Unsupported word type");
	return *it;
}

/**
 * @brief Returns the table, built on first use and never modified.
 */
auto part_of_speech_table() -> const Part_Of_Speech_Table&
{
	static const auto table = Part_Of_Speech_Table(make_table());
	return table;
}

auto make_word_property(std::string surface, std::string pronunciation,
                        int accent_type, Word_Type type, int priority)
    -> Word_Property
{
	auto p = Word_Property();
	p.surface = std::move(surface);
	p.pronunciation = std::move(pronunciation);
	p.accent_type = accent_type;
	p.part_of_speech = part_of_speech_table().find(type).pos;
	p.priority = priority;
	return p;
}

auto operator==(const Word_Record& a, const Word_Record& b) -> bool
{
	return a.surface == b.surface && a.priority == b.priority &&
	       a.context_id == b.context_id &&
	       a.part_of_speech == b.part_of_speech &&
	       a.inflectional_type == b.inflectional_type &&
	       a.inflectional_form == b.inflectional_form &&
	       a.stem == b.stem && a.yomi == b.yomi &&
	       a.pronunciation == b.pronunciation &&
	       a.accent_type == b.accent_type &&
	       a.mora_count == b.mora_count &&
	       a.accent_associative_rule == b.accent_associative_rule;
}

/**
 * @brief Counts the moras of a katakana pronunciation.
 *
 * Combinations such as "キャ" or "ティ" count as one mora, every other
 * character including "ッ" and "ー" counts as one.
 *
 * @throws Validation_Error if @p pronunciation is not valid katakana.
 */
auto count_moras(std::string_view pronunciation) -> int
{
	return count_moras_valid(check_pronunciation(pronunciation));
}

/**
 * @brief Maps a priority to the cost used by the dictionary compiler.
 *
 * Higher priority gives lower cost. The analyzer prefers low cost entries.
 *
 * @param context_id context id of a row in the part-of-speech table
 * @param priority value in [MIN_PRIORITY, MAX_PRIORITY]
 * @throws Validation_Error on unknown context id or priority out of range
 */
auto cost_from_priority(int context_id, int priority) -> int
{
	auto& detail = find_cost_candidates(context_id);
	check_priority(priority);
	return detail.cost_candidates[MAX_PRIORITY - priority];
}

/**
 * @brief Inverse of cost_from_priority().
 *
 * Costs that are not candidates map to the priority with the nearest
 * candidate. On a tie the higher priority wins.
 */
auto priority_from_cost(int context_id, int cost) -> int
{
	auto& detail = find_cost_candidates(context_id);
	if (cost < numeric_limits<short>::min() ||
	    cost > numeric_limits<short>::max())
		throw Validation_Error("Cost " + to_string(cost) +
		                       " does not fit in 16 bits");
	auto& c = detail.cost_candidates;
	auto best = begin(c);
	for (auto it = begin(c); it != end(c); ++it) {
		if (abs(*it - cost) < abs(*best - cost))
			best = it;
	}
	return MAX_PRIORITY - int(distance(begin(c), best));
}

/**
 * @brief Validates a property and builds the record to be stored.
 *
 * The surface is converted to full-width, the mora count is computed from
 * the pronunciation and the context id is taken from the part of speech.
 *
 * @throws Validation_Error if the part of speech is not in the table, the
 * accent associative rule is not allowed for it, or any field is malformed.
 */
auto to_record(const Word_Property& property) -> Word_Record
{
	auto& detail =
	    find_detail(property.part_of_speech, property.accent_associative_rule);
	check_priority(property.priority);

	auto w = Word_Record();
	w.surface = normalize_surface(property.surface);
	w.priority = property.priority;
	w.context_id = detail.context_id;
	w.part_of_speech = detail.pos;
	w.yomi = property.pronunciation;
	w.pronunciation = property.pronunciation;
	w.mora_count = count_moras_valid(check_pronunciation(w.pronunciation));
	w.accent_type = property.accent_type;
	check_accent_type(w.accent_type, w.mora_count);
	w.accent_associative_rule = property.accent_associative_rule;
	return w;
}

/**
 * @brief Validates a complete record and returns its normalized form.
 *
 * Used for records that did not come from to_record(), i.e. imports and
 * loaded stores. An empty yomi defaults to the pronunciation and a zero mora
 * count is filled in. A non-zero mora count must match the pronunciation.
 *
 * @throws Validation_Error if the record breaks any invariant of Word_Record
 */
auto validate_record(const Word_Record& record) -> Word_Record
{
	auto& detail =
	    find_detail(record.part_of_speech, record.accent_associative_rule);
	if (detail.context_id != record.context_id)
		throw Validation_Error(
		    "Context id " + to_string(record.context_id) +
		    " does not belong to part of speech " +
		    pos_key(record.part_of_speech));
	check_priority(record.priority);

	auto w = record;
	w.surface = normalize_surface(record.surface);
	auto moras = count_moras_valid(check_pronunciation(w.pronunciation));
	if (w.mora_count != 0 && w.mora_count != moras)
		throw Validation_Error("Mora count " + to_string(w.mora_count) +
		                       " does not match pronunciation " +
		                       w.pronunciation);
	w.mora_count = moras;
	check_accent_type(w.accent_type, w.mora_count);
	if (w.yomi.empty())
		w.yomi = w.pronunciation;
	check_column("Yomi", w.yomi);
	check_column("Inflectional type", w.inflectional_type);
	check_column("Inflectional form", w.inflectional_form);
	check_column("Stem", w.stem);
	return w;
}

auto to_save_format(const Word_Record& record) -> Save_Format_Word
{
	auto s = Save_Format_Word();
	s.surface = record.surface;
	s.context_id = record.context_id;
	s.cost = cost_from_priority(record.context_id, record.priority);
	s.part_of_speech = record.part_of_speech;
	s.inflectional_type = record.inflectional_type;
	s.inflectional_form = record.inflectional_form;
	s.stem = record.stem;
	s.yomi = record.yomi;
	s.pronunciation = record.pronunciation;
	s.accent_type = record.accent_type;
	s.mora_count = record.mora_count;
	s.accent_associative_rule = record.accent_associative_rule;
	return s;
}

/**
 * @brief Rebuilds a record from its on-disk form.
 *
 * The priority is recovered from the cost. A missing mora count is
 * recomputed, a stored one must match the pronunciation, zero included.
 *
 * @throws Validation_Error if the stored word is not a valid record
 */
auto from_save_format(const Save_Format_Word& word) -> Word_Record
{
	auto w = Word_Record();
	w.surface = word.surface;
	w.priority = priority_from_cost(word.context_id, word.cost);
	w.context_id = word.context_id;
	w.part_of_speech = word.part_of_speech;
	w.inflectional_type = word.inflectional_type;
	w.inflectional_form = word.inflectional_form;
	w.stem = word.stem;
	w.yomi = word.yomi;
	w.pronunciation = word.pronunciation;
	w.accent_type = word.accent_type;
	w.accent_associative_rule = word.accent_associative_rule;
	if (word.mora_count) {
		auto moras = count_moras(word.pronunciation);
		if (*word.mora_count != moras)
			throw Validation_Error(
			    "Stored mora count " + to_string(*word.mora_count) +
			    " does not match pronunciation " + word.pronunciation);
		w.mora_count = moras;
	}
	return validate_record(w);
}

VOXDICT_END_INLINE_NAMESPACE
} // namespace voxdict

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

#include "compiler.hxx"
#include "paths.hxx"
#include "utils.hxx"

#include <fstream>
#include <sstream>

#include <boost/iostreams/copy.hpp>
#include <boost/iostreams/filter/zstd.hpp>
#include <boost/iostreams/filtering_stream.hpp>

using namespace std;
namespace fs = std::filesystem;
namespace io = boost::iostreams;

namespace voxdict {
VOXDICT_BEGIN_INLINE_NAMESPACE

Analyzer::~Analyzer() = default;

/**
 * @brief Reads one base lexicon file, decompressing it if it ends in .zst.
 * @throws Compilation_Error if the file can not be read or decompressed
 */
auto read_base_lexicon(const std::filesystem::path& file) -> std::string
{
	auto in = ifstream(file, ios_base::binary);
	if (in.fail())
		throw Compilation_Error("Can not open base lexicon " +
		                        file.string());
	auto out = ostringstream();
	try {
		auto filter = io::filtering_istream();
		if (file.extension() == ".zst")
			filter.push(io::zstd_decompressor());
		filter.push(in);
		io::copy(filter, out);
	}
	catch (const std::ios_base::failure& e) {
		throw Compilation_Error("Can not read base lexicon " +
		                        file.string() + ": " + e.what());
	}
	return std::move(out).str();
}

/**
 * @brief Appends the compiler source line of one word.
 *
 * Columns: surface, left and right context id, cost, the four
 * part-of-speech columns, inflectional type, form and stem, yomi,
 * pronunciation, accent type/mora count and accent associative rule.
 */
auto append_source_line(const Word_Record& word, std::string& out) -> void
{
	auto cost = cost_from_priority(word.context_id, word.priority);
	auto& pos = word.part_of_speech;
	auto id = to_string(word.context_id);
	out += word.surface;
	out += ',';
	out += id;
	out += ',';
	out += id;
	out += ',';
	out += to_string(cost);
	out += ',';
	out += pos.part_of_speech;
	out += ',';
	out += pos.detail_1;
	out += ',';
	out += pos.detail_2;
	out += ',';
	out += pos.detail_3;
	out += ',';
	out += word.inflectional_type;
	out += ',';
	out += word.inflectional_form;
	out += ',';
	out += word.stem;
	out += ',';
	out += word.yomi;
	out += ',';
	out += word.pronunciation;
	out += ',';
	out += to_string(word.accent_type);
	out += '/';
	out += to_string(word.mora_count);
	out += ',';
	out += word.accent_associative_rule;
	out += '\n';
}

Dictionary_Compiler::Dictionary_Compiler(const Word_Store& store,
                                         Analyzer& analyzer,
                                         std::filesystem::path base_lexicon_dir,
                                         std::filesystem::path compiled_path,
                                         Compile_Options options,
                                         std::ostream& log)
    : store(store), analyzer(analyzer),
      base_lexicon_dir(std::move(base_lexicon_dir)),
      compiled_path(std::move(compiled_path)), options(options), log(&log)
{
}

/**
 * @brief Writes the compiler source: base lexicon followed by user words.
 * @return false if there is no base lexicon
 */
auto Dictionary_Compiler::stage_source(const std::filesystem::path& source)
    -> bool
{
	auto files =
	    find_base_lexicon_files(base_lexicon_dir, options.under_test_harness);
	if (files.empty())
		return false;
	if (options.under_test_harness)
		log_line(*log, "INFO",
		         "Using only the test base lexicon " + files[0].string());

	auto text = string();
	for (auto& f : files) {
		text += read_base_lexicon(f);
		if (!text.empty() && text.back() != '\n')
			text += '\n';
	}
	for (auto& [id, word] : store.read_all())
		append_source_line(word, text);

	auto dir = source.parent_path();
	if (!dir.empty())
		fs::create_directories(dir);
	auto out = ofstream(source, ios_base::binary | ios_base::trunc);
	out << text;
	out.close();
	if (out.fail())
		throw Compilation_Error("Can not write compiler source " +
		                        source.string());
	return true;
}

/**
 * Unregisters the current dictionary, moves the new one to its final place
 * and registers it. If the move fails the previous dictionary is registered
 * again. If registering the new one fails, the previous file is already
 * replaced, so the analyzer and active_dictionary() are left without a user
 * dictionary until the next successful compile.
 */
auto Dictionary_Compiler::swap_in(const std::filesystem::path& compiled)
    -> void
{
	auto previous = active.get();
	analyzer.clear_user_dictionary();
	active.reset();
	try {
		fs::rename(compiled, compiled_path);
	}
	catch (const fs::filesystem_error&) {
		if (previous) {
			analyzer.set_user_dictionary(*previous);
			active.set(previous);
		}
		throw;
	}
	if (!fs::is_regular_file(compiled_path))
		return;
	auto p = make_shared<const fs::path>(fs::canonical(compiled_path));
	analyzer.set_user_dictionary(*p);
	active.set(p);
}

auto Dictionary_Compiler::compile_locked() -> void
{
	auto tag = generate_uuid();
	auto dir = compiled_path.parent_path();
	auto stem = compiled_path.stem().string();
	auto source = dir / (stem + ".dict_csv-" + tag + ".tmp");
	auto compiled = dir / (stem + ".dict_compiled-" + tag + ".tmp");

	struct Cleanup {
		const fs::path& a;
		const fs::path& b;
		ostream& log;
		~Cleanup()
		{
			remove_temporary(a, log);
			remove_temporary(b, log);
		}
	} cleanup{source, compiled, *log};

	st = Compile_State::STAGING_SOURCE;
	if (!stage_source(source)) {
		log_line(*log, "WARNING",
		         "No base lexicon found in " + base_lexicon_dir.string() +
		             ", the user dictionary is not compiled");
		st = Compile_State::IDLE;
		return;
	}

	st = Compile_State::COMPILING;
	auto err = ostringstream();
	if (!analyzer.compile(source, compiled, err))
		throw Compilation_Error("Compiling the user dictionary failed: " +
		                        err.str());
	if (!fs::is_regular_file(compiled))
		throw Compilation_Error(
		    "Compiling the user dictionary produced no output");

	st = Compile_State::SWAPPING;
	swap_in(compiled);
	log_line(*log, "INFO",
	         "Activated user dictionary " + compiled_path.string());
	st = Compile_State::IDLE;
}

/**
 * @brief Rebuilds the compiled dictionary from the current store and
 * activates it.
 *
 * Serialized with other compilations. A missing base lexicon is only logged.
 * After a failure state() stays Compile_State::FAILED until the next call.
 *
 * @throws Compilation_Error if the external compiler fails, in which case
 * the previously active dictionary stays active
 * @throws Analyzer_Error or other errors of the analyzer if it can not
 * register the new dictionary, see swap_in()
 * @throws Corrupt_Store_Error if the store can not be read
 * @throws std::filesystem::filesystem_error on I/O errors
 */
auto Dictionary_Compiler::compile() -> void
{
	auto lock = lock_guard<mutex>(mtx);
#ifdef _WIN32
	// The analyzer keeps the dictionary file open and can not reload it.
	if (options.under_test_harness)
		return;
#endif
	try {
		compile_locked();
	}
	catch (const std::exception& e) {
		st = Compile_State::FAILED;
		log_line(*log, "ERROR",
		         string("Updating the user dictionary failed: ") +
		             e.what());
		throw;
	}
}

VOXDICT_END_INLINE_NAMESPACE
} // namespace voxdict

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
 * @brief Compiling the user dictionary and activating it in the analyzer.
 */

#ifndef VOXDICT_COMPILER_HXX
#define VOXDICT_COMPILER_HXX

#include "store.hxx"

#include <atomic>
#include <memory>

namespace voxdict {
VOXDICT_BEGIN_INLINE_NAMESPACE

/**
 * @brief Thrown when the external compiler fails or produces no output.
 */
class Compilation_Error : public User_Dictionary_Error {
      public:
	using User_Dictionary_Error::User_Dictionary_Error;
};

/**
 * @brief The morphological analyzer as seen by the compiler.
 *
 * Implementations wrap a concrete analyzer, see Mecab_Analyzer. The
 * set/clear calls are only made by Dictionary_Compiler while it holds its
 * lock.
 */
class VOXDICT_EXPORT Analyzer {
      public:
	virtual ~Analyzer();

	/**
	 * @brief Compiles lexicon source text into a binary dictionary.
	 * @param source CSV lexicon source
	 * @param output path of the binary dictionary to create
	 * @param err_msg receives the reason of a failure
	 * @return true on success
	 */
	virtual auto compile(const std::filesystem::path& source,
	                     const std::filesystem::path& output,
	                     std::ostream& err_msg) -> bool = 0;
	virtual auto set_user_dictionary(const std::filesystem::path& artifact)
	    -> void = 0;
	virtual auto clear_user_dictionary() -> void = 0;
};

/**
 * @brief Atomically replaceable handle to the active compiled dictionary.
 *
 * Single writer (the compiler, under its lock), any number of readers
 * without locking. A reader keeps its snapshot alive while it holds it.
 */
class VOXDICT_EXPORT Active_Dictionary {
	std::shared_ptr<const std::filesystem::path> current;

      public:
	auto get() const -> std::shared_ptr<const std::filesystem::path>
	{
		return std::atomic_load(&current);
	}
	auto set(std::shared_ptr<const std::filesystem::path> p) -> void
	{
		std::atomic_store(&current, std::move(p));
	}
	auto reset() -> void { set(nullptr); }
};

struct Compile_Options {
	/**
	 * Set when running from the test suite. Only the uncompressed
	 * 01_default.csv is used as base lexicon, and on Windows compilation
	 * is skipped because the analyzer can not reload there.
	 */
	bool under_test_harness = false;
};

enum class Compile_State : char {
	IDLE,
	STAGING_SOURCE,
	COMPILING,
	SWAPPING,
	FAILED
};

VOXDICT_EXPORT auto read_base_lexicon(const std::filesystem::path& file)
    -> std::string;
VOXDICT_EXPORT auto append_source_line(const Word_Record& word,
                                       std::string& out) -> void;

/**
 * @brief Builds the compiled dictionary from the base lexicon and the store
 * and swaps it into the analyzer.
 *
 * The compile lock is taken before the store lock and never the other way
 * round.
 */
class VOXDICT_EXPORT Dictionary_Compiler {
	const Word_Store& store;
	Analyzer& analyzer;
	std::filesystem::path base_lexicon_dir;
	std::filesystem::path compiled_path;
	Compile_Options options;
	std::ostream* log;
	std::mutex mtx;
	Active_Dictionary active;
	std::atomic<Compile_State> st{Compile_State::IDLE};

	auto compile_locked() -> void;
	auto stage_source(const std::filesystem::path& source) -> bool;
	auto swap_in(const std::filesystem::path& compiled) -> void;

      public:
	Dictionary_Compiler(const Word_Store& store, Analyzer& analyzer,
	                    std::filesystem::path base_lexicon_dir,
	                    std::filesystem::path compiled_path,
	                    Compile_Options options = {},
	                    std::ostream& log = std::clog);
	Dictionary_Compiler(const Dictionary_Compiler&) = delete;
	auto operator=(const Dictionary_Compiler&)
	    -> Dictionary_Compiler& = delete;

	auto compile() -> void;
	auto active_dictionary() const { return active.get(); }
	auto state() const { return st.load(); }
	auto& compiled_dictionary_path() const { return compiled_path; }
};

VOXDICT_END_INLINE_NAMESPACE
} // namespace voxdict
#endif // VOXDICT_COMPILER_HXX

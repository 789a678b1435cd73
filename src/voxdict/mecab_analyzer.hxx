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
 * @brief Analyzer backed by MeCab.
 */

#ifndef VOXDICT_MECAB_ANALYZER_HXX
#define VOXDICT_MECAB_ANALYZER_HXX

#include "compiler.hxx"

#include <memory>

namespace MeCab {
class Model;
}

namespace voxdict {
VOXDICT_BEGIN_INLINE_NAMESPACE

/**
 * @brief Thrown when MeCab can not load a dictionary.
 */
class Analyzer_Error : public User_Dictionary_Error {
      public:
	using User_Dictionary_Error::User_Dictionary_Error;
};

/**
 * @brief MeCab with a hot swappable user dictionary.
 *
 * One long-lived MeCab::Model. Changing the user dictionary builds a new
 * model and swaps it in, taggers are created per call from the current one.
 * MeCab guards the swap against taggers in use.
 */
class Mecab_Analyzer : public Analyzer {
	struct Model_Deleter {
		auto operator()(MeCab::Model* m) const -> void;
	};
	std::filesystem::path system_dic;
	std::unique_ptr<MeCab::Model, Model_Deleter> model;

	auto load(const std::filesystem::path* user_dic)
	    -> std::unique_ptr<MeCab::Model, Model_Deleter>;

      public:
	explicit Mecab_Analyzer(std::filesystem::path system_dic);
	~Mecab_Analyzer() override;

	auto compile(const std::filesystem::path& source,
	             const std::filesystem::path& output,
	             std::ostream& err_msg) -> bool override;
	auto set_user_dictionary(const std::filesystem::path& artifact)
	    -> void override;
	auto clear_user_dictionary() -> void override;

	auto parse(const std::string& text) -> std::string;
	auto& system_dictionary() const { return system_dic; }
};

VOXDICT_END_INLINE_NAMESPACE
} // namespace voxdict
#endif // VOXDICT_MECAB_ANALYZER_HXX

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

#include "mecab_analyzer.hxx"

#include <string>
#include <vector>

#include <mecab.h>

using namespace std;

namespace voxdict {
VOXDICT_BEGIN_INLINE_NAMESPACE

namespace {
auto last_error() -> string
{
	auto e = MeCab::getLastError();
	return e ? e : "unknown error";
}

auto to_argv(vector<string>& args) -> vector<char*>
{
	auto argv = vector<char*>();
	for (auto& a : args)
		argv.push_back(data(a));
	argv.push_back(nullptr);
	return argv;
}
} // namespace

auto Mecab_Analyzer::Model_Deleter::operator()(MeCab::Model* m) const -> void
{
	MeCab::deleteModel(m);
}

auto Mecab_Analyzer::load(const std::filesystem::path* user_dic)
    -> std::unique_ptr<MeCab::Model, Model_Deleter>
{
	auto args = vector<string>{"mecab", "-d", system_dic.string()};
	if (user_dic) {
		args.push_back("-u");
		args.push_back(user_dic->string());
	}
	auto argv = to_argv(args);
	auto m = unique_ptr<MeCab::Model, Model_Deleter>(
	    MeCab::createModel(int(args.size()), argv.data()));
	if (!m)
		throw Analyzer_Error("Can not load MeCab dictionary: " +
		                     last_error());
	return m;
}

/**
 * @brief Loads the system dictionary without a user dictionary.
 * @param system_dic directory of the compiled MeCab system dictionary
 * @throws Analyzer_Error if it can not be loaded
 */
Mecab_Analyzer::Mecab_Analyzer(std::filesystem::path system_dic)
    : system_dic(std::move(system_dic))
{
	model = load(nullptr);
}

Mecab_Analyzer::~Mecab_Analyzer() = default;

/**
 * Runs mecab-dict-index in process. The source columns must match the
 * system dictionary's definitions, which they do for IPADIC based
 * dictionaries.
 */
auto Mecab_Analyzer::compile(const std::filesystem::path& source,
                             const std::filesystem::path& output,
                             std::ostream& err_msg) -> bool
{
	auto args = vector<string>{"mecab-dict-index",
	                           "-d",
	                           system_dic.string(),
	                           "-u",
	                           output.string(),
	                           "-f",
	                           "utf-8",
	                           "-t",
	                           "utf-8",
	                           source.string()};
	auto argv = to_argv(args);
	auto ret = mecab_dict_index(int(args.size()), argv.data());
	if (ret != 0) {
		err_msg << "mecab-dict-index exited with " << ret;
		return false;
	}
	return true;
}

auto Mecab_Analyzer::set_user_dictionary(const std::filesystem::path& artifact)
    -> void
{
	if (!model->swap(load(&artifact).release()))
		throw Analyzer_Error("Can not activate user dictionary " +
		                     artifact.string() + ": " + last_error());
}

auto Mecab_Analyzer::clear_user_dictionary() -> void
{
	if (!model->swap(load(nullptr).release()))
		throw Analyzer_Error("Can not deactivate user dictionary: " +
		                     last_error());
}

/**
 * @brief Tokenizes text with the current dictionaries.
 * @return MeCab's default output, one token per line ending with EOS
 */
auto Mecab_Analyzer::parse(const std::string& text) -> std::string
{
	auto tagger = unique_ptr<MeCab::Tagger, decltype(&MeCab::deleteTagger)>(
	    model->createTagger(), &MeCab::deleteTagger);
	if (!tagger)
		throw Analyzer_Error("Can not create MeCab tagger: " +
		                     last_error());
	auto result = tagger->parse(text.c_str());
	if (!result)
		throw Analyzer_Error(string("MeCab parsing failed: ") +
		                     tagger->what());
	return result;
}

VOXDICT_END_INLINE_NAMESPACE
} // namespace voxdict

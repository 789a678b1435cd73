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

#include "paths.hxx"
#include "utils.hxx"

#include <algorithm>
#include <cstdlib>

#if __has_include(<unistd.h>)
#include <unistd.h> // defines _POSIX_VERSION
#endif

using namespace std;

namespace voxdict {
VOXDICT_BEGIN_INLINE_NAMESPACE

using fs_path = std::filesystem::path;
using std::filesystem::directory_iterator;

namespace {
template <class CharT>
auto& split_to_paths(basic_string_view<CharT> s, CharT sep,
                     vector<fs_path>& out)
{
	for (size_t i1 = 0;;) {
		auto i2 = s.find(sep, i1);
		out.emplace_back(s.substr(i1, i2 - i1));
		if (i2 == s.npos)
			break;
		i1 = i2 + 1;
	}
	return out;
}
} // namespace

/**
 * @brief Returns the directory holding the store and the compiled dictionary.
 *
 * $VOXDICT_DATA_DIR if set, otherwise the per-user data directory of the
 * platform with "voxdict" appended. The directory is not created here.
 */
auto default_save_dir() -> fs_path
{
#ifdef _WIN32
	auto data_dir = _wgetenv(L"VOXDICT_DATA_DIR");
	if (data_dir && *data_dir)
		return data_dir;
	auto local = _wgetenv(L"LOCALAPPDATA");
	if (local && *local)
		return fs_path(local) / L"voxdict";
#else
	auto data_dir = getenv("VOXDICT_DATA_DIR");
	if (data_dir && *data_dir)
		return data_dir;
#if defined(__APPLE__) && defined(__MACH__)
	if (auto home = getenv("HOME"))
		return fs_path(home) / "Library/Application Support/voxdict";
#elif defined(_POSIX_VERSION)
	auto xdg_data_home = getenv("XDG_DATA_HOME");
	if (xdg_data_home && *xdg_data_home)
		return fs_path(xdg_data_home) / "voxdict";
	if (auto home = getenv("HOME"))
		return fs_path(home) / ".local/share/voxdict";
#endif
#endif
	return "voxdict";
}

/**
 * @brief Append the paths of the directories to be searched for the base
 * lexicon.
 * @param[out] paths vector that receives the directory paths
 */
auto append_base_lexicon_dir_paths(vector<fs_path>& paths) -> void
{
#ifdef _WIN32
	const auto PATHSEP = L';';
	auto base_dir = _wgetenv(L"VOXDICT_BASE_DIR");
#else
	const auto PATHSEP = ':';
	auto base_dir = getenv("VOXDICT_BASE_DIR");
#endif
	if (base_dir && *base_dir)
		split_to_paths(basic_string_view(base_dir), PATHSEP, paths);

#ifdef _POSIX_VERSION
	auto xdg_data_dirs = getenv("XDG_DATA_DIRS");
	if (xdg_data_dirs && *xdg_data_dirs) {
		auto i = size(paths);
		split_to_paths(string_view(xdg_data_dirs), PATHSEP, paths);
		for (; i != size(paths); ++i)
			paths[i] /= "voxdict/dictionaries";
	}
	else {
		paths.push_back("/usr/local/share/voxdict/dictionaries");
		paths.push_back("/usr/share/voxdict/dictionaries");
	}
#endif
#if _WIN32
	if (auto p = _wgetenv(L"PROGRAMDATA"))
		paths.push_back(fs_path(p) / L"voxdict\\dictionaries");
#endif
}

/**
 * @brief Returns the first existing base lexicon directory.
 * @return the directory or empty path if none exists
 */
auto find_base_lexicon_dir() -> fs_path
{
	auto paths = vector<fs_path>();
	append_base_lexicon_dir_paths(paths);
	for (auto& p : paths) {
		auto ec = error_code();
		if (filesystem::is_directory(p, ec))
			return p;
	}
	return {};
}

auto make_paths(const fs_path& save_dir, const fs_path& base_lexicon_dir)
    -> Dictionary_Paths
{
	auto p = Dictionary_Paths();
	p.base_lexicon_dir = base_lexicon_dir;
	p.store_file = save_dir / "user_dict.json";
	p.compiled_dictionary = save_dir / "user.dic";
	return p;
}

/**
 * @brief Lists the base lexicon source files in compile order.
 *
 * Normally these are all *.csv.zst files in @p dir sorted by file name. When
 * @p under_test_harness is set only the uncompressed 01_default.csv is
 * returned, because decompressing the full lexicon on every test is too
 * slow.
 *
 * @return the files, empty if the directory does not exist
 */
auto find_base_lexicon_files(const fs_path& dir, bool under_test_harness)
    -> vector<fs_path>
{
	auto files = vector<fs_path>();
	if (under_test_harness) {
		auto p = dir / "01_default.csv";
		if (filesystem::is_regular_file(p))
			files.push_back(p);
		return files;
	}
	if (!filesystem::is_directory(dir))
		return files;
	for (auto& entry : directory_iterator(dir)) {
		if (!entry.is_regular_file())
			continue;
		if (ends_with(entry.path().filename().string(), ".csv.zst"))
			files.push_back(entry.path());
	}
	sort(begin(files), end(files), [](auto& a, auto& b) {
		return a.filename() < b.filename();
	});
	return files;
}

VOXDICT_END_INLINE_NAMESPACE
} // namespace voxdict

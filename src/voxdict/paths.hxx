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
 * @brief Finding the data directories and the base lexicon.
 */

#ifndef VOXDICT_PATHS_HXX
#define VOXDICT_PATHS_HXX

#include "defines.hxx"

#include <filesystem>
#include <vector>

namespace voxdict {
VOXDICT_BEGIN_INLINE_NAMESPACE

/**
 * @brief Where one installation keeps its files.
 */
struct Dictionary_Paths {
	std::filesystem::path base_lexicon_dir;
	std::filesystem::path store_file;
	std::filesystem::path compiled_dictionary;
};

VOXDICT_EXPORT auto default_save_dir() -> std::filesystem::path;

VOXDICT_EXPORT auto
append_base_lexicon_dir_paths(std::vector<std::filesystem::path>& paths)
    -> void;
VOXDICT_EXPORT auto find_base_lexicon_dir() -> std::filesystem::path;

VOXDICT_EXPORT auto make_paths(const std::filesystem::path& save_dir,
                               const std::filesystem::path& base_lexicon_dir)
    -> Dictionary_Paths;

VOXDICT_EXPORT auto
find_base_lexicon_files(const std::filesystem::path& dir,
                        bool under_test_harness)
    -> std::vector<std::filesystem::path>;

VOXDICT_END_INLINE_NAMESPACE
} // namespace voxdict
#endif // VOXDICT_PATHS_HXX

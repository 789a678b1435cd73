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

#include <voxdict/dictionary.hxx>
#include <voxdict/mecab_analyzer.hxx>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>

#include <getopt.h>

// manually define if not supplied by the build system
#ifndef PROJECT_VERSION
#define PROJECT_VERSION "unknown.version"
#endif

using namespace std;
using voxdict::User_Dictionary, voxdict::Word_Property, voxdict::Word_Type;
namespace {
enum Mode { NORMAL, HELP, VERSION };
auto print_help(const char* program_name) -> void
{
	auto p = string_view(program_name);
	auto& o = cout;
	o << "Usage:\n"
	  << p << " [-d DATA_DIR] [-b BASE_DIR] [-s SYSTEM_DIC] COMMAND [ARG]...\n"
	  << p << " --help|--version\n"
	  << R"(
Manage the user dictionary of the Japanese text-to-speech analyzer.

Commands:
  list                              print all words as JSON
  add SURFACE PRONUNCIATION ACCENT  add a word and print its identifier
  update UUID SURFACE PRONUNCIATION ACCENT
                                    replace the word with identifier UUID
  delete UUID                       delete the word with identifier UUID
  import FILE                       merge words from FILE, which must be in
                                    the format printed by list
  compile                           rebuild the compiled dictionary
  analyze TEXT                      tokenize TEXT with the user dictionary

Options:
  -d, --data-dir=DIR       directory of the store and compiled dictionary
  -b, --base-dir=DIR       directory of the base lexicon (*.csv.zst)
  -s, --system-dic=DIR     MeCab system dictionary used for compiling
  -t, --type=TYPE          word type for add and update: PROPER_NOUN
                           (default), COMMON_NOUN, VERB, ADJECTIVE or SUFFIX
  -p, --priority=N         priority for add and update, 0 to 10, default 5
  --override               on import, incoming words replace existing ones
  --help                   print this help
  --version                print version number

The following environment variables can have effect:

  VOXDICT_DATA_DIR   - same as -d,
  VOXDICT_BASE_DIR   - additional directories to search for the base lexicon,
  VOXDICT_SYSTEM_DIC - same as -s.

Example:
)"
	  << "    " << p << " add ＶＯＩＣＥ ボイス 1 -p 7\n"
	  << "    " << p << " import words.json --override\n";
}

auto ver_str = "voxdict " PROJECT_VERSION R"(
Copyright (C) 2024 The Voxdict Authors
License LGPLv3+: GNU LGPL version 3 or later <http://gnu.org/licenses/lgpl.html>.
This is free software: you are free to change and redistribute it.
There is NO WARRANTY, to the extent permitted by law.
)";

auto print_version() -> void { cout << ver_str; }

auto parse_int(const char* name, const string& s) -> int
{
	auto ss = istringstream(s);
	auto n = 0;
	if (!(ss >> n) || ss.peek() != EOF)
		throw invalid_argument(string(name) + " " + s +
		                       " is not an integer");
	return n;
}

auto parse_word_type(string s) -> Word_Type
{
	for (auto& c : s)
		if ('a' <= c && c <= 'z')
			c -= 'a' - 'A';
	if (s == "PROPER_NOUN")
		return Word_Type::PROPER_NOUN;
	if (s == "COMMON_NOUN")
		return Word_Type::COMMON_NOUN;
	if (s == "VERB")
		return Word_Type::VERB;
	if (s == "ADJECTIVE")
		return Word_Type::ADJECTIVE;
	if (s == "SUFFIX")
		return Word_Type::SUFFIX;
	throw invalid_argument("Unknown word type " + s);
}

struct Word_Options {
	Word_Type type = Word_Type::PROPER_NOUN;
	int priority = voxdict::DEFAULT_PRIORITY;
};

auto make_property(char** args, const Word_Options& opt) -> Word_Property
{
	return voxdict::make_word_property(args[0], args[1],
	                                   parse_int("Accent", args[2]),
	                                   opt.type, opt.priority);
}

auto read_import_file(const char* file_name) -> voxdict::Word_Map
{
	auto in = ifstream(file_name, ios_base::binary);
	if (in.fail())
		throw invalid_argument(string("Can not open ") + file_name);
	auto words = voxdict::Word_Map();
	auto err = ostringstream();
	if (!voxdict::parse_store(in, words, err))
		throw invalid_argument(string(file_name) + ": " + err.str());
	if (!err.str().empty())
		clog << "WARNING: " << file_name << ": " << err.str() << '\n';
	return words;
}

auto check_arg_count(const string& command, int have, int need) -> bool
{
	if (have == need)
		return true;
	clog << "ERROR: Command " << command << " takes " << need
	     << " argument(s), " << have << " given\n";
	return false;
}
} // namespace
int main(int argc, char* argv[])
{
	auto mode_int = int(Mode::NORMAL);
	auto override_int = 0;
	auto program_name = "voxdict";
	auto save_dir = filesystem::path();
	auto base_dir = filesystem::path();
	auto system_dic = string();
	auto word_opt = Word_Options();

	if (argc > 0 && argv[0])
		program_name = argv[0];

	ios_base::sync_with_stdio(false);

	auto optstring = "d:b:s:t:p:";
	option longopts[] = {
	    {"help", no_argument, &mode_int, Mode::HELP},
	    {"version", no_argument, &mode_int, Mode::VERSION},
	    {"override", no_argument, &override_int, 1},
	    {"data-dir", required_argument, nullptr, 'd'},
	    {"base-dir", required_argument, nullptr, 'b'},
	    {"system-dic", required_argument, nullptr, 's'},
	    {"type", required_argument, nullptr, 't'},
	    {"priority", required_argument, nullptr, 'p'},
	    {}};
	int longindex;
	int c;
	try {
		while ((c = getopt_long(argc, argv, optstring, longopts,
		                        &longindex)) != -1) {
			switch (c) {
			case 0:
				break;
			case 'd':
				save_dir = optarg;
				break;
			case 'b':
				base_dir = optarg;
				break;
			case 's':
				system_dic = optarg;
				break;
			case 't':
				word_opt.type = parse_word_type(optarg);
				break;
			case 'p':
				word_opt.priority = parse_int("Priority", optarg);
				break;
			case '?':
				return EXIT_FAILURE;
			}
		}
	}
	catch (const invalid_argument& e) {
		clog << "ERROR: " << e.what() << '\n';
		return EXIT_FAILURE;
	}
	auto mode = static_cast<Mode>(mode_int);
	if (mode == Mode::VERSION) {
		print_version();
		return 0;
	}
	else if (mode == Mode::HELP) {
		print_help(program_name);
		return 0;
	}
	if (optind == argc) {
		clog << "ERROR: No command given, see --help\n";
		return EXIT_FAILURE;
	}
	auto command = string(argv[optind]);
	auto args = argv + optind + 1;
	auto n_args = argc - optind - 1;

	if (save_dir.empty())
		save_dir = voxdict::default_save_dir();
	if (base_dir.empty())
		base_dir = voxdict::find_base_lexicon_dir();
	if (system_dic.empty()) {
		auto env = getenv("VOXDICT_SYSTEM_DIC");
		if (env)
			system_dic = env;
	}
	auto paths = voxdict::make_paths(save_dir, base_dir);

	try {
		if (command == "list") {
			if (!check_arg_count(command, n_args, 0))
				return EXIT_FAILURE;
			auto store = voxdict::Word_Store(paths.store_file);
			voxdict::serialize_store(store.read_all(), cout);
			return 0;
		}
		auto known = command == "add" || command == "update" ||
		             command == "delete" || command == "import" ||
		             command == "compile" || command == "analyze";
		if (!known) {
			clog << "ERROR: Unknown command " << command << '\n';
			return EXIT_FAILURE;
		}
		if (system_dic.empty()) {
			clog << "ERROR: No MeCab system dictionary given, use -s "
			        "or VOXDICT_SYSTEM_DIC\n";
			return EXIT_FAILURE;
		}
		clog << "INFO: Store " << paths.store_file.string()
		     << ", base lexicon " << paths.base_lexicon_dir.string()
		     << endl;
		auto analyzer = voxdict::Mecab_Analyzer(system_dic);
		auto dic = User_Dictionary(paths, analyzer);

		if (command == "add") {
			if (!check_arg_count(command, n_args, 3))
				return EXIT_FAILURE;
			cout << dic.add_word(make_property(args, word_opt))
			     << '\n';
		}
		else if (command == "update") {
			if (!check_arg_count(command, n_args, 4))
				return EXIT_FAILURE;
			dic.update_word(args[0],
			                make_property(args + 1, word_opt));
		}
		else if (command == "delete") {
			if (!check_arg_count(command, n_args, 1))
				return EXIT_FAILURE;
			dic.delete_word(args[0]);
		}
		else if (command == "import") {
			if (!check_arg_count(command, n_args, 1))
				return EXIT_FAILURE;
			dic.import_words(read_import_file(args[0]),
			                 override_int != 0);
		}
		else if (command == "compile") {
			if (!check_arg_count(command, n_args, 0))
				return EXIT_FAILURE;
			// Already compiled on construction.
		}
		else if (command == "analyze") {
			if (!check_arg_count(command, n_args, 1))
				return EXIT_FAILURE;
			cout << analyzer.parse(args[0]);
		}
	}
	catch (const exception& e) {
		clog << "ERROR: " << e.what() << '\n';
		return EXIT_FAILURE;
	}
	return 0;
}

#include "lib.cpp" // Include the implementation directly so every helper is reachable

#include <cassert>
#include <filesystem> // Already included via lib.cpp but good practice
#include <fstream>
#include <iostream> // For std::cerr, std::cout, std::endl
#include <sstream>  // For std::istringstream, std::ostringstream
#include <string>
#include <utility>
#include <vector>

const std::string TEST_DIR_NAME = "test_dir_dir2md"; // Use a unique name
const fs::path TEST_DIR_PATH = fs::absolute(TEST_DIR_NAME);

const std::string TEST_OUTPUT_DIR_NAME = "test_output_dir2md";
const fs::path TEST_OUTPUT_DIR_PATH = fs::absolute(TEST_OUTPUT_DIR_NAME);

const fs::path TEST_LOG_FILE = fs::absolute("test_dir2md.log");

// --- Helper Functions for Testing ---

// Records everything instead of printing it
class CapturingLogSink : public LogSink {
public:
  std::vector<std::pair<LogLevel, std::string>> records;

  void write(LogLevel level, const std::string &message) override {
    records.emplace_back(level, message);
  }

  bool contains(LogLevel level, const std::string &fragment) const {
    for (const auto &record : records) {
      if (record.first == level &&
          record.second.find(fragment) != std::string::npos)
        return true;
    }
    return false;
  }

  size_t count(LogLevel level) const {
    size_t total = 0;
    for (const auto &record : records) {
      if (record.first == level)
        total++;
    }
    return total;
  }
};

void cleanup_test_directories() {
  std::error_code ec;
  fs::remove_all(TEST_DIR_PATH, ec);
  fs::remove_all(TEST_OUTPUT_DIR_PATH, ec);
  fs::remove(TEST_LOG_FILE, ec);
}

// Creates a test file, ensuring parent directory exists
void create_test_file(const fs::path &absolute_path,
                      const std::string &content) {
  try {
    if (absolute_path.has_parent_path()) {
      fs::create_directories(absolute_path.parent_path());
    }
    std::ofstream file(absolute_path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
      std::cerr << "Error creating test file: " << normalize_path(absolute_path)
                << std::endl;
      return;
    }
    file << content;
  } catch (const std::exception &e) {
    std::cerr << "Exception creating test file "
              << normalize_path(absolute_path) << ": " << e.what() << std::endl;
  }
}

std::string read_test_file(const fs::path &path) {
  std::ifstream file(path, std::ios::binary);
  assert(file.is_open());
  return std::string((std::istreambuf_iterator<char>(file)),
                     std::istreambuf_iterator<char>());
}

size_t count_regular_files(const fs::path &directory) {
  size_t total = 0;
  for (const auto &entry : fs::recursive_directory_iterator(directory)) {
    if (entry.is_regular_file())
      total++;
  }
  return total;
}

size_t count_occurrences(const std::string &text, const std::string &needle) {
  size_t total = 0;
  for (size_t pos = text.find(needle); pos != std::string::npos;
       pos = text.find(needle, pos + needle.size())) {
    total++;
  }
  return total;
}

// Mixed-case extensions, a dotfile, an extensionless file and two pruned
// directories
void create_catalog_structure() {
  cleanup_test_directories();
  create_test_file(TEST_DIR_PATH / ".gitignore", "*.o\n");
  create_test_file(TEST_DIR_PATH / "B.PY", "print('B')\n");
  create_test_file(TEST_DIR_PATH / "README", "readme\n");
  create_test_file(TEST_DIR_PATH / "a.py", "print('a')\n");
  create_test_file(TEST_DIR_PATH / "docs" / "guide.md", "# Guide\n");
  create_test_file(TEST_DIR_PATH / "node_modules" / "x.js", "var x;\n");
  create_test_file(TEST_DIR_PATH / "src" / ".git" / "config", "[core]\n");
  create_test_file(TEST_DIR_PATH / "src" / "main.go", "package main\n");
  create_test_file(TEST_DIR_PATH / "src" / "util.PY", "pass\n");
}

// Two python files at the root around a subdirectory, plus one text file
void create_single_file_structure() {
  cleanup_test_directories();
  create_test_file(TEST_DIR_PATH / "a.py", "A");
  create_test_file(TEST_DIR_PATH / "notes.txt", "n");
  create_test_file(TEST_DIR_PATH / "sub" / "b.py", "B");
  create_test_file(TEST_DIR_PATH / "z.py", "Z");
}

// --- Test Functions ---

void test_trim() {
  std::cout << "Test: trim..." << std::flush;
  assert(trim("  hello  ") == "hello");
  assert(trim("\tworld\n") == "world");
  assert(trim("") == "");
  std::cout << " Passed\n";
}

void test_should_exclude() {
  std::cout << "Test: should_exclude..." << std::flush;
  ExclusionSet excluded = make_exclusion_set({"build"});
  assert(excluded.size() == 4);
  assert(should_exclude("x/.git", excluded));
  assert(should_exclude("node_modules", excluded));
  assert(should_exclude("deep/er/.terraform", excluded));
  assert(should_exclude("a/build", excluded));
  assert(!should_exclude("a/build2", excluded));
  assert(!should_exclude("a/.github", excluded));
  assert(!should_exclude("node_modules/src", excluded)); // Base name only
  assert(!should_exclude("a/build", make_exclusion_set({})));
  std::cout << " Passed\n";
}

void test_file_extension() {
  std::cout << "Test: file_extension and extension_key..." << std::flush;
  assert(file_extension("main.go") == ".go");
  assert(file_extension("archive.tar.gz") == ".gz");
  assert(file_extension("README") == "");
  assert(file_extension(".bashrc") == "");
  assert(file_extension("..foo") == "");
  assert(file_extension(".eslintrc.json") == ".json");
  assert(file_extension("file.") == ".");
  assert(file_extension("...") == "");

  assert(extension_key("B.PY") == ".py");
  assert(extension_key(".Env") == ".env");
  assert(extension_key(".eslintrc.json") == ".eslintrc.json");
  assert(extension_key("Makefile") == "");
  std::cout << " Passed\n";
}

void test_sanitize_filename() {
  std::cout << "Test: sanitize_filename..." << std::flush;
  assert(sanitize_filename("src/main.go") == "src_main_go");
  assert(sanitize_filename("My File-Name.TXT") == "my_file_name_txt");
  assert(sanitize_filename("  a  b ") == "a_b");
  assert(sanitize_filename("a - b") == "a_b");
  assert(sanitize_filename("a--b") == "a_b");
  assert(sanitize_filename(".gitignore") == "_gitignore");
  assert(sanitize_filename("src/.env") == "src__env");
  assert(sanitize_filename("\xc3\xa9.py") == "___py"); // Non-ASCII, per byte
  assert(sanitize_filename("") == "");

  const std::vector<std::string> samples = {
      "docs/Read Me (v2).md", "--lead-trail--", "\tTabs\tand\nnewlines\n",
      "C:\\win\\path.cpp",     "UPPER_lower-09", "a//b\\\\c??d"};
  for (const auto &sample : samples) {
    std::string once = sanitize_filename(sample);
    assert(sanitize_filename(once) == once);
    for (char c : once) {
      assert((c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '_');
    }
  }
  std::cout << " Passed\n";
}

void test_render_markdown() {
  std::cout << "Test: render_markdown..." << std::flush;
  assert(render_markdown("a/b.py", "print(\"hi\")", "py") ==
         "# File Name: a/b.py\n# File Contents:\n```py\nprint(\"hi\")\n```\n\n");
  // No language: raw content, no fence
  assert(render_markdown("Makefile", "all:\n", "") ==
         "# File Name: Makefile\n# File Contents:\nall:\n\n\n");
  // Contents are kept byte for byte
  assert(render_markdown("w.txt", "  x\r\n\n", "txt") ==
         "# File Name: w.txt\n# File Contents:\n```txt\n  x\r\n\n\n```\n\n");
  std::cout << " Passed\n";
}

void test_is_valid_utf8() {
  std::cout << "Test: is_valid_utf8..." << std::flush;
  assert(is_valid_utf8(""));
  assert(is_valid_utf8("plain ascii\n"));
  assert(is_valid_utf8("h\xc3\xa9llo"));       // U+00E9
  assert(is_valid_utf8("\xe2\x82\xac"));       // U+20AC
  assert(is_valid_utf8("\xf0\x9f\x98\x80"));   // U+1F600
  assert(!is_valid_utf8("\xff"));
  assert(!is_valid_utf8("\xc0\xaf"));          // Overlong '/'
  assert(!is_valid_utf8("\xed\xa0\x80"));      // Surrogate
  assert(!is_valid_utf8("\xe2\x82"));          // Truncated
  assert(!is_valid_utf8("\xf4\x90\x80\x80"));  // Past U+10FFFF
  assert(!is_valid_utf8(std::string("a\x80z"))); // Stray continuation byte
  std::cout << " Passed\n";
}

void test_read_text_file() {
  std::cout << "Test: read_text_file..." << std::flush;
  cleanup_test_directories();
  create_test_file(TEST_DIR_PATH / "crlf.txt", "a\r\nb");
  create_test_file(TEST_DIR_PATH / "binary.bin", std::string{'\xff', '\xfe', 'a'});

  assert(read_text_file(TEST_DIR_PATH / "crlf.txt") == "a\r\nb");

  bool decode_error = false;
  try {
    read_text_file(TEST_DIR_PATH / "binary.bin");
  } catch (const TextDecodeError &) {
    decode_error = true;
  }
  assert(decode_error);

  bool open_error = false;
  try {
    read_text_file(TEST_DIR_PATH / "missing.txt");
  } catch (const TextDecodeError &) {
    assert(false); // A missing file is not an encoding problem
  } catch (const std::runtime_error &) {
    open_error = true;
  }
  assert(open_error);
  std::cout << " Passed\n";
}

void test_discover_extensions() {
  std::cout << "Test: discover_extensions..." << std::flush;
  create_catalog_structure();
  CapturingLogSink log;
  std::vector<ExtensionEntry> catalog =
      discover_extensions(TEST_DIR_PATH, make_exclusion_set({}), log);

  // First-seen order: ".gitignore", "B.PY", "README", "a.py", docs/, src/
  assert(catalog.size() == 5);
  assert(catalog[0].key == ".gitignore" && catalog[0].count == 1);
  assert(catalog[1].key == ".py" && catalog[1].count == 3);
  assert(catalog[2].key == "" && catalog[2].count == 1);
  assert(catalog[3].key == ".md" && catalog[3].count == 1);
  assert(catalog[4].key == ".go" && catalog[4].count == 1);
  for (const auto &entry : catalog) {
    assert(entry.key != ".js"); // node_modules pruned
  }

  cleanup_test_directories();
  fs::create_directories(TEST_DIR_PATH);
  assert(discover_extensions(TEST_DIR_PATH, make_exclusion_set({}), log)
             .empty());
  std::cout << " Passed\n";
}

void test_render_directory_tree() {
  std::cout << "Test: render_directory_tree..." << std::flush;
  cleanup_test_directories();
  create_test_file(TEST_DIR_PATH / "docs" / "a.md", "a");
  create_test_file(TEST_DIR_PATH / "docs" / "sub" / "b.md", "b");
  create_test_file(TEST_DIR_PATH / "src" / "main.go", "package main");
  create_test_file(TEST_DIR_PATH / "src" / ".git" / "config", "[core]");
  create_test_file(TEST_DIR_PATH / "README", "r");
  create_test_file(TEST_DIR_PATH / "zeta.txt", "z");

  CapturingLogSink log;
  TreeListing listing =
      render_directory_tree(TEST_DIR_PATH, make_exclusion_set({}), log);
  const std::vector<std::string> expected = {".",
                                             "├── docs",
                                             "│   ├── sub",
                                             "│   │   └── b.md",
                                             "│   └── a.md",
                                             "├── src",
                                             "│   └── main.go",
                                             "├── README",
                                             "└── zeta.txt",
                                             "",
                                             "3 directories, 5 files"};
  assert(listing.lines == expected);
  assert(listing.dirCount == 3);
  assert(listing.fileCount == 5);
  std::cout << " Passed\n";
}

void test_tree_last_sibling_after_exclusion() {
  std::cout << "Test: tree connector for last surviving sibling..."
            << std::flush;
  cleanup_test_directories();
  create_test_file(TEST_DIR_PATH / "a.txt", "a");
  create_test_file(TEST_DIR_PATH / "node_modules", "a file, still excluded");

  CapturingLogSink log;
  TreeListing listing =
      render_directory_tree(TEST_DIR_PATH, make_exclusion_set({}), log);
  assert(join_strings(listing.lines, "\n") ==
         ".\n└── a.txt\n\n0 directories, 1 files");
  std::cout << " Passed\n";
}

void test_pipeline_per_file_scenario() {
  std::cout << "Test: pipeline per-file mode..." << std::flush;
  cleanup_test_directories();
  create_test_file(TEST_DIR_PATH / "src" / "main.go", "package main\n");
  create_test_file(TEST_DIR_PATH / "src" / ".git" / "config", "[core]\n");
  create_test_file(TEST_DIR_PATH / "README", "readme\n");

  CapturingLogSink log;
  ConversionPipeline pipeline(make_exclusion_set({}), log);
  assert(pipeline.run(TEST_DIR_PATH, TEST_OUTPUT_DIR_PATH, {".go"}, false));

  fs::path markdown_file = TEST_OUTPUT_DIR_PATH / "src" / "src_main_go.txt";
  assert(fs::exists(markdown_file));
  assert(read_test_file(markdown_file) ==
         "# File Name: src/main.go\n# File Contents:\n```go\npackage "
         "main\n\n```\n\n");
  assert(count_regular_files(TEST_OUTPUT_DIR_PATH) == 2); // + tree
  assert(!fs::exists(TEST_OUTPUT_DIR_PATH / "src" / ".git"));
  assert(!fs::exists(TEST_OUTPUT_DIR_PATH / "all_files.txt"));

  assert(read_test_file(TEST_OUTPUT_DIR_PATH / "directory_tree.txt") ==
         ".\n├── src\n│   └── main.go\n└── README\n\n1 directories, 2 files");
  assert(pipeline.stats().converted == 1);
  assert(pipeline.stats().skipped == 0);
  assert(pipeline.stats().bytes == std::string("package main\n").size());
  assert(log.contains(LogLevel::Info, "created successfully"));
  assert(log.contains(LogLevel::Info, "Processed 1 files"));
  std::cout << " Passed\n";
}

void test_pipeline_single_file_mode() {
  std::cout << "Test: pipeline single-file mode..." << std::flush;
  create_single_file_structure();

  CapturingLogSink log;
  ConversionPipeline pipeline(make_exclusion_set({}), log);
  assert(pipeline.run(TEST_DIR_PATH, TEST_OUTPUT_DIR_PATH, {".py"}, true));

  // Root files come before the subdirectory's files
  const std::string expected =
      "# File Name: a.py\n# File Contents:\n```py\nA\n```\n\n"
      "---\n"
      "# File Name: z.py\n# File Contents:\n```py\nZ\n```\n\n"
      "---\n"
      "# File Name: sub/b.py\n# File Contents:\n```py\nB\n```\n\n";
  assert(read_test_file(TEST_OUTPUT_DIR_PATH / "all_files.txt") == expected);
  assert(count_regular_files(TEST_OUTPUT_DIR_PATH) == 2); // + tree
  assert(!fs::exists(TEST_OUTPUT_DIR_PATH / "sub"));
  assert(pipeline.stats().converted == 3);
  assert(log.contains(LogLevel::Info, "All markdown content written to"));
  std::cout << " Passed\n";
}

void test_pipeline_decode_failure_is_skipped() {
  std::cout << "Test: pipeline skips undecodable files..." << std::flush;
  cleanup_test_directories();
  create_test_file(TEST_DIR_PATH / "good.py", "ok");
  create_test_file(TEST_DIR_PATH / "bad.py", std::string{'\xff', '\xfe', 'a'});

  CapturingLogSink log;
  ConversionPipeline pipeline(make_exclusion_set({}), log);
  assert(pipeline.run(TEST_DIR_PATH, TEST_OUTPUT_DIR_PATH, {".py"}, false));

  assert(fs::exists(TEST_OUTPUT_DIR_PATH / "good_py.txt"));
  assert(!fs::exists(TEST_OUTPUT_DIR_PATH / "bad_py.txt"));
  assert(pipeline.stats().converted == 1);
  assert(pipeline.stats().skipped == 1);
  assert(log.contains(LogLevel::Warning, "due to encoding issues"));
  assert(log.count(LogLevel::Error) == 0);
  std::cout << " Passed\n";
}

void test_pipeline_dotfile_selection() {
  std::cout << "Test: pipeline dotfile and extensionless selection..."
            << std::flush;
  cleanup_test_directories();
  create_test_file(TEST_DIR_PATH / ".gitignore", "*.o\n");
  create_test_file(TEST_DIR_PATH / ".env", "SECRET=1\n");
  create_test_file(TEST_DIR_PATH / ".DS_Store", "x");
  create_test_file(TEST_DIR_PATH / "Makefile", "all:\n");
  create_test_file(TEST_DIR_PATH / "main.c", "int x;\n");

  CapturingLogSink log;
  ConversionPipeline pipeline(make_exclusion_set({}), log);

  // Dotfiles picked by full name; .env is never converted
  assert(pipeline.run(TEST_DIR_PATH, TEST_OUTPUT_DIR_PATH,
                      {".gitignore", ".env"}, false));
  assert(pipeline.stats().converted == 1);
  assert(read_test_file(TEST_OUTPUT_DIR_PATH / "_gitignore.txt") ==
         "# File Name: .gitignore\n# File Contents:\n*.o\n\n\n");
  assert(!fs::exists(TEST_OUTPUT_DIR_PATH / "_env.txt"));

  // The empty key selects every extensionless file except the guarded names
  fs::remove_all(TEST_OUTPUT_DIR_PATH);
  assert(pipeline.run(TEST_DIR_PATH, TEST_OUTPUT_DIR_PATH, {""}, false));
  assert(pipeline.stats().converted == 2);
  assert(fs::exists(TEST_OUTPUT_DIR_PATH / "makefile.txt"));
  assert(fs::exists(TEST_OUTPUT_DIR_PATH / "_gitignore.txt"));
  assert(!fs::exists(TEST_OUTPUT_DIR_PATH / "_ds_store.txt"));
  assert(!fs::exists(TEST_OUTPUT_DIR_PATH / "_env.txt"));
  assert(!fs::exists(TEST_OUTPUT_DIR_PATH / "main_c.txt"));
  std::cout << " Passed\n";
}

void test_pipeline_user_exclusions() {
  std::cout << "Test: pipeline user exclusions..." << std::flush;
  cleanup_test_directories();
  create_test_file(TEST_DIR_PATH / "keep" / "a.go", "package a\n");
  create_test_file(TEST_DIR_PATH / "keep" / "node_modules" / "d.go", "d\n");
  create_test_file(TEST_DIR_PATH / "build" / "b.go", "package b\n");
  create_test_file(TEST_DIR_PATH / "build" / "nested" / "c.go", "c\n");

  ExclusionSet excluded = make_exclusion_set({"build"});
  CapturingLogSink log;
  ConversionPipeline pipeline(excluded, log);
  assert(pipeline.run(TEST_DIR_PATH, TEST_OUTPUT_DIR_PATH, {".GO"}, false));

  assert(pipeline.stats().converted == 1);
  assert(fs::exists(TEST_OUTPUT_DIR_PATH / "keep" / "keep_a_go.txt"));
  assert(!fs::exists(TEST_OUTPUT_DIR_PATH / "build"));
  assert(read_test_file(TEST_OUTPUT_DIR_PATH / "directory_tree.txt") ==
         ".\n└── keep\n    └── a.go\n\n1 directories, 1 files");

  std::vector<ExtensionEntry> catalog =
      discover_extensions(TEST_DIR_PATH, excluded, log);
  assert(catalog.size() == 1);
  assert(catalog[0].key == ".go" && catalog[0].count == 1);
  std::cout << " Passed\n";
}

void test_pipeline_unwritable_output_dir() {
  std::cout << "Test: pipeline with an unusable output directory..."
            << std::flush;
  create_single_file_structure();
  create_test_file(TEST_OUTPUT_DIR_PATH, "a regular file in the way");

  CapturingLogSink log;
  ConversionPipeline pipeline(make_exclusion_set({}), log);
  assert(!pipeline.run(TEST_DIR_PATH, TEST_OUTPUT_DIR_PATH, {".py"}, false));
  assert(log.contains(LogLevel::Error, "Failed to create output directory"));
  assert(pipeline.stats().converted == 0);
  fs::remove(TEST_OUTPUT_DIR_PATH);
  std::cout << " Passed\n";
}

void test_pipeline_per_file_write_failure() {
  std::cout << "Test: pipeline keeps going after write failures..."
            << std::flush;
  create_single_file_structure();
  // sub/ cannot be created and the tree file cannot be opened
  create_test_file(TEST_OUTPUT_DIR_PATH / "sub", "blocker");
  fs::create_directories(TEST_OUTPUT_DIR_PATH / "directory_tree.txt");

  CapturingLogSink log;
  ConversionPipeline pipeline(make_exclusion_set({}), log);
  assert(!pipeline.run(TEST_DIR_PATH, TEST_OUTPUT_DIR_PATH, {".py"}, false));

  assert(pipeline.stats().converted == 2);
  assert(pipeline.stats().skipped == 1);
  assert(log.contains(LogLevel::Error, "Error processing"));
  assert(log.contains(LogLevel::Error, "sub/b.py"));
  assert(log.contains(LogLevel::Error, "directory_tree.txt"));
  assert(fs::exists(TEST_OUTPUT_DIR_PATH / "a_py.txt"));
  assert(fs::exists(TEST_OUTPUT_DIR_PATH / "z_py.txt"));
  assert(fs::is_directory(TEST_OUTPUT_DIR_PATH / "directory_tree.txt"));
  assert(log.contains(LogLevel::Info, "Processed 2 files"));
  std::cout << " Passed\n";
}

void test_symlinked_directory_not_followed() {
  std::cout << "Test: symlinked directories are listed, not walked..."
            << std::flush;
  cleanup_test_directories();
  create_test_file(TEST_DIR_PATH / "real" / "m.py", "M");
  std::error_code ec;
  fs::create_directory_symlink(TEST_DIR_PATH / "real", TEST_DIR_PATH / "link",
                               ec);
  if (ec) {
    std::cout << " Skipped (cannot create symlink: " << ec.message() << ")\n";
    return;
  }

  CapturingLogSink log;
  ExclusionSet excluded = make_exclusion_set({});
  TreeListing listing = render_directory_tree(TEST_DIR_PATH, excluded, log);
  assert(join_strings(listing.lines, "\n") ==
         ".\n├── real\n│   └── m.py\n└── link\n\n1 directories, 2 files");

  std::vector<ExtensionEntry> catalog =
      discover_extensions(TEST_DIR_PATH, excluded, log);
  assert(catalog.size() == 1);
  assert(catalog[0].key == ".py" && catalog[0].count == 1);

  ConversionPipeline pipeline(excluded, log);
  assert(pipeline.run(TEST_DIR_PATH, TEST_OUTPUT_DIR_PATH, {".py"}, false));
  assert(pipeline.stats().converted == 1);
  assert(fs::exists(TEST_OUTPUT_DIR_PATH / "real" / "real_m_py.txt"));
  assert(!fs::exists(TEST_OUTPUT_DIR_PATH / "link"));
  std::cout << " Passed\n";
}

void test_input_dir_with_excluded_name() {
  std::cout << "Test: input directory named like an excluded one..."
            << std::flush;
  cleanup_test_directories();
  const fs::path input_dir = TEST_DIR_PATH / "node_modules";
  create_test_file(input_dir / "a.py", "A");

  CapturingLogSink log;
  ExclusionSet excluded = make_exclusion_set({});
  std::vector<ExtensionEntry> catalog =
      discover_extensions(input_dir, excluded, log);
  assert(catalog.size() == 1);
  assert(catalog[0].key == ".py" && catalog[0].count == 1);

  ConversionPipeline pipeline(excluded, log);
  assert(pipeline.run(input_dir, TEST_OUTPUT_DIR_PATH, {".py"}, false));
  assert(pipeline.stats().converted == 1);
  assert(fs::exists(TEST_OUTPUT_DIR_PATH / "a_py.txt"));
  assert(read_test_file(TEST_OUTPUT_DIR_PATH / "directory_tree.txt") ==
         ".\n└── a.py\n\n0 directories, 1 files");
  std::cout << " Passed\n";
}

void test_parse_arguments() {
  std::cout << "Test: parse_arguments..." << std::flush;
  char *argv[] = {(char *)"dir2md",        (char *)"in",
                  (char *)"out",           (char *)"--extensions",
                  (char *)".PY",           (char *)".Md",
                  (char *)"-x",            (char *)"build",
                  (char *)"--exclude-dir", (char *)"dist",
                  (char *)"--single-file", (char *)"-v",
                  (char *)"--log-file",    (char *)"run.log"};
  int argc = 14;
  Config config = parse_arguments(argc, argv);
  assert(config.inputDir == "in");
  assert(config.outputDir == "out");
  assert((config.extensions == std::vector<std::string>{".py", ".md"}));
  assert((config.excludeDirs == std::vector<std::string>{"build", "dist"}));
  assert(config.singleFile);
  assert(config.verbose);
  assert(config.logFile == "run.log");

  char *bare_argv[] = {(char *)"dir2md"};
  Config bare = parse_arguments(1, bare_argv);
  assert(bare.inputDir.empty());
  assert(bare.outputDir.empty());
  assert(bare.extensions.empty());
  assert(bare.excludeDirs.empty());
  assert(!bare.singleFile);
  std::cout << " Passed\n";
}

void test_extension_key_from_choice() {
  std::cout << "Test: extension_key_from_choice..." << std::flush;
  assert(extension_key_from_choice(".py (3)") == ".py");
  assert(extension_key_from_choice(" (2)") == "");
  assert(extension_key_from_choice(".my file (1)") == ".my file");
  assert(extension_key_from_choice("plain") == "plain");
  std::cout << " Passed\n";
}

void test_console_prompter() {
  std::cout << "Test: ConsolePrompter..." << std::flush;
  cleanup_test_directories();
  fs::create_directories(TEST_DIR_PATH);

  auto ask = [](const std::string &input, auto question) {
    std::istringstream in(input);
    std::ostringstream out;
    ConsolePrompter prompter(in, out);
    auto answer = question(prompter);
    return std::make_pair(answer, out.str());
  };

  // Text
  assert(ask("\n", [](Prompter &p) { return p.ask_text("Out", "dflt"); })
             .first == "dflt");
  assert(ask("  out  \n", [](Prompter &p) { return p.ask_text("Out", ""); })
             .first == "out");

  // Confirm
  auto confirm = ask("maybe\nY\n", [](Prompter &p) {
    return p.ask_confirm("Single?", false);
  });
  assert(confirm.first == true);
  assert(confirm.second.find("Please answer y or n") != std::string::npos);
  assert(ask("\n", [](Prompter &p) { return p.ask_confirm("Single?", false); })
             .first == false);
  assert(!ask("", [](Prompter &p) { return p.ask_confirm("Single?", true); })
              .first.has_value());

  // Directory path, re-asked until it exists
  auto directory = ask("/no/such/dir2md/dir\n" + TEST_DIR_PATH.string() + "\n",
                       [](Prompter &p) { return p.ask_directory_path("In"); });
  assert(directory.first.has_value());
  assert(*directory.first == TEST_DIR_PATH);
  assert(directory.second.find("must be an existing directory") !=
         std::string::npos);

  // Multi-select
  const std::vector<std::string> choices = {"a (1)", "b (2)", "c (3)"};
  auto select = [&](const std::string &input) {
    return ask(input, [&](Prompter &p) {
             return p.ask_multi_select("Pick", choices, choices);
           })
        .first;
  };
  assert(*select("\n") == choices);
  assert((*select("3, 1\n") == std::vector<std::string>{"a (1)", "c (3)"}));
  assert(select("none\n")->empty());
  assert((*select("4\n2\n") == std::vector<std::string>{"b (2)"}));
  assert(!select("x\n").has_value());
  std::cout << " Passed\n";
}

void test_select_extensions() {
  std::cout << "Test: select_extensions..." << std::flush;
  create_catalog_structure();
  CapturingLogSink log;

  std::istringstream in("2 5\n");
  std::ostringstream out;
  ConsolePrompter prompter(in, out);
  std::vector<std::string> selected =
      select_extensions(TEST_DIR_PATH, make_exclusion_set({}), prompter, log);
  assert((selected == std::vector<std::string>{".py", ".go"}));
  assert(out.str().find("[x] 2) .py (3)") != std::string::npos);
  assert(out.str().find("[x] 3)  (1)") != std::string::npos);

  cleanup_test_directories();
  fs::create_directories(TEST_DIR_PATH);
  std::istringstream empty_in("");
  ConsolePrompter empty_prompter(empty_in, out);
  assert(select_extensions(TEST_DIR_PATH, make_exclusion_set({}),
                           empty_prompter, log)
             .empty());
  assert(log.contains(LogLevel::Warning, "No files with usable extensions"));
  std::cout << " Passed\n";
}

void test_resolve_output_dir() {
  std::cout << "Test: resolve_output_dir..." << std::flush;
  assert(resolve_output_dir("proj/", "") == fs::current_path() / "proj");
  assert(resolve_output_dir("a/proj", "") == fs::current_path() / "proj");
  assert(resolve_output_dir("x", "custom") == fs::path("custom"));
  assert(resolve_output_dir("", "").empty());
  std::cout << " Passed\n";
}

void test_run_application_interactive() {
  std::cout << "Test: run_application interactive..." << std::flush;
  create_single_file_structure();

  // Input dir, output dir, single file: yes, keep every extension
  std::istringstream in(TEST_DIR_PATH.string() + "\n" +
                        TEST_OUTPUT_DIR_PATH.string() + "\ny\n\n");
  std::ostringstream out;
  ConsolePrompter prompter(in, out);
  CapturingLogSink log;

  assert(run_application(Config{}, prompter, log) == 0);
  std::string combined = read_test_file(TEST_OUTPUT_DIR_PATH / "all_files.txt");
  assert(count_occurrences(combined, "# File Name: ") == 4);
  assert(count_occurrences(combined, "---\n") == 3);
  assert(fs::exists(TEST_OUTPUT_DIR_PATH / "directory_tree.txt"));
  assert(log.contains(LogLevel::Info, "Markdown generation complete."));
  std::cout << " Passed\n";
}

void test_run_application_with_arguments() {
  std::cout << "Test: run_application with arguments..." << std::flush;
  create_single_file_structure();

  Config config;
  config.inputDir = TEST_DIR_NAME; // Relative on purpose
  config.outputDir = TEST_OUTPUT_DIR_NAME;
  config.extensions = {".PY"};
  std::istringstream in(""); // Nothing may be asked
  std::ostringstream out;
  ConsolePrompter prompter(in, out);
  CapturingLogSink log;

  assert(run_application(config, prompter, log) == 0);
  assert(out.str().empty());
  assert(fs::exists(TEST_OUTPUT_DIR_PATH / "a_py.txt"));
  assert(fs::exists(TEST_OUTPUT_DIR_PATH / "sub" / "sub_b_py.txt"));
  assert(!fs::exists(TEST_OUTPUT_DIR_PATH / "notes_txt.txt"));
  assert(log.contains(LogLevel::Info, "Using extensions from arguments: .py"));
  std::cout << " Passed\n";
}

void test_run_application_errors() {
  std::cout << "Test: run_application configuration errors..." << std::flush;
  cleanup_test_directories();
  std::ostringstream out;

  // Aborted interactive input
  {
    std::istringstream in("");
    ConsolePrompter prompter(in, out);
    CapturingLogSink log;
    assert(run_application(Config{}, prompter, log) == 1);
    assert(log.contains(LogLevel::Error, "Input or output directory not provided."));
  }

  // Input directory that does not exist
  {
    Config config;
    config.inputDir = "does_not_exist_dir2md";
    config.outputDir = TEST_OUTPUT_DIR_NAME;
    config.extensions = {".py"};
    std::istringstream in("");
    ConsolePrompter prompter(in, out);
    CapturingLogSink log;
    assert(run_application(config, prompter, log) == 1);
    assert(log.contains(LogLevel::Error, "not found"));
  }

  // Nothing to select, and nothing is written
  {
    fs::create_directories(TEST_DIR_PATH);
    Config config;
    config.inputDir = TEST_DIR_PATH;
    config.outputDir = TEST_OUTPUT_DIR_PATH;
    std::istringstream in("");
    ConsolePrompter prompter(in, out);
    CapturingLogSink log;
    assert(run_application(config, prompter, log) == 1);
    assert(log.contains(LogLevel::Error, "No extensions selected. Exiting."));
    assert(!fs::exists(TEST_OUTPUT_DIR_PATH));
  }
  std::cout << " Passed\n";
}

void test_file_log_sink() {
  std::cout << "Test: FileLogSink..." << std::flush;
  cleanup_test_directories();
  {
    FileLogSink sink(TEST_LOG_FILE, false);
    assert(sink.is_open());
    sink.info("hello");
    sink.debug("hidden unless verbose");
    sink.error("boom");
  }
  std::string logged = read_test_file(TEST_LOG_FILE);
  assert(logged.find(" - INFO - hello\n") != std::string::npos);
  assert(logged.find(" - ERROR - boom\n") != std::string::npos);
  assert(logged.find("hidden unless verbose") == std::string::npos);
  assert(count_occurrences(logged, "\n") == 2);
  std::cout << " Passed\n";
}

int main() {
  try {
    test_trim();
    test_should_exclude();
    test_file_extension();
    test_sanitize_filename();
    test_render_markdown();
    test_is_valid_utf8();
    test_read_text_file();
    test_discover_extensions();
    test_render_directory_tree();
    test_tree_last_sibling_after_exclusion();
    test_pipeline_per_file_scenario();
    test_pipeline_single_file_mode();
    test_pipeline_decode_failure_is_skipped();
    test_pipeline_dotfile_selection();
    test_pipeline_user_exclusions();
    test_pipeline_unwritable_output_dir();
    test_pipeline_per_file_write_failure();
    test_symlinked_directory_not_followed();
    test_input_dir_with_excluded_name();
    test_parse_arguments();
    test_extension_key_from_choice();
    test_console_prompter();
    test_select_extensions();
    test_resolve_output_dir();
    test_run_application_interactive();
    test_run_application_with_arguments();
    test_run_application_errors();
    test_file_log_sink();

    // Cleanup after all tests
    cleanup_test_directories();
    std::cout << "\nAll tests passed successfully!\n";
    return 0;

  } catch (const std::exception &e) {
    std::cerr << "\n\n!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!\n";
    std::cerr << "Test failed with exception: " << e.what() << std::endl;
    std::cerr << "!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!\n\n";
    cleanup_test_directories(); // Attempt cleanup even on failure
    return 1;
  }
}

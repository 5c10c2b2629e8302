#include <algorithm>
#include <cctype> // For std::tolower
#include <chrono>
#include <cstdint>
#include <cstdlib> // For std::exit
#include <ctime>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <ios> // Needed for std::ios_base
#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error> // For filesystem errors
#include <unordered_map>
#include <utility> // For std::move
#include <vector>

namespace fs = std::filesystem;

// --- Configuration ---
struct Config {
  fs::path inputDir;  // Empty when it has to be asked for interactively
  fs::path outputDir; // Empty means <cwd>/<basename(inputDir)>
  std::vector<std::string> extensions; // Lowercase, with leading dot (or a
                                       // full dotfile name)
  std::vector<std::string> excludeDirs; // Added to the default exclusions
  bool singleFile = false;
  fs::path logFile; // Optional, log records are appended to it
  bool verbose = false;
};

// --- Utility Functions ---

std::string trim(std::string_view str) {
  constexpr std::string_view whitespace = " \t\n\r\f\v";
  size_t start = str.find_first_not_of(whitespace);
  if (start == std::string_view::npos)
    return "";
  size_t end = str.find_last_not_of(whitespace);
  return std::string(str.substr(start, end - start + 1));
}

std::string to_lower(std::string str) {
  std::transform(str.begin(), str.end(), str.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return str;
}

// Normalizes path separators to '/' and simplifies lexically
std::string normalize_path(const fs::path &path) {
  std::string path_str = path.lexically_normal().string();
  std::replace(path_str.begin(), path_str.end(), '\\', '/');
  return path_str;
}

// "proj/" and "proj" name the same directory; keep the one with a filename
fs::path strip_trailing_separator(fs::path path) {
  while (path.has_relative_path() && !path.has_filename()) {
    path = path.parent_path();
  }
  return path;
}

std::string join_strings(const std::vector<std::string> &parts,
                         std::string_view separator) {
  std::string joined;
  for (size_t i = 0; i < parts.size(); ++i) {
    if (i > 0)
      joined += separator;
    joined += parts[i];
  }
  return joined;
}

// --- Logging ---

enum class LogLevel { Debug, Info, Warning, Error };

const char *log_level_name(LogLevel level) {
  switch (level) {
  case LogLevel::Debug:
    return "DEBUG";
  case LogLevel::Info:
    return "INFO";
  case LogLevel::Warning:
    return "WARNING";
  case LogLevel::Error:
    return "ERROR";
  }
  return "INFO";
}

// Receives every log record of a run. Passed by reference to whatever needs
// to report something, so tests can swap in a capturing sink.
class LogSink {
public:
  virtual ~LogSink() = default;
  virtual void write(LogLevel level, const std::string &message) = 0;

  void debug(const std::string &message) { write(LogLevel::Debug, message); }
  void info(const std::string &message) { write(LogLevel::Info, message); }
  void warning(const std::string &message) {
    write(LogLevel::Warning, message);
  }
  void error(const std::string &message) { write(LogLevel::Error, message); }
};

// Info goes to stdout, problems go to stderr
class ConsoleLogSink : public LogSink {
public:
  explicit ConsoleLogSink(bool verbose = false) : verbose_(verbose) {}

  void write(LogLevel level, const std::string &message) override {
    switch (level) {
    case LogLevel::Debug:
      if (verbose_)
        std::cout << "Debug: " << message << std::endl;
      break;
    case LogLevel::Info:
      std::cout << "Info: " << message << std::endl;
      break;
    case LogLevel::Warning:
      std::cerr << "WARNING: " << message << '\n';
      break;
    case LogLevel::Error:
      std::cerr << "ERROR: " << message << '\n';
      break;
    }
  }

private:
  bool verbose_;
};

// Appends "<date> <time> - LEVEL - message" lines to a file
class FileLogSink : public LogSink {
public:
  FileLogSink(const fs::path &log_path, bool verbose) : verbose_(verbose) {
    stream_.open(log_path, std::ios::binary | std::ios::out | std::ios::app);
  }

  bool is_open() const { return stream_.is_open(); }

  void write(LogLevel level, const std::string &message) override {
    if (!stream_.is_open() || (level == LogLevel::Debug && !verbose_))
      return;
    std::time_t now =
        std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    stream_ << std::put_time(std::localtime(&now), "%Y-%m-%d %H:%M:%S")
            << " - " << log_level_name(level) << " - " << message << '\n';
    stream_.flush();
  }

private:
  std::ofstream stream_;
  bool verbose_;
};

class TeeLogSink : public LogSink {
public:
  void add(std::unique_ptr<LogSink> sink) { sinks_.push_back(std::move(sink)); }

  void write(LogLevel level, const std::string &message) override {
    for (auto &sink : sinks_) {
      sink->write(level, message);
    }
  }

private:
  std::vector<std::unique_ptr<LogSink>> sinks_;
};

// --- Exclusions ---

using ExclusionSet = std::set<std::string>;

const std::vector<std::string> DEFAULT_EXCLUDED_DIRS = {".terraform",
                                                        "node_modules", ".git"};

ExclusionSet make_exclusion_set(const std::vector<std::string> &user_excluded) {
  ExclusionSet excluded(DEFAULT_EXCLUDED_DIRS.begin(),
                        DEFAULT_EXCLUDED_DIRS.end());
  excluded.insert(user_excluded.begin(), user_excluded.end());
  return excluded;
}

// Matches the base name only, never a path prefix or pattern
bool should_exclude(const fs::path &path, const ExclusionSet &excluded) {
  return excluded.count(path.filename().string()) > 0;
}

// --- Directory Listing ---

// Symlinked directories count as plain entries so walks never follow them
bool is_walkable_directory(const fs::directory_entry &entry) {
  std::error_code ec;
  if (entry.is_symlink(ec))
    return false;
  return entry.is_directory(ec);
}

// Entries of one directory in byte-wise name order. A directory that fails
// mid-listing is reported and contributes whatever was read before the error.
std::vector<fs::directory_entry> list_directory(const fs::path &directory,
                                                LogSink &log) {
  std::vector<fs::directory_entry> entries;
  try {
    for (const auto &entry : fs::directory_iterator(
             directory, fs::directory_options::skip_permission_denied)) {
      entries.push_back(entry);
    }
  } catch (const fs::filesystem_error &e) {
    log.warning("Filesystem error listing " + normalize_path(directory) +
                ": " + e.what());
  }
  std::sort(entries.begin(), entries.end(),
            [](const fs::directory_entry &a, const fs::directory_entry &b) {
              return a.path().filename().string() <
                     b.path().filename().string();
            });
  return entries;
}

// --- Extensions ---

// Leading dots never start an extension: ".bashrc" has none, "file." has "."
std::string file_extension(const std::string &filename) {
  size_t first = filename.find_first_not_of('.');
  if (first == std::string::npos)
    return "";
  size_t dot = filename.rfind('.');
  if (dot == std::string::npos || dot < first)
    return "";
  return filename.substr(dot);
}

// Dotfiles are keyed by their whole name, everything else by extension
std::string extension_key(const std::string &filename) {
  if (!filename.empty() && filename[0] == '.')
    return to_lower(filename);
  return to_lower(file_extension(filename));
}

struct ExtensionEntry {
  std::string key;
  size_t count = 0;
};

void scan_extensions(const fs::path &directory, const ExclusionSet &excluded,
                     std::vector<ExtensionEntry> &catalog,
                     std::unordered_map<std::string, size_t> &catalog_index,
                     LogSink &log) {
  for (const auto &entry : list_directory(directory, log)) {
    if (should_exclude(entry.path(), excluded)) {
      log.debug("Skipping excluded entry: " + normalize_path(entry.path()));
      continue;
    }
    if (is_walkable_directory(entry)) {
      scan_extensions(entry.path(), excluded, catalog, catalog_index, log);
      continue;
    }
    std::error_code ec;
    if (!entry.is_regular_file(ec))
      continue;

    std::string key = extension_key(entry.path().filename().string());
    auto it = catalog_index.find(key);
    if (it == catalog_index.end()) {
      catalog_index.emplace(key, catalog.size());
      catalog.push_back({key, 1});
    } else {
      catalog[it->second].count++;
    }
  }
}

// Counts every extension key under input_dir, in first-seen order
std::vector<ExtensionEntry> discover_extensions(const fs::path &input_dir,
                                                const ExclusionSet &excluded,
                                                LogSink &log) {
  std::vector<ExtensionEntry> catalog;
  std::unordered_map<std::string, size_t> catalog_index;
  scan_extensions(input_dir, excluded, catalog, catalog_index, log);
  return catalog;
}

// --- Filename Sanitising ---

bool is_word_char(unsigned char c) {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
         (c >= '0' && c <= '9') || c == '_';
}

bool is_space_char(unsigned char c) {
  return c == ' ' || (c >= '\t' && c <= '\r') || (c >= 0x1c && c <= 0x1f);
}

// Flattens a relative path into a lowercase [a-z0-9_] token
std::string sanitize_filename(std::string_view name) {
  std::string replaced;
  replaced.reserve(name.size());
  for (char ch : name) {
    unsigned char c = static_cast<unsigned char>(ch);
    replaced += (is_word_char(c) || is_space_char(c) || c == '-') ? ch : '_';
  }

  size_t start = 0;
  size_t end = replaced.size();
  while (start < end && is_space_char(replaced[start]))
    ++start;
  while (end > start && is_space_char(replaced[end - 1]))
    --end;

  std::string result;
  result.reserve(end - start);
  bool in_separator_run = false;
  for (size_t i = start; i < end; ++i) {
    unsigned char c = static_cast<unsigned char>(replaced[i]);
    if (c == '-' || is_space_char(c)) {
      if (!in_separator_run)
        result += '_';
      in_separator_run = true;
      continue;
    }
    in_separator_run = false;
    result += static_cast<char>(std::tolower(c));
  }
  return result;
}

// --- File Content Processing ---

class TextDecodeError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Strict UTF-8: rejects overlong forms, surrogates and code points past
// U+10FFFF
bool is_valid_utf8(std::string_view text) {
  size_t i = 0;
  while (i < text.size()) {
    unsigned char lead = static_cast<unsigned char>(text[i]);
    if (lead < 0x80) {
      ++i;
      continue;
    }

    size_t length = 0;
    uint32_t code_point = 0;
    if ((lead & 0xE0) == 0xC0) {
      length = 2;
      code_point = lead & 0x1F;
    } else if ((lead & 0xF0) == 0xE0) {
      length = 3;
      code_point = lead & 0x0F;
    } else if ((lead & 0xF8) == 0xF0) {
      length = 4;
      code_point = lead & 0x07;
    } else {
      return false;
    }
    if (i + length > text.size())
      return false;

    for (size_t k = 1; k < length; ++k) {
      unsigned char next = static_cast<unsigned char>(text[i + k]);
      if ((next & 0xC0) != 0x80)
        return false;
      code_point = (code_point << 6) | (next & 0x3F);
    }

    if ((length == 2 && code_point < 0x80) ||
        (length == 3 && code_point < 0x800) ||
        (length == 4 && code_point < 0x10000))
      return false;
    if (code_point > 0x10FFFF || (code_point >= 0xD800 && code_point <= 0xDFFF))
      return false;
    i += length;
  }
  return true;
}

// Reads the file byte for byte. Throws TextDecodeError when it is not UTF-8.
std::string read_text_file(const fs::path &path) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    throw std::runtime_error("Could not open file: " + normalize_path(path));
  }
  std::string content((std::istreambuf_iterator<char>(file)),
                      std::istreambuf_iterator<char>());
  if (file.bad()) {
    throw std::runtime_error("Could not read file: " + normalize_path(path));
  }
  if (!is_valid_utf8(content)) {
    throw TextDecodeError("Not valid UTF-8 text: " + normalize_path(path));
  }
  return content;
}

void write_text_file(const fs::path &path, const std::string &content) {
  std::ofstream file(path, std::ios::binary | std::ios::out | std::ios::trunc);
  if (!file.is_open()) {
    throw std::runtime_error("Could not open output file for writing: " +
                             normalize_path(path));
  }
  file << content;
  file.close();
  if (!file) { // Check for errors on close
    throw std::runtime_error("Failed to write to output file: " +
                             normalize_path(path));
  }
}

std::string render_markdown(const std::string &relative_path,
                            const std::string &contents,
                            const std::string &language) {
  std::stringstream markdown;
  markdown << "# File Name: " << relative_path << "\n";
  markdown << "# File Contents:\n";
  if (!language.empty()) {
    markdown << "```" << language << "\n" << contents << "\n```\n\n";
  } else {
    markdown << contents << "\n\n";
  }
  return markdown.str();
}

// --- Directory Tree ---

struct TreeListing {
  std::vector<std::string> lines;
  size_t dirCount = 0;
  size_t fileCount = 0;
};

void build_tree_lines(const fs::path &directory, const std::string &indent,
                      const ExclusionSet &excluded, TreeListing &listing,
                      LogSink &log) {
  std::vector<fs::directory_entry> entries;
  for (auto &entry : list_directory(directory, log)) {
    if (!should_exclude(entry.path(), excluded))
      entries.push_back(std::move(entry));
  }
  // Already in name order; move directories ahead of files
  std::stable_sort(entries.begin(), entries.end(),
                   [](const fs::directory_entry &a,
                      const fs::directory_entry &b) {
                     return is_walkable_directory(a) &&
                            !is_walkable_directory(b);
                   });

  for (size_t i = 0; i < entries.size(); ++i) {
    const auto &entry = entries[i];
    bool is_last = (i + 1 == entries.size());
    listing.lines.push_back(indent + (is_last ? "└── " : "├── ") +
                            entry.path().filename().string());

    if (is_walkable_directory(entry)) {
      listing.dirCount++;
      build_tree_lines(entry.path(), indent + (is_last ? "    " : "│   "),
                       excluded, listing, log);
    } else {
      listing.fileCount++;
    }
  }
}

// "." first, then the entries, then a blank line and the totals
TreeListing render_directory_tree(const fs::path &root,
                                  const ExclusionSet &excluded, LogSink &log) {
  TreeListing listing;
  listing.lines.push_back(".");
  build_tree_lines(root, "", excluded, listing, log);
  listing.lines.push_back("");
  listing.lines.push_back(std::to_string(listing.dirCount) + " directories, " +
                          std::to_string(listing.fileCount) + " files");
  return listing;
}

bool write_directory_tree(const fs::path &root, const fs::path &output_file,
                          const ExclusionSet &excluded, LogSink &log) {
  TreeListing listing = render_directory_tree(root, excluded, log);
  try {
    write_text_file(output_file, join_strings(listing.lines, "\n"));
  } catch (const std::exception &e) {
    log.error(e.what());
    return false;
  }
  log.info("Directory tree written to '" + normalize_path(output_file) + "'.");
  return true;
}

// --- Conversion Pipeline ---

struct ConversionStats {
  size_t converted = 0;
  size_t skipped = 0; // Decode failures and other per-file errors
  unsigned long long bytes = 0;
};

class ConversionPipeline {
public:
  ConversionPipeline(ExclusionSet excluded, LogSink &log)
      : excluded_(std::move(excluded)), log_(log) {}

  // Converts every selected file under input_dir into output_dir, then writes
  // directory_tree.txt. Returns false if the output directory cannot be
  // created or the combined/tree file cannot be written; per-file failures
  // are logged and skipped.
  bool run(const fs::path &input_dir, const fs::path &output_dir,
           const std::vector<std::string> &selected_extensions,
           bool single_file);

  const ConversionStats &stats() const { return stats_; }

private:
  void walk(const fs::path &directory);
  bool is_selected(const std::string &filename) const;
  void convert_file(const fs::path &file_path);

  ExclusionSet excluded_;
  LogSink &log_;

  fs::path input_dir_; // Absolute
  fs::path output_dir_;
  std::set<std::string> selected_; // Lowercase
  bool single_file_ = false;
  std::vector<std::string> fragments_; // Single-file mode, in walk order
  ConversionStats stats_;
};

bool ConversionPipeline::run(const fs::path &input_dir,
                             const fs::path &output_dir,
                             const std::vector<std::string> &selected_extensions,
                             bool single_file) {
  input_dir_ = strip_trailing_separator(fs::absolute(input_dir).lexically_normal());
  output_dir_ = output_dir;
  single_file_ = single_file;
  selected_.clear();
  for (const auto &extension : selected_extensions) {
    selected_.insert(to_lower(extension));
  }
  fragments_.clear();
  stats_ = ConversionStats{};

  std::error_code ec;
  fs::create_directories(output_dir_, ec);
  std::error_code ec_type;
  if (ec || !fs::is_directory(output_dir_, ec_type)) {
    log_.error("Failed to create output directory " +
               normalize_path(output_dir_) +
               (ec ? ": " + ec.message() : std::string(": not a directory")));
    return false;
  }

  walk(input_dir_);

  bool success = true;
  if (single_file_) {
    fs::path combined_file = output_dir_ / "all_files.txt";
    try {
      write_text_file(combined_file, join_strings(fragments_, "---\n"));
      log_.info("All markdown content written to " +
                normalize_path(combined_file));
    } catch (const std::exception &e) {
      log_.error(e.what());
      success = false;
    }
    fragments_.clear();
  }

  if (!write_directory_tree(input_dir_, output_dir_ / "directory_tree.txt",
                            excluded_, log_)) {
    success = false;
  }

  std::stringstream ss_msg;
  ss_msg << "Processed " << stats_.converted << " files (" << std::fixed
         << std::setprecision(2) << (stats_.bytes / (1024.0 * 1024.0))
         << " MiB total).";
  log_.info(ss_msg.str());
  return success;
}

// A directory's own files are converted before its subdirectories are entered
void ConversionPipeline::walk(const fs::path &directory) {
  std::vector<fs::path> subdirectories;
  for (const auto &entry : list_directory(directory, log_)) {
    if (is_walkable_directory(entry)) {
      if (should_exclude(entry.path(), excluded_)) {
        log_.debug("Skipping excluded directory: " +
                   normalize_path(entry.path()));
      } else {
        subdirectories.push_back(entry.path());
      }
      continue;
    }

    std::error_code ec;
    if (!entry.is_regular_file(ec) || should_exclude(entry.path(), excluded_))
      continue;

    const std::string filename = entry.path().filename().string();
    if (filename == ".DS_Store" || filename == ".env")
      continue;
    if (is_selected(filename)) {
      convert_file(entry.path());
    }
  }

  for (const auto &subdirectory : subdirectories) {
    walk(subdirectory);
  }
}

// Extensionless files (dotfiles included) can also be picked by full name
bool ConversionPipeline::is_selected(const std::string &filename) const {
  std::string extension = to_lower(file_extension(filename));
  if (selected_.count(extension))
    return true;
  return extension.empty() && selected_.count(to_lower(filename)) > 0;
}

void ConversionPipeline::convert_file(const fs::path &file_path) {
  const fs::path relative = file_path.lexically_relative(input_dir_);
  const std::string relative_path = normalize_path(relative);
  const std::string extension =
      to_lower(file_extension(file_path.filename().string()));
  const std::string language = extension.empty() ? "" : extension.substr(1);

  try {
    std::string contents = read_text_file(file_path);
    std::string fragment = render_markdown(relative_path, contents, language);

    if (single_file_) {
      fragments_.push_back(std::move(fragment));
    } else {
      fs::path output_file = output_dir_ / relative;
      output_file.replace_filename(sanitize_filename(relative_path) + ".txt");
      fs::create_directories(output_file.parent_path());
      write_text_file(output_file, fragment);
      log_.info("Markdown file '" + normalize_path(output_file) +
                "' created successfully.");
    }
    stats_.converted++;
    stats_.bytes += contents.size();
  } catch (const TextDecodeError &) {
    stats_.skipped++;
    log_.warning("Skipping " + normalize_path(file_path) +
                 " due to encoding issues.");
  } catch (const std::exception &e) {
    stats_.skipped++;
    log_.error("Error processing " + normalize_path(file_path) + ": " +
               e.what());
  }
}

// --- Interactive Prompts ---

// Every question returns std::nullopt when the user aborts
class Prompter {
public:
  virtual ~Prompter() = default;

  // Answer must name an existing directory
  virtual std::optional<fs::path>
  ask_directory_path(const std::string &message) = 0;
  virtual std::optional<std::string>
  ask_text(const std::string &message, const std::string &default_value) = 0;
  virtual std::optional<bool> ask_confirm(const std::string &message,
                                          bool default_value) = 0;
  // Returns the chosen subset in choice order
  virtual std::optional<std::vector<std::string>>
  ask_multi_select(const std::string &message,
                   const std::vector<std::string> &choices,
                   const std::vector<std::string> &defaults) = 0;
};

// Parses "1, 3 4" into zero-based indices. Empty optional on any bad token.
std::optional<std::vector<size_t>> parse_selection(const std::string &answer,
                                                   size_t choice_count) {
  std::string spaced = answer;
  std::replace(spaced.begin(), spaced.end(), ',', ' ');
  std::istringstream tokens(spaced);
  std::set<size_t> indices; // Ordered and deduplicated
  std::string token;
  while (tokens >> token) {
    if (!std::all_of(token.begin(), token.end(),
                     [](unsigned char c) { return std::isdigit(c); })) {
      return std::nullopt;
    }
    size_t number = 0;
    try {
      number = std::stoul(token);
    } catch (const std::exception &) {
      return std::nullopt;
    }
    if (number < 1 || number > choice_count)
      return std::nullopt;
    indices.insert(number - 1);
  }
  return std::vector<size_t>(indices.begin(), indices.end());
}

// Line-based prompts over any stream pair
class ConsolePrompter : public Prompter {
public:
  ConsolePrompter(std::istream &in, std::ostream &out) : in_(in), out_(out) {}

  std::optional<fs::path>
  ask_directory_path(const std::string &message) override {
    while (true) {
      auto answer = read_answer(message);
      if (!answer)
        return std::nullopt;
      std::string value = trim(*answer);
      std::error_code ec;
      if (!value.empty() && fs::is_directory(value, ec))
        return fs::path(value);
      out_ << ">> Path must be an existing directory.\n";
    }
  }

  std::optional<std::string>
  ask_text(const std::string &message,
           const std::string &default_value) override {
    auto answer = read_answer(message);
    if (!answer)
      return std::nullopt;
    std::string value = trim(*answer);
    return value.empty() ? default_value : value;
  }

  std::optional<bool> ask_confirm(const std::string &message,
                                  bool default_value) override {
    const std::string hint = default_value ? " (Y/n)" : " (y/N)";
    while (true) {
      auto answer = read_answer(message + hint);
      if (!answer)
        return std::nullopt;
      std::string value = to_lower(trim(*answer));
      if (value.empty())
        return default_value;
      if (value == "y" || value == "yes")
        return true;
      if (value == "n" || value == "no")
        return false;
      out_ << ">> Please answer y or n.\n";
    }
  }

  std::optional<std::vector<std::string>>
  ask_multi_select(const std::string &message,
                   const std::vector<std::string> &choices,
                   const std::vector<std::string> &defaults) override {
    auto is_default = [&](const std::string &choice) {
      return std::find(defaults.begin(), defaults.end(), choice) !=
             defaults.end();
    };

    out_ << "? " << message << '\n';
    for (size_t i = 0; i < choices.size(); ++i) {
      out_ << "  " << (is_default(choices[i]) ? "[x] " : "[ ] ") << (i + 1)
           << ") " << choices[i] << '\n';
    }

    while (true) {
      auto answer = read_answer(
          "Numbers to select (blank keeps the marked ones, 'none' for nothing)");
      if (!answer)
        return std::nullopt;
      std::string value = trim(*answer);

      std::vector<std::string> selected;
      if (value.empty()) {
        std::copy_if(choices.begin(), choices.end(),
                     std::back_inserter(selected), is_default);
        return selected;
      }
      if (to_lower(value) == "none")
        return selected;

      auto indices = parse_selection(value, choices.size());
      if (indices) {
        for (size_t index : *indices) {
          selected.push_back(choices[index]);
        }
        return selected;
      }
      out_ << ">> Enter numbers between 1 and " << choices.size() << ".\n";
    }
  }

private:
  std::optional<std::string> read_answer(const std::string &message) {
    out_ << "? " << message << ": " << std::flush;
    std::string line;
    if (!std::getline(in_, line))
      return std::nullopt;
    return line;
  }

  std::istream &in_;
  std::ostream &out_;
};

// "<key> (<count>)" -> "<key>"
std::string extension_key_from_choice(const std::string &choice) {
  size_t suffix_pos = choice.rfind(" (");
  if (suffix_pos == std::string::npos || choice.empty() ||
      choice.back() != ')')
    return choice;
  return choice.substr(0, suffix_pos);
}

std::vector<std::string> select_extensions(const fs::path &input_dir,
                                           const ExclusionSet &excluded,
                                           Prompter &prompter, LogSink &log) {
  std::vector<ExtensionEntry> catalog =
      discover_extensions(input_dir, excluded, log);
  if (catalog.empty()) {
    log.warning("No files with usable extensions were found.");
    return {};
  }

  std::vector<std::string> choices;
  choices.reserve(catalog.size());
  for (const auto &entry : catalog) {
    choices.push_back(entry.key + " (" + std::to_string(entry.count) + ")");
  }

  auto answer = prompter.ask_multi_select("Select file extensions to process",
                                          choices, choices);
  if (!answer)
    return {};

  std::vector<std::string> selected;
  selected.reserve(answer->size());
  for (const auto &choice : *answer) {
    selected.push_back(extension_key_from_choice(choice));
  }
  return selected;
}

// --- Application ---

// A blank output directory becomes <cwd>/<basename(input_dir)>
fs::path resolve_output_dir(const fs::path &input_dir,
                            const std::string &output_dir) {
  if (!output_dir.empty())
    return fs::path(output_dir);
  if (input_dir.empty())
    return {};
  return fs::current_path() / strip_trailing_separator(input_dir).filename();
}

int run_application(const Config &config, Prompter &prompter, LogSink &log) {
  fs::path input_dir = config.inputDir;
  std::string output_dir_str = config.outputDir.string();
  bool single_file = config.singleFile;

  if (input_dir.empty()) {
    // An abort at any question discards all three answers
    std::optional<fs::path> answered_input =
        prompter.ask_directory_path("Enter the input directory");
    std::optional<std::string> answered_output;
    std::optional<bool> answered_single_file;
    if (answered_input) {
      answered_output = prompter.ask_text(
          "Enter the output directory (leave blank to use default)", "");
    }
    if (answered_output) {
      answered_single_file =
          prompter.ask_confirm("Output all content to a single file?", false);
    }
    if (answered_single_file) {
      input_dir = *answered_input;
      output_dir_str = *answered_output;
      single_file = *answered_single_file;
    }
  }

  fs::path output_dir = resolve_output_dir(input_dir, output_dir_str);
  if (input_dir.empty() || output_dir.empty()) {
    log.error("Input or output directory not provided.");
    return 1;
  }

  std::error_code ec;
  if (!fs::is_directory(input_dir, ec)) {
    log.error("Input directory '" + normalize_path(input_dir) + "' not found.");
    return 1;
  }

  ExclusionSet excluded = make_exclusion_set(config.excludeDirs);

  std::vector<std::string> selected_extensions;
  if (!config.extensions.empty()) {
    for (const auto &extension : config.extensions) {
      selected_extensions.push_back(to_lower(extension));
    }
    log.info("Using extensions from arguments: " +
             join_strings(selected_extensions, ", "));
  } else {
    selected_extensions = select_extensions(input_dir, excluded, prompter, log);
  }

  if (selected_extensions.empty()) {
    log.error("No extensions selected. Exiting.");
    return 1;
  }

  ConversionPipeline pipeline(excluded, log);
  if (!pipeline.run(input_dir, output_dir, selected_extensions, single_file)) {
    log.error("Markdown generation finished with errors.");
    return 1;
  }
  log.info("Markdown generation complete.");
  return 0;
}

// --- Argument Parsing ---

void print_usage(const char *program_name) {
  std::cerr << "Usage: " << program_name
            << " [input_dir] [output_dir] [options]\n";
  std::cerr << "Generates markdown files and a directory tree from directory "
               "contents.\n";
  std::cerr << "Missing input_dir and extensions are asked for "
               "interactively.\n\n";
  std::cerr << "Options:\n";

  std::vector<std::pair<std::string, std::string>> options = {
      {"-e, --extensions <ext...>",
       "File extensions to include (e.g., .py .js .md). Dotfiles are given "
       "by full name (e.g., .gitignore)."},
      {"-x, --exclude-dir <name>",
       "Directory name to exclude, in addition to .terraform, node_modules "
       "and .git (can be used multiple times)."},
      {"-s, --single-file", "Output all content to a single file."},
      {"--log-file <file>", "Also append log records to <file>."},
      {"-v, --verbose", "Log debug records such as skipped directories."},
      {"-h, --help", "Show this help message."}};

  size_t max_option_length = 0;
  for (const auto &option : options) {
    max_option_length = std::max(max_option_length, option.first.length());
  }

  for (const auto &option : options) {
    std::cerr << "  " << std::left << std::setw(max_option_length + 2)
              << option.first << option.second << "\n";
  }
}

Config parse_arguments(int argc, char *argv[]) {
  Config config;

  for (int i = 1; i < argc; ++i) {
    if (std::string_view(argv[i]) == "-h" ||
        std::string_view(argv[i]) == "--help") {
      print_usage(argv[0]);
      std::exit(0);
    }
  }

  auto fail = [&](const std::string &message) {
    std::cerr << "ERROR: " << message << "\n\n";
    print_usage(argv[0]);
    std::exit(1);
  };

  std::vector<std::string> positionals;
  for (int i = 1; i < argc; ++i) {
    std::string_view arg = argv[i];
    auto parse_multi_arg = [&](std::vector<std::string> &target_vec) {
      while (i + 1 < argc && argv[i + 1][0] != '-') {
        target_vec.emplace_back(argv[++i]);
      }
    };

    if (arg == "-e" || arg == "--extensions") {
      std::vector<std::string> extensions;
      parse_multi_arg(extensions);
      if (extensions.empty())
        fail("--extensions expects at least one value.");
      for (auto &ext : extensions) {
        config.extensions.push_back(to_lower(std::move(ext)));
      }
    } else if (arg == "-x" || arg == "--exclude-dir") {
      if (i + 1 >= argc)
        fail("--exclude-dir expects a directory name.");
      config.excludeDirs.emplace_back(argv[++i]);
    } else if (arg == "-s" || arg == "--single-file") {
      config.singleFile = true;
    } else if (arg == "--log-file") {
      if (i + 1 >= argc)
        fail("--log-file expects a file path.");
      config.logFile = argv[++i];
    } else if (arg == "-v" || arg == "--verbose") {
      config.verbose = true;
    } else if (arg.size() > 1 && arg[0] == '-') {
      fail("Unknown or invalid option: " + std::string(arg));
    } else {
      positionals.emplace_back(arg);
    }
  }

  if (positionals.size() > 2)
    fail("Unexpected argument: " + positionals[2]);
  if (!positionals.empty())
    config.inputDir = positionals[0];
  if (positionals.size() > 1)
    config.outputDir = positionals[1];

  return config;
}

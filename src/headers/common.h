#pragma once
/**
 * TexFill — Common header
 * Shared includes, using declarations and utility declarations
 */

#include <nlohmann/json.hpp>

#include <iostream>
#include <string>
#include <array>
#include <memory>
#include <regex>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <cstdlib>
#include <cstdio>
#include <mutex>
#include <chrono>
#include <thread>
#include <algorithm>
#include <random>
#include <vector>
#include <map>
#include <set>
#include <functional>
#include <stdexcept>
#include <ctime>
#include <cstdint>
#include <iterator>

// ─── Type aliases & namespace shortcuts ─────────────────────────────────────

using json = nlohmann::json;
namespace fs = std::filesystem;

using std::string;
using std::vector;
using std::map;
using std::set;
using std::mutex;
using std::thread;
using std::cout;
using std::cerr;
using std::endl;
using std::array;
using std::unique_ptr;
using std::lock_guard;
using std::function;
using std::ofstream;
using std::ifstream;
using std::pair;
using std::regex;
using std::to_string;

#define TEXFILL_LOG "[TexFill] "

// ─── Safe JSON accessor (handles null values) ──────────────────────────────

string json_str(const json& j, const string& key, const string& def = "");

// ─── String / file utilities ────────────────────────────────────────────────

string trim(const string& s);
string tail_chars(const string& s, size_t max_chars);
string truncate_preview(const string& s, size_t max_chars);
string escape_arg(const string& arg);
string iso_now();

// ─── Shell execution ────────────────────────────────────────────────────────

string exec_command(const string& cmd, int& exit_code);

// ─── Path and executable finding ────────────────────────────────────────────

string find_executable(const string& name, const vector<string>& extra_paths = {});

// ─── File helpers ───────────────────────────────────────────────────────────

string read_file_binary(const fs::path& path);
bool   write_file_binary(const fs::path& path, const string& data);

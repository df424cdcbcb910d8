/**
 * TexFill — Common utilities implementation
 */

#include "common.h"

#ifndef _WIN32
#include <sys/wait.h>
#endif

// ─── JSON helpers ───────────────────────────────────────────────────────────

string json_str(const json& j, const string& key, const string& def) {
    if (j.contains(key) && j[key].is_string()) return j[key].get<string>();
    return def;
}

// ─── String utilities ───────────────────────────────────────────────────────

string trim(const string& s) {
    const char* ws = " \t\r\n\f\v";
    auto start = s.find_first_not_of(ws);

    if (start == string::npos) return "";
    auto end = s.find_last_not_of(ws);
    return s.substr(start, end - start + 1);
}

string tail_chars(const string& s, size_t max_chars) {
    if (s.size() <= max_chars) return s;
    return s.substr(s.size() - max_chars);
}

string truncate_preview(const string& s, size_t max_chars) {
    if (s.size() <= max_chars) return s;
    return s.substr(0, max_chars) + "...";
}

string escape_arg(const string& arg) {
#ifdef _WIN32
    string escaped = "\"";

    for (char c : arg) {
        if (c == '"') escaped += "\\\"";
        else escaped += c;
    }

    escaped += "\"";
    return escaped;
#else
    string escaped = "'";

    for (char c : arg) {
        if (c == '\'') escaped += "'\\''";
        else escaped += c;
    }

    escaped += "'";
    return escaped;
#endif
}

string iso_now() {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    char buf[32];
    struct tm gmt;
#ifdef _WIN32
    gmtime_s(&gmt, &t);
#else
    gmtime_r(&t, &gmt);
#endif
    strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &gmt);
    return string(buf);
}

// ─── Shell execution ────────────────────────────────────────────────────────

string exec_command(const string& cmd, int& exit_code) {
    string result;
    array<char, 4096> buffer;

#ifdef _WIN32
    string full_cmd = "\"" + cmd + " 2>&1\"";
    unique_ptr<FILE, decltype(&_pclose)> pipe(_popen(full_cmd.c_str(), "r"), _pclose);
#else
    string full_cmd = cmd + " 2>&1";
    unique_ptr<FILE, decltype(&pclose)> pipe(popen(full_cmd.c_str(), "r"), pclose);
#endif

    if (!pipe) { exit_code = -1; return "Failed to execute command"; }

    while (fgets(buffer.data(), buffer.size(), pipe.get()) != nullptr) {
        result += buffer.data();
    }

    // Capture the real process exit code
#ifdef _WIN32
    exit_code = _pclose(pipe.release());
#else
    int raw = pclose(pipe.release());
    exit_code = WIFEXITED(raw) ? WEXITSTATUS(raw) : -1;
#endif
    return result;
}

// ─── Executable lookup ──────────────────────────────────────────────────────

string find_executable(const string& name, const vector<string>& extra_paths) {
    string result;
    array<char, 4096> buf;
#ifdef _WIN32
    string wcmd = "where.exe " + name + " 2>&1";
    unique_ptr<FILE, decltype(&_pclose)> pipe(_popen(wcmd.c_str(), "r"), _pclose);
#else
    string wcmd = "which " + name + " 2>&1";
    unique_ptr<FILE, decltype(&pclose)> pipe(popen(wcmd.c_str(), "r"), pclose);
#endif

    if (pipe) {
        while (fgets(buf.data(), buf.size(), pipe.get()) != nullptr) { result += buf.data(); }
    }

    auto nl = result.find('\n');

    if (nl != string::npos) result = result.substr(0, nl);
    result.erase(std::remove(result.begin(), result.end(), '\r'), result.end());

    std::error_code ec;
    if (!result.empty() && fs::exists(result, ec)) return result;
    for (const auto& p : extra_paths) { if (fs::exists(p, ec)) return p; }
    return "";
}

// ─── File helpers ───────────────────────────────────────────────────────────

string read_file_binary(const fs::path& path) {
    ifstream f(path, std::ios::binary);
    return string((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
}

bool write_file_binary(const fs::path& path, const string& data) {
    ofstream out(path, std::ios::binary);
    if (!out) return false;
    out.write(data.data(), static_cast<std::streamsize>(data.size()));
    out.close();
    return !out.fail();
}

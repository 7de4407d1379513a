#pragma once
#include <set>
#include <string>

namespace droidlink {

std::string trim(const std::string& s);

// Drop "WARNING: linker: ..." lines some emulators prepend to shell output.
std::string strip_shell_warnings(const std::string& output);

// Package of `mCurrentFocus=Window{... com.example/.Main}`; empty if absent.
std::string parse_focused_package(const std::string& dumpsys_output);

// Accepts both `dumpsys package` ("Package [name] (...)") and
// `pm list packages` ("package:name") output.
std::set<std::string> parse_package_list(const std::string& output);

} // namespace droidlink

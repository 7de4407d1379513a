#include "transport/ShellParsers.hpp"

#include <regex>
#include <sstream>

namespace droidlink {

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    auto begin = s.find_first_not_of(ws);
    if (begin == std::string::npos) return "";
    auto end = s.find_last_not_of(ws);
    return s.substr(begin, end - begin + 1);
}

std::string strip_shell_warnings(const std::string& output) {
    if (output.rfind("WARNING", 0) != 0) return output;
    std::istringstream in(output);
    std::string line, out;
    bool first = true;
    while (std::getline(in, line)) {
        if (line.rfind("WARNING: linker:", 0) == 0) continue;
        if (!first) out.push_back('\n');
        out += line;
        first = false;
    }
    return out;
}

std::string parse_focused_package(const std::string& dumpsys_output) {
    static const std::regex component(R"(([a-zA-Z0-9_.]+)/[a-zA-Z0-9_.$]+)");
    std::smatch m;
    if (std::regex_search(dumpsys_output, m, component)) return m[1].str();
    return "";
}

std::set<std::string> parse_package_list(const std::string& output) {
    static const std::regex dumpsys_entry(R"(Package \[([^\s\]]+)\])");
    static const std::regex pm_entry(R"(package:([^\s]+))");

    std::set<std::string> packages;
    for (std::sregex_iterator it(output.begin(), output.end(), dumpsys_entry), end; it != end; ++it) {
        packages.insert((*it)[1].str());
    }
    if (!packages.empty()) return packages;
    for (std::sregex_iterator it(output.begin(), output.end(), pm_entry), end; it != end; ++it) {
        packages.insert((*it)[1].str());
    }
    return packages;
}

} // namespace droidlink

#include <ibmcloud_mcp/session/dotenv.hpp>

#include <fstream>
#include <sstream>

namespace ibmcloud_mcp {

namespace {

std::string_view Trim(std::string_view s) {
    const char* ws = " \t\r";
    auto begin = s.find_first_not_of(ws);
    if (begin == std::string_view::npos) return {};
    auto end = s.find_last_not_of(ws);
    return s.substr(begin, end - begin + 1);
}

std::string_view StripQuotes(std::string_view value) {
    if (value.size() >= 2) {
        char first = value.front();
        char last = value.back();
        if ((first == '"' || first == '\'') && first == last) {
            return value.substr(1, value.size() - 2);
        }
    }
    return value;
}

} // anonymous namespace

std::map<std::string, std::string> ParseDotenv(std::string_view text) {
    std::map<std::string, std::string> vars;
    size_t pos = 0;
    while (pos <= text.size()) {
        auto eol = text.find('\n', pos);
        auto raw = text.substr(pos, eol == std::string_view::npos
                                        ? std::string_view::npos
                                        : eol - pos);
        pos = (eol == std::string_view::npos) ? text.size() + 1 : eol + 1;

        auto line = Trim(raw);
        if (line.empty() || line.front() == '#') continue;

        constexpr std::string_view kExport = "export ";
        if (line.substr(0, kExport.size()) == kExport) {
            line = Trim(line.substr(kExport.size()));
        }

        auto eq = line.find('=');
        if (eq == std::string_view::npos) continue;

        auto key = Trim(line.substr(0, eq));
        if (key.empty()) continue;
        auto value = StripQuotes(Trim(line.substr(eq + 1)));
        vars[std::string(key)] = std::string(value);
    }
    return vars;
}

std::optional<std::map<std::string, std::string>> LoadDotenvFile(
    const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        return std::nullopt;
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    return ParseDotenv(ss.str());
}

} // namespace ibmcloud_mcp

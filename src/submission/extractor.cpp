#include "submission/extractor.hpp"

#include <cctype>
#include <optional>
#include <regex>
#include <sstream>
#include <string>
#include <vector>

namespace arena::submission {

namespace {

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    std::string current;
    for (const char c : text) {
        if (c == '\n') {
            lines.push_back(current);
            current.clear();
        } else if (c != '\r') {
            current.push_back(c);
        }
    }
    lines.push_back(current);
    return lines;
}

std::string rtrim(std::string line) {
    while (!line.empty() && std::isspace(static_cast<unsigned char>(line.back())) != 0) {
        line.pop_back();
    }
    return line;
}

std::string trim(const std::string& line) {
    std::size_t begin = 0;
    while (begin < line.size() && std::isspace(static_cast<unsigned char>(line[begin])) != 0) {
        ++begin;
    }
    return rtrim(line.substr(begin));
}

bool is_blank(const std::string& line) {
    return trim(line).empty();
}

std::size_t indentation(const std::string& line) {
    std::size_t n = 0;
    while (n < line.size() && (line[n] == ' ' || line[n] == '\t')) {
        ++n;
    }
    return n;
}

std::string join(const std::vector<std::string>& lines) {
    std::string out;
    for (std::size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) {
            out.push_back('\n');
        }
        out += lines[i];
    }
    return out;
}

// Idempotent: strips CR, trailing whitespace per line, and leading/trailing
// blank lines.
std::string normalize(const std::string& text) {
    std::vector<std::string> lines;
    for (const auto& line : split_lines(text)) {
        lines.push_back(rtrim(line));
    }
    std::size_t first = 0;
    while (first < lines.size() && lines[first].empty()) {
        ++first;
    }
    std::size_t last = lines.size();
    while (last > first && lines[last - 1].empty()) {
        --last;
    }
    return join(std::vector<std::string>(lines.begin() + static_cast<std::ptrdiff_t>(first),
                                         lines.begin() + static_cast<std::ptrdiff_t>(last)));
}

std::regex def_pattern(const std::string& entry_point, const bool anchored_at_column_zero) {
    const std::string prefix = anchored_at_column_zero ? "^" : "^[ \\t]*";
    return std::regex(prefix + "(async[ \\t]+)?def[ \\t]+" + entry_point + "[ \\t]*\\(");
}

bool is_code_line_at_column_zero(const std::string& line) {
    static const std::regex kKeyword(
        R"(^(def|class|import|from|async|await|if|elif|else|for|while|try|except|finally|with|return|raise|assert|pass|break|continue|global|nonlocal|del|yield|lambda|print)\b)");
    static const std::regex kStatement(
        R"(^[A-Za-z_][A-Za-z0-9_.]*(\[[^\]]*\])?([ \t]*(=|\+=|-=|\*=|/=)|\())");
    static const std::regex kPunctuation(R"(^[#@)\]}'"])");
    return std::regex_search(line, kKeyword) || std::regex_search(line, kStatement) ||
           std::regex_search(line, kPunctuation);
}

std::optional<std::string> fenced_block(const std::string& text, const std::string& entry_point) {
    const auto lines = split_lines(text);
    const std::regex def_any = def_pattern(entry_point, false);
    std::size_t i = 0;
    while (i < lines.size()) {
        if (trim(lines[i]).rfind("```", 0) != 0) {
            ++i;
            continue;
        }
        std::vector<std::string> body;
        std::size_t j = i + 1;
        bool closed = false;
        for (; j < lines.size(); ++j) {
            if (trim(lines[j]).rfind("```", 0) == 0) {
                closed = true;
                break;
            }
            body.push_back(lines[j]);
        }
        if (!closed) {
            return std::nullopt;
        }
        const std::string content = join(body);
        if (std::regex_search(content, def_any)) {
            return normalize(content);
        }
        i = j + 1;
    }
    return std::nullopt;
}

std::optional<std::string> function_block(const std::string& text, const std::string& entry_point) {
    const auto lines = split_lines(text);
    const std::regex def_any = def_pattern(entry_point, false);
    for (std::size_t i = 0; i < lines.size(); ++i) {
        if (!std::regex_search(lines[i], def_any)) {
            continue;
        }
        const std::size_t base = indentation(lines[i]);
        std::vector<std::string> block;
        block.push_back(lines[i].substr(base));
        for (std::size_t j = i + 1; j < lines.size(); ++j) {
            const std::string& line = lines[j];
            if (is_blank(line)) {
                block.emplace_back();
                continue;
            }
            if (indentation(line) <= base) {
                break;
            }
            block.push_back(line.substr(base));
        }
        return normalize(join(block));
    }
    return std::nullopt;
}

std::optional<std::string> wrapped_code_lines(const std::string& text,
                                              const std::string& entry_point) {
    std::vector<std::string> body;
    for (const auto& raw_line : split_lines(text)) {
        const std::string line = trim(raw_line);
        if (line.empty() || line.back() == ':' || line.front() == '#') {
            continue;
        }
        const bool code_like = line.find('=') != std::string::npos ||
                               line.find("return") != std::string::npos ||
                               line.find("def ") != std::string::npos ||
                               line.find("if ") != std::string::npos ||
                               line.find("for ") != std::string::npos;
        if (code_like) {
            body.push_back("    " + line);
        }
    }
    if (body.empty()) {
        return std::nullopt;
    }
    body.insert(body.begin(), "def " + entry_point + "():");
    return normalize(join(body));
}

}  // namespace

std::string entry_point_from_stub(const std::string& stub) {
    static const std::regex kDef(R"(def\s+(\w+)\s*\()");
    std::smatch match;
    if (std::regex_search(stub, match, kDef)) {
        return match[1].str();
    }
    return "solve";
}

bool is_executable_form(const std::string& text, const std::string& entry_point) {
    if (text.empty() || normalize(text) != text) {
        return false;
    }
    const std::regex def_top = def_pattern(entry_point, true);
    bool defines_entry_point = false;
    for (const auto& line : split_lines(text)) {
        if (line.empty() || indentation(line) > 0) {
            continue;
        }
        if (line.rfind("```", 0) == 0 || !is_code_line_at_column_zero(line)) {
            return false;
        }
        if (std::regex_search(line, def_top)) {
            defines_entry_point = true;
        }
    }
    return defines_entry_point;
}

std::string extract_executable(const std::string& raw, const std::string& entry_point) {
    const std::string whole = normalize(raw);
    if (is_executable_form(whole, entry_point)) {
        return whole;
    }

    const auto fenced = fenced_block(raw, entry_point);
    if (fenced.has_value() && is_executable_form(fenced.value(), entry_point)) {
        return fenced.value();
    }

    const auto block = function_block(raw, entry_point);
    if (block.has_value() && is_executable_form(block.value(), entry_point)) {
        return block.value();
    }

    const auto wrapped = wrapped_code_lines(raw, entry_point);
    if (wrapped.has_value() && is_executable_form(wrapped.value(), entry_point)) {
        return wrapped.value();
    }

    return "def " + entry_point + "():\n    pass";
}

}  // namespace arena::submission

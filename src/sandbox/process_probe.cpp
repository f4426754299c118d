#include "sandbox/process_probe.hpp"

#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <system_error>

namespace arena::sandbox {

namespace {

// Fields of /proc/<pid>/stat after the parenthesised command name, which may
// itself contain spaces or parentheses.
struct StatFields {
    char state = '?';
    pid_t pgrp = -1;
};

std::optional<StatFields> read_stat(const std::string& pid_dir) {
    std::ifstream in(pid_dir + "/stat");
    if (!in.is_open()) {
        return std::nullopt;
    }
    std::string content;
    std::getline(in, content);
    const auto close_paren = content.rfind(')');
    if (close_paren == std::string::npos) {
        return std::nullopt;
    }

    std::istringstream rest(content.substr(close_paren + 1));
    StatFields fields;
    long ppid = 0;
    long pgrp = 0;
    if (!(rest >> fields.state >> ppid >> pgrp)) {
        return std::nullopt;
    }
    fields.pgrp = static_cast<pid_t>(pgrp);
    return fields;
}

std::optional<std::uint64_t> read_vm_rss_kb(const std::string& pid_dir) {
    std::ifstream in(pid_dir + "/status");
    if (!in.is_open()) {
        return std::nullopt;
    }
    std::string line;
    while (std::getline(in, line)) {
        if (line.rfind("VmRSS:", 0) != 0) {
            continue;
        }
        std::istringstream value(line.substr(6));
        std::uint64_t kb = 0;
        if (value >> kb) {
            return kb;
        }
        return std::nullopt;
    }
    // Zombies and kernel threads carry no VmRSS line.
    return std::nullopt;
}

bool is_numeric(const std::string& name) {
    if (name.empty()) {
        return false;
    }
    for (const char c : name) {
        if (std::isdigit(static_cast<unsigned char>(c)) == 0) {
            return false;
        }
    }
    return true;
}

}  // namespace

std::optional<std::uint64_t> resident_kb(const pid_t pid) {
    const std::string pid_dir = "/proc/" + std::to_string(pid);
    const auto stat = read_stat(pid_dir);
    if (!stat.has_value() || stat->state == 'Z' || stat->state == 'X') {
        return std::nullopt;
    }
    return read_vm_rss_kb(pid_dir);
}

std::optional<std::uint64_t> group_resident_kb(const pid_t pgid) {
    const auto leader = resident_kb(pgid);
    if (!leader.has_value()) {
        return std::nullopt;
    }

    std::uint64_t total = 0;
    std::error_code ec;
    std::filesystem::directory_iterator it("/proc", ec);
    if (ec) {
        return leader;
    }
    for (; it != std::filesystem::directory_iterator(); it.increment(ec)) {
        if (ec) {
            break;
        }
        const auto& entry = *it;
        const std::string name = entry.path().filename().string();
        if (!is_numeric(name)) {
            continue;
        }
        const std::string pid_dir = entry.path().string();
        const auto stat = read_stat(pid_dir);
        if (!stat.has_value() || stat->pgrp != pgid || stat->state == 'Z') {
            continue;
        }
        // A member can exit between the stat and status reads.
        const auto rss = read_vm_rss_kb(pid_dir);
        if (rss.has_value()) {
            total += rss.value();
        }
    }
    return total > 0 ? total : leader.value();
}

}  // namespace arena::sandbox

#pragma once

#include <cstdint>
#include <optional>
#include <sys/types.h>

namespace arena::sandbox {

// Resident set size of a single process in kilobytes, read from
// /proc/<pid>/status. Empty when the process is gone or already a zombie.
std::optional<std::uint64_t> resident_kb(pid_t pid);

// Sum of resident memory over every live process whose process group is
// `pgid`. Empty when the group leader itself is gone or a zombie.
std::optional<std::uint64_t> group_resident_kb(pid_t pgid);

}  // namespace arena::sandbox

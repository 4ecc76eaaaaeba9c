#pragma once
#include <functional>
#include <string>
#include <vector>

namespace rpub {

// Extracts regular-file members of a POSIX ustar / GNU tar archive into
// target_dir, flattening member paths to their basename. Only members for
// which accept(basename) is true are written. Returns the written paths.
// Throws CorruptDataError for malformed archives, FilesystemError on I/O.
std::vector<std::string> extractTar(const std::string& tar_path,
                                    const std::string& target_dir,
                                    const std::function<bool(const std::string&)>& accept);

} // namespace rpub

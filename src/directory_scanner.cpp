#include "directory_scanner.hpp"

#include <algorithm>

#include "extension_policy.hpp"

std::vector<CandidateFile> DirectoryScanner::scan(const std::filesystem::path& dir) const {
  std::error_code ec;
  std::filesystem::directory_iterator it(dir, ec);
  if(ec) {
    throw DirectoryReadError("Unable to read " + dir.string() + ": " + ec.message());
  }

  std::vector<CandidateFile> files;
  for(auto end = std::filesystem::directory_iterator(); it != end; it.increment(ec)) {
    if(ec) break;
    std::error_code type_ec;
    if(it->is_directory(type_ec)) continue;
    CandidateFile file;
    file.name = it->path().filename().string();
    file.extension = extension_of(file.name);
    file.full_path = it->path();
    files.push_back(std::move(file));
  }
  if(ec) {
    throw DirectoryReadError("Unable to read " + dir.string() + ": " + ec.message());
  }

  std::sort(files.begin(), files.end(),
            [](const CandidateFile& a, const CandidateFile& b){ return a.name < b.name; });
  return files;
}

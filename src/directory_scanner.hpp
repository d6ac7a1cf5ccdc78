#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

struct CandidateFile {
  std::string name;
  std::string extension;
  std::filesystem::path full_path;
};

// An unreadable watch directory is an operator error, not a transient
// condition; callers let this escape and terminate the process.
class DirectoryReadError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

class DirectoryScanner {
public:
  virtual ~DirectoryScanner() = default;

  // Non-directory entries of dir, ordered by name. Throws DirectoryReadError.
  virtual std::vector<CandidateFile> scan(const std::filesystem::path& dir) const;
};

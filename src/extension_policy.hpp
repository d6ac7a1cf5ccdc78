#pragma once

#include <string>

enum class ExtensionClass {
  Rejected,
  DirectTransfer,
  RequiresTranscode
};

const char* to_string(ExtensionClass value);

// Total over all strings; exact, case-sensitive match. Anything not on
// the allow-list is Rejected.
ExtensionClass classify(const std::string& extension);

// Suffix after the last '.', or "" when the name has no dot. The suffix
// must be made of word characters; "a.png~" has no extension.
std::string extension_of(const std::string& filename);

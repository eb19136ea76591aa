#pragma once

#include <string>
#include <unordered_set>

// Set of import paths shipped with the Go distribution.
// Lookups are exact: "internal/foo" or "crypto/tls/extra" are not members
// unless they are listed verbatim.
const std::unordered_set<std::string>& standardPackages();

// Check if an import path belongs to the Go standard library
bool isStandardPackage(const std::string& importPath);

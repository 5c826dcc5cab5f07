#ifndef EXECUTOR_DEPENDENCIES_HPP
#define EXECUTOR_DEPENDENCIES_HPP

#include <string>
#include <vector>

#include "google/protobuf/repeated_field.h"

namespace executor {

// Reduces a requirement specifier ("Flask[async]>=2.0; python_version>'3'")
// to the bare, lowercase package name. Returns an empty string if nothing is
// left.
std::string NormalizeDependency(const std::string& spec);

// True for the modules shipped with the interpreter, which must never be
// handed to the package installer.
bool IsStandardModule(const std::string& name);

// True if name only contains letters, digits, '.', '-' and '_'.
bool IsLegalDependencyName(const std::string& name);

// Normalized package names to install, without standard modules, illegal
// names and duplicates.
std::vector<std::string> SanitizeDependencies(
    const google::protobuf::RepeatedPtrField<std::string>& dependencies);

}  // namespace executor

#endif

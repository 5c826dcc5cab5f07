#ifndef CORE_VALIDATOR_HPP
#define CORE_VALIDATOR_HPP

#include <string>

#include "proto/swarm.pb.h"

namespace core {

// Checks that a bundle is worth a sandbox call: there is source and test code,
// no unit is empty, unit names are safe relative paths and unique, the
// dependency names are legal and the Python units are lexically well formed.
// On failure returns false and describes the first defect in reason.
bool ValidateBundle(const proto::Bundle& bundle, std::string* reason);

// Lexical check of Python source: balanced brackets and terminated string
// literals. Comments and the content of strings are ignored.
bool CheckPythonSource(const std::string& source, std::string* reason);

}  // namespace core

#endif

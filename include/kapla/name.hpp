#pragma once

#include <kapla/result.hpp>
#include <string>

namespace kapla {

// Package names: [a-zA-Z][a-zA-Z0-9_.-]*
Status validate_package_name(const std::string& raw);

// Lowercase with '-' and '.' folded to '_'. Lock entries and
// external dependency keys are compared through this form.
std::string normalize_package_name(const std::string& raw);

} // namespace kapla

#pragma once

#include <stackup/result.hpp>
#include <string>
#include <vector>

namespace stackup {

// Where an operation runs and what it acts on
enum class OperationScope {
    Package,   // runs in the package directory, takes a target
    Project,   // runs at the project root
    Global     // needs no project
};

struct Operation {
    std::string name;                 // first argument to the build tool
    OperationScope scope;
    std::vector<std::string> flags;   // switches this operation accepts
};

// Every operation the front-end knows how to issue
const std::vector<Operation>& operations();

const Operation* find_operation(const std::string& name);

// Each flag must be one the operation accepts. Flags of the form
// "--opt=value" are matched on "--opt=".
Status validate_flags(const Operation& op, const std::vector<std::string>& flags);

} // namespace stackup

/**
 * @file field_validator.cpp
 * @brief Implementation for the tools module.
 *
 * Standalone checker for pipeline directories.
 * This file is part of the src/tools subsystem.
 */

#include "step_directory_validation.hpp"

#include <iostream>
#include <string>
#include <vector>

namespace {

void print_validator_usage(std::ostream& os) {
    os << "WBGT Field Validator\n"
       << "Usage:\n"
       << "  wbgt_field_validator --input <dir> [--mode report|strict]\n"
       << "      [--scope required|all] [--missing-value <v>] [--json <path>]\n";
}

}

int main(int argc, char** argv) {
    wbgt::FieldValidatorOptions options;
    std::string error;
    switch (wbgt::parse_field_validator_args(std::vector<std::string>(argv + 1, argv + argc), options, error)) {
        case CliParseResult::Help:
            print_validator_usage(std::cout);
            return 0;
        case CliParseResult::Error:
            std::cerr << error << "\n";
            print_validator_usage(std::cerr);
            return 1;
        case CliParseResult::Ok:
            break;
    }
    return wbgt::run_field_validator(options);
}

#pragma once
#include <iosfwd>

namespace planka {

constexpr const char* VERSION = "0.3.0";
constexpr const char* APP_NAME = "planka";

void print_version(std::ostream& os);

}  // namespace planka

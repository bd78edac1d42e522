#include "planka/version.hpp"

#include <ostream>

namespace planka {

void print_version(std::ostream& os) {
    os << APP_NAME << " " << VERSION << std::endl;
}

}  // namespace planka

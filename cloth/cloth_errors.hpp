#ifndef DRAPE_CLOTH_ERRORS_HPP
#define DRAPE_CLOTH_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace drape {

// Cloth dimensions that cannot produce a mesh
class InvalidGeometry : public std::invalid_argument {
public:
    explicit InvalidGeometry(const std::string& what)
        : std::invalid_argument("invalid cloth geometry: " + what) {}
};

// Simulation tunables outside their valid range
class InvalidConfig : public std::invalid_argument {
public:
    explicit InvalidConfig(const std::string& what)
        : std::invalid_argument("invalid cloth config: " + what) {}
};

}  // namespace drape

#endif // DRAPE_CLOTH_ERRORS_HPP

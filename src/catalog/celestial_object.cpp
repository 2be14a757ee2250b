/// @file celestial_object.cpp
/// @brief Descriptor helpers.

#include "catalog/celestial_object.hpp"

#include <cctype>

namespace orrery::catalog
{

bool iequals(std::string_view a, std::string_view b)
{
    if (a.size() != b.size())
    {
        return false;
    }
    for (std::size_t i = 0; i < a.size(); ++i)
    {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i])))
        {
            return false;
        }
    }
    return true;
}

} // namespace orrery::catalog

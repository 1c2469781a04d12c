#pragma once

#include <string>
#include <string_view>

#ifndef ARBOR_VERSION_STRING
#define ARBOR_VERSION_STRING "0.1.0"
#endif

namespace arbor {

class Version {
public:
    static constexpr std::string_view String() noexcept { return std::string_view{ARBOR_VERSION_STRING}; }

    static std::string FullString()
    {
        return std::string{"arbor "} + std::string{String()};
    }
};

}  // namespace arbor

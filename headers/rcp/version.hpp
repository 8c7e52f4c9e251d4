//
// Created by gregorian-rayne on 10/18/26.
//

#ifndef REPORTCONTENTPIPELINE_VERSION_HPP
#define REPORTCONTENTPIPELINE_VERSION_HPP

/**
 * @file version.hpp
 * @brief Report Content Pipeline version information.
 */

namespace rcp {

    /**
     * Major version number.
     * Incremented for breaking API changes.
     */
    constexpr int VERSION_MAJOR = 1;

    /**
     * Minor version number.
     */
    constexpr int VERSION_MINOR = 2;

    /**
     * Patch version number.
     */
    constexpr int VERSION_PATCH = 0;

    /**
     * Full version string in "major.minor.patch" format.
     */
    constexpr auto VERSION_STRING = "1.2.0";

    constexpr auto PROJECT_NAME = "Report Content Pipeline";

    constexpr auto PROJECT_SHORT_NAME = "rcp";

}  // namespace rcp

#endif //REPORTCONTENTPIPELINE_VERSION_HPP

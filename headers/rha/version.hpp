#ifndef RHA_VERSION_HPP
#define RHA_VERSION_HPP

namespace rha {

    /// Bumped on breaking changes to ProjectReport or the command line.
    constexpr int VERSION_MAJOR = 1;
    constexpr int VERSION_MINOR = 0;
    constexpr int VERSION_PATCH = 0;

    constexpr auto VERSION_STRING = "1.0.0";
    constexpr auto PROJECT_SHORT_NAME = "rha";

}  // namespace rha

#endif // RHA_VERSION_HPP

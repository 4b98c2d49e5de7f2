#ifndef ARGPARS_TIME_UTILS_HPP
#define ARGPARS_TIME_UTILS_HPP

#include <string>

namespace argpars {

/**
 * @brief Get the current local time formatted as YYYY-MM-DD HH:MM:SS.
 */
std::string timestamp();

} // namespace argpars

#endif // ARGPARS_TIME_UTILS_HPP

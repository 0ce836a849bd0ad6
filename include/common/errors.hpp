/**
 * @file errors.hpp
 * @brief Exception hierarchy for fatal pipeline failures
 *
 * Every failure that aborts a frontier run derives from FrontierError so the
 * command-line driver can report it uniformly. Invalid arguments passed by
 * callers keep using std::invalid_argument.
 */

#ifndef FRONTIER_COMMON_ERRORS_HPP
#define FRONTIER_COMMON_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace frontier
{

    /**
     * @class FrontierError
     * @brief Base class for all fatal pipeline errors
     */
    class FrontierError : public std::runtime_error
    {
    public:
        explicit FrontierError(const std::string &message)
            : std::runtime_error(message) {}

        explicit FrontierError(const char *message)
            : std::runtime_error(message) {}
    };

    /**
     * @class ParseError
     * @brief A date or numeric field could not be parsed
     */
    class ParseError : public FrontierError
    {
    public:
        using FrontierError::FrontierError;
    };

    /**
     * @class SchemaError
     * @brief The input table lacks an expected field or has the wrong shape
     */
    class SchemaError : public FrontierError
    {
    public:
        using FrontierError::FrontierError;
    };

    /**
     * @class InsufficientDataError
     * @brief Too few observations to estimate variance and covariance
     */
    class InsufficientDataError : public FrontierError
    {
    public:
        using FrontierError::FrontierError;
    };

} // namespace frontier

#endif // FRONTIER_COMMON_ERRORS_HPP

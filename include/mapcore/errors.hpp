// errors.hpp
// Exception family thrown by every mapcore container.
// -----------------------------------------------------------
// * Every type derives from mapcore::Error *and* from the closest standard
//   exception, so callers may catch either the whole family or the usual
//   std::invalid_argument / std::out_of_range / std::runtime_error.
// * A throwing operation leaves its container unmodified.

#ifndef MAPCORE_ERRORS_HPP
#define MAPCORE_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace mapcore
{

    /*-------------------------------------------------------------------------
     *  struct Error
     *-------------------------------------------------------------------------
     *  Tag base for the family.  Carries no state of its own; the message is
     *  held by the std exception each concrete type also inherits from.
     *-------------------------------------------------------------------------*/
    struct Error
    {
        virtual ~Error() = default;
        virtual const char *what() const noexcept = 0;
    };

    /* Bad constructor parameter: negative capacity, non-positive or NaN load
       factor.  No partial object is produced. */
    class InvalidArgument : public std::invalid_argument, public Error
    {
    public:
        explicit InvalidArgument(const std::string &msg) : std::invalid_argument(msg) {}
        const char *what() const noexcept override { return std::invalid_argument::what(); }
    };

    /* Absent key under natural ordering, or a key the comparator cannot
       order against the keys already stored. */
    class InvalidKey : public std::invalid_argument, public Error
    {
    public:
        explicit InvalidKey(const std::string &msg) : std::invalid_argument(msg) {}
        const char *what() const noexcept override { return std::invalid_argument::what(); }
    };

    /* An iterator/cursor saw the structural-change counter move under it.
       Best effort only: absence of this error does not prove absence of
       unsynchronised mutation. */
    class ConcurrentModification : public std::runtime_error, public Error
    {
    public:
        ConcurrentModification() : std::runtime_error("concurrent modification detected") {}
        explicit ConcurrentModification(const std::string &msg) : std::runtime_error(msg) {}
        const char *what() const noexcept override { return std::runtime_error::what(); }
    };

    class IndexOutOfRange : public std::out_of_range, public Error
    {
    public:
        explicit IndexOutOfRange(const std::string &msg) : std::out_of_range(msg) {}
        const char *what() const noexcept override { return std::out_of_range::what(); }
    };

    class NoSuchElement : public std::out_of_range, public Error
    {
    public:
        explicit NoSuchElement(const std::string &msg) : std::out_of_range(msg) {}
        const char *what() const noexcept override { return std::out_of_range::what(); }
    };

    // cursor remove()/set() without a preceding next()/previous()
    class IllegalState : public std::logic_error, public Error
    {
    public:
        explicit IllegalState(const std::string &msg) : std::logic_error(msg) {}
        const char *what() const noexcept override { return std::logic_error::what(); }
    };

} // namespace mapcore

#endif // MAPCORE_ERRORS_HPP

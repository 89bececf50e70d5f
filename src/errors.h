#ifndef errors_h_INCLUDED
#define errors_h_INCLUDED

#include <stdexcept>
#include <string>

// Bad command line or missing input and image paths.
class config_error : public std::runtime_error
{
    public:
    explicit config_error(const std::string& message) : std::runtime_error(message) {}
};

// An annotation document that is not valid JSON or does not match the selected layout.
class parse_error : public std::runtime_error
{
    public:
    explicit parse_error(const std::string& message) : std::runtime_error(message) {}
};

// Failure to read, write, copy or create something on disk.
class io_error : public std::runtime_error
{
    public:
    explicit io_error(const std::string& message) : std::runtime_error(message) {}
};

#endif  // errors_h_INCLUDED

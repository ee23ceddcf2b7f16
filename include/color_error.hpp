#ifndef COLOR_ERROR_HPP
#define COLOR_ERROR_HPP

#include <stdexcept>
#include <string>
#include <string_view>

enum class ErrorKind
{
    InvalidComponent,
    InvalidHex,
    InvalidName,
    InvalidColorString,
    EmptyInput
};

/*
 * Base of every failure raised while building or transforming a color.
 * All of them describe bad input, nothing is worth retrying.
 */
class ColorError : public std::invalid_argument
{
public:
    ColorError( ErrorKind kind, const std::string& message)
    : std::invalid_argument( message), error_kind( kind)
    {
    }

    [[nodiscard]] ErrorKind kind() const noexcept
    {
        return error_kind;
    }

private:
    ErrorKind error_kind;
};

class InvalidComponent : public ColorError
{
public:
    InvalidComponent( std::string_view component, std::string_view reason)
    : ColorError( ErrorKind::InvalidComponent,
                  "Invalid " + std::string( component) + ": " + std::string( reason))
    {
    }
};

class InvalidHex : public ColorError
{
public:
    explicit InvalidHex( std::string_view hex)
    : ColorError( ErrorKind::InvalidHex,
                  "Color has to be 3, 4, 6 or 8 hex digits -> `" + std::string( hex) + "`")
    {
    }
};

class InvalidName : public ColorError
{
public:
    explicit InvalidName( std::string_view name)
    : ColorError( ErrorKind::InvalidName, "Unable to find match for `" + std::string( name) + "`"),
      color_name( name)
    {
    }

    [[nodiscard]] const std::string& name() const noexcept
    {
        return color_name;
    }

private:
    std::string color_name;
};

class InvalidColorString : public ColorError
{
public:
    explicit InvalidColorString( std::string_view input)
    : ColorError( ErrorKind::InvalidColorString,
                  "Invalid color specification `" + std::string( input) + "`"),
      given( input)
    {
    }

    [[nodiscard]] const std::string& input() const noexcept
    {
        return given;
    }

private:
    std::string given;
};

class EmptyInput : public ColorError
{
public:
    explicit EmptyInput( std::string_view operation)
    : ColorError( ErrorKind::EmptyInput, std::string( operation) + " requires at least one color")
    {
    }
};

#endif //COLOR_ERROR_HPP

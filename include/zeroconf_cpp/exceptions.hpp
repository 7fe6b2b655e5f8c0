#pragma once

#include <stdexcept>
#include <string>

namespace zeroconf_cpp
{

struct Error : std::runtime_error {
    explicit Error(const std::string& what) : std::runtime_error{what} {}
};

// A label of a name is longer than 63 bytes
struct NamePartTooLongError : Error {
    explicit NamePartTooLongError(const std::string& name)
        : Error{"Name part too long in: " + name} {}
};

struct BadNameError : Error {
    explicit BadNameError(const std::string& what) : Error{what} {}
};

struct BadTypeInNameError : Error {
    explicit BadTypeInNameError(const std::string& what) : Error{what} {}
};

// Probing found another host claiming the name
struct NonUniqueNameError : Error {
    explicit NonUniqueNameError(const std::string& name)
        : Error{"Name is not unique: " + name} {}
};

struct ServiceNameAlreadyRegisteredError : Error {
    explicit ServiceNameAlreadyRegisteredError(const std::string& name)
        : Error{"Service name already registered: " + name} {}
};

struct DecodeError : Error {
    explicit DecodeError(const std::string& what) : Error{what} {}
};

struct NotImplementedError : std::logic_error {
    explicit NotImplementedError(const std::string& what) : std::logic_error{what} {}
};

}

#pragma once

#include <stdexcept>
#include <string>

namespace fileio {

// Base class for every failure a file operation can report
class Error : public std::runtime_error {
public:
    explicit Error(const std::string& what) : std::runtime_error(what) {}
};

// A chunk request exhausted its retry budget
class TransferTimeout : public Error {
public:
    explicit TransferTimeout(const std::string& what) : Error(what) {}
};

// Reply missing or not matching the request (directory listing)
class ProtocolError : public Error {
public:
    explicit ProtocolError(const std::string& what) : Error(what) {}
};

// Transport failure or link already closed
class LinkError : public Error {
public:
    explicit LinkError(const std::string& what) : Error(what) {}
};

} // namespace fileio

#pragma once
#include <stdexcept>
#include <string>

namespace greetmcp
{

struct Error : public std::runtime_error
{
    using std::runtime_error::runtime_error;
};

struct NotFoundError : public Error
{
    using Error::Error;
};

struct ValidationError : public Error
{
    using Error::Error;
};

/// tools/call without arguments, tool name or a required tool argument
struct MissingArgumentError : public ValidationError
{
    using ValidationError::ValidationError;
};

/// tools/call naming a tool absent from the current registry snapshot
struct UnknownToolError : public NotFoundError
{
    using NotFoundError::NotFoundError;
};

/// Missing or unknown Mcp-Session-Id on a request that requires one
struct InvalidSessionError : public Error
{
    using Error::Error;
};

/// Send to a closed or broken transport / session
struct DeliveryFailedError : public Error
{
    using Error::Error;
};

/// Session id generator produced an id already in use
struct DuplicateSessionError : public Error
{
    using Error::Error;
};

struct SessionLimitError : public Error
{
    using Error::Error;
};

/// A second GET stream was requested for a session that already has one
struct StreamConflictError : public Error
{
    using Error::Error;
};

struct TransportError : public Error
{
    using Error::Error;
};

struct ConfigError : public Error
{
    using Error::Error;
};

} // namespace greetmcp

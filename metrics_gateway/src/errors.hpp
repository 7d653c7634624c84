#pragma once
#include <stdexcept>
#include <string>

// Invalid startup options. Fatal, raised before the server starts.
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

// Local health callback or metrics collection failed.
class CallbackError : public std::runtime_error {
public:
    explicit CallbackError(const std::string& what) : std::runtime_error(what) {}
};

// A worker replied to a fan-out request with an explicit error.
class WorkerError : public std::runtime_error {
public:
    explicit WorkerError(const std::string& what) : std::runtime_error(what) {}
};

// Not every worker replied before the aggregation deadline.
class TimeoutError : public std::runtime_error {
public:
    explicit TimeoutError(const std::string& what) : std::runtime_error(what) {}
};

#pragma once

#include <stdexcept>
#include <string>

// Unreadable, empty, oversize or out-of-range request data. Raised before any engine runs.
class InputError : public std::runtime_error {
public:
  explicit InputError(const std::string& what) : std::runtime_error(what) {}
};

// Failure inside the DSP layer or an engine. Contained at the job boundary.
class ProcessingError : public std::runtime_error {
public:
  explicit ProcessingError(const std::string& what) : std::runtime_error(what) {}
};

class JobTimeoutError : public ProcessingError {
public:
  explicit JobTimeoutError(const std::string& what) : ProcessingError(what) {}
};

class NotFoundError : public std::runtime_error {
public:
  explicit NotFoundError(const std::string& what) : std::runtime_error(what) {}
};

class ConfigError : public std::runtime_error {
public:
  explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

#pragma once

// Error taxonomy for the calibration core.
//
// - ConfigError:     invalid staircase/run parameters (fatal to starting a run)
// - ConnectionError: actuator transport cannot be established (fatal to the run)
// - RangeError:      level outside the protocol range [0,255] (caller bug)
// - StateError:      API used in the wrong state (caller bug)
// - TransportError:  write failed on an open channel (abort the trial sequence)
// - AbortRequested:  operator abort, raised by the UI collaborator
//
// The forced zero-transmit on close/emergency is the only place where a
// failure is logged instead of raised.

#include <stdexcept>
#include <string>

namespace photocal {

class Error : public std::runtime_error {
public:
  explicit Error(const std::string& what) : std::runtime_error(what) {}
};

class ConfigError final : public Error {
public:
  explicit ConfigError(const std::string& what) : Error(what) {}
};

class ConnectionError final : public Error {
public:
  explicit ConnectionError(const std::string& what) : Error(what) {}
};

class RangeError final : public Error {
public:
  explicit RangeError(const std::string& what) : Error(what) {}
};

class StateError final : public Error {
public:
  explicit StateError(const std::string& what) : Error(what) {}
};

class TransportError final : public Error {
public:
  explicit TransportError(const std::string& what) : Error(what) {}
};

class AbortRequested final : public Error {
public:
  explicit AbortRequested(const std::string& what = "aborted by operator") : Error(what) {}
};

} // namespace photocal

#pragma once
#include <stdexcept>
#include <string>

namespace lc {

// Root of everything the library throws.
class Error : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Malformed input to a call (negative offset, unknown column, orderBy...).
class InvalidArgument : public Error {
public:
  using Error::Error;
};

// Request beyond the file, or beyond what can currently be known.
class OutOfBounds : public Error {
public:
  using Error::Error;
};

class ColumnOutOfRange : public OutOfBounds {
public:
  using OutOfBounds::OutOfBounds;
};

// Internal invariant violated. Never retried.
class InconsistentState : public Error {
public:
  using Error::Error;
};

class InconsistentOverlap : public InconsistentState {
public:
  using InconsistentState::InconsistentState;
};

class NonContiguous : public InconsistentState {
public:
  using InconsistentState::InconsistentState;
};

// Malformed or empty file, reported once at creation.
class InputError : public Error {
public:
  using Error::Error;
};

// Byte source failure (HTTP status, connection, short read).
class TransportError : public Error {
public:
  using Error::Error;
};

class Cancelled : public Error {
public:
  Cancelled() : Error("operation cancelled") {}
};

}

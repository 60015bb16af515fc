#ifndef MSGMUX_ERRORS_HPP
#define MSGMUX_ERRORS_HPP

namespace msgmux {

// Error codes for msgmux operations
enum class Error {
  OK = 0,
  ConnectionClosed,
  ConnectionReset,
  EOF_,
  ReadError,
  WriteError,
  Canceled,
  DeadlineExceeded,
  PoolClosed,
  QueueClosed,
  RetriesExhausted,
  InvalidArgument,
};

// Convert error to human-readable string
inline const char* ErrorString(Error err) {
  switch (err) {
    case Error::OK:
      return "ok";
    case Error::ConnectionClosed:
      return "connection closed";
    case Error::ConnectionReset:
      return "connection reset";
    case Error::EOF_:
      return "end of file";
    case Error::ReadError:
      return "read error";
    case Error::WriteError:
      return "write error";
    case Error::Canceled:
      return "context canceled";
    case Error::DeadlineExceeded:
      return "context deadline exceeded";
    case Error::PoolClosed:
      return "pool closed";
    case Error::QueueClosed:
      return "queue closed";
    case Error::RetriesExhausted:
      return "retries exhausted";
    case Error::InvalidArgument:
      return "invalid argument";
    default:
      return "unknown error";
  }
}

// True for the errors a cancelled or expired context reports.
inline bool IsCancellation(Error err) {
  return err == Error::Canceled || err == Error::DeadlineExceeded;
}

// Result type for operations that return a value or error
template <typename T>
struct Result {
  T value;
  Error error;

  bool ok() const { return error == Error::OK; }

  explicit operator bool() const { return ok(); }
};

}  // namespace msgmux

#endif  // MSGMUX_ERRORS_HPP

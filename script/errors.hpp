#ifndef SCRIPT_ERRORS_HPP
#define SCRIPT_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "script/value.hpp"

namespace script {

// Raised by the lexer and the parser. Line and column are 1-based.
class SyntaxError : public std::runtime_error {
 public:
  SyntaxError(const std::string& msg, int line, int column)
      : std::runtime_error(msg), line_(line), column_(column) {}
  int line() const { return line_; }
  int column() const { return column_; }

 private:
  int line_;
  int column_;
};

// An exception raised by running code. It is catchable by try/except in the
// script; type() is the name of its exception class.
class ScriptError : public std::runtime_error {
 public:
  ScriptError(std::string type, std::string message)
      : std::runtime_error(type + ": " + message),
        type_(std::move(type)),
        message_(std::move(message)) {}
  ScriptError(std::string type, std::string message, Value exception)
      : ScriptError(std::move(type), std::move(message)) {
    exception_ = std::move(exception);
  }

  const std::string& type() const { return type_; }
  const std::string& message() const { return message_; }

  // The exception object bound by "except ... as e". None until the
  // interpreter materializes it.
  const Value& exception() const { return exception_; }
  void set_exception(Value exception) { exception_ = std::move(exception); }

  // Frames are added while the error unwinds, innermost first.
  void AddFrame(const std::string& function, int line) {
    frames_.emplace_back(function, line);
  }
  const std::vector<std::pair<std::string, int>>& frames() const {
    return frames_;
  }

  // Python-style traceback, outermost frame first.
  std::string Traceback() const;

 private:
  std::string type_;
  std::string message_;
  Value exception_;
  std::vector<std::pair<std::string, int>> frames_;
};

// Thrown when the running script was asked to stop. Not a ScriptError, so
// the script cannot catch it.
class Interrupted : public std::exception {
 public:
  const char* what() const noexcept override { return "interrupted"; }
};

}  // namespace script

#endif

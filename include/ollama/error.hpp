#pragma once

#include <map>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

namespace ollama {

class OllamaError : public std::runtime_error {
public:
  explicit OllamaError(const std::string& message)
      : std::runtime_error(message) {}
};

class APIError : public OllamaError {
public:
  APIError(std::string message,
           long status_code,
           nlohmann::json error_body,
           std::map<std::string, std::string> headers)
      : OllamaError(std::move(message)),
        status_code_(status_code),
        error_body_(std::move(error_body)),
        headers_(std::move(headers)) {}

  long status_code() const { return status_code_; }
  const nlohmann::json& error_body() const { return error_body_; }
  const std::map<std::string, std::string>& headers() const { return headers_; }

private:
  long status_code_;
  nlohmann::json error_body_;
  std::map<std::string, std::string> headers_;
};

class BadRequestError : public APIError {
public:
  using APIError::APIError;
};

class AuthenticationError : public APIError {
public:
  using APIError::APIError;
};

class PermissionDeniedError : public APIError {
public:
  using APIError::APIError;
};

class NotFoundError : public APIError {
public:
  using APIError::APIError;
};

class ConflictError : public APIError {
public:
  using APIError::APIError;
};

class UnprocessableEntityError : public APIError {
public:
  using APIError::APIError;
};

class RateLimitError : public APIError {
public:
  using APIError::APIError;
};

class InternalServerError : public APIError {
public:
  using APIError::APIError;
};

/// Connection or transfer failure reported by the transport. Never retried by the client.
class TransportError : public OllamaError {
public:
  explicit TransportError(const std::string& message)
      : OllamaError(message) {}
};

class TransportTimeoutError : public TransportError {
public:
  using TransportError::TransportError;
};

/// A record (or a non-streaming body) is not valid JSON or lacks a required field.
class DecodeError : public OllamaError {
public:
  explicit DecodeError(const std::string& message)
      : OllamaError(message) {}
};

/// The server embedded an `error` payload inside an otherwise well-formed stream.
class ServerStreamError : public OllamaError {
public:
  explicit ServerStreamError(const std::string& message)
      : OllamaError(message) {}
};

/// The stream ended with an incomplete trailing record.
class TruncationError : public OllamaError {
public:
  TruncationError(const std::string& message, std::string partial_record)
      : OllamaError(message), partial_record_(std::move(partial_record)) {}

  const std::string& partial_record() const { return partial_record_; }

private:
  std::string partial_record_;
};

/// A finalized tool call whose accumulated argument text could not be parsed.
/// Delivered alongside the stream's events rather than thrown.
class ToolCallParseError : public OllamaError {
public:
  ToolCallParseError(const std::string& message, int index, std::string name, std::string arguments_text)
      : OllamaError(message),
        index_(index),
        name_(std::move(name)),
        arguments_text_(std::move(arguments_text)) {}

  int index() const { return index_; }
  const std::string& name() const { return name_; }
  const std::string& arguments_text() const { return arguments_text_; }

private:
  int index_;
  std::string name_;
  std::string arguments_text_;
};

/// Mutually exclusive or missing parameters, raised before any network call.
class LocalValidationError : public OllamaError {
public:
  explicit LocalValidationError(const std::string& message)
      : OllamaError(message) {}
};

}  // namespace ollama

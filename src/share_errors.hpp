#pragma once

#include <stdexcept>
#include <string>
#include <utility>

// Advertisement could not be bound or registered; fatal to discovery start.
class RegistrationError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// The serving endpoint could not be bound or started.
class ServeError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// A directory listing came back with a non-207 status or an unreadable body.
class ListingError : public std::runtime_error {
public:
  ListingError(std::string remote_path, const std::string& reason, int status = 0)
    : std::runtime_error(reason), remote_path_(std::move(remote_path)), status_(status) {}

  const std::string& remote_path() const { return remote_path_; }
  int status() const { return status_; }

private:
  std::string remote_path_;
  int status_ = 0;
};

// Network, HTTP or disk failure while downloading one file.
class TransferError : public std::runtime_error {
public:
  TransferError(std::string remote_path, const std::string& reason, int status = 0)
    : std::runtime_error(reason), remote_path_(std::move(remote_path)), status_(status) {}

  const std::string& remote_path() const { return remote_path_; }
  int status() const { return status_; }

private:
  std::string remote_path_;
  int status_ = 0;
};

// Credential prompt cancelled, or the retried request was still rejected.
class AuthFailure : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

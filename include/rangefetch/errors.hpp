#pragma once

#include <stdexcept>
#include <string>

namespace rangefetch {

class DownloadError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Required command line input is missing or unusable.
class ArgumentError : public DownloadError {
public:
    using DownloadError::DownloadError;
};

// The metadata response carried no usable Content-Length.
class SizeUnavailable : public DownloadError {
public:
    using DownloadError::DownloadError;
};

// A request could not be sent, or its response could not be read to the end.
class TransferError : public DownloadError {
public:
    using DownloadError::DownloadError;
};

} // namespace rangefetch

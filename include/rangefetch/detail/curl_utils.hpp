#pragma once

#include <string>

namespace rangefetch::detail {

/// Initializes libcurl once per process, before the first easy handle.
/// The matching curl_global_cleanup runs during static destruction, so a
/// process that still has transfers in flight must leave through
/// std::_Exit rather than returning from main.
/// @throws TransferError if libcurl cannot be initialized.
void ensureCurlInitialized();

// "libcurl/8.5.0 OpenSSL/3.0.13 ..." as reported by the linked library.
std::string curlVersion();

} // namespace rangefetch::detail

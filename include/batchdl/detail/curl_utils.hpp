#pragma once

#include <memory>

#include <curl/curl.h>

namespace batchdl::detail {

using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;

// Returns a fresh easy handle, or an empty one when libcurl cannot allocate it.
// The first call sets up libcurl's global state, which lives until exit.
[[nodiscard]] CurlHandle makeCurlHandle();

} // namespace batchdl::detail
